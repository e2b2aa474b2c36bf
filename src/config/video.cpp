#include "src/config/video.hh"

#include <array>
#include <format>
#include <sstream>

namespace encspec::config {
	static constexpr std::array<std::string_view, 6> VIDEO_ENCODER_NAMES = {
		"aom", "rav1e", "svt", "x264", "x265", "copy",
	};

	std::span<const std::string_view> supported_video_encoders() {
		return VIDEO_ENCODER_NAMES;
	}

	std::optional<VideoEncoderIdent> VideoEncoderIdent_from_name(std::string_view name) {
		if(name == "aom") {
			return VideoEncoderIdent::Aom;
		}
		if(name == "rav1e") {
			return VideoEncoderIdent::Rav1e;
		}
		if(name == "svt") {
			return VideoEncoderIdent::SvtAv1;
		}
		if(name == "x264") {
			return VideoEncoderIdent::X264;
		}
		if(name == "x265") {
			return VideoEncoderIdent::X265;
		}
		if(name == "copy") {
			return VideoEncoderIdent::Copy;
		}

		return std::optional<VideoEncoderIdent>();
	}

	std::string_view VideoEncoderIdent_to_str(VideoEncoderIdent ident) {
		switch(ident) {
			case VideoEncoderIdent::Copy:
				return "copy";
			case VideoEncoderIdent::Aom:
				return "aom";
			case VideoEncoderIdent::Rav1e:
				return "rav1e";
			case VideoEncoderIdent::SvtAv1:
				return "svt";
			case VideoEncoderIdent::X264:
				return "x264";
			case VideoEncoderIdent::X265:
				return "x265";
		}

		return "copy"; // unreachable
	}

	VideoJobConfig VideoJobConfig::defaults(VideoEncoderIdent ident) {
		switch(ident) {
			case VideoEncoderIdent::Copy:
				return VideoJobConfig(video::Copy {});
			case VideoEncoderIdent::Aom:
				return VideoJobConfig(video::Aom {});
			case VideoEncoderIdent::Rav1e:
				return VideoJobConfig(video::Rav1e {});
			case VideoEncoderIdent::SvtAv1:
				return VideoJobConfig(video::SvtAv1 {});
			case VideoEncoderIdent::X264:
				return VideoJobConfig(video::X264 {});
			case VideoEncoderIdent::X265:
				return VideoJobConfig(video::X265 {});
		}

		return VideoJobConfig(); // unreachable
	}

	VideoEncoderIdent VideoJobConfig::ident() const {
		return std::visit(Overloaded {
			[](const video::Copy&)   {return VideoEncoderIdent::Copy;},
			[](const video::Aom&)    {return VideoEncoderIdent::Aom;},
			[](const video::Rav1e&)  {return VideoEncoderIdent::Rav1e;},
			[](const video::SvtAv1&) {return VideoEncoderIdent::SvtAv1;},
			[](const video::X264&)   {return VideoEncoderIdent::X264;},
			[](const video::X265&)   {return VideoEncoderIdent::X265;},
		}, m_encoder);
	}

	std::string_view VideoJobConfig::av1an_name() const {
		switch(ident()) {
			case VideoEncoderIdent::Copy:
				return "copy";
			case VideoEncoderIdent::Aom:
				return "aom";
			case VideoEncoderIdent::Rav1e:
				return "rav1e";
			case VideoEncoderIdent::SvtAv1:
				return "svt-av1";
			case VideoEncoderIdent::X264:
				return "x264";
			case VideoEncoderIdent::X265:
				return "x265";
		}

		return "copy"; // unreachable
	}

	bool VideoJobConfig::uses_av1an_thread_pinning() const {
		switch(ident()) {
			case VideoEncoderIdent::Aom:
			case VideoEncoderIdent::Rav1e:
			case VideoEncoderIdent::SvtAv1:
				return true;
			case VideoEncoderIdent::Copy:
			case VideoEncoderIdent::X264:
			case VideoEncoderIdent::X265:
				return false;
		}

		return false;
	}

	std::optional<int16_t> VideoJobConfig::crf() const {
		return std::visit(Overloaded {
			[](const video::Copy&) {return std::optional<int16_t>();},
			[](const auto& e)      {return std::optional<int16_t>(e.crf);},
		}, m_encoder);
	}

	std::optional<Profile> VideoJobConfig::profile() const {
		return std::visit(Overloaded {
			[](const video::Copy&) {return std::optional<Profile>();},
			[](const auto& e)      {return std::optional<Profile>(e.profile);},
		}, m_encoder);
	}

	std::string VideoJobConfig::to_string() const {
		std::stringstream s;

		s << VideoEncoderIdent_to_str(ident());

		std::visit(Overloaded {
			[&](const video::Copy&) {},
			[&](const video::Aom& e) {
				s << std::format(" {{ crf: {}, speed: {}, profile: {}, grain: {}, compat: {} }}",
					e.crf, e.speed, Profile_to_str(e.profile), e.grain, e.compat);
			},
			[&](const video::Rav1e& e) {
				s << std::format(" {{ crf: {}, speed: {}, profile: {}, grain: {} }}",
					e.crf, e.speed, Profile_to_str(e.profile), e.grain);
			},
			[&](const video::SvtAv1& e) {
				s << std::format(" {{ crf: {}, speed: {}, profile: {}, grain: {} }}",
					e.crf, e.speed, Profile_to_str(e.profile), e.grain);
			},
			[&](const video::X264& e) {
				s << std::format(" {{ crf: {}, profile: {}, compat: {} }}",
					e.crf, Profile_to_str(e.profile), e.compat);
			},
			[&](const video::X265& e) {
				s << std::format(" {{ crf: {}, profile: {}, compat: {} }}",
					e.crf, Profile_to_str(e.profile), e.compat);
			},
		}, m_encoder);

		return std::move(s).str();
	}

	void VideoJobConfig::hash(Hasher& hasher) const {
		hasher.add("_video-config_");
		const size_t start = hasher.pos();

		hasher.add_field(VideoEncoderIdent_to_str(ident()));

		std::visit(Overloaded {
			[&](const video::Copy&) {},
			[&](const video::Aom& e) {
				hasher.add(e.crf);
				hasher.add(e.speed);
				hasher.add(static_cast<uint8_t>(e.profile));
				hasher.add(e.grain);
				hasher.add(e.compat);
			},
			[&](const video::Rav1e& e) {
				hasher.add(e.crf);
				hasher.add(e.speed);
				hasher.add(static_cast<uint8_t>(e.profile));
				hasher.add(e.grain);
			},
			[&](const video::SvtAv1& e) {
				hasher.add(e.crf);
				hasher.add(e.speed);
				hasher.add(static_cast<uint8_t>(e.profile));
				hasher.add(e.grain);
			},
			[&](const video::X264& e) {
				hasher.add(e.crf);
				hasher.add(static_cast<uint8_t>(e.profile));
				hasher.add(e.compat);
			},
			[&](const video::X265& e) {
				hasher.add(e.crf);
				hasher.add(static_cast<uint8_t>(e.profile));
				hasher.add(e.compat);
			},
		}, m_encoder);

		hasher.add(static_cast<uint64_t>(hasher.pos() - start));
	}
}
