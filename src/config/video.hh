#pragma once

#include "src/config/profile.hh"
#include "src/constants.hh"
#include "src/util.hh"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>

namespace encspec::config {
	namespace video {
		struct Copy {
			bool operator==(const Copy&) const = default;
		};

		struct Aom {
			int16_t crf     = constants::AOM_DEFAULT_CRF;
			uint8_t speed   = constants::AOM_DEFAULT_SPEED;
			Profile profile = Profile::Film;
			uint8_t grain   = 0;
			bool    compat  = false;

			bool operator==(const Aom&) const = default;
		};

		struct Rav1e {
			int16_t crf     = constants::RAV1E_DEFAULT_CRF;
			uint8_t speed   = constants::RAV1E_DEFAULT_SPEED;
			Profile profile = Profile::Film;
			uint8_t grain   = 0;

			bool operator==(const Rav1e&) const = default;
		};

		struct SvtAv1 {
			int16_t crf     = constants::SVT_DEFAULT_CRF;
			uint8_t speed   = constants::SVT_DEFAULT_SPEED;
			Profile profile = Profile::Film;
			uint8_t grain   = 0;

			bool operator==(const SvtAv1&) const = default;
		};

		struct X264 {
			int16_t crf     = constants::X264_DEFAULT_CRF;
			Profile profile = Profile::Film;
			bool    compat  = false;

			bool operator==(const X264&) const = default;
		};

		struct X265 {
			int16_t crf     = constants::X265_DEFAULT_CRF;
			Profile profile = Profile::Film;
			bool    compat  = false;

			bool operator==(const X265&) const = default;
		};
	}

	// Identity of a video encoder, without any of its settings
	enum struct VideoEncoderIdent {
		Copy,
		Aom,
		Rav1e,
		SvtAv1,
		X264,
		X265,
	};

	// Names accepted by `enc=`
	std::span<const std::string_view> supported_video_encoders();

	std::optional<VideoEncoderIdent> VideoEncoderIdent_from_name(std::string_view name);
	std::string_view VideoEncoderIdent_to_str(VideoEncoderIdent ident);

	// Video settings of one output; which fields exist depends on the encoder.
	class VideoJobConfig {
		public:
			using Encoder = std::variant<video::Copy, video::Aom, video::Rav1e, video::SvtAv1, video::X264, video::X265>;

			// x264 with its defaults
			VideoJobConfig() = default;

			VideoJobConfig(Encoder&& encoder)
				: m_encoder(std::move(encoder)) {}

			// The encoder's settings with all of its defaults
			static VideoJobConfig defaults(VideoEncoderIdent ident);

			VideoEncoderIdent ident() const;

			// Encoder name as understood by av1an
			std::string_view av1an_name() const;
			bool uses_av1an_thread_pinning() const;

			// Quantizer (crf), or nothing for `copy`
			std::optional<int16_t> crf() const;
			std::optional<Profile> profile() const;

			constexpr Encoder& encoder() {return m_encoder;}
			constexpr const Encoder& encoder() const {return m_encoder;}

			template<typename T>
			const T *as() const {
				return std::get_if<T>(&m_encoder);
			}

			bool operator==(const VideoJobConfig&) const = default;

			std::string to_string() const;
			void hash(Hasher& hasher) const;
		private:
			Encoder m_encoder = video::X264 {};
	};
}
