#include "src/resolver/resolve.hh"
#include "src/resolver/error.hh"
#include "src/config/audio.hh"
#include "src/constants.hh"
#include "src/log.hh"
#include "src/util.hh"

#include <cstdlib>
#include <initializer_list>
#include <optional>
#include <string>
#include <variant>

namespace encspec::resolver {
	using namespace config::video;

	// Returns `value` if `range` contains it
	template<typename T>
	static T checked(std::string_view filter, Spanned<T> value, ValueRange range, const config::VideoJobConfig& video) {
		if(!range.contains(value.val)) {
			throw error::value_out_of_range(
				filter,
				Spanned(static_cast<int64_t>(value.val), value.span),
				range,
				config::VideoEncoderIdent_to_str(video.ident())
			);
		}

		return value.val;
	}

	std::optional<Spanned<std::string_view>> find_video_encoder(TokenSpan tokens) {
		for(const Spanned<FilterToken>& t : tokens) {
			if(std::optional<std::string_view> name = t->as_video_encoder()) {
				return Spanned(*name, t.span);
			}
		}

		return std::optional<Spanned<std::string_view>>();
	}

	config::VideoJobConfig configure_video_encoder(TokenSpan tokens) {
		const std::optional<Spanned<std::string_view>> name = find_video_encoder(tokens);
		if(!name) {
			return config::VideoJobConfig::defaults(config::VideoEncoderIdent::X264);
		}

		const std::optional<config::VideoEncoderIdent> ident = config::VideoEncoderIdent_from_name(name->val);
		if(!ident) {
			throw error::unknown_encoder_name(*name);
		}

		return config::VideoJobConfig::defaults(*ident);
	}

	void apply_quantizer(config::VideoJobConfig& video, Spanned<int16_t> q) {
		const config::VideoJobConfig& v = video;

		std::visit(Overloaded {
			[](Copy&) {},
			[&](Aom& e)    {e.crf = checked("q", q, constants::AOM_QUANTIZER_RANGE, v);},
			[&](Rav1e& e)  {e.crf = checked("q", q, constants::RAV1E_QUANTIZER_RANGE, v);},
			[&](SvtAv1& e) {e.crf = checked("q", q, constants::SVT_QUANTIZER_RANGE, v);},
			[&](X264& e)   {e.crf = checked("q", q, constants::X264_QUANTIZER_RANGE, v);},
			[&](X265& e)   {e.crf = checked("q", q, constants::X265_QUANTIZER_RANGE, v);},
		}, video.encoder());
	}

	void apply_speed(config::VideoJobConfig& video, Spanned<uint8_t> speed) {
		const config::VideoJobConfig& v = video;

		std::visit(Overloaded {
			[&](Aom& e)    {e.speed = checked("s", speed, constants::SPEED_RANGE, v);},
			[&](Rav1e& e)  {e.speed = checked("s", speed, constants::SPEED_RANGE, v);},
			[&](SvtAv1& e) {e.speed = checked("s", speed, constants::SPEED_RANGE, v);},
			[](auto&) {},
		}, video.encoder());
	}

	void apply_grain(config::VideoJobConfig& video, Spanned<uint8_t> grain) {
		const config::VideoJobConfig& v = video;

		std::visit(Overloaded {
			[&](Aom& e)    {e.grain = checked("g", grain, constants::GRAIN_RANGE, v);},
			[&](Rav1e& e)  {e.grain = checked("g", grain, constants::GRAIN_RANGE, v);},
			[&](SvtAv1& e) {e.grain = checked("g", grain, constants::GRAIN_RANGE, v);},
			[](auto&) {},
		}, video.encoder());
	}

	void apply_profile(config::VideoJobConfig& video, config::Profile profile) {
		std::visit(Overloaded {
			[](Copy&) {},
			[&](auto& e) {e.profile = profile;},
		}, video.encoder());
	}

	void apply_compat(config::VideoJobConfig& video, bool compat) {
		std::visit(Overloaded {
			[&](Aom& e)  {e.compat = compat;},
			[&](X264& e) {e.compat = compat;},
			[&](X265& e) {e.compat = compat;},
			[](auto&) {},
		}, video.encoder());
	}

	void apply_filter(config::OutputJobConfig& output, Spanned<const FilterToken&> token) {
		const FilterToken& t = token.val;

		log::debug("Applying `{}` to {}", t.to_string(), config::VideoEncoderIdent_to_str(output.video.ident()));

		switch(t.type()) {
			case FilterToken::Type::VideoEncoderName:
				// Already selected by `configure_video_encoder`
				return;
			case FilterToken::Type::Quantizer:
				apply_quantizer(output.video, Spanned(*t.as_quantizer(), token.span));
				return;
			case FilterToken::Type::Speed:
				apply_speed(output.video, Spanned(*t.as_speed(), token.span));
				return;
			case FilterToken::Type::Profile:
				apply_profile(output.video, *t.as_profile());
				return;
			case FilterToken::Type::Grain:
				apply_grain(output.video, Spanned(*t.as_grain(), token.span));
				return;
			case FilterToken::Type::Compat:
				apply_compat(output.video, *t.as_compat());
				return;
			case FilterToken::Type::Extension: {
				const std::string_view ext = *t.as_extension();
				if(ext != "mkv" && ext != "mp4") {
					throw error::unsupported_extension(Spanned(ext, token.span));
				}

				output.output_extension = std::string(ext);
				return;
			}
			case FilterToken::Type::BitDepth: {
				const uint8_t depth = *t.as_bit_depth();
				if(depth != 8 && depth != 10) {
					throw error::unsupported_bit_depth(Spanned(static_cast<int64_t>(depth), token.span));
				}

				output.bit_depth_override = depth;
				return;
			}
			case FilterToken::Type::Resolution: {
				const config::Resolution res = *t.as_resolution();
				for(uint32_t d : {res.width, res.height}) {
					if(d % 2 != 0 || !constants::RESOLUTION_RANGE.contains(d)) {
						throw error::invalid_resolution(Spanned(static_cast<int64_t>(d), token.span), constants::RESOLUTION_RANGE);
					}
				}

				output.resolution_override = res;
				return;
			}
			case FilterToken::Type::AudioEncoderName: {
				const std::string_view name = *t.as_audio_encoder();
				const std::optional<config::AudioEncoder> encoder = config::AudioEncoder_from_name(name);
				if(!encoder) {
					throw error::unknown_audio_encoder_name(Spanned(name, token.span));
				}

				output.audio.encoder = *encoder;
				return;
			}
			case FilterToken::Type::AudioBitrate: {
				const uint32_t kbps = *t.as_audio_bitrate();
				if(!constants::AUDIO_BITRATE_RANGE.contains(kbps)) {
					throw error::invalid_audio_bitrate(Spanned(static_cast<int64_t>(kbps), token.span), constants::AUDIO_BITRATE_RANGE);
				}

				output.audio.kbps_per_channel = kbps;
				return;
			}
			case FilterToken::Type::AudioTrackList: {
				const std::span<const config::TrackSpec> tracks = *t.as_audio_tracks();
				output.audio_tracks.assign(tracks.begin(), tracks.end());
				return;
			}
			case FilterToken::Type::AudioNormalize:
				output.audio_normalize = true;
				return;
			case FilterToken::Type::SubtitleTrackList: {
				const std::span<const config::TrackSpec> tracks = *t.as_subtitle_tracks();
				output.subtitle_tracks.assign(tracks.begin(), tracks.end());
				return;
			}
		}

		std::abort(); // unreachable
	}

	config::OutputJobConfig resolve_output(TokenSpan tokens) {
		config::OutputJobConfig output;
		output.video = configure_video_encoder(tokens);

		const std::optional<Spanned<std::string_view>> selected = find_video_encoder(tokens);

		for(const Spanned<FilterToken>& t : tokens) {
			if(t->as_video_encoder() && t.span != selected->span) {
				log::warning("Ignoring `{}`: the encoder is already set by `enc={}`", t->to_string(), selected->val);
			}

			apply_filter(output, t.as_cref());
		}

		return output;
	}
}
