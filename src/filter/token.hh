#pragma once

#include "src/config/output.hh"
#include "src/config/profile.hh"
#include "src/config/track.hh"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace encspec {
	// One recognized clause of a segment.
	//
	// Names are views into the specification string, so a token must not outlive it.
	class FilterToken {
		public:
			enum struct Type {
				VideoEncoderName,
				Quantizer,
				Speed,
				Profile,
				Grain,
				Compat,
				Extension,
				BitDepth,
				Resolution,
				AudioEncoderName,
				AudioBitrate,
				AudioTrackList,
				AudioNormalize,
				SubtitleTrackList,
			};

			FilterToken(const FilterToken&) = delete;
			FilterToken(FilterToken&& t);
			~FilterToken();

			constexpr Type type() const {return m_type;}
			bool operator==(const FilterToken& rhs) const;

			// Canonical key of the clause (`q` for `q=`, `qp=` and `crf=`)
			std::string_view filter_name() const;

			// Displays the token in its canonical clause form
			std::string to_string() const;

			static FilterToken video_encoder(std::string_view name);
			static FilterToken quantizer(int16_t q);
			static FilterToken speed(uint8_t speed);
			static FilterToken profile(config::Profile profile);
			static FilterToken grain(uint8_t grain);
			static FilterToken compat(bool compat);
			static FilterToken extension(std::string_view extension);
			static FilterToken bit_depth(uint8_t depth);
			static FilterToken resolution(config::Resolution resolution);
			static FilterToken audio_encoder(std::string_view name);
			static FilterToken audio_bitrate(uint32_t kbps);
			static FilterToken audio_tracks(std::vector<config::TrackSpec>&& tracks);
			static FilterToken audio_normalize();
			static FilterToken subtitle_tracks(std::vector<config::TrackSpec>&& tracks);

			std::optional<std::string_view>   as_video_encoder() const;
			std::optional<int16_t>            as_quantizer() const;
			std::optional<uint8_t>            as_speed() const;
			std::optional<config::Profile>    as_profile() const;
			std::optional<uint8_t>            as_grain() const;
			std::optional<bool>               as_compat() const;
			std::optional<std::string_view>   as_extension() const;
			std::optional<uint8_t>            as_bit_depth() const;
			std::optional<config::Resolution> as_resolution() const;
			std::optional<std::string_view>   as_audio_encoder() const;
			std::optional<uint32_t>           as_audio_bitrate() const;
			std::optional<std::span<const config::TrackSpec>> as_audio_tracks() const;
			bool                              is_audio_normalize() const;
			std::optional<std::span<const config::TrackSpec>> as_subtitle_tracks() const;
		private:
			Type m_type;
			union {
				std::string_view               m_name;
				int16_t                        m_quantizer;
				uint8_t                        m_small;
				bool                           m_compat;
				config::Profile                m_profile;
				config::Resolution             m_resolution;
				uint32_t                       m_bitrate;
				std::vector<config::TrackSpec> m_tracks;
			};

			inline FilterToken() noexcept {};

			static FilterToken track_list(Type type, std::vector<config::TrackSpec>&& tracks);
	};
}
