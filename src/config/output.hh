#pragma once

#include "src/config/audio.hh"
#include "src/config/track.hh"
#include "src/config/video.hh"
#include "src/constants.hh"
#include "src/util.hh"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace encspec::config {
	struct Resolution {
		uint32_t width;
		uint32_t height;

		bool operator==(const Resolution&) const = default;
	};

	// Everything needed to produce one output file from a source.
	class OutputJobConfig {
		public:
			VideoJobConfig          video;
			std::string             output_extension = std::string(constants::DEFAULT_EXTENSION);
			std::optional<uint8_t>  bit_depth_override;
			std::optional<Resolution> resolution_override;
			AudioJobConfig          audio;
			bool                    audio_normalize = false;
			std::vector<TrackSpec>  audio_tracks;
			std::vector<TrackSpec>  subtitle_tracks;

			bool operator==(const OutputJobConfig&) const = default;

			std::string to_string() const;
			void hash(Hasher& hasher) const;

			// SHA-256 of the configuration, as URL-safe BASE64.
			//
			// Equal configurations always have equal fingerprints.
			std::string fingerprint() const;
	};
}
