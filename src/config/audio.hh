#pragma once

#include "src/constants.hh"
#include "src/util.hh"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace encspec::config {
	enum struct AudioEncoder {
		Copy,
		Aac,
		Flac,
		Opus,
	};

	// Names accepted by `aenc=`
	std::span<const std::string_view> supported_audio_encoders();

	std::optional<AudioEncoder> AudioEncoder_from_name(std::string_view name);
	std::string_view AudioEncoder_to_str(AudioEncoder encoder);

	struct AudioJobConfig {
		AudioEncoder encoder = AudioEncoder::Copy;
		uint32_t kbps_per_channel = constants::DEFAULT_AUDIO_KBPS_PER_CHANNEL;

		bool operator==(const AudioJobConfig&) const = default;

		std::string to_string() const;
		void hash(Hasher& hasher) const;
	};
}
