#include "src/config/audio.hh"

#include <array>
#include <format>

namespace encspec::config {
	static constexpr std::array<std::string_view, 4> AUDIO_ENCODER_NAMES = {
		"copy", "aac", "flac", "opus",
	};

	std::span<const std::string_view> supported_audio_encoders() {
		return AUDIO_ENCODER_NAMES;
	}

	std::optional<AudioEncoder> AudioEncoder_from_name(std::string_view name) {
		if(name == "copy") {
			return AudioEncoder::Copy;
		}
		if(name == "aac") {
			return AudioEncoder::Aac;
		}
		if(name == "flac") {
			return AudioEncoder::Flac;
		}
		if(name == "opus") {
			return AudioEncoder::Opus;
		}

		return std::optional<AudioEncoder>();
	}

	std::string_view AudioEncoder_to_str(AudioEncoder encoder) {
		switch(encoder) {
			case AudioEncoder::Copy:
				return "copy";
			case AudioEncoder::Aac:
				return "aac";
			case AudioEncoder::Flac:
				return "flac";
			case AudioEncoder::Opus:
				return "opus";
		}

		return "copy"; // unreachable
	}

	std::string AudioJobConfig::to_string() const {
		return std::format("{} {{ kbps_per_channel: {} }}", AudioEncoder_to_str(encoder), kbps_per_channel);
	}

	void AudioJobConfig::hash(Hasher& hasher) const {
		hasher.add("_audio-config_");
		const size_t start = hasher.pos();

		hasher.add_field(AudioEncoder_to_str(encoder));
		hasher.add(kbps_per_channel);

		hasher.add(static_cast<uint64_t>(hasher.pos() - start));
	}
}
