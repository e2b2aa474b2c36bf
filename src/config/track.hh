#pragma once

#include "src/util.hh"

#include <cstdint>
#include <filesystem>
#include <string>
#include <variant>

namespace encspec::config {
	// A track taken from the source video itself, by index.
	//
	// The index is not checked against the video's actual track count here.
	struct FromVideo {
		uint8_t index;

		bool operator==(const FromVideo&) const = default;
	};

	// A track read from a sibling file of the source video.
	struct External {
		std::filesystem::path path;

		bool operator==(const External&) const = default;
	};

	using TrackSource = std::variant<FromVideo, External>;

	struct TrackSpec {
		TrackSource source;
		bool enabled = false;
		bool forced = false;

		bool operator==(const TrackSpec&) const = default;

		std::string to_string() const;
		void hash(Hasher& hasher) const;
	};
}
