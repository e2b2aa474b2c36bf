#pragma once

#include <optional>
#include <string_view>

namespace encspec::config {
	// Tuning profile applied to an encode.
	enum struct Profile {
		Film,
		Grain,
		Anime,
		AnimeDetailed,
		AnimeGrain,
		Fast,
	};

	// We are using regular functions because C++ enums cannot have methods

	// Parses a profile name (case-insensitive)
	std::optional<Profile> Profile_from_string(std::string_view name);
	std::string_view Profile_to_str(Profile profile);
	bool Profile_is_anime(Profile profile);
}
