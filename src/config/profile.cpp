#include "src/config/profile.hh"

#include <array>
#include <string>
#include <utility>

extern "C" {
	#include <libavutil/avstring.h>
}

namespace encspec::config {
	static constexpr std::array<std::pair<Profile, const char *>, 6> PROFILE_NAMES = {{
		{Profile::Film,          "film"},
		{Profile::Grain,         "grain"},
		{Profile::Anime,         "anime"},
		{Profile::AnimeDetailed, "animedetailed"},
		{Profile::AnimeGrain,    "animegrain"},
		{Profile::Fast,          "fast"},
	}};

	std::optional<Profile> Profile_from_string(std::string_view name) {
		// av_strcasecmp needs a null-terminated string
		const std::string owned(name);

		for(const auto& [profile, profile_name] : PROFILE_NAMES) {
			if(av_strcasecmp(owned.c_str(), profile_name) == 0) {
				return profile;
			}
		}

		return std::optional<Profile>();
	}

	std::string_view Profile_to_str(Profile profile) {
		switch(profile) {
			case Profile::Film:
				return "film";
			case Profile::Grain:
				return "grain";
			case Profile::Anime:
				return "anime";
			case Profile::AnimeDetailed:
				return "animedetailed";
			case Profile::AnimeGrain:
				return "animegrain";
			case Profile::Fast:
				return "fast";
		}

		return "film"; // unreachable
	}

	bool Profile_is_anime(Profile profile) {
		switch(profile) {
			case Profile::Anime:
			case Profile::AnimeDetailed:
			case Profile::AnimeGrain:
				return true;
			case Profile::Film:
			case Profile::Grain:
			case Profile::Fast:
				return false;
		}

		return false;
	}
}
