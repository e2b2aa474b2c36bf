#include "src/parser/track.hh"
#include "src/parser/error.hh"
#include "src/util.hh"

#include <algorithm>
#include <charconv>
#include <system_error>

namespace encspec::parser {
	config::TrackSource resolve_track_source(
		Spanned<std::string_view> identifier,
		std::string_view filter,
		const std::filesystem::path& source_file
	) {
		const std::string_view id = identifier.val;

		if(!id.empty() && std::all_of(id.begin(), id.end(), is_digit)) {
			uint8_t index = 0;
			const auto [ptr, ec] = std::from_chars(id.data(), id.data() + id.size(), index);

			if(ec != std::errc() || ptr != id.data() + id.size()) {
				throw error::invalid_numeric_literal(filter, identifier);
			}

			return config::FromVideo {index};
		}

		std::filesystem::path path = source_file;
		path.replace_extension(std::filesystem::path(id));

		std::error_code ec;
		if(!std::filesystem::exists(path, ec)) {
			throw error::missing_track_file(identifier.span, path);
		}

		return config::External {std::move(path)};
	}
}
