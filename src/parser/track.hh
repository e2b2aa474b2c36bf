#pragma once

#include "src/config/track.hh"
#include "src/error.hh"

#include <filesystem>
#include <string_view>

namespace encspec::parser {
	// Resolves the identifier of a track clause.
	//
	// A number that fits in 8 bits selects a track of the source video. Anything else names a sibling of
	// `source_file` whose extension is replaced with the identifier (`ac3` -> `movie.ac3`), which must exist.
	// Dotted identifiers follow the same rule, so `1.ac3` names `movie.1.ac3`, not `movie.ac3`.
	//
	// Throws `ParseError` (`InvalidNumericLiteral` or `MissingTrackFile`). `filter` is only used for error reporting.
	config::TrackSource resolve_track_source(
		Spanned<std::string_view> identifier,
		std::string_view filter,
		const std::filesystem::path& source_file
	);
}
