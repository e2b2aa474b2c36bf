#pragma once

#include "src/error.hh"
#include "src/filter/token.hh"
#include "src/lexer.hh"

#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace encspec::parser {
	// The filter tokens of one output segment, in the order they were written
	using TokenStream = std::vector<Spanned<FilterToken>>;

	// Parses every clause of one segment.
	//
	// `segment.span` locates the segment within the whole specification so that diagnostics point at the
	// right place. `source_file` is needed to resolve external track references.
	//
	// Throws `ParseError` on the first clause that cannot be parsed.
	TokenStream parse_filters(Spanned<std::string_view> segment, const std::filesystem::path& source_file);

	// Each production either leaves `lexer` untouched and returns nothing (its key does not match), or
	// consumes a whole clause. Once the key has matched, an invalid value is an error.
	std::optional<FilterToken> try_parse_video_encoder(Lexer& lexer, const std::filesystem::path& source_file);
	std::optional<FilterToken> try_parse_quantizer(Lexer& lexer, const std::filesystem::path& source_file);
	std::optional<FilterToken> try_parse_speed(Lexer& lexer, const std::filesystem::path& source_file);
	std::optional<FilterToken> try_parse_profile(Lexer& lexer, const std::filesystem::path& source_file);
	std::optional<FilterToken> try_parse_grain(Lexer& lexer, const std::filesystem::path& source_file);
	std::optional<FilterToken> try_parse_compat(Lexer& lexer, const std::filesystem::path& source_file);
	std::optional<FilterToken> try_parse_extension(Lexer& lexer, const std::filesystem::path& source_file);
	std::optional<FilterToken> try_parse_bit_depth(Lexer& lexer, const std::filesystem::path& source_file);
	std::optional<FilterToken> try_parse_resolution(Lexer& lexer, const std::filesystem::path& source_file);
	std::optional<FilterToken> try_parse_audio_encoder(Lexer& lexer, const std::filesystem::path& source_file);
	std::optional<FilterToken> try_parse_audio_bitrate(Lexer& lexer, const std::filesystem::path& source_file);
	std::optional<FilterToken> try_parse_audio_tracks(Lexer& lexer, const std::filesystem::path& source_file);
	std::optional<FilterToken> try_parse_audio_normalize(Lexer& lexer, const std::filesystem::path& source_file);
	std::optional<FilterToken> try_parse_subtitle_tracks(Lexer& lexer, const std::filesystem::path& source_file);

	// `identifier ('-' letters)? ('|' identifier ('-' letters)?)*`
	std::vector<config::TrackSpec> parse_track_list(Lexer& lexer, std::string_view filter, const std::filesystem::path& source_file);
}
