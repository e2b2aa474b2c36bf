#pragma once

#include <cstdint>
#include <filesystem>
#include <format>
#include <span>
#include <string>
#include <string_view>

#include "src/error.hh"

namespace encspec::parser::error {
	using Hint = Diagnostic::Hint;

	// Lists the names of a closed set as "`a`, `b`, `c`"
	inline std::string quoted_list(std::span<const std::string_view> names) {
		std::string s;

		for(std::string_view name : names) {
			if(!s.empty()) {
				s += ", ";
			}
			s += std::format("`{}`", name);
		}

		return s;
	}

	inline ParseError unrecognized_filter(Spanned<std::string_view> remainder) {
		ParseError e(
			ErrorKind::UnrecognizedFilter,
			Diagnostic(
				std::format("Unrecognized filter `{}`", remainder.val),
				{
					Hint::error("No filter starts here", remainder.span),
				}
			)
		);
		e.literal = remainder.val;

		return e;
	}

	inline ParseError expected_track(Span at) {
		ParseError e(
			ErrorKind::UnrecognizedFilter,
			Diagnostic(
				"Expected a track (index or file extension)",
				{
					Hint::error("Expected track here", at),
				}
			)
		);

		return e;
	}

	inline ParseError invalid_numeric_literal(std::string_view filter, Spanned<std::string_view> literal) {
		ParseError e(
			ErrorKind::InvalidNumericLiteral,
			Diagnostic(
				std::format("Invalid number `{}` for filter `{}`", literal.val, filter),
				{
					Hint::error("", literal.span),
				}
			)
		);
		e.filter = filter;
		e.literal = literal.val;

		return e;
	}

	inline ParseError unknown_name(ErrorKind kind, std::string_view what, Spanned<std::string_view> name, std::span<const std::string_view> supported) {
		ParseError e(
			kind,
			Diagnostic(
				std::format("Unknown {} `{}`", what, name.val),
				{
					Hint::error(std::format("Expected one of {}", quoted_list(supported)), name.span),
				}
			)
		);
		e.literal = name.val;

		return e;
	}

	inline ParseError unsupported_bit_depth(Spanned<std::string_view> literal) {
		ParseError e(
			ErrorKind::UnsupportedBitDepth,
			Diagnostic(
				std::format("Unsupported bit depth `{}`", literal.val),
				{
					Hint::error("Expected `8` or `10`", literal.span),
				}
			)
		);
		e.filter = "bd";
		e.literal = literal.val;

		return e;
	}

	inline ParseError resolution_out_of_range(Spanned<uint32_t> dimension, ValueRange range) {
		ParseError e(
			ErrorKind::FilterValueOutOfRange,
			Diagnostic(
				std::format("Invalid resolution dimension `{}`", dimension.val),
				{
					Hint::error(std::format("Must be even and at least {}", range.min), dimension.span),
				}
			)
		);
		e.filter = "res";
		e.value = dimension.val;
		e.allowed_range = range;

		return e;
	}

	inline ParseError missing_track_file(Span track, const std::filesystem::path& path) {
		ParseError e(
			ErrorKind::MissingTrackFile,
			Diagnostic(
				std::format("Track file `{}` does not exist", path.string()),
				{
					Hint::error("Track referenced here", track),
				}
			)
		);
		e.path = path;

		return e;
	}
}
