#pragma once

#include "src/error.hh"

#include <cstdint>
#include <format>
#include <string>
#include <string_view>

namespace encspec::resolver::error {
	using Hint = Diagnostic::Hint;

	inline ParseError value_out_of_range(std::string_view filter, Spanned<int64_t> value, ValueRange range, std::string_view encoder) {
		ParseError e(
			ErrorKind::FilterValueOutOfRange,
			Diagnostic(
				std::format("Value {} of filter `{}` is out of range for encoder `{}`", value.val, filter, encoder),
				{
					Hint::error(std::format("Expected a value between {} and {}", range.min, range.max), value.span),
				}
			)
		);
		e.filter = filter;
		e.value = value.val;
		e.allowed_range = range;

		return e;
	}

	inline ParseError invalid_audio_bitrate(Spanned<int64_t> kbps, ValueRange range) {
		ParseError e(
			ErrorKind::FilterValueOutOfRange,
			Diagnostic(
				std::format("Invalid audio bitrate {}", kbps.val),
				{
					Hint::error(std::format("Expected at least {} kbps per channel", range.min), kbps.span),
				}
			)
		);
		e.filter = "ab";
		e.value = kbps.val;
		e.allowed_range = range;

		return e;
	}

	inline ParseError invalid_resolution(Spanned<int64_t> dimension, ValueRange range) {
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

	inline ParseError unsupported_bit_depth(Spanned<int64_t> depth) {
		ParseError e(
			ErrorKind::UnsupportedBitDepth,
			Diagnostic(
				std::format("Unsupported bit depth `{}`", depth.val),
				{
					Hint::error("Expected `8` or `10`", depth.span),
				}
			)
		);
		e.filter = "bd";
		e.literal = std::to_string(depth.val);

		return e;
	}

	inline ParseError unknown_encoder_name(Spanned<std::string_view> name) {
		ParseError e(
			ErrorKind::UnknownEncoderName,
			Diagnostic(
				std::format("Unknown video encoder `{}`", name.val),
				{
					Hint::error("", name.span),
				}
			)
		);
		e.literal = name.val;

		return e;
	}

	inline ParseError unknown_audio_encoder_name(Spanned<std::string_view> name) {
		ParseError e(
			ErrorKind::UnknownAudioEncoderName,
			Diagnostic(
				std::format("Unknown audio encoder `{}`", name.val),
				{
					Hint::error("", name.span),
				}
			)
		);
		e.literal = name.val;

		return e;
	}

	inline ParseError unsupported_extension(Spanned<std::string_view> ext) {
		ParseError e(
			ErrorKind::UnsupportedExtension,
			Diagnostic(
				std::format("Unsupported output extension `{}`", ext.val),
				{
					Hint::error("Expected `mkv` or `mp4`", ext.span),
				}
			)
		);
		e.literal = ext.val;

		return e;
	}
}
