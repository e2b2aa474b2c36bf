#pragma once

#include "src/config/output.hh"
#include "src/config/video.hh"
#include "src/error.hh"
#include "src/filter/token.hh"

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace encspec::resolver {
	using TokenSpan = std::span<const Spanned<FilterToken>>;

	// Folds the tokens of one segment into a validated configuration.
	//
	// The video encoder is selected first, so the position of `enc=` within the segment does not matter.
	// Filters that do not apply to the selected encoder are ignored. Throws `ParseError`.
	config::OutputJobConfig resolve_output(TokenSpan tokens);

	// The first `enc=` of the segment; any later one is ignored
	std::optional<Spanned<std::string_view>> find_video_encoder(TokenSpan tokens);

	// The selected encoder with its defaults, or x264 when none was named
	config::VideoJobConfig configure_video_encoder(TokenSpan tokens);

	// Projects one token onto `output`
	void apply_filter(config::OutputJobConfig& output, Spanned<const FilterToken&> token);

	void apply_quantizer(config::VideoJobConfig& video, Spanned<int16_t> q);
	void apply_speed(config::VideoJobConfig& video, Spanned<uint8_t> speed);
	void apply_grain(config::VideoJobConfig& video, Spanned<uint8_t> grain);
	void apply_profile(config::VideoJobConfig& video, config::Profile profile);
	void apply_compat(config::VideoJobConfig& video, bool compat);
}
