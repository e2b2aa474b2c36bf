#pragma once

#include "src/config/output.hh"
#include "src/error.hh"

#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace encspec {
	// Splits a specification into its `;`-separated segments.
	//
	// Blank segments are dropped. Every span is relative to `specification`.
	std::vector<Spanned<std::string_view>> split_segments(std::string_view specification);

	// Resolves every output described by `specification` for `source_file`, in order.
	//
	// An absent or blank specification describes a single output with every default. The first error
	// aborts the whole call (`ParseError`).
	std::vector<config::OutputJobConfig> resolve(
		std::optional<std::string_view> specification,
		const std::filesystem::path& source_file
	);
}
