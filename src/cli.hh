#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace encspec::cli {
	struct Parameters {
		// Output specification; absent means one output with every default
		std::optional<std::string>         formats;
		bool                               verbose     = false;
		bool                               quiet       = false;
		bool                               fingerprint = false;
		bool                               help        = false;
		std::vector<std::filesystem::path> files;
	};

	// Parses the command line.
	//
	// Throws `boost::program_options::error` if it is invalid.
	Parameters parse(int argc, const char *const argv[]);

	std::string usage(std::string_view program);

	// The `AV_LOG_*` level selected by `--verbose` and `--quiet`
	int log_level(const Parameters& params);
}
