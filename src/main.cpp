#include "src/cli.hh"
#include "src/config/output.hh"
#include "src/error.hh"
#include "src/spec.hh"

#include <boost/program_options/errors.hpp>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string_view>
#include <vector>

#include <unistd.h>

extern "C" {
	#include <libavutil/log.h>
}

using encspec::config::OutputJobConfig;

// Prints the outputs of one file, or its error. Returns whether it succeeded.
static bool process_file(const encspec::cli::Parameters& params, const std::filesystem::path& file) {
	const std::optional<std::string_view> spec = params.formats
		? std::optional<std::string_view>(*params.formats)
		: std::nullopt;

	try {
		const std::vector<OutputJobConfig> outputs = encspec::resolve(spec, file);

		std::cout << file.string() << ":\n";
		for(size_t i = 0; i < outputs.size(); i++) {
			std::cout << "#" << i << " " << outputs[i].to_string() << '\n';

			if(params.fingerprint) {
				std::cout << "fingerprint: " << outputs[i].fingerprint() << '\n';
			}
		}

		return true;
	} catch(const encspec::ParseError& e) {
		const encspec::SourceInfo si(spec.value_or(""));
		const bool color = isatty(STDERR_FILENO);

		std::cerr
			<< "[Error] Failed processing file " << file.string() << '\n'
			<< e.render(si, color) << '\n';

		return false;
	}
}

int main(int argc, char *argv[]) {
	encspec::cli::Parameters params;

	try {
		params = encspec::cli::parse(argc, argv);
	} catch(const boost::program_options::error& e) {
		std::cerr << "error: " << e.what() << "\n\n" << encspec::cli::usage(argv[0]);
		return EXIT_FAILURE;
	}

	if(params.help) {
		std::cout << encspec::cli::usage(argv[0]);
		return EXIT_SUCCESS;
	}

	av_log_set_level(encspec::cli::log_level(params));

	bool all_ok = true;

	try {
		for(const std::filesystem::path& file : params.files) {
			all_ok &= process_file(params, file);
		}
	} catch(const std::exception& e) {
		std::cerr << "error: " << e.what() << '\n';
		return EXIT_FAILURE;
	}

	return all_ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
