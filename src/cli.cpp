#include "src/cli.hh"

#include <boost/program_options.hpp>

#include <sstream>

extern "C" {
	#include <libavutil/log.h>
}

namespace po = boost::program_options;

namespace encspec::cli {
	static po::options_description visible_options() {
		po::options_description options("Options");
		options.add_options()
			("help,h", "Display this help message")
			("formats,f", po::value<std::string>(), "Output specification, e.g. `enc=aom,q=20;enc=x264`")
			("verbose,v", po::bool_switch(), "Log every parsed filter")
			("quiet", po::bool_switch(), "Only log errors")
			("fingerprint", po::bool_switch(), "Print the fingerprint of every output");

		return options;
	}

	Parameters parse(int argc, const char *const argv[]) {
		po::options_description hidden("Hidden options");
		hidden.add_options()
			("file", po::value<std::vector<std::string>>()->composing(), "file");

		po::options_description all;
		all.add(visible_options()).add(hidden);

		po::positional_options_description positional;
		positional.add("file", -1);

		po::variables_map vm;
		po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
		po::notify(vm);

		Parameters params;
		params.help        = vm.count("help") > 0;
		params.verbose     = vm["verbose"].as<bool>();
		params.quiet       = vm["quiet"].as<bool>();
		params.fingerprint = vm["fingerprint"].as<bool>();

		if(vm.count("formats")) {
			params.formats = vm["formats"].as<std::string>();
		}

		if(params.verbose && params.quiet) {
			throw po::error("`--verbose` and `--quiet` cannot be combined");
		}

		if(vm.count("file")) {
			for(const std::string& file : vm["file"].as<std::vector<std::string>>()) {
				params.files.emplace_back(file);
			}
		}

		if(params.files.empty() && !params.help) {
			throw po::error("no input file provided");
		}

		return params;
	}

	std::string usage(std::string_view program) {
		std::stringstream s;

		s << "Usage: " << program << " [options] file...\n";
		s << visible_options();

		return std::move(s).str();
	}

	int log_level(const Parameters& params) {
		if(params.verbose) {
			return AV_LOG_DEBUG;
		}
		if(params.quiet) {
			return AV_LOG_ERROR;
		}

		return AV_LOG_INFO;
	}
}
