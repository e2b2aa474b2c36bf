#include "src/spec.hh"
#include "src/log.hh"
#include "src/parser.hh"
#include "src/resolver/resolve.hh"
#include "src/util.hh"

#include <algorithm>

namespace encspec {
	static bool is_blank(std::string_view s) {
		return std::all_of(s.begin(), s.end(), is_space);
	}

	std::vector<Spanned<std::string_view>> split_segments(std::string_view specification) {
		std::vector<Spanned<std::string_view>> segments;

		size_t start = 0;
		for(;;) {
			const size_t end = std::min(specification.find(';', start), specification.length());
			const std::string_view segment = specification.substr(start, end - start);

			if(!is_blank(segment)) {
				segments.emplace_back(segment, Span(start, segment.length()));
			}

			if(end == specification.length()) {
				break;
			}

			start = end + 1;
		}

		return segments;
	}

	std::vector<config::OutputJobConfig> resolve(
		std::optional<std::string_view> specification,
		const std::filesystem::path& source_file
	) {
		std::vector<config::OutputJobConfig> outputs;

		if(!specification || is_blank(*specification)) {
			log::verbose("No output specification; using defaults");
			outputs.emplace_back();
			return outputs;
		}

		const std::vector<Spanned<std::string_view>> segments = split_segments(*specification);

		if(segments.empty()) {
			// Only separators (`;;`)
			outputs.emplace_back();
			return outputs;
		}

		for(size_t i = 0; i < segments.size(); i++) {
			const parser::TokenStream tokens = parser::parse_filters(segments[i], source_file);
			config::OutputJobConfig output = resolver::resolve_output(tokens);

			log::verbose(
				"Output {}: `{}` -> {} ({} filters)",
				i,
				*segments[i],
				config::VideoEncoderIdent_to_str(output.video.ident()),
				tokens.size()
			);

			outputs.push_back(std::move(output));
		}

		return outputs;
	}
}
