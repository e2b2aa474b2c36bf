#include "src/config/audio.hh"
#include "src/config/profile.hh"
#include "src/config/video.hh"
#include "src/constants.hh"
#include "src/error.hh"
#include "src/log.hh"
#include "src/parser/error.hh"
#include "src/parser/track.hh"
#include "src/parser.hh"
#include "src/util.hh"

#include <array>
#include <charconv>
#include <cstddef>
#include <span>
#include <string>
#include <system_error>
#include <type_traits>

namespace encspec::parser {
	// The text following a key up to the next separator. Used when the value has the wrong shape.
	static Spanned<std::string_view> value_literal(const Lexer& lexer) {
		const std::string_view rest = lexer.remaining();

		size_t len = 0;
		while(len < rest.length() && rest[len] != ',' && !is_space(rest[len])) {
			len += 1;
		}

		return Spanned(rest.substr(0, len), Span(lexer.position(), len));
	}

	template<typename T>
	static T parse_integer(std::string_view filter, Spanned<std::string_view> literal) {
		const std::string_view s = literal.val;

		T value {};
		const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);

		if(ec != std::errc() || ptr != s.data() + s.size()) {
			throw error::invalid_numeric_literal(filter, literal);
		}

		return value;
	}

	// Digits after a key, converted to `T`
	template<typename T>
	static Spanned<T> expect_integer(Lexer& lexer, std::string_view filter) {
		std::optional<Spanned<std::string_view>> digits = std::is_signed_v<T> ? lexer.signed_digits() : lexer.digit1();

		if(!digits) {
			throw error::invalid_numeric_literal(filter, value_literal(lexer));
		}

		return Spanned(parse_integer<T>(filter, *digits), digits->span);
	}

	TokenStream parse_filters(Spanned<std::string_view> segment, const std::filesystem::path& source_file) {
		typedef std::optional<FilterToken> (*subfunction)(Lexer&, const std::filesystem::path&);
		constexpr subfunction subfunctions[] = {
			try_parse_video_encoder,
			try_parse_quantizer,
			try_parse_speed,
			try_parse_profile,
			try_parse_grain,
			try_parse_compat,
			try_parse_extension,
			try_parse_bit_depth,
			try_parse_resolution,
			try_parse_audio_encoder,
			try_parse_audio_bitrate,
			try_parse_audio_tracks,
			try_parse_audio_normalize,
			try_parse_subtitle_tracks,
		};

		TokenStream tokens;
		Lexer lexer(segment.val, segment.span.start);

		lexer.skip_whitespace();

		while(!lexer.empty()) {
			const size_t start = lexer.position();

			std::optional<FilterToken> token;
			for(subfunction f: subfunctions) {
				if(std::optional<FilterToken> t = f(lexer, source_file)) {
					token.emplace(std::move(*t));
					break;
				}
			}

			if(!token.has_value()) {
				throw error::unrecognized_filter(Spanned(lexer.remaining(), lexer.remaining_span()));
			}

			const Span span = lexer.span_from(start);
			log::debug("Parsed filter `{}` at byte {}", token->to_string(), span.start);

			tokens.emplace_back(std::move(*token), span);
			lexer.skip_separators();
		}

		return tokens;
	}

	std::optional<FilterToken> try_parse_video_encoder(Lexer& lexer, const std::filesystem::path&) {
		if(!lexer.tag("enc=")) {
			return std::optional<FilterToken>();
		}

		std::optional<Spanned<std::string_view>> name = lexer.alnum1();
		if(!name) {
			name.emplace(value_literal(lexer));
		}

		if(!config::VideoEncoderIdent_from_name(name->val)) {
			throw error::unknown_name(ErrorKind::UnknownEncoderName, "video encoder", *name, config::supported_video_encoders());
		}

		return FilterToken::video_encoder(name->val);
	}

	std::optional<FilterToken> try_parse_quantizer(Lexer& lexer, const std::filesystem::path&) {
		if(!lexer.tag_any({"q=", "qp=", "crf="})) {
			return std::optional<FilterToken>();
		}

		return FilterToken::quantizer(*expect_integer<int16_t>(lexer, "q"));
	}

	std::optional<FilterToken> try_parse_speed(Lexer& lexer, const std::filesystem::path&) {
		if(!lexer.tag_any({"s=", "speed="})) {
			return std::optional<FilterToken>();
		}

		return FilterToken::speed(*expect_integer<uint8_t>(lexer, "s"));
	}

	std::optional<FilterToken> try_parse_profile(Lexer& lexer, const std::filesystem::path&) {
		if(!lexer.tag_any({"p=", "profile="})) {
			return std::optional<FilterToken>();
		}

		std::optional<Spanned<std::string_view>> name = lexer.alpha1();
		if(!name) {
			name.emplace(value_literal(lexer));
		}

		const std::optional<config::Profile> profile = config::Profile_from_string(name->val);
		if(!profile) {
			static constexpr std::array<std::string_view, 6> PROFILE_NAMES = {
				"film", "grain", "anime", "animedetailed", "animegrain", "fast",
			};
			throw error::unknown_name(ErrorKind::UnknownProfile, "profile", *name, PROFILE_NAMES);
		}

		return FilterToken::profile(*profile);
	}

	std::optional<FilterToken> try_parse_grain(Lexer& lexer, const std::filesystem::path&) {
		if(!lexer.tag_any({"g=", "grain="})) {
			return std::optional<FilterToken>();
		}

		return FilterToken::grain(*expect_integer<uint8_t>(lexer, "g"));
	}

	std::optional<FilterToken> try_parse_compat(Lexer& lexer, const std::filesystem::path&) {
		if(!lexer.tag("compat=")) {
			return std::optional<FilterToken>();
		}

		return FilterToken::compat(*expect_integer<uint8_t>(lexer, "compat") > 0);
	}

	std::optional<FilterToken> try_parse_extension(Lexer& lexer, const std::filesystem::path&) {
		if(!lexer.tag("ext=")) {
			return std::optional<FilterToken>();
		}

		static constexpr std::array<std::string_view, 2> EXTENSIONS = {"mkv", "mp4"};

		std::optional<Spanned<std::string_view>> ext = lexer.alnum1();
		if(!ext) {
			ext.emplace(value_literal(lexer));
		}

		if(ext->val != "mkv" && ext->val != "mp4") {
			throw error::unknown_name(ErrorKind::UnsupportedExtension, "output extension", *ext, EXTENSIONS);
		}

		return FilterToken::extension(ext->val);
	}

	std::optional<FilterToken> try_parse_bit_depth(Lexer& lexer, const std::filesystem::path&) {
		if(!lexer.tag("bd=")) {
			return std::optional<FilterToken>();
		}

		std::optional<Spanned<std::string_view>> digits = lexer.digit1();
		if(!digits) {
			throw error::invalid_numeric_literal("bd", value_literal(lexer));
		}

		// Only the exact spellings are accepted (`bd=08` is not 8)
		if(digits->val == "8") {
			return FilterToken::bit_depth(8);
		} else if(digits->val == "10") {
			return FilterToken::bit_depth(10);
		}

		throw error::unsupported_bit_depth(*digits);
	}

	std::optional<FilterToken> try_parse_resolution(Lexer& lexer, const std::filesystem::path&) {
		if(!lexer.tag("res=")) {
			return std::optional<FilterToken>();
		}

		const Spanned<std::string_view> literal = value_literal(lexer);

		std::optional<Spanned<std::string_view>> width = lexer.digit1();
		const bool has_separator = width && lexer.ch('x');
		std::optional<Spanned<std::string_view>> height = has_separator ? lexer.digit1() : std::nullopt;

		if(!height) {
			throw error::invalid_numeric_literal("res", literal);
		}

		const Spanned<uint32_t> dimensions[] = {
			Spanned(parse_integer<uint32_t>("res", *width), width->span),
			Spanned(parse_integer<uint32_t>("res", *height), height->span),
		};

		for(const Spanned<uint32_t>& d : dimensions) {
			if(d.val % 2 != 0 || !constants::RESOLUTION_RANGE.contains(d.val)) {
				throw error::resolution_out_of_range(d, constants::RESOLUTION_RANGE);
			}
		}

		return FilterToken::resolution(config::Resolution {dimensions[0].val, dimensions[1].val});
	}

	std::optional<FilterToken> try_parse_audio_encoder(Lexer& lexer, const std::filesystem::path&) {
		if(!lexer.tag("aenc=")) {
			return std::optional<FilterToken>();
		}

		std::optional<Spanned<std::string_view>> name = lexer.alnum1();
		if(!name) {
			name.emplace(value_literal(lexer));
		}

		if(!config::AudioEncoder_from_name(name->val)) {
			throw error::unknown_name(ErrorKind::UnknownAudioEncoderName, "audio encoder", *name, config::supported_audio_encoders());
		}

		return FilterToken::audio_encoder(name->val);
	}

	std::optional<FilterToken> try_parse_audio_bitrate(Lexer& lexer, const std::filesystem::path&) {
		if(!lexer.tag("ab=")) {
			return std::optional<FilterToken>();
		}

		return FilterToken::audio_bitrate(*expect_integer<uint32_t>(lexer, "ab"));
	}

	std::optional<FilterToken> try_parse_audio_tracks(Lexer& lexer, const std::filesystem::path& source_file) {
		if(!lexer.tag("at=")) {
			return std::optional<FilterToken>();
		}

		return FilterToken::audio_tracks(parse_track_list(lexer, "at", source_file));
	}

	std::optional<FilterToken> try_parse_audio_normalize(Lexer& lexer, const std::filesystem::path&) {
		if(!lexer.tag("an=1")) {
			return std::optional<FilterToken>();
		}

		return FilterToken::audio_normalize();
	}

	std::optional<FilterToken> try_parse_subtitle_tracks(Lexer& lexer, const std::filesystem::path& source_file) {
		if(!lexer.tag("st=")) {
			return std::optional<FilterToken>();
		}

		return FilterToken::subtitle_tracks(parse_track_list(lexer, "st", source_file));
	}

	// `alnum+ ('.' alnum+)*`
	static std::optional<Spanned<std::string_view>> parse_track_identifier(Lexer& lexer) {
		const size_t start = lexer.position();

		if(!lexer.alnum1()) {
			return std::optional<Spanned<std::string_view>>();
		}

		for(;;) {
			const size_t dot = lexer.position();

			if(!lexer.ch('.')) {
				break;
			}

			if(!lexer.alnum1()) {
				lexer.rewind(dot);
				break;
			}
		}

		const Span span = lexer.span_from(start);
		return Spanned(lexer.text(span), span);
	}

	static config::TrackSpec parse_track(Lexer& lexer, std::string_view filter, const std::filesystem::path& source_file) {
		std::optional<Spanned<std::string_view>> identifier = parse_track_identifier(lexer);
		if(!identifier) {
			throw error::expected_track(Span(lexer.position(), 0));
		}

		config::TrackSpec track {
			.source = resolve_track_source(*identifier, filter, source_file),
		};

		const size_t dash = lexer.position();
		if(lexer.ch('-')) {
			if(std::optional<Spanned<std::string_view>> tags = lexer.alpha1()) {
				for(char c : tags->val) {
					if(c == 'd' || c == 'e') {
						track.enabled = true;
					} else if(c == 'f') {
						track.forced = true;
					}
				}
			} else {
				lexer.rewind(dash);
			}
		}

		return track;
	}

	std::vector<config::TrackSpec> parse_track_list(Lexer& lexer, std::string_view filter, const std::filesystem::path& source_file) {
		std::vector<config::TrackSpec> tracks;

		tracks.push_back(parse_track(lexer, filter, source_file));
		while(lexer.ch('|')) {
			tracks.push_back(parse_track(lexer, filter, source_file));
		}

		return tracks;
	}
}
