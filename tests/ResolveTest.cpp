#include <gtest/gtest.h>

#include "src/resolver/resolve.hh"

#include <cstdint>
#include <vector>

namespace encspec::tests {
	using config::Profile;
	using config::VideoEncoderIdent;
	using namespace config::video;

	// Builds a token stream where every token gets a distinct one-byte span
	template<typename... Tokens>
	static std::vector<Spanned<FilterToken>> stream(Tokens&&... tokens) {
		std::vector<Spanned<FilterToken>> out;
		size_t pos = 0;

		(out.emplace_back(std::forward<Tokens>(tokens), Span(pos++, 1)), ...);

		return out;
	}

	static ParseError resolve_error(const std::vector<Spanned<FilterToken>>& tokens) {
		try {
			resolver::resolve_output(tokens);
		} catch(const ParseError& e) {
			return e;
		}

		ADD_FAILURE() << "resolved without error";
		return ParseError(ErrorKind::UnrecognizedFilter, Diagnostic("", {}));
	}

	TEST(Resolve, defaultsToX264) {
		const config::OutputJobConfig output = resolver::resolve_output({});

		EXPECT_EQ(output, config::OutputJobConfig());
		ASSERT_NE(output.video.as<X264>(), nullptr);
		EXPECT_EQ(output.video.as<X264>()->crf, 18);
		EXPECT_EQ(output.output_extension, "mkv");
		EXPECT_EQ(output.audio.encoder, config::AudioEncoder::Copy);
		EXPECT_EQ(output.audio.kbps_per_channel, 96u);
	}

	TEST(Resolve, encoderSelectedFirst) {
		const config::OutputJobConfig output = resolver::resolve_output(stream(
			FilterToken::quantizer(30),
			FilterToken::video_encoder("aom")
		));

		const Aom *aom = output.video.as<Aom>();
		ASSERT_NE(aom, nullptr);
		EXPECT_EQ(aom->crf, 30);
		EXPECT_EQ(aom->speed, 4);
		EXPECT_EQ(aom->profile, Profile::Film);
	}

	TEST(Resolve, firstEncoderWins) {
		const config::OutputJobConfig output = resolver::resolve_output(stream(
			FilterToken::video_encoder("rav1e"),
			FilterToken::video_encoder("x265")
		));

		EXPECT_EQ(output.video.ident(), VideoEncoderIdent::Rav1e);
	}

	TEST(Resolve, filterOrderDoesNotMatter) {
		const config::OutputJobConfig a = resolver::resolve_output(stream(
			FilterToken::quantizer(20),
			FilterToken::profile(Profile::Anime)
		));
		const config::OutputJobConfig b = resolver::resolve_output(stream(
			FilterToken::profile(Profile::Anime),
			FilterToken::quantizer(20)
		));

		EXPECT_EQ(a, b);
		EXPECT_EQ(a.video.crf(), 20);
		EXPECT_EQ(a.video.profile(), Profile::Anime);
	}

	TEST(Resolve, quantizerRanges) {
		struct Case {
			std::string_view encoder;
			int16_t min;
			int16_t max;
		};

		for(const Case& c : {Case {"x264", -12, 51}, Case {"x265", 0, 51}, Case {"aom", 0, 63}, Case {"svt", 0, 63}, Case {"rav1e", 0, 255}}) {
			EXPECT_EQ(resolver::resolve_output(stream(FilterToken::video_encoder(c.encoder), FilterToken::quantizer(c.min))).video.crf(), c.min);
			EXPECT_EQ(resolver::resolve_output(stream(FilterToken::video_encoder(c.encoder), FilterToken::quantizer(c.max))).video.crf(), c.max);

			const ParseError below = resolve_error(stream(FilterToken::video_encoder(c.encoder), FilterToken::quantizer(c.min - 1)));
			EXPECT_EQ(below.kind(), ErrorKind::FilterValueOutOfRange) << c.encoder;
			EXPECT_EQ(below.value, c.min - 1);
			EXPECT_EQ(below.allowed_range, (ValueRange {c.min, c.max}));

			const ParseError above = resolve_error(stream(FilterToken::video_encoder(c.encoder), FilterToken::quantizer(c.max + 1)));
			EXPECT_EQ(above.kind(), ErrorKind::FilterValueOutOfRange) << c.encoder;
			EXPECT_EQ(above.filter, "q");
		}
	}

	TEST(Resolve, quantizerIgnoredForCopy) {
		const config::OutputJobConfig output = resolver::resolve_output(stream(
			FilterToken::video_encoder("copy"),
			FilterToken::quantizer(1000)
		));

		EXPECT_EQ(output.video.ident(), VideoEncoderIdent::Copy);
		EXPECT_EQ(output.video.crf(), std::nullopt);
	}

	TEST(Resolve, speedAppliesToAv1Encoders) {
		const config::OutputJobConfig rav1e = resolver::resolve_output(stream(
			FilterToken::video_encoder("rav1e"),
			FilterToken::speed(10)
		));
		EXPECT_EQ(rav1e.video.as<Rav1e>()->speed, 10);

		const ParseError e = resolve_error(stream(FilterToken::video_encoder("rav1e"), FilterToken::speed(11)));
		EXPECT_EQ(e.kind(), ErrorKind::FilterValueOutOfRange);
		EXPECT_EQ(e.filter, "s");
		EXPECT_EQ(e.value, 11);
		EXPECT_EQ(e.allowed_range, (ValueRange {0, 10}));
		EXPECT_EQ(e.diagnostic().hints()[0].span, Span(1, 1));

		// x264 has no speed, so nothing is checked
		const config::OutputJobConfig x264 = resolver::resolve_output(stream(FilterToken::speed(200)));
		EXPECT_EQ(x264, config::OutputJobConfig());
	}

	TEST(Resolve, grain) {
		const config::OutputJobConfig svt = resolver::resolve_output(stream(
			FilterToken::video_encoder("svt"),
			FilterToken::grain(64)
		));
		EXPECT_EQ(svt.video.as<SvtAv1>()->grain, 64);

		EXPECT_EQ(resolve_error(stream(FilterToken::video_encoder("aom"), FilterToken::grain(65))).kind(), ErrorKind::FilterValueOutOfRange);
		EXPECT_EQ(resolver::resolve_output(stream(FilterToken::video_encoder("x265"), FilterToken::grain(200))).video.as<X265>()->crf, 18);
	}

	TEST(Resolve, compatAndProfileApplicability) {
		const config::OutputJobConfig aom = resolver::resolve_output(stream(
			FilterToken::video_encoder("aom"),
			FilterToken::compat(true)
		));
		EXPECT_TRUE(aom.video.as<Aom>()->compat);

		const config::OutputJobConfig rav1e = resolver::resolve_output(stream(
			FilterToken::video_encoder("rav1e"),
			FilterToken::compat(true)
		));
		EXPECT_EQ(rav1e.video, config::VideoJobConfig::defaults(VideoEncoderIdent::Rav1e));

		const config::OutputJobConfig copy = resolver::resolve_output(stream(
			FilterToken::video_encoder("copy"),
			FilterToken::profile(Profile::Fast)
		));
		EXPECT_EQ(copy.video.profile(), std::nullopt);
	}

	TEST(Resolve, outputFields) {
		const std::vector<config::TrackSpec> audio = {{config::FromVideo {1}, true, false}};
		const std::vector<config::TrackSpec> subs = {{config::FromVideo {3}, false, true}};

		const config::OutputJobConfig output = resolver::resolve_output(stream(
			FilterToken::extension("mp4"),
			FilterToken::bit_depth(10),
			FilterToken::resolution({1280, 720}),
			FilterToken::audio_encoder("opus"),
			FilterToken::audio_bitrate(64),
			FilterToken::audio_normalize(),
			FilterToken::audio_tracks(std::vector(audio)),
			FilterToken::subtitle_tracks(std::vector(subs)),
			FilterToken::extension("mkv")
		));

		EXPECT_EQ(output.output_extension, "mkv");
		EXPECT_EQ(output.bit_depth_override, 10);
		EXPECT_EQ(output.resolution_override, (config::Resolution {1280, 720}));
		EXPECT_EQ(output.audio.encoder, config::AudioEncoder::Opus);
		EXPECT_EQ(output.audio.kbps_per_channel, 64u);
		EXPECT_TRUE(output.audio_normalize);
		EXPECT_EQ(output.audio_tracks, audio);
		EXPECT_EQ(output.subtitle_tracks, subs);
	}

	TEST(Resolve, zeroAudioBitrate) {
		const ParseError e = resolve_error(stream(FilterToken::audio_bitrate(0)));

		EXPECT_EQ(e.kind(), ErrorKind::FilterValueOutOfRange);
		EXPECT_EQ(e.filter, "ab");
		EXPECT_EQ(e.value, 0);
		EXPECT_EQ(e.allowed_range, (ValueRange {1, UINT32_MAX}));
	}

	TEST(Resolve, handBuiltTokensAreRevalidated) {
		EXPECT_EQ(resolve_error(stream(FilterToken::video_encoder("vp9"))).kind(), ErrorKind::UnknownEncoderName);
		EXPECT_EQ(resolve_error(stream(FilterToken::audio_encoder("mp3"))).kind(), ErrorKind::UnknownAudioEncoderName);
		EXPECT_EQ(resolve_error(stream(FilterToken::extension("avi"))).kind(), ErrorKind::UnsupportedExtension);
		EXPECT_EQ(resolve_error(stream(FilterToken::bit_depth(12))).kind(), ErrorKind::UnsupportedBitDepth);
		EXPECT_EQ(resolve_error(stream(FilterToken::resolution({63, 64}))).kind(), ErrorKind::FilterValueOutOfRange);
	}
}
