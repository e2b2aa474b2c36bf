#include <gtest/gtest.h>

#include "src/parser.hh"
#include "tests/TempDir.hh"

namespace encspec::tests {
	using config::Profile;

	class Parser : public TempDirTest {
		protected:
			parser::TokenStream parse(std::string_view segment) {
				return parser::parse_filters(Spanned(segment, Span(0, segment.length())), source());
			}

			// Parses a segment that is expected to fail and returns the error
			ParseError parse_error(std::string_view segment) {
				try {
					parse(segment);
				} catch(const ParseError& e) {
					return e;
				}

				ADD_FAILURE() << "`" << segment << "` parsed without error";
				return ParseError(ErrorKind::UnrecognizedFilter, Diagnostic("", {}));
			}
	};

	TEST_F(Parser, singleClauses) {
		EXPECT_EQ(parse("enc=aom")[0].val, FilterToken::video_encoder("aom"));
		EXPECT_EQ(parse("q=20")[0].val, FilterToken::quantizer(20));
		EXPECT_EQ(parse("qp=-12")[0].val, FilterToken::quantizer(-12));
		EXPECT_EQ(parse("crf=30")[0].val, FilterToken::quantizer(30));
		EXPECT_EQ(parse("s=4")[0].val, FilterToken::speed(4));
		EXPECT_EQ(parse("speed=6")[0].val, FilterToken::speed(6));
		EXPECT_EQ(parse("p=anime")[0].val, FilterToken::profile(Profile::Anime));
		EXPECT_EQ(parse("profile=AnimeGrain")[0].val, FilterToken::profile(Profile::AnimeGrain));
		EXPECT_EQ(parse("g=10")[0].val, FilterToken::grain(10));
		EXPECT_EQ(parse("grain=64")[0].val, FilterToken::grain(64));
		EXPECT_EQ(parse("compat=1")[0].val, FilterToken::compat(true));
		EXPECT_EQ(parse("compat=0")[0].val, FilterToken::compat(false));
		EXPECT_EQ(parse("ext=mp4")[0].val, FilterToken::extension("mp4"));
		EXPECT_EQ(parse("bd=10")[0].val, FilterToken::bit_depth(10));
		EXPECT_EQ(parse("res=1920x1080")[0].val, FilterToken::resolution({1920, 1080}));
		EXPECT_EQ(parse("aenc=opus")[0].val, FilterToken::audio_encoder("opus"));
		EXPECT_EQ(parse("ab=128")[0].val, FilterToken::audio_bitrate(128));
		EXPECT_EQ(parse("an=1")[0].val, FilterToken::audio_normalize());
	}

	TEST_F(Parser, clausesKeepTheirOrderAndSpans) {
		const parser::TokenStream tokens = parse("q=20, enc=aom ,s=3");

		ASSERT_EQ(tokens.size(), 3u);
		EXPECT_EQ(tokens[0].val, FilterToken::quantizer(20));
		EXPECT_EQ(tokens[0].span, Span(0, 4));
		EXPECT_EQ(tokens[1].val, FilterToken::video_encoder("aom"));
		EXPECT_EQ(tokens[1].span, Span(6, 7));
		EXPECT_EQ(tokens[2].val, FilterToken::speed(3));
		EXPECT_EQ(tokens[2].span, Span(15, 3));
	}

	TEST_F(Parser, whitespaceAroundSegment) {
		const parser::TokenStream tokens = parse("  p=film  ");

		ASSERT_EQ(tokens.size(), 1u);
		EXPECT_EQ(tokens[0].span, Span(2, 6));
	}

	TEST_F(Parser, trackLists) {
		const std::filesystem::path ac3 = touch("movie.ac3");
		const std::filesystem::path srt = touch("movie.en.srt");

		const parser::TokenStream tokens = parse("at=0-e|ac3-f,st=en.srt-ef|2");
		ASSERT_EQ(tokens.size(), 2u);

		const std::vector<config::TrackSpec> audio = {
			{config::FromVideo {0}, true, false},
			{config::External {ac3}, false, true},
		};
		const std::vector<config::TrackSpec> subtitles = {
			{config::External {srt}, true, true},
			{config::FromVideo {2}, false, false},
		};

		EXPECT_EQ(tokens[0].val, FilterToken::audio_tracks(std::vector(audio)));
		EXPECT_EQ(tokens[1].val, FilterToken::subtitle_tracks(std::vector(subtitles)));
	}

	TEST_F(Parser, trackTagLetters) {
		const parser::TokenStream tokens = parse("at=1-d|2-x|3-fe");
		const std::span<const config::TrackSpec> tracks = *tokens.at(0)->as_audio_tracks();

		ASSERT_EQ(tracks.size(), 3u);
		EXPECT_TRUE(tracks[0].enabled);
		EXPECT_FALSE(tracks[0].forced);
		EXPECT_FALSE(tracks[1].enabled);
		EXPECT_FALSE(tracks[1].forced);
		EXPECT_TRUE(tracks[2].enabled);
		EXPECT_TRUE(tracks[2].forced);
	}

	TEST_F(Parser, unknownNames) {
		EXPECT_EQ(parse_error("enc=vp9").kind(), ErrorKind::UnknownEncoderName);
		EXPECT_EQ(parse_error("enc=AOM").kind(), ErrorKind::UnknownEncoderName);
		EXPECT_EQ(parse_error("enc=").kind(), ErrorKind::UnknownEncoderName);
		EXPECT_EQ(parse_error("aenc=mp3").kind(), ErrorKind::UnknownAudioEncoderName);
		EXPECT_EQ(parse_error("p=cartoon").kind(), ErrorKind::UnknownProfile);
		EXPECT_EQ(parse_error("ext=avi").kind(), ErrorKind::UnsupportedExtension);
		EXPECT_EQ(parse_error("bd=12").kind(), ErrorKind::UnsupportedBitDepth);
		EXPECT_EQ(parse_error("bd=999").kind(), ErrorKind::UnsupportedBitDepth);
		EXPECT_EQ(parse_error("bd=256").kind(), ErrorKind::UnsupportedBitDepth);
		EXPECT_EQ(parse_error("bd=08").kind(), ErrorKind::UnsupportedBitDepth);
		EXPECT_EQ(parse_error("bd=010").literal, "010");

		const ParseError e = parse_error("enc=vp9");
		EXPECT_EQ(e.literal, "vp9");
		ASSERT_EQ(e.diagnostic().hints().size(), 1u);
		EXPECT_EQ(e.diagnostic().hints()[0].span, Span(4, 3));
	}

	TEST_F(Parser, invalidNumbers) {
		for(std::string_view s : {"q=abc", "q=", "s=300", "q=40000", "g=256", "compat=x", "ab=-1", "bd=x", "res=1920", "res=axb"}) {
			EXPECT_EQ(parse_error(s).kind(), ErrorKind::InvalidNumericLiteral) << s;
		}

		const ParseError e = parse_error("s=300");
		EXPECT_EQ(e.filter, "s");
		EXPECT_EQ(e.literal, "300");
	}

	TEST_F(Parser, resolutionBounds) {
		EXPECT_EQ(parse("res=64x64")[0].val, FilterToken::resolution({64, 64}));

		for(std::string_view s : {"res=1921x1080", "res=62x64", "res=64x63"}) {
			EXPECT_EQ(parse_error(s).kind(), ErrorKind::FilterValueOutOfRange) << s;
		}

		const ParseError e = parse_error("res=1280x721");
		EXPECT_EQ(e.filter, "res");
		EXPECT_EQ(e.value, 721);
		EXPECT_EQ(e.diagnostic().hints()[0].span, Span(9, 3));
	}

	TEST_F(Parser, unrecognizedFilter) {
		const ParseError e = parse_error("q=20,foo=1");

		EXPECT_EQ(e.kind(), ErrorKind::UnrecognizedFilter);
		EXPECT_EQ(e.literal, "foo=1");
		EXPECT_EQ(e.diagnostic().hints()[0].span, Span(5, 5));

		EXPECT_EQ(parse_error("an=0").kind(), ErrorKind::UnrecognizedFilter);
		EXPECT_EQ(parse_error("q=20x").literal, "x");
		// Non-ASCII bytes are not whitespace
		EXPECT_EQ(parse_error("q=20\xC3\xA9").literal, "\xC3\xA9");
		EXPECT_EQ(parse_error("\xC3\xA9").kind(), ErrorKind::UnrecognizedFilter);
		// The historic bare `e`/`f` track suffix is not accepted
		EXPECT_EQ(parse_error("at=1e|2").kind(), ErrorKind::MissingTrackFile);
	}

	TEST_F(Parser, malformedTrackList) {
		EXPECT_EQ(parse_error("at=").kind(), ErrorKind::UnrecognizedFilter);
		EXPECT_EQ(parse_error("st=0|").kind(), ErrorKind::UnrecognizedFilter);
		EXPECT_EQ(parse_error("at=ac3").kind(), ErrorKind::MissingTrackFile);
	}
}
