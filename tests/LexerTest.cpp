#include <gtest/gtest.h>

#include "src/lexer.hh"

namespace encspec::tests {
	TEST(Lexer, tagConsumesOnlyOnMatch) {
		Lexer lexer("enc=aom");

		EXPECT_FALSE(lexer.tag("q="));
		EXPECT_EQ(lexer.position(), 0u);

		const std::optional<Span> s = lexer.tag("enc=");
		ASSERT_TRUE(s);
		EXPECT_EQ(*s, Span(0, 4));
		EXPECT_EQ(lexer.remaining(), "aom");
	}

	TEST(Lexer, spansAreRelativeToWholeSpecification) {
		Lexer lexer("q=20", 10);

		ASSERT_TRUE(lexer.tag("q="));
		const auto digits = lexer.digit1();

		ASSERT_TRUE(digits);
		EXPECT_EQ(digits->val, "20");
		EXPECT_EQ(digits->span, Span(12, 2));
		EXPECT_TRUE(lexer.empty());
	}

	TEST(Lexer, tagAnyTriesInOrder) {
		Lexer lexer("crf=30");

		const auto key = lexer.tag_any({"q=", "qp=", "crf="});
		ASSERT_TRUE(key);
		EXPECT_EQ(key->val, "crf=");
		EXPECT_EQ(lexer.remaining(), "30");
	}

	TEST(Lexer, characterClasses) {
		Lexer lexer("abc123.x");

		EXPECT_FALSE(lexer.digit1());

		const auto letters = lexer.alpha1();
		ASSERT_TRUE(letters);
		EXPECT_EQ(letters->val, "abc");

		const auto alnum = lexer.alnum1();
		ASSERT_TRUE(alnum);
		EXPECT_EQ(alnum->val, "123");

		EXPECT_FALSE(lexer.alnum1());
		EXPECT_TRUE(lexer.ch('.'));
	}

	TEST(Lexer, signedDigits) {
		Lexer negative("-12");
		const auto n = negative.signed_digits();
		ASSERT_TRUE(n);
		EXPECT_EQ(n->val, "-12");

		Lexer dash_only("-x");
		EXPECT_FALSE(dash_only.signed_digits());
		EXPECT_EQ(dash_only.remaining(), "-x");
	}

	TEST(Lexer, skipSeparators) {
		Lexer lexer("  , ,, q=1");

		lexer.skip_separators();
		// Only one run of commas is skipped
		EXPECT_EQ(lexer.remaining(), ",, q=1");

		Lexer trailing(" ,,  s=2");
		trailing.skip_separators();
		EXPECT_EQ(trailing.remaining(), "s=2");
	}

	TEST(Lexer, rewind) {
		Lexer lexer("ac3-", 5);

		const size_t start = lexer.position();
		ASSERT_TRUE(lexer.alnum1());
		const size_t dash = lexer.position();
		ASSERT_TRUE(lexer.ch('-'));
		EXPECT_FALSE(lexer.alpha1());

		lexer.rewind(dash);
		EXPECT_EQ(lexer.remaining(), "-");
		EXPECT_EQ(lexer.text(lexer.span_from(start)), "ac3");
	}
}
