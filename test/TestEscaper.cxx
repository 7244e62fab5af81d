// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "char-escape/Escaper.hxx"
#include "char-escape/Error.hxx"
#include "char-escape/Table.hxx"

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>

using namespace CharEscape;
using std::string_view_literals::operator""sv;

static UnescapeError
CatchUnescapeError(const Escaper &escaper, std::string_view s)
{
	try {
		const auto result = escaper.Unescape(s);
		ADD_FAILURE() << "no error, result: " << result;
	} catch (const UnescapeError &e) {
		return e;
	}

	throw std::runtime_error("UnescapeError expected");
}

TEST(Escaper, CStyle)
{
	const Escaper escaper(U'\\', c_style_rules);

	const auto unescaped = "\n\r\t\\'\""sv;
	const auto escaped = R"(\n\r\t\\\'\")"sv;

	EXPECT_EQ(escaper.Escape(unescaped), escaped);
	EXPECT_EQ(escaper.Unescape(escaped), unescaped);
	EXPECT_TRUE(escaper.IsEscaped(escaped));
	EXPECT_FALSE(escaper.IsEscaped(unescaped));
}

TEST(Escaper, Whitespace)
{
	static constexpr auto rules = MakeRuleTable({
			EscapeRule{U'\n', U'n'},
			EscapeRule{U' ', U'w'},
		});
	const Escaper escaper(U'\\', rules);

	const auto unescaped = "line1\nline2\n\nline3 with whitespace"sv;
	const auto escaped = R"(line1\nline2\n\nline3\wwith\wwhitespace)"sv;

	EXPECT_EQ(escaper.Escape(unescaped), escaped);
	EXPECT_EQ(escaper.Unescape(escaped), unescaped);

	EXPECT_EQ(escaper.Unescape(R"(S\wP\wA\wC\wE)"sv), "S P A C E");
}

TEST(Escaper, CustomEscapeChar)
{
	static constexpr auto rules = MakeRuleTable(U'%', {
			EscapeRule{U'a', U'a'},
			EscapeRule{U'c', U'c'},
			EscapeRule{U'e', U'e'},
			EscapeRule{U'p', U'p'},
			EscapeRule{U's', U's'},
		});
	const Escaper escaper(U'%', rules);

	const auto unescaped = "escaper.escape(\"escaper\")"sv;
	const auto escaped = "%e%s%c%a%p%er.%e%s%c%a%p%e(\"%e%s%c%a%p%er\")"sv;

	EXPECT_EQ(escaper.Escape(unescaped), escaped);
	EXPECT_EQ(escaper.Unescape(escaped), unescaped);

	/* the backslash has no special meaning here */
	EXPECT_EQ(escaper.Escape("\\"sv), "\\");
	EXPECT_EQ(escaper.Escape("100%"sv), "100%%");
	EXPECT_EQ(escaper.Unescape("100%%"sv), "100%");
}

TEST(Escaper, Empty)
{
	const auto &escaper = c_style_escaper;

	EXPECT_EQ(escaper.Escape(""sv), "");
	EXPECT_EQ(escaper.Unescape(""sv), "");
	EXPECT_TRUE(escaper.IsEscaped(""sv));
}

TEST(Escaper, Invalid)
{
	static constexpr auto rules = MakeRuleTable({
			EscapeRule{U'\n', U'n'},
			EscapeRule{U'\t', U't'},
		});
	const Escaper escaper(U'\\', rules);

	const auto e = CatchUnescapeError(escaper, R"(\nval\d escape sequence)"sv);
	EXPECT_EQ(e.GetCode(), UnescapeErrorCode::INVALID);
	EXPECT_TRUE(e.GetSequence() == U"\\d");
	EXPECT_EQ(e.GetSequenceUTF8(), "\\d");
	EXPECT_STREQ(e.what(), "invalid escape sequence: \\d");
	EXPECT_EQ(e, UnescapeError::Invalid(U'\\', U'd'));
	EXPECT_FALSE(escaper.IsEscaped(R"(\nval\d escape sequence)"sv));

	/* the first bad sequence is reported */
	EXPECT_EQ(CatchUnescapeError(escaper, R"(\x\y)"sv),
		  UnescapeError::Invalid(U'\\', U'x'));

	/* escape character followed by a raw character */
	EXPECT_EQ(CatchUnescapeError(escaper, "\\\n"sv),
		  UnescapeError::Invalid(U'\\', U'\n'));
}

TEST(Escaper, Incomplete)
{
	static constexpr auto rules = MakeRuleTable({
			EscapeRule{U'\n', U'n'},
			EscapeRule{U'\t', U't'},
		});
	const Escaper escaper(U'\\', rules);

	const auto e = CatchUnescapeError(escaper, "another failure\\"sv);
	EXPECT_EQ(e.GetCode(), UnescapeErrorCode::INCOMPLETE);
	EXPECT_TRUE(e.GetSequence().empty());
	EXPECT_STREQ(e.what(), "incomplete escape sequence");
	EXPECT_EQ(e, UnescapeError::Incomplete());
	EXPECT_FALSE(escaper.IsEscaped("another failure\\"sv));

	EXPECT_EQ(CatchUnescapeError(escaper, "\\"sv),
		  UnescapeError::Incomplete());

	/* a complete pair followed by a lone escape character */
	EXPECT_EQ(CatchUnescapeError(escaper, "\\\\\\"sv),
		  UnescapeError::Incomplete());
	EXPECT_EQ(escaper.Unescape("\\\\\\\\"sv), "\\\\");
}

TEST(Escaper, ErrorEquality)
{
	EXPECT_EQ(UnescapeError::Incomplete(), UnescapeError::Incomplete());
	EXPECT_EQ(UnescapeError::Invalid(U'\\', U'x'),
		  UnescapeError::Invalid(U'\\', U'x'));
	EXPECT_FALSE(UnescapeError::Invalid(U'\\', U'x') ==
		     UnescapeError::Invalid(U'\\', U'y'));
	EXPECT_FALSE(UnescapeError::Invalid(U'\\', U'x') ==
		     UnescapeError::Incomplete());

	EXPECT_EQ(MissingEscapeCharRuleError(), MissingEscapeCharRuleError());
	EXPECT_STREQ(MissingEscapeCharRuleError().what(),
		     "no escape sequence defined for the escape character");
}

TEST(Escaper, IsEscaped)
{
	static constexpr auto rules = MakeRuleTable({
			EscapeRule{U'&', U'a'},
			EscapeRule{U'\\', U'b'},
			EscapeRule{U'%', U'm'},
			EscapeRule{U'|', U'p'},
			EscapeRule{U'/', U's'},
		});
	const Escaper escaper(U'\\', rules);

	/* contains an invalid escape sequence */
	EXPECT_FALSE(escaper.IsEscaped(R"(\a  \b  \c  \d  \e)"sv));

	/* ends with the escape character */
	EXPECT_FALSE(escaper.IsEscaped(R"(\a  \b  \m  \p  \s  \)"sv));

	/* contains a character which should have been escaped */
	EXPECT_FALSE(escaper.IsEscaped(R"(\a  \b  \m  \|  \s)"sv));
	EXPECT_FALSE(escaper.IsEscaped("a/b"sv));

	EXPECT_TRUE(escaper.IsEscaped(R"(\a  \b  \m  \p  \s)"sv));
	EXPECT_TRUE(escaper.IsEscaped("plain text"sv));

	/* the explicit rule wins over the implicit one */
	EXPECT_EQ(escaper.Escape("\\"sv), "\\b");
	EXPECT_EQ(escaper.Unescape("\\b\\\\"sv), "\\\\");
}

/**
 * IsEscaped() is stricter than "Unescape() succeeds": raw characters
 * which should have been escaped are accepted by Unescape().
 */
TEST(Escaper, IsEscapedStricterThanUnescape)
{
	const auto &escaper = c_style_escaper;

	EXPECT_FALSE(escaper.IsEscaped("a\nb"sv));
	EXPECT_EQ(escaper.Unescape("a\nb"sv), "a\nb");

	EXPECT_FALSE(escaper.IsEscaped("say \"hi\""sv));
	EXPECT_EQ(escaper.Unescape("say \"hi\""sv), "say \"hi\"");

	/* but whenever IsEscaped() is true, Unescape() succeeds */
	EXPECT_TRUE(escaper.IsEscaped(R"(say \"hi\"\n)"sv));
	EXPECT_EQ(escaper.Unescape(R"(say \"hi\"\n)"sv), "say \"hi\"\n");
}

TEST(Escaper, Construct)
{
	static constexpr EscapeRule rules[] = {
		{U'\n', U'n'},
		{U'\t', U't'},
	};

	EXPECT_THROW(Escaper(U'\\', rules), MissingEscapeCharRuleError);
	EXPECT_THROW(Escaper(U'\\', std::span<const EscapeRule>{}),
		     MissingEscapeCharRuleError);

	static constexpr EscapeRule rules2[] = {
		{U'\n', U'n'},
		{U'\\', U'\\'},
	};

	EXPECT_NO_THROW(Escaper(U'\\', rules2));

	/* the rule only needs to have the escape character as raw */
	static constexpr EscapeRule rules3[] = {
		{U'#', U'h'},
	};

	const Escaper escaper(U'#', rules3);
	EXPECT_EQ(escaper.GetEscapeChar(), U'#');
	EXPECT_EQ(escaper.GetRules().size(), 1u);
	EXPECT_EQ(escaper.Escape("#1"sv), "#h1");
	EXPECT_EQ(escaper.Unescape("#h1"sv), "#1");

	/* a rule with the escape character only as "escaped" does
	   not count */
	static constexpr EscapeRule rules4[] = {
		{U'x', U'#'},
	};

	EXPECT_THROW(Escaper(U'#', rules4), MissingEscapeCharRuleError);
}

TEST(Escaper, InvalidCharacter)
{
	static constexpr EscapeRule surrogate[] = {
		{U'\\', U'\\'},
		{U'x', char32_t(0xd800)},
	};

	try {
		Escaper escaper(U'\\', surrogate);
		FAIL();
	} catch (const InvalidCharacterError &e) {
		EXPECT_EQ(uint_least32_t(e.GetCharacter()), 0xd800u);
		EXPECT_STREQ(e.what(), "not a Unicode scalar value: U+D800");
	}

	static constexpr EscapeRule out_of_range[] = {
		{U'\\', U'\\'},
		{char32_t(0x300000), U'x'},
	};

	EXPECT_THROW(Escaper(U'\\', out_of_range), InvalidCharacterError);

	static constexpr EscapeRule self_only[] = {
		{char32_t(0x110000), char32_t(0x110000)},
	};

	EXPECT_THROW(Escaper(char32_t(0x110000), self_only),
		     InvalidCharacterError);

	EXPECT_FALSE(IsUnicodeScalar(0xd800));
	EXPECT_FALSE(IsUnicodeScalar(0xdfff));
	EXPECT_FALSE(IsUnicodeScalar(0x110000));
	EXPECT_TRUE(IsUnicodeScalar(0xd7ff));
	EXPECT_TRUE(IsUnicodeScalar(0xe000));
	EXPECT_TRUE(IsUnicodeScalar(0x10ffff));

	static_assert(!HasOnlyUnicodeScalars(U'\\', surrogate));
	static_assert(!HasOnlyUnicodeScalars(U'\\', out_of_range));
	static_assert(HasOnlyUnicodeScalars(U'\\', c_style_rules));
}

TEST(Escaper, SupplementaryPlane)
{
	static constexpr EscapeRule rules[] = {
		{U'\\', U'\\'},
		{U'x', U'\U0010ffff'},
		{U'\U0001F600', U's'},
	};

	const Escaper escaper(U'\\', rules);
	const auto escaped = escaper.Escape("x\xf0\x9f\x98\x80"sv);
	EXPECT_EQ(escaped, "\\\xf4\x8f\xbf\xbf\\s");
	EXPECT_TRUE(escaper.IsEscaped(escaped));
	EXPECT_EQ(escaper.Unescape(escaped), "x\xf0\x9f\x98\x80");
}

TEST(Escaper, Unchecked)
{
	static constexpr EscapeRule rules[] = {
		{U'\n', U'n'},
	};

	/* no validation; the escape character is copied as-is */
	const auto escaper = Escaper::Unchecked(U'\\', rules);
	EXPECT_EQ(escaper.Escape("a\\b\n"sv), "a\\b\\n");
	EXPECT_EQ(CatchUnescapeError(escaper, "a\\b\\n"sv),
		  UnescapeError::Invalid(U'\\', U'b'));
}

TEST(Escaper, Equality)
{
	static constexpr EscapeRule a[] = {
		{U'\n', U'n'},
		{U'\\', U'\\'},
	};

	static constexpr EscapeRule b[] = {
		{U'\n', U'n'},
		{U'\\', U'\\'},
	};

	static constexpr EscapeRule reversed[] = {
		{U'\\', U'\\'},
		{U'\n', U'n'},
	};

	EXPECT_EQ(Escaper(U'\\', a), Escaper(U'\\', b));
	EXPECT_FALSE(Escaper(U'\\', a) == Escaper(U'\\', reversed));
	EXPECT_FALSE(Escaper::Unchecked(U'\\', a) ==
		     Escaper::Unchecked(U'/', a));

	/* one table may back several escapers */
	EXPECT_FALSE(Escaper::Unchecked(U'\\', a) ==
		     Escaper::Unchecked(U'\n', a));
}

TEST(Escaper, FirstRawRuleWins)
{
	static constexpr EscapeRule rules[] = {
		{U'x', U'1'},
		{U'x', U'2'},
		{U'\\', U'\\'},
	};

	static constexpr EscapeRule permuted[] = {
		{U'x', U'2'},
		{U'x', U'1'},
		{U'\\', U'\\'},
	};

	const Escaper escaper(U'\\', rules), escaper2(U'\\', permuted);

	for (unsigned i = 0; i < 3; ++i) {
		EXPECT_EQ(escaper.Escape("x"sv), "\\1");
		EXPECT_EQ(escaper2.Escape("x"sv), "\\2");
	}

	/* both sequences unescape to the raw character */
	EXPECT_EQ(escaper.Unescape("\\1\\2"sv), "xx");
}

TEST(Escaper, FirstEscapedRuleWins)
{
	static constexpr EscapeRule rules[] = {
		{U'a', U'z'},
		{U'b', U'z'},
		{U'\\', U'\\'},
	};

	const Escaper escaper(U'\\', rules);
	EXPECT_EQ(escaper.Escape("ab"sv), "\\z\\z");
	EXPECT_EQ(escaper.Unescape("\\z\\z"sv), "aa");
}

TEST(Escaper, NonASCII)
{
	static constexpr auto rules = MakeRuleTable(U'§', {
			EscapeRule{U'ä', U'a'},
			EscapeRule{U'€', U'e'},
			EscapeRule{U'\n', U'ñ'},
		});
	const Escaper escaper(U'§', rules);

	const auto unescaped = "Kä€§\nx"sv;
	const auto escaped = "K§a§e§§§ñx"sv;

	EXPECT_EQ(escaper.Escape(unescaped), escaped);
	EXPECT_EQ(escaper.Unescape(escaped), unescaped);
	EXPECT_TRUE(escaper.IsEscaped(escaped));
	EXPECT_FALSE(escaper.IsEscaped(unescaped));

	EXPECT_TRUE(escaper.Escape(U"Kä€§\nx"sv) == U"K§a§e§§§ñx");
	EXPECT_TRUE(escaper.Unescape(U"K§a§e§§§ñx"sv) == U"Kä€§\nx");
	EXPECT_TRUE(escaper.IsEscaped(U"K§a§e§§§ñx"sv));

	/* the sequence in the error message is UTF-8 */
	const auto e = CatchUnescapeError(escaper, "§ö"sv);
	EXPECT_TRUE(e.GetSequence() == U"§ö");
	EXPECT_STREQ(e.what(), "invalid escape sequence: §ö");

	/* code points above the BMP */
	EXPECT_EQ(escaper.Escape("\U0001F600ä"sv), "\U0001F600§a");
}

TEST(Escaper, MalformedUTF8)
{
	const auto &escaper = c_style_escaper;

	try {
		escaper.Escape("ab\xc3"sv);
		FAIL();
	} catch (const MalformedUTF8Error &e) {
		EXPECT_EQ(e.GetOffset(), 2u);
	}

	EXPECT_THROW(escaper.Escape("\xff"sv), MalformedUTF8Error);
	EXPECT_THROW(escaper.Unescape("x\x80"sv), MalformedUTF8Error);

	/* malformed input is reported even after a lone escape
	   character */
	EXPECT_THROW(escaper.Unescape("\\\xff"sv), MalformedUTF8Error);

	EXPECT_FALSE(escaper.IsEscaped("\xff"sv));
	EXPECT_FALSE(escaper.IsEscaped("abc\xc0\xaf"sv));
	EXPECT_FALSE(escaper.IsEscaped("\xed\xa0\x80"sv));
}
