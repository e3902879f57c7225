#include <capglob/pattern.h>

#include <gtest/gtest.h>

#include <sstream>
#include <string>

using capglob::match_options;
using capglob::pattern;
using capglob::pattern_error;

namespace {

	// byte offset of the error `source` fails to compile with, or -1
	long error_pos(const char *source) {
		try {
			pattern p(source);
		}
		catch (const pattern_error &ex) {
			return static_cast<long>(ex.pos());
		}
		return -1;
	}

	match_options ignore_case() {
		match_options options;
		options.case_sensitive = false;
		return options;
	}

	match_options literal_separator() {
		match_options options;
		options.require_literal_separator = true;
		return options;
	}

	match_options literal_leading_dot() {
		match_options options;
		options.require_literal_leading_dot = true;
		return options;
	}

} // namespace

TEST(PatternCompile, WildcardErrors) {
	EXPECT_EQ(error_pos("a/**b"), 4);
	EXPECT_EQ(error_pos("a/bc**"), 3);
	EXPECT_EQ(error_pos("a/*****"), 4);
	EXPECT_EQ(error_pos("a/b**c**d"), 2);
	EXPECT_EQ(error_pos("a**b"), 0);
	EXPECT_EQ(error_pos("***"), 2);
}

TEST(PatternCompile, UnclosedBracketErrors) {
	EXPECT_EQ(error_pos("abc[def"), 3);
	EXPECT_EQ(error_pos("abc[!def"), 3);
	EXPECT_EQ(error_pos("abc["), 3);
	EXPECT_EQ(error_pos("abc[!"), 3);
	EXPECT_EQ(error_pos("abc[d"), 3);
	EXPECT_EQ(error_pos("abc[!d"), 3);
	EXPECT_EQ(error_pos("abc[]"), 3);
	EXPECT_EQ(error_pos("abc[!]"), 3);
}

TEST(PatternCompile, ParenErrors) {
	EXPECT_EQ(error_pos("a)b"), 1);
	EXPECT_EQ(error_pos("(a"), 0);
	EXPECT_EQ(error_pos("a(b(c)"), 1);
	EXPECT_EQ(error_pos("(**"), 0);
}

TEST(PatternCompile, ErrorPositionsAreByteOffsets) {
	// "é" takes two bytes
	EXPECT_EQ(error_pos("é[a"), 2);
	EXPECT_EQ(error_pos("\xff"), 0);
}

TEST(PatternCompile, ErrorMessage) {
	try {
		pattern p("abc[");
		FAIL() << "expected a pattern_error";
	}
	catch (const pattern_error &ex) {
		EXPECT_EQ(ex.pos(), 3u);
		EXPECT_STREQ(ex.msg(), "invalid range pattern");
		EXPECT_STREQ(ex.what(), "Pattern syntax error near position 3: invalid range pattern");
	}
}

TEST(PatternCompile, ValidPatterns) {
	EXPECT_EQ(error_pos("**"), -1);
	EXPECT_EQ(error_pos("a/**/b"), -1);
	EXPECT_EQ(error_pos("/**/test"), -1);
	EXPECT_EQ(error_pos("**/(**)/*.txt"), -1);
	EXPECT_EQ(error_pos("some/(**)/needle.txt"), -1);
	EXPECT_EQ(error_pos("[]]"), -1);
	EXPECT_EQ(error_pos("[!]]"), -1);
	EXPECT_EQ(error_pos("one/**/*.cpp"), -1);
}

TEST(PatternCompile, Properties) {
	pattern p("images/(*)/(**)/x.jpg");
	EXPECT_EQ(p.str(), "images/(*)/(**)/x.jpg");
	EXPECT_TRUE(p.is_recursive());
	EXPECT_EQ(p.group_count(), 2u);

	pattern q("images/*.jpg");
	EXPECT_FALSE(q.is_recursive());
	EXPECT_EQ(q.group_count(), 0u);
}

TEST(PatternCompile, SkipGroups) {
	auto p = pattern::compile("(*).(jpg)", true);
	EXPECT_EQ(p.group_count(), 0u);
	EXPECT_TRUE(p.matches("cat.jpg"));
	EXPECT_EQ(p.tokens().size(), 5u);
}

TEST(PatternCompile, ConsecutiveRecursiveWildcardsCollapse) {
	pattern p("**/**/x");
	ASSERT_EQ(p.tokens().size(), 2u);
	EXPECT_TRUE(std::holds_alternative<capglob::tok::any_recursive_sequence>(p.tokens()[0]));
	EXPECT_EQ(p.tokens()[1], capglob::token(capglob::tok::literal{U'x'}));
}

TEST(PatternCompile, EqualityAndOrdering) {
	EXPECT_EQ(pattern("a*b"), pattern("a*b"));
	EXPECT_NE(pattern("a*b"), pattern("a?b"));
	EXPECT_LT(pattern("a"), pattern("b"));
	EXPECT_EQ(pattern(), pattern(""));

	std::ostringstream os;
	os << pattern("x/(*)");
	EXPECT_EQ(os.str(), "x/(*)");
}

TEST(PatternMatch, Wildcards) {
	EXPECT_TRUE(pattern("a*b").matches("a_b"));
	EXPECT_TRUE(pattern("a*b*c").matches("abc"));
	EXPECT_FALSE(pattern("a*b*c").matches("abcd"));
	EXPECT_TRUE(pattern("a*b*c").matches("a_b_c"));
	EXPECT_TRUE(pattern("a*b*c").matches("a___b___c"));
	EXPECT_TRUE(pattern("abc*abc*abc").matches("abcabcabcabcabcabcabc"));
	EXPECT_FALSE(pattern("abc*abc*abc").matches("abcabcabcabcabcabcabca"));
	EXPECT_TRUE(pattern("a*a*a*a*a*a*a*a*a").matches("aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa"));
	EXPECT_TRUE(pattern("a*b[xyz]c*d").matches("abxcdbxcddd"));
	EXPECT_TRUE(pattern("some/only-(*).txt").matches("some/only-file1.txt"));
}

TEST(PatternMatch, AnyChar) {
	EXPECT_TRUE(pattern("a?c").matches("abc"));
	EXPECT_TRUE(pattern("a?c").matches("aéc"));
	EXPECT_FALSE(pattern("a?c").matches("ac"));
	EXPECT_FALSE(pattern("a?c").matches("abbc"));
}

TEST(PatternMatch, EmptyPattern) {
	EXPECT_TRUE(pattern("").matches(""));
	EXPECT_FALSE(pattern("").matches("a"));
	EXPECT_TRUE(pattern().matches(""));
}

TEST(PatternMatch, RecursiveWildcards) {
	pattern p("some/**/needle.txt");
	EXPECT_TRUE(p.matches("some/needle.txt"));
	EXPECT_TRUE(p.matches("some/one/needle.txt"));
	EXPECT_TRUE(p.matches("some/one/two/needle.txt"));
	EXPECT_TRUE(p.matches("some/other/needle.txt"));
	EXPECT_FALSE(p.matches("some/other/notthis.txt"));

	pattern all("**");
	EXPECT_TRUE(all.is_recursive());
	EXPECT_TRUE(all.matches("abcde"));
	EXPECT_TRUE(all.matches(""));
	EXPECT_TRUE(all.matches(".asdf"));
	EXPECT_TRUE(all.matches("/x/.asdf"));

	pattern collapsed("some/**/**/needle.txt");
	EXPECT_TRUE(collapsed.matches("some/needle.txt"));
	EXPECT_TRUE(collapsed.matches("some/one/needle.txt"));
	EXPECT_TRUE(collapsed.matches("some/one/two/needle.txt"));
	EXPECT_FALSE(collapsed.matches("some/other/notthis.txt"));

	pattern leading("**/test");
	EXPECT_TRUE(leading.matches("one/two/test"));
	EXPECT_TRUE(leading.matches("one/test"));
	EXPECT_TRUE(leading.matches("test"));

	pattern absolute("/**/test");
	EXPECT_TRUE(absolute.matches("/one/two/test"));
	EXPECT_TRUE(absolute.matches("/one/test"));
	EXPECT_TRUE(absolute.matches("/test"));
	EXPECT_FALSE(absolute.matches("/one/notthis"));
	EXPECT_FALSE(absolute.matches("/notthis"));

	// sub-patterns after `**` only start at a path component
	pattern dot("**/.*");
	EXPECT_TRUE(dot.matches(".abc"));
	EXPECT_TRUE(dot.matches("abc/.abc"));
	EXPECT_FALSE(dot.matches("ab.c"));
	EXPECT_FALSE(dot.matches("abc/ab.c"));
}

TEST(PatternMatch, ZeroWidthRecursiveWildcard) {
	pattern p("a/**/b");
	EXPECT_TRUE(p.matches("a/b"));
	EXPECT_TRUE(p.matches("a/x/b"));
	EXPECT_TRUE(p.matches("a/x/y/b"));
	EXPECT_FALSE(p.matches("a/xb"));
}

TEST(PatternMatch, Ranges) {
	pattern digit("a[0-9]b");
	for (char c = '0'; c <= '9'; c++) {
		EXPECT_TRUE(digit.matches(std::string("a") + c + "b"));
	}
	EXPECT_FALSE(digit.matches("a_b"));

	pattern not_digit("a[!0-9]b");
	for (char c = '0'; c <= '9'; c++) {
		EXPECT_FALSE(not_digit.matches(std::string("a") + c + "b"));
	}
	EXPECT_TRUE(not_digit.matches("a_b"));

	for (const char *source : { "[a-z123]", "[1a-z23]", "[123a-z]" }) {
		pattern p(source);
		for (char c = 'a'; c <= 'z'; c++) {
			EXPECT_TRUE(p.matches(std::string(1, c))) << source;
		}
		for (char c = 'A'; c <= 'Z'; c++) {
			EXPECT_TRUE(p.matches(std::string(1, c), ignore_case())) << source;
		}
		EXPECT_TRUE(p.matches("1"));
		EXPECT_TRUE(p.matches("2"));
		EXPECT_TRUE(p.matches("3"));
	}

	for (const char *source : { "[abc-]", "[-abc]", "[a-c-]" }) {
		pattern p(source);
		EXPECT_TRUE(p.matches("a")) << source;
		EXPECT_TRUE(p.matches("b")) << source;
		EXPECT_TRUE(p.matches("c")) << source;
		EXPECT_TRUE(p.matches("-")) << source;
		EXPECT_FALSE(p.matches("d")) << source;
	}

	// endpoints are never swapped
	pattern reversed("[2-1]");
	EXPECT_FALSE(reversed.matches("1"));
	EXPECT_FALSE(reversed.matches("2"));

	EXPECT_TRUE(pattern("[-]").matches("-"));
	EXPECT_FALSE(pattern("[!-]").matches("-"));
}

TEST(PatternMatch, ClosingBracketInClass) {
	EXPECT_TRUE(pattern("[]]").matches("]"));
	EXPECT_FALSE(pattern("[]]").matches("a"));
	EXPECT_TRUE(pattern("[!]]").matches("a"));
	EXPECT_FALSE(pattern("[!]]").matches("]"));
}

TEST(PatternMatch, UnicodeRanges) {
	pattern p("[α-ω]");
	EXPECT_TRUE(p.matches("β"));
	EXPECT_FALSE(p.matches("b"));
	EXPECT_TRUE(pattern("*é").matches("café"));
}

TEST(PatternMatch, InvalidUtf8NeverMatches) {
	EXPECT_FALSE(pattern("*").matches("a\xff"));
	EXPECT_FALSE(pattern("**").matches("\xc3"));
	EXPECT_FALSE(pattern("*").captures("\xed\xa0\x80").has_value());
}

TEST(PatternMatch, Paths) {
	pattern txt("*hello.txt");
	EXPECT_TRUE(txt.matches("hello.txt"));
	EXPECT_TRUE(txt.matches("gareth_says_hello.txt"));
	EXPECT_TRUE(txt.matches("some/path/to/hello.txt"));
	EXPECT_TRUE(txt.matches("some\\path\\to\\hello.txt"));
	EXPECT_TRUE(txt.matches("/an/absolute/path/to/hello.txt"));
	EXPECT_FALSE(txt.matches("hello.txt-and-then-some"));
	EXPECT_FALSE(txt.matches("goodbye.txt"));

	pattern dir("*some/path/to/hello.txt");
	EXPECT_TRUE(dir.matches("some/path/to/hello.txt"));
	EXPECT_TRUE(dir.matches("a/bigger/some/path/to/hello.txt"));
	EXPECT_FALSE(dir.matches("some/path/to/hello.txt-and-then-some"));
	EXPECT_FALSE(dir.matches("some/other/path/to/hello.txt"));

	EXPECT_TRUE(pattern("a/b").matches_path(capglob::fs::path("a/b")));
}

TEST(PatternMatch, CaseInsensitive) {
	pattern p("aBcDeFg");
	EXPECT_TRUE(p.matches("aBcDeFg", ignore_case()));
	EXPECT_TRUE(p.matches("abcdefg", ignore_case()));
	EXPECT_TRUE(p.matches("ABCDEFG", ignore_case()));
	EXPECT_TRUE(p.matches("AbCdEfG", ignore_case()));
	EXPECT_FALSE(p.matches("ABCDEFG"));

	// ASCII only
	EXPECT_FALSE(pattern("é").matches("É", ignore_case()));
}

TEST(PatternMatch, CaseInsensitiveRange) {
	pattern within("[a]");
	pattern except("[!a]");

	EXPECT_TRUE(within.matches("a", ignore_case()));
	EXPECT_TRUE(within.matches("A", ignore_case()));
	EXPECT_FALSE(within.matches("A"));

	EXPECT_FALSE(except.matches("a", ignore_case()));
	EXPECT_FALSE(except.matches("A", ignore_case()));
	EXPECT_TRUE(except.matches("A"));

	// ranges only fold when both endpoints are letters
	EXPECT_FALSE(pattern("[0-Z]").matches("b", ignore_case()));
}

TEST(PatternMatch, RequireLiteralSeparator) {
	EXPECT_TRUE(pattern("abc/def").matches("abc/def", literal_separator()));
	EXPECT_FALSE(pattern("abc?def").matches("abc/def", literal_separator()));
	EXPECT_FALSE(pattern("abc*def").matches("abc/def", literal_separator()));
	EXPECT_FALSE(pattern("abc[/]def").matches("abc/def", literal_separator()));

	EXPECT_TRUE(pattern("abc/def").matches("abc/def"));
	EXPECT_TRUE(pattern("abc?def").matches("abc/def"));
	EXPECT_TRUE(pattern("abc*def").matches("abc/def"));
	EXPECT_TRUE(pattern("abc[/]def").matches("abc/def"));

	// `**` crosses separators regardless
	EXPECT_TRUE(pattern("a/**/d").matches("a/b/c/d", literal_separator()));
}

TEST(PatternMatch, RequireLiteralLeadingDot) {
	EXPECT_TRUE(pattern("*.txt").matches(".hello.txt"));
	EXPECT_FALSE(pattern("*.txt").matches(".hello.txt", literal_leading_dot()));

	EXPECT_TRUE(pattern(".*.*").matches(".hello.txt"));
	EXPECT_TRUE(pattern(".*.*").matches(".hello.txt", literal_leading_dot()));

	EXPECT_TRUE(pattern("aaa/bbb/*").matches("aaa/bbb/.ccc"));
	EXPECT_FALSE(pattern("aaa/bbb/*").matches("aaa/bbb/.ccc", literal_leading_dot()));

	EXPECT_TRUE(pattern("aaa/bbb/*").matches("aaa/bbb/c.c.c."));
	EXPECT_TRUE(pattern("aaa/bbb/*").matches("aaa/bbb/c.c.c.", literal_leading_dot()));

	EXPECT_TRUE(pattern("aaa/bbb/.*").matches("aaa/bbb/.ccc"));
	EXPECT_TRUE(pattern("aaa/bbb/.*").matches("aaa/bbb/.ccc", literal_leading_dot()));

	EXPECT_TRUE(pattern("aaa/?bbb").matches("aaa/.bbb"));
	EXPECT_FALSE(pattern("aaa/?bbb").matches("aaa/.bbb", literal_leading_dot()));

	EXPECT_TRUE(pattern("aaa/[.]bbb").matches("aaa/.bbb"));
	EXPECT_FALSE(pattern("aaa/[.]bbb").matches("aaa/.bbb", literal_leading_dot()));

	EXPECT_TRUE(pattern("**/*").matches(".bbb"));
	EXPECT_FALSE(pattern("**/*").matches(".bbb", literal_leading_dot()));
}

TEST(PatternMatch, DefaultOptions) {
	match_options defaults;
	EXPECT_TRUE(defaults.case_sensitive);
	EXPECT_FALSE(defaults.require_literal_separator);
	EXPECT_FALSE(defaults.require_literal_leading_dot);
	EXPECT_EQ(defaults, match_options{});
}

TEST(PatternEscape, BracketsMetacharacters) {
	std::string s = "_[_]_?_*_!_";
	EXPECT_EQ(pattern::escape(s), "_[[]_[]]_[?]_[*]_!_");
	EXPECT_TRUE(pattern(pattern::escape(s)).matches(s));
}

TEST(PatternEscape, RoundTrip) {
	for (const char *s : { "", "plain", "(*)", "a(b)c", "ünï?cödé", "[!]", "**", "x/**/y" }) {
		auto escaped = pattern::escape(s);
		EXPECT_TRUE(pattern(escaped).matches(s)) << s << " -> " << escaped;
	}
	EXPECT_FALSE(pattern(pattern::escape("a*")).matches("abc"));
}
