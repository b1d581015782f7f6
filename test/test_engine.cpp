#include "minitest.hpp"
#include "deepgrep/regular_expression.hpp"
#include "deepgrep/regex/format.hpp"

#include <string>
#include <vector>
#include <string_view>

#include "fmt/format.h"

using namespace deepgrep;
using namespace deepgrep::regex;
using namespace std::string_view_literals;

// ============================================================================
// ENGINE
// ============================================================================

TEST(engine_compiles_through_cache) {
	engine_config config;
	config.cache_capacity = 8;
	engine<char> grep{config};

	auto [e1, first] = grep.compile(R"((\w+)=(\d+))");
	auto [e2, second] = grep.compile(R"((\w+)=(\d+))");
	ASSERT_FALSE(e1);
	ASSERT_TRUE(first == second);
	ASSERT_EQ(grep.cache().stats().hits, 1u);
	ASSERT_EQ(grep.cache().capacity(), 8u);

	auto [status, matches] = grep.find_all(first, "a=1 b=22\nc=x d=4");
	ASSERT_EQ(status, error_category::success);
	ASSERT_EQ(matches.size(), 3u);
	ASSERT_EQ(*matches[1].group(2), "22"sv);
	ASSERT_EQ(matches[2].line, 1u);
}

TEST(engine_reports_syntax_errors) {
	engine<char> grep;
	auto [error, compiled] = grep.compile("a{3,2}");
	ASSERT_EQ(error.category, error_category::bad_brace_expression);
	ASSERT_EQ(error.position, 1u);
	ASSERT_TRUE(compiled == nullptr);
	ASSERT_EQ(grep.cache().size(), 0u);

	auto [status, matches] = grep.find_all("x)", "x)");
	ASSERT_EQ(status, error_category::missing_paren);
	ASSERT_TRUE(matches.empty());
}

TEST(engine_find_all_by_pattern) {
	engine<char> grep;
	auto [status, matches] = grep.find_all(R"(\d+)", "1 22\n333");
	ASSERT_EQ(status, error_category::success);
	ASSERT_EQ(matches.size(), 3u);
	ASSERT_EQ(matches[2].str(), "333"sv);
	ASSERT_TRUE(grep.cache().contains(R"(\d+)"));
}

TEST(engine_applies_find_options) {
	engine_config config;
	config.find.offsets = offset_mode::line_relative;
	config.find.step_budget = 2000;
	config.find.on_exceeded = exceeded_policy::abort;
	engine<char> grep{config};

	auto [e1, digits] = grep.compile(R"(\d)");
	auto [s1, matches] = grep.find_all(digits, "a\nb7");
	ASSERT_EQ(matches.size(), 1u);
	ASSERT_EQ(matches[0].start(), 1u);

	auto [e2, slow] = grep.compile("(a+)+b|c");
	const std::string text = std::string(25, 'a') + "\nc";
	auto [s2, none] = grep.find_all(slow, text);
	ASSERT_EQ(s2, error_category::resource_exceeded);
	ASSERT_TRUE(none.empty());
}

TEST(engine_lazy_matches_keep_pattern_alive) {
	engine_config config;
	config.cache_capacity = 1;
	engine<char> grep{config};

	auto [error, compiled] = grep.compile("o");
	auto range = grep.matches(compiled, "foo boo");
	compiled.reset();
	// evicts "o" from the cache, the range still owns it
	grep.compile("x");
	ASSERT_FALSE(grep.cache().contains("o"));

	std::vector<std::size_t> starts;
	for(const auto& m: range) starts.push_back(m.start());
	ASSERT_EQ(starts, (std::vector<std::size_t>{1, 2, 5, 6}));
	ASSERT_EQ(range.status(), error_category::success);
}

TEST(engine_wide) {
	engine<wchar_t> grep;
	auto [error, compiled] = grep.compile(L"\\w+");
	auto [status, matches] = grep.find_all(compiled, L"ab cd");
	ASSERT_EQ(matches.size(), 2u);
	ASSERT_TRUE(matches[1].str() == L"cd"sv);
}

// ============================================================================
// FREE FUNCTIONS
// ============================================================================

TEST(free_full_match) {
	auto [status, m] = full_match<char>("a|ab"sv, "ab"sv);
	ASSERT_EQ(status, error_category::success);
	ASSERT_TRUE(m.has_value());

	auto [bad, none] = full_match<char>("(a"sv, "a"sv);
	ASSERT_EQ(bad, error_category::missing_paren);
	ASSERT_FALSE(none.has_value());
}

TEST(free_search_and_find_all) {
	auto [s1, first] = search<char>(R"(\d+)"sv, "ab 12 34"sv);
	ASSERT_EQ(first->str(), "12"sv);

	auto [s2, all] = regex::find_all<char>(R"(\d+)"sv, "ab 12 34"sv);
	ASSERT_EQ(all.size(), 2u);

	auto [s3, broken] = regex::find_all<char>("[a"sv, "ab"sv);
	ASSERT_EQ(s3, error_category::bad_bracket_expression);
	ASSERT_TRUE(broken.empty());
}

TEST(free_compile) {
	auto [error, compiled] = compile<char>(R"((?<k>\w+):)"sv);
	ASSERT_FALSE(error);
	ASSERT_EQ(compiled->pattern, R"((?<k>\w+):)");
	ASSERT_EQ(compiled->group_index("k"), std::optional<std::size_t>{1});
}

// ============================================================================
// REPLACE
// ============================================================================

TEST(replace_expands_groups) {
	std::string text = "me@host and you@there";
	auto [status, count] = replace<char>(R"((\w+)@(\w+))"sv, text, R"(\2 at \1)"sv);
	ASSERT_EQ(status, error_category::success);
	ASSERT_EQ(count, 2u);
	ASSERT_EQ(text, "host at me and there at you");
}

TEST(replace_honours_count) {
	std::string text = "a-b-c";
	auto [status, count] = replace<char>("-"sv, text, "+"sv, 1);
	ASSERT_EQ(count, 1u);
	ASSERT_EQ(text, "a+b-c");
}

TEST(replace_empty_matches) {
	std::string text = "bb";
	auto [status, count] = replace<char>("a*"sv, text, "-"sv);
	ASSERT_EQ(count, 3u);
	ASSERT_EQ(text, "-b-b-");
}

TEST(replace_escapes_and_unset_groups) {
	std::string text = "x1 y";
	auto [status, count] = replace<char>(R"((\w)(\d)?)"sv, text, R"([\1\2\\])"sv);
	ASSERT_EQ(count, 2u);
	ASSERT_EQ(text, R"([x1\] [y\])");
}

TEST(replace_spans_lines) {
	std::string text = "one\ntwo\r\nthree";
	auto [status, count] = replace<char>("^t"sv, text, "T"sv);
	ASSERT_EQ(count, 2u);
	ASSERT_EQ(text, "one\nTwo\r\nThree");
}

TEST(replace_bad_pattern_leaves_target) {
	std::string text = "abc";
	auto [status, count] = replace<char>("a{"sv, text, "x"sv);
	ASSERT_EQ(status, error_category::bad_brace_expression);
	ASSERT_EQ(count, 0u);
	ASSERT_EQ(text, "abc");
}

// ============================================================================
// FORMATTING
// ============================================================================

TEST(format_errors) {
	ASSERT_EQ(fmt::format("{}", syntax_error{error_category::missing_paren, 0}), "missing parentheses at position 0");
	ASSERT_EQ(fmt::format("[{}]", error_category::resource_exceeded), "[step budget exceeded]");
}

TEST(format_matches) {
	auto [status, m] = search<char>(R"((\w+)\s+\1|(z))"sv, "hello hello"sv);
	ASSERT_TRUE(m.has_value());
	ASSERT_EQ(fmt::format("{}", *m), R"("hello hello"[0,11))");
	ASSERT_EQ(fmt::format("{:g}", *m), R"("hello hello"[0,11) {1: "hello", 2: -})");
}
