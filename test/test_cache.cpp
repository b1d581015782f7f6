#include "minitest.hpp"
#include "deepgrep/regex/cache.hpp"
#include "deepgrep/regex/finder.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>
#include <string_view>

using namespace deepgrep::regex;
using namespace std::string_view_literals;

TEST(cache_hit_returns_same_pattern) {
	pattern_cache<char> cache{2};
	auto [e1, first] = cache.get_or_compile(R"(\d+)");
	auto [e2, second] = cache.get_or_compile(R"(\d+)");
	ASSERT_FALSE(e1);
	ASSERT_FALSE(e2);
	ASSERT_TRUE(first == second);
	ASSERT_EQ(first->pattern, R"(\d+)");

	auto stats = cache.stats();
	ASSERT_EQ(stats.hits, 1u);
	ASSERT_EQ(stats.misses, 1u);
	ASSERT_EQ(stats.evictions, 0u);
}

TEST(cache_is_transparent) {
	pattern_cache<char> cache;
	const auto text = "a1 b22\nc333"sv;

	auto [error, tree] = parse<char>(R"([a-z](\d+))"sv);
	auto [s0, expected] = find_all<char>(tree, text);

	for(int i = 0; i < 3; ++i) {
		auto [e, compiled] = cache.get_or_compile(R"([a-z](\d+))");
		auto [s, matches] = find_all<char>(compiled->tree, text);
		ASSERT_TRUE(matches == expected);
	}
	ASSERT_EQ(expected.size(), 3u);
}

TEST(cache_evicts_least_recently_used) {
	pattern_cache<char> cache{2};
	cache.get_or_compile("a");
	cache.get_or_compile("b");
	// a becomes the most recently used
	cache.get_or_compile("a");
	cache.get_or_compile("c");

	ASSERT_EQ(cache.size(), 2u);
	ASSERT_TRUE(cache.contains("a"));
	ASSERT_FALSE(cache.contains("b"));
	ASSERT_TRUE(cache.contains("c"));
	ASSERT_EQ(cache.stats().evictions, 1u);
}

TEST(cache_contains_does_not_touch) {
	pattern_cache<char> cache{2};
	cache.get_or_compile("a");
	cache.get_or_compile("b");
	ASSERT_TRUE(cache.contains("a"));
	cache.get_or_compile("c");

	ASSERT_FALSE(cache.contains("a"));
	ASSERT_TRUE(cache.contains("b"));
}

TEST(cache_capacity_zero_keeps_nothing) {
	pattern_cache<char> cache{0};
	auto [e1, first] = cache.get_or_compile("x+");
	auto [e2, second] = cache.get_or_compile("x+");
	ASSERT_TRUE(first != nullptr);
	ASSERT_TRUE(second != nullptr);
	ASSERT_TRUE(first != second);
	ASSERT_EQ(cache.size(), 0u);
	ASSERT_EQ(cache.capacity(), 0u);
	ASSERT_EQ(cache.stats().misses, 2u);
}

TEST(cache_syntax_errors_are_not_cached) {
	pattern_cache<char> cache{4};
	auto [error, compiled] = cache.get_or_compile("(abc");
	ASSERT_TRUE(error == (syntax_error{error_category::missing_paren, 0}));
	ASSERT_TRUE(compiled == nullptr);
	ASSERT_EQ(cache.size(), 0u);
	ASSERT_FALSE(cache.contains("(abc"));
}

TEST(cache_clear) {
	pattern_cache<char> cache{4};
	cache.get_or_compile("a");
	cache.get_or_compile("b");
	cache.clear();
	ASSERT_EQ(cache.size(), 0u);
	ASSERT_FALSE(cache.contains("a"));

	// usable after clearing
	auto [error, compiled] = cache.get_or_compile("a");
	ASSERT_TRUE(compiled != nullptr);
	ASSERT_EQ(cache.size(), 1u);
}

TEST(cache_compiled_pattern_outlives_eviction) {
	pattern_cache<char> cache{1};
	auto [e1, held] = cache.get_or_compile("(x)(y)");
	cache.get_or_compile("z");
	ASSERT_FALSE(cache.contains("(x)(y)"));
	ASSERT_EQ(held->group_count(), 2u);

	auto [s, matches] = find_all<char>(held->tree, "xy"sv);
	ASSERT_EQ(matches.size(), 1u);
}

TEST(cache_concurrent_access) {
	pattern_cache<char> cache{4};
	const std::vector<std::string> patterns{
		"a", "b+", "c*", R"(\d)", R"(\w+)", "(x)", "y|z", "[0-9]", "q{2}", "^r$"
	};
	constexpr int threads = 8;
	constexpr int rounds = 200;

	std::atomic<int> wrong{0};
	std::vector<std::thread> workers;
	for(int t = 0; t < threads; ++t) {
		workers.emplace_back([&, t]() {
			for(int i = 0; i < rounds; ++i) {
				const auto& p = patterns[(i + t) % patterns.size()];
				auto [error, compiled] = cache.get_or_compile(p);
				if(error || compiled == nullptr || compiled->pattern != p) ++wrong;
			}
		});
	}
	for(auto& w: workers) w.join();

	ASSERT_EQ(wrong.load(), 0);
	ASSERT_TRUE(cache.size() <= 4u);
	auto stats = cache.stats();
	ASSERT_EQ(stats.hits + stats.misses, std::size_t(threads * rounds));
}

TEST(cache_wide_patterns) {
	pattern_cache<wchar_t> cache{2};
	auto [error, compiled] = cache.get_or_compile(L"(?<n>\\d+)");
	ASSERT_FALSE(error);
	ASSERT_EQ(compiled->group_index(L"n"), std::optional<std::size_t>{1});
	ASSERT_TRUE(cache.contains(L"(?<n>\\d+)"));
}
