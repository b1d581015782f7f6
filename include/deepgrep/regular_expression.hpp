#pragma once

/*
	deepgrep regular expression engine.

	Supported Grammer:
	concat
	alternative          |
	marking grouping     ()
	named grouping       (?<name>) (?P<name>)
	non-marking grouping (?:)
	kleene closure       *
	positive closure     +
	optional             ?
	wildcard             .
	brackets             [...], [^...]
	braces               {m} {m,} {m,n}
	line anchors         ^ $
	backreferences       \1 ... \k<name>
	classes              \d \D \s \S \w \W

	all quantifiers are greedy, there is no lookaround.
*/

#include <tuple>
#include <memory>
#include <string>
#include <vector>
#include <cstddef>
#include <utility>
#include <optional>
#include <string_view>

#include "deepgrep/config.hpp"
#include "deepgrep/regex/error.hpp"
#include "deepgrep/regex/cache.hpp"
#include "deepgrep/regex/finder.hpp"
#include "deepgrep/regex/parser.hpp"
#include "deepgrep/regex/matcher.hpp"
#include "deepgrep/regex/options.hpp"
#include "deepgrep/regex/syntax_tree.hpp"

namespace deepgrep {

namespace regex {

/*
	the entry point for applications: owns a pattern cache sized by the
	configuration and applies the configured find options to every scan.
	safe to share between threads.
*/
template <typename CharT>
class engine {
public:

	using char_t = CharT;
	using tree_t = syntax_tree<char_t>;
	using match_t = basic_match<char_t>;
	using cache_t = pattern_cache<char_t>;
	using compiled_ptr_t = compiled_ptr<char_t>;
	using string_view_t = std::basic_string_view<char_t>;

	explicit engine(const engine_config& config = {}):
		config{config}, patterns{config.cache_capacity} {}

	std::tuple<syntax_error, compiled_ptr_t> compile(string_view_t pattern) {
		return patterns.get_or_compile(pattern);
	}

	std::tuple<error_category, std::vector<match_t>> find_all(const compiled_ptr_t& compiled, string_view_t text) const{
		return regex::find_all<char_t>(compiled->tree, text, config.find);
	}

	// compiles through the cache first, a syntax error yields its category
	std::tuple<error_category, std::vector<match_t>> find_all(string_view_t pattern, string_view_t text) {
		auto [error, compiled] = compile(pattern);
		if(error) return {error.category, {}};
		return find_all(compiled, text);
	}

	// lazy version of find_all, the range keeps compiled alive
	match_range<char_t> matches(const compiled_ptr_t& compiled, string_view_t text) const{
		return match_range<char_t>{std::shared_ptr<const tree_t>(compiled, &compiled->tree), text, config.find};
	}

	const cache_t& cache() const noexcept{ return patterns; }
	cache_t& cache() noexcept{ return patterns; }

	const engine_config& configuration() const noexcept{ return config; }

private:
	const engine_config config;
	cache_t patterns;

}; // class engine

namespace impl {

// expands \0 .. \9 and \\ in replacement, unset groups expand to nothing
template <typename CharT>
void expand_replacement(basic_string<CharT>& out, basic_string_view<CharT> replacement, const basic_match<CharT>& m) {
	for(size_t i = 0; i < replacement.size(); ++i) {
		const CharT c = replacement[i];
		if(c != '\\' || i + 1 == replacement.size()) {
			out.push_back(c);
			continue;
		}
		const CharT next = replacement[++i];
		if(is_digit(next)) {
			if(auto g = m.group(size_t(next - '0')); g) out.append(*g);
		}else {
			// \\ and any other escaped character stand for themselves
			out.push_back(next);
		}
	}
}

} // namespace impl

// free functions, none of them caches the compiled pattern

using impl::compile;

template <typename CharT>
std::tuple<error_category, std::optional<basic_match<CharT>>> full_match(
	std::basic_string_view<CharT> pattern, std::basic_string_view<CharT> target,
	std::size_t step_budget = find_options::default_step_budget
) {
	auto [error, tree] = parse<CharT>(pattern);
	if(error) return {error.category, std::nullopt};
	return matcher<CharT>{tree, step_budget}.full_match(target);
}

template <typename CharT>
std::tuple<error_category, std::optional<basic_match<CharT>>> search(
	std::basic_string_view<CharT> pattern, std::basic_string_view<CharT> target, find_options options = {}
) {
	auto [error, tree] = parse<CharT>(pattern);
	if(error) return {error.category, std::nullopt};
	return search<CharT>(tree, target, options);
}

template <typename CharT>
std::tuple<error_category, std::vector<basic_match<CharT>>> find_all(
	std::basic_string_view<CharT> pattern, std::basic_string_view<CharT> target, find_options options = {}
) {
	auto [error, tree] = parse<CharT>(pattern);
	if(error) return {error.category, {}};
	return find_all<CharT>(tree, target, options);
}

// replaces at most count matches of pattern in target, returns the count of replacements
template <typename CharT>
std::tuple<error_category, std::size_t> replace(
	std::basic_string_view<CharT> pattern, std::basic_string<CharT>& target,
	std::basic_string_view<CharT> replacement, std::size_t count = -1, find_options options = {}
) {
	auto [error, tree] = parse<CharT>(pattern);
	if(error) return {error.category, 0};

	options.offsets = offset_mode::absolute;
	std::basic_string<CharT> result;
	std::size_t copied = 0, replaced = 0;

	match_range<CharT> range{tree, target, options};
	for(auto it = range.begin(); replaced < count && it != range.end(); ++it) {
		result.append(target, copied, it->start() - copied);
		impl::expand_replacement<CharT>(result, replacement, *it);
		copied = it->end();
		++replaced;
	}
	// the range looks into target, so it must not change before the scan is over
	auto status = range.status();
	result.append(target, copied);
	target = std::move(result);
	return {status, replaced};
}

// instantiated once in regular_expression.cpp
namespace impl {

extern template struct syntax_tree<char>;
extern template struct pattern_parser<char>;
extern template struct matcher<char>;
extern template class match_range<char>;
extern template struct compiled_pattern<char>;
extern template class pattern_cache<char>;

extern template struct syntax_tree<wchar_t>;
extern template struct pattern_parser<wchar_t>;
extern template struct matcher<wchar_t>;
extern template class match_range<wchar_t>;
extern template struct compiled_pattern<wchar_t>;
extern template class pattern_cache<wchar_t>;

} // namespace impl

extern template class engine<char>;
extern template class engine<wchar_t>;

} // namespace regex

} // namespace deepgrep
