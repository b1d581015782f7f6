#pragma once

// fmt support for the regex types, narrow characters only

#include <string_view>

#include "fmt/core.h"
#include "fmt/format.h"

#include "deepgrep/regex/error.hpp"
#include "deepgrep/regex/matcher.hpp"

// "nothing to repeat"
template <>
struct fmt::formatter<deepgrep::regex::error_category>: fmt::formatter<std::string_view> {
	template <typename FormatContext>
	auto format(deepgrep::regex::error_category category, FormatContext& ctx) const{
		return fmt::formatter<std::string_view>::format(deepgrep::regex::error_message(category), ctx);
	}
};

// "missing parentheses at position 0"
template <>
struct fmt::formatter<deepgrep::regex::syntax_error> {
	constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

	template <typename FormatContext>
	auto format(const deepgrep::regex::syntax_error& error, FormatContext& ctx) const{
		return fmt::format_to(ctx.out(), "{} at position {}", error.message(), error.position);
	}
};

// "hello hello"[0,11) {1: "hello", 2: -}
// {} prints the whole match only, {:g} adds the groups
template <>
struct fmt::formatter<deepgrep::regex::basic_match<char>> {
	bool with_groups = false;

	constexpr auto parse(fmt::format_parse_context& ctx) {
		auto it = ctx.begin();
		if(it != ctx.end() && *it == 'g') {
			with_groups = true;
			++it;
		}
		return it;
	}

	template <typename FormatContext>
	auto format(const deepgrep::regex::basic_match<char>& m, FormatContext& ctx) const{
		auto out = fmt::format_to(ctx.out(), "\"{}\"[{},{})", m.str(), m.start(), m.end());
		if(!with_groups || m.group_count() == 0) return out;

		out = fmt::format_to(out, " {{");
		for(std::size_t i = 1; i <= m.group_count(); ++i) {
			if(i > 1) out = fmt::format_to(out, ", ");
			if(auto g = m.group(i); g) out = fmt::format_to(out, "{}: \"{}\"", i, *g);
			else out = fmt::format_to(out, "{}: -", i);
		}
		return fmt::format_to(out, "}}");
	}
};
