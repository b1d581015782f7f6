#pragma once

#include <tuple>
#include <memory>
#include <vector>
#include <cstddef>
#include <utility>
#include <iterator>
#include <optional>
#include <string_view>

#include "deepgrep/regex/error.hpp"
#include "deepgrep/regex/matcher.hpp"
#include "deepgrep/regex/options.hpp"
#include "deepgrep/regex/syntax_tree.hpp"

namespace deepgrep {

namespace regex {

namespace impl {

/*
	lazily scans a text for non-overlapping matches in document order.

	the text is split on "\n", "\r\n" and "\r", terminators are not part of any line,
	and a terminator at the very end of the text does not open an empty last line.
	each line is scanned left to right, after an empty match the scan moves one
	extra position forward so every position is tried exactly once.
*/
template <typename CharT>
class match_range {
public:

	using char_t = CharT;
	using tree_t = syntax_tree<char_t>;
	using match_t = basic_match<char_t>;
	using string_view_t = basic_string_view<char_t>;

	class iterator {
	public:
		using iterator_concept = std::input_iterator_tag;
		using iterator_category = std::input_iterator_tag;
		using difference_type = std::ptrdiff_t;
		using value_type = match_t;
		using reference = const match_t&;
		using pointer = const match_t*;

		iterator() noexcept = default;
		explicit iterator(match_range* range) noexcept: range{range} {}

		reference operator*() const{ return *range->current; }
		pointer operator->() const{ return &*range->current; }

		iterator& operator++() {
			range->advance();
			return *this;
		}
		void operator++(int) { ++*this; }

		bool at_end() const noexcept{
			return range == nullptr || !range->current.has_value();
		}

		friend bool operator==(const iterator& it, std::default_sentinel_t) noexcept{
			return it.at_end();
		}

	private:
		match_range* range = nullptr;
	};

	match_range(const tree_t& tree, string_view_t text, find_options options = {}):
		line_matcher{tree, options.step_budget}, text{text}, options{options} {}

	// keeps the owner of tree alive for as long as the range exists
	match_range(std::shared_ptr<const tree_t> tree, string_view_t text, find_options options = {}):
		match_range(*tree, text, options) {
		owner = std::move(tree);
	}

	match_range(const match_range&) = delete;
	match_range& operator=(const match_range&) = delete;

	iterator begin() {
		if(!started) {
			started = true;
			advance();
		}
		return iterator{this};
	}

	std::default_sentinel_t end() const noexcept{ return std::default_sentinel; }

	// success, or resource_exceeded when at least one attempt gave up
	error_category status() const noexcept{ return result; }

	// number of start positions abandoned because of the step budget
	size_t abandoned() const noexcept{ return abandoned_count; }

protected:

	matcher<char_t> line_matcher;
	std::shared_ptr<const tree_t> owner;
	string_view_t text;
	find_options options;

	size_t line_begin = 0;
	size_t line_end = 0;
	size_t next_line_begin = 0;
	size_t line_number = 0;
	size_t cursor = 0;
	bool line_loaded = false;
	bool started = false;
	bool done = false;

	error_category result = error_category::success;
	size_t abandoned_count = 0;
	optional<match_t> current;

	bool load_next_line() {
		if(next_line_begin >= text.size()) return false;
		if(line_loaded) ++line_number;

		line_begin = next_line_begin;
		line_end = line_begin;
		while(line_end < text.size() && !is_line_terminator(text[line_end])) ++line_end;

		if(line_end == text.size()) {
			next_line_begin = text.size();
		}else if(text[line_end] == '\r' && line_end + 1 < text.size() && text[line_end + 1] == '\n') {
			next_line_begin = line_end + 2;
		}else {
			next_line_begin = line_end + 1;
		}
		cursor = 0;
		line_loaded = true;
		return true;
	}

	bool advance() {
		current.reset();
		while(!done) {
			string_view_t line = text.substr(line_begin, line_end - line_begin);
			if(!line_loaded || cursor > line.size()) {
				if(!load_next_line()) {
					done = true;
					break;
				}
				continue;
			}

			auto [errc, m] = line_matcher.match_at(line, cursor);
			if(errc == error_category::resource_exceeded) {
				result = errc;
				++abandoned_count;
				if(options.on_exceeded == exceeded_policy::abort) {
					done = true;
					break;
				}
				++cursor;
				continue;
			}
			if(!m) {
				++cursor;
				continue;
			}

			cursor = m->empty() ? m->end() + 1 : m->end();
			current = locate(std::move(*m));
			return true;
		}
		return false;
	}

	match_t locate(match_t m) const{
		m.line = line_number;
		if(options.offsets == offset_mode::absolute) {
			for(auto& g: m.groups) {
				if(g) *g = {g->first + line_begin, g->second + line_begin};
			}
			m.subject = text;
		}
		return m;
	}

}; // class match_range

} // namespace impl

template <typename CharT>
using match_range = impl::match_range<CharT>;

template <typename CharT>
std::tuple<error_category, std::vector<basic_match<CharT>>> find_all(
	const syntax_tree<CharT>& tree, std::basic_string_view<CharT> text, find_options options = {}
) {
	match_range<CharT> range{tree, text, options};
	std::vector<basic_match<CharT>> matches;
	for(const auto& m: range) matches.push_back(m);
	return {range.status(), std::move(matches)};
}

// the first match in document order
template <typename CharT>
std::tuple<error_category, std::optional<basic_match<CharT>>> search(
	const syntax_tree<CharT>& tree, std::basic_string_view<CharT> text, find_options options = {}
) {
	match_range<CharT> range{tree, text, options};
	if(auto it = range.begin(); it != range.end()) return {range.status(), *it};
	return {range.status(), std::nullopt};
}

template <typename CharT>
std::tuple<error_category, std::optional<basic_match<CharT>>> match_at(
	const syntax_tree<CharT>& tree, std::basic_string_view<CharT> line, std::size_t start,
	std::size_t step_budget = find_options::default_step_budget
) {
	return matcher<CharT>{tree, step_budget}.match_at(line, start);
}

} // namespace regex

} // namespace deepgrep
