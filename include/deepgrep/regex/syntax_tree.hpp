#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <utility>
#include <variant>
#include <optional>
#include <algorithm>
#include <functional>
#include <string_view>
#include <type_traits>

namespace deepgrep {

namespace regex {

namespace impl {

using std::pair;
using std::size_t;
using std::vector;
using std::variant;
using std::optional;
using std::shared_ptr;
using std::basic_string;
using std::basic_string_view;
using std::make_unsigned_t;

template <typename CharT>
constexpr make_unsigned_t<CharT> to_unit(CharT c) noexcept{
	return static_cast<make_unsigned_t<CharT>>(c);
}

template <typename CharT>
struct char_range {
	using char_t = CharT;
	using unit_t = make_unsigned_t<char_t>;

	// inclusive: [from, to]
	unit_t from, to;

	constexpr bool is_member(char_t c) const noexcept{
		return from <= to_unit(c) && to_unit(c) <= to;
	}

	friend constexpr bool operator==(const char_range&, const char_range&) noexcept = default;
};

template <typename CharT>
constexpr char_range<CharT> make_range(CharT from, CharT to) noexcept{
	return {to_unit(from), to_unit(to)};
}

template <typename CharT>
constexpr bool in_range(CharT a, CharT b, CharT x) noexcept{ return to_unit(a) <= to_unit(x) && to_unit(x) <= to_unit(b); }

template <typename CharT>
constexpr bool is_line_terminator(CharT c) noexcept{
	return c == CharT('\n') || c == CharT('\r');
}

template <typename CharT>
constexpr bool is_word(CharT c) noexcept{
	return
		in_range(CharT('0'), CharT('9'), c) ||
		in_range(CharT('a'), CharT('z'), c) ||
		in_range(CharT('A'), CharT('Z'), c) ||
		(c == CharT('_'));
}

enum class shorthand_class: unsigned char {
	digits,      // \d: [0-9]
	words,       // \w: [0-9A-Z_a-z]
	spaces,      // \s: [\t\n\v\f\r ]
	non_digits,  // \D
	non_words,   // \W
	non_spaces   // \S
};

// sorts and merges overlapping or adjacent ranges in place
template <typename CharT>
void normalize_ranges(vector<char_range<CharT>>& ranges) {
	using unit_t = typename char_range<CharT>::unit_t;
	if(ranges.empty()) return;
	std::sort(ranges.begin(), ranges.end(), [](const auto& l, const auto& r) {
		return l.from < r.from || (l.from == r.from && l.to < r.to);
	});
	size_t out = 0;
	for(size_t i = 1; i < ranges.size(); ++i) {
		auto& last = ranges[out];
		const auto& cur = ranges[i];
		// overlapping or adjacent
		if(cur.from <= last.to || unit_t(cur.from - 1) == last.to) {
			last.to = std::max(last.to, cur.to);
		}else {
			ranges[++out] = cur;
		}
	}
	ranges.resize(out + 1);
}

// complement of normalized ranges over the whole code unit domain
template <typename CharT>
vector<char_range<CharT>> complement_ranges(const vector<char_range<CharT>>& ranges) {
	using unit_t = typename char_range<CharT>::unit_t;
	constexpr unit_t unit_max = std::numeric_limits<unit_t>::max();

	vector<char_range<CharT>> result;
	unit_t next = 0;
	bool exhausted = false;
	for(const auto& r: ranges) {
		if(r.from > next) result.push_back({next, unit_t(r.from - 1)});
		if(r.to == unit_max) {
			exhausted = true;
			break;
		}
		next = unit_t(r.to + 1);
	}
	if(!exhausted) result.push_back({next, unit_max});
	return result;
}

template <typename CharT>
vector<char_range<CharT>> shorthand_ranges(shorthand_class kind) {
	vector<char_range<CharT>> ranges;
	switch(kind) {
	case shorthand_class::digits:
	case shorthand_class::non_digits:
		ranges.push_back(make_range(CharT('0'), CharT('9')));
		break;
	case shorthand_class::words:
	case shorthand_class::non_words:
		ranges.push_back(make_range(CharT('0'), CharT('9')));
		ranges.push_back(make_range(CharT('A'), CharT('Z')));
		ranges.push_back(make_range(CharT('_'), CharT('_')));
		ranges.push_back(make_range(CharT('a'), CharT('z')));
		break;
	case shorthand_class::spaces:
	case shorthand_class::non_spaces:
		ranges.push_back(make_range(CharT('\t'), CharT('\r')));
		ranges.push_back(make_range(CharT(' '), CharT(' ')));
		break;
	}
	switch(kind) {
	case shorthand_class::non_digits:
	case shorthand_class::non_words:
	case shorthand_class::non_spaces:
		return complement_ranges(ranges);
	default:
		return ranges;
	}
}

/*
	abstract syntax tree of a pattern.

	nodes live in an arena and refer to their children by node_id_t,
	a child is always stored before its parent, so the arena is acyclic.
	the tree is immutable once the parser hands it out.
*/
template <typename CharT>
struct syntax_tree {

	using char_t = CharT;
	using range_t = char_range<char_t>;
	using string_t = basic_string<char_t>;
	using string_view_t = basic_string_view<char_t>;

	using node_id_t = std::uint32_t;
	using group_id_t = size_t;

	// group name -> group index
	using group_names_t = std::map<string_t, group_id_t, std::less<>>;

	enum class anchor_kind: unsigned char {
		line_begin, // ^
		line_end    // $
	};

	struct literal {
		char_t ch;
	};

	struct char_class {
		vector<range_t> ranges;
		bool negated = false;

		bool accept(char_t c) const noexcept{
			bool member = std::any_of(ranges.begin(), ranges.end(), [c](const range_t& r) {
				return r.is_member(c);
			});
			return member != negated;
		}
	};

	// matches everything except line terminators
	struct any_char {};

	struct anchor {
		anchor_kind kind;
	};

	struct group {
		// empty for non-capturing groups
		optional<group_id_t> index;
		node_id_t body;
	};

	struct backreference {
		group_id_t index;
	};

	struct concat {
		vector<node_id_t> items;
	};

	struct alternation {
		vector<node_id_t> branches;
	};

	struct quantifier {
		node_id_t body;
		size_t min = 0;
		// empty means unbounded
		optional<size_t> max;
		bool greedy = true;
	};

	using node = variant<
		literal,
		char_class,
		any_char,
		anchor,
		group,
		backreference,
		concat,
		alternation,
		quantifier
	>;

	vector<node> nodes;
	node_id_t root = 0;
	size_t group_count = 0;
	shared_ptr<const group_names_t> names = std::make_shared<const group_names_t>();

	const node& operator[](node_id_t id) const{
		return nodes[id];
	}

	template <typename NodeT>
	node_id_t add(NodeT&& n) {
		nodes.emplace_back(std::forward<NodeT>(n));
		return static_cast<node_id_t>(nodes.size() - 1);
	}

	optional<group_id_t> group_index(string_view_t name) const{
		if(auto it = names->find(name); it != names->end()) return it->second;
		return std::nullopt;
	}

}; // struct syntax_tree

} // namespace impl

template <typename CharT>
using syntax_tree = impl::syntax_tree<CharT>;

} // namespace regex

} // namespace deepgrep
