#pragma once

/*
	recursive descent parser: pattern string -> syntax_tree

	precedence, lowest to highest:
	alternation       a|b
	concatenation     ab
	quantifier        *  +  ?  {m}  {m,}  {m,n}
	atom              c  \e  .  [...]  [^...]  (...)  (?:...)  (?<name>...)  ^  $
*/

#include <tuple>
#include <string>
#include <vector>
#include <cstddef>
#include <utility>
#include <optional>
#include <string_view>

#include "deepgrep/regex/error.hpp"
#include "deepgrep/regex/syntax_tree.hpp"

namespace deepgrep {

namespace regex {

namespace impl {

using std::tuple;

template <typename CharT>
constexpr bool is_digit(CharT c) noexcept{ return in_range(CharT('0'), CharT('9'), c); }

template <typename CharT>
constexpr bool is_alpha(CharT c) noexcept{
	return in_range(CharT('a'), CharT('z'), c) || in_range(CharT('A'), CharT('Z'), c);
}

template <typename CharT>
constexpr bool is_hex_digit(CharT c) noexcept{
	return is_digit(c) || in_range(CharT('a'), CharT('f'), c) || in_range(CharT('A'), CharT('F'), c);
}

template <typename CharT>
constexpr int hex_val(CharT x) noexcept{
	if(is_digit(x)) {
		return x - '0';
	}else if(in_range(CharT('a'), CharT('f'), x)) {
		return (x - 'a') + 10;
	}else {
		// 'A' <= x && x <= 'F'
		return (x - 'A') + 10;
	}
}

template <typename CharT>
struct pattern_parser {

	using char_t = CharT;
	using tree_t = syntax_tree<char_t>;
	using range_t = typename tree_t::range_t;
	using string_t = typename tree_t::string_t;
	using node_id_t = typename tree_t::node_id_t;
	using group_id_t = typename tree_t::group_id_t;
	using group_names_t = typename tree_t::group_names_t;

	using pattern_view_t = basic_string_view<char_t>;

	// upper bound of m and n in {m,n}
	static constexpr size_t max_repeat_count = 100000;
	// upper bound of nested groups, keeps the descent off the end of the stack
	static constexpr size_t max_nesting_depth = 256;

	pattern_parser() = default;

	tuple<syntax_error, tree_t> parse(pattern_view_t s) {
		reset(s);

		auto root = parse_alternation();
		if(root && !at_end()) {
			// the only thing stopping the top level alternation is an unmatched ')'
			fail(error_category::missing_paren, pos);
			root.reset();
		}
		if(root && resolve_backreferences()) {
			tree.root = *root;
			tree.names = std::make_shared<const group_names_t>(std::move(names));
			return {syntax_error{}, std::move(tree)};
		}
		return {error, tree_t{}};
	}

protected:

	// one lexed escape sequence, \e
	struct escape_token {
		enum kind_category {
			single_char,
			shorthand_escape,
			backreference,
			named_backreference
		} kind;
		char_t ch{};
		shorthand_class shorthand{};
		group_id_t index = 0;
		string_t name;
	};

	// a member of a bracket expression before range folding
	struct class_atom {
		bool is_single;
		char_t ch{};
		shorthand_class shorthand{};
	};

	struct pending_backreference {
		size_t position;
		node_id_t node;
		// empty for numeric backreferences
		string_t name;
	};

	pattern_view_t pattern;
	size_t pos = 0;
	size_t depth = 0;

	tree_t tree;
	group_names_t names;
	vector<pending_backreference> backreferences;
	syntax_error error;

	void reset(pattern_view_t s) {
		pattern = s;
		pos = 0;
		depth = 0;
		tree = tree_t{};
		names.clear();
		backreferences.clear();
		error = {};
	}

	bool at_end() const noexcept{ return pos >= pattern.size(); }
	char_t peek() const noexcept{ return pattern[pos]; }

	bool next_is(char_t c) const noexcept{ return !at_end() && peek() == c; }

	static constexpr bool is_quantifier_start(char_t c) noexcept{
		return c == '*' || c == '+' || c == '?' || c == '{';
	}

	// records the first error and yields an empty result
	std::nullopt_t fail(error_category category, size_t at) noexcept{
		error = {category, at};
		return std::nullopt;
	}

	// alternation ::= concat ('|' concat)*
	optional<node_id_t> parse_alternation() {
		vector<node_id_t> branches;
		while(true) {
			auto branch = parse_concat();
			if(!branch) return std::nullopt;
			branches.push_back(*branch);
			if(!next_is('|')) break;
			++pos;
		}
		if(branches.size() == 1) return branches.front();
		return tree.add(typename tree_t::alternation{std::move(branches)});
	}

	// concat ::= quantified*, an empty concat matches the empty string
	optional<node_id_t> parse_concat() {
		vector<node_id_t> items;
		while(!at_end() && peek() != '|' && peek() != ')') {
			auto item = parse_quantified();
			if(!item) return std::nullopt;
			items.push_back(*item);
		}
		if(items.size() == 1) return items.front();
		return tree.add(typename tree_t::concat{std::move(items)});
	}

	// quantified ::= atom quantifier?
	optional<node_id_t> parse_quantified() {
		if(is_quantifier_start(peek())) return fail(error_category::empty_operand, pos);

		auto atom = parse_atom();
		if(!atom) return std::nullopt;
		if(at_end() || !is_quantifier_start(peek())) return atom;

		// ^* and $+ have nothing to repeat
		if(std::holds_alternative<typename tree_t::anchor>(tree[*atom])) return fail(error_category::empty_operand, pos);

		size_t min = 0;
		optional<size_t> max;
		switch(peek()) {
		case '*': ++pos; break;
		case '+': ++pos; min = 1; break;
		case '?': ++pos; max = 1; break;
		default: {
			// '{'
			auto braces = parse_braces();
			if(!braces) return std::nullopt;
			std::tie(min, max) = *braces;
		}
		}
		// lazy and possessive suffixes are not part of this dialect
		if(!at_end() && is_quantifier_start(peek())) return fail(error_category::multiple_repeat, pos);

		return tree.add(typename tree_t::quantifier{*atom, min, max, true});
	}

	// {m}, {m,}, {m,n}
	optional<pair<size_t, optional<size_t>>> parse_braces() {
		const size_t brace_pos = pos++;

		auto lex_count = [this]() -> optional<size_t> {
			if(at_end() || !is_digit(peek())) return std::nullopt;
			size_t n = 0;
			do {
				n = n * 10 + size_t(peek() - '0');
				if(n > max_repeat_count) return std::nullopt;
				++pos;
			}while(!at_end() && is_digit(peek()));
			return n;
		};

		auto m = lex_count();
		if(!m) return fail(error_category::bad_brace_expression, brace_pos);

		if(next_is('}')) {
			++pos;
			return pair{*m, optional<size_t>{*m}};
		}
		if(!next_is(',')) return fail(error_category::bad_brace_expression, brace_pos);
		++pos;
		if(next_is('}')) {
			++pos;
			return pair{*m, optional<size_t>{}};
		}
		auto n = lex_count();
		if(!n || !next_is('}') || *m > *n) return fail(error_category::bad_brace_expression, brace_pos);
		++pos;
		return pair{*m, optional<size_t>{*n}};
	}

	optional<node_id_t> parse_atom() {
		switch(peek()) {
		case '(':
			return parse_group();
		case '[':
			return parse_brackets();
		case '.':
			++pos;
			return tree.add(typename tree_t::any_char{});
		case '^':
			++pos;
			return tree.add(typename tree_t::anchor{tree_t::anchor_kind::line_begin});
		case '$':
			++pos;
			return tree.add(typename tree_t::anchor{tree_t::anchor_kind::line_end});
		case '\\':
			return parse_escape();
		default:
			return tree.add(typename tree_t::literal{pattern[pos++]});
		}
	}

	optional<node_id_t> parse_group() {
		const size_t open_pos = pos++;
		if(++depth > max_nesting_depth) return fail(error_category::nesting_too_deep, open_pos);

		bool capturing = true;
		string_t name;
		size_t name_pos = 0;

		if(next_is('?')) {
			++pos;
			if(at_end()) return fail(error_category::missing_paren, open_pos);
			switch(peek()) {
			case ':': // (?: non-marking grouping
				++pos;
				capturing = false;
				break;
			case '=': // (?= zero-width positive lookahead
			case '!': // (?! zero-width negative lookahead
				return fail(error_category::unsupported_features, open_pos);
			case 'P': // (?P<name>
				++pos;
				if(!next_is('<')) return fail(error_category::bad_group_name, pos);
				[[fallthrough]];
			case '<': // (?<name>
				++pos;
				if(next_is('=') || next_is('!')) return fail(error_category::unsupported_features, open_pos);
				name_pos = pos;
				if(auto lexed = lex_group_name(); lexed) name = std::move(*lexed);
				else return std::nullopt;
				break;
			default:
				// inline flags and the like
				return fail(error_category::unsupported_features, open_pos);
			}
		}

		optional<group_id_t> index;
		if(capturing) {
			index = ++tree.group_count;
			if(!name.empty() && !names.try_emplace(name, *index).second) {
				return fail(error_category::bad_group_name, name_pos);
			}
		}

		auto body = parse_alternation();
		if(!body) return std::nullopt;
		if(!next_is(')')) return fail(error_category::missing_paren, open_pos);
		++pos;
		--depth;
		return tree.add(typename tree_t::group{index, *body});
	}

	// name ::= [A-Za-z_][A-Za-z0-9_]* '>'
	optional<string_t> lex_group_name() {
		const size_t begin = pos;
		while(!at_end() && is_word(peek())) ++pos;
		if(pos == begin || is_digit(pattern[begin])) return fail(error_category::bad_group_name, begin);
		if(!next_is('>')) return fail(error_category::bad_group_name, pos);
		string_t name{pattern.substr(begin, pos - begin)};
		++pos;
		return name;
	}

	/*
		escapes:
		1. control escape    \f \n \r \t \v \0
		2. c + control letter \cX, value = X % 32
		3. x + hex escape    exactly two hex digits
		4. classes           \d \D \s \S \w \W
		5. backreference     \N, \k<name> (not inside brackets)
		6. identity escape   any other non-alphanumeric character, such as \\, \.
	*/
	optional<escape_token> lex_escape(bool in_brackets) {
		const size_t escape_pos = pos++;
		if(at_end()) return fail(error_category::bad_escape, escape_pos);

		auto single = [](char_t c) { return escape_token{escape_token::single_char, c}; };
		auto shorthand = [](shorthand_class kind) {
			escape_token token{escape_token::shorthand_escape};
			token.shorthand = kind;
			return token;
		};

		char_t c = pattern[pos++];
		switch(c) {
		// control escapes:
		case 'f': return single(char_t('\f'));
		case 'n': return single(char_t('\n'));
		case 'r': return single(char_t('\r'));
		case 't': return single(char_t('\t'));
		case 'v': return single(char_t('\v'));
		case '0': return single(char_t('\0'));

		case 'c': {
			if(at_end() || !is_alpha(peek())) return fail(error_category::bad_escape, escape_pos);
			return single(char_t(to_unit(pattern[pos++]) % 32));
		}
		case 'x': {
			if(pos + 1 >= pattern.size() || !is_hex_digit(pattern[pos]) || !is_hex_digit(pattern[pos + 1]))
				return fail(error_category::bad_escape, escape_pos);
			char_t value = char_t(hex_val(pattern[pos]) * 0x10 + hex_val(pattern[pos + 1]));
			pos += 2;
			return single(value);
		}

		case 'd': return shorthand(shorthand_class::digits);
		case 'D': return shorthand(shorthand_class::non_digits);
		case 's': return shorthand(shorthand_class::spaces);
		case 'S': return shorthand(shorthand_class::non_spaces);
		case 'w': return shorthand(shorthand_class::words);
		case 'W': return shorthand(shorthand_class::non_words);

		case 'b':
			// backspace inside brackets, a word boundary assertion elsewhere
			if(in_brackets) return single(char_t('\b'));
			return fail(error_category::unsupported_features, escape_pos);
		case 'B':
			return fail(error_category::unsupported_features, escape_pos);

		case 'k': {
			if(in_brackets || !next_is('<')) return fail(error_category::bad_escape, escape_pos);
			++pos;
			auto name = lex_group_name();
			if(!name) return std::nullopt;
			escape_token token{escape_token::named_backreference};
			token.name = std::move(*name);
			return token;
		}
		}

		if(in_range(char_t('1'), char_t('9'), c)) {
			if(in_brackets) return fail(error_category::bad_escape, escape_pos);
			group_id_t index = group_id_t(c - '0');
			while(!at_end() && is_digit(peek())) {
				index = index * 10 + group_id_t(pattern[pos++] - '0');
				// no pattern has that many groups, keep the value bounded
				if(index > max_repeat_count) index = max_repeat_count + 1;
			}
			escape_token token{escape_token::backreference};
			token.index = index;
			return token;
		}

		// unknown letter escapes are reserved
		if(is_alpha(c) || is_digit(c)) return fail(error_category::bad_escape, escape_pos);

		// identity escapes
		return single(c);
	}

	optional<node_id_t> parse_escape() {
		const size_t escape_pos = pos;
		auto token = lex_escape(false);
		if(!token) return std::nullopt;

		switch(token->kind) {
		case escape_token::single_char:
			return tree.add(typename tree_t::literal{token->ch});
		case escape_token::shorthand_escape:
			return tree.add(typename tree_t::char_class{shorthand_ranges<char_t>(token->shorthand), false});
		case escape_token::backreference: {
			auto id = tree.add(typename tree_t::backreference{token->index});
			backreferences.push_back({escape_pos, id, {}});
			return id;
		}
		case escape_token::named_backreference: {
			// resolved once every group name is known
			auto id = tree.add(typename tree_t::backreference{0});
			backreferences.push_back({escape_pos, id, std::move(token->name)});
			return id;
		}
		}
		return fail(error_category::bad_escape, escape_pos);
	}

	optional<class_atom> lex_class_atom() {
		if(peek() != '\\') return class_atom{true, pattern[pos++]};

		auto token = lex_escape(true);
		if(!token) return std::nullopt;
		if(token->kind == escape_token::shorthand_escape) return class_atom{false, char_t{}, token->shorthand};
		return class_atom{true, token->ch};
	}

	// [c...], [^c...]
	optional<node_id_t> parse_brackets() {
		const size_t open_pos = pos++;
		bool negated = false;
		if(next_is('^')) {
			negated = true;
			++pos;
		}

		vector<range_t> ranges;
		size_t members = 0;
		while(!at_end() && peek() != ']') {
			const size_t member_pos = pos;
			auto from = lex_class_atom();
			if(!from) return std::nullopt;

			// '-' is a literal when it is first, last, or follows a completed range
			const bool is_range = next_is('-') && pos + 1 < pattern.size() && pattern[pos + 1] != ']';

			if(!from->is_single) {
				// bad char range like [\w-...]
				if(is_range) return fail(error_category::bad_bracket_expression, member_pos);
				auto expanded = shorthand_ranges<char_t>(from->shorthand);
				ranges.insert(ranges.end(), expanded.begin(), expanded.end());
			}else if(is_range) {
				++pos; // skip '-'
				auto to = lex_class_atom();
				if(!to) return std::nullopt;
				// bad char range like [c-\w] or [z-a]
				if(!to->is_single || to_unit(from->ch) > to_unit(to->ch))
					return fail(error_category::bad_bracket_expression, member_pos);
				ranges.push_back(make_range(from->ch, to->ch));
			}else {
				ranges.push_back(make_range(from->ch, from->ch));
			}
			++members;
		}

		// '...[', broken bracket
		if(at_end()) return fail(error_category::bad_bracket_expression, open_pos);
		++pos; // skip ']'
		// [] and [^] accept nothing useful
		if(members == 0) return fail(error_category::bad_bracket_expression, open_pos);

		normalize_ranges(ranges);
		return tree.add(typename tree_t::char_class{std::move(ranges), negated});
	}

	// every backreference must name a group defined somewhere in the pattern
	bool resolve_backreferences() {
		for(auto& ref: backreferences) {
			auto& node = std::get<typename tree_t::backreference>(tree.nodes[ref.node]);
			if(!ref.name.empty()) {
				auto it = names.find(ref.name);
				if(it == names.end()) {
					fail(error_category::bad_backreference, ref.position);
					return false;
				}
				node.index = it->second;
			}else if(node.index == 0 || node.index > tree.group_count) {
				fail(error_category::bad_backreference, ref.position);
				return false;
			}
		}
		return true;
	}

}; // struct pattern_parser

} // namespace impl

template <typename CharT>
using pattern_parser = impl::pattern_parser<CharT>;

template <typename CharT>
std::tuple<syntax_error, syntax_tree<CharT>> parse(std::basic_string_view<CharT> pattern) {
	return pattern_parser<CharT>{}.parse(pattern);
}

} // namespace regex

} // namespace deepgrep
