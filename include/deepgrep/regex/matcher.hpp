#pragma once

/*
	backtracking interpreter over a syntax_tree.

	the interpreter never recurses: the work that remains after the current node
	(the continuation) is a persistent singly linked list living in an arena,
	a choice point remembers a continuation, a cursor, the length of the capture
	undo log and the arena size, so backtracking is a constant-time restore.
	every processed work item costs one step of the caller-supplied budget.
*/

#include <tuple>
#include <limits>
#include <memory>
#include <string>
#include <vector>
#include <cstddef>
#include <utility>
#include <variant>
#include <optional>
#include <string_view>

#include "deepgrep/regex/error.hpp"
#include "deepgrep/regex/options.hpp"
#include "deepgrep/regex/syntax_tree.hpp"

namespace deepgrep {

namespace regex {

namespace impl {

using std::tuple;

template <typename... Fs>
struct overloaded: Fs... { using Fs::operator()...; };
template <typename... Fs>
overloaded(Fs...) -> overloaded<Fs...>;

// one successful match attempt, immutable once produced
template <typename CharT>
struct basic_match {

	using char_t = CharT;
	using string_view_t = basic_string_view<char_t>;
	using group_id_t = typename syntax_tree<char_t>::group_id_t;
	using group_names_t = typename syntax_tree<char_t>::group_names_t;

	// [first, second), offsets into subject
	using span_t = pair<size_t, size_t>;

	// the scanning context the offsets refer to, either one line or the whole text
	string_view_t subject;
	// 0-based line number within the searched text
	size_t line = 0;
	// groups[0] is the whole match
	vector<optional<span_t>> groups;
	shared_ptr<const group_names_t> names;

	size_t start() const noexcept{ return groups.front()->first; }
	size_t end() const noexcept{ return groups.front()->second; }
	size_t length() const noexcept{ return end() - start(); }
	bool empty() const noexcept{ return start() == end(); }

	string_view_t str() const{ return subject.substr(start(), length()); }

	// number of capture groups, not counting the whole match
	size_t group_count() const noexcept{ return groups.size() - 1; }

	optional<span_t> span(group_id_t index) const{
		if(index >= groups.size()) return std::nullopt;
		return groups[index];
	}

	// empty when the group did not take part in the match
	optional<string_view_t> group(group_id_t index) const{
		auto s = span(index);
		if(!s) return std::nullopt;
		return subject.substr(s->first, s->second - s->first);
	}

	optional<string_view_t> group(string_view_t name) const{
		if(!names) return std::nullopt;
		if(auto it = names->find(name); it != names->end()) return group(it->second);
		return std::nullopt;
	}

	friend bool operator==(const basic_match& l, const basic_match& r) noexcept{
		return l.line == r.line && l.groups == r.groups && l.str() == r.str();
	}

}; // struct basic_match

template <typename CharT>
struct matcher {

	using char_t = CharT;
	using tree_t = syntax_tree<char_t>;
	using node_id_t = typename tree_t::node_id_t;
	using group_id_t = typename tree_t::group_id_t;
	using string_view_t = basic_string_view<char_t>;

	using match_t = basic_match<char_t>;
	using span_t = typename match_t::span_t;

	static constexpr size_t default_step_budget = find_options::default_step_budget;

	const tree_t& tree;
	size_t step_budget;

	explicit matcher(const tree_t& tree, size_t step_budget = default_step_budget):
		tree{tree}, step_budget{step_budget} {}

	// try to match beginning exactly at start, anchors are relative to line
	tuple<error_category, optional<match_t>> match_at(string_view_t line, size_t start) {
		return run(line, start, false);
	}

	// the match must cover the whole of text
	tuple<error_category, optional<match_t>> full_match(string_view_t text) {
		return run(text, 0, true);
	}

	// steps spent by the last attempt
	size_t steps() const noexcept{ return step_count; }

protected:

	using link_t = size_t;
	static constexpr link_t nil = std::numeric_limits<link_t>::max();

	enum class op: unsigned char {
		visit,        // match node
		close_group,  // record (pos, cursor) for the group at node
		repeat,       // quantifier at node has completed count iterations
		repeat_check, // an iteration that began at pos has just finished
		try_branch    // resume alternation at node with branch count
	};

	struct work {
		op code;
		node_id_t node;
		size_t count = 0;
		size_t pos = 0;
	};

	struct cell {
		work item;
		link_t next;
	};

	struct choice_point {
		link_t cont;
		size_t cursor;
		size_t undo_size;
		size_t arena_size;
	};

	vector<cell> arena;
	vector<choice_point> choices;
	vector<optional<span_t>> captures;
	// (group, value before overwrite)
	vector<pair<group_id_t, optional<span_t>>> undo_log;

	string_view_t input;
	size_t cursor = 0;
	link_t cont = nil;
	size_t step_count = 0;

	void reset(string_view_t line, size_t start) {
		arena.clear();
		choices.clear();
		undo_log.clear();
		captures.assign(tree.group_count + 1, std::nullopt);
		input = line;
		cursor = start;
		cont = nil;
		step_count = 0;
	}

	link_t push(const work& item, link_t next) {
		arena.push_back({item, next});
		return arena.size() - 1;
	}

	void push_choice(link_t alternative) {
		choices.push_back({alternative, cursor, undo_log.size(), arena.size()});
	}

	void set_capture(group_id_t index, span_t value) {
		undo_log.emplace_back(index, captures[index]);
		captures[index] = value;
	}

	// restores the newest choice point, false when none is left
	bool backtrack() {
		if(choices.empty()) return false;
		const auto cp = choices.back();
		choices.pop_back();

		while(undo_log.size() > cp.undo_size) {
			auto& [index, value] = undo_log.back();
			captures[index] = value;
			undo_log.pop_back();
		}
		// cells created after the choice point are unreachable from here on
		arena.resize(cp.arena_size);
		cursor = cp.cursor;
		cont = cp.cont;
		return true;
	}

	tuple<error_category, optional<match_t>> run(string_view_t line, size_t start, bool anchored_end) {
		reset(line, start);
		// no position past the end of line to start from
		if(start > line.size()) return {error_category::success, std::nullopt};
		cont = push({op::visit, tree.root}, nil);

		while(true) {
			if(cont == nil) {
				if(!anchored_end || cursor == input.size()) break;
				if(!backtrack()) return {error_category::success, std::nullopt};
				continue;
			}
			if(++step_count > step_budget) return {error_category::resource_exceeded, std::nullopt};

			// copy: the arena may grow while the item executes
			const cell current = arena[cont];
			cont = current.next;
			if(!execute(current.item) && !backtrack()) return {error_category::success, std::nullopt};
		}

		match_t m;
		m.subject = input;
		m.groups = captures;
		m.groups.front() = span_t{start, cursor};
		m.names = tree.names;
		return {error_category::success, std::move(m)};
	}

	bool execute(const work& item) {
		switch(item.code) {
		case op::visit:
			return visit(item.node);
		case op::close_group:
			set_capture(*std::get<typename tree_t::group>(tree[item.node]).index, {item.pos, cursor});
			return true;
		case op::repeat:
			return repeat(item.node, item.count);
		case op::repeat_check: {
			const auto& q = std::get<typename tree_t::quantifier>(tree[item.node]);
			// an iteration that consumed nothing would repeat forever, stop iterating
			if(cursor == item.pos && item.count > q.min) return true;
			cont = push({op::repeat, item.node, item.count}, cont);
			return true;
		}
		case op::try_branch:
			return try_branch(item.node, item.count);
		}
		return false;
	}

	bool consume_if(bool accepted) noexcept{
		if(accepted) ++cursor;
		return accepted;
	}

	bool visit(node_id_t id) {
		const bool has_input = cursor < input.size();
		return std::visit(overloaded{
			[&](const typename tree_t::literal& n) {
				return consume_if(has_input && input[cursor] == n.ch);
			},
			[&](const typename tree_t::char_class& n) {
				return consume_if(has_input && n.accept(input[cursor]));
			},
			[&](const typename tree_t::any_char&) {
				return consume_if(has_input && !is_line_terminator(input[cursor]));
			},
			[&](const typename tree_t::anchor& n) {
				if(n.kind == tree_t::anchor_kind::line_begin) return cursor == 0;
				return cursor == input.size();
			},
			[&](const typename tree_t::group& n) {
				if(n.index) cont = push({op::close_group, id, 0, cursor}, cont);
				cont = push({op::visit, n.body}, cont);
				return true;
			},
			[&](const typename tree_t::backreference& n) {
				const auto& captured = captures[n.index];
				// unset group: an ordinary failure
				if(!captured) return false;
				auto text = input.substr(captured->first, captured->second - captured->first);
				if(input.substr(cursor, text.size()) != text) return false;
				cursor += text.size();
				return true;
			},
			[&](const typename tree_t::concat& n) {
				for(auto it = n.items.rbegin(); it != n.items.rend(); ++it) {
					cont = push({op::visit, *it}, cont);
				}
				return true;
			},
			[&](const typename tree_t::alternation&) {
				return try_branch(id, 0);
			},
			[&](const typename tree_t::quantifier&) {
				cont = push({op::repeat, id, 0}, cont);
				return true;
			}
		}, tree[id]);
	}

	// first branch whose continuation succeeds wins, later ones are choice points
	bool try_branch(node_id_t id, size_t branch) {
		const auto& alt = std::get<typename tree_t::alternation>(tree[id]);
		if(branch + 1 < alt.branches.size()) {
			push_choice(push({op::try_branch, id, branch + 1}, cont));
		}
		cont = push({op::visit, alt.branches[branch]}, cont);
		return true;
	}

	// greedy: iterate first, remember "stop here" as a choice point
	bool repeat(node_id_t id, size_t count) {
		const auto& q = std::get<typename tree_t::quantifier>(tree[id]);
		if(q.max && count >= *q.max) return true;

		if(count >= q.min) push_choice(cont);
		cont = push({op::repeat_check, id, count + 1, cursor}, cont);
		cont = push({op::visit, q.body}, cont);
		return true;
	}

}; // struct matcher

} // namespace impl

template <typename CharT>
using basic_match = impl::basic_match<CharT>;

template <typename CharT>
using matcher = impl::matcher<CharT>;

using match = basic_match<char>;
using wmatch = basic_match<wchar_t>;

} // namespace regex

} // namespace deepgrep
