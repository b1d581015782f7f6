#pragma once

#include <map>
#include <list>
#include <mutex>
#include <tuple>
#include <atomic>
#include <memory>
#include <string>
#include <cstddef>
#include <utility>
#include <optional>
#include <string_view>
#include <shared_mutex>

#include "deepgrep/regex/error.hpp"
#include "deepgrep/regex/parser.hpp"
#include "deepgrep/regex/syntax_tree.hpp"

namespace deepgrep {

namespace regex {

namespace impl {

// a parsed pattern, shared read-only by every user once created
template <typename CharT>
struct compiled_pattern {

	using char_t = CharT;
	using tree_t = syntax_tree<char_t>;
	using string_t = typename tree_t::string_t;
	using string_view_t = typename tree_t::string_view_t;
	using group_id_t = typename tree_t::group_id_t;

	string_t pattern;
	tree_t tree;

	size_t group_count() const noexcept{ return tree.group_count; }

	optional<group_id_t> group_index(string_view_t name) const{
		return tree.group_index(name);
	}

}; // struct compiled_pattern

template <typename CharT>
using compiled_ptr = shared_ptr<const compiled_pattern<CharT>>;

template <typename CharT>
std::tuple<syntax_error, compiled_ptr<CharT>> compile(basic_string_view<CharT> pattern) {
	auto [error, tree] = pattern_parser<CharT>{}.parse(pattern);
	if(error) return {error, nullptr};
	return {
		error,
		std::make_shared<const compiled_pattern<CharT>>(compiled_pattern<CharT>{
			basic_string<CharT>{pattern},
			std::move(tree)
		})
	};
}

/*
	bounded least-recently-used cache: pattern -> compiled pattern.

	lookups share table_mutex, the recency list is only touched under order_mutex,
	and inserting plus evicting happens while table_mutex is held exclusively,
	so an eviction can never race with a hit that is moving the same entry.
	lock order is always table_mutex, then order_mutex.
*/
template <typename CharT>
class pattern_cache {
public:

	using char_t = CharT;
	using compiled_t = compiled_pattern<char_t>;
	using compiled_ptr_t = compiled_ptr<char_t>;
	using string_t = typename compiled_t::string_t;
	using string_view_t = typename compiled_t::string_view_t;

	static constexpr size_t default_capacity = 128;

	struct statistics {
		size_t hits = 0;
		size_t misses = 0;
		size_t evictions = 0;
	};

	// capacity 0 keeps nothing, every call parses
	explicit pattern_cache(size_t capacity = default_capacity) noexcept: max_entries{capacity} {}

	pattern_cache(const pattern_cache&) = delete;
	pattern_cache& operator=(const pattern_cache&) = delete;

	std::tuple<syntax_error, compiled_ptr_t> get_or_compile(string_view_t pattern) {
		{
			std::shared_lock table_lock{table_mutex};
			if(auto it = table.find(pattern); it != table.end()) {
				touch(it->second);
				++hit_count;
				return {syntax_error{}, it->second.compiled};
			}
		}

		++miss_count;
		// parsing needs no lock
		auto [error, compiled] = impl::compile<char_t>(pattern);
		if(error || max_entries == 0) return {error, std::move(compiled)};

		std::unique_lock table_lock{table_mutex};
		if(auto it = table.find(pattern); it != table.end()) {
			// another caller inserted it meanwhile, both trees are equivalent
			touch(it->second);
			return {syntax_error{}, it->second.compiled};
		}

		std::lock_guard order_lock{order_mutex};
		order.push_front(compiled);
		table.emplace(string_t{pattern}, entry{compiled, order.begin()});
		while(table.size() > max_entries) {
			table.erase(table.find(order.back()->pattern));
			order.pop_back();
			++eviction_count;
		}
		return {syntax_error{}, std::move(compiled)};
	}

	// does not count as a use
	bool contains(string_view_t pattern) const{
		std::shared_lock table_lock{table_mutex};
		return table.find(pattern) != table.end();
	}

	size_t size() const{
		std::shared_lock table_lock{table_mutex};
		return table.size();
	}

	size_t capacity() const noexcept{ return max_entries; }

	void clear() {
		std::unique_lock table_lock{table_mutex};
		std::lock_guard order_lock{order_mutex};
		table.clear();
		order.clear();
	}

	statistics stats() const noexcept{
		return {hit_count.load(), miss_count.load(), eviction_count.load()};
	}

private:

	// front is the most recently used
	using order_t = std::list<compiled_ptr_t>;

	struct entry {
		compiled_ptr_t compiled;
		typename order_t::iterator position;
	};

	// caller holds table_mutex, shared or exclusive
	void touch(entry& e) {
		std::lock_guard order_lock{order_mutex};
		order.splice(order.begin(), order, e.position);
	}

	const size_t max_entries;

	std::map<string_t, entry, std::less<>> table;
	order_t order;

	mutable std::shared_mutex table_mutex;
	std::mutex order_mutex;

	std::atomic<size_t> hit_count{0};
	std::atomic<size_t> miss_count{0};
	std::atomic<size_t> eviction_count{0};

}; // class pattern_cache

} // namespace impl

template <typename CharT>
using compiled_pattern = impl::compiled_pattern<CharT>;

template <typename CharT>
using compiled_ptr = impl::compiled_ptr<CharT>;

template <typename CharT>
using pattern_cache = impl::pattern_cache<CharT>;

} // namespace regex

} // namespace deepgrep
