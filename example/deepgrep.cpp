/*
	deepgrep [options] PATTERN [FILE...]

	prints every match as FILE:LINE:OFFSET: MATCH, reading standard input when no file is given.

	-c                   print the number of matches per file only
	-o                   print the matched text only
	-g                   print capture groups as well
	--budget N           steps allowed for a single match attempt
	--cache N            compiled patterns kept in the cache
	--abort-on-exceeded  stop scanning a file once an attempt runs out of steps
	--line-offsets       report offsets relative to the line
	-v                   print cache statistics to stderr

	the DEEPGREP_* environment variables are read first, options override them.
	exit status: 0 if anything matched, 1 if nothing did, 2 on errors.
*/

#include <string>
#include <vector>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string_view>

#include "fmt/core.h"
#include "fmt/format.h"

#include "deepgrep/config.hpp"
#include "deepgrep/regular_expression.hpp"
#include "deepgrep/regex/format.hpp"

namespace {

using namespace deepgrep;

struct cli_options {
	bool count_only = false;
	bool only_matching = false;
	bool with_groups = false;
	bool verbose = false;
	std::string pattern;
	std::vector<std::string> files;
};

constexpr int exit_matched = 0;
constexpr int exit_no_match = 1;
constexpr int exit_error = 2;

void usage() {
	fmt::print(stderr, "usage: deepgrep [-c] [-o] [-g] [-v] [--budget N] [--cache N] "
		"[--abort-on-exceeded] [--line-offsets] PATTERN [FILE...]\n");
}

// fills options and config from argv, false on a malformed command line
bool parse_arguments(int argc, const char** argv, cli_options& options, engine_config& config) {
	bool pattern_seen = false;
	for(int i = 1; i < argc; ++i) {
		const std::string_view arg = argv[i];

		auto size_argument = [&](std::string_view name) -> std::optional<std::size_t> {
			if(i + 1 >= argc) {
				fmt::print(stderr, "deepgrep: {} needs a value\n", name);
				return std::nullopt;
			}
			auto n = parse_size(argv[++i]);
			if(!n) fmt::print(stderr, "deepgrep: {}: not a number: {}\n", name, argv[i]);
			return n;
		};

		if(pattern_seen) {
			options.files.emplace_back(arg);
		}else if(arg == "-c") {
			options.count_only = true;
		}else if(arg == "-o") {
			options.only_matching = true;
		}else if(arg == "-g") {
			options.with_groups = true;
		}else if(arg == "-v") {
			options.verbose = true;
		}else if(arg == "--abort-on-exceeded") {
			config.find.on_exceeded = regex::exceeded_policy::abort;
		}else if(arg == "--line-offsets") {
			config.find.offsets = regex::offset_mode::line_relative;
		}else if(arg == "--budget") {
			auto n = size_argument(arg);
			if(!n || *n == 0) return false;
			config.find.step_budget = *n;
		}else if(arg == "--cache") {
			auto n = size_argument(arg);
			if(!n) return false;
			config.cache_capacity = *n;
		}else if(arg == "--") {
			if(++i < argc) {
				options.pattern = argv[i];
				pattern_seen = true;
			}
		}else if(arg.size() > 1 && arg.front() == '-') {
			fmt::print(stderr, "deepgrep: unknown option {}\n", arg);
			return false;
		}else {
			options.pattern = std::string(arg);
			pattern_seen = true;
		}
	}
	return pattern_seen;
}

std::optional<std::string> read_input(const std::string& file) {
	if(file == "-") return std::string{std::istreambuf_iterator<char>{std::cin}, std::istreambuf_iterator<char>{}};

	std::ifstream in{file, std::ios::binary};
	if(!in) return std::nullopt;
	return std::string{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
}

// scans one input, returns the number of matches or nothing if it could not be read
std::optional<std::size_t> grep_file(regex::engine<char>& grep, const regex::compiled_ptr<char>& compiled,
	const std::string& file, const cli_options& options) {
	auto text = read_input(file);
	if(!text) {
		fmt::print(stderr, "deepgrep: {}: cannot read\n", file);
		return std::nullopt;
	}

	const std::string_view name = file == "-" ? "(standard input)" : std::string_view{file};
	std::size_t found = 0;

	auto range = grep.matches(compiled, *text);
	for(const auto& m: range) {
		++found;
		if(options.count_only) continue;
		if(options.only_matching) {
			fmt::print("{}\n", m.str());
		}else if(options.with_groups) {
			fmt::print("{}:{}: {:g}\n", name, m.line + 1, m);
		}else {
			fmt::print("{}:{}:{}: {}\n", name, m.line + 1, m.start(), m.str());
		}
	}
	if(range.status() == regex::error_category::resource_exceeded) {
		fmt::print(stderr, "deepgrep: {}: {}, {} start positions skipped\n", name, range.status(), range.abandoned());
	}
	if(options.count_only) fmt::print("{}:{}\n", name, found);
	return found;
}

} // namespace

int main(int argc, const char** argv) {
	std::vector<std::string> warnings;
	auto config = engine_config::from_environment(&warnings);
	for(const auto& w: warnings) fmt::print(stderr, "deepgrep: {}\n", w);

	cli_options options;
	if(!parse_arguments(argc, argv, options, config)) {
		usage();
		return exit_error;
	}
	if(options.files.empty()) options.files.emplace_back("-");

	regex::engine<char> grep{config};
	auto [error, compiled] = grep.compile(options.pattern);
	if(error) {
		fmt::print(stderr, "deepgrep: bad pattern: {}\n", error);
		fmt::print(stderr, "  {}\n  {:>{}}\n", options.pattern, '^', error.position + 1);
		return exit_error;
	}

	bool any_match = false, any_error = false;
	for(const auto& file: options.files) {
		auto found = grep_file(grep, compiled, file, options);
		if(!found) any_error = true;
		else if(*found > 0) any_match = true;
	}

	if(options.verbose) {
		const auto stats = grep.cache().stats();
		fmt::print(stderr, "cache: {} of {} entries, {} hits, {} misses, {} evictions\n",
			grep.cache().size(), grep.cache().capacity(), stats.hits, stats.misses, stats.evictions);
	}

	if(any_error) return exit_error;
	return any_match ? exit_matched : exit_no_match;
}
