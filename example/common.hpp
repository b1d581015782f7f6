#pragma once

// some common utils for the interactive examples

#include <string>
#include <vector>
#include <iostream>
#include <string_view>

#include "fmt/core.h"
#include "fmt/format.h"
#include "fmt/ranges.h"

#include "deepgrep/regular_expression.hpp"
#include "deepgrep/regex/format.hpp"

inline bool read_line(std::string_view prompt, std::string& line) {
	fmt::print("{}\n", prompt);
	return static_cast<bool>(std::getline(std::cin, line));
}

// "a"[0,1) {1: "a"}, "b"[3,4) {1: -}
inline void print_matches(const std::vector<deepgrep::regex::match>& matches) {
	fmt::print("{:g}\n", fmt::join(matches, ", "));
}

inline void print_status(deepgrep::regex::error_category status) {
	if(status != deepgrep::regex::error_category::success) fmt::print("warning: {}\n", status);
}
