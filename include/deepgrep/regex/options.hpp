#pragma once

#include <cstddef>

namespace deepgrep {

namespace regex {

// what match offsets are relative to
enum class offset_mode {
	absolute,     // offsets into the whole searched text
	line_relative // offsets into the line the match was found on
};

// what a scan does when one attempt runs out of steps
enum class exceeded_policy {
	skip_position, // give up on this start position and keep scanning
	abort          // stop scanning and return what was found so far
};

struct find_options {
	static constexpr std::size_t default_step_budget = 1'000'000;

	// steps allowed for a single match attempt
	std::size_t step_budget = default_step_budget;
	offset_mode offsets = offset_mode::absolute;
	exceeded_policy on_exceeded = exceeded_policy::skip_position;
};

} // namespace regex

} // namespace deepgrep
