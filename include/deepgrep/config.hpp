#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <optional>
#include <functional>
#include <string_view>

#include "deepgrep/regex/options.hpp"

namespace deepgrep {

// everything the surrounding application may tune
struct engine_config {
	static constexpr std::size_t default_cache_capacity = 128;

	// compiled patterns kept by the cache, 0 disables caching
	std::size_t cache_capacity = default_cache_capacity;
	regex::find_options find;

	// returns the value of an environment variable or nullptr
	using env_lookup = std::function<const char*(const char*)>;

	/*
		DEEPGREP_CACHE_CAPACITY  unsigned integer
		DEEPGREP_STEP_BUDGET     unsigned integer, greater than 0
		DEEPGREP_OFFSETS         absolute | line
		DEEPGREP_ON_EXCEEDED     skip | abort

		unset variables keep their defaults, so do malformed ones, which are
		described in warnings when it is given.
	*/
	static engine_config from_environment(const env_lookup& lookup, std::vector<std::string>* warnings = nullptr);
	static engine_config from_environment(std::vector<std::string>* warnings = nullptr);
};

std::optional<std::size_t> parse_size(std::string_view text) noexcept;
std::optional<regex::offset_mode> parse_offset_mode(std::string_view text) noexcept;
std::optional<regex::exceeded_policy> parse_exceeded_policy(std::string_view text) noexcept;

} // namespace deepgrep
