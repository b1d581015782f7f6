#include "deepgrep/config.hpp"

#include <cstdlib>
#include <charconv>
#include <system_error>

#include "fmt/core.h"

namespace deepgrep {

namespace {

// reads name through lookup and hands a present value to apply,
// apply returns false when the value is unusable
template <typename ApplyT>
void read_variable(const engine_config::env_lookup& lookup, const char* name, std::vector<std::string>* warnings, ApplyT&& apply) {
	const char* value = lookup(name);
	if(value == nullptr) return;
	if(!apply(std::string_view{value}) && warnings != nullptr) {
		warnings->push_back(fmt::format("ignoring {}=\"{}\": malformed value", name, value));
	}
}

} // namespace

std::optional<std::size_t> parse_size(std::string_view text) noexcept{
	std::size_t value = 0;
	auto [end, errc] = std::from_chars(text.data(), text.data() + text.size(), value);
	if(errc != std::errc{} || end != text.data() + text.size() || text.empty()) return std::nullopt;
	return value;
}

std::optional<regex::offset_mode> parse_offset_mode(std::string_view text) noexcept{
	if(text == "absolute") return regex::offset_mode::absolute;
	if(text == "line" || text == "line_relative") return regex::offset_mode::line_relative;
	return std::nullopt;
}

std::optional<regex::exceeded_policy> parse_exceeded_policy(std::string_view text) noexcept{
	if(text == "skip" || text == "skip_position") return regex::exceeded_policy::skip_position;
	if(text == "abort") return regex::exceeded_policy::abort;
	return std::nullopt;
}

engine_config engine_config::from_environment(const env_lookup& lookup, std::vector<std::string>* warnings) {
	engine_config config;

	read_variable(lookup, "DEEPGREP_CACHE_CAPACITY", warnings, [&](std::string_view v) {
		auto n = parse_size(v);
		if(n) config.cache_capacity = *n;
		return n.has_value();
	});
	read_variable(lookup, "DEEPGREP_STEP_BUDGET", warnings, [&](std::string_view v) {
		auto n = parse_size(v);
		if(!n || *n == 0) return false;
		config.find.step_budget = *n;
		return true;
	});
	read_variable(lookup, "DEEPGREP_OFFSETS", warnings, [&](std::string_view v) {
		auto mode = parse_offset_mode(v);
		if(mode) config.find.offsets = *mode;
		return mode.has_value();
	});
	read_variable(lookup, "DEEPGREP_ON_EXCEEDED", warnings, [&](std::string_view v) {
		auto policy = parse_exceeded_policy(v);
		if(policy) config.find.on_exceeded = *policy;
		return policy.has_value();
	});

	return config;
}

engine_config engine_config::from_environment(std::vector<std::string>* warnings) {
	return from_environment([](const char* name) -> const char* { return std::getenv(name); }, warnings);
}

} // namespace deepgrep
