#pragma once

#include <cstddef>
#include <string_view>

namespace deepgrep {

namespace regex {

enum class error_category {
	success = 0,
	empty_operand,
	multiple_repeat,
	bad_escape,
	missing_paren,
	bad_bracket_expression,
	bad_brace_expression,
	bad_backreference,
	bad_group_name,
	nesting_too_deep,
	unsupported_features,

	// not a syntax error: raised by the matcher when the step budget runs out
	resource_exceeded
};


constexpr std::string_view error_message(error_category category) noexcept{
	switch(category) {
	case error_category::success:                return "successed";
	case error_category::empty_operand:          return "nothing to repeat";
	case error_category::multiple_repeat:        return "multiple repeat";
	case error_category::bad_escape:             return "bad escape";
	case error_category::missing_paren:          return "missing parentheses";
	case error_category::bad_bracket_expression: return "bad bracket expression";
	case error_category::bad_brace_expression:   return "bad brace expression";
	case error_category::bad_backreference:      return "backreference to undefined group";
	case error_category::bad_group_name:         return "bad group name";
	case error_category::nesting_too_deep:       return "groups are nested too deeply";
	case error_category::unsupported_features:   return "unsupported features";
	case error_category::resource_exceeded:      return "step budget exceeded";
	}
	return "";
}

constexpr bool is_syntax_error(error_category category) noexcept{
	return category != error_category::success && category != error_category::resource_exceeded;
}

// a malformed pattern, position is the index of the offending code unit
struct syntax_error {
	error_category category = error_category::success;
	std::size_t position = 0;

	constexpr explicit operator bool() const noexcept{
		return category != error_category::success;
	}

	constexpr std::string_view message() const noexcept{
		return error_message(category);
	}

	friend constexpr bool operator==(const syntax_error&, const syntax_error&) noexcept = default;
};

} // namespace regex

} // namespace deepgrep
