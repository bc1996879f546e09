#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "fmt/core.h"

namespace dgrep {

namespace regex {

enum class error_category {
	success = 0,

	// pattern syntax errors
	empty_pattern,
	empty_operand,
	nothing_to_repeat,
	bad_escape,
	missing_paren,
	bad_bracket_expression,
	bad_brace_expression,
	bad_backreference,
	expensive_brace_expression_unroll,
	unsupported_features,
	nesting_too_deep,

	// runtime errors
	step_limit_exceeded
};

enum class error_kind {
	none = 0,
	pattern_syntax,
	match_timeout
};

constexpr std::string_view error_message(error_category category) noexcept{
	switch(category) {
	case error_category::success:                return "successed";
	case error_category::empty_pattern:          return "empty pattern";
	case error_category::empty_operand:          return "empty operand";
	case error_category::nothing_to_repeat:      return "nothing to repeat";
	case error_category::bad_escape:             return "bad escape";
	case error_category::missing_paren:          return "missing parentheses";
	case error_category::bad_bracket_expression: return "bad bracket expression";
	case error_category::bad_brace_expression:   return "bad brace expression";
	case error_category::bad_backreference:      return "backreference to an undefined group";
	case error_category::expensive_brace_expression_unroll: return "brace expression is too complex to unroll";
	case error_category::unsupported_features:   return "unsupported features";
	case error_category::nesting_too_deep:       return "groups nested too deeply";
	case error_category::step_limit_exceeded:    return "match step limit exceeded";
	}
	return "";
}

constexpr error_kind kind_of(error_category category) noexcept{
	switch(category) {
	case error_category::success:             return error_kind::none;
	case error_category::step_limit_exceeded: return error_kind::match_timeout;
	default:                                  return error_kind::pattern_syntax;
	}
}

constexpr std::string_view kind_name(error_kind kind) noexcept{
	switch(kind) {
	case error_kind::none:           return "none";
	case error_kind::pattern_syntax: return "PatternSyntaxError";
	case error_kind::match_timeout:  return "MatchTimeout";
	}
	return "";
}

// error value returned next to every result, position is an offset into the pattern
// and is only meaningful for pattern syntax errors
struct error_info {
	error_category category = error_category::success;
	std::size_t position = 0;

	constexpr error_info() noexcept = default;
	constexpr error_info(error_category category, std::size_t position = 0) noexcept:
		category{category}, position{position} {}

	constexpr bool ok() const noexcept{
		return category == error_category::success;
	}

	constexpr explicit operator bool() const noexcept{
		return !ok();
	}

	constexpr error_kind kind() const noexcept{
		return kind_of(category);
	}

	std::string message() const{
		switch(kind()) {
		case error_kind::pattern_syntax:
			return fmt::format("{} at position {}", error_message(category), position);
		default:
			return std::string{error_message(category)};
		}
	}

	friend constexpr bool operator==(const error_info&, const error_info&) noexcept = default;
};

} // namespace regex

} // namespace dgrep
