#pragma once

#include <cstddef>
#include <string_view>

#include "dgrep/char_class.hpp"

namespace dgrep {

namespace regex {

namespace impl {

// zero-width assertions
enum class anchor_kind: unsigned char {
	text_begin,        // ^
	text_end,          // $
	word_boundary,     // \b
	non_word_boundary  // \B
};

// pos is an offset into text, pos == text.size() is the end of text
template <typename CharT>
constexpr bool assertion_accept(anchor_kind kind, std::basic_string_view<CharT> text, std::size_t pos) noexcept{
	switch(kind) {
	case anchor_kind::text_begin:
		return pos == 0;
	case anchor_kind::text_end:
		return pos == text.size();
	case anchor_kind::word_boundary:
	case anchor_kind::non_word_boundary: {
		bool before = pos > 0 && is_word(text[pos - 1]);
		bool after  = pos < text.size() && is_word(text[pos]);
		return (before != after) == (kind == anchor_kind::word_boundary);
	}
	}
	return false;
}

} // namespace impl

} // namespace regex

} // namespace dgrep
