#pragma once

#include <tuple>
#include <vector>
#include <cstddef>
#include <algorithm>
#include <optional>
#include <string_view>

#include "dgrep/vm.hpp"
#include "dgrep/error.hpp"
#include "dgrep/program.hpp"

namespace dgrep {

namespace regex {

namespace impl {

using std::size_t;
using std::tuple;
using std::vector;
using std::optional;
using std::basic_string_view;

// enumerates the non-overlapping matches of a program in a text from left to right
template <typename CharT>
struct match_iterator {

	using char_t = CharT;
	using string_view_t = basic_string_view<char_t>;
	using program_t = program<char_t>;
	using vm_t = backtracking_vm<char_t>;

	match_iterator(const program_t& prog, string_view_t text, size_t step_limit = vm_t::default_step_limit) noexcept:
		vm{prog, step_limit}, text{text} {}

	// the next match, nullopt once the text is exhausted;
	// a step_limit_exceeded error ends the enumeration
	tuple<error_info, optional<match_result>> next() {
		// start offsets run over [0, text.size()), an anchored pattern can only match at offset 0
		size_t last = vm.prog.anchored_at_begin() ? std::min<size_t>(1, text.size()) : text.size();
		while(!finished && pos < last) {
			auto [errc, result] = vm.try_match_at(text, pos);
			if(errc) {
				finished = true;
				return {errc, std::nullopt};
			}
			if(result) {
				// step over an empty match, or we would find it again
				pos = result->empty() ? result->end + 1 : result->end;
				return {errc, std::move(result)};
			}
			++pos;
		}
		finished = true;
		return {error_category::success, std::nullopt};
	}

	// restart from the beginning of the text
	match_iterator& reset() noexcept{
		pos = 0;
		finished = false;
		return *this;
	}

	// next offset to try
	size_t position() const noexcept{
		return pos;
	}

protected:
	vm_t vm;
	string_view_t text;
	size_t pos = 0;
	bool finished = false;
};

template <typename CharT>
tuple<error_info, vector<match_result>> find_all(const program<CharT>& prog, basic_string_view<CharT> text, size_t step_limit = backtracking_vm<CharT>::default_step_limit) {
	vector<match_result> results;
	match_iterator<CharT> it{prog, text, step_limit};
	while(true) {
		auto [errc, result] = it.next();
		if(errc) return {errc, {}};
		if(!result) break;
		results.push_back(std::move(*result));
	}
	return {error_category::success, std::move(results)};
}

} // namespace impl

} // namespace regex

} // namespace dgrep
