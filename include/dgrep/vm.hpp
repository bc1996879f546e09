#pragma once

/*
	Backtracking matcher.

	One attempt runs the program from instruction 0 at a given offset. Alternatives are kept
	on an explicit stack instead of the call stack:
		split      pushes the secondary branch and continues with the primary one,
		save       pushes the old register value so that it is restored on backtracking,
		a mismatch pops the stack until a branch to resume is found.
	the first thread reaching accept wins (leftmost-first, not leftmost-longest).

	every executed instruction and every resumed branch costs one step, an attempt that
	exceeds step_limit is aborted with error_category::step_limit_exceeded.
*/

#include <tuple>
#include <limits>
#include <vector>
#include <cstddef>
#include <optional>
#include <string_view>

#include "dgrep/error.hpp"
#include "dgrep/program.hpp"
#include "dgrep/assertion.hpp"
#include "dgrep/char_class.hpp"

namespace dgrep {

namespace regex {

namespace impl {

using std::size_t;
using std::tuple;
using std::vector;
using std::optional;
using std::basic_string_view;

// capture range: [begin, end), offsets into the subject text
struct capture_span {
	size_t begin, end;

	constexpr size_t size() const noexcept{
		return end - begin;
	}

	friend constexpr bool operator==(const capture_span&, const capture_span&) noexcept = default;
};

struct match_result {
	size_t begin, end;
	// groups[0] is the whole match, nullopt for a group that did not participate
	vector<optional<capture_span>> groups;

	constexpr bool empty() const noexcept{
		return begin == end;
	}

	template <typename CharT>
	basic_string_view<CharT> view(basic_string_view<CharT> text, size_t group_id = 0) const{
		const auto& g = groups[group_id];
		return g ? text.substr(g->begin, g->size()) : basic_string_view<CharT>{};
	}

	friend bool operator==(const match_result&, const match_result&) = default;
};

template <typename CharT>
struct backtracking_vm {

	using char_t = CharT;
	using string_view_t = basic_string_view<char_t>;
	using program_t = program<char_t>;

	static constexpr size_t unset = std::numeric_limits<size_t>::max();
	static constexpr size_t default_step_limit = 1'000'000;

	const program_t& prog;
	// 0 disables the limit
	size_t step_limit = default_step_limit;

	backtracking_vm(const program_t& prog, size_t step_limit = default_step_limit) noexcept:
		prog{prog}, step_limit{step_limit} {}

	// run the program once from start; with anchored_end the match must end at text.size()
	tuple<error_info, optional<match_result>> try_match_at(string_view_t text, size_t start, bool anchored_end = false) const{
		thread_state t{prog, start};
		vector<frame> stack;
		size_t steps = 0;

		auto out_of_steps = [&]() {
			return step_limit != 0 && ++steps > step_limit;
		};

		// restore registers and resume the most recent branch, false if nothing is left to try
		auto backtrack = [&]() {
			while(!stack.empty()) {
				auto f = stack.back();
				stack.pop_back();
				switch(f.kind) {
				case frame::resume:
					t.pc = f.index;
					t.offset = f.value;
					return true;
				case frame::restore_register:
					t.registers[f.index] = f.value;
					break;
				case frame::restore_open_mark:
					t.open_marks[f.index] = f.value;
					break;
				case frame::restore_loop_mark:
					t.loop_marks[f.index] = f.value;
					break;
				}
			}
			return false;
		};

		while(true) {
			if(out_of_steps()) return {error_category::step_limit_exceeded, std::nullopt};

			const auto& ins = prog[t.pc];
			bool failed = false;

			switch(ins.op) {
			case opcode::match_char:
				if(t.offset < text.size() && text[t.offset] == ins.data.single_char) {
					++t.offset;
					++t.pc;
				}else failed = true;
				break;
			case opcode::match_class:
				if(t.offset < text.size() && prog.classes[ins.data.class_id].accept(text[t.offset])) {
					++t.offset;
					++t.pc;
				}else failed = true;
				break;
			case opcode::match_any:
				if(t.offset < text.size() && !is_newline(text[t.offset])) {
					++t.offset;
					++t.pc;
				}else failed = true;
				break;
			case opcode::split:
				stack.push_back({frame::resume, ins.data.branch.secondary, t.offset});
				t.pc = ins.data.branch.primary;
				break;
			case opcode::jump:
				t.pc = ins.data.target;
				break;
			case opcode::save: {
				auto group_id = ins.data.slot / 2;
				if(ins.data.slot % 2 == 0) {
					// group opened, its capture changes only when it closes
					stack.push_back({frame::restore_open_mark, group_id, t.open_marks[group_id]});
					t.open_marks[group_id] = t.offset;
				}else {
					stack.push_back({frame::restore_register, 2 * group_id, t.registers[2 * group_id]});
					stack.push_back({frame::restore_register, 2 * group_id + 1, t.registers[2 * group_id + 1]});
					t.registers[2 * group_id] = t.open_marks[group_id];
					t.registers[2 * group_id + 1] = t.offset;
				}
				++t.pc;
				break;
			}
			case opcode::backreference: {
				auto begin = t.registers[2 * ins.data.group_id];
				auto end = t.registers[2 * ins.data.group_id + 1];
				// a group that has not closed yet never matches, not even as an empty string
				if(begin == unset || end == unset) {
					failed = true;
					break;
				}
				auto captured = text.substr(begin, end - begin);
				if(text.substr(t.offset, captured.size()) == captured) {
					t.offset += captured.size();
					++t.pc;
				}else failed = true;
				break;
			}
			case opcode::assertion:
				if(assertion_accept(ins.data.anchor, text, t.offset)) ++t.pc;
				else failed = true;
				break;
			case opcode::progress_mark:
				stack.push_back({frame::restore_loop_mark, ins.data.slot, t.loop_marks[ins.data.slot]});
				t.loop_marks[ins.data.slot] = t.offset;
				++t.pc;
				break;
			case opcode::progress_check:
				// an iteration that consumed nothing would loop forever
				if(t.offset == t.loop_marks[ins.data.slot]) failed = true;
				else ++t.pc;
				break;
			case opcode::accept:
				if(anchored_end && t.offset != text.size()) {
					failed = true;
					break;
				}
				return {error_category::success, t.result()};
			}

			if(failed) {
				if(!backtrack()) return {error_category::success, std::nullopt};
				// resuming a branch costs a step too
				if(out_of_steps()) return {error_category::step_limit_exceeded, std::nullopt};
			}
		}
	}

protected:

	// a saved alternative or an undo record
	struct frame {
		enum kind_category: unsigned char {
			resume,            // continue at pc = index, offset = value
			restore_register,  // registers[index] = value
			restore_open_mark, // open_marks[index] = value
			restore_loop_mark  // loop_marks[index] = value
		} kind;
		size_t index;
		size_t value;
	};

	struct thread_state {
		size_t pc = 0;
		size_t offset;
		vector<size_t> registers;
		vector<size_t> open_marks;
		vector<size_t> loop_marks;

		thread_state(const program_t& prog, size_t start):
			offset{start},
			registers(prog.register_count(), unset),
			open_marks(prog.group_count + 1, unset),
			loop_marks(prog.loop_count, unset) {}

		match_result result() const{
			match_result res{registers[0], registers[1], {}};
			res.groups.reserve(registers.size() / 2);
			for(size_t i = 0; i < registers.size(); i += 2) {
				if(registers[i] != unset && registers[i + 1] != unset)
					res.groups.push_back(capture_span{registers[i], registers[i + 1]});
				else
					res.groups.push_back(std::nullopt);
			}
			return res;
		}
	};

}; // struct backtracking_vm

} // namespace impl

using impl::capture_span;
using impl::match_result;

} // namespace regex

} // namespace dgrep
