#pragma once

#include <vector>
#include <cstddef>

#include "dgrep/assertion.hpp"
#include "dgrep/char_class.hpp"

namespace dgrep {

namespace regex {

namespace impl {

using std::size_t;
using std::vector;

enum class opcode: unsigned char {
	match_char,      // consume one char equal to data.single_char
	match_class,     // consume one char accepted by classes[data.class_id]
	match_any,       // consume one char except newlines
	split,           // continue at data.branch.primary, backtrack to data.branch.secondary
	jump,            // continue at data.target
	save,            // even slot 2g opens group g, odd slot 2g + 1 closes it and commits its capture
	backreference,   // consume the text captured by group data.group_id
	assertion,       // zero-width check of data.anchor
	progress_mark,   // loop_marks[data.slot] = current offset
	progress_check,  // fail unless the current offset moved past loop_marks[data.slot]
	accept           // the whole pattern matched
};

template <typename CharT>
struct program;

template <typename CharT>
struct instruction {
	using char_t = CharT;

	opcode op;

	struct branch_info {
		size_t primary;   // tried first
		size_t secondary; // tried on backtracking
	};

	union instruction_data {
		// active when op == match_char
		char_t single_char;
		// active when op == match_class
		size_t class_id;
		// active when op == split
		branch_info branch;
		// active when op == jump
		size_t target;
		// active when op == save, progress_mark or progress_check
		size_t slot;
		// active when op == backreference
		size_t group_id;
		// active when op == assertion
		anchor_kind anchor;

		constexpr instruction_data(): target{0} {}
	} data;

	static constexpr instruction make_char(char_t c) noexcept{
		instruction i{opcode::match_char};
		i.data.single_char = c;
		return i;
	}

	static constexpr instruction make_class(size_t class_id) noexcept{
		instruction i{opcode::match_class};
		i.data.class_id = class_id;
		return i;
	}

	static constexpr instruction make_any() noexcept{
		return {opcode::match_any};
	}

	static constexpr instruction make_split(size_t primary, size_t secondary) noexcept{
		instruction i{opcode::split};
		i.data.branch = {primary, secondary};
		return i;
	}

	static constexpr instruction make_jump(size_t target) noexcept{
		instruction i{opcode::jump};
		i.data.target = target;
		return i;
	}

	static constexpr instruction make_save(size_t slot) noexcept{
		instruction i{opcode::save};
		i.data.slot = slot;
		return i;
	}

	static constexpr instruction make_backreference(size_t group_id) noexcept{
		instruction i{opcode::backreference};
		i.data.group_id = group_id;
		return i;
	}

	static constexpr instruction make_assertion(anchor_kind kind) noexcept{
		instruction i{opcode::assertion};
		i.data.anchor = kind;
		return i;
	}

	static constexpr instruction make_progress_mark(size_t slot) noexcept{
		instruction i{opcode::progress_mark};
		i.data.slot = slot;
		return i;
	}

	static constexpr instruction make_progress_check(size_t slot) noexcept{
		instruction i{opcode::progress_check};
		i.data.slot = slot;
		return i;
	}

	static constexpr instruction make_accept() noexcept{
		return {opcode::accept};
	}

	friend constexpr bool operator==(const instruction& l, const instruction& r) noexcept{
		if(l.op != r.op) return false;
		switch(l.op) {
		case opcode::match_char:     return l.data.single_char == r.data.single_char;
		case opcode::match_class:    return l.data.class_id == r.data.class_id;
		case opcode::split:          return l.data.branch.primary == r.data.branch.primary && l.data.branch.secondary == r.data.branch.secondary;
		case opcode::jump:           return l.data.target == r.data.target;
		case opcode::save:
		case opcode::progress_mark:
		case opcode::progress_check: return l.data.slot == r.data.slot;
		case opcode::backreference:  return l.data.group_id == r.data.group_id;
		case opcode::assertion:      return l.data.anchor == r.data.anchor;
		case opcode::match_any:
		case opcode::accept:         return true;
		}
		return false;
	}
};

template <typename CharT>
struct pattern_compiler;

// output of pattern_compiler, immutable and shareable among matching threads
template <typename CharT>
struct program {
	using char_t = CharT;
	using instruction_t = instruction<char_t>;
	using class_t = char_class<char_t>;

	vector<instruction_t> instructions;
	vector<class_t> classes;

	// capturing groups, not counting the whole match
	size_t group_count = 0;
	// registers used by progress_mark and progress_check
	size_t loop_count = 0;

	friend pattern_compiler<char_t>;

	// group g occupies registers 2g (begin) and 2g + 1 (end), group 0 is the whole match
	size_t register_count() const noexcept{
		return 2 * (group_count + 1);
	}

	size_t size() const noexcept{
		return instructions.size();
	}

	// whether every match has to start at offset 0, i.e. the pattern begins with ^
	bool anchored_at_begin() const noexcept{
		// instructions[0] is always save 0
		return instructions.size() > 1 &&
			instructions[1].op == opcode::assertion &&
			instructions[1].data.anchor == anchor_kind::text_begin;
	}

	const instruction_t& operator[](size_t pc) const{
		return instructions[pc];
	}

	friend bool operator==(const program&, const program&) = default;

protected:

	// built by pattern_compiler
	program() = default;
};

} // namespace impl

} // namespace regex

} // namespace dgrep
