#pragma once

/*
	Lowering of the syntax tree into a linear program.

		R1 R2         : code(R1) code(R2)
		R1 | R2       : split L1, L2
		                L1: code(R1)
		                    jump L3
		                L2: code(R2)
		                L3:
		(R)           : save 2n, code(R), save 2n + 1
		R*            : L1: split L2, L3      (lazy: split L3, L2)
		                L2: code(R)
		                    jump L1
		                L3:
		R+            : L1: code(R)
		                    split L1, L2      (lazy: split L2, L1)
		                L2:
		R{m}          : code(R) repeated m times
		R{m,}         : R{m - 1} R+
		R{m,n}        : R{m} followed by n - m nested optionals:
		                    split L1, L3
		                L1: code(R)
		                    split L2, L3
		                L2: code(R)
		                L3:

	loops whose body can match the empty string are guarded by progress_mark/progress_check,
	an iteration that does not consume input is abandoned instead of looping forever.

	counted repetitions are unrolled, which is fine as long as the unrolled program is small:
		ψ(c), ψ([...]), ψ(.), ψ(\n), ψ(^) = 1
		ψ(R1 R2)      = ψ(R1) + ψ(R2)
		ψ(R1 | R2)    = ψ(R1) + ψ(R2) + 2
		ψ((R))        = ψ(R) + 2
		ψ(R{m,})      = max(m, 1)ψ(R) + 2
		ψ(R{m,n})     = mψ(R) + (n - m)(ψ(R) + 1)
	a counted repetition with ψ(R) > max_unroll_complexity is rejected.
*/

#include <tuple>
#include <vector>
#include <limits>
#include <cstddef>
#include <utility>
#include <variant>
#include <optional>
#include <algorithm>
#include <string_view>

#include "dgrep/ast.hpp"
#include "dgrep/error.hpp"
#include "dgrep/parser.hpp"
#include "dgrep/program.hpp"

namespace dgrep {

namespace regex {

namespace impl {

using std::size_t;
using std::tuple;
using std::vector;
using std::optional;
using std::basic_string_view;

template <typename CharT>
struct pattern_compiler {

	using char_t = CharT;
	using node_t = ast::node<char_t>;
	using program_t = program<char_t>;
	using instruction_t = instruction<char_t>;
	using pattern_view_t = basic_string_view<char_t>;

	// indicate a sub program's complexity
	using complexity_t = size_t;

	static constexpr complexity_t default_unroll_complexity = 2000;
	complexity_t max_unroll_complexity = default_unroll_complexity;

	constexpr pattern_compiler() = default;
	constexpr pattern_compiler(complexity_t max_unroll_complexity) noexcept:
		max_unroll_complexity{max_unroll_complexity} {}

	// parse and lower a pattern, the program is empty on failure
	tuple<error_info, program_t> compile(pattern_view_t pattern) {
		pattern_parser<char_t> parser{pattern};
		auto [errc, root] = parser.parse();
		syntax_tree = std::move(root);
		if(errc) return {errc, program_t{}};
		return lower(*syntax_tree, parser.group_count());
	}

	// lower an already parsed tree, group_count is the number of capturing groups in it
	tuple<error_info, program_t> lower(const node_t& root, size_t group_count) {
		result = program_t{};
		failure = {};
		result.group_count = group_count;

		emit(instruction_t::make_save(0));
		if(!emit_node(root)) return {failure, program_t{}};
		emit(instruction_t::make_save(1));
		emit(instruction_t::make_accept());

		return {failure, std::move(result)};
	}

	// the tree built by the last compile(), kept for dumping
	const optional<node_t>& ast() const noexcept{
		return syntax_tree;
	}

protected:

	optional<node_t> syntax_tree;
	program_t result;
	error_info failure;

	size_t here() const noexcept{
		return result.instructions.size();
	}

	size_t emit(const instruction_t& i) {
		result.instructions.push_back(i);
		return here() - 1;
	}

	void patch_target(size_t pc, size_t target) noexcept{
		auto& i = result.instructions[pc];
		switch(i.op) {
		case opcode::jump:
			i.data.target = target;
			break;
		case opcode::split:
			// the unresolved branch is the exit: secondary for greedy splits, primary for lazy ones
			if(i.data.branch.primary == unresolved) i.data.branch.primary = target;
			else i.data.branch.secondary = target;
			break;
		default:
			break;
		}
	}

	static constexpr size_t unresolved = std::numeric_limits<size_t>::max();

	static complexity_t measure(const node_t& n) {
		return std::visit(ast::overloaded{
			[](const ast::literal<char_t>&)  -> complexity_t { return 1; },
			[](const ast::char_set<char_t>&) -> complexity_t { return 1; },
			[](const ast::any_char&)         -> complexity_t { return 1; },
			[](const ast::backreference&)    -> complexity_t { return 1; },
			[](const ast::anchor&)           -> complexity_t { return 1; },
			[](const ast::concat<char_t>& c) -> complexity_t {
				complexity_t sum = 0;
				for(const auto& i: c.items) sum += measure(i);
				return sum;
			},
			[](const ast::alternation<char_t>& a) -> complexity_t {
				complexity_t sum = 0;
				for(const auto& i: a.alternatives) sum += measure(i) + 2;
				return sum - 2;
			},
			[](const ast::group<char_t>& g) -> complexity_t {
				return measure(*g.child) + (g.index ? 2 : 0);
			},
			[](const ast::repetition<char_t>& r) -> complexity_t {
				return measure(r, measure(*r.child));
			}
		}, n.value);
	}

	bool emit_node(const node_t& n) {
		return std::visit(ast::overloaded{
			[this](const ast::literal<char_t>& l) {
				emit(instruction_t::make_char(l.value));
				return true;
			},
			[this](const ast::char_set<char_t>& s) {
				result.classes.push_back(s.value);
				emit(instruction_t::make_class(result.classes.size() - 1));
				return true;
			},
			[this](const ast::any_char&) {
				emit(instruction_t::make_any());
				return true;
			},
			[this](const ast::concat<char_t>& c) {
				for(const auto& i: c.items) if(!emit_node(i)) return false;
				return true;
			},
			[this](const ast::alternation<char_t>& a) {
				return emit_alternation(a);
			},
			[this, &n](const ast::repetition<char_t>& r) {
				return emit_repetition(r, n.position);
			},
			[this](const ast::group<char_t>& g) {
				if(!g.index) return emit_node(*g.child);
				emit(instruction_t::make_save(2 * *g.index));
				if(!emit_node(*g.child)) return false;
				emit(instruction_t::make_save(2 * *g.index + 1));
				return true;
			},
			[this](const ast::backreference& b) {
				emit(instruction_t::make_backreference(b.index));
				return true;
			},
			[this](const ast::anchor& a) {
				emit(instruction_t::make_assertion(a.kind));
				return true;
			}
		}, n.value);
	}

	bool emit_alternation(const ast::alternation<char_t>& a) {
		vector<size_t> exits;
		for(size_t i = 0; i + 1 < a.alternatives.size(); ++i) {
			auto split = emit(instruction_t::make_split(here() + 1, unresolved));
			if(!emit_node(a.alternatives[i])) return false;
			exits.push_back(emit(instruction_t::make_jump(unresolved)));
			patch_target(split, here());
		}
		if(!emit_node(a.alternatives.back())) return false;
		for(auto pc: exits) patch_target(pc, here());
		return true;
	}

	// split whose body starts at the next instruction and whose exit is patched later
	size_t emit_loop_split(bool greedy) {
		return emit(greedy ?
			instruction_t::make_split(here() + 1, unresolved) :
			instruction_t::make_split(unresolved, here() + 1));
	}

	bool emit_repetition(const ast::repetition<char_t>& r, size_t position) {
		const auto& child = *r.child;

		bool counted = r.min > 1 || (r.max != ast::unbounded && r.max > 1);
		if(counted) {
			auto c = measure(child);
			if(c > max_unroll_complexity || measure(r, c) > max_unroll_complexity) {
				failure = {error_category::expensive_brace_expression_unroll, position};
				return false;
			}
		}

		if(r.max == ast::unbounded) {
			bool guarded = ast::can_be_empty(child);
			size_t loop = guarded ? result.loop_count++ : 0;

			if(r.min == 0) {
				// R*
				auto split = emit_loop_split(r.greedy);
				if(guarded) emit(instruction_t::make_progress_mark(loop));
				if(!emit_node(child)) return false;
				if(guarded) emit(instruction_t::make_progress_check(loop));
				emit(instruction_t::make_jump(split));
				patch_target(split, here());
				return true;
			}

			// R{m,}: the last mandatory copy is the loop body, so R+ emits R only once
			for(size_t i = 1; i < r.min; ++i) if(!emit_node(child)) return false;
			auto body = here();
			if(guarded) emit(instruction_t::make_progress_mark(loop));
			if(!emit_node(child)) return false;
			if(!guarded) {
				emit(r.greedy ?
					instruction_t::make_split(body, here() + 1) :
					instruction_t::make_split(here() + 1, body));
				return true;
			}
			// another iteration only after this one consumed something
			emit(r.greedy ?
				instruction_t::make_split(here() + 1, here() + 3) :
				instruction_t::make_split(here() + 3, here() + 1));
			emit(instruction_t::make_progress_check(loop));
			emit(instruction_t::make_jump(body));
			return true;
		}

		// R{m}
		for(size_t i = 0; i < r.min; ++i) if(!emit_node(child)) return false;

		// (R(R(R)?)?)?
		vector<size_t> exits;
		for(size_t i = r.min; i < r.max; ++i) {
			exits.push_back(emit_loop_split(r.greedy));
			if(!emit_node(child)) return false;
		}
		for(auto pc: exits) patch_target(pc, here());
		return true;
	}

	// ψ of a repetition whose child measures c
	static constexpr complexity_t measure(const ast::repetition<char_t>& r, complexity_t c) noexcept{
		if(r.max == ast::unbounded) return (r.min == 0 ? c : r.min * c) + 2;
		return r.min * c + (r.max - r.min) * (c + 1);
	}

}; // struct pattern_compiler

} // namespace impl

template <typename CharT>
using program = impl::program<CharT>;

} // namespace regex

} // namespace dgrep
