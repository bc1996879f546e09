#pragma once

// fmt formatters for dumping patterns: syntax trees, instructions and whole programs

#include <string>
#include <variant>
#include <iterator>

#include "fmt/core.h"
#include "fmt/format.h"

#include "dgrep/ast.hpp"
#include "dgrep/error.hpp"
#include "dgrep/program.hpp"
#include "dgrep/assertion.hpp"
#include "dgrep/char_class.hpp"

namespace dgrep {

namespace regex {

namespace impl {

inline std::string describe_char(char c) {
	switch(c) {
	case '\f': return "\\f";
	case '\n': return "\\n";
	case '\r': return "\\r";
	case '\t': return "\\t";
	case '\v': return "\\v";
	case '\0': return "\\0";
	case '\\': return "\\\\";
	}
	auto u = static_cast<unsigned char>(c);
	if(u < 0x20 || u >= 0x7f) return fmt::format("\\x{:02x}", u);
	return std::string(1, c);
}

constexpr std::string_view anchor_symbol(anchor_kind kind) noexcept{
	switch(kind) {
	case anchor_kind::text_begin:        return "^";
	case anchor_kind::text_end:          return "$";
	case anchor_kind::word_boundary:     return "\\b";
	case anchor_kind::non_word_boundary: return "\\B";
	}
	return "";
}

// "" for an unbounded count
inline std::string describe_count(std::size_t n) {
	return n == ast::unbounded ? std::string{} : fmt::format("{}", n);
}

} // namespace impl

} // namespace regex

} // namespace dgrep

template <>
struct fmt::formatter<dgrep::regex::error_info>: fmt::formatter<std::string_view> {
	auto format(const dgrep::regex::error_info& e, fmt::format_context& ctx) const -> decltype(ctx.out()) {
		return fmt::format_to(ctx.out(), "{}: {}", dgrep::regex::kind_name(e.kind()), e.message());
	}
};

// [a-z_], [^0-9]
template <>
struct fmt::formatter<dgrep::regex::impl::char_class<char>> {
	constexpr auto parse(fmt::format_parse_context& ctx) -> decltype(ctx.begin()) {
		return ctx.begin();
	}

	auto format(const dgrep::regex::impl::char_class<char>& c, fmt::format_context& ctx) const -> decltype(ctx.out()) {
		using dgrep::regex::impl::describe_char;
		auto out = fmt::format_to(ctx.out(), "[{}", c.negated ? "^" : "");
		for(const auto& r: c.ranges) {
			if(r.from == r.to) out = fmt::format_to(out, "{}", describe_char(r.from));
			else out = fmt::format_to(out, "{}-{}", describe_char(r.from), describe_char(r.to));
		}
		return fmt::format_to(out, "]");
	}
};

// (concat (char 'a') (repeat 0, greedy (group 1 (class [0-9]))))
template <>
struct fmt::formatter<dgrep::regex::impl::ast::node<char>> {
	constexpr auto parse(fmt::format_parse_context& ctx) -> decltype(ctx.begin()) {
		return ctx.begin();
	}

	auto format(const dgrep::regex::impl::ast::node<char>& n, fmt::format_context& ctx) const -> decltype(ctx.out()) {
		namespace ast = dgrep::regex::impl::ast;
		using dgrep::regex::impl::describe_char;
		using dgrep::regex::impl::anchor_symbol;
		using dgrep::regex::impl::describe_count;

		auto out = ctx.out();
		std::visit(ast::overloaded{
			[&](const ast::literal<char>& l) {
				out = fmt::format_to(out, "(char '{}')", describe_char(l.value));
			},
			[&](const ast::char_set<char>& s) {
				out = fmt::format_to(out, "(class {})", s.value);
			},
			[&](const ast::any_char&) {
				out = fmt::format_to(out, "(any)");
			},
			[&](const ast::concat<char>& c) {
				out = fmt::format_to(out, "(concat");
				for(const auto& i: c.items) out = fmt::format_to(out, " {}", i);
				out = fmt::format_to(out, ")");
			},
			[&](const ast::alternation<char>& a) {
				out = fmt::format_to(out, "(alter");
				for(const auto& i: a.alternatives) out = fmt::format_to(out, " {}", i);
				out = fmt::format_to(out, ")");
			},
			[&](const ast::repetition<char>& r) {
				out = fmt::format_to(out, "(repeat {},{} {} {})",
					r.min, describe_count(r.max), r.greedy ? "greedy" : "lazy", *r.child);
			},
			[&](const ast::group<char>& g) {
				if(g.index) out = fmt::format_to(out, "(group {} {})", *g.index, *g.child);
				else out = fmt::format_to(out, "(group {})", *g.child);
			},
			[&](const ast::backreference& b) {
				out = fmt::format_to(out, "(backref {})", b.index);
			},
			[&](const ast::anchor& a) {
				out = fmt::format_to(out, "(assert {})", anchor_symbol(a.kind));
			}
		}, n.value);
		return out;
	}
};

template <>
struct fmt::formatter<dgrep::regex::impl::instruction<char>> {
	constexpr auto parse(fmt::format_parse_context& ctx) -> decltype(ctx.begin()) {
		return ctx.begin();
	}

	auto format(const dgrep::regex::impl::instruction<char>& i, fmt::format_context& ctx) const -> decltype(ctx.out()) {
		using dgrep::regex::impl::opcode;
		using dgrep::regex::impl::describe_char;
		using dgrep::regex::impl::anchor_symbol;

		switch(i.op) {
		case opcode::match_char:     return fmt::format_to(ctx.out(), "char '{}'", describe_char(i.data.single_char));
		case opcode::match_class:    return fmt::format_to(ctx.out(), "class #{}", i.data.class_id);
		case opcode::match_any:      return fmt::format_to(ctx.out(), "any");
		case opcode::split:          return fmt::format_to(ctx.out(), "split {}, {}", i.data.branch.primary, i.data.branch.secondary);
		case opcode::jump:           return fmt::format_to(ctx.out(), "jump {}", i.data.target);
		case opcode::save:           return fmt::format_to(ctx.out(), "save {}", i.data.slot);
		case opcode::backreference:  return fmt::format_to(ctx.out(), "backref {}", i.data.group_id);
		case opcode::assertion:      return fmt::format_to(ctx.out(), "assert {}", anchor_symbol(i.data.anchor));
		case opcode::progress_mark:  return fmt::format_to(ctx.out(), "mark {}", i.data.slot);
		case opcode::progress_check: return fmt::format_to(ctx.out(), "check {}", i.data.slot);
		case opcode::accept:         return fmt::format_to(ctx.out(), "accept");
		}
		return ctx.out();
	}
};

// one instruction per line, classes are expanded
template <>
struct fmt::formatter<dgrep::regex::impl::program<char>> {
	constexpr auto parse(fmt::format_parse_context& ctx) -> decltype(ctx.begin()) {
		return ctx.begin();
	}

	auto format(const dgrep::regex::impl::program<char>& p, fmt::format_context& ctx) const -> decltype(ctx.out()) {
		using dgrep::regex::impl::opcode;

		auto out = fmt::format_to(ctx.out(), "; groups: {}, loops: {}\n", p.group_count, p.loop_count);
		for(std::size_t pc = 0; pc < p.size(); ++pc) {
			const auto& i = p[pc];
			out = fmt::format_to(out, "{:>4}  {}", pc, i);
			if(i.op == opcode::match_class) out = fmt::format_to(out, " {}", p.classes[i.data.class_id]);
			out = fmt::format_to(out, "\n");
		}
		return out;
	}
};
