#pragma once

/*
	Pattern abstract syntax tree.

	A closed sum type, every consumer visits all of the alternatives:
		literal        c
		char_set       [...], [^...], \d, \w, \s ...
		any_char       .
		concat         R1 R2 ... Rn
		alternation    R1 | R2 | ... | Rn   (tried from left to right)
		repetition     R*, R+, R?, R{m}, R{m,}, R{m,n} and their lazy forms
		group          (R), (?:R)
		backreference  \n
		anchor         ^, $, \b, \B
*/

#include <limits>
#include <memory>
#include <vector>
#include <cstddef>
#include <utility>
#include <variant>
#include <concepts>
#include <type_traits>
#include <optional>
#include <algorithm>

#include "dgrep/assertion.hpp"
#include "dgrep/char_class.hpp"

namespace dgrep {

namespace regex {

namespace impl {

namespace ast {

using std::size_t;
using std::vector;
using std::variant;
using std::optional;
using std::unique_ptr;

inline constexpr size_t unbounded = std::numeric_limits<size_t>::max();

template <typename CharT>
struct node;

template <typename CharT>
using node_ptr = unique_ptr<node<CharT>>;

template <typename CharT>
struct literal {
	CharT value;
};

template <typename CharT>
struct char_set {
	char_class<CharT> value;
};

struct any_char {};

template <typename CharT>
struct concat {
	vector<node<CharT>> items;
};

template <typename CharT>
struct alternation {
	vector<node<CharT>> alternatives;
};

template <typename CharT>
struct repetition {
	node_ptr<CharT> child;
	size_t min;
	size_t max; // unbounded for {m,}
	bool greedy;
};

template <typename CharT>
struct group {
	node_ptr<CharT> child;
	optional<size_t> index; // nullopt for non-capturing group
};

struct backreference {
	size_t index;
};

struct anchor {
	anchor_kind kind;
};

template <typename CharT>
struct node {
	using char_t = CharT;
	using value_t = variant<
		literal<char_t>,
		char_set<char_t>,
		any_char,
		concat<char_t>,
		alternation<char_t>,
		repetition<char_t>,
		group<char_t>,
		backreference,
		anchor
	>;

	value_t value;
	// offset of the construct in the source pattern
	size_t position = 0;

	template <typename T>
	requires (!std::same_as<std::remove_cvref_t<T>, node>)
	node(T&& v, size_t position = 0): value{std::forward<T>(v)}, position{position} {}

	template <typename T>
	bool is() const noexcept{
		return std::holds_alternative<T>(value);
	}

	template <typename T>
	const T& as() const{
		return std::get<T>(value);
	}
};

template <class... Fs>
struct overloaded: Fs... { using Fs::operator()...; };
template <class... Fs>
overloaded(Fs...) -> overloaded<Fs...>;

// whether the sub-pattern may match without consuming input
template <typename CharT>
bool can_be_empty(const node<CharT>& n) {
	return std::visit(overloaded{
		[](const literal<CharT>&)     { return false; },
		[](const char_set<CharT>&)    { return false; },
		[](const any_char&)           { return false; },
		[](const concat<CharT>& c) {
			return std::all_of(c.items.cbegin(), c.items.cend(), [](const auto& i) { return can_be_empty(i); });
		},
		[](const alternation<CharT>& a) {
			return std::any_of(a.alternatives.cbegin(), a.alternatives.cend(), [](const auto& i) { return can_be_empty(i); });
		},
		[](const repetition<CharT>& r) { return r.min == 0 || can_be_empty(*r.child); },
		[](const group<CharT>& g)      { return can_be_empty(*g.child); },
		// the referenced group may have captured an empty string
		[](const backreference&)       { return true; },
		[](const anchor&)              { return true; }
	}, n.value);
}

} // namespace ast

} // namespace impl

} // namespace regex

} // namespace dgrep
