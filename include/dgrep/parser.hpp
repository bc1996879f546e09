#pragma once

/*
	Recursive descent parser of patterns.

	alternation ::= concat ('|' concat)*
	concat      ::= repetition+
	repetition  ::= atom (quantifier '?'?)?
	quantifier  ::= '*' | '+' | '?' | '{' m '}' | '{' m ',' '}' | '{' m ',' n '}'
	atom        ::= char | '.' | '^' | '$' | escape | brackets | '(' alternation ')' | '(?:' alternation ')'
*/

#include <tuple>
#include <memory>
#include <string>
#include <vector>
#include <cstddef>
#include <utility>
#include <optional>
#include <string_view>

#include "dgrep/ast.hpp"
#include "dgrep/error.hpp"
#include "dgrep/assertion.hpp"
#include "dgrep/char_class.hpp"

namespace dgrep {

namespace regex {

namespace impl {

using std::size_t;
using std::tuple;
using std::vector;
using std::optional;
using std::make_unique;
using std::basic_string_view;

template <typename CharT>
struct pattern_parser {

	using char_t = CharT;
	using range_t = char_range<char_t>;
	using class_t = char_class<char_t>;
	using node_t = ast::node<char_t>;

	using pattern_view_t = basic_string_view<char_t>;

	// counted repetitions beyond this are rejected while lexing, the compiler rejects far smaller ones anyway
	static constexpr size_t max_repeat_count = 100000;
	// groups are parsed, lowered and destroyed recursively, so their depth is bounded
	static constexpr size_t max_nesting_depth = 1000;

	constexpr pattern_parser() = default;

	pattern_parser(pattern_view_t s): pattern{s} {}

	// parse the whole pattern
	tuple<error_info, optional<node_t>> parse() {
		reset();
		if(pattern.empty()) return {fail(error_category::empty_pattern, 0), std::nullopt};

		auto root = parse_alternation();
		if(!root) return {failure, std::nullopt};

		if(pos != pattern.size()) {
			// the only way to stop before the end is an unmatched ')'
			return {fail(error_category::missing_paren, pos), std::nullopt};
		}
		return {failure, std::move(root)};
	}

	// number of capturing groups seen by the last parse()
	size_t group_count() const noexcept{
		return max_capture_id;
	}

protected:

	pattern_view_t pattern;
	size_t pos = 0;
	size_t max_capture_id = 0;
	size_t depth = 0;
	error_info failure;

	struct braces_result {
		size_t low, high; // m, n
	};

	struct escape_result {
		enum class kind_category {
			single_char,
			char_set,
			backreference,
			anchor
		} kind;
		char_t single_char{};
		class_t char_set{};
		size_t group_id = 0;
		anchor_kind anchor{};
	};

	void reset() noexcept{
		pos = 0;
		max_capture_id = 0;
		depth = 0;
		failure = {};
	}

	error_info fail(error_category category, size_t position) noexcept{
		// keep the first error
		if(failure.ok()) failure = {category, position};
		return failure;
	}

	bool at_end() const noexcept{
		return pos >= pattern.size();
	}

	char_t peek() const noexcept{
		return pattern[pos];
	}

	static constexpr bool is_quantifier(char_t c) noexcept{
		return c == '*' || c == '+' || c == '?' || c == '{';
	}

	optional<node_t> parse_alternation() {
		auto begin = pos;
		vector<node_t> alternatives;

		auto first = parse_concat();
		if(!first) return std::nullopt;
		alternatives.push_back(std::move(*first));

		while(!at_end() && peek() == '|') {
			++pos;
			auto next = parse_concat();
			if(!next) return std::nullopt;
			alternatives.push_back(std::move(*next));
		}

		if(alternatives.size() == 1) return std::move(alternatives.front());
		return node_t{ast::alternation<char_t>{std::move(alternatives)}, begin};
	}

	optional<node_t> parse_concat() {
		auto begin = pos;
		vector<node_t> items;
		while(!at_end() && peek() != '|' && peek() != ')') {
			auto item = parse_repetition();
			if(!item) return std::nullopt;
			items.push_back(std::move(*item));
		}

		// ")a", "a|)": a ')' outside of any group closes nothing
		if(items.empty() && depth == 0 && !at_end() && peek() == ')') {
			fail(error_category::missing_paren, pos);
			return std::nullopt;
		}
		// "a|", "|a", "()"
		if(items.empty()) {
			fail(error_category::empty_operand, pos);
			return std::nullopt;
		}
		if(items.size() == 1) return std::move(items.front());
		return node_t{ast::concat<char_t>{std::move(items)}, begin};
	}

	optional<node_t> parse_repetition() {
		auto atom = parse_atom();
		if(!atom || at_end() || !is_quantifier(peek())) return atom;

		auto quantifier_pos = pos;
		if(atom->template is<ast::anchor>()) {
			// ^*, $+, \b{2}
			fail(error_category::nothing_to_repeat, quantifier_pos);
			return std::nullopt;
		}

		size_t low, high;
		switch(pattern[pos++]) {
		case '*': low = 0; high = ast::unbounded; break;
		case '+': low = 1; high = ast::unbounded; break;
		case '?': low = 0; high = 1;              break;
		default: {
			// '{'
			auto braces_res = parse_braces();
			if(!braces_res) {
				fail(error_category::bad_brace_expression, quantifier_pos);
				return std::nullopt;
			}
			low = braces_res->low;
			high = braces_res->high;
		}
		}

		bool greedy = true;
		if(!at_end() && peek() == '?') {
			greedy = false;
			++pos;
		}

		// a**, a+*, a{2}{3}
		if(!at_end() && is_quantifier(peek())) {
			fail(error_category::nothing_to_repeat, pos);
			return std::nullopt;
		}

		auto begin = atom->position;
		return node_t{
			ast::repetition<char_t>{make_unique<node_t>(std::move(*atom)), low, high, greedy},
			begin
		};
	}

	optional<node_t> parse_atom() {
		auto begin = pos;
		char_t c = pattern[pos];
		switch(c) {
		case '*':
		case '+':
		case '?':
		case '{':
			fail(error_category::nothing_to_repeat, begin);
			return std::nullopt;
		case '(':
			return parse_group();
		case '[': {
			auto set = parse_brackets();
			if(!set) return std::nullopt;
			return node_t{ast::char_set<char_t>{std::move(*set)}, begin};
		}
		case '.':
			++pos;
			return node_t{ast::any_char{}, begin};
		case '^':
			++pos;
			return node_t{ast::anchor{anchor_kind::text_begin}, begin};
		case '$':
			++pos;
			return node_t{ast::anchor{anchor_kind::text_end}, begin};
		case '\\': {
			++pos;
			auto esc = lex_escape(false);
			if(!esc) return std::nullopt;
			switch(esc->kind) {
			case escape_result::kind_category::single_char:   return node_t{ast::literal<char_t>{esc->single_char}, begin};
			case escape_result::kind_category::char_set:      return node_t{ast::char_set<char_t>{std::move(esc->char_set)}, begin};
			case escape_result::kind_category::backreference: return node_t{ast::backreference{esc->group_id}, begin};
			case escape_result::kind_category::anchor:        return node_t{ast::anchor{esc->anchor}, begin};
			}
			return std::nullopt;
		}
		default:
			++pos;
			return node_t{ast::literal<char_t>{c}, begin};
		}
	}

	optional<node_t> parse_group() {
		// assume pos is pointing at '('
		auto begin = pos++;
		if(at_end()) {
			fail(error_category::missing_paren, begin);
			return std::nullopt;
		}

		optional<size_t> index;
		if(peek() != '?') {
			// marking group, numbered by the position of its left parenthesis
			index = ++max_capture_id;
		}else {
			if(++pos == pattern.size()) {
				fail(error_category::missing_paren, begin); // (?
				return std::nullopt;
			}
			switch(pattern[pos++]) {
			case ':': // grouping
				break;
			case '=': // zero-width positive lookahead
			case '!': // zero-width negative lookahead
			default:  // (?i) and friends
				fail(error_category::unsupported_features, begin);
				return std::nullopt;
			}
		}

		if(depth == max_nesting_depth) {
			fail(error_category::nesting_too_deep, begin);
			return std::nullopt;
		}
		++depth;
		auto child = parse_alternation();
		--depth;
		if(!child) return std::nullopt;
		if(at_end() || peek() != ')') {
			fail(error_category::missing_paren, begin);
			return std::nullopt;
		}
		++pos; // skip ')'

		return node_t{ast::group<char_t>{make_unique<node_t>(std::move(*child)), index}, begin};
	}

	optional<escape_result> lex_escape(bool in_brackets) {
		/*
		assume the backslash is consumed

			control escape:
				f: U+000C, page-feed
				n: U+000A, line-feed
				r: U+000D, return
				t: U+0009, tab
				v: U+000B, vertical-tab
				0: U+0000, null

			c + control letter:
				any upper/lower case ASCII character
				value = value_of_encode_unit % 32

			x + hex escape sequence:
				letter x and EXACTLY followed by two hex-digits

			identity escape:
				escape and other character that is not a letter or digit,
				such as \\, \.

			special escapes of re:
				d: digit
				D: non-digit
				s: space
				S: non-space
				w: letter, digit or '_'
				W: different from letter, digit or '_'
				b: word boundary (backspace in a bracket expression)
				B: non word boundary
				1-9: backreference
		*/
		auto begin = pos - 1;
		if(at_end()) {
			fail(error_category::bad_escape, begin);
			return std::nullopt;
		}

		auto make_char = [](char_t c) {
			escape_result res{escape_result::kind_category::single_char};
			res.single_char = c;
			return res;
		};
		auto make_set = [](class_t set) {
			escape_result res{escape_result::kind_category::char_set};
			res.char_set = std::move(set);
			return res;
		};
		auto make_anchor = [](anchor_kind kind) {
			escape_result res{escape_result::kind_category::anchor};
			res.anchor = kind;
			return res;
		};

		char_t c = pattern[pos++];
		switch(c) {
		// control escapes:
		case 'f': return make_char('\f');
		case 'n': return make_char('\n');
		case 'r': return make_char('\r');
		case 't': return make_char('\t');
		case 'v': return make_char('\v');
		case '0': return make_char('\0');

		case 'c': {
			if(!at_end() && (in_range<char_t>('a', 'z', peek()) || in_range<char_t>('A', 'Z', peek()))) {
				return make_char(char_t(pattern[pos++] % 32));
			}
			fail(error_category::bad_escape, begin);
			return std::nullopt;
		}
		case 'x': {
			if(pos + 1 < pattern.size() && is_hex_digit(pattern[pos]) && is_hex_digit(pattern[pos + 1])) {
				auto val = hex_val(pattern[pos]) * 0x10 + hex_val(pattern[pos + 1]);
				pos += 2;
				return make_char(char_t(val));
			}
			fail(error_category::bad_escape, begin);
			return std::nullopt;
		}

		case 'd': return make_set(class_t::digits());
		case 'D': return make_set(class_t::digits().invert());
		case 's': return make_set(class_t::spaces());
		case 'S': return make_set(class_t::spaces().invert());
		case 'w': return make_set(class_t::words());
		case 'W': return make_set(class_t::words().invert());

		case 'b':
			if(in_brackets) return make_char('\b'); // backspace
			return make_anchor(anchor_kind::word_boundary);
		case 'B':
			if(in_brackets) break;
			return make_anchor(anchor_kind::non_word_boundary);
		}

		if(in_range<char_t>('1', '9', c)) {
			if(in_brackets) {
				fail(error_category::bad_escape, begin);
				return std::nullopt;
			}
			// take as many digits as still name a group opened so far: with one group, \10 is \1 followed by '0'
			size_t id = size_t(c - '0');
			if(id > max_capture_id) {
				fail(error_category::bad_backreference, begin);
				return std::nullopt;
			}
			while(!at_end() && is_digit(peek()) && id * 10 + size_t(peek() - '0') <= max_capture_id) {
				id = id * 10 + size_t(pattern[pos++] - '0');
			}
			escape_result res{escape_result::kind_category::backreference};
			res.group_id = id;
			return res;
		}

		if(is_word(c)) {
			// unknown letter escape
			fail(error_category::bad_escape, begin);
			return std::nullopt;
		}
		// identity escapes
		return make_char(c);
	}

	optional<class_t> parse_brackets() {
		// assume pos is pointing at the left square bracket '['
		auto begin = pos++;
		auto bad_bracket = [&]() -> optional<class_t> {
			fail(error_category::bad_bracket_expression, begin);
			return std::nullopt;
		};

		class_t set;
		if(!at_end() && peek() == '^') {
			set.negated = true;
			++pos;
		}

		// a single member: either one char or a class such as \d
		struct member {
			bool is_char;
			char_t c;
			class_t set;
		};
		auto lex_member = [&]() -> optional<member> {
			if(peek() != '\\') return member{true, pattern[pos++], {}};
			++pos;
			auto esc = lex_escape(true);
			if(!esc) return std::nullopt;
			if(esc->kind == escape_result::kind_category::single_char) return member{true, esc->single_char, {}};
			return member{false, {}, std::move(esc->char_set)};
		};

		while(!at_end() && peek() != ']') {
			auto from = lex_member();
			if(!from) return std::nullopt;

			// '-' is literal at the beginning or the end of the expression
			bool is_range = !at_end() && peek() == '-' && pos + 1 < pattern.size() && pattern[pos + 1] != ']';
			if(!is_range) {
				if(from->is_char) set.add(from->c);
				else set.add(from->set);
				continue;
			}

			// bad char range like [\w-z]
			if(!from->is_char) return bad_bracket();
			++pos; // skip '-'

			auto to = lex_member();
			if(!to) return std::nullopt;
			// bad char range like [a-\w] or [z-a]
			if(!to->is_char || from->c > to->c) return bad_bracket();

			set.add(range_t{from->c, to->c});
		}

		if(at_end()) return bad_bracket(); // '...[', broken bracket
		++pos; // skip ']'
		set.normalize();
		return set;
	}

	optional<braces_result> parse_braces() {
		// assume '{' is consumed
		// m, n ::= [0-9]+
		auto lex_digits = [this]() -> optional<size_t> {
			if(at_end() || !is_digit(peek())) return std::nullopt;
			size_t n = 0;
			do {
				n = n * 10 + size_t(pattern[pos++] - '0');
				if(n > max_repeat_count) return std::nullopt;
			}while(!at_end() && is_digit(peek()));
			return n;
		};

		auto m = lex_digits();
		if(!m || at_end()) return std::nullopt;

		if(peek() == '}') {
			++pos;
			return braces_result{*m, *m}; // {m}
		}
		if(peek() != ',') return std::nullopt;
		++pos;
		if(!at_end() && peek() == '}') {
			++pos;
			return braces_result{*m, ast::unbounded}; // {m,}
		}

		auto n = lex_digits();
		// {m,n}, where m > n is an error too
		if(!n || at_end() || peek() != '}' || *m > *n) return std::nullopt;
		++pos;
		return braces_result{*m, *n};
	}

}; // struct pattern_parser

} // namespace impl

} // namespace regex

} // namespace dgrep
