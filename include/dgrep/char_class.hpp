#pragma once

#include <vector>
#include <limits>
#include <algorithm>

namespace dgrep {

namespace regex {

namespace impl {

using std::vector;
using std::numeric_limits;

template <typename CharT>
struct char_range {
	using char_t = CharT;
	char_t from, to;

	constexpr bool is_member(char_t c) const noexcept{
		return from <= c && c <= to;
	}

	friend constexpr bool operator==(const char_range&, const char_range&) noexcept = default;
};

template <typename CharT>
constexpr bool in_range(CharT a, CharT b, CharT x) noexcept{ return a <= x && x <= b; }

template <typename CharT>
constexpr bool in_range(const char_range<CharT>& r, CharT x) noexcept{ return r.is_member(x); }

template <typename CharT>
constexpr bool is_hex_digit(CharT x) noexcept{
	return in_range<CharT>('0', '9', x) || in_range<CharT>('a', 'f', x) || in_range<CharT>('A', 'F', x);
}

template <typename CharT>
constexpr int hex_val(CharT x) noexcept{
	if('0' <= x && x <= '9') {
		return x - '0';
	}else if('a' <= x && x <= 'f') {
		return (x - 'a') + 10;
	}else {
		// 'A' <= x && x <= 'F'
		return (x - 'A') + 10;
	}
}

template <typename CharT>
constexpr bool is_digit(CharT c) noexcept{
	return in_range<CharT>('0', '9', c);
}

template <typename CharT>
constexpr bool is_word(CharT c) noexcept{
	return
		in_range<CharT>('0', '9', c) ||
		in_range<CharT>('a', 'z', c) ||
		in_range<CharT>('A', 'Z', c) ||
		(c == '_');
}

template <typename CharT>
constexpr bool is_space(CharT c) noexcept{
	// [\t\n\v\f\r ] == [\x09-\x0d ]
	return in_range<CharT>('\x09', '\x0d', c) || c == ' ';
}

template <typename CharT>
constexpr bool is_newline(CharT c) noexcept{
	return c == '\n' || c == '\r';
}

// a set of char ranges, optionally negated
template <typename CharT>
struct char_class {
	using char_t = CharT;
	using range_t = char_range<char_t>;

	vector<range_t> ranges;
	bool negated = false;

	static char_class digits() {
		return {{ {'0', '9'} }, false};
	}
	static char_class words() {
		return {{ {'0', '9'}, {'A', 'Z'}, {'_', '_'}, {'a', 'z'} }, false};
	}
	static char_class spaces() {
		return {{ {'\x09', '\x0d'}, {' ', ' '} }, false};
	}

	char_class& add(char_t c) {
		ranges.push_back({c, c});
		return *this;
	}

	char_class& add(range_t r) {
		ranges.push_back(r);
		return *this;
	}

	// [\D] and the like: a negated class nested in a bracket expression contributes its complement
	char_class& add(const char_class& other) {
		if(other.negated) {
			auto complement = complement_of(other.ranges);
			ranges.insert(ranges.end(), complement.begin(), complement.end());
		}else {
			ranges.insert(ranges.end(), other.ranges.begin(), other.ranges.end());
		}
		return *this;
	}

	char_class& invert() noexcept{
		negated = !negated;
		return *this;
	}

	// sort and merge overlapping or adjacent ranges
	char_class& normalize() {
		ranges = normalized(ranges);
		return *this;
	}

	bool accept(char_t c) const noexcept{
		bool member = std::any_of(ranges.cbegin(), ranges.cend(), [c](const range_t& r) { return r.is_member(c); });
		return member != negated;
	}

	static vector<range_t> normalized(vector<range_t> rs) {
		std::sort(rs.begin(), rs.end(), [](const range_t& l, const range_t& r) { return l.from < r.from; });
		vector<range_t> result;
		for(const auto& r: rs) {
			if(!result.empty()) {
				auto& last = result.back();
				// adjacent: last.to + 1 == r.from, written so that it never overflows
				if(r.from <= last.to || (last.to != numeric_limits<char_t>::max() && r.from == char_t(last.to + 1))) {
					last.to = std::max(last.to, r.to);
					continue;
				}
			}
			result.push_back(r);
		}
		return result;
	}

	static vector<range_t> complement_of(const vector<range_t>& rs) {
		vector<range_t> result;
		char_t next = numeric_limits<char_t>::min();
		bool exhausted = false;
		for(const auto& r: normalized(rs)) {
			if(r.from > next) result.push_back({next, char_t(r.from - 1)});
			if(r.to == numeric_limits<char_t>::max()) {
				exhausted = true;
				break;
			}
			next = char_t(r.to + 1);
		}
		if(!exhausted) result.push_back({next, numeric_limits<char_t>::max()});
		return result;
	}

	friend bool operator==(const char_class&, const char_class&) = default;
};

} // namespace impl

} // namespace regex

} // namespace dgrep
