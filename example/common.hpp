#pragma once

// some common utils for the interactive examples

#include <limits>
#include <string>
#include <vector>
#include <utility>
#include <iostream>
#include <iterator>
#include <string_view>

#include "fmt/core.h"

#include "dgrep/regex.hpp"
#include "dgrep/format.hpp"

using fmt::print;

template <typename... Args>
void println(fmt::format_string<Args...> format, Args&&... args) {
	print(format, std::forward<Args>(args)...);
	print("\n");
}

// "text"[first,last] for a capture, ""[-,-] for a group that did not participate
inline void print_captures(std::string_view target, const std::vector<std::string_view>& captures) {
	size_t i = 0;
	for(const auto& m: captures) {
		if(m.data() == nullptr) {
			print("\"\"[-,-]");
		}else {
			auto shift_dist = std::distance(target.data(), m.data());
			print("\"{}\"[{},{})", m, shift_dist, shift_dist + m.size());
		}
		if(++i < captures.size()) print(", ");
	}
}

// prompt for a line, false on end of input
inline bool read_line(std::string_view prompt, std::string& line) {
	println("{}", prompt);
	return static_cast<bool>(std::getline(std::cin, line));
}
