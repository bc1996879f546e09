/*
	dgrep: print the substrings of each input line matched by a pattern.

	usage: dgrep [-c] [-n] [-d] [--steps N] [--cache N] PATTERN [FILE...]

		-c          print only the total count of matches
		-n          prefix each match with its line number
		-d          dump the syntax tree and the program of PATTERN first
		--steps N   steps allowed for one match attempt (0: unlimited)
		--cache N   compiled patterns to keep (0: no caching)

	exit status: 0 if anything matched, 1 if nothing matched, 2 on errors.
*/

#include <string>
#include <vector>
#include <cstdio>
#include <cstddef>
#include <fstream>
#include <istream>
#include <iostream>
#include <optional>
#include <charconv>
#include <string_view>

#include "fmt/core.h"
#include "fmt/format.h"

#include "dgrep/regex.hpp"
#include "dgrep/format.hpp"

namespace {

using std::string;
using std::vector;
using std::optional;
using std::string_view;

using namespace dgrep::regex;

constexpr int exit_matched = 0;
constexpr int exit_no_match = 1;
constexpr int exit_error = 2;

struct command_line {
	bool count_only = false;
	bool line_numbers = false;
	bool dump = false;
	engine_options options;
	string pattern;
	vector<string> files;
};

void usage() {
	fmt::print(stderr, "usage: dgrep [-c] [-n] [-d] [--steps N] [--cache N] PATTERN [FILE...]\n");
}

optional<std::size_t> parse_count(string_view s) {
	std::size_t n = 0;
	auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), n);
	if(ec != std::errc{} || end != s.data() + s.size()) return std::nullopt;
	return n;
}

optional<command_line> parse_command_line(int argc, const char** argv) {
	command_line cmd;
	bool has_pattern = false;
	for(int i = 1; i < argc; ++i) {
		string_view arg = argv[i];
		if(has_pattern || arg.empty() || arg.front() != '-' || arg == "-") {
			if(!has_pattern) {
				cmd.pattern = arg;
				has_pattern = true;
			}else cmd.files.emplace_back(arg);
			continue;
		}

		if(arg == "-c") cmd.count_only = true;
		else if(arg == "-n") cmd.line_numbers = true;
		else if(arg == "-d") cmd.dump = true;
		else if(arg == "--steps" || arg == "--cache") {
			if(i + 1 == argc) {
				fmt::print(stderr, "dgrep: {} requires a value\n", arg);
				return std::nullopt;
			}
			auto n = parse_count(argv[++i]);
			if(!n) {
				fmt::print(stderr, "dgrep: bad value for {}: {}\n", arg, argv[i]);
				return std::nullopt;
			}
			if(arg == "--steps") cmd.options.step_limit = *n;
			else cmd.options.cache_capacity = *n;
		}else if(arg == "--") {
			// everything after -- is the pattern and the files
			if(++i < argc) {
				cmd.pattern = argv[i];
				has_pattern = true;
			}
			while(++i < argc) cmd.files.emplace_back(argv[i]);
		}else {
			fmt::print(stderr, "dgrep: unknown option {}\n", arg);
			return std::nullopt;
		}
	}
	if(!has_pattern) return std::nullopt;
	return cmd;
}

// print the tree and the program of a pattern, false on a syntax error
bool dump_pattern(const command_line& cmd) {
	impl::pattern_compiler<char> compiler{cmd.options.max_unroll_complexity};
	auto [errc, prog] = compiler.compile(cmd.pattern);
	if(compiler.ast()) fmt::print("ast: {}\n", *compiler.ast());
	if(errc) {
		fmt::print(stderr, "dgrep: {}\n", errc);
		return false;
	}
	fmt::print("program:\n{}", prog);
	return true;
}

struct search_state {
	std::size_t matches = 0;
	bool failed = false;
};

void search_stream(engine& re, const command_line& cmd, std::istream& in, string_view name, bool show_name, search_state& state) {
	string line;
	std::size_t line_number = 0;
	while(std::getline(in, line)) {
		++line_number;
		auto [errc, result] = re.search(cmd.pattern, line);
		if(errc) {
			// a timeout only gives up on this line, syntax errors are caught before searching
			fmt::print(stderr, "dgrep: {}:{}: {}\n", name, line_number, errc);
			state.failed = true;
			continue;
		}
		state.matches += result.size();
		if(cmd.count_only) continue;

		for(const auto& m: result) {
			if(show_name) fmt::print("{}:", name);
			if(cmd.line_numbers) fmt::print("{}:", line_number);
			fmt::print("{}\n", m);
		}
	}
}

} // namespace

int main(int argc, const char** argv) {
	auto cmd = parse_command_line(argc, argv);
	if(!cmd) {
		usage();
		return exit_error;
	}

	if(cmd->dump && !dump_pattern(*cmd)) return exit_error;

	engine re{cmd->options};
	// report syntax errors once instead of for every line
	if(auto [errc, prog] = re.compile(cmd->pattern); errc) {
		fmt::print(stderr, "dgrep: {}\n", errc);
		return exit_error;
	}

	search_state state;
	if(cmd->files.empty()) {
		search_stream(re, *cmd, std::cin, "(standard input)", false, state);
	}else {
		bool show_name = cmd->files.size() > 1;
		for(const auto& file: cmd->files) {
			if(file == "-") {
				search_stream(re, *cmd, std::cin, "(standard input)", show_name, state);
				continue;
			}
			std::ifstream in{file};
			if(!in) {
				fmt::print(stderr, "dgrep: {}: cannot open file\n", file);
				state.failed = true;
				continue;
			}
			search_stream(re, *cmd, in, file, show_name, state);
		}
	}

	if(cmd->count_only) fmt::print("{}\n", state.matches);

	if(state.failed) return exit_error;
	return state.matches > 0 ? exit_matched : exit_no_match;
}
