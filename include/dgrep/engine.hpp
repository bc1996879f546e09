#pragma once

#include <tuple>
#include <memory>
#include <string>
#include <vector>
#include <cstddef>
#include <utility>
#include <concepts>
#include <string_view>

#include "dgrep/vm.hpp"
#include "dgrep/error.hpp"
#include "dgrep/program.hpp"
#include "dgrep/compiler.hpp"
#include "dgrep/lru_cache.hpp"
#include "dgrep/match_iterator.hpp"

namespace dgrep {

namespace regex {

struct engine_options {
	static constexpr std::size_t default_step_limit = impl::backtracking_vm<char>::default_step_limit;
	static constexpr std::size_t default_cache_capacity = 512;
	static constexpr std::size_t default_unroll_complexity = impl::pattern_compiler<char>::default_unroll_complexity;

	// steps allowed for one match attempt, 0 disables the limit
	std::size_t step_limit = default_step_limit;
	// compiled patterns kept by an engine, 0 disables caching
	std::size_t cache_capacity = default_cache_capacity;
	// largest program a counted repetition may unroll into
	std::size_t max_unroll_complexity = default_unroll_complexity;
};

namespace impl {

using std::size_t;
using std::tuple;
using std::vector;
using std::shared_ptr;
using std::basic_string;
using std::basic_string_view;

using std::constructible_from;
using std::default_initializable;

template <typename CharT>
struct regular_expression_engine {

	using char_t = CharT;

	using string_t = basic_string<char_t>;
	using string_view_t = basic_string_view<char_t>;
	using const_pos_t = const char_t*;

	using program_t = program<char_t>;
	using program_ptr = shared_ptr<const program_t>;

	explicit regular_expression_engine(engine_options options = {}):
		options{options}, cache{options.cache_capacity} {}

	// compile a pattern or take it from the cache, compile errors are not cached
	tuple<error_info, program_ptr> compile(string_view_t pattern) {
		string_t key{pattern};
		if(auto cached = cache.get(key)) return {error_category::success, std::move(*cached)};

		// compiled outside of the lock, concurrent misses may compile the same pattern twice
		pattern_compiler<char_t> compiler{options.max_unroll_complexity};
		auto [errc, prog] = compiler.compile(pattern);
		if(errc) return {errc, nullptr};

		return {errc, cache.put(key, std::make_shared<const program_t>(std::move(prog)))};
	}

	// all of the matches of pattern in text, as spans
	tuple<error_info, vector<match_result>> find_all(string_view_t pattern, string_view_t text) {
		auto [errc, prog] = compile(pattern);
		if(errc) return {errc, {}};
		return impl::find_all(*prog, text, options.step_limit);
	}

	// the matched substrings of all of the non-overlapping matches
	template <default_initializable ResultViewT = string_view_t>
	requires constructible_from<ResultViewT, const_pos_t, const_pos_t>
	tuple<error_info, vector<ResultViewT>> search(string_view_t pattern, string_view_t text) {
		auto [errc, matches] = find_all(pattern, text);
		if(errc) return {errc, {}};

		vector<ResultViewT> result;
		result.reserve(matches.size());
		for(const auto& m: matches) result.push_back(make_view<ResultViewT>(text, m.groups.front()));
		return {errc, std::move(result)};
	}

	// captures of the first match: result[0] is the whole match, empty when nothing matches
	template <default_initializable ResultViewT = string_view_t>
	requires constructible_from<ResultViewT, const_pos_t, const_pos_t>
	tuple<error_info, vector<ResultViewT>> search_first(string_view_t pattern, string_view_t text) {
		auto [errc, prog] = compile(pattern);
		if(errc) return {errc, {}};

		match_iterator<char_t> it{*prog, text, options.step_limit};
		auto [match_errc, m] = it.next();
		if(match_errc || !m) return {match_errc, {}};
		return {match_errc, captures<ResultViewT>(text, *m)};
	}

	// captures of all of the matches
	template <default_initializable ResultViewT = string_view_t>
	requires constructible_from<ResultViewT, const_pos_t, const_pos_t>
	tuple<error_info, vector<vector<ResultViewT>>> search_all(string_view_t pattern, string_view_t text) {
		auto [errc, matches] = find_all(pattern, text);
		if(errc) return {errc, {}};

		vector<vector<ResultViewT>> results;
		results.reserve(matches.size());
		for(const auto& m: matches) results.push_back(captures<ResultViewT>(text, m));
		return {errc, std::move(results)};
	}

	// captures of a match of the whole text, empty when the text does not match
	template <default_initializable ResultViewT = string_view_t>
	requires constructible_from<ResultViewT, const_pos_t, const_pos_t>
	tuple<error_info, vector<ResultViewT>> match(string_view_t pattern, string_view_t text) {
		auto [errc, prog] = compile(pattern);
		if(errc) return {errc, {}};

		backtracking_vm<char_t> vm{*prog, options.step_limit};
		auto [match_errc, m] = vm.try_match_at(text, 0, true);
		if(match_errc || !m) return {match_errc, {}};
		return {match_errc, captures<ResultViewT>(text, *m)};
	}

	// whether pattern matches anywhere in text
	tuple<error_info, bool> contains(string_view_t pattern, string_view_t text) {
		auto [errc, prog] = compile(pattern);
		if(errc) return {errc, false};

		match_iterator<char_t> it{*prog, text, options.step_limit};
		auto [match_errc, m] = it.next();
		return {match_errc, !match_errc && m.has_value()};
	}

	// replace at most count leftmost non-overlapping matches with replacement,
	// returns the count of replacements, target is left untouched on error
	tuple<error_info, size_t> replace(string_view_t pattern, string_t& target, string_view_t replacement, size_t count = -1) {
		auto [errc, prog] = compile(pattern);
		if(errc) return {errc, 0};

		string_view_t text{target};
		match_iterator<char_t> it{*prog, text, options.step_limit};
		string_t replaced;
		size_t last = 0, i = 0;
		for(; i < count; ++i) {
			auto [match_errc, m] = it.next();
			if(match_errc) return {match_errc, 0};
			if(!m) break; // no more matches

			replaced.append(text.substr(last, m->begin - last));
			replaced.append(replacement);
			last = m->end;
		}
		replaced.append(text.substr(last));
		target = std::move(replaced);
		return {error_category::success, i};
	}

	const engine_options& get_options() const noexcept{
		return options;
	}

	// count of the compiled patterns currently cached
	size_t cached_patterns() const{
		return cache.size();
	}

	bool is_cached(string_view_t pattern) const{
		return cache.contains(string_t{pattern});
	}

protected:

	const engine_options options;
	lru_cache<string_t, program_ptr> cache;

	template <typename ResultViewT>
	static ResultViewT make_view(string_view_t text, const optional<capture_span>& span) {
		if(!span) return ResultViewT{};
		return ResultViewT{text.data() + span->begin, text.data() + span->end};
	}

	template <typename ResultViewT>
	static vector<ResultViewT> captures(string_view_t text, const match_result& m) {
		vector<ResultViewT> result;
		result.reserve(m.groups.size());
		for(const auto& g: m.groups) result.push_back(make_view<ResultViewT>(text, g));
		return result;
	}

}; // struct regular_expression_engine

} // namespace impl

template <typename CharT>
using regular_expression_engine = impl::regular_expression_engine<CharT>;

using engine = regular_expression_engine<char>;

// free functions, each one compiles the pattern on a throwaway engine

template <typename CharT>
std::tuple<error_info, std::shared_ptr<const program<CharT>>> compile(std::basic_string_view<CharT> pattern, engine_options options = {}) {
	options.cache_capacity = 0;
	return regular_expression_engine<CharT>{options}.compile(pattern);
}

template <typename CharT, typename ResultViewT = std::basic_string_view<CharT>>
std::tuple<error_info, std::vector<ResultViewT>> match(std::basic_string_view<CharT> pattern, std::basic_string_view<CharT> target, engine_options options = {}) {
	options.cache_capacity = 0;
	return regular_expression_engine<CharT>{options}.template match<ResultViewT>(pattern, target);
}

template <typename CharT, typename ResultViewT = std::basic_string_view<CharT>>
std::tuple<error_info, std::vector<ResultViewT>> search(std::basic_string_view<CharT> pattern, std::basic_string_view<CharT> target, engine_options options = {}) {
	options.cache_capacity = 0;
	return regular_expression_engine<CharT>{options}.template search<ResultViewT>(pattern, target);
}

template <typename CharT, typename ResultViewT = std::basic_string_view<CharT>>
std::tuple<error_info, std::vector<std::vector<ResultViewT>>> search_all(std::basic_string_view<CharT> pattern, std::basic_string_view<CharT> target, engine_options options = {}) {
	options.cache_capacity = 0;
	return regular_expression_engine<CharT>{options}.template search_all<ResultViewT>(pattern, target);
}

template <typename CharT>
std::tuple<error_info, std::size_t> replace(std::basic_string_view<CharT> pattern, std::basic_string<CharT>& target, std::basic_string_view<CharT> replacement, std::size_t count = -1, engine_options options = {}) {
	options.cache_capacity = 0;
	return regular_expression_engine<CharT>{options}.replace(pattern, target, replacement, count);
}

} // namespace regex

} // namespace dgrep
