#include <string>
#include <thread>
#include <vector>
#include <string_view>

#include "gtest/gtest.h"
#include "fmt/format.h"

#include "dgrep/regex.hpp"
#include "dgrep/format.hpp"

namespace {

using namespace dgrep::regex;
using views = std::vector<std::string_view>;

TEST(Engine, SearchReturnsEveryMatch) {
	engine re;
	auto [errc, result] = re.search("\\d+", "User logged in at 14:32, error code 404");
	ASSERT_TRUE(errc.ok());
	EXPECT_EQ(result, (views{"14", "32", "404"}));
}

TEST(Engine, Backreference) {
	engine re;
	auto [errc, result] = re.search("(\\w+) \\1", "hello hello and goodbye");
	ASSERT_TRUE(errc.ok());
	EXPECT_EQ(result, (views{"hello hello"}));
}

TEST(Engine, LazyAndGreedyPlus) {
	engine re;
	auto [lazy_errc, lazy_first] = re.search_first("a+?", "aaa");
	ASSERT_TRUE(lazy_errc.ok());
	ASSERT_FALSE(lazy_first.empty());
	EXPECT_EQ(lazy_first[0], "a");

	// every lazy match is as short as possible
	auto [lazy_all_errc, lazy_all] = re.search("a+?", "aaa");
	ASSERT_TRUE(lazy_all_errc.ok());
	EXPECT_EQ(lazy_all, (views{"a", "a", "a"}));

	auto [greedy_errc, greedy] = re.search("a+", "aaa");
	ASSERT_TRUE(greedy_errc.ok());
	EXPECT_EQ(greedy, (views{"aaa"}));
}

TEST(Engine, UnsetBackreferenceNeverMatches) {
	engine re;
	auto [errc, result] = re.search("(a)|\\1b", "b");
	ASSERT_TRUE(errc.ok());
	EXPECT_TRUE(result.empty());
}

TEST(Engine, AnchoredPatternDoesNotMatchLater) {
	engine re;
	auto [errc, result] = re.search("^abc", "xabc");
	ASSERT_TRUE(errc.ok());
	EXPECT_TRUE(result.empty());
}

TEST(Engine, EmptyMatches) {
	engine re;
	auto [errc, result] = re.search("a*", "bb");
	ASSERT_TRUE(errc.ok());
	EXPECT_EQ(result, (views{"", ""}));

	auto [end_errc, at_end] = re.search("$", "abc");
	ASSERT_TRUE(end_errc.ok());
	EXPECT_TRUE(at_end.empty());
}

TEST(Engine, NestedQuantifierWithoutAnchorsTerminates) {
	engine re;
	std::string text(40, 'a');
	text += '!';
	auto [errc, result] = re.search("(a+)+", text);
	if(errc.ok()) {
		EXPECT_EQ(result, (views{std::string_view{text}.substr(0, 40)}));
	}else {
		EXPECT_EQ(errc.kind(), error_kind::match_timeout);
	}
}

TEST(Engine, CatastrophicBacktrackingTimesOut) {
	engine re;
	std::string text(40, 'a');
	text += '!';
	auto [errc, result] = re.search("^(a+)+$", text);
	EXPECT_EQ(errc.category, error_category::step_limit_exceeded);
	EXPECT_EQ(errc.kind(), error_kind::match_timeout);
	EXPECT_TRUE(result.empty());
	EXPECT_EQ(fmt::format("{}", errc), "MatchTimeout: match step limit exceeded");

	// the program stays cached and usable
	EXPECT_TRUE(re.is_cached("^(a+)+$"));
	auto [short_errc, short_result] = re.search("^(a+)+$", "aaaa");
	EXPECT_TRUE(short_errc.ok());
	EXPECT_EQ(short_result, (views{"aaaa"}));
}

TEST(Engine, StepLimitIsConfigurable) {
	engine strict{engine_options{.step_limit = 50}};
	auto [errc, result] = strict.search("(a|aa)+$", "aaaaaaaaaaaaaaaaaaaa!");
	EXPECT_EQ(errc.category, error_category::step_limit_exceeded);
}

TEST(Engine, DeeplyNestedPatterns) {
	engine re;
	std::string plus_pattern;
	for(int i = 0; i < 30; ++i) plus_pattern += "(?:";
	plus_pattern += "a";
	for(int i = 0; i < 30; ++i) plus_pattern += ")+";
	auto [errc, result] = re.search(plus_pattern, "aaa");
	ASSERT_TRUE(errc.ok());
	EXPECT_EQ(result, (views{"aaa"}));

	std::string groups = std::string(50000, '(') + "a" + std::string(50000, ')');
	auto [deep_errc, deep] = re.search(groups, "a");
	EXPECT_EQ(deep_errc.category, error_category::nesting_too_deep);
	EXPECT_EQ(deep_errc.kind(), error_kind::pattern_syntax);
	EXPECT_TRUE(deep.empty());
}

TEST(Engine, SyntaxErrors) {
	engine re;
	auto [errc, result] = re.search("(abc", "abc");
	EXPECT_EQ(errc.kind(), error_kind::pattern_syntax);
	EXPECT_EQ(errc.category, error_category::missing_paren);
	EXPECT_EQ(errc.position, 0u);
	EXPECT_TRUE(result.empty());
	EXPECT_EQ(fmt::format("{}", errc), "PatternSyntaxError: missing parentheses at position 0");

	// errors are not cached
	EXPECT_FALSE(re.is_cached("(abc"));
	EXPECT_EQ(re.cached_patterns(), 0u);
}

TEST(Engine, SearchIsIdempotent) {
	engine re;
	auto [errc, first] = re.search("\\w+@\\w+\\.com", "mail bob@example.com or eve@test.com");
	auto [errc_again, second] = re.search("\\w+@\\w+\\.com", "mail bob@example.com or eve@test.com");
	ASSERT_TRUE(errc.ok());
	ASSERT_TRUE(errc_again.ok());
	EXPECT_EQ(first, second);
	EXPECT_EQ(first, (views{"bob@example.com", "eve@test.com"}));
}

TEST(Engine, SearchAllReturnsCaptures) {
	engine re;
	auto [errc, results] = re.search_all("(\\w+)=(\\d+)?", "x=1 y=");
	ASSERT_TRUE(errc.ok());
	ASSERT_EQ(results.size(), 2u);
	EXPECT_EQ(results[0], (views{"x=1", "x", "1"}));
	EXPECT_EQ(results[1][0], "y=");
	// a group that did not participate yields an empty view
	EXPECT_TRUE(results[1][2].empty());
	EXPECT_EQ(results[1][2].data(), nullptr);
}

TEST(Engine, MatchCoversTheWholeText) {
	engine re;
	auto [errc, result] = re.match("(\\d+)-(\\d+)", "10-20");
	ASSERT_TRUE(errc.ok());
	EXPECT_EQ(result, (views{"10-20", "10", "20"}));

	auto [alt_errc, alt] = re.match("a|ab", "ab");
	ASSERT_TRUE(alt_errc.ok());
	EXPECT_EQ(alt, (views{"ab"}));

	auto [no_errc, none] = re.match("(\\d+)-(\\d+)", "10-20 ");
	ASSERT_TRUE(no_errc.ok());
	EXPECT_TRUE(none.empty());
}

TEST(Engine, Contains) {
	engine re;
	auto [errc, found] = re.contains("\\berror\\b", "an error occurred");
	ASSERT_TRUE(errc.ok());
	EXPECT_TRUE(found);

	auto [errc_missing, missing] = re.contains("\\berror\\b", "no errors here");
	ASSERT_TRUE(errc_missing.ok());
	EXPECT_FALSE(missing);
}

TEST(Engine, Replace) {
	engine re;
	std::string text = "a1b22c333";
	auto [errc, count] = re.replace("\\d+", text, "#");
	ASSERT_TRUE(errc.ok());
	EXPECT_EQ(count, 3u);
	EXPECT_EQ(text, "a#b#c#");

	text = "a1b22c333";
	auto [limited_errc, limited] = re.replace("\\d+", text, "<num>", 2);
	ASSERT_TRUE(limited_errc.ok());
	EXPECT_EQ(limited, 2u);
	EXPECT_EQ(text, "a<num>b<num>c333");

	text = "ab";
	auto [empty_errc, empty_count] = re.replace("x*", text, "-");
	ASSERT_TRUE(empty_errc.ok());
	EXPECT_EQ(empty_count, 2u);
	EXPECT_EQ(text, "-a-b");
}

TEST(Engine, ReplaceLeavesTheTextOnError) {
	engine re;
	std::string text = "abc";
	auto [errc, count] = re.replace("a{", text, "x");
	EXPECT_EQ(errc.category, error_category::bad_brace_expression);
	EXPECT_EQ(count, 0u);
	EXPECT_EQ(text, "abc");
}

TEST(Engine, CacheIsBoundedAndRecent) {
	engine re{engine_options{.cache_capacity = 2}};
	EXPECT_FALSE(std::get<0>(re.compile("a")));
	EXPECT_FALSE(std::get<0>(re.compile("b")));
	EXPECT_FALSE(std::get<0>(re.compile("a")));
	EXPECT_FALSE(std::get<0>(re.compile("c")));

	EXPECT_EQ(re.cached_patterns(), 2u);
	EXPECT_TRUE(re.is_cached("a"));
	EXPECT_FALSE(re.is_cached("b"));
	EXPECT_TRUE(re.is_cached("c"));
}

TEST(Engine, CachedProgramIsShared) {
	engine re;
	auto [errc, first] = re.compile("(\\w+)@");
	auto [errc_again, second] = re.compile("(\\w+)@");
	ASSERT_TRUE(errc.ok());
	ASSERT_TRUE(errc_again.ok());
	EXPECT_EQ(first, second);
	EXPECT_EQ(first->group_count, 1u);
}

TEST(Engine, DisabledCache) {
	engine re{engine_options{.cache_capacity = 0}};
	auto [errc, result] = re.search("b", "abc");
	ASSERT_TRUE(errc.ok());
	EXPECT_EQ(result, (views{"b"}));
	EXPECT_EQ(re.cached_patterns(), 0u);
}

TEST(Engine, FreeFunctions) {
	auto [errc, result] = search<char>("o", "foo");
	ASSERT_TRUE(errc.ok());
	EXPECT_EQ(result, (views{"o", "o"}));

	auto [match_errc, whole] = match<char>("f(o+)", "foo");
	ASSERT_TRUE(match_errc.ok());
	EXPECT_EQ(whole, (views{"foo", "oo"}));

	std::string text = "x-y-z";
	auto [replace_errc, count] = replace<char>("-", text, "+");
	ASSERT_TRUE(replace_errc.ok());
	EXPECT_EQ(count, 2u);
	EXPECT_EQ(text, "x+y+z");

	auto [compile_errc, prog] = compile<char>("a)");
	EXPECT_EQ(compile_errc, (error_info{error_category::missing_paren, 1}));
	EXPECT_EQ(prog, nullptr);
}

TEST(Engine, ConcurrentSearches) {
	engine re{engine_options{.cache_capacity = 4}};
	const std::vector<std::string> patterns{"\\d+", "[a-z]+", "(\\w)\\1", "x|y", "^\\w+", "\\s"};
	const std::string text = "abc 123 xx yy 9";

	std::vector<views> expected;
	{
		engine reference;
		for(const auto& p: patterns) expected.push_back(std::get<1>(reference.search(p, text)));
	}

	std::vector<std::thread> threads;
	std::vector<int> failures(8, 0);
	for(std::size_t t = 0; t < failures.size(); ++t) {
		threads.emplace_back([&, t]() {
			for(int round = 0; round < 100; ++round) {
				for(std::size_t i = 0; i < patterns.size(); ++i) {
					auto [errc, result] = re.search(patterns[(i + t) % patterns.size()], text);
					if(errc || result != expected[(i + t) % patterns.size()]) ++failures[t];
				}
			}
		});
	}
	for(auto& th: threads) th.join();

	for(auto f: failures) EXPECT_EQ(f, 0);
	EXPECT_LE(re.cached_patterns(), 4u);
}

} // namespace
