#include <string>
#include <optional>
#include <string_view>

#include "gtest/gtest.h"

#include "dgrep/vm.hpp"
#include "dgrep/compiler.hpp"

namespace {

using namespace dgrep::regex;
using vm_t = impl::backtracking_vm<char>;

class BacktrackingVm: public ::testing::Test {
protected:
	program<char> compile(std::string_view pattern) {
		impl::pattern_compiler<char> compiler;
		auto [errc, prog] = compiler.compile(pattern);
		EXPECT_TRUE(errc.ok()) << pattern << ": " << errc.message();
		return std::move(prog);
	}

	// match attempt at start, expected to finish within the default step limit
	std::optional<match_result> attempt(std::string_view pattern, std::string_view text, std::size_t start = 0, bool anchored_end = false) {
		auto prog = compile(pattern);
		vm_t vm{prog};
		auto [errc, result] = vm.try_match_at(text, start, anchored_end);
		EXPECT_TRUE(errc.ok()) << pattern << ": " << errc.message();
		return result;
	}
};

TEST_F(BacktrackingVm, MatchesAtTheGivenOffsetOnly) {
	auto m = attempt("abc", "xabc", 1);
	ASSERT_TRUE(m.has_value());
	EXPECT_EQ(m->begin, 1u);
	EXPECT_EQ(m->end, 4u);

	EXPECT_FALSE(attempt("abc", "xabc", 0).has_value());
	EXPECT_FALSE(attempt("abc", "xabc", 2).has_value());
}

TEST_F(BacktrackingVm, LeftmostFirstAlternation) {
	auto m = attempt("a|ab", "ab");
	ASSERT_TRUE(m.has_value());
	EXPECT_EQ(m->end, 1u);

	// anchoring the end forces the second alternative
	auto full = attempt("a|ab", "ab", 0, true);
	ASSERT_TRUE(full.has_value());
	EXPECT_EQ(full->end, 2u);

	EXPECT_FALSE(attempt("a|ab", "abc", 0, true).has_value());
}

TEST_F(BacktrackingVm, GreedyAndLazyQuantifiers) {
	EXPECT_EQ(attempt("a+", "aaa")->end, 3u);
	EXPECT_EQ(attempt("a+?", "aaa")->end, 1u);
	EXPECT_EQ(attempt("a??", "aaa")->end, 0u);
	EXPECT_EQ(attempt("a{2,3}?", "aaaa")->end, 2u);
	EXPECT_EQ(attempt("a.*b", "axbxb")->end, 5u);
	EXPECT_EQ(attempt("a.*?b", "axbxb")->end, 3u);
}

TEST_F(BacktrackingVm, Captures) {
	std::string_view text = "me@host";
	auto m = attempt("(\\w+)@(\\w+)", text);
	ASSERT_TRUE(m.has_value());
	ASSERT_EQ(m->groups.size(), 3u);
	EXPECT_EQ(m->view(text, 0), "me@host");
	EXPECT_EQ(m->view(text, 1), "me");
	EXPECT_EQ(m->view(text, 2), "host");
}

TEST_F(BacktrackingVm, GroupThatDidNotParticipateIsUnset) {
	auto m = attempt("(a)|(b)", "b");
	ASSERT_TRUE(m.has_value());
	EXPECT_FALSE(m->groups[1].has_value());
	EXPECT_EQ(m->groups[2], (capture_span{0, 1}));
}

TEST_F(BacktrackingVm, RepeatedGroupKeepsItsLastIteration) {
	std::string_view text = "abcd";
	auto m = attempt("(\\w)+", text);
	ASSERT_TRUE(m.has_value());
	EXPECT_EQ(m->view(text, 1), "d");
}

TEST_F(BacktrackingVm, BacktrackingRestoresCaptures) {
	std::string_view text = "aab";
	// "aa" is never needed, the group ends with the second "a"
	auto m = attempt("(a|aa)+b", text);
	ASSERT_TRUE(m.has_value());
	EXPECT_EQ(m->view(text, 0), "aab");
	EXPECT_EQ(m->view(text, 1), "a");
}

TEST_F(BacktrackingVm, Backreferences) {
	std::string_view text = "hello hello";
	auto m = attempt("(\\w+) \\1", text);
	ASSERT_TRUE(m.has_value());
	EXPECT_EQ(m->end, 11u);

	EXPECT_FALSE(attempt("(\\w+) \\1", "hello world").has_value());
	// an empty capture matches as an empty string
	EXPECT_EQ(attempt("(a*)b\\1", "b")->end, 1u);
}

TEST_F(BacktrackingVm, UnsetBackreferenceFails) {
	EXPECT_FALSE(attempt("(a)|b\\1", "b").has_value());
	EXPECT_FALSE(attempt("(a\\1)", "aa").has_value());
}

TEST_F(BacktrackingVm, BackreferenceSeesThePreviousIteration) {
	std::string_view text = "aba";
	auto m = attempt("(a|b\\1)+", text);
	ASSERT_TRUE(m.has_value());
	EXPECT_EQ(m->end, 3u);
	EXPECT_EQ(m->groups[1], (capture_span{1, 3}));
}

TEST_F(BacktrackingVm, Anchors) {
	EXPECT_TRUE(attempt("^a", "a").has_value());
	EXPECT_FALSE(attempt("^a", "ba", 1).has_value());
	EXPECT_TRUE(attempt("a$", "ba", 1).has_value());
	EXPECT_FALSE(attempt("a$", "ab").has_value());

	EXPECT_EQ(attempt("\\bfoo\\b", "a foo b", 2)->end, 5u);
	EXPECT_FALSE(attempt("\\bfoo\\b", "afoo", 1).has_value());
	EXPECT_TRUE(attempt("\\Boo", "foo", 1).has_value());
}

TEST_F(BacktrackingVm, DotDoesNotMatchNewlines) {
	EXPECT_FALSE(attempt("a.b", "a\nb").has_value());
	EXPECT_FALSE(attempt("a.b", "a\rb").has_value());
	EXPECT_TRUE(attempt("a[^x]b", "a\nb").has_value());
}

TEST_F(BacktrackingVm, EmptyLoopBodiesTerminate) {
	auto m = attempt("(a*)*", "b");
	ASSERT_TRUE(m.has_value());
	EXPECT_TRUE(m->empty());

	EXPECT_EQ(attempt("(a?)*c", "aac")->end, 3u);
	EXPECT_FALSE(attempt("(a*)*b", "aac").has_value());
	EXPECT_EQ(attempt("(a?)+?x", "aax")->end, 3u);
}

TEST_F(BacktrackingVm, StepLimitAbortsTheAttempt) {
	auto prog = compile("(a+)+$");
	std::string text(20, 'a');
	text += '!';

	vm_t limited{prog, 100};
	auto [errc, result] = limited.try_match_at(text, 0);
	EXPECT_EQ(errc.category, error_category::step_limit_exceeded);
	EXPECT_EQ(errc.kind(), error_kind::match_timeout);
	EXPECT_FALSE(result.has_value());

	// a pattern that fails quickly stays within the same limit
	auto quick = compile("b+$");
	vm_t quick_vm{quick, 100};
	auto [quick_errc, quick_result] = quick_vm.try_match_at(text, 0);
	EXPECT_TRUE(quick_errc.ok());
	EXPECT_FALSE(quick_result.has_value());
}

TEST_F(BacktrackingVm, ZeroStepLimitIsUnlimited) {
	auto prog = compile("(a+)+$");
	std::string text(12, 'a');
	text += '!';

	vm_t unlimited{prog, 0};
	auto [errc, result] = unlimited.try_match_at(text, 0);
	EXPECT_TRUE(errc.ok());
	EXPECT_FALSE(result.has_value());
}

} // namespace
