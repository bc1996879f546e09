#pragma once

/*
	Backtracking regular expression engine of dgrep.

	Supported Grammar:
	concat
	alternative           |
	marking grouping      ()
	non-marking grouping  (?:)
	kleene closure        *
	positive closure      +
	optional              ?
	lazy quantifiers      *? +? ?? {m,n}?
	wildcard              .
	brackets              [...], [^...]
	braces                {m} {m,} {m,n}
	anchors               ^ $ \b \B
	classes               \d \D \w \W \s \S
	backreferences        \1 ... \n

	Unsupported:
	zero-width positive/negative lookahead
*/

#include "dgrep/ast.hpp"
#include "dgrep/vm.hpp"
#include "dgrep/error.hpp"
#include "dgrep/engine.hpp"
#include "dgrep/parser.hpp"
#include "dgrep/program.hpp"
#include "dgrep/compiler.hpp"
#include "dgrep/lru_cache.hpp"
#include "dgrep/char_class.hpp"
#include "dgrep/match_iterator.hpp"
