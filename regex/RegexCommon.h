
#ifndef REGEX_COMMON_H_
#define REGEX_COMMON_H_

#include <QtGlobal>

// Flags for the Regex constructor. Or'd together.
enum RE_DEFAULT_FLAG {
	REDFLT_STANDARD         = 0,
	REDFLT_CASE_INSENSITIVE = 1, // Literals and [] members compare case folded
	REDFLT_MATCH_NEWLINE    = 2, // '.' also matches '\n'
	REDFLT_SHORTEST_FIRST   = 4  // '*', '+' and '?' try fewer repetitions first
};

/*
 * Measured recursion limits:
 *    Linux:      +/-  40 000 (up to 110 000)
 *    Solaris:    +/-  85 000
 *    HP-UX 11:   +/- 325 000
 *
 * Every level of cursor nesting costs a couple of stack frames, so 10 000
 * ought to be safe.
 */
const int DefaultRecursionLimit = 10000;

// Deepest allowed nesting of () in a pattern.
const int MaxNestingDepth = 1000;

// Half-open range [start, end) of UTF-16 units in the subject text.
struct RegexSpan {
	int start;
	int end;
};

inline bool operator==(const RegexSpan &lhs, const RegexSpan &rhs) {
	return lhs.start == rhs.start && lhs.end == rhs.end;
}

inline bool operator!=(const RegexSpan &lhs, const RegexSpan &rhs) {
	return !(lhs == rhs);
}

/* Resource limits for a single matches()/search()/findAll() call. A call that
   runs into one of them throws RegexResourceException instead of answering. */
struct RegexLimits {
	RegexLimits() : recursionLimit(DefaultRecursionLimit), stepBudget(0), deadlineMs(-1) {
	}

	int           recursionLimit; // Max. nesting depth of live cursors
	unsigned long stepBudget;     // Max. number of cursor advances, 0 means unlimited
	qint64        deadlineMs;     // Wall clock budget in ms, negative means none
};

#endif
