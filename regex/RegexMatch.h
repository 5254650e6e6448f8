
#ifndef REGEX_MATCH_H_
#define REGEX_MATCH_H_

#include "RegexCommon.h"
#include "RegexException.h"
#include <QElapsedTimer>
#include <QString>
#include <memory>

class Regex;
class RegexCursor;
class RegexNode;
class RegexTracer;

/* State of one matches()/search()/findAll() call: the subject text and the
   resource accounting. Lives on the caller's stack for the duration of the
   call and is handed to every cursor; the compiled Regex is only read. */
class RegexMatch {
	friend class Regex;
public:
	RegexMatch(const Regex *regex, const QString &text, const RegexLimits &limits, RegexTracer *tracer);

private:
	RegexMatch(const RegexMatch &) = delete;
	RegexMatch &operator=(const RegexMatch &) = delete;

private:
	bool matchesWhole();
	bool exec(int from, RegexSpan *span);
	bool attempt(int start, int *end);

public:
	std::unique_ptr<RegexCursor> open(const RegexNode *node, int offset, int depth);
	void enter(int depth);
	void step();

public:
	const QString &text() const {
		return text_;
	}

	unsigned long steps() const {
		return steps_;
	}

private:
	void abort(ResourceKind kind);

private:
	const Regex *const  regex_;
	const QString &     text_;
	const RegexLimits   limits_;
	RegexTracer *const  tracer_;  // May be null
	unsigned long       steps_;   // Cursor advances so far
	QElapsedTimer       timer_;
};

#endif
