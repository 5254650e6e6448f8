
#include "RegexMatch.h"
#include "Regex.h"
#include "RegexNode.h"
#include "RegexTrace.h"
#include <QtDebug>

namespace {

// The deadline is only looked at every this many steps.
const unsigned long DeadlineCheckInterval = 256;

//------------------------------------------------------------------------------
// Name: TracingCursor
// Desc: Reports the life of another cursor to a RegexTracer. Enter is
//       reported on the first pull, like any other lazily started work.
//------------------------------------------------------------------------------
class TracingCursor : public RegexCursor {
public:
	TracingCursor(RegexMatch &match, std::unique_ptr<RegexCursor> inner, RegexTracer *tracer, const RegexNode *node, int offset) : RegexCursor(match), inner_(std::move(inner)), tracer_(tracer), node_(node), offset_(offset), entered_(false), exited_(false) {
	}

protected:
	bool advance(int *end) override {

		if (!entered_) {
			entered_ = true;
			tracer_->enter(node_, offset_);
		}

		if (forward(inner_.get(), end)) {
			tracer_->matched(node_, offset_, *end);
			return true;
		}

		if (!exited_) {
			exited_ = true;
			tracer_->exit(node_, offset_);
		}

		return false;
	}

private:
	const std::unique_ptr<RegexCursor> inner_;
	RegexTracer *const                 tracer_;
	const RegexNode *const             node_;
	const int                          offset_;
	bool                               entered_;
	bool                               exited_;
};

}

//------------------------------------------------------------------------------
// Name: RegexMatch
//------------------------------------------------------------------------------
RegexMatch::RegexMatch(const Regex *regex, const QString &text, const RegexLimits &limits, RegexTracer *tracer) : regex_(regex), text_(text), limits_(limits), tracer_(tracer), steps_(0) {
	if (limits_.deadlineMs >= 0) {
		timer_.start();
	}
}

//------------------------------------------------------------------------------
// Name: matchesWhole
// Desc: True if some way of matching the pattern at offset 0 ends exactly
//       at the end of the text. Stops pulling as soon as one does.
//------------------------------------------------------------------------------
bool RegexMatch::matchesWhole() {

	const int length = text_.size();
	std::unique_ptr<RegexCursor> cursor = open(regex_->root_.get(), 0, 0);

	int end;
	while (cursor->next(&end)) {
		if (end == length) {
			return true;
		}
	}

	return false;
}

//------------------------------------------------------------------------------
// Name:     exec
// Synopsis: leftmost match starting at or after 'from'
// Desc:     Start offsets are tried in increasing order up to and including
//           the end of the text. The first end offset produced at the first
//           start offset that produces any is the answer, even if a later
//           start would give a longer match.
//------------------------------------------------------------------------------
bool RegexMatch::exec(int from, RegexSpan *span) {

	const int length = text_.size();

	for (int start = from; start <= length; ++start) {

		// We know what char match must start with.
		if (regex_->hasMatchStart_) {
			if (start == length || text_.at(start) != regex_->matchStart_) {
				continue;
			}
		}

		int end;
		if (attempt(start, &end)) {
			span->start = start;
			span->end   = end;
			return true;
		}
	}

	return false;
}

//------------------------------------------------------------------------------
// Name: attempt
// Desc: First end offset of the pattern at 'start', if any
//------------------------------------------------------------------------------
bool RegexMatch::attempt(int start, int *end) {
	std::unique_ptr<RegexCursor> cursor = open(regex_->root_.get(), start, 0);
	return cursor->next(end);
}

//------------------------------------------------------------------------------
// Name: open
// Desc: Starts a cursor for 'node', charging it against the recursion limit
//       and hooking up the tracer if there is one.
//------------------------------------------------------------------------------
std::unique_ptr<RegexCursor> RegexMatch::open(const RegexNode *node, int offset, int depth) {

	enter(depth);

	std::unique_ptr<RegexCursor> cursor = node->cursor(*this, offset, depth);

	if (tracer_) {
		cursor.reset(new TracingCursor(*this, std::move(cursor), tracer_, node, offset));
	}

	return cursor;
}

//------------------------------------------------------------------------------
// Name: enter
//------------------------------------------------------------------------------
void RegexMatch::enter(int depth) {
	if (depth > limits_.recursionLimit) {
		abort(ResourceKind::RecursionLimit);
	}
}

//------------------------------------------------------------------------------
// Name: step
//------------------------------------------------------------------------------
void RegexMatch::step() {

	++steps_;

	if (limits_.stepBudget != 0 && steps_ > limits_.stepBudget) {
		abort(ResourceKind::StepBudget);
	}

	if (limits_.deadlineMs >= 0 && (steps_ % DeadlineCheckInterval) == 0 && timer_.hasExpired(limits_.deadlineMs)) {
		abort(ResourceKind::Deadline);
	}
}

//------------------------------------------------------------------------------
// Name: abort
//------------------------------------------------------------------------------
void RegexMatch::abort(ResourceKind kind) {
	qDebug("regex \"%s\": %s after %lu steps", qPrintable(regex_->pattern()), RegexResourceException::kindName(kind), steps_);
	throw RegexResourceException(kind, steps_);
}
