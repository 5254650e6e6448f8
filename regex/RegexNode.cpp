
#include "RegexNode.h"
#include "RegexMatch.h"
#include <cassert>

namespace {

/*--------------------------------------------------------------------*
 * CharCursor
 *
 * Base case of all matching: one end offset if the character at
 * 'offset' is accepted, nothing otherwise.
 *--------------------------------------------------------------------*/
class CharCursor : public RegexCursor {
public:
	CharCursor(RegexMatch &match, const RegexCharNode *node, int offset) : RegexCursor(match), node_(node), offset_(offset), done_(false) {
	}

protected:
	bool advance(int *end) override {
		if (done_) {
			return false;
		}

		done_ = true;

		const QString &text = match_.text();
		if (offset_ < text.size() && node_->accepts(text.at(offset_))) {
			*end = offset_ + 1;
			return true;
		}

		return false;
	}

private:
	const RegexCharNode *const node_;
	const int                  offset_;
	bool                       done_;
};

/*--------------------------------------------------------------------*
 * SequenceCursor
 *
 * Matches items [index, size) of a sequence. For every end of the
 * first item the rest of the sequence is tried from there; when the
 * rest runs dry the next end of the first item is pulled. That is all
 * the backtracking there is.
 *--------------------------------------------------------------------*/
class SequenceCursor : public RegexCursor {
public:
	SequenceCursor(RegexMatch &match, const SequenceNode *node, int index, int offset, int depth) : RegexCursor(match), node_(node), index_(index), offset_(offset), depth_(depth), done_(false) {
	}

protected:
	bool advance(int *end) override {

		if (index_ == node_->size()) {
			if (done_) {
				return false;
			}

			done_ = true;
			*end = offset_;
			return true;
		}

		if (!head_) {
			head_ = match_.open(node_->at(index_), offset_, depth_ + 1);
		}

		for (;;) {
			if (rest_) {
				if (rest_->next(end)) {
					return true;
				}
				rest_.reset();
			}

			int mid;
			if (!head_->next(&mid)) {
				return false;
			}

			match_.enter(depth_ + 1);
			rest_.reset(new SequenceCursor(match_, node_, index_ + 1, mid, depth_ + 1));
		}
	}

private:
	const SequenceNode *const    node_;
	const int                    index_;
	const int                    offset_;
	const int                    depth_;
	bool                         done_;
	std::unique_ptr<RegexCursor> head_;
	std::unique_ptr<RegexCursor> rest_;
};

//------------------------------------------------------------------------------
// Name: AlternationCursor
//------------------------------------------------------------------------------
class AlternationCursor : public RegexCursor {
public:
	AlternationCursor(RegexMatch &match, const AlternationNode *node, int offset, int depth) : RegexCursor(match), node_(node), offset_(offset), depth_(depth), onRight_(false) {
	}

protected:
	bool advance(int *end) override {

		if (!onRight_) {
			if (!current_) {
				current_ = match_.open(node_->left(), offset_, depth_ + 1);
			}

			if (current_->next(end)) {
				return true;
			}

			// Left side is exhausted, backtrack into the right one.
			onRight_ = true;
			current_ = match_.open(node_->right(), offset_, depth_ + 1);
		}

		return current_->next(end);
	}

private:
	const AlternationNode *const node_;
	const int                    offset_;
	const int                    depth_;
	bool                         onRight_;
	std::unique_ptr<RegexCursor> current_;
};

/*--------------------------------------------------------------------*
 * StarCursor
 *
 * Zero or more repetitions of node->inner() starting at 'offset'.
 * Each repetition that actually consumed text continues with a nested
 * StarCursor at its end. A repetition that consumed nothing is never
 * followed, otherwise patterns like (a*)* would recurse forever at
 * the same offset.
 *
 * Greedy order yields everything the nested repetitions yield before
 * 'offset' itself; shortest-first order yields 'offset' first.
 *--------------------------------------------------------------------*/
class StarCursor : public RegexCursor {
public:
	StarCursor(RegexMatch &match, const RepeatNode *node, int offset, int depth) : RegexCursor(match), node_(node), offset_(offset), depth_(depth), selfDone_(false), innerDone_(false) {
	}

protected:
	bool advance(int *end) override {

		if (node_->shortestFirst() && !selfDone_) {
			selfDone_ = true;
			*end = offset_;
			return true;
		}

		for (;;) {
			if (rest_) {
				if (rest_->next(end)) {
					return true;
				}
				rest_.reset();
			}

			if (innerDone_ || !repeat()) {
				break;
			}
		}

		if (!selfDone_) {
			selfDone_ = true;
			*end = offset_;
			return true;
		}

		return false;
	}

private:
	bool repeat() {

		if (!inner_) {
			inner_ = match_.open(node_->inner(), offset_, depth_ + 1);
		}

		int mid;
		while (inner_->next(&mid)) {
			if (mid != offset_) {
				match_.enter(depth_ + 1);
				rest_.reset(new StarCursor(match_, node_, mid, depth_ + 1));
				return true;
			}
		}

		innerDone_ = true;
		inner_.reset();
		return false;
	}

private:
	const RepeatNode *const      node_;
	const int                    offset_;
	const int                    depth_;
	bool                         selfDone_;
	bool                         innerDone_;
	std::unique_ptr<RegexCursor> inner_;
	std::unique_ptr<RegexCursor> rest_;
};

//------------------------------------------------------------------------------
// Name: PlusCursor
// Desc: One repetition, then a StarCursor from wherever it ended.
//------------------------------------------------------------------------------
class PlusCursor : public RegexCursor {
public:
	PlusCursor(RegexMatch &match, const PlusNode *node, int offset, int depth) : RegexCursor(match), node_(node), offset_(offset), depth_(depth) {
	}

protected:
	bool advance(int *end) override {

		if (!first_) {
			first_ = match_.open(node_->inner(), offset_, depth_ + 1);
		}

		for (;;) {
			if (rest_) {
				if (rest_->next(end)) {
					return true;
				}
				rest_.reset();
			}

			int mid;
			if (!first_->next(&mid)) {
				return false;
			}

			match_.enter(depth_ + 1);
			rest_.reset(new StarCursor(match_, node_, mid, depth_ + 1));
		}
	}

private:
	const PlusNode *const        node_;
	const int                    offset_;
	const int                    depth_;
	std::unique_ptr<RegexCursor> first_;
	std::unique_ptr<RegexCursor> rest_;
};

//------------------------------------------------------------------------------
// Name: QuestionCursor
//------------------------------------------------------------------------------
class QuestionCursor : public RegexCursor {
public:
	QuestionCursor(RegexMatch &match, const QuestionNode *node, int offset, int depth) : RegexCursor(match), node_(node), offset_(offset), depth_(depth), selfDone_(false), innerDone_(false) {
	}

protected:
	bool advance(int *end) override {

		if (node_->shortestFirst() && !selfDone_) {
			selfDone_ = true;
			*end = offset_;
			return true;
		}

		if (!innerDone_) {
			if (!inner_) {
				inner_ = match_.open(node_->inner(), offset_, depth_ + 1);
			}

			if (inner_->next(end)) {
				return true;
			}

			innerDone_ = true;
			inner_.reset();
		}

		if (!selfDone_) {
			selfDone_ = true;
			*end = offset_;
			return true;
		}

		return false;
	}

private:
	const QuestionNode *const    node_;
	const int                    offset_;
	const int                    depth_;
	bool                         selfDone_;
	bool                         innerDone_;
	std::unique_ptr<RegexCursor> inner_;
};

QString quoted(QChar c) {
	return QString::fromLatin1("'%1'").arg(c);
}

}

//------------------------------------------------------------------------------
// Name: next
//------------------------------------------------------------------------------
bool RegexCursor::next(int *end) {
	match_.step();
	return advance(end);
}

//------------------------------------------------------------------------------
// Name: children
//------------------------------------------------------------------------------
QVector<const RegexNode *> RegexNode::children() const {
	return QVector<const RegexNode *>();
}

//------------------------------------------------------------------------------
// Name: label
// Desc: Short human readable description, used by tracing and AST export
//------------------------------------------------------------------------------
QString RegexNode::label() const {
	return QString::fromLatin1(typeName());
}

//------------------------------------------------------------------------------
// Name: typeName
//------------------------------------------------------------------------------
const char *RegexNode::typeName() const {
	switch (type()) {
	case NodeType::Literal:
		return "Literal";
	case NodeType::Dot:
		return "Dot";
	case NodeType::CharClass:
		return "CharClass";
	case NodeType::Group:
		return "Group";
	case NodeType::Sequence:
		return "Sequence";
	case NodeType::Alternation:
		return "Alternation";
	case NodeType::Star:
		return "Star";
	case NodeType::Plus:
		return "Plus";
	case NodeType::Question:
		return "Question";
	}

	return "Unknown";
}

//------------------------------------------------------------------------------
// Name: cursor
//------------------------------------------------------------------------------
std::unique_ptr<RegexCursor> RegexCharNode::cursor(RegexMatch &match, int offset, int depth) const {
	Q_UNUSED(depth);
	return std::unique_ptr<RegexCursor>(new CharCursor(match, this, offset));
}

//------------------------------------------------------------------------------
// Name: LiteralNode
//------------------------------------------------------------------------------
LiteralNode::LiteralNode(QChar c, bool caseless) : ch_(c), caseless_(caseless) {
}

bool LiteralNode::accepts(QChar c) const {
	if (c == ch_) {
		return true;
	}

	return caseless_ && c.toCaseFolded() == ch_.toCaseFolded();
}

QString LiteralNode::label() const {
	return QString::fromLatin1("Literal(%1)").arg(quoted(ch_));
}

//------------------------------------------------------------------------------
// Name: DotNode
//------------------------------------------------------------------------------
DotNode::DotNode(bool matchNewline) : matchNewline_(matchNewline) {
}

bool DotNode::accepts(QChar c) const {
	return matchNewline_ || c != QLatin1Char('\n');
}

//------------------------------------------------------------------------------
// Name: CharClassNode
//------------------------------------------------------------------------------
CharClassNode::CharClassNode(bool negated, const QVector<QChar> &singles, const QVector<ClassRange> &ranges, bool caseless) : negated_(negated), singles_(singles), ranges_(ranges), caseless_(caseless) {
	assert(!singles_.isEmpty() || !ranges_.isEmpty());
}

bool CharClassNode::accepts(QChar c) const {

	bool found = contains(c);

	if (!found && caseless_) {
		found = contains(c.toLower()) || contains(c.toUpper());
	}

	return found != negated_;
}

bool CharClassNode::contains(QChar c) const {

	if (singles_.contains(c)) {
		return true;
	}

	for (const ClassRange &range : ranges_) {
		if (range.low <= c && c <= range.high) {
			return true;
		}
	}

	return false;
}

QString CharClassNode::label() const {

	QString members;
	for (QChar c : singles_) {
		members += c;
	}

	for (const ClassRange &range : ranges_) {
		members += range.low;
		members += QLatin1Char('-');
		members += range.high;
	}

	return QString::fromLatin1("CharClass([%1%2])").arg(negated_ ? QString::fromLatin1("^") : QString(), members);
}

//------------------------------------------------------------------------------
// Name: GroupNode
//------------------------------------------------------------------------------
GroupNode::GroupNode(std::unique_ptr<RegexNode> child) : child_(std::move(child)) {
	assert(child_);
}

std::unique_ptr<RegexCursor> GroupNode::cursor(RegexMatch &match, int offset, int depth) const {
	return match.open(child_.get(), offset, depth + 1);
}

QVector<const RegexNode *> GroupNode::children() const {
	return QVector<const RegexNode *>() << child_.get();
}

//------------------------------------------------------------------------------
// Name: SequenceNode
//------------------------------------------------------------------------------
SequenceNode::SequenceNode(std::vector<std::unique_ptr<RegexNode>> items) : items_(std::move(items)) {
	for (const std::unique_ptr<RegexNode> &item : items_) {
		assert(item);
		Q_UNUSED(item);
	}
}

std::unique_ptr<RegexCursor> SequenceNode::cursor(RegexMatch &match, int offset, int depth) const {
	return std::unique_ptr<RegexCursor>(new SequenceCursor(match, this, 0, offset, depth));
}

QVector<const RegexNode *> SequenceNode::children() const {
	QVector<const RegexNode *> result;
	for (const std::unique_ptr<RegexNode> &item : items_) {
		result.append(item.get());
	}
	return result;
}

//------------------------------------------------------------------------------
// Name: AlternationNode
//------------------------------------------------------------------------------
AlternationNode::AlternationNode(std::unique_ptr<RegexNode> left, std::unique_ptr<RegexNode> right) : left_(std::move(left)), right_(std::move(right)) {
	assert(left_ && right_);
}

std::unique_ptr<RegexCursor> AlternationNode::cursor(RegexMatch &match, int offset, int depth) const {
	return std::unique_ptr<RegexCursor>(new AlternationCursor(match, this, offset, depth));
}

QVector<const RegexNode *> AlternationNode::children() const {
	return QVector<const RegexNode *>() << left_.get() << right_.get();
}

//------------------------------------------------------------------------------
// Name: RepeatNode
//------------------------------------------------------------------------------
RepeatNode::RepeatNode(std::unique_ptr<RegexNode> inner, bool shortestFirst) : inner_(std::move(inner)), shortestFirst_(shortestFirst) {
	assert(inner_);
}

QVector<const RegexNode *> RepeatNode::children() const {
	return QVector<const RegexNode *>() << inner_.get();
}

StarNode::StarNode(std::unique_ptr<RegexNode> inner, bool shortestFirst) : RepeatNode(std::move(inner), shortestFirst) {
}

std::unique_ptr<RegexCursor> StarNode::cursor(RegexMatch &match, int offset, int depth) const {
	return std::unique_ptr<RegexCursor>(new StarCursor(match, this, offset, depth));
}

PlusNode::PlusNode(std::unique_ptr<RegexNode> inner, bool shortestFirst) : RepeatNode(std::move(inner), shortestFirst) {
}

std::unique_ptr<RegexCursor> PlusNode::cursor(RegexMatch &match, int offset, int depth) const {
	return std::unique_ptr<RegexCursor>(new PlusCursor(match, this, offset, depth));
}

QuestionNode::QuestionNode(std::unique_ptr<RegexNode> inner, bool shortestFirst) : RepeatNode(std::move(inner), shortestFirst) {
}

std::unique_ptr<RegexCursor> QuestionNode::cursor(RegexMatch &match, int offset, int depth) const {
	return std::unique_ptr<RegexCursor>(new QuestionCursor(match, this, offset, depth));
}
