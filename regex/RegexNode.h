
#ifndef REGEX_NODE_H_
#define REGEX_NODE_H_

#include <QChar>
#include <QString>
#include <QVector>
#include <memory>
#include <vector>

class RegexMatch;

/* A lazily evaluated, finite sequence of end offsets. Each call to next()
   produces the next way the node it came from can consume text, or returns
   false once there are no more. Dropping a cursor early is always fine. */
class RegexCursor {
public:
	explicit RegexCursor(RegexMatch &match) : match_(match) {
	}

	virtual ~RegexCursor() = default;

private:
	RegexCursor(const RegexCursor &) = delete;
	RegexCursor &operator=(const RegexCursor &) = delete;

public:
	bool next(int *end);

protected:
	virtual bool advance(int *end) = 0;

	// Advance 'cursor' without charging a step, for cursors that wrap another
	static bool forward(RegexCursor *cursor, int *end) {
		return cursor->advance(end);
	}

protected:
	RegexMatch &match_;
};

enum class NodeType {
	Literal,
	Dot,
	CharClass,
	Group,
	Sequence,
	Alternation,
	Star,
	Plus,
	Question
};

/* A node of the compiled pattern. Nodes never change after the parser built
   them and hold nothing about the text being matched, so one tree can serve
   any number of matches at once. */
class RegexNode {
public:
	RegexNode() = default;
	virtual ~RegexNode() = default;

private:
	RegexNode(const RegexNode &) = delete;
	RegexNode &operator=(const RegexNode &) = delete;

public:
	virtual NodeType type() const = 0;

	/* Starts enumerating the end offsets of this node at 'offset'. 'depth'
	   is the cursor nesting depth of the caller. Use RegexMatch::open
	   rather than calling this directly, it enforces the limits. */
	virtual std::unique_ptr<RegexCursor> cursor(RegexMatch &match, int offset, int depth) const = 0;

	virtual QVector<const RegexNode *> children() const;
	virtual QString label() const;

public:
	const char *typeName() const;
};

// A node that consumes exactly one character when 'accepts' says so.
class RegexCharNode : public RegexNode {
public:
	virtual bool accepts(QChar c) const = 0;
	std::unique_ptr<RegexCursor> cursor(RegexMatch &match, int offset, int depth) const override;
};

class LiteralNode : public RegexCharNode {
public:
	LiteralNode(QChar c, bool caseless);

public:
	NodeType type() const override { return NodeType::Literal; }
	bool accepts(QChar c) const override;
	QString label() const override;

public:
	QChar character() const { return ch_; }
	bool caseless() const   { return caseless_; }

private:
	const QChar ch_;
	const bool  caseless_;
};

// Dot never matches '\n' unless the pattern was compiled with REDFLT_MATCH_NEWLINE.
class DotNode : public RegexCharNode {
public:
	explicit DotNode(bool matchNewline);

public:
	NodeType type() const override { return NodeType::Dot; }
	bool accepts(QChar c) const override;

public:
	bool matchNewline() const { return matchNewline_; }

private:
	const bool matchNewline_;
};

struct ClassRange {
	QChar low;
	QChar high;
};

class CharClassNode : public RegexCharNode {
public:
	CharClassNode(bool negated, const QVector<QChar> &singles, const QVector<ClassRange> &ranges, bool caseless);

public:
	NodeType type() const override { return NodeType::CharClass; }
	bool accepts(QChar c) const override;
	QString label() const override;

public:
	bool negated() const                     { return negated_; }
	const QVector<QChar> &singles() const     { return singles_; }
	const QVector<ClassRange> &ranges() const { return ranges_; }

private:
	bool contains(QChar c) const;

private:
	const bool                negated_;
	const QVector<QChar>      singles_;
	const QVector<ClassRange> ranges_;
	const bool                caseless_;
};

// Parenthesized sub pattern. Matches exactly what its child matches.
class GroupNode : public RegexNode {
public:
	explicit GroupNode(std::unique_ptr<RegexNode> child);

public:
	NodeType type() const override { return NodeType::Group; }
	std::unique_ptr<RegexCursor> cursor(RegexMatch &match, int offset, int depth) const override;
	QVector<const RegexNode *> children() const override;

public:
	const RegexNode *child() const { return child_.get(); }

private:
	const std::unique_ptr<RegexNode> child_;
};

class SequenceNode : public RegexNode {
public:
	explicit SequenceNode(std::vector<std::unique_ptr<RegexNode>> items);

public:
	NodeType type() const override { return NodeType::Sequence; }
	std::unique_ptr<RegexCursor> cursor(RegexMatch &match, int offset, int depth) const override;
	QVector<const RegexNode *> children() const override;

public:
	int size() const                 { return static_cast<int>(items_.size()); }
	const RegexNode *at(int i) const { return items_[i].get(); }

private:
	const std::vector<std::unique_ptr<RegexNode>> items_;
};

// Left alternative first, every one of its ends, then the right one.
class AlternationNode : public RegexNode {
public:
	AlternationNode(std::unique_ptr<RegexNode> left, std::unique_ptr<RegexNode> right);

public:
	NodeType type() const override { return NodeType::Alternation; }
	std::unique_ptr<RegexCursor> cursor(RegexMatch &match, int offset, int depth) const override;
	QVector<const RegexNode *> children() const override;

public:
	const RegexNode *left() const  { return left_.get(); }
	const RegexNode *right() const { return right_.get(); }

private:
	const std::unique_ptr<RegexNode> left_;
	const std::unique_ptr<RegexNode> right_;
};

/* Common part of '*', '+' and '?'. By default more repetitions are tried
   before fewer; 'shortestFirst' reverses that. */
class RepeatNode : public RegexNode {
public:
	RepeatNode(std::unique_ptr<RegexNode> inner, bool shortestFirst);

public:
	QVector<const RegexNode *> children() const override;

public:
	const RegexNode *inner() const { return inner_.get(); }
	bool shortestFirst() const     { return shortestFirst_; }

protected:
	const std::unique_ptr<RegexNode> inner_;
	const bool                       shortestFirst_;
};

class StarNode : public RepeatNode {
public:
	StarNode(std::unique_ptr<RegexNode> inner, bool shortestFirst);

public:
	NodeType type() const override { return NodeType::Star; }
	std::unique_ptr<RegexCursor> cursor(RegexMatch &match, int offset, int depth) const override;
};

class PlusNode : public RepeatNode {
public:
	PlusNode(std::unique_ptr<RegexNode> inner, bool shortestFirst);

public:
	NodeType type() const override { return NodeType::Plus; }
	std::unique_ptr<RegexCursor> cursor(RegexMatch &match, int offset, int depth) const override;
};

class QuestionNode : public RepeatNode {
public:
	QuestionNode(std::unique_ptr<RegexNode> inner, bool shortestFirst);

public:
	NodeType type() const override { return NodeType::Question; }
	std::unique_ptr<RegexCursor> cursor(RegexMatch &match, int offset, int depth) const override;
};

#endif
