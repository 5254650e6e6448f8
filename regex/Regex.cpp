
#include "Regex.h"
#include "RegexMatch.h"
#include "RegexNode.h"
#include "RegexParser.h"
#include <QtDebug>

namespace {

/*--------------------------------------------------------------------*
 * leadingLiteral
 *
 * If every match of 'node' has to begin with one particular character,
 * stores it in '*c'. Only looks through the shapes where that is
 * obvious: a case sensitive literal, possibly first in a sequence,
 * inside a group or repeated by '+'.
 *--------------------------------------------------------------------*/
bool leadingLiteral(const RegexNode *node, QChar *c) {

	switch (node->type()) {
	case NodeType::Literal: {
		const LiteralNode *literal = static_cast<const LiteralNode *>(node);
		if (literal->caseless()) {
			return false;
		}

		*c = literal->character();
		return true;
	}

	case NodeType::Group:
		return leadingLiteral(static_cast<const GroupNode *>(node)->child(), c);

	case NodeType::Plus:
		return leadingLiteral(static_cast<const PlusNode *>(node)->inner(), c);

	case NodeType::Sequence: {
		const SequenceNode *sequence = static_cast<const SequenceNode *>(node);
		return sequence->size() != 0 && leadingLiteral(sequence->at(0), c);
	}

	default:
		return false;
	}
}

}

/*----------------------------------------------------------------------*
 * Regex
 *
 * Compiles a regular expression into the tree used for matching.
 *
 * The default behaviour wrt. case sensitivity, newline matching and
 * quantifier order can be controlled through the defaultFlags argument.
 *----------------------------------------------------------------------*/
Regex::Regex(const QString &exp, int defaultFlags) : regex_(exp), flags_(defaultFlags), hasMatchStart_(false) {

	try {
		RegexParser parser(exp, defaultFlags);
		root_ = parser.parse();
	} catch (const RegexParseException &e) {
		qDebug("Error compiling regex:\n%s", e.what());
		throw;
	}

	// Dig out information for optimizations.
	hasMatchStart_ = leadingLiteral(root_.get(), &matchStart_);
}

//------------------------------------------------------------------------------
// Name: ~Regex
//------------------------------------------------------------------------------
Regex::~Regex() {
}

//------------------------------------------------------------------------------
// Name: matches
//------------------------------------------------------------------------------
bool Regex::matches(const QString &text, const RegexLimits &limits, RegexTracer *tracer) const {
	RegexMatch match(this, text, limits, tracer);
	return match.matchesWhole();
}

//------------------------------------------------------------------------------
// Name: search
//------------------------------------------------------------------------------
bool Regex::search(const QString &text, RegexSpan *span, const RegexLimits &limits, RegexTracer *tracer) const {
	RegexMatch match(this, text, limits, tracer);
	return match.exec(0, span);
}

//------------------------------------------------------------------------------
// Name: findAll
//------------------------------------------------------------------------------
QVector<RegexSpan> Regex::findAll(const QString &text, const RegexLimits &limits, RegexTracer *tracer) const {

	QVector<RegexSpan> spans;
	RegexMatch match(this, text, limits, tracer);

	int from = 0;
	while (from <= text.size()) {
		RegexSpan span;
		if (!match.exec(from, &span)) {
			break;
		}

		spans.append(span);

		// An empty match still has to move us forward.
		from = (span.end == span.start) ? span.start + 1 : span.end;
	}

	return spans;
}

//------------------------------------------------------------------------------
// Name: findAllStrings
//------------------------------------------------------------------------------
QStringList Regex::findAllStrings(const QString &text, const RegexLimits &limits, RegexTracer *tracer) const {

	QStringList strings;
	for (const RegexSpan &span : findAll(text, limits, tracer)) {
		strings.append(text.mid(span.start, span.end - span.start));
	}

	return strings;
}
