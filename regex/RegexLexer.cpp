
#include "RegexLexer.h"
#include "RegexException.h"

namespace {

RegexToken makeToken(TokenKind kind, QChar ch, int position) {
	RegexToken token;
	token.kind     = kind;
	token.ch       = ch;
	token.position = position;
	return token;
}

}

//------------------------------------------------------------------------------
// Name: RegexLexer
//------------------------------------------------------------------------------
RegexLexer::RegexLexer(const QString &pattern) : pattern_(pattern), pos_(0) {
}

//------------------------------------------------------------------------------
// Name: next
// Desc: Classifies the next character outside of a bracket expression.
//       ']', '^' and '-' have no special meaning here and come back as
//       literals.
//------------------------------------------------------------------------------
RegexToken RegexLexer::next() {

	if (pos_ >= pattern_.size()) {
		return makeToken(TokenKind::EndOfInput, QChar(), pos_);
	}

	const int start = pos_;
	const QChar c   = pattern_.at(pos_++);

	switch (c.unicode()) {
	case '.':
		return makeToken(TokenKind::Dot, c, start);
	case '|':
		return makeToken(TokenKind::Pipe, c, start);
	case '*':
		return makeToken(TokenKind::Star, c, start);
	case '+':
		return makeToken(TokenKind::Plus, c, start);
	case '?':
		return makeToken(TokenKind::Question, c, start);
	case '(':
		return makeToken(TokenKind::LParen, c, start);
	case ')':
		return makeToken(TokenKind::RParen, c, start);
	case '[':
		return makeToken(TokenKind::LBracket, c, start);
	case '\\':
		return escape(start);
	default:
		return makeToken(TokenKind::Literal, c, start);
	}
}

//------------------------------------------------------------------------------
// Name: nextInClass
// Desc: Classifies the next character inside a bracket expression, where
//       only '^', '-', ']' and '\' are special.
//------------------------------------------------------------------------------
RegexToken RegexLexer::nextInClass() {

	if (pos_ >= pattern_.size()) {
		return makeToken(TokenKind::EndOfInput, QChar(), pos_);
	}

	const int start = pos_;
	const QChar c   = pattern_.at(pos_++);

	switch (c.unicode()) {
	case '^':
		return makeToken(TokenKind::Caret, c, start);
	case '-':
		return makeToken(TokenKind::Dash, c, start);
	case ']':
		return makeToken(TokenKind::RBracket, c, start);
	case '\\':
		return escape(start);
	default:
		return makeToken(TokenKind::Literal, c, start);
	}
}

//------------------------------------------------------------------------------
// Name: escape
// Desc: '\' makes the following character a literal, whatever it is.
//------------------------------------------------------------------------------
RegexToken RegexLexer::escape(int start) {

	if (pos_ >= pattern_.size()) {
		throw RegexParseException(ParseErrorKind::TrailingBackslash, start, pattern_);
	}

	return makeToken(TokenKind::Literal, pattern_.at(pos_++), start);
}
