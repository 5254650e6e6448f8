
#ifndef REGEX_LEXER_H_
#define REGEX_LEXER_H_

#include <QChar>
#include <QString>

enum class TokenKind {
	Literal,
	Dot,
	Pipe,
	Star,
	Plus,
	Question,
	LParen,
	RParen,
	LBracket,
	Caret,
	Dash,
	RBracket,
	EndOfInput
};

struct RegexToken {
	TokenKind kind;
	QChar     ch;       // The character itself, or the escaped one after '\'
	int       position; // Offset of the token in the pattern
};

/* Splits a pattern into tokens. Characters have different meanings inside
   and outside of [], so the parser asks for whichever it needs; the only
   state kept between calls is the cursor. */
class RegexLexer {
public:
	explicit RegexLexer(const QString &pattern);

private:
	RegexLexer(const RegexLexer &) = delete;
	RegexLexer &operator=(const RegexLexer &) = delete;

public:
	RegexToken next();
	RegexToken nextInClass();

public:
	int position() const {
		return pos_;
	}

	const QString &pattern() const {
		return pattern_;
	}

private:
	RegexToken escape(int start);

private:
	const QString pattern_;
	int           pos_; // Input scan position
};

#endif
