
#ifndef REGEX_EXCEPTION_H_
#define REGEX_EXCEPTION_H_

#include <QString>
#include <cstdarg>
#include <cstdio>
#include <stdexcept>

class RegexException : public std::exception {
public:
	explicit RegexException(const char *format, ...) {
		va_list ap;
		va_start(ap, format);
		vsnprintf(error_, sizeof(error_), format, ap);
		va_end(ap);
	}

	const char *what() const noexcept {
		return error_;
	}

private:
	char error_[512];
};

enum class ParseErrorKind {
	UnbalancedParenthesis,
	UnterminatedCharClass,
	DanglingQuantifier,
	InvalidCharClassRange,
	TrailingBackslash,
	NestingTooDeep
};

/* Thrown by the Regex constructor. No part of the pattern is usable after
   this; position() is the offset into the pattern of the offending
   character. */
class RegexParseException : public RegexException {
public:
	RegexParseException(ParseErrorKind kind, int position, const QString &pattern);

public:
	ParseErrorKind kind() const {
		return kind_;
	}

	int position() const {
		return position_;
	}

	static const char *kindName(ParseErrorKind kind);

private:
	ParseErrorKind kind_;
	int            position_;
};

enum class ResourceKind {
	RecursionLimit,
	StepBudget,
	Deadline
};

/* Thrown when a match gives up before it knows the answer. Never means
   "no match". */
class RegexResourceException : public RegexException {
public:
	RegexResourceException(ResourceKind kind, unsigned long steps);

public:
	ResourceKind kind() const {
		return kind_;
	}

	unsigned long steps() const {
		return steps_;
	}

	static const char *kindName(ResourceKind kind);

private:
	ResourceKind  kind_;
	unsigned long steps_;
};

#endif
