
#include "RegexException.h"
#include <QByteArray>

namespace {

/*--------------------------------------------------------------------*
 * describe
 *
 * Builds "<kind> at offset N" followed by the pattern and a caret
 * under the offending character.
 *--------------------------------------------------------------------*/
QByteArray describe(ParseErrorKind kind, int position, const QString &pattern) {

	QString message = QString::fromLatin1("%1 at offset %2\n%3\n%4^")
		.arg(QString::fromLatin1(RegexParseException::kindName(kind)), QString::number(position), pattern, QString(position, QLatin1Char(' ')));

	return message.toUtf8();
}

}

//------------------------------------------------------------------------------
// Name: RegexParseException
//------------------------------------------------------------------------------
RegexParseException::RegexParseException(ParseErrorKind kind, int position, const QString &pattern) : RegexException("%s", describe(kind, position, pattern).constData()), kind_(kind), position_(position) {
}

//------------------------------------------------------------------------------
// Name: kindName
//------------------------------------------------------------------------------
const char *RegexParseException::kindName(ParseErrorKind kind) {
	switch (kind) {
	case ParseErrorKind::UnbalancedParenthesis:
		return "unbalanced parenthesis";
	case ParseErrorKind::UnterminatedCharClass:
		return "missing right ']'";
	case ParseErrorKind::DanglingQuantifier:
		return "quantifier follows nothing";
	case ParseErrorKind::InvalidCharClassRange:
		return "invalid [] range";
	case ParseErrorKind::TrailingBackslash:
		return "trailing backslash";
	case ParseErrorKind::NestingTooDeep:
		return "() nested too deeply";
	}

	return "unknown error";
}

//------------------------------------------------------------------------------
// Name: RegexResourceException
//------------------------------------------------------------------------------
RegexResourceException::RegexResourceException(ResourceKind kind, unsigned long steps) : RegexException("match aborted: %s after %lu steps", kindName(kind), steps), kind_(kind), steps_(steps) {
}

//------------------------------------------------------------------------------
// Name: kindName
//------------------------------------------------------------------------------
const char *RegexResourceException::kindName(ResourceKind kind) {
	switch (kind) {
	case ResourceKind::RecursionLimit:
		return "recursion limit exceeded";
	case ResourceKind::StepBudget:
		return "step budget exhausted";
	case ResourceKind::Deadline:
		return "deadline expired";
	}

	return "unknown limit";
}
