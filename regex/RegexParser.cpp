
#include "RegexParser.h"
#include "RegexCommon.h"
#include "RegexException.h"
#include "RegexNode.h"
#include <vector>

//------------------------------------------------------------------------------
// Name: RegexParser
//------------------------------------------------------------------------------
RegexParser::RegexParser(const QString &pattern, int flags) : lexer_(pattern), caseless_((flags & REDFLT_CASE_INSENSITIVE) != 0), matchNewline_((flags & REDFLT_MATCH_NEWLINE) != 0), shortestFirst_((flags & REDFLT_SHORTEST_FIRST) != 0), nesting_(0) {
	token_.kind     = TokenKind::EndOfInput;
	token_.position = 0;
}

/*----------------------------------------------------------------------*
 * parse
 *
 * Parses the whole pattern. The empty pattern is legal and gives an
 * empty sequence, which matches only the empty string.
 *----------------------------------------------------------------------*/
std::unique_ptr<RegexNode> RegexParser::parse() {

	advance();

	std::unique_ptr<RegexNode> root = alternation();

	// Check for proper termination.
	if (token_.kind == TokenKind::RParen) {
		throw RegexParseException(ParseErrorKind::UnbalancedParenthesis, token_.position, lexer_.pattern());
	} else if (token_.kind != TokenKind::EndOfInput) {
		throw RegexException("junk on end"); // "Can't happen" - NOTREACHED
	}

	return root;
}

//------------------------------------------------------------------------------
// Name: alternation
//------------------------------------------------------------------------------
std::unique_ptr<RegexNode> RegexParser::alternation() {

	std::unique_ptr<RegexNode> node = sequence();

	while (token_.kind == TokenKind::Pipe) {
		advance();

		std::unique_ptr<RegexNode> left  = std::move(node);
		std::unique_ptr<RegexNode> right = sequence();
		node.reset(new AlternationNode(std::move(left), std::move(right)));
	}

	return node;
}

//------------------------------------------------------------------------------
// Name: sequence
// Desc: Collects factors up to '|', ')' or the end of the pattern. A
//       sequence of one is just that factor.
//------------------------------------------------------------------------------
std::unique_ptr<RegexNode> RegexParser::sequence() {

	std::vector<std::unique_ptr<RegexNode>> items;

	while (token_.kind != TokenKind::Pipe && token_.kind != TokenKind::RParen && token_.kind != TokenKind::EndOfInput) {
		items.push_back(factor());
	}

	if (items.size() == 1) {
		return std::move(items.front());
	}

	return std::unique_ptr<RegexNode>(new SequenceNode(std::move(items)));
}

//------------------------------------------------------------------------------
// Name: factor
// Desc: An atom and at most one quantifier. A second quantifier is left for
//       atom() to reject.
//------------------------------------------------------------------------------
std::unique_ptr<RegexNode> RegexParser::factor() {

	std::unique_ptr<RegexNode> node = atom();

	switch (token_.kind) {
	case TokenKind::Star:
		advance();
		return std::unique_ptr<RegexNode>(new StarNode(std::move(node), shortestFirst_));
	case TokenKind::Plus:
		advance();
		return std::unique_ptr<RegexNode>(new PlusNode(std::move(node), shortestFirst_));
	case TokenKind::Question:
		advance();
		return std::unique_ptr<RegexNode>(new QuestionNode(std::move(node), shortestFirst_));
	default:
		return node;
	}
}

//------------------------------------------------------------------------------
// Name: atom
//------------------------------------------------------------------------------
std::unique_ptr<RegexNode> RegexParser::atom() {

	switch (token_.kind) {
	case TokenKind::Literal: {
		std::unique_ptr<RegexNode> node(new LiteralNode(token_.ch, caseless_));
		advance();
		return node;
	}

	case TokenKind::Dot:
		advance();
		return std::unique_ptr<RegexNode>(new DotNode(matchNewline_));

	case TokenKind::LBracket:
		return charClass();

	case TokenKind::LParen: {
		const int open = token_.position;

		if (++nesting_ > MaxNestingDepth) {
			throw RegexParseException(ParseErrorKind::NestingTooDeep, open, lexer_.pattern());
		}

		advance();
		std::unique_ptr<RegexNode> inner = alternation();

		if (token_.kind != TokenKind::RParen) {
			throw RegexParseException(ParseErrorKind::UnbalancedParenthesis, open, lexer_.pattern());
		}

		--nesting_;
		advance();
		return std::unique_ptr<RegexNode>(new GroupNode(std::move(inner)));
	}

	case TokenKind::Star:
	case TokenKind::Plus:
	case TokenKind::Question:
		throw RegexParseException(ParseErrorKind::DanglingQuantifier, token_.position, lexer_.pattern());

	default:
		throw RegexException("internal error, 'atom'"); // sequence() stops on anything else
	}
}

/*----------------------------------------------------------------------*
 * charClass
 *
 * Parses a bracket expression; the current token is the '['. A ']'
 * right after '[' or '[^' and a '-' that cannot start a range are
 * members like any other character.
 *----------------------------------------------------------------------*/
std::unique_ptr<RegexNode> RegexParser::charClass() {

	const int open = token_.position;
	bool negated   = false;
	bool first     = true;
	QVector<QChar>      singles;
	QVector<ClassRange> ranges;

	RegexToken tok = lexer_.nextInClass();

	if (tok.kind == TokenKind::Caret) {
		negated = true;
		tok = lexer_.nextInClass();
	}

	for (;;) {
		if (tok.kind == TokenKind::EndOfInput) {
			throw RegexParseException(ParseErrorKind::UnterminatedCharClass, open, lexer_.pattern());
		}

		if (tok.kind == TokenKind::RBracket && !first) {
			break;
		}

		first = false;

		const RegexToken low = tok;
		tok = lexer_.nextInClass();

		if (tok.kind != TokenKind::Dash) {
			singles.append(low.ch);
			continue;
		}

		const RegexToken high = lexer_.nextInClass();

		if (high.kind == TokenKind::EndOfInput) {
			throw RegexParseException(ParseErrorKind::UnterminatedCharClass, open, lexer_.pattern());
		}

		if (high.kind == TokenKind::RBracket) {
			// Trailing '-' as in [a-]
			singles.append(low.ch);
			singles.append(QLatin1Char('-'));
			tok = high;
			continue;
		}

		if (high.ch < low.ch) {
			throw RegexParseException(ParseErrorKind::InvalidCharClassRange, low.position, lexer_.pattern());
		}

		ClassRange range = {low.ch, high.ch};
		ranges.append(range);
		tok = lexer_.nextInClass();
	}

	advance();
	return std::unique_ptr<RegexNode>(new CharClassNode(negated, singles, ranges, caseless_));
}

//------------------------------------------------------------------------------
// Name: advance
//------------------------------------------------------------------------------
void RegexParser::advance() {
	token_ = lexer_.next();
}
