
#ifndef REGEX_PARSER_H_
#define REGEX_PARSER_H_

#include "RegexLexer.h"
#include <memory>

class RegexNode;

/* Recursive descent parser. Precedence, loosest first:
 *
 *   alternation := sequence ('|' sequence)*
 *   sequence    := factor*
 *   factor      := atom ('*' | '+' | '?')?
 *   atom        := literal | '.' | class | '(' alternation ')'
 *   class       := '[' '^'? item+ ']'
 *   item        := char | char '-' char
 *
 * Either the whole pattern parses or RegexParseException is thrown and
 * nothing built so far survives.
 */
class RegexParser {
public:
	RegexParser(const QString &pattern, int flags);

private:
	RegexParser(const RegexParser &) = delete;
	RegexParser &operator=(const RegexParser &) = delete;

public:
	std::unique_ptr<RegexNode> parse();

private:
	std::unique_ptr<RegexNode> alternation();
	std::unique_ptr<RegexNode> sequence();
	std::unique_ptr<RegexNode> factor();
	std::unique_ptr<RegexNode> atom();
	std::unique_ptr<RegexNode> charClass();
	void advance();

private:
	RegexLexer lexer_;
	RegexToken token_;   // Current token, not yet consumed
	const bool caseless_;
	const bool matchNewline_;
	const bool shortestFirst_;
	int        nesting_; // Currently open ()'s
};

#endif
