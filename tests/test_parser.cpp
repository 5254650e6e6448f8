#include <gtest/gtest.h>

#include "regex/Regex.h"
#include "regex/RegexNode.h"
#include "regex/RegexParser.h"

namespace {

std::unique_ptr<RegexNode> parse(const char *pattern, int flags = REDFLT_STANDARD) {
	RegexParser parser(QString::fromLatin1(pattern), flags);
	return parser.parse();
}

ParseErrorKind errorOf(const char *pattern, int *position) {
	try {
		parse(pattern);
	} catch (const RegexParseException &e) {
		*position = e.position();
		return e.kind();
	}

	ADD_FAILURE() << "pattern \"" << pattern << "\" parsed";
	return ParseErrorKind::NestingTooDeep;
}

}

TEST(Parser, EmptyPatternIsEmptySequence) {
	std::unique_ptr<RegexNode> root = parse("");
	ASSERT_EQ(root->type(), NodeType::Sequence);
	EXPECT_EQ(static_cast<const SequenceNode *>(root.get())->size(), 0);
}

TEST(Parser, SingleLiteral) {
	std::unique_ptr<RegexNode> root = parse("a");
	ASSERT_EQ(root->type(), NodeType::Literal);
	EXPECT_EQ(static_cast<const LiteralNode *>(root.get())->character(), QLatin1Char('a'));
}

TEST(Parser, Concatenation) {
	std::unique_ptr<RegexNode> root = parse("a.c");
	ASSERT_EQ(root->type(), NodeType::Sequence);

	const SequenceNode *sequence = static_cast<const SequenceNode *>(root.get());
	ASSERT_EQ(sequence->size(), 3);
	EXPECT_EQ(sequence->at(0)->type(), NodeType::Literal);
	EXPECT_EQ(sequence->at(1)->type(), NodeType::Dot);
	EXPECT_EQ(sequence->at(2)->type(), NodeType::Literal);
}

TEST(Parser, AlternationBindsLoosest) {
	std::unique_ptr<RegexNode> root = parse("ab|c");
	ASSERT_EQ(root->type(), NodeType::Alternation);

	const AlternationNode *alternation = static_cast<const AlternationNode *>(root.get());
	EXPECT_EQ(alternation->left()->type(), NodeType::Sequence);
	EXPECT_EQ(alternation->right()->type(), NodeType::Literal);
}

TEST(Parser, AlternationChainsToTheLeft) {
	std::unique_ptr<RegexNode> root = parse("a|b|c");
	ASSERT_EQ(root->type(), NodeType::Alternation);

	const AlternationNode *outer = static_cast<const AlternationNode *>(root.get());
	ASSERT_EQ(outer->left()->type(), NodeType::Alternation);
	EXPECT_EQ(static_cast<const LiteralNode *>(outer->right())->character(), QLatin1Char('c'));

	const AlternationNode *inner = static_cast<const AlternationNode *>(outer->left());
	EXPECT_EQ(static_cast<const LiteralNode *>(inner->left())->character(), QLatin1Char('a'));
	EXPECT_EQ(static_cast<const LiteralNode *>(inner->right())->character(), QLatin1Char('b'));
}

TEST(Parser, EmptyAlternatives) {
	std::unique_ptr<RegexNode> root = parse("a|");
	ASSERT_EQ(root->type(), NodeType::Alternation);

	const AlternationNode *alternation = static_cast<const AlternationNode *>(root.get());
	ASSERT_EQ(alternation->right()->type(), NodeType::Sequence);
	EXPECT_EQ(static_cast<const SequenceNode *>(alternation->right())->size(), 0);
}

TEST(Parser, QuantifierBindsToAtom) {
	std::unique_ptr<RegexNode> root = parse("ab*");
	ASSERT_EQ(root->type(), NodeType::Sequence);

	const SequenceNode *sequence = static_cast<const SequenceNode *>(root.get());
	ASSERT_EQ(sequence->size(), 2);
	ASSERT_EQ(sequence->at(1)->type(), NodeType::Star);
	EXPECT_EQ(static_cast<const StarNode *>(sequence->at(1))->inner()->type(), NodeType::Literal);
}

TEST(Parser, QuantifiedGroup) {
	std::unique_ptr<RegexNode> root = parse("(ab)+c");
	ASSERT_EQ(root->type(), NodeType::Sequence);

	const SequenceNode *sequence = static_cast<const SequenceNode *>(root.get());
	ASSERT_EQ(sequence->size(), 2);
	ASSERT_EQ(sequence->at(0)->type(), NodeType::Plus);

	const RegexNode *group = static_cast<const PlusNode *>(sequence->at(0))->inner();
	ASSERT_EQ(group->type(), NodeType::Group);
	EXPECT_EQ(static_cast<const GroupNode *>(group)->child()->type(), NodeType::Sequence);
}

TEST(Parser, QuestionAndFlags) {
	std::unique_ptr<RegexNode> greedy = parse("a?");
	ASSERT_EQ(greedy->type(), NodeType::Question);
	EXPECT_FALSE(static_cast<const QuestionNode *>(greedy.get())->shortestFirst());

	std::unique_ptr<RegexNode> lazy = parse("a?", REDFLT_SHORTEST_FIRST);
	EXPECT_TRUE(static_cast<const QuestionNode *>(lazy.get())->shortestFirst());
}

TEST(Parser, EmptyGroup) {
	std::unique_ptr<RegexNode> root = parse("()");
	ASSERT_EQ(root->type(), NodeType::Group);
	EXPECT_EQ(static_cast<const GroupNode *>(root.get())->child()->type(), NodeType::Sequence);
}

TEST(Parser, CharClassSinglesAndRanges) {
	std::unique_ptr<RegexNode> root = parse("[^a-cxy]");
	ASSERT_EQ(root->type(), NodeType::CharClass);

	const CharClassNode *charClass = static_cast<const CharClassNode *>(root.get());
	EXPECT_TRUE(charClass->negated());
	ASSERT_EQ(charClass->ranges().size(), 1);
	EXPECT_EQ(charClass->ranges()[0].low, QLatin1Char('a'));
	EXPECT_EQ(charClass->ranges()[0].high, QLatin1Char('c'));
	ASSERT_EQ(charClass->singles().size(), 2);
	EXPECT_EQ(charClass->singles()[0], QLatin1Char('x'));
	EXPECT_EQ(charClass->singles()[1], QLatin1Char('y'));
}

TEST(Parser, CharClassLiteralBracketAndDash) {
	std::unique_ptr<RegexNode> root = parse("[]a-]");
	ASSERT_EQ(root->type(), NodeType::CharClass);

	const CharClassNode *charClass = static_cast<const CharClassNode *>(root.get());
	EXPECT_FALSE(charClass->negated());
	EXPECT_TRUE(charClass->ranges().isEmpty());
	ASSERT_EQ(charClass->singles().size(), 3);
	EXPECT_EQ(charClass->singles()[0], QLatin1Char(']'));
	EXPECT_EQ(charClass->singles()[1], QLatin1Char('a'));
	EXPECT_EQ(charClass->singles()[2], QLatin1Char('-'));
}

TEST(Parser, CharClassMetacharactersAreMembers) {
	std::unique_ptr<RegexNode> root = parse("[(*.|]");
	ASSERT_EQ(root->type(), NodeType::CharClass);
	EXPECT_EQ(static_cast<const CharClassNode *>(root.get())->singles().size(), 4);
}

TEST(Parser, UnbalancedParenthesis) {
	int position = -1;
	EXPECT_EQ(errorOf("(a", &position), ParseErrorKind::UnbalancedParenthesis);
	EXPECT_EQ(position, 0);

	EXPECT_EQ(errorOf("a)", &position), ParseErrorKind::UnbalancedParenthesis);
	EXPECT_EQ(position, 1);

	EXPECT_EQ(errorOf("x(a(b)", &position), ParseErrorKind::UnbalancedParenthesis);
	EXPECT_EQ(position, 1);
}

TEST(Parser, DanglingQuantifier) {
	int position = -1;
	EXPECT_EQ(errorOf("*a", &position), ParseErrorKind::DanglingQuantifier);
	EXPECT_EQ(position, 0);

	EXPECT_EQ(errorOf("(+a)", &position), ParseErrorKind::DanglingQuantifier);
	EXPECT_EQ(position, 1);

	EXPECT_EQ(errorOf("a|?", &position), ParseErrorKind::DanglingQuantifier);
	EXPECT_EQ(position, 2);

	EXPECT_EQ(errorOf("a**", &position), ParseErrorKind::DanglingQuantifier);
	EXPECT_EQ(position, 2);
}

TEST(Parser, UnterminatedCharClass) {
	int position = -1;
	EXPECT_EQ(errorOf("[a-", &position), ParseErrorKind::UnterminatedCharClass);
	EXPECT_EQ(position, 0);

	EXPECT_EQ(errorOf("x[abc", &position), ParseErrorKind::UnterminatedCharClass);
	EXPECT_EQ(position, 1);

	EXPECT_EQ(errorOf("[]", &position), ParseErrorKind::UnterminatedCharClass);
	EXPECT_EQ(errorOf("[^", &position), ParseErrorKind::UnterminatedCharClass);
}

TEST(Parser, InvalidCharClassRange) {
	int position = -1;
	EXPECT_EQ(errorOf("[z-a]", &position), ParseErrorKind::InvalidCharClassRange);
	EXPECT_EQ(position, 1);

	EXPECT_EQ(errorOf("ab[xc-b]", &position), ParseErrorKind::InvalidCharClassRange);
	EXPECT_EQ(position, 4);
}

TEST(Parser, NestingTooDeep) {
	QString pattern;
	for (int i = 0; i <= MaxNestingDepth; ++i) {
		pattern += QLatin1Char('(');
	}

	RegexParser parser(pattern, REDFLT_STANDARD);
	try {
		parser.parse();
		FAIL() << "expected RegexParseException";
	} catch (const RegexParseException &e) {
		EXPECT_EQ(e.kind(), ParseErrorKind::NestingTooDeep);
		EXPECT_EQ(e.position(), MaxNestingDepth);
	}
}

TEST(Parser, RegexConstructorReportsParseErrors) {
	EXPECT_THROW(Regex(QStringLiteral("(a")), RegexParseException);
	EXPECT_THROW(Regex(QStringLiteral("*a")), RegexParseException);
	EXPECT_THROW(Regex(QStringLiteral("[a-")), RegexParseException);
	EXPECT_NO_THROW(Regex(QStringLiteral("")));
}

TEST(Parser, ErrorMessagePointsAtOffset) {
	try {
		Regex re(QStringLiteral("ab(c"));
		FAIL() << "expected RegexParseException";
	} catch (const RegexParseException &e) {
		const QString message = QString::fromUtf8(e.what());
		EXPECT_TRUE(message.startsWith(QStringLiteral("unbalanced parenthesis at offset 2")));
		EXPECT_TRUE(message.endsWith(QStringLiteral("ab(c\n  ^")));
	}
}
