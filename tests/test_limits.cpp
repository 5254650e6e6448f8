#include <gtest/gtest.h>

#include "regex/Regex.h"
#include <QString>
#include <atomic>
#include <thread>
#include <vector>

namespace {

QString repeated(char c, int n) {
	return QString(n, QLatin1Char(c));
}

}

TEST(Limits, PathologicalPatternTerminates) {
	Regex re(QStringLiteral("(a*)*b"));

	for (int n = 0; n <= 20; n += 5) {
		EXPECT_FALSE(re.matches(repeated('a', n))) << "n = " << n;
	}

	EXPECT_TRUE(re.matches(repeated('a', 20) + QLatin1Char('b')));
}

TEST(Limits, PathologicalPatternWithinGenerousBudget) {
	Regex re(QStringLiteral("(a*)*b"));

	RegexLimits limits;
	limits.stepBudget = 100000000ul;
	EXPECT_FALSE(re.matches(repeated('a', 20), limits));
}

TEST(Limits, StepBudget) {
	Regex re(QStringLiteral("(a*)*b"));

	RegexLimits limits;
	limits.stepBudget = 100000ul;

	try {
		re.matches(repeated('a', 25), limits);
		FAIL() << "expected RegexResourceException";
	} catch (const RegexResourceException &e) {
		EXPECT_EQ(e.kind(), ResourceKind::StepBudget);
		EXPECT_GT(e.steps(), 100000ul);
	}
}

TEST(Limits, StepBudgetAppliesToWholeScan) {
	Regex re(QStringLiteral("a"));
	const QString text = repeated('a', 1000);

	EXPECT_EQ(re.findAll(text).size(), 1000);

	RegexLimits limits;
	limits.stepBudget = 500ul;
	EXPECT_THROW(re.findAll(text, limits), RegexResourceException);
}

TEST(Limits, RecursionLimit) {
	Regex re(QStringLiteral("a*"));

	RegexLimits limits;
	limits.recursionLimit = 1000;

	try {
		re.matches(repeated('a', 3000), limits);
		FAIL() << "expected RegexResourceException";
	} catch (const RegexResourceException &e) {
		EXPECT_EQ(e.kind(), ResourceKind::RecursionLimit);
	}
}

TEST(Limits, RecursionLimitNotReached) {
	Regex re(QStringLiteral("a*"));

	RegexLimits limits;
	limits.recursionLimit = 1000;
	EXPECT_TRUE(re.matches(repeated('a', 100), limits));
}

TEST(Limits, Deadline) {
	Regex re(QStringLiteral("(a*)*b"));

	RegexLimits limits;
	limits.deadlineMs = 20;

	RegexSpan found;
	try {
		re.search(repeated('a', 30), &found, limits);
		FAIL() << "expected RegexResourceException";
	} catch (const RegexResourceException &e) {
		EXPECT_EQ(e.kind(), ResourceKind::Deadline);
	}
}

TEST(Limits, ExceptionMessage) {
	Regex re(QStringLiteral("(a*)*b"));

	RegexLimits limits;
	limits.stepBudget = 10ul;

	try {
		re.matches(repeated('a', 10), limits);
		FAIL() << "expected RegexResourceException";
	} catch (const RegexResourceException &e) {
		EXPECT_STREQ(e.what(), "match aborted: step budget exhausted after 11 steps");
	}
}

TEST(Limits, SharedAcrossThreads) {
	Regex re(QStringLiteral("[a-c]+x|b+"));
	const QString text = QStringLiteral("zzabcabcx bbb");

	std::atomic<int> failures(0);
	std::vector<std::thread> threads;

	for (int i = 0; i < 8; ++i) {
		threads.emplace_back([&re, &text, &failures]() {
			for (int j = 0; j < 200; ++j) {
				const QVector<RegexSpan> spans = re.findAll(text);
				if (spans.size() != 2 || spans[0].start != 2 || spans[0].end != 9 || spans[1].start != 10 || spans[1].end != 13) {
					++failures;
				}
			}
		});
	}

	for (std::thread &thread : threads) {
		thread.join();
	}

	EXPECT_EQ(failures.load(), 0);
}
