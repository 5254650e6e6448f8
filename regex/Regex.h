
#ifndef REGEX_H_
#define REGEX_H_

#include "RegexCommon.h"
#include "RegexException.h"
#include <QChar>
#include <QString>
#include <QStringList>
#include <QVector>
#include <memory>

class RegexNode;
class RegexTracer;

/* The compiled form of a regular expression. Built once from the pattern
   text; afterwards it is never modified, so any number of threads may match
   with the same Regex at the same time. */
class Regex {
	friend class RegexMatch;
public:
	/**
	 * @brief Compiles a regular expression.
	 * @param exp - The pattern text.
	 * @param defaultFlags - RE_DEFAULT_FLAG values or'd together
	 * @throws RegexParseException if the pattern is malformed
	 */
	explicit Regex(const QString &exp, int defaultFlags = REDFLT_STANDARD);
	~Regex();

private:
	Regex(const Regex &) = delete;
	Regex &operator=(const Regex &) = delete;

public:
	/**
	 * @brief matches - Does the pattern match all of 'text'?
	 * @throws RegexResourceException if 'limits' stopped the match
	 */
	bool matches(const QString &text, const RegexLimits &limits = RegexLimits(), RegexTracer *tracer = nullptr) const;

	/**
	 * @brief search - Leftmost match in 'text'.
	 * @param span - Receives the match, untouched if there is none.
	 * @return true if there is a match
	 * @throws RegexResourceException if 'limits' stopped the search
	 */
	bool search(const QString &text, RegexSpan *span, const RegexLimits &limits = RegexLimits(), RegexTracer *tracer = nullptr) const;

	/**
	 * @brief findAll - All non-overlapping matches, left to right. After an
	 * empty match the next search starts one character further on.
	 * @throws RegexResourceException if 'limits' stopped the search. The
	 * limits apply to the whole scan, not to each match.
	 */
	QVector<RegexSpan> findAll(const QString &text, const RegexLimits &limits = RegexLimits(), RegexTracer *tracer = nullptr) const;

	// The text of every findAll() match.
	QStringList findAllStrings(const QString &text, const RegexLimits &limits = RegexLimits(), RegexTracer *tracer = nullptr) const;

public:
	const QString &pattern() const {
		return regex_;
	}

	int flags() const {
		return flags_;
	}

	const RegexNode *root() const {
		return root_.get();
	}

private:
	std::unique_ptr<RegexNode> root_;
	QString                    regex_;
	int                        flags_;
	QChar                      matchStart_;    // Character that must begin a match
	bool                       hasMatchStart_; // Is matchStart_ valid?
};

#endif
