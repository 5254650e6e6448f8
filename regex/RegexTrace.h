
#ifndef REGEX_TRACE_H_
#define REGEX_TRACE_H_

#include <QString>
#include <QStringList>

class RegexNode;

/* Receives the life of every node cursor opened during a match: when it is
   first pulled, each end offset it produces, and when it runs dry. A cursor
   abandoned early (because the match already succeeded) never exits. */
class RegexTracer {
public:
	virtual ~RegexTracer() = default;

public:
	virtual void enter(const RegexNode *node, int offset) = 0;
	virtual void matched(const RegexNode *node, int offset, int end) = 0;
	virtual void exit(const RegexNode *node, int offset) = 0;

public:
	static QString enterLine(const RegexNode *node, int offset);
	static QString matchedLine(const RegexNode *node, int offset, int end);
	static QString exitLine(const RegexNode *node, int offset);
};

// Keeps the events as text, e.g. "ENTER Star pos=0", "MATCH Star 0->2".
class RegexTraceRecorder : public RegexTracer {
public:
	void enter(const RegexNode *node, int offset) override;
	void matched(const RegexNode *node, int offset, int end) override;
	void exit(const RegexNode *node, int offset) override;

public:
	const QStringList &lines() const {
		return lines_;
	}

	void clear() {
		lines_.clear();
	}

private:
	QStringList lines_;
};

// Same text as RegexTraceRecorder, written with qDebug().
class RegexDebugTracer : public RegexTracer {
public:
	void enter(const RegexNode *node, int offset) override;
	void matched(const RegexNode *node, int offset, int end) override;
	void exit(const RegexNode *node, int offset) override;
};

#endif
