
#include "RegexTrace.h"
#include "RegexNode.h"
#include <QtDebug>

//------------------------------------------------------------------------------
// Name: enterLine
//------------------------------------------------------------------------------
QString RegexTracer::enterLine(const RegexNode *node, int offset) {
	return QString::fromLatin1("ENTER %1 pos=%2").arg(QString::fromLatin1(node->typeName())).arg(offset);
}

//------------------------------------------------------------------------------
// Name: matchedLine
//------------------------------------------------------------------------------
QString RegexTracer::matchedLine(const RegexNode *node, int offset, int end) {
	return QString::fromLatin1("MATCH %1 %2->%3").arg(QString::fromLatin1(node->typeName())).arg(offset).arg(end);
}

//------------------------------------------------------------------------------
// Name: exitLine
//------------------------------------------------------------------------------
QString RegexTracer::exitLine(const RegexNode *node, int offset) {
	return QString::fromLatin1("EXIT %1 pos=%2").arg(QString::fromLatin1(node->typeName())).arg(offset);
}

void RegexTraceRecorder::enter(const RegexNode *node, int offset) {
	lines_.append(enterLine(node, offset));
}

void RegexTraceRecorder::matched(const RegexNode *node, int offset, int end) {
	lines_.append(matchedLine(node, offset, end));
}

void RegexTraceRecorder::exit(const RegexNode *node, int offset) {
	lines_.append(exitLine(node, offset));
}

void RegexDebugTracer::enter(const RegexNode *node, int offset) {
	qDebug() << enterLine(node, offset);
}

void RegexDebugTracer::matched(const RegexNode *node, int offset, int end) {
	qDebug() << matchedLine(node, offset, end);
}

void RegexDebugTracer::exit(const RegexNode *node, int offset) {
	qDebug() << exitLine(node, offset);
}
