
#include "RegexExport.h"
#include "RegexNode.h"
#include <QJsonArray>
#include <QJsonValue>
#include <QTextStream>

namespace {

QString nodeId(int index) {
	return QString::fromLatin1("n%1").arg(index);
}

QJsonValue representation(const RegexNode *node) {

	switch (node->type()) {
	case NodeType::Literal:
		return QString(static_cast<const LiteralNode *>(node)->character());

	case NodeType::CharClass: {
		const CharClassNode *charClass = static_cast<const CharClassNode *>(node);

		QJsonArray chars;
		for (QChar c : charClass->singles()) {
			chars.append(QString(c));
		}

		QJsonArray ranges;
		for (const ClassRange &range : charClass->ranges()) {
			ranges.append(QString::fromLatin1("%1-%2").arg(QString(range.low), QString(range.high)));
		}

		QJsonObject repr;
		repr.insert(QStringLiteral("chars"), chars);
		repr.insert(QStringLiteral("ranges"), ranges);
		repr.insert(QStringLiteral("negated"), charClass->negated());
		return repr;
	}

	default:
		return QJsonValue(QJsonValue::Null);
	}
}

QJsonObject toJson(const RegexNode *node, int *counter) {

	QJsonObject object;
	object.insert(QStringLiteral("id"), nodeId((*counter)++));
	object.insert(QStringLiteral("type"), QString::fromLatin1(node->typeName()));
	object.insert(QStringLiteral("repr"), representation(node));

	QJsonArray children;
	for (const RegexNode *child : node->children()) {
		children.append(toJson(child, counter));
	}

	object.insert(QStringLiteral("children"), children);
	return object;
}

QString escapeLabel(const QString &label) {
	QString escaped = label;
	escaped.replace(QLatin1Char('\\'), QLatin1String("\\\\"));
	escaped.replace(QLatin1Char('"'), QLatin1String("\\\""));
	escaped.replace(QLatin1Char('\n'), QLatin1String("\\n"));
	return escaped;
}

int writeDot(QTextStream &out, const RegexNode *node, int *counter) {

	const int index = (*counter)++;
	out << "  " << nodeId(index) << " [label=\"" << escapeLabel(node->label()) << "\"];\n";

	for (const RegexNode *child : node->children()) {
		const int childIndex = writeDot(out, child, counter);
		out << "  " << nodeId(index) << " -> " << nodeId(childIndex) << ";\n";
	}

	return index;
}

}

//------------------------------------------------------------------------------
// Name: regexAstToJson
//------------------------------------------------------------------------------
QJsonObject regexAstToJson(const RegexNode *root) {
	int counter = 0;
	return toJson(root, &counter);
}

//------------------------------------------------------------------------------
// Name: regexAstToDot
//------------------------------------------------------------------------------
QString regexAstToDot(const RegexNode *root) {

	QString dot;
	QTextStream out(&dot);

	int counter = 0;
	out << "digraph regex {\n";
	writeDot(out, root, &counter);
	out << "}\n";
	out.flush();

	return dot;
}
