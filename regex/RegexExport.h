
#ifndef REGEX_EXPORT_H_
#define REGEX_EXPORT_H_

#include <QJsonObject>
#include <QString>

class RegexNode;

/* Describes a compiled tree as
 *   { "id": "n0", "type": "Sequence", "repr": null, "children": [...] }
 * "repr" is the character of a Literal, { "chars", "ranges", "negated" }
 * for a CharClass and null for everything else. Ids are numbered in
 * pre-order. */
QJsonObject regexAstToJson(const RegexNode *root);

// Graphviz source for the tree, one labeled vertex per node.
QString regexAstToDot(const RegexNode *root);

#endif
