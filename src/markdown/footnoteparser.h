/*
 * footnoteparser.h: Footnote extraction ahead of MD4C
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MD2PDF_FOOTNOTEPARSER_H
#define MD2PDF_FOOTNOTEPARSER_H

#include <QHash>
#include <QList>
#include <QString>
#include <QStringList>

// Pulls footnote definitions out of markdown text before it reaches MD4C,
// which has no footnote support.
//
//   Reference:   [^label]
//   Definition:  [^label]: Content text
//                    Continuation lines indented by 4 spaces or a tab.
//
//                    Further paragraphs are indented the same way.

struct FootnoteDefinition {
    QString label;
    int number = 0;     // 1-based, by order of first reference
    QString content;
};

class FootnoteParser
{
public:
    FootnoteParser() = default;

    // Returns the markdown with all definitions removed; references are
    // left in place. Populates footnotes().
    QString process(const QString &markdownText);

    // Referenced footnotes by number, then unreferenced ones in source order.
    const QList<FootnoteDefinition> &footnotes() const { return m_footnotes; }

    // Number assigned to label, or 0 if there is no such definition.
    int numberFor(const QString &label) const { return m_numbers.value(label); }

private:
    void assignNumbers(const QStringList &lines, const QList<FootnoteDefinition> &defs);

    QList<FootnoteDefinition> m_footnotes;
    QHash<QString, int> m_numbers;
};

#endif // MD2PDF_FOOTNOTEPARSER_H
