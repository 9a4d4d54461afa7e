/*
 * htmltransformer.h: Markdown event stream -> HTML fragment
 *
 * Single pass over the events. A stack of open blocks validates nesting
 * and decides the closing tags; code blocks go through
 * CodeBlockHighlighter, table rows are buffered until the table closes.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MD2PDF_HTMLTRANSFORMER_H
#define MD2PDF_HTMLTRANSFORMER_H

#include <QSet>
#include <QStack>
#include <QString>

#include "codeblockhighlighter.h"
#include "eventstream.h"

class HtmlTransformer
{
public:
    enum Error {
        NoError,
        StructuralError,
    };

    HtmlTransformer() = default;

    // Consumes the stream. On a nesting violation returns false; html()
    // then holds the output produced before the offending event.
    bool transform(Markdown::EventStream &events);

    QString html() const { return m_html; }
    Error error() const { return m_error; }
    QString errorString() const { return m_errorString; }

private:
    struct OpenBlock {
        Markdown::StartBlock start;
        int eventIndex = 0;
        qsizetype tagOffset = -1; // position of the opening tag in target()
    };

    struct TableState {
        QString head;
        QString body;
        int rowCount = 0;
    };

    bool handleEvent(const Markdown::Event &event);
    bool openBlock(const Markdown::StartBlock &start, const QString &tag = QString());
    bool closeBlock(const Markdown::EndBlock &end);

    void writeCodeBlock(const Markdown::CodeBlock &block);
    void writeTableRow(const Markdown::TableRow &row);
    void writeTaskMarker(const Markdown::TaskMarker &marker);
    void writeFootnoteReference(const Markdown::FootnoteReference &ref);

    static QString openingTag(const Markdown::StartBlock &start);
    static QString closingTag(const Markdown::StartBlock &start);
    static QString describe(const Markdown::StartBlock &start);
    static QString describe(const Markdown::EndBlock &end);
    static QString footnoteId(const QString &label);

    bool fail(const QString &message);

    // Footnote definitions are written aside and appended at the end
    QString &target() { return m_footnoteDepth > 0 ? m_footnotes : m_html; }

    CodeBlockHighlighter m_highlighter;

    QString m_html;
    QString m_footnotes;
    QStack<OpenBlock> m_openBlocks;
    QStack<TableState> m_tables;
    QSet<QString> m_referencedFootnotes;
    int m_footnoteDepth = 0;
    int m_eventIndex = 0;

    Error m_error = NoError;
    QString m_errorString;
};

#endif // MD2PDF_HTMLTRANSFORMER_H
