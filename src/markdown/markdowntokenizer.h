/*
 * markdowntokenizer.h: MD4C -> Markdown::Event adapter
 *
 * Same callback structure as the MD4C builders elsewhere: static
 * trampolines forward to instance handlers, which translate MD4C's
 * enter/leave notifications into the flat event sequence consumed by
 * HtmlTransformer.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MD2PDF_MARKDOWNTOKENIZER_H
#define MD2PDF_MARKDOWNTOKENIZER_H

#include <QString>
#include <QStringList>

#include <md4c.h>

#include <optional>

#include "eventstream.h"
#include "footnoteparser.h"

class MarkdownTokenizer
{
public:
    MarkdownTokenizer() = default;

    Markdown::BufferedEventStream tokenize(const QString &markdownText);

    // True when MD4C aborted; the stream then holds the events produced
    // up to that point.
    bool parseAborted() const { return m_parseAborted; }

private:
    // Runs MD4C over markdown, appending to m_stream
    void parse(const QString &markdown);

    // MD4C static callbacks
    static int sEnterBlock(MD_BLOCKTYPE type, void *detail, void *userdata);
    static int sLeaveBlock(MD_BLOCKTYPE type, void *detail, void *userdata);
    static int sEnterSpan(MD_SPANTYPE type, void *detail, void *userdata);
    static int sLeaveSpan(MD_SPANTYPE type, void *detail, void *userdata);
    static int sText(MD_TEXTTYPE type, const MD_CHAR *text, MD_SIZE size,
                     void *userdata);

    // Instance handlers
    int enterBlock(MD_BLOCKTYPE type, void *detail);
    int leaveBlock(MD_BLOCKTYPE type, void *detail);
    int enterSpan(MD_SPANTYPE type, void *detail);
    int leaveSpan(MD_SPANTYPE type, void *detail);
    int onText(MD_TEXTTYPE type, const MD_CHAR *text, MD_SIZE size);

    // Event output
    void emitEvent(Markdown::Event event);
    void appendText(const QString &text);
    void flushText();

    // Helpers
    static QString extractAttribute(const MD_ATTRIBUTE &attr);
    static QString resolveEntity(const QString &entity);

    Markdown::BufferedEventStream m_stream;
    bool m_parseAborted = false;

    // Normal text is buffered so adjacent MD4C text runs (and entities)
    // become a single Text event, and footnote references split across
    // runs are still found.
    QString m_pendingText;

    // Code block
    bool m_inCodeBlock = false;
    std::optional<QString> m_codeLanguage;
    QString m_codeText;

    // Code span
    bool m_inCodeSpan = false;
    QString m_codeSpanText;

    // Image
    int m_imageDepth = 0; // > 0 while collecting alt text
    QString m_altText;
    QString m_imageSrc;
    QString m_imageTitle;

    // Table
    bool m_inTableCell = false;
    QString m_cellText;
    QStringList m_rowCells;

    // Footnotes
    FootnoteParser m_footnoteParser;
};

#endif // MD2PDF_MARKDOWNTOKENIZER_H
