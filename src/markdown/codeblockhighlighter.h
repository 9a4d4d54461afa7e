/*
 * codeblockhighlighter.h: KSyntaxHighlighting adapter for fenced code blocks
 *
 * Runs the KSyntaxHighlighting lexer over a code block and decomposes it
 * into HighlightSpans carrying one of a fixed set of theme classes. The
 * concatenated span text always equals the input.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MD2PDF_CODEBLOCKHIGHLIGHTER_H
#define MD2PDF_CODEBLOCKHIGHLIGHTER_H

#include <QList>
#include <QString>

#include <KSyntaxHighlighting/AbstractHighlighter>
#include <KSyntaxHighlighting/Definition>
#include <KSyntaxHighlighting/Theme>

#include <optional>

struct HighlightSpan {
    QString text;
    QString styleClass;

    bool operator==(const HighlightSpan &other) const
    {
        return text == other.text && styleClass == other.styleClass;
    }
};

class CodeBlockHighlighter : public KSyntaxHighlighting::AbstractHighlighter
{
public:
    CodeBlockHighlighter();

    QList<HighlightSpan> highlight(const std::optional<QString> &language,
                                   const QString &content);

    // Resolve a fence language (alias, definition name or file extension).
    // Returns an invalid definition for unknown languages.
    KSyntaxHighlighting::Definition definitionFor(const QString &language) const;

    // Spans as HTML with inline dark theme colours.
    static QString renderHtml(const QList<HighlightSpan> &spans);

    static QString styleClassFor(KSyntaxHighlighting::Theme::TextStyle style);
    static QString colorFor(const QString &styleClass);

    static const QString PlainClass;

protected:
    void applyFormat(int offset, int length,
                     const KSyntaxHighlighting::Format &format) override;

private:
    struct Mark {
        int start;
        int length;
        QString styleClass;
    };

    void appendLine(QList<HighlightSpan> &spans, const QString &line);
    static void appendSpan(QList<HighlightSpan> &spans, const QString &text,
                           const QString &styleClass);

    QList<Mark> m_marks; // lexer output for the current line
};

#endif // MD2PDF_CODEBLOCKHIGHLIGHTER_H
