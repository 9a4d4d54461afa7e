/*
 * converter.h: Markdown source -> HTML fragment
 *
 * Runs MarkdownTokenizer and HtmlTransformer in sequence.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MD2PDF_CONVERTER_H
#define MD2PDF_CONVERTER_H

#include <QString>

class Converter
{
public:
    Converter() = default;

    bool convert(const QString &markdownText);

    QString html() const { return m_html; }
    QString errorString() const { return m_errorString; }

private:
    QString m_html;
    QString m_errorString;
};

#endif // MD2PDF_CONVERTER_H
