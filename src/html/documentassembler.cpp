/*
 * documentassembler.cpp: HTML fragment -> self-contained printable document
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "documentassembler.h"

#include <QRegularExpression>

namespace {

// %1 is the page margin in CSS pixels. Only local font families are
// named; the renderer falls back to its defaults when they are missing.
const char kStylesheetTemplate[] = R"CSS(
@page {
    size: A4;
    margin: %1px %1px %1px %1px;
}

* {
    margin: 0;
    padding: 0;
    box-sizing: border-box;
}

body {
    font-family: 'Crimson Text', 'Noto Serif', 'DejaVu Serif', Georgia, serif;
    line-height: 1.8;
    color: #2c3e50;
    background-color: #fdfcfb;
    font-size: 16px;
}

.container {
    max-width: 800px;
    margin: 0 auto;
}

h1, h2, h3, h4, h5, h6 {
    font-family: 'Inter', 'Noto Sans', 'DejaVu Sans', Helvetica, Arial, sans-serif;
    color: #1a202c;
    margin-top: 2em;
    margin-bottom: 0.8em;
    font-weight: 700;
    line-height: 1.3;
    page-break-after: avoid;
    break-after: avoid;
}

h1 {
    font-size: 2.5em;
    border-bottom: 3px solid #e74c3c;
    padding-bottom: 0.3em;
    margin-top: 0;
    margin-bottom: 1em;
}

h2 { font-size: 1.9em; color: #2c3e50; }
h3 { font-size: 1.5em; color: #34495e; }
h4 { font-size: 1.25em; }
h5 { font-size: 1.1em; }
h6 { font-size: 1em; font-style: italic; }

p {
    margin-bottom: 1.2em;
    text-align: justify;
    hyphens: auto;
}

a {
    color: #3498db;
    text-decoration: none;
}

strong { font-weight: 700; }
em { font-style: italic; }
del { color: #7f8c8d; }

code.inline-code {
    font-family: 'Fira Code', 'JetBrains Mono', 'DejaVu Sans Mono', Consolas, monospace;
    background-color: #2b303b;
    color: #bf616a;
    padding: 0.15em 0.4em;
    border-radius: 4px;
    font-size: 0.85em;
    border: 1px solid #4f5b66;
}

.code-block {
    background-color: #2b303b;
    border-radius: 8px;
    padding: 1.2em 1.5em;
    margin: 1.5em 0;
    border: 1px solid #4f5b66;
    page-break-inside: avoid;
    break-inside: avoid;
    -webkit-print-color-adjust: exact;
    print-color-adjust: exact;
}

.code-block pre {
    margin: 0;
    font-family: 'Fira Code', 'JetBrains Mono', 'DejaVu Sans Mono', Consolas, monospace;
    font-size: 0.85em;
    line-height: 1.5;
    white-space: pre-wrap;
    word-wrap: break-word;
}

.code-block code {
    color: #c0c5ce;
    background: none;
    font-family: inherit;
}

.hl-keyword { color: #b48ead; }
.hl-string { color: #a3be8c; }
.hl-comment { color: #65737e; font-style: italic; }
.hl-number { color: #d08770; }
.hl-function { color: #8fa1b3; }
.hl-type { color: #ebcb8b; }
.hl-punctuation { color: #96b5b4; }
.hl-identifier { color: #bf616a; }

blockquote {
    border-left: 4px solid #e74c3c;
    margin: 1.5em 0;
    font-style: italic;
    color: #555555;
    background-color: #f9f9f9;
    padding: 1em 1.5em;
    border-radius: 0 8px 8px 0;
}

blockquote p:last-child { margin-bottom: 0; }

ul, ol {
    margin-bottom: 1.2em;
    padding-left: 2em;
}

li { margin-bottom: 0.4em; }
li > ul, li > ol { margin-top: 0.4em; margin-bottom: 0; }

li.task-list-item { list-style: none; }
li.task-list-item input[type="checkbox"] { margin: 0 0.5em 0 -1.4em; vertical-align: middle; }

hr {
    border: none;
    border-top: 2px solid #ecf0f1;
    margin: 2.5em 0;
}

table {
    width: 100%;
    border-collapse: collapse;
    margin: 1.5em 0;
    font-size: 0.95em;
    page-break-inside: avoid;
}

th, td {
    padding: 0.6em 0.75em;
    text-align: left;
    border-bottom: 1px solid #ecf0f1;
}

th {
    background-color: #34495e;
    color: #ffffff;
    font-family: 'Inter', 'Noto Sans', 'DejaVu Sans', Helvetica, Arial, sans-serif;
    font-weight: 600;
    -webkit-print-color-adjust: exact;
    print-color-adjust: exact;
}

tbody tr:nth-child(even) { background-color: #f8f9fa; }

img {
    max-width: 100%;
    height: auto;
    border-radius: 8px;
    margin: 1em 0;
}

sup.footnote-ref { font-size: 0.75em; line-height: 0; }
sup.footnote-ref a { color: #3498db; }

section.footnotes {
    margin-top: 3em;
    font-size: 0.85em;
    color: #555555;
}

section.footnotes hr { margin: 0 0 1em 0; width: 33%; }
a.footnote-backref { margin-left: 0.3em; }

@media screen {
    .container { padding: 40px; }
}
)CSS";

} // namespace

QString AssembledDocument::toHtml() const
{
    QString html;
    html.reserve(m_htmlBody.size() + m_cssTemplate.size() + 512);
    html += QLatin1String("<!DOCTYPE html>\n<html lang=\"en\">\n<head>\n"
                          "<meta charset=\"UTF-8\">\n"
                          "<meta name=\"viewport\" content=\"width=device-width, initial-scale=1.0\">\n"
                          "<title>");
    html += m_title;
    html += QLatin1String("</title>\n<style>");
    html += m_cssTemplate;
    html += QLatin1String("</style>\n</head>\n<body>\n<div class=\"container\">\n");
    html += m_htmlBody;
    html += QLatin1String("</div>\n</body>\n</html>\n");
    return html;
}

AssembledDocument DocumentAssembler::assemble(const QString &htmlBody, const RenderConfig &config)
{
    return AssembledDocument(htmlBody, stylesheet(config.marginPixels), documentTitle(htmlBody));
}

QString DocumentAssembler::stylesheet(int marginPixels)
{
    return QString::fromUtf8(kStylesheetTemplate).arg(qMax(0, marginPixels));
}

QString DocumentAssembler::documentTitle(const QString &htmlBody)
{
    static const QRegularExpression headingRx(
        QStringLiteral(R"(<h([1-6])[^>]*>(.*?)</h\1>)"),
        QRegularExpression::DotMatchesEverythingOption);
    static const QRegularExpression tagRx(QStringLiteral("<[^>]*>"));

    const QRegularExpressionMatch match = headingRx.match(htmlBody);
    if (match.hasMatch()) {
        // Heading text is already escaped; only the inline markup goes
        QString title = match.captured(2);
        title.remove(tagRx);
        title = title.simplified();
        if (!title.isEmpty())
            return title;
    }
    return QStringLiteral("Document");
}
