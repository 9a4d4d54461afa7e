/*
 * converter.cpp: Markdown source -> HTML fragment
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "converter.h"

#include "htmltransformer.h"
#include "markdowntokenizer.h"

bool Converter::convert(const QString &markdownText)
{
    m_html.clear();
    m_errorString.clear();

    MarkdownTokenizer tokenizer;
    Markdown::BufferedEventStream events = tokenizer.tokenize(markdownText);

    HtmlTransformer transformer;
    const bool ok = transformer.transform(events);
    m_html = transformer.html();
    if (!ok)
        m_errorString = transformer.errorString();
    return ok;
}
