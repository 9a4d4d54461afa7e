/*
 * htmlutils.h: Shared HTML escaping helpers
 *
 * Used by the transformer for element text and attributes and by the code
 * highlighter for span text.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MD2PDF_HTMLUTILS_H
#define MD2PDF_HTMLUTILS_H

#include <QString>

namespace HtmlUtils {

/// Escape text for use in element content and quoted attribute values.
inline QString escapeText(const QString &text)
{
    QString result;
    result.reserve(text.size() + text.size() / 8);

    for (QChar ch : text) {
        switch (ch.unicode()) {
        case '&':  result.append(QLatin1String("&amp;"));  break;
        case '<':  result.append(QLatin1String("&lt;"));   break;
        case '>':  result.append(QLatin1String("&gt;"));   break;
        case '"':  result.append(QLatin1String("&quot;")); break;
        case '\'': result.append(QLatin1String("&#39;"));  break;
        default:   result.append(ch);                      break;
        }
    }

    return result;
}

/// Make a URL safe inside a double-quoted attribute. URLs are otherwise
/// passed through as written in the source.
inline QString quoteUrl(const QString &url)
{
    QString result = url;
    result.replace(QLatin1Char('"'), QLatin1String("%22"));
    return result;
}

} // namespace HtmlUtils

#endif // MD2PDF_HTMLUTILS_H
