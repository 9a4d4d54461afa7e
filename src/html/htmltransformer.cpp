/*
 * htmltransformer.cpp: Markdown event stream -> HTML fragment
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "htmltransformer.h"
#include "htmlutils.h"

#include <QDebug>

#include <algorithm>

using namespace Markdown;

bool HtmlTransformer::transform(EventStream &events)
{
    m_html.clear();
    m_footnotes.clear();
    m_openBlocks.clear();
    m_tables.clear();
    m_referencedFootnotes.clear();
    m_footnoteDepth = 0;
    m_eventIndex = 0;
    m_error = NoError;
    m_errorString.clear();

    while (auto event = events.next()) {
        if (!handleEvent(*event))
            return false;
        ++m_eventIndex;
    }

    if (!m_openBlocks.isEmpty()) {
        const OpenBlock &innermost = m_openBlocks.top();
        return fail(QStringLiteral("%1 block(s) still open at end of input; innermost is %2 opened at event %3")
                        .arg(m_openBlocks.size())
                        .arg(describe(innermost.start))
                        .arg(innermost.eventIndex));
    }

    if (!m_footnotes.isEmpty()) {
        m_html += QLatin1String("<section class=\"footnotes\">\n<hr />\n<ol>\n");
        m_html += m_footnotes;
        m_html += QLatin1String("</ol>\n</section>\n");
    }

    return true;
}

bool HtmlTransformer::handleEvent(const Event &event)
{
    if (const auto *start = std::get_if<StartBlock>(&event))
        return openBlock(*start);

    if (const auto *end = std::get_if<EndBlock>(&event))
        return closeBlock(*end);

    if (const auto *text = std::get_if<Text>(&event)) {
        target() += HtmlUtils::escapeText(text->text);
    } else if (const auto *code = std::get_if<CodeSpan>(&event)) {
        target() += QLatin1String("<code class=\"inline-code\">")
                    + HtmlUtils::escapeText(code->code) + QLatin1String("</code>");
    } else if (const auto *block = std::get_if<CodeBlock>(&event)) {
        writeCodeBlock(*block);
    } else if (const auto *link = std::get_if<LinkStart>(&event)) {
        QString tag = QStringLiteral("<a href=\"%1\"").arg(HtmlUtils::quoteUrl(link->url));
        if (!link->title.isEmpty())
            tag += QStringLiteral(" title=\"%1\"").arg(HtmlUtils::escapeText(link->title));
        tag += QLatin1Char('>');
        return openBlock(StartBlock{BlockKind::Link}, tag);
    } else if (const auto *image = std::get_if<ImageStart>(&event)) {
        QString tag = QStringLiteral("<img src=\"%1\" alt=\"%2\"")
                          .arg(HtmlUtils::quoteUrl(image->url), HtmlUtils::escapeText(image->alt));
        if (!image->title.isEmpty())
            tag += QStringLiteral(" title=\"%1\"").arg(HtmlUtils::escapeText(image->title));
        tag += QLatin1String(" />");
        target() += tag;
    } else if (std::holds_alternative<ThematicBreak>(event)) {
        target() += QLatin1String("<hr />\n");
    } else if (const auto *row = std::get_if<TableRow>(&event)) {
        writeTableRow(*row);
    } else if (const auto *marker = std::get_if<TaskMarker>(&event)) {
        writeTaskMarker(*marker);
    } else if (std::holds_alternative<SoftBreak>(event)) {
        target() += QLatin1Char('\n');
    } else if (std::holds_alternative<HardBreak>(event)) {
        target() += QLatin1String("<br />\n");
    } else if (const auto *ref = std::get_if<FootnoteReference>(&event)) {
        writeFootnoteReference(*ref);
    } else if (const auto *unsupported = std::get_if<Unsupported>(&event)) {
        target() += HtmlUtils::escapeText(unsupported->text);
    }

    return true;
}

// --- Nesting ---

bool HtmlTransformer::openBlock(const StartBlock &start, const QString &tag)
{
    if (start.kind == BlockKind::Table) {
        m_tables.push(TableState());
        m_openBlocks.push({start, m_eventIndex, -1});
        return true;
    }

    if (start.kind == BlockKind::FootnoteDefinition)
        ++m_footnoteDepth;

    OpenBlock block{start, m_eventIndex, target().size()};
    target() += tag.isEmpty() ? openingTag(start) : tag;
    m_openBlocks.push(block);
    return true;
}

bool HtmlTransformer::closeBlock(const EndBlock &end)
{
    if (m_openBlocks.isEmpty()) {
        return fail(QStringLiteral("Unexpected end of %1 at event %2: no block is open")
                        .arg(describe(end))
                        .arg(m_eventIndex));
    }

    const OpenBlock &open = m_openBlocks.top();
    const bool levelMatches = end.kind != BlockKind::Heading || end.level == open.start.level;
    if (open.start.kind != end.kind || !levelMatches) {
        return fail(QStringLiteral("End of %1 at event %2 does not match the open %3 from event %4")
                        .arg(describe(end))
                        .arg(m_eventIndex)
                        .arg(describe(open.start))
                        .arg(open.eventIndex));
    }

    const OpenBlock block = m_openBlocks.pop();

    if (block.start.kind == BlockKind::Table) {
        const TableState table = m_tables.pop();
        QString html = QStringLiteral("<table>\n");
        if (!table.head.isEmpty())
            html += QLatin1String("<thead>\n") + table.head + QLatin1String("</thead>\n");
        if (!table.body.isEmpty())
            html += QLatin1String("<tbody>\n") + table.body + QLatin1String("</tbody>\n");
        html += QLatin1String("</table>\n");
        target() += html;
        return true;
    }

    if (block.start.kind == BlockKind::FootnoteDefinition
        && m_referencedFootnotes.contains(block.start.label)) {
        const QString id = footnoteId(block.start.label);
        const QString backref =
            QStringLiteral(" <a href=\"#fnref-%1\" class=\"footnote-backref\">&#8617;</a>").arg(id);
        // Keep the link inside the last paragraph of the note
        const QLatin1String paragraphEnd("</p>\n");
        if (target().endsWith(paragraphEnd))
            target().insert(target().size() - paragraphEnd.size(), backref);
        else
            target() += backref;
    }

    target() += closingTag(block.start);

    if (block.start.kind == BlockKind::FootnoteDefinition)
        --m_footnoteDepth;

    return true;
}

bool HtmlTransformer::fail(const QString &message)
{
    m_error = StructuralError;
    m_errorString = message;
    qWarning() << "HtmlTransformer:" << message;
    return false;
}

// --- Leaf writers ---

void HtmlTransformer::writeCodeBlock(const CodeBlock &block)
{
    const QString language = (block.language && !block.language->trimmed().isEmpty())
                                 ? block.language->trimmed()
                                 : CodeBlockHighlighter::PlainClass;
    const QString attr = HtmlUtils::escapeText(language);

    const QList<HighlightSpan> spans = m_highlighter.highlight(block.language, block.content);

    QString &out = target();
    out += QStringLiteral("<div class=\"code-block\" data-language=\"%1\"><pre><code class=\"language-%1\">")
               .arg(attr);
    out += CodeBlockHighlighter::renderHtml(spans);
    out += QLatin1String("</code></pre></div>\n");
}

// The first row of a table is its header; there is no separate marker.
void HtmlTransformer::writeTableRow(const TableRow &row)
{
    const bool inTable = !m_openBlocks.isEmpty()
                         && m_openBlocks.top().start.kind == BlockKind::Table;
    if (!inTable) {
        // Stray row: keep the cell text
        QStringList cells;
        for (const auto &cell : row.cells)
            cells.append(HtmlUtils::escapeText(cell));
        target() += cells.join(QLatin1String(" | "));
        return;
    }

    TableState &table = m_tables.top();
    const bool header = table.rowCount == 0;
    const QLatin1String cellTag = header ? QLatin1String("th") : QLatin1String("td");

    QString html = QStringLiteral("<tr>");
    for (const auto &cell : row.cells)
        html += QStringLiteral("<%1>%2</%1>").arg(cellTag, HtmlUtils::escapeText(cell));
    html += QLatin1String("</tr>\n");

    if (header)
        table.head += html;
    else
        table.body += html;
    ++table.rowCount;
}

void HtmlTransformer::writeTaskMarker(const TaskMarker &marker)
{
    // Tag the enclosing list item so CSS can drop its bullet
    if (!m_openBlocks.isEmpty()) {
        const OpenBlock &item = m_openBlocks.top();
        const QLatin1String plainLi("<li>");
        if (item.start.kind == BlockKind::ListItem && item.tagOffset >= 0
            && QStringView(target()).mid(item.tagOffset, plainLi.size()) == plainLi) {
            target().replace(item.tagOffset, plainLi.size(),
                             QStringLiteral("<li class=\"task-list-item\">"));
        }
    }

    target() += marker.checked
                    ? QLatin1String("<input type=\"checkbox\" disabled checked /> ")
                    : QLatin1String("<input type=\"checkbox\" disabled /> ");
}

void HtmlTransformer::writeFootnoteReference(const FootnoteReference &ref)
{
    const QString id = footnoteId(ref.label);
    QString idAttr;
    if (!m_referencedFootnotes.contains(ref.label)) {
        m_referencedFootnotes.insert(ref.label);
        idAttr = QStringLiteral(" id=\"fnref-%1\"").arg(id);
    }
    target() += QStringLiteral("<sup class=\"footnote-ref\"%1><a href=\"#fn-%2\">%3</a></sup>")
                    .arg(idAttr, id, QString::number(ref.number));
}

// --- Tags ---

QString HtmlTransformer::openingTag(const StartBlock &start)
{
    switch (start.kind) {
    case BlockKind::Paragraph:     return QStringLiteral("<p>");
    case BlockKind::Heading:       return QStringLiteral("<h%1>").arg(std::clamp(start.level, 1, 6));
    case BlockKind::BlockQuote:    return QStringLiteral("<blockquote>\n");
    case BlockKind::BulletList:    return QStringLiteral("<ul>\n");
    case BlockKind::OrderedList:
        if (start.start != 1)
            return QStringLiteral("<ol start=\"%1\">\n").arg(start.start);
        return QStringLiteral("<ol>\n");
    case BlockKind::ListItem:      return QStringLiteral("<li>");
    case BlockKind::Emphasis:      return QStringLiteral("<em>");
    case BlockKind::Strong:        return QStringLiteral("<strong>");
    case BlockKind::Strikethrough: return QStringLiteral("<del>");
    case BlockKind::Underline:     return QStringLiteral("<u>");
    case BlockKind::Link:          return QStringLiteral("<a>"); // attributes come from LinkStart
    case BlockKind::FootnoteDefinition:
        return QStringLiteral("<li id=\"fn-%1\">").arg(footnoteId(start.label));
    case BlockKind::Table:
        break;
    }
    return {};
}

QString HtmlTransformer::closingTag(const StartBlock &start)
{
    switch (start.kind) {
    case BlockKind::Paragraph:     return QStringLiteral("</p>\n");
    case BlockKind::Heading:       return QStringLiteral("</h%1>\n").arg(std::clamp(start.level, 1, 6));
    case BlockKind::BlockQuote:    return QStringLiteral("</blockquote>\n");
    case BlockKind::BulletList:    return QStringLiteral("</ul>\n");
    case BlockKind::OrderedList:   return QStringLiteral("</ol>\n");
    case BlockKind::ListItem:      return QStringLiteral("</li>\n");
    case BlockKind::Emphasis:      return QStringLiteral("</em>");
    case BlockKind::Strong:        return QStringLiteral("</strong>");
    case BlockKind::Strikethrough: return QStringLiteral("</del>");
    case BlockKind::Underline:     return QStringLiteral("</u>");
    case BlockKind::Link:          return QStringLiteral("</a>");
    case BlockKind::FootnoteDefinition:
        return QStringLiteral("</li>\n");
    case BlockKind::Table:
        break;
    }
    return {};
}

QString HtmlTransformer::describe(const StartBlock &start)
{
    if (start.kind == BlockKind::Heading)
        return QStringLiteral("heading level %1").arg(start.level);
    return blockKindName(start.kind);
}

QString HtmlTransformer::describe(const EndBlock &end)
{
    if (end.kind == BlockKind::Heading)
        return QStringLiteral("heading level %1").arg(end.level);
    return blockKindName(end.kind);
}

// Letters, digits and '-' are kept; anything else becomes _<hex>_, so
// distinct labels never share an id.
QString HtmlTransformer::footnoteId(const QString &label)
{
    QString id;
    const QList<uint> codePoints = label.toUcs4();
    for (uint cp : codePoints) {
        if (cp == '-' || (cp < 0x80 && QChar(char16_t(cp)).isLetterOrNumber()))
            id += QLatin1Char(static_cast<char>(cp));
        else
            id += QStringLiteral("_%1_").arg(cp, 0, 16);
    }
    return id;
}
