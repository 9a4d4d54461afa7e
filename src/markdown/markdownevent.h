/*
 * markdownevent.h: Structural Markdown event types (header-only, std::variant)
 *
 * The tokenizer turns Markdown source into a flat, ordered sequence of
 * these events. Container constructs are bracketed by StartBlock/EndBlock
 * pairs; leaf constructs (code blocks, images, table rows) arrive as a
 * single self-contained event.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MD2PDF_MARKDOWNEVENT_H
#define MD2PDF_MARKDOWNEVENT_H

#include <QString>
#include <QStringList>

#include <optional>
#include <variant>

namespace Markdown {

enum class BlockKind {
    Paragraph,
    Heading,            // level 1-6
    BlockQuote,
    BulletList,
    OrderedList,        // start number
    ListItem,
    Table,
    Emphasis,
    Strong,
    Strikethrough,
    Underline,
    Link,               // opened by LinkStart
    FootnoteDefinition, // label
};

inline QString blockKindName(BlockKind kind)
{
    switch (kind) {
    case BlockKind::Paragraph:          return QStringLiteral("paragraph");
    case BlockKind::Heading:            return QStringLiteral("heading");
    case BlockKind::BlockQuote:         return QStringLiteral("blockquote");
    case BlockKind::BulletList:         return QStringLiteral("bullet list");
    case BlockKind::OrderedList:        return QStringLiteral("ordered list");
    case BlockKind::ListItem:           return QStringLiteral("list item");
    case BlockKind::Table:              return QStringLiteral("table");
    case BlockKind::Emphasis:           return QStringLiteral("emphasis");
    case BlockKind::Strong:             return QStringLiteral("strong");
    case BlockKind::Strikethrough:      return QStringLiteral("strikethrough");
    case BlockKind::Underline:          return QStringLiteral("underline");
    case BlockKind::Link:               return QStringLiteral("link");
    case BlockKind::FootnoteDefinition: return QStringLiteral("footnote definition");
    }
    return QStringLiteral("block");
}

struct StartBlock {
    BlockKind kind = BlockKind::Paragraph;
    int level = 0;      // Heading only
    int start = 1;      // OrderedList only
    QString label;      // FootnoteDefinition only
};

struct EndBlock {
    BlockKind kind = BlockKind::Paragraph;
    int level = 0;
    QString label;
};

struct Text {
    QString text;
};

struct CodeSpan {
    QString code;
};

struct CodeBlock {
    std::optional<QString> language;
    QString content;
};

struct LinkStart {
    QString url;
    QString title;
};

struct ImageStart {
    QString url;
    QString alt;
    QString title;
};

struct ThematicBreak {};

struct TableRow {
    QStringList cells;
};

struct TaskMarker {
    bool checked = false;
};

struct SoftBreak {};
struct HardBreak {};

struct FootnoteReference {
    QString label;
    int number = 0;
};

// Anything the tokenizer reports but has no structural mapping for
// (raw HTML, math). Rendered as plain text.
struct Unsupported {
    QString text;
};

using Event = std::variant<
    StartBlock,
    EndBlock,
    Text,
    CodeSpan,
    CodeBlock,
    LinkStart,
    ImageStart,
    ThematicBreak,
    TableRow,
    TaskMarker,
    SoftBreak,
    HardBreak,
    FootnoteReference,
    Unsupported
>;

} // namespace Markdown

#endif // MD2PDF_MARKDOWNEVENT_H
