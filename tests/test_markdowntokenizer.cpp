/*
 * test_markdowntokenizer.cpp: MD4C callbacks -> Markdown events
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include "markdowntokenizer.h"
#include "qtprinters.h"

using namespace Markdown;

namespace {

QList<Event> tokenize(const QString &markdown)
{
    MarkdownTokenizer tokenizer;
    return tokenizer.tokenize(markdown).pending();
}

template<typename T>
QList<T> eventsOf(const QList<Event> &events)
{
    QList<T> result;
    for (const auto &event : events) {
        if (const auto *e = std::get_if<T>(&event))
            result.append(*e);
    }
    return result;
}

QString allText(const QList<Event> &events)
{
    QString text;
    for (const auto &t : eventsOf<Text>(events))
        text += t.text;
    return text;
}

} // namespace

TEST(MarkdownTokenizerTest, EmptyInputHasNoEvents) {
    EXPECT_TRUE(tokenize(QString()).isEmpty());
}

TEST(MarkdownTokenizerTest, HeadingAndParagraph) {
    const auto events = tokenize(QStringLiteral("## Title\n\nSome *em* text.\n"));

    ASSERT_GE(events.size(), 3);
    const auto *start = std::get_if<StartBlock>(&events[0]);
    ASSERT_NE(start, nullptr);
    EXPECT_EQ(start->kind, BlockKind::Heading);
    EXPECT_EQ(start->level, 2);

    const auto *title = std::get_if<Text>(&events[1]);
    ASSERT_NE(title, nullptr);
    EXPECT_EQ(title->text, QStringLiteral("Title"));

    const auto *end = std::get_if<EndBlock>(&events[2]);
    ASSERT_NE(end, nullptr);
    EXPECT_EQ(end->kind, BlockKind::Heading);
    EXPECT_EQ(end->level, 2);

    const auto starts = eventsOf<StartBlock>(events);
    ASSERT_EQ(starts.size(), 3);
    EXPECT_EQ(starts[1].kind, BlockKind::Paragraph);
    EXPECT_EQ(starts[2].kind, BlockKind::Emphasis);
    EXPECT_EQ(allText(events), QStringLiteral("TitleSome em text."));
}

TEST(MarkdownTokenizerTest, StartAndEndEventsBalance) {
    const auto events = tokenize(QStringLiteral(
        "> quote with **bold _and em_**\n\n"
        "1. one\n2. two\n\n"
        "- [x] done\n- [ ] todo\n"));

    EXPECT_EQ(eventsOf<StartBlock>(events).size(), eventsOf<EndBlock>(events).size());
}

TEST(MarkdownTokenizerTest, FencedCodeWithLanguage) {
    const auto events = tokenize(QStringLiteral("```python\nprint(1)\nx = 2\n```\n"));

    const auto blocks = eventsOf<CodeBlock>(events);
    ASSERT_EQ(blocks.size(), 1);
    ASSERT_TRUE(blocks.first().language.has_value());
    EXPECT_EQ(*blocks.first().language, QStringLiteral("python"));
    EXPECT_EQ(blocks.first().content, QStringLiteral("print(1)\nx = 2\n"));
}

TEST(MarkdownTokenizerTest, FencedCodeWithoutLanguage) {
    const auto blocks = eventsOf<CodeBlock>(tokenize(QStringLiteral("```\nraw *text*\n```\n")));
    ASSERT_EQ(blocks.size(), 1);
    EXPECT_FALSE(blocks.first().language.has_value());
    EXPECT_EQ(blocks.first().content, QStringLiteral("raw *text*\n"));
}

TEST(MarkdownTokenizerTest, InlineCode) {
    const auto spans = eventsOf<CodeSpan>(tokenize(QStringLiteral("Use `a < b` here.\n")));
    ASSERT_EQ(spans.size(), 1);
    EXPECT_EQ(spans.first().code, QStringLiteral("a < b"));
}

TEST(MarkdownTokenizerTest, OrderedListStart) {
    const auto starts = eventsOf<StartBlock>(tokenize(QStringLiteral("3. three\n4. four\n")));
    ASSERT_FALSE(starts.isEmpty());
    EXPECT_EQ(starts.first().kind, BlockKind::OrderedList);
    EXPECT_EQ(starts.first().start, 3);
}

TEST(MarkdownTokenizerTest, TableRows) {
    const auto events = tokenize(QStringLiteral(
        "| Name | Value |\n"
        "|------|-------|\n"
        "| a    | **1** |\n"
        "| b    | 2     |\n"));

    const auto rows = eventsOf<TableRow>(events);
    ASSERT_EQ(rows.size(), 3);
    EXPECT_EQ(rows[0].cells, (QStringList{QStringLiteral("Name"), QStringLiteral("Value")}));
    EXPECT_EQ(rows[1].cells, (QStringList{QStringLiteral("a"), QStringLiteral("1")}));
    EXPECT_EQ(rows[2].cells, (QStringList{QStringLiteral("b"), QStringLiteral("2")}));

    const auto starts = eventsOf<StartBlock>(events);
    ASSERT_EQ(starts.size(), 1);
    EXPECT_EQ(starts.first().kind, BlockKind::Table);
}

TEST(MarkdownTokenizerTest, TaskList) {
    const auto markers = eventsOf<TaskMarker>(tokenize(QStringLiteral("- [x] done\n- [ ] todo\n")));
    ASSERT_EQ(markers.size(), 2);
    EXPECT_TRUE(markers[0].checked);
    EXPECT_FALSE(markers[1].checked);
}

TEST(MarkdownTokenizerTest, LinkWithTitle) {
    const auto events = tokenize(QStringLiteral("[site](https://example.org \"Example\")\n"));

    const auto links = eventsOf<LinkStart>(events);
    ASSERT_EQ(links.size(), 1);
    EXPECT_EQ(links.first().url, QStringLiteral("https://example.org"));
    EXPECT_EQ(links.first().title, QStringLiteral("Example"));

    const auto ends = eventsOf<EndBlock>(events);
    ASSERT_FALSE(ends.isEmpty());
    EXPECT_EQ(ends.first().kind, BlockKind::Link);
    EXPECT_EQ(allText(events), QStringLiteral("site"));
}

TEST(MarkdownTokenizerTest, ImageCollectsAltText) {
    const auto events = tokenize(QStringLiteral("![a *fancy* cat](cat.png)\n"));

    const auto images = eventsOf<ImageStart>(events);
    ASSERT_EQ(images.size(), 1);
    EXPECT_EQ(images.first().url, QStringLiteral("cat.png"));
    EXPECT_EQ(images.first().alt, QStringLiteral("a fancy cat"));
    // Alt text does not leak into the paragraph
    EXPECT_TRUE(allText(events).isEmpty());
    EXPECT_TRUE(eventsOf<StartBlock>(events).size() == 1);
}

TEST(MarkdownTokenizerTest, EntitiesAreDecoded) {
    const auto events = tokenize(QStringLiteral("Tom &amp; Jerry &copy; &#65;&#x42; &bogus;\n"));
    EXPECT_EQ(allText(events), QStringLiteral("Tom & Jerry © AB &bogus;"));
}

TEST(MarkdownTokenizerTest, HardAndSoftBreaks) {
    const auto events = tokenize(QStringLiteral("one  \ntwo\nthree\n"));
    EXPECT_EQ(eventsOf<HardBreak>(events).size(), 1);
    EXPECT_EQ(eventsOf<SoftBreak>(events).size(), 1);
}

TEST(MarkdownTokenizerTest, RawHtmlIsUnsupported) {
    const auto events = tokenize(QStringLiteral("Text with <span>inline</span> html.\n"));
    const auto unsupported = eventsOf<Unsupported>(events);
    ASSERT_EQ(unsupported.size(), 2);
    EXPECT_EQ(unsupported[0].text, QStringLiteral("<span>"));
    EXPECT_EQ(unsupported[1].text, QStringLiteral("</span>"));
}

TEST(MarkdownTokenizerTest, ThematicBreak) {
    const auto events = tokenize(QStringLiteral("above\n\n---\n\nbelow\n"));
    EXPECT_EQ(eventsOf<ThematicBreak>(events).size(), 1);
}

TEST(MarkdownTokenizerTest, Footnotes) {
    const auto events = tokenize(QStringLiteral(
        "Claim[^src] and more[^2].\n"
        "\n"
        "[^2]: Second.\n"
        "[^src]: The source.\n"));

    const auto refs = eventsOf<FootnoteReference>(events);
    ASSERT_EQ(refs.size(), 2);
    EXPECT_EQ(refs[0].label, QStringLiteral("src"));
    EXPECT_EQ(refs[0].number, 1);
    EXPECT_EQ(refs[1].label, QStringLiteral("2"));
    EXPECT_EQ(refs[1].number, 2);

    QStringList defined;
    for (const auto &start : eventsOf<StartBlock>(events)) {
        if (start.kind == BlockKind::FootnoteDefinition)
            defined.append(start.label);
    }
    EXPECT_EQ(defined, (QStringList{QStringLiteral("src"), QStringLiteral("2")}));
    EXPECT_TRUE(allText(events).contains(QStringLiteral("The source.")));
    EXPECT_FALSE(allText(events).contains(QStringLiteral("[^src]")));
}

TEST(MarkdownTokenizerTest, UndefinedFootnoteReferenceStaysText) {
    const auto events = tokenize(QStringLiteral("See[^nope].\n\n[^other]: Other.\n"));
    EXPECT_TRUE(eventsOf<FootnoteReference>(events).isEmpty());
    EXPECT_TRUE(allText(events).contains(QStringLiteral("See[^nope].")));
}

TEST(MarkdownTokenizerTest, CodeBlockKeepsBlankLinesAlongsideFootnotes) {
    const auto events = tokenize(QStringLiteral(
        "```\na\n\n\n\nb\n```\n\nx[^1]\n\n[^1]: n\n"));

    const auto blocks = eventsOf<CodeBlock>(events);
    ASSERT_EQ(blocks.size(), 1);
    EXPECT_EQ(blocks.first().content, QStringLiteral("a\n\n\n\nb\n"));
    EXPECT_EQ(eventsOf<FootnoteReference>(events).size(), 1);
}

TEST(MarkdownTokenizerTest, FootnoteBodiesAreParsed) {
    const auto events = tokenize(QStringLiteral(
        "Claim[^a].\n"
        "\n"
        "[^a]: Some **bold**, see[^b].\n"
        "\n"
        "    More.\n"
        "[^b]: Inner.\n"));

    // Events between the start and end of the first definition
    QList<Event> body;
    bool inside = false;
    for (const auto &event : events) {
        if (const auto *s = std::get_if<StartBlock>(&event);
            s && s->kind == BlockKind::FootnoteDefinition && s->label == QStringLiteral("a")) {
            inside = true;
            continue;
        }
        if (const auto *e = std::get_if<EndBlock>(&event);
            e && e->kind == BlockKind::FootnoteDefinition && inside) {
            break;
        }
        if (inside)
            body.append(event);
    }

    int paragraphs = 0;
    bool strong = false;
    for (const auto &start : eventsOf<StartBlock>(body)) {
        paragraphs += start.kind == BlockKind::Paragraph ? 1 : 0;
        strong = strong || start.kind == BlockKind::Strong;
    }
    EXPECT_EQ(paragraphs, 2);
    EXPECT_TRUE(strong);

    const auto refs = eventsOf<FootnoteReference>(body);
    ASSERT_EQ(refs.size(), 1);
    EXPECT_EQ(refs.first().label, QStringLiteral("b"));
    EXPECT_EQ(refs.first().number, 2);
    EXPECT_FALSE(allText(body).contains(QStringLiteral("**")));
}
