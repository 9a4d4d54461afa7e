/*
 * test_htmltransformer.cpp: Event stream -> HTML fragment
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include "htmltransformer.h"
#include "qtprinters.h"

using namespace Markdown;

namespace {

struct Result {
    bool ok;
    QString html;
    HtmlTransformer::Error error;
    QString errorString;
};

Result run(QList<Event> events)
{
    BufferedEventStream stream(std::move(events));
    HtmlTransformer transformer;
    const bool ok = transformer.transform(stream);
    return {ok, transformer.html(), transformer.error(), transformer.errorString()};
}

StartBlock start(BlockKind kind, int level = 0)
{
    StartBlock s;
    s.kind = kind;
    s.level = level;
    return s;
}

EndBlock end(BlockKind kind, int level = 0)
{
    EndBlock e;
    e.kind = kind;
    e.level = level;
    return e;
}

Event text(const char *t)
{
    return Text{QString::fromUtf8(t)};
}

} // namespace

TEST(HtmlTransformerTest, EmptyStream) {
    const auto r = run({});
    EXPECT_TRUE(r.ok);
    EXPECT_TRUE(r.html.isEmpty());
    EXPECT_EQ(r.error, HtmlTransformer::NoError);
}

TEST(HtmlTransformerTest, ParagraphWithInlineMarkup) {
    const auto r = run({
        start(BlockKind::Paragraph),
        text("a "), start(BlockKind::Emphasis), text("b"), end(BlockKind::Emphasis),
        text(" "), start(BlockKind::Strong), text("c"), end(BlockKind::Strong),
        text(" "), start(BlockKind::Strikethrough), text("d"), end(BlockKind::Strikethrough),
        text(" "), start(BlockKind::Underline), text("e"), end(BlockKind::Underline),
        end(BlockKind::Paragraph),
    });
    ASSERT_TRUE(r.ok) << r.errorString.toStdString();
    EXPECT_EQ(r.html, QStringLiteral("<p>a <em>b</em> <strong>c</strong> <del>d</del> <u>e</u></p>\n"));
}

TEST(HtmlTransformerTest, HeadingLevels) {
    for (int level = 1; level <= 6; ++level) {
        const auto r = run({start(BlockKind::Heading, level), text("T"), end(BlockKind::Heading, level)});
        ASSERT_TRUE(r.ok);
        EXPECT_EQ(r.html, QStringLiteral("<h%1>T</h%1>\n").arg(level));
    }
}

TEST(HtmlTransformerTest, TextIsEscaped) {
    const auto r = run({start(BlockKind::Paragraph), text("<b> & \"q\" 'a'"), end(BlockKind::Paragraph)});
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.html, QStringLiteral("<p>&lt;b&gt; &amp; &quot;q&quot; &#39;a&#39;</p>\n"));
}

TEST(HtmlTransformerTest, ListsAndQuote) {
    StartBlock ordered = start(BlockKind::OrderedList);
    ordered.start = 4;
    const auto r = run({
        start(BlockKind::BlockQuote),
        start(BlockKind::BulletList),
        start(BlockKind::ListItem), text("x"), end(BlockKind::ListItem),
        end(BlockKind::BulletList),
        end(BlockKind::BlockQuote),
        ordered,
        start(BlockKind::ListItem), text("y"), end(BlockKind::ListItem),
        end(BlockKind::OrderedList),
    });
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.html, QStringLiteral("<blockquote>\n<ul>\n<li>x</li>\n</ul>\n</blockquote>\n"
                                     "<ol start=\"4\">\n<li>y</li>\n</ol>\n"));
}

TEST(HtmlTransformerTest, LinkAndImage) {
    const auto r = run({
        start(BlockKind::Paragraph),
        LinkStart{QStringLiteral("https://example.org/?a=\"1\""), QStringLiteral("T & C")},
        text("go"),
        end(BlockKind::Link),
        ImageStart{QStringLiteral("cat.png"), QStringLiteral("a <cat>"), QString()},
        end(BlockKind::Paragraph),
    });
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.html, QStringLiteral(
        "<p><a href=\"https://example.org/?a=%221%22\" title=\"T &amp; C\">go</a>"
        "<img src=\"cat.png\" alt=\"a &lt;cat&gt;\" /></p>\n"));
}

TEST(HtmlTransformerTest, InlineCodeAndBreaks) {
    const auto r = run({
        start(BlockKind::Paragraph),
        CodeSpan{QStringLiteral("a<b")}, SoftBreak{}, text("x"), HardBreak{}, text("y"),
        end(BlockKind::Paragraph),
        ThematicBreak{},
    });
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.html, QStringLiteral(
        "<p><code class=\"inline-code\">a&lt;b</code>\nx<br />\ny</p>\n<hr />\n"));
}

TEST(HtmlTransformerTest, CodeBlockWithoutLanguageIsPlain) {
    const auto r = run({CodeBlock{std::nullopt, QStringLiteral("if (a < b) {}\n")}});
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.html, QStringLiteral(
        "<div class=\"code-block\" data-language=\"plain\"><pre><code class=\"language-plain\">"
        "if (a &lt; b) {}\n</code></pre></div>\n"));
}

TEST(HtmlTransformerTest, CodeBlockWithLanguageIsHighlighted) {
    const auto r = run({CodeBlock{QStringLiteral("python"), QStringLiteral("def f(): pass\n")}});
    ASSERT_TRUE(r.ok);
    EXPECT_TRUE(r.html.startsWith(QStringLiteral(
        "<div class=\"code-block\" data-language=\"python\"><pre><code class=\"language-python\">")));
    EXPECT_TRUE(r.html.contains(QStringLiteral("class=\"hl-keyword\"")));
    EXPECT_TRUE(r.html.endsWith(QStringLiteral("</code></pre></div>\n")));
}

TEST(HtmlTransformerTest, TableFirstRowIsHeader) {
    const auto r = run({
        start(BlockKind::Table),
        TableRow{{QStringLiteral("H1"), QStringLiteral("H2")}},
        TableRow{{QStringLiteral("a"), QStringLiteral("b & c")}},
        TableRow{{QStringLiteral("d"), QStringLiteral("e")}},
        end(BlockKind::Table),
    });
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.html, QStringLiteral(
        "<table>\n"
        "<thead>\n<tr><th>H1</th><th>H2</th></tr>\n</thead>\n"
        "<tbody>\n<tr><td>a</td><td>b &amp; c</td></tr>\n<tr><td>d</td><td>e</td></tr>\n</tbody>\n"
        "</table>\n"));
}

TEST(HtmlTransformerTest, HeaderOnlyTable) {
    const auto r = run({
        start(BlockKind::Table),
        TableRow{{QStringLiteral("only")}},
        end(BlockKind::Table),
    });
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.html, QStringLiteral("<table>\n<thead>\n<tr><th>only</th></tr>\n</thead>\n</table>\n"));
}

TEST(HtmlTransformerTest, TaskListItem) {
    const auto r = run({
        start(BlockKind::BulletList),
        start(BlockKind::ListItem), TaskMarker{true}, text("done"), end(BlockKind::ListItem),
        start(BlockKind::ListItem), TaskMarker{false}, text("todo"), end(BlockKind::ListItem),
        end(BlockKind::BulletList),
    });
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.html, QStringLiteral(
        "<ul>\n"
        "<li class=\"task-list-item\"><input type=\"checkbox\" disabled checked /> done</li>\n"
        "<li class=\"task-list-item\"><input type=\"checkbox\" disabled /> todo</li>\n"
        "</ul>\n"));
}

TEST(HtmlTransformerTest, Footnotes) {
    StartBlock def = start(BlockKind::FootnoteDefinition);
    def.label = QStringLiteral("src");
    EndBlock defEnd = end(BlockKind::FootnoteDefinition);
    defEnd.label = QStringLiteral("src");

    const auto r = run({
        start(BlockKind::Paragraph),
        text("Claim"), FootnoteReference{QStringLiteral("src"), 1},
        text(" again"), FootnoteReference{QStringLiteral("src"), 1},
        end(BlockKind::Paragraph),
        def, text("Source."), defEnd,
    });
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.html, QStringLiteral(
        "<p>Claim<sup class=\"footnote-ref\" id=\"fnref-src\"><a href=\"#fn-src\">1</a></sup>"
        " again<sup class=\"footnote-ref\"><a href=\"#fn-src\">1</a></sup></p>\n"
        "<section class=\"footnotes\">\n<hr />\n<ol>\n"
        "<li id=\"fn-src\">Source. <a href=\"#fnref-src\" class=\"footnote-backref\">&#8617;</a></li>\n"
        "</ol>\n</section>\n"));
}

TEST(HtmlTransformerTest, UnsupportedPassesThroughAsText) {
    const auto r = run({start(BlockKind::Paragraph), Unsupported{QStringLiteral("<span>")},
                        end(BlockKind::Paragraph)});
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.html, QStringLiteral("<p>&lt;span&gt;</p>\n"));
}

TEST(HtmlTransformerTest, UnmatchedEndIsStructuralError) {
    const auto r = run({text("lead"), end(BlockKind::Paragraph)});
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error, HtmlTransformer::StructuralError);
    EXPECT_TRUE(r.errorString.contains(QStringLiteral("paragraph")));
    EXPECT_TRUE(r.errorString.contains(QStringLiteral("event 1")));
    EXPECT_EQ(r.html, QStringLiteral("lead"));
}

TEST(HtmlTransformerTest, MismatchedEndIsStructuralError) {
    const auto r = run({
        start(BlockKind::Paragraph), start(BlockKind::Emphasis), text("x"),
        end(BlockKind::Strong),
    });
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error, HtmlTransformer::StructuralError);
    EXPECT_TRUE(r.errorString.contains(QStringLiteral("strong")));
    EXPECT_TRUE(r.errorString.contains(QStringLiteral("emphasis")));
    // Output before the offending event is kept
    EXPECT_EQ(r.html, QStringLiteral("<p><em>x"));
}

TEST(HtmlTransformerTest, MismatchedHeadingLevel) {
    const auto r = run({start(BlockKind::Heading, 2), text("x"), end(BlockKind::Heading, 3)});
    EXPECT_FALSE(r.ok);
    EXPECT_TRUE(r.errorString.contains(QStringLiteral("heading level 3")));
    EXPECT_TRUE(r.errorString.contains(QStringLiteral("heading level 2")));
}

TEST(HtmlTransformerTest, UnclosedBlockIsStructuralError) {
    const auto r = run({start(BlockKind::BlockQuote), start(BlockKind::Paragraph), text("x")});
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error, HtmlTransformer::StructuralError);
    EXPECT_TRUE(r.errorString.contains(QStringLiteral("2 block(s) still open")));
    EXPECT_TRUE(r.errorString.contains(QStringLiteral("paragraph")));
    EXPECT_EQ(r.html, QStringLiteral("<blockquote>\n<p>x"));
}

TEST(HtmlTransformerTest, TransformerIsReusable) {
    HtmlTransformer transformer;
    BufferedEventStream bad(QList<Event>{end(BlockKind::Paragraph)});
    EXPECT_FALSE(transformer.transform(bad));

    BufferedEventStream good(QList<Event>{start(BlockKind::Paragraph), text("ok"), end(BlockKind::Paragraph)});
    EXPECT_TRUE(transformer.transform(good));
    EXPECT_EQ(transformer.error(), HtmlTransformer::NoError);
    EXPECT_TRUE(transformer.errorString().isEmpty());
    EXPECT_EQ(transformer.html(), QStringLiteral("<p>ok</p>\n"));
}

TEST(HtmlTransformerTest, UnreferencedFootnoteHasNoBackReference) {
    StartBlock def = start(BlockKind::FootnoteDefinition);
    def.label = QStringLiteral("orphan");
    EndBlock defEnd = end(BlockKind::FootnoteDefinition);
    defEnd.label = QStringLiteral("orphan");

    const auto r = run({def, text("Nobody cites me."), defEnd});
    ASSERT_TRUE(r.ok);
    EXPECT_TRUE(r.html.contains(QStringLiteral("<li id=\"fn-orphan\">Nobody cites me.</li>")));
    EXPECT_FALSE(r.html.contains(QStringLiteral("fnref-")));
}

TEST(HtmlTransformerTest, FootnoteIdsAreDistinct) {
    auto definition = [](const char *label) {
        StartBlock s = start(BlockKind::FootnoteDefinition);
        s.label = QString::fromUtf8(label);
        return s;
    };
    auto definitionEnd = [](const char *label) {
        EndBlock e = end(BlockKind::FootnoteDefinition);
        e.label = QString::fromUtf8(label);
        return e;
    };

    const auto r = run({
        start(BlockKind::Paragraph),
        FootnoteReference{QStringLiteral("a b"), 1},
        FootnoteReference{QStringLiteral("a-b"), 2},
        end(BlockKind::Paragraph),
        definition("a b"), text("space"), definitionEnd("a b"),
        definition("a-b"), text("dash"), definitionEnd("a-b"),
    });
    ASSERT_TRUE(r.ok);
    EXPECT_TRUE(r.html.contains(QStringLiteral("<li id=\"fn-a_20_b\">space")));
    EXPECT_TRUE(r.html.contains(QStringLiteral("<li id=\"fn-a-b\">dash")));
    EXPECT_TRUE(r.html.contains(QStringLiteral("href=\"#fn-a_20_b\">1</a>")));
    EXPECT_TRUE(r.html.contains(QStringLiteral("href=\"#fn-a-b\">2</a>")));
}
