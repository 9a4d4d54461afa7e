/*
 * codeblockhighlighter.cpp: KSyntaxHighlighting adapter for fenced code blocks
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "codeblockhighlighter.h"
#include "htmlutils.h"

#include <KSyntaxHighlighting/Format>
#include <KSyntaxHighlighting/Repository>
#include <KSyntaxHighlighting/State>

#include <QDebug>

#include <algorithm>
#include <utility>

using KSyntaxHighlighting::Theme;

const QString CodeBlockHighlighter::PlainClass = QStringLiteral("plain");

namespace {

KSyntaxHighlighting::Repository &repository()
{
    static KSyntaxHighlighting::Repository repo;
    return repo;
}

// Fence info strings people actually write, mapped to definition names.
struct LanguageAlias {
    const char *alias;
    const char *definition;
};

const LanguageAlias kLanguageAliases[] = {
    {"py",         "Python"},
    {"python3",    "Python"},
    {"js",         "JavaScript"},
    {"mjs",        "JavaScript"},
    {"ts",         "TypeScript"},
    {"rs",         "Rust"},
    {"sh",         "Bash"},
    {"shell",      "Bash"},
    {"zsh",        "Zsh"},
    {"console",    "Bash"},
    {"c++",        "C++"},
    {"cpp",        "C++"},
    {"cxx",        "C++"},
    {"h",          "C"},
    {"cs",         "C#"},
    {"csharp",     "C#"},
    {"golang",     "Go"},
    {"rb",         "Ruby"},
    {"kt",         "Kotlin"},
    {"yml",        "YAML"},
    {"md",         "Markdown"},
    {"html",       "HTML"},
    {"xml",        "XML"},
    {"json",       "JSON"},
    {"toml",       "TOML"},
    {"sql",        "SQL"},
    {"dockerfile", "Dockerfile"},
    {"cmake",      "CMake"},
    {"make",       "Makefile"},
    {"makefile",   "Makefile"},
};

// Lexical category -> theme class.
struct StyleRule {
    Theme::TextStyle textStyle;
    const char *styleClass;
};

const StyleRule kStyleRules[] = {
    {Theme::Normal,         "plain"},
    {Theme::Keyword,        "keyword"},
    {Theme::ControlFlow,    "keyword"},
    {Theme::Import,         "keyword"},
    {Theme::Preprocessor,   "keyword"},
    {Theme::Attribute,      "keyword"},
    {Theme::Function,       "function"},
    {Theme::BuiltIn,        "function"},
    {Theme::Variable,       "identifier"},
    {Theme::Operator,       "punctuation"},
    {Theme::DataType,       "type"},
    {Theme::Extension,      "type"},
    {Theme::Char,           "string"},
    {Theme::SpecialChar,    "string"},
    {Theme::String,         "string"},
    {Theme::VerbatimString, "string"},
    {Theme::SpecialString,  "string"},
    {Theme::DecVal,         "number"},
    {Theme::BaseN,          "number"},
    {Theme::Float,          "number"},
    {Theme::Constant,       "number"},
    {Theme::Comment,        "comment"},
    {Theme::Documentation,  "comment"},
    {Theme::Annotation,     "comment"},
    {Theme::CommentVar,     "comment"},
    {Theme::RegionMarker,   "comment"},
    {Theme::Information,    "comment"},
    {Theme::Warning,        "comment"},
    {Theme::Alert,          "comment"},
    {Theme::Others,         "plain"},
    {Theme::Error,          "plain"},
};

// base16 ocean dark foregrounds, drawn on #2b303b.
struct ThemeColor {
    const char *styleClass;
    const char *color;
};

const ThemeColor kThemeColors[] = {
    {"plain",       "#c0c5ce"},
    {"keyword",     "#b48ead"},
    {"string",      "#a3be8c"},
    {"comment",     "#65737e"},
    {"number",      "#d08770"},
    {"function",    "#8fa1b3"},
    {"type",        "#ebcb8b"},
    {"punctuation", "#96b5b4"},
    {"identifier",  "#bf616a"},
};

} // namespace

CodeBlockHighlighter::CodeBlockHighlighter()
{
    setTheme(repository().defaultTheme(KSyntaxHighlighting::Repository::DarkTheme));
}

KSyntaxHighlighting::Definition CodeBlockHighlighter::definitionFor(const QString &language) const
{
    const QString lang = language.trimmed();
    if (lang.isEmpty())
        return {};

    const QString lower = lang.toLower();
    for (const auto &alias : kLanguageAliases) {
        if (lower == QLatin1String(alias.alias)) {
            auto def = repository().definitionForName(QString::fromLatin1(alias.definition));
            if (def.isValid())
                return def;
            break;
        }
    }

    auto def = repository().definitionForName(lang);
    if (!def.isValid())
        def = repository().definitionForFileName(QStringLiteral("file.") + lower);
    return def;
}

QList<HighlightSpan> CodeBlockHighlighter::highlight(const std::optional<QString> &language,
                                                     const QString &content)
{
    QList<HighlightSpan> spans;
    if (content.isEmpty())
        return spans;

    KSyntaxHighlighting::Definition def;
    if (language)
        def = definitionFor(*language);

    if (!def.isValid()) {
        if (language && !language->isEmpty())
            qDebug() << "CodeBlockHighlighter: No syntax definition for" << *language
                     << "- rendering as plain text";
        appendSpan(spans, content, PlainClass);
        return spans;
    }

    setDefinition(def);

    KSyntaxHighlighting::State state;
    qsizetype lineStart = 0;
    for (;;) {
        const qsizetype newline = content.indexOf(QLatin1Char('\n'), lineStart);
        const qsizetype lineEnd = newline < 0 ? content.size() : newline;
        const QString line = content.mid(lineStart, lineEnd - lineStart);

        m_marks.clear();
        state = highlightLine(line, state);
        appendLine(spans, line);

        if (newline < 0)
            break;
        appendSpan(spans, QStringLiteral("\n"), PlainClass);
        lineStart = newline + 1;
    }
    m_marks.clear();

    return spans;
}

void CodeBlockHighlighter::applyFormat(int offset, int length,
                                       const KSyntaxHighlighting::Format &format)
{
    if (length <= 0)
        return;
    m_marks.append(Mark{offset, length, styleClassFor(format.textStyle())});
}

// Turn the lexer marks of one line into spans. Whatever the lexer did not
// cover (or reported out of range) is emitted as plain text, so the line
// text survives unchanged.
void CodeBlockHighlighter::appendLine(QList<HighlightSpan> &spans, const QString &line)
{
    std::stable_sort(m_marks.begin(), m_marks.end(),
                     [](const Mark &a, const Mark &b) { return a.start < b.start; });

    const int lineLength = static_cast<int>(line.size());
    int cursor = 0;
    for (const Mark &mark : std::as_const(m_marks)) {
        const int start = std::clamp(mark.start, cursor, lineLength);
        const int end = std::clamp(mark.start + mark.length, start, lineLength);
        if (end == start)
            continue;
        if (start > cursor)
            appendSpan(spans, line.mid(cursor, start - cursor), PlainClass);
        appendSpan(spans, line.mid(start, end - start), mark.styleClass);
        cursor = end;
    }
    if (cursor < lineLength)
        appendSpan(spans, line.mid(cursor), PlainClass);
}

void CodeBlockHighlighter::appendSpan(QList<HighlightSpan> &spans, const QString &text,
                                      const QString &styleClass)
{
    if (text.isEmpty())
        return;
    if (!spans.isEmpty() && spans.last().styleClass == styleClass) {
        spans.last().text.append(text);
        return;
    }
    spans.append(HighlightSpan{text, styleClass});
}

QString CodeBlockHighlighter::styleClassFor(Theme::TextStyle style)
{
    for (const auto &rule : kStyleRules) {
        if (rule.textStyle == style)
            return QString::fromLatin1(rule.styleClass);
    }
    return PlainClass;
}

QString CodeBlockHighlighter::colorFor(const QString &styleClass)
{
    for (const auto &entry : kThemeColors) {
        if (styleClass == QLatin1String(entry.styleClass))
            return QString::fromLatin1(entry.color);
    }
    return QString::fromLatin1(kThemeColors[0].color);
}

QString CodeBlockHighlighter::renderHtml(const QList<HighlightSpan> &spans)
{
    QString html;
    for (const auto &span : spans) {
        const QString text = HtmlUtils::escapeText(span.text);
        if (span.styleClass == PlainClass) {
            html += text;
            continue;
        }
        html += QStringLiteral("<span class=\"hl-%1\" style=\"color:%2\">")
                    .arg(span.styleClass, colorFor(span.styleClass));
        html += text;
        html += QLatin1String("</span>");
    }
    return html;
}
