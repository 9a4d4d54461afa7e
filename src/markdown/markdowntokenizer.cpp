/*
 * markdowntokenizer.cpp: MD4C -> Markdown::Event adapter
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "markdowntokenizer.h"

#include <QByteArray>
#include <QDebug>
#include <QHash>
#include <QRegularExpression>

#include <utility>

using namespace Markdown;

Markdown::BufferedEventStream MarkdownTokenizer::tokenize(const QString &markdownText)
{
    m_stream = BufferedEventStream();
    m_parseAborted = false;
    m_pendingText.clear();
    m_inCodeBlock = false;
    m_codeLanguage.reset();
    m_codeText.clear();
    m_inCodeSpan = false;
    m_codeSpanText.clear();
    m_imageDepth = 0;
    m_altText.clear();
    m_imageSrc.clear();
    m_imageTitle.clear();
    m_inTableCell = false;
    m_cellText.clear();
    m_rowCells.clear();

    parse(m_footnoteParser.process(markdownText));

    // Definition bodies are Markdown too; references inside them resolve
    // against the same numbering.
    for (const auto &fn : m_footnoteParser.footnotes()) {
        emitEvent(StartBlock{BlockKind::FootnoteDefinition, 0, 1, fn.label});
        parse(fn.content);
        emitEvent(EndBlock{BlockKind::FootnoteDefinition, 0, fn.label});
    }

    return std::exchange(m_stream, BufferedEventStream());
}

void MarkdownTokenizer::parse(const QString &markdown)
{
    MD_PARSER parser = {};
    parser.abi_version = 0;
    parser.flags = MD_DIALECT_GITHUB | MD_FLAG_UNDERLINE;
    parser.enter_block = &MarkdownTokenizer::sEnterBlock;
    parser.leave_block = &MarkdownTokenizer::sLeaveBlock;
    parser.enter_span  = &MarkdownTokenizer::sEnterSpan;
    parser.leave_span  = &MarkdownTokenizer::sLeaveSpan;
    parser.text        = &MarkdownTokenizer::sText;

    const QByteArray utf8 = markdown.toUtf8();
    const int result = md_parse(utf8.constData(), static_cast<MD_SIZE>(utf8.size()),
                                &parser, this);
    flushText();

    if (result != 0) {
        m_parseAborted = true;
        qWarning() << "MarkdownTokenizer: md_parse aborted with code" << result;
    }
}

// --- Static callbacks (delegate to instance) ---

int MarkdownTokenizer::sEnterBlock(MD_BLOCKTYPE type, void *detail, void *userdata)
{
    return static_cast<MarkdownTokenizer *>(userdata)->enterBlock(type, detail);
}

int MarkdownTokenizer::sLeaveBlock(MD_BLOCKTYPE type, void *detail, void *userdata)
{
    return static_cast<MarkdownTokenizer *>(userdata)->leaveBlock(type, detail);
}

int MarkdownTokenizer::sEnterSpan(MD_SPANTYPE type, void *detail, void *userdata)
{
    return static_cast<MarkdownTokenizer *>(userdata)->enterSpan(type, detail);
}

int MarkdownTokenizer::sLeaveSpan(MD_SPANTYPE type, void *detail, void *userdata)
{
    return static_cast<MarkdownTokenizer *>(userdata)->leaveSpan(type, detail);
}

int MarkdownTokenizer::sText(MD_TEXTTYPE type, const MD_CHAR *text, MD_SIZE size,
                             void *userdata)
{
    return static_cast<MarkdownTokenizer *>(userdata)->onText(type, text, size);
}

// --- Block handlers ---

int MarkdownTokenizer::enterBlock(MD_BLOCKTYPE type, void *detail)
{
    switch (type) {
    case MD_BLOCK_P:
        emitEvent(StartBlock{BlockKind::Paragraph});
        break;

    case MD_BLOCK_H: {
        auto *d = static_cast<MD_BLOCK_H_DETAIL *>(detail);
        emitEvent(StartBlock{BlockKind::Heading, static_cast<int>(d->level)});
        break;
    }

    case MD_BLOCK_QUOTE:
        emitEvent(StartBlock{BlockKind::BlockQuote});
        break;

    case MD_BLOCK_UL:
        emitEvent(StartBlock{BlockKind::BulletList});
        break;

    case MD_BLOCK_OL: {
        auto *d = static_cast<MD_BLOCK_OL_DETAIL *>(detail);
        emitEvent(StartBlock{BlockKind::OrderedList, 0, static_cast<int>(d->start)});
        break;
    }

    case MD_BLOCK_LI: {
        auto *d = static_cast<MD_BLOCK_LI_DETAIL *>(detail);
        emitEvent(StartBlock{BlockKind::ListItem});
        if (d->is_task)
            emitEvent(TaskMarker{d->task_mark != ' '});
        break;
    }

    case MD_BLOCK_HR:
        emitEvent(ThematicBreak{});
        break;

    case MD_BLOCK_CODE: {
        auto *d = static_cast<MD_BLOCK_CODE_DETAIL *>(detail);
        flushText();
        const QString lang = extractAttribute(d->lang);
        m_codeLanguage = lang.isEmpty() ? std::nullopt : std::optional<QString>(lang);
        m_codeText.clear();
        m_inCodeBlock = true;
        break;
    }

    case MD_BLOCK_TABLE:
        emitEvent(StartBlock{BlockKind::Table});
        break;

    case MD_BLOCK_TR:
        m_rowCells.clear();
        break;

    case MD_BLOCK_TH:
    case MD_BLOCK_TD:
        flushText();
        m_cellText.clear();
        m_inTableCell = true;
        break;

    // Structure carried by other events (or by nothing at all)
    case MD_BLOCK_DOC:
    case MD_BLOCK_HTML:
    case MD_BLOCK_THEAD:
    case MD_BLOCK_TBODY:
        break;
    }

    return 0;
}

int MarkdownTokenizer::leaveBlock(MD_BLOCKTYPE type, void *detail)
{
    switch (type) {
    case MD_BLOCK_P:
        emitEvent(EndBlock{BlockKind::Paragraph});
        break;

    case MD_BLOCK_H: {
        auto *d = static_cast<MD_BLOCK_H_DETAIL *>(detail);
        emitEvent(EndBlock{BlockKind::Heading, static_cast<int>(d->level)});
        break;
    }

    case MD_BLOCK_QUOTE:
        emitEvent(EndBlock{BlockKind::BlockQuote});
        break;

    case MD_BLOCK_UL:
        emitEvent(EndBlock{BlockKind::BulletList});
        break;

    case MD_BLOCK_OL:
        emitEvent(EndBlock{BlockKind::OrderedList});
        break;

    case MD_BLOCK_LI:
        emitEvent(EndBlock{BlockKind::ListItem});
        break;

    case MD_BLOCK_CODE:
        m_inCodeBlock = false;
        emitEvent(CodeBlock{m_codeLanguage, m_codeText});
        m_codeLanguage.reset();
        m_codeText.clear();
        break;

    case MD_BLOCK_TABLE:
        emitEvent(EndBlock{BlockKind::Table});
        break;

    case MD_BLOCK_TR:
        emitEvent(TableRow{m_rowCells});
        m_rowCells.clear();
        break;

    case MD_BLOCK_TH:
    case MD_BLOCK_TD:
        m_inTableCell = false;
        m_rowCells.append(m_cellText.trimmed());
        m_cellText.clear();
        break;

    case MD_BLOCK_DOC:
    case MD_BLOCK_HR:
    case MD_BLOCK_HTML:
    case MD_BLOCK_THEAD:
    case MD_BLOCK_TBODY:
        break;
    }

    return 0;
}

// --- Span handlers ---

int MarkdownTokenizer::enterSpan(MD_SPANTYPE type, void *detail)
{
    // Cells are flattened to text; inside alt text only text counts
    if (m_inTableCell)
        return 0;
    if (m_imageDepth > 0) {
        if (type == MD_SPAN_IMG)
            ++m_imageDepth;
        return 0;
    }

    switch (type) {
    case MD_SPAN_EM:
        emitEvent(StartBlock{BlockKind::Emphasis});
        break;

    case MD_SPAN_STRONG:
        emitEvent(StartBlock{BlockKind::Strong});
        break;

    case MD_SPAN_DEL:
        emitEvent(StartBlock{BlockKind::Strikethrough});
        break;

    case MD_SPAN_U:
        emitEvent(StartBlock{BlockKind::Underline});
        break;

    case MD_SPAN_A: {
        auto *d = static_cast<MD_SPAN_A_DETAIL *>(detail);
        emitEvent(LinkStart{extractAttribute(d->href), extractAttribute(d->title)});
        break;
    }

    case MD_SPAN_IMG: {
        auto *d = static_cast<MD_SPAN_IMG_DETAIL *>(detail);
        flushText();
        m_imageSrc = extractAttribute(d->src);
        m_imageTitle = extractAttribute(d->title);
        m_altText.clear();
        m_imageDepth = 1;
        break;
    }

    case MD_SPAN_CODE:
        flushText();
        m_codeSpanText.clear();
        m_inCodeSpan = true;
        break;

    // Not enabled in the parser flags; their text degrades to plain text
    case MD_SPAN_WIKILINK:
    case MD_SPAN_LATEXMATH:
    case MD_SPAN_LATEXMATH_DISPLAY:
        break;
    }

    return 0;
}

int MarkdownTokenizer::leaveSpan(MD_SPANTYPE type, void *detail)
{
    Q_UNUSED(detail);

    if (m_inTableCell)
        return 0;

    if (m_imageDepth > 0) {
        // Nested images inside alt text only contribute their text
        if (type == MD_SPAN_IMG && --m_imageDepth == 0) {
            emitEvent(ImageStart{m_imageSrc, m_altText, m_imageTitle});
            m_imageSrc.clear();
            m_imageTitle.clear();
            m_altText.clear();
        }
        return 0;
    }

    switch (type) {
    case MD_SPAN_EM:
        emitEvent(EndBlock{BlockKind::Emphasis});
        break;

    case MD_SPAN_STRONG:
        emitEvent(EndBlock{BlockKind::Strong});
        break;

    case MD_SPAN_DEL:
        emitEvent(EndBlock{BlockKind::Strikethrough});
        break;

    case MD_SPAN_U:
        emitEvent(EndBlock{BlockKind::Underline});
        break;

    case MD_SPAN_A:
        emitEvent(EndBlock{BlockKind::Link});
        break;

    case MD_SPAN_CODE:
        m_inCodeSpan = false;
        emitEvent(CodeSpan{m_codeSpanText});
        m_codeSpanText.clear();
        break;

    case MD_SPAN_IMG:
    case MD_SPAN_WIKILINK:
    case MD_SPAN_LATEXMATH:
    case MD_SPAN_LATEXMATH_DISPLAY:
        break;
    }

    return 0;
}

// --- Text handler ---

int MarkdownTokenizer::onText(MD_TEXTTYPE type, const MD_CHAR *text, MD_SIZE size)
{
    QString str = QString::fromUtf8(text, static_cast<qsizetype>(size));

    switch (type) {
    case MD_TEXT_ENTITY:
        str = resolveEntity(str);
        break;
    case MD_TEXT_NULLCHAR:
        str = QString(QChar(0xFFFD));
        break;
    case MD_TEXT_BR:
    case MD_TEXT_SOFTBR:
        str = m_inCodeBlock ? QStringLiteral("\n") : QStringLiteral(" ");
        break;
    default:
        break;
    }

    if (m_imageDepth > 0) {
        m_altText.append(str);
        return 0;
    }
    if (m_inTableCell) {
        m_cellText.append(str);
        return 0;
    }
    if (m_inCodeBlock) {
        m_codeText.append(str);
        return 0;
    }
    if (m_inCodeSpan) {
        m_codeSpanText.append(str);
        return 0;
    }

    switch (type) {
    case MD_TEXT_BR:
        emitEvent(HardBreak{});
        break;
    case MD_TEXT_SOFTBR:
        emitEvent(SoftBreak{});
        break;
    case MD_TEXT_HTML:
    case MD_TEXT_LATEXMATH:
        emitEvent(Unsupported{str});
        break;
    default:
        appendText(str);
        break;
    }

    return 0;
}

// --- Event output ---

void MarkdownTokenizer::emitEvent(Markdown::Event event)
{
    flushText();
    m_stream.append(std::move(event));
}

void MarkdownTokenizer::appendText(const QString &text)
{
    m_pendingText.append(text);
}

void MarkdownTokenizer::flushText()
{
    if (m_pendingText.isEmpty())
        return;

    const QString text = std::exchange(m_pendingText, QString());
    if (m_footnoteParser.footnotes().isEmpty()) {
        m_stream.append(Text{text});
        return;
    }

    static const QRegularExpression refRx(QStringLiteral(R"(\[\^([^\]]+)\])"));
    qsizetype lastEnd = 0;
    auto it = refRx.globalMatch(text);
    while (it.hasNext()) {
        const auto match = it.next();
        const int number = m_footnoteParser.numberFor(match.captured(1));
        if (number == 0)
            continue; // no definition: leave the brackets as text
        if (match.capturedStart() > lastEnd)
            m_stream.append(Text{text.mid(lastEnd, match.capturedStart() - lastEnd)});
        m_stream.append(FootnoteReference{match.captured(1), number});
        lastEnd = match.capturedEnd();
    }
    if (lastEnd < text.size())
        m_stream.append(Text{text.mid(lastEnd)});
}

// --- Helpers ---

QString MarkdownTokenizer::extractAttribute(const MD_ATTRIBUTE &attr)
{
    if (!attr.text || attr.size == 0)
        return {};

    // Attributes may be split into substrings (entities, escapes);
    // decode entities and join the rest verbatim.
    if (!attr.substr_types || !attr.substr_offsets)
        return QString::fromUtf8(attr.text, static_cast<qsizetype>(attr.size));

    QString result;
    for (int i = 0; attr.substr_offsets[i] < attr.size; ++i) {
        const MD_OFFSET begin = attr.substr_offsets[i];
        const MD_OFFSET end = attr.substr_offsets[i + 1];
        const QString part = QString::fromUtf8(attr.text + begin,
                                               static_cast<qsizetype>(end - begin));
        switch (attr.substr_types[i]) {
        case MD_TEXT_ENTITY:
            result += resolveEntity(part);
            break;
        case MD_TEXT_NULLCHAR:
            result += QChar(0xFFFD);
            break;
        default:
            result += part;
            break;
        }
    }
    return result;
}

QString MarkdownTokenizer::resolveEntity(const QString &entity)
{
    static const QHash<QString, QString> entities = {
        {QStringLiteral("&amp;"),    QStringLiteral("&")},
        {QStringLiteral("&lt;"),     QStringLiteral("<")},
        {QStringLiteral("&gt;"),     QStringLiteral(">")},
        {QStringLiteral("&quot;"),   QStringLiteral("\"")},
        {QStringLiteral("&apos;"),   QStringLiteral("'")},
        {QStringLiteral("&nbsp;"),   QString(QChar(0x00A0))},
        {QStringLiteral("&mdash;"),  QString(QChar(0x2014))},
        {QStringLiteral("&ndash;"),  QString(QChar(0x2013))},
        {QStringLiteral("&lsquo;"),  QString(QChar(0x2018))},
        {QStringLiteral("&rsquo;"),  QString(QChar(0x2019))},
        {QStringLiteral("&ldquo;"),  QString(QChar(0x201C))},
        {QStringLiteral("&rdquo;"),  QString(QChar(0x201D))},
        {QStringLiteral("&hellip;"), QString(QChar(0x2026))},
        {QStringLiteral("&copy;"),   QString(QChar(0x00A9))},
        {QStringLiteral("&reg;"),    QString(QChar(0x00AE))},
        {QStringLiteral("&trade;"),  QString(QChar(0x2122))},
        {QStringLiteral("&deg;"),    QString(QChar(0x00B0))},
        {QStringLiteral("&times;"),  QString(QChar(0x00D7))},
        {QStringLiteral("&divide;"), QString(QChar(0x00F7))},
        {QStringLiteral("&euro;"),   QString(QChar(0x20AC))},
    };

    auto it = entities.constFind(entity);
    if (it != entities.constEnd())
        return it.value();

    // &#1234; or &#x12AB;
    if (entity.startsWith(QLatin1String("&#")) && entity.endsWith(QLatin1Char(';'))) {
        const QString num = entity.mid(2, entity.size() - 3);
        bool ok = false;
        const uint code = num.startsWith(QLatin1Char('x'), Qt::CaseInsensitive)
                              ? num.mid(1).toUInt(&ok, 16)
                              : num.toUInt(&ok, 10);
        if (ok && code > 0 && code <= 0x10FFFF) {
            const char32_t cp = code;
            return QString::fromUcs4(&cp, 1);
        }
    }

    // Unknown entity: keep the source text
    return entity;
}
