/*
 * footnoteparser.cpp: Footnote extraction ahead of MD4C
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "footnoteparser.h"

#include <QRegularExpression>
#include <QStringList>

#include <algorithm>

namespace {

bool isContinuation(const QString &line)
{
    return line.startsWith(QLatin1String("    ")) || line.startsWith(QLatin1Char('\t'));
}

} // namespace

QString FootnoteParser::process(const QString &markdownText)
{
    m_footnotes.clear();
    m_numbers.clear();

    static const QRegularExpression defRx(
        QStringLiteral(R"(^\[\^([^\]]+)\]:[ \t]+(.*)$)"));

    const QStringList lines = markdownText.split(QLatin1Char('\n'));
    QStringList kept;
    QList<FootnoteDefinition> defs;
    bool inFence = false;

    qsizetype i = 0;
    while (i < lines.size()) {
        const QString &line = lines[i];
        const QString trimmed = line.trimmed();
        if (trimmed.startsWith(QLatin1String("```")) || trimmed.startsWith(QLatin1String("~~~")))
            inFence = !inFence;

        const QRegularExpressionMatch match = inFence ? QRegularExpressionMatch()
                                                      : defRx.match(line);
        if (!match.hasMatch()) {
            kept.append(line);
            ++i;
            continue;
        }

        FootnoteDefinition def;
        def.label = match.captured(1);
        def.content = match.captured(2).trimmed();

        // Swallow continuation lines; blank lines only belong to the
        // definition when indented content follows them.
        ++i;
        while (i < lines.size()) {
            qsizetype next = i;
            while (next < lines.size() && lines[next].trimmed().isEmpty())
                ++next;
            if (next >= lines.size() || !isContinuation(lines[next]))
                break;

            const QString &cont = lines[next];
            def.content += (next > i) ? QLatin1String("\n\n") : QLatin1String(" ");
            def.content += cont.mid(cont.startsWith(QLatin1Char('\t')) ? 1 : 4).trimmed();
            i = next + 1;
        }

        defs.append(def);
    }

    if (defs.isEmpty())
        return markdownText;

    assignNumbers(kept, defs);

    return kept.join(QLatin1Char('\n'));
}

// Numbers follow the first reference in running text; references shown
// inside fenced code or code spans do not count.
void FootnoteParser::assignNumbers(const QStringList &lines, const QList<FootnoteDefinition> &defs)
{
    QHash<QString, FootnoteDefinition> byLabel;
    for (const auto &def : defs) {
        if (!byLabel.contains(def.label))
            byLabel.insert(def.label, def);
    }

    static const QRegularExpression refRx(QStringLiteral(R"(\[\^([^\]]+)\])"));
    static const QRegularExpression codeSpanRx(QStringLiteral(R"((`+).*?\1)"));
    int nextNumber = 1;
    bool inFence = false;
    for (const QString &line : lines) {
        const QString trimmed = line.trimmed();
        if (trimmed.startsWith(QLatin1String("```")) || trimmed.startsWith(QLatin1String("~~~"))) {
            inFence = !inFence;
            continue;
        }
        if (inFence)
            continue;

        QString prose = line;
        prose.remove(codeSpanRx);
        auto it = refRx.globalMatch(prose);
        while (it.hasNext()) {
            const QString label = it.next().captured(1);
            if (byLabel.contains(label) && !m_numbers.contains(label))
                m_numbers.insert(label, nextNumber++);
        }
    }

    for (const auto &def : defs) {
        if (!m_numbers.contains(def.label))
            m_numbers.insert(def.label, nextNumber++);
    }

    for (auto it = m_numbers.constBegin(); it != m_numbers.constEnd(); ++it) {
        FootnoteDefinition fn = byLabel.value(it.key());
        fn.number = it.value();
        m_footnotes.append(fn);
    }
    std::sort(m_footnotes.begin(), m_footnotes.end(),
              [](const FootnoteDefinition &a, const FootnoteDefinition &b) {
                  return a.number < b.number;
              });
}
