/*
 * eventstream.h: Forward-only, single-consumer Markdown event sequence
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MD2PDF_EVENTSTREAM_H
#define MD2PDF_EVENTSTREAM_H

#include <QList>

#include <optional>
#include <utility>

#include "markdownevent.h"

namespace Markdown {

class EventStream
{
public:
    virtual ~EventStream() = default;

    // Returns the next event, or nullopt once the sequence is exhausted.
    // Events are handed out exactly once.
    virtual std::optional<Event> next() = 0;
};

// Event stream over events the md4c callbacks pushed into a list.
class BufferedEventStream : public EventStream
{
public:
    BufferedEventStream() = default;
    explicit BufferedEventStream(QList<Event> events)
        : m_events(std::move(events))
    {
    }

    void append(Event event) { m_events.append(std::move(event)); }

    std::optional<Event> next() override
    {
        if (m_position >= m_events.size())
            return std::nullopt;
        return std::move(m_events[m_position++]);
    }

    // Events not yet consumed; used by callers that inspect the stream
    // before handing it on.
    QList<Event> pending() const { return m_events.mid(m_position); }
    qsizetype size() const { return m_events.size() - m_position; }
    bool atEnd() const { return m_position >= m_events.size(); }

private:
    QList<Event> m_events;
    qsizetype m_position = 0;
};

} // namespace Markdown

#endif // MD2PDF_EVENTSTREAM_H
