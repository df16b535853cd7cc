#pragma once

#include <QMutex>
#include <QWaitCondition>
#include <deque>
#include <optional>
#include <atomic>

#include "PlaybackEvent.h"

// Subscriber-side inbox for PlaybackEvents. The controller pushes from its
// own thread; any thread may pop. Capacity 0 means unbounded; otherwise the
// oldest event is dropped to make room and counted.
class PlaybackEventQueue {
public:
    explicit PlaybackEventQueue(int capacity = 0);

    PlaybackEventQueue(const PlaybackEventQueue&) = delete;
    PlaybackEventQueue& operator=(const PlaybackEventQueue&) = delete;

    void push(const PlaybackEvent& event);

    std::optional<PlaybackEvent> tryPop();
    // Blocks up to timeoutMs (-1 = forever). nullopt on timeout or close().
    std::optional<PlaybackEvent> waitPop(int timeoutMs = -1);

    // Wakes all waiters; later pushes are ignored.
    void close();
    bool isClosed() const;

    int size() const;
    int capacity() const { return m_capacity; }
    quint64 droppedCount() const { return m_dropped.load(); }

private:
    mutable QMutex            m_mutex;
    QWaitCondition            m_notEmpty;
    std::deque<PlaybackEvent> m_events;
    const int                 m_capacity;
    bool                      m_closed = false;
    std::atomic<quint64>      m_dropped{0};
};
