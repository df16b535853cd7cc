#include "PlaybackEventQueue.h"

#include <QDeadlineTimer>
#include <QDebug>

PlaybackEventQueue::PlaybackEventQueue(int capacity)
    : m_capacity(capacity > 0 ? capacity : 0)
{
}

void PlaybackEventQueue::push(const PlaybackEvent& event)
{
    {
        QMutexLocker lock(&m_mutex);
        if (m_closed)
            return;
        if (m_capacity > 0 && int(m_events.size()) >= m_capacity) {
            m_events.pop_front();
            const quint64 dropped = ++m_dropped;
            if (dropped == 1 || dropped % 100 == 0)
                qWarning() << "[Controller] Event subscriber lagging, dropped" << dropped;
        }
        m_events.push_back(event);
    }
    m_notEmpty.wakeOne();
}

std::optional<PlaybackEvent> PlaybackEventQueue::tryPop()
{
    QMutexLocker lock(&m_mutex);
    if (m_events.empty())
        return std::nullopt;
    PlaybackEvent e = std::move(m_events.front());
    m_events.pop_front();
    return e;
}

std::optional<PlaybackEvent> PlaybackEventQueue::waitPop(int timeoutMs)
{
    QDeadlineTimer deadline = timeoutMs < 0 ? QDeadlineTimer(QDeadlineTimer::Forever)
                                            : QDeadlineTimer(timeoutMs);
    QMutexLocker lock(&m_mutex);
    while (m_events.empty() && !m_closed) {
        if (!m_notEmpty.wait(&m_mutex, deadline))
            break;
    }
    if (m_events.empty())
        return std::nullopt;
    PlaybackEvent e = std::move(m_events.front());
    m_events.pop_front();
    return e;
}

void PlaybackEventQueue::close()
{
    {
        QMutexLocker lock(&m_mutex);
        m_closed = true;
    }
    m_notEmpty.wakeAll();
}

bool PlaybackEventQueue::isClosed() const
{
    QMutexLocker lock(&m_mutex);
    return m_closed;
}

int PlaybackEventQueue::size() const
{
    QMutexLocker lock(&m_mutex);
    return int(m_events.size());
}
