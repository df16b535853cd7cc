#include "QueueManager.h"
#include <QDebug>
#include <algorithm>

void QueueManager::setQueue(const QVector<Track>& tracks)
{
    m_queue = tracks;
    m_queueIndex = tracks.isEmpty() ? -1 : 0;
    qDebug() << "[Queue] Set" << tracks.size() << "tracks";
}

void QueueManager::append(const Track& track)
{
    m_queue.append(track);
    if (m_queueIndex < 0)
        m_queueIndex = 0;
}

void QueueManager::append(const QVector<Track>& tracks)
{
    if (tracks.isEmpty())
        return;
    m_queue.append(tracks);
    if (m_queueIndex < 0)
        m_queueIndex = 0;
    qDebug() << "[Queue] Appended" << tracks.size() << "tracks"
             << "(" << m_queue.size() << "total)";
}

void QueueManager::insertNext(const Track& track)
{
    if (m_queueIndex < 0) {
        append(track);
        return;
    }
    m_queue.insert(m_queueIndex + 1, track);
}

void QueueManager::removeFromQueue(int index)
{
    if (index < 0 || index >= m_queue.size()) return;

    m_queue.removeAt(index);

    if (m_queue.isEmpty()) {
        m_queueIndex = -1;
    } else if (index < m_queueIndex) {
        m_queueIndex--;
    } else if (index == m_queueIndex) {
        // The following track moves into the current slot
        if (m_queueIndex >= m_queue.size())
            m_queueIndex = m_queue.size() - 1;
    }
}

void QueueManager::moveTo(int fromIndex, int toIndex)
{
    if (fromIndex < 0 || fromIndex >= m_queue.size()) return;
    if (toIndex < 0 || toIndex >= m_queue.size()) return;
    if (fromIndex == toIndex) return;

    Track track = m_queue.takeAt(fromIndex);
    m_queue.insert(toIndex, track);

    if (m_queueIndex == fromIndex) {
        m_queueIndex = toIndex;
    } else {
        if (fromIndex < m_queueIndex && toIndex >= m_queueIndex)
            m_queueIndex--;
        else if (fromIndex > m_queueIndex && toIndex <= m_queueIndex)
            m_queueIndex++;
    }
}

void QueueManager::clearQueue()
{
    m_queue.clear();
    m_queueIndex = -1;
}

std::optional<int> QueueManager::preloadIndex() const
{
    if (m_queueIndex < 0 || m_queueIndex + 1 >= m_queue.size())
        return std::nullopt;
    return m_queueIndex + 1;
}

Track QueueManager::currentTrack() const
{
    if (m_queueIndex >= 0 && m_queueIndex < m_queue.size())
        return m_queue.at(m_queueIndex);
    return Track();
}

Track QueueManager::preloadTrack() const
{
    const std::optional<int> idx = preloadIndex();
    return idx ? m_queue.at(*idx) : Track();
}

int QueueManager::indexOf(const QString& trackId, int from) const
{
    for (int i = std::max(0, from); i < m_queue.size(); ++i) {
        if (m_queue.at(i).id == trackId)
            return i;
    }
    return -1;
}

std::optional<Track> QueueManager::advance()
{
    const std::optional<int> next = preloadIndex();
    if (!next) {
        qDebug() << "[Queue] End of queue at index" << m_queueIndex;
        return std::nullopt;
    }
    m_queueIndex = *next;
    return m_queue.at(m_queueIndex);
}

Track QueueManager::previous()
{
    if (m_queueIndex > 0)
        m_queueIndex--;
    return currentTrack();
}

bool QueueManager::jump(int index)
{
    if (index < 0 || index >= m_queue.size()) {
        qDebug() << "[Queue] Jump out of range:" << index << "size" << m_queue.size();
        return false;
    }
    m_queueIndex = index;
    return true;
}
