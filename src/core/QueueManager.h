#pragma once
#include <QVector>
#include <optional>
#include "MusicData.h"

// Track order plus the current cursor. The preload cursor is always derived
// from the current one, never stored, so no mutation can leave it stale.
// Pure data: no I/O, no locking (the controller is the single writer).
class QueueManager {
public:
    QueueManager() = default;

    // Queue CRUD
    void setQueue(const QVector<Track>& tracks);
    void append(const Track& track);
    void append(const QVector<Track>& tracks);
    void insertNext(const Track& track);
    void removeFromQueue(int index);
    void moveTo(int fromIndex, int toIndex);
    void clearQueue();

    // Queue access
    const QVector<Track>& queue() const { return m_queue; }
    int currentIndex() const { return m_queueIndex; }
    std::optional<int> preloadIndex() const;
    Track currentTrack() const;
    Track preloadTrack() const;
    // First entry at or after from with this id, -1 if none
    int indexOf(const QString& trackId, int from = 0) const;
    bool isEmpty() const { return m_queue.isEmpty(); }
    int size() const { return m_queue.size(); }

    bool canGoNext() const { return preloadIndex().has_value(); }
    bool canGoPrevious() const { return m_queueIndex > 0; }

    // Navigation
    // Returns the new current track, or nullopt at the end (index unchanged).
    std::optional<Track> advance();
    // At index 0 this is a no-op returning the current track.
    Track previous();
    // False if index is out of range (index unchanged).
    bool jump(int index);

private:
    QVector<Track> m_queue;
    int m_queueIndex = -1;
};
