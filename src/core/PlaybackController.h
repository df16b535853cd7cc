#pragma once

#include <QObject>
#include <QFuture>
#include <QMutex>
#include <QReadWriteLock>
#include <QString>
#include <QVector>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "EngineConfig.h"
#include "MusicData.h"
#include "PlaybackError.h"
#include "PlaybackEvent.h"
#include "QueueManager.h"
#include "audio/AudioEngine.h"
#include "../platform/IAudioBackend.h"

class PlaybackEventQueue;
class PlaybackCommandSender;

// Orchestration root. Owns the engine and the queue, advances the queue on
// gapless switches and end-of-stream, and applies the retry/skip policy.
//
// Lives on the thread that creates it; every command must be issued from
// that thread (other threads go through PlaybackCommandSender). Each command
// returns a future that resolves once the command has fully taken effect.
class PlaybackController : public QObject {
    Q_OBJECT

public:
    // Fails with NoBackend or NoDevice; *error is set and nullptr returned.
    static std::unique_ptr<PlaybackController> create(
        std::shared_ptr<IAudioBackend> backend,
        const EngineConfig& config = EngineConfig(),
        PlaybackError* error = nullptr,
        PlaybackPipeline::DecoderFactory decoderFactory = {});

    ~PlaybackController() override;

    // ── Commands ─────────────────────────────────────────────────────
    QFuture<PlaybackResult> loadQueue(const QVector<Track>& tracks);
    QFuture<PlaybackResult> play();
    QFuture<PlaybackResult> pause();
    QFuture<PlaybackResult> stop();
    QFuture<PlaybackResult> next();
    QFuture<PlaybackResult> previous();
    QFuture<PlaybackResult> jump(int index);
    QFuture<PlaybackResult> seek(quint64 positionNs);
    QFuture<PlaybackResult> selectDevice(const QString& deviceId);

    // Queue editing. The playing track keeps playing unless it is removed.
    QFuture<PlaybackResult> append(const QVector<Track>& tracks);
    QFuture<PlaybackResult> insertNext(const Track& track);
    QFuture<PlaybackResult> remove(int index);
    QFuture<PlaybackResult> move(int fromIndex, int toIndex);

    // ── Queries (any thread) ─────────────────────────────────────────
    QVector<Track> queueSnapshot() const;
    int currentIndex() const;
    std::optional<int> preloadIndex() const;
    Track currentTrack() const;

    // Controller thread only
    PlaybackState state() const { return m_state; }
    quint64 position() const { return m_engine->position(); }
    QString loadedTrackId() const { return m_loadedId; }
    QString preloadedTrackId() const { return m_preloadId; }
    DeviceDescriptor currentDevice() const { return m_device; }
    std::vector<DeviceDescriptor> devices() const;
    const EngineConfig& config() const { return m_config; }

    // ── Event subscription ───────────────────────────────────────────
    // capacity < 0 uses EngineConfig::eventQueueCapacity. The controller
    // keeps a weak reference; dropping the handle unsubscribes.
    std::shared_ptr<PlaybackEventQueue> subscribe(int capacity = -1);
    PlaybackCommandSender commandSender();

signals:
    void playbackEvent(const PlaybackEvent& event);

private:
    using Completion = std::function<void(const PlaybackResult&)>;

    PlaybackController(std::shared_ptr<IAudioBackend> backend,
                       const EngineConfig& config,
                       const DeviceDescriptor& device,
                       PlaybackPipeline::DecoderFactory decoderFactory);

    void onEngineEvent(const PlaybackEvent& event);
    void onTrackSwitched(const QString& trackId);
    void onEndOfStream();
    void onFault(const PlaybackError& error);

    void loadCurrent(quint64 startNs, bool autoplay, quint64 token, Completion done);
    void startPlayback(int attempt, quint64 token, Completion done);
    void skipFailedTrack(const PlaybackError& cause, bool autoplay, quint64 token, Completion done);
    void issuePreload();
    QFuture<PlaybackResult> afterQueueEdit(bool currentRemoved);

    void publish(const PlaybackEvent& event);
    quint64 bumpToken() { return ++m_token; }

    std::shared_ptr<IAudioBackend> m_backend;
    EngineConfig                   m_config;
    DeviceDescriptor               m_device;
    AudioEngine*                   m_engine = nullptr;

    // Single writer (this thread); other threads copy under the read lock
    mutable QReadWriteLock m_queueLock;
    QueueManager           m_queue;

    PlaybackState m_state = PlaybackState::Stopped;
    QString       m_loadedId;     // track the pipeline holds, empty when Null
    QString       m_preloadId;    // confirmed preload, empty while pending
    int           m_announcedIndex = -1;  // queue entry of the last TrackChanged
    bool          m_wantPlay = false;

    // Bumped by stop and navigation; continuations and retries carrying an
    // older token resolve as Cancelled
    quint64 m_token = 0;

    QMutex m_subscribersMutex;
    std::vector<std::weak_ptr<PlaybackEventQueue>> m_subscribers;
};
