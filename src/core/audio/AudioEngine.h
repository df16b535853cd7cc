#pragma once

#include <QObject>
#include <QFuture>
#include <QString>
#include <QThread>
#include <memory>
#include <atomic>
#include <functional>

#include "PlaybackPipeline.h"
#include "../EngineConfig.h"
#include "../MusicData.h"
#include "../PlaybackError.h"
#include "../PlaybackEvent.h"

// Supervisor around one PlaybackPipeline running on its own thread.
// Turns commands into queued pipeline calls and pipeline transitions into
// PlaybackEvents. Holds no retry or queue logic.
class AudioEngine : public QObject {
    Q_OBJECT

public:
    AudioEngine(std::shared_ptr<IAudioBackend> backend,
                PlaybackPipeline::DecoderFactory decoderFactory,
                const EngineConfig& config,
                QObject* parent = nullptr);
    ~AudioEngine() override;

    // Commands. Executed in order on the pipeline thread; each future
    // resolves with that command's outcome.
    QFuture<PlaybackResult> load(const Track& track, quint64 startNs = 0);
    QFuture<PlaybackResult> play();
    QFuture<PlaybackResult> pause();
    QFuture<PlaybackResult> seek(quint64 positionNs);
    QFuture<PlaybackResult> setPreload(const Track& track);
    QFuture<PlaybackResult> clearPreload();
    QFuture<PlaybackResult> skipToPreload();
    QFuture<PlaybackResult> setDevice(const DeviceDescriptor& device);

    // Preempts everything queued before it.
    QFuture<PlaybackResult> stop();

    // Cached from the last pipeline transition; never set directly.
    PlaybackState state() const { return m_state; }
    quint64 position() const { return m_pipeline->position(); }
    int positionIntervalMs() const { return m_config.positionIntervalMs; }

    static PlaybackState publicState(PlaybackPipeline::State s);

signals:
    void eventOccurred(const PlaybackEvent& event);

private:
    using Operation = std::function<PlaybackResult(PlaybackPipeline*)>;
    // Non-cancellable operations still run when a stop() overtakes them
    QFuture<PlaybackResult> dispatch(const char* name, Operation op, bool cancellable = true);

    void onPipelineState(PlaybackPipeline::State s);

    EngineConfig      m_config;
    QThread           m_thread;
    PlaybackPipeline* m_pipeline = nullptr;   // lives on m_thread
    PlaybackState     m_state = PlaybackState::Stopped;

    // Bumped by stop(); commands queued under an older epoch are dropped
    std::shared_ptr<std::atomic<quint64>> m_stopEpoch;
};
