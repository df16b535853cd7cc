#pragma once

#include <QObject>
#include <QTimer>
#include <QString>
#include <memory>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <thread>
#include <deque>
#include <cstdint>

#include "AudioFormat.h"
#include "GaplessManager.h"
#include "IDecoder.h"
#include "../MusicData.h"
#include "../PlaybackError.h"
#include "../../platform/IAudioBackend.h"

// The single audio graph: one active decode path, one optional preloaded
// path, and the exclusive device handle.
//
// Threading:
//   - Every public method except position(), currentTrackId() and
//     interrupt() must be called on the thread the pipeline lives on.
//   - Decoding and device writes run on an internal render thread. It
//     reports end-of-stream and faults through atomic flags, and gapless
//     switches through a queue of track ids. The position timer polls both
//     on the pipeline thread, so all signals are emitted from the pipeline
//     thread in order.
class PlaybackPipeline : public QObject {
    Q_OBJECT

public:
    enum class State { Null, Ready, Paused, Playing };
    Q_ENUM(State)

    using DecoderFactory = std::function<std::unique_ptr<IDecoder>()>;

    PlaybackPipeline(std::shared_ptr<IAudioBackend> backend,
                     DecoderFactory decoderFactory,
                     QObject* parent = nullptr);
    ~PlaybackPipeline() override;

    void setTargetDevice(const DeviceDescriptor& device);
    const DeviceDescriptor& targetDevice() const { return m_device; }
    void setPositionInterval(int ms);
    void setBufferDuration(int ms);

    PlaybackResult load(const Track& track, quint64 startNs = 0);
    PlaybackResult play();
    PlaybackResult pause();
    PlaybackResult stop();
    PlaybackResult seek(quint64 positionNs);

    PlaybackResult setPreload(const Track& track);
    void clearPreload();
    // Performs the end-of-stream switch now (gapless manual skip).
    PlaybackResult skipToPreload();

    State state() const { return m_state.load(std::memory_order_acquire); }
    quint64 position() const;
    QString currentTrackId() const;
    QString preloadTrackId() const { return m_gapless.preloadTrackId(); }
    bool isDeviceHeld() const;

    // Thread-safe. Makes the render thread stop writing as soon as possible;
    // the queued stop() that follows does the actual teardown.
    void interrupt();

signals:
    void stateChanged(PlaybackPipeline::State state);
    void positionSampled(quint64 positionNs);
    void trackSwitched(const QString& trackId);
    void endOfStream();
    void faulted(const PlaybackError& error);

private:
    void onPositionTimer();
    void renderLoop();
    // The thread starts already stopped if interrupt() ran since interruptsSeen
    void startRenderThread(uint64_t interruptsSeen);
    void stopRenderThread();
    void requestRenderStop(bool external);
    void teardown();
    void setState(State s);
    void raiseFault(const PlaybackError& error);

    PlaybackResult openDecoder(const Track& track, std::unique_ptr<IDecoder>& decoder,
                               AudioStreamFormat& format) const;
    PlaybackResult checkTrackMetadata(const Track& track) const;
    PlaybackResult checkDeviceFormat(const Track& track, const AudioStreamFormat& format) const;
    int chunkFrames(const AudioStreamFormat& format) const;

    // Clock writers run under m_decoderMutex
    void resetClockLocked(int64_t frames, int sampleRate);
    quint64 sampleClock() const;

    std::shared_ptr<IAudioBackend> m_backend;
    DecoderFactory                 m_decoderFactory;
    DeviceDescriptor               m_device;

    mutable std::mutex        m_decoderMutex;
    std::unique_ptr<IDecoder> m_decoder;        // guarded by m_decoderMutex
    Track                     m_activeTrack;    // guarded by m_decoderMutex
    AudioStreamFormat         m_activeFormat;   // guarded by m_decoderMutex
    uint64_t                  m_seekGeneration = 0;  // guarded
    bool                      m_flushPending = false; // guarded
    PlaybackError             m_rtFaultError;   // guarded
    std::deque<QString>       m_pendingSwitches; // guarded, ids not yet signalled
    GaplessManager            m_gapless;

    std::unique_ptr<IAudioOutput> m_output;
    mutable std::mutex            m_outputMutex;  // pointer swaps vs interrupt()

    std::thread             m_renderThread;
    std::atomic<bool>       m_renderStop{false};
    std::atomic<bool>       m_renderPaused{false};
    std::mutex              m_renderWaitMutex;
    std::atomic<uint64_t>   m_interruptCount{0};   // bumped by interrupt() only
    std::condition_variable m_renderWake;
    std::atomic<int>        m_bufferDurationMs{50};

    // Position clock, seqlock-style so a sample never mixes two tracks
    std::atomic<uint64_t> m_clockSeq{0};
    std::atomic<int64_t>  m_framesPlayed{0};
    std::atomic<int>      m_clockRate{44100};

    // Render thread → pipeline thread
    std::atomic<bool> m_rtEndOfStream{false};
    std::atomic<bool> m_rtFault{false};

    std::atomic<State> m_state{State::Null};
    QTimer* m_positionTimer = nullptr;
};
