#pragma once

#include <memory>
#include <atomic>
#include <mutex>
#include <QString>
#include "AudioFormat.h"
#include "IDecoder.h"
#include "../MusicData.h"

// Owns the inactive "next track" decode path used for gapless transitions.
//
// Thread safety:
//   - Pipeline-thread methods (setPreload, cancelPreload) lock the shared
//     decoder mutex internally. The decoder is opened by the caller before
//     it is handed over, so no file I/O happens under the lock.
//   - swapToCurrentLocked() / resetLocked() assume the caller already holds
//     the decoder mutex (render thread or pipeline thread).
class GaplessManager {
public:
    // decoderMutex: shared with PlaybackPipeline, protects all decoder access
    explicit GaplessManager(std::mutex* decoderMutex);
    ~GaplessManager();

    // ── Pipeline thread ──────────────────────────────────────────────

    void setPreload(std::unique_ptr<IDecoder> decoder, const Track& track);
    void cancelPreload();

    bool isPreloadReady() const { return m_nextReady.load(std::memory_order_acquire); }
    QString preloadTrackId() const;

    // Reset all state. Caller MUST hold decoderMutex.
    void resetLocked();

    // ── Render thread (caller MUST hold decoderMutex) ────────────────

    // Swap next→current. The previous current decoder is closed.
    struct TransitionResult {
        bool switched = false;
        AudioStreamFormat format;
        Track track;
    };
    TransitionResult swapToCurrentLocked(std::unique_ptr<IDecoder>& currentDecoder,
                                         Track& currentTrack);

private:
    std::mutex* m_decoderMutex;  // not owned, shared with PlaybackPipeline

    std::unique_ptr<IDecoder> m_nextDecoder;
    Track                     m_nextTrack;
    AudioStreamFormat         m_nextFormat{};
    std::atomic<bool>         m_nextReady{false};
};
