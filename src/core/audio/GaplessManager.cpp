#include "GaplessManager.h"

#include <QDebug>

GaplessManager::GaplessManager(std::mutex* decoderMutex)
    : m_decoderMutex(decoderMutex)
{
}

GaplessManager::~GaplessManager() = default;

// ── Pipeline thread ──────────────────────────────────────────────────

void GaplessManager::setPreload(std::unique_ptr<IDecoder> decoder, const Track& track)
{
    if (!decoder || !decoder->isOpen())
        return;

    std::unique_ptr<IDecoder> previous;
    {
        std::lock_guard<std::mutex> lock(*m_decoderMutex);
        previous = std::move(m_nextDecoder);
        m_nextDecoder = std::move(decoder);
        m_nextTrack = track;
        m_nextFormat = m_nextDecoder->format();
        m_nextReady.store(true, std::memory_order_release);
    }
    // Closing the replaced decoder outside the lock
    previous.reset();

    qDebug() << "[Gapless] Next track ready:" << track.id
             << m_nextFormat.sampleRate << "Hz" << m_nextFormat.bitsPerSample << "bit";
}

void GaplessManager::cancelPreload()
{
    std::unique_ptr<IDecoder> previous;
    {
        std::lock_guard<std::mutex> lock(*m_decoderMutex);
        if (!m_nextReady.load(std::memory_order_relaxed) && !m_nextDecoder)
            return;
        previous = std::move(m_nextDecoder);
        m_nextTrack = Track();
        m_nextReady.store(false, std::memory_order_release);
    }
    qDebug() << "[Gapless] Next track cancelled";
}

QString GaplessManager::preloadTrackId() const
{
    std::lock_guard<std::mutex> lock(*m_decoderMutex);
    return m_nextReady.load(std::memory_order_relaxed) ? m_nextTrack.id : QString();
}

void GaplessManager::resetLocked()
{
    // Caller MUST hold m_decoderMutex
    m_nextDecoder.reset();
    m_nextTrack = Track();
    m_nextFormat = AudioStreamFormat{};
    m_nextReady.store(false, std::memory_order_release);
}

// ── Render thread (caller holds decoderMutex) ────────────────────────

GaplessManager::TransitionResult GaplessManager::swapToCurrentLocked(
    std::unique_ptr<IDecoder>& currentDecoder,
    Track& currentTrack)
{
    TransitionResult result;
    if (!m_nextReady.load(std::memory_order_acquire) || !m_nextDecoder)
        return result;

    currentDecoder.swap(m_nextDecoder);
    currentTrack = m_nextTrack;

    result.switched = true;
    result.format = m_nextFormat;
    result.track = m_nextTrack;

    // m_nextDecoder now holds the finished track
    m_nextDecoder.reset();
    m_nextTrack = Track();
    m_nextReady.store(false, std::memory_order_release);
    return result;
}
