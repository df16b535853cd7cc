#include "PlaybackPipeline.h"

#include <QDebug>
#include <QFileInfo>
#include <QMetaEnum>
#include <algorithm>
#include <vector>

namespace {

quint64 framesToNs(int64_t frames, int sampleRate)
{
    if (sampleRate <= 0 || frames <= 0)
        return 0;
    const quint64 f = (quint64)frames;
    const quint64 rate = (quint64)sampleRate;
    return f / rate * 1000000000ULL + f % rate * 1000000000ULL / rate;
}

int64_t nsToFrames(quint64 ns, int sampleRate)
{
    const quint64 rate = (quint64)std::max(0, sampleRate);
    return (int64_t)(ns / 1000000000ULL * rate + ns % 1000000000ULL * rate / 1000000000ULL);
}

ErrorKind kindForDecoderError(DecoderError e)
{
    switch (e) {
    case DecoderError::FileNotFound:     return ErrorKind::FileNotFound;
    case DecoderError::FileUnreadable:   return ErrorKind::FileUnreadable;
    case DecoderError::UnsupportedCodec: return ErrorKind::UnsupportedCodec;
    default:                             return ErrorKind::CorruptStream;
    }
}

ErrorKind kindForOutputStatus(IAudioOutput::Status s)
{
    switch (s) {
    case IAudioOutput::Status::Busy:              return ErrorKind::DeviceBusy;
    case IAudioOutput::Status::UnsupportedFormat: return ErrorKind::UnsupportedFormat;
    default:                                      return ErrorKind::DeviceRemoved;
    }
}

const char* stateName(PlaybackPipeline::State s)
{
    return QMetaEnum::fromType<PlaybackPipeline::State>().valueToKey((int)s);
}

} // namespace

PlaybackPipeline::PlaybackPipeline(std::shared_ptr<IAudioBackend> backend,
                                   DecoderFactory decoderFactory,
                                   QObject* parent)
    : QObject(parent)
    , m_backend(std::move(backend))
    , m_decoderFactory(std::move(decoderFactory))
    , m_gapless(&m_decoderMutex)
    , m_positionTimer(new QTimer(this))
{
    qRegisterMetaType<PlaybackError>();

    m_positionTimer->setInterval(50);
    m_positionTimer->setTimerType(Qt::PreciseTimer);
    connect(m_positionTimer, &QTimer::timeout, this, &PlaybackPipeline::onPositionTimer);
}

PlaybackPipeline::~PlaybackPipeline()
{
    teardown();
}

void PlaybackPipeline::setTargetDevice(const DeviceDescriptor& device)
{
    m_device = device;
    qDebug() << "[Pipeline] Target device:" << device.id.c_str() << device.name.c_str();
}

void PlaybackPipeline::setPositionInterval(int ms)
{
    m_positionTimer->setInterval(std::max(1, ms));
}

void PlaybackPipeline::setBufferDuration(int ms)
{
    m_bufferDurationMs.store(std::max(1, ms), std::memory_order_relaxed);
}

// ── Commands ─────────────────────────────────────────────────────────

PlaybackResult PlaybackPipeline::load(const Track& track, quint64 startNs)
{
    qDebug() << "[Pipeline] load" << track.id << track.filePath
             << track.sampleRate << "Hz" << track.bitDepth << "bit";

    // Refuse before touching the current graph so the state stays as it was
    if (!m_device.isValid())
        return PlaybackResult::failure(ErrorKind::DeviceRemoved,
                                       QStringLiteral("no output device selected"), track.id);
    PlaybackResult result = checkTrackMetadata(track);
    if (!result)
        return result;

    std::unique_ptr<IDecoder> decoder;
    AudioStreamFormat format;
    result = openDecoder(track, decoder, format);
    if (!result)
        return result;
    result = checkDeviceFormat(track, format);
    if (!result)
        return result;

    const quint64 duration = format.durationNs > 0 ? format.durationNs : track.durationNs;
    if (startNs > 0) {
        if (startNs >= duration || !decoder->seek(startNs))
            return PlaybackResult::failure(ErrorKind::InvalidState,
                                           QStringLiteral("start position out of range"), track.id);
    }

    // Release whatever the previous track held
    teardown();

    {
        std::lock_guard<std::mutex> lock(m_decoderMutex);
        m_decoder = std::move(decoder);
        m_activeTrack = track;
        m_activeFormat = format;
        if (m_activeFormat.durationNs == 0)
            m_activeFormat.durationNs = track.durationNs;
        ++m_seekGeneration;
        resetClockLocked(nsToFrames(startNs, format.sampleRate), format.sampleRate);
    }

    setState(State::Ready);
    return PlaybackResult::success();
}

PlaybackResult PlaybackPipeline::play()
{
    const State s = state();
    if (s == State::Playing)
        return PlaybackResult::success();
    if (s == State::Null)
        return PlaybackResult::failure(ErrorKind::InvalidState, QStringLiteral("no track loaded"));

    if (s == State::Paused) {
        {
            std::lock_guard<std::mutex> lock(m_renderWaitMutex);
            m_renderPaused.store(false, std::memory_order_release);
        }
        m_renderWake.notify_all();
        setState(State::Playing);
        return PlaybackResult::success();
    }

    // Ready: claim the device at exactly the stream's native format.
    // An interrupt() from here on keeps the render thread from starting.
    const uint64_t interrupts = m_interruptCount.load(std::memory_order_acquire);
    AudioStreamFormat format;
    QString trackId;
    {
        std::lock_guard<std::mutex> lock(m_decoderMutex);
        format = m_activeFormat;
        trackId = m_activeTrack.id;
    }

    std::unique_ptr<IAudioOutput> output = m_backend->createOutput();
    if (!output)
        return PlaybackResult::failure(ErrorKind::DeviceRemoved,
                                       QStringLiteral("backend could not create an output"), trackId);

    const IAudioOutput::Status status = output->open(m_device.id, format);
    if (status != IAudioOutput::Status::Ok) {
        const QString reason = QString::fromStdString(output->lastError());
        qWarning() << "[Pipeline] Device open failed:" << m_device.id.c_str() << reason;
        return PlaybackResult::failure(kindForOutputStatus(status),
            QStringLiteral("%1: %2").arg(QString::fromStdString(m_device.id), reason), trackId);
    }

    {
        std::lock_guard<std::mutex> lock(m_outputMutex);
        m_output = std::move(output);
    }

    startRenderThread(interrupts);
    m_positionTimer->start();
    setState(State::Playing);
    return PlaybackResult::success();
}

PlaybackResult PlaybackPipeline::pause()
{
    const State s = state();
    if (s == State::Paused)
        return PlaybackResult::success();
    if (s != State::Playing)
        return PlaybackResult::failure(ErrorKind::InvalidState,
                                       QStringLiteral("pause requires Playing, state is %1")
                                           .arg(QLatin1String(stateName(s))));

    m_renderPaused.store(true, std::memory_order_release);
    setState(State::Paused);
    return PlaybackResult::success();
}

PlaybackResult PlaybackPipeline::stop()
{
    const State previous = state();
    teardown();
    if (previous != State::Null)
        setState(State::Null);
    return PlaybackResult::success();
}

PlaybackResult PlaybackPipeline::seek(quint64 positionNs)
{
    const State s = state();
    if (s != State::Playing && s != State::Paused)
        return PlaybackResult::failure(ErrorKind::InvalidState,
                                       QStringLiteral("seek requires Playing or Paused, state is %1")
                                           .arg(QLatin1String(stateName(s))));

    {
        std::lock_guard<std::mutex> lock(m_decoderMutex);
        if (positionNs >= m_activeFormat.durationNs)
            return PlaybackResult::failure(ErrorKind::InvalidState,
                QStringLiteral("seek to %1 ns outside [0, %2)").arg(positionNs).arg(m_activeFormat.durationNs),
                m_activeTrack.id);

        if (!m_decoder->seek(positionNs))
            return PlaybackResult::failure(ErrorKind::CorruptStream,
                                           QStringLiteral("stream is not seekable"), m_activeTrack.id);

        ++m_seekGeneration;
        m_flushPending = true;
        resetClockLocked(nsToFrames(positionNs, m_activeFormat.sampleRate),
                         m_activeFormat.sampleRate);
    }

    qDebug() << "[Pipeline] Seek to" << positionNs / 1000000 << "ms";
    emit positionSampled(positionNs);
    return PlaybackResult::success();
}

PlaybackResult PlaybackPipeline::setPreload(const Track& track)
{
    if (state() == State::Null)
        return PlaybackResult::failure(ErrorKind::InvalidState,
                                       QStringLiteral("preload requires a loaded track"), track.id);

    // The old next track is stale whether or not this one validates
    m_gapless.cancelPreload();

    PlaybackResult result = checkTrackMetadata(track);
    if (!result)
        return result;

    std::unique_ptr<IDecoder> decoder;
    AudioStreamFormat format;
    result = openDecoder(track, decoder, format);
    if (!result)
        return result;
    result = checkDeviceFormat(track, format);
    if (!result)
        return result;

    m_gapless.setPreload(std::move(decoder), track);
    return PlaybackResult::success();
}

void PlaybackPipeline::clearPreload()
{
    m_gapless.cancelPreload();
}

PlaybackResult PlaybackPipeline::skipToPreload()
{
    const State s = state();
    if (s != State::Playing && s != State::Paused)
        return PlaybackResult::failure(ErrorKind::InvalidState,
                                       QStringLiteral("skip requires Playing or Paused"));

    GaplessManager::TransitionResult t;
    std::deque<QString> earlier;
    {
        std::lock_guard<std::mutex> lock(m_decoderMutex);
        t = m_gapless.swapToCurrentLocked(m_decoder, m_activeTrack);
        if (!t.switched)
            return PlaybackResult::failure(ErrorKind::InvalidState, QStringLiteral("no preloaded track"));
        m_activeFormat = t.format;
        ++m_seekGeneration;
        m_flushPending = true;
        resetClockLocked(0, t.format.sampleRate);
        earlier.swap(m_pendingSwitches);
    }

    qDebug() << "[Gapless] Skipped to" << t.track.id;
    for (const QString& id : earlier)
        emit trackSwitched(id);
    emit trackSwitched(t.track.id);
    return PlaybackResult::success();
}

// ── Queries ──────────────────────────────────────────────────────────

quint64 PlaybackPipeline::position() const
{
    return sampleClock();
}

QString PlaybackPipeline::currentTrackId() const
{
    std::lock_guard<std::mutex> lock(m_decoderMutex);
    return m_activeTrack.id;
}

bool PlaybackPipeline::isDeviceHeld() const
{
    std::lock_guard<std::mutex> lock(m_outputMutex);
    return m_output && m_output->isOpen();
}

void PlaybackPipeline::interrupt()
{
    requestRenderStop(true);
}

// ── Internals ────────────────────────────────────────────────────────

PlaybackResult PlaybackPipeline::openDecoder(const Track& track,
                                             std::unique_ptr<IDecoder>& decoder,
                                             AudioStreamFormat& format) const
{
    QFileInfo fi(track.filePath);
    if (!fi.exists())
        return PlaybackResult::failure(ErrorKind::FileNotFound, track.filePath, track.id);
    if (!fi.isReadable())
        return PlaybackResult::failure(ErrorKind::FileUnreadable, track.filePath, track.id);
    if (fi.size() == 0)
        return PlaybackResult::failure(ErrorKind::CorruptStream,
                                       QStringLiteral("empty file: ") + track.filePath, track.id);

    decoder = m_decoderFactory ? m_decoderFactory() : nullptr;
    if (!decoder)
        return PlaybackResult::failure(ErrorKind::UnsupportedCodec,
                                       QStringLiteral("no decoder available"), track.id);

    if (!decoder->open(track.filePath.toStdString())) {
        const ErrorKind kind = kindForDecoderError(decoder->lastError());
        qWarning() << "[Pipeline] Cannot decode" << track.filePath << ":" << decoder->errorString();
        return PlaybackResult::failure(kind, decoder->errorString(), track.id);
    }

    format = decoder->format();
    return PlaybackResult::success();
}

PlaybackResult PlaybackPipeline::checkTrackMetadata(const Track& track) const
{
    if (!m_device.capabilitiesKnown() || m_device.supports(track.sampleRate, track.bitDepth))
        return PlaybackResult::success();

    return PlaybackResult::failure(ErrorKind::UnsupportedFormat,
        QStringLiteral("%1 does not accept %2 Hz / %3-bit")
            .arg(QString::fromStdString(m_device.name))
            .arg(track.sampleRate).arg(track.bitDepth),
        track.id);
}

PlaybackResult PlaybackPipeline::checkDeviceFormat(const Track& track,
                                                   const AudioStreamFormat& format) const
{
    if (format.sampleRate != track.sampleRate || format.bitsPerSample != track.bitDepth)
        qDebug() << "[Pipeline] Stream format differs from metadata:"
                 << format.sampleRate << "Hz" << format.bitsPerSample << "bit vs"
                 << track.sampleRate << "Hz" << track.bitDepth << "bit";

    if (!m_device.capabilitiesKnown()) {
        // Busy and never probed: the open at play() is the only check left
        qDebug() << "[Pipeline]" << m_device.id.c_str() << "is busy, format checked at open";
        return PlaybackResult::success();
    }

    if (!m_device.supports(format.sampleRate, format.bitsPerSample, format.isFloat))
        return PlaybackResult::failure(ErrorKind::UnsupportedFormat,
            QStringLiteral("stream is %1 Hz / %2-bit %3, not accepted by %4")
                .arg(format.sampleRate).arg(format.bitsPerSample)
                .arg(format.isFloat ? QStringLiteral("float") : QStringLiteral("integer"))
                .arg(QString::fromStdString(m_device.name)),
            track.id);
    if (format.channels > m_device.maxChannels)
        return PlaybackResult::failure(ErrorKind::UnsupportedFormat,
            QStringLiteral("%1 channels exceed device maximum").arg(format.channels), track.id);
    return PlaybackResult::success();
}

int PlaybackPipeline::chunkFrames(const AudioStreamFormat& format) const
{
    return std::max(64, format.sampleRate * m_bufferDurationMs.load(std::memory_order_relaxed) / 1000);
}

void PlaybackPipeline::setState(State s)
{
    const State old = m_state.exchange(s, std::memory_order_acq_rel);
    if (old == s)
        return;

    qDebug() << "[Pipeline] State:" << stateName(old) << "→" << stateName(s);
    emit stateChanged(s);
}

void PlaybackPipeline::raiseFault(const PlaybackError& error)
{
    {
        std::lock_guard<std::mutex> lock(m_decoderMutex);
        m_rtFaultError = error;
    }
    m_rtFault.store(true, std::memory_order_release);
}

void PlaybackPipeline::teardown()
{
    m_positionTimer->stop();
    stopRenderThread();

    {
        std::lock_guard<std::mutex> lock(m_outputMutex);
        if (m_output) {
            m_output->close();
            m_output.reset();
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_decoderMutex);
        m_decoder.reset();
        m_activeTrack = Track();
        m_gapless.resetLocked();
        m_pendingSwitches.clear();
        m_flushPending = false;
        ++m_seekGeneration;
        resetClockLocked(0, m_activeFormat.sampleRate);
    }

    m_rtEndOfStream.store(false, std::memory_order_relaxed);
    m_rtFault.store(false, std::memory_order_relaxed);
}

// ── Position clock ───────────────────────────────────────────────────

void PlaybackPipeline::resetClockLocked(int64_t frames, int sampleRate)
{
    m_clockSeq.fetch_add(1);  // odd: write in progress
    m_framesPlayed.store(frames);
    m_clockRate.store(sampleRate);
    m_clockSeq.fetch_add(1);
}

quint64 PlaybackPipeline::sampleClock() const
{
    for (;;) {
        const uint64_t before = m_clockSeq.load();
        if (before & 1) {
            std::this_thread::yield();
            continue;
        }
        const int64_t frames = m_framesPlayed.load();
        const int rate = m_clockRate.load();
        if (m_clockSeq.load() == before)
            return framesToNs(frames, rate);
    }
}

void PlaybackPipeline::onPositionTimer()
{
    const quint64 positionNs = sampleClock();

    // One signal per switch, even when several land between two ticks
    std::deque<QString> switched;
    {
        std::lock_guard<std::mutex> lock(m_decoderMutex);
        switched.swap(m_pendingSwitches);
    }
    for (const QString& id : switched)
        emit trackSwitched(id);

    if (state() == State::Playing)
        emit positionSampled(positionNs);

    if (m_rtFault.exchange(false)) {
        PlaybackError error;
        {
            std::lock_guard<std::mutex> lock(m_decoderMutex);
            error = m_rtFaultError;
        }
        qWarning() << "[Pipeline] Fault:" << error;
        teardown();
        setState(State::Null);
        emit faulted(error);
        return;
    }

    if (m_rtEndOfStream.exchange(false)) {
        qDebug() << "[Pipeline] End of stream, no preload";
        teardown();
        setState(State::Null);
        emit endOfStream();
    }
}

// ── Render thread ────────────────────────────────────────────────────

void PlaybackPipeline::startRenderThread(uint64_t interruptsSeen)
{
    stopRenderThread();
    {
        std::lock_guard<std::mutex> lock(m_renderWaitMutex);
        m_renderStop.store(m_interruptCount.load(std::memory_order_acquire) != interruptsSeen,
                           std::memory_order_release);
    }
    m_renderPaused.store(false, std::memory_order_release);
    m_rtEndOfStream.store(false, std::memory_order_relaxed);
    m_rtFault.store(false, std::memory_order_relaxed);
    m_renderThread = std::thread(&PlaybackPipeline::renderLoop, this);
}

void PlaybackPipeline::stopRenderThread()
{
    if (!m_renderThread.joinable())
        return;
    requestRenderStop(false);
    m_renderThread.join();
}

void PlaybackPipeline::requestRenderStop(bool external)
{
    {
        std::lock_guard<std::mutex> lock(m_renderWaitMutex);
        if (external)
            m_interruptCount.fetch_add(1, std::memory_order_acq_rel);
        m_renderStop.store(true, std::memory_order_release);
    }
    m_renderWake.notify_all();

    std::lock_guard<std::mutex> lock(m_outputMutex);
    if (m_output)
        m_output->interrupt();
}

void PlaybackPipeline::renderLoop()
{
    std::vector<uint8_t> buffer;
    bool outputPaused = false;

    while (!m_renderStop.load(std::memory_order_acquire)) {
        if (m_renderPaused.load(std::memory_order_acquire)) {
            if (!outputPaused) {
                m_output->setPaused(true);
                outputPaused = true;
            }
            std::unique_lock<std::mutex> wait(m_renderWaitMutex);
            m_renderWake.wait(wait, [this] {
                return m_renderStop.load(std::memory_order_acquire)
                    || !m_renderPaused.load(std::memory_order_acquire);
            });
            continue;
        }
        if (outputPaused) {
            m_output->setPaused(false);
            outputPaused = false;
        }

        int frames = 0;
        uint64_t generation = 0;
        bool flush = false;
        AudioStreamFormat format;
        PlaybackError decodeFault;
        {
            std::lock_guard<std::mutex> lock(m_decoderMutex);
            flush = m_flushPending;
            m_flushPending = false;
            format = m_activeFormat;
            generation = m_seekGeneration;

            const int chunk = chunkFrames(format);
            buffer.resize((size_t)chunk * format.bytesPerFrame());
            frames = m_decoder ? m_decoder->read(buffer.data(), chunk) : -1;

            if (frames == 0) {
                GaplessManager::TransitionResult t =
                    m_gapless.swapToCurrentLocked(m_decoder, m_activeTrack);
                if (t.switched) {
                    m_activeFormat = t.format;
                    ++m_seekGeneration;
                    resetClockLocked(0, t.format.sampleRate);
                    m_pendingSwitches.push_back(t.track.id);
                    qDebug() << "[Gapless] Switched to" << t.track.id;
                    continue;
                }
            } else if (frames < 0) {
                decodeFault = PlaybackError(
                    m_decoder ? kindForDecoderError(m_decoder->lastError()) : ErrorKind::CorruptStream,
                    m_decoder ? m_decoder->errorString() : QStringLiteral("no decoder"),
                    m_activeTrack.id);
            }
        }

        if (flush)
            m_output->flush();

        if (frames == 0) {
            m_output->drain();
            m_rtEndOfStream.store(true, std::memory_order_release);
            return;
        }
        if (frames < 0) {
            raiseFault(decodeFault);
            return;
        }

        if (!format.sameLayout(m_output->currentFormat())) {
            // Same exclusive handle, new clock
            const IAudioOutput::Status status = m_output->reconfigure(format);
            if (status != IAudioOutput::Status::Ok) {
                raiseFault(PlaybackError(kindForOutputStatus(status),
                                         QString::fromStdString(m_output->lastError()),
                                         currentTrackId()));
                return;
            }
        }

        const int written = m_output->write(buffer.data(), frames);
        if (written < 0) {
            raiseFault(PlaybackError(ErrorKind::DeviceRemoved,
                                     QString::fromStdString(m_output->lastError()),
                                     currentTrackId()));
            return;
        }

        std::lock_guard<std::mutex> lock(m_decoderMutex);
        if (generation == m_seekGeneration)
            m_framesPlayed.fetch_add(written);
    }
}
