#include "AlsaOutput.h"

#include <alsa/asoundlib.h>
#include <QDebug>
#include <cerrno>

namespace {

// FFmpeg hands 24-bit sources over MSB-aligned in a 32-bit container, which
// is exactly S32_LE on the wire.
snd_pcm_format_t alsaFormatFor(const AudioStreamFormat& format)
{
    if (format.isFloat)
        return format.bytesPerSample == 4 ? SND_PCM_FORMAT_FLOAT_LE : SND_PCM_FORMAT_UNKNOWN;
    switch (format.bytesPerSample) {
    case 2: return SND_PCM_FORMAT_S16_LE;
    case 4: return SND_PCM_FORMAT_S32_LE;
    default: return SND_PCM_FORMAT_UNKNOWN;
    }
}

} // namespace

AlsaOutput::AlsaOutput(int periodMs)
    : m_periodMs(periodMs > 0 ? periodMs : 50)
{
}

AlsaOutput::~AlsaOutput()
{
    close();
}

IAudioOutput::Status AlsaOutput::open(const std::string& deviceId, const AudioStreamFormat& format)
{
    close();
    m_interrupted.store(false, std::memory_order_release);

    int err = snd_pcm_open(&m_pcm, deviceId.c_str(), SND_PCM_STREAM_PLAYBACK, SND_PCM_NONBLOCK);
    if (err < 0) {
        m_pcm = nullptr;
        setLastError(snd_strerror(err));
        qWarning() << "[ALSA] Cannot open" << deviceId.c_str() << ":" << snd_strerror(err);
        if (err == -EBUSY)
            return Status::Busy;
        if (err == -ENOENT || err == -ENODEV)
            return Status::NotFound;
        return Status::Failed;
    }

    m_deviceId = deviceId;
    Status status = configure(format);
    if (status != Status::Ok) {
        snd_pcm_close(m_pcm);
        m_pcm = nullptr;
        return status;
    }

    qDebug() << "[ALSA] Opened" << deviceId.c_str() << "exclusive"
             << format.sampleRate << "Hz" << format.bitsPerSample << "bit"
             << format.channels << "ch";
    return Status::Ok;
}

void AlsaOutput::close()
{
    if (!m_pcm)
        return;
    snd_pcm_drop(m_pcm);
    snd_pcm_close(m_pcm);
    m_pcm = nullptr;
    qDebug() << "[ALSA] Released" << m_deviceId.c_str();
}

IAudioOutput::Status AlsaOutput::reconfigure(const AudioStreamFormat& format)
{
    if (!m_pcm)
        return Status::Failed;
    if (format.sameLayout(m_format))
        return Status::Ok;

    // Let the tail of the previous stream play out on the old clock.
    drain();
    snd_pcm_hw_free(m_pcm);

    Status status = configure(format);
    if (status == Status::Ok) {
        qDebug() << "[ALSA] Reconfigured" << m_deviceId.c_str() << "to"
                 << format.sampleRate << "Hz" << format.bitsPerSample << "bit";
    }
    return status;
}

IAudioOutput::Status AlsaOutput::configure(const AudioStreamFormat& format)
{
    const snd_pcm_format_t pcmFormat = alsaFormatFor(format);
    if (pcmFormat == SND_PCM_FORMAT_UNKNOWN) {
        setLastError("no ALSA sample format for stream");
        return Status::UnsupportedFormat;
    }

    snd_pcm_hw_params_t* hwParams;
    snd_pcm_hw_params_alloca(&hwParams);

    int err = snd_pcm_hw_params_any(m_pcm, hwParams);
    if (err < 0) {
        setLastError(snd_strerror(err));
        return Status::Failed;
    }

    // hw: never resamples, but refuse plugin resampling outright as well
    snd_pcm_hw_params_set_rate_resample(m_pcm, hwParams, 0);

    err = snd_pcm_hw_params_set_access(m_pcm, hwParams, SND_PCM_ACCESS_RW_INTERLEAVED);
    if (err < 0) {
        setLastError(snd_strerror(err));
        return Status::Failed;
    }

    err = snd_pcm_hw_params_set_format(m_pcm, hwParams, pcmFormat);
    if (err < 0) {
        setLastError(std::string("sample format rejected: ") + snd_strerror(err));
        return Status::UnsupportedFormat;
    }

    err = snd_pcm_hw_params_set_channels(m_pcm, hwParams, (unsigned)format.channels);
    if (err < 0) {
        setLastError(std::string("channel count rejected: ") + snd_strerror(err));
        return Status::UnsupportedFormat;
    }

    // Exact rate only. set_rate_near would hide a mismatch.
    err = snd_pcm_hw_params_set_rate(m_pcm, hwParams, (unsigned)format.sampleRate, 0);
    if (err < 0) {
        setLastError(std::string("sample rate rejected: ") + snd_strerror(err));
        return Status::UnsupportedFormat;
    }

    snd_pcm_uframes_t periodFrames = (snd_pcm_uframes_t)format.sampleRate * m_periodMs / 1000;
    snd_pcm_hw_params_set_period_size_near(m_pcm, hwParams, &periodFrames, nullptr);
    snd_pcm_uframes_t bufferFrames = periodFrames * 4;
    snd_pcm_hw_params_set_buffer_size_near(m_pcm, hwParams, &bufferFrames);

    err = snd_pcm_hw_params(m_pcm, hwParams);
    if (err < 0) {
        setLastError(snd_strerror(err));
        return Status::Failed;
    }
    m_canPause = snd_pcm_hw_params_can_pause(hwParams) != 0;

    err = snd_pcm_prepare(m_pcm);
    if (err < 0) {
        setLastError(snd_strerror(err));
        return Status::Failed;
    }

    m_format = format;
    return Status::Ok;
}

int AlsaOutput::write(const uint8_t* data, int frames)
{
    if (!m_pcm)
        return -1;

    const int bytesPerFrame = m_format.bytesPerFrame();
    int written = 0;
    while (written < frames) {
        if (m_interrupted.load(std::memory_order_acquire))
            break;

        snd_pcm_sframes_t n = snd_pcm_writei(m_pcm, data + (size_t)written * bytesPerFrame,
                                             (snd_pcm_uframes_t)(frames - written));
        if (n == -EAGAIN) {
            snd_pcm_wait(m_pcm, 20);
            continue;
        }
        if (n < 0) {
            if (!recover((int)n))
                return -1;
            continue;
        }
        written += (int)n;
    }
    return written;
}

bool AlsaOutput::recover(int err)
{
    if (err == -ENODEV) {
        setLastError("device removed");
        qWarning() << "[ALSA] Device removed:" << m_deviceId.c_str();
        return false;
    }
    if (err == -EPIPE)
        qDebug() << "[ALSA] Underrun on" << m_deviceId.c_str();

    int r = snd_pcm_recover(m_pcm, err, 1);
    if (r < 0) {
        setLastError(snd_strerror(r));
        qWarning() << "[ALSA] Recovery failed:" << snd_strerror(r);
        return false;
    }
    return true;
}

void AlsaOutput::drain()
{
    if (!m_pcm)
        return;
    snd_pcm_nonblock(m_pcm, 0);
    snd_pcm_drain(m_pcm);
    snd_pcm_nonblock(m_pcm, 1);
    snd_pcm_prepare(m_pcm);
}

void AlsaOutput::flush()
{
    if (!m_pcm)
        return;
    snd_pcm_drop(m_pcm);
    snd_pcm_prepare(m_pcm);
}

bool AlsaOutput::setPaused(bool paused)
{
    if (!m_pcm)
        return false;
    if (m_canPause)
        return snd_pcm_pause(m_pcm, paused ? 1 : 0) == 0;

    // No hardware pause: drop the queue and restart from the next write
    if (paused)
        snd_pcm_drop(m_pcm);
    else
        snd_pcm_prepare(m_pcm);
    return true;
}

void AlsaOutput::interrupt()
{
    m_interrupted.store(true, std::memory_order_release);
}

std::string AlsaOutput::lastError() const
{
    std::lock_guard<std::mutex> lock(m_errorMutex);
    return m_lastError;
}

void AlsaOutput::setLastError(const std::string& message)
{
    std::lock_guard<std::mutex> lock(m_errorMutex);
    m_lastError = message;
}
