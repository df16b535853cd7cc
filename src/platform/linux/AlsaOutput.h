#pragma once

#include "../IAudioOutput.h"

#include <atomic>
#include <mutex>
#include <string>

typedef struct _snd_pcm snd_pcm_t;

// ALSA output on a raw hw: device. Opening hw: claims the device for this
// client only and bypasses dmix/plug, so no mixing or conversion can happen.
class AlsaOutput : public IAudioOutput {
public:
    explicit AlsaOutput(int periodMs = 50);
    ~AlsaOutput() override;

    Status open(const std::string& deviceId, const AudioStreamFormat& format) override;
    void close() override;
    bool isOpen() const override { return m_pcm != nullptr; }

    Status reconfigure(const AudioStreamFormat& format) override;

    int write(const uint8_t* data, int frames) override;
    void drain() override;
    void flush() override;
    bool setPaused(bool paused) override;
    void interrupt() override;

    std::string deviceId() const override { return m_deviceId; }
    AudioStreamFormat currentFormat() const override { return m_format; }
    std::string lastError() const override;

private:
    Status configure(const AudioStreamFormat& format);
    bool recover(int err);
    void setLastError(const std::string& message);

    snd_pcm_t*        m_pcm = nullptr;
    std::string       m_deviceId;
    AudioStreamFormat m_format;
    int               m_periodMs;
    bool              m_canPause = false;
    std::atomic<bool> m_interrupted{false};

    mutable std::mutex m_errorMutex;
    std::string        m_lastError;
};
