#pragma once

#include <memory>
#include <string>
#include <cstdint>
#include "AudioDevice.h"
#include "../core/audio/AudioFormat.h"

// Exclusive, non-mixing output stream on one device.
//
// Threading: open/close run while no writer is active. write/drain/flush/
// setPaused/reconfigure are called from the single render thread.
// interrupt() may be called from any thread.
class IAudioOutput {
public:
    virtual ~IAudioOutput() = default;

    IAudioOutput(const IAudioOutput&) = delete;
    IAudioOutput& operator=(const IAudioOutput&) = delete;

    enum class Status {
        Ok,
        Busy,               // held by another exclusive client
        UnsupportedFormat,  // device cannot take the format natively
        NotFound,           // device vanished
        Failed
    };

    // Lifecycle. open() claims the device exclusively at exactly `format`.
    virtual Status open(const std::string& deviceId, const AudioStreamFormat& format) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    // Switch the held handle to a new stream format without releasing it.
    virtual Status reconfigure(const AudioStreamFormat& format) = 0;

    // Blocking write of interleaved frames in the open format.
    // Returns frames written (short on interrupt) or -1 on device failure.
    virtual int write(const uint8_t* data, int frames) = 0;

    virtual void drain() = 0;   // block until queued frames are played
    virtual void flush() = 0;   // discard queued frames
    virtual bool setPaused(bool paused) = 0;

    // Make a blocked write() return promptly. Cleared by the next open().
    virtual void interrupt() = 0;

    // Signal path info
    virtual std::string deviceId() const = 0;
    virtual AudioStreamFormat currentFormat() const = 0;
    virtual std::string lastError() const = 0;

protected:
    IAudioOutput() = default;
};
