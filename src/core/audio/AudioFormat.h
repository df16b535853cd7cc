#pragma once
#include <cstdint>

// Native PCM layout of a decoded stream. The device is opened with exactly
// this layout; nothing in the signal path converts between formats.
struct AudioStreamFormat {
    int      sampleRate     = 44100;
    int      channels       = 2;
    int      bitsPerSample  = 16;   // significant bits
    int      bytesPerSample = 2;    // container size
    bool     isFloat        = false;
    int64_t  totalFrames    = 0;
    uint64_t durationNs     = 0;

    int bytesPerFrame() const { return bytesPerSample * channels; }

    // Same wire layout (duration excluded)
    bool sameLayout(const AudioStreamFormat& o) const
    {
        return sampleRate == o.sampleRate && channels == o.channels
            && bitsPerSample == o.bitsPerSample && bytesPerSample == o.bytesPerSample
            && isFloat == o.isFloat;
    }
};
