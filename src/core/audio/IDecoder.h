#pragma once

#include <string>
#include <cstdint>
#include <QString>
#include "AudioFormat.h"

enum class DecoderError {
    None,
    FileNotFound,
    FileUnreadable,
    CorruptStream,
    UnsupportedCodec
};

// Source of native PCM. Output is interleaved, in exactly format(), with
// no conversion of sample values.
class IDecoder {
public:
    virtual ~IDecoder() = default;

    virtual bool open(const std::string& filePath) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    // Read up to maxFrames interleaved frames into buf (format().bytesPerFrame()
    // bytes each). Returns frames read, 0 at end of stream, -1 on a decode error.
    virtual int read(uint8_t* buf, int maxFrames) = 0;

    // Seek to a position in nanoseconds. Sample accurate. Returns true on success.
    virtual bool seek(uint64_t positionNs) = 0;

    virtual AudioStreamFormat format() const = 0;
    virtual DecoderError lastError() const = 0;
    virtual QString errorString() const { return QString(); }
    virtual QString codecName() const { return QString(); }
};
