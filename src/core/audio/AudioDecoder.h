#pragma once
#include <string>
#include <memory>
#include <QString>
#include "IDecoder.h"

// FFmpeg decoder that hands out samples in the codec's own sample format.
// Planar output is repacked to interleaved; sample values are never touched.
class AudioDecoder : public IDecoder {
public:
    AudioDecoder();
    ~AudioDecoder() override;

    AudioDecoder(const AudioDecoder&) = delete;
    AudioDecoder& operator=(const AudioDecoder&) = delete;

    bool open(const std::string& filePath) override;
    void close() override;
    bool isOpen() const override;

    int read(uint8_t* buf, int maxFrames) override;
    bool seek(uint64_t positionNs) override;

    AudioStreamFormat format() const override;
    DecoderError lastError() const override;
    QString errorString() const override;

    // Returns the FFmpeg codec name (e.g. "flac", "alac", "mp3") or empty if not loaded
    QString codecName() const override;

    // Container tag lookup (title, artist, album, track, disc); empty if absent
    QString tag(const char* key) const;

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};
