#ifndef MUSICDATA_H
#define MUSICDATA_H

#include <QString>
#include <QVector>
#include <QMetaType>

// ── Audio Quality Classification ────────────────────────────────────
enum class AudioQuality {
    Unknown,
    Lossy,       // MP3, AAC, OGG
    Lossless,    // CD quality: 16-bit/44.1-48kHz lossless (FLAC, ALAC, WAV)
    HiRes        // Lossless at >16-bit or >48kHz
};

// ── Data Structs ────────────────────────────────────────────────────
// Immutable once handed over by the library; the engine only reads it.
struct Track {
    QString id;
    QString filePath;
    quint64 durationNs  = 0;
    int     trackNumber = 0;
    int     discNumber  = 0;
    QString format;          // container/codec tag, e.g. "FLAC"
    int     bitDepth    = 16;
    int     sampleRate  = 44100;

    // Display only
    QString title;
    QString artist;
    QString album;

    bool isValid() const { return !id.isEmpty(); }
};

Q_DECLARE_METATYPE(Track)

AudioQuality classifyAudioQuality(const Track& track);
QString      getQualityLabel(AudioQuality quality);

// "96kHz / 24-bit"
QString formatStreamLabel(const Track& track);
// "3:05"
QString formatDuration(quint64 ns);

#endif // MUSICDATA_H
