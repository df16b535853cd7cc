#include "MusicData.h"

AudioQuality classifyAudioQuality(const Track& track)
{
    const QString tag = track.format.toUpper();
    if (tag.isEmpty())
        return AudioQuality::Unknown;

    if (tag == QStringLiteral("MP3") || tag == QStringLiteral("AAC")
        || tag == QStringLiteral("OGG") || tag == QStringLiteral("VORBIS")
        || tag == QStringLiteral("OPUS"))
        return AudioQuality::Lossy;

    if (track.bitDepth > 16 || track.sampleRate > 48000)
        return AudioQuality::HiRes;
    return AudioQuality::Lossless;
}

QString getQualityLabel(AudioQuality quality)
{
    switch (quality) {
    case AudioQuality::Lossy:    return QStringLiteral("Lossy");
    case AudioQuality::Lossless: return QStringLiteral("Lossless");
    case AudioQuality::HiRes:    return QStringLiteral("Hi-Res");
    default:                     return QString();
    }
}

QString formatStreamLabel(const Track& track)
{
    const double khz = track.sampleRate / 1000.0;
    return QStringLiteral("%1kHz / %2-bit")
        .arg(QString::number(khz, 'g', 4))
        .arg(track.bitDepth);
}

QString formatDuration(quint64 ns)
{
    const quint64 totalSecs = ns / 1000000000ULL;
    return QStringLiteral("%1:%2")
        .arg(totalSecs / 60)
        .arg(totalSecs % 60, 2, 10, QLatin1Char('0'));
}
