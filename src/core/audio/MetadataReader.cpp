#include "MetadataReader.h"
#include "AudioDecoder.h"

#include <QFileInfo>
#include <QUuid>
#include <QDebug>
#include <QtConcurrent>

static int leadingNumber(const QString& tag)
{
    // Handle "3/12" format
    int slashPos = tag.indexOf('/');
    return (slashPos > 0) ? tag.left(slashPos).toInt() : tag.toInt();
}

std::optional<Track> MetadataReader::readTrack(const QString& filePath, QString* error)
{
    QFileInfo fi(filePath);
    if (!fi.exists() || !fi.isFile()) {
        if (error) *error = QStringLiteral("no such file");
        return std::nullopt;
    }

    AudioDecoder decoder;
    if (!decoder.open(fi.absoluteFilePath().toStdString())) {
        if (error) *error = decoder.errorString();
        return std::nullopt;
    }

    const AudioStreamFormat fmt = decoder.format();

    Track track;
    track.id         = QUuid::createUuid().toString(QUuid::WithoutBraces);
    track.filePath   = fi.absoluteFilePath();
    track.durationNs = fmt.durationNs;
    track.sampleRate = fmt.sampleRate;
    track.bitDepth   = fmt.bitsPerSample;
    track.format     = decoder.codecName().toUpper();

    track.title  = decoder.tag("title");
    track.artist = decoder.tag("artist");
    track.album  = decoder.tag("album");

    const QString trackNum = decoder.tag("track");
    if (!trackNum.isEmpty())
        track.trackNumber = leadingNumber(trackNum);
    const QString discNum = decoder.tag("disc");
    if (!discNum.isEmpty())
        track.discNumber = leadingNumber(discNum);

    // Fallback: use filename as title
    if (track.title.isEmpty())
        track.title = fi.completeBaseName();

    decoder.close();
    return track;
}

QVector<Track> MetadataReader::readTracks(const QStringList& filePaths)
{
    const QList<std::optional<Track>> probed = QtConcurrent::blockingMapped<QList<std::optional<Track>>>(
        filePaths, [](const QString& path) {
            QString error;
            std::optional<Track> t = readTrack(path, &error);
            if (!t)
                qWarning() << "[Decoder] Skipping" << path << ":" << error;
            return t;
        });

    QVector<Track> tracks;
    tracks.reserve(probed.size());
    for (const std::optional<Track>& t : probed) {
        if (t)
            tracks.append(*t);
    }
    return tracks;
}
