#pragma once

#include <QString>
#include <QStringList>
#include <QVector>
#include <optional>
#include "../MusicData.h"

// Builds Track records from files on disk. The format fields are taken from
// the decoder's actual output so they match what the pipeline will check.
class MetadataReader {
public:
    static std::optional<Track> readTrack(const QString& filePath, QString* error = nullptr);

    // Probes in parallel; unreadable files are logged and left out, order kept.
    static QVector<Track> readTracks(const QStringList& filePaths);
};
