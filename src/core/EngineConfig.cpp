#include "EngineConfig.h"

#include <QDebug>
#include <QDir>
#include <QSettings>
#include <QStandardPaths>

namespace {

int boundedInt(const QSettings& s, const QString& key, int fallback, int lo, int hi)
{
    bool ok = false;
    const int v = s.value(key, fallback).toInt(&ok);
    if (!ok || v < lo || v > hi) {
        qWarning() << "[Config] Ignoring" << key << "=" << s.value(key).toString()
                   << "(expected" << lo << "-" << hi << ")";
        return fallback;
    }
    return v;
}

} // namespace

int EngineConfig::retryDelayMs(int attempt) const
{
    const int shift = qBound(0, attempt - 1, 16);
    return retryBaseDelayMs << shift;
}

// ── Settings INI path ───────────────────────────────────────────────
QString EngineConfig::settingsPath()
{
    QDir dir(QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation)
             + QStringLiteral("/Aurum"));
    return dir.filePath(QStringLiteral("settings.ini"));
}

EngineConfig EngineConfig::fromSettings(const QString& iniPath)
{
    EngineConfig c;
    QSettings s(iniPath, QSettings::IniFormat);
    if (s.status() != QSettings::NoError) {
        qWarning() << "[Config] Cannot read" << iniPath << "- using defaults";
        return c;
    }

    c.positionIntervalMs = boundedInt(s, QStringLiteral("playback/positionIntervalMs"),
                                      c.positionIntervalMs, 5, 1000);
    c.retryMaxAttempts   = boundedInt(s, QStringLiteral("playback/retryMaxAttempts"),
                                      c.retryMaxAttempts, 1, 10);
    c.retryBaseDelayMs   = boundedInt(s, QStringLiteral("playback/retryBaseDelayMs"),
                                      c.retryBaseDelayMs, 1, 5000);
    c.eventQueueCapacity = boundedInt(s, QStringLiteral("playback/eventQueueCapacity"),
                                      c.eventQueueCapacity, 0, 1000000);
    c.gapless            = s.value(QStringLiteral("playback/gapless"), c.gapless).toBool();
    c.bufferDurationMs   = boundedInt(s, QStringLiteral("audio/bufferDurationMs"),
                                      c.bufferDurationMs, 5, 1000);
    c.deviceId           = s.value(QStringLiteral("audio/outputDevice")).toString();

    qDebug() << "[Config] Loaded" << iniPath
             << "interval:" << c.positionIntervalMs << "ms"
             << "retries:" << c.retryMaxAttempts
             << "device:" << (c.deviceId.isEmpty() ? QStringLiteral("default") : c.deviceId);
    return c;
}
