#pragma once

#include <QString>

// Tunables for the playback core. Read-only at runtime; the engine never
// writes settings back.
struct EngineConfig {
    int     positionIntervalMs = 50;   // PositionChanged sampling period
    int     bufferDurationMs   = 50;   // render chunk and device period
    int     retryMaxAttempts   = 4;    // device-busy attempts, first try included
    int     retryBaseDelayMs   = 100;
    int     eventQueueCapacity = 0;    // 0 = unbounded, else drop-oldest
    QString deviceId;                  // empty = backend default
    bool    gapless            = true;

    // Backoff before retry number `attempt` (1-based): base * 2^(attempt-1)
    int retryDelayMs(int attempt) const;

    // ~/.config/Aurum/settings.ini
    static QString settingsPath();
    // Missing keys and out-of-range values fall back to the defaults above.
    static EngineConfig fromSettings(const QString& iniPath = settingsPath());
};
