#pragma once

#include <QString>
#include <QMetaType>

class QDebug;

enum class ErrorCategory {
    None,
    Pipeline,      // invalid state transition requested
    Device,        // busy, unsupported format, removed
    Decode,        // corrupt stream, unsupported codec
    Io,            // file missing or unreadable
    Construction   // no backend, no device
};

enum class ErrorKind {
    None,
    InvalidState,
    OutOfRange,
    Cancelled,
    DeviceBusy,
    UnsupportedFormat,
    DeviceRemoved,
    CorruptStream,
    UnsupportedCodec,
    FileNotFound,
    FileUnreadable,
    NoBackend,
    NoDevice
};

ErrorCategory categoryOf(ErrorKind kind);
QString errorKindName(ErrorKind kind);

struct PlaybackError {
    ErrorKind kind = ErrorKind::None;
    QString   message;
    QString   trackId;   // empty when not tied to a track

    PlaybackError() = default;
    PlaybackError(ErrorKind k, const QString& msg, const QString& track = QString())
        : kind(k), message(msg), trackId(track) {}

    ErrorCategory category() const { return categoryOf(kind); }

    // Failures that belong to one track; the controller skips past them.
    bool isPerTrack() const;
    bool isTransient() const { return kind == ErrorKind::DeviceBusy; }

    QString toString() const;
};

// Success, or exactly one PlaybackError.
class PlaybackResult {
public:
    PlaybackResult() = default;
    PlaybackResult(const PlaybackError& error) : m_error(error) {}

    static PlaybackResult success() { return PlaybackResult(); }
    static PlaybackResult failure(ErrorKind kind, const QString& message,
                                  const QString& trackId = QString())
    {
        return PlaybackResult(PlaybackError(kind, message, trackId));
    }

    bool ok() const { return m_error.kind == ErrorKind::None; }
    explicit operator bool() const { return ok(); }

    const PlaybackError& error() const { return m_error; }
    ErrorKind kind() const { return m_error.kind; }

private:
    PlaybackError m_error;
};

QDebug operator<<(QDebug dbg, const PlaybackError& error);

Q_DECLARE_METATYPE(PlaybackError)
Q_DECLARE_METATYPE(PlaybackResult)
