#include "PlaybackError.h"

#include <QDebug>

ErrorCategory categoryOf(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::None:
        return ErrorCategory::None;
    case ErrorKind::InvalidState:
    case ErrorKind::OutOfRange:
    case ErrorKind::Cancelled:
        return ErrorCategory::Pipeline;
    case ErrorKind::DeviceBusy:
    case ErrorKind::UnsupportedFormat:
    case ErrorKind::DeviceRemoved:
        return ErrorCategory::Device;
    case ErrorKind::CorruptStream:
    case ErrorKind::UnsupportedCodec:
        return ErrorCategory::Decode;
    case ErrorKind::FileNotFound:
    case ErrorKind::FileUnreadable:
        return ErrorCategory::Io;
    case ErrorKind::NoBackend:
    case ErrorKind::NoDevice:
        return ErrorCategory::Construction;
    }
    return ErrorCategory::None;
}

QString errorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::None:              return QStringLiteral("None");
    case ErrorKind::InvalidState:      return QStringLiteral("InvalidState");
    case ErrorKind::OutOfRange:        return QStringLiteral("OutOfRange");
    case ErrorKind::Cancelled:         return QStringLiteral("Cancelled");
    case ErrorKind::DeviceBusy:        return QStringLiteral("DeviceBusy");
    case ErrorKind::UnsupportedFormat: return QStringLiteral("UnsupportedFormat");
    case ErrorKind::DeviceRemoved:     return QStringLiteral("DeviceRemoved");
    case ErrorKind::CorruptStream:     return QStringLiteral("CorruptStream");
    case ErrorKind::UnsupportedCodec:  return QStringLiteral("UnsupportedCodec");
    case ErrorKind::FileNotFound:      return QStringLiteral("FileNotFound");
    case ErrorKind::FileUnreadable:    return QStringLiteral("FileUnreadable");
    case ErrorKind::NoBackend:         return QStringLiteral("NoBackend");
    case ErrorKind::NoDevice:          return QStringLiteral("NoDevice");
    }
    return QStringLiteral("Unknown");
}

bool PlaybackError::isPerTrack() const
{
    switch (category()) {
    case ErrorCategory::Decode:
    case ErrorCategory::Io:
        return true;
    case ErrorCategory::Device:
        return kind == ErrorKind::UnsupportedFormat;
    default:
        return false;
    }
}

QString PlaybackError::toString() const
{
    QString s = errorKindName(kind);
    if (!message.isEmpty())
        s += QStringLiteral(": ") + message;
    if (!trackId.isEmpty())
        s += QStringLiteral(" (track ") + trackId + QLatin1Char(')');
    return s;
}

QDebug operator<<(QDebug dbg, const PlaybackError& error)
{
    QDebugStateSaver saver(dbg);
    dbg.nospace() << "PlaybackError(" << error.toString() << ')';
    return dbg;
}
