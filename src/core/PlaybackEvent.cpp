#include "PlaybackEvent.h"

#include <QDebug>

QString playbackStateName(PlaybackState state)
{
    switch (state) {
    case PlaybackState::Stopped:   return QStringLiteral("Stopped");
    case PlaybackState::Playing:   return QStringLiteral("Playing");
    case PlaybackState::Paused:    return QStringLiteral("Paused");
    case PlaybackState::Buffering: return QStringLiteral("Buffering");
    }
    return QStringLiteral("Unknown");
}

PlaybackEvent PlaybackEvent::stateChanged(PlaybackState s)
{
    PlaybackEvent e;
    e.type = Type::StateChanged;
    e.state = s;
    return e;
}

PlaybackEvent PlaybackEvent::positionChanged(quint64 ns)
{
    PlaybackEvent e;
    e.type = Type::PositionChanged;
    e.positionNs = ns;
    return e;
}

PlaybackEvent PlaybackEvent::trackChanged(const QString& id)
{
    PlaybackEvent e;
    e.type = Type::TrackChanged;
    e.trackId = id;
    return e;
}

PlaybackEvent PlaybackEvent::endOfQueue()
{
    PlaybackEvent e;
    e.type = Type::EndOfQueue;
    return e;
}

PlaybackEvent PlaybackEvent::errorOccurred(const PlaybackError& err)
{
    PlaybackEvent e;
    e.type = Type::Error;
    e.error = err;
    e.trackId = err.trackId;
    return e;
}

QString PlaybackEvent::toString() const
{
    switch (type) {
    case Type::StateChanged:
        return QStringLiteral("StateChanged(%1)").arg(playbackStateName(state));
    case Type::PositionChanged:
        return QStringLiteral("PositionChanged(%1 ms)").arg(positionNs / 1000000ULL);
    case Type::TrackChanged:
        return QStringLiteral("TrackChanged(%1)").arg(trackId);
    case Type::EndOfQueue:
        return QStringLiteral("EndOfQueue");
    case Type::Error:
        return QStringLiteral("Error(%1)").arg(error.toString());
    }
    return QString();
}

QDebug operator<<(QDebug dbg, const PlaybackEvent& event)
{
    QDebugStateSaver saver(dbg);
    dbg.noquote() << event.toString();
    return dbg;
}
