#pragma once

#include <QString>
#include <QMetaType>
#include "PlaybackError.h"

class QDebug;

// Buffering is reserved for network sources and never entered for local files.
enum class PlaybackState { Stopped, Playing, Paused, Buffering };

QString playbackStateName(PlaybackState state);

// Immutable fact about something that already happened.
struct PlaybackEvent {
    enum class Type { StateChanged, PositionChanged, TrackChanged, EndOfQueue, Error };

    Type          type = Type::StateChanged;
    PlaybackState state = PlaybackState::Stopped;   // StateChanged
    quint64       positionNs = 0;                   // PositionChanged
    QString       trackId;                          // TrackChanged
    PlaybackError error;                            // Error

    static PlaybackEvent stateChanged(PlaybackState s);
    static PlaybackEvent positionChanged(quint64 ns);
    static PlaybackEvent trackChanged(const QString& id);
    static PlaybackEvent endOfQueue();
    static PlaybackEvent errorOccurred(const PlaybackError& e);

    QString toString() const;
};

QDebug operator<<(QDebug dbg, const PlaybackEvent& event);

Q_DECLARE_METATYPE(PlaybackState)
Q_DECLARE_METATYPE(PlaybackEvent)
