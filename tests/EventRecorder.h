#pragma once

#include <QElapsedTimer>
#include <QFuture>
#include <QObject>
#include <QTest>
#include <QStringList>
#include <QVector>
#include "core/PlaybackError.h"
#include "core/PlaybackEvent.h"

// Collects PlaybackEvents from any signal carrying one.
class EventRecorder {
public:
    template <typename Sender, typename Signal>
    void attach(Sender* sender, Signal signal, QObject* context)
    {
        QObject::connect(sender, signal, context, [this](const PlaybackEvent& e) { events.append(e); });
    }

    int count(PlaybackEvent::Type type) const
    {
        int n = 0;
        for (const PlaybackEvent& e : events)
            n += e.type == type ? 1 : 0;
        return n;
    }

    int countState(PlaybackState state) const
    {
        int n = 0;
        for (const PlaybackEvent& e : events)
            n += (e.type == PlaybackEvent::Type::StateChanged && e.state == state) ? 1 : 0;
        return n;
    }

    bool hasTrackChange(const QString& id) const
    {
        for (const PlaybackEvent& e : events) {
            if (e.type == PlaybackEvent::Type::TrackChanged && e.trackId == id)
                return true;
        }
        return false;
    }

    // One token per event; runs of position samples fold into "pos*"
    QStringList trace() const
    {
        QStringList out;
        for (const PlaybackEvent& e : events) {
            switch (e.type) {
            case PlaybackEvent::Type::StateChanged:
                out << QStringLiteral("state:") + playbackStateName(e.state);
                break;
            case PlaybackEvent::Type::PositionChanged:
                if (out.isEmpty() || out.last() != QStringLiteral("pos*"))
                    out << QStringLiteral("pos*");
                break;
            case PlaybackEvent::Type::TrackChanged:
                out << QStringLiteral("track:") + e.trackId;
                break;
            case PlaybackEvent::Type::EndOfQueue:
                out << QStringLiteral("end");
                break;
            case PlaybackEvent::Type::Error:
                out << QStringLiteral("error:") + errorKindName(e.error.kind);
                break;
            }
        }
        return out;
    }

    void clear() { events.clear(); }

    QVector<PlaybackEvent> events;
};

// Spins the event loop until the command resolves. Continuations run on
// this thread, so a plain waitForFinished() would deadlock controller flows.
inline PlaybackResult awaitResult(QFuture<PlaybackResult> future, int timeoutMs = 5000)
{
    QElapsedTimer timer;
    timer.start();
    while (!future.isFinished() && timer.elapsed() < timeoutMs)
        QTest::qWait(5);
    if (!future.isFinished())
        return PlaybackResult::failure(ErrorKind::Cancelled, QStringLiteral("timed out waiting for command"));
    if (future.isCanceled() || future.resultCount() == 0)
        return PlaybackResult::failure(ErrorKind::Cancelled, QStringLiteral("future cancelled"));
    return future.result();
}
