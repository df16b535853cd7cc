#pragma once

#include <QFuture>
#include <QPointer>
#include <QString>
#include <QVector>
#include <functional>

#include "MusicData.h"
#include "PlaybackError.h"

class PlaybackController;

// Copyable handle for issuing commands from any thread. Each command is
// posted to the controller's thread; if the controller is gone the future
// resolves as Cancelled.
class PlaybackCommandSender {
public:
    PlaybackCommandSender() = default;
    explicit PlaybackCommandSender(PlaybackController* controller);

    bool isConnected() const { return !m_controller.isNull(); }

    QFuture<PlaybackResult> loadQueue(const QVector<Track>& tracks);
    QFuture<PlaybackResult> play();
    QFuture<PlaybackResult> pause();
    QFuture<PlaybackResult> stop();
    QFuture<PlaybackResult> next();
    QFuture<PlaybackResult> previous();
    QFuture<PlaybackResult> jump(int index);
    QFuture<PlaybackResult> seek(quint64 positionNs);
    QFuture<PlaybackResult> selectDevice(const QString& deviceId);

private:
    using Command = std::function<QFuture<PlaybackResult>(PlaybackController*)>;
    QFuture<PlaybackResult> post(const char* name, Command command) const;

    QPointer<PlaybackController> m_controller;
};
