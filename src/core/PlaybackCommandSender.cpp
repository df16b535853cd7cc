#include "PlaybackCommandSender.h"
#include "PlaybackController.h"

#include <QDebug>
#include <QMetaObject>
#include <QPromise>
#include <memory>

PlaybackCommandSender::PlaybackCommandSender(PlaybackController* controller)
    : m_controller(controller)
{
}

QFuture<PlaybackResult> PlaybackCommandSender::post(const char* name, Command command) const
{
    auto promise = std::make_shared<QPromise<PlaybackResult>>();
    QFuture<PlaybackResult> future = promise->future();
    promise->start();

    QPointer<PlaybackController> target = m_controller;
    if (!target) {
        qDebug() << "[Controller]" << name << "sent to a destroyed controller";
        promise->addResult(PlaybackResult::failure(ErrorKind::Cancelled,
                                                   QStringLiteral("controller is gone")));
        promise->finish();
        return future;
    }

    // A controller destroyed before delivery drops the call, which cancels
    // the future when the promise goes away
    QMetaObject::invokeMethod(target.data(), [target, promise, command]() {
        if (!target)
            return;
        command(target.data()).then([promise](const PlaybackResult& r) {
            promise->addResult(r);
            promise->finish();
        });
    }, Qt::QueuedConnection);

    return future;
}

QFuture<PlaybackResult> PlaybackCommandSender::loadQueue(const QVector<Track>& tracks)
{
    return post("loadQueue", [tracks](PlaybackController* c) { return c->loadQueue(tracks); });
}

QFuture<PlaybackResult> PlaybackCommandSender::play()
{
    return post("play", [](PlaybackController* c) { return c->play(); });
}

QFuture<PlaybackResult> PlaybackCommandSender::pause()
{
    return post("pause", [](PlaybackController* c) { return c->pause(); });
}

QFuture<PlaybackResult> PlaybackCommandSender::stop()
{
    return post("stop", [](PlaybackController* c) { return c->stop(); });
}

QFuture<PlaybackResult> PlaybackCommandSender::next()
{
    return post("next", [](PlaybackController* c) { return c->next(); });
}

QFuture<PlaybackResult> PlaybackCommandSender::previous()
{
    return post("previous", [](PlaybackController* c) { return c->previous(); });
}

QFuture<PlaybackResult> PlaybackCommandSender::jump(int index)
{
    return post("jump", [index](PlaybackController* c) { return c->jump(index); });
}

QFuture<PlaybackResult> PlaybackCommandSender::seek(quint64 positionNs)
{
    return post("seek", [positionNs](PlaybackController* c) { return c->seek(positionNs); });
}

QFuture<PlaybackResult> PlaybackCommandSender::selectDevice(const QString& deviceId)
{
    return post("selectDevice", [deviceId](PlaybackController* c) { return c->selectDevice(deviceId); });
}
