#include "PlaybackController.h"
#include "PlaybackCommandSender.h"
#include "PlaybackEventQueue.h"

#include <QDebug>
#include <QPromise>
#include <QReadLocker>
#include <QTimer>
#include <QWriteLocker>
#include <algorithm>

namespace {

using Promise = std::shared_ptr<QPromise<PlaybackResult>>;

Promise makePromise()
{
    auto promise = std::make_shared<QPromise<PlaybackResult>>();
    promise->start();
    return promise;
}

void finish(const Promise& promise, const PlaybackResult& result)
{
    promise->addResult(result);
    promise->finish();
}

QFuture<PlaybackResult> resolved(const PlaybackResult& result)
{
    Promise promise = makePromise();
    finish(promise, result);
    return promise->future();
}

PlaybackResult cancelled()
{
    return PlaybackResult::failure(ErrorKind::Cancelled, QStringLiteral("superseded by a newer command"));
}

} // namespace

// ── Construction ─────────────────────────────────────────────────────

std::unique_ptr<PlaybackController> PlaybackController::create(
    std::shared_ptr<IAudioBackend> backend,
    const EngineConfig& config,
    PlaybackError* error,
    PlaybackPipeline::DecoderFactory decoderFactory)
{
    auto fail = [error](ErrorKind kind, const QString& message) {
        qWarning() << "[Controller] Cannot start:" << message;
        if (error)
            *error = PlaybackError(kind, message);
        return std::unique_ptr<PlaybackController>();
    };

    if (!backend)
        return fail(ErrorKind::NoBackend, QStringLiteral("no audio backend for this platform"));

    const std::vector<DeviceDescriptor> devices = backend->enumerateDevices();
    if (devices.empty())
        return fail(ErrorKind::NoDevice,
                    QStringLiteral("backend %1 reports no output devices")
                        .arg(QString::fromStdString(backend->name())));

    auto byId = [&](const std::string& id) {
        return std::find_if(devices.begin(), devices.end(),
                            [&id](const DeviceDescriptor& d) { return d.id == id; });
    };

    auto chosen = devices.end();
    if (!config.deviceId.isEmpty()) {
        chosen = byId(config.deviceId.toStdString());
        if (chosen == devices.end())
            qWarning() << "[Controller] Configured device" << config.deviceId
                       << "not found, using default";
    }
    if (chosen == devices.end())
        chosen = std::find_if(devices.begin(), devices.end(),
                              [](const DeviceDescriptor& d) { return d.isDefault; });
    if (chosen == devices.end())
        chosen = devices.begin();

    if (error)
        *error = PlaybackError();
    return std::unique_ptr<PlaybackController>(
        new PlaybackController(std::move(backend), config, *chosen, std::move(decoderFactory)));
}

PlaybackController::PlaybackController(std::shared_ptr<IAudioBackend> backend,
                                       const EngineConfig& config,
                                       const DeviceDescriptor& device,
                                       PlaybackPipeline::DecoderFactory decoderFactory)
    : QObject(nullptr)
    , m_backend(backend)
    , m_config(config)
    , m_device(device)
{
    qRegisterMetaType<PlaybackEvent>();
    qRegisterMetaType<PlaybackResult>();

    m_engine = new AudioEngine(std::move(backend), std::move(decoderFactory), m_config, this);
    connect(m_engine, &AudioEngine::eventOccurred, this, &PlaybackController::onEngineEvent);

    qDebug() << "[Controller] Output device:" << device.id.c_str() << device.name.c_str()
             << "gapless:" << m_config.gapless;

    // Ordered ahead of every later command, so nothing needs to wait on it
    m_engine->setDevice(m_device).then(this, [](const PlaybackResult& r) {
        if (!r)
            qWarning() << "[Controller] Initial device selection failed:" << r.error();
    });
}

PlaybackController::~PlaybackController()
{
    bumpToken();
    {
        QMutexLocker lock(&m_subscribersMutex);
        for (const auto& weak : m_subscribers) {
            if (auto queue = weak.lock())
                queue->close();
        }
        m_subscribers.clear();
    }
    disconnect(m_engine, nullptr, this, nullptr);
    delete m_engine;
    m_engine = nullptr;
}

// ── Commands ─────────────────────────────────────────────────────────

QFuture<PlaybackResult> PlaybackController::loadQueue(const QVector<Track>& tracks)
{
    const quint64 token = bumpToken();
    {
        QWriteLocker lock(&m_queueLock);
        m_queue.setQueue(tracks);
    }
    m_loadedId.clear();
    m_preloadId.clear();
    m_announcedIndex = -1;

    if (tracks.isEmpty()) {
        qDebug() << "[Controller] Empty queue loaded";
        m_wantPlay = false;
        Promise promise = makePromise();
        m_engine->stop().then(this, [promise](const PlaybackResult& r) { finish(promise, r); });
        return promise->future();
    }

    Promise promise = makePromise();
    loadCurrent(0, m_wantPlay && m_state == PlaybackState::Playing, token,
                [promise](const PlaybackResult& r) { finish(promise, r); });
    return promise->future();
}

QFuture<PlaybackResult> PlaybackController::play()
{
    if (currentIndex() < 0)
        return resolved(PlaybackResult::failure(ErrorKind::InvalidState, QStringLiteral("queue is empty")));

    m_wantPlay = true;
    Promise promise = makePromise();
    Completion done = [promise](const PlaybackResult& r) { finish(promise, r); };

    // Nothing held after stop or end of queue: reload from the top of the track
    if (m_loadedId.isEmpty())
        loadCurrent(0, true, m_token, std::move(done));
    else
        startPlayback(1, m_token, std::move(done));
    return promise->future();
}

QFuture<PlaybackResult> PlaybackController::pause()
{
    m_wantPlay = false;
    return m_engine->pause();
}

QFuture<PlaybackResult> PlaybackController::stop()
{
    bumpToken();
    m_wantPlay = false;
    m_loadedId.clear();
    m_preloadId.clear();
    qDebug() << "[Controller] Stop at queue index" << currentIndex();
    return m_engine->stop();
}

QFuture<PlaybackResult> PlaybackController::next()
{
    const quint64 token = bumpToken();

    Track upcoming;
    {
        QReadLocker lock(&m_queueLock);
        upcoming = m_queue.preloadTrack();
    }
    if (!upcoming.isValid())
        return resolved(PlaybackResult::failure(ErrorKind::OutOfRange, QStringLiteral("already at the last track")));

    Promise promise = makePromise();
    Completion done = [promise](const PlaybackResult& r) { finish(promise, r); };

    const bool active = m_state == PlaybackState::Playing || m_state == PlaybackState::Paused;
    if (active && m_config.gapless && !m_preloadId.isEmpty() && m_preloadId == upcoming.id) {
        // Gapless manual skip; the queue follows on the engine's TrackChanged
        m_engine->skipToPreload().then(this, [this, token, done](const PlaybackResult& r) {
            if (token != m_token) {
                done(cancelled());
                return;
            }
            if (r) {
                done(r);
                return;
            }
            qDebug() << "[Controller] Gapless skip unavailable:" << r.error();
            {
                QWriteLocker lock(&m_queueLock);
                m_queue.advance();
            }
            loadCurrent(0, m_wantPlay, token, done);
        });
        return promise->future();
    }

    {
        QWriteLocker lock(&m_queueLock);
        m_queue.advance();
    }
    loadCurrent(0, m_wantPlay, token, std::move(done));
    return promise->future();
}

QFuture<PlaybackResult> PlaybackController::previous()
{
    bool moved = false;
    {
        QWriteLocker lock(&m_queueLock);
        if (m_queue.isEmpty())
            return resolved(PlaybackResult::failure(ErrorKind::InvalidState, QStringLiteral("queue is empty")));
        if (m_queue.canGoPrevious()) {
            m_queue.previous();
            moved = true;
        }
    }

    // At the first track: restart it. The pipeline and a pending preload stay.
    if (!moved && !m_loadedId.isEmpty()) {
        if (m_state == PlaybackState::Playing || m_state == PlaybackState::Paused)
            return m_engine->seek(0);
        return resolved(PlaybackResult::success());
    }

    const quint64 token = bumpToken();
    Promise promise = makePromise();
    loadCurrent(0, m_wantPlay, token, [promise](const PlaybackResult& r) { finish(promise, r); });
    return promise->future();
}

QFuture<PlaybackResult> PlaybackController::jump(int index)
{
    {
        QWriteLocker lock(&m_queueLock);
        if (!m_queue.jump(index))
            return resolved(PlaybackResult::failure(ErrorKind::OutOfRange,
                QStringLiteral("index %1 outside queue of %2").arg(index).arg(m_queue.size())));
    }

    const quint64 token = bumpToken();
    Promise promise = makePromise();
    loadCurrent(0, m_wantPlay, token, [promise](const PlaybackResult& r) { finish(promise, r); });
    return promise->future();
}

QFuture<PlaybackResult> PlaybackController::seek(quint64 positionNs)
{
    return m_engine->seek(positionNs);
}

QFuture<PlaybackResult> PlaybackController::selectDevice(const QString& deviceId)
{
    const std::vector<DeviceDescriptor> all = devices();
    auto it = std::find_if(all.begin(), all.end(), [&deviceId](const DeviceDescriptor& d) {
        return d.id == deviceId.toStdString();
    });
    if (it == all.end())
        return resolved(PlaybackResult::failure(ErrorKind::DeviceRemoved,
                                                QStringLiteral("no such device: ") + deviceId));

    const quint64 token = bumpToken();
    const bool wasLoaded = !m_loadedId.isEmpty();
    const bool wasPlaying = m_state == PlaybackState::Playing;
    const bool wasPaused = m_state == PlaybackState::Paused;
    quint64 resumeAt = wasLoaded ? m_engine->position() : 0;
    if (resumeAt >= currentTrack().durationNs)
        resumeAt = 0;

    qDebug() << "[Controller] Switching output to" << deviceId << "resume at"
             << resumeAt / 1000000 << "ms";

    m_device = *it;
    m_loadedId.clear();
    m_preloadId.clear();
    m_engine->stop();

    Promise promise = makePromise();
    m_engine->setDevice(m_device).then(this,
        [this, token, promise, wasLoaded, wasPlaying, wasPaused, resumeAt](const PlaybackResult& r) {
            if (token != m_token) {
                finish(promise, cancelled());
                return;
            }
            if (!r || !wasLoaded) {
                finish(promise, r);
                return;
            }
            const bool restart = wasPlaying || wasPaused;
            loadCurrent(resumeAt, restart, token, [this, promise, wasPaused](const PlaybackResult& loaded) {
                if (!loaded || !wasPaused) {
                    finish(promise, loaded);
                    return;
                }
                m_wantPlay = false;
                m_engine->pause().then(this, [promise](const PlaybackResult& paused) {
                    finish(promise, paused);
                });
            });
        });
    return promise->future();
}

// ── Queue editing ────────────────────────────────────────────────────

QFuture<PlaybackResult> PlaybackController::append(const QVector<Track>& tracks)
{
    bool wasEmpty = false;
    {
        QWriteLocker lock(&m_queueLock);
        wasEmpty = m_queue.isEmpty();
        m_queue.append(tracks);
    }
    if (wasEmpty && !tracks.isEmpty()) {
        const quint64 token = bumpToken();
        Promise promise = makePromise();
        loadCurrent(0, false, token, [promise](const PlaybackResult& r) { finish(promise, r); });
        return promise->future();
    }
    return afterQueueEdit(false);
}

QFuture<PlaybackResult> PlaybackController::insertNext(const Track& track)
{
    bool wasEmpty = false;
    {
        QWriteLocker lock(&m_queueLock);
        wasEmpty = m_queue.isEmpty();
        m_queue.insertNext(track);
    }
    if (wasEmpty) {
        const quint64 token = bumpToken();
        Promise promise = makePromise();
        loadCurrent(0, false, token, [promise](const PlaybackResult& r) { finish(promise, r); });
        return promise->future();
    }
    return afterQueueEdit(false);
}

QFuture<PlaybackResult> PlaybackController::remove(int index)
{
    bool removedCurrent = false;
    {
        QWriteLocker lock(&m_queueLock);
        if (index < 0 || index >= m_queue.size())
            return resolved(PlaybackResult::failure(ErrorKind::OutOfRange,
                QStringLiteral("index %1 outside queue of %2").arg(index).arg(m_queue.size())));
        removedCurrent = index == m_queue.currentIndex();
        const bool announced = m_announcedIndex == m_queue.currentIndex();
        m_queue.removeFromQueue(index);
        m_announcedIndex = (announced && !removedCurrent) ? m_queue.currentIndex() : -1;
    }
    return afterQueueEdit(removedCurrent);
}

QFuture<PlaybackResult> PlaybackController::move(int fromIndex, int toIndex)
{
    {
        QWriteLocker lock(&m_queueLock);
        if (fromIndex < 0 || fromIndex >= m_queue.size() || toIndex < 0 || toIndex >= m_queue.size())
            return resolved(PlaybackResult::failure(ErrorKind::OutOfRange,
                QStringLiteral("move %1 -> %2 outside queue of %3")
                    .arg(fromIndex).arg(toIndex).arg(m_queue.size())));
        const bool announced = m_announcedIndex == m_queue.currentIndex();
        m_queue.moveTo(fromIndex, toIndex);
        m_announcedIndex = announced ? m_queue.currentIndex() : -1;
    }
    return afterQueueEdit(false);
}

QFuture<PlaybackResult> PlaybackController::afterQueueEdit(bool currentRemoved)
{
    if (!currentRemoved) {
        issuePreload();
        return resolved(PlaybackResult::success());
    }

    const quint64 token = bumpToken();
    m_loadedId.clear();
    m_preloadId.clear();

    if (currentIndex() < 0) {
        m_wantPlay = false;
        return m_engine->stop();
    }

    Promise promise = makePromise();
    loadCurrent(0, m_wantPlay, token, [promise](const PlaybackResult& r) { finish(promise, r); });
    return promise->future();
}

// ── Queries ──────────────────────────────────────────────────────────

QVector<Track> PlaybackController::queueSnapshot() const
{
    QReadLocker lock(&m_queueLock);
    return m_queue.queue();
}

int PlaybackController::currentIndex() const
{
    QReadLocker lock(&m_queueLock);
    return m_queue.currentIndex();
}

std::optional<int> PlaybackController::preloadIndex() const
{
    QReadLocker lock(&m_queueLock);
    return m_queue.preloadIndex();
}

Track PlaybackController::currentTrack() const
{
    QReadLocker lock(&m_queueLock);
    return m_queue.currentTrack();
}

std::vector<DeviceDescriptor> PlaybackController::devices() const
{
    return m_backend->enumerateDevices();
}

// ── Subscription ─────────────────────────────────────────────────────

std::shared_ptr<PlaybackEventQueue> PlaybackController::subscribe(int capacity)
{
    auto queue = std::make_shared<PlaybackEventQueue>(capacity < 0 ? m_config.eventQueueCapacity : capacity);
    QMutexLocker lock(&m_subscribersMutex);
    m_subscribers.push_back(queue);
    return queue;
}

PlaybackCommandSender PlaybackController::commandSender()
{
    return PlaybackCommandSender(this);
}

void PlaybackController::publish(const PlaybackEvent& event)
{
    if (event.type == PlaybackEvent::Type::StateChanged)
        m_state = event.state;
    else if (event.type == PlaybackEvent::Type::TrackChanged)
        m_announcedIndex = currentIndex();
    if (event.type != PlaybackEvent::Type::PositionChanged)
        qDebug() << "[Controller] Event:" << event;

    emit playbackEvent(event);

    QMutexLocker lock(&m_subscribersMutex);
    auto it = m_subscribers.begin();
    while (it != m_subscribers.end()) {
        if (auto queue = it->lock()) {
            queue->push(event);
            ++it;
        } else {
            it = m_subscribers.erase(it);
        }
    }
}

// ── Engine notifications ─────────────────────────────────────────────

void PlaybackController::onEngineEvent(const PlaybackEvent& event)
{
    switch (event.type) {
    case PlaybackEvent::Type::StateChanged:
    case PlaybackEvent::Type::PositionChanged:
        publish(event);
        break;
    case PlaybackEvent::Type::TrackChanged:
        onTrackSwitched(event.trackId);
        break;
    case PlaybackEvent::Type::EndOfQueue:
        onEndOfStream();
        break;
    case PlaybackEvent::Type::Error:
        onFault(event.error);
        break;
    }
}

void PlaybackController::onTrackSwitched(const QString& trackId)
{
    {
        QWriteLocker lock(&m_queueLock);
        if (m_queue.preloadTrack().id == trackId) {
            m_queue.advance();
        } else {
            // Queue was edited after the preload was issued; prefer an
            // entry ahead of the current one when the id repeats
            int index = m_queue.indexOf(trackId, m_queue.currentIndex() + 1);
            if (index < 0)
                index = m_queue.indexOf(trackId);
            qDebug() << "[Controller] Switched to" << trackId << "outside preload slot, index" << index;
            if (index >= 0)
                m_queue.jump(index);
        }
    }

    m_loadedId = trackId;
    m_preloadId.clear();
    publish(PlaybackEvent::trackChanged(trackId));
    issuePreload();
}

void PlaybackController::onEndOfStream()
{
    if (m_loadedId.isEmpty()) {
        qDebug() << "[Controller] Ignoring end of stream from a replaced track";
        return;
    }
    m_loadedId.clear();
    m_preloadId.clear();

    bool advanced = false;
    {
        QWriteLocker lock(&m_queueLock);
        advanced = m_queue.advance().has_value();
    }

    // Preload missing (gapless off, or it failed): continue with a fresh load
    if (advanced) {
        qDebug() << "[Controller] End of track without preload, loading next";
        loadCurrent(0, true, bumpToken(), [](const PlaybackResult& r) {
            if (!r && r.kind() != ErrorKind::Cancelled)
                qWarning() << "[Controller] Could not continue queue:" << r.error();
        });
        return;
    }

    m_wantPlay = false;
    publish(PlaybackEvent::endOfQueue());
}

void PlaybackController::onFault(const PlaybackError& error)
{
    const bool stale = m_loadedId.isEmpty() || (!error.trackId.isEmpty() && error.trackId != m_loadedId);
    publish(PlaybackEvent::errorOccurred(error));
    if (stale)
        return;

    m_loadedId.clear();
    m_preloadId.clear();
    if (!error.isPerTrack()) {
        m_wantPlay = false;
        return;
    }

    skipFailedTrack(error, m_wantPlay, bumpToken(), [](const PlaybackResult& r) {
        if (!r && r.kind() != ErrorKind::Cancelled)
            qWarning() << "[Controller] Skip after fault ended with:" << r.error();
    });
}

// ── Load / play flows ────────────────────────────────────────────────

void PlaybackController::loadCurrent(quint64 startNs, bool autoplay, quint64 token, Completion done)
{
    const Track track = currentTrack();
    if (!track.isValid()) {
        done(PlaybackResult::failure(ErrorKind::InvalidState, QStringLiteral("queue is empty")));
        return;
    }

    m_loadedId.clear();
    m_preloadId.clear();

    m_engine->load(track, startNs).then(this,
        [this, track, autoplay, token, done](const PlaybackResult& r) {
            if (token != m_token) {
                done(cancelled());
                return;
            }
            if (!r) {
                if (r.error().isPerTrack()) {
                    publish(PlaybackEvent::errorOccurred(r.error()));
                    skipFailedTrack(r.error(), autoplay, token, done);
                } else {
                    done(r);
                }
                return;
            }

            // Queue entries, not ids: the same track may be queued twice
            m_loadedId = track.id;
            if (currentIndex() != m_announcedIndex)
                publish(PlaybackEvent::trackChanged(track.id));
            issuePreload();

            if (autoplay)
                startPlayback(1, token, done);
            else
                done(r);
        });
}

void PlaybackController::startPlayback(int attempt, quint64 token, Completion done)
{
    m_engine->play().then(this, [this, attempt, token, done](const PlaybackResult& r) {
        if (token != m_token) {
            done(cancelled());
            return;
        }
        if (r) {
            if (attempt > 1)
                qDebug() << "[Controller] Device acquired on attempt" << attempt;
            done(r);
            return;
        }

        const PlaybackError& error = r.error();
        if (error.isTransient()) {
            if (attempt < m_config.retryMaxAttempts) {
                const int delay = m_config.retryDelayMs(attempt);
                qDebug() << "[Controller] Device busy, retry" << attempt << "of"
                         << m_config.retryMaxAttempts - 1 << "in" << delay << "ms";
                QTimer::singleShot(delay, this, [this, attempt, token, done]() {
                    if (token != m_token) {
                        done(cancelled());
                        return;
                    }
                    startPlayback(attempt + 1, token, done);
                });
                return;
            }
            // Budget spent: report, keep the track loaded and the queue where it is
            qWarning() << "[Controller] Device still busy after" << attempt << "attempts";
            m_wantPlay = false;
            publish(PlaybackEvent::errorOccurred(error));
            done(r);
            return;
        }

        if (error.isPerTrack()) {
            publish(PlaybackEvent::errorOccurred(error));
            m_loadedId.clear();
            skipFailedTrack(error, true, token, done);
            return;
        }
        done(r);
    });
}

void PlaybackController::skipFailedTrack(const PlaybackError& cause, bool autoplay,
                                         quint64 token, Completion done)
{
    std::optional<Track> next;
    {
        QWriteLocker lock(&m_queueLock);
        next = m_queue.advance();
    }

    if (!next) {
        qDebug() << "[Controller] No track left after failure of" << cause.trackId;
        m_wantPlay = false;
        m_loadedId.clear();
        m_preloadId.clear();
        m_engine->stop().then(this, [this, cause, done](const PlaybackResult&) {
            publish(PlaybackEvent::endOfQueue());
            done(cause);
        });
        return;
    }

    qDebug() << "[Controller] Skipping failed track" << cause.trackId << "->" << next->id;
    loadCurrent(0, autoplay, token, std::move(done));
}

void PlaybackController::issuePreload()
{
    if (!m_config.gapless || m_loadedId.isEmpty())
        return;

    Track upcoming;
    {
        QReadLocker lock(&m_queueLock);
        upcoming = m_queue.preloadTrack();
    }

    if (!upcoming.isValid()) {
        if (!m_preloadId.isEmpty()) {
            m_preloadId.clear();
            m_engine->clearPreload();
        }
        return;
    }
    if (upcoming.id == m_preloadId)
        return;

    m_preloadId.clear();
    const quint64 token = m_token;
    m_engine->setPreload(upcoming).then(this, [this, upcoming, token](const PlaybackResult& r) {
        // A reload since then has dropped the pipeline's preload
        if (token != m_token)
            return;
        {
            QReadLocker lock(&m_queueLock);
            if (m_queue.preloadTrack().id != upcoming.id)
                return;   // superseded by a later navigation
        }
        if (r) {
            m_preloadId = upcoming.id;
            qDebug() << "[Gapless] Preloaded" << upcoming.id;
        } else {
            // The pipeline has dropped its old preload, so this track ends
            // the current one and surfaces as an Error when it becomes current
            qDebug() << "[Gapless] Preload of" << upcoming.id << "failed:" << r.error();
        }
    });
}
