#include "AudioEngine.h"
#include "AudioDecoder.h"

#include <QDebug>
#include <QPromise>
#include <QMetaObject>

AudioEngine::AudioEngine(std::shared_ptr<IAudioBackend> backend,
                         PlaybackPipeline::DecoderFactory decoderFactory,
                         const EngineConfig& config,
                         QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_stopEpoch(std::make_shared<std::atomic<quint64>>(0))
{
    qRegisterMetaType<PlaybackEvent>();
    qRegisterMetaType<PlaybackError>();

    if (!decoderFactory)
        decoderFactory = []() { return std::make_unique<AudioDecoder>(); };

    m_pipeline = new PlaybackPipeline(std::move(backend), std::move(decoderFactory));
    m_pipeline->setPositionInterval(m_config.positionIntervalMs);
    m_pipeline->setBufferDuration(m_config.bufferDurationMs);
    m_pipeline->moveToThread(&m_thread);
    m_thread.setObjectName(QStringLiteral("PlaybackPipeline"));

    // Queued: everything the pipeline emits is re-published here, in order
    connect(m_pipeline, &PlaybackPipeline::stateChanged,
            this, &AudioEngine::onPipelineState, Qt::QueuedConnection);
    connect(m_pipeline, &PlaybackPipeline::positionSampled, this, [this](quint64 ns) {
        emit eventOccurred(PlaybackEvent::positionChanged(ns));
    }, Qt::QueuedConnection);
    connect(m_pipeline, &PlaybackPipeline::trackSwitched, this, [this](const QString& id) {
        qDebug() << "[Engine] Gapless transition to" << id;
        emit eventOccurred(PlaybackEvent::trackChanged(id));
    }, Qt::QueuedConnection);
    connect(m_pipeline, &PlaybackPipeline::endOfStream, this, [this]() {
        emit eventOccurred(PlaybackEvent::endOfQueue());
    }, Qt::QueuedConnection);
    connect(m_pipeline, &PlaybackPipeline::faulted, this, [this](const PlaybackError& e) {
        emit eventOccurred(PlaybackEvent::errorOccurred(e));
    }, Qt::QueuedConnection);

    m_thread.start();
}

AudioEngine::~AudioEngine()
{
    m_stopEpoch->fetch_add(1);
    m_pipeline->interrupt();

    // Tear the graph down on its own thread, then let the thread go
    PlaybackPipeline* pipeline = m_pipeline;
    QMetaObject::invokeMethod(pipeline, [pipeline]() {
        pipeline->stop();
        delete pipeline;
    }, Qt::BlockingQueuedConnection);
    m_pipeline = nullptr;

    m_thread.quit();
    m_thread.wait();
}

PlaybackState AudioEngine::publicState(PlaybackPipeline::State s)
{
    switch (s) {
    case PlaybackPipeline::State::Playing: return PlaybackState::Playing;
    case PlaybackPipeline::State::Paused:  return PlaybackState::Paused;
    default:                               return PlaybackState::Stopped;
    }
}

void AudioEngine::onPipelineState(PlaybackPipeline::State s)
{
    // Null and Ready both read as Stopped; publish only real changes
    const PlaybackState mapped = publicState(s);
    if (mapped == m_state)
        return;
    m_state = mapped;
    emit eventOccurred(PlaybackEvent::stateChanged(mapped));
}

QFuture<PlaybackResult> AudioEngine::dispatch(const char* name, Operation op, bool cancellable)
{
    auto promise = std::make_shared<QPromise<PlaybackResult>>();
    QFuture<PlaybackResult> future = promise->future();
    promise->start();

    const quint64 epoch = m_stopEpoch->load();
    std::shared_ptr<std::atomic<quint64>> stopEpoch = m_stopEpoch;
    PlaybackPipeline* pipeline = m_pipeline;

    QMetaObject::invokeMethod(pipeline, [pipeline, promise, op, epoch, stopEpoch, name, cancellable]() {
        PlaybackResult result;
        if (cancellable && stopEpoch->load() != epoch) {
            qDebug() << "[Engine]" << name << "cancelled by stop";
            result = PlaybackResult::failure(ErrorKind::Cancelled,
                                             QStringLiteral("superseded by stop"));
        } else {
            result = op(pipeline);
            if (!result.ok())
                qDebug() << "[Engine]" << name << "failed:" << result.error();
        }
        promise->addResult(result);
        promise->finish();
    }, Qt::QueuedConnection);

    return future;
}

QFuture<PlaybackResult> AudioEngine::load(const Track& track, quint64 startNs)
{
    return dispatch("load", [track, startNs](PlaybackPipeline* p) { return p->load(track, startNs); });
}

QFuture<PlaybackResult> AudioEngine::play()
{
    return dispatch("play", [](PlaybackPipeline* p) { return p->play(); });
}

QFuture<PlaybackResult> AudioEngine::pause()
{
    return dispatch("pause", [](PlaybackPipeline* p) { return p->pause(); });
}

QFuture<PlaybackResult> AudioEngine::seek(quint64 positionNs)
{
    return dispatch("seek", [positionNs](PlaybackPipeline* p) { return p->seek(positionNs); });
}

QFuture<PlaybackResult> AudioEngine::setPreload(const Track& track)
{
    return dispatch("setPreload", [track](PlaybackPipeline* p) { return p->setPreload(track); });
}

QFuture<PlaybackResult> AudioEngine::clearPreload()
{
    return dispatch("clearPreload", [](PlaybackPipeline* p) {
        p->clearPreload();
        return PlaybackResult::success();
    });
}

QFuture<PlaybackResult> AudioEngine::skipToPreload()
{
    return dispatch("skipToPreload", [](PlaybackPipeline* p) { return p->skipToPreload(); });
}

QFuture<PlaybackResult> AudioEngine::setDevice(const DeviceDescriptor& device)
{
    return dispatch("setDevice", [device](PlaybackPipeline* p) {
        p->setTargetDevice(device);
        return PlaybackResult::success();
    }, false);
}

QFuture<PlaybackResult> AudioEngine::stop()
{
    m_stopEpoch->fetch_add(1);
    m_pipeline->interrupt();
    return dispatch("stop", [](PlaybackPipeline* p) { return p->stop(); }, false);
}
