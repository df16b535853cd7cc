#include <QtTest/QtTest>
#include <QSignalSpy>
#include "FakeAudio.h"
#include "core/audio/PlaybackPipeline.h"

static FakeMediaSpec cdSpec(quint64 durationNs = 200000000)
{
    FakeMediaSpec s;
    s.sampleRate = 44100;
    s.bitDepth = 16;
    s.durationNs = durationNs;
    return s;
}

static FakeMediaSpec hiResSpec(quint64 durationNs = 150000000)
{
    FakeMediaSpec s;
    s.sampleRate = 96000;
    s.bitDepth = 24;
    s.durationNs = durationNs;
    return s;
}

class tst_PlaybackPipeline : public QObject {
    Q_OBJECT

private:
    std::unique_ptr<PlaybackPipeline> makePipeline()
    {
        auto p = std::make_unique<PlaybackPipeline>(m_backend, &makeFakeDecoder);
        p->setTargetDevice(FakeBackend::defaultDevice());
        p->setPositionInterval(10);
        p->setBufferDuration(10);
        return p;
    }

    std::shared_ptr<FakeBackend> m_backend;
    std::unique_ptr<FakeLibrary> m_lib;

private slots:
    void init()
    {
        FakeDeviceRegistry::reset();
        m_backend = std::make_shared<FakeBackend>();
        m_lib = std::make_unique<FakeLibrary>();
    }

    void cleanup()
    {
        m_lib.reset();
        m_backend.reset();
    }

    // ── load ─────────────────────────────────────────────────────
    void load_supportedFormat_goesReady()
    {
        auto p = makePipeline();
        QSignalSpy states(p.get(), &PlaybackPipeline::stateChanged);
        const Track a = m_lib->add("a", cdSpec());

        QVERIFY(p->load(a).ok());
        QVERIFY(p->state() == PlaybackPipeline::State::Ready);
        QCOMPARE(states.count(), 1);
        QCOMPARE(p->currentTrackId(), QStringLiteral("a"));
        QVERIFY(!p->isDeviceHeld());
    }

    void load_unsupportedFormat_keepsState()
    {
        auto p = makePipeline();
        FakeMediaSpec spec = hiResSpec();
        spec.sampleRate = 192000;
        const Track t = m_lib->add("t", spec);

        const PlaybackResult r = p->load(t);
        QVERIFY(!r.ok());
        QVERIFY(r.kind() == ErrorKind::UnsupportedFormat);
        QVERIFY(r.error().category() == ErrorCategory::Device);
        QCOMPARE(r.error().trackId, QStringLiteral("t"));
        QVERIFY(p->state() == PlaybackPipeline::State::Null);
    }

    void load_unsupportedFormatWhilePlaying_keepsPlaying()
    {
        auto p = makePipeline();
        const Track a = m_lib->add("a", cdSpec(2000000000));
        FakeMediaSpec spec = cdSpec();
        spec.sampleRate = 32000;
        const Track bad = m_lib->add("bad", spec);

        QVERIFY(p->load(a).ok());
        QVERIFY(p->play().ok());
        QVERIFY(p->load(bad).kind() == ErrorKind::UnsupportedFormat);
        QVERIFY(p->state() == PlaybackPipeline::State::Playing);
        QCOMPARE(p->currentTrackId(), QStringLiteral("a"));
        QVERIFY(p->stop().ok());
    }

    void load_missingFile()
    {
        auto p = makePipeline();
        Track t = m_lib->add("gone", cdSpec());
        t.filePath += QStringLiteral(".missing");

        const PlaybackResult r = p->load(t);
        QVERIFY(r.kind() == ErrorKind::FileNotFound);
        QVERIFY(r.error().isPerTrack());
    }

    void load_corruptAtOpen()
    {
        auto p = makePipeline();
        FakeMediaSpec spec = cdSpec();
        spec.openError = DecoderError::CorruptStream;
        const Track t = m_lib->add("corrupt", spec);

        const PlaybackResult r = p->load(t);
        QVERIFY(r.kind() == ErrorKind::CorruptStream);
        QVERIFY(r.error().category() == ErrorCategory::Decode);
        QVERIFY(p->state() == PlaybackPipeline::State::Null);
    }

    void load_startPositionBeyondEnd()
    {
        auto p = makePipeline();
        const Track a = m_lib->add("a", cdSpec());
        QVERIFY(p->load(a, a.durationNs).kind() == ErrorKind::InvalidState);
        QVERIFY(p->load(a, 100000000).ok());
        QCOMPARE(p->position(), quint64(100000000));
    }

    void load_floatStreamNeedsFloatCapability()
    {
        DeviceDescriptor intOnly = FakeBackend::defaultDevice();
        intOnly.capabilities.push_back({44100, 32, false});
        DeviceDescriptor withFloat = intOnly;
        withFloat.capabilities.push_back({44100, 32, true});
        m_backend = std::make_shared<FakeBackend>(std::vector<DeviceDescriptor>{ withFloat });

        FakeMediaSpec spec = cdSpec();
        spec.bitDepth = 32;
        spec.isFloat = true;
        const Track f = m_lib->add("float", spec);

        auto p = makePipeline();
        p->setTargetDevice(intOnly);
        const PlaybackResult r = p->load(f);
        QVERIFY(r.kind() == ErrorKind::UnsupportedFormat);
        QVERIFY(p->state() == PlaybackPipeline::State::Null);

        p->setTargetDevice(withFloat);
        QVERIFY(p->load(f).ok());
        QVERIFY(p->play().ok());
        {
            auto log = m_backend->log();
            std::lock_guard<std::mutex> lock(log->mutex);
            QCOMPARE(int(log->formats.size()), 1);
            QVERIFY(log->formats[0].isFloat);
            QCOMPARE(log->formats[0].bitsPerSample, 32);
        }
        QVERIFY(p->stop().ok());
    }

    void load_busyUnprobedDevice_checksAtOpen()
    {
        DeviceDescriptor busy = FakeBackend::defaultDevice();
        busy.busy = true;
        busy.capabilities.clear();
        QVERIFY(!busy.capabilitiesKnown());

        auto p = makePipeline();
        p->setTargetDevice(busy);
        const Track a = m_lib->add("a", cdSpec());
        QVERIFY(FakeDeviceRegistry::claim("fake:0"));

        QVERIFY(p->load(a).ok());
        QVERIFY(p->play().kind() == ErrorKind::DeviceBusy);
        QVERIFY(p->state() == PlaybackPipeline::State::Ready);

        FakeDeviceRegistry::release("fake:0");
        QVERIFY(p->play().ok());
        QVERIFY(p->stop().ok());

        // With nothing probed the device itself refuses a format it lacks
        FakeMediaSpec spec = cdSpec();
        spec.sampleRate = 32000;
        const Track odd = m_lib->add("odd", spec);
        QVERIFY(p->load(odd).ok());
        QVERIFY(p->play().kind() == ErrorKind::UnsupportedFormat);
    }

    // ── play / pause / stop ──────────────────────────────────────
    void play_claimsDeviceExclusively()
    {
        auto p = makePipeline();
        const Track a = m_lib->add("a", cdSpec());
        QVERIFY(p->load(a).ok());
        QVERIFY(p->play().ok());
        QVERIFY(p->state() == PlaybackPipeline::State::Playing);
        QVERIFY(p->isDeviceHeld());
        QVERIFY(FakeDeviceRegistry::isClaimed("fake:0"));

        QVERIFY(p->stop().ok());
        QVERIFY(p->state() == PlaybackPipeline::State::Null);
        QVERIFY(!FakeDeviceRegistry::isClaimed("fake:0"));
        QVERIFY(!p->isDeviceHeld());
    }

    void play_withoutTrackIsInvalid()
    {
        auto p = makePipeline();
        QVERIFY(p->play().kind() == ErrorKind::InvalidState);
    }

    void play_busyDevice_staysReady()
    {
        auto p = makePipeline();
        const Track a = m_lib->add("a", cdSpec());
        QVERIFY(FakeDeviceRegistry::claim("fake:0"));

        QVERIFY(p->load(a).ok());
        const PlaybackResult r = p->play();
        QVERIFY(r.kind() == ErrorKind::DeviceBusy);
        QVERIFY(r.error().isTransient());
        QVERIFY(p->state() == PlaybackPipeline::State::Ready);

        FakeDeviceRegistry::release("fake:0");
        QVERIFY(p->play().ok());
        QVERIFY(p->stop().ok());
    }

    void pause_twiceEmitsOnce()
    {
        auto p = makePipeline();
        const Track a = m_lib->add("a", cdSpec(2000000000));
        QVERIFY(p->load(a).ok());
        QVERIFY(p->play().ok());

        QSignalSpy states(p.get(), &PlaybackPipeline::stateChanged);
        QVERIFY(p->pause().ok());
        QVERIFY(p->pause().ok());
        QCOMPARE(states.count(), 1);
        QVERIFY(states.at(0).at(0).value<PlaybackPipeline::State>() == PlaybackPipeline::State::Paused);

        // Paused keeps the device
        QVERIFY(p->isDeviceHeld());
        QVERIFY(p->play().ok());
        QVERIFY(p->state() == PlaybackPipeline::State::Playing);
        QVERIFY(p->stop().ok());
    }

    void pause_fromReadyIsInvalid()
    {
        auto p = makePipeline();
        const Track a = m_lib->add("a", cdSpec());
        QVERIFY(p->load(a).ok());
        QVERIFY(p->pause().kind() == ErrorKind::InvalidState);
        QVERIFY(p->state() == PlaybackPipeline::State::Ready);
    }

    void pause_holdsPosition()
    {
        auto p = makePipeline();
        const Track a = m_lib->add("a", cdSpec(2000000000));
        QVERIFY(p->load(a).ok());
        QVERIFY(p->play().ok());
        QTest::qWait(60);
        QVERIFY(p->pause().ok());
        QTest::qWait(30);
        const quint64 held = p->position();
        QTest::qWait(60);
        QCOMPARE(p->position(), held);
        QVERIFY(p->stop().ok());
    }

    // ── seek ─────────────────────────────────────────────────────
    void seek_landsWithinOneInterval()
    {
        auto p = makePipeline();
        const Track a = m_lib->add("a", cdSpec(1000000000));
        QVERIFY(p->load(a).ok());
        QVERIFY(p->play().ok());
        QVERIFY(p->pause().ok());

        const quint64 target = 500000000;
        QVERIFY(p->seek(target).ok());
        const quint64 pos = p->position();
        QVERIFY(pos >= target);
        QVERIFY(pos - target <= 10000000ULL);
        QVERIFY(p->stop().ok());
    }

    void seek_outOfRangeIsInvalid()
    {
        auto p = makePipeline();
        const Track a = m_lib->add("a", cdSpec());
        QVERIFY(p->load(a).ok());
        QVERIFY(p->seek(0).kind() == ErrorKind::InvalidState);   // Ready

        QVERIFY(p->play().ok());
        QVERIFY(p->pause().ok());
        QVERIFY(p->seek(a.durationNs).kind() == ErrorKind::InvalidState);
        QVERIFY(p->seek(a.durationNs + 1).kind() == ErrorKind::InvalidState);
        QVERIFY(p->seek(a.durationNs - 1).ok());
        QVERIFY(p->stop().ok());
    }

    // ── end of stream / faults ───────────────────────────────────
    void endOfStream_withoutPreload_releasesDevice()
    {
        auto p = makePipeline();
        QSignalSpy eos(p.get(), &PlaybackPipeline::endOfStream);
        const Track a = m_lib->add("a", cdSpec(100000000));
        QVERIFY(p->load(a).ok());
        QVERIFY(p->play().ok());

        QTRY_COMPARE_WITH_TIMEOUT(eos.count(), 1, 3000);
        QVERIFY(p->state() == PlaybackPipeline::State::Null);
        QVERIFY(!FakeDeviceRegistry::isClaimed("fake:0"));
    }

    void midStreamCorruption_faults()
    {
        auto p = makePipeline();
        QSignalSpy faults(p.get(), &PlaybackPipeline::faulted);
        QSignalSpy eos(p.get(), &PlaybackPipeline::endOfStream);
        FakeMediaSpec spec = cdSpec(1000000000);
        spec.failAtFrame = 4410;   // 100 ms in
        const Track a = m_lib->add("a", spec);
        QVERIFY(p->load(a).ok());
        QVERIFY(p->play().ok());

        QTRY_COMPARE_WITH_TIMEOUT(faults.count(), 1, 3000);
        const PlaybackError e = faults.at(0).at(0).value<PlaybackError>();
        QVERIFY(e.kind == ErrorKind::CorruptStream);
        QCOMPARE(e.trackId, QStringLiteral("a"));
        QVERIFY(p->state() == PlaybackPipeline::State::Null);
        QCOMPARE(eos.count(), 0);
        QVERIFY(!FakeDeviceRegistry::isClaimed("fake:0"));
    }

    // ── gapless ──────────────────────────────────────────────────
    void setPreload_requiresLoadedTrack()
    {
        auto p = makePipeline();
        const Track b = m_lib->add("b", hiResSpec());
        QVERIFY(p->setPreload(b).kind() == ErrorKind::InvalidState);
    }

    void setPreload_validatesAgainstDevice()
    {
        auto p = makePipeline();
        const Track a = m_lib->add("a", cdSpec());
        FakeMediaSpec spec = hiResSpec();
        spec.sampleRate = 352800;
        const Track b = m_lib->add("b", spec);
        QVERIFY(p->load(a).ok());
        QVERIFY(p->setPreload(b).kind() == ErrorKind::UnsupportedFormat);
        QVERIFY(p->preloadTrackId().isEmpty());
    }

    void setPreload_failureDropsEarlierPreload()
    {
        auto p = makePipeline();
        QSignalSpy switches(p.get(), &PlaybackPipeline::trackSwitched);
        QSignalSpy eos(p.get(), &PlaybackPipeline::endOfStream);
        const Track a = m_lib->add("A", cdSpec(100000000));
        const Track b = m_lib->add("B", cdSpec(100000000));
        Track x = m_lib->add("X", cdSpec());
        x.filePath += QStringLiteral(".missing");

        QVERIFY(p->load(a).ok());
        QVERIFY(p->setPreload(b).ok());
        QVERIFY(p->setPreload(x).kind() == ErrorKind::FileNotFound);
        QVERIFY(p->preloadTrackId().isEmpty());

        // A ends with nothing armed behind it
        QVERIFY(p->play().ok());
        QTRY_COMPARE_WITH_TIMEOUT(eos.count(), 1, 3000);
        QCOMPARE(switches.count(), 0);
    }

    void gaplessSwitch_keepsDeviceAndOrdersSignals()
    {
        auto p = makePipeline();
        const Track a = m_lib->add("A", cdSpec(200000000));
        const Track b = m_lib->add("B", hiResSpec(150000000));

        QStringList trace;
        connect(p.get(), &PlaybackPipeline::stateChanged, this, [&trace](PlaybackPipeline::State s) {
            trace << QStringLiteral("state:%1").arg(int(s));
        });
        connect(p.get(), &PlaybackPipeline::trackSwitched, this, [&trace](const QString& id) {
            trace << QStringLiteral("switch:") + id;
        });
        connect(p.get(), &PlaybackPipeline::endOfStream, this, [&trace]() {
            trace << QStringLiteral("eos");
        });

        QVERIFY(p->load(a).ok());
        QVERIFY(p->setPreload(b).ok());
        QCOMPARE(p->preloadTrackId(), QStringLiteral("B"));
        QVERIFY(p->play().ok());

        QTRY_VERIFY_WITH_TIMEOUT(trace.contains(QStringLiteral("eos")), 3000);

        // Ready, Playing, switch, then Null only after B ends
        const QStringList expected = {
            QStringLiteral("state:%1").arg(int(PlaybackPipeline::State::Ready)),
            QStringLiteral("state:%1").arg(int(PlaybackPipeline::State::Playing)),
            QStringLiteral("switch:B"),
            QStringLiteral("state:%1").arg(int(PlaybackPipeline::State::Null)),
            QStringLiteral("eos"),
        };
        QCOMPARE(trace, expected);

        auto log = m_backend->log();
        std::lock_guard<std::mutex> lock(log->mutex);
        QCOMPARE(log->opens, 1);
        QCOMPARE(int(log->formats.size()), 2);
        QCOMPARE(log->formats[0].sampleRate, 44100);
        QCOMPARE(log->formats[0].bitsPerSample, 16);
        QCOMPARE(log->formats[1].sampleRate, 96000);
        QCOMPARE(log->formats[1].bitsPerSample, 24);
    }

    void gaplessSwitch_positionRestartsForNextTrack()
    {
        auto p = makePipeline();
        const Track a = m_lib->add("A", cdSpec(200000000));
        const Track b = m_lib->add("B", hiResSpec(1000000000));

        QVector<quint64> afterSwitch;
        bool switched = false;
        connect(p.get(), &PlaybackPipeline::trackSwitched, this, [&switched]() { switched = true; });
        connect(p.get(), &PlaybackPipeline::positionSampled, this, [&](quint64 ns) {
            if (switched)
                afterSwitch.append(ns);
        });

        QVERIFY(p->load(a).ok());
        QVERIFY(p->setPreload(b).ok());
        QVERIFY(p->play().ok());

        QTRY_VERIFY_WITH_TIMEOUT(afterSwitch.size() >= 3, 3000);
        // First sample after the switch belongs to B, not to A's tail
        QVERIFY(afterSwitch.first() < 100000000ULL);
        QCOMPARE(p->currentTrackId(), QStringLiteral("B"));
        QVERIFY(p->stop().ok());
    }

    void gaplessSwitch_eachReportedWithinOneTick()
    {
        auto p = makePipeline();
        p->setPositionInterval(1000);
        const Track a = m_lib->add("A", cdSpec(30000000));
        const Track b = m_lib->add("B", cdSpec(300000000));
        const Track c = m_lib->add("C", hiResSpec(2000000000));

        QStringList switched;
        connect(p.get(), &PlaybackPipeline::trackSwitched, this, [&switched](const QString& id) {
            switched << id;
        });

        QVERIFY(p->load(a).ok());
        QVERIFY(p->setPreload(b).ok());
        QVERIFY(p->play().ok());

        // Both switches land before the first tick
        QTRY_COMPARE_WITH_TIMEOUT(p->currentTrackId(), QStringLiteral("B"), 1000);
        QVERIFY(p->setPreload(c).ok());
        QTRY_COMPARE_WITH_TIMEOUT(switched, (QStringList{ QStringLiteral("B"), QStringLiteral("C") }), 3000);
        QCOMPARE(p->currentTrackId(), QStringLiteral("C"));
        QVERIFY(p->stop().ok());
    }

    void skipToPreload_switchesImmediately()
    {
        auto p = makePipeline();
        const Track a = m_lib->add("A", cdSpec(2000000000));
        const Track b = m_lib->add("B", hiResSpec(2000000000));
        QSignalSpy switches(p.get(), &PlaybackPipeline::trackSwitched);

        QVERIFY(p->load(a).ok());
        QVERIFY(p->skipToPreload().kind() == ErrorKind::InvalidState);  // Ready
        QVERIFY(p->play().ok());
        QVERIFY(p->skipToPreload().kind() == ErrorKind::InvalidState);  // nothing preloaded

        QVERIFY(p->setPreload(b).ok());
        QTest::qWait(30);
        QVERIFY(p->skipToPreload().ok());
        QCOMPARE(switches.count(), 1);
        QCOMPARE(switches.at(0).at(0).toString(), QStringLiteral("B"));
        QCOMPARE(p->currentTrackId(), QStringLiteral("B"));
        QVERIFY(p->preloadTrackId().isEmpty());

        // The timer must not report the same switch again
        QTest::qWait(50);
        QCOMPARE(switches.count(), 1);
        QVERIFY(p->stop().ok());
    }

    void clearPreload_endsAtCurrentTrack()
    {
        auto p = makePipeline();
        QSignalSpy eos(p.get(), &PlaybackPipeline::endOfStream);
        QSignalSpy switches(p.get(), &PlaybackPipeline::trackSwitched);
        const Track a = m_lib->add("A", cdSpec(100000000));
        const Track b = m_lib->add("B", cdSpec(100000000));

        QVERIFY(p->load(a).ok());
        QVERIFY(p->setPreload(b).ok());
        p->clearPreload();
        QVERIFY(p->preloadTrackId().isEmpty());
        QVERIFY(p->play().ok());

        QTRY_COMPARE_WITH_TIMEOUT(eos.count(), 1, 3000);
        QCOMPARE(switches.count(), 0);
    }

    void stop_interruptsBlockedWrite()
    {
        auto p = makePipeline();
        p->setBufferDuration(500);
        const Track a = m_lib->add("A", cdSpec(5000000000ULL));
        QVERIFY(p->load(a).ok());
        QVERIFY(p->play().ok());
        QTest::qWait(20);

        QElapsedTimer t;
        t.start();
        p->interrupt();
        QVERIFY(p->stop().ok());
        QVERIFY(t.elapsed() < 250);
        QVERIFY(!FakeDeviceRegistry::isClaimed("fake:0"));
    }

    void interruptDuringDeviceOpen_rendersNothing()
    {
        auto p = makePipeline();
        const Track a = m_lib->add("A", cdSpec(2000000000));
        auto log = m_backend->log();
        PlaybackPipeline* pipeline = p.get();
        {
            std::lock_guard<std::mutex> lock(log->mutex);
            log->afterOpen = [pipeline]() { pipeline->interrupt(); };
        }

        QVERIFY(p->load(a).ok());
        QVERIFY(p->play().ok());
        QTest::qWait(60);
        QCOMPARE(qint64(log->framesWritten.load()), qint64(0));
        QVERIFY(p->stop().ok());
        QVERIFY(!FakeDeviceRegistry::isClaimed("fake:0"));

        // The old interrupt does not leak into the next play
        {
            std::lock_guard<std::mutex> lock(log->mutex);
            log->afterOpen = nullptr;
        }
        QVERIFY(p->load(a).ok());
        QVERIFY(p->play().ok());
        QTRY_VERIFY(log->framesWritten.load() > 0);
        QVERIFY(p->stop().ok());
    }
};

QTEST_MAIN(tst_PlaybackPipeline)
#include "tst_PlaybackPipeline.moc"
