#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QTextStream>
#include <QTimer>
#include <atomic>
#include <csignal>
#include <cstdio>

#include "core/EngineConfig.h"
#include "core/Logging.h"
#include "core/MusicData.h"
#include "core/PlaybackController.h"
#include "core/PlaybackEvent.h"
#include "core/audio/MetadataReader.h"
#include "platform/IAudioBackend.h"

static QTextStream& out()
{
    static QTextStream s(stdout);
    return s;
}

static std::atomic<bool> s_interrupted{false};

static void quitOnSignal(int sig)
{
    (void)sig;
    s_interrupted.store(true);
}

static int listDevices(const std::shared_ptr<IAudioBackend>& backend)
{
    if (!backend) {
        qWarning() << "[App] No audio backend on this platform";
        return 1;
    }
    const std::vector<DeviceDescriptor> devices = backend->enumerateDevices();
    if (devices.empty()) {
        out() << "No output devices\n";
        return 1;
    }
    for (const DeviceDescriptor& d : devices) {
        out() << (d.isDefault ? "* " : "  ") << QString::fromStdString(d.id)
              << "  " << QString::fromStdString(d.name)
              << (d.busy ? " (busy)" : "") << "\n";
        QStringList caps;
        for (const DeviceCapability& c : d.capabilities)
            caps << QStringLiteral("%1/%2%3").arg(c.sampleRate).arg(c.bitDepth)
                        .arg(c.isFloat ? QStringLiteral("f") : QString());
        out() << "      " << caps.join(QStringLiteral(" ")) << "\n";
    }
    out().flush();
    return 0;
}

static void printEvent(const PlaybackController& controller, const PlaybackEvent& e)
{
    switch (e.type) {
    case PlaybackEvent::Type::TrackChanged: {
        const Track t = controller.currentTrack();
        out() << "▶ " << (t.artist.isEmpty() ? QString() : t.artist + QStringLiteral(" - "))
              << t.title << "  [" << formatStreamLabel(t) << ", "
              << getQualityLabel(classifyAudioQuality(t)) << ", "
              << formatDuration(t.durationNs) << "]\n";
        break;
    }
    case PlaybackEvent::Type::StateChanged:
        out() << "  " << playbackStateName(e.state) << "\n";
        break;
    case PlaybackEvent::Type::Error:
        out() << "  error: " << e.error.toString() << "\n";
        break;
    case PlaybackEvent::Type::EndOfQueue:
        out() << "  end of queue\n";
        break;
    case PlaybackEvent::Type::PositionChanged:
        return;
    }
    out().flush();
}

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setOrganizationName("Aurum");
    app.setApplicationName("aurum-player");
    app.setApplicationVersion(AURUM_VERSION);

    QCommandLineParser parser;
    parser.setApplicationDescription("Bit-perfect gapless player");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption listOpt("list-devices", "List output devices and their formats.");
    QCommandLineOption deviceOpt({"d", "device"}, "Output device id (e.g. hw:1,0).", "id");
    QCommandLineOption configOpt({"c", "config"}, "Settings file.", "ini", EngineConfig::settingsPath());
    QCommandLineOption logOpt("log", "Log file.", "path", Logging::defaultLogPath());
    QCommandLineOption verboseOpt({"v", "verbose"}, "Debug logging.");
    QCommandLineOption noGaplessOpt("no-gapless", "Reopen the device between tracks.");
    parser.addOptions({listOpt, deviceOpt, configOpt, logOpt, verboseOpt, noGaplessOpt});
    parser.addPositionalArgument("files", "Audio files to play, in order.", "[files...]");
    parser.process(app);

    Logging::install(parser.value(logOpt), parser.isSet(verboseOpt));
    qDebug() << "=== aurum-player" << AURUM_VERSION << "PID:" << QCoreApplication::applicationPid() << "===";

    EngineConfig config = EngineConfig::fromSettings(parser.value(configOpt));
    if (parser.isSet(deviceOpt))
        config.deviceId = parser.value(deviceOpt);
    if (parser.isSet(noGaplessOpt))
        config.gapless = false;

    std::shared_ptr<IAudioBackend> backend = createPlatformAudioBackend(config.bufferDurationMs);
    if (parser.isSet(listOpt))
        return listDevices(backend);

    const QStringList files = parser.positionalArguments();
    if (files.isEmpty())
        parser.showHelp(1);

    const QVector<Track> tracks = MetadataReader::readTracks(files);
    if (tracks.isEmpty()) {
        qWarning() << "[App] Nothing playable among" << files.size() << "files";
        return 1;
    }

    PlaybackError error;
    std::unique_ptr<PlaybackController> controller = PlaybackController::create(backend, config, &error);
    if (!controller) {
        fprintf(stderr, "aurum-player: %s\n", qPrintable(error.toString()));
        return 2;
    }

    out() << "Output: " << QString::fromStdString(controller->currentDevice().name)
          << " (" << QString::fromStdString(controller->currentDevice().id) << ")\n";

    int exitCode = 0;
    PlaybackController* c = controller.get();
    QObject::connect(c, &PlaybackController::playbackEvent, &app, [c, &exitCode](const PlaybackEvent& e) {
        printEvent(*c, e);
        if (e.type == PlaybackEvent::Type::EndOfQueue)
            QCoreApplication::quit();
        else if (e.type == PlaybackEvent::Type::Error && !e.error.isPerTrack())
            exitCode = 3;
    });

    std::signal(SIGINT, quitOnSignal);
    std::signal(SIGTERM, quitOnSignal);
    QTimer signalPoll;
    QObject::connect(&signalPoll, &QTimer::timeout, &app, []() {
        if (s_interrupted.load())
            QCoreApplication::quit();
    });
    signalPoll.start(100);

    c->loadQueue(tracks).then(c, [c, &exitCode](const PlaybackResult& loaded) {
        if (!loaded) {
            qWarning() << "[App] Could not load queue:" << loaded.error();
            exitCode = 3;
            QCoreApplication::quit();
            return;
        }
        c->play().then(c, [&exitCode](const PlaybackResult& playing) {
            if (!playing && playing.kind() != ErrorKind::Cancelled) {
                fprintf(stderr, "aurum-player: %s\n", qPrintable(playing.error().toString()));
                exitCode = 3;
                QCoreApplication::quit();
            }
        });
    });

    app.exec();

    // Release the device before the controller goes away
    controller->stop().waitForFinished();
    controller.reset();
    return exitCode;
}
