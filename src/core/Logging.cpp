#include "Logging.h"

#include <QDateTime>
#include <QDebug>
#include <QFile>
#include <QMutex>
#include <QStandardPaths>
#include <atomic>
#include <cstdio>

namespace {

QFile s_logFile;
QMutex s_logMutex;
std::atomic<bool> s_verbose{false};

const char* levelTag(QtMsgType type)
{
    switch (type) {
    case QtDebugMsg:    return "D";
    case QtInfoMsg:     return "I";
    case QtWarningMsg:  return "W";
    case QtCriticalMsg: return "C";
    case QtFatalMsg:    return "F";
    }
    return "?";
}

void messageHandler(QtMsgType type, const QMessageLogContext&, const QString& msg)
{
    if (type == QtDebugMsg && !s_verbose.load(std::memory_order_relaxed))
        return;

    QMutexLocker lock(&s_logMutex);
    QString line = QStringLiteral("[%1] %2 %3\n")
        .arg(QDateTime::currentDateTime().toString(QStringLiteral("HH:mm:ss.zzz")),
             QLatin1String(levelTag(type)), msg);
    QByteArray utf8 = line.toUtf8();
    if (s_logFile.isOpen()) {
        s_logFile.write(utf8);
        s_logFile.flush();
    }
    fprintf(stderr, "%s", utf8.constData());
}

} // namespace

namespace Logging {

QString defaultLogPath()
{
    return QStandardPaths::writableLocation(QStandardPaths::TempLocation)
           + QStringLiteral("/aurum-debug.log");
}

bool install(const QString& path, bool verbose)
{
    s_verbose.store(verbose);

    bool opened = false;
    {
        QMutexLocker lock(&s_logMutex);
        if (s_logFile.isOpen())
            s_logFile.close();
        s_logFile.setFileName(path);
        opened = s_logFile.open(QIODevice::WriteOnly | QIODevice::Truncate);
    }

    qInstallMessageHandler(messageHandler);

    if (!opened)
        qWarning() << "[Log] Cannot open" << path << "- logging to stderr only";
    return opened;
}

void setVerbose(bool verbose)
{
    s_verbose.store(verbose);
}

} // namespace Logging
