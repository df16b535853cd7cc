#include <QtTest/QtTest>
#include <QTemporaryDir>
#include <QFile>
#include "EngineConfig.h"

class tst_EngineConfig : public QObject {
    Q_OBJECT

private:
    QString writeIni(const QByteArray& body)
    {
        const QString path = m_dir.filePath(QStringLiteral("settings.ini"));
        QFile f(path);
        if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate))
            return QString();
        f.write(body);
        return path;
    }

    QTemporaryDir m_dir;

private slots:
    void defaults()
    {
        EngineConfig c;
        QCOMPARE(c.positionIntervalMs, 50);
        QCOMPARE(c.bufferDurationMs, 50);
        QCOMPARE(c.retryMaxAttempts, 4);
        QCOMPARE(c.retryBaseDelayMs, 100);
        QCOMPARE(c.eventQueueCapacity, 0);
        QVERIFY(c.deviceId.isEmpty());
        QVERIFY(c.gapless);
    }

    void retryDelay_doublesPerAttempt()
    {
        EngineConfig c;
        c.retryBaseDelayMs = 25;
        QCOMPARE(c.retryDelayMs(1), 25);
        QCOMPARE(c.retryDelayMs(2), 50);
        QCOMPARE(c.retryDelayMs(3), 100);
        QCOMPARE(c.retryDelayMs(0), 25);
    }

    void fromSettings_missingFileGivesDefaults()
    {
        EngineConfig c = EngineConfig::fromSettings(m_dir.filePath(QStringLiteral("absent.ini")));
        QCOMPARE(c.positionIntervalMs, 50);
        QCOMPARE(c.retryMaxAttempts, 4);
        QVERIFY(c.gapless);
    }

    void fromSettings_readsBothGroups()
    {
        const QString path = writeIni(
            "[playback]\n"
            "positionIntervalMs=20\n"
            "retryMaxAttempts=6\n"
            "retryBaseDelayMs=10\n"
            "eventQueueCapacity=64\n"
            "gapless=false\n"
            "[audio]\n"
            "bufferDurationMs=25\n"
            "outputDevice=hw:1,0\n");
        QVERIFY(!path.isEmpty());

        EngineConfig c = EngineConfig::fromSettings(path);
        QCOMPARE(c.positionIntervalMs, 20);
        QCOMPARE(c.retryMaxAttempts, 6);
        QCOMPARE(c.retryBaseDelayMs, 10);
        QCOMPARE(c.eventQueueCapacity, 64);
        QVERIFY(!c.gapless);
        QCOMPARE(c.bufferDurationMs, 25);
        QCOMPARE(c.deviceId, QStringLiteral("hw:1,0"));
    }

    void fromSettings_outOfRangeFallsBack()
    {
        const QString path = writeIni(
            "[playback]\n"
            "positionIntervalMs=0\n"
            "retryMaxAttempts=500\n"
            "retryBaseDelayMs=abc\n");
        QVERIFY(!path.isEmpty());

        EngineConfig c = EngineConfig::fromSettings(path);
        QCOMPARE(c.positionIntervalMs, 50);
        QCOMPARE(c.retryMaxAttempts, 4);
        QCOMPARE(c.retryBaseDelayMs, 100);
    }

    void settingsPath_endsInAurumDir()
    {
        QVERIFY(EngineConfig::settingsPath().endsWith(QStringLiteral("/Aurum/settings.ini")));
    }
};

QTEST_MAIN(tst_EngineConfig)
#include "tst_EngineConfig.moc"
