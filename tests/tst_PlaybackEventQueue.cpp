#include <QtTest/QtTest>
#include <QElapsedTimer>
#include <thread>
#include "PlaybackEventQueue.h"

class tst_PlaybackEventQueue : public QObject {
    Q_OBJECT

private slots:
    void unbounded_keepsEverythingInOrder()
    {
        PlaybackEventQueue q;
        for (int i = 0; i < 1000; ++i)
            q.push(PlaybackEvent::positionChanged(quint64(i)));
        QCOMPARE(q.size(), 1000);
        QCOMPARE(q.droppedCount(), quint64(0));
        for (int i = 0; i < 1000; ++i) {
            auto e = q.tryPop();
            QVERIFY(e.has_value());
            QCOMPARE(e->positionNs, quint64(i));
        }
        QVERIFY(!q.tryPop().has_value());
    }

    void bounded_dropsOldest()
    {
        PlaybackEventQueue q(3);
        for (int i = 0; i < 5; ++i)
            q.push(PlaybackEvent::positionChanged(quint64(i)));
        QCOMPARE(q.size(), 3);
        QCOMPARE(q.droppedCount(), quint64(2));
        QCOMPARE(q.tryPop()->positionNs, quint64(2));
        QCOMPARE(q.tryPop()->positionNs, quint64(3));
        QCOMPARE(q.tryPop()->positionNs, quint64(4));
    }

    void bounded_pushNeverBlocks()
    {
        PlaybackEventQueue q(1);
        QElapsedTimer t;
        t.start();
        for (int i = 0; i < 100000; ++i)
            q.push(PlaybackEvent::positionChanged(quint64(i)));
        QVERIFY(t.elapsed() < 2000);
        QCOMPARE(q.size(), 1);
    }

    void waitPop_timesOut()
    {
        PlaybackEventQueue q;
        QElapsedTimer t;
        t.start();
        QVERIFY(!q.waitPop(50).has_value());
        QVERIFY(t.elapsed() >= 40);
    }

    void waitPop_wakesOnPushFromOtherThread()
    {
        PlaybackEventQueue q;
        std::thread producer([&q]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(30));
            q.push(PlaybackEvent::endOfQueue());
        });
        auto e = q.waitPop(5000);
        producer.join();
        QVERIFY(e.has_value());
        QVERIFY(e->type == PlaybackEvent::Type::EndOfQueue);
    }

    void close_wakesWaitersAndIgnoresPushes()
    {
        PlaybackEventQueue q;
        std::thread closer([&q]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(30));
            q.close();
        });
        QVERIFY(!q.waitPop(-1).has_value());
        closer.join();
        QVERIFY(q.isClosed());
        q.push(PlaybackEvent::endOfQueue());
        QCOMPARE(q.size(), 0);
    }
};

QTEST_MAIN(tst_PlaybackEventQueue)
#include "tst_PlaybackEventQueue.moc"
