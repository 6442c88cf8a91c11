/**
 * @file test_connectivitymonitor.cpp
 * @brief Unit tests for ConnectivityMonitor
 *
 * Tests window classification, debounced tier notifications and probe
 * driven sampling.
 */

#include <QtTest/QtTest>
#include <QDebug>
#include <QSignalSpy>
#include "sync/connectivitymonitor.h"
#include "fakes.h"

using namespace FieldSync;
using namespace FieldSync::Testing;

class TestConnectivityMonitor : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void init();
    void cleanup();

    // ========== Classification Tests ==========
    void testEmptyWindowIsOffline();
    void testInitialTierIsOffline();
    void testClassifyThresholds_data();
    void testClassifyThresholds();
    void testLatestUnreachableIsOffline();
    void testMeanIgnoresUnreachableSamples();
    void testClassifyIsDeterministic();

    // ========== Notification Tests ==========
    void testNotifiesOnTierChange();
    void testNoDuplicateNotification();
    void testSubscribeAndUnsubscribe();

    // ========== Window Tests ==========
    void testWindowSizeTrimsOldSamples();

    // ========== Probe Tests ==========
    void testSampleNowWithoutProbe();
    void testSampleNowUsesProbe();
    void testStartSamplesImmediately();

private:
    ConnectivityMonitor *m_monitor;
};

void TestConnectivityMonitor::initTestCase()
{
    qRegisterMetaType<FieldSync::QualityTier>();
}

void TestConnectivityMonitor::init()
{
    m_monitor = new ConnectivityMonitor();
}

void TestConnectivityMonitor::cleanup()
{
    delete m_monitor;
    m_monitor = nullptr;
}

// ========== Classification Tests ==========

void TestConnectivityMonitor::testEmptyWindowIsOffline()
{
    QCOMPARE(ConnectivityMonitor::classify({}), QualityTier::Offline);
}

void TestConnectivityMonitor::testInitialTierIsOffline()
{
    QCOMPARE(m_monitor->currentQuality(), QualityTier::Offline);
}

void TestConnectivityMonitor::testClassifyThresholds_data()
{
    QTest::addColumn<double>("kbps");
    QTest::addColumn<int>("latency");
    QTest::addColumn<int>("tier");

    QTest::newRow("excellent") << 8000.0 << 40 << int(QualityTier::Excellent);
    QTest::newRow("excellent edge") << 5000.0 << 100 << int(QualityTier::Excellent);
    QTest::newRow("fast but laggy") << 8000.0 << 250 << int(QualityTier::Good);
    QTest::newRow("good") << 1500.0 << 200 << int(QualityTier::Good);
    QTest::newRow("fair") << 300.0 << 600 << int(QualityTier::Fair);
    QTest::newRow("poor bandwidth") << 100.0 << 50 << int(QualityTier::Poor);
    QTest::newRow("poor latency") << 8000.0 << 1500 << int(QualityTier::Poor);
}

void TestConnectivityMonitor::testClassifyThresholds()
{
    QFETCH(double, kbps);
    QFETCH(int, latency);
    QFETCH(int, tier);

    QCOMPARE(int(ConnectivityMonitor::classify({makeSample(kbps, latency)})), tier);
}

void TestConnectivityMonitor::testLatestUnreachableIsOffline()
{
    QList<NetworkQualitySample> window = {excellentSample(), excellentSample(), offlineSample()};
    QCOMPARE(ConnectivityMonitor::classify(window), QualityTier::Offline);
}

void TestConnectivityMonitor::testMeanIgnoresUnreachableSamples()
{
    // The unreachable sample in the middle must not drag the mean to zero
    QList<NetworkQualitySample> window = {excellentSample(), offlineSample(), excellentSample()};
    QCOMPARE(ConnectivityMonitor::classify(window), QualityTier::Excellent);
}

void TestConnectivityMonitor::testClassifyIsDeterministic()
{
    QList<NetworkQualitySample> window = {
        makeSample(6000.0, 80), makeSample(900.0, 350), makeSample(2000.0, 150)
    };

    QualityTier first = ConnectivityMonitor::classify(window);
    for (int i = 0; i < 10; ++i) {
        QCOMPARE(ConnectivityMonitor::classify(window), first);
    }
    // Mean: 2966 kbit/s, 193 ms
    QCOMPARE(first, QualityTier::Good);
}

// ========== Notification Tests ==========

void TestConnectivityMonitor::testNotifiesOnTierChange()
{
    QSignalSpy spy(m_monitor, &ConnectivityMonitor::qualityChanged);

    m_monitor->addSample(excellentSample());

    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).value<FieldSync::QualityTier>(), QualityTier::Excellent);
    QCOMPARE(m_monitor->currentQuality(), QualityTier::Excellent);
}

void TestConnectivityMonitor::testNoDuplicateNotification()
{
    QSignalSpy spy(m_monitor, &ConnectivityMonitor::qualityChanged);

    for (int i = 0; i < 5; ++i) {
        m_monitor->addSample(excellentSample());
    }
    QCOMPARE(spy.count(), 1);

    m_monitor->addSample(offlineSample());
    m_monitor->addSample(offlineSample());
    QCOMPARE(spy.count(), 2);
    QCOMPARE(m_monitor->currentQuality(), QualityTier::Offline);
}

void TestConnectivityMonitor::testSubscribeAndUnsubscribe()
{
    QList<QualityTier> seen;
    int id = m_monitor->subscribe([&seen](QualityTier tier) { seen.append(tier); });

    m_monitor->addSample(excellentSample());
    m_monitor->addSample(excellentSample());
    QCOMPARE(seen.size(), 1);
    QCOMPARE(seen.first(), QualityTier::Excellent);

    m_monitor->unsubscribe(id);
    m_monitor->addSample(offlineSample());
    QCOMPARE(seen.size(), 1);
}

// ========== Window Tests ==========

void TestConnectivityMonitor::testWindowSizeTrimsOldSamples()
{
    m_monitor->setWindowSize(2);
    QCOMPARE(m_monitor->windowSize(), 2);

    m_monitor->addSample(poorSample());
    m_monitor->addSample(poorSample());
    QCOMPARE(m_monitor->currentQuality(), QualityTier::Poor);

    // Two excellent samples push both poor ones out of the window
    m_monitor->addSample(excellentSample());
    m_monitor->addSample(excellentSample());
    QCOMPARE(m_monitor->currentQuality(), QualityTier::Excellent);

    m_monitor->setWindowSize(0);
    QCOMPARE(m_monitor->windowSize(), 1);
}

// ========== Probe Tests ==========

void TestConnectivityMonitor::testSampleNowWithoutProbe()
{
    QSignalSpy spy(m_monitor, &ConnectivityMonitor::qualityChanged);

    m_monitor->sampleNow();

    QCOMPARE(m_monitor->currentQuality(), QualityTier::Offline);
    QCOMPARE(spy.count(), 0);
}

void TestConnectivityMonitor::testSampleNowUsesProbe()
{
    FakeQualityProbe *probe = new FakeQualityProbe({excellentSample(), offlineSample()});
    m_monitor->setProbe(probe);
    m_monitor->setWindowSize(1);

    m_monitor->sampleNow();
    QCOMPARE(m_monitor->currentQuality(), QualityTier::Excellent);

    m_monitor->sampleNow();
    QCOMPARE(m_monitor->currentQuality(), QualityTier::Offline);
    QCOMPARE(probe->calls, 2);
}

void TestConnectivityMonitor::testStartSamplesImmediately()
{
    FakeQualityProbe *probe = new FakeQualityProbe({excellentSample()});
    m_monitor->setProbe(probe);

    m_monitor->start(60000);
    QVERIFY(m_monitor->isRunning());
    QCOMPARE(probe->calls, 1);
    QCOMPARE(m_monitor->currentQuality(), QualityTier::Excellent);

    m_monitor->stop();
    QVERIFY(!m_monitor->isRunning());
}

QTEST_MAIN(TestConnectivityMonitor)
#include "test_connectivitymonitor.moc"
