#include "audio/JackCaptureService.h"

#include <QDir>
#include <QFileInfo>
#include <QTemporaryDir>
#include <QtTest>

#include <jack/jack.h>

#include <algorithm>
#include <string>

// Runs against a JACK server that is already up (for example `jackd -d dummy`); skipped otherwise.
class JackCaptureServiceTest : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanupTestCase();
    void consecutiveTakesReuseInputPorts();
    void cancelledTakeLeavesNoFile();
    void inputBeyondCapturePortsIsUnavailable();

private:
    int countPorts(const char* pattern) const;
    RecordingSettings settings() const;
    static CaptureTarget target(int input, const QString& relativePath);

    jack_client_t* m_client {nullptr};
    int m_sampleRate {0};
    int m_capturePorts {0};
};

void JackCaptureServiceTest::initTestCase() {
    jack_status_t status = static_cast<jack_status_t>(0);
    m_client = jack_client_open("organrec_test", JackNoStartServer, &status);
    if (!m_client)
        QSKIP("no JACK server running");
    m_sampleRate = static_cast<int>(jack_get_sample_rate(m_client));
    m_capturePorts = countPorts(nullptr);
    if (m_capturePorts == 0)
        QSKIP("JACK server has no physical capture ports");
}

void JackCaptureServiceTest::cleanupTestCase() {
    if (m_client)
        jack_client_close(m_client);
    m_client = nullptr;
}

int JackCaptureServiceTest::countPorts(const char* pattern) const {
    const unsigned long flags = pattern ? JackPortIsInput : (JackPortIsPhysical | JackPortIsOutput);
    const char** ports = jack_get_ports(m_client, pattern, JACK_DEFAULT_AUDIO_TYPE, flags);
    if (!ports)
        return 0;
    int count = 0;
    for (const char** p = ports; *p; ++p)
        ++count;
    jack_free(ports);
    return count;
}

RecordingSettings JackCaptureServiceTest::settings() const {
    RecordingSettings s;
    s.sampleRate = m_sampleRate;
    s.recordSeconds = 1;
    return s;
}

CaptureTarget JackCaptureServiceTest::target(int input, const QString& relativePath) {
    CaptureTarget t;
    t.channel = MicrophoneChannel {QStringLiteral("front"), QStringLiteral("Front"), true, input};
    t.relativePath = relativePath;
    t.note = 36;
    return t;
}

void JackCaptureServiceTest::consecutiveTakesReuseInputPorts() {
    QTemporaryDir dir;
    JackCaptureService capture(dir.path(), QString());
    const int expected = std::min(m_capturePorts, 64);

    const CaptureBegin first = capture.begin({target(1, QStringLiteral("first.wav"))}, settings());
    QVERIFY2(first.ok(), qPrintable(first.message));
    QCOMPARE(countPorts("^organrec:in_"), expected);
    QTest::qWait(300);
    const CaptureResults firstResults = capture.stop(first.handle);
    QCOMPARE(firstResults.value(QStringLiteral("front")).status, CaptureStatus::Ok);

    // The second take must not register or drop ports on the running client.
    const CaptureBegin second = capture.begin({target(1, QStringLiteral("second.wav"))}, settings());
    QVERIFY2(second.ok(), qPrintable(second.message));
    QCOMPARE(countPorts("^organrec:in_"), expected);
    QTest::qWait(300);
    const CaptureResults secondResults = capture.stop(second.handle);
    QCOMPARE(secondResults.value(QStringLiteral("front")).status, CaptureStatus::Ok);
    QCOMPARE(countPorts("^organrec:in_"), expected);

    QVERIFY(QFileInfo(QDir(dir.path()).filePath(QStringLiteral("first.wav"))).size() > 0);
    QVERIFY(QFileInfo(QDir(dir.path()).filePath(QStringLiteral("second.wav"))).size() > 0);
}

void JackCaptureServiceTest::cancelledTakeLeavesNoFile() {
    QTemporaryDir dir;
    JackCaptureService capture(dir.path(), QString());
    const CaptureBegin begin = capture.begin({target(1, QStringLiteral("cancelled.wav"))}, settings());
    QVERIFY2(begin.ok(), qPrintable(begin.message));
    QTest::qWait(100);
    capture.cancel(begin.handle);

    QVERIFY(capture.stop(begin.handle).isEmpty());
    QVERIFY(!QFileInfo::exists(QDir(dir.path()).filePath(QStringLiteral("cancelled.wav"))));
}

void JackCaptureServiceTest::inputBeyondCapturePortsIsUnavailable() {
    QTemporaryDir dir;
    JackCaptureService capture(dir.path(), QString());
    const CaptureBegin begin = capture.begin({target(m_capturePorts + 1, QStringLiteral("missing.wav"))}, settings());
    QCOMPARE(begin.status, CaptureStatus::DeviceUnavailable);
    QCOMPARE(begin.handle, CaptureHandle(0));
}

QTEST_GUILESS_MAIN(JackCaptureServiceTest)
#include "JackCaptureServiceTest.moc"
