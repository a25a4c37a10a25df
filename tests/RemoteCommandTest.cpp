#include "RecordingSettings.h"
#include "RemoteCommand.h"
#include "util.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QtTest>

namespace {

QJsonObject parseObject(const char* json) {
    return QJsonDocument::fromJson(QByteArray(json)).object();
}

} // namespace

Q_DECLARE_METATYPE(RemoteCommandType)

class RemoteCommandTest : public QObject {
    Q_OBJECT

private slots:
    void parsesSimpleCommands_data();
    void parsesSimpleCommands();
    void parsesSelectRegister();
    void parsesSelectOrgan();
    void parsesSettingsPatch();
    void parsesMicrophones();
    void rejectsMalformedCommands_data();
    void rejectsMalformedCommands();
    void settingsPatchKeepsMissingKeys();
    void settingsPatchRejectsWrongTypes();
    void settingsPatchAcceptsLayoutNames();
    void rejectsNumbersOutsideIntegerRange();
    void acceptsLargestExactRequestId();
};

void RemoteCommandTest::parsesSimpleCommands_data() {
    QTest::addColumn<QString>("name");
    QTest::addColumn<RemoteCommandType>("type");

    QTest::newRow("start") << QStringLiteral("start") << RemoteCommandType::Start;
    QTest::newRow("stop") << QStringLiteral("stop") << RemoteCommandType::Stop;
    QTest::newRow("retry") << QStringLiteral("retry") << RemoteCommandType::Retry;
    QTest::newRow("next") << QStringLiteral("next") << RemoteCommandType::Next;
    QTest::newRow("previous") << QStringLiteral("previous") << RemoteCommandType::Previous;
    QTest::newRow("listInputs") << QStringLiteral("listInputs") << RemoteCommandType::ListInputs;
    QTest::newRow("recordAll") << QStringLiteral("recordAll") << RemoteCommandType::RecordAll;
    QTest::newRow("pause") << QStringLiteral("pause") << RemoteCommandType::Pause;
    QTest::newRow("shutdown") << QStringLiteral("shutdown") << RemoteCommandType::Shutdown;
}

void RemoteCommandTest::parsesSimpleCommands() {
    QFETCH(QString, name);
    QFETCH(RemoteCommandType, type);

    QString error;
    const auto cmd = RemoteCommand::fromJson(QJsonObject {{QStringLiteral("command"), name},
                                                          {QStringLiteral("requestId"), 42}}, &error);
    QVERIFY2(cmd.has_value(), qPrintable(error));
    QCOMPARE(cmd->type, type);
    QCOMPARE(cmd->requestId, qint64(42));
    QCOMPARE(remoteCommandName(type), name);
}

void RemoteCommandTest::parsesSelectRegister() {
    QString error;
    const auto cmd = RemoteCommand::fromJson(
        parseObject(R"({"command":"selectRegister","keyboard":"Bovenwerk","register":"Holpijp 8 voet","tremulant":true})"),
        &error);
    QVERIFY2(cmd.has_value(), qPrintable(error));
    QCOMPARE(cmd->type, RemoteCommandType::SelectRegister);
    QCOMPARE(cmd->requestId, qint64(-1));
    QCOMPARE(cmd->selection.keyboard, QStringLiteral("Bovenwerk"));
    QCOMPARE(cmd->selection.label, QStringLiteral("Holpijp 8 voet"));
    QVERIFY(cmd->selection.tremulant);
}

void RemoteCommandTest::parsesSelectOrgan() {
    QString error;
    const auto cmd = RemoteCommand::fromJson(
        parseObject(R"({"command":"selectOrgan","organ":"Bavokerk","keyboards":["Hoofdwerk","Rugwerk"]})"), &error);
    QVERIFY2(cmd.has_value(), qPrintable(error));
    QCOMPARE(cmd->organ, QStringLiteral("Bavokerk"));
    QCOMPARE(cmd->keyboards, QStringList({QStringLiteral("Hoofdwerk"), QStringLiteral("Rugwerk")}));
}

void RemoteCommandTest::parsesSettingsPatch() {
    QString error;
    const auto cmd = RemoteCommand::fromJson(
        parseObject(R"({"command":"updateSettings","settings":{"recordSeconds":8}})"), &error);
    QVERIFY2(cmd.has_value(), qPrintable(error));
    QCOMPARE(cmd->settingsPatch.size(), 1);
    QCOMPARE(cmd->settingsPatch.value(QStringLiteral("recordSeconds")).toInt(), 8);
}

void RemoteCommandTest::parsesMicrophones() {
    QString error;
    const auto cmd = RemoteCommand::fromJson(
        parseObject(R"({"command":"configureMicrophones","microphones":[
            {"id":"front","position":"Front","input":1},
            {"id":"rear","enabled":false,"input":3}]})"),
        &error);
    QVERIFY2(cmd.has_value(), qPrintable(error));
    QCOMPARE(cmd->microphones.size(), std::size_t(2));
    QCOMPARE(cmd->microphones[0].position, QStringLiteral("Front"));
    QVERIFY(cmd->microphones[0].enabled);
    QCOMPARE(cmd->microphones[1].position, QStringLiteral("rear"));
    QVERIFY(!cmd->microphones[1].enabled);
    QCOMPARE(cmd->microphones[1].input, 3);
}

void RemoteCommandTest::rejectsMalformedCommands_data() {
    QTest::addColumn<QByteArray>("json");

    QTest::newRow("no command") << QByteArray(R"({"requestId":1})");
    QTest::newRow("unknown") << QByteArray(R"({"command":"explode"})");
    QTest::newRow("string request id") << QByteArray(R"({"command":"start","requestId":"7"})");
    QTest::newRow("register missing") << QByteArray(R"({"command":"selectRegister"})");
    QTest::newRow("organ missing") << QByteArray(R"({"command":"selectOrgan"})");
    QTest::newRow("settings not object") << QByteArray(R"({"command":"updateSettings","settings":5})");
    QTest::newRow("microphones not array") << QByteArray(R"({"command":"configureMicrophones","microphones":{}})");
    QTest::newRow("microphone not object") << QByteArray(R"({"command":"configureMicrophones","microphones":[1]})");
    QTest::newRow("note text") << QByteArray(R"({"command":"setNote","note":"C2"})");
    QTest::newRow("note fraction") << QByteArray(R"({"command":"setNote","note":36.5})");
    QTest::newRow("note huge") << QByteArray(R"({"command":"setNote","note":1e12})");
    QTest::newRow("request id huge") << QByteArray(R"({"command":"start","requestId":1e300})");
    QTest::newRow("request id negative") << QByteArray(R"({"command":"start","requestId":-4})");
    QTest::newRow("request id fraction") << QByteArray(R"({"command":"start","requestId":2.5})");
}

void RemoteCommandTest::rejectsMalformedCommands() {
    QFETCH(QByteArray, json);
    QString error;
    const auto cmd = RemoteCommand::fromJson(QJsonDocument::fromJson(json).object(), &error);
    QVERIFY(!cmd.has_value());
    QVERIFY(!error.isEmpty());
}

void RemoteCommandTest::settingsPatchKeepsMissingKeys() {
    RecordingSettings settings;
    QString message;
    QVERIFY(applySettingsPatch(parseObject(R"({"countdownSeconds":3,"endNote":60})"), settings, &message));
    QCOMPARE(settings.countdownSeconds, 3);
    QCOMPARE(settings.endNote, 60);
    QCOMPARE(settings.startNote, 36);
    QCOMPARE(settings.sampleRate, 44100);
}

void RemoteCommandTest::settingsPatchRejectsWrongTypes() {
    RecordingSettings settings;
    QString message;
    QVERIFY(!applySettingsPatch(parseObject(R"({"sampleRate":"48000"})"), settings, &message));
    QVERIFY(!applySettingsPatch(parseObject(R"({"recordSeconds":2.5})"), settings, &message));
    QVERIFY(!applySettingsPatch(parseObject(R"({"channels":3})"), settings, &message));
    QVERIFY(!applySettingsPatch(parseObject(R"({"countdownSeconds":2,"bitDepth":true})"), settings, &message));
    QCOMPARE(settings, RecordingSettings {});
}

void RemoteCommandTest::settingsPatchAcceptsLayoutNames() {
    RecordingSettings settings;
    QVERIFY(applySettingsPatch(parseObject(R"({"channels":"stereo"})"), settings));
    QCOMPARE(settings.channels, ChannelLayout::Stereo);
    QVERIFY(applySettingsPatch(parseObject(R"({"channels":1})"), settings));
    QCOMPARE(settings.channels, ChannelLayout::Mono);
    QCOMPARE(settingsToJson(settings).value(QStringLiteral("channels")).toInt(), 1);
}

void RemoteCommandTest::rejectsNumbersOutsideIntegerRange() {
    RecordingSettings settings;
    QString message;
    QVERIFY(!applySettingsPatch(parseObject(R"({"sampleRate":1e12})"), settings, &message));
    QVERIFY(message.contains(QStringLiteral("sampleRate")));
    QVERIFY(!applySettingsPatch(parseObject(R"({"startNote":-1e300})"), settings, &message));
    QVERIFY(!applySettingsPatch(parseObject(R"({"channels":4294967297})"), settings, &message));
    QCOMPARE(settings, RecordingSettings {});

    QCOMPARE(exactInt(2147483647.0).value_or(0), 2147483647);
    QVERIFY(!exactInt(2147483648.0).has_value());
    QVERIFY(!exactInt(-2147483649.0).has_value());
}

void RemoteCommandTest::acceptsLargestExactRequestId() {
    QString error;
    const auto cmd = RemoteCommand::fromJson(parseObject(R"({"command":"stop","requestId":9007199254740992})"), &error);
    QVERIFY2(cmd.has_value(), qPrintable(error));
    QCOMPARE(cmd->requestId, qint64(9007199254740992LL));
    QVERIFY(!RemoteCommand::fromJson(parseObject(R"({"command":"stop","requestId":9007199254740994})"), &error));
}

QTEST_GUILESS_MAIN(RemoteCommandTest)
#include "RemoteCommandTest.moc"
