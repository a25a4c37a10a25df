#include "NamingEngine.h"

#include <QRegularExpression>
#include <QtTest>

class NamingEngineTest : public QObject {
    Q_OBJECT

private slots:
    void formatsRegisterLabels_data();
    void formatsRegisterLabels();
    void formatIsIdempotent_data();
    void formatIsIdempotent();
    void tremulantFlagAppendsOnce();
    void emptyLabelFallsBack();
    void canonicalNamesAreFilesystemSafe();
    void noteFileNames();
    void noteDisplayNames();
    void buildsSinglePositionPath();
    void buildsPerPositionPath();
    void sanitizesPathSegments();
};

void NamingEngineTest::formatsRegisterLabels_data() {
    QTest::addColumn<QString>("label");
    QTest::addColumn<QString>("expected");

    QTest::newRow("voet dropped") << QStringLiteral("Holpijp 8 voet") << QStringLiteral("Holpijp_8");
    QTest::newRow("apostrophe") << QStringLiteral("Prestant 8'") << QStringLiteral("Prestant_8");
    QTest::newRow("curly apostrophe") << QStringLiteral("Roerfluit 4’") << QStringLiteral("Roerfluit_4");
    QTest::newRow("tremulant suffix") << QStringLiteral("Holpijp 8 voet + tremulant") << QStringLiteral("Holpijp_8_trem");
    QTest::newRow("short trem") << QStringLiteral("Bourdon 16 trem") << QStringLiteral("Bourdon_16_trem");
    QTest::newRow("sterk") << QStringLiteral("Mixtuur 4 sterk") << QStringLiteral("Mixtuur_4st");
    QTest::newRow("rij") << QStringLiteral("Sesquialter 2 rij") << QStringLiteral("Sesquialter_2st");
    QTest::newRow("count first") << QStringLiteral("3 sterk Cornet") << QStringLiteral("Cornet_3st");
    QTest::newRow("fraction") << QStringLiteral("Nasard 2 2/3") << QStringLiteral("Nasard_2_2-3");
    QTest::newRow("multi word") << QStringLiteral("Viola da gamba 8") << QStringLiteral("Viola_da_gamba_8");
    QTest::newRow("accent") << QStringLiteral("Flûte 4") << QStringLiteral("Flute_4");
    QTest::newRow("no pitch") << QStringLiteral("Vox humana") << QStringLiteral("Vox_humana");
    QTest::newRow("extra spaces") << QStringLiteral("  Octaaf   2  ") << QStringLiteral("Octaaf_2");
}

void NamingEngineTest::formatsRegisterLabels() {
    QFETCH(QString, label);
    QFETCH(QString, expected);
    QCOMPARE(NamingEngine::format(label), expected);
}

void NamingEngineTest::formatIsIdempotent_data() {
    formatsRegisterLabels_data();
}

void NamingEngineTest::formatIsIdempotent() {
    QFETCH(QString, label);
    const QString once = NamingEngine::format(label);
    QCOMPARE(NamingEngine::format(once), once);
    QCOMPARE(NamingEngine::format(once, NamingEngine::mentionsTremulant(once)), once);
}

void NamingEngineTest::tremulantFlagAppendsOnce() {
    QCOMPARE(NamingEngine::format(QStringLiteral("Holpijp 8"), true), QStringLiteral("Holpijp_8_trem"));
    QCOMPARE(NamingEngine::format(QStringLiteral("Holpijp 8 tremulant"), true), QStringLiteral("Holpijp_8_trem"));
    QVERIFY(NamingEngine::mentionsTremulant(QStringLiteral("Holpijp 8 + Tremulant")));
    QVERIFY(!NamingEngine::mentionsTremulant(QStringLiteral("Holpijp 8")));
}

void NamingEngineTest::emptyLabelFallsBack() {
    QCOMPARE(NamingEngine::format(QString()), QStringLiteral("Register"));
    QCOMPARE(NamingEngine::format(QStringLiteral("  ''  ")), QStringLiteral("Register"));
    QCOMPARE(NamingEngine::format(QString(), true), QStringLiteral("Register_trem"));
}

void NamingEngineTest::canonicalNamesAreFilesystemSafe() {
    static const QRegularExpression safe(QStringLiteral("^[A-Za-z0-9#_-]+$"));
    const QStringList labels {
        QStringLiteral("Trompet 8' (bas/disc)"),
        QStringLiteral("Quintadeen 16 voet"),
        QStringLiteral("Cimbel 3 rijen + trem"),
        QStringLiteral("Gedéckt 8 / 4"),
        QStringLiteral("Échos \"grand\" 8"),
        QStringLiteral("****"),
    };
    for (const auto& label : labels) {
        const QString name = NamingEngine::format(label);
        QVERIFY2(safe.match(name).hasMatch(), qPrintable(name));
    }
}

void NamingEngineTest::noteFileNames() {
    QCOMPARE(NamingEngine::noteFileName(0), QStringLiteral("000-c"));
    QCOMPARE(NamingEngine::noteFileName(36), QStringLiteral("036-c"));
    QCOMPARE(NamingEngine::noteFileName(61), QStringLiteral("061-c#"));
    QCOMPARE(NamingEngine::noteFileName(96), QStringLiteral("096-c"));
    QCOMPARE(NamingEngine::noteFileName(127), QStringLiteral("127-g"));
}

void NamingEngineTest::noteDisplayNames() {
    QCOMPARE(NamingEngine::noteDisplayName(0), QStringLiteral("C-1"));
    QCOMPARE(NamingEngine::noteDisplayName(36), QStringLiteral("C2"));
    QCOMPARE(NamingEngine::noteDisplayName(60), QStringLiteral("C4"));
    QCOMPARE(NamingEngine::noteDisplayName(61), QStringLiteral("C#4"));
    QCOMPARE(NamingEngine::noteDisplayName(69), QStringLiteral("A4"));
}

void NamingEngineTest::buildsSinglePositionPath() {
    const RegisterLocation location {QStringLiteral("Bavokerk"), QStringLiteral("Hoofdwerk"), QStringLiteral("Holpijp 8 voet")};
    QCOMPARE(NamingEngine::pathFor(location, false, std::nullopt, 36),
             QStringLiteral("Bavokerk/Hoofdwerk/Holpijp_8/036-c.mp3"));
    QCOMPARE(NamingEngine::pathFor(location, true, std::nullopt, 37),
             QStringLiteral("Bavokerk/Hoofdwerk/Holpijp_8_trem/037-c#.mp3"));
}

void NamingEngineTest::buildsPerPositionPath() {
    const RegisterLocation location {QStringLiteral("Sint Bavo"), QStringLiteral("Rugwerk"), QStringLiteral("Prestant 8'")};
    QCOMPARE(NamingEngine::pathFor(location, false, QStringLiteral("Front"), 60),
             QStringLiteral("Sint_Bavo/Rugwerk/Prestant_8/Front/060-c.mp3"));
    QCOMPARE(NamingEngine::pathFor(location, false, QString(), 60),
             QStringLiteral("Sint_Bavo/Rugwerk/Prestant_8/Mic/060-c.mp3"));
}

void NamingEngineTest::sanitizesPathSegments() {
    QCOMPARE(NamingEngine::sanitizeSegment(QStringLiteral("../etc"), QStringLiteral("Organ")), QStringLiteral("etc"));
    QCOMPARE(NamingEngine::sanitizeSegment(QStringLiteral("a/b"), QStringLiteral("Organ")), QStringLiteral("ab"));
    QCOMPARE(NamingEngine::sanitizeSegment(QStringLiteral("   "), QStringLiteral("Keyboard")), QStringLiteral("Keyboard"));
    QCOMPARE(NamingEngine::sanitizeSegment(QStringLiteral("Große Orgel"), QStringLiteral("Organ")), QStringLiteral("Groe_Orgel"));
}

QTEST_GUILESS_MAIN(NamingEngineTest)
#include "NamingEngineTest.moc"
