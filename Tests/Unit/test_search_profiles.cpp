#include <QtTest/QtTest>
#include "core/search/search_profiles.h"

#include <QJsonArray>

#include <cmath>

class TestSearchProfiles : public QObject {
    Q_OBJECT

private slots:
    // ── Built-ins ────────────────────────────────────────────────
    void testBuiltinNames();
    void testReposProfile();
    void testRecentProfile();
    void testDeepAndKeywordsProfiles();
    void testDefaultProfile();

    // ── Derived configs ──────────────────────────────────────────
    void testFusionConfigFromWeights();
    void testTimeDecayConfig();

    // ── Custom profiles ──────────────────────────────────────────
    void testFromJsonDefaults();
    void testFromJsonFullProfile();
    void testFromJsonRejectsBadValues_data();
    void testFromJsonRejectsBadValues();
    void testShadowingBuiltinRejected();
    void testDuplicateCustomRejected();
    void testRegistryJson();
};

// ── Built-ins ────────────────────────────────────────────────────

void TestSearchProfiles::testBuiltinNames()
{
    const rc::SearchProfileRegistry registry;
    QCOMPARE(registry.names(), (QStringList{QStringLiteral("deep"), QStringLiteral("default"),
                                            QStringLiteral("keywords"), QStringLiteral("recent"),
                                            QStringLiteral("repos")}));
    QVERIFY(rc::SearchProfileRegistry::isBuiltin(QStringLiteral("recent")));
    QVERIFY(!rc::SearchProfileRegistry::isBuiltin(QStringLiteral("mine")));
    QVERIFY(!registry.find(QStringLiteral("mine")).has_value());
}

void TestSearchProfiles::testReposProfile()
{
    const auto repos = rc::SearchProfileRegistry().find(QStringLiteral("repos"));
    QVERIFY(repos.has_value());
    QCOMPARE(repos->hybridWeight, 0.3);
    QCOMPARE(repos->bm25Boost, 2.0);
    QVERIFY(!repos->crossEncoderEnabled);
    QVERIFY(!repos->chunkingEnabled);
    QVERIFY(!repos->timeDecay.has_value());
    QCOMPARE(repos->defaultIncludeTypes, QStringList{QStringLiteral("gleaning")});

    QCOMPARE(static_cast<int>(repos->metadataBoosts.size()), 3);
    const rc::MetadataBoostRule& popularity = repos->metadataBoosts[0];
    QCOMPARE(popularity.kind, rc::MetadataBoostRule::Kind::LogCounter);
    QCOMPARE(popularity.field, QStringLiteral("popularity"));
    QCOMPARE(popularity.maxBoost, 0.5);
    QCOMPARE(repos->metadataBoosts[1].field, QStringLiteral("topics"));
    QCOMPARE(repos->metadataBoosts[1].multiplier, 3.0);
    QCOMPARE(repos->metadataBoosts[2].field, QStringLiteral("language"));
    QCOMPARE(repos->metadataBoosts[2].multiplier, 1.5);
}

void TestSearchProfiles::testRecentProfile()
{
    const auto recent = rc::SearchProfileRegistry().find(QStringLiteral("recent"));
    QVERIFY(recent.has_value());
    QVERIFY(recent->timeDecay.has_value());
    QCOMPARE(recent->timeDecay->halfLifeDays, 7.0);
    QCOMPARE(recent->timeDecay->maxBoost, 0.5);
    QCOMPARE(recent->maxAgeDays.value_or(0.0), 90.0);
    QCOMPARE(recent->defaultIncludeTypes,
             (QStringList{QStringLiteral("daily"), QStringLiteral("note"),
                          QStringLiteral("writering")}));
}

void TestSearchProfiles::testDeepAndKeywordsProfiles()
{
    const rc::SearchProfileRegistry registry;
    const auto deep = registry.find(QStringLiteral("deep"));
    QVERIFY(deep.has_value());
    QCOMPARE(deep->hybridWeight, 0.8);
    QVERIFY(deep->showChunkContext);
    QVERIFY(deep->crossEncoderEnabled);
    QCOMPARE(deep->defaultExcludeTypes,
             (QStringList{QStringLiteral("daily"), QStringLiteral("gleaning")}));

    const auto keywords = registry.find(QStringLiteral("keywords"));
    QVERIFY(keywords.has_value());
    QCOMPARE(keywords->hybridWeight, 0.2);
    QCOMPARE(keywords->bm25Boost, 1.5);
    QVERIFY(!keywords->crossEncoderEnabled);
}

void TestSearchProfiles::testDefaultProfile()
{
    const auto balanced = rc::SearchProfileRegistry().find(
        QString::fromLatin1(rc::SearchProfileRegistry::kDefaultProfile));
    QVERIFY(balanced.has_value());
    QCOMPARE(balanced->hybridWeight, 0.5);
    QCOMPARE(balanced->bm25Boost, 1.0);
    QCOMPARE(balanced->timeDecay->halfLifeDays, 90.0);
    QCOMPARE(balanced->timeDecay->maxBoost, 0.2);
    QVERIFY(!balanced->maxAgeDays.has_value());
    QCOMPARE(balanced->defaultExcludeTypes, QStringList{QStringLiteral("daily")});
    QVERIFY(balanced->defaultIncludeTypes.isEmpty());
    QCOMPARE(balanced->chunkSize, 2000);
    QCOMPARE(balanced->chunkOverlap, 400);
}

// ── Derived configs ──────────────────────────────────────────────

void TestSearchProfiles::testFusionConfigFromWeights()
{
    const rc::SearchProfileRegistry registry;

    const rc::FusionConfig balanced = registry.find(QStringLiteral("default"))->fusionConfig();
    QCOMPARE(balanced.lexicalWeight, 1.0);
    QCOMPARE(balanced.vectorWeight, 1.0);
    QVERIFY(!balanced.metadataBoostEnabled);

    const rc::FusionConfig repos = registry.find(QStringLiteral("repos"))->fusionConfig();
    QVERIFY(std::abs(repos.lexicalWeight - 2.0 * 0.7 * 2.0) < 1e-12);
    QVERIFY(std::abs(repos.vectorWeight - 0.6) < 1e-12);
    QVERIFY(repos.metadataBoostEnabled);
    QCOMPARE(static_cast<int>(repos.metadataBoosts.size()), 3);
}

void TestSearchProfiles::testTimeDecayConfig()
{
    const rc::SearchProfileRegistry registry;

    const rc::TimeDecayConfig recent = registry.find(QStringLiteral("recent"))->timeDecayConfig();
    QVERIFY(recent.enabled);
    QCOMPARE(recent.halfLifeDays, 7.0);
    QCOMPARE(recent.maxAgeDays.value_or(0.0), 90.0);

    const rc::TimeDecayConfig keywords = registry.find(QStringLiteral("keywords"))->timeDecayConfig();
    QVERIFY(!keywords.enabled);
    QVERIFY(!keywords.maxAgeDays.has_value());
}

// ── Custom profiles ──────────────────────────────────────────────

void TestSearchProfiles::testFromJsonDefaults()
{
    QString error;
    const auto profile = rc::SearchProfile::fromJson(QStringLiteral("mine"), QJsonObject{}, &error);
    QVERIFY2(profile.has_value(), qPrintable(error));
    QCOMPARE(profile->displayName, QStringLiteral("mine"));
    QCOMPARE(profile->hybridWeight, 0.5);
    QVERIFY(profile->crossEncoderEnabled);
    QVERIFY(!profile->queryExpansionEnabled);
    QVERIFY(!profile->timeDecay.has_value());
    QVERIFY(profile->metadataBoosts.empty());
}

void TestSearchProfiles::testFromJsonFullProfile()
{
    const QJsonObject json{
        {QStringLiteral("displayName"), QStringLiteral("Papers")},
        {QStringLiteral("hybridWeight"), 0.9},
        {QStringLiteral("bm25Boost"), 0.5},
        {QStringLiteral("metadataBoosts"), QJsonArray{
            QJsonObject{{QStringLiteral("kind"), QStringLiteral("log")},
                        {QStringLiteral("field"), QStringLiteral("citations")},
                        {QStringLiteral("maxBoost"), 1.0}}}},
        {QStringLiteral("timeDecay"), QJsonObject{{QStringLiteral("halfLifeDays"), 30.0}}},
        {QStringLiteral("maxAgeDays"), 365.0},
        {QStringLiteral("queryExpansionEnabled"), true},
        {QStringLiteral("defaultIncludeTypes"), QJsonArray{QStringLiteral("paper"), QStringLiteral(" ")}},
        {QStringLiteral("chunkSize"), 500},
        {QStringLiteral("chunkOverlap"), 50},
    };

    QString error;
    const auto profile = rc::SearchProfile::fromJson(QStringLiteral("papers"), json, &error);
    QVERIFY2(profile.has_value(), qPrintable(error));
    QCOMPARE(profile->displayName, QStringLiteral("Papers"));
    QCOMPARE(profile->hybridWeight, 0.9);
    QCOMPARE(profile->metadataBoosts[0].field, QStringLiteral("citations"));
    QCOMPARE(profile->metadataBoosts[0].maxBoost, 1.0);
    QCOMPARE(profile->timeDecay->halfLifeDays, 30.0);
    QCOMPARE(profile->maxAgeDays.value_or(0.0), 365.0);
    QVERIFY(profile->queryExpansionEnabled);
    QCOMPARE(profile->defaultIncludeTypes, QStringList{QStringLiteral("paper")});
    QCOMPARE(profile->chunkerConfig().chunkSize, 500);
    QCOMPARE(profile->chunkerConfig().overlap, 50);

    // Serialized form parses back to the same settings.
    const auto reparsed = rc::SearchProfile::fromJson(QStringLiteral("papers"), profile->toJson());
    QVERIFY(reparsed.has_value());
    QCOMPARE(reparsed->bm25Boost, 0.5);
    QCOMPARE(reparsed->timeDecay->halfLifeDays, 30.0);
}

void TestSearchProfiles::testFromJsonRejectsBadValues_data()
{
    QTest::addColumn<QJsonObject>("json");
    QTest::addColumn<QString>("fragment");

    QTest::newRow("weight-high") << QJsonObject{{QStringLiteral("hybridWeight"), 1.5}}
                                 << QStringLiteral("hybridWeight");
    QTest::newRow("weight-negative") << QJsonObject{{QStringLiteral("hybridWeight"), -0.1}}
                                     << QStringLiteral("hybridWeight");
    QTest::newRow("bm25") << QJsonObject{{QStringLiteral("bm25Boost"), -1.0}}
                          << QStringLiteral("bm25Boost");
    QTest::newRow("decay-type") << QJsonObject{{QStringLiteral("timeDecay"), 7}}
                                << QStringLiteral("timeDecay");
    QTest::newRow("decay-halflife")
        << QJsonObject{{QStringLiteral("timeDecay"), QJsonObject{{QStringLiteral("halfLifeDays"), 0}}}}
        << QStringLiteral("halfLifeDays");
    QTest::newRow("max-age") << QJsonObject{{QStringLiteral("maxAgeDays"), 0}}
                             << QStringLiteral("maxAgeDays");
    QTest::newRow("overlap") << QJsonObject{{QStringLiteral("chunkSize"), 100},
                                            {QStringLiteral("chunkOverlap"), 100}}
                             << QStringLiteral("overlap");
    QTest::newRow("rule-kind")
        << QJsonObject{{QStringLiteral("metadataBoosts"),
                        QJsonArray{QJsonObject{{QStringLiteral("field"), QStringLiteral("x")},
                                               {QStringLiteral("kind"), QStringLiteral("sqrt")}}}}}
        << QStringLiteral("unknown kind");
}

void TestSearchProfiles::testFromJsonRejectsBadValues()
{
    QFETCH(QJsonObject, json);
    QFETCH(QString, fragment);

    QString error;
    QVERIFY(!rc::SearchProfile::fromJson(QStringLiteral("bad"), json, &error).has_value());
    QVERIFY2(error.contains(fragment), qPrintable(error));
    QVERIFY(error.startsWith(QStringLiteral("Profile 'bad':")));
}

void TestSearchProfiles::testShadowingBuiltinRejected()
{
    rc::SearchProfileRegistry registry;
    auto profile = rc::SearchProfile::fromJson(QStringLiteral("repos"), QJsonObject{});
    QVERIFY(profile.has_value());

    QString error;
    QVERIFY(!registry.addCustom(*profile, &error));
    QVERIFY(error.contains(QStringLiteral("shadow")));
    QCOMPARE(registry.find(QStringLiteral("repos"))->bm25Boost, 2.0);
}

void TestSearchProfiles::testDuplicateCustomRejected()
{
    rc::SearchProfileRegistry registry;
    auto profile = rc::SearchProfile::fromJson(QStringLiteral("mine"), QJsonObject{});
    QVERIFY(profile.has_value());

    QVERIFY(registry.addCustom(*profile));
    QString error;
    QVERIFY(!registry.addCustom(*profile, &error));
    QVERIFY(error.contains(QStringLiteral("Duplicate")));
    QCOMPARE(registry.names().size(), 6);
}

void TestSearchProfiles::testRegistryJson()
{
    const QJsonObject json = rc::SearchProfileRegistry().toJson();
    QCOMPARE(json.value(QStringLiteral("default")).toString(), QStringLiteral("default"));
    const QJsonArray profiles = json.value(QStringLiteral("profiles")).toArray();
    QCOMPARE(profiles.size(), 5);
    for (const QJsonValue& value : profiles) {
        const QJsonObject profile = value.toObject();
        QVERIFY(profile.contains(QStringLiteral("hybridWeight")));
        QVERIFY(profile.contains(QStringLiteral("timeDecay")));
        QVERIFY(!profile.value(QStringLiteral("displayName")).toString().isEmpty());
    }
}

QTEST_MAIN(TestSearchProfiles)
#include "test_search_profiles.moc"
