#include <QtTest/QtTest>
#include "core/ranking/hybrid_fusion.h"

#include <cmath>

class TestHybridFusion : public QObject {
    Q_OBJECT

private slots:
    // ── RRF arithmetic ───────────────────────────────────────────
    void testRrfContributionExact();
    void testFusedScoresExact();
    void testInterleavedListsTieOnLexicalScore();
    void testHybridWeightMapping();
    void testEmptyListsYieldNothing();
    void testHitsOutsideCatalogDropped();

    // ── Ordering ─────────────────────────────────────────────────
    void testTieBreakPrefersLexicalScore();
    void testTieBreakFallsBackToItemId();

    // ── Tag override ─────────────────────────────────────────────
    void testTagMatchOutranksEveryUntaggedResult();
    void testTagMarginInterpolatesWithCoverage();
    void testTagBoostDisabled();

    // ── Metadata boosts ──────────────────────────────────────────
    void testLogCounterFactorSaturates();
    void testPopularityBoostApplied();
    void testCategoricalMatchBoost();
    void testMetadataBoostDisabled();
    void testBoostRuleJson();
};

namespace {

rc::Item makeItem(const QString& id, const QStringList& tags = {})
{
    rc::Item item;
    item.id = id;
    item.title = id;
    item.body = QStringLiteral("body of ") + id;
    item.tags = tags;
    return item;
}

rc::DocumentRef ref(const QString& id)
{
    rc::DocumentRef doc;
    doc.docId = id;
    doc.parentId = id;
    return doc;
}

rc::LexicalHit lexical(const QString& id, double score = 1.0, const QStringList& tags = {})
{
    rc::LexicalHit hit;
    hit.doc = ref(id);
    hit.score = score;
    hit.tagMatch = !tags.isEmpty();
    hit.matchedTags = tags;
    return hit;
}

rc::VectorHit vectorHit(const QString& id, float similarity = 0.5f)
{
    rc::VectorHit hit;
    hit.doc = ref(id);
    hit.similarity = similarity;
    return hit;
}

const rc::RetrievalCandidate* findCandidate(const std::vector<rc::RetrievalCandidate>& list,
                                            const QString& id)
{
    for (const auto& candidate : list) {
        if (candidate.doc.docId == id) {
            return &candidate;
        }
    }
    return nullptr;
}

bool nearlyEqual(double a, double b)
{
    return std::abs(a - b) < 1e-12;
}

} // namespace

// ── RRF arithmetic ───────────────────────────────────────────────

void TestHybridFusion::testRrfContributionExact()
{
    QVERIFY(nearlyEqual(rc::HybridFusion::rrfContribution(1.0, 1, 60), 1.0 / 61.0));
    QVERIFY(nearlyEqual(rc::HybridFusion::rrfContribution(2.0, 3, 60), 2.0 / 63.0));
    QCOMPARE(rc::HybridFusion::rrfContribution(1.0, 0, 60), 0.0);
}

void TestHybridFusion::testFusedScoresExact()
{
    const rc::ItemCatalog catalog({makeItem(QStringLiteral("a")), makeItem(QStringLiteral("b")),
                                   makeItem(QStringLiteral("c"))});
    const std::vector<rc::LexicalHit> lexicalHits{lexical(QStringLiteral("a")),
                                                  lexical(QStringLiteral("c"))};
    const std::vector<rc::VectorHit> vectorHits{vectorHit(QStringLiteral("b")),
                                                vectorHit(QStringLiteral("a"))};

    const auto fused = rc::HybridFusion::fuse(lexicalHits, vectorHits, QStringLiteral("query"),
                                              catalog);
    QCOMPARE(static_cast<int>(fused.size()), 3);

    const auto* a = findCandidate(fused, QStringLiteral("a"));
    const auto* b = findCandidate(fused, QStringLiteral("b"));
    const auto* c = findCandidate(fused, QStringLiteral("c"));
    QVERIFY(a && b && c);
    QVERIFY(nearlyEqual(a->finalScore, 1.0 / 61.0 + 1.0 / 62.0));
    QVERIFY(nearlyEqual(b->finalScore, 1.0 / 61.0));
    QVERIFY(nearlyEqual(c->finalScore, 1.0 / 62.0));
    QCOMPARE(a->lexicalRank.value(), 1);
    QCOMPARE(a->vectorRank.value(), 2);
    QVERIFY(!c->vectorRank.has_value());

    QCOMPARE(fused[0].doc.docId, QStringLiteral("a"));
    QCOMPARE(fused[1].doc.docId, QStringLiteral("b"));
    QCOMPARE(fused[2].doc.docId, QStringLiteral("c"));
}

void TestHybridFusion::testInterleavedListsTieOnLexicalScore()
{
    const rc::ItemCatalog catalog({makeItem(QStringLiteral("x")), makeItem(QStringLiteral("y")),
                                   makeItem(QStringLiteral("z")), makeItem(QStringLiteral("w"))});
    const std::vector<rc::VectorHit> vectorHits{vectorHit(QStringLiteral("y")),
                                                vectorHit(QStringLiteral("x")),
                                                vectorHit(QStringLiteral("w"))};

    auto fused = rc::HybridFusion::fuse({lexical(QStringLiteral("x"), 4.0),
                                         lexical(QStringLiteral("y"), 2.5),
                                         lexical(QStringLiteral("z"), 1.0)},
                                        vectorHits, QStringLiteral("q"), catalog);
    QCOMPARE(static_cast<int>(fused.size()), 4);

    const auto* x = findCandidate(fused, QStringLiteral("x"));
    const auto* y = findCandidate(fused, QStringLiteral("y"));
    const auto* z = findCandidate(fused, QStringLiteral("z"));
    const auto* w = findCandidate(fused, QStringLiteral("w"));
    QVERIFY(x && y && z && w);
    QVERIFY(nearlyEqual(x->finalScore, 1.0 / 61.0 + 1.0 / 62.0));
    QVERIFY(nearlyEqual(y->finalScore, 1.0 / 61.0 + 1.0 / 62.0));
    QVERIFY(nearlyEqual(z->finalScore, 1.0 / 63.0));
    QVERIFY(nearlyEqual(w->finalScore, 1.0 / 62.0));

    QCOMPARE(fused[0].doc.docId, QStringLiteral("x"));
    QCOMPARE(fused[1].doc.docId, QStringLiteral("y"));
    QCOMPARE(fused[2].doc.docId, QStringLiteral("w"));
    QCOMPARE(fused[3].doc.docId, QStringLiteral("z"));

    // Same ranks, higher lexical score on y: y wins the tie.
    fused = rc::HybridFusion::fuse({lexical(QStringLiteral("x"), 2.5),
                                    lexical(QStringLiteral("y"), 4.0),
                                    lexical(QStringLiteral("z"), 1.0)},
                                   vectorHits, QStringLiteral("q"), catalog);
    QCOMPARE(static_cast<int>(fused.size()), 4);
    QCOMPARE(fused[0].doc.docId, QStringLiteral("y"));
    QCOMPARE(fused[1].doc.docId, QStringLiteral("x"));
}

void TestHybridFusion::testHybridWeightMapping()
{
    const auto balanced = rc::FusionConfig::fromHybridWeight(0.5, 1.0);
    QCOMPARE(balanced.lexicalWeight, 1.0);
    QCOMPARE(balanced.vectorWeight, 1.0);

    const auto lexicalOnly = rc::FusionConfig::fromHybridWeight(0.0, 1.0);
    QCOMPARE(lexicalOnly.lexicalWeight, 2.0);
    QCOMPARE(lexicalOnly.vectorWeight, 0.0);

    const auto boosted = rc::FusionConfig::fromHybridWeight(0.75, 2.0);
    QVERIFY(nearlyEqual(boosted.lexicalWeight, 1.0));
    QVERIFY(nearlyEqual(boosted.vectorWeight, 1.5));

    const auto clamped = rc::FusionConfig::fromHybridWeight(3.0, 1.0);
    QCOMPARE(clamped.lexicalWeight, 0.0);
    QCOMPARE(clamped.vectorWeight, 2.0);
}

void TestHybridFusion::testEmptyListsYieldNothing()
{
    const rc::ItemCatalog catalog({makeItem(QStringLiteral("a"))});
    QVERIFY(rc::HybridFusion::fuse({}, {}, QStringLiteral("q"), catalog).empty());
}

void TestHybridFusion::testHitsOutsideCatalogDropped()
{
    const rc::ItemCatalog catalog({makeItem(QStringLiteral("a"))});
    const auto fused = rc::HybridFusion::fuse({lexical(QStringLiteral("ghost")),
                                               lexical(QStringLiteral("a"))},
                                              {}, QStringLiteral("q"), catalog);
    QCOMPARE(static_cast<int>(fused.size()), 1);
    QCOMPARE(fused[0].doc.docId, QStringLiteral("a"));
    // Ranks are list positions, so the dropped hit still occupied rank 1.
    QCOMPARE(fused[0].lexicalRank.value(), 2);
}

// ── Ordering ─────────────────────────────────────────────────────

void TestHybridFusion::testTieBreakPrefersLexicalScore()
{
    const rc::ItemCatalog catalog({makeItem(QStringLiteral("a")), makeItem(QStringLiteral("b"))});
    const auto fused = rc::HybridFusion::fuse({lexical(QStringLiteral("b"), 3.0)},
                                              {vectorHit(QStringLiteral("a"))},
                                              QStringLiteral("q"), catalog);
    QCOMPARE(static_cast<int>(fused.size()), 2);
    QVERIFY(nearlyEqual(fused[0].finalScore, fused[1].finalScore));
    QCOMPARE(fused[0].doc.docId, QStringLiteral("b"));
}

void TestHybridFusion::testTieBreakFallsBackToItemId()
{
    const rc::ItemCatalog catalog({makeItem(QStringLiteral("zeta")),
                                   makeItem(QStringLiteral("alpha"))});
    const auto fused = rc::HybridFusion::fuse({lexical(QStringLiteral("zeta"), 0.0)},
                                              {vectorHit(QStringLiteral("alpha"))},
                                              QStringLiteral("q"), catalog);
    QCOMPARE(static_cast<int>(fused.size()), 2);
    QCOMPARE(fused[0].doc.docId, QStringLiteral("alpha"));
    QCOMPARE(fused[1].doc.docId, QStringLiteral("zeta"));
}

// ── Tag override ─────────────────────────────────────────────────

void TestHybridFusion::testTagMatchOutranksEveryUntaggedResult()
{
    rc::Item popular = makeItem(QStringLiteral("popular"));
    popular.metadata.popularity = 250000;
    const rc::ItemCatalog catalog({popular,
                                   makeItem(QStringLiteral("second")),
                                   makeItem(QStringLiteral("tagged"), {QStringLiteral("ai")})});

    rc::FusionConfig config;
    rc::MetadataBoostRule stars;
    stars.field = QStringLiteral("popularity");
    stars.maxBoost = 0.5;
    config.metadataBoosts.push_back(stars);

    const std::vector<rc::LexicalHit> lexicalHits{
        lexical(QStringLiteral("popular")), lexical(QStringLiteral("second")),
        lexical(QStringLiteral("tagged"), 0.1, {QStringLiteral("ai")})};
    const std::vector<rc::VectorHit> vectorHits{vectorHit(QStringLiteral("popular")),
                                                vectorHit(QStringLiteral("second"))};

    const auto fused = rc::HybridFusion::fuse(lexicalHits, vectorHits,
                                              QStringLiteral("ai assistants"), catalog, config);
    QCOMPARE(static_cast<int>(fused.size()), 3);
    QCOMPARE(fused[0].doc.docId, QStringLiteral("tagged"));
    QVERIFY(fused[0].tagMatched);

    const double naturalMax = fused[1].finalScore;
    QVERIFY(fused[0].finalScore >= naturalMax * 1.5);

    bool annotated = false;
    for (const auto& boost : fused[0].boosts) {
        annotated = annotated || boost.kind == QLatin1String("tag");
    }
    QVERIFY(annotated);
}

void TestHybridFusion::testTagMarginInterpolatesWithCoverage()
{
    const rc::FusionConfig config;
    QCOMPARE(rc::HybridFusion::tagMargin(0, 2, config), 1.5);
    QCOMPARE(rc::HybridFusion::tagMargin(1, 2, config), 1.75);
    QCOMPARE(rc::HybridFusion::tagMargin(2, 2, config), 2.0);
    QCOMPARE(rc::HybridFusion::tagMargin(1, 0, config), 1.5);
}

void TestHybridFusion::testTagBoostDisabled()
{
    const rc::ItemCatalog catalog({makeItem(QStringLiteral("first")),
                                   makeItem(QStringLiteral("tagged"), {QStringLiteral("ai")})});
    rc::FusionConfig config;
    config.tagBoostEnabled = false;

    const auto fused = rc::HybridFusion::fuse(
        {lexical(QStringLiteral("first")), lexical(QStringLiteral("tagged"), 1.0, {QStringLiteral("ai")})},
        {}, QStringLiteral("ai"), catalog, config);
    QCOMPARE(fused[0].doc.docId, QStringLiteral("first"));
    QVERIFY(!fused[1].tagMatched);
    QVERIFY(nearlyEqual(fused[1].finalScore, 1.0 / 62.0));
}

// ── Metadata boosts ──────────────────────────────────────────────

void TestHybridFusion::testLogCounterFactorSaturates()
{
    rc::MetadataBoostRule rule;
    rule.maxBoost = 0.5;
    rule.saturation = 1000.0;
    QCOMPARE(rc::HybridFusion::logCounterFactor(0.0, rule), 1.0);
    QVERIFY(nearlyEqual(rc::HybridFusion::logCounterFactor(1000.0, rule), 1.5));
    QVERIFY(nearlyEqual(rc::HybridFusion::logCounterFactor(1e9, rule), 1.5));

    const double mid = rc::HybridFusion::logCounterFactor(30.0, rule);
    QVERIFY(mid > 1.0 && mid < 1.5);
}

void TestHybridFusion::testPopularityBoostApplied()
{
    rc::Item starred = makeItem(QStringLiteral("starred"));
    starred.metadata.popularity = 100000;
    const rc::ItemCatalog catalog({makeItem(QStringLiteral("plain")), starred});

    rc::FusionConfig config;
    rc::MetadataBoostRule rule;
    rule.field = QStringLiteral("popularity");
    rule.maxBoost = 0.5;
    rule.saturation = 100000.0;
    config.metadataBoosts.push_back(rule);

    const auto fused = rc::HybridFusion::fuse(
        {lexical(QStringLiteral("plain")), lexical(QStringLiteral("starred"))},
        {}, QStringLiteral("q"), catalog, config);
    QCOMPARE(fused[0].doc.docId, QStringLiteral("starred"));
    QVERIFY(nearlyEqual(fused[0].finalScore, 1.5 / 62.0));
    QCOMPARE(static_cast<int>(fused[0].boosts.size()), 1);
    QCOMPARE(fused[0].boosts[0].kind, QStringLiteral("metadata"));
}

void TestHybridFusion::testCategoricalMatchBoost()
{
    rc::Item rust = makeItem(QStringLiteral("rust-repo"));
    rust.metadata.language = QStringLiteral("Rust");
    rc::Item topical = makeItem(QStringLiteral("topical"));
    topical.metadata.topics = {QStringLiteral("parser"), QStringLiteral("compiler")};
    const rc::ItemCatalog catalog({makeItem(QStringLiteral("other")), rust, topical});

    rc::FusionConfig config;
    rc::MetadataBoostRule language;
    language.kind = rc::MetadataBoostRule::Kind::CategoricalMatch;
    language.field = QStringLiteral("language");
    language.multiplier = 1.5;
    rc::MetadataBoostRule topics;
    topics.kind = rc::MetadataBoostRule::Kind::CategoricalMatch;
    topics.field = QStringLiteral("topics");
    topics.multiplier = 3.0;
    config.metadataBoosts = {language, topics};

    const auto fused = rc::HybridFusion::fuse(
        {lexical(QStringLiteral("other")), lexical(QStringLiteral("rust-repo")),
         lexical(QStringLiteral("topical"))},
        {}, QStringLiteral("rust parser"), catalog, config);

    const auto* rustCandidate = findCandidate(fused, QStringLiteral("rust-repo"));
    const auto* topicalCandidate = findCandidate(fused, QStringLiteral("topical"));
    QVERIFY(rustCandidate && topicalCandidate);
    QVERIFY(nearlyEqual(rustCandidate->finalScore, 1.5 / 62.0));
    QVERIFY(nearlyEqual(topicalCandidate->finalScore, 3.0 / 63.0));
    QCOMPARE(fused[0].doc.docId, QStringLiteral("topical"));
}

void TestHybridFusion::testMetadataBoostDisabled()
{
    rc::Item starred = makeItem(QStringLiteral("starred"));
    starred.metadata.popularity = 100000;
    const rc::ItemCatalog catalog({starred});

    rc::FusionConfig config;
    config.metadataBoostEnabled = false;
    rc::MetadataBoostRule rule;
    rule.field = QStringLiteral("popularity");
    config.metadataBoosts.push_back(rule);

    const auto fused = rc::HybridFusion::fuse({lexical(QStringLiteral("starred"))}, {},
                                              QStringLiteral("q"), catalog, config);
    QVERIFY(nearlyEqual(fused[0].finalScore, 1.0 / 61.0));
    QVERIFY(fused[0].boosts.empty());
}

void TestHybridFusion::testBoostRuleJson()
{
    QJsonObject json;
    json[QStringLiteral("field")] = QStringLiteral("topics");
    json[QStringLiteral("kind")] = QStringLiteral("match");
    json[QStringLiteral("multiplier")] = 3.0;
    const auto rule = rc::MetadataBoostRule::fromJson(json);
    QVERIFY(rule.has_value());
    QCOMPARE(rule->kind, rc::MetadataBoostRule::Kind::CategoricalMatch);
    QCOMPARE(rule->multiplier, 3.0);
    QCOMPARE(rule->toJson(), json);

    json[QStringLiteral("kind")] = QStringLiteral("sqrt");
    QString error;
    QVERIFY(!rc::MetadataBoostRule::fromJson(json, &error).has_value());
    QVERIFY(error.contains(QStringLiteral("sqrt")));
}

QTEST_MAIN(TestHybridFusion)
#include "test_hybrid_fusion.moc"
