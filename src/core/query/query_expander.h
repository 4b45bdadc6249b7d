#pragma once

#include <QString>
#include <QStringList>
#include <utility>
#include <vector>

namespace rc {

struct QueryExpansionConfig {
    int topK = 5;               // seed passages fitted per query
    int maxTerms = 3;           // terms appended at most
    int maxFeatures = 100;      // vocabulary cap, by total term count
    int minTokenCount = 3;      // queries with this many tokens are left alone
};

// QueryExpander: rewrites short queries with terms mined from an initial
// retrieval pass. Fits a per-query TF-IDF model (unigrams and bigrams,
// English stop words removed, smoothed idf, L2-normalized rows) over the seed
// passages and appends the terms with the highest mean weight that the query
// does not already contain.
//
// expand() never fails: any problem yields the original query unchanged.
class QueryExpander {
public:
    using TermScore = std::pair<QString, double>;

    explicit QueryExpander(const QueryExpansionConfig& config = {});

    bool shouldExpand(const QString& query) const;

    // seedTexts are ranked; only the first topK are used, and fewer than
    // topK seeds leaves the query unexpanded.
    QString expand(const QString& query, const std::vector<QString>& seedTexts) const;

    // Vocabulary terms by mean TF-IDF weight over the documents, best first.
    // Empty when the documents hold no usable terms.
    std::vector<TermScore> rankTerms(const std::vector<QString>& documents) const;

    // Lowercased word tokens of two or more characters, stop words removed.
    static QStringList analyze(const QString& text);
    static bool isStopWord(const QString& token);

    const QueryExpansionConfig& config() const { return m_config; }

private:
    QueryExpansionConfig m_config;
};

} // namespace rc
