#include "core/query/query_expander.h"
#include "core/shared/logging.h"

#include <QHash>
#include <QRegularExpression>
#include <QSet>

#include <algorithm>
#include <cmath>

namespace rc {

namespace {

const QSet<QString>& englishStopWords()
{
    static const QSet<QString> words = [] {
        static const char* const kWords[] = {
            "a", "about", "above", "across", "after", "afterwards", "again", "against",
            "all", "almost", "alone", "along", "already", "also", "although", "always",
            "am", "among", "amongst", "amoungst", "amount", "an", "and", "another",
            "any", "anyhow", "anyone", "anything", "anyway", "anywhere", "are", "around",
            "as", "at", "back", "be", "became", "because", "become", "becomes",
            "becoming", "been", "before", "beforehand", "behind", "being", "below",
            "beside", "besides", "between", "beyond", "bill", "both", "bottom", "but",
            "by", "call", "can", "cannot", "cant", "co", "con", "could", "couldnt",
            "cry", "de", "describe", "detail", "do", "done", "down", "due", "during",
            "each", "eg", "eight", "either", "eleven", "else", "elsewhere", "empty",
            "enough", "etc", "even", "ever", "every", "everyone", "everything",
            "everywhere", "except", "few", "fifteen", "fifty", "fill", "find", "fire",
            "first", "five", "for", "former", "formerly", "forty", "found", "four",
            "from", "front", "full", "further", "get", "give", "go", "had", "has",
            "hasnt", "have", "he", "hence", "her", "here", "hereafter", "hereby",
            "herein", "hereupon", "hers", "herself", "him", "himself", "his", "how",
            "however", "hundred", "i", "ie", "if", "in", "inc", "indeed", "interest",
            "into", "is", "it", "its", "itself", "keep", "last", "latter", "latterly",
            "least", "less", "ltd", "made", "many", "may", "me", "meanwhile", "might",
            "mill", "mine", "more", "moreover", "most", "mostly", "move", "much",
            "must", "my", "myself", "name", "namely", "neither", "never",
            "nevertheless", "next", "nine", "no", "nobody", "none", "noone", "nor",
            "not", "nothing", "now", "nowhere", "of", "off", "often", "on", "once",
            "one", "only", "onto", "or", "other", "others", "otherwise", "our", "ours",
            "ourselves", "out", "over", "own", "part", "per", "perhaps", "please",
            "put", "rather", "re", "same", "see", "seem", "seemed", "seeming", "seems",
            "serious", "several", "she", "should", "show", "side", "since", "sincere",
            "six", "sixty", "so", "some", "somehow", "someone", "something",
            "sometime", "sometimes", "somewhere", "still", "such", "system", "take",
            "ten", "than", "that", "the", "their", "them", "themselves", "then",
            "thence", "there", "thereafter", "thereby", "therefore", "therein",
            "thereupon", "these", "they", "thick", "thin", "third", "this", "those",
            "though", "three", "through", "throughout", "thru", "thus", "to",
            "together", "too", "top", "toward", "towards", "twelve", "twenty", "two",
            "un", "under", "until", "up", "upon", "us", "very", "via", "was", "we",
            "well", "were", "what", "whatever", "when", "whence", "whenever", "where",
            "whereafter", "whereas", "whereby", "wherein", "whereupon", "wherever",
            "whether", "which", "while", "whither", "who", "whoever", "whole", "whom",
            "whose", "why", "will", "with", "within", "without", "would", "yet", "you",
            "your", "yours", "yourself", "yourselves",
        };
        QSet<QString> set;
        for (const char* word : kWords) {
            set.insert(QString::fromLatin1(word));
        }
        return set;
    }();
    return words;
}

// Unigrams followed by bigrams of adjacent surviving tokens.
QStringList termsOf(const QString& text)
{
    const QStringList tokens = QueryExpander::analyze(text);
    QStringList terms = tokens;
    for (int i = 0; i + 1 < tokens.size(); ++i) {
        terms.append(tokens.at(i) + QLatin1Char(' ') + tokens.at(i + 1));
    }
    return terms;
}

} // namespace

QueryExpander::QueryExpander(const QueryExpansionConfig& config)
    : m_config(config)
{
}

bool QueryExpander::shouldExpand(const QString& query) const
{
    const QStringList tokens = query.split(QRegularExpression(QStringLiteral("\\s+")),
                                           Qt::SkipEmptyParts);
    return !tokens.isEmpty() && tokens.size() < m_config.minTokenCount;
}

QString QueryExpander::expand(const QString& query, const std::vector<QString>& seedTexts) const
{
    if (!shouldExpand(query)) {
        return query;
    }
    if (m_config.topK <= 0 || m_config.maxTerms <= 0
        || static_cast<int>(seedTexts.size()) < m_config.topK) {
        LOG_DEBUG(rcRanking, "Expansion skipped: %d seed(s), need %d",
                  static_cast<int>(seedTexts.size()), m_config.topK);
        return query;
    }

    const std::vector<QString> seeds(seedTexts.begin(), seedTexts.begin() + m_config.topK);
    const std::vector<TermScore> ranked = rankTerms(seeds);
    if (ranked.empty()) {
        LOG_DEBUG(rcRanking, "Expansion skipped: seeds have no usable terms");
        return query;
    }

    const QString queryLower = query.toLower();
    QStringList survivors;
    const int take = std::min(m_config.maxTerms, static_cast<int>(ranked.size()));
    for (int i = 0; i < take; ++i) {
        const QString& term = ranked[static_cast<size_t>(i)].first;
        if (!queryLower.contains(term)) {
            survivors.append(term);
        }
    }

    if (survivors.isEmpty()) {
        return query;
    }

    const QString expanded = query + QLatin1Char(' ') + survivors.join(QLatin1Char(' '));
    LOG_INFO(rcRanking, "Expanded query '%s' -> '%s'",
             qUtf8Printable(query), qUtf8Printable(expanded));
    return expanded;
}

std::vector<QueryExpander::TermScore> QueryExpander::rankTerms(
    const std::vector<QString>& documents) const
{
    if (documents.empty()) {
        return {};
    }

    // ── Count ──────────────────────────────────────────────
    std::vector<QHash<QString, int>> counts;
    counts.reserve(documents.size());
    QHash<QString, int> totalCounts;
    QHash<QString, int> documentFrequency;
    for (const QString& document : documents) {
        QHash<QString, int> docCounts;
        for (const QString& term : termsOf(document)) {
            ++docCounts[term];
        }
        for (auto it = docCounts.cbegin(); it != docCounts.cend(); ++it) {
            totalCounts[it.key()] += it.value();
            ++documentFrequency[it.key()];
        }
        counts.push_back(std::move(docCounts));
    }

    if (totalCounts.isEmpty()) {
        return {};
    }

    // ── Vocabulary cap ─────────────────────────────────────
    std::vector<std::pair<QString, int>> vocabulary;
    vocabulary.reserve(static_cast<size_t>(totalCounts.size()));
    for (auto it = totalCounts.cbegin(); it != totalCounts.cend(); ++it) {
        vocabulary.emplace_back(it.key(), it.value());
    }
    std::sort(vocabulary.begin(), vocabulary.end(),
              [](const auto& lhs, const auto& rhs) {
                  if (lhs.second != rhs.second) {
                      return lhs.second > rhs.second;
                  }
                  return lhs.first < rhs.first;
              });
    if (m_config.maxFeatures > 0
        && static_cast<int>(vocabulary.size()) > m_config.maxFeatures) {
        vocabulary.resize(static_cast<size_t>(m_config.maxFeatures));
    }

    // ── Weight ─────────────────────────────────────────────
    const double n = static_cast<double>(documents.size());
    QHash<QString, double> idf;
    for (const auto& entry : vocabulary) {
        const double df = documentFrequency.value(entry.first);
        idf.insert(entry.first, std::log((1.0 + n) / (1.0 + df)) + 1.0);
    }

    QHash<QString, double> meanWeight;
    for (const auto& docCounts : counts) {
        QHash<QString, double> row;
        double norm = 0.0;
        for (auto it = docCounts.cbegin(); it != docCounts.cend(); ++it) {
            const auto idfIt = idf.constFind(it.key());
            if (idfIt == idf.cend()) {
                continue;
            }
            const double weight = it.value() * idfIt.value();
            row.insert(it.key(), weight);
            norm += weight * weight;
        }
        if (norm <= 0.0) {
            continue;
        }
        norm = std::sqrt(norm);
        for (auto it = row.cbegin(); it != row.cend(); ++it) {
            meanWeight[it.key()] += (it.value() / norm) / n;
        }
    }

    std::vector<TermScore> ranked;
    ranked.reserve(static_cast<size_t>(meanWeight.size()));
    for (auto it = meanWeight.cbegin(); it != meanWeight.cend(); ++it) {
        ranked.emplace_back(it.key(), it.value());
    }
    std::sort(ranked.begin(), ranked.end(),
              [](const TermScore& lhs, const TermScore& rhs) {
                  if (lhs.second != rhs.second) {
                      return lhs.second > rhs.second;
                  }
                  return lhs.first < rhs.first;
              });
    return ranked;
}

QStringList QueryExpander::analyze(const QString& text)
{
    static const QRegularExpression tokenPattern(
        QStringLiteral("\\b\\w\\w+\\b"),
        QRegularExpression::UseUnicodePropertiesOption);

    QStringList tokens;
    const QString lowered = text.toLower();
    auto it = tokenPattern.globalMatch(lowered);
    while (it.hasNext()) {
        const QString token = it.next().captured(0);
        if (!isStopWord(token)) {
            tokens.append(token);
        }
    }
    return tokens;
}

bool QueryExpander::isStopWord(const QString& token)
{
    return englishStopWords().contains(token);
}

} // namespace rc
