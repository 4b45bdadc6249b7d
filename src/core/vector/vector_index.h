#pragma once

#include "core/shared/chunk.h"

#include <QString>
#include <memory>
#include <mutex>
#include <vector>

namespace hnswlib {
class InnerProductSpace;

template <typename dist_t>
class BruteforceSearch;
} // namespace hnswlib

namespace rc {

struct VectorHit {
    DocumentRef doc;
    float similarity = 0.0f;    // cosine similarity in [-1, 1]
};

// VectorIndex: exact cosine search over precomputed document embeddings.
// Vectors are L2-normalized on insert so the inner-product space yields
// cosine similarity (hnswlib distance = 1 - dot). Labels are insertion
// ordinals; the label -> document mapping lives in the JSON sidecar.
class VectorIndex {
public:
    struct IndexMetadata {
        int schemaVersion = 1;
        int dimensions = 0;
        QString modelId = QStringLiteral("unknown");
        QString buildId;            // pairs the file with its lexical database
    };

    VectorIndex();
    explicit VectorIndex(const IndexMetadata& metadata);
    ~VectorIndex();

    VectorIndex(const VectorIndex&) = delete;
    VectorIndex& operator=(const VectorIndex&) = delete;

    bool create(int capacity);
    bool load(const QString& indexPath, const QString& metaPath);
    bool save(const QString& indexPath, const QString& metaPath) const;

    // Rejects vectors of the wrong dimension or zero norm.
    bool add(const DocumentRef& doc, const std::vector<float>& embedding);

    // Results sorted by similarity desc. limit is clamped to the index size.
    std::vector<VectorHit> query(const std::vector<float>& embedding, int limit) const;

    // Drops the loaded vectors; the index becomes unavailable.
    void release();

    int size() const;
    bool isAvailable() const;
    int dimensions() const;
    const IndexMetadata& metadata() const;

    static bool normalize(std::vector<float>& vec);

private:
    IndexMetadata m_metadata;
    std::unique_ptr<hnswlib::InnerProductSpace> m_space;
    std::unique_ptr<hnswlib::BruteforceSearch<float>> m_index;
    std::vector<DocumentRef> m_documents;
    size_t m_capacity = 0;
    mutable std::mutex m_mutex;
};

} // namespace rc
