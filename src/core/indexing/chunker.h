#pragma once

#include "core/shared/chunk.h"

#include <QString>
#include <optional>
#include <vector>

namespace rc {

// Configuration for the Chunker.
// Defined outside the class to avoid the "default member initializer needed
// within enclosing class" issue in C++.
struct ChunkerConfig {
    int threshold = 4000;   // bodies longer than this are split
    int chunkSize = 2000;
    int overlap = 400;
};

// Chunker: splits oversized item bodies into overlapping windows before
// embedding and lexical indexing.
//
// Windows of chunkSize characters advance by (chunkSize - overlap). When the
// text remaining past a window is shorter than overlap it is absorbed into
// that window instead of forming a near-empty trailing fragment. Adjacent
// chunks therefore share at least `overlap` characters, so any substring of
// length <= overlap lies entirely inside some chunk.
class Chunker {
public:
    using Config = ChunkerConfig;

    // Rejects chunkSize <= 0, overlap < 0, overlap >= chunkSize, threshold < 0.
    static std::optional<Chunker> create(const Config& config, QString* error = nullptr);
    static bool validate(const Config& config, QString* error = nullptr);

    bool shouldChunk(const QString& body) const;

    // Empty body -> no chunks. Body at or below the threshold -> exactly one
    // chunk spanning the body, keyed by the parent id itself.
    std::vector<Chunk> chunk(const QString& parentId, const QString& parentTitle,
                             const QString& body) const;

    const Config& config() const { return m_config; }

private:
    explicit Chunker(const Config& config);

    Config m_config;
};

} // namespace rc
