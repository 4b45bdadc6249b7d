#include "core/indexing/chunker.h"
#include "core/shared/logging.h"

#include <algorithm>

namespace rc {

// ── Construction ────────────────────────────────────────────

Chunker::Chunker(const Config& config)
    : m_config(config)
{
}

bool Chunker::validate(const Config& config, QString* error)
{
    QString problem;
    if (config.chunkSize <= 0) {
        problem = QStringLiteral("chunk size must be positive (got %1)").arg(config.chunkSize);
    } else if (config.overlap < 0) {
        problem = QStringLiteral("chunk overlap must not be negative (got %1)").arg(config.overlap);
    } else if (config.overlap >= config.chunkSize) {
        problem = QStringLiteral("chunk overlap (%1) must be smaller than chunk size (%2)")
                      .arg(config.overlap)
                      .arg(config.chunkSize);
    } else if (config.threshold < 0) {
        problem = QStringLiteral("chunking threshold must not be negative (got %1)")
                      .arg(config.threshold);
    }

    if (problem.isEmpty()) {
        return true;
    }
    if (error) {
        *error = problem;
    }
    return false;
}

std::optional<Chunker> Chunker::create(const Config& config, QString* error)
{
    QString problem;
    if (!validate(config, &problem)) {
        LOG_ERROR(rcIndex, "Invalid chunker configuration: %s", qUtf8Printable(problem));
        if (error) {
            *error = problem;
        }
        return std::nullopt;
    }
    return Chunker(config);
}

// ── Public API ──────────────────────────────────────────────

bool Chunker::shouldChunk(const QString& body) const
{
    return body.size() > m_config.threshold;
}

std::vector<Chunk> Chunker::chunk(const QString& parentId, const QString& parentTitle,
                                  const QString& body) const
{
    std::vector<Chunk> chunks;

    if (body.isEmpty()) {
        return chunks;
    }

    if (!shouldChunk(body)) {
        Chunk whole;
        whole.chunkId = parentId;
        whole.parentId = parentId;
        whole.startOffset = 0;
        whole.endOffset = body.size();
        whole.title = parentTitle;
        whole.content = body;
        chunks.push_back(std::move(whole));
        return chunks;
    }

    const qsizetype length = body.size();
    const qsizetype size = m_config.chunkSize;
    const qsizetype step = size - m_config.overlap;

    qsizetype start = 0;
    while (true) {
        qsizetype end = std::min(start + size, length);

        // Fold a short trailing remainder into this window.
        if (end < length && length - end < m_config.overlap) {
            end = length;
        }

        Chunk c;
        c.parentId = parentId;
        c.chunkIndex = static_cast<int>(chunks.size());
        c.startOffset = start;
        c.endOffset = end;
        c.content = body.mid(start, end - start);
        chunks.push_back(std::move(c));

        if (end >= length) {
            break;
        }
        start += step;
    }

    const int total = static_cast<int>(chunks.size());
    for (Chunk& c : chunks) {
        c.chunkTotal = total;
        c.chunkId = computeChunkId(parentId, c.chunkIndex);
        c.title = chunkTitle(parentTitle, c.chunkIndex, total);
    }

    LOG_DEBUG(rcIndex, "Chunked %s: %d chunks from %d chars",
              qUtf8Printable(parentId), total, static_cast<int>(length));

    return chunks;
}

} // namespace rc
