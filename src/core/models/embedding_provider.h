#pragma once

#include <QString>

#include <optional>
#include <vector>

namespace rc {

// Text -> fixed-length vector. Implementations must be callable from several
// worker threads at once. A nullopt result means the service failed; callers
// degrade instead of erroring.
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    virtual bool isAvailable() const = 0;
    virtual QString modelId() const = 0;
    virtual int dimensions() const = 0;

    virtual std::optional<std::vector<float>> embedQuery(const QString& text) = 0;
    virtual std::optional<std::vector<std::vector<float>>> embedDocuments(
        const std::vector<QString>& texts) = 0;
};

} // namespace rc
