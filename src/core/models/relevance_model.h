#pragma once

#include <QString>

#include <optional>
#include <vector>

namespace rc {

// Joint (query, passage) relevance scorer. Returns one score per passage,
// higher is more relevant, or nullopt when the model call failed.
class RelevanceModel {
public:
    virtual ~RelevanceModel() = default;

    virtual bool isAvailable() const = 0;
    virtual std::optional<std::vector<float>> score(const QString& query,
                                                    const std::vector<QString>& passages) = 0;
};

} // namespace rc
