#pragma once

#include "core/shared/types.h"

#include <QString>
#include <optional>
#include <vector>

namespace rc {

// Supplies the current set of structured items for a corpus root. Parsing
// raw notes into items happens upstream of this interface.
class ItemSource {
public:
    virtual ~ItemSource() = default;

    virtual std::optional<std::vector<Item>> loadItems(const QString& corpusRoot,
                                                       QString* error = nullptr) = 0;
};

// Reads <root>/items.json: either an array of items or {"items": [...]}.
// Malformed entries are skipped with a warning; a duplicate id keeps the
// first occurrence.
class JsonItemSource : public ItemSource {
public:
    explicit JsonItemSource(const QString& fileName = QStringLiteral("items.json"));

    std::optional<std::vector<Item>> loadItems(const QString& corpusRoot,
                                               QString* error = nullptr) override;

private:
    QString m_fileName;
};

} // namespace rc
