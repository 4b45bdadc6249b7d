#pragma once

#include "core/shared/types.h"

#include <QHash>
#include <QString>
#include <memory>
#include <vector>

namespace rc {

// Immutable id -> item lookup for one index snapshot. Items are shared so
// candidates stay valid after the owning client is released.
class ItemCatalog {
public:
    ItemCatalog() = default;
    explicit ItemCatalog(std::vector<Item> items);

    std::shared_ptr<const Item> find(const QString& id) const;
    int size() const { return static_cast<int>(m_items.size()); }
    const std::vector<std::shared_ptr<const Item>>& items() const { return m_items; }

private:
    std::vector<std::shared_ptr<const Item>> m_items;
    QHash<QString, int> m_byId;
};

} // namespace rc
