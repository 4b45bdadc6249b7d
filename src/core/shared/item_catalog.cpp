#include "core/shared/item_catalog.h"

namespace rc {

ItemCatalog::ItemCatalog(std::vector<Item> items)
{
    m_items.reserve(items.size());
    for (Item& item : items) {
        const QString id = item.id;
        m_byId.insert(id, static_cast<int>(m_items.size()));
        m_items.push_back(std::make_shared<const Item>(std::move(item)));
    }
}

std::shared_ptr<const Item> ItemCatalog::find(const QString& id) const
{
    const auto it = m_byId.constFind(id);
    if (it == m_byId.constEnd()) {
        return nullptr;
    }
    return m_items[static_cast<size_t>(it.value())];
}

} // namespace rc
