#pragma once

#include "core/corpus/corpus.h"
#include "core/shared/types.h"

#include <QString>
#include <QStringList>
#include <vector>

namespace rc::test {

Item makeItem(const QString& id,
              const QString& title,
              const QString& body,
              const QStringList& tags = {},
              const QString& type = {},
              double modifiedAt = 0.0);

// Writes <root>/items.json as {"items": [...]}.
bool writeItems(const QString& root, const std::vector<Item>& items);

Corpus makeCorpus(const QString& name, const QString& root, const QString& storage);

// Files directly inside dir, sorted; used to assert that nothing was written.
QStringList listFiles(const QString& dir);

} // namespace rc::test
