#include "Support/corpus_fixture.h"

#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

namespace rc::test {

Item makeItem(const QString& id,
              const QString& title,
              const QString& body,
              const QStringList& tags,
              const QString& type,
              double modifiedAt)
{
    Item item;
    item.id = id;
    item.title = title;
    item.body = body;
    item.tags = tags;
    item.metadata.type = type;
    item.modifiedAt = modifiedAt;
    return item;
}

bool writeItems(const QString& root, const std::vector<Item>& items)
{
    if (!QDir().mkpath(root)) {
        return false;
    }
    QJsonArray array;
    for (const Item& item : items) {
        array.append(item.toJson());
    }
    QJsonObject doc;
    doc[QStringLiteral("items")] = array;

    QFile file(QDir(root).filePath(QStringLiteral("items.json")));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    const QByteArray bytes = QJsonDocument(doc).toJson(QJsonDocument::Compact);
    return file.write(bytes) == bytes.size();
}

Corpus makeCorpus(const QString& name, const QString& root, const QString& storage)
{
    Corpus corpus;
    corpus.name = name;
    corpus.rootPath = root;
    corpus.storagePath = storage;
    return corpus;
}

QStringList listFiles(const QString& dir)
{
    QStringList files = QDir(dir).entryList(QDir::Files | QDir::Hidden, QDir::Name);
    return files;
}

} // namespace rc::test
