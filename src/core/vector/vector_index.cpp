#include "core/vector/vector_index.h"
#include "core/shared/logging.h"

#include <hnswlib/hnswlib.h>

#include <QDateTime>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>

#include <algorithm>
#include <cmath>

namespace rc {

namespace {

constexpr int kMetaVersion = 1;

QJsonObject documentToJson(const DocumentRef& doc)
{
    QJsonObject json;
    json[QStringLiteral("doc_id")] = doc.docId;
    json[QStringLiteral("parent_id")] = doc.parentId;
    json[QStringLiteral("chunk_index")] = doc.chunkIndex;
    json[QStringLiteral("chunk_total")] = doc.chunkTotal;
    json[QStringLiteral("start")] = static_cast<qint64>(doc.startOffset);
    json[QStringLiteral("end")] = static_cast<qint64>(doc.endOffset);
    return json;
}

DocumentRef documentFromJson(const QJsonObject& json)
{
    DocumentRef doc;
    doc.docId = json.value(QStringLiteral("doc_id")).toString();
    doc.parentId = json.value(QStringLiteral("parent_id")).toString();
    doc.chunkIndex = json.value(QStringLiteral("chunk_index")).toInt(0);
    doc.chunkTotal = json.value(QStringLiteral("chunk_total")).toInt(1);
    doc.startOffset = static_cast<qsizetype>(json.value(QStringLiteral("start")).toInteger());
    doc.endOffset = static_cast<qsizetype>(json.value(QStringLiteral("end")).toInteger());
    return doc;
}

} // namespace

VectorIndex::VectorIndex()
{
}

VectorIndex::VectorIndex(const IndexMetadata& metadata)
    : m_metadata(metadata)
{
}

VectorIndex::~VectorIndex()
{
}

bool VectorIndex::normalize(std::vector<float>& vec)
{
    double norm = 0.0;
    for (float v : vec) {
        norm += static_cast<double>(v) * static_cast<double>(v);
    }
    norm = std::sqrt(norm);
    if (norm <= 0.0 || !std::isfinite(norm)) {
        return false;
    }
    for (float& v : vec) {
        v = static_cast<float>(v / norm);
    }
    return true;
}

bool VectorIndex::create(int capacity)
{
    if (m_metadata.dimensions <= 0) {
        LOG_ERROR(rcIndex, "VectorIndex::create requires a positive dimension");
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    try {
        m_capacity = static_cast<size_t>(std::max(capacity, 1));
        m_space = std::make_unique<hnswlib::InnerProductSpace>(
            static_cast<size_t>(m_metadata.dimensions));
        m_index = std::make_unique<hnswlib::BruteforceSearch<float>>(m_space.get(), m_capacity);
        m_documents.clear();
        m_documents.reserve(m_capacity);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(rcIndex, "VectorIndex::create failed: %s", e.what());
        m_index.reset();
        m_space.reset();
        return false;
    }
}

bool VectorIndex::load(const QString& indexPath, const QString& metaPath)
{
    QFileInfo indexInfo(indexPath);
    if (!indexInfo.exists() || !indexInfo.isFile()) {
        LOG_WARN(rcIndex, "VectorIndex::load missing index file: %s", qUtf8Printable(indexPath));
        return false;
    }

    QFile metaFile(metaPath);
    if (!metaFile.open(QIODevice::ReadOnly)) {
        LOG_ERROR(rcIndex, "VectorIndex::load failed to open meta file: %s",
                  qUtf8Printable(metaPath));
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument metaDoc = QJsonDocument::fromJson(metaFile.readAll(), &parseError);
    metaFile.close();
    if (parseError.error != QJsonParseError::NoError || !metaDoc.isObject()) {
        LOG_ERROR(rcIndex, "VectorIndex::load invalid meta JSON: %s",
                  qUtf8Printable(parseError.errorString()));
        return false;
    }

    const QJsonObject meta = metaDoc.object();
    const int dimensions = meta.value(QStringLiteral("dimensions")).toInt(-1);
    if (dimensions <= 0) {
        LOG_ERROR(rcIndex, "VectorIndex::load missing/invalid dimensions in metadata");
        return false;
    }
    if (m_metadata.dimensions > 0 && dimensions != m_metadata.dimensions) {
        LOG_ERROR(rcIndex, "VectorIndex::load dimension mismatch: %d expected %d",
                  dimensions, m_metadata.dimensions);
        return false;
    }

    std::vector<DocumentRef> documents;
    const QJsonArray docArray = meta.value(QStringLiteral("documents")).toArray();
    documents.reserve(static_cast<size_t>(docArray.size()));
    for (const QJsonValue& value : docArray) {
        documents.push_back(documentFromJson(value.toObject()));
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    try {
        m_metadata.dimensions = dimensions;
        m_metadata.schemaVersion = meta.value(QStringLiteral("version")).toInt(kMetaVersion);
        m_metadata.modelId = meta.value(QStringLiteral("model_id")).toString(QStringLiteral("unknown"));
        m_metadata.buildId = meta.value(QStringLiteral("build_id")).toString();

        m_space = std::make_unique<hnswlib::InnerProductSpace>(static_cast<size_t>(dimensions));
        m_index = std::make_unique<hnswlib::BruteforceSearch<float>>(
            m_space.get(), indexPath.toStdString());
    } catch (const std::exception& e) {
        LOG_ERROR(rcIndex, "VectorIndex::load failed: %s", e.what());
        m_index.reset();
        m_space.reset();
        return false;
    }

    if (m_index->cur_element_count != documents.size()) {
        LOG_ERROR(rcIndex, "VectorIndex::load element count %d does not match %d documents",
                  static_cast<int>(m_index->cur_element_count),
                  static_cast<int>(documents.size()));
        m_index.reset();
        m_space.reset();
        return false;
    }

    m_capacity = m_index->maxelements_;
    m_documents = std::move(documents);
    LOG_INFO(rcIndex, "Vector index loaded: %d vectors, %d dims, model %s",
             static_cast<int>(m_documents.size()), dimensions,
             qUtf8Printable(m_metadata.modelId));
    return true;
}

bool VectorIndex::save(const QString& indexPath, const QString& metaPath) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_index) {
        LOG_WARN(rcIndex, "VectorIndex::save called with unavailable index");
        return false;
    }

    try {
        m_index->saveIndex(indexPath.toStdString());
    } catch (const std::exception& e) {
        LOG_ERROR(rcIndex, "VectorIndex::save failed to persist index: %s", e.what());
        return false;
    }

    QJsonArray docArray;
    for (const DocumentRef& doc : m_documents) {
        docArray.append(documentToJson(doc));
    }

    QJsonObject meta;
    meta.insert(QStringLiteral("version"), kMetaVersion);
    meta.insert(QStringLiteral("model_id"), m_metadata.modelId);
    meta.insert(QStringLiteral("dimensions"), m_metadata.dimensions);
    if (!m_metadata.buildId.isEmpty()) {
        meta.insert(QStringLiteral("build_id"), m_metadata.buildId);
    }
    meta.insert(QStringLiteral("total_elements"), static_cast<int>(m_documents.size()));
    meta.insert(QStringLiteral("documents"), docArray);
    meta.insert(QStringLiteral("last_persisted"),
                QDateTime::currentDateTimeUtc().toString(Qt::ISODate));

    QSaveFile metaFile(metaPath);
    if (!metaFile.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(rcIndex, "VectorIndex::save failed to open meta file for write: %s",
                  qUtf8Printable(metaPath));
        return false;
    }
    metaFile.write(QJsonDocument(meta).toJson(QJsonDocument::Compact));
    if (!metaFile.commit()) {
        LOG_ERROR(rcIndex, "VectorIndex::save failed writing meta file: %s",
                  qUtf8Printable(metaPath));
        return false;
    }
    return true;
}

bool VectorIndex::add(const DocumentRef& doc, const std::vector<float>& embedding)
{
    if (static_cast<int>(embedding.size()) != m_metadata.dimensions) {
        LOG_WARN(rcIndex, "VectorIndex::add rejected %s: %d dims, expected %d",
                 qUtf8Printable(doc.docId), static_cast<int>(embedding.size()),
                 m_metadata.dimensions);
        return false;
    }

    std::vector<float> normalized = embedding;
    if (!normalize(normalized)) {
        LOG_WARN(rcIndex, "VectorIndex::add rejected %s: zero-norm embedding",
                 qUtf8Printable(doc.docId));
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_index) {
        LOG_WARN(rcIndex, "VectorIndex::add called with unavailable index");
        return false;
    }

    try {
        if (m_documents.size() >= m_capacity) {
            // BruteforceSearch cannot grow in place; rebuild at double size.
            const size_t newCapacity = std::max<size_t>(m_capacity * 2, 16);
            auto grown = std::make_unique<hnswlib::BruteforceSearch<float>>(
                m_space.get(), newCapacity);
            // Labels are dense insertion ordinals, so label == internal slot.
            for (size_t label = 0; label < m_documents.size(); ++label) {
                grown->addPoint(m_index->data_ + m_index->size_per_element_ * label, label);
            }
            m_index = std::move(grown);
            m_capacity = newCapacity;
        }
        const auto label = static_cast<hnswlib::labeltype>(m_documents.size());
        m_index->addPoint(normalized.data(), label);
        m_documents.push_back(doc);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(rcIndex, "VectorIndex::add failed: %s", e.what());
        return false;
    }
}

std::vector<VectorHit> VectorIndex::query(const std::vector<float>& embedding, int limit) const
{
    std::vector<VectorHit> results;
    if (limit <= 0 || static_cast<int>(embedding.size()) != m_metadata.dimensions) {
        return results;
    }

    std::vector<float> normalized = embedding;
    if (!normalize(normalized)) {
        return results;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_index || m_documents.empty()) {
        return results;
    }

    const size_t k = std::min(static_cast<size_t>(limit), m_documents.size());
    try {
        auto queue = m_index->searchKnn(normalized.data(), k);
        results.reserve(queue.size());
        while (!queue.empty()) {
            const auto entry = queue.top();
            queue.pop();
            const size_t label = static_cast<size_t>(entry.second);
            if (label >= m_documents.size()) {
                continue;
            }
            results.push_back(VectorHit{m_documents[label], 1.0f - entry.first});
        }
    } catch (const std::exception& e) {
        LOG_ERROR(rcIndex, "VectorIndex::query failed: %s", e.what());
        return {};
    }

    std::stable_sort(results.begin(), results.end(), [](const VectorHit& a, const VectorHit& b) {
        if (a.similarity != b.similarity) {
            return a.similarity > b.similarity;
        }
        return a.doc.docId < b.doc.docId;
    });
    return results;
}

void VectorIndex::release()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_index.reset();
    m_space.reset();
    m_documents.clear();
    m_documents.shrink_to_fit();
    m_capacity = 0;
}

int VectorIndex::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<int>(m_documents.size());
}

bool VectorIndex::isAvailable() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index != nullptr;
}

int VectorIndex::dimensions() const
{
    return m_metadata.dimensions;
}

const VectorIndex::IndexMetadata& VectorIndex::metadata() const
{
    return m_metadata;
}

} // namespace rc
