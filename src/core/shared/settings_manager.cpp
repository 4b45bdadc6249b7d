#include "core/shared/settings_manager.h"
#include "core/indexing/chunker.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>
#include <QSet>
#include <QStandardPaths>

namespace rc {

namespace {

QString expandHome(const QString& path)
{
    if (path == QLatin1String("~")) {
        return QDir::homePath();
    }
    if (path.startsWith(QLatin1String("~/"))) {
        return QDir::homePath() + path.mid(1);
    }
    return path;
}

QJsonObject modelToJson(const ModelSettings& model)
{
    QJsonObject json;
    json.insert(QStringLiteral("modelPath"), model.modelPath);
    json.insert(QStringLiteral("vocabPath"), model.vocabPath);
    json.insert(QStringLiteral("modelId"), model.modelId);
    json.insert(QStringLiteral("dimensions"), model.dimensions);
    json.insert(QStringLiteral("queryPrefix"), model.queryPrefix);
    json.insert(QStringLiteral("maxSequenceLength"), model.maxSequenceLength);
    json.insert(QStringLiteral("intraOpThreads"), model.intraOpThreads);
    return json;
}

ModelSettings modelFromJson(const QJsonObject& json)
{
    ModelSettings model;
    model.modelPath = expandHome(json.value(QStringLiteral("modelPath")).toString());
    model.vocabPath = expandHome(json.value(QStringLiteral("vocabPath")).toString());
    model.modelId = json.value(QStringLiteral("modelId")).toString();
    if (model.modelId.isEmpty() && !model.modelPath.isEmpty()) {
        model.modelId = QFileInfo(model.modelPath).completeBaseName();
    }
    model.dimensions = json.value(QStringLiteral("dimensions")).toInt(model.dimensions);
    model.queryPrefix = json.value(QStringLiteral("queryPrefix")).toString();
    model.maxSequenceLength = json.value(QStringLiteral("maxSequenceLength")).toInt(model.maxSequenceLength);
    model.intraOpThreads = json.value(QStringLiteral("intraOpThreads")).toInt(model.intraOpThreads);
    return model;
}

void readInt(const QJsonObject& json, const char* key, int* out)
{
    const QString name = QString::fromLatin1(key);
    if (json.contains(name)) {
        *out = json.value(name).toInt(*out);
    }
}

} // namespace

std::optional<Settings> SettingsManager::load(QString* error)
{
    const QString filePath = settingsFilePath();
    if (filePath.isEmpty()) {
        LOG_INFO(rcCore, "No settings file found; using defaults");
        return defaults();
    }
    return loadFrom(filePath, error);
}

std::optional<Settings> SettingsManager::loadFrom(const QString& filePath, QString* error)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error) {
            *error = QStringLiteral("Failed to open settings file %1: %2")
                         .arg(filePath, file.errorString());
        }
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (error) {
            *error = QStringLiteral("Failed to parse settings JSON (%1): %2")
                         .arg(filePath, parseError.errorString());
        }
        return std::nullopt;
    }

    auto settings = fromJson(doc.object(), error);
    if (settings) {
        LOG_INFO(rcCore, "Loaded settings from %s", qUtf8Printable(filePath));
    }
    return settings;
}

bool SettingsManager::save(const Settings& settings, const QString& filePath)
{
    const QString parentDir = QFileInfo(filePath).absolutePath();
    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(rcCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        LOG_ERROR(rcCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }
    file.write(QJsonDocument(toJson(settings)).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        LOG_ERROR(rcCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }
    return true;
}

QStringList SettingsManager::searchPaths()
{
    QStringList paths;
    const QString envPath = qEnvironmentVariable("RECOLLECT_CONFIG_PATH").trimmed();
    if (!envPath.isEmpty()) {
        paths.append(expandHome(envPath));
    }
    const QString configBase = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
    if (!configBase.isEmpty()) {
        paths.append(configBase + QStringLiteral("/recollect/config.json"));
    }
    paths.append(QDir::homePath() + QStringLiteral("/.recollect.json"));
    paths.append(QDir::current().filePath(QStringLiteral("config.json")));
    return paths;
}

QString SettingsManager::settingsFilePath()
{
    for (const QString& path : searchPaths()) {
        if (QFileInfo(path).isFile()) {
            return path;
        }
    }
    return {};
}

Settings SettingsManager::defaults()
{
    Settings settings;
    settings.defaultCorpusRoot = QDir::homePath() + QStringLiteral("/notes");
    settings.defaultStoragePath =
        QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation)
        + QStringLiteral("/recollect");
    return settings;
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("defaultCorpusRoot"), settings.defaultCorpusRoot);
    json.insert(QStringLiteral("defaultStoragePath"), settings.defaultStoragePath);
    json.insert(QStringLiteral("defaultCorpus"), settings.defaultCorpus);

    QJsonArray corpora;
    for (const CorpusSettings& corpus : settings.corpora) {
        QJsonObject entry;
        entry.insert(QStringLiteral("name"), corpus.name);
        entry.insert(QStringLiteral("root"), corpus.root);
        if (!corpus.storage.isEmpty()) {
            entry.insert(QStringLiteral("storage"), corpus.storage);
        }
        corpora.append(entry);
    }
    json.insert(QStringLiteral("corpora"), corpora);

    json.insert(QStringLiteral("embeddingModel"), modelToJson(settings.embeddingModel));
    json.insert(QStringLiteral("crossEncoderModel"), modelToJson(settings.crossEncoderModel));

    json.insert(QStringLiteral("chunkThreshold"), settings.chunkThreshold);
    json.insert(QStringLiteral("chunkSize"), settings.chunkSize);
    json.insert(QStringLiteral("chunkOverlap"), settings.chunkOverlap);

    json.insert(QStringLiteral("clientCacheSize"), settings.clientCacheSize);
    json.insert(QStringLiteral("defaultLimit"), settings.defaultLimit);
    json.insert(QStringLiteral("maxLimit"), settings.maxLimit);
    json.insert(QStringLiteral("queryThreads"), settings.queryThreads);
    json.insert(QStringLiteral("stageThreads"), settings.stageThreads);
    json.insert(QStringLiteral("queueLimit"), settings.queueLimit);
    json.insert(QStringLiteral("retrievalDepth"), settings.retrievalDepth);
    json.insert(QStringLiteral("rerankTopN"), settings.rerankTopN);

    json.insert(QStringLiteral("lexicalTimeoutMs"), settings.lexicalTimeoutMs);
    json.insert(QStringLiteral("embeddingTimeoutMs"), settings.embeddingTimeoutMs);
    json.insert(QStringLiteral("vectorTimeoutMs"), settings.vectorTimeoutMs);
    json.insert(QStringLiteral("rerankTimeoutMs"), settings.rerankTimeoutMs);

    json.insert(QStringLiteral("profiles"), settings.customProfiles);
    return json;
}

std::optional<Settings> SettingsManager::fromJson(const QJsonObject& json, QString* error)
{
    Settings settings = defaults();

    settings.defaultCorpusRoot = expandHome(
        json.value(QStringLiteral("defaultCorpusRoot")).toString(settings.defaultCorpusRoot));
    settings.defaultStoragePath = expandHome(
        json.value(QStringLiteral("defaultStoragePath")).toString(settings.defaultStoragePath));
    settings.defaultCorpus = json.value(QStringLiteral("defaultCorpus")).toString(settings.defaultCorpus);

    const QJsonArray corporaArray = json.value(QStringLiteral("corpora")).toArray();
    settings.corpora.reserve(static_cast<size_t>(corporaArray.size()));
    for (const QJsonValue& value : corporaArray) {
        const QJsonObject entry = value.toObject();
        CorpusSettings corpus;
        corpus.name = entry.value(QStringLiteral("name")).toString().trimmed();
        corpus.root = expandHome(entry.value(QStringLiteral("root")).toString());
        corpus.storage = expandHome(entry.value(QStringLiteral("storage")).toString());
        settings.corpora.push_back(corpus);
    }

    settings.embeddingModel = modelFromJson(json.value(QStringLiteral("embeddingModel")).toObject());
    settings.crossEncoderModel = modelFromJson(json.value(QStringLiteral("crossEncoderModel")).toObject());

    readInt(json, "chunkThreshold", &settings.chunkThreshold);
    readInt(json, "chunkSize", &settings.chunkSize);
    readInt(json, "chunkOverlap", &settings.chunkOverlap);

    readInt(json, "clientCacheSize", &settings.clientCacheSize);
    readInt(json, "defaultLimit", &settings.defaultLimit);
    readInt(json, "maxLimit", &settings.maxLimit);
    readInt(json, "queryThreads", &settings.queryThreads);
    readInt(json, "stageThreads", &settings.stageThreads);
    readInt(json, "queueLimit", &settings.queueLimit);
    readInt(json, "retrievalDepth", &settings.retrievalDepth);
    readInt(json, "rerankTopN", &settings.rerankTopN);

    readInt(json, "lexicalTimeoutMs", &settings.lexicalTimeoutMs);
    readInt(json, "embeddingTimeoutMs", &settings.embeddingTimeoutMs);
    readInt(json, "vectorTimeoutMs", &settings.vectorTimeoutMs);
    readInt(json, "rerankTimeoutMs", &settings.rerankTimeoutMs);

    settings.customProfiles = json.value(QStringLiteral("profiles")).toObject();

    if (!validate(settings, error)) {
        return std::nullopt;
    }
    return settings;
}

bool SettingsManager::validate(const Settings& settings, QString* error)
{
    auto fail = [error](const QString& message) {
        if (error) {
            *error = QStringLiteral("Invalid settings: %1").arg(message);
        }
        return false;
    };

    ChunkerConfig chunking;
    chunking.threshold = settings.chunkThreshold;
    chunking.chunkSize = settings.chunkSize;
    chunking.overlap = settings.chunkOverlap;
    QString chunkError;
    if (!Chunker::validate(chunking, &chunkError)) {
        return fail(chunkError);
    }

    if (settings.clientCacheSize < 1) {
        return fail(QStringLiteral("clientCacheSize must be >= 1"));
    }
    if (settings.maxLimit < 1 || settings.defaultLimit < 1
        || settings.defaultLimit > settings.maxLimit) {
        return fail(QStringLiteral("need 1 <= defaultLimit <= maxLimit"));
    }
    if (settings.queryThreads < 1 || settings.stageThreads < 1 || settings.queueLimit < 1) {
        return fail(QStringLiteral("thread counts and queueLimit must be >= 1"));
    }
    if (settings.retrievalDepth < 1 || settings.rerankTopN < 1) {
        return fail(QStringLiteral("retrievalDepth and rerankTopN must be >= 1"));
    }
    if (settings.lexicalTimeoutMs < 1 || settings.embeddingTimeoutMs < 1
        || settings.vectorTimeoutMs < 1 || settings.rerankTimeoutMs < 1) {
        return fail(QStringLiteral("stage timeouts must be >= 1 ms"));
    }

    QSet<QString> names;
    for (const CorpusSettings& corpus : settings.corpora) {
        if (corpus.name.isEmpty() || corpus.root.isEmpty()) {
            return fail(QStringLiteral("every corpus needs a name and a root"));
        }
        if (names.contains(corpus.name)) {
            return fail(QStringLiteral("duplicate corpus '%1'").arg(corpus.name));
        }
        names.insert(corpus.name);
    }
    return true;
}

} // namespace rc
