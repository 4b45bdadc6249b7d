#pragma once

#include <QJsonObject>
#include <QString>
#include <vector>

namespace rc {

// Files for one ONNX model. Empty modelPath disables the model.
struct ModelSettings {
    QString modelPath;
    QString vocabPath;
    QString modelId;
    int dimensions = 0;
    QString queryPrefix;
    int maxSequenceLength = 512;
    int intraOpThreads = 2;

    bool isConfigured() const { return !modelPath.isEmpty() && !vocabPath.isEmpty(); }
};

struct CorpusSettings {
    QString name;
    QString root;
    QString storage;        // empty: derived from root
};

struct Settings {
    // Corpora
    QString defaultCorpusRoot;
    QString defaultStoragePath;
    QString defaultCorpus = QStringLiteral("default");
    std::vector<CorpusSettings> corpora;

    // Models
    ModelSettings embeddingModel;
    ModelSettings crossEncoderModel;

    // Indexing
    int chunkThreshold = 4000;
    int chunkSize = 2000;
    int chunkOverlap = 400;

    // Query serving
    int clientCacheSize = 3;
    int defaultLimit = 10;
    int maxLimit = 100;
    int queryThreads = 4;
    int stageThreads = 8;
    int queueLimit = 64;
    int retrievalDepth = 100;
    int rerankTopN = 100;

    // Stage timeouts (ms)
    int lexicalTimeoutMs = 2000;
    int embeddingTimeoutMs = 3000;
    int vectorTimeoutMs = 2000;
    int rerankTimeoutMs = 5000;

    // name -> profile object, validated when profiles are registered
    QJsonObject customProfiles;
};

} // namespace rc
