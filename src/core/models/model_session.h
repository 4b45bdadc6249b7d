#pragma once

#include "core/models/tokenizer.h"

#include <QString>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rc {

// Files and shape information for one ONNX model, as configured in settings.
struct ModelSpec {
    QString name;               // "embedding", "cross-encoder"
    QString modelPath;
    QString vocabPath;
    QString modelId;            // recorded in index metadata
    int dimensions = 0;         // embedding width; unused for cross-encoders
    QString queryPrefix;        // prepended to queries by asymmetric bi-encoders
    int maxSequenceLength = 512;
    int intraOpThreads = 2;
};

struct ModelOutput {
    std::vector<float> data;
    std::vector<int64_t> shape;
};

// ModelSession: owns one ONNX Runtime session for a BERT-style model.
// Run() is safe to call from several threads at once.
class ModelSession {
public:
    explicit ModelSession(const ModelSpec& spec);
    ~ModelSession();

    ModelSession(const ModelSession&) = delete;
    ModelSession& operator=(const ModelSession&) = delete;
    ModelSession(ModelSession&&) = delete;
    ModelSession& operator=(ModelSession&&) = delete;

    bool initialize();
    bool isAvailable() const;

    // Feeds input_ids, attention_mask and (when the model declares it)
    // token_type_ids; returns the first output tensor.
    std::optional<ModelOutput> run(const EncodedBatch& batch) const;

    const ModelSpec& spec() const;
    const std::vector<std::string>& inputNames() const;
    const std::vector<std::string>& outputNames() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;

    ModelSpec m_spec;
    std::vector<std::string> m_inputNames;
    std::vector<std::string> m_outputNames;
    bool m_available = false;
};

} // namespace rc
