#include "core/models/model_session.h"
#include "core/shared/logging.h"

#include <QFile>

#include <onnxruntime_cxx_api.h>

#include <algorithm>

namespace rc {

namespace {

Ort::Env& ortEnvironment()
{
    static Ort::Env env(ORT_LOGGING_LEVEL_WARNING, "recollect-models");
    return env;
}

bool contains(const std::vector<std::string>& names, const char* name)
{
    return std::find(names.begin(), names.end(), std::string(name)) != names.end();
}

} // anonymous namespace

class ModelSession::Impl {
public:
    Ort::SessionOptions sessionOptions;
    std::unique_ptr<Ort::Session> session;
};

ModelSession::ModelSession(const ModelSpec& spec)
    : m_impl(std::make_unique<Impl>())
    , m_spec(spec)
{
}

ModelSession::~ModelSession() = default;

bool ModelSession::initialize()
{
    if (m_spec.modelPath.isEmpty() || !QFile::exists(m_spec.modelPath)) {
        LOG_WARN(rcModels, "ModelSession: model file missing at %s",
                 qUtf8Printable(m_spec.modelPath));
        m_available = false;
        return false;
    }

    try {
        m_impl->sessionOptions.SetIntraOpNumThreads(std::max(1, m_spec.intraOpThreads));
        m_impl->sessionOptions.SetInterOpNumThreads(1);
        m_impl->sessionOptions.SetExecutionMode(ExecutionMode::ORT_SEQUENTIAL);
        m_impl->sessionOptions.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

        m_impl->session = std::make_unique<Ort::Session>(
            ortEnvironment(), m_spec.modelPath.toUtf8().constData(), m_impl->sessionOptions);

        Ort::AllocatorWithDefaultOptions allocator;
        const size_t inputCount = m_impl->session->GetInputCount();
        m_inputNames.clear();
        m_inputNames.reserve(inputCount);
        for (size_t i = 0; i < inputCount; ++i) {
            Ort::AllocatedStringPtr inputName = m_impl->session->GetInputNameAllocated(i, allocator);
            if (inputName.get() != nullptr) {
                m_inputNames.emplace_back(inputName.get());
            }
        }

        for (const char* required : {"input_ids", "attention_mask"}) {
            if (!contains(m_inputNames, required)) {
                LOG_WARN(rcModels, "ModelSession: required input '%s' not found in model '%s'",
                         required, qUtf8Printable(m_spec.name));
                m_impl->session.reset();
                m_available = false;
                return false;
            }
        }

        const size_t outputCount = m_impl->session->GetOutputCount();
        m_outputNames.clear();
        m_outputNames.reserve(outputCount);
        for (size_t i = 0; i < outputCount; ++i) {
            Ort::AllocatedStringPtr outputName = m_impl->session->GetOutputNameAllocated(i, allocator);
            if (outputName.get() != nullptr && outputName.get()[0] != '\0') {
                m_outputNames.emplace_back(outputName.get());
            }
        }

        if (m_outputNames.empty()) {
            LOG_WARN(rcModels, "ModelSession: no output names found in model '%s'",
                     qUtf8Printable(m_spec.name));
            m_impl->session.reset();
            m_available = false;
            return false;
        }

        LOG_INFO(rcModels, "ModelSession: initialized '%s', %zu inputs, %zu outputs",
                 qUtf8Printable(m_spec.name), m_inputNames.size(), m_outputNames.size());

        m_available = true;
        return true;
    } catch (const Ort::Exception& ex) {
        LOG_WARN(rcModels, "ModelSession: ONNX initialization failed for '%s': %s",
                 qUtf8Printable(m_spec.name), ex.what());
    }

    m_impl->session.reset();
    m_available = false;
    return false;
}

bool ModelSession::isAvailable() const
{
    return m_available;
}

std::optional<ModelOutput> ModelSession::run(const EncodedBatch& batch) const
{
    if (!m_available || !m_impl->session || batch.isEmpty()) {
        return std::nullopt;
    }

    const int64_t inputShape[2] = {
        static_cast<int64_t>(batch.batchSize),
        static_cast<int64_t>(batch.seqLength),
    };

    try {
        Ort::MemoryInfo memoryInfo = Ort::MemoryInfo::CreateCpu(
            OrtAllocatorType::OrtArenaAllocator, OrtMemTypeDefault);

        std::vector<const char*> inputNames;
        std::vector<Ort::Value> inputTensors;
        auto addInput = [&](const char* name, const std::vector<int64_t>& values) {
            inputNames.push_back(name);
            inputTensors.push_back(Ort::Value::CreateTensor<int64_t>(
                memoryInfo,
                const_cast<int64_t*>(values.data()),
                values.size(),
                inputShape, 2));
        };

        addInput("input_ids", batch.inputIds);
        addInput("attention_mask", batch.attentionMask);
        if (contains(m_inputNames, "token_type_ids")) {
            addInput("token_type_ids", batch.tokenTypeIds);
        }

        const char* outputNames[1] = {m_outputNames.front().c_str()};

        std::vector<Ort::Value> outputs = m_impl->session->Run(
            Ort::RunOptions{nullptr},
            inputNames.data(), inputTensors.data(), inputTensors.size(),
            outputNames, 1);

        if (outputs.empty() || !outputs[0].IsTensor()) {
            LOG_WARN(rcModels, "ModelSession '%s': missing tensor output",
                     qUtf8Printable(m_spec.name));
            return std::nullopt;
        }

        Ort::TensorTypeAndShapeInfo info = outputs[0].GetTensorTypeAndShapeInfo();
        const float* data = outputs[0].GetTensorData<float>();
        if (!data) {
            return std::nullopt;
        }

        ModelOutput output;
        output.shape = info.GetShape();
        output.data.assign(data, data + info.GetElementCount());
        return output;
    } catch (const Ort::Exception& ex) {
        LOG_WARN(rcModels, "ModelSession '%s' inference failed: %s",
                 qUtf8Printable(m_spec.name), ex.what());
        return std::nullopt;
    }
}

const ModelSpec& ModelSession::spec() const
{
    return m_spec;
}

const std::vector<std::string>& ModelSession::inputNames() const
{
    return m_inputNames;
}

const std::vector<std::string>& ModelSession::outputNames() const
{
    return m_outputNames;
}

} // namespace rc
