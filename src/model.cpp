#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "CharNER/model.hpp"

using namespace charner;

OnnxModel::OnnxModel(const std::string& path, const Config& config)
    : modelPath(path), config(config)
{
    try {
        env = new Ort::Env(ORT_LOGGING_LEVEL_WARNING, "charner");
        sessionOptions = new Ort::SessionOptions();
        session = new Ort::Session(*env, modelPath.c_str(), *sessionOptions);
    } catch (...) {
        release();
        throw;
    }
    initialize();
}

OnnxModel::OnnxModel(const std::string& path, const Config& config, const int device_id)
    : modelPath(path), config(config)
{
    try {
        env = new Ort::Env(ORT_LOGGING_LEVEL_WARNING, "charner");
        sessionOptions = new Ort::SessionOptions();
        useDevice(sessionOptions, device_id);
        session = new Ort::Session(*env, modelPath.c_str(), *sessionOptions);
    } catch (...) {
        release();
        throw;
    }
    initialize();
}

OnnxModel::OnnxModel(
    const std::string& path, const Config& config, const Ort::Env& env, const Ort::SessionOptions& session_options
) : modelPath(path), config(config)
{
    session = new Ort::Session(env, modelPath.c_str(), session_options);
    initialize();
}

OnnxModel::~OnnxModel() {
    release();
}

void OnnxModel::release() {
    delete session;
    session = nullptr;
    delete sessionOptions;
    sessionOptions = nullptr;
    delete env;
    env = nullptr;
}

void OnnxModel::initialize() {
    switch (config.inputFormat) {
    case CHAR_IDS:
        inputNames = {"char_ids", "text_lengths"};
        outputNames = {"probs"};
        break;
    case BERT:
        inputNames = {"input_ids", "attention_mask", "token_type_ids"};
        outputNames = {"probs"};
        break;
    }
    spdlog::info("[CharNER] Loaded ONNX model from {} ({} inputs)", modelPath, inputNames.size());
}

void OnnxModel::useDevice(Ort::SessionOptions* session_options, const int device_id) {
    if (device_id >= 0) {
        OrtCUDAProviderOptions cuda_options;
        cuda_options.device_id = device_id;
        session_options->AppendExecutionProvider_CUDA(cuda_options);
    }
}

int64_t OnnxModel::count_total_elements(const std::vector<int64_t>& output_shape) {
    int64_t total_elements = 1;
    for (int64_t i : output_shape) {
        total_elements *= i;
    }
    return total_elements;
}

void OnnxModel::softmaxRow(float* row, int64_t n) {
    if (n <= 0) return;
    float m = row[0];
    for (int64_t i = 1; i < n; ++i) m = std::max(m, row[i]);
    double sum = 0.0;
    for (int64_t i = 0; i < n; ++i) {
        row[i] = std::exp(row[i] - m);
        sum += row[i];
    }
    for (int64_t i = 0; i < n; ++i) row[i] = float(row[i] / sum);
}

void OnnxModel::run(
    const std::vector<Ort::Value>& input_tensors, std::vector<float>& output, std::vector<int64_t>& output_shape
) {
    std::vector<Ort::Value> modelOutputs = session->Run(
        Ort::RunOptions(), inputNames.data(),
        input_tensors.data(), inputNames.size(),
        outputNames.data(), outputNames.size()
    );
    Ort::Value& output_tensor = modelOutputs[0];
    Ort::TensorTypeAndShapeInfo output_info = output_tensor.GetTensorTypeAndShapeInfo();
    output_shape = output_info.GetShape();

    const float* output_data = output_tensor.GetTensorData<float>();
    output = std::vector<float>(output_data, output_data + count_total_elements(output_shape));
}

std::vector<ProbabilityMatrix> OnnxModel::predict(Batch& batch) {
    Ort::MemoryInfo memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);

    std::vector<Ort::Value> input_tensors;
    batch.tensors(input_tensors, memory_info);

    std::vector<float> output;
    std::vector<int64_t> shape;
    run(input_tensors, output, shape);

    return sliceOutput(output, shape, batch, config.outputsLogits);
}

std::vector<ProbabilityMatrix> OnnxModel::sliceOutput(
    const std::vector<float>& output, const std::vector<int64_t>& shape, const Batch& batch, bool logits
) {
    if (shape.size() != 3) {
        throw std::runtime_error("Unexpected model output of rank " + std::to_string(shape.size()));
    }
    if (shape[0] != batch.batchSize) {
        throw std::runtime_error("Model output has " + std::to_string(shape[0]) + " items, expected " + std::to_string(batch.batchSize));
    }
    if (count_total_elements(shape) != static_cast<int64_t>(output.size())) {
        throw std::runtime_error("Model output size does not match its shape");
    }
    const int64_t positions = shape[1];
    const int64_t classes = shape[2];
    // rows past the characters ([SEP], padding) are dropped here, short outputs are kept short
    const int64_t rows = std::max<int64_t>(0, std::min(batch.numChars, positions - batch.leadingTokens));

    std::vector<ProbabilityMatrix> probs;
    probs.reserve(batch.batchSize);
    for (int64_t b = 0; b < batch.batchSize; ++b) {
        ProbabilityMatrix matrix(rows, classes);
        if (rows == 0) {
            probs.push_back(std::move(matrix));
            continue;
        }
        const float* src = output.data() + (b * positions + batch.leadingTokens) * classes;
        std::copy(src, src + rows * classes, matrix.data.begin());

        if (logits) {
            for (int64_t r = 0; r < rows; ++r) {
                softmaxRow(matrix.data.data() + r * classes, classes);
            }
        }
        probs.push_back(std::move(matrix));
    }
    return probs;
}
