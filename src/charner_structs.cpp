#include <utility>

#include "CharNER/charner_structs.hpp"

using namespace charner;

TextInput TextInput::tokenized(const CharSequence& chars) {
    TextInput input("");
    input.kind = TOKENIZED;
    input.chars = chars;
    return input;
}

ProbabilityMatrix::ProbabilityMatrix(int64_t rows, int64_t classes)
    : rows(rows), classes(classes), data(rows * classes, 0.0f) {}

ProbabilityMatrix::ProbabilityMatrix(int64_t rows, int64_t classes, std::vector<float> values)
    : rows(rows), classes(classes), data(std::move(values)) {
    if (static_cast<int64_t>(data.size()) != rows * classes) {
        throw std::invalid_argument(
            "Probability matrix of shape [" + std::to_string(rows) + ", " + std::to_string(classes) +
            "] cannot hold " + std::to_string(data.size()) + " values"
        );
    }
}

LabelVocabulary::LabelVocabulary(const std::vector<std::string>& labels) : idToLabel(labels) {
    for (size_t i = 0; i < labels.size(); ++i) {
        labelToId.emplace(labels[i], int64_t(i)); // first occurrence wins
    }
}

int64_t LabelVocabulary::id(const std::string& label) const {
    auto it = labelToId.find(label);
    if (it == labelToId.end()) {
        return -1;
    }
    return it->second;
}

Batch::~Batch() {};

void CharIdsBatch::tensors(std::vector<Ort::Value>& tensors, const Ort::MemoryInfo& memory_info) {
    tensors.push_back(Ort::Value::CreateTensor<int64_t>(
        memory_info, inputsIds.data(), inputsIds.size(), inputsShape.data(), inputsShape.size()));
    tensors.push_back(Ort::Value::CreateTensor<int64_t>(
        memory_info, textLengths.data(), textLengths.size(), textLengthsShape.data(), textLengthsShape.size()));
}

CharIdsBatch::~CharIdsBatch() {};

void BertBatch::tensors(std::vector<Ort::Value>& tensors, const Ort::MemoryInfo& memory_info) {
    tensors.push_back(Ort::Value::CreateTensor<int64_t>(
        memory_info, inputsIds.data(), inputsIds.size(), inputsShape.data(), inputsShape.size()));
    tensors.push_back(Ort::Value::CreateTensor<int64_t>(
        memory_info, attentionMasks.data(), attentionMasks.size(), inputsShape.data(), inputsShape.size()));
    tensors.push_back(Ort::Value::CreateTensor<int64_t>(
        memory_info, tokenTypeIds.data(), tokenTypeIds.size(), inputsShape.data(), inputsShape.size()));
}

BertBatch::~BertBatch() {};
