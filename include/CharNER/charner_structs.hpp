#pragma once

#include <onnxruntime_cxx_api.h>

#include <vector>
#include <string>
#include <cstdint>
#include <stdexcept>
#include <unordered_map>

namespace charner {
    typedef std::vector<std::string> CharSequence;
    typedef std::vector<std::string> TagSequence;

    class InvalidInputType : public std::invalid_argument {
    public:
        explicit InvalidInputType(const std::string& what) : std::invalid_argument(what) {}
    };

    struct TextInput {
        enum Kind : int {
            RAW,
            TOKENIZED
        };

        Kind kind;
        std::string raw;
        CharSequence chars;

        TextInput(const std::string& text) : kind(RAW), raw(text) {}
        TextInput(const char* text) : kind(RAW), raw(text) {}

        static TextInput tokenized(const CharSequence& chars);
    };

    struct ProbabilityMatrix {
        int64_t rows = 0;
        int64_t classes = 0;
        std::vector<float> data; // rows x classes, row-major

        ProbabilityMatrix() = default;
        ProbabilityMatrix(int64_t rows, int64_t classes);
        ProbabilityMatrix(int64_t rows, int64_t classes, std::vector<float> values);

        const float* row(int64_t r) const { return data.data() + r * classes; }
        float at(int64_t r, int64_t c) const { return data[r * classes + c]; }
        float& at(int64_t r, int64_t c) { return data[r * classes + c]; }
    };

    struct LabelVocabulary {
        std::vector<std::string> idToLabel;
        std::unordered_map<std::string, int64_t> labelToId;

        LabelVocabulary() = default;
        explicit LabelVocabulary(const std::vector<std::string>& labels);

        size_t size() const { return idToLabel.size(); }
        int64_t id(const std::string& label) const; // -1 when unknown
        const std::string& label(int64_t id) const { return idToLabel.at(id); }
    };

    struct Batch {
        int64_t batchSize = 0;
        int64_t numChars = 0;      // padded character positions per item
        int64_t leadingTokens = 0; // model rows preceding the first character

        std::vector<int64_t> inputsIds;
        std::vector<int64_t> inputsShape;
        std::vector<int64_t> textLengths;

        virtual ~Batch();
        virtual void tensors(std::vector<Ort::Value>& tensors, const Ort::MemoryInfo& memory_info) = 0;
    };

    struct CharIdsBatch : public Batch {
        std::vector<int64_t> textLengthsShape;

        virtual ~CharIdsBatch();
        virtual void tensors(std::vector<Ort::Value>& tensors, const Ort::MemoryInfo& memory_info);
    };

    struct BertBatch : public Batch {
        std::vector<int64_t> attentionMasks;
        std::vector<int64_t> tokenTypeIds;

        virtual ~BertBatch();
        virtual void tensors(std::vector<Ort::Value>& tensors, const Ort::MemoryInfo& memory_info);
    };

    struct Chunk {
        std::string type;
        int start;
        int end; // exclusive
    };

    struct Entity {
        std::string text;
        std::string type;
        float score;
        int beginOffset;
        int endOffset;
    };

    struct TaggedText {
        CharSequence chars;
        std::vector<Entity> entities;
    };
}
