#pragma once

#include <tokenizers_cpp.h>

#include <memory>
#include <vector>
#include <string>

#include "charner_config.hpp"
#include "charner_structs.hpp"
#include "decoder.hpp"

namespace charner {
    class Processor {
    public:
        virtual ~Processor() {};
        virtual std::unique_ptr<Batch> prepareInput(const std::vector<CharSequence>& texts) = 0;
        virtual std::vector<TagSequence> labelDecode(
            const std::vector<ProbabilityMatrix>& probs, const std::vector<size_t>& lengths
        ) = 0;
        virtual const LabelVocabulary& labels() const = 0;
        virtual bool suffixTags() const { return false; } // labels written as PER-B
    };

    class CharProcessor : public Processor {
    protected:
        Config config;
        LabelVocabulary labelVocab;
        std::unique_ptr<tokenizers::Tokenizer> tokenizer;
        std::unique_ptr<LabelDecoder> decoder;
        int64_t unkId;
        int64_t clsId;
        int64_t sepId;

        int64_t maxChars() const;
        std::vector<std::vector<int64_t>> encodeTexts(const std::vector<CharSequence>& texts);
        void prepareCharIds(const std::vector<std::vector<int64_t>>& ids, CharIdsBatch* output);
        void prepareBert(const std::vector<std::vector<int64_t>>& ids, BertBatch* output);
    public:
        CharProcessor(const Config& config, const std::string& tokenizer_path, const LabelVocabulary& labels);
        virtual ~CharProcessor() {};

        int64_t encodeChar(const std::string& ch);
        virtual std::unique_ptr<Batch> prepareInput(const std::vector<CharSequence>& texts);
        virtual std::vector<TagSequence> labelDecode(
            const std::vector<ProbabilityMatrix>& probs, const std::vector<size_t>& lengths
        );
        virtual const LabelVocabulary& labels() const;
        virtual bool suffixTags() const;
    };
}
