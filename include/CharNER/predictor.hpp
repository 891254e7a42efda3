#pragma once

#include <vector>
#include <string>

#include "charner_structs.hpp"
#include "model.hpp"
#include "processor.hpp"
#include "tokenizer_utils.hpp"

namespace charner {
    class Predictor {
    protected:
        Model& model;
        Processor& processor;
        CharSplitter charSplitter;

        std::vector<CharSequence> normalizeInputs(const std::vector<TextInput>& texts) const;
        std::vector<ProbabilityMatrix> predictChars(const std::vector<CharSequence>& chars);
        std::vector<TagSequence> tagChars(
            const std::vector<CharSequence>& chars, const std::vector<ProbabilityMatrix>& probs
        );
    public:
        Predictor(Model& model, Processor& processor);

        ProbabilityMatrix predictProb(const TextInput& text);
        std::vector<ProbabilityMatrix> predictProbBatch(const std::vector<TextInput>& texts);

        TagSequence tag(const TextInput& text);
        std::vector<TagSequence> tagBatch(const std::vector<TextInput>& texts);

        TaggedText prettyTag(const TextInput& text);
        std::vector<TaggedText> prettyTagBatch(const std::vector<TextInput>& texts);

        static std::vector<Entity> entities(
            const CharSequence& chars, const TagSequence& tags, const ProbabilityMatrix& prob,
            const LabelVocabulary& labels, bool suffix = false
        );
    };
}
