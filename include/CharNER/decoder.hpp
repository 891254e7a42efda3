#pragma once

#include <vector>
#include <string>

#include "charner_structs.hpp"

namespace charner {
    class LabelDecoder {
    protected:
        const LabelVocabulary& labels;

        void checkInputs(const std::vector<ProbabilityMatrix>& probs, const std::vector<size_t>& lengths) const;
        static std::vector<int64_t> argmaxPath(const ProbabilityMatrix& prob, size_t length);
        virtual std::vector<int64_t> decodePath(const ProbabilityMatrix& prob, size_t length) const = 0;
    public:
        explicit LabelDecoder(const LabelVocabulary& labels) : labels(labels) {};
        virtual ~LabelDecoder() {};
        std::vector<TagSequence> decode(
            const std::vector<ProbabilityMatrix>& probs, const std::vector<size_t>& lengths
        ) const;
    };

    class ArgmaxDecoder : public LabelDecoder {
    protected:
        virtual std::vector<int64_t> decodePath(const ProbabilityMatrix& prob, size_t length) const;
    public:
        ArgmaxDecoder(const LabelVocabulary& labels) : LabelDecoder(labels) {};
        virtual ~ArgmaxDecoder() {};
    };

    class ViterbiDecoder : public LabelDecoder {
    protected:
        std::vector<bool> allowedStart;
        std::vector<bool> allowedEnd;
        std::vector<bool> allowedTransitions; // numLabels x numLabels, [prev * n + next]

        virtual std::vector<int64_t> decodePath(const ProbabilityMatrix& prob, size_t length) const;
    public:
        ViterbiDecoder(const LabelVocabulary& labels, bool suffix = false);
        virtual ~ViterbiDecoder() {};
        bool isAllowed(int64_t prev, int64_t next) const;
    };
}
