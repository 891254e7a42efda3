#pragma once

#include <vector>

#include "charner_structs.hpp"

namespace charner {
    std::vector<float> selectConfidences(
        const ProbabilityMatrix& prob, const TagSequence& tags, const LabelVocabulary& labels
    );

    Entity scoreChunk(const Chunk& chunk, const CharSequence& chars, const std::vector<float>& confidences);

    std::vector<Entity> scoreChunks(
        const std::vector<Chunk>& chunks, const CharSequence& chars, const std::vector<float>& confidences
    );
}
