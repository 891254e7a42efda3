#include <algorithm>

#include "CharNER/scorer.hpp"

using namespace charner;

std::vector<float> charner::selectConfidences(
    const ProbabilityMatrix& prob, const TagSequence& tags, const LabelVocabulary& labels
) {
    const int64_t length = std::min<int64_t>(tags.size(), prob.rows);
    std::vector<float> confidences;
    confidences.reserve(length);

    for (int64_t i = 0; i < length; ++i) {
        const float* row = prob.row(i);
        if (prob.classes <= 0) {
            confidences.push_back(0.0f);
            continue;
        }
        if (prob.classes == 1) { // decoder already reduced each row to its chosen label
            confidences.push_back(row[0]);
            continue;
        }

        int64_t id = labels.id(tags[i]);
        if (id >= 0 && id < prob.classes) {
            confidences.push_back(row[id]);
        } else {
            confidences.push_back(*std::max_element(row, row + prob.classes));
        }
    }
    return confidences;
}

Entity charner::scoreChunk(const Chunk& chunk, const CharSequence& chars, const std::vector<float>& confidences) {
    Entity entity;
    entity.type = chunk.type;
    entity.beginOffset = chunk.start;
    entity.endOffset = chunk.end;

    double sum = 0.0;
    for (int i = chunk.start; i < chunk.end; ++i) {
        entity.text += chars.at(i);
        sum += confidences.at(i);
    }
    entity.score = static_cast<float>(sum / (chunk.end - chunk.start));
    return entity;
}

std::vector<Entity> charner::scoreChunks(
    const std::vector<Chunk>& chunks, const CharSequence& chars, const std::vector<float>& confidences
) {
    std::vector<Entity> entities;
    entities.reserve(chunks.size());

    for (const auto& chunk : chunks) {
        entities.push_back(scoreChunk(chunk, chars, confidences));
    }
    return entities;
}
