#include <algorithm>

#include <spdlog/spdlog.h>

#include "CharNER/predictor.hpp"
#include "CharNER/chunker.hpp"
#include "CharNER/scorer.hpp"

using namespace charner;

Predictor::Predictor(Model& model, Processor& processor)
    : model(model), processor(processor) {}

std::vector<CharSequence> Predictor::normalizeInputs(const std::vector<TextInput>& texts) const {
    std::vector<CharSequence> res;
    res.reserve(texts.size());

    for (size_t i = 0; i < texts.size(); ++i) {
        const TextInput& text = texts[i];
        switch (text.kind) {
        case TextInput::RAW:
            res.push_back(charSplitter.call(text.raw));
            break;
        case TextInput::TOKENIZED:
            for (const auto& ch : text.chars) {
                if (!charSplitter.isSingleChar(ch)) {
                    throw InvalidInputType(
                        "Text " + std::to_string(i) + " is not tokenized at char level: got \"" + ch + "\""
                    );
                }
            }
            spdlog::debug("[CharNER] Text {} passed pre-tokenized ({} chars)", i, text.chars.size());
            res.push_back(text.chars);
            break;
        default:
            throw InvalidInputType("Text " + std::to_string(i) + " is neither a string nor a list of chars");
        }
    }
    return res;
}

std::vector<ProbabilityMatrix> Predictor::predictChars(const std::vector<CharSequence>& chars) {
    if (chars.empty()) {
        spdlog::warn("[CharNER] Empty batch");
        return {};
    }

    bool allEmpty = std::all_of(chars.begin(), chars.end(), [](const CharSequence& c) { return c.empty(); });
    if (allEmpty) {
        int64_t classes = processor.labels().size();
        return std::vector<ProbabilityMatrix>(chars.size(), ProbabilityMatrix(0, classes));
    }

    std::unique_ptr<Batch> batch = processor.prepareInput(chars);
    std::vector<ProbabilityMatrix> probs = model.predict(*batch);
    if (probs.size() != chars.size()) {
        throw std::runtime_error(
            "Model returned " + std::to_string(probs.size()) + " matrices for " + std::to_string(chars.size()) + " texts"
        );
    }
    return probs;
}

std::vector<TagSequence> Predictor::tagChars(
    const std::vector<CharSequence>& chars, const std::vector<ProbabilityMatrix>& probs
) {
    if (chars.empty()) {
        return {};
    }

    std::vector<size_t> lengths;
    lengths.reserve(chars.size());
    for (size_t i = 0; i < chars.size(); ++i) {
        size_t length = std::min<size_t>(chars[i].size(), probs[i].rows);
        if (length < chars[i].size()) {
            spdlog::debug("[CharNER] Text {} has {} chars but only {} rows, tagging {}",
                          i, chars[i].size(), probs[i].rows, length);
        }
        lengths.push_back(length);
    }
    std::vector<TagSequence> tags = processor.labelDecode(probs, lengths);
    if (tags.size() != chars.size()) {
        throw std::runtime_error(
            "Processor decoded " + std::to_string(tags.size()) + " tag sequences for " + std::to_string(chars.size()) + " texts"
        );
    }
    for (size_t i = 0; i < tags.size(); ++i) {
        if (tags[i].size() != lengths[i]) {
            throw std::runtime_error(
                "Processor decoded " + std::to_string(tags[i].size()) + " tags for text " + std::to_string(i) +
                ", expected " + std::to_string(lengths[i])
            );
        }
    }
    return tags;
}

ProbabilityMatrix Predictor::predictProb(const TextInput& text) {
    return predictProbBatch({text}).front();
}

std::vector<ProbabilityMatrix> Predictor::predictProbBatch(const std::vector<TextInput>& texts) {
    return predictChars(normalizeInputs(texts));
}

TagSequence Predictor::tag(const TextInput& text) {
    return tagBatch({text}).front();
}

std::vector<TagSequence> Predictor::tagBatch(const std::vector<TextInput>& texts) {
    std::vector<CharSequence> chars = normalizeInputs(texts);
    return tagChars(chars, predictChars(chars));
}

TaggedText Predictor::prettyTag(const TextInput& text) {
    return prettyTagBatch({text}).front();
}

std::vector<TaggedText> Predictor::prettyTagBatch(const std::vector<TextInput>& texts) {
    std::vector<CharSequence> chars = normalizeInputs(texts);
    std::vector<ProbabilityMatrix> probs = predictChars(chars);
    std::vector<TagSequence> tags = tagChars(chars, probs);

    std::vector<TaggedText> results;
    results.reserve(chars.size());
    for (size_t i = 0; i < chars.size(); ++i) {
        results.push_back({
            chars[i],
            entities(chars[i], tags[i], probs[i], processor.labels(), processor.suffixTags())
        });
    }
    return results;
}

std::vector<Entity> Predictor::entities(
    const CharSequence& chars, const TagSequence& tags, const ProbabilityMatrix& prob,
    const LabelVocabulary& labels, bool suffix
) {
    std::vector<Chunk> chunks = getChunks(tags, suffix);
    std::vector<float> confidences = selectConfidences(prob, tags, labels);
    return scoreChunks(chunks, chars, confidences);
}
