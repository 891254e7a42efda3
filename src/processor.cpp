#include <algorithm>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "CharNER/processor.hpp"
#include "CharNER/tokenizer_utils.hpp"

using namespace charner;

CharProcessor::CharProcessor(const Config& config, const std::string& tokenizer_path, const LabelVocabulary& labels)
    : config(config), labelVocab(labels) {
    if (maxChars() <= 0) {
        throw std::invalid_argument("maxLength " + std::to_string(config.maxLength) + " leaves no room for characters");
    }
    if (labelVocab.size() == 0) {
        throw std::invalid_argument("Label vocabulary is empty");
    }

    const std::string blob = LoadBytesFromFile(tokenizer_path);
    tokenizer = tokenizers::Tokenizer::FromBlobJSON(blob);

    unkId = tokenizer->TokenToId("[UNK]");
    if (unkId < 0) {
        unkId = 0;
    }
    clsId = tokenizer->TokenToId("[CLS]");
    sepId = tokenizer->TokenToId("[SEP]");
    if (config.inputFormat == BERT && (clsId < 0 || sepId < 0)) {
        throw std::runtime_error("Tokenizer " + tokenizer_path + " has no [CLS]/[SEP] tokens");
    }

    switch (config.decodeMode) {
    case VITERBI:
        decoder = std::make_unique<ViterbiDecoder>(labelVocab, config.suffixTags);
        break;
    case ARGMAX:
    default:
        decoder = std::make_unique<ArgmaxDecoder>(labelVocab);
        break;
    }
    spdlog::info("[CharNER] Processor ready: {} labels, max length {}", labelVocab.size(), config.maxLength);
}

int64_t CharProcessor::maxChars() const {
    return config.inputFormat == BERT ? config.maxLength - 2 : config.maxLength;
}

int64_t CharProcessor::encodeChar(const std::string& ch) {
    std::vector<int32_t> ids = tokenizer->Encode(ch);
    if (ids.empty()) {
        return unkId;
    }
    return ids.front();
}

std::vector<std::vector<int64_t>> CharProcessor::encodeTexts(const std::vector<CharSequence>& texts) {
    std::vector<std::vector<int64_t>> res;
    res.reserve(texts.size());

    for (const auto& text : texts) {
        size_t n = std::min<size_t>(text.size(), maxChars());
        std::vector<int64_t> ids;
        ids.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            ids.push_back(encodeChar(text[i]));
        }
        if (n < text.size()) {
            spdlog::debug("[CharNER] Text of {} chars truncated to {}", text.size(), n);
        }
        res.push_back(ids);
    }
    return res;
}

void CharProcessor::prepareCharIds(const std::vector<std::vector<int64_t>>& ids, CharIdsBatch* output) {
    output->leadingTokens = 0;
    output->inputsShape = {output->batchSize, output->numChars};
    output->inputsIds.assign(output->batchSize * output->numChars, 0);
    output->textLengths.assign(output->batchSize, 0);
    output->textLengthsShape = {output->batchSize, 1};

    for (size_t p = 0; p < ids.size(); ++p) {
        std::copy(ids[p].begin(), ids[p].end(), output->inputsIds.begin() + p * output->numChars);
        output->textLengths[p] = int64_t(ids[p].size());
    }
}

void CharProcessor::prepareBert(const std::vector<std::vector<int64_t>>& ids, BertBatch* output) {
    const int64_t width = output->numChars + 2; // [CLS] ... [SEP]

    output->leadingTokens = 1;
    output->inputsShape = {output->batchSize, width};
    output->inputsIds.assign(output->batchSize * width, 0);
    output->attentionMasks.assign(output->batchSize * width, 0);
    output->tokenTypeIds.assign(output->batchSize * width, 0);
    output->textLengths.assign(output->batchSize, 0);

    for (size_t p = 0; p < ids.size(); ++p) {
        size_t idx = p * width;
        output->inputsIds[idx] = clsId;
        output->attentionMasks[idx] = 1;
        idx++;

        for (int64_t id : ids[p]) {
            output->inputsIds[idx] = id;
            output->attentionMasks[idx] = 1;
            idx++;
        }
        output->inputsIds[idx] = sepId;
        output->attentionMasks[idx] = 1;
        output->textLengths[p] = int64_t(ids[p].size());
    }
}

std::unique_ptr<Batch> CharProcessor::prepareInput(const std::vector<CharSequence>& texts) {
    std::vector<std::vector<int64_t>> ids = encodeTexts(texts);

    int64_t numChars = 1; // keep the tensors non-empty
    for (const auto& t : ids) {
        numChars = std::max(numChars, int64_t(t.size()));
    }

    switch (config.inputFormat) {
    case BERT: {
        auto output = std::make_unique<BertBatch>();
        output->batchSize = texts.size();
        output->numChars = numChars;
        prepareBert(ids, output.get());
        return output;
    }
    case CHAR_IDS:
    default: {
        auto output = std::make_unique<CharIdsBatch>();
        output->batchSize = texts.size();
        output->numChars = numChars;
        prepareCharIds(ids, output.get());
        return output;
    }
    }
}

std::vector<TagSequence> CharProcessor::labelDecode(
    const std::vector<ProbabilityMatrix>& probs, const std::vector<size_t>& lengths
) {
    return decoder->decode(probs, lengths);
}

const LabelVocabulary& CharProcessor::labels() const {
    return labelVocab;
}

bool CharProcessor::suffixTags() const {
    return config.suffixTags;
}
