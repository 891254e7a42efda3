#include <iostream>
#include <vector>
#include <string>
#include <random>
#include <fstream>
#include <filesystem>
#include <atomic>
#include <cmath>
#include <thread>

#include <gtest/gtest.h>

#include "CharNER/charner_structs.hpp"
#include "CharNER/chunker.hpp"
#include "CharNER/decoder.hpp"
#include "CharNER/model.hpp"
#include "CharNER/processor.hpp"
#include "CharNER/scorer.hpp"
#include "CharNER/tokenizer_utils.hpp"

using charner::Chunk;
using charner::TagSequence;

static const charner::LabelVocabulary kBioLabels({"O", "B-LOC", "I-LOC", "B-PER", "I-PER"});

bool compare_chunks(const Chunk& a, const Chunk& b) {
    return a.type == b.type && a.start == b.start && a.end == b.end;
}

void expect_chunks(const std::vector<Chunk>& actual, const std::vector<Chunk>& expected) {
    ASSERT_EQ(actual.size(), expected.size());
    for (size_t i = 0; i < actual.size(); i++) {
        std::cout << "Actual: " << actual[i].type << " [" << actual[i].start << ", " << actual[i].end << ")"
                  << " Expected: " << expected[i].type << " [" << expected[i].start << ", " << expected[i].end << ")"
                  << std::endl;
        EXPECT_TRUE(compare_chunks(actual[i], expected[i]));
    }
}

// Chunks must be sorted, non-empty, disjoint and cover only same-typed span labels.
void expect_well_formed(const TagSequence& tags, const std::vector<Chunk>& chunks, bool suffix = false) {
    int prevEnd = 0;
    for (const auto& chunk : chunks) {
        EXPECT_GE(chunk.start, prevEnd);
        EXPECT_LT(chunk.start, chunk.end);
        EXPECT_LE(chunk.end, static_cast<int>(tags.size()));
        for (int i = chunk.start; i < chunk.end; i++) {
            charner::ParsedTag parsed = charner::parseTag(tags[i], suffix);
            EXPECT_NE(parsed.role, charner::OUTSIDE);
            EXPECT_EQ(parsed.type, chunk.type);
        }
        prevEnd = chunk.end;
    }
}

charner::ProbabilityMatrix matrix_from_rows(const std::vector<std::vector<float>>& rows) {
    std::vector<float> data;
    for (const auto& row : rows) {
        data.insert(data.end(), row.begin(), row.end());
    }
    return charner::ProbabilityMatrix(rows.size(), rows.empty() ? 0 : rows[0].size(), data);
}

TEST(TestTopic, TestCharSplitter) {
    charner::CharSplitter splitter;

    auto result = splitter.call("北京a b\n");
    std::vector<std::string> expected = {"北", "京", "a", " ", "b", "\n"};
    EXPECT_EQ(result, expected);

    EXPECT_TRUE(splitter.call("").empty());
    EXPECT_TRUE(splitter.isSingleChar("门"));
    EXPECT_TRUE(splitter.isSingleChar("x"));
    EXPECT_FALSE(splitter.isSingleChar("ab"));
    EXPECT_FALSE(splitter.isSingleChar(""));
}

TEST(TestTopic, TestCharSplitterRejectsInvalidUtf8) {
    charner::CharSplitter splitter;
    EXPECT_THROW(splitter.call("ab\xff"), charner::InvalidInputType);
}

TEST(TestTopic, TestCharSplitterSharedAcrossThreads) {
    const charner::CharSplitter splitter;
    const std::vector<std::string> expected = {"北", "京", "天", "安", "门", "!"};
    std::atomic<int> mismatches{0};

    std::vector<std::thread> workers;
    for (int w = 0; w < 4; w++) {
        workers.emplace_back([&]() {
            for (int i = 0; i < 200; i++) {
                if (splitter.call("北京天安门!") != expected) {
                    mismatches++;
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    EXPECT_EQ(mismatches.load(), 0);
}

TEST(TestTopic, TestLoadLabels) {
    auto path = std::filesystem::temp_directory_path() / "charner_test_labels.txt";
    {
        std::ofstream out(path, std::ios::binary);
        out << "O\r\nB-LOC\r\nI-LOC\n\n";
    }

    charner::LabelVocabulary labels = charner::LoadLabels(path.string());
    std::filesystem::remove(path);

    ASSERT_EQ(labels.size(), 3u);
    EXPECT_EQ(labels.label(1), "B-LOC");
    EXPECT_EQ(labels.id("I-LOC"), 2);
    EXPECT_EQ(labels.id("B-PER"), -1);
    EXPECT_THROW(charner::LoadLabels("./does-not-exist.txt"), std::runtime_error);
}

TEST(TestTopic, TestParseTag) {
    charner::ParsedTag p = charner::parseTag("B-LOC");
    EXPECT_EQ(p.role, charner::BEGIN);
    EXPECT_EQ(p.type, "LOC");

    p = charner::parseTag("I-NESTED-TYPE");
    EXPECT_EQ(p.role, charner::INSIDE);
    EXPECT_EQ(p.type, "NESTED-TYPE");

    p = charner::parseTag("PER-E", true);
    EXPECT_EQ(p.role, charner::END);
    EXPECT_EQ(p.type, "PER");

    EXPECT_EQ(charner::parseTag("O").role, charner::OUTSIDE);
    EXPECT_EQ(charner::parseTag("").role, charner::OUTSIDE);
    EXPECT_EQ(charner::parseTag("X-PER").role, charner::OUTSIDE);
    EXPECT_EQ(charner::parseTag("X-PER").type, "");
}

TEST(TestTopic, TestChunksBio) {
    TagSequence tags = {"B-LOC", "I-LOC", "B-LOC", "I-LOC", "I-LOC"};
    expect_chunks(charner::getChunks(tags), {{"LOC", 0, 2}, {"LOC", 2, 5}});

    tags = {"O", "B-PER", "I-PER", "O", "B-LOC", "O"};
    expect_chunks(charner::getChunks(tags), {{"PER", 1, 3}, {"LOC", 4, 5}});
}

TEST(TestTopic, TestChunksInsideWithoutBegin) {
    TagSequence tags = {"I-PER", "O", "B-LOC"};
    std::vector<Chunk> chunks;
    EXPECT_NO_THROW(chunks = charner::getChunks(tags));
    expect_chunks(chunks, {{"PER", 0, 1}, {"LOC", 2, 3}});
    expect_well_formed(tags, chunks);
}

TEST(TestTopic, TestChunksTypeMismatch) {
    TagSequence tags = {"B-PER", "I-LOC", "I-LOC", "I-PER"};
    auto chunks = charner::getChunks(tags);
    expect_chunks(chunks, {{"PER", 0, 1}, {"LOC", 1, 3}, {"PER", 3, 4}});
    expect_well_formed(tags, chunks);
}

TEST(TestTopic, TestChunksBioes) {
    TagSequence tags = {"S-PER", "B-LOC", "I-LOC", "E-LOC", "O", "E-ORG", "E-ORG"};
    auto chunks = charner::getChunks(tags);
    expect_chunks(chunks, {{"PER", 0, 1}, {"LOC", 1, 4}, {"ORG", 5, 6}, {"ORG", 6, 7}});
    expect_well_formed(tags, chunks);
}

TEST(TestTopic, TestChunksSuffixScheme) {
    TagSequence tags = {"PER-B", "PER-I", "O", "LOC-S"};
    expect_chunks(charner::getChunks(tags, true), {{"PER", 0, 2}, {"LOC", 3, 4}});
}

TEST(TestTopic, TestChunksDegenerateInputs) {
    EXPECT_TRUE(charner::getChunks({}).empty());
    EXPECT_TRUE(charner::getChunks({"O", "O", "O"}).empty());

    TagSequence tags = {"X-PER", "", "B", "I", "O"};
    std::vector<Chunk> chunks;
    EXPECT_NO_THROW(chunks = charner::getChunks(tags));
    expect_chunks(chunks, {{"", 2, 4}});
    expect_well_formed(tags, chunks);
}

TEST(TestTopic, TestChunksRandomSequencesStayWellFormed) {
    std::vector<std::string> alphabet = {
        "O", "B-LOC", "I-LOC", "E-LOC", "S-LOC", "B-PER", "I-PER", "E-PER", "S-PER", "", "Z-PER"
    };
    std::mt19937 rng(42);
    std::uniform_int_distribution<size_t> pick(0, alphabet.size() - 1);
    std::uniform_int_distribution<size_t> length(0, 24);

    for (int round = 0; round < 500; round++) {
        TagSequence tags(length(rng));
        for (auto& t : tags) {
            t = alphabet[pick(rng)];
        }
        auto first = charner::getChunks(tags);
        expect_well_formed(tags, first);

        auto second = charner::getChunks(tags);
        ASSERT_EQ(first.size(), second.size());
        for (size_t i = 0; i < first.size(); i++) {
            EXPECT_TRUE(compare_chunks(first[i], second[i]));
        }
    }
}

TEST(TestTopic, TestScoreIsMeanOfSelectedLabel) {
    auto prob = matrix_from_rows({
        {0.02f, 0.90f, 0.02f, 0.04f, 0.02f},
        {0.10f, 0.05f, 0.80f, 0.03f, 0.02f},
        {0.01f, 0.01f, 0.95f, 0.02f, 0.01f},
        {0.70f, 0.10f, 0.10f, 0.05f, 0.05f},
    });
    TagSequence tags = {"B-LOC", "I-LOC", "I-LOC", "O"};
    charner::CharSequence chars = {"天", "安", "门", "。"};

    auto confidences = charner::selectConfidences(prob, tags, kBioLabels);
    ASSERT_EQ(confidences.size(), 4u);
    EXPECT_FLOAT_EQ(confidences[1], 0.80f);

    auto entities = charner::scoreChunks(charner::getChunks(tags), chars, confidences);
    ASSERT_EQ(entities.size(), 1u);
    EXPECT_EQ(entities[0].text, "天安门");
    EXPECT_EQ(entities[0].type, "LOC");
    EXPECT_EQ(entities[0].beginOffset, 0);
    EXPECT_EQ(entities[0].endOffset, 3);
    EXPECT_NEAR(entities[0].score, (0.9 + 0.8 + 0.95) / 3.0, 1e-6);
    EXPECT_GE(entities[0].score, 0.0f);
    EXPECT_LE(entities[0].score, 1.0f);
}

TEST(TestTopic, TestConfidenceFallbacks) {
    // single column: the row already is the chosen label's confidence
    auto column = matrix_from_rows({{0.5f}, {0.7f}});
    auto confidences = charner::selectConfidences(column, {"B-PER", "I-PER"}, kBioLabels);
    EXPECT_FLOAT_EQ(confidences[0], 0.5f);
    EXPECT_FLOAT_EQ(confidences[1], 0.7f);

    // label outside the vocabulary: row maximum
    auto prob = matrix_from_rows({{0.1f, 0.6f, 0.1f, 0.1f, 0.1f}});
    confidences = charner::selectConfidences(prob, {"B-ORG"}, kBioLabels);
    EXPECT_FLOAT_EQ(confidences[0], 0.6f);

    // scores are averaged verbatim, never renormalized
    auto logits = matrix_from_rows({{0.0f, 3.0f, 0.0f, 0.0f, 0.0f}, {0.0f, 0.0f, 5.0f, 0.0f, 0.0f}});
    auto entities = charner::scoreChunks(
        charner::getChunks({"B-LOC", "I-LOC"}), {"a", "b"},
        charner::selectConfidences(logits, {"B-LOC", "I-LOC"}, kBioLabels)
    );
    ASSERT_EQ(entities.size(), 1u);
    EXPECT_FLOAT_EQ(entities[0].score, 4.0f);
}

TEST(TestTopic, TestArgmaxDecoder) {
    charner::ArgmaxDecoder decoder(kBioLabels);
    auto prob = matrix_from_rows({
        {0.1f, 0.6f, 0.1f, 0.1f, 0.1f},
        {0.1f, 0.1f, 0.6f, 0.1f, 0.1f},
        {0.6f, 0.1f, 0.1f, 0.1f, 0.1f},
        {0.2f, 0.2f, 0.2f, 0.2f, 0.2f},
    });

    auto tags = decoder.decode({prob, prob}, {4, 2});
    ASSERT_EQ(tags.size(), 2u);
    EXPECT_EQ(tags[0], TagSequence({"B-LOC", "I-LOC", "O", "O"}));
    EXPECT_EQ(tags[1], TagSequence({"B-LOC", "I-LOC"}));

    EXPECT_TRUE(decoder.decode({prob}, {0})[0].empty());
    EXPECT_THROW(decoder.decode({prob}, {5}), std::out_of_range);
    EXPECT_THROW(decoder.decode({prob}, {1, 1}), std::out_of_range);

    auto narrow = matrix_from_rows({{0.5f, 0.5f}});
    EXPECT_THROW(decoder.decode({narrow}, {1}), std::runtime_error);
}

TEST(TestTopic, TestViterbiForbidsInsideAfterOutside) {
    charner::ViterbiDecoder decoder(kBioLabels);
    auto prob = matrix_from_rows({
        {0.60f, 0.10f, 0.05f, 0.20f, 0.05f},
        {0.30f, 0.05f, 0.60f, 0.025f, 0.025f},
    });

    EXPECT_EQ(charner::ArgmaxDecoder(kBioLabels).decode({prob}, {2})[0], TagSequence({"O", "I-LOC"}));
    EXPECT_EQ(decoder.decode({prob}, {2})[0], TagSequence({"O", "O"}));

    EXPECT_FALSE(decoder.isAllowed(kBioLabels.id("O"), kBioLabels.id("I-LOC")));
    EXPECT_FALSE(decoder.isAllowed(kBioLabels.id("B-PER"), kBioLabels.id("I-LOC")));
    EXPECT_TRUE(decoder.isAllowed(kBioLabels.id("B-LOC"), kBioLabels.id("I-LOC")));
    EXPECT_TRUE(decoder.isAllowed(kBioLabels.id("I-LOC"), kBioLabels.id("B-PER")));
}

TEST(TestTopic, TestViterbiKeepsValidArgmaxPath) {
    charner::ViterbiDecoder decoder(kBioLabels);
    auto prob = matrix_from_rows({
        {0.1f, 0.1f, 0.1f, 0.6f, 0.1f},
        {0.1f, 0.1f, 0.1f, 0.1f, 0.6f},
        {0.6f, 0.1f, 0.1f, 0.1f, 0.1f},
        {0.1f, 0.6f, 0.1f, 0.1f, 0.1f},
    });
    EXPECT_EQ(decoder.decode({prob}, {4})[0], TagSequence({"B-PER", "I-PER", "O", "B-LOC"}));
}

TEST(TestTopic, TestViterbiBioesMustCloseChunks) {
    charner::LabelVocabulary labels({"O", "B-LOC", "I-LOC", "E-LOC", "S-LOC"});
    charner::ViterbiDecoder decoder(labels);

    auto prob = matrix_from_rows({{0.1f, 0.7f, 0.0f, 0.0f, 0.2f}});
    EXPECT_EQ(decoder.decode({prob}, {1})[0], TagSequence({"S-LOC"}));
    EXPECT_FALSE(decoder.isAllowed(labels.id("B-LOC"), labels.id("O")));
}

TEST(TestTopic, TestViterbiFallsBackWhenNoPathIsValid) {
    charner::LabelVocabulary labels({"I-LOC", "I-PER"});
    charner::ViterbiDecoder decoder(labels);

    auto prob = matrix_from_rows({{0.3f, 0.7f}, {0.8f, 0.2f}});
    EXPECT_EQ(decoder.decode({prob}, {2})[0], TagSequence({"I-PER", "I-LOC"}));
}

std::filesystem::path write_tokenizer_json() {
    auto path = std::filesystem::temp_directory_path() / "charner_test_tokenizer.json";
    std::ofstream out(path, std::ios::binary);
    out << R"({
  "version": "1.0",
  "truncation": null,
  "padding": null,
  "added_tokens": [],
  "normalizer": null,
  "pre_tokenizer": {"type": "Whitespace"},
  "post_processor": null,
  "decoder": null,
  "model": {
    "type": "WordLevel",
    "vocab": {"[PAD]": 0, "[UNK]": 1, "[CLS]": 2, "[SEP]": 3, "北": 4, "京": 5, "天": 6, "安": 7, "门": 8},
    "unk_token": "[UNK]"
  }
})";
    return path;
}

TEST(TestTopic, TestProcessorBertLayout) {
    auto path = write_tokenizer_json();
    charner::Config config{6, charner::BERT};
    charner::CharProcessor processor(config, path.string(), kBioLabels);
    std::filesystem::remove(path);

    auto batch = processor.prepareInput({{"北", "京", "天", "安", "门"}, {"x"}});
    auto* bert = dynamic_cast<charner::BertBatch*>(batch.get());
    ASSERT_NE(bert, nullptr);

    // maxLength 6 leaves 4 characters between [CLS] and [SEP]
    EXPECT_EQ(bert->batchSize, 2);
    EXPECT_EQ(bert->numChars, 4);
    EXPECT_EQ(bert->leadingTokens, 1);
    EXPECT_EQ(bert->inputsShape, std::vector<int64_t>({2, 6}));
    EXPECT_EQ(bert->inputsIds, std::vector<int64_t>({2, 4, 5, 6, 7, 3,
                                                     2, 1, 3, 0, 0, 0}));
    EXPECT_EQ(bert->attentionMasks, std::vector<int64_t>({1, 1, 1, 1, 1, 1,
                                                          1, 1, 1, 0, 0, 0}));
    EXPECT_EQ(bert->tokenTypeIds, std::vector<int64_t>(12, 0));
    EXPECT_EQ(bert->textLengths, std::vector<int64_t>({4, 1}));
    EXPECT_FALSE(processor.suffixTags());
}

TEST(TestTopic, TestProcessorCharIdsLayout) {
    auto path = write_tokenizer_json();
    charner::Config config{3};
    config.suffixTags = true;
    charner::CharProcessor processor(config, path.string(), kBioLabels);
    std::filesystem::remove(path);

    auto batch = processor.prepareInput({{"北", "京", "天", "安"}, {}});
    auto* ids = dynamic_cast<charner::CharIdsBatch*>(batch.get());
    ASSERT_NE(ids, nullptr);

    EXPECT_EQ(ids->numChars, 3);
    EXPECT_EQ(ids->leadingTokens, 0);
    EXPECT_EQ(ids->inputsShape, std::vector<int64_t>({2, 3}));
    EXPECT_EQ(ids->inputsIds, std::vector<int64_t>({4, 5, 6, 0, 0, 0}));
    EXPECT_EQ(ids->textLengths, std::vector<int64_t>({3, 0}));
    EXPECT_EQ(ids->textLengthsShape, std::vector<int64_t>({2, 1}));
    EXPECT_TRUE(processor.suffixTags());
}

TEST(TestTopic, TestSliceOutputDropsSpecialRows) {
    charner::BertBatch batch;
    batch.batchSize = 2;
    batch.numChars = 2;
    batch.leadingTokens = 1;

    // [batch=2, positions=4 ([CLS] c0 c1 [SEP]), classes=2], value = 10*b + position + class/10
    std::vector<float> output;
    for (int b = 0; b < 2; b++) {
        for (int p = 0; p < 4; p++) {
            for (int c = 0; c < 2; c++) {
                output.push_back(10.0f * b + p + c / 10.0f);
            }
        }
    }

    auto probs = charner::OnnxModel::sliceOutput(output, {2, 4, 2}, batch, false);
    ASSERT_EQ(probs.size(), 2u);
    for (int b = 0; b < 2; b++) {
        EXPECT_EQ(probs[b].rows, 2);
        EXPECT_EQ(probs[b].classes, 2);
        EXPECT_FLOAT_EQ(probs[b].at(0, 0), 10.0f * b + 1);
        EXPECT_FLOAT_EQ(probs[b].at(1, 1), 10.0f * b + 2.1f);
    }
}

TEST(TestTopic, TestSliceOutputKeepsShortOutputShort) {
    charner::CharIdsBatch batch;
    batch.batchSize = 1;
    batch.numChars = 5;

    auto probs = charner::OnnxModel::sliceOutput(std::vector<float>(6, 0.5f), {1, 3, 2}, batch, false);
    ASSERT_EQ(probs.size(), 1u);
    EXPECT_EQ(probs[0].rows, 3);

    EXPECT_THROW(charner::OnnxModel::sliceOutput(std::vector<float>(6, 0.5f), {1, 6}, batch, false), std::runtime_error);
    EXPECT_THROW(charner::OnnxModel::sliceOutput(std::vector<float>(4, 0.5f), {1, 3, 2}, batch, false), std::runtime_error);
}

TEST(TestTopic, TestSliceOutputSoftmaxOnLogits) {
    charner::CharIdsBatch batch;
    batch.batchSize = 1;
    batch.numChars = 1;

    auto probs = charner::OnnxModel::sliceOutput({0.0f, std::log(3.0f)}, {1, 1, 2}, batch, true);
    ASSERT_EQ(probs[0].rows, 1);
    EXPECT_NEAR(probs[0].at(0, 0), 0.25, 1e-6);
    EXPECT_NEAR(probs[0].at(0, 1), 0.75, 1e-6);
}

TEST(TestTopic, TestModelMissingFileThrows) {
    charner::Config config{16};
    EXPECT_THROW(charner::OnnxModel("./does-not-exist.onnx", config), Ort::Exception);
}
