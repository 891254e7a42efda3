#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

#include "CharNER/decoder.hpp"
#include "CharNER/chunker.hpp"

using namespace charner;

static const float kMinProb = 1e-10f;

void LabelDecoder::checkInputs(const std::vector<ProbabilityMatrix>& probs, const std::vector<size_t>& lengths) const {
    if (probs.size() != lengths.size()) {
        throw std::out_of_range(
            "Got " + std::to_string(lengths.size()) + " lengths for " + std::to_string(probs.size()) + " matrices"
        );
    }
    for (size_t i = 0; i < probs.size(); ++i) {
        if (lengths[i] > static_cast<size_t>(probs[i].rows)) {
            throw std::out_of_range(
                "Length " + std::to_string(lengths[i]) + " exceeds " + std::to_string(probs[i].rows) +
                " rows of matrix " + std::to_string(i)
            );
        }
        if (lengths[i] > 0 && static_cast<size_t>(probs[i].classes) != labels.size()) {
            throw std::runtime_error(
                "Matrix " + std::to_string(i) + " has " + std::to_string(probs[i].classes) +
                " classes but the label vocabulary has " + std::to_string(labels.size())
            );
        }
    }
}

std::vector<int64_t> LabelDecoder::argmaxPath(const ProbabilityMatrix& prob, size_t length) {
    std::vector<int64_t> path;
    path.reserve(length);

    for (size_t r = 0; r < length; ++r) {
        const float* row = prob.row(r);
        int64_t best = 0;
        for (int64_t c = 1; c < prob.classes; ++c) {
            if (row[c] > row[best]) {
                best = c;
            }
        }
        path.push_back(best);
    }
    return path;
}

std::vector<TagSequence> LabelDecoder::decode(
    const std::vector<ProbabilityMatrix>& probs, const std::vector<size_t>& lengths
) const {
    checkInputs(probs, lengths);

    std::vector<TagSequence> tags;
    tags.reserve(probs.size());
    for (size_t i = 0; i < probs.size(); ++i) {
        std::vector<int64_t> path = decodePath(probs[i], lengths[i]);

        TagSequence sequence;
        sequence.reserve(path.size());
        for (int64_t id : path) {
            sequence.push_back(labels.label(id));
        }
        tags.push_back(sequence);
    }
    return tags;
}

std::vector<int64_t> ArgmaxDecoder::decodePath(const ProbabilityMatrix& prob, size_t length) const {
    return argmaxPath(prob, length);
}

ViterbiDecoder::ViterbiDecoder(const LabelVocabulary& labels, bool suffix)
    : LabelDecoder(labels) {
    const size_t n = labels.size();

    std::vector<ParsedTag> parsed;
    parsed.reserve(n);
    bool bioes = false;
    for (const auto& label : labels.idToLabel) {
        parsed.push_back(parseTag(label, suffix));
        bioes = bioes || parsed.back().role == END || parsed.back().role == SINGLE;
    }

    allowedStart.assign(n, true);
    allowedEnd.assign(n, true);
    allowedTransitions.assign(n * n, true);

    for (size_t j = 0; j < n; ++j) {
        const ParsedTag& next = parsed[j];
        allowedStart[j] = next.role != INSIDE && next.role != END;
        allowedEnd[j] = !(bioes && (next.role == BEGIN || next.role == INSIDE));

        for (size_t i = 0; i < n; ++i) {
            const ParsedTag& prev = parsed[i];
            bool open = prev.role == BEGIN || prev.role == INSIDE;
            bool continues = next.role == INSIDE || next.role == END;

            bool allowed = true;
            if (continues) {
                allowed = open && prev.type == next.type;
            } else if (bioes && open) {
                allowed = false; // an open BIOES chunk must be closed by E
            }
            allowedTransitions[i * n + j] = allowed;
        }
    }
}

bool ViterbiDecoder::isAllowed(int64_t prev, int64_t next) const {
    return allowedTransitions[prev * labels.size() + next];
}

std::vector<int64_t> ViterbiDecoder::decodePath(const ProbabilityMatrix& prob, size_t length) const {
    if (length == 0) {
        return {};
    }

    const int64_t n = prob.classes;
    const float negInf = -std::numeric_limits<float>::infinity();

    std::vector<float> score(n);
    for (int64_t j = 0; j < n; ++j) {
        score[j] = allowedStart[j] ? std::log(std::max(prob.at(0, j), kMinProb)) : negInf;
    }

    std::vector<float> nextScore(n);
    std::vector<int64_t> history((length - 1) * n);

    for (size_t t = 1; t < length; ++t) {
        for (int64_t j = 0; j < n; ++j) {
            float best = negInf;
            int64_t bestPrev = 0;
            for (int64_t i = 0; i < n; ++i) {
                if (!isAllowed(i, j) || score[i] == negInf) {
                    continue;
                }
                if (score[i] > best) {
                    best = score[i];
                    bestPrev = i;
                }
            }
            nextScore[j] = best == negInf ? negInf : best + std::log(std::max(prob.at(t, j), kMinProb));
            history[(t - 1) * n + j] = bestPrev;
        }
        std::swap(score, nextScore);
    }

    int64_t bestLast = -1;
    float bestScore = negInf;
    for (int64_t j = 0; j < n; ++j) {
        if (allowedEnd[j] && score[j] > bestScore) {
            bestScore = score[j];
            bestLast = j;
        }
    }
    if (bestLast < 0) { // no path satisfies the scheme
        return argmaxPath(prob, length);
    }

    std::vector<int64_t> path(length);
    path[length - 1] = bestLast;
    for (size_t t = length - 1; t > 0; --t) {
        path[t - 1] = history[(t - 1) * n + path[t]];
    }
    return path;
}
