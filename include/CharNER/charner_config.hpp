#pragma once

namespace charner {
    enum InputFormat {
        CHAR_IDS,
        BERT
    };

    enum DecodeMode {
        ARGMAX,
        VITERBI
    };

    struct Config {
        int maxLength;
        InputFormat inputFormat = CHAR_IDS;
        DecodeMode decodeMode = ARGMAX;
        bool suffixTags = false; // labels written as PER-B instead of B-PER
        bool outputsLogits = false;
    };
}
