#pragma once
#include <memory>
#include <string>
#include <vector>
#include "charner_structs.hpp"

namespace charner {

class CharSplitter {
private:
    struct Implementation;
    std::unique_ptr<Implementation> pimpl;

public:
    CharSplitter();
    ~CharSplitter();
    CharSplitter(const CharSplitter&) = delete;
    CharSplitter& operator=(const CharSplitter&) = delete;
    CharSequence call(const std::string& text) const;
    bool isSingleChar(const std::string& token) const;
};

std::string LoadBytesFromFile(const std::string& path);
LabelVocabulary LoadLabels(const std::string& path);

}
