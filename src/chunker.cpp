#include "CharNER/chunker.hpp"

using namespace charner;

namespace {
    bool endOfChunk(TagRole prevRole, TagRole role, const std::string& prevType, const std::string& type) {
        if (prevRole == END || prevRole == SINGLE) {
            return true;
        }
        if ((prevRole == BEGIN || prevRole == INSIDE) && (role == BEGIN || role == SINGLE || role == OUTSIDE)) {
            return true;
        }
        return prevRole != OUTSIDE && prevType != type;
    }

    bool startOfChunk(TagRole prevRole, TagRole role, const std::string& prevType, const std::string& type) {
        if (role == BEGIN || role == SINGLE) {
            return true;
        }
        if ((role == INSIDE || role == END) && (prevRole == END || prevRole == SINGLE || prevRole == OUTSIDE)) {
            return true;
        }
        return role != OUTSIDE && prevType != type;
    }

    TagRole roleOf(char c) {
        switch (c) {
        case 'B':
            return BEGIN;
        case 'I':
            return INSIDE;
        case 'E':
            return END;
        case 'S':
            return SINGLE;
        default:
            return OUTSIDE;
        }
    }
}

ParsedTag charner::parseTag(const std::string& tag, bool suffix) {
    if (tag.empty()) {
        return {OUTSIDE, ""};
    }

    ParsedTag parsed;
    if (suffix) {
        size_t pos = tag.rfind('-');
        parsed.role = roleOf(tag.back());
        parsed.type = pos == std::string::npos ? "" : tag.substr(0, pos);
    } else {
        size_t pos = tag.find('-');
        parsed.role = roleOf(tag.front());
        parsed.type = pos == std::string::npos ? "" : tag.substr(pos + 1);
    }

    if (parsed.role == OUTSIDE) {
        parsed.type.clear();
    }
    return parsed;
}

std::vector<Chunk> charner::getChunks(const TagSequence& tags, bool suffix) {
    std::vector<Chunk> chunks;

    TagRole prevRole = OUTSIDE;
    std::string prevType;
    int begin = 0;

    // one step past the end acts as a trailing outside label
    for (size_t i = 0; i <= tags.size(); ++i) {
        ParsedTag current = i < tags.size() ? parseTag(tags[i], suffix) : ParsedTag{OUTSIDE, ""};

        if (endOfChunk(prevRole, current.role, prevType, current.type)) {
            chunks.push_back({prevType, begin, static_cast<int>(i)});
        }
        if (startOfChunk(prevRole, current.role, prevType, current.type)) {
            begin = static_cast<int>(i);
        }

        prevRole = current.role;
        prevType = current.type;
    }
    return chunks;
}
