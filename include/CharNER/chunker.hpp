#pragma once

#include <string>
#include <vector>

#include "charner_structs.hpp"

namespace charner {
    enum TagRole {
        OUTSIDE,
        BEGIN,
        INSIDE,
        END,
        SINGLE
    };

    struct ParsedTag {
        TagRole role;
        std::string type;
    };

    ParsedTag parseTag(const std::string& tag, bool suffix = false);

    // Never throws; malformed transitions become boundary-implied chunks.
    std::vector<Chunk> getChunks(const TagSequence& tags, bool suffix = false);
}
