#define PCRE2_CODE_UNIT_WIDTH 8
#include <pcre2.h>
#include <fstream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include "CharNER/tokenizer_utils.hpp"

namespace charner
{

    // RAII wrapper for a compiled PCRE2 pattern, read-only once compiled
    class PCRE2Resource
    {
    private:
        pcre2_code *pattern_;

    public:
        PCRE2Resource() : pattern_(nullptr) {}

        ~PCRE2Resource()
        {
            if (pattern_)
                pcre2_code_free(pattern_);
        }

        PCRE2Resource(const PCRE2Resource &) = delete;
        PCRE2Resource &operator=(const PCRE2Resource &) = delete;

        void compilePattern(const char *pattern, uint32_t options)
        {
            int errorcode;
            PCRE2_SIZE erroroffset;

            pattern_ = pcre2_compile(
                reinterpret_cast<PCRE2_SPTR>(pattern),
                PCRE2_ZERO_TERMINATED,
                options,
                &errorcode,
                &erroroffset,
                nullptr);

            if (!pattern_)
            {
                PCRE2_UCHAR buffer[256];
                pcre2_get_error_message(errorcode, buffer, sizeof(buffer));
                throw std::runtime_error("PCRE2 compilation failed at offset " +
                                         std::to_string(erroroffset) + ": " +
                                         reinterpret_cast<char *>(buffer));
            }

            pcre2_jit_compile(pattern_, PCRE2_JIT_COMPLETE);
        }

        pcre2_code *pattern() const { return pattern_; }
    };

    // Match state owned by a single call; the compiled pattern is shared.
    class PCRE2MatchData
    {
    private:
        pcre2_match_data *match_data_;

    public:
        explicit PCRE2MatchData(const pcre2_code *pattern)
            : match_data_(pcre2_match_data_create_from_pattern(pattern, nullptr))
        {
            if (!match_data_)
            {
                throw std::runtime_error("Failed to create PCRE2 match data");
            }
        }

        ~PCRE2MatchData()
        {
            pcre2_match_data_free(match_data_);
        }

        PCRE2MatchData(const PCRE2MatchData &) = delete;
        PCRE2MatchData &operator=(const PCRE2MatchData &) = delete;

        pcre2_match_data *get() const { return match_data_; }
        PCRE2_SIZE *getOvectorPointer() const
        {
            return pcre2_get_ovector_pointer(match_data_);
        }
    };

    struct CharSplitter::Implementation
    {
        PCRE2Resource pcre2;
    };

    std::string LoadBytesFromFile(const std::string &path)
    {
        std::ifstream fs(path, std::ios::in | std::ios::binary);
        if (!fs)
        {
            throw std::runtime_error("Cannot open file: " + path);
        }

        fs.seekg(0, std::ios::end);
        std::string data;
        data.reserve(fs.tellg());
        fs.seekg(0, std::ios::beg);

        data.assign(
            std::istreambuf_iterator<char>(fs),
            std::istreambuf_iterator<char>());

        return data;
    }

    // One label per line, line number is the class index.
    LabelVocabulary LoadLabels(const std::string &path)
    {
        std::ifstream fs(path);
        if (!fs)
        {
            throw std::runtime_error("Cannot open label file: " + path);
        }

        std::vector<std::string> labels;
        std::string line;
        while (std::getline(fs, line))
        {
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            labels.push_back(line);
        }
        while (!labels.empty() && labels.back().empty())
            labels.pop_back();

        if (labels.empty())
        {
            throw std::runtime_error("Label file is empty: " + path);
        }
        return LabelVocabulary(labels);
    }

    CharSplitter::CharSplitter()
        : pimpl(std::make_unique<Implementation>())
    {
        // one match per code point, line breaks included
        pimpl->pcre2.compilePattern(".", PCRE2_UTF | PCRE2_DOTALL);
    }

    CharSplitter::~CharSplitter() = default;

    CharSequence CharSplitter::call(const std::string &text) const
    {
        CharSequence chars;
        chars.reserve(text.length());

        PCRE2MatchData match_data(pimpl->pcre2.pattern());
        PCRE2_SIZE *ovector = match_data.getOvectorPointer();
        const size_t subject_length = text.length();
        size_t start_offset = 0;

        while (start_offset < subject_length)
        {
            int rc = pcre2_match(
                pimpl->pcre2.pattern(),
                reinterpret_cast<PCRE2_SPTR>(text.c_str()),
                subject_length,
                start_offset,
                start_offset == 0 ? 0 : PCRE2_NO_UTF_CHECK, // subject validated on the first match
                match_data.get(),
                nullptr);

            if (rc < 0)
            {
                if (rc <= PCRE2_ERROR_UTF8_ERR1 && rc >= PCRE2_ERROR_UTF8_ERR21)
                {
                    throw InvalidInputType("Text is not valid UTF-8 at offset " +
                                           std::to_string(ovector[0]));
                }
                if (rc != PCRE2_ERROR_NOMATCH)
                {
                    PCRE2_UCHAR buffer[256];
                    pcre2_get_error_message(rc, buffer, sizeof(buffer));
                    throw std::runtime_error("PCRE2 matching error: " +
                                             std::string(reinterpret_cast<char *>(buffer)));
                }
                break;
            }

            const size_t start = ovector[0];
            const size_t end = ovector[1];

            chars.push_back(text.substr(start, end - start));

            start_offset = end;
        }

        return chars;
    }

    bool CharSplitter::isSingleChar(const std::string &token) const
    {
        if (token.empty())
            return false;
        return call(token).size() == 1;
    }

}
