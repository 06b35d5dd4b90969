#include "parley/utils/TextUtils.hpp"
#include <cctype>

namespace parley {
namespace utils {

namespace {
    bool is_title_char(unsigned char c) {
        // Bytes >= 0x80 belong to multi-byte sequences and are dropped.
        return c < 0x80 && (std::isalnum(c) || c == '_' || std::isspace(c));
    }
}

std::string trim(const std::string& text) {
    size_t begin = 0;
    while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    size_t end = text.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::string derive_title(const std::string& seed) {
    std::string cleaned;
    cleaned.reserve(seed.size());
    for (char c : seed) {
        if (is_title_char(static_cast<unsigned char>(c))) {
            cleaned.push_back(c);
        }
    }

    std::string title = trim(cleaned).substr(0, MAX_TITLE_LENGTH);
    if (title.empty()) {
        return DEFAULT_TITLE;
    }
    return title;
}

std::string preview(const std::string& content, size_t max_chars) {
    size_t chars = 0;
    size_t pos = 0;
    while (pos < content.size() && chars < max_chars) {
        unsigned char lead = static_cast<unsigned char>(content[pos]);
        size_t width = 1;
        if ((lead & 0xE0) == 0xC0) {
            width = 2;
        } else if ((lead & 0xF0) == 0xE0) {
            width = 3;
        } else if ((lead & 0xF8) == 0xF0) {
            width = 4;
        }
        pos += width;
        ++chars;
    }
    if (pos > content.size()) {
        pos = content.size();
    }
    return content.substr(0, pos);
}

} // namespace utils
} // namespace parley
