#ifndef PARLEY_UTILS_TEXT_UTILS_HPP
#define PARLEY_UTILS_TEXT_UTILS_HPP

#include <string>
#include <cstddef>

namespace parley {
namespace utils {

constexpr const char* DEFAULT_TITLE = "New Chat";
constexpr size_t MAX_TITLE_LENGTH = 40;
constexpr size_t MAX_PREVIEW_LENGTH = 50;

/**
 * @brief Derive a conversation title from seed text
 *
 * Drops every character that is not a word character or whitespace, trims
 * the result and cuts it to MAX_TITLE_LENGTH. Falls back to DEFAULT_TITLE
 * when nothing is left.
 */
std::string derive_title(const std::string& seed);

// First max_chars UTF-8 characters of content, never splitting a sequence.
std::string preview(const std::string& content, size_t max_chars = MAX_PREVIEW_LENGTH);

std::string trim(const std::string& text);

} // namespace utils
} // namespace parley

#endif // PARLEY_UTILS_TEXT_UTILS_HPP
