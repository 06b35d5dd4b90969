#include <gtest/gtest.h>

#include "parley/utils/TextUtils.hpp"

using parley::utils::derive_title;
using parley::utils::preview;

TEST(DeriveTitleTest, CleanTextIsKeptAsIs) {
    EXPECT_EQ(derive_title("What licenses do I need"), "What licenses do I need");
}

TEST(DeriveTitleTest, PunctuationIsStripped) {
    EXPECT_EQ(derive_title("I want to start a restaurant!!!"), "I want to start a restaurant");
    EXPECT_EQ(derive_title("GST, PAN & FSSAI?"), "GST PAN  FSSAI");
}

TEST(DeriveTitleTest, SurroundingWhitespaceIsTrimmed) {
    EXPECT_EQ(derive_title("   hello there \n"), "hello there");
    EXPECT_EQ(derive_title("?? hello"), "hello");
}

TEST(DeriveTitleTest, TruncatesToFortyCharacters) {
    const std::string seed = "How do I register a private limited company in Karnataka";
    const std::string title = derive_title(seed);
    EXPECT_EQ(title.size(), 40u);
    EXPECT_EQ(title, seed.substr(0, 40));
}

TEST(DeriveTitleTest, EmptyResultFallsBackToPlaceholder) {
    EXPECT_EQ(derive_title(""), "New Chat");
    EXPECT_EQ(derive_title("!!! ???"), "New Chat");
    EXPECT_EQ(derive_title("    "), "New Chat");
}

TEST(DeriveTitleTest, KeepsUnderscoresAndDropsNonAscii) {
    EXPECT_EQ(derive_title("snake_case name"), "snake_case name");
    EXPECT_EQ(derive_title("caf\xC3\xA9 license"), "caf license");
}

TEST(PreviewTest, ShortContentIsUnchanged) {
    EXPECT_EQ(preview("short"), "short");
    EXPECT_EQ(preview(""), "");
}

TEST(PreviewTest, TruncatesToFiftyCharacters) {
    const std::string content(80, 'x');
    EXPECT_EQ(preview(content), std::string(50, 'x'));
    EXPECT_EQ(preview(content, 10), std::string(10, 'x'));
}

TEST(PreviewTest, NeverSplitsMultiByteCharacters) {
    std::string content;
    for (int i = 0; i < 60; ++i) {
        content += "\xC3\xA9";
    }
    const std::string cut = preview(content);
    EXPECT_EQ(cut.size(), 100u);
    EXPECT_EQ(cut, content.substr(0, 100));
}
