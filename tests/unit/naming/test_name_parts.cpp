#include <gtest/gtest.h>

#include "depot/naming/name_parts.hpp"

using depot::naming::NameParts;

class NamePartsTest : public ::testing::Test {};

TEST_F(NamePartsTest, ExtensionAcceptsCommonExtensions) {
  EXPECT_EQ(NameParts::extension("abc123.zip"), ".zip");
  EXPECT_EQ(NameParts::extension("something.mp4"), ".mp4");
  EXPECT_EQ(NameParts::extension("photo.JPEG"), ".JPEG");
  EXPECT_EQ(NameParts::extension("archive.tar.gz"), ".gz");
}

TEST_F(NamePartsTest, ExtensionRejectsNumericOnlyGroups) {
  EXPECT_EQ(NameParts::extension("abc123.1"), "");
  EXPECT_EQ(NameParts::extension("something.342"), "");
}

TEST_F(NamePartsTest, ExtensionRejectsMissingOrOddShapes) {
  EXPECT_EQ(NameParts::extension("abc123"), "");
  EXPECT_EQ(NameParts::extension("file."), "");
  EXPECT_EQ(NameParts::extension("short.x"), "");
  EXPECT_EQ(NameParts::extension("long.abcdefghijk"), "");
  EXPECT_EQ(NameParts::extension("dashed.tar-gz"), "");
  EXPECT_EQ(NameParts::extension(".hidden"), "");
}

TEST_F(NamePartsTest, ExtensionAcceptsTenCharacters) {
  EXPECT_EQ(NameParts::extension("long.abcdefghij"), ".abcdefghij");
}

TEST_F(NamePartsTest, IsValidExtension) {
  EXPECT_TRUE(NameParts::isValidExtension(".jpg"));
  EXPECT_TRUE(NameParts::isValidExtension(".m4a"));
  EXPECT_FALSE(NameParts::isValidExtension(""));
  EXPECT_FALSE(NameParts::isValidExtension("."));
  EXPECT_FALSE(NameParts::isValidExtension(".1"));
  EXPECT_FALSE(NameParts::isValidExtension("jpg"));
}

TEST_F(NamePartsTest, SuffixOnlyMatchesTrailingPosition) {
  EXPECT_EQ(NameParts::suffix("abc_o_123.jpg", ".jpg", "_o"), "");
  EXPECT_EQ(NameParts::suffix("abc123_o.jpg", ".jpg", "_o"), "_o");
  EXPECT_EQ(NameParts::suffix("abc_o_123", "", "_o"), "");
  EXPECT_EQ(NameParts::suffix("abc123_o", "", "_o"), "_o");
}

TEST_F(NamePartsTest, SuffixIsCheckedBeforeTheExtension) {
  // The marker has to sit on the stem, not on the extension
  EXPECT_EQ(NameParts::suffix("photo.jpg", ".jpg", "jpg"), "");
  EXPECT_EQ(NameParts::suffix("photo_o.png", ".png", "_o"), "_o");
}

TEST_F(NamePartsTest, SuffixWithCustomOrEmptyCandidate) {
  EXPECT_EQ(NameParts::suffix("avatar_thumb.png", ".png", "_thumb"), "_thumb");
  EXPECT_EQ(NameParts::suffix("avatar_thumb.png", ".png", "_o"), "");
  EXPECT_EQ(NameParts::suffix("avatar.png", ".png", ""), "");
}

TEST_F(NamePartsTest, StemStripsExtensionAndSuffix) {
  EXPECT_EQ(NameParts::stem("abc123_o.jpg", ".jpg", "_o"), "abc123");
  EXPECT_EQ(NameParts::stem("abc123.jpg", ".jpg", ""), "abc123");
  EXPECT_EQ(NameParts::stem("something.1", "", ""), "something.1");
  EXPECT_EQ(NameParts::stem("_o.jpg", ".jpg", "_o"), "");
}
