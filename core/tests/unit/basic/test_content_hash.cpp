#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "reqtrace/basic/content_hash.hpp"

using namespace reqtrace;

TEST(ContentHash, Sha256KnownDigests)
{
  EXPECT_EQ(sha256_hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(ContentHash, CollapseWhitespace)
{
  EXPECT_EQ(collapse_whitespace("  a   b\t\nc  "), "a b c");
  EXPECT_EQ(collapse_whitespace(""), "");
  EXPECT_EQ(collapse_whitespace("   "), "");
}

TEST(ContentHash, NormalizedLayout)
{
  const std::vector<std::pair<std::string, std::string>> assertions = {
    {"A", "The system SHALL   log in."},
    {"B", "  The system SHALL\nlog out. "},
  };
  const std::string text = normalize_for_hash("  Login ", "\n\n  First line  \nSecond\n\n", assertions);
  EXPECT_EQ(
    text,
    "Login\n"
    "First line\n"
    "Second\n"
    "A. The system SHALL log in.\n"
    "B. The system SHALL log out.");
}

TEST(ContentHash, ShortHashIsPrefixOfDigest)
{
  const std::vector<std::pair<std::string, std::string>> assertions = {{"A", "Do it."}};
  const std::string full = sha256_hex(normalize_for_hash("Title", "Body", assertions));
  const std::string short_hash = content_hash("Title", "Body", assertions);
  ASSERT_EQ(short_hash.size(), k_content_hash_length);
  EXPECT_EQ(short_hash, full.substr(0, k_content_hash_length));
}

TEST(ContentHash, IgnoresIncidentalWhitespace)
{
  const std::vector<std::pair<std::string, std::string>> a = {{"A", "Do  it."}};
  const std::vector<std::pair<std::string, std::string>> b = {{"A", " Do it. "}};
  EXPECT_EQ(content_hash("Title", "Body\n", a), content_hash(" Title", "\nBody", b));
}

TEST(ContentHash, ChangesWithContent)
{
  const std::vector<std::pair<std::string, std::string>> a = {{"A", "Do it."}};
  const std::vector<std::pair<std::string, std::string>> b = {{"A", "Do it now."}};
  const std::string base = content_hash("Title", "Body", a);
  EXPECT_NE(base, content_hash("Title", "Body", b));
  EXPECT_NE(base, content_hash("Other", "Body", a));
  EXPECT_NE(base, content_hash("Title", "Body changed", a));
  EXPECT_NE(base, content_hash("Title", "Body", {{"B", "Do it."}}));
}
