#include <gtest/gtest.h>

#include <string>

#include "reqtrace/syntax/identifier.hpp"

using namespace reqtrace;

namespace
{

std::string suggestion_for(const std::string & text)
{
  const auto r = parse_identifier(text);
  EXPECT_FALSE(r) << text;
  return r.failure.suggestion.value_or("");
}

}  // namespace

TEST(Identifier, ParsesQualifiedForm)
{
  const auto r = parse_identifier("REQ-p00001");
  ASSERT_TRUE(r);
  EXPECT_FALSE(r.identifier.ns.has_value());
  EXPECT_EQ(r.identifier.level, Level::Product);
  EXPECT_EQ(r.identifier.sequence, 1U);
  EXPECT_FALSE(r.identifier.is_assertion_scoped());
  EXPECT_EQ(r.identifier.form, IdentifierForm::Qualified);
  EXPECT_EQ(r.identifier.to_string(), "REQ-p00001");
}

TEST(Identifier, ParsesNamespaceAndLabels)
{
  const auto r = parse_identifier("CAL-REQ-d00042-A-C");
  ASSERT_TRUE(r);
  ASSERT_TRUE(r.identifier.ns.has_value());
  EXPECT_EQ(*r.identifier.ns, "CAL");
  EXPECT_EQ(r.identifier.level, Level::Development);
  EXPECT_EQ(r.identifier.sequence, 42U);
  ASSERT_EQ(r.identifier.assertion_labels.size(), 2U);
  EXPECT_EQ(r.identifier.assertion_labels[0], 'A');
  EXPECT_EQ(r.identifier.assertion_labels[1], 'C');
  EXPECT_EQ(r.identifier.key(), "CAL-REQ-d00042");
  EXPECT_EQ(r.identifier.to_string(), "CAL-REQ-d00042-A-C");
}

TEST(Identifier, ParsesBareForm)
{
  const auto r = parse_identifier("o00003");
  ASSERT_TRUE(r);
  EXPECT_EQ(r.identifier.form, IdentifierForm::Bare);
  EXPECT_EQ(r.identifier.level, Level::Operational);
  // Rendering is always qualified
  EXPECT_EQ(r.identifier.to_string(), "REQ-o00003");
}

TEST(Identifier, BareFormCanBeDisabled)
{
  IdentifierConfig cfg;
  cfg.allow_bare = false;
  EXPECT_FALSE(parse_identifier("p00001", cfg));
  EXPECT_TRUE(parse_identifier("REQ-p00001", cfg));
}

TEST(Identifier, RoundTripsCanonicalText)
{
  for (const std::string text :
       {"REQ-p00001", "REQ-o00017", "REQ-d99999", "REQ-p00001-A", "REQ-d00002-B-D",
        "ABC-REQ-o00010-Z"}) {
    const auto r = parse_identifier(text);
    ASSERT_TRUE(r) << text;
    EXPECT_EQ(r.identifier.to_string(), text);
    const auto again = parse_identifier(r.identifier.to_string());
    ASSERT_TRUE(again);
    EXPECT_EQ(again.identifier, r.identifier);
  }
}

TEST(Identifier, CustomPrefixAndDigits)
{
  IdentifierConfig cfg;
  cfg.prefix = "SYS";
  cfg.digits = 3;

  const auto r = parse_identifier("SYS-d042", cfg);
  ASSERT_TRUE(r);
  EXPECT_EQ(r.identifier.sequence, 42U);
  EXPECT_EQ(r.identifier.to_string(cfg), "SYS-d042");
  EXPECT_FALSE(parse_identifier("SYS-d00042", cfg));
  EXPECT_FALSE(parse_identifier("REQ-d042", cfg));
}

TEST(Identifier, RejectsWrongDigitCount)
{
  EXPECT_FALSE(parse_identifier("REQ-p0001"));
  EXPECT_FALSE(parse_identifier("REQ-p000001"));
}

TEST(Identifier, SuggestsFixForKnownMistakes)
{
  EXPECT_EQ(suggestion_for("req-p00001"), "REQ-p00001");
  EXPECT_EQ(suggestion_for("REQ-P00001"), "REQ-p00001");
  EXPECT_EQ(suggestion_for("REQ_p00001"), "REQ-p00001");
  EXPECT_EQ(suggestion_for("REQp00001"), "REQ-p00001");
  EXPECT_EQ(suggestion_for("REQ-p1"), "REQ-p00001");
  EXPECT_EQ(suggestion_for("REQ-p00001-a"), "REQ-p00001-A");
  EXPECT_EQ(suggestion_for("cal-REQ-p00001"), "CAL-REQ-p00001");
  EXPECT_EQ(suggestion_for("RQE-p00001"), "REQ-p00001");
  EXPECT_EQ(suggestion_for("REQ-p00001-AB"), "REQ-p00001-A-B");
}

TEST(Identifier, NoSuggestionForUnrelatedText)
{
  const auto r = parse_identifier("hello");
  EXPECT_FALSE(r);
  EXPECT_FALSE(r.failure.message.empty());
  EXPECT_FALSE(r.failure.suggestion.has_value());
}

TEST(Identifier, DuplicateLabelIsRejected)
{
  const auto r = parse_identifier("REQ-p00001-A-A");
  EXPECT_FALSE(r);
  EXPECT_FALSE(r.failure.suggestion.has_value());
}

TEST(Identifier, SuggestIdentifierReturnsReason)
{
  const auto fix = suggest_identifier("REQ_p00001");
  ASSERT_TRUE(fix.has_value());
  EXPECT_EQ(fix->text, "REQ-p00001");
  EXPECT_FALSE(fix->reason.empty());

  EXPECT_FALSE(suggest_identifier("hello").has_value());
}

TEST(Identifier, LooksLikeIdentifier)
{
  EXPECT_TRUE(looks_like_identifier("REQ-p00001"));
  EXPECT_TRUE(looks_like_identifier("CAL-REQ-p00001"));
  EXPECT_FALSE(looks_like_identifier("Requirements"));
  EXPECT_FALSE(looks_like_identifier("Assertions"));
}

TEST(Identifier, ExpandLabels)
{
  const auto r = parse_identifier("REQ-p00001-A-C");
  ASSERT_TRUE(r);
  const auto parts = expand_labels(r.identifier);
  ASSERT_EQ(parts.size(), 2U);
  EXPECT_EQ(parts[0].to_string(), "REQ-p00001-A");
  EXPECT_EQ(parts[1].to_string(), "REQ-p00001-C");

  const auto plain = parse_identifier("REQ-p00001");
  ASSERT_TRUE(plain);
  const auto single = expand_labels(plain.identifier);
  ASSERT_EQ(single.size(), 1U);
  EXPECT_EQ(single[0], plain.identifier);
}

TEST(Identifier, RequirementAndWithLabel)
{
  const auto r = parse_identifier("REQ-o00002-B");
  ASSERT_TRUE(r);
  EXPECT_EQ(r.identifier.requirement().to_string(), "REQ-o00002");
  EXPECT_EQ(r.identifier.requirement().with_label('D').to_string(), "REQ-o00002-D");
}

TEST(Level, ParseAcceptsShortLongAndCodeNames)
{
  EXPECT_EQ(parse_level("prd"), Level::Product);
  EXPECT_EQ(parse_level("PRD"), Level::Product);
  EXPECT_EQ(parse_level("Product"), Level::Product);
  EXPECT_EQ(parse_level("p"), Level::Product);
  EXPECT_EQ(parse_level("ops"), Level::Operational);
  EXPECT_EQ(parse_level("Operations"), Level::Operational);
  EXPECT_EQ(parse_level("operational"), Level::Operational);
  EXPECT_EQ(parse_level("dev"), Level::Development);
  EXPECT_EQ(parse_level("Development"), Level::Development);
  EXPECT_EQ(parse_level("D"), Level::Development);
  EXPECT_FALSE(parse_level("system").has_value());
}

TEST(Level, ToString)
{
  EXPECT_EQ(to_string(Level::Product), "prd");
  EXPECT_EQ(to_string(Level::Operational), "ops");
  EXPECT_EQ(to_string(Level::Development), "dev");
}
