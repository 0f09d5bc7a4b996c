#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "reqtrace/basic/diagnostic.hpp"
#include "reqtrace/basic/diagnostic_printer.hpp"
#include "reqtrace/basic/source_manager.hpp"

using namespace reqtrace;

TEST(DiagnosticBag, BuilderAddsOnDestruction)
{
  DiagnosticBag bag;
  {
    auto builder = bag.report_error(SourceLocation{"spec/prd.md", 4, {}}, "broken");
    builder.with_code("broken-link").with_node("REQ-p00001");
    EXPECT_TRUE(bag.empty());
  }
  ASSERT_EQ(bag.size(), 1U);
  const Diagnostic & d = bag.all().front();
  EXPECT_EQ(d.severity, Severity::Error);
  EXPECT_EQ(d.code, "broken-link");
  ASSERT_TRUE(d.node_id.has_value());
  EXPECT_EQ(*d.node_id, "REQ-p00001");
  ASSERT_TRUE(d.location.has_value());
  EXPECT_EQ(d.location->line, 4U);
}

TEST(DiagnosticBag, CountsBySeverityAndCode)
{
  DiagnosticBag bag;
  bag.report_error("e1").with_code("cycle");
  bag.report_warning("w1").with_code("orphan");
  bag.report_warning("w2").with_code("orphan");
  bag.report_info("i1").with_code("coverage-gap");

  EXPECT_TRUE(bag.has_errors());
  EXPECT_TRUE(bag.has_warnings());
  EXPECT_EQ(bag.count(Severity::Error), 1U);
  EXPECT_EQ(bag.count(Severity::Warning), 2U);
  EXPECT_EQ(bag.count(Severity::Info), 1U);
  EXPECT_EQ(bag.count_code("orphan"), 2U);
  EXPECT_EQ(bag.with_code("cycle").size(), 1U);
  EXPECT_EQ(bag.errors().size(), 1U);
  EXPECT_EQ(bag.warnings().size(), 2U);
}

TEST(DiagnosticBag, MergeAppendsInOrder)
{
  DiagnosticBag a;
  a.report_error("first");
  DiagnosticBag b;
  b.report_warning("second");
  b.report_info("third");

  a.merge(std::move(b));
  ASSERT_EQ(a.size(), 3U);
  EXPECT_EQ(a.all()[0].message, "first");
  EXPECT_EQ(a.all()[1].message, "second");
  EXPECT_EQ(a.all()[2].message, "third");
}

TEST(DiagnosticBag, LabelsUseDiagnosticLocation)
{
  DiagnosticBag bag;
  bag.report_error(SourceLocation{"a.md", 3, {}}, "bad id")
    .with_label(5, 4, "here")
    .with_fixit(5, 4, "REQ-p00001");

  const Diagnostic & d = bag.all().front();
  const Label * primary = d.primary_label();
  ASSERT_NE(primary, nullptr);
  EXPECT_EQ(primary->location.path, "a.md");
  EXPECT_EQ(primary->location.line, 3U);
  EXPECT_EQ(primary->column, 5U);
  ASSERT_EQ(d.fixits.size(), 1U);
  EXPECT_EQ(d.fixits[0].replacement_text, "REQ-p00001");
}

TEST(SourceLocation, ToString)
{
  EXPECT_EQ((SourceLocation{"a.md", 3, {}}).to_string(), "a.md:3");
  EXPECT_EQ((SourceLocation{"a.md", 3, 9U}).to_string(), "a.md:3-9");
  EXPECT_EQ((SourceLocation{"a.md", 0, {}}).to_string(), "a.md");
  EXPECT_EQ((SourceLocation{}).to_string(), "<unknown>");
}

TEST(SourceRegistry, LinesAndLookup)
{
  SourceRegistry registry;
  const FileId id = registry.register_file("spec/prd.md", "line one\nline two\n");
  ASSERT_TRUE(id.is_valid());
  EXPECT_EQ(registry.register_file("spec/prd.md", "ignored"), id);

  const SourceFile * file = registry.find_file("spec/prd.md");
  ASSERT_NE(file, nullptr);
  EXPECT_EQ(file->line_count(), 2U);
  EXPECT_EQ(file->get_line(1), "line two");
  EXPECT_EQ(registry.find_file("missing.md"), nullptr);
}

TEST(DiagnosticPrinter, PlainOutputShowsSourceLine)
{
  SourceRegistry registry;
  registry.register_file("spec/dev.md", "# REQ-d00001: Title\n**Implements**: REQ-p00999\n");

  DiagnosticBag bag;
  bag.report_error(SourceLocation{"spec/dev.md", 2, {}}, "REQ-d00001 implements REQ-p00999")
    .with_code("broken-link")
    .with_label(17, 10, "no such requirement")
    .with_help("check the identifier");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(bag, registry);

  const std::string text = out.str();
  EXPECT_NE(text.find("error[broken-link]: REQ-d00001 implements REQ-p00999"), std::string::npos)
    << text;
  EXPECT_NE(text.find("spec/dev.md:2:17"), std::string::npos) << text;
  EXPECT_NE(text.find("**Implements**: REQ-p00999"), std::string::npos) << text;
  EXPECT_NE(text.find("^^^^^^^^^^ no such requirement"), std::string::npos) << text;
  EXPECT_NE(text.find("check the identifier"), std::string::npos) << text;
}

TEST(DiagnosticPrinter, OrdersByPathAndLine)
{
  SourceRegistry registry;
  DiagnosticBag bag;
  bag.report_warning("no location");
  bag.report_warning(SourceLocation{"b.md", 1, {}}, "b1");
  bag.report_warning(SourceLocation{"a.md", 9, {}}, "a9");
  bag.report_warning(SourceLocation{"a.md", 2, {}}, "a2");

  std::ostringstream out;
  DiagnosticPrinter(out, false).print_all(bag, registry);
  const std::string text = out.str();

  const auto a2 = text.find("a2");
  const auto a9 = text.find("a9");
  const auto b1 = text.find("b1");
  const auto none = text.find("no location");
  ASSERT_NE(a2, std::string::npos);
  EXPECT_LT(a2, a9);
  EXPECT_LT(a9, b1);
  EXPECT_LT(b1, none);
}
