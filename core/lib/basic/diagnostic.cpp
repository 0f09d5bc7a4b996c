// reqtrace/basic/diagnostic.cpp - Diagnostic implementation
#include "reqtrace/basic/diagnostic.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace reqtrace
{

std::string_view to_string(Severity severity) noexcept
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "info";
    case Severity::Hint:
      return "hint";
  }
  return "error";
}

const Label * Diagnostic::primary_label() const noexcept
{
  for (const auto & l : labels) {
    if (l.style == LabelStyle::Primary) {
      return &l;
    }
  }
  if (!labels.empty()) {
    return &labels.front();
  }
  return nullptr;
}

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), active_(other.active_)
{
  other.active_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (active_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_code(std::string code)
{
  diagnostic_.code = std::move(code);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_node(std::string node_id)
{
  diagnostic_.node_id = std::move(node_id);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::at(SourceLocation location)
{
  diagnostic_.location = std::move(location);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_label(
  uint32_t column, uint32_t length, std::string msg, LabelStyle style)
{
  Label label;
  if (diagnostic_.location) {
    label.location = *diagnostic_.location;
  }
  label.column = column;
  label.length = length;
  label.message = std::move(msg);
  label.style = style;
  diagnostic_.labels.push_back(std::move(label));
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_secondary_label(
  SourceLocation location, std::string msg)
{
  diagnostic_.labels.push_back(Label{std::move(location), 0, 0, std::move(msg), LabelStyle::Secondary});
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_fixit(
  uint32_t column, uint32_t length, std::string replacement)
{
  FixIt fixit;
  if (diagnostic_.location) {
    fixit.location = *diagnostic_.location;
  }
  fixit.column = column;
  fixit.length = length;
  fixit.replacement_text = std::move(replacement);
  diagnostic_.fixits.push_back(std::move(fixit));
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

DiagnosticBuilder DiagnosticBag::report(Severity severity, std::string message)
{
  Diagnostic d;
  d.severity = severity;
  d.message = std::move(message);
  return {*this, std::move(d)};
}

DiagnosticBuilder DiagnosticBag::report_error(std::string message)
{
  return report(Severity::Error, std::move(message));
}

DiagnosticBuilder DiagnosticBag::report_error(SourceLocation location, std::string message)
{
  auto builder = report(Severity::Error, std::move(message));
  builder.at(std::move(location));
  return builder;
}

DiagnosticBuilder DiagnosticBag::report_warning(std::string message)
{
  return report(Severity::Warning, std::move(message));
}

DiagnosticBuilder DiagnosticBag::report_warning(SourceLocation location, std::string message)
{
  auto builder = report(Severity::Warning, std::move(message));
  builder.at(std::move(location));
  return builder;
}

DiagnosticBuilder DiagnosticBag::report_info(std::string message)
{
  return report(Severity::Info, std::move(message));
}

DiagnosticBuilder DiagnosticBag::report_info(SourceLocation location, std::string message)
{
  auto builder = report(Severity::Info, std::move(message));
  builder.at(std::move(location));
  return builder;
}

DiagnosticBuilder DiagnosticBag::report_hint(SourceLocation location, std::string message)
{
  auto builder = report(Severity::Hint, std::move(message));
  builder.at(std::move(location));
  return builder;
}

void DiagnosticBag::add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

void DiagnosticBag::add(const Diagnostic & diag) { diagnostics_.push_back(diag); }

std::vector<Diagnostic> DiagnosticBag::errors() const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [](const Diagnostic & d) { return d.severity == Severity::Error; });
  return result;
}

std::vector<Diagnostic> DiagnosticBag::warnings() const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [](const Diagnostic & d) { return d.severity == Severity::Warning; });
  return result;
}

bool DiagnosticBag::has_errors() const { return count(Severity::Error) > 0; }

bool DiagnosticBag::has_warnings() const { return count(Severity::Warning) > 0; }

size_t DiagnosticBag::count(Severity severity) const
{
  return static_cast<size_t>(std::count_if(
    diagnostics_.begin(), diagnostics_.end(),
    [severity](const Diagnostic & d) { return d.severity == severity; }));
}

std::vector<Diagnostic> DiagnosticBag::with_code(std::string_view code) const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [code](const Diagnostic & d) { return d.code == code; });
  return result;
}

size_t DiagnosticBag::count_code(std::string_view code) const
{
  return static_cast<size_t>(std::count_if(
    diagnostics_.begin(), diagnostics_.end(),
    [code](const Diagnostic & d) { return d.code == code; }));
}

void DiagnosticBag::merge(DiagnosticBag && other)
{
  diagnostics_.insert(
    diagnostics_.end(), std::make_move_iterator(other.diagnostics_.begin()),
    std::make_move_iterator(other.diagnostics_.end()));
  other.diagnostics_.clear();
}

void DiagnosticBag::merge(const DiagnosticBag & other)
{
  diagnostics_.insert(diagnostics_.end(), other.diagnostics_.begin(), other.diagnostics_.end());
}

}  // namespace reqtrace
