// reqtrace/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "reqtrace/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace reqtrace
{

namespace
{

std::string display_path(const std::string & path)
{
  if (path.empty()) {
    return "<unknown>";
  }
  std::error_code ec;
  auto rel_path = std::filesystem::relative(path, std::filesystem::current_path(), ec);
  if (ec || rel_path.empty() || rel_path.native().rfind("..", 0) == 0) {
    return path;
  }
  return rel_path.string();
}

std::string clean_line(std::string_view line)
{
  std::string cleaned;
  cleaned.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      cleaned += "    ";
    } else if (c != '\r' && c != '\n') {
      cleaned += c;
    }
  }
  return cleaned;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceRegistry & sources)
{
  // === Header line: error[CODE]: message ===
  print_severity_header(diag);

  // === Location line: --> file:line:col ===
  if (diag.location && diag.location->is_valid()) {
    const Label * primary = diag.primary_label();
    const uint32_t column = (primary != nullptr && primary->column > 0) ? primary->column : 1;
    fmt::print(
      os_, "{} {}:{}:{}\n", gutter_arrow(), display_path(diag.location->path),
      diag.location->line, column);
  } else if (diag.location) {
    fmt::print(os_, "{} {}\n", gutter_arrow(), display_path(diag.location->path));
  }

  if (diag.node_id) {
    print_note(fmt::format("node: {}", *diag.node_id));
  }

  // === Labels (source snippets) ===
  if (!diag.labels.empty()) {
    fmt::print(os_, "{}\n", gutter_pipe());
  }
  for (const auto & label : diag.labels) {
    print_label_context(label, sources);
  }

  // === Fix-its ===
  for (const auto & f : diag.fixits) {
    print_fixit(f, sources);
  }

  // === Help message ===
  if (diag.help_message) {
    print_help(*diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceRegistry & sources)
{
  std::vector<Diagnostic> sorted_diags;
  sorted_diags.reserve(diags.size());
  std::copy(diags.begin(), diags.end(), std::back_inserter(sorted_diags));

  // Diagnostics without a location go last
  std::stable_sort(
    sorted_diags.begin(), sorted_diags.end(), [](const Diagnostic & a, const Diagnostic & b) {
      if (a.location.has_value() != b.location.has_value()) {
        return a.location.has_value();
      }
      if (!a.location) {
        return false;
      }
      if (a.location->path != b.location->path) {
        return a.location->path < b.location->path;
      }
      return a.location->line < b.location->line;
    });

  for (const auto & d : sorted_diags) {
    print(d, sources);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  if (use_color_) {
    os_ << rang::style::bold;
    switch (diag.severity) {
      case Severity::Error:
        os_ << rang::fg::red;
        break;
      case Severity::Warning:
        os_ << rang::fg::yellow;
        break;
      case Severity::Info:
        os_ << rang::fg::cyan;
        break;
      case Severity::Hint:
        os_ << rang::fg::green;
        break;
    }
    os_ << to_string(diag.severity);
    if (!diag.code.empty()) {
      os_ << "[" << diag.code << "]";
    }
    os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
  } else if (!diag.code.empty()) {
    fmt::print(os_, "{}[{}]: {}\n", to_string(diag.severity), diag.code, diag.message);
  } else {
    fmt::print(os_, "{}: {}\n", to_string(diag.severity), diag.message);
  }
}

void DiagnosticPrinter::print_label_context(const Label & label, const SourceRegistry & sources)
{
  const SourceFile * source =
    label.location.is_valid() ? sources.find_file(label.location.path) : nullptr;
  if (source == nullptr) {
    if (!label.message.empty()) {
      if (label.location.is_valid()) {
        print_note(fmt::format("{}: {}", label.location.to_string(), label.message));
      } else {
        print_note(label.message);
      }
    }
    return;
  }

  const uint32_t start_col = label.column > 0 ? label.column : 1;
  uint32_t end_col = start_col + (label.length > 0 ? label.length : 1);
  if (label.column == 0) {
    end_col = static_cast<uint32_t>(source->get_line(label.location.line - 1).size()) + 1;
  }

  print_source_line(
    *source, label.location.line - 1, start_col, end_col, label.style, label.message);
}

void DiagnosticPrinter::print_source_line(
  const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
  LabelStyle style, std::string_view label_message)
{
  const std::string_view line = source.get_line(line_index);

  if (line.empty()) {
    return;
  }

  const uint32_t line_num = line_index + 1;

  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", line_num);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", line_num);
  }
  fmt::print(os_, "{}\n", clean_line(line));

  fmt::print(os_, "      {} ", gutter_pipe_only());

  // Skip to start column (handle tabs)
  std::string marker_prefix;
  uint32_t visual_col = 1;
  for (size_t char_idx = 0; visual_col < start_col && char_idx < line.size(); ++char_idx) {
    if (line[char_idx] == '\t') {
      marker_prefix += "    ";
    } else {
      marker_prefix += ' ';
    }
    visual_col++;
  }

  const size_t marker_len = (end_col > start_col) ? (end_col - start_col) : 1;
  const char marker_char = (style == LabelStyle::Primary) ? '^' : '-';

  fmt::print(os_, "{}", marker_prefix);
  if (use_color_) {
    if (style == LabelStyle::Primary) {
      os_ << rang::fg::red << rang::style::bold;
    } else {
      os_ << rang::fg::cyan;
    }
  }
  fmt::print(os_, "{}", std::string(marker_len, marker_char));
  if (!label_message.empty()) {
    fmt::print(os_, " {}", label_message);
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_fixit(const FixIt & fixit, const SourceRegistry & sources)
{
  const SourceFile * source =
    fixit.location.is_valid() ? sources.find_file(fixit.location.path) : nullptr;

  fmt::print(os_, "{}\n", gutter_pipe());
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "help" << rang::style::reset << rang::fg::reset;
    fmt::print(os_, ": replace with '{}'\n", fixit.replacement_text);
  } else {
    fmt::print(os_, "help: replace with '{}'\n", fixit.replacement_text);
  }

  if (source == nullptr || fixit.column == 0) {
    return;
  }

  // Show the line with the replacement applied
  std::string fixed_line(source->get_line(fixit.location.line - 1));
  const size_t start = fixit.column - 1;
  if (start > fixed_line.size()) {
    return;
  }
  fixed_line.replace(start, fixit.length, fixit.replacement_text);

  fmt::print(os_, "{}\n", gutter_pipe());
  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", fixit.location.line);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", fixit.location.line);
  }
  fmt::print(os_, "{}\n", clean_line(fixed_line));

  fmt::print(os_, "      {} {}", gutter_pipe_only(), std::string(start, ' '));
  const std::string marker(std::max<size_t>(fixit.replacement_text.size(), 1), '+');
  if (use_color_) {
    os_ << rang::fg::green << rang::style::bold << marker << rang::style::reset << rang::fg::reset;
  } else {
    fmt::print(os_, "{}", marker);
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "   = help: {}\n", message);
  }
}

void DiagnosticPrinter::print_note(std::string_view message)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "note: {}\n", message);
  } else {
    fmt::print(os_, "   = note: {}\n", message);
  }
}

// =============================================================================
// Gutter helpers (Rust-style)
// =============================================================================

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}{} -->{}", "\033[1;36m", " ", "\033[0m");
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

std::string DiagnosticPrinter::gutter_pipe_only() const
{
  if (use_color_) {
    return fmt::format("{}|{}", "\033[1;36m", "\033[0m");
  }
  return "|";
}

}  // namespace reqtrace
