// reqtrace/syntax/document_parser.cpp - Requirement document parser implementation
#include "reqtrace/syntax/document_parser.hpp"

#include <algorithm>
#include <cctype>
#include <functional>

#include "reqtrace/basic/content_hash.hpp"
#include "reqtrace/syntax/keywords.hpp"

namespace reqtrace
{

namespace
{

std::string_view trim(std::string_view s)
{
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
    s.remove_prefix(1);
  }
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
    s.remove_suffix(1);
  }
  return s;
}

bool istarts_with(std::string_view s, std::string_view prefix)
{
  return s.size() >= prefix.size() && syntax::iequals(s.substr(0, prefix.size()), prefix);
}

bool is_alpha(char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0; }
bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }
bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

char to_upper(char c) { return static_cast<char>(std::toupper(static_cast<unsigned char>(c))); }

std::vector<std::string_view> split_view(std::string_view s, char sep)
{
  std::vector<std::string_view> out;
  size_t pos = 0;
  while (true) {
    const size_t next = s.find(sep, pos);
    if (next == std::string_view::npos) {
      out.push_back(s.substr(pos));
      break;
    }
    out.push_back(s.substr(pos, next - pos));
    pos = next + 1;
  }
  return out;
}

std::string lowercase(std::string_view s)
{
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  });
  return out;
}

bool is_no_reference(std::string_view value)
{
  value = trim(value);
  return std::any_of(
    syntax::k_no_reference_values.begin(), syntax::k_no_reference_values.end(),
    [value](std::string_view v) { return syntax::iequals(value, v); });
}

bool is_placeholder_text(std::string_view text)
{
  text = trim(text);
  const auto strip = [](char c) {
    return c == '*' || c == '_' || c == '[' || c == ']' || c == '(' || c == ')' || c == '.';
  };
  while (!text.empty() && strip(text.front())) {
    text.remove_prefix(1);
  }
  while (!text.empty() && strip(text.back())) {
    text.remove_suffix(1);
  }
  text = trim(text);
  if (text.empty()) {
    return true;
  }
  return std::any_of(
    syntax::k_placeholder_texts.begin(), syntax::k_placeholder_texts.end(),
    [text](std::string_view p) { return syntax::iequals(text, p); });
}

/// Cut an expected-broken marker (and anything after it) from a line part
std::string_view strip_marker(std::string_view s, bool & found)
{
  const size_t pos = s.find(syntax::k_expected_broken_marker);
  found = pos != std::string_view::npos;
  if (!found) {
    return s;
  }
  return trim(s.substr(0, pos));
}

std::string join_lines(const std::vector<std::string_view> & lines)
{
  size_t first = 0;
  size_t last = lines.size();
  while (first < last && trim(lines[first]).empty()) {
    ++first;
  }
  while (last > first && trim(lines[last - 1]).empty()) {
    --last;
  }
  std::string out;
  for (size_t i = first; i < last; ++i) {
    if (i > first) {
      out += '\n';
    }
    out += lines[i];
  }
  return out;
}

/// "**Key**: value", "**Key:** value" or "Key: value"
struct Field
{
  std::string_view key;
  std::string_view value;
  bool bold = false;
};

std::optional<Field> parse_field(std::string_view segment)
{
  const std::string_view s = trim(segment);
  size_t i = 0;
  while (i < s.size() && s[i] == '*') {
    ++i;
  }
  const size_t key_start = i;
  while (i < s.size() && is_alpha(s[i])) {
    ++i;
  }
  if (i == key_start) {
    return std::nullopt;
  }
  const std::string_view key = s.substr(key_start, i - key_start);
  while (i < s.size() && (s[i] == '*' || s[i] == ' ')) {
    ++i;
  }
  if (i >= s.size() || s[i] != ':') {
    return std::nullopt;
  }
  ++i;
  while (i < s.size() && (s[i] == '*' || is_space(s[i]))) {
    ++i;
  }
  return Field{key, trim(s.substr(i)), key_start >= 2};
}

std::optional<std::string_view> canonical_metadata_key(std::string_view key)
{
  for (const auto k : syntax::k_metadata_keys) {
    if (syntax::iequals(key, k)) {
      return k;
    }
  }
  return std::nullopt;
}

bool is_reference_key(std::string_view canonical)
{
  return std::find(
           syntax::k_reference_keywords.begin(), syntax::k_reference_keywords.end(),
           canonical) != syntax::k_reference_keywords.end();
}

/**
 * Whether a field counts as metadata. The preamble accepts every metadata
 * key, plain or bold; after it only bold reference keys (or bold near-misses
 * of one) are read.
 */
bool is_metadata_field(const Field & field, bool preamble)
{
  if (!preamble && !field.bold) {
    return false;
  }
  if (const auto canonical = canonical_metadata_key(field.key)) {
    return preamble || is_reference_key(*canonical);
  }
  return syntax::suggest_reference_keyword(field.key).has_value();
}

std::optional<std::string_view> canonical_journey_key(std::string_view key)
{
  for (const auto k : syntax::k_journey_keys) {
    if (syntax::iequals(key, k)) {
      return k;
    }
  }
  return std::nullopt;
}

struct AssertionItem
{
  char label = 0;  // 0 = unlabeled bullet
  std::string_view text;
  bool lowercase = false;
  std::string_view label_text;
};

std::optional<AssertionItem> match_labeled(std::string_view t)
{
  // (A) text
  if (t.size() >= 3 && t[0] == '(' && is_alpha(t[1]) && t[2] == ')') {
    if (t.size() == 3 || is_space(t[3])) {
      return AssertionItem{
        to_upper(t[1]), trim(t.substr(3)), t[1] != to_upper(t[1]), t.substr(1, 1)};
    }
  }
  // A. text / A) text
  if (t.size() >= 2 && is_alpha(t[0]) && (t[1] == '.' || t[1] == ')')) {
    if (t.size() == 2 || is_space(t[2])) {
      return AssertionItem{
        to_upper(t[0]), trim(t.substr(2)), t[0] != to_upper(t[0]), t.substr(0, 1)};
    }
  }
  // 1. text / 1) text
  size_t n = 0;
  while (n < t.size() && is_digit(t[n])) {
    ++n;
  }
  if (n > 0 && n <= 2 && n < t.size() && (t[n] == '.' || t[n] == ')')) {
    if (n + 1 == t.size() || is_space(t[n + 1])) {
      const int number = std::stoi(std::string(t.substr(0, n)));
      if (number >= 1 && number <= 26) {
        return AssertionItem{
          static_cast<char>('A' + number - 1), trim(t.substr(n + 1)), false, t.substr(0, n)};
      }
    }
  }
  return std::nullopt;
}

std::optional<AssertionItem> match_assertion_item(std::string_view t)
{
  if (auto labeled = match_labeled(t)) {
    return labeled;
  }
  if (t.size() >= 2 && (t[0] == '-' || t[0] == '*' || t[0] == '+') && is_space(t[1])) {
    const std::string_view rest = trim(t.substr(2));
    if (auto labeled = match_labeled(rest)) {
      return labeled;
    }
    return AssertionItem{0, rest, false, {}};
  }
  return std::nullopt;
}

}  // namespace

// ============================================================================
// Entry Point
// ============================================================================

ParsedDocument parse_document(
  std::string_view text, const std::string & path, const DocumentParseOptions & options)
{
  ParsedDocument doc;
  doc.path = path;
  syntax::DocumentParser parser(text, path, options, doc.diagnostics);
  parser.parse(doc.requirements, doc.journeys);
  return doc;
}

namespace syntax
{

DocumentParser::DocumentParser(
  std::string_view text, std::string path, const DocumentParseOptions & options,
  DiagnosticBag & diags)
: text_(text), path_(std::move(path)), options_(options), diags_(diags)
{
  for (auto line : split_view(text_, '\n')) {
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    lines_.push_back(line);
  }
  if (!lines_.empty() && lines_.back().empty() && !text_.empty() && text_.back() == '\n') {
    lines_.pop_back();
  }

  if (!options_.root.empty()) {
    const auto rel = std::filesystem::path(path_).lexically_relative(options_.root);
    if (!rel.empty() && rel.native().rfind("..", 0) != 0) {
      subdirectory_ = rel.parent_path().generic_string();
    }
  }
}

void DocumentParser::parse(std::vector<Requirement> & requirements, std::vector<Journey> & journeys)
{
  while (!at_eof()) {
    if (auto header = match_header(cur())) {
      if (istarts_with(header->id_text, k_journey_prefix)) {
        parse_journey_block(*header, journeys);
      } else {
        parse_requirement_block(*header, requirements);
      }
      continue;
    }
    ++idx_;
  }
}

// ============================================================================
// Line helpers
// ============================================================================

uint32_t DocumentParser::column_of(std::string_view part) const noexcept
{
  const std::string_view line = lines_[idx_];
  const std::less<const char *> before;
  if (before(part.data(), line.data()) || before(line.data() + line.size(), part.data())) {
    return 0;
  }
  return static_cast<uint32_t>(part.data() - line.data()) + 1;
}

SourceLocation DocumentParser::here() const { return SourceLocation{path_, line_no(), {}}; }

std::optional<std::string_view> DocumentParser::heading_text(std::string_view line)
{
  size_t i = 0;
  while (i < line.size() && line[i] == '#') {
    ++i;
  }
  if (i == 0 || i > 6 || i >= line.size() || !is_space(line[i])) {
    return std::nullopt;
  }
  return trim(line.substr(i));
}

std::optional<DocumentParser::Header> DocumentParser::match_header(std::string_view line) const
{
  const auto heading = heading_text(line);
  if (!heading || heading->empty()) {
    return std::nullopt;
  }

  Header header;
  const size_t colon = heading->find(':');
  if (colon != std::string_view::npos) {
    header.id_text = trim(heading->substr(0, colon));
    header.title = trim(heading->substr(colon + 1));
  } else {
    // "# REQ-p00001 Title"
    size_t end = 0;
    while (end < heading->size() && !is_space((*heading)[end])) {
      ++end;
    }
    header.id_text = heading->substr(0, end);
    header.title = trim(heading->substr(end));
  }

  if (header.id_text.empty()) {
    return std::nullopt;
  }
  if (istarts_with(header.id_text, k_journey_prefix) && header.id_text.size() > 3 &&
      header.id_text[3] == '-') {
    return header;
  }
  const auto & ids = options_.identifiers;
  if (looks_like_identifier(header.id_text, ids)) {
    return header;
  }
  if (colon != std::string_view::npos) {
    // Misspelled prefix: only qualified corrections count as headers
    if (auto fix = suggest_identifier(header.id_text, ids);
        fix && fix->text.find(ids.prefix) != std::string::npos) {
      return header;
    }
  }
  return std::nullopt;
}

bool DocumentParser::is_end_marker(std::string_view line)
{
  return istarts_with(trim(line), "*End*");
}

void DocumentParser::skip_to_next_header()
{
  while (!at_eof() && !match_header(cur())) {
    ++idx_;
  }
}

std::optional<std::string> DocumentParser::parse_end_hash(std::string_view line)
{
  const std::string lower = lowercase(line);
  const size_t pos = lower.find("hash");
  if (pos == std::string::npos) {
    return std::nullopt;
  }
  size_t i = lower.find(':', pos);
  if (i == std::string::npos) {
    return std::nullopt;
  }
  ++i;
  while (i < lower.size() && (lower[i] == '*' || lower[i] == '`' || is_space(lower[i]))) {
    ++i;
  }
  size_t end = i;
  while (end < lower.size() && std::isalnum(static_cast<unsigned char>(lower[end]))) {
    ++end;
  }
  if (end == i) {
    return std::nullopt;
  }
  return lower.substr(i, end - i);
}

// ============================================================================
// Requirement blocks
// ============================================================================

void DocumentParser::parse_requirement_block(const Header & header, std::vector<Requirement> & out)
{
  const uint32_t header_line = line_no();
  const auto & ids = options_.identifiers;

  auto parsed = parse_identifier(header.id_text, ids);
  if (!parsed) {
    const auto col = column_of(header.id_text);
    const auto len = static_cast<uint32_t>(header.id_text.size());
    auto builder = diags_.report_error(here(), "invalid requirement header");
    builder.with_code("invalid-header").with_label(col, len, parsed.failure.message);
    if (parsed.failure.suggestion) {
      builder.with_help("did you mean '" + *parsed.failure.suggestion + "'?")
        .with_fixit(col, len, *parsed.failure.suggestion);
    }
    ++idx_;
    skip_to_next_header();
    return;
  }

  Identifier id = parsed.identifier;
  id.form = IdentifierForm::Qualified;
  if (id.is_assertion_scoped()) {
    const auto col = column_of(header.id_text);
    diags_.report_error(here(), "a requirement header cannot name an assertion")
      .with_code("invalid-header")
      .with_node(id.to_string(ids))
      .with_label(col, static_cast<uint32_t>(header.id_text.size()), "assertion-scoped identifier")
      .with_help("use '" + id.requirement().to_string(ids) + "'");
    ++idx_;
    skip_to_next_header();
    return;
  }

  Requirement req;
  req.id = id;
  req.level = id.level;
  req.title = std::string(header.title);
  req.location = SourceLocation{path_, header_line, {}};
  req.subdirectory = subdirectory_;
  if (req.title.empty()) {
    diags_.report_warning(here(), "requirement " + id.to_string(ids) + " has no title")
      .with_code("invalid-header")
      .with_node(id.to_string(ids));
  }
  ++idx_;

  Section section = Section::Body;
  bool preamble = true;
  bool status_seen = false;
  bool ended = false;
  uint32_t last_content_line = header_line;
  std::vector<std::string_view> body_lines;
  std::vector<std::string_view> rationale_lines;
  continuation_open_ = false;
  reported_bullet_style_ = false;

  while (!at_eof()) {
    const std::string_view line = cur();
    if (match_header(line)) {
      break;
    }

    if (is_end_marker(line)) {
      req.stored_hash = parse_end_hash(line);
      req.location.end_line = line_no();
      ++idx_;
      size_t look = idx_;
      while (look < lines_.size() && trim(lines_[look]).empty()) {
        ++look;
      }
      if (look < lines_.size() && trim(lines_[look]) == "---") {
        idx_ = look + 1;
      }
      ended = true;
      break;
    }

    if (!trim(line).empty()) {
      last_content_line = line_no();
    }

    if (auto heading = heading_text(line)) {
      if (iequals(*heading, k_assertions_heading)) {
        section = Section::Assertions;
      } else if (iequals(*heading, k_rationale_heading)) {
        section = Section::Rationale;
      } else {
        section = Section::Other;
        body_lines.push_back(line);
      }
      preamble = false;
      continuation_open_ = false;
      ++idx_;
      continue;
    }

    switch (section) {
      case Section::Body:
      case Section::Other:
        if (trim(line).empty()) {
          body_lines.push_back(line);
        } else if (!parse_metadata_line(line, req, status_seen, preamble)) {
          body_lines.push_back(line);
          preamble = false;
        }
        break;
      case Section::Rationale:
        rationale_lines.push_back(line);
        break;
      case Section::Assertions:
        parse_assertion_line(line, req);
        break;
    }
    ++idx_;
  }

  if (!ended) {
    req.location.end_line = last_content_line;
  }
  req.body = join_lines(body_lines);
  if (std::string rationale = join_lines(rationale_lines); !rationale.empty()) {
    req.rationale = std::move(rationale);
  }

  finish_requirement(req, status_seen);
  out.push_back(std::move(req));
}

bool DocumentParser::parse_metadata_line(
  std::string_view line, Requirement & req, bool & status_seen, bool preamble)
{
  const auto segments = split_view(line, '|');
  std::vector<Field> fields;
  for (const auto seg : segments) {
    if (auto field = parse_field(seg)) {
      fields.push_back(*field);
    } else if (segments.size() == 1) {
      return false;
    }
  }

  const bool recognized = std::any_of(fields.begin(), fields.end(), [preamble](const Field & f) {
    return is_metadata_field(f, preamble);
  });
  if (!recognized) {
    return false;
  }

  const auto & ids = options_.identifiers;
  const std::string node = req.id.to_string(ids);
  bool expected_broken = false;
  strip_marker(line, expected_broken);

  for (const auto & field : fields) {
    if (!is_metadata_field(field, preamble)) {
      continue;
    }
    const auto key_col = column_of(field.key);
    const auto key_len = static_cast<uint32_t>(field.key.size());
    const auto canonical = canonical_metadata_key(field.key);

    if (!canonical) {
      if (auto suggestion = suggest_reference_keyword(field.key)) {
        diags_
          .report_warning(
            here(), "unknown keyword '" + std::string(field.key) +
                      "'; references on this line are ignored")
          .with_code("keyword-spelling")
          .with_node(node)
          .with_label(key_col, key_len, "not a reference keyword")
          .with_help("did you mean '" + std::string(*suggestion) + "'?")
          .with_fixit(key_col, key_len, std::string(*suggestion));
      }
      continue;
    }

    if (*canonical != field.key) {
      diags_
        .report_warning(
          here(), "keyword '" + std::string(field.key) + "' should be written '" +
                    std::string(*canonical) + "'")
        .with_code("keyword-case")
        .with_node(node)
        .with_label(key_col, key_len, "wrong case")
        .with_fixit(key_col, key_len, std::string(*canonical));
    }

    const auto value_col = column_of(field.value);
    const auto value_len = static_cast<uint32_t>(field.value.size());

    if (*canonical == "Level") {
      const auto level = parse_level(field.value);
      if (!level) {
        diags_.report_warning(here(), "unknown level '" + std::string(field.value) + "'")
          .with_code("unknown-level")
          .with_node(node)
          .with_label(value_col, value_len, "expected PRD, OPS or DEV");
      } else if (*level != req.id.level) {
        diags_
          .report_warning(
            here(), "level '" + std::string(field.value) + "' does not match identifier level '" +
                      std::string(to_string(req.id.level)) + "'")
          .with_code("level-mismatch")
          .with_node(node)
          .with_label(value_col, value_len, "")
          .with_help("the identifier determines the level");
      }
    } else if (*canonical == "Status") {
      if (status_seen) {
        continue;
      }
      status_seen = true;
      if (auto status = parse_status(field.value)) {
        req.status = *status;
      } else {
        req.status = Status::Unknown;
        diags_.report_warning(here(), "unknown status '" + std::string(field.value) + "'")
          .with_code("unknown-status")
          .with_node(node)
          .with_label(value_col, value_len, "")
          .with_help("expected Active, Draft, Proposed, Deprecated or Superseded");
      }
    } else if (*canonical == "Tags") {
      for (const auto tag : split_view(field.value, ',')) {
        if (const auto t = trim(tag); !t.empty()) {
          req.tags.emplace_back(t);
        }
      }
    } else {
      parse_reference_values(lowercase(*canonical), field.value, expected_broken, req);
    }
  }
  return true;
}

void DocumentParser::parse_reference_values(
  std::string_view relationship, std::string_view value, bool expected_broken, Requirement & req)
{
  bool marker = false;
  value = strip_marker(value, marker);
  if (is_no_reference(value)) {
    return;
  }

  const auto & ids = options_.identifiers;
  for (const auto part : split_view(value, ',')) {
    std::string_view t = trim(part);
    if (t.size() >= 2 && t.front() == '`' && t.back() == '`') {
      t = trim(t.substr(1, t.size() - 2));
    }
    if (t.empty() || is_no_reference(t)) {
      continue;
    }

    Reference ref;
    ref.relationship = std::string(relationship);
    ref.line = line_no();
    ref.expected_broken = expected_broken || marker;

    if (relationship == "addresses" && istarts_with(t, k_journey_prefix)) {
      ref.target_text = std::string(t);
      req.references.push_back(std::move(ref));
      continue;
    }

    auto parsed = parse_identifier(t, ids);
    if (!parsed) {
      const auto col = column_of(t);
      const auto len = static_cast<uint32_t>(t.size());
      auto builder =
        diags_.report_error(here(), "invalid reference in " + req.id.to_string(ids));
      builder.with_code("invalid-reference")
        .with_node(req.id.to_string(ids))
        .with_label(col, len, parsed.failure.message);
      if (parsed.failure.suggestion) {
        builder.with_help("did you mean '" + *parsed.failure.suggestion + "'?")
          .with_fixit(col, len, *parsed.failure.suggestion);
      }
      continue;
    }

    Identifier target = parsed.identifier;
    target.form = IdentifierForm::Qualified;
    ref.target_text = target.to_string(ids);
    ref.target = std::move(target);
    req.references.push_back(std::move(ref));
  }
}

void DocumentParser::parse_assertion_line(std::string_view line, Requirement & req)
{
  std::string_view t = trim(line);
  if (t.empty()) {
    continuation_open_ = false;
    return;
  }

  bool expected_broken = false;
  t = strip_marker(t, expected_broken);

  const auto item = match_assertion_item(t);
  if (!item) {
    if (continuation_open_ && !req.assertions.empty() && is_space(line.front())) {
      auto & last = req.assertions.back();
      if (!last.text.empty()) {
        last.text += ' ';
      }
      last.text += std::string(t);
      last.expected_broken = last.expected_broken || expected_broken;
    }
    return;
  }

  const auto & ids = options_.identifiers;
  const std::string node = req.id.to_string(ids);
  char label = item->label;

  if (label == 0) {
    label = 'A';
    for (const auto & a : req.assertions) {
      label = std::max<char>(label, static_cast<char>(a.label + 1));
    }
    if (label > 'Z') {
      diags_.report_error(here(), "too many assertions in " + node)
        .with_code("duplicate-assertion")
        .with_node(node);
      continuation_open_ = false;
      return;
    }
    if (!reported_bullet_style_) {
      reported_bullet_style_ = true;
      diags_.report_hint(here(), "bulleted assertions are labeled in order")
        .with_code("assertion-style")
        .with_node(node)
        .with_help(std::string("write '") + label + ". ...' to fix the label");
    }
  } else if (item->lowercase) {
    diags_.report_hint(here(), "assertion labels are uppercase")
      .with_code("assertion-style")
      .with_node(node)
      .with_label(column_of(item->label_text), 1, "")
      .with_fixit(column_of(item->label_text), 1, std::string(1, label));
  }

  if (const Assertion * first = req.find_assertion(label)) {
    diags_
      .report_error(
        here(), "duplicate assertion label '" + std::string(1, label) + "' in " + node)
      .with_code("duplicate-assertion")
      .with_node(node)
      .with_secondary_label(SourceLocation{path_, first->line, {}}, "first defined here");
    continuation_open_ = false;
    return;
  }

  Assertion assertion;
  assertion.label = label;
  assertion.text = std::string(item->text);
  assertion.owner = req.id;
  assertion.line = line_no();
  assertion.expected_broken = expected_broken;
  req.assertions.push_back(std::move(assertion));
  continuation_open_ = true;
}

void DocumentParser::finish_requirement(Requirement & req, bool status_seen)
{
  const auto & ids = options_.identifiers;

  std::vector<std::pair<std::string, std::string>> hashed;
  hashed.reserve(req.assertions.size());
  for (auto & a : req.assertions) {
    a.placeholder = is_placeholder_text(a.text);
    hashed.emplace_back(std::string(1, a.label), a.text);
  }
  req.computed_hash = content_hash(req.title, req.body, hashed);

  if (!status_seen) {
    diags_.report_warning(req.location, "requirement " + req.id.to_string(ids) + " has no status")
      .with_code("unknown-status")
      .with_node(req.id.to_string(ids));
  }
}

// ============================================================================
// Journey blocks
// ============================================================================

void DocumentParser::parse_journey_block(const Header & header, std::vector<Journey> & out)
{
  Journey journey;
  journey.id = std::string(header.id_text);
  journey.title = std::string(header.title);
  journey.location = here();
  ++idx_;

  const auto & ids = options_.identifiers;
  uint32_t last_content_line = journey.location.line;
  bool ended = false;

  while (!at_eof()) {
    const std::string_view line = cur();
    if (match_header(line)) {
      break;
    }
    if (is_end_marker(line)) {
      journey.location.end_line = line_no();
      ++idx_;
      if (!at_eof() && trim(cur()) == "---") {
        ++idx_;
      }
      ended = true;
      break;
    }
    if (!trim(line).empty()) {
      last_content_line = line_no();
    }

    const auto field = parse_field(line);
    const auto key = field ? canonical_journey_key(field->key) : std::nullopt;
    if (key) {
      if (*key == "Actor") {
        journey.actor = std::string(field->value);
      } else if (*key == "Goal") {
        journey.goal = std::string(field->value);
      } else if (*key == "Context") {
        journey.context = std::string(field->value);
      } else if (*key == "Addresses") {
        for (const auto part : split_view(field->value, ',')) {
          const std::string_view t = trim(part);
          if (t.empty() || is_no_reference(t)) {
            continue;
          }
          auto parsed = parse_identifier(t, ids);
          if (!parsed) {
            auto builder = diags_.report_error(here(), "invalid reference in " + journey.id);
            builder.with_code("invalid-reference")
              .with_node(journey.id)
              .with_label(column_of(t), static_cast<uint32_t>(t.size()), parsed.failure.message);
            if (parsed.failure.suggestion) {
              builder.with_help("did you mean '" + *parsed.failure.suggestion + "'?");
            }
            continue;
          }
          journey.addresses.push_back(parsed.identifier.to_string(ids));
        }
      }
    } else if (auto step = match_labeled(trim(line)); step && is_digit(trim(line).front())) {
      journey.steps.emplace_back(step->text);
    }
    ++idx_;
  }

  if (!ended) {
    journey.location.end_line = last_content_line;
  }
  out.push_back(std::move(journey));
}

}  // namespace syntax

}  // namespace reqtrace
