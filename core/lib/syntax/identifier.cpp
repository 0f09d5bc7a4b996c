// reqtrace/syntax/identifier.cpp - Identifier parsing and mistake correction
#include "reqtrace/syntax/identifier.hpp"

#include <algorithm>
#include <cctype>

#include "reqtrace/syntax/keywords.hpp"

namespace reqtrace
{

namespace
{

bool is_upper_alpha(char c) { return c >= 'A' && c <= 'Z'; }
bool is_digit(char c) { return c >= '0' && c <= '9'; }

char to_lower(char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); }
char to_upper(char c) { return static_cast<char>(std::toupper(static_cast<unsigned char>(c))); }

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

std::vector<std::string> split(std::string_view s, char sep)
{
  std::vector<std::string> out;
  size_t pos = 0;
  while (true) {
    const size_t next = s.find(sep, pos);
    if (next == std::string_view::npos) {
      out.emplace_back(s.substr(pos));
      break;
    }
    out.emplace_back(s.substr(pos, next - pos));
    pos = next + 1;
  }
  return out;
}

bool all_digits(std::string_view s)
{
  return !s.empty() && std::all_of(s.begin(), s.end(), is_digit);
}

bool all_alpha(std::string_view s)
{
  return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
  });
}

bool is_namespace(std::string_view s)
{
  return s.size() >= 2 && s.size() <= 4 && std::all_of(s.begin(), s.end(), is_upper_alpha);
}

std::string join(const std::vector<std::string> & parts, std::string_view sep)
{
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      out += sep;
    }
    out += parts[i];
  }
  return out;
}

/// Level code followed by exactly `digits` digits, e.g. "p00001"
bool parse_level_sequence(
  std::string_view token, const IdentifierConfig & config, Level & level, uint32_t & sequence)
{
  if (token.size() != static_cast<size_t>(config.digits) + 1) {
    return false;
  }
  const auto lvl = config.level_from_code(token.front());
  if (!lvl) {
    return false;
  }
  const std::string_view digits = token.substr(1);
  if (!all_digits(digits)) {
    return false;
  }
  uint32_t value = 0;
  for (const char c : digits) {
    value = value * 10 + static_cast<uint32_t>(c - '0');
  }
  level = *lvl;
  sequence = value;
  return true;
}

/// Level code in either case followed by 1..n digits
bool loose_level_sequence(std::string_view token, const IdentifierConfig & config)
{
  if (token.size() < 2) {
    return false;
  }
  return config.level_from_code(to_lower(token.front())).has_value() &&
         all_digits(token.substr(1));
}

std::optional<Identifier> parse_strict(
  std::string_view text, const IdentifierConfig & config, std::string & error)
{
  if (text.empty()) {
    error = "empty identifier";
    return std::nullopt;
  }

  const auto tokens = split(text, '-');
  for (const auto & t : tokens) {
    if (t.empty()) {
      error = "empty segment";
      return std::nullopt;
    }
  }

  Identifier id;
  size_t idx = 0;
  if (
    tokens.size() >= 2 && tokens[0] != config.prefix && is_namespace(tokens[0]) &&
    tokens[1] == config.prefix) {
    id.ns = tokens[0];
    idx = 1;
  }

  if (tokens[idx] == config.prefix) {
    id.form = IdentifierForm::Qualified;
    ++idx;
  } else if (idx == 0 && config.allow_bare) {
    id.form = IdentifierForm::Bare;
  } else {
    error = "expected prefix '" + config.prefix + "'";
    return std::nullopt;
  }

  if (idx >= tokens.size()) {
    error = "missing level and sequence";
    return std::nullopt;
  }
  if (!parse_level_sequence(tokens[idx], config, id.level, id.sequence)) {
    if (id.form == IdentifierForm::Bare) {
      error = "expected prefix '" + config.prefix + "'";
    } else {
      error = "expected a level code followed by " + std::to_string(config.digits) + " digits";
    }
    return std::nullopt;
  }
  ++idx;

  for (; idx < tokens.size(); ++idx) {
    const auto & label = tokens[idx];
    if (label.size() != 1 || !is_upper_alpha(label.front())) {
      error = "invalid assertion label '" + label + "'";
      return std::nullopt;
    }
    if (
      std::find(id.assertion_labels.begin(), id.assertion_labels.end(), label.front()) !=
      id.assertion_labels.end()) {
      error = "duplicate assertion label '" + label + "'";
      return std::nullopt;
    }
    id.assertion_labels.push_back(label.front());
  }

  return id;
}

void add_reason(std::vector<std::string> & reasons, std::string reason)
{
  if (std::find(reasons.begin(), reasons.end(), reason) == reasons.end()) {
    reasons.push_back(std::move(reason));
  }
}

}  // namespace

// ============================================================================
// Level
// ============================================================================

std::string_view to_string(Level level) noexcept
{
  switch (level) {
    case Level::Product:
      return "prd";
    case Level::Operational:
      return "ops";
    case Level::Development:
      return "dev";
  }
  return "prd";
}

std::optional<Level> parse_level(std::string_view text) noexcept
{
  using syntax::iequals;
  text = trim(text);
  if (iequals(text, "prd") || iequals(text, "product") || iequals(text, "p")) {
    return Level::Product;
  }
  if (
    iequals(text, "ops") || iequals(text, "operational") || iequals(text, "operations") ||
    iequals(text, "o")) {
    return Level::Operational;
  }
  if (iequals(text, "dev") || iequals(text, "development") || iequals(text, "d")) {
    return Level::Development;
  }
  return std::nullopt;
}

// ============================================================================
// IdentifierConfig
// ============================================================================

char IdentifierConfig::level_code(Level level) const noexcept
{
  switch (level) {
    case Level::Product:
      return product_code;
    case Level::Operational:
      return operational_code;
    case Level::Development:
      return development_code;
  }
  return product_code;
}

std::optional<Level> IdentifierConfig::level_from_code(char code) const noexcept
{
  if (code == product_code) return Level::Product;
  if (code == operational_code) return Level::Operational;
  if (code == development_code) return Level::Development;
  return std::nullopt;
}

// ============================================================================
// Identifier
// ============================================================================

std::string Identifier::key(const IdentifierConfig & config) const
{
  std::string out;
  if (ns) {
    out += *ns;
    out += '-';
  }
  out += config.prefix;
  out += '-';
  out += config.level_code(level);

  const std::string seq = std::to_string(sequence);
  if (seq.size() < config.digits) {
    out.append(config.digits - seq.size(), '0');
  }
  out += seq;
  return out;
}

std::string Identifier::to_string(const IdentifierConfig & config) const
{
  std::string out = key(config);
  for (const char label : assertion_labels) {
    out += '-';
    out += label;
  }
  return out;
}

Identifier Identifier::requirement() const
{
  Identifier out = *this;
  out.assertion_labels.clear();
  return out;
}

Identifier Identifier::with_label(char label) const
{
  Identifier out = *this;
  out.assertion_labels = {label};
  return out;
}

// ============================================================================
// Parsing
// ============================================================================

IdentifierParseResult parse_identifier(std::string_view text, const IdentifierConfig & config)
{
  const std::string_view trimmed = trim(text);

  std::string error;
  if (auto id = parse_strict(trimmed, config, error)) {
    return IdentifierParseResult::ok(std::move(*id));
  }

  std::string message = "invalid identifier '" + std::string(trimmed) + "': ";
  if (auto correction = suggest_identifier(trimmed, config)) {
    message += correction->reason;
    return IdentifierParseResult::fail(std::move(message), std::move(correction->text));
  }
  message += error;
  return IdentifierParseResult::fail(std::move(message));
}

std::optional<IdentifierCorrection> suggest_identifier(
  std::string_view text, const IdentifierConfig & config)
{
  const std::string_view original = trim(text);
  std::string s(original);
  std::vector<std::string> reasons;

  // Wrong separators
  for (const auto sep : syntax::k_separator_mistakes) {
    size_t pos = 0;
    bool replaced = false;
    while ((pos = s.find(sep, pos)) != std::string::npos) {
      s.replace(pos, sep.size(), "-");
      replaced = true;
      ++pos;
    }
    if (replaced) {
      add_reason(reasons, "use '-' as the separator");
    }
  }
  while (s.find("--") != std::string::npos) {
    s.replace(s.find("--"), 2, "-");
    add_reason(reasons, "remove the empty segment");
  }
  while (!s.empty() && s.front() == '-') {
    s.erase(s.begin());
  }
  while (!s.empty() && s.back() == '-') {
    s.pop_back();
  }
  if (s.empty()) {
    return std::nullopt;
  }

  auto tokens = split(s, '-');

  // Prefix: exact, miscased, glued to the level code, or misspelled
  std::optional<size_t> prefix_at;
  for (size_t i = 0; i < tokens.size() && i < 2 && !prefix_at; ++i) {
    const std::string tok = tokens[i];
    if (syntax::iequals(tok, config.prefix)) {
      prefix_at = i;
    } else if (
      tok.size() > config.prefix.size() &&
      syntax::iequals(std::string_view(tok).substr(0, config.prefix.size()), config.prefix) &&
      loose_level_sequence(std::string_view(tok).substr(config.prefix.size()), config)) {
      tokens[i] = tok.substr(0, config.prefix.size());
      tokens.insert(
        tokens.begin() + static_cast<std::ptrdiff_t>(i) + 1, tok.substr(config.prefix.size()));
      add_reason(reasons, "separate the prefix with '-'");
      prefix_at = i;
    }
  }
  if (!prefix_at) {
    for (size_t i = 0; i + 1 < tokens.size() && i < 2 && !prefix_at; ++i) {
      if (
        tokens[i].size() >= 2 && !loose_level_sequence(tokens[i], config) &&
        syntax::edit_distance(tokens[i], config.prefix) <= syntax::k_max_suggestion_distance &&
        loose_level_sequence(tokens[i + 1], config)) {
        add_reason(reasons, "did you mean '" + config.prefix + "'?");
        tokens[i] = config.prefix;
        prefix_at = i;
      }
    }
  }

  size_t level_at = 0;
  if (prefix_at) {
    if (tokens[*prefix_at] != config.prefix) {
      add_reason(reasons, "write the prefix as '" + config.prefix + "'");
      tokens[*prefix_at] = config.prefix;
    }
    if (*prefix_at == 1) {
      std::string ns = tokens[0];
      std::transform(ns.begin(), ns.end(), ns.begin(), to_upper);
      if (ns != tokens[0]) {
        add_reason(reasons, "write the namespace in uppercase");
        tokens[0] = ns;
      }
    }
    level_at = *prefix_at + 1;
  }

  // Level code case and sequence padding
  if (level_at < tokens.size() && loose_level_sequence(tokens[level_at], config)) {
    auto & tok = tokens[level_at];
    const char code = to_lower(tok.front());
    if (code != tok.front()) {
      add_reason(reasons, "the level code is lowercase");
      tok.front() = code;
    }
    const size_t n = tok.size() - 1;
    if (n < config.digits) {
      tok.insert(1, config.digits - n, '0');
      add_reason(
        reasons, "the sequence has " + std::to_string(config.digits) + " digits");
    }
  }

  // Assertion labels
  const size_t head = std::min(level_at + 1, tokens.size());
  std::vector<std::string> rebuilt(
    tokens.begin(), tokens.begin() + static_cast<std::ptrdiff_t>(head));
  for (size_t i = level_at + 1; i < tokens.size(); ++i) {
    const auto & tok = tokens[i];
    if (!all_alpha(tok)) {
      rebuilt.push_back(tok);
      continue;
    }
    if (tok.size() > 1) {
      add_reason(reasons, "list each assertion label separately");
    }
    for (const char c : tok) {
      if (c != to_upper(c)) {
        add_reason(reasons, "assertion labels are uppercase");
      }
      rebuilt.emplace_back(1, to_upper(c));
    }
  }

  std::string candidate = join(rebuilt, "-");
  if (candidate == original) {
    return std::nullopt;
  }
  std::string error;
  if (!parse_strict(candidate, config, error)) {
    return std::nullopt;
  }
  if (reasons.empty()) {
    reasons.emplace_back("did you mean '" + candidate + "'?");
  }
  return IdentifierCorrection{std::move(candidate), join(reasons, "; ")};
}

bool looks_like_identifier(std::string_view text, const IdentifierConfig & config)
{
  text = trim(text);
  // Prefix followed by a separator, or glued to a level code and digit
  const auto starts_with_prefix = [&](std::string_view s) {
    if (
      s.size() <= config.prefix.size() ||
      !syntax::iequals(s.substr(0, config.prefix.size()), config.prefix)) {
      return false;
    }
    const std::string_view rest = s.substr(config.prefix.size());
    const char next = rest.front();
    if (next == '-' || next == '_' || next == '.' || next == ' ' || next == ':') {
      return true;
    }
    return rest.size() >= 2 && config.level_from_code(to_lower(next)).has_value() &&
           is_digit(rest[1]);
  };
  if (starts_with_prefix(text)) {
    return true;
  }
  // Namespace followed by a separator and the prefix
  size_t n = 0;
  while (n < text.size() && n < 5 && std::isalpha(static_cast<unsigned char>(text[n]))) {
    ++n;
  }
  if (n < 2 || n > 4 || n >= text.size()) {
    return false;
  }
  const char sep = text[n];
  if (sep != '-' && sep != '_' && sep != '.' && sep != ' ') {
    return false;
  }
  return starts_with_prefix(text.substr(n + 1));
}

std::vector<Identifier> expand_labels(const Identifier & id)
{
  if (id.assertion_labels.empty()) {
    return {id};
  }
  std::vector<Identifier> out;
  out.reserve(id.assertion_labels.size());
  for (const char label : id.assertion_labels) {
    out.push_back(id.with_label(label));
  }
  return out;
}

}  // namespace reqtrace
