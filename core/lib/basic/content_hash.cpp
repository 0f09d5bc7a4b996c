// reqtrace/basic/content_hash.cpp - SHA-256 via the OpenSSL EVP interface
#include "reqtrace/basic/content_hash.hpp"

#include <openssl/evp.h>

#include <array>
#include <cctype>
#include <stdexcept>

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

}  // namespace

std::string sha256_hex(std::string_view text)
{
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int digest_len = 0;

  EVP_MD_CTX * ctx = EVP_MD_CTX_new();
  if (ctx == nullptr) {
    throw std::runtime_error("OpenSSL: EVP_MD_CTX_new failed");
  }
  if (
    EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1 ||
    EVP_DigestUpdate(ctx, text.data(), text.size()) != 1 ||
    EVP_DigestFinal_ex(ctx, digest.data(), &digest_len) != 1) {
    EVP_MD_CTX_free(ctx);
    throw std::runtime_error("OpenSSL: EVP sha256 digest failed");
  }
  EVP_MD_CTX_free(ctx);

  static constexpr char k_hex[] = "0123456789abcdef";
  std::string out;
  out.reserve(static_cast<size_t>(digest_len) * 2);
  for (unsigned int i = 0; i < digest_len; ++i) {
    out.push_back(k_hex[(digest[i] >> 4) & 0x0F]);
    out.push_back(k_hex[digest[i] & 0x0F]);
  }
  return out;
}

std::string collapse_whitespace(std::string_view text)
{
  std::string out;
  out.reserve(text.size());
  bool pending_space = false;
  for (const char c : trim(text)) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      pending_space = true;
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(c);
  }
  return out;
}

std::string normalize_for_hash(
  std::string_view title, std::string_view body,
  const std::vector<std::pair<std::string, std::string>> & assertions)
{
  std::vector<std::string_view> body_lines;
  size_t pos = 0;
  while (pos <= body.size()) {
    const size_t nl = body.find('\n', pos);
    const size_t end = (nl == std::string_view::npos) ? body.size() : nl;
    body_lines.push_back(trim(body.substr(pos, end - pos)));
    if (nl == std::string_view::npos) {
      break;
    }
    pos = nl + 1;
  }
  while (!body_lines.empty() && body_lines.front().empty()) {
    body_lines.erase(body_lines.begin());
  }
  while (!body_lines.empty() && body_lines.back().empty()) {
    body_lines.pop_back();
  }

  std::string out(trim(title));
  for (const auto line : body_lines) {
    out += '\n';
    out += line;
  }
  for (const auto & [label, text] : assertions) {
    out += '\n';
    out += label;
    out += ". ";
    out += collapse_whitespace(text);
  }
  return out;
}

std::string content_hash(
  std::string_view title, std::string_view body,
  const std::vector<std::pair<std::string, std::string>> & assertions)
{
  return sha256_hex(normalize_for_hash(title, body, assertions)).substr(0, k_content_hash_length);
}

}  // namespace reqtrace
