#include "gitling/hash.hpp"
#include "gitling/consts.hpp"

#include <cstdint>
#include <memory>
#include <openssl/evp.h> // EVP_* digest API
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace gitling {

namespace {

struct MdCtxFree {
  void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxFree>;

int nibble(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return 10 + (c - 'a');
  }
  if (c >= 'A' && c <= 'F') {
    return 10 + (c - 'A');
  }
  return -1;
}

} // namespace

raw_oid sha1(std::span<const std::uint8_t> data) {
  MdCtxPtr ctx{EVP_MD_CTX_new()};
  if (!ctx) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha1(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex(EVP_sha1) failed");
  }
  if (!data.empty() && EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }

  raw_oid out{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  if (len != out.size()) {
    throw std::runtime_error("SHA-1 produced unexpected length");
  }
  return out;
}

std::string to_hex(const raw_oid &id) {
  static constexpr std::string_view kHex = "0123456789abcdef";
  std::string s;
  s.reserve(consts::kOidHexLen);
  for (const std::uint8_t b : id) {
    s.push_back(kHex[(b >> 4) & 0xF]);
    s.push_back(kHex[b & 0xF]);
  }
  return s;
}

bool from_hex(std::string_view hex, raw_oid &out) {
  if (hex.size() != consts::kOidHexLen) {
    return false;
  }
  for (std::size_t i = 0; i < consts::kOidRawLen; ++i) {
    const int hi = nibble(hex[2 * i]);
    const int lo = nibble(hex[(2 * i) + 1]);
    if (hi < 0 || lo < 0) {
      return false;
    }
    out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  return true;
}

} // namespace gitling
