#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace gitling {

// Raw 20-byte SHA-1 digest (binary, not hex)
using raw_oid = std::array<std::uint8_t, 20>;

/**
 * Compute SHA-1 of arbitrary bytes.
 * Object ids are the digest of the full framed buffer
 *   "<type> <size>\0" + payload
 * not of the payload alone.
 */
raw_oid sha1(std::span<const std::uint8_t> data);

inline raw_oid sha1(std::string_view s) {
  return sha1(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

/** Binary digest -> 40-char lowercase hex. */
std::string to_hex(const raw_oid &id);

/**
 * Parse 40-char hex into a binary digest.
 * Returns false if length/characters are invalid.
 */
bool from_hex(std::string_view hex, raw_oid &out);

} // namespace gitling
