#pragma once
#include <string>
#include <string_view>

namespace gitling {

// Validate 40-char lowercase/uppercase hex
auto looks_hex40(std::string_view str) -> bool;

namespace strutil {
  // Strip trailing CR/LF characters in place
  void rstrip_newlines(std::string& str);

  auto to_lower(std::string_view str) -> std::string;

  // Trim spaces/tabs/CR on both ends
  auto trim(std::string_view str) -> std::string;
}

} // namespace gitling
