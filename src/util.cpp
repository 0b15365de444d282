#include "gitling/util.hpp"

#include "gitling/consts.hpp"

#include <algorithm>
#include <cctype>

namespace gitling {

bool looks_hex40(std::string_view str) {
  if (str.size() != consts::kOidHexLen) {
    return false;
  }
  return std::ranges::all_of(str,
                             [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); });
}

namespace strutil {

void rstrip_newlines(std::string &s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
    s.pop_back();
  }
}

std::string to_lower(std::string_view str) {
  std::string out(str);
  std::ranges::transform(out, out.begin(),
                         [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });
  return out;
}

std::string trim(std::string_view sv) {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t')) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r')) {
    sv.remove_suffix(1);
  }
  return std::string(sv);
}

} // namespace strutil

} // namespace gitling
