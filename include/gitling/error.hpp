#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace gitling {

enum class ErrorCode : std::uint8_t {
  NotARepository,
  BadConfig,
  NotFound,
  UnknownType,
  UnsupportedType,
  MalformedLength,
  InvalidLeaf,
  InvalidSha,
  UnexpectedType,
  NotADirectory,
  NotAFile,
  NotEmpty,
  AlreadyExists,
  DecompressionError,
  RefCycle,
  Io,
};

// Lowercase stable name, e.g. "malformed-length".
const char *error_code_name(ErrorCode code);

class Error : public std::runtime_error {
public:
  Error(ErrorCode code, const std::string &message)
      : std::runtime_error(message), code_(code) {}

  [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
  ErrorCode code_;
};

} // namespace gitling
