#include "gitling/error.hpp"

namespace gitling {

const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::NotARepository:
    return "not-a-repository";
  case ErrorCode::BadConfig:
    return "bad-config";
  case ErrorCode::NotFound:
    return "not-found";
  case ErrorCode::UnknownType:
    return "unknown-type";
  case ErrorCode::UnsupportedType:
    return "unsupported-type";
  case ErrorCode::MalformedLength:
    return "malformed-length";
  case ErrorCode::InvalidLeaf:
    return "invalid-leaf";
  case ErrorCode::InvalidSha:
    return "invalid-sha";
  case ErrorCode::UnexpectedType:
    return "unexpected-type";
  case ErrorCode::NotADirectory:
    return "not-a-directory";
  case ErrorCode::NotAFile:
    return "not-a-file";
  case ErrorCode::NotEmpty:
    return "not-empty";
  case ErrorCode::AlreadyExists:
    return "already-exists";
  case ErrorCode::DecompressionError:
    return "decompression-error";
  case ErrorCode::RefCycle:
    return "ref-cycle";
  case ErrorCode::Io:
    return "io";
  }
  return "unknown";
}

} // namespace gitling
