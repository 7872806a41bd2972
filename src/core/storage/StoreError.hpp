#pragma once
#include <stdexcept>
#include <string>

namespace vf {

enum class ErrorCode {
  AlreadyExists,
  NotFound,
  AlreadyClaimed,
  IllegalTransition,
  Expired,
  MalformedRecord,
  InvalidId,
  Io
};

inline const char* error_code_name(ErrorCode c) {
  switch (c) {
    case ErrorCode::AlreadyExists:     return "AlreadyExists";
    case ErrorCode::NotFound:          return "NotFound";
    case ErrorCode::AlreadyClaimed:    return "AlreadyClaimed";
    case ErrorCode::IllegalTransition: return "IllegalTransition";
    case ErrorCode::Expired:           return "Expired";
    case ErrorCode::MalformedRecord:   return "MalformedRecord";
    case ErrorCode::InvalidId:         return "InvalidId";
    case ErrorCode::Io:                return "Io";
  }
  return "Unknown";
}

class StoreError : public std::runtime_error {
public:
  StoreError(ErrorCode code, const std::string& what)
    : std::runtime_error(std::string(error_code_name(code)) + ": " + what), code_(code) {}

  ErrorCode code() const noexcept { return code_; }

private:
  ErrorCode code_;
};

} // namespace vf
