#include "StatusMap.hpp"

namespace vf {

int http_status_for(ErrorCode c) {
  switch (c) {
    case ErrorCode::NotFound:          return 404;
    case ErrorCode::InvalidId:         return 400;
    case ErrorCode::MalformedRecord:   return 422;
    case ErrorCode::AlreadyExists:
    case ErrorCode::AlreadyClaimed:
    case ErrorCode::IllegalTransition:
    case ErrorCode::Expired:           return 409;
    case ErrorCode::Io:                return 500;
  }
  return 500;
}

} // namespace vf
