#include "Errors.hpp"

namespace docfetch {

const char* errorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::NONE:
      return "none";
    case ErrorKind::NETWORK:
      return "network";
    case ErrorKind::HTTP_STATUS:
      return "http_status";
    case ErrorKind::VALIDATION:
      return "validation";
    case ErrorKind::DUPLICATE_JOB:
      return "duplicate_job";
    case ErrorKind::UNKNOWN_CAPABILITY:
      return "unknown_capability";
    case ErrorKind::CONFIGURATION:
      return "configuration";
    case ErrorKind::PARSE:
      return "parse";
    case ErrorKind::IO:
      return "io";
    case ErrorKind::CANCELLED:
      return "cancelled";
    case ErrorKind::INTERNAL:
      return "internal";
  }
  return "unknown";
}

}  // namespace docfetch
