#ifndef DOCFETCH_ERRORS_HPP_
#define DOCFETCH_ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace docfetch {

enum class ErrorKind {
  NONE,
  NETWORK,
  HTTP_STATUS,
  VALIDATION,
  DUPLICATE_JOB,
  UNKNOWN_CAPABILITY,
  CONFIGURATION,
  PARSE,
  IO,
  CANCELLED,
  INTERNAL
};

const char* errorKindName(ErrorKind kind);

class Error : public std::runtime_error {
 public:
  Error(ErrorKind kind, const std::string& what)
      : std::runtime_error(what), kind_(kind) {}
  ErrorKind kind() const { return kind_; }

 private:
  ErrorKind kind_;
};

// Connect/read failure or timeout. Retryable.
class NetworkError : public Error {
 public:
  explicit NetworkError(const std::string& what)
      : Error(ErrorKind::NETWORK, what) {}
};

class HttpStatusError : public Error {
 public:
  explicit HttpStatusError(long status)
      : Error(ErrorKind::HTTP_STATUS, "HTTP status " + std::to_string(status)),
        status_(status) {}
  long status() const { return status_; }

 private:
  long status_;
};

class ValidationError : public Error {
 public:
  explicit ValidationError(const std::string& what)
      : Error(ErrorKind::VALIDATION, what) {}
};

class DuplicateJobError : public Error {
 public:
  explicit DuplicateJobError(const std::string& what)
      : Error(ErrorKind::DUPLICATE_JOB, what) {}
};

class UnknownCapabilityError : public Error {
 public:
  explicit UnknownCapabilityError(const std::string& what)
      : Error(ErrorKind::UNKNOWN_CAPABILITY, what) {}
};

class ConfigurationError : public Error {
 public:
  explicit ConfigurationError(const std::string& what)
      : Error(ErrorKind::CONFIGURATION, what) {}
};

class ParseError : public Error {
 public:
  explicit ParseError(const std::string& what)
      : Error(ErrorKind::PARSE, what) {}
};

class IoError : public Error {
 public:
  explicit IoError(const std::string& what) : Error(ErrorKind::IO, what) {}
};

// Raised inside a transfer when its control asks it to stop.
class TransferAborted : public Error {
 public:
  TransferAborted() : Error(ErrorKind::CANCELLED, "transfer aborted") {}
};

}  // namespace docfetch

#endif  // DOCFETCH_ERRORS_HPP_
