#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace writelink {

// Error handling - using std::expected pattern
enum class ErrorCode {
  kInvalidArgument,
  kNotFound,
  kAlreadyExists,
  kInvalidFrontmatter,
  kDecodingError,
  kEncodingError,
  kFileSystemError,
  kValidationError,
  kConfigError
};

// Convert error code to string
std::string_view errorCodeToString(ErrorCode code);

// Error class for detailed error information.
//
// Besides the human readable message an error may carry structured payload:
// the identity it is about (note id or path), the OS error that caused it,
// and a list of details such as the header fields a record was missing.
class Error {
 public:
  Error(ErrorCode code, std::string message)
      : code_(code), message_(std::move(message)) {}

  ErrorCode code() const { return code_; }
  const std::string& message() const { return message_; }
  const std::string& subject() const { return subject_; }
  const std::error_code& systemError() const { return system_error_; }
  const std::vector<std::string>& details() const { return details_; }

  Error& withSubject(std::string subject) {
    subject_ = std::move(subject);
    return *this;
  }

  Error& withSystemError(std::error_code ec) {
    system_error_ = ec;
    return *this;
  }

  Error& withDetails(std::vector<std::string> details) {
    details_ = std::move(details);
    return *this;
  }

 private:
  ErrorCode code_;
  std::string message_;
  std::string subject_;
  std::error_code system_error_;
  std::vector<std::string> details_;
};

// Result type alias
template <typename T>
using Result = std::expected<T, Error>;

// Convenience function for creating errors
inline Error makeError(ErrorCode code, const std::string& message) {
  return Error(code, message);
}

// Convenience function for creating error results
template <typename T>
inline Result<T> makeErrorResult(ErrorCode code, const std::string& message) {
  return std::unexpected(makeError(code, message));
}

// Filesystem error carrying the OS error and the path it happened on
inline Error makeFileSystemError(const std::string& message, const std::string& path,
                                 std::error_code ec = {}) {
  Error error(ErrorCode::kFileSystemError,
              ec ? message + ": " + ec.message() : message);
  error.withSubject(path).withSystemError(ec);
  return error;
}

// One-line description suitable for showing to a user
std::string describe(const Error& error);

// Version information
struct Version {
  int major;
  int minor;
  int patch;

  std::string toString() const;
};

// Get version information
Version getVersion();

}  // namespace writelink
