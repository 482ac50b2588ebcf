#include "writelink/common.hpp"

#include <sstream>

namespace writelink {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kNotFound:
      return "Not found";
    case ErrorCode::kAlreadyExists:
      return "Already exists";
    case ErrorCode::kInvalidFrontmatter:
      return "Invalid frontmatter";
    case ErrorCode::kDecodingError:
      return "Decoding error";
    case ErrorCode::kEncodingError:
      return "Encoding error";
    case ErrorCode::kFileSystemError:
      return "File system error";
    case ErrorCode::kValidationError:
      return "Validation error";
    case ErrorCode::kConfigError:
      return "Configuration error";
  }
  return "Unknown error";
}

std::string describe(const Error& error) {
  std::ostringstream oss;
  oss << errorCodeToString(error.code()) << ": " << error.message();

  if (!error.details().empty()) {
    oss << " [";
    for (size_t i = 0; i < error.details().size(); ++i) {
      if (i > 0) oss << ", ";
      oss << error.details()[i];
    }
    oss << "]";
  }

  return oss.str();
}

std::string Version::toString() const {
  std::ostringstream oss;
  oss << major << "." << minor << "." << patch;
  return oss.str();
}

Version getVersion() {
  return Version{0, 1, 0};
}

}  // namespace writelink
