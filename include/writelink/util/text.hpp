#pragma once

#include <string>
#include <string_view>

#include "writelink/common.hpp"

namespace writelink::util {

// Unicode-aware text helpers backed by ICU
class Text {
 public:
  // Full Unicode case folding of UTF-8 text
  static Result<std::string> foldCase(std::string_view utf8_text);

  // Case-insensitive substring test. Falls back to ASCII folding when either
  // side is not valid UTF-8.
  static bool containsIgnoreCase(std::string_view haystack, std::string_view needle);

  // Strip leading and trailing ASCII whitespace and line breaks
  static std::string trim(std::string_view text);

 private:
  static std::string asciiLower(std::string_view text);
};

}  // namespace writelink::util
