#include "writelink/util/text.hpp"

#include <algorithm>
#include <cctype>

#include <unicode/uchar.h>
#include <unicode/ustring.h>

namespace writelink::util {

namespace {

Result<std::u16string> utf8ToUtf16(std::string_view utf8_text) {
  if (utf8_text.empty()) {
    return std::u16string();
  }

  UErrorCode status = U_ZERO_ERROR;

  // Calculate required buffer size
  int32_t utf16_length = 0;
  u_strFromUTF8(nullptr, 0, &utf16_length, utf8_text.data(),
                static_cast<int32_t>(utf8_text.length()), &status);

  if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) {
    return makeErrorResult<std::u16string>(ErrorCode::kInvalidArgument,
        "Failed to calculate UTF-16 length: " + std::string(u_errorName(status)));
  }

  std::u16string result(utf16_length, 0);
  status = U_ZERO_ERROR;

  u_strFromUTF8(reinterpret_cast<UChar*>(result.data()), utf16_length, nullptr,
                utf8_text.data(), static_cast<int32_t>(utf8_text.length()), &status);

  if (U_FAILURE(status)) {
    return makeErrorResult<std::u16string>(ErrorCode::kInvalidArgument,
        "Failed to convert UTF-8 to UTF-16: " + std::string(u_errorName(status)));
  }

  return result;
}

Result<std::string> utf16ToUtf8(const std::u16string& utf16_text) {
  if (utf16_text.empty()) {
    return std::string();
  }

  UErrorCode status = U_ZERO_ERROR;

  int32_t utf8_length = 0;
  u_strToUTF8(nullptr, 0, &utf8_length,
              reinterpret_cast<const UChar*>(utf16_text.c_str()),
              static_cast<int32_t>(utf16_text.length()), &status);

  if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) {
    return makeErrorResult<std::string>(ErrorCode::kInvalidArgument,
        "Failed to calculate UTF-8 length: " + std::string(u_errorName(status)));
  }

  std::string result(utf8_length, 0);
  status = U_ZERO_ERROR;

  u_strToUTF8(result.data(), utf8_length, nullptr,
              reinterpret_cast<const UChar*>(utf16_text.c_str()),
              static_cast<int32_t>(utf16_text.length()), &status);

  if (U_FAILURE(status)) {
    return makeErrorResult<std::string>(ErrorCode::kInvalidArgument,
        "Failed to convert UTF-16 to UTF-8: " + std::string(u_errorName(status)));
  }

  return result;
}

}  // namespace

Result<std::string> Text::foldCase(std::string_view utf8_text) {
  auto utf16 = utf8ToUtf16(utf8_text);
  if (!utf16.has_value()) {
    return std::unexpected(utf16.error());
  }
  if (utf16->empty()) {
    return std::string();
  }

  UErrorCode status = U_ZERO_ERROR;
  const auto* source = reinterpret_cast<const UChar*>(utf16->c_str());
  auto source_length = static_cast<int32_t>(utf16->length());

  // Folding may grow the string (e.g. German sharp s)
  int32_t folded_length = u_strFoldCase(nullptr, 0, source, source_length,
                                        U_FOLD_CASE_DEFAULT, &status);
  if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) {
    return makeErrorResult<std::string>(ErrorCode::kInvalidArgument,
        "Failed to calculate folded length: " + std::string(u_errorName(status)));
  }

  std::u16string folded(folded_length, 0);
  status = U_ZERO_ERROR;
  u_strFoldCase(reinterpret_cast<UChar*>(folded.data()), folded_length, source,
                source_length, U_FOLD_CASE_DEFAULT, &status);
  if (U_FAILURE(status)) {
    return makeErrorResult<std::string>(ErrorCode::kInvalidArgument,
        "Failed to fold case: " + std::string(u_errorName(status)));
  }

  return utf16ToUtf8(folded);
}

bool Text::containsIgnoreCase(std::string_view haystack, std::string_view needle) {
  if (needle.empty()) {
    return true;
  }

  auto folded_haystack = foldCase(haystack);
  auto folded_needle = foldCase(needle);
  if (folded_haystack.has_value() && folded_needle.has_value()) {
    return folded_haystack->find(*folded_needle) != std::string::npos;
  }

  return asciiLower(haystack).find(asciiLower(needle)) != std::string::npos;
}

std::string Text::trim(std::string_view text) {
  constexpr std::string_view kWhitespace = " \t\r\n\f\v";
  auto start = text.find_first_not_of(kWhitespace);
  if (start == std::string_view::npos) {
    return "";
  }
  auto end = text.find_last_not_of(kWhitespace);
  return std::string(text.substr(start, end - start + 1));
}

std::string Text::asciiLower(std::string_view text) {
  std::string result(text);
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return result;
}

}  // namespace writelink::util
