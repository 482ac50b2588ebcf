#pragma once

#include <chrono>
#include <string>

#include "writelink/common.hpp"

namespace writelink::util {

// Time utilities for RFC3339 formatting and parsing
class Time {
 public:
  // Format time as RFC3339 UTC with millisecond fraction: 2024-01-15T10:30:00.000Z
  static std::string toRfc3339(std::chrono::system_clock::time_point time);

  // Parse RFC3339 string to time_point. Fractional seconds are required;
  // the zone may be 'Z' or a numeric offset.
  static Result<std::chrono::system_clock::time_point> fromRfc3339(const std::string& str);

  // Current time truncated to the precision the file format stores
  static std::chrono::system_clock::time_point now();

  // Truncate to millisecond precision
  static std::chrono::system_clock::time_point truncate(std::chrono::system_clock::time_point time);
};

}  // namespace writelink::util
