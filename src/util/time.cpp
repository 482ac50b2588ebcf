#include "writelink/util/time.hpp"

#include <iomanip>
#include <regex>
#include <sstream>

namespace writelink::util {

using std::chrono::system_clock;

std::string Time::toRfc3339(system_clock::time_point time) {
  auto ms = std::chrono::floor<std::chrono::milliseconds>(time);
  auto day = std::chrono::floor<std::chrono::days>(ms);
  std::chrono::year_month_day ymd{day};
  std::chrono::hh_mm_ss hms{ms - day};

  std::ostringstream oss;
  oss << std::setfill('0')
      << std::setw(4) << static_cast<int>(ymd.year()) << '-'
      << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-'
      << std::setw(2) << static_cast<unsigned>(ymd.day()) << 'T'
      << std::setw(2) << hms.hours().count() << ':'
      << std::setw(2) << hms.minutes().count() << ':'
      << std::setw(2) << hms.seconds().count() << '.'
      << std::setw(3) << hms.subseconds().count() << 'Z';

  return oss.str();
}

Result<system_clock::time_point> Time::fromRfc3339(const std::string& str) {
  static const std::regex rfc3339_regex(
      R"((\d{4})-(\d{2})-(\d{2})T(\d{2}):(\d{2}):(\d{2})\.(\d{1,9})(Z|([+-])(\d{2}):(\d{2})))");

  std::smatch match;
  if (!std::regex_match(str, match, rfc3339_regex)) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Invalid RFC3339 format: " + str));
  }

  std::chrono::year_month_day ymd{
      std::chrono::year{std::stoi(match[1])},
      std::chrono::month{static_cast<unsigned>(std::stoi(match[2]))},
      std::chrono::day{static_cast<unsigned>(std::stoi(match[3]))}};

  int hours = std::stoi(match[4]);
  int minutes = std::stoi(match[5]);
  int seconds = std::stoi(match[6]);

  if (!ymd.ok() || hours > 23 || minutes > 59 || seconds > 59) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Invalid time values: " + str));
  }

  // Right-pad the fraction to nanoseconds
  std::string fraction = match[7];
  fraction.append(9 - fraction.size(), '0');

  // Seconds since the epoch fit any four-digit year; nanosecond ticks do not
  std::chrono::sys_seconds utc_seconds = std::chrono::sys_days{ymd} +
                                         std::chrono::hours(hours) +
                                         std::chrono::minutes(minutes) +
                                         std::chrono::seconds(seconds);

  if (match[9].matched) {
    int offset_hours = std::stoi(match[10]);
    int offset_minutes = std::stoi(match[11]);
    if (offset_hours > 23 || offset_minutes > 59) {
      return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                       "Invalid zone offset: " + str));
    }
    auto offset = std::chrono::hours(offset_hours) + std::chrono::minutes(offset_minutes);
    // Local time = UTC + offset
    if (match[9] == "+") {
      utc_seconds -= offset;
    } else {
      utc_seconds += offset;
    }
  }

  // Keep one second of headroom at each end for the fractional part
  auto earliest = std::chrono::ceil<std::chrono::seconds>(system_clock::time_point::min()) +
                  std::chrono::seconds(1);
  auto latest = std::chrono::floor<std::chrono::seconds>(system_clock::time_point::max()) -
                std::chrono::seconds(1);
  if (utc_seconds < earliest || utc_seconds > latest) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Time out of representable range: " + str));
  }

  auto time_point = std::chrono::time_point_cast<system_clock::duration>(utc_seconds);
  time_point += std::chrono::duration_cast<system_clock::duration>(
      std::chrono::nanoseconds(std::stoll(fraction)));

  return time_point;
}

system_clock::time_point Time::now() {
  return truncate(system_clock::now());
}

system_clock::time_point Time::truncate(system_clock::time_point time) {
  return std::chrono::time_point_cast<system_clock::duration>(
      std::chrono::floor<std::chrono::milliseconds>(time));
}

}  // namespace writelink::util
