#include "traceops/common/time.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace traceops::common {

namespace {

std::tm to_tm(const std::int64_t epoch_ms, const bool local) {
  const std::time_t t = static_cast<std::time_t>(epoch_ms / 1000);
  std::tm tm{};
#ifdef _WIN32
  if (local) {
    localtime_s(&tm, &t);
  } else {
    gmtime_s(&tm, &t);
  }
#else
  if (local) {
    localtime_r(&t, &tm);
  } else {
    gmtime_r(&t, &tm);
  }
#endif
  return tm;
}

} // namespace

std::optional<std::int64_t> parse_timestamp_ms(const std::string &text) {
  if (text.size() < 19) {
    return std::nullopt;
  }

  std::tm tm{};
  std::istringstream in(text.substr(0, 19));
  in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (in.fail()) {
    return std::nullopt;
  }

  std::size_t pos = 19;
  std::int64_t millis = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    std::int64_t scale = 100;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
      millis += (text[pos] - '0') * scale;
      scale /= 10;
      ++pos;
    }
  }

  std::int64_t offset_seconds = 0;
  if (pos < text.size()) {
    const char zone = text[pos];
    if (zone == 'Z' || zone == 'z') {
      ++pos;
    } else if (zone == '+' || zone == '-') {
      const std::string offset = text.substr(pos + 1);
      if (offset.size() < 4) {
        return std::nullopt;
      }
      const bool has_colon = offset.size() >= 5 && offset[2] == ':';
      const std::string hh = offset.substr(0, 2);
      const std::string mm = offset.substr(has_colon ? 3 : 2, 2);
      for (const char ch : hh + mm) {
        if (std::isdigit(static_cast<unsigned char>(ch)) == 0) {
          return std::nullopt;
        }
      }
      offset_seconds = std::stoll(hh) * 3600 + std::stoll(mm) * 60;
      if (zone == '-') {
        offset_seconds = -offset_seconds;
      }
      pos = text.size();
    }
    if (pos != text.size()) {
      return std::nullopt;
    }
  }

#ifdef _WIN32
  const std::time_t seconds = _mkgmtime(&tm);
#else
  const std::time_t seconds = timegm(&tm);
#endif
  if (seconds == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }
  return (static_cast<std::int64_t>(seconds) - offset_seconds) * 1000 + millis;
}

std::string format_local_datetime(const std::int64_t epoch_ms) {
  const std::tm tm = to_tm(epoch_ms, true);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return out.str();
}

std::string utc_file_stamp(const std::int64_t epoch_ms) {
  const std::tm tm = to_tm(epoch_ms, false);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%d-%H-%M-%S");
  return out.str();
}

std::int64_t now_epoch_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

} // namespace traceops::common
