#include "time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace codeintel::util {

namespace {

std::tm ToUtc(TimePoint tp) {
  const std::time_t t = Clock::to_time_t(tp);
  std::tm           utc{};
  gmtime_r(&t, &utc);
  return utc;
}

long MicrosOfSecond(TimePoint tp) {
  const auto sec = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto       us  = std::chrono::duration_cast<std::chrono::microseconds>(tp - sec).count();
  // pre-epoch time points round toward zero
  if (us < 0) us += 1000000;
  return static_cast<long>(us);
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

uint64_t ToUnixMicros(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

std::string FormatIso8601Utc(TimePoint tp) {
  const auto         utc = ToUtc(tp);
  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6) << std::setfill('0') << MicrosOfSecond(tp) << "+00:00";
  return out.str();
}

std::string FormatCompactUtc(TimePoint tp) {
  const auto         utc = ToUtc(tp);
  std::ostringstream out;
  out << std::put_time(&utc, "%Y%m%d_%H%M%S") << '_' << std::setw(6) << std::setfill('0') << MicrosOfSecond(tp) << 'Z';
  return out.str();
}

} // namespace codeintel::util
