#include "fguard/core/clock.h"

#include "fguard/core/time.h"

#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace fguard::core {

std::string SystemClock::now_iso8601() {
  const auto now = std::chrono::system_clock::now();
  const auto time_t_now = std::chrono::system_clock::to_time_t(now);

  std::ostringstream oss;
  oss << std::put_time(std::gmtime(&time_t_now), "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

std::string FixedClock::now_iso8601() {
  return fixed_time_;
}

namespace {

CivilTime read_clock(IClock& clock) {
  const std::string now = clock.now_iso8601();
  const auto parsed = parse_timestamp(now);
  if (!parsed.has_value()) {
    throw std::runtime_error("clock returned an invalid ISO 8601 timestamp: " + now);
  }
  return parsed.value();
}

}  // namespace

int current_year(IClock& clock) {
  return civil_from_unix_millis(read_clock(clock).unix_millis).year;
}

long long current_unix_millis(IClock& clock) {
  return read_clock(clock).unix_millis;
}

}  // namespace fguard::core
