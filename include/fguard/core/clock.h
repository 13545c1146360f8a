#pragma once

#include <string>
#include <utility>

namespace fguard::core {

// Abstract clock interface for timestamp injection.
// Anything date-dependent (schema bounds such as "publication year <= current year",
// age and past/future checks) reads time through this interface so tests can freeze it.
class IClock {
 public:
  virtual ~IClock() = default;

  // Return current timestamp in ISO 8601 format (UTC).
  // Contract: returned string is non-empty and valid ISO 8601.
  virtual std::string now_iso8601() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: returns actual system time.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  std::string now_iso8601() override;
};

// Fixed clock: returns constant timestamp for deterministic tests.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::string fixed_time) : fixed_time_(std::move(fixed_time)) {}
  ~FixedClock() override = default;

  FixedClock(const FixedClock&) = default;
  FixedClock& operator=(const FixedClock&) = default;
  FixedClock(FixedClock&&) = default;
  FixedClock& operator=(FixedClock&&) = default;

  std::string now_iso8601() override;

 private:
  std::string fixed_time_;
};

// Calendar year of the clock's current instant (UTC).
// Throws std::runtime_error if the clock returns an unparseable timestamp.
[[nodiscard]] int current_year(IClock& clock);

// Current instant as Unix milliseconds (UTC). Same failure contract as current_year().
[[nodiscard]] long long current_unix_millis(IClock& clock);

}  // namespace fguard::core
