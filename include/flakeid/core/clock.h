#pragma once

#include "flakeid/core/time.h"

#include <functional>
#include <utility>

namespace flakeid::core {

// Abstract clock interface for time injection.
// Production code reads the system wall clock; tests substitute scripted or fixed time so the
// generator's state machine can be driven deterministically.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Return the current instant (UTC).
  virtual Timestamp now() = 0;

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

  Timestamp now() override;
};

// Fixed clock: returns a constant instant until explicitly moved with set() or advance().
// Not thread-safe on its own; callers that share it across threads must serialize access.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(Timestamp fixed_time) : fixed_time_(fixed_time) {}
  ~FixedClock() override = default;

  FixedClock(const FixedClock&) = default;
  FixedClock& operator=(const FixedClock&) = default;
  FixedClock(FixedClock&&) = default;
  FixedClock& operator=(FixedClock&&) = default;

  Timestamp now() override;

  void set(Timestamp fixed_time) { fixed_time_ = fixed_time; }
  void advance(Clock::duration delta) { fixed_time_ += delta; }

 private:
  Timestamp fixed_time_;
};

// Function clock: adapts any zero-argument callable returning a Timestamp.
class FunctionClock final : public IClock {
 public:
  using Source = std::function<Timestamp()>;

  explicit FunctionClock(Source source) : source_(std::move(source)) {}
  ~FunctionClock() override = default;

  FunctionClock(const FunctionClock&) = default;
  FunctionClock& operator=(const FunctionClock&) = default;
  FunctionClock(FunctionClock&&) = default;
  FunctionClock& operator=(FunctionClock&&) = default;

  Timestamp now() override;

 private:
  Source source_;
};

}  // namespace flakeid::core
