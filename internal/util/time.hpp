#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>

#include "google/protobuf/timestamp.pb.h"

namespace tender::util {

/*
  Time utilities. Single place to control the clock source.

  Deadline checks go through a TimeSource so tests can move the clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
google::protobuf::Timestamp MillisToProto(uint64_t unix_ms);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t ToUnixMillis(TimePoint tp);

class TimeSource {
 public:
  virtual ~TimeSource() = default;

  virtual TimePoint Now() const = 0;

  uint64_t NowMillis() const {
    return ToUnixMillis(Now());
  }
};

class SystemTimeSource final : public TimeSource {
 public:
  TimePoint Now() const override;
};

// Manually advanced clock for tests and replay tooling.
class ManualTimeSource final : public TimeSource {
 public:
  explicit ManualTimeSource(TimePoint start = Clock::now());

  TimePoint Now() const override;

  void Set(TimePoint tp);
  void Advance(std::chrono::milliseconds delta);

 private:
  mutable std::mutex mutex_;
  TimePoint          now_;
};

} // namespace tender::util
