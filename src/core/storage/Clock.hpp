#pragma once
#include <string>
#include <utility>

#include "core/model/Timestamp.hpp"

namespace vf {

class Clock {
public:
  virtual ~Clock() = default;
  virtual Timestamp now() const = 0;
};

class SystemClock : public Clock {
public:
  Timestamp now() const override;
};

// Reads time from the store itself: touches a stamp file and returns the
// modification time the filesystem assigned to it. Every worker sharing the
// store then compares against the same source.
class StoreClock : public Clock {
public:
  explicit StoreClock(std::string stampPath) : stampPath_(std::move(stampPath)) {}
  Timestamp now() const override;

private:
  std::string stampPath_;
};

} // namespace vf
