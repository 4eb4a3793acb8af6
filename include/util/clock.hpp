#pragma once
#include <atomic>
#include <chrono>

namespace parcellink
{

using SteadyTime = std::chrono::steady_clock::time_point;
using Millis     = std::chrono::milliseconds;

// Every timer in the engine reads time through this, so tests can drive it by hand.
struct IClock
{
    virtual SteadyTime now() const = 0;
    virtual ~IClock()              = default;
};

class SteadyClock final : public IClock
{
  public:
    SteadyTime now() const override { return std::chrono::steady_clock::now(); }
};

class ManualClock final : public IClock
{
  public:
    SteadyTime now() const override { return SteadyTime(Millis(ms_.load())); }
    void       advance(Millis d) { ms_.fetch_add(d.count()); }
    void       set(Millis since_origin) { ms_.store(since_origin.count()); }

  private:
    std::atomic<Millis::rep> ms_{0};
};

}  // namespace parcellink
