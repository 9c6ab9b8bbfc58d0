#include "CounterStore.hpp"

#include <glog/logging.h>

namespace Queue {

std::int64_t MemoryCounterStore::get(std::string_view key)
{
  std::lock_guard<std::mutex> lock(mtx_);
  auto const                  it = counters_.find(std::string(key));
  return it == counters_.end() ? 0 : it->second;
}

void MemoryCounterStore::add(std::string_view key, std::int64_t delta)
{
  std::lock_guard<std::mutex> lock(mtx_);
  auto&                       val = counters_[std::string(key)];
  val += delta;
  if (val <= 0)
    counters_.erase(std::string(key));
}

bool MemoryCounterStore::try_add(std::string_view key,
                                 std::int64_t     delta,
                                 std::int64_t     limit)
{
  std::lock_guard<std::mutex> lock(mtx_);
  auto&                       val = counters_[std::string(key)];
  if (val + delta > limit) {
    if (val == 0)
      counters_.erase(std::string(key));
    return false;
  }
  val += delta;
  return true;
}

std::optional<std::uint64_t> MemoryCounterStore::rate_limit(
    std::string_view key, Rate const& rate, std::uint64_t now)
{
  auto const period = static_cast<std::uint64_t>(rate.period.count());
  CHECK_GT(period, 0u) << "rate period must be positive";

  auto const start = now - (now % period);

  std::lock_guard<std::mutex> lock(mtx_);
  auto&                       win = windows_[std::string(key)];
  if (win.start != start) {
    win.start = start;
    win.count = 0;
  }
  if (win.count + 1 > rate.requests)
    return start + period;
  ++win.count;
  return {};
}

} // namespace Queue
