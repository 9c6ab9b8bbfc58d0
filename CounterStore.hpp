#ifndef COUNTERSTORE_DOT_HPP
#define COUNTERSTORE_DOT_HPP

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace Queue {

// So many requests per period.
struct Rate {
  std::uint64_t        requests{0};
  std::chrono::seconds period{0};
};

// The shared counters behind limiters and quotas. Every operation is
// atomic with respect to the others.
class CounterStore {
public:
  virtual ~CounterStore() = default;

  virtual std::int64_t get(std::string_view key) = 0;

  virtual void add(std::string_view key, std::int64_t delta) = 0;

  // Adds delta unless the total would exceed limit, returns whether it
  // was added.
  virtual bool
  try_add(std::string_view key, std::int64_t delta, std::int64_t limit)
      = 0;

  // Counts one request in the current fixed window. Returns nothing if
  // it's allowed, else the time the window refills.
  virtual std::optional<std::uint64_t>
  rate_limit(std::string_view key, Rate const& rate, std::uint64_t now) = 0;
};

class MemoryCounterStore : public CounterStore {
public:
  std::int64_t get(std::string_view key) override;
  void         add(std::string_view key, std::int64_t delta) override;
  bool
  try_add(std::string_view key, std::int64_t delta, std::int64_t limit) override;
  std::optional<std::uint64_t>
  rate_limit(std::string_view key, Rate const& rate, std::uint64_t now) override;

private:
  struct window {
    std::uint64_t start{0};
    std::uint64_t count{0};
  };

  std::mutex                                   mtx_;
  std::unordered_map<std::string, std::int64_t> counters_;
  std::unordered_map<std::string, window>       windows_;
};

} // namespace Queue

#endif // COUNTERSTORE_DOT_HPP
