#ifndef GUARD_DOT_HPP
#define GUARD_DOT_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "CounterStore.hpp"
#include "Error.hpp"
#include "Message.hpp"
#include "Throttle.hpp"

class LocalDomains;

namespace Queue {

class ConcurrencyLimiter;

// A slot held against a concurrency limit, given back on destruction.
class InFlight {
public:
  explicit InFlight(std::shared_ptr<ConcurrencyLimiter> limiter);
  ~InFlight();

  InFlight(InFlight&& other) noexcept;
  InFlight& operator=(InFlight&& other) noexcept;

  InFlight(InFlight const&) = delete;
  InFlight& operator=(InFlight const&) = delete;

private:
  std::shared_ptr<ConcurrencyLimiter> limiter_;
};

class ConcurrencyLimiter : public std::enable_shared_from_this<ConcurrencyLimiter> {
public:
  explicit ConcurrencyLimiter(std::uint64_t max)
    : max_(max)
  {
  }

  std::optional<InFlight> try_acquire();

  std::uint64_t in_flight() const { return in_flight_.load(); }
  bool          is_active() const { return in_flight() > 0; }

private:
  friend class InFlight;

  std::uint64_t const        max_;
  std::atomic<std::uint64_t> in_flight_{0};
};

struct Admit {
};

struct Deferred {
  std::uint64_t retry_at;
  Error         reason; // RateLimited or ConcurrencyLimited
};

struct Rejected {
  std::string reason;
};

using Admission = std::variant<Admit, Deferred, Rejected>;

// Checks limiters and quotas against the shared counters.
class Guard {
public:
  Guard(CounterStore& counters, LocalDomains const* domains);

  // Each limiter whose match expression applies counts one request,
  // the first one over its limit defers. Slots taken on concurrency
  // limits are appended to in_flight.
  Admission check(std::vector<RateLimiter> const& limiters,
                  Expr::Resolver const&           env,
                  std::uint64_t                   now,
                  std::vector<InFlight>&          in_flight);

  // The sender, recipient and remote buckets in turn.
  Admission check(RateLimiters const&    limiters,
                  Expr::Resolver const&  env,
                  std::uint64_t          now,
                  std::vector<InFlight>& in_flight);

  // Charges the message against every applicable quota, recording the
  // charges in message.quota_keys. If any quota would be exceeded
  // nothing is charged and false is returned.
  bool has_quota(QueueQuotas const& quotas, Message& message);

  // Gives back the charges for recipients that reached a final status.
  void release_quota(Message& message);

  CounterStore& counters() { return counters_; }

  // Drop idle concurrency limiters.
  void cleanup();

private:
  CounterStore&       counters_;
  LocalDomains const* domains_;

  std::mutex                                                           mtx_;
  std::unordered_map<std::string, std::shared_ptr<ConcurrencyLimiter>> concurrency_;
};

} // namespace Queue

#endif // GUARD_DOT_HPP
