#ifndef THROTTLE_DOT_HPP
#define THROTTLE_DOT_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "CounterStore.hpp"
#include "Expression.hpp"

class Config;

namespace Queue {

// The message dimensions a limiter or quota counts by.
constexpr std::uint16_t THROTTLE_RCPT = 1 << 0;
constexpr std::uint16_t THROTTLE_RCPT_DOMAIN = 1 << 1;
constexpr std::uint16_t THROTTLE_SENDER = 1 << 2;
constexpr std::uint16_t THROTTLE_SENDER_DOMAIN = 1 << 3;
constexpr std::uint16_t THROTTLE_AUTH_AS = 1 << 4;
constexpr std::uint16_t THROTTLE_LISTENER = 1 << 5;
constexpr std::uint16_t THROTTLE_MX = 1 << 6;
constexpr std::uint16_t THROTTLE_REMOTE_IP = 1 << 7;
constexpr std::uint16_t THROTTLE_LOCAL_IP = 1 << 8;
constexpr std::uint16_t THROTTLE_HELO_DOMAIN = 1 << 9;

std::optional<std::uint16_t> throttle_key(std::string_view name);

struct RateLimiter {
  std::string                  id;
  Expr::Expression             expr; // empty matches everything
  std::uint16_t                keys{0};
  std::optional<Rate>          rate;
  std::optional<std::uint64_t> concurrency;
};

struct QueueQuota {
  std::string                  id;
  Expr::Expression             expr;
  std::uint16_t                keys{0};
  std::optional<std::uint64_t> size;
  std::optional<std::uint64_t> messages;
};

// Limiters partitioned by the scope they have to be checked in.
struct RateLimiters {
  std::vector<RateLimiter> sender;
  std::vector<RateLimiter> rcpt;
  std::vector<RateLimiter> remote;
};

struct QueueQuotas {
  std::vector<QueueQuota> sender;
  std::vector<QueueQuota> rcpt;
  std::vector<QueueQuota> rcpt_domain;
};

// queue.limiter.inbound.<id>.*
RateLimiters parse_inbound_rate_limiters(Config& config);

// queue.limiter.outbound.<id>.*
RateLimiters parse_outbound_rate_limiters(Config& config);

// queue.quota.<id>.*
QueueQuotas parse_queue_quotas(Config& config);

// The counter key: a hash of the id, the selected dimension values and
// the limits, so changing a limit starts a fresh count.
std::string new_key(RateLimiter const& limiter, Expr::Resolver const& env);
std::string new_key(QueueQuota const& quota, Expr::Resolver const& env);

// "<requests>/<period>", for example "100/1h".
bool parse_value(std::string_view value, Rate& out, std::string& msg);

} // namespace Queue

#endif // THROTTLE_DOT_HPP
