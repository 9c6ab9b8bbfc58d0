#ifndef MESSAGE_DOT_HPP
#define MESSAGE_DOT_HPP

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include "Error.hpp"
#include "QueueName.hpp"

namespace Queue {

// Recipient flags.
constexpr std::uint32_t RCPT_DSN_SENT = 1 << 0;
constexpr std::uint32_t NOTIFY_NEVER = 1 << 1;
constexpr std::uint32_t NOTIFY_SUCCESS = 1 << 2;
constexpr std::uint32_t NOTIFY_FAILURE = 1 << 3;
constexpr std::uint32_t NOTIFY_DELAY = 1 << 4;
constexpr std::uint32_t RCPT_STATUS_LOGGED = 1 << 5; // final outcome logged

constexpr std::uint64_t never = std::numeric_limits<std::uint64_t>::max();

// An attempt counter and the time the next attempt is due.
struct Schedule {
  std::uint32_t inner{0};
  std::uint64_t due{0};

  static Schedule now(std::uint64_t now) { return Schedule{0, now}; }
  static Schedule later(std::uint64_t now, std::uint64_t delay)
  {
    return Schedule{0, now + delay};
  }
};

// Deadline after a fixed number of seconds from arrival.
struct Ttl {
  std::uint64_t seconds;
  bool operator==(Ttl const&) const = default;
};

// Deadline after a number of delivery attempts.
struct Attempts {
  std::uint32_t count;
  bool operator==(Attempts const&) const = default;
};

using QueueExpiry = std::variant<Ttl, Attempts>;

struct Recipient {
  std::string                address;
  std::string                address_lcase;
  std::optional<std::string> orcpt;
  DeliveryStatus             status{Scheduled{}};
  std::uint32_t              flags{0};
  Schedule                   retry;
  Schedule                   notify;
  QueueExpiry                expires{Ttl{0}};
  QueueName                  queue;

  std::string_view domain_part() const;

  bool is_pending() const
  {
    return std::holds_alternative<Scheduled>(status)
           || std::holds_alternative<TemporaryFailure<ErrorDetails>>(status);
  }

  std::optional<std::uint64_t> expiration_time(std::uint64_t created) const;
  bool is_expired(std::uint64_t created, std::uint64_t now) const;
};

enum class MessageSource { local, dsn, report };

std::string_view to_string(MessageSource source);

// A counter charged when the message was admitted.
struct QuotaKey {
  enum class kind { size, count };

  kind          type;
  std::string   key;
  std::uint64_t id; // which recipient(s) the charge is for
  std::uint64_t amount;
};

enum class PendingDelivery { no, yes_other_queue, yes };

struct Message {
  std::uint64_t              queue_id{0};
  std::uint64_t              created{0};
  std::string                return_path;
  std::string                return_path_lcase;
  std::vector<Recipient>     recipients;
  std::optional<std::string> env_id;
  std::uint64_t              size{0};
  std::string                blob_hash;
  MessageSource              source{MessageSource::local};
  std::vector<QuotaKey>      quota_keys;

  // Names of the signatures to apply on the way out.
  std::vector<std::string> sign_with;

  std::string_view return_path_domain() const;

  // All of these consider only recipients still pending delivery,
  // optionally restricted to one virtual queue.
  std::optional<std::uint64_t>
  next_event(std::optional<QueueName> queue = {}) const;
  std::optional<std::uint64_t>
  next_delivery_event(std::optional<QueueName> queue = {}) const;
  std::optional<std::uint64_t>
  next_dsn(std::optional<QueueName> queue = {}) const;
  std::optional<std::uint64_t>
  expires(std::optional<QueueName> queue = {}) const;
  std::optional<std::uint64_t> next_event_after(std::optional<QueueName> queue,
                                                std::uint64_t instant) const;
  // Per virtual queue, when there is next something to do: an attempt,
  // an expiry, or a delay report for a recipient that asked for them.
  std::unordered_map<QueueName, std::uint64_t> next_events() const;

  // Fails the pending recipients whose deadline has passed. Returns
  // whether anything is still pending, and whether any of it is on the
  // given queue.
  PendingDelivery has_pending_delivery(QueueName const& queue,
                                       std::uint64_t    now);
};

std::string_view domain_of(std::string_view address);

} // namespace Queue

#endif // MESSAGE_DOT_HPP
