#ifndef SPOOL_DOT_HPP
#define SPOOL_DOT_HPP

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include "BlobStore.hpp"
#include "Catalog.hpp"
#include "CounterStore.hpp"
#include "Dispatcher.hpp"
#include "Dsn.hpp"
#include "Envelope.hpp"
#include "Guard.hpp"
#include "PolicyResolver.hpp"
#include "QueueStore.hpp"
#include "Transport.hpp"

class LocalDomains;

namespace Queue {

// The outbound queue: admits messages, runs delivery attempts on the
// virtual queue pools, keeps each recipient's retry, notify and expiry
// schedule, and sends the resulting delivery status notifications.
//
// Everything passed by reference must outlive the Spool.
class Spool {
public:
  Spool(Spool const&) = delete;
  Spool& operator=(Spool const&) = delete;

  Spool(Catalog const&      catalog,
        LocalDomains const* domains,
        CounterStore&       counters,
        QueueStore&         store,
        BlobStore&          blobs,
        Transport&          transport);

  Message new_message(std::string_view return_path, std::uint64_t now) const;

  // Adds a recipient due for delivery now, with its first delay
  // notification, expiry and virtual queue from its queue strategy.
  void add_recipient(Message&                   message,
                     std::string_view           address,
                     std::uint64_t              now,
                     std::uint32_t              flags = NOTIFY_FAILURE
                                                        | NOTIFY_DELAY,
                     std::optional<std::string> orcpt = {}) const;

  // Checks the inbound limiters (when the message comes from a
  // session) and the quotas, then stores the body and the message and
  // schedules delivery. Anything but Admit leaves nothing stored.
  Admission queue_message(Message&               message,
                          std::string_view       raw,
                          SessionEnvelope const* session,
                          std::uint64_t          now);

  // Records the outcome of an attempt. Temporary failures move the
  // recipient on to its next retry interval, retry_at overrides that
  // interval.
  void set_rcpt_status(Message const&               message,
                       Recipient&                   rcpt,
                       DeliveryStatus               status,
                       std::uint64_t                now,
                       std::optional<std::uint64_t> retry_at = {}) const;

  // One pass over a message for one virtual queue: expire, attempt the
  // recipients that are due, report, then save or remove it.
  void deliver(std::uint64_t queue_id, QueueName const& queue, std::uint64_t now);

  // Dispatches a delivery job for each virtual queue that has something
  // due for the message. Returns the number of jobs dispatched.
  std::size_t schedule(std::uint64_t queue_id, std::uint64_t now);

  // schedule() for every queued message.
  std::size_t schedule_all(std::uint64_t now);

  // Logs, then builds and queues a report to the return path, or
  // handles the double bounce when there's none.
  void send_dsn(Message& message, std::uint64_t now);
  std::size_t log_dsn(Message& message, std::uint64_t now) const
  {
    return dsn_.log_dsn(message, now);
  }

  // Waits for dispatched deliveries to finish.
  void join() { dispatcher_.join(); }

  PolicyResolver const& policy() const { return policy_; }
  Guard&                guard() { return guard_; }
  Dispatcher&           dispatcher() { return dispatcher_; }

private:
  std::uint64_t enqueue_(Message& message, std::string_view raw, std::uint64_t now);
  void attempt_(Message const& message, Recipient& rcpt, std::uint64_t now);

  std::shared_ptr<std::mutex> message_lock_(std::uint64_t queue_id);
  void                        forget_lock_(std::uint64_t queue_id);
  void                        finished_(std::uint64_t queue_id, QueueName const& queue);

  QueueStore& store_;
  BlobStore&  blobs_;
  Transport&  transport_;

  PolicyResolver policy_;
  Guard          guard_;
  DsnBuilder     dsn_;

  std::mutex                                                     locks_mtx_;
  std::unordered_map<std::uint64_t, std::shared_ptr<std::mutex>> locks_;
  std::set<std::pair<std::uint64_t, QueueName>>                  running_;

  Dispatcher dispatcher_; // last, so its workers stop first
};

} // namespace Queue

#endif // SPOOL_DOT_HPP
