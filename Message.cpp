#include "Message.hpp"

#include <algorithm>

#include <glog/logging.h>

namespace Queue {

std::string_view domain_of(std::string_view address)
{
  auto const at = address.rfind('@');
  if (at == std::string_view::npos)
    return {};
  return address.substr(at + 1);
}

std::string_view to_string(MessageSource source)
{
  switch (source) {
  case MessageSource::local: return "local";
  case MessageSource::dsn: return "dsn";
  case MessageSource::report: return "report";
  }
  return "local";
}

std::string_view Recipient::domain_part() const { return domain_of(address); }

std::optional<std::uint64_t>
Recipient::expiration_time(std::uint64_t created) const
{
  if (auto ttl = std::get_if<Ttl>(&expires))
    return created + ttl->seconds;
  return {};
}

bool Recipient::is_expired(std::uint64_t created, std::uint64_t now) const
{
  return std::visit(overloaded{
                        [&](Ttl const& ttl) { return created + ttl.seconds <= now; },
                        [&](Attempts const& att) { return retry.inner >= att.count; },
                    },
                    expires);
}

std::string_view Message::return_path_domain() const
{
  return domain_of(return_path);
}

namespace {
bool on_queue(Recipient const& rcpt, std::optional<QueueName> const& queue)
{
  return rcpt.is_pending() && (!queue || rcpt.queue == *queue);
}

void keep_min(std::optional<std::uint64_t>& acc, std::uint64_t val)
{
  if (!acc || val < *acc)
    acc = val;
}

// When a delay report could next go out for rcpt.
std::uint64_t delay_report_due(Recipient const& rcpt)
{
  if ((rcpt.flags & NOTIFY_NEVER) || !(rcpt.flags & NOTIFY_DELAY))
    return never;
  return rcpt.notify.due;
}
} // namespace

std::optional<std::uint64_t>
Message::next_event(std::optional<QueueName> queue) const
{
  std::optional<std::uint64_t> next;
  for (auto const& rcpt : recipients) {
    if (!on_queue(rcpt, queue))
      continue;
    auto earlier = std::min(rcpt.retry.due, rcpt.notify.due);
    if (auto const exp = rcpt.expiration_time(created))
      earlier = std::min(earlier, *exp);
    keep_min(next, earlier);
  }
  return next;
}

std::optional<std::uint64_t>
Message::next_delivery_event(std::optional<QueueName> queue) const
{
  std::optional<std::uint64_t> next;
  for (auto const& rcpt : recipients) {
    if (on_queue(rcpt, queue))
      keep_min(next, rcpt.retry.due);
  }
  return next;
}

std::optional<std::uint64_t>
Message::next_dsn(std::optional<QueueName> queue) const
{
  std::optional<std::uint64_t> next;
  for (auto const& rcpt : recipients) {
    if (on_queue(rcpt, queue))
      keep_min(next, rcpt.notify.due);
  }
  return next;
}

std::optional<std::uint64_t>
Message::expires(std::optional<QueueName> queue) const
{
  std::optional<std::uint64_t> latest;
  for (auto const& rcpt : recipients) {
    if (!on_queue(rcpt, queue))
      continue;
    if (auto const exp = rcpt.expiration_time(created)) {
      if (!latest || *exp > *latest)
        latest = *exp;
    }
  }
  return latest;
}

std::optional<std::uint64_t>
Message::next_event_after(std::optional<QueueName> queue,
                          std::uint64_t            instant) const
{
  std::optional<std::uint64_t> next;
  for (auto const& rcpt : recipients) {
    if (!on_queue(rcpt, queue))
      continue;
    if (rcpt.retry.due > instant)
      keep_min(next, rcpt.retry.due);
    if (rcpt.notify.due > instant)
      keep_min(next, rcpt.notify.due);
    if (auto const exp = rcpt.expiration_time(created); exp && *exp > instant)
      keep_min(next, *exp);
  }
  return next;
}

std::unordered_map<QueueName, std::uint64_t> Message::next_events() const
{
  std::unordered_map<QueueName, std::uint64_t> events;
  for (auto const& rcpt : recipients) {
    if (!rcpt.is_pending())
      continue;
    auto earlier = std::min(rcpt.retry.due, delay_report_due(rcpt));
    if (auto const exp = rcpt.expiration_time(created))
      earlier = std::min(earlier, *exp);
    auto [it, inserted] = events.emplace(rcpt.queue, earlier);
    if (!inserted && earlier < it->second)
      it->second = earlier;
  }
  return events;
}

PendingDelivery Message::has_pending_delivery(QueueName const& queue,
                                              std::uint64_t    now)
{
  auto pending       = false;
  auto matches_queue = false;

  for (auto& rcpt : recipients) {
    if (std::holds_alternative<TemporaryFailure<ErrorDetails>>(rcpt.status)
        && rcpt.is_expired(created, now)) {
      LOG(INFO) << "queue " << queue_id << ": delivery to " << rcpt.address
                << " expired after " << rcpt.retry.inner << " attempts";
      rcpt.status = into_permanent(std::move(rcpt.status));
    }
    else if (std::holds_alternative<Scheduled>(rcpt.status)
             && rcpt.is_expired(created, now)) {
      LOG(INFO) << "queue " << queue_id << ": " << rcpt.address
                << " expired without any delivery attempts made";
      rcpt.status = PermanentFailure<ErrorDetails>{ErrorDetails{
          std::string(rcpt.domain_part()),
          Io{"Message expired without any delivery attempts made."}}};
    }
    else if (rcpt.is_pending()) {
      pending       = true;
      matches_queue = matches_queue || rcpt.queue == queue;
    }
  }

  if (!pending)
    return PendingDelivery::no;
  return matches_queue ? PendingDelivery::yes : PendingDelivery::yes_other_queue;
}

} // namespace Queue
