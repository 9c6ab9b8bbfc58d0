#include "Spool.hpp"

#include "LocalDomains.hpp"
#include "Now.hpp"

#include <algorithm>
#include <exception>

#include <boost/algorithm/string/case_conv.hpp>

#include <glog/logging.h>

namespace Queue {

Spool::Spool(Catalog const&      catalog,
             LocalDomains const* domains,
             CounterStore&       counters,
             QueueStore&         store,
             BlobStore&          blobs,
             Transport&          transport)
  : store_(store)
  , blobs_(blobs)
  , transport_(transport)
  , policy_(catalog, domains)
  , guard_(counters, domains)
  , dsn_(policy_, blobs)
  , dispatcher_(catalog.virtual_queues)
{
}

Message Spool::new_message(std::string_view return_path,
                           std::uint64_t    now) const
{
  Message message;
  message.created           = now;
  message.return_path       = std::string(return_path);
  message.return_path_lcase = boost::algorithm::to_lower_copy(message.return_path);
  return message;
}

void Spool::add_recipient(Message&                   message,
                          std::string_view           address,
                          std::uint64_t              now,
                          std::uint32_t              flags,
                          std::optional<std::string> orcpt) const
{
  Recipient rcpt;
  rcpt.address       = std::string(address);
  rcpt.address_lcase = boost::algorithm::to_lower_copy(rcpt.address);
  rcpt.orcpt         = std::move(orcpt);
  rcpt.flags         = flags;
  rcpt.retry         = Schedule::now(now);

  auto const& strategy = policy_.queue_strategy(QueueEnvelope(message, rcpt));
  rcpt.notify  = Schedule::later(now, strategy.notify.front());
  rcpt.expires = strategy.expiry;
  rcpt.queue   = strategy.virtual_queue;

  message.recipients.push_back(std::move(rcpt));
}

std::uint64_t
Spool::enqueue_(Message& message, std::string_view raw, std::uint64_t now)
{
  message.size      = raw.size();
  message.blob_hash = blobs_.put_blob(raw);
  message.queue_id  = store_.assign_id();
  store_.write(message);

  LOG(INFO) << "queue " << message.queue_id << ": queued " << to_string(message.source)
            << " message from <" << message.return_path << "> for "
            << message.recipients.size() << " recipient(s), " << message.size
            << " bytes";

  schedule(message.queue_id, now);
  return message.queue_id;
}

Admission Spool::queue_message(Message&               message,
                               std::string_view       raw,
                               SessionEnvelope const* session,
                               std::uint64_t          now)
{
  message.size = raw.size();

  // Slots on inbound concurrency limits are held only while admitting.
  std::vector<InFlight> in_flight;

  if (session) {
    auto env   = *session;
    env.sender = message.return_path_lcase;
    for (auto const& rcpt : message.recipients) {
      env.rcpt       = rcpt.address_lcase;
      auto admission = guard_.check(policy_.catalog().inbound_limiters, env,
                                    now, in_flight);
      if (!std::holds_alternative<Admit>(admission)) {
        LOG(INFO) << "message from <" << message.return_path
                  << "> held back by an inbound limit for " << rcpt.address;
        return admission;
      }
    }
  }

  if (!guard_.has_quota(policy_.catalog().quota, message)) {
    LOG(INFO) << "message from <" << message.return_path
              << "> rejected, queue quota exceeded";
    return Rejected{"queue quota exceeded"};
  }

  try {
    enqueue_(message, raw, now);
  }
  catch (std::exception const& e) {
    LOG(ERROR) << "can't queue message from <" << message.return_path
               << ">: " << e.what();
    for (auto const& qk : message.quota_keys)
      guard_.counters().add(qk.key, -static_cast<std::int64_t>(qk.amount));
    message.quota_keys.clear();
    throw;
  }
  return Admit{};
}

void Spool::set_rcpt_status(Message const&               message,
                            Recipient&                   rcpt,
                            DeliveryStatus               status,
                            std::uint64_t                now,
                            std::optional<std::uint64_t> retry_at) const
{
  rcpt.status = std::move(status);

  if (auto done = std::get_if<Completed<HostResponse>>(&rcpt.status)) {
    LOG(INFO) << "queue " << message.queue_id << ": delivered to "
              << rcpt.address << " via " << done->value.hostname;
    return;
  }
  if (auto perm = std::get_if<PermanentFailure<ErrorDetails>>(&rcpt.status)) {
    LOG(INFO) << "queue " << message.queue_id << ": delivery to "
              << rcpt.address << " failed: " << describe(perm->error);
    return;
  }

  // Resolved after the status changed, so last_error sees this attempt.
  auto const& strategy = policy_.queue_strategy(QueueEnvelope(message, rcpt));

  if (retry_at) {
    rcpt.retry.due = *retry_at;
  }
  else {
    auto const idx = std::min<std::size_t>(rcpt.retry.inner,
                                           strategy.retry.size() - 1);
    rcpt.retry.due = now + strategy.retry[idx];
    rcpt.retry.inner += 1;
  }
  rcpt.expires = strategy.expiry;
  rcpt.queue   = strategy.virtual_queue;

  if (auto tmp = std::get_if<TemporaryFailure<ErrorDetails>>(&rcpt.status)) {
    LOG(INFO) << "queue " << message.queue_id << ": delivery to "
              << rcpt.address << " deferred: " << describe(tmp->error)
              << ", next attempt " << Now(rcpt.retry.due);
  }
}

void Spool::attempt_(Message const& message, Recipient& rcpt, std::uint64_t now)
{
  auto const domain = std::string(rcpt.domain_part());

  QueueEnvelope const   env(message, rcpt);
  std::vector<InFlight> in_flight;

  // The remote bucket depends on the host picked, which only the
  // transport knows.
  auto const& outbound  = policy_.catalog().outbound_limiters;
  auto        admission = guard_.check(outbound.sender, env, now, in_flight);
  if (std::holds_alternative<Admit>(admission))
    admission = guard_.check(outbound.rcpt, env, now, in_flight);

  if (auto deferred = std::get_if<Deferred>(&admission)) {
    std::optional<std::uint64_t> retry_at;
    if (std::holds_alternative<RateLimited>(deferred->reason))
      retry_at = deferred->retry_at;
    set_rcpt_status(
        message, rcpt,
        TemporaryFailure<ErrorDetails>{ErrorDetails{domain, deferred->reason}},
        now, retry_at);
    return;
  }
  if (auto rejected = std::get_if<Rejected>(&admission)) {
    set_rcpt_status(message, rcpt,
                    PermanentFailure<ErrorDetails>{
                        ErrorDetails{domain, Io{rejected->reason}}},
                    now);
    return;
  }

  auto const& route      = policy_.routing_strategy(env);
  auto const& tls        = policy_.tls_strategy(env);
  auto const& connection = policy_.connection_strategy(env);

  DeliveryStatus status;
  try {
    status = transport_.deliver(message, rcpt, route, tls, connection);
  }
  catch (std::exception const& e) {
    LOG(ERROR) << "queue " << message.queue_id << ": transport failed for "
               << rcpt.address << ": " << e.what();
    status = TemporaryFailure<ErrorDetails>{ErrorDetails{domain, Io{e.what()}}};
  }
  set_rcpt_status(message, rcpt, std::move(status), now);
}

void Spool::deliver(std::uint64_t    queue_id,
                    QueueName const& queue,
                    std::uint64_t    now)
{
  auto const snapshot = store_.read(queue_id);
  if (!snapshot) {
    LOG(WARNING) << "queue " << queue_id << ": message not found";
    return;
  }

  std::vector<std::pair<std::size_t, Recipient>> attempted;
  for (std::size_t idx = 0; idx < snapshot->recipients.size(); ++idx) {
    auto const& rcpt = snapshot->recipients[idx];
    if (!rcpt.is_pending() || rcpt.queue != queue || rcpt.retry.due > now
        || rcpt.is_expired(snapshot->created, now))
      continue;
    Recipient updated = rcpt;
    attempt_(*snapshot, updated, now);
    attempted.emplace_back(idx, std::move(updated));
  }

  auto const lock_ptr = message_lock_(queue_id);
  std::lock_guard<std::mutex> lock(*lock_ptr);

  // Other queues may have changed other recipients meanwhile.
  auto message = store_.read(queue_id);
  if (!message) {
    LOG(WARNING) << "queue " << queue_id << ": message removed during delivery";
    return;
  }
  for (auto& [idx, rcpt] : attempted) {
    if (idx >= message->recipients.size()
        || message->recipients[idx].address != rcpt.address) {
      LOG(ERROR) << "queue " << queue_id << ": recipient " << rcpt.address
                 << " changed during delivery";
      continue;
    }
    // The notify schedule and flags belong to whoever reported last,
    // only the outcome of the attempt is ours.
    auto& fresh   = message->recipients[idx];
    fresh.status  = std::move(rcpt.status);
    fresh.retry   = rcpt.retry;
    fresh.expires = rcpt.expires;
    fresh.queue   = rcpt.queue;
  }

  auto const pending = message->has_pending_delivery(queue, now);
  send_dsn(*message, now);
  guard_.release_quota(*message);

  if (pending == PendingDelivery::no) {
    LOG(INFO) << "queue " << queue_id << ": done, removing";
    store_.remove(queue_id);
    forget_lock_(queue_id);
  }
  else {
    store_.write(*message);
  }
}

std::size_t Spool::schedule(std::uint64_t queue_id, std::uint64_t now)
{
  auto const message = store_.read(queue_id);
  if (!message)
    return 0;

  std::size_t jobs = 0;
  for (auto const& [queue, due] : message->next_events()) {
    if (due > now)
      continue;
    {
      std::lock_guard<std::mutex> lock(locks_mtx_);
      if (!running_.emplace(queue_id, queue).second)
        continue; // already on its way
    }
    dispatcher_.dispatch(queue, [this, queue_id, queue = queue, now] {
      try {
        deliver(queue_id, queue, now);
      }
      catch (...) {
        finished_(queue_id, queue);
        throw;
      }
      finished_(queue_id, queue);
    });
    ++jobs;
  }
  return jobs;
}

std::size_t Spool::schedule_all(std::uint64_t now)
{
  std::size_t jobs = 0;
  for (auto const id : store_.queued())
    jobs += schedule(id, now);
  return jobs;
}

void Spool::send_dsn(Message& message, std::uint64_t now)
{
  dsn_.log_dsn(message, now);

  if (message.return_path.empty()) {
    DsnBuilder::handle_double_bounce(message, now);
    return;
  }

  auto const report = dsn_.build_dsn(message, now);
  if (!report)
    return;

  auto bounce      = new_message("", now);
  bounce.source    = MessageSource::dsn;
  bounce.sign_with = policy_.dsn_sign(message);
  add_recipient(bounce, message.return_path, now);

  auto const id = enqueue_(bounce, *report, now);
  LOG(INFO) << "queue " << message.queue_id << ": report queued as " << id;
}

std::shared_ptr<std::mutex> Spool::message_lock_(std::uint64_t queue_id)
{
  std::lock_guard<std::mutex> lock(locks_mtx_);
  auto& mtx = locks_[queue_id];
  if (!mtx)
    mtx = std::make_shared<std::mutex>();
  return mtx;
}

void Spool::forget_lock_(std::uint64_t queue_id)
{
  std::lock_guard<std::mutex> lock(locks_mtx_);
  locks_.erase(queue_id);
}

void Spool::finished_(std::uint64_t queue_id, QueueName const& queue)
{
  std::lock_guard<std::mutex> lock(locks_mtx_);
  running_.erase(std::make_pair(queue_id, queue));
}

} // namespace Queue
