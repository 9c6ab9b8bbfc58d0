#include "Spool.hpp"

#include "Config.hpp"

#include <algorithm>
#include <functional>
#include <map>
#include <stdexcept>

#include <glog/logging.h>

using namespace Queue;

namespace {

// Answers from a table, throws for anyone not in it.
class FakeTransport : public Transport {
public:
  struct Attempt {
    Message     message;
    std::string rcpt;
  };

  void set(std::string const& address, DeliveryStatus status)
  {
    std::lock_guard<std::mutex> lock(mtx_);
    outcomes_.insert_or_assign(address, std::move(status));
  }

  // Runs fn, once, in the middle of the next attempt for address.
  void during(std::string const& address, std::function<void()> fn)
  {
    std::lock_guard<std::mutex> lock(mtx_);
    hooks_.insert_or_assign(address, std::move(fn));
  }

  DeliveryStatus deliver(Message const&            message,
                         Recipient const&          rcpt,
                         RoutingStrategy const&    route,
                         TlsStrategy const&        tls,
                         ConnectionStrategy const& connection) override
  {
    CHECK(std::holds_alternative<MxRoute>(route));

    std::function<void()> hook;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      auto const it = hooks_.find(rcpt.address_lcase);
      if (it != hooks_.end()) {
        hook = std::move(it->second);
        hooks_.erase(it);
      }
    }
    if (hook)
      hook();

    std::lock_guard<std::mutex> lock(mtx_);
    attempts_.push_back(Attempt{message, rcpt.address});
    auto const it = outcomes_.find(rcpt.address_lcase);
    if (it == outcomes_.end())
      throw std::runtime_error("connection reset");
    return it->second;
  }

  std::vector<Attempt> attempts() const
  {
    std::lock_guard<std::mutex> lock(mtx_);
    return attempts_;
  }

private:
  mutable std::mutex                    mtx_;
  std::map<std::string, DeliveryStatus>        outcomes_;
  std::map<std::string, std::function<void()>> hooks_;
  std::vector<Attempt>                         attempts_;
};

struct Fixture {
  explicit Fixture(Catalog const& catalog)
    : spool(catalog, nullptr, counters, store, blobs, transport)
  {
  }

  // Puts a message straight into the store, nothing is scheduled.
  std::uint64_t store_message(Message& msg, std::string_view raw)
  {
    msg.size      = raw.size();
    msg.blob_hash = blobs.put_blob(raw);
    msg.queue_id  = store.assign_id();
    store.write(msg);
    return msg.queue_id;
  }

  MemoryCounterStore counters;
  MemoryQueueStore   store;
  MemoryBlobStore    blobs;
  FakeTransport      transport;
  Spool              spool;
};

constexpr auto base_config = R"(
report.domain = example.com
report.submitter = mx.example.com

queue.virtual.slow.threads-per-node = 1

queue.schedule.remote.queue-name = default
queue.schedule.remote.retry = 60

queue.schedule.tenacious.queue-name = default
queue.schedule.tenacious.retry = 1m, 10m, 1h
queue.schedule.tenacious.notify = 1h, 1d
queue.schedule.tenacious.expire = 5d

queue.schedule.later.queue-name = slow
queue.schedule.later.retry = 1h
queue.schedule.later.max-attempts = 2

queue.schedule.dsn.queue-name = default
queue.schedule.dsn.retry = 10m

queue.strategy.schedule.1.if = source == 'dsn'
queue.strategy.schedule.1.then = 'dsn'
queue.strategy.schedule.2.if = rcpt_domain == 'tenacious.example'
queue.strategy.schedule.2.then = 'tenacious'
queue.strategy.schedule.3.if = rcpt_domain == 'slow.example' && last_error == 'connection'
queue.strategy.schedule.3.then = 'later'
queue.strategy.schedule.else = 'remote'
)";

Catalog catalog_for(std::string const& text)
{
  Config config;
  config.parse(text, "spool.conf");
  CHECK(!config.has_errors()) << config.errors().front().key << ": "
                              << config.errors().front().message;
  return Catalog::parse(config, "localhost");
}

bool contains(std::string_view haystack, std::string_view needle)
{
  return haystack.find(needle) != std::string_view::npos;
}

DeliveryStatus delivered(std::string_view host)
{
  return Completed<HostResponse>{
      HostResponse{std::string(host), Response{250, {2, 0, 0}, "OK"}}};
}

DeliveryStatus refused(std::string_view host)
{
  return TemporaryFailure<ErrorDetails>{
      ErrorDetails{std::string(host), ConnectionError{"connection refused"}}};
}

DeliveryStatus no_such_user(std::string_view host)
{
  return PermanentFailure<ErrorDetails>{ErrorDetails{
      std::string(host),
      UnexpectedResponse{"RCPT TO", Response{550, {5, 1, 1}, "no such user"}}}};
}

constexpr std::uint64_t day = 86400;

} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const base = catalog_for(base_config);

  // New recipients and their schedules.
  {
    Fixture f(base);
    auto&   spool = f.spool;

    auto msg = spool.new_message("Alice@Example.COM", 1000);
    CHECK_EQ(msg.return_path, "Alice@Example.COM");
    CHECK_EQ(msg.return_path_lcase, "alice@example.com");
    CHECK_EQ(msg.created, 1000u);

    spool.add_recipient(msg, "Bob@Example.NET", 1000);
    spool.add_recipient(msg, "dave@tenacious.example", 1000, NOTIFY_NEVER,
                        "rfc822;Dave@Tenacious.Example");
    spool.add_recipient(msg, "eve@slow.example", 1000);

    auto& bob  = msg.recipients[0];
    auto& dave = msg.recipients[1];
    auto& eve  = msg.recipients[2];

    CHECK_EQ(bob.address, "Bob@Example.NET");
    CHECK_EQ(bob.address_lcase, "bob@example.net");
    CHECK_EQ(bob.flags, NOTIFY_FAILURE | NOTIFY_DELAY);
    CHECK(std::holds_alternative<Scheduled>(bob.status));
    CHECK_EQ(bob.retry.due, 1000u);
    CHECK_EQ(bob.retry.inner, 0u);
    CHECK_EQ(bob.notify.due, 1000u + 10000 * day); // no delay reports
    CHECK(std::get<Ttl>(bob.expires) == Ttl{3 * day});
    CHECK(bob.queue.is_default());

    CHECK_EQ(dave.flags, NOTIFY_NEVER);
    CHECK_EQ(*dave.orcpt, "rfc822;Dave@Tenacious.Example");
    CHECK_EQ(dave.notify.due, 1000u + 3600u);
    CHECK(std::get<Ttl>(dave.expires) == Ttl{5 * day});

    // A temporary failure waits one retry interval, the last interval
    // repeats once the list runs out.
    spool.set_rcpt_status(msg, bob, refused("mx.example.net"), 1000);
    CHECK(std::holds_alternative<TemporaryFailure<ErrorDetails>>(bob.status));
    CHECK_EQ(bob.retry.due, 1060u);
    CHECK_EQ(bob.retry.inner, 1u);
    CHECK_EQ(bob.notify.due, 1000u + 10000 * day);

    spool.set_rcpt_status(msg, bob, refused("mx.example.net"), 1060);
    CHECK_EQ(bob.retry.due, 1120u);
    CHECK_EQ(bob.retry.inner, 2u);

    // A rate limit says exactly when to come back.
    spool.set_rcpt_status(
        msg, bob,
        TemporaryFailure<ErrorDetails>{ErrorDetails{"example.net", RateLimited{}}},
        1120, 1200);
    CHECK_EQ(bob.retry.due, 1200u);
    CHECK_EQ(bob.retry.inner, 2u);

    // Final outcomes leave the schedule alone.
    spool.set_rcpt_status(msg, bob, delivered("mx.example.net"), 1200);
    CHECK(std::holds_alternative<Completed<HostResponse>>(bob.status));
    CHECK_EQ(bob.retry.due, 1200u);

    std::uint64_t now = 1000;
    for (auto const wait : {60u, 600u, 3600u, 3600u}) {
      spool.set_rcpt_status(msg, dave, refused("mx.tenacious.example"), now);
      CHECK_EQ(dave.retry.due, now + wait);
      now = dave.retry.due;
    }
    CHECK_EQ(dave.retry.inner, 4u);

    // The strategy is picked again after every failure.
    spool.set_rcpt_status(msg, eve, refused("mx.slow.example"), 1000);
    CHECK_EQ(eve.queue, QueueName("slow"));
    CHECK_EQ(eve.retry.due, 1000u + 3600u);
    CHECK(std::get<Attempts>(eve.expires) == Attempts{2});

    spool.set_rcpt_status(
        msg, eve,
        TemporaryFailure<ErrorDetails>{
            ErrorDetails{"slow.example", DnsError{"SERVFAIL"}}},
        4600);
    CHECK(eve.queue.is_default());
    CHECK_EQ(eve.retry.due, 4660u);
    CHECK(std::get<Ttl>(eve.expires) == Ttl{3 * day});
  }

  // Retries until the deadline, with nobody to tell.
  {
    Fixture f(base);
    f.transport.set("dave@tenacious.example", refused("mx.tenacious.example"));

    auto msg = f.spool.new_message("", 1000);
    f.spool.add_recipient(msg, "dave@tenacious.example", 1000);
    auto const id = f.store_message(msg, "Subject: retry\r\n\r\n");

    f.spool.deliver(id, QueueName{}, 1000);
    CHECK_EQ(f.transport.attempts().size(), 1u);
    auto stored = f.store.read(id);
    CHECK(stored);
    auto const& dave = stored->recipients[0];
    CHECK(std::holds_alternative<TemporaryFailure<ErrorDetails>>(dave.status));
    CHECK_EQ(dave.retry.due, 1060u);
    CHECK_EQ(dave.retry.inner, 1u);

    // Not due yet, or not on this queue.
    f.spool.deliver(id, QueueName{}, 1030);
    f.spool.deliver(id, QueueName("slow"), 2000);
    CHECK_EQ(f.transport.attempts().size(), 1u);

    // The delay report falls due but can't go anywhere.
    f.spool.deliver(id, QueueName{}, 4600);
    CHECK_EQ(f.transport.attempts().size(), 2u);
    stored = f.store.read(id);
    CHECK_EQ(stored->recipients[0].retry.due, 4600u + 600u);
    CHECK_EQ(stored->recipients[0].retry.inner, 2u);
    CHECK_EQ(stored->recipients[0].notify.due, 1000u + 5 * day + 10);
    CHECK(f.store.queued() == std::vector<std::uint64_t>{id});

    // Out of time: failed, and the message goes.
    f.spool.deliver(id, QueueName{}, 1000 + 5 * day);
    CHECK_EQ(f.transport.attempts().size(), 2u);
    CHECK(!f.store.read(id));
    CHECK(f.store.queued().empty());
  }

  // Outbound rate limits, and a transport that throws.
  {
    auto const catalog = catalog_for(std::string(base_config) + R"(
queue.limiter.outbound.per-domain.key = rcpt_domain
queue.limiter.outbound.per-domain.rate = 1/1h
)");
    Fixture f(catalog);
    f.transport.set("a@example.net", delivered("mx.example.net"));
    f.transport.set("b@example.net", delivered("mx.example.net"));
    f.transport.set("c@example.org", delivered("mx.example.org"));

    auto msg = f.spool.new_message("alice@example.com", 3600);
    for (auto rcpt : {"a@example.net", "b@example.net", "c@example.org",
                      "d@example.com"})
      f.spool.add_recipient(msg, rcpt, 3600);
    auto const id = f.store_message(msg, "Subject: limits\r\n\r\n");

    f.spool.deliver(id, QueueName{}, 3700);
    CHECK_EQ(f.transport.attempts().size(), 3u);

    auto stored = f.store.read(id);
    CHECK(stored);
    auto const& rcpts = stored->recipients;
    CHECK(std::holds_alternative<Completed<HostResponse>>(rcpts[0].status));
    CHECK(!(rcpts[0].flags & RCPT_DSN_SENT)); // nothing was reported

    auto const& limited
        = std::get<TemporaryFailure<ErrorDetails>>(rcpts[1].status);
    CHECK(std::holds_alternative<RateLimited>(limited.error.error));
    CHECK_EQ(rcpts[1].retry.due, 7200u);
    CHECK_EQ(rcpts[1].retry.inner, 0u);

    CHECK(std::holds_alternative<Completed<HostResponse>>(rcpts[2].status));

    auto const& thrown
        = std::get<TemporaryFailure<ErrorDetails>>(rcpts[3].status);
    CHECK_EQ(std::get<Io>(thrown.error.error).details, "connection reset");
    CHECK_EQ(rcpts[3].retry.due, 3760u);

    // Next window.
    f.spool.deliver(id, QueueName{}, 7200);
    CHECK_EQ(f.transport.attempts().size(), 5u);
    stored = f.store.read(id);
    CHECK(stored);
    CHECK(std::holds_alternative<Completed<HostResponse>>(
        stored->recipients[1].status));
    CHECK(stored->recipients[3].is_pending());

    // Delivered on either pass, logged once.
    CHECK(stored->recipients[0].flags & RCPT_STATUS_LOGGED);
    CHECK(stored->recipients[1].flags & RCPT_STATUS_LOGGED);
    CHECK(!(stored->recipients[3].flags & RCPT_STATUS_LOGGED));
    CHECK_EQ(f.spool.log_dsn(*stored, 7200), 0u);
  }

  // Queued, delivered, and reported on through the worker pools.
  {
    Fixture f(base);
    f.transport.set("bob@example.net", delivered("mx.example.net"));
    f.transport.set("carol@example.org", no_such_user("mx.example.org"));
    f.transport.set("alice@example.com", delivered("mx.example.com"));

    auto const raw = std::string("Subject: lunch\r\n"
                                 "From: alice@example.com\r\n"
                                 "\r\n"
                                 "Noon?\r\n");

    auto msg = f.spool.new_message("alice@example.com", 1000);
    f.spool.add_recipient(msg, "bob@example.net", 1000,
                          NOTIFY_SUCCESS | NOTIFY_FAILURE);
    f.spool.add_recipient(msg, "carol@example.org", 1000);

    auto const admission = f.spool.queue_message(msg, raw, nullptr, 1000);
    CHECK(std::holds_alternative<Admit>(admission));
    CHECK_EQ(msg.queue_id, 1u);
    CHECK_EQ(msg.size, raw.size());
    CHECK_EQ(msg.blob_hash, blob_hash(raw));

    f.spool.join();

    CHECK(f.store.queued().empty());

    auto const attempts = f.transport.attempts();
    CHECK_EQ(attempts.size(), 3u);

    auto const bounce = std::find_if(
        attempts.begin(), attempts.end(), [](FakeTransport::Attempt const& a) {
          return a.message.source == MessageSource::dsn;
        });
    CHECK(bounce != attempts.end());
    CHECK_EQ(bounce->rcpt, "alice@example.com");
    CHECK_EQ(bounce->message.return_path, "");
    CHECK(bounce->message.recipients[0].queue.is_default());
    CHECK_EQ(bounce->message.recipients[0].retry.inner, 0u);

    auto const report = f.blobs.get_blob(bounce->message.blob_hash);
    CHECK(report);
    CHECK(contains(*report, "Subject: Partially delivered message\r\n"));
    CHECK(contains(*report, "From: \"Mail Delivery Subsystem\" "
                            "<MAILER-DAEMON@example.com>\r\n"));
    CHECK(contains(*report, "<bob@example.net> (delivered to 'mx.example.net' "
                            "with code 250 (2.0.0) 'OK')"));
    CHECK(contains(*report, "<carol@example.org> (host 'mx.example.org' "
                            "rejected command 'RCPT TO' with code 550"));
    CHECK(contains(*report, "Reporting-MTA: dns;mx.example.com\r\n"));
    CHECK(contains(*report, "Subject: lunch\r\n"));
    CHECK(!contains(*report, "Noon?"));
  }

  // Two queues working on one message: a delay report goes out once.
  {
    Fixture f(base);
    f.transport.set("r1@tenacious.example", refused("mx.tenacious.example"));
    f.transport.set("r2@tenacious.example", refused("mx.tenacious.example"));
    f.transport.set("alice@example.com", delivered("mx.example.com"));

    auto msg = f.spool.new_message("alice@example.com", 1000);
    f.spool.add_recipient(msg, "r1@tenacious.example", 1000);
    f.spool.add_recipient(msg, "r2@tenacious.example", 1000);
    msg.recipients[1].queue = QueueName("slow");
    auto const id = f.store_message(msg, "Subject: twice\r\n\r\n");

    // The first delay report falls due an hour in.
    std::uint64_t const now = 1000 + 3600;
    CHECK_EQ(msg.recipients[0].notify.due, now);
    CHECK_EQ(msg.recipients[1].notify.due, now);

    // While r1 is being tried, the slow queue finishes r2 and reports
    // on both.
    f.transport.during("r1@tenacious.example",
                       [&] { f.spool.deliver(id, QueueName("slow"), now); });
    f.spool.deliver(id, QueueName{}, now);
    f.spool.join();

    auto const stored = f.store.read(id);
    CHECK(stored);
    for (auto const& rcpt : stored->recipients) {
      CHECK(std::holds_alternative<TemporaryFailure<ErrorDetails>>(rcpt.status));
      CHECK_EQ(rcpt.retry.inner, 1u);
      CHECK_EQ(rcpt.notify.inner, 1u);
      CHECK_EQ(rcpt.notify.due, now + day);
    }

    auto const attempts = f.transport.attempts();
    auto const reports  = std::count_if(
        attempts.begin(), attempts.end(), [](FakeTransport::Attempt const& a) {
          return a.message.source == MessageSource::dsn;
        });
    CHECK_EQ(reports, 1);

    auto const report = std::find_if(
        attempts.begin(), attempts.end(), [](FakeTransport::Attempt const& a) {
          return a.message.source == MessageSource::dsn;
        });
    auto const body = f.blobs.get_blob(report->message.blob_hash);
    CHECK(body);
    CHECK(contains(*body, "Subject: Warning: Delay in message delivery\r\n"));
    CHECK(contains(*body, "<r1@tenacious.example>"));
    CHECK(contains(*body, "<r2@tenacious.example>"));
  }

  // Quotas and inbound limits.
  {
    auto const catalog = catalog_for(std::string(base_config) + R"(
queue.quota.total.size = 1000
queue.limiter.inbound.ip.key = remote_ip
queue.limiter.inbound.ip.rate = 1/1m
)");
    Fixture f(catalog);

    auto make = [&](std::size_t size, std::uint64_t now) {
      auto msg = f.spool.new_message("alice@example.com", now);
      f.spool.add_recipient(msg, "bob@example.net", now);
      return std::make_pair(msg, std::string(size, 'x'));
    };

    auto [big, big_raw] = make(1200, 1000);
    auto const too_big  = f.spool.queue_message(big, big_raw, nullptr, 1000);
    CHECK_EQ(std::get<Rejected>(too_big).reason, "queue quota exceeded");
    CHECK(f.store.queued().empty());
    CHECK_EQ(f.blobs.size(), 0u);
    CHECK(big.quota_keys.empty());

    SessionEnvelope session;
    session.remote_ip = "192.0.2.1";

    auto [small, small_raw] = make(800, 1000);
    CHECK(std::holds_alternative<Admit>(
        f.spool.queue_message(small, small_raw, &session, 1000)));
    CHECK_EQ(small.quota_keys.size(), 1u);

    auto other      = session;
    other.remote_ip = "192.0.2.2";
    auto [second, second_raw] = make(800, 1001);
    CHECK(std::holds_alternative<Rejected>(
        f.spool.queue_message(second, second_raw, &other, 1001)));

    auto [third, third_raw] = make(100, 1002);
    auto const limited = f.spool.queue_message(third, third_raw, &session, 1002);
    CHECK_EQ(std::get<Deferred>(limited).retry_at, 1020u);
    CHECK(std::holds_alternative<RateLimited>(std::get<Deferred>(limited).reason));

    f.spool.join();

    // Still trying, so still counted.
    CHECK(f.store.queued() == std::vector<std::uint64_t>{small.queue_id});
    CHECK_EQ(f.counters.get(small.quota_keys[0].key), 800);
    auto const stored = f.store.read(small.queue_id);
    CHECK_EQ(stored->quota_keys.size(), 1u);
    CHECK(stored->recipients[0].is_pending());
  }

  // Picking up what's due from the store.
  {
    Fixture f(base);
    f.transport.set("a@example.net", delivered("mx.example.net"));
    f.transport.set("b@slow.example", delivered("mx.slow.example"));

    auto due = f.spool.new_message("alice@example.com", 1000);
    f.spool.add_recipient(due, "a@example.net", 1000);
    f.spool.add_recipient(due, "b@slow.example", 1000);
    due.recipients[1].queue = QueueName("slow");
    auto const due_id       = f.store_message(due, "Subject: now\r\n\r\n");

    auto later = f.spool.new_message("alice@example.com", 1000);
    f.spool.add_recipient(later, "a@example.net", 1000);
    later.recipients[0].retry.due = 5000;
    auto const later_id = f.store_message(later, "Subject: later\r\n\r\n");

    CHECK_EQ(f.spool.schedule(later_id, 1000), 0u);
    CHECK_EQ(f.spool.schedule(12345, 1000), 0u);
    CHECK_EQ(f.spool.schedule_all(1000), 2u); // one job per virtual queue

    f.spool.join();

    CHECK_EQ(f.transport.attempts().size(), 2u);
    CHECK(!f.store.read(due_id));
    CHECK(f.store.queued() == std::vector<std::uint64_t>{later_id});
  }
}
