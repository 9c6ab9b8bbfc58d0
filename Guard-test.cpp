#include "Guard.hpp"

#include "Config.hpp"
#include "Envelope.hpp"

#include <algorithm>

#include <glog/logging.h>

using namespace Queue;

namespace {
bool has_error(Config const& config, std::string_view key)
{
  auto const& errs = config.errors();
  return std::any_of(errs.begin(), errs.end(),
                     [&](Config::Error const& e) { return e.key == key; });
}

Message message(std::string_view sender, std::uint64_t size)
{
  Message msg;
  msg.return_path       = std::string(sender);
  msg.return_path_lcase = std::string(sender);
  msg.size              = size;
  for (auto rcpt : {"a@example.net", "b@example.net", "c@example.org"}) {
    Recipient r;
    r.address       = rcpt;
    r.address_lcase = rcpt;
    msg.recipients.push_back(r);
  }
  return msg;
}

void complete_all(Message& msg)
{
  for (auto& rcpt : msg.recipients)
    rcpt.status = Completed<HostResponse>{HostResponse{"mx", Response{250}}};
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  std::string err;
  Rate        rate;
  CHECK(parse_value("100/1h", rate, err));
  CHECK_EQ(rate.requests, 100u);
  CHECK(rate.period == std::chrono::hours(1));
  CHECK(!parse_value("100", rate, err));
  CHECK(!parse_value("0/1m", rate, err));
  CHECK(!parse_value("x/1m", rate, err));

  // Counter store.
  {
    MemoryCounterStore counters;
    CHECK(counters.try_add("k", 5, 10));
    CHECK(counters.try_add("k", 5, 10));
    CHECK(!counters.try_add("k", 1, 10));
    CHECK_EQ(counters.get("k"), 10);
    counters.add("k", -10);
    CHECK_EQ(counters.get("k"), 0);

    Rate const two_per_minute{2, std::chrono::seconds(60)};
    CHECK(!counters.rate_limit("r", two_per_minute, 1000));
    CHECK(!counters.rate_limit("r", two_per_minute, 1001));
    CHECK_EQ(*counters.rate_limit("r", two_per_minute, 1002), 1020u);
    CHECK(!counters.rate_limit("r", two_per_minute, 1020));
  }

  // Sorting limiters and quotas into buckets.
  {
    Config config;
    config.parse(R"(
queue.limiter.inbound.by-ip.key = remote_ip
queue.limiter.inbound.by-ip.rate = 10/1m
queue.limiter.inbound.by-rcpt.key = rcpt
queue.limiter.inbound.by-rcpt.rate = 10/1m
queue.limiter.inbound.by-sender.key = sender_domain
queue.limiter.inbound.by-sender.concurrency = 5
queue.limiter.inbound.matched.match = rcpt_domain == 'example.org'
queue.limiter.inbound.matched.rate = 1/1s
queue.limiter.inbound.off.key = rcpt
queue.limiter.inbound.off.rate = 1/1s
queue.limiter.inbound.off.enable = false
queue.limiter.inbound.useless.key = rcpt

queue.limiter.outbound.by-mx.key = mx
queue.limiter.outbound.by-mx.concurrency = 2
queue.limiter.outbound.by-domain.key = rcpt_domain
queue.limiter.outbound.by-domain.rate = 100/1h
queue.limiter.outbound.by-sender.key = sender
queue.limiter.outbound.by-sender.rate = 100/1h
queue.limiter.outbound.bad-key.key = helo_domain
queue.limiter.outbound.bad-key.rate = 1/1s
queue.limiter.outbound.unknown-key.key = colour
queue.limiter.outbound.unknown-key.rate = 1/1s

queue.quota.per-rcpt.key = rcpt
queue.quota.per-rcpt.messages = 10
queue.quota.per-domain.key = rcpt_domain
queue.quota.per-domain.size = 1000000
queue.quota.global.messages = 100000
queue.quota.empty.size = 0
)");

    auto const in = parse_inbound_rate_limiters(config);
    CHECK_EQ(in.remote.size(), 1u);
    CHECK_EQ(in.remote[0].id, "by-ip");
    CHECK_EQ(in.rcpt.size(), 2u); // by-rcpt and matched
    CHECK_EQ(in.sender.size(), 1u);
    CHECK_EQ(in.sender[0].id, "by-sender");
    CHECK(has_error(config, "queue.limiter.inbound.useless"));

    auto const out = parse_outbound_rate_limiters(config);
    CHECK_EQ(out.remote.size(), 1u);
    CHECK_EQ(out.remote[0].id, "by-mx");
    CHECK_EQ(out.rcpt.size(), 1u);
    CHECK_EQ(out.rcpt[0].id, "by-domain");
    // A limiter keeps its valid keys, bad ones are reported.
    CHECK(has_error(config, "queue.limiter.outbound.bad-key.key"));
    CHECK(has_error(config, "queue.limiter.outbound.unknown-key.key"));
    CHECK_EQ(out.sender.size(), 3u);

    auto const quotas = parse_queue_quotas(config);
    CHECK_EQ(quotas.rcpt.size(), 1u);
    CHECK_EQ(quotas.rcpt_domain.size(), 1u);
    CHECK_EQ(quotas.sender.size(), 1u);
    CHECK_EQ(quotas.sender[0].id, "global");
    CHECK(has_error(config, "queue.quota.empty"));
  }

  // A size quota of 1000 bytes.
  {
    Config config;
    config.parse("queue.quota.size.size = 1000\n");
    auto const quotas = parse_queue_quotas(config);
    CHECK(!config.has_errors());

    MemoryCounterStore counters;
    Guard              guard(counters, nullptr);

    auto too_big = message("alice@example.com", 1200);
    CHECK(!guard.has_quota(quotas, too_big));
    CHECK(too_big.quota_keys.empty());

    auto first = message("alice@example.com", 800);
    CHECK(guard.has_quota(quotas, first));
    CHECK_EQ(first.quota_keys.size(), 1u);
    CHECK(first.quota_keys[0].type == QuotaKey::kind::size);
    CHECK_EQ(counters.get(first.quota_keys[0].key), 800);

    auto second = message("alice@example.com", 800);
    CHECK(!guard.has_quota(quotas, second));

    // Released only once every recipient is done.
    first.recipients[0].status
        = Completed<HostResponse>{HostResponse{"mx", Response{250}}};
    guard.release_quota(first);
    CHECK_EQ(first.quota_keys.size(), 1u);

    complete_all(first);
    guard.release_quota(first);
    CHECK(first.quota_keys.empty());

    CHECK(guard.has_quota(quotas, second));
  }

  // Per recipient and per domain quotas, and a match expression.
  {
    Config config;
    config.parse(R"(
queue.quota.rcpt.key = rcpt
queue.quota.rcpt.messages = 1
queue.quota.domain.key = rcpt_domain
queue.quota.domain.messages = 1
queue.quota.domain.match = rcpt_domain == 'example.org'
)");
    auto const quotas = parse_queue_quotas(config);
    CHECK(!config.has_errors());

    MemoryCounterStore counters;
    Guard              guard(counters, nullptr);

    auto first = message("alice@example.com", 10);
    CHECK(guard.has_quota(quotas, first));
    CHECK_EQ(first.quota_keys.size(), 4u); // three recipients, one domain

    // Every charge is rolled back when one doesn't fit.
    auto second = message("bob@example.com", 10);
    CHECK(!guard.has_quota(quotas, second));
    CHECK(second.quota_keys.empty());

    // The recipient at example.org is done, its charges go.
    first.recipients[2].status = PermanentFailure<ErrorDetails>{
        ErrorDetails{"example.org", Io{"gone"}}};
    guard.release_quota(first);
    CHECK_EQ(first.quota_keys.size(), 2u);

    complete_all(first);
    guard.release_quota(first);
    CHECK(first.quota_keys.empty());
    CHECK(guard.has_quota(quotas, second));
  }

  // Inbound rate limits.
  {
    Config config;
    config.parse(R"(
queue.limiter.inbound.ip.key = remote_ip
queue.limiter.inbound.ip.rate = 2/1m
)");
    auto const limiters = parse_inbound_rate_limiters(config);
    CHECK(!config.has_errors());

    MemoryCounterStore counters;
    Guard              guard(counters, nullptr);

    SessionEnvelope env;
    env.remote_ip = "192.0.2.1";
    env.sender    = "alice@example.com";
    env.rcpt      = "bob@example.org";

    std::vector<InFlight> in_flight;
    CHECK(std::holds_alternative<Admit>(guard.check(limiters, env, 1000, in_flight)));
    CHECK(std::holds_alternative<Admit>(guard.check(limiters, env, 1001, in_flight)));
    auto const third = guard.check(limiters, env, 1002, in_flight);
    auto const deferred = std::get_if<Deferred>(&third);
    CHECK(deferred);
    CHECK_EQ(deferred->retry_at, 1020u);
    CHECK(std::holds_alternative<RateLimited>(deferred->reason));

    // Another address is counted separately.
    auto other      = env;
    other.remote_ip = "192.0.2.2";
    CHECK(std::holds_alternative<Admit>(guard.check(limiters, other, 1002, in_flight)));

    // Next window.
    CHECK(std::holds_alternative<Admit>(guard.check(limiters, env, 1020, in_flight)));
    CHECK(in_flight.empty());
  }

  // Outbound concurrency limits.
  {
    Config config;
    config.parse(R"(
queue.limiter.outbound.domain.key = rcpt_domain
queue.limiter.outbound.domain.concurrency = 1
)");
    auto const limiters = parse_outbound_rate_limiters(config);
    CHECK(!config.has_errors());

    MemoryCounterStore counters;
    Guard              guard(counters, nullptr);

    auto const          msg = message("alice@example.com", 10);
    QueueEnvelope const a(msg, msg.recipients[0]);
    QueueEnvelope const b(msg, msg.recipients[1]); // same domain
    QueueEnvelope const c(msg, msg.recipients[2]);

    std::vector<InFlight> held;
    CHECK(std::holds_alternative<Admit>(guard.check(limiters, a, 100, held)));
    CHECK_EQ(held.size(), 1u);

    std::vector<InFlight> second;
    auto const busy = guard.check(limiters, b, 100, second);
    CHECK(std::holds_alternative<Deferred>(busy));
    CHECK(std::holds_alternative<ConcurrencyLimited>(
        std::get<Deferred>(busy).reason));
    CHECK(second.empty());

    CHECK(std::holds_alternative<Admit>(guard.check(limiters, c, 100, second)));
    second.clear();

    held.clear(); // slot given back
    CHECK(std::holds_alternative<Admit>(guard.check(limiters, b, 100, second)));

    second.clear();
    guard.cleanup();
    CHECK(std::holds_alternative<Admit>(guard.check(limiters, a, 100, second)));
  }
}
