#include "Catalog.hpp"

#include "Config.hpp"
#include "Envelope.hpp"
#include "LocalDomains.hpp"
#include "PolicyResolver.hpp"

#include <algorithm>

#include <glog/logging.h>

using namespace Queue;

namespace {
bool has_error(Config const& config, std::string_view key)
{
  auto const& errs = config.errors();
  return std::any_of(errs.begin(), errs.end(), [&](Config::Error const& e) {
    return e.key == key && e.kind != Config::error_kind::warning;
  });
}

Message message_to(std::string_view rcpt, MessageSource source)
{
  Message msg;
  msg.return_path       = "sender@example.com";
  msg.return_path_lcase = "sender@example.com";
  msg.source            = source;
  Recipient r;
  r.address       = std::string(rcpt);
  r.address_lcase = std::string(rcpt);
  msg.recipients.push_back(r);
  return msg;
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  // Nothing configured.
  {
    Config        empty;
    auto const    catalog = Catalog::parse(empty, "mx.example.org");
    CHECK(!empty.has_errors());
    CHECK_EQ(catalog.report_domain, "mx.example.org");
    CHECK_EQ(catalog.submitter, "mx.example.org");

    auto const& qs = catalog.queue_or_default("remote");
    CHECK(!qs.retry.empty());
    CHECK(!qs.notify.empty());
    CHECK(std::get<Ttl>(qs.expiry) == Ttl{432000});
    CHECK(qs.virtual_queue.is_default());

    CHECK(std::holds_alternative<LocalRoute>(catalog.route_or_default("local")));
    auto const& mx = catalog.route_or_default("mx");
    CHECK(std::holds_alternative<MxRoute>(mx));
    CHECK_EQ(std::get<MxRoute>(mx).max_mx, 5u);
    CHECK_EQ(std::get<MxRoute>(mx).max_multihomed, 2u);
    CHECK(std::get<MxRoute>(mx).ip_lookup_strategy
          == IpLookupStrategy::ipv4_then_ipv6);

    auto const& tls = catalog.tls_or_default("default");
    CHECK(tls.try_dane() && tls.try_mta_sts() && tls.try_start_tls());
    CHECK(!tls.is_tls_required());
    CHECK(tls.timeout_tls == std::chrono::minutes(3));
    CHECK(tls.timeout_mta_sts == std::chrono::minutes(5));

    auto const& conn = catalog.connection_or_default("default");
    CHECK(conn.timeout_connect == std::chrono::minutes(5));
    CHECK(conn.timeout_data == std::chrono::minutes(10));
    CHECK(conn.source_ipv4.empty() && conn.source_ipv6.empty());

    CHECK_EQ(catalog.threads(QueueName::default_queue()), 1u);

    // The default selectors.
    StaticDomains const  domains{"example.org"};
    PolicyResolver const policy(catalog, &domains);

    auto const local = message_to("bob@example.org", MessageSource::local);
    QueueEnvelope const local_env(local, local.recipients[0]);
    CHECK_EQ(policy.route(local_env), "local");
    CHECK_EQ(policy.schedule(local_env), "local");
    CHECK_EQ(policy.connection(local_env), "default");
    CHECK_EQ(policy.tls(local_env), "default");

    auto const remote = message_to("eve@example.net", MessageSource::local);
    QueueEnvelope const remote_env(remote, remote.recipients[0]);
    CHECK_EQ(policy.route(remote_env), "mx");
    CHECK_EQ(policy.schedule(remote_env), "remote");

    auto const dsn = message_to("eve@example.net", MessageSource::dsn);
    CHECK_EQ(policy.schedule(QueueEnvelope(dsn, dsn.recipients[0])), "dsn");
    auto const report = message_to("eve@example.net", MessageSource::report);
    CHECK_EQ(policy.schedule(QueueEnvelope(report, report.recipients[0])),
             "report");

    // A TLS failure on an earlier attempt.
    auto tls_failed       = remote;
    auto& rcpt            = tls_failed.recipients[0];
    rcpt.retry.inner      = 1;
    rcpt.status = TemporaryFailure<ErrorDetails>{
        ErrorDetails{"mx.example.net", TlsError{"handshake failed"}}};
    CHECK_EQ(policy.tls(QueueEnvelope(tls_failed, rcpt)), "invalid-tls");

    CHECK_EQ(policy.dsn_from_name(remote), "Mail Delivery Subsystem");
    CHECK_EQ(policy.dsn_from_address(remote), "MAILER-DAEMON@mx.example.org");
    CHECK(policy.dsn_sign(remote).empty());
    CHECK_EQ(policy.reporting_mta(), "mx.example.org");
  }

  // A full configuration.
  {
    Config config;
    config.parse(R"(
report.domain = example.org
report.submitter = mx1.example.org
report.dsn.from-name = 'Postmaster'
report.dsn.sign = 'rsa, ed25519'

queue.virtual.fast.threads-per-node = 4
queue.virtual.slow.threads-per-node = 0
queue.virtual.much-too-long.threads-per-node = 2

queue.schedule.remote.queue-name = fast
queue.schedule.remote.retry = 1m, 10m
queue.schedule.remote.notify = 1d
queue.schedule.remote.expire = 2d

queue.schedule.capped.queue-name = default
queue.schedule.capped.retry = 30s
queue.schedule.capped.max-attempts = 3

queue.schedule.both.queue-name = default
queue.schedule.both.retry = 1m
queue.schedule.both.expire = 1d
queue.schedule.both.max-attempts = 3

queue.schedule.lost.queue-name = nowhere
queue.schedule.lost.retry = 1m

queue.schedule.noretry.queue-name = default

queue.route.relay.type = relay
queue.route.relay.address = smtp.example.net
queue.route.relay.port = 587
queue.route.relay.protocol = lmtp
queue.route.relay.auth.username = user
queue.route.relay.auth.secret = secret
queue.route.relay.tls.implicit = true

queue.route.halfauth.type = relay
queue.route.halfauth.address = smtp.example.net
queue.route.halfauth.auth.username = user

queue.route.direct.type = mx
queue.route.direct.limits.mx = 3
queue.route.direct.ip-lookup = ipv6_then_ipv4

queue.route.bogus.type = carrier-pigeon

queue.tls.strict.dane = require
queue.tls.strict.mta-sts = optional
queue.tls.strict.starttls = optional

queue.tls.none.starttls = disable
queue.tls.none.dane = disable
queue.tls.none.mta-sts = disable

queue.source-ip.192.0.2.1.ehlo-hostname = out1.example.org
queue.connection.pool.source-ips = 192.0.2.1, 2001:db8::1, not-an-ip
queue.connection.pool.ehlo-hostname = out.example.org
queue.connection.pool.timeout.data = 20m

queue.strategy.route.1.if = rcpt_domain == 'example.net'
queue.strategy.route.1.then = 'relay'
queue.strategy.route.else = 'direct'
)",
                 "test.conf");

    auto const catalog = Catalog::parse(config, "localhost");

    CHECK_EQ(catalog.report_domain, "example.org");
    CHECK_EQ(catalog.submitter, "mx1.example.org");

    // Virtual queues.
    CHECK_EQ(catalog.virtual_queues.size(), 2u);
    CHECK_EQ(catalog.threads(QueueName("fast")), 4u);
    CHECK_EQ(catalog.threads(QueueName("slow")), 1u);
    CHECK(has_error(config, "queue.virtual.much-too-long.threads-per-node"));

    // Schedules.
    auto const& remote = catalog.queue_strategy.at("remote");
    CHECK(remote.retry == (std::vector<std::uint64_t>{60, 600}));
    CHECK(remote.notify == (std::vector<std::uint64_t>{86400}));
    CHECK(std::get<Ttl>(remote.expiry) == Ttl{2 * 86400});
    CHECK_EQ(remote.virtual_queue, QueueName("fast"));

    auto const& capped = catalog.queue_strategy.at("capped");
    CHECK(std::get<Attempts>(capped.expiry) == Attempts{3});
    CHECK_EQ(capped.notify.size(), 1u);
    CHECK_EQ(capped.notify[0], 10000ull * 86400);

    CHECK(!catalog.queue_strategy.count("both"));
    CHECK(has_error(config, "queue.schedule.both.expire"));
    CHECK(!catalog.queue_strategy.count("lost"));
    CHECK(has_error(config, "queue.schedule.lost.queue-name"));

    // An empty retry list falls back to one hour.
    auto const& noretry = catalog.queue_strategy.at("noretry");
    CHECK(noretry.retry == (std::vector<std::uint64_t>{3600}));
    CHECK(has_error(config, "queue.schedule.noretry.retry"));

    // Routes.
    auto const& relay = std::get<RelayRoute>(catalog.routing_strategy.at("relay"));
    CHECK_EQ(relay.address, "smtp.example.net");
    CHECK_EQ(relay.port, 587);
    CHECK(relay.protocol == ServerProtocol::lmtp);
    CHECK(relay.tls_implicit);
    CHECK(!relay.tls_allow_invalid_certs);
    CHECK(relay.auth);
    CHECK_EQ(relay.auth->username, "user");
    CHECK_EQ(relay.auth->secret, "secret");

    auto const& half
        = std::get<RelayRoute>(catalog.routing_strategy.at("halfauth"));
    CHECK(!half.auth);
    CHECK_EQ(half.port, 25);
    CHECK(half.protocol == ServerProtocol::smtp);

    auto const& direct = std::get<MxRoute>(catalog.routing_strategy.at("direct"));
    CHECK_EQ(direct.max_mx, 3u);
    CHECK_EQ(direct.max_multihomed, 2u);
    CHECK(direct.ip_lookup_strategy == IpLookupStrategy::ipv6_then_ipv4);

    CHECK(!catalog.routing_strategy.count("bogus"));
    CHECK(has_error(config, "queue.route.bogus.type"));

    // TLS.
    auto const& strict = catalog.tls_strategy.at("strict");
    CHECK(strict.is_dane_required());
    CHECK(!strict.is_mta_sts_required());
    CHECK(strict.is_tls_required());

    auto const& none = catalog.tls_strategy.at("none");
    CHECK(!none.try_start_tls() && !none.try_dane() && !none.try_mta_sts());
    CHECK(!none.is_tls_required());

    // Connections.
    auto const& pool = catalog.connection_strategy.at("pool");
    CHECK_EQ(pool.source_ipv4.size(), 1u);
    CHECK_EQ(pool.source_ipv4[0].ip, "192.0.2.1");
    CHECK_EQ(*pool.source_ipv4[0].host, "out1.example.org");
    CHECK_EQ(pool.source_ipv6.size(), 1u);
    CHECK(!pool.source_ipv6[0].host);
    CHECK_EQ(*pool.ehlo_hostname, "out.example.org");
    CHECK(pool.timeout_data == std::chrono::minutes(20));
    CHECK(pool.timeout_rcpt == std::chrono::minutes(5));
    CHECK(has_error(config, "queue.connection.pool.source-ips"));

    // Lookups fall back to "default", then the built in values.
    CHECK(catalog.queue_or_default("no-such").retry
          == default_queue_strategy().retry);
    CHECK(std::holds_alternative<MxRoute>(catalog.route_or_default("no-such")));

    // Selectors and DSN settings.
    PolicyResolver const policy(catalog, nullptr);
    auto const to_net = message_to("bob@example.net", MessageSource::local);
    QueueEnvelope const net_env(to_net, to_net.recipients[0]);
    CHECK_EQ(policy.route(net_env), "relay");
    CHECK(std::holds_alternative<RelayRoute>(policy.routing_strategy(net_env)));
    auto const to_com = message_to("bob@example.com", MessageSource::local);
    CHECK(std::holds_alternative<MxRoute>(
        policy.routing_strategy(QueueEnvelope(to_com, to_com.recipients[0]))));

    CHECK_EQ(policy.dsn_from_name(to_net), "Postmaster");
    CHECK_EQ(policy.dsn_from_address(to_net), "MAILER-DAEMON@example.org");
    auto const sign = policy.dsn_sign(to_net);
    CHECK_EQ(sign.size(), 2u);
    CHECK_EQ(sign[0], "rsa");
    CHECK_EQ(sign[1], "ed25519");
  }
}
