#include "Catalog.hpp"

#include "Config.hpp"
#include "IP.hpp"

#include <glog/logging.h>

#include <fmt/format.h>

namespace Queue {

namespace {

std::string quoted(std::string_view s)
{
  if (s.find('\'') == std::string_view::npos)
    return fmt::format("'{}'", s);
  return fmt::format("\"{}\"", s);
}

std::unordered_map<QueueName, VirtualQueue> parse_virtual_queues(Config& config)
{
  std::unordered_map<QueueName, VirtualQueue> entries;
  for (auto const& id : config.sub_keys("queue.virtual", "threads-per-node")) {
    auto const key  = fmt::format("queue.virtual.{}.threads-per-node", id);
    auto const name = QueueName::parse(id);
    if (!name) {
      config.new_parse_error(
          key, fmt::format("invalid virtual queue name \"{}\", must be one to "
                           "eight bytes long",
                           id));
      continue;
    }
    auto const threads = config.property_require<std::uint64_t>(key);
    entries[*name] = VirtualQueue{
        static_cast<std::size_t>(threads && *threads > 0 ? *threads : 1)};
  }
  return entries;
}

std::optional<QueueStrategy>
parse_queue_strategy(Config&                                            config,
                     std::string const&                                 id,
                     std::unordered_map<QueueName, VirtualQueue> const& queues)
{
  auto const pfx = fmt::format("queue.schedule.{}", id);

  auto const queue_key = fmt::format("{}.queue-name", pfx);
  auto const virtual_queue
      = config.property_require<QueueName>(queue_key).value_or(QueueName{});
  if (!virtual_queue.is_default() && !queues.count(virtual_queue)) {
    config.new_parse_error(
        queue_key,
        fmt::format("virtual queue \"{}\" does not exist", virtual_queue.as_str()));
    return {};
  }

  auto to_secs = [](std::vector<std::chrono::milliseconds> const& durs) {
    std::vector<std::uint64_t> secs;
    for (auto const& d : durs)
      secs.push_back(static_cast<std::uint64_t>(
          std::chrono::duration_cast<std::chrono::seconds>(d).count()));
    return secs;
  };

  QueueStrategy strategy;
  strategy.virtual_queue = virtual_queue;

  auto const retry_key = fmt::format("{}.retry", pfx);
  strategy.retry
      = to_secs(config.properties<std::chrono::milliseconds>(retry_key));
  if (strategy.retry.empty()) {
    config.new_parse_error(retry_key,
                           "at least one retry interval must be given");
    strategy.retry.push_back(60 * 60);
  }

  strategy.notify = to_secs(config.properties<std::chrono::milliseconds>(
      fmt::format("{}.notify", pfx)));
  if (strategy.notify.empty()) {
    strategy.notify.push_back(10000ull * 86400); // never, in practice
  }

  auto const expire_key = fmt::format("{}.expire", pfx);
  auto const expire = config.property<std::chrono::milliseconds>(expire_key);
  auto const max_attempts
      = config.property<std::uint32_t>(fmt::format("{}.max-attempts", pfx));

  if (expire && max_attempts) {
    config.new_parse_error(expire_key,
                           "can't give both expire and max-attempts");
    return {};
  }
  if (expire) {
    strategy.expiry = Ttl{static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(*expire).count())};
  }
  else if (max_attempts) {
    strategy.expiry = Attempts{*max_attempts};
  }
  else {
    strategy.expiry = Ttl{3 * 86400};
  }

  return strategy;
}

std::optional<RoutingStrategy> parse_route(Config& config, std::string const& id)
{
  auto const pfx  = fmt::format("queue.route.{}", id);
  auto const type = config.property_require<std::string>(fmt::format("{}.type", pfx));
  if (!type)
    return {};

  if (*type == "local")
    return LocalRoute{};

  if (*type == "mx") {
    MxRoute mx;
    mx.max_mx = config.property<std::uint64_t>(fmt::format("{}.limits.mx", pfx))
                    .value_or(5);
    mx.max_multihomed
        = config.property<std::uint64_t>(fmt::format("{}.limits.multihomed", pfx))
              .value_or(2);
    mx.ip_lookup_strategy
        = config.property<IpLookupStrategy>(fmt::format("{}.ip-lookup", pfx))
              .value_or(IpLookupStrategy::ipv4_then_ipv6);
    return mx;
  }

  if (*type == "relay") {
    RelayRoute relay;
    auto address
        = config.property_require<std::string>(fmt::format("{}.address", pfx));
    if (!address)
      return {};
    relay.address = std::move(*address);
    relay.port = config.property<std::uint16_t>(fmt::format("{}.port", pfx))
                     .value_or(25);
    relay.protocol
        = config.property<ServerProtocol>(fmt::format("{}.protocol", pfx))
              .value_or(ServerProtocol::smtp);
    auto username
        = config.property<std::string>(fmt::format("{}.auth.username", pfx));
    auto secret
        = config.property<std::string>(fmt::format("{}.auth.secret", pfx));
    if (username && secret)
      relay.auth = Credentials{std::move(*username), std::move(*secret)};
    relay.tls_implicit
        = config.property<bool>(fmt::format("{}.tls.implicit", pfx)).value_or(true);
    relay.tls_allow_invalid_certs
        = config.property<bool>(fmt::format("{}.tls.allow-invalid-certs", pfx))
              .value_or(false);
    return relay;
  }

  config.new_parse_error(
      fmt::format("{}.type", pfx),
      fmt::format("invalid route type \"{}\", expected relay, local or mx", *type));
  return {};
}

TlsStrategy parse_tls(Config& config, std::string const& id)
{
  auto const  pfx = fmt::format("queue.tls.{}", id);
  TlsStrategy tls;
  tls.dane = config.property<RequireOptional>(fmt::format("{}.dane", pfx))
                 .value_or(RequireOptional::optional);
  tls.mta_sts = config.property<RequireOptional>(fmt::format("{}.mta-sts", pfx))
                    .value_or(RequireOptional::optional);
  tls.tls = config.property<RequireOptional>(fmt::format("{}.starttls", pfx))
                .value_or(RequireOptional::optional);
  tls.allow_invalid_certs
      = config.property<bool>(fmt::format("{}.allow-invalid-certs", pfx))
            .value_or(false);
  tls.timeout_tls
      = config.property<std::chrono::milliseconds>(fmt::format("{}.timeout.tls", pfx))
            .value_or(std::chrono::minutes(3));
  tls.timeout_mta_sts = config.property<std::chrono::milliseconds>(
                                  fmt::format("{}.timeout.mta-sts", pfx))
                            .value_or(std::chrono::minutes(5));
  return tls;
}

ConnectionStrategy parse_connection(Config& config, std::string const& id)
{
  auto const pfx = fmt::format("queue.connection.{}", id);

  ConnectionStrategy conn;

  auto const ips_key = fmt::format("{}.source-ips", pfx);
  for (auto const& ip : config.properties<std::string>(ips_key)) {
    IpAndHost iph{ip, config.property<std::string>(fmt::format(
                          "queue.source-ip.{}.ehlo-hostname", ip))};
    if (IP::is_v4(ip)) {
      conn.source_ipv4.push_back(std::move(iph));
    }
    else if (IP::is_v6(ip)) {
      conn.source_ipv6.push_back(std::move(iph));
    }
    else {
      config.new_parse_error(ips_key,
                             fmt::format("invalid IP address \"{}\"", ip));
    }
  }

  conn.ehlo_hostname
      = config.property<std::string>(fmt::format("{}.ehlo-hostname", pfx));

  auto timeout = [&](char const* name, std::chrono::milliseconds dflt) {
    return config
        .property<std::chrono::milliseconds>(
            fmt::format("{}.timeout.{}", pfx, name))
        .value_or(dflt);
  };

  using std::chrono::minutes;
  conn.timeout_connect  = timeout("connect", minutes(5));
  conn.timeout_greeting = timeout("greeting", minutes(5));
  conn.timeout_ehlo     = timeout("ehlo", minutes(5));
  conn.timeout_mail     = timeout("mail-from", minutes(5));
  conn.timeout_rcpt     = timeout("rcpt-to", minutes(5));
  conn.timeout_data     = timeout("data", minutes(10));

  return conn;
}

void try_parse(Config&          config,
               Expr::IfBlock&   block,
               std::string_view key,
               std::uint32_t    vars)
{
  if (auto parsed = Expr::IfBlock::parse(config, key, vars))
    block = std::move(*parsed);
}

} // namespace

Catalog::Catalog(std::string const& hostname)
  : route("queue.strategy.route",
          {{"is_local_domain(rcpt_domain)", "'local'"}},
          "'mx'",
          Expr::Context::rcpt)
  , queue("queue.strategy.schedule",
          {{"is_local_domain(rcpt_domain)", "'local'"},
           {"source == 'dsn'", "'dsn'"},
           {"source == 'report'", "'report'"}},
          "'remote'",
          Expr::Context::rcpt)
  , connection("queue.strategy.connection", {}, "'default'", Expr::Context::host)
  , tls("queue.strategy.tls",
        {{"retry_num > 0 && last_error == 'tls'", "'invalid-tls'"}},
        "'default'",
        Expr::Context::host)
  , report_domain(hostname)
  , submitter(hostname)
  , builtin_queue_(default_queue_strategy())
  , builtin_local_route_(default_routing_strategy("local"))
  , builtin_mx_route_(default_routing_strategy("mx"))
  , builtin_tls_(default_tls_strategy())
  , builtin_connection_(default_connection_strategy())
{
  dsn.name = Expr::IfBlock("report.dsn.from-name", {},
                           "'Mail Delivery Subsystem'", Expr::Context::sender);
  dsn.address = Expr::IfBlock(
      "report.dsn.from-address", {},
      fmt::format("'MAILER-DAEMON@' + {}", quoted(report_domain)),
      Expr::Context::sender);
}

Catalog Catalog::parse(Config& config, std::string const& hostname)
{
  Catalog catalog(
      config.property<std::string>("report.domain").value_or(hostname));
  catalog.submitter
      = config.property<std::string>("report.submitter").value_or(hostname);

  try_parse(config, catalog.route, "queue.strategy.route", Expr::Context::rcpt);
  try_parse(config, catalog.queue, "queue.strategy.schedule", Expr::Context::rcpt);
  try_parse(config, catalog.connection, "queue.strategy.connection",
            Expr::Context::host);
  try_parse(config, catalog.tls, "queue.strategy.tls", Expr::Context::host);
  try_parse(config, catalog.dsn.name, "report.dsn.from-name",
            Expr::Context::sender);
  try_parse(config, catalog.dsn.address, "report.dsn.from-address",
            Expr::Context::sender);
  try_parse(config, catalog.dsn.sign, "report.dsn.sign", Expr::Context::sender);

  catalog.virtual_queues = parse_virtual_queues(config);

  for (auto const& id : config.sub_keys("queue.schedule")) {
    if (auto strategy = parse_queue_strategy(config, id, catalog.virtual_queues))
      catalog.queue_strategy.emplace(id, std::move(*strategy));
  }
  for (auto const& id : config.sub_keys("queue.route", "type")) {
    if (auto strategy = parse_route(config, id))
      catalog.routing_strategy.emplace(id, std::move(*strategy));
  }
  for (auto const& id : config.sub_keys("queue.tls")) {
    catalog.tls_strategy.emplace(id, parse_tls(config, id));
  }
  for (auto const& id : config.sub_keys("queue.connection")) {
    catalog.connection_strategy.emplace(id, parse_connection(config, id));
  }

  catalog.inbound_limiters  = parse_inbound_rate_limiters(config);
  catalog.outbound_limiters = parse_outbound_rate_limiters(config);
  catalog.quota             = parse_queue_quotas(config);

  return catalog;
}

namespace {
template <typename Map>
typename Map::mapped_type const*
lookup(Map const& map, std::string_view name, char const* what)
{
  auto const it = map.find(std::string(name));
  if (it != map.end())
    return &it->second;
  if (name != "default") {
    LOG(WARNING) << what << " strategy \"" << name
                 << "\" not found, using default";
  }
  auto const dflt = map.find("default");
  return dflt != map.end() ? &dflt->second : nullptr;
}
} // namespace

QueueStrategy const& Catalog::queue_or_default(std::string_view name) const
{
  auto const found = lookup(queue_strategy, name, "queue");
  return found ? *found : builtin_queue_;
}

RoutingStrategy const& Catalog::route_or_default(std::string_view name) const
{
  auto const it = routing_strategy.find(std::string(name));
  if (it != routing_strategy.end())
    return it->second;
  if (name == "local")
    return builtin_local_route_;
  if (name == "mx")
    return builtin_mx_route_;
  auto const found = lookup(routing_strategy, name, "routing");
  return found ? *found : builtin_mx_route_;
}

TlsStrategy const& Catalog::tls_or_default(std::string_view name) const
{
  auto const found = lookup(tls_strategy, name, "tls");
  return found ? *found : builtin_tls_;
}

ConnectionStrategy const&
Catalog::connection_or_default(std::string_view name) const
{
  auto const found = lookup(connection_strategy, name, "connection");
  return found ? *found : builtin_connection_;
}

std::size_t Catalog::threads(QueueName const& name) const
{
  auto const it = virtual_queues.find(name);
  return it != virtual_queues.end() ? it->second.threads : 1;
}

} // namespace Queue
