// Load a queue configuration and show what it comes to.

#include "Catalog.hpp"
#include "Config.hpp"
#include "osutil.hpp"

#include <iostream>
#include <map>
#include <system_error>

#include <fmt/format.h>

#include <gflags/gflags.h>
#include <glog/logging.h>

DEFINE_string(config_file, "", "configuration file, default queue.conf in the config dir");
DEFINE_string(hostname, "", "host name for reports, default this host's name");

using namespace Queue;

namespace {

std::string_view kind_name(Config::error_kind kind)
{
  switch (kind) {
  case Config::error_kind::parse: return "parse error";
  case Config::error_kind::build: return "build error";
  case Config::error_kind::warning: return "warning";
  }
  return "error";
}

std::string expiry(QueueExpiry const& exp)
{
  return std::visit(overloaded{
                        [](Ttl const& ttl) {
                          return fmt::format("expire {}s", ttl.seconds);
                        },
                        [](Attempts const& att) {
                          return fmt::format("max-attempts {}", att.count);
                        },
                    },
                    exp);
}

std::string route(RoutingStrategy const& rs)
{
  return std::visit(
      overloaded{
          [](LocalRoute const&) { return std::string("local"); },
          [](MxRoute const& mx) {
            return fmt::format("mx max-mx {} multihomed {} {}", mx.max_mx,
                               mx.max_multihomed, to_string(mx.ip_lookup_strategy));
          },
          [](RelayRoute const& relay) {
            return fmt::format("relay {}:{} {}{}{}", relay.address, relay.port,
                               to_string(relay.protocol),
                               relay.auth ? " auth" : "",
                               relay.tls_implicit ? " implicit-tls" : "");
          },
      },
      rs);
}

template <typename Map>
std::map<std::string, typename Map::mapped_type const*> sorted(Map const& map)
{
  std::map<std::string, typename Map::mapped_type const*> out;
  for (auto const& [name, value] : map)
    out.emplace(name, &value);
  return out;
}

} // namespace

int main(int argc, char* argv[])
{
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  auto const path = FLAGS_config_file.empty()
                        ? osutil::get_config_dir() / "queue.conf"
                        : fs::path(FLAGS_config_file);
  auto const hostname
      = FLAGS_hostname.empty() ? osutil::get_hostname() : FLAGS_hostname;

  Config config;
  try {
    config.load(path);
  }
  catch (std::system_error const& e) {
    std::cerr << e.what() << '\n';
    return 2;
  }

  auto const catalog = Catalog::parse(config, hostname);

  std::cout << fmt::format("report domain {}, submitter {}\n",
                           catalog.report_domain, catalog.submitter);
  std::cout << fmt::format("spool {}\n", osutil::get_spool_dir().string());

  for (auto const& [name, vq] : catalog.virtual_queues)
    std::cout << fmt::format("virtual queue {}: {} threads\n", name.as_str(),
                             vq.threads);

  for (auto const& [name, qs] : sorted(catalog.queue_strategy)) {
    std::cout << fmt::format(
        "schedule {}: retry {}, notify {}, {}, queue {}\n", name,
        qs->retry.size(), qs->notify.size(), expiry(qs->expiry),
        qs->virtual_queue.as_str());
  }
  for (auto const& [name, rs] : sorted(catalog.routing_strategy))
    std::cout << fmt::format("route {}: {}\n", name, route(*rs));
  for (auto const& [name, tls] : sorted(catalog.tls_strategy)) {
    std::cout << fmt::format("tls {}: dane {} mta-sts {} starttls {}\n", name,
                             to_string(tls->dane), to_string(tls->mta_sts),
                             to_string(tls->tls));
  }
  for (auto const& [name, conn] : sorted(catalog.connection_strategy)) {
    std::cout << fmt::format("connection {}: {} IPv4, {} IPv6 sources\n", name,
                             conn->source_ipv4.size(), conn->source_ipv6.size());
  }

  auto const& in  = catalog.inbound_limiters;
  auto const& out = catalog.outbound_limiters;
  std::cout << fmt::format("inbound limiters: {} sender, {} rcpt, {} remote\n",
                           in.sender.size(), in.rcpt.size(), in.remote.size());
  std::cout << fmt::format("outbound limiters: {} sender, {} rcpt, {} remote\n",
                           out.sender.size(), out.rcpt.size(), out.remote.size());
  std::cout << fmt::format("quotas: {} sender, {} rcpt, {} rcpt domain\n",
                           catalog.quota.sender.size(), catalog.quota.rcpt.size(),
                           catalog.quota.rcpt_domain.size());

  for (auto const& err : config.errors()) {
    std::cout << fmt::format("{}: {}: {}\n", kind_name(err.kind), err.key,
                             err.message);
  }

  return config.has_errors() ? 1 : 0;
}
