#ifndef CATALOG_DOT_HPP
#define CATALOG_DOT_HPP

#include <string>
#include <string_view>
#include <unordered_map>

#include "Expression.hpp"
#include "QueueName.hpp"
#include "Strategy.hpp"
#include "Throttle.hpp"

class Config;

namespace Queue {

struct DsnConfig {
  Expr::IfBlock name;
  Expr::IfBlock address;
  Expr::IfBlock sign;
};

// Everything the queue reads from configuration. Built once, then
// shared read only.
struct Catalog {
  // Strategy selectors.
  Expr::IfBlock route;
  Expr::IfBlock queue;
  Expr::IfBlock connection;
  Expr::IfBlock tls;

  DsnConfig dsn;

  std::string report_domain;
  std::string submitter; // reporting MTA name

  RateLimiters inbound_limiters;
  RateLimiters outbound_limiters;
  QueueQuotas  quota;

  std::unordered_map<std::string, QueueStrategy>      queue_strategy;
  std::unordered_map<std::string, RoutingStrategy>    routing_strategy;
  std::unordered_map<std::string, TlsStrategy>        tls_strategy;
  std::unordered_map<std::string, ConnectionStrategy> connection_strategy;
  std::unordered_map<QueueName, VirtualQueue>         virtual_queues;

  // The built in selectors, with report_domain and submitter set to
  // hostname.
  explicit Catalog(std::string const& hostname);

  // Loads what's configured over the defaults; problems are recorded
  // in config, the entry concerned is left out.
  static Catalog parse(Config& config, std::string const& hostname);

  // Look up a strategy by name, else the "default" entry, else the
  // built in default.
  QueueStrategy const&      queue_or_default(std::string_view name) const;
  RoutingStrategy const&    route_or_default(std::string_view name) const;
  TlsStrategy const&        tls_or_default(std::string_view name) const;
  ConnectionStrategy const& connection_or_default(std::string_view name) const;

  // Threads for a virtual queue, one for "default" if not configured.
  std::size_t threads(QueueName const& name) const;

private:
  QueueStrategy      builtin_queue_;
  RoutingStrategy    builtin_local_route_;
  RoutingStrategy    builtin_mx_route_;
  TlsStrategy        builtin_tls_;
  ConnectionStrategy builtin_connection_;
};

} // namespace Queue

#endif // CATALOG_DOT_HPP
