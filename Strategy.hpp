#ifndef STRATEGY_DOT_HPP
#define STRATEGY_DOT_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "Message.hpp"
#include "QueueName.hpp"

namespace Queue {

struct VirtualQueue {
  std::size_t threads{1};
};

struct QueueStrategy {
  std::vector<std::uint64_t> retry;  // seconds, never empty
  std::vector<std::uint64_t> notify; // seconds, never empty
  QueueExpiry                expiry{Ttl{3 * 86400}};
  QueueName                  virtual_queue;
};

enum class IpLookupStrategy {
  ipv4_only,
  ipv6_only,
  ipv4_then_ipv6,
  ipv6_then_ipv4,
};

enum class ServerProtocol { smtp, lmtp };

struct Credentials {
  std::string username;
  std::string secret;
};

struct LocalRoute {
};

struct MxRoute {
  std::size_t      max_mx{5};
  std::size_t      max_multihomed{2};
  IpLookupStrategy ip_lookup_strategy{IpLookupStrategy::ipv4_then_ipv6};
};

struct RelayRoute {
  std::string                address;
  std::uint16_t              port{25};
  ServerProtocol             protocol{ServerProtocol::smtp};
  std::optional<Credentials> auth;
  bool                       tls_implicit{true};
  bool                       tls_allow_invalid_certs{false};
};

using RoutingStrategy = std::variant<LocalRoute, MxRoute, RelayRoute>;

enum class RequireOptional { optional, require, disable };

struct TlsStrategy {
  RequireOptional dane{RequireOptional::optional};
  RequireOptional mta_sts{RequireOptional::optional};
  RequireOptional tls{RequireOptional::optional};
  bool            allow_invalid_certs{false};

  std::chrono::milliseconds timeout_tls{std::chrono::minutes(3)};
  std::chrono::milliseconds timeout_mta_sts{std::chrono::minutes(5)};

  bool try_dane() const { return dane != RequireOptional::disable; }
  bool try_start_tls() const { return tls != RequireOptional::disable; }
  bool try_mta_sts() const { return mta_sts != RequireOptional::disable; }
  bool is_dane_required() const { return dane == RequireOptional::require; }
  bool is_mta_sts_required() const
  {
    return mta_sts == RequireOptional::require;
  }

  // STARTTLS is mandatory when asked for directly, or when DANE or
  // MTA-STS has to authenticate the server.
  bool is_tls_required() const
  {
    return tls == RequireOptional::require || is_dane_required()
           || is_mta_sts_required();
  }
};

// A source address to bind, and the EHLO name to use from it.
struct IpAndHost {
  std::string                ip;
  std::optional<std::string> host;
};

struct ConnectionStrategy {
  std::vector<IpAndHost>     source_ipv4;
  std::vector<IpAndHost>     source_ipv6;
  std::optional<std::string> ehlo_hostname;

  std::chrono::milliseconds timeout_connect{std::chrono::minutes(5)};
  std::chrono::milliseconds timeout_greeting{std::chrono::minutes(5)};
  std::chrono::milliseconds timeout_ehlo{std::chrono::minutes(5)};
  std::chrono::milliseconds timeout_mail{std::chrono::minutes(5)};
  std::chrono::milliseconds timeout_rcpt{std::chrono::minutes(5)};
  std::chrono::milliseconds timeout_data{std::chrono::minutes(10)};
};

// The strategies used when nothing is configured.
QueueStrategy      default_queue_strategy();
RoutingStrategy    default_routing_strategy(std::string_view name);
TlsStrategy        default_tls_strategy();
ConnectionStrategy default_connection_strategy();

std::string_view to_string(RequireOptional ro);
std::string_view to_string(IpLookupStrategy ls);
std::string_view to_string(ServerProtocol proto);

bool parse_value(std::string_view value,
                 RequireOptional& out,
                 std::string&     msg);
bool parse_value(std::string_view  value,
                 IpLookupStrategy& out,
                 std::string&      msg);
bool parse_value(std::string_view value,
                 ServerProtocol&  out,
                 std::string&     msg);

} // namespace Queue

bool parse_value(std::string_view value, QueueName& out, std::string& msg);

#endif // STRATEGY_DOT_HPP
