#include "Strategy.hpp"

#include "Config.hpp"

#include <fmt/format.h>

namespace Queue {

QueueStrategy default_queue_strategy()
{
  return QueueStrategy{
      {120, 300, 600, 900, 1800, 3600, 7200},
      {86400, 259200},
      Ttl{432000},
      QueueName::default_queue(),
  };
}

RoutingStrategy default_routing_strategy(std::string_view name)
{
  if (name == "local")
    return LocalRoute{};
  return MxRoute{};
}

TlsStrategy default_tls_strategy() { return TlsStrategy{}; }

ConnectionStrategy default_connection_strategy()
{
  return ConnectionStrategy{};
}

std::string_view to_string(RequireOptional ro)
{
  switch (ro) {
  case RequireOptional::optional: return "optional";
  case RequireOptional::require: return "require";
  case RequireOptional::disable: return "disable";
  }
  return "optional";
}

std::string_view to_string(IpLookupStrategy ls)
{
  switch (ls) {
  case IpLookupStrategy::ipv4_only: return "ipv4_only";
  case IpLookupStrategy::ipv6_only: return "ipv6_only";
  case IpLookupStrategy::ipv4_then_ipv6: return "ipv4_then_ipv6";
  case IpLookupStrategy::ipv6_then_ipv4: return "ipv6_then_ipv4";
  }
  return "ipv4_then_ipv6";
}

std::string_view to_string(ServerProtocol proto)
{
  return proto == ServerProtocol::lmtp ? "lmtp" : "smtp";
}

bool parse_value(std::string_view value,
                 RequireOptional& out,
                 std::string&     msg)
{
  value = unquote(value);
  if (value == "optional") {
    out = RequireOptional::optional;
    return true;
  }
  if (value == "require" || value == "required") {
    out = RequireOptional::require;
    return true;
  }
  if (value == "disable" || value == "disabled" || value == "none"
      || value == "false") {
    out = RequireOptional::disable;
    return true;
  }
  msg = fmt::format("invalid TLS option \"{}\"", value);
  return false;
}

bool parse_value(std::string_view  value,
                 IpLookupStrategy& out,
                 std::string&      msg)
{
  value = unquote(value);
  if (value == "ipv4_only") {
    out = IpLookupStrategy::ipv4_only;
    return true;
  }
  if (value == "ipv6_only") {
    out = IpLookupStrategy::ipv6_only;
    return true;
  }
  if (value == "ipv4_then_ipv6") {
    out = IpLookupStrategy::ipv4_then_ipv6;
    return true;
  }
  if (value == "ipv6_then_ipv4") {
    out = IpLookupStrategy::ipv6_then_ipv4;
    return true;
  }
  msg = fmt::format("invalid IP lookup strategy \"{}\"", value);
  return false;
}

bool parse_value(std::string_view value,
                 ServerProtocol&  out,
                 std::string&     msg)
{
  value = unquote(value);
  if (value == "smtp") {
    out = ServerProtocol::smtp;
    return true;
  }
  if (value == "lmtp") {
    out = ServerProtocol::lmtp;
    return true;
  }
  msg = fmt::format("invalid protocol \"{}\", expected smtp or lmtp", value);
  return false;
}

} // namespace Queue

bool parse_value(std::string_view value, QueueName& out, std::string& msg)
{
  auto const name = QueueName::parse(unquote(value));
  if (!name) {
    msg = "queue names must be one to eight bytes long";
    return false;
  }
  out = *name;
  return true;
}
