#include "Error.hpp"

#include <fmt/format.h>

namespace Queue {

std::string Response::esc_string() const
{
  return fmt::format("{}.{}.{}", esc[0], esc[1], esc[2]);
}

std::string_view error_kind(Error const& error)
{
  return std::visit(
      overloaded{
          [](UnexpectedResponse const&) { return std::string_view("unexpected"); },
          [](DnsError const&) { return std::string_view("dns"); },
          [](ConnectionError const&) { return std::string_view("connection"); },
          [](TlsError const&) { return std::string_view("tls"); },
          [](DaneError const&) { return std::string_view("dane"); },
          [](MtaStsError const&) { return std::string_view("mta-sts"); },
          [](RateLimited const&) { return std::string_view("rate"); },
          [](ConcurrencyLimited const&) { return std::string_view("concurrency"); },
          [](Io const&) { return std::string_view("io"); },
      },
      error);
}

std::string describe(ErrorDetails const& details)
{
  return std::visit(
      overloaded{
          [&](UnexpectedResponse const& e) {
            return fmt::format("{} replied {} {} to {}", details.entity,
                               e.response.code, e.response.message,
                               e.command.empty() ? "transaction" : e.command);
          },
          [&](DnsError const& e) {
            return fmt::format("dns {}: {}", details.entity, e.details);
          },
          [&](ConnectionError const& e) {
            return fmt::format("connection {}: {}", details.entity, e.details);
          },
          [&](TlsError const& e) {
            return fmt::format("tls {}: {}", details.entity, e.details);
          },
          [&](DaneError const& e) {
            return fmt::format("dane {}: {}", details.entity, e.details);
          },
          [&](MtaStsError const& e) {
            return fmt::format("mta-sts {}: {}", details.entity, e.details);
          },
          [&](RateLimited const&) {
            return fmt::format("rate limited {}", details.entity);
          },
          [&](ConcurrencyLimited const&) {
            return fmt::format("concurrency limited {}", details.entity);
          },
          [&](Io const& e) {
            return fmt::format("queue error {}: {}", details.entity, e.details);
          },
      },
      details.error);
}

} // namespace Queue
