#ifndef ERROR_DOT_HPP
#define ERROR_DOT_HPP

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include "Status.hpp"

namespace Queue {

// An SMTP reply: basic code, enhanced status code (RFC 3463) and text.
struct Response {
  std::uint16_t               code{0};
  std::array<std::uint8_t, 3> esc{0, 0, 0};
  std::string                 message;

  bool        has_esc() const { return esc[0] > 0; }
  std::string esc_string() const;
};

// A successful reply and the host that gave it.
struct HostResponse {
  std::string hostname;
  Response    response;
};

// The kinds of failure a delivery attempt can report. Each is scoped to
// one recipient and recorded as a temporary or permanent failure.

struct UnexpectedResponse {
  std::string command; // empty for the transaction as a whole
  Response    response;
};

struct DnsError {
  std::string details;
};

struct ConnectionError {
  std::string details;
};

struct TlsError {
  std::string details;
};

struct DaneError {
  std::string details;
};

struct MtaStsError {
  std::string details;
};

struct RateLimited {
};

struct ConcurrencyLimited {
};

struct Io {
  std::string details;
};

using Error = std::variant<UnexpectedResponse,
                           DnsError,
                           ConnectionError,
                           TlsError,
                           DaneError,
                           MtaStsError,
                           RateLimited,
                           ConcurrencyLimited,
                           Io>;

// entity is the host, domain or address the error concerns.
struct ErrorDetails {
  std::string entity;
  Error       error;
};

using DeliveryStatus = Status<HostResponse, ErrorDetails>;

// Short name of the error kind, as seen by the last_error expression
// variable: "dns", "connection", "tls", "dane", "mta-sts", "rate",
// "concurrency", "io" or "unexpected".
std::string_view error_kind(Error const& error);

// Free form description of the error, for logs.
std::string describe(ErrorDetails const& details);

} // namespace Queue

#endif // ERROR_DOT_HPP
