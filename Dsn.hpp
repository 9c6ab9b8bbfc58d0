#ifndef DSN_DOT_HPP
#define DSN_DOT_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "BlobStore.hpp"
#include "Message.hpp"
#include "PolicyResolver.hpp"

namespace Queue {

// Most of the original message quoted back in a report.
constexpr std::size_t max_header_size = 4096;

// The header section at the start of buf, cut after the last complete
// line when buf holds less than max bytes of it.
std::string header_block(std::string_view buf,
                         std::size_t      max = max_header_size);

// One line of the human readable part of a report.
std::string dsn_text(std::string_view addr, HostResponse const& response);
std::string dsn_text(std::string_view addr, ErrorDetails const& details);

// The per-recipient fields of a message/delivery-status part (RFC 3464
// section 2.3), without the trailing blank line.
std::string dsn_fields(Recipient const& rcpt,
                       std::uint64_t    created,
                       std::uint64_t    now);

// Builds RFC 3464 delivery status notifications.
class DsnBuilder {
public:
  DsnBuilder(PolicyResolver const& policy, BlobStore& blobs)
    : policy_(policy)
    , blobs_(blobs)
  {
  }

  // A report covering every recipient with something new to say, or
  // nothing. Reported final recipients get RCPT_DSN_SENT, and when
  // there are delays to report the notify schedule of pending ones that
  // fell due moves on to the next interval.
  std::optional<std::string> build_dsn(Message& message, std::uint64_t now);

  // One log line per recipient transition not logged before: a final
  // outcome once, a delay each time a delay report falls due. Returns
  // the number of lines logged.
  std::size_t log_dsn(Message& message, std::uint64_t now) const;

  // For a message with an empty return path: nothing can be reported,
  // so mark failures as reported and push back pending notifications.
  // Returns the number of newly failed recipients.
  static std::size_t handle_double_bounce(Message& message, std::uint64_t now);

private:
  std::string original_headers_(Message const& message);

  PolicyResolver const& policy_;
  BlobStore&            blobs_;
};

} // namespace Queue

#endif // DSN_DOT_HPP
