#include "Dsn.hpp"

#include "Envelope.hpp"
#include "Now.hpp"
#include "Pill.hpp"

#include <sstream>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include <glog/logging.h>

namespace Queue {

namespace {

// Reply text on one line.
std::string response_text(Response const& response)
{
  std::string text;
  text.reserve(response.message.size());
  for (auto const ch : response.message) {
    if (ch != '\r' && ch != '\n')
      text += ch;
  }
  return text;
}

// Enhanced status code, or one made from the basic reply code.
std::string status_code(Response const& response)
{
  if (response.has_esc())
    return response.esc_string();
  return fmt::format("{}.{}.{}", response.code / 100, (response.code / 10) % 10,
                     response.code % 10);
}

std::string_view action(DeliveryStatus const& status)
{
  return std::visit(overloaded{
                        [](Completed<HostResponse> const&) {
                          return std::string_view("delivered");
                        },
                        [](PermanentFailure<ErrorDetails> const&) {
                          return std::string_view("failed");
                        },
                        [](auto const&) { return std::string_view("delayed"); },
                    },
                    status);
}

std::string status_field(DeliveryStatus const& status)
{
  return std::visit(
      overloaded{
          [](Scheduled const&) { return std::string("4.0.0"); },
          [](Completed<HostResponse> const& c) {
            return status_code(c.value.response);
          },
          [](TemporaryFailure<ErrorDetails> const& f) {
            if (auto ur = std::get_if<UnexpectedResponse>(&f.error.error))
              return status_code(ur->response);
            return std::string("4.0.0");
          },
          [](PermanentFailure<ErrorDetails> const& f) {
            if (auto ur = std::get_if<UnexpectedResponse>(&f.error.error))
              return status_code(ur->response);
            return std::string("5.0.0");
          },
      },
      status);
}

ErrorDetails const* failure_of(DeliveryStatus const& status)
{
  if (auto tmp = std::get_if<TemporaryFailure<ErrorDetails>>(&status))
    return &tmp->error;
  if (auto perm = std::get_if<PermanentFailure<ErrorDetails>>(&status))
    return &perm->error;
  return nullptr;
}

// Was the error reported by, or while talking to, a remote host?
bool names_remote_mta(Error const& error)
{
  return std::holds_alternative<UnexpectedResponse>(error)
         || std::holds_alternative<ConnectionError>(error)
         || std::holds_alternative<TlsError>(error)
         || std::holds_alternative<DaneError>(error);
}

std::string display_name(std::string_view name)
{
  std::string quoted = "\"";
  for (auto const ch : name) {
    if (ch == '"' || ch == '\\')
      quoted += '\\';
    quoted += ch;
  }
  quoted += '"';
  return quoted;
}

// Headers in the order added, then the body.
class Eml {
public:
  void add_hdr(std::string name, std::string value)
  {
    hdrs_.emplace_back(std::move(name), std::move(value));
  }

private:
  std::vector<std::pair<std::string, std::string>> hdrs_;

  friend std::ostream& operator<<(std::ostream& os, Eml const& eml)
  {
    for (auto const& [name, value] : eml.hdrs_) {
      os << name << ": " << value << "\r\n";
    }
    return os << "\r\n"; // end of headers
  }
};

void write_part(std::ostream&    os,
                std::string_view boundary,
                std::string_view content_type,
                std::string_view body)
{
  os << "--" << boundary << "\r\n"
     << "Content-Type: " << content_type << "\r\n"
     << "\r\n"
     << body;
  if (body.empty() || body.back() != '\n')
    os << "\r\n";
}

} // namespace

std::string header_block(std::string_view buf, std::size_t max)
{
  buf = buf.substr(0, max);

  auto prev_ch = '\0';
  auto last_lf = buf.size();
  for (std::size_t pos = 0; pos < buf.size(); ++pos) {
    auto const ch = buf[pos];
    if (ch == '\n') {
      last_lf = pos + 1;
      if (prev_ch == '\n')
        break; // blank line, end of headers
      prev_ch = ch;
    }
    else if (ch == '\r') {
      continue;
    }
    else if (ch == '\0') {
      break;
    }
    else {
      prev_ch = ch;
    }
  }
  if (last_lf < max)
    buf = buf.substr(0, last_lf);
  return std::string(buf);
}

std::string dsn_text(std::string_view addr, HostResponse const& response)
{
  return fmt::format("<{}> (delivered to '{}' with code {} ({}) '{}')\r\n", addr,
                     response.hostname, response.response.code,
                     response.response.esc_string(),
                     response_text(response.response));
}

std::string dsn_text(std::string_view addr, ErrorDetails const& details)
{
  auto const& entity = details.entity;
  return std::visit(
      overloaded{
          [&](UnexpectedResponse const& e) {
            auto const what = e.command.empty()
                                  ? std::string("transaction")
                                  : fmt::format("command '{}'", e.command);
            return fmt::format(
                "<{}> (host '{}' rejected {} with code {} ({}) '{}')\r\n", addr,
                entity, what, e.response.code, e.response.esc_string(),
                response_text(e.response));
          },
          [&](DnsError const& e) {
            return fmt::format("<{}> (failed to lookup '{}': {})\r\n", addr,
                               entity, e.details);
          },
          [&](ConnectionError const& e) {
            return fmt::format("<{}> (connection to '{}' failed: {})\r\n", addr,
                               entity, e.details);
          },
          [&](TlsError const& e) {
            return fmt::format("<{}> (TLS error from '{}': {})\r\n", addr,
                               entity, e.details);
          },
          [&](DaneError const& e) {
            return fmt::format(
                "<{}> (DANE failed to authenticate '{}': {})\r\n", addr, entity,
                e.details);
          },
          [&](MtaStsError const& e) {
            return fmt::format(
                "<{}> (MTA-STS failed to authenticate '{}': {})\r\n", addr,
                entity, e.details);
          },
          [&](RateLimited const&) {
            return fmt::format("<{}> (rate limited)\r\n", addr);
          },
          [&](ConcurrencyLimited const&) {
            return fmt::format(
                "<{}> (too many concurrent connections to remote server)\r\n",
                addr);
          },
          [&](Io const& e) {
            return fmt::format("<{}> (queue error: {})\r\n", addr, e.details);
          },
      },
      details.error);
}

std::string dsn_fields(Recipient const& rcpt,
                       std::uint64_t    created,
                       std::uint64_t    now)
{
  std::string fields;
  if (rcpt.orcpt)
    fields += fmt::format("Original-Recipient: rfc822;{}\r\n", *rcpt.orcpt);
  fields += fmt::format("Final-Recipient: rfc822;{}\r\n", rcpt.address);
  fields += fmt::format("Action: {}\r\n", action(rcpt.status));
  fields += fmt::format("Status: {}\r\n", status_field(rcpt.status));

  if (auto const err = failure_of(rcpt.status)) {
    if (auto ur = std::get_if<UnexpectedResponse>(&err->error)) {
      fields += fmt::format("Diagnostic-Code: smtp;{} {}\r\n", ur->response.code,
                            response_text(ur->response));
    }
    if (names_remote_mta(err->error))
      fields += fmt::format("Remote-MTA: dns;{}\r\n", err->entity);
  }
  else if (auto done = std::get_if<Completed<HostResponse>>(&rcpt.status)) {
    fields += fmt::format("Remote-MTA: dns;{}\r\n", done->value.hostname);
  }

  if (rcpt.is_pending()) {
    if (auto const expires = rcpt.expiration_time(created);
        expires && *expires > now) {
      fields += fmt::format("Will-Retry-Until: {}\r\n", Now(*expires).string());
    }
  }
  return fields;
}

std::string DsnBuilder::original_headers_(Message const& message)
{
  auto const blob = blobs_.get_blob(message.blob_hash, 0, max_header_size);
  if (!blob) {
    LOG(WARNING) << "queue " << message.queue_id << ": blob "
                 << message.blob_hash << " not found";
    return {};
  }
  return header_block(*blob);
}

std::optional<std::string> DsnBuilder::build_dsn(Message& message,
                                                 std::uint64_t now)
{
  if (message.return_path.empty())
    return {};

  std::string txt_success;
  std::string txt_delay;
  std::string txt_failed;
  std::string dsn;

  for (auto& rcpt : message.recipients) {
    if (rcpt.flags & (RCPT_DSN_SENT | NOTIFY_NEVER))
      continue;

    if (auto done = std::get_if<Completed<HostResponse>>(&rcpt.status)) {
      if (!(rcpt.flags & NOTIFY_SUCCESS))
        continue;
      rcpt.flags |= RCPT_DSN_SENT;
      txt_success += dsn_text(rcpt.address, done->value);
    }
    else if (auto perm = std::get_if<PermanentFailure<ErrorDetails>>(&rcpt.status)) {
      if (!(rcpt.flags & NOTIFY_FAILURE))
        continue;
      rcpt.flags |= RCPT_DSN_SENT;
      txt_failed += dsn_text(rcpt.address, perm->error);
    }
    else if (rcpt.notify.due <= now && (rcpt.flags & NOTIFY_DELAY)) {
      if (auto tmp = std::get_if<TemporaryFailure<ErrorDetails>>(&rcpt.status)) {
        txt_delay += dsn_text(rcpt.address, tmp->error);
      }
      else {
        // Still scheduled when the notification fell due: the attempts
        // so far were held back by concurrency limits.
        txt_delay += dsn_text(rcpt.address,
                              ErrorDetails{"localhost", ConcurrencyLimited{}});
      }
    }
    else {
      continue;
    }

    dsn += dsn_fields(rcpt, message.created, now);
    dsn += "\r\n";
  }

  auto const has_success = !txt_success.empty();
  auto const has_delay   = !txt_delay.empty();
  auto const has_failure = !txt_failed.empty();

  if (!has_success && !has_delay && !has_failure)
    return {};

  std::string      txt;
  std::string_view subject;
  auto             is_mixed = false;

  if (has_success && !has_delay && !has_failure) {
    txt = "Your message has been successfully delivered to the following "
          "recipients:\r\n\r\n";
    subject = "Successfully delivered message";
  }
  else if (has_delay && !has_success && !has_failure) {
    txt = "There was a temporary problem delivering your message to the "
          "following recipients:\r\n\r\n";
    subject = "Warning: Delay in message delivery";
  }
  else if (has_failure && !has_success && !has_delay) {
    txt = "Your message could not be delivered to the following "
          "recipients:\r\n\r\n";
    subject = "Failed to deliver message";
  }
  else if (has_success) {
    txt      = "Your message has been partially delivered:\r\n\r\n";
    subject  = "Partially delivered message";
    is_mixed = true;
  }
  else {
    txt = "Your message could not be delivered to some recipients:\r\n\r\n";
    subject  = "Warning: Temporary and permanent failures during message "
               "delivery";
    is_mixed = true;
  }

  // Move delay notifications on to the next interval, or stop them.
  if (has_delay) {
    for (auto& rcpt : message.recipients) {
      if (!rcpt.is_pending() || rcpt.notify.due > now)
        continue;
      auto const& strategy
          = policy_.queue_strategy(QueueEnvelope(message, rcpt));
      auto const next = rcpt.notify.inner + 1;
      if (next < strategy.notify.size()) {
        rcpt.notify.inner = next;
        rcpt.notify.due   = now + strategy.notify[next];
      }
      else {
        rcpt.notify.due = never;
      }
    }
  }

  if (has_success) {
    if (is_mixed)
      txt += "    ----- Delivery to the following addresses was successful "
             "-----\r\n";
    txt += txt_success;
    txt += "\r\n";
  }
  if (has_delay) {
    if (is_mixed)
      txt += "    ----- There was a temporary problem delivering to these "
             "addresses -----\r\n";
    txt += txt_delay;
    txt += "\r\n";
  }
  if (has_failure) {
    if (is_mixed)
      txt += "    ----- Delivery to the following addresses failed -----\r\n";
    txt += txt_failed;
    txt += "\r\n";
  }

  auto const  from_name     = policy_.dsn_from_name(message);
  auto const  from_addr     = policy_.dsn_from_address(message);
  auto const& reporting_mta = policy_.reporting_mta();

  auto const status = fmt::format("Reporting-MTA: dns;{}\r\n"
                                  "Arrival-Date: {}\r\n"
                                  "{}"
                                  "\r\n"
                                  "{}",
                                  reporting_mta, Now(message.created).string(),
                                  message.env_id
                                      ? fmt::format("Original-Envelope-Id: {}\r\n",
                                                    *message.env_id)
                                      : std::string{},
                                  dsn);

  auto const date = Now(now);
  auto const pill = Pill{};
  auto const boundary = fmt::format("{}.{}", date.sec(), pill.as_string_view());

  Eml eml;
  eml.add_hdr("From", from_name.empty()
                          ? fmt::format("<{}>", from_addr)
                          : fmt::format("{} <{}>", display_name(from_name),
                                        from_addr));
  eml.add_hdr("To", fmt::format("<{}>", message.return_path));
  eml.add_hdr("Auto-Submitted", "auto-generated");
  eml.add_hdr("Message-ID", fmt::format("<{}.{}@{}>", date.sec(),
                                        pill.as_string_view(), reporting_mta));
  eml.add_hdr("Date", date.string());
  eml.add_hdr("Subject", std::string(subject));
  eml.add_hdr("MIME-Version", "1.0");
  eml.add_hdr("Content-Type",
              fmt::format("multipart/report; report-type=\"delivery-status\"; "
                          "boundary=\"{}\"",
                          boundary));

  std::ostringstream os;
  os << eml;
  write_part(os, boundary, "text/plain; charset=\"utf-8\"", txt);
  write_part(os, boundary, "message/delivery-status", status);
  write_part(os, boundary, "message/rfc822", original_headers_(message));
  os << "--" << boundary << "--\r\n";

  return os.str();
}

std::size_t DsnBuilder::log_dsn(Message& message, std::uint64_t now) const
{
  std::size_t logged = 0;

  for (auto& rcpt : message.recipients) {
    if (rcpt.flags & (RCPT_DSN_SENT | RCPT_STATUS_LOGGED))
      continue;

    // Delays are logged when a delay report falls due, building the
    // report moves the notify schedule on.
    auto const delay_due = rcpt.notify.due <= now
                           && (rcpt.flags & NOTIFY_DELAY)
                           && !(rcpt.flags & NOTIFY_NEVER);

    std::visit(
        overloaded{
            [&](Completed<HostResponse> const& done) {
              LOG(INFO) << "queue " << message.queue_id << ": delivered to "
                        << rcpt.address << " at " << done.value.hostname
                        << " code " << done.value.response.code << " "
                        << response_text(done.value.response);
              rcpt.flags |= RCPT_STATUS_LOGGED;
              ++logged;
            },
            [&](TemporaryFailure<ErrorDetails> const& tmp) {
              if (!delay_due)
                return;
              auto const expires = rcpt.expiration_time(message.created);
              LOG(INFO) << "queue " << message.queue_id
                        << ": temporary failure for " << rcpt.address << ": "
                        << describe(tmp.error) << ", next retry "
                        << Now(rcpt.retry.due) << ", expires "
                        << (expires ? Now(*expires).string() : "never")
                        << ", attempts " << rcpt.retry.inner;
              ++logged;
            },
            [&](PermanentFailure<ErrorDetails> const& perm) {
              LOG(INFO) << "queue " << message.queue_id
                        << ": permanent failure for " << rcpt.address << ": "
                        << describe(perm.error) << ", attempts "
                        << rcpt.retry.inner;
              rcpt.flags |= RCPT_STATUS_LOGGED;
              ++logged;
            },
            [&](Scheduled const&) {
              if (!delay_due)
                return;
              LOG(INFO) << "queue " << message.queue_id << ": " << rcpt.address
                        << " concurrency limited, next retry "
                        << Now(rcpt.retry.due) << ", attempts "
                        << rcpt.retry.inner;
              ++logged;
            },
        },
        rcpt.status);
  }

  return logged;
}

std::size_t DsnBuilder::handle_double_bounce(Message& message, std::uint64_t now)
{
  std::vector<std::string> bounced;

  for (auto& rcpt : message.recipients) {
    if (!(rcpt.flags & (RCPT_DSN_SENT | NOTIFY_NEVER))) {
      if (auto perm = std::get_if<PermanentFailure<ErrorDetails>>(&rcpt.status)) {
        rcpt.flags |= RCPT_DSN_SENT;
        bounced.push_back(dsn_text(rcpt.address, perm->error));
      }
    }

    if (rcpt.notify.due <= now) {
      auto const expires = rcpt.expiration_time(message.created);
      rcpt.notify.due    = expires ? *expires + 10 : never;
    }
  }

  if (!bounced.empty()) {
    std::string list;
    for (auto const& text : bounced)
      list += text.substr(0, text.size() - 2) + "; "; // drop CRLF
    list.resize(list.size() - 2);
    LOG(WARNING) << "queue " << message.queue_id << ": double bounce: " << list;
  }
  return bounced.size();
}

} // namespace Queue
