#ifndef ENVELOPE_DOT_HPP
#define ENVELOPE_DOT_HPP

#include <string>
#include <string_view>

#include "Expression.hpp"
#include "Message.hpp"

namespace Queue {

// Expression variables for a queued message, scoped to the sender, to
// one recipient, or to one recipient and the remote host being tried.
class QueueEnvelope : public Expr::Resolver {
public:
  explicit QueueEnvelope(Message const& message)
    : message_(message)
  {
  }

  QueueEnvelope(Message const& message, Recipient const& rcpt)
    : message_(message)
    , rcpt_(&rcpt)
  {
  }

  QueueEnvelope& with_host(std::string_view mx,
                           std::string_view remote_ip,
                           std::string_view local_ip)
  {
    mx_        = mx;
    remote_ip_ = remote_ip;
    local_ip_  = local_ip;
    return *this;
  }

  Message const&   message() const { return message_; }
  Recipient const* recipient() const { return rcpt_; }

  Expr::Value resolve(Expr::Variable var) const override;

private:
  Message const&   message_;
  Recipient const* rcpt_{nullptr};

  std::string mx_;
  std::string remote_ip_;
  std::string local_ip_;
};

// Expression variables for an SMTP session at RCPT TO time, before the
// message exists.
struct SessionEnvelope : public Expr::Resolver {
  std::string listener;
  std::string remote_ip;
  std::string local_ip;
  std::string helo_domain;
  std::string authenticated_as;
  std::string sender;
  std::string rcpt;

  Expr::Value resolve(Expr::Variable var) const override;
};

} // namespace Queue

#endif // ENVELOPE_DOT_HPP
