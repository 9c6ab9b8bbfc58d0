#include "Envelope.hpp"

#include <boost/algorithm/string/case_conv.hpp>


namespace Queue {

using Expr::Value;
using Expr::Variable;

namespace {
Value str(std::string_view s) { return Value{std::string(s)}; }

Value last_error(Recipient const& rcpt)
{
  if (auto tmp = std::get_if<TemporaryFailure<ErrorDetails>>(&rcpt.status))
    return str(error_kind(tmp->error.error));
  if (auto perm = std::get_if<PermanentFailure<ErrorDetails>>(&rcpt.status))
    return str(error_kind(perm->error.error));
  return str("");
}

Value last_status(Recipient const& rcpt)
{
  auto code = [](ErrorDetails const& det) -> Value {
    if (auto resp = std::get_if<UnexpectedResponse>(&det.error))
      return Value{std::int64_t{resp->response.code}};
    return str("");
  };
  if (auto done = std::get_if<Completed<HostResponse>>(&rcpt.status))
    return Value{std::int64_t{done->value.response.code}};
  if (auto tmp = std::get_if<TemporaryFailure<ErrorDetails>>(&rcpt.status))
    return code(tmp->error);
  if (auto perm = std::get_if<PermanentFailure<ErrorDetails>>(&rcpt.status))
    return code(perm->error);
  return str("");
}
} // namespace

Value QueueEnvelope::resolve(Variable var) const
{
  switch (var) {
  case Variable::sender: return str(message_.return_path_lcase);
  case Variable::sender_domain:
    return str(domain_of(message_.return_path_lcase));
  case Variable::source: return str(to_string(message_.source));
  case Variable::size:
    return Value{static_cast<std::int64_t>(message_.size)};
  case Variable::env_id: return str(message_.env_id.value_or(""));
  case Variable::mx: return str(mx_);
  case Variable::remote_ip: return str(remote_ip_);
  case Variable::local_ip: return str(local_ip_);
  default: break;
  }

  if (rcpt_ == nullptr)
    return str("");

  switch (var) {
  case Variable::rcpt: return str(rcpt_->address_lcase);
  case Variable::rcpt_domain: return str(domain_of(rcpt_->address_lcase));
  case Variable::retry_num: return Value{std::int64_t{rcpt_->retry.inner}};
  case Variable::notify_num: return Value{std::int64_t{rcpt_->notify.inner}};
  case Variable::last_error: return last_error(*rcpt_);
  case Variable::last_status: return last_status(*rcpt_);
  case Variable::queue_name: return str(rcpt_->queue.as_str());
  default: break;
  }
  return str("");
}

Value SessionEnvelope::resolve(Variable var) const
{
  switch (var) {
  case Variable::listener: return str(listener);
  case Variable::remote_ip: return str(remote_ip);
  case Variable::local_ip: return str(local_ip);
  case Variable::helo_domain:
    return str(boost::algorithm::to_lower_copy(helo_domain));
  case Variable::authenticated_as: return str(authenticated_as);
  case Variable::sender:
    return str(boost::algorithm::to_lower_copy(sender));
  case Variable::sender_domain:
    return str(domain_of(boost::algorithm::to_lower_copy(sender)));
  case Variable::rcpt: return str(boost::algorithm::to_lower_copy(rcpt));
  case Variable::rcpt_domain:
    return str(domain_of(boost::algorithm::to_lower_copy(rcpt)));
  default: break;
  }
  return str("");
}

} // namespace Queue
