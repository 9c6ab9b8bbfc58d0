#include "PolicyResolver.hpp"

#include <algorithm>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <glog/logging.h>

namespace Queue {

std::string PolicyResolver::name_(Expr::IfBlock const& block,
                                  QueueEnvelope const& env) const
{
  return block.eval_string(env, domains_).value_or("default");
}

std::string PolicyResolver::route(QueueEnvelope const& env) const
{
  return name_(catalog_.route, env);
}

std::string PolicyResolver::schedule(QueueEnvelope const& env) const
{
  return name_(catalog_.queue, env);
}

std::string PolicyResolver::connection(QueueEnvelope const& env) const
{
  return name_(catalog_.connection, env);
}

std::string PolicyResolver::tls(QueueEnvelope const& env) const
{
  return name_(catalog_.tls, env);
}

QueueStrategy const&
PolicyResolver::queue_strategy(QueueEnvelope const& env) const
{
  return catalog_.queue_or_default(schedule(env));
}

RoutingStrategy const&
PolicyResolver::routing_strategy(QueueEnvelope const& env) const
{
  return catalog_.route_or_default(route(env));
}

ConnectionStrategy const&
PolicyResolver::connection_strategy(QueueEnvelope const& env) const
{
  return catalog_.connection_or_default(connection(env));
}

TlsStrategy const& PolicyResolver::tls_strategy(QueueEnvelope const& env) const
{
  return catalog_.tls_or_default(tls(env));
}

std::string PolicyResolver::dsn_from_name(Message const& message) const
{
  QueueEnvelope const env(message);
  return catalog_.dsn.name.eval_string(env, domains_)
      .value_or("Mail Delivery Subsystem");
}

std::string PolicyResolver::dsn_from_address(Message const& message) const
{
  QueueEnvelope const env(message);
  if (auto addr = catalog_.dsn.address.eval_string(env, domains_))
    return *addr;
  LOG(WARNING) << "no DSN from-address, using MAILER-DAEMON@"
               << catalog_.report_domain;
  return "MAILER-DAEMON@" + catalog_.report_domain;
}

std::vector<std::string> PolicyResolver::dsn_sign(Message const& message) const
{
  std::vector<std::string> names;

  QueueEnvelope const env(message);
  auto const          list = catalog_.dsn.sign.eval_string(env, domains_);
  if (!list)
    return names;

  boost::algorithm::split(names, *list, boost::algorithm::is_any_of(","));
  for (auto& name : names)
    boost::algorithm::trim(name);
  names.erase(std::remove(names.begin(), names.end(), std::string{}),
              names.end());
  return names;
}

} // namespace Queue
