#ifndef POLICYRESOLVER_DOT_HPP
#define POLICYRESOLVER_DOT_HPP

#include <string>
#include <vector>

#include "Catalog.hpp"
#include "Envelope.hpp"

class LocalDomains;

namespace Queue {

// Picks strategies for a message by evaluating the catalog's selector
// expressions. Has no side effects, safe to share between threads.
class PolicyResolver {
public:
  PolicyResolver(Catalog const& catalog, LocalDomains const* domains)
    : catalog_(catalog)
    , domains_(domains)
  {
  }

  // Strategy names, "default" when a selector gives nothing.
  std::string route(QueueEnvelope const& env) const;
  std::string schedule(QueueEnvelope const& env) const;
  std::string connection(QueueEnvelope const& env) const;
  std::string tls(QueueEnvelope const& env) const;

  QueueStrategy const&      queue_strategy(QueueEnvelope const& env) const;
  RoutingStrategy const&    routing_strategy(QueueEnvelope const& env) const;
  ConnectionStrategy const& connection_strategy(QueueEnvelope const& env) const;
  TlsStrategy const&        tls_strategy(QueueEnvelope const& env) const;

  std::string              dsn_from_name(Message const& message) const;
  std::string              dsn_from_address(Message const& message) const;
  std::vector<std::string> dsn_sign(Message const& message) const;

  std::string const& reporting_mta() const { return catalog_.submitter; }

  Catalog const&      catalog() const { return catalog_; }
  LocalDomains const* domains() const { return domains_; }

private:
  std::string name_(Expr::IfBlock const& block, QueueEnvelope const& env) const;

  Catalog const&      catalog_;
  LocalDomains const* domains_;
};

} // namespace Queue

#endif // POLICYRESOLVER_DOT_HPP
