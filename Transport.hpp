#ifndef TRANSPORT_DOT_HPP
#define TRANSPORT_DOT_HPP

#include "Error.hpp"
#include "Message.hpp"
#include "Strategy.hpp"

namespace Queue {

// Carries one message to one recipient: MX lookup, connection, TLS and
// the SMTP or LMTP transaction all happen behind this.
class Transport {
public:
  virtual ~Transport() = default;

  virtual DeliveryStatus deliver(Message const&            message,
                                 Recipient const&          rcpt,
                                 RoutingStrategy const&    route,
                                 TlsStrategy const&        tls,
                                 ConnectionStrategy const& connection)
      = 0;
};

} // namespace Queue

#endif // TRANSPORT_DOT_HPP
