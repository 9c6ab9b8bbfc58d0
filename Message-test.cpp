#include "Message.hpp"

#include <glog/logging.h>

using namespace Queue;

namespace {
Recipient rcpt(std::string_view address,
               std::uint64_t    due,
               std::uint64_t    notify,
               QueueExpiry      expires,
               std::string_view queue = "default")
{
  Recipient r;
  r.address       = std::string(address);
  r.address_lcase = std::string(address);
  r.retry.due     = due;
  r.notify.due    = notify;
  r.expires       = expires;
  r.queue         = QueueName(queue);
  return r;
}

ErrorDetails refused()
{
  return ErrorDetails{"mx.example.com", ConnectionError{"refused"}};
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  CHECK_EQ(domain_of("bob@Example.COM"), "Example.COM");
  CHECK_EQ(domain_of("postmaster"), "");
  CHECK_EQ(domain_of("\"a@b\"@example.org"), "example.org");
  CHECK_EQ(to_string(MessageSource::dsn), "dsn");

  // Status transitions.
  {
    DeliveryStatus st = TemporaryFailure<ErrorDetails>{refused()};
    CHECK(!is_final(st));
    st = into_permanent(std::move(st));
    CHECK(std::holds_alternative<PermanentFailure<ErrorDetails>>(st));
    CHECK(is_final(st));
    CHECK_EQ(std::get<PermanentFailure<ErrorDetails>>(st).error.entity,
             "mx.example.com");

    st = into_temporary(std::move(st));
    CHECK(std::holds_alternative<TemporaryFailure<ErrorDetails>>(st));

    DeliveryStatus done
        = Completed<HostResponse>{HostResponse{"mx", Response{250}}};
    CHECK(std::holds_alternative<Completed<HostResponse>>(into_permanent(done)));
    CHECK(std::holds_alternative<Completed<HostResponse>>(into_temporary(done)));

    DeliveryStatus sched = Scheduled{};
    CHECK(std::holds_alternative<Scheduled>(into_permanent(sched)));
    CHECK(!is_final(sched));
  }

  // Deadlines.
  {
    auto r = rcpt("a@example.com", 100, 200, Ttl{3600});
    CHECK_EQ(*r.expiration_time(1000), 4600u);
    CHECK(!r.is_expired(1000, 4599));
    CHECK(r.is_expired(1000, 4600));

    r.expires = Attempts{3};
    CHECK(!r.expiration_time(1000));
    r.retry.inner = 2;
    CHECK(!r.is_expired(1000, never - 1));
    r.retry.inner = 3;
    CHECK(r.is_expired(1000, 0));
  }

  Message msg;
  msg.queue_id    = 7;
  msg.created     = 1000;
  msg.return_path = "alice@example.com";
  msg.recipients.push_back(rcpt("a@example.net", 1060, 1500, Ttl{600}));
  msg.recipients.push_back(rcpt("b@example.net", 1030, never, Ttl{3600}, "slow"));
  msg.recipients.push_back(rcpt("c@example.org", 1010, 1020, Attempts{2}));
  msg.recipients[2].status
      = Completed<HostResponse>{HostResponse{"mx", Response{250}}};

  CHECK_EQ(msg.return_path_domain(), "example.com");

  // Finished recipients don't count.
  CHECK_EQ(*msg.next_event(), 1030u);
  CHECK_EQ(*msg.next_event(QueueName("default")), 1060u);
  CHECK_EQ(*msg.next_delivery_event(), 1030u);
  CHECK_EQ(*msg.next_dsn(), 1500u);
  CHECK_EQ(*msg.next_dsn(QueueName("slow")), never);
  CHECK_EQ(*msg.expires(), 4600u);
  CHECK_EQ(*msg.expires(QueueName("default")), 1600u);
  CHECK(!msg.next_event(QueueName("other")));

  CHECK_EQ(*msg.next_event_after({}, 1030), 1060u);
  CHECK_EQ(*msg.next_event_after(QueueName("default"), 1060), 1500u);
  CHECK_EQ(*msg.next_event_after(QueueName("slow"), 1030), 4600u);
  CHECK_EQ(*msg.next_event_after({}, 5000), never);
  CHECK(!msg.next_event_after(QueueName("default"), 1600));

  auto const events = msg.next_events();
  CHECK_EQ(events.size(), 2u);
  CHECK_EQ(events.at(QueueName("default")), 1060u);
  CHECK_EQ(events.at(QueueName("slow")), 1030u);

  // Still going on both queues.
  CHECK(msg.has_pending_delivery(QueueName("default"), 1100)
        == PendingDelivery::yes);
  CHECK(msg.has_pending_delivery(QueueName("other"), 1100)
        == PendingDelivery::yes_other_queue);

  // The first recipient runs out of time having tried once, the
  // second one never tried at all.
  msg.recipients[0].status = TemporaryFailure<ErrorDetails>{refused()};
  CHECK(msg.has_pending_delivery(QueueName("default"), 1600)
        == PendingDelivery::yes_other_queue);
  auto const& failed
      = std::get<PermanentFailure<ErrorDetails>>(msg.recipients[0].status);
  CHECK(std::holds_alternative<ConnectionError>(failed.error.error));

  CHECK(msg.has_pending_delivery(QueueName("slow"), 4600)
        == PendingDelivery::no);
  auto const& expired
      = std::get<PermanentFailure<ErrorDetails>>(msg.recipients[1].status);
  CHECK_EQ(expired.error.entity, "example.net");
  CHECK_EQ(std::get<Io>(expired.error.error).details,
           "Message expired without any delivery attempts made.");

  CHECK(!msg.next_event());
  CHECK(msg.next_events().empty());

  // Attempts run out.
  Message capped;
  capped.created = 0;
  capped.recipients.push_back(rcpt("d@example.com", 10, never, Attempts{2}));
  capped.recipients[0].status = TemporaryFailure<ErrorDetails>{refused()};
  capped.recipients[0].retry.inner = 1;
  CHECK(capped.has_pending_delivery(QueueName{}, 1000000) == PendingDelivery::yes);
  capped.recipients[0].retry.inner = 2;
  CHECK(capped.has_pending_delivery(QueueName{}, 0) == PendingDelivery::no);
  CHECK(is_final(capped.recipients[0].status));

  // Only recipients that want delay reports wake their queue for one.
  Message waiting;
  waiting.created = 0;
  waiting.recipients.push_back(rcpt("e@example.com", 5000, 100, Ttl{86400}));
  waiting.recipients.push_back(
      rcpt("f@example.com", 6000, 200, Ttl{86400}, "slow"));
  waiting.recipients[1].flags = NOTIFY_DELAY | NOTIFY_FAILURE;

  auto const waking = waiting.next_events();
  CHECK_EQ(waking.at(QueueName("default")), 5000u);
  CHECK_EQ(waking.at(QueueName("slow")), 200u);

  waiting.recipients[1].flags |= NOTIFY_NEVER;
  CHECK_EQ(waiting.next_events().at(QueueName("slow")), 6000u);

  // The notify schedule itself is unchanged.
  CHECK_EQ(*waiting.next_dsn(QueueName("default")), 100u);
  CHECK_EQ(*waiting.next_event(QueueName("slow")), 200u);
}
