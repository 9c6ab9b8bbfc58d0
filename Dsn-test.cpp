#include "Dsn.hpp"

#include "Now.hpp"

#include <glog/logging.h>

using namespace Queue;

namespace {
bool contains(std::string_view haystack, std::string_view needle)
{
  return haystack.find(needle) != std::string_view::npos;
}

Recipient rcpt(std::string_view address, std::uint32_t flags, DeliveryStatus status)
{
  Recipient r;
  r.address       = std::string(address);
  r.address_lcase = std::string(address);
  r.flags         = flags;
  r.status        = std::move(status);
  r.expires       = Ttl{432000};
  return r;
}

Response const ok{250, {2, 0, 0}, "OK queued as 1234"};
Response const no_user{550, {5, 1, 1}, "no such\r\n user"};

ErrorDetails rejected()
{
  return ErrorDetails{"mx.example.org", UnexpectedResponse{"RCPT TO", no_user}};
}

ErrorDetails refused()
{
  return ErrorDetails{"mx.example.net", ConnectionError{"connection refused"}};
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  // The header section of the original message.
  CHECK_EQ(header_block("Subject: hi\r\nFrom: a\r\n\r\nbody\r\n"),
           "Subject: hi\r\nFrom: a\r\n\r\n");
  CHECK_EQ(header_block("Subject: hi\nFrom: a\n\nbody\n"),
           "Subject: hi\nFrom: a\n\n");
  CHECK_EQ(header_block("A: b\r\n", 4096), "A: b\r\n");
  CHECK_EQ(header_block(std::string_view("A: b\r\n\0junk", 11)), "A: b\r\n");
  CHECK_EQ(header_block("Subject: hello\r\nFrom: somebody\r\n\r\n", 20),
           "Subject: hello\r\n");
  CHECK_EQ(header_block("Subject"), "Subject");
  CHECK_EQ(header_block(""), "");

  CHECK_EQ(dsn_text("bob@example.org", HostResponse{"mx.example.org", ok}),
           "<bob@example.org> (delivered to 'mx.example.org' with code 250 "
           "(2.0.0) 'OK queued as 1234')\r\n");
  CHECK_EQ(dsn_text("bob@example.org", rejected()),
           "<bob@example.org> (host 'mx.example.org' rejected command 'RCPT "
           "TO' with code 550 (5.1.1) 'no such user')\r\n");
  CHECK_EQ(dsn_text("bob@example.org",
                    ErrorDetails{"mx.example.org",
                                 UnexpectedResponse{"", Response{554}}}),
           "<bob@example.org> (host 'mx.example.org' rejected transaction "
           "with code 554 (0.0.0) '')\r\n");
  CHECK_EQ(dsn_text("c@example.net", refused()),
           "<c@example.net> (connection to 'mx.example.net' failed: "
           "connection refused)\r\n");
  CHECK_EQ(dsn_text("d@example.com",
                    ErrorDetails{"example.com", DnsError{"NXDOMAIN"}}),
           "<d@example.com> (failed to lookup 'example.com': NXDOMAIN)\r\n");
  CHECK_EQ(dsn_text("e@example.com", ErrorDetails{"example.com", RateLimited{}}),
           "<e@example.com> (rate limited)\r\n");
  CHECK_EQ(dsn_text("f@example.com", ErrorDetails{"localhost", Io{"disk full"}}),
           "<f@example.com> (queue error: disk full)\r\n");

  // Per recipient fields.
  {
    auto r  = rcpt("bob@example.org", 0,
                   PermanentFailure<ErrorDetails>{rejected()});
    r.orcpt = "Bob@Example.ORG";
    CHECK_EQ(dsn_fields(r, 1000, 2000),
             "Original-Recipient: rfc822;Bob@Example.ORG\r\n"
             "Final-Recipient: rfc822;bob@example.org\r\n"
             "Action: failed\r\n"
             "Status: 5.1.1\r\n"
             "Diagnostic-Code: smtp;550 no such user\r\n"
             "Remote-MTA: dns;mx.example.org\r\n");

    auto const done = rcpt("a@example.org", 0,
                           Completed<HostResponse>{HostResponse{"mx1", ok}});
    CHECK_EQ(dsn_fields(done, 1000, 2000),
             "Final-Recipient: rfc822;a@example.org\r\n"
             "Action: delivered\r\n"
             "Status: 2.0.0\r\n"
             "Remote-MTA: dns;mx1\r\n");

    auto const later = rcpt("c@example.net", 0,
                            TemporaryFailure<ErrorDetails>{refused()});
    CHECK_EQ(dsn_fields(later, 1000, 2000),
             std::string("Final-Recipient: rfc822;c@example.net\r\n"
                         "Action: delayed\r\n"
                         "Status: 4.0.0\r\n"
                         "Remote-MTA: dns;mx.example.net\r\n"
                         "Will-Retry-Until: ")
                 + Now(1000 + 432000).string() + "\r\n");

    // Past its deadline, no promise to retry.
    CHECK(!contains(dsn_fields(later, 1000, 1000 + 432000), "Will-Retry-Until"));

    auto const io = rcpt("d@example.com", 0,
                         PermanentFailure<ErrorDetails>{
                             ErrorDetails{"example.com", Io{"expired"}}});
    CHECK_EQ(dsn_fields(io, 1000, 2000),
             "Final-Recipient: rfc822;d@example.com\r\n"
             "Action: failed\r\n"
             "Status: 5.0.0\r\n");
  }

  Catalog const        catalog("mx.example.com");
  PolicyResolver const policy(catalog, nullptr);
  MemoryBlobStore      blobs;
  DsnBuilder           builder(policy, blobs);

  auto const raw = std::string("Subject: test\r\nFrom: alice@example.com\r\n"
                               "\r\n"
                               "secret body\r\n");

  auto new_message = [&] {
    Message msg;
    msg.queue_id    = 1;
    msg.created     = 1000;
    msg.return_path = "alice@example.com";
    msg.blob_hash   = blobs.put_blob(raw);
    return msg;
  };

  // One delivered, one failed: a single mixed report.
  {
    auto msg = new_message();
    msg.env_id = "ENV-1";
    msg.recipients.push_back(
        rcpt("a@example.org", NOTIFY_SUCCESS,
             Completed<HostResponse>{HostResponse{"mx.example.org", ok}}));
    msg.recipients.push_back(rcpt("b@example.org", NOTIFY_FAILURE,
                                  PermanentFailure<ErrorDetails>{rejected()}));

    auto const report = builder.build_dsn(msg, 2000);
    CHECK(report);
    CHECK(contains(*report, "Subject: Partially delivered message\r\n"));
    CHECK(contains(*report, "From: \"Mail Delivery Subsystem\" "
                            "<MAILER-DAEMON@mx.example.com>\r\n"));
    CHECK(contains(*report, "To: <alice@example.com>\r\n"));
    CHECK(contains(*report, "Auto-Submitted: auto-generated\r\n"));
    CHECK(contains(*report, "MIME-Version: 1.0\r\n"));
    CHECK(contains(*report, "Content-Type: multipart/report; "
                            "report-type=\"delivery-status\"; boundary=\""));
    CHECK(contains(*report, "Your message has been partially delivered:"));
    CHECK(contains(*report, "    ----- Delivery to the following addresses was "
                            "successful -----\r\n<a@example.org> (delivered to"));
    CHECK(contains(*report, "    ----- Delivery to the following addresses "
                            "failed -----\r\n<b@example.org> (host"));
    CHECK(contains(*report, "Content-Type: message/delivery-status\r\n\r\n"
                            "Reporting-MTA: dns;mx.example.com\r\n"));
    CHECK(contains(*report, std::string("Arrival-Date: ") + Now(1000).string()));
    CHECK(contains(*report, "Original-Envelope-Id: ENV-1\r\n"));
    CHECK(contains(*report, "Final-Recipient: rfc822;a@example.org\r\n"
                            "Action: delivered\r\n"));
    CHECK(contains(*report, "Final-Recipient: rfc822;b@example.org\r\n"
                            "Action: failed\r\n"));
    CHECK(contains(*report, "Content-Type: message/rfc822\r\n\r\n"
                            "Subject: test\r\nFrom: alice@example.com\r\n"));
    CHECK(!contains(*report, "secret body"));

    CHECK(msg.recipients[0].flags & RCPT_DSN_SENT);
    CHECK(msg.recipients[1].flags & RCPT_DSN_SENT);

    // Nothing new to say.
    CHECK(!builder.build_dsn(msg, 3000));
  }

  // Final recipients that didn't ask to hear about it.
  {
    auto msg = new_message();
    msg.recipients.push_back(
        rcpt("a@example.org", NOTIFY_FAILURE,
             Completed<HostResponse>{HostResponse{"mx.example.org", ok}}));
    msg.recipients.push_back(rcpt("b@example.org", NOTIFY_NEVER,
                                  PermanentFailure<ErrorDetails>{rejected()}));
    CHECK(!builder.build_dsn(msg, 2000));
    CHECK_EQ(msg.recipients[0].flags, NOTIFY_FAILURE);
    CHECK_EQ(msg.recipients[1].flags, NOTIFY_NEVER);
  }

  // Only a failure.
  {
    auto msg = new_message();
    msg.recipients.push_back(rcpt("b@example.org", NOTIFY_FAILURE,
                                  PermanentFailure<ErrorDetails>{rejected()}));
    auto const report = builder.build_dsn(msg, 2000);
    CHECK(report);
    CHECK(contains(*report, "Subject: Failed to deliver message\r\n"));
    CHECK(contains(*report, "Your message could not be delivered to the "
                            "following recipients:\r\n\r\n<b@example.org>"));
    CHECK(!contains(*report, "-----\r\n"));
  }

  // Delay notifications follow the notify schedule, then stop.
  {
    auto msg     = new_message();
    auto pending = rcpt("c@example.net", NOTIFY_DELAY | NOTIFY_FAILURE,
                        TemporaryFailure<ErrorDetails>{refused()});
    pending.notify = Schedule{0, 1000 + 86400};
    msg.recipients.push_back(pending);

    auto const before = msg.recipients[0].notify;
    CHECK(!builder.build_dsn(msg, 2000));
    CHECK_EQ(msg.recipients[0].notify.due, before.due);
    CHECK_EQ(msg.recipients[0].notify.inner, before.inner);
    CHECK_EQ(msg.recipients[0].flags, NOTIFY_DELAY | NOTIFY_FAILURE);

    auto now    = 1000 + 86400;
    auto report = builder.build_dsn(msg, now);
    CHECK(report);
    CHECK(contains(*report, "Subject: Warning: Delay in message delivery\r\n"));
    CHECK(contains(*report, "There was a temporary problem delivering your "
                            "message to the following recipients:"));
    CHECK(contains(*report, "Action: delayed\r\n"));
    CHECK(contains(*report, "Will-Retry-Until: "));
    CHECK(!(msg.recipients[0].flags & RCPT_DSN_SENT));
    CHECK_EQ(msg.recipients[0].notify.inner, 1u);
    CHECK_EQ(msg.recipients[0].notify.due, now + 259200u);

    now += 259200;
    CHECK(builder.build_dsn(msg, now));
    CHECK_EQ(msg.recipients[0].notify.due, never);
    CHECK(!builder.build_dsn(msg, never - 1));
  }

  // Not interested in delays: no report, nothing changes.
  {
    auto msg   = new_message();
    auto quiet = rcpt("e@example.com", NOTIFY_FAILURE,
                      TemporaryFailure<ErrorDetails>{refused()});
    quiet.notify = Schedule{0, 1500};
    msg.recipients.push_back(quiet);
    CHECK(!builder.build_dsn(msg, 2000));
    CHECK_EQ(msg.recipients[0].notify.due, 1500u);
    CHECK_EQ(msg.recipients[0].notify.inner, 0u);
  }

  // A recipient held back by concurrency limits, one that doesn't want
  // delay reports, and a failure.
  {
    auto msg   = new_message();
    auto held  = rcpt("d@example.com", NOTIFY_DELAY, Scheduled{});
    held.notify = Schedule{0, 1500};
    auto quiet = rcpt("e@example.com", NOTIFY_FAILURE,
                      TemporaryFailure<ErrorDetails>{refused()});
    quiet.notify = Schedule{0, 1500};
    msg.recipients.push_back(held);
    msg.recipients.push_back(quiet);
    msg.recipients.push_back(rcpt("b@example.org", NOTIFY_FAILURE,
                                  PermanentFailure<ErrorDetails>{rejected()}));

    auto const report = builder.build_dsn(msg, 2000);
    CHECK(report);
    CHECK(contains(*report, "Subject: Warning: Temporary and permanent failures "
                            "during message delivery\r\n"));
    CHECK(contains(*report, "<d@example.com> (too many concurrent connections "
                            "to remote server)"));
    CHECK(!contains(*report, "e@example.com"));
    CHECK(contains(*report, "    ----- There was a temporary problem "
                            "delivering to these addresses -----\r\n"));

    // Both move on, so neither is due again right away.
    CHECK_EQ(msg.recipients[0].notify.due, 2000u + 259200u);
    CHECK_EQ(msg.recipients[1].notify.due, 2000u + 259200u);
  }

  // Each outcome is logged once, however many passes see it.
  {
    auto msg = new_message();
    msg.recipients.push_back(
        rcpt("a@example.org", NOTIFY_FAILURE,
             Completed<HostResponse>{HostResponse{"mx.example.org", ok}}));
    msg.recipients.push_back(rcpt("b@example.org", NOTIFY_NEVER,
                                  PermanentFailure<ErrorDetails>{rejected()}));
    auto pending = rcpt("c@example.net", NOTIFY_DELAY | NOTIFY_FAILURE,
                        TemporaryFailure<ErrorDetails>{refused()});
    pending.notify = Schedule{0, 1500};
    msg.recipients.push_back(pending);
    auto quiet = rcpt("e@example.com", NOTIFY_FAILURE,
                      TemporaryFailure<ErrorDetails>{refused()});
    quiet.notify = Schedule{0, 1500};
    msg.recipients.push_back(quiet);

    CHECK_EQ(builder.log_dsn(msg, 2000), 3u);
    CHECK(msg.recipients[0].flags & RCPT_STATUS_LOGGED);
    CHECK(msg.recipients[1].flags & RCPT_STATUS_LOGGED);
    CHECK(!(msg.recipients[2].flags & RCPT_STATUS_LOGGED));
    CHECK(!(msg.recipients[3].flags & RCPT_STATUS_LOGGED));

    auto const report = builder.build_dsn(msg, 2000);
    CHECK(report);
    CHECK(contains(*report, "Subject: Warning: Delay in message delivery\r\n"));
    CHECK(!contains(*report, "a@example.org"));

    CHECK_EQ(builder.log_dsn(msg, 2000), 0u);
    CHECK_EQ(builder.log_dsn(msg, 3000), 0u);
  }

  // A report about a report goes nowhere, and changes nothing.
  {
    auto msg = new_message();
    msg.return_path.clear();
    msg.recipients.push_back(rcpt("a@example.org", NOTIFY_FAILURE,
                                  PermanentFailure<ErrorDetails>{rejected()}));
    auto pending = rcpt("c@example.net", NOTIFY_DELAY,
                        TemporaryFailure<ErrorDetails>{refused()});
    pending.notify = Schedule{0, 1500};
    msg.recipients.push_back(pending);

    for (std::uint64_t const now : {2000u, 3000u}) {
      CHECK(!builder.build_dsn(msg, now));
      CHECK_EQ(msg.recipients[0].flags, NOTIFY_FAILURE);
      CHECK_EQ(msg.recipients[1].flags, NOTIFY_DELAY);
      CHECK_EQ(msg.recipients[1].notify.due, 1500u);
      CHECK_EQ(msg.recipients[1].notify.inner, 0u);
    }
  }

  // Nowhere to send a report.
  {
    Message msg;
    msg.queue_id = 2;
    msg.created  = 1000;
    msg.recipients.push_back(rcpt("a@example.org", NOTIFY_FAILURE,
                                  PermanentFailure<ErrorDetails>{rejected()}));
    auto pending = rcpt("c@example.net", NOTIFY_DELAY,
                        TemporaryFailure<ErrorDetails>{refused()});
    pending.notify = Schedule{0, 1500};
    msg.recipients.push_back(pending);
    auto capped    = rcpt("d@example.net", NOTIFY_DELAY,
                          TemporaryFailure<ErrorDetails>{refused()});
    capped.expires = Attempts{5};
    capped.notify  = Schedule{0, 1500};
    msg.recipients.push_back(capped);

    CHECK_EQ(DsnBuilder::handle_double_bounce(msg, 2000), 1u);
    CHECK(msg.recipients[0].flags & RCPT_DSN_SENT);
    CHECK_EQ(msg.recipients[1].notify.due, 1000u + 432000u + 10u);
    CHECK_EQ(msg.recipients[2].notify.due, never);

    CHECK_EQ(DsnBuilder::handle_double_bounce(msg, 3000), 0u);
    CHECK_EQ(msg.recipients[1].notify.due, 1000u + 432000u + 10u);
  }
}
