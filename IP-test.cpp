#include "IP.hpp"

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  CHECK(IP::is_v4("127.0.0.1"));
  CHECK(IP::is_v4("10.0.0.255"));
  CHECK(IP::is_v4("192.168.1.2"));
  CHECK(!IP::is_v4("256.0.0.1"));
  CHECK(!IP::is_v4("1.2.3"));
  CHECK(!IP::is_v4("1.2.3.4.5"));
  CHECK(!IP::is_v4("::1"));

  CHECK(IP::is_v6("::1"));
  CHECK(IP::is_v6("::"));
  CHECK(IP::is_v6("2001:db8::1"));
  CHECK(IP::is_v6("fe80::1:2:3:4"));
  CHECK(IP::is_v6("::ffff:192.0.2.1"));
  CHECK(!IP::is_v6("2001:db8::g"));
  CHECK(!IP::is_v6("127.0.0.1"));

  CHECK(IP::is_address("a:b::c"));
  CHECK(IP::is_address("8.8.8.8"));
  CHECK(!IP::is_address("mx.example.com"));
  CHECK(!IP::is_address(""));
}
