#include "Config.hpp"

#include <unistd.h>

#include <fstream>
#include <system_error>

#include <glog/logging.h>

using namespace std::chrono_literals;

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  std::string msg;

  std::chrono::milliseconds dur{};
  CHECK(parse_value("90", dur, msg));
  CHECK(dur == 90s);
  CHECK(parse_value("250ms", dur, msg));
  CHECK(dur == 250ms);
  CHECK(parse_value("5m", dur, msg));
  CHECK(dur == 5min);
  CHECK(parse_value("2h", dur, msg));
  CHECK(dur == 2h);
  CHECK(parse_value("'3d'", dur, msg));
  CHECK(dur == 72h);
  CHECK(!parse_value("3w", dur, msg));
  CHECK(!parse_value("", dur, msg));

  bool b{};
  CHECK(parse_value("true", b, msg) && b);
  CHECK(parse_value("Off", b, msg) && !b);
  CHECK(!parse_value("maybe", b, msg));

  std::uint16_t port{};
  CHECK(parse_value("587", port, msg));
  CHECK_EQ(port, 587);
  CHECK(!parse_value("70000", port, msg));
  CHECK(!parse_value("25x", port, msg));

  CHECK_EQ(unquote("'abc'"), "abc");
  CHECK_EQ(unquote("\"abc\""), "abc");
  CHECK_EQ(unquote("'abc\""), "'abc\"");

  Config config;
  config.parse(R"(# queue settings
queue.schedule.remote.retry = 2m, 5m, 10m
queue.schedule.remote.retry = 1h
queue.schedule.remote.notify = 1d
queue.schedule.local.retry = 1m

report.domain = "example.org"
report.domain = example.net
queue.strategy.route = 'a, b'
this line is broken
)",
               "test.conf");

  CHECK(config.contains("queue.schedule.remote.retry"));
  CHECK(!config.contains("queue.schedule.remote"));

  // The last one wins.
  CHECK_EQ(*config.value("report.domain"), "example.net");

  auto const retry = config.values("queue.schedule.remote.retry");
  CHECK_EQ(retry.size(), 4);
  CHECK_EQ(retry[0], "2m");
  CHECK_EQ(retry[3], "1h");

  auto const durs
      = config.properties<std::chrono::milliseconds>("queue.schedule.remote.retry");
  CHECK_EQ(durs.size(), 4);
  CHECK(durs[2] == 10min);

  // No splitting inside quotes.
  CHECK_EQ(config.values("queue.strategy.route").size(), 1);

  auto const ids = config.sub_keys("queue.schedule");
  CHECK_EQ(ids.size(), 2);
  CHECK_EQ(ids[0], "local");
  CHECK_EQ(ids[1], "remote");
  CHECK_EQ(config.sub_keys("queue.schedule", "notify").size(), 1);

  CHECK_EQ(config.errors().size(), 1);
  CHECK_EQ(config.errors()[0].key, "test.conf:10");
  CHECK(config.has_errors());

  CHECK(!config.property<bool>("no.such.key"));
  CHECK(config.property_or_default<std::uint64_t>("no.such.key", "42") == 42);
  CHECK(!config.property_require<std::string>("no.such.key"));
  CHECK_EQ(config.errors().size(), 2);

  config.add("bad.number", "twelve");
  CHECK(!config.property<std::uint64_t>("bad.number"));
  CHECK_EQ(config.errors().size(), 3);

  Config warn;
  warn.new_parse_warning("some.key", "only a warning");
  CHECK(!warn.has_errors());

  // load()
  auto const path = fs::temp_directory_path()
                    / ("config-test-" + std::to_string(getpid()) + ".conf");
  {
    std::ofstream ofs(path);
    ofs << "queue.virtual.fast.threads-per-node = 4\r\n";
  }
  Config loaded;
  loaded.load(path);
  CHECK_EQ(*loaded.property<std::uint64_t>("queue.virtual.fast.threads-per-node"),
           4u);
  CHECK(!loaded.has_errors());
  fs::remove(path);

  auto threw = false;
  try {
    loaded.load(path);
  }
  catch (std::system_error const&) {
    threw = true;
  }
  CHECK(threw);
}
