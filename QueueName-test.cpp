#include "QueueName.hpp"

#include <set>
#include <sstream>
#include <unordered_map>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  QueueName dflt;
  CHECK_EQ(dflt.as_str(), "default");
  CHECK(dflt.is_default());
  CHECK_EQ(dflt, QueueName::default_queue());

  for (auto name : {"a", "fast", "remote", "12345678"}) {
    QueueName q{name};
    CHECK_EQ(q.as_str(), name);
    CHECK(!q.is_default());
    CHECK_EQ(q, *QueueName::parse(name));
  }

  CHECK(!QueueName::parse(""));
  CHECK(!QueueName::parse("123456789"));

  bool threw = false;
  try {
    QueueName too_long{"overlong1"};
  }
  catch (std::invalid_argument const& e) {
    threw = true;
  }
  CHECK(threw);

  threw = false;
  try {
    QueueName empty{""};
  }
  catch (std::invalid_argument const& e) {
    threw = true;
  }
  CHECK(threw);

  CHECK_NE(QueueName("fast"), QueueName("fast2"));
  CHECK_LT(QueueName("aaa"), QueueName("bbb"));

  std::unordered_map<QueueName, int> counts;
  counts[QueueName("fast")] += 1;
  counts[QueueName("fast")] += 1;
  counts[QueueName("slow")] += 1;
  CHECK_EQ(counts.size(), 2u);
  CHECK_EQ(counts[QueueName("fast")], 2);

  std::ostringstream os;
  os << QueueName("slow");
  CHECK_EQ(os.str(), "slow");
}
