#include "Dispatcher.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>

#include <glog/logging.h>

using namespace Queue;

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  std::unordered_map<QueueName, VirtualQueue> queues;
  queues[QueueName("fast")] = VirtualQueue{2};
  queues[QueueName("slow")] = VirtualQueue{0};

  Dispatcher dispatcher(queues);

  CHECK_EQ(dispatcher.threads(QueueName("fast")), 2u);
  CHECK_EQ(dispatcher.threads(QueueName("slow")), 1u);
  CHECK_EQ(dispatcher.threads(QueueName::default_queue()), 1u);
  CHECK_EQ(dispatcher.threads(QueueName("nope")), 0u);

  std::atomic<int> ran{0};

  CHECK(dispatcher.dispatch(QueueName("nope"), [&] { ++ran; })
        == QueueName::default_queue());
  CHECK(dispatcher.dispatch(QueueName("slow"), [&] { ++ran; })
        == QueueName("slow"));

  // A failed job is logged, the pool carries on.
  dispatcher.dispatch(QueueName("fast"),
                      [] { throw std::runtime_error("no route to host"); });
  dispatcher.dispatch(QueueName("fast"), [&] { ++ran; });

  // A job waiting on the default queue doesn't hold up the others.
  std::promise<void> released;
  auto               waiting = released.get_future();
  dispatcher.dispatch(QueueName::default_queue(), [&] {
    CHECK(waiting.wait_for(std::chrono::seconds(30))
          == std::future_status::ready);
    ++ran;
  });
  dispatcher.dispatch(QueueName("fast"), [&] {
    ++ran;
    released.set_value();
  });

  // Both fast workers busy at once.
  std::promise<void> first;
  std::promise<void> second;
  auto               first_up  = first.get_future();
  auto               second_up = second.get_future();
  dispatcher.dispatch(QueueName("fast"), [&] {
    first.set_value();
    CHECK(second_up.wait_for(std::chrono::seconds(30))
          == std::future_status::ready);
    ++ran;
  });
  dispatcher.dispatch(QueueName("fast"), [&] {
    second.set_value();
    CHECK(first_up.wait_for(std::chrono::seconds(30))
          == std::future_status::ready);
    ++ran;
  });

  dispatcher.join();

  CHECK_EQ(ran.load(), 7);
  CHECK_EQ(dispatcher.pending(QueueName("fast")), 0u);
  CHECK_EQ(dispatcher.pending(QueueName::default_queue()), 0u);
}
