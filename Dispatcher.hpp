#ifndef DISPATCHER_DOT_HPP
#define DISPATCHER_DOT_HPP

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <unordered_map>

#include <boost/asio/thread_pool.hpp>

#include "QueueName.hpp"
#include "Strategy.hpp"

namespace Queue {

// One worker pool per virtual queue, so a stall on one queue can't hold
// up another. Jobs for an unknown queue go to "default".
class Dispatcher {
public:
  Dispatcher(Dispatcher const&) = delete;
  Dispatcher& operator=(Dispatcher const&) = delete;

  explicit Dispatcher(
      std::unordered_map<QueueName, VirtualQueue> const& queues);
  ~Dispatcher();

  // Returns the queue the job was placed on.
  QueueName dispatch(QueueName const& name, std::function<void()> job);

  std::size_t threads(QueueName const& name) const;

  // Jobs placed on a queue that haven't finished.
  std::size_t pending(QueueName const& name) const;

  // Waits for every queued job to finish; no more can be dispatched.
  void join();

private:
  struct pool {
    explicit pool(std::size_t n)
      : threads(n)
      , workers(n)
    {
    }

    std::size_t                threads;
    boost::asio::thread_pool   workers;
    std::atomic<std::size_t>   pending{0};
  };

  pool&       pool_for_(QueueName const& name);
  pool const* find_(QueueName const& name) const;

  std::unordered_map<QueueName, std::unique_ptr<pool>> pools_;
};

} // namespace Queue

#endif // DISPATCHER_DOT_HPP
