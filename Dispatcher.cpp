#include "Dispatcher.hpp"

#include <exception>

#include <boost/asio/post.hpp>

#include <glog/logging.h>

namespace Queue {

Dispatcher::Dispatcher(std::unordered_map<QueueName, VirtualQueue> const& queues)
{
  for (auto const& [name, vq] : queues) {
    auto const n = vq.threads ? vq.threads : 1;
    pools_.emplace(name, std::make_unique<pool>(n));
    LOG(INFO) << "virtual queue " << name << " with " << n << " thread"
              << (n == 1 ? "" : "s");
  }
  if (!pools_.count(QueueName::default_queue()))
    pools_.emplace(QueueName::default_queue(), std::make_unique<pool>(1));
}

Dispatcher::~Dispatcher() { join(); }

Dispatcher::pool const* Dispatcher::find_(QueueName const& name) const
{
  auto const it = pools_.find(name);
  return it == pools_.end() ? nullptr : it->second.get();
}

Dispatcher::pool& Dispatcher::pool_for_(QueueName const& name)
{
  auto it = pools_.find(name);
  if (it == pools_.end()) {
    LOG(WARNING) << "no virtual queue " << name << ", using default";
    it = pools_.find(QueueName::default_queue());
  }
  return *it->second;
}

QueueName Dispatcher::dispatch(QueueName const& name, std::function<void()> job)
{
  auto& p = pool_for_(name);
  auto const used = pools_.count(name) ? name : QueueName::default_queue();

  ++p.pending;
  boost::asio::post(p.workers, [&p, used, job = std::move(job)]() {
    try {
      job();
    }
    catch (std::exception const& e) {
      LOG(ERROR) << "queue " << used << " job failed: " << e.what();
    }
    --p.pending;
  });
  return used;
}

std::size_t Dispatcher::threads(QueueName const& name) const
{
  auto const p = find_(name);
  return p ? p->threads : 0;
}

std::size_t Dispatcher::pending(QueueName const& name) const
{
  auto const p = find_(name);
  return p ? p->pending.load() : 0;
}

void Dispatcher::join()
{
  for (auto& [name, p] : pools_)
    p->workers.join();
}

} // namespace Queue
