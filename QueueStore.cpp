#include "QueueStore.hpp"

#include <stdexcept>

#include <fmt/format.h>

namespace Queue {

void MemoryQueueStore::write(Message const& message)
{
  if (message.queue_id == 0)
    throw std::invalid_argument("message has no queue id");

  std::lock_guard<std::mutex> lock(mtx_);
  messages_.insert_or_assign(message.queue_id, message);
}

void MemoryQueueStore::remove(std::uint64_t queue_id)
{
  std::lock_guard<std::mutex> lock(mtx_);
  if (messages_.erase(queue_id) == 0)
    throw std::runtime_error(fmt::format("no queued message {}", queue_id));
}

std::optional<Message> MemoryQueueStore::read(std::uint64_t queue_id) const
{
  std::lock_guard<std::mutex> lock(mtx_);
  auto const                  it = messages_.find(queue_id);
  if (it == messages_.end())
    return {};
  return it->second;
}

std::vector<std::uint64_t> MemoryQueueStore::queued() const
{
  std::vector<std::uint64_t> ids;

  std::lock_guard<std::mutex> lock(mtx_);
  ids.reserve(messages_.size());
  for (auto const& [id, msg] : messages_)
    ids.push_back(id);
  return ids;
}

} // namespace Queue
