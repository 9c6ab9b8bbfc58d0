#ifndef QUEUESTORE_DOT_HPP
#define QUEUESTORE_DOT_HPP

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

#include "Message.hpp"

namespace Queue {

// Where queued messages live between delivery attempts.
class QueueStore {
public:
  virtual ~QueueStore() = default;

  virtual std::uint64_t assign_id() = 0;

  // Replaces any stored copy with the same queue_id.
  virtual void write(Message const& message) = 0;
  virtual void remove(std::uint64_t queue_id) = 0;

  virtual std::optional<Message> read(std::uint64_t queue_id) const = 0;

  // Ids of every stored message, in ascending order.
  virtual std::vector<std::uint64_t> queued() const = 0;
};

class MemoryQueueStore : public QueueStore {
public:
  std::uint64_t assign_id() override { return ++last_id_; }

  void write(Message const& message) override;
  void remove(std::uint64_t queue_id) override;

  std::optional<Message>     read(std::uint64_t queue_id) const override;
  std::vector<std::uint64_t> queued() const override;

private:
  std::atomic<std::uint64_t> last_id_{0};

  mutable std::mutex                mtx_;
  std::map<std::uint64_t, Message> messages_;
};

} // namespace Queue

#endif // QUEUESTORE_DOT_HPP
