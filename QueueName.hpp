#ifndef QUEUENAME_DOT_HPP
#define QUEUENAME_DOT_HPP

#include <algorithm>
#include <array>
#include <compare>
#include <cstring>
#include <functional>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

// The name of a virtual queue: one to eight bytes, stored NUL padded in
// a fixed width array so it can be compared and hashed cheaply. The
// name "default" always exists.

class QueueName {
public:
  static constexpr std::size_t max_length = 8;

  QueueName()
    : QueueName(std::string_view("default"))
  {
  }

  explicit QueueName(std::string_view name)
  {
    if (name.empty() || name.length() > max_length) {
      throw std::invalid_argument("queue name must be one to eight bytes");
    }
    bytes_.fill('\0');
    std::copy(name.begin(), name.end(), bytes_.begin());
  }

  static std::optional<QueueName> parse(std::string_view name)
  {
    if (name.empty() || name.length() > max_length)
      return {};
    return QueueName(name);
  }

  static QueueName default_queue() { return QueueName{}; }

  std::string_view as_str() const
  {
    auto const len = strnlen(bytes_.data(), max_length);
    return std::string_view(bytes_.data(), len);
  }

  bool is_default() const { return as_str() == "default"; }

  bool operator==(QueueName const& rhs) const = default;
  auto operator<=>(QueueName const& rhs) const = default;

  std::array<char, max_length> const& bytes() const { return bytes_; }

private:
  std::array<char, max_length> bytes_;
};

inline std::ostream& operator<<(std::ostream& os, QueueName const& name)
{
  return os << name.as_str();
}

namespace std {
template <>
struct hash<QueueName> {
  std::size_t operator()(QueueName const& k) const
  {
    return hash<std::string_view>()(
        std::string_view(k.bytes().data(), k.bytes().size()));
  }
};
} // namespace std

#endif // QUEUENAME_DOT_HPP
