#ifndef STATUS_DOT_HPP
#define STATUS_DOT_HPP

#include <utility>
#include <variant>

namespace Queue {

// Outcome of delivery to one recipient, T is the success payload, E the
// failure details.

struct Scheduled {
};

template <typename T>
struct Completed {
  T value;
};

template <typename E>
struct TemporaryFailure {
  E error;
};

template <typename E>
struct PermanentFailure {
  E error;
};

template <typename T, typename E>
using Status = std::
    variant<Scheduled, Completed<T>, TemporaryFailure<E>, PermanentFailure<E>>;

template <typename T, typename E>
Status<T, E> into_permanent(Status<T, E> status)
{
  if (auto tmp = std::get_if<TemporaryFailure<E>>(&status))
    return PermanentFailure<E>{std::move(tmp->error)};
  return status;
}

template <typename T, typename E>
Status<T, E> into_temporary(Status<T, E> status)
{
  if (auto perm = std::get_if<PermanentFailure<E>>(&status))
    return TemporaryFailure<E>{std::move(perm->error)};
  return status;
}

template <typename T, typename E>
bool is_final(Status<T, E> const& status)
{
  return std::holds_alternative<Completed<T>>(status)
         || std::holds_alternative<PermanentFailure<E>>(status);
}

// Build a visitor from lambdas.
template <typename... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace Queue

#endif // STATUS_DOT_HPP
