#ifndef EXPRESSION_DOT_HPP
#define EXPRESSION_DOT_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

class Config;
class LocalDomains;

// Conditional expressions over message attributes, used to pick
// strategy names and to select which limiters and quotas apply.

namespace Expr {

enum class Variable : std::uint8_t {
  rcpt,
  rcpt_domain,
  sender,
  sender_domain,
  mx,
  remote_ip,
  local_ip,
  helo_domain,
  authenticated_as,
  listener,
  retry_num,
  notify_num,
  last_error,
  last_status,
  queue_name,
  source,
  size,
  env_id,
};

constexpr std::uint32_t bit(Variable v)
{
  return std::uint32_t(1) << static_cast<unsigned>(v);
}

// The variables each evaluation context can supply.
namespace Context {
constexpr std::uint32_t sender = bit(Variable::sender)
                                 | bit(Variable::sender_domain)
                                 | bit(Variable::source) | bit(Variable::size)
                                 | bit(Variable::env_id);

constexpr std::uint32_t quota
    = sender | bit(Variable::rcpt) | bit(Variable::rcpt_domain);

constexpr std::uint32_t rcpt
    = quota | bit(Variable::retry_num) | bit(Variable::notify_num)
      | bit(Variable::last_error) | bit(Variable::last_status)
      | bit(Variable::queue_name);

constexpr std::uint32_t host = rcpt | bit(Variable::mx)
                               | bit(Variable::remote_ip)
                               | bit(Variable::local_ip);

constexpr std::uint32_t rcpt_to
    = bit(Variable::listener) | bit(Variable::remote_ip)
      | bit(Variable::local_ip) | bit(Variable::helo_domain)
      | bit(Variable::authenticated_as) | bit(Variable::sender)
      | bit(Variable::sender_domain) | bit(Variable::rcpt)
      | bit(Variable::rcpt_domain);
} // namespace Context

std::optional<Variable> variable_named(std::string_view name);
std::string_view        name_of(Variable var);

using Value = std::variant<bool, std::int64_t, std::string>;

bool        to_bool(Value const& value);
std::string to_string(Value const& value);

// Supplies variable values at evaluation time.
class Resolver {
public:
  virtual ~Resolver() = default;

  virtual Value resolve(Variable var) const = 0;
};

enum class Op : std::uint8_t {
  op_not,
  op_add,
  op_eq,
  op_ne,
  op_lt,
  op_le,
  op_gt,
  op_ge,
  op_and,
  op_or,
};

enum class Function : std::uint8_t {
  is_local_domain,
  starts_with,
  ends_with,
  contains,
  lowercase,
};

struct Call {
  Function    fn;
  std::size_t argc;
};

using Token = std::variant<Value, Variable, Op, Call>;

class Expression {
public:
  Expression() = default;

  // Returns an empty optional and sets msg on a syntax error, or when
  // a variable outside allowed is referenced.
  static std::optional<Expression>
  parse(std::string_view text, std::uint32_t allowed, std::string& msg);

  bool empty() const { return program_.empty(); }

  Value eval(Resolver const& vars, LocalDomains const* domains) const;

  // Bit set of the variables referenced.
  std::uint32_t variables() const { return variables_; }

  std::string const& text() const { return text_; }

private:
  friend struct Builder;

  std::vector<Token> program_; // postfix
  std::uint32_t      variables_{0};
  std::string        text_;
};

struct IfThen {
  Expression cond;
  Expression then;
};

// An ordered chain of conditions, the first one true selects its value,
// else the default. Loaded from either "<key> = <expr>" or
// "<key>.<n>.if", "<key>.<n>.then" and "<key>.else".
class IfBlock {
public:
  IfBlock() = default;

  // Build from expression text, which must parse.
  IfBlock(std::string                                              key,
          std::vector<std::pair<std::string_view, std::string_view>> if_then,
          std::string_view                                         dflt,
          std::uint32_t                                            allowed);

  // Returns nothing when the key isn't configured or doesn't parse.
  static std::optional<IfBlock>
  parse(Config& config, std::string_view key, std::uint32_t allowed);

  bool empty() const { return if_then_.empty() && dflt_.empty(); }

  // Evaluates to nothing if no branch applies and there is no default.
  std::optional<Value> eval(Resolver const& vars,
                            LocalDomains const* domains) const;

  // The result as a string, nothing when empty.
  std::optional<std::string> eval_string(Resolver const&     vars,
                                         LocalDomains const* domains) const;

  std::uint32_t      variables() const;
  std::string const& key() const { return key_; }

private:
  std::string         key_;
  std::vector<IfThen> if_then_;
  Expression          dflt_;
};

} // namespace Expr

#endif // EXPRESSION_DOT_HPP
