#include "Expression.hpp"

#include "Config.hpp"
#include "LocalDomains.hpp"

#include <algorithm>
#include <charconv>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include <glog/logging.h>

#include <fmt/format.h>

#include <tao/pegtl.hpp>

namespace Expr {

namespace {
// In the order of enum class Variable.
constexpr std::string_view variable_names[]{
    "rcpt",       "rcpt_domain",      "sender",     "sender_domain",
    "mx",         "remote_ip",        "local_ip",   "helo_domain",
    "authenticated_as",               "listener",   "retry_num",
    "notify_num", "last_error",       "last_status", "queue_name",
    "source",     "size",             "env_id",
};

struct function_info {
  std::string_view name;
  Function         fn;
  std::size_t      argc;
};

constexpr function_info functions[]{
    {"is_local_domain", Function::is_local_domain, 1},
    {"starts_with", Function::starts_with, 2},
    {"ends_with", Function::ends_with, 2},
    {"contains", Function::contains, 2},
    {"lowercase", Function::lowercase, 1},
};

bool as_int(Value const& value, std::int64_t& out)
{
  if (auto b = std::get_if<bool>(&value)) {
    out = *b ? 1 : 0;
    return true;
  }
  if (auto i = std::get_if<std::int64_t>(&value)) {
    out = *i;
    return true;
  }
  auto const& s = std::get<std::string>(value);
  if (s.empty())
    return false;
  auto const [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc{} && ptr == s.data() + s.size();
}

// Negative, zero or positive, as a is less than, equal to or greater
// than b. Numbers compare as numbers unless both sides are strings.
int compare(Value const& a, Value const& b)
{
  auto const both_strings = std::holds_alternative<std::string>(a)
                            && std::holds_alternative<std::string>(b);
  std::int64_t ia{}, ib{};
  if (!both_strings && as_int(a, ia) && as_int(b, ib))
    return ia < ib ? -1 : (ia > ib ? 1 : 0);
  return to_string(a).compare(to_string(b));
}
} // namespace

std::optional<Variable> variable_named(std::string_view name)
{
  for (std::size_t i = 0; i < std::size(variable_names); ++i) {
    if (variable_names[i] == name)
      return static_cast<Variable>(i);
  }
  return {};
}

std::string_view name_of(Variable var)
{
  return variable_names[static_cast<std::size_t>(var)];
}

bool to_bool(Value const& value)
{
  if (auto b = std::get_if<bool>(&value))
    return *b;
  if (auto i = std::get_if<std::int64_t>(&value))
    return *i != 0;
  return !std::get<std::string>(value).empty();
}

std::string to_string(Value const& value)
{
  if (auto b = std::get_if<bool>(&value))
    return *b ? "true" : "false";
  if (auto i = std::get_if<std::int64_t>(&value))
    return fmt::format("{}", *i);
  return std::get<std::string>(value);
}

// Collects the postfix program while the grammar matches.
struct Builder {
  Expression&   expr;
  std::uint32_t allowed;
  std::string   error;

  std::vector<Op>                              ops;
  std::vector<std::pair<Function, std::size_t>> calls;

  void emit(Token tok) { expr.program_.push_back(std::move(tok)); }

  void fail(std::string msg)
  {
    if (error.empty())
      error = std::move(msg);
  }
};

namespace Grammar {

using namespace tao::pegtl;

struct ws : star<space> {};

struct expr;

struct name : seq<ranges<'a', 'z', 'A', 'Z', '_'>,
                  star<ranges<'a', 'z', 'A', 'Z', '0', '9', '_'>>> {};

struct sq_string : seq<one<'\''>, star<not_one<'\''>>, one<'\''>> {};
struct dq_string : seq<one<'"'>, star<not_one<'"'>>, one<'"'>> {};
struct string_lit : sor<sq_string, dq_string> {};

struct integer : seq<opt<one<'-'>>, plus<digit>> {};

struct call_head : seq<name, ws, one<'('>> {};
struct arg : seq<ws, expr, ws> {};
struct call : seq<call_head, ws, opt<list<arg, one<','>>>, ws, one<')'>> {};

struct variable : name {};

struct paren : seq<one<'('>, ws, expr, ws, one<')'>> {};

struct primary : sor<string_lit, integer, call, variable, paren> {};

struct unary;
struct negation : seq<one<'!'>, not_at<one<'='>>, ws, unary> {};
struct unary : sor<negation, primary> {};

struct add_tail : seq<ws, one<'+'>, ws, unary> {};
struct add_expr : seq<unary, star<add_tail>> {};

// clang-format off
struct cmp_op : sor<string<'=', '='>,
                    string<'!', '='>,
                    string<'<', '='>,
                    string<'>', '='>,
                    one<'<'>,
                    one<'>'>> {};
// clang-format on

struct cmp_tail : seq<ws, cmp_op, ws, add_expr> {};
struct cmp_expr : seq<add_expr, opt<cmp_tail>> {};

struct and_tail : seq<ws, string<'&', '&'>, ws, cmp_expr> {};
struct and_expr : seq<cmp_expr, star<and_tail>> {};

struct or_tail : seq<ws, string<'|', '|'>, ws, and_expr> {};
struct expr : seq<and_expr, star<or_tail>> {};

struct grammar : seq<ws, expr, ws, eof> {};

template <typename Rule>
struct action : nothing<Rule> {};

template <>
struct action<string_lit> {
  template <typename Input>
  static void apply(Input const& in, Builder& b)
  {
    auto const s = in.string();
    b.emit(Value{s.substr(1, s.length() - 2)});
  }
};

template <>
struct action<integer> {
  template <typename Input>
  static void apply(Input const& in, Builder& b)
  {
    auto const   s = in.string();
    std::int64_t n{};
    auto const [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), n);
    if (ec != std::errc{}) {
      b.fail(fmt::format("integer {} out of range", s));
    }
    b.emit(Value{n});
  }
};

template <>
struct action<variable> {
  template <typename Input>
  static void apply(Input const& in, Builder& b)
  {
    auto const s = in.string();
    if (s == "true" || s == "false") {
      b.emit(Value{s == "true"});
      return;
    }
    auto const var = variable_named(s);
    if (!var) {
      b.fail(fmt::format("unknown variable \"{}\"", s));
      b.emit(Value{std::string{}});
      return;
    }
    if ((b.allowed & bit(*var)) == 0) {
      b.fail(fmt::format("variable \"{}\" is not available here", s));
    }
    b.expr.variables_ |= bit(*var);
    b.emit(*var);
  }
};

template <>
struct action<call_head> {
  template <typename Input>
  static void apply(Input const& in, Builder& b)
  {
    auto       s   = in.string();
    auto const end = s.find_first_not_of(
        "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_");
    s.resize(end);
    auto const fn = std::find_if(std::begin(functions), std::end(functions),
                                 [&](auto const& f) { return f.name == s; });
    if (fn == std::end(functions)) {
      b.fail(fmt::format("unknown function \"{}\"", s));
      b.calls.emplace_back(Function::lowercase, 0);
      return;
    }
    b.calls.emplace_back(fn->fn, 0);
  }
};

template <>
struct action<arg> {
  static void apply0(Builder& b) { ++b.calls.back().second; }
};

template <>
struct action<call> {
  static void apply0(Builder& b)
  {
    auto const [fn, argc] = b.calls.back();
    b.calls.pop_back();
    auto const info = std::find_if(std::begin(functions), std::end(functions),
                                   [&](auto const& f) { return f.fn == fn; });
    if (info->argc != argc) {
      b.fail(fmt::format("{}() takes {} argument{}", info->name, info->argc,
                         info->argc == 1 ? "" : "s"));
    }
    b.emit(Call{fn, argc});
  }
};

template <>
struct action<negation> {
  static void apply0(Builder& b) { b.emit(Op::op_not); }
};

template <>
struct action<add_tail> {
  static void apply0(Builder& b) { b.emit(Op::op_add); }
};

template <>
struct action<cmp_op> {
  template <typename Input>
  static void apply(Input const& in, Builder& b)
  {
    auto const s = in.string();
    if (s == "==")
      b.ops.push_back(Op::op_eq);
    else if (s == "!=")
      b.ops.push_back(Op::op_ne);
    else if (s == "<=")
      b.ops.push_back(Op::op_le);
    else if (s == ">=")
      b.ops.push_back(Op::op_ge);
    else if (s == "<")
      b.ops.push_back(Op::op_lt);
    else
      b.ops.push_back(Op::op_gt);
  }
};

template <>
struct action<cmp_tail> {
  static void apply0(Builder& b)
  {
    b.emit(b.ops.back());
    b.ops.pop_back();
  }
};

template <>
struct action<and_tail> {
  static void apply0(Builder& b) { b.emit(Op::op_and); }
};

template <>
struct action<or_tail> {
  static void apply0(Builder& b) { b.emit(Op::op_or); }
};

} // namespace Grammar

std::optional<Expression>
Expression::parse(std::string_view text, std::uint32_t allowed, std::string& msg)
{
  Expression expr;
  expr.text_ = std::string(text);

  Builder b{expr, allowed, {}, {}, {}};

  tao::pegtl::memory_input<> in{text.data(), text.size(), "expression"};
  if (!tao::pegtl::parse<Grammar::grammar, Grammar::action>(in, b)) {
    msg = fmt::format("syntax error in \"{}\"", text);
    return {};
  }
  if (!b.error.empty()) {
    msg = std::move(b.error);
    return {};
  }
  return expr;
}

Value Expression::eval(Resolver const& vars, LocalDomains const* domains) const
{
  std::vector<Value> stack;

  auto pop = [&stack]() {
    CHECK(!stack.empty()) << "expression stack underflow";
    auto v = std::move(stack.back());
    stack.pop_back();
    return v;
  };

  for (auto const& tok : program_) {
    if (auto lit = std::get_if<Value>(&tok)) {
      stack.push_back(*lit);
    }
    else if (auto var = std::get_if<Variable>(&tok)) {
      stack.push_back(vars.resolve(*var));
    }
    else if (auto op = std::get_if<Op>(&tok)) {
      if (*op == Op::op_not) {
        auto const a = pop();
        stack.push_back(Value{!to_bool(a)});
        continue;
      }
      auto const b = pop();
      auto const a = pop();
      switch (*op) {
      case Op::op_add: {
        std::int64_t ia{}, ib{};
        if (!std::holds_alternative<std::string>(a)
            && !std::holds_alternative<std::string>(b) && as_int(a, ia)
            && as_int(b, ib)) {
          stack.push_back(Value{ia + ib});
        }
        else {
          stack.push_back(Value{to_string(a) + to_string(b)});
        }
        break;
      }
      case Op::op_eq: stack.push_back(Value{compare(a, b) == 0}); break;
      case Op::op_ne: stack.push_back(Value{compare(a, b) != 0}); break;
      case Op::op_lt: stack.push_back(Value{compare(a, b) < 0}); break;
      case Op::op_le: stack.push_back(Value{compare(a, b) <= 0}); break;
      case Op::op_gt: stack.push_back(Value{compare(a, b) > 0}); break;
      case Op::op_ge: stack.push_back(Value{compare(a, b) >= 0}); break;
      case Op::op_and:
        stack.push_back(Value{to_bool(a) && to_bool(b)});
        break;
      case Op::op_or: stack.push_back(Value{to_bool(a) || to_bool(b)}); break;
      case Op::op_not: break;
      }
    }
    else {
      auto const& call = std::get<Call>(tok);
      std::vector<std::string> args(call.argc);
      for (auto i = call.argc; i > 0; --i)
        args[i - 1] = to_string(pop());

      switch (call.fn) {
      case Function::is_local_domain:
        stack.push_back(Value{domains != nullptr && !args[0].empty()
                              && domains->contains(args[0])});
        break;
      case Function::starts_with:
        stack.push_back(Value{boost::algorithm::starts_with(args[0], args[1])});
        break;
      case Function::ends_with:
        stack.push_back(Value{boost::algorithm::ends_with(args[0], args[1])});
        break;
      case Function::contains:
        stack.push_back(Value{boost::algorithm::contains(args[0], args[1])});
        break;
      case Function::lowercase:
        stack.push_back(Value{boost::algorithm::to_lower_copy(args[0])});
        break;
      }
    }
  }

  CHECK_EQ(stack.size(), 1u) << "malformed expression " << text_;
  return stack.back();
}

IfBlock::IfBlock(
    std::string                                                key,
    std::vector<std::pair<std::string_view, std::string_view>> if_then,
    std::string_view                                           dflt,
    std::uint32_t                                              allowed)
  : key_(std::move(key))
{
  auto compile = [&](std::string_view text) {
    std::string msg;
    auto        expr = Expression::parse(text, allowed, msg);
    CHECK(expr) << key_ << ": " << msg;
    return std::move(*expr);
  };
  for (auto const& [cond, then] : if_then)
    if_then_.push_back(IfThen{compile(cond), compile(then)});
  if (!dflt.empty())
    dflt_ = compile(dflt);
}

std::optional<IfBlock>
IfBlock::parse(Config& config, std::string_view key, std::uint32_t allowed)
{
  IfBlock block;
  block.key_ = std::string(key);

  auto compile = [&](std::string const& k, std::string_view text)
      -> std::optional<Expression> {
    std::string msg;
    auto        expr = Expression::parse(text, allowed, msg);
    if (!expr)
      config.new_parse_error(k, msg);
    return expr;
  };

  if (auto const v = config.value(key)) {
    auto expr = compile(block.key_, *v);
    if (!expr)
      return {};
    block.dflt_ = std::move(*expr);
    return block;
  }

  auto ids = config.sub_keys(key);
  if (ids.empty())
    return {};

  // Numeric ids in numeric order, so 10 comes after 9.
  std::stable_sort(ids.begin(), ids.end(), [](auto const& a, auto const& b) {
    if (a.length() != b.length())
      return a.length() < b.length();
    return a < b;
  });

  auto ok = true;
  for (auto const& id : ids) {
    if (id == "else") {
      auto const k   = fmt::format("{}.else", key);
      auto const txt = config.value(k);
      if (!txt) {
        config.new_parse_error(k, "missing value");
        ok = false;
        continue;
      }
      if (auto expr = compile(k, *txt))
        block.dflt_ = std::move(*expr);
      else
        ok = false;
      continue;
    }
    auto const if_key   = fmt::format("{}.{}.if", key, id);
    auto const then_key = fmt::format("{}.{}.then", key, id);
    auto const cond_txt = config.value(if_key);
    auto const then_txt = config.value(then_key);
    if (!cond_txt || !then_txt) {
      config.new_parse_error(fmt::format("{}.{}", key, id),
                             "needs both \"if\" and \"then\"");
      ok = false;
      continue;
    }
    auto cond = compile(if_key, *cond_txt);
    auto then = compile(then_key, *then_txt);
    if (!cond || !then) {
      ok = false;
      continue;
    }
    block.if_then_.push_back(IfThen{std::move(*cond), std::move(*then)});
  }

  if (!ok)
    return {};
  return block;
}

std::optional<Value> IfBlock::eval(Resolver const&     vars,
                                   LocalDomains const* domains) const
{
  for (auto const& branch : if_then_) {
    if (to_bool(branch.cond.eval(vars, domains)))
      return branch.then.eval(vars, domains);
  }
  if (!dflt_.empty())
    return dflt_.eval(vars, domains);
  return {};
}

std::optional<std::string> IfBlock::eval_string(Resolver const&     vars,
                                                LocalDomains const* domains) const
{
  auto const val = eval(vars, domains);
  if (!val)
    return {};
  auto str = to_string(*val);
  if (str.empty())
    return {};
  return str;
}

std::uint32_t IfBlock::variables() const
{
  auto vars = dflt_.variables();
  for (auto const& branch : if_then_)
    vars |= branch.cond.variables() | branch.then.variables();
  return vars;
}

} // namespace Expr
