#include "Throttle.hpp"

#include "Config.hpp"
#include "Hash.hpp"

#include <glog/logging.h>

#include <fmt/format.h>

namespace Queue {

namespace {
struct key_name {
  std::string_view name;
  std::uint16_t    key;
  Expr::Variable   var;
};

constexpr key_name key_names[]{
    {"rcpt", THROTTLE_RCPT, Expr::Variable::rcpt},
    {"rcpt_domain", THROTTLE_RCPT_DOMAIN, Expr::Variable::rcpt_domain},
    {"sender", THROTTLE_SENDER, Expr::Variable::sender},
    {"sender_domain", THROTTLE_SENDER_DOMAIN, Expr::Variable::sender_domain},
    {"authenticated_as", THROTTLE_AUTH_AS, Expr::Variable::authenticated_as},
    {"listener", THROTTLE_LISTENER, Expr::Variable::listener},
    {"mx", THROTTLE_MX, Expr::Variable::mx},
    {"remote_ip", THROTTLE_REMOTE_IP, Expr::Variable::remote_ip},
    {"local_ip", THROTTLE_LOCAL_IP, Expr::Variable::local_ip},
    {"helo_domain", THROTTLE_HELO_DOMAIN, Expr::Variable::helo_domain},
};

bool uses(Expr::Expression const& expr, std::initializer_list<Expr::Variable> vars)
{
  for (auto var : vars) {
    if (expr.variables() & Expr::bit(var))
      return true;
  }
  return false;
}

// Parses the key list, available is what the context can supply.
std::uint16_t
parse_keys(Config& config, std::string const& prefix, std::uint16_t available)
{
  std::uint16_t keys = 0;
  auto const    key  = fmt::format("{}.key", prefix);
  for (auto const v : config.values(key)) {
    auto const name = unquote(v);
    auto const k    = throttle_key(name);
    if (!k) {
      config.new_parse_error(key, fmt::format("unknown key \"{}\"", name));
    }
    else if ((*k & available) == 0) {
      config.new_build_error(
          key, fmt::format("key \"{}\" is not available in this context", name));
    }
    else {
      keys |= *k;
    }
  }
  return keys;
}

std::optional<Expr::Expression>
parse_match(Config& config, std::string const& prefix, std::uint32_t vars)
{
  auto const key = fmt::format("{}.match", prefix);
  auto const txt = config.value(key);
  if (!txt)
    return Expr::Expression{};
  std::string msg;
  auto        expr = Expr::Expression::parse(unquote(*txt), vars, msg);
  if (!expr)
    config.new_parse_error(key, msg);
  return expr;
}

std::vector<RateLimiter> parse_rate_limiters(Config&          config,
                                             std::string_view prefix,
                                             std::uint32_t    vars,
                                             std::uint16_t    available)
{
  std::vector<RateLimiter> limiters;
  for (auto const& id : config.sub_keys(prefix)) {
    auto const pfx = fmt::format("{}.{}", prefix, id);

    if (!config.property<bool>(fmt::format("{}.enable", pfx)).value_or(true))
      continue;

    RateLimiter limiter;
    limiter.id   = id;
    limiter.keys = parse_keys(config, pfx, available);

    auto expr = parse_match(config, pfx, vars);
    if (!expr)
      continue;
    limiter.expr = std::move(*expr);

    limiter.rate = config.property<Rate>(fmt::format("{}.rate", pfx));
    limiter.concurrency
        = config.property<std::uint64_t>(fmt::format("{}.concurrency", pfx));

    if (!limiter.rate && !limiter.concurrency) {
      config.new_parse_error(pfx, "needs a \"rate\" and/or \"concurrency\"");
      continue;
    }
    limiters.push_back(std::move(limiter));
  }
  return limiters;
}

void hash_dimensions(Hash&                 h,
                     std::string_view      id,
                     std::uint16_t         keys,
                     Expr::Resolver const& env)
{
  h.update(id);
  h.separator();
  for (auto const& kn : key_names) {
    if ((keys & kn.key) == 0)
      continue;
    auto val = Expr::to_string(env.resolve(kn.var));
    if (val.empty()
        && (kn.key == THROTTLE_SENDER || kn.key == THROTTLE_SENDER_DOMAIN))
      val = "<>";
    h.update(val);
    h.separator();
  }
}
} // namespace

std::optional<std::uint16_t> throttle_key(std::string_view name)
{
  for (auto const& kn : key_names) {
    if (kn.name == name)
      return kn.key;
  }
  return {};
}

bool parse_value(std::string_view value, Rate& out, std::string& msg)
{
  value          = unquote(value);
  auto const pos  = value.find('/');
  if (pos == std::string_view::npos) {
    msg = "expected <requests>/<period>";
    return false;
  }

  std::uint64_t requests{};
  if (!::parse_value(value.substr(0, pos), requests, msg))
    return false;

  std::chrono::milliseconds period{};
  if (!::parse_value(value.substr(pos + 1), period, msg))
    return false;

  auto const secs = std::chrono::duration_cast<std::chrono::seconds>(period);
  if (requests == 0 || secs.count() == 0) {
    msg = "requests and period must be positive";
    return false;
  }
  out = Rate{requests, secs};
  return true;
}

RateLimiters parse_inbound_rate_limiters(Config& config)
{
  RateLimiters limiters;

  auto all = parse_rate_limiters(
      config, "queue.limiter.inbound", Expr::Context::rcpt_to,
      THROTTLE_LISTENER | THROTTLE_REMOTE_IP | THROTTLE_LOCAL_IP
          | THROTTLE_AUTH_AS | THROTTLE_HELO_DOMAIN | THROTTLE_RCPT
          | THROTTLE_RCPT_DOMAIN | THROTTLE_SENDER | THROTTLE_SENDER_DOMAIN);

  using V = Expr::Variable;
  for (auto& t : all) {
    if ((t.keys & (THROTTLE_RCPT | THROTTLE_RCPT_DOMAIN))
        || uses(t.expr, {V::rcpt, V::rcpt_domain})) {
      limiters.rcpt.push_back(std::move(t));
    }
    else if ((t.keys
              & (THROTTLE_SENDER | THROTTLE_SENDER_DOMAIN
                 | THROTTLE_HELO_DOMAIN | THROTTLE_AUTH_AS))
             || uses(t.expr, {V::sender, V::sender_domain, V::helo_domain,
                              V::authenticated_as})) {
      limiters.sender.push_back(std::move(t));
    }
    else {
      limiters.remote.push_back(std::move(t));
    }
  }
  return limiters;
}

RateLimiters parse_outbound_rate_limiters(Config& config)
{
  RateLimiters limiters;

  auto all = parse_rate_limiters(
      config, "queue.limiter.outbound", Expr::Context::host,
      THROTTLE_RCPT_DOMAIN | THROTTLE_SENDER | THROTTLE_SENDER_DOMAIN
          | THROTTLE_MX | THROTTLE_REMOTE_IP | THROTTLE_LOCAL_IP);

  using V = Expr::Variable;
  for (auto& t : all) {
    if ((t.keys & (THROTTLE_MX | THROTTLE_REMOTE_IP | THROTTLE_LOCAL_IP))
        || uses(t.expr, {V::mx, V::remote_ip, V::local_ip})) {
      limiters.remote.push_back(std::move(t));
    }
    else if ((t.keys & THROTTLE_RCPT_DOMAIN)
             || uses(t.expr, {V::rcpt_domain})) {
      limiters.rcpt.push_back(std::move(t));
    }
    else {
      limiters.sender.push_back(std::move(t));
    }
  }
  return limiters;
}

QueueQuotas parse_queue_quotas(Config& config)
{
  QueueQuotas quotas;

  for (auto const& id : config.sub_keys("queue.quota")) {
    auto const pfx = fmt::format("queue.quota.{}", id);

    if (!config.property<bool>(fmt::format("{}.enable", pfx)).value_or(true))
      continue;

    QueueQuota quota;
    quota.id   = id;
    quota.keys = parse_keys(config, pfx,
                            THROTTLE_RCPT | THROTTLE_RCPT_DOMAIN
                                | THROTTLE_SENDER | THROTTLE_SENDER_DOMAIN);

    auto expr = parse_match(config, pfx, Expr::Context::quota);
    if (!expr)
      continue;
    quota.expr = std::move(*expr);

    auto const size
        = config.property<std::uint64_t>(fmt::format("{}.size", pfx));
    if (size && *size > 0)
      quota.size = size;
    auto const messages
        = config.property<std::uint64_t>(fmt::format("{}.messages", pfx));
    if (messages && *messages > 0)
      quota.messages = messages;

    if (!quota.size && !quota.messages) {
      config.new_parse_error(
          pfx, "a quota needs a positive \"size\" and/or \"messages\"");
      continue;
    }

    using V = Expr::Variable;
    if ((quota.keys & THROTTLE_RCPT) || uses(quota.expr, {V::rcpt})) {
      quotas.rcpt.push_back(std::move(quota));
    }
    else if ((quota.keys & THROTTLE_RCPT_DOMAIN)
             || uses(quota.expr, {V::rcpt_domain})) {
      quotas.rcpt_domain.push_back(std::move(quota));
    }
    else {
      quotas.sender.push_back(std::move(quota));
    }
  }
  return quotas;
}

std::string new_key(RateLimiter const& limiter, Expr::Resolver const& env)
{
  Hash h;
  hash_dimensions(h, limiter.id, limiter.keys, env);
  if (limiter.rate) {
    h.update(limiter.rate->requests);
    h.update(static_cast<std::uint64_t>(limiter.rate->period.count()));
  }
  if (limiter.concurrency)
    h.update(*limiter.concurrency);
  return h.final();
}

std::string new_key(QueueQuota const& quota, Expr::Resolver const& env)
{
  Hash h;
  hash_dimensions(h, quota.id, quota.keys, env);
  h.update(quota.size.value_or(0));
  h.update(quota.messages.value_or(0));
  return h.final();
}

} // namespace Queue
