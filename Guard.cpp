#include "Guard.hpp"

#include "Envelope.hpp"
#include "LocalDomains.hpp"

#include <algorithm>
#include <set>

#include <glog/logging.h>

namespace Queue {

InFlight::InFlight(std::shared_ptr<ConcurrencyLimiter> limiter)
  : limiter_(std::move(limiter))
{
}

InFlight::~InFlight()
{
  if (limiter_)
    limiter_->in_flight_.fetch_sub(1);
}

InFlight::InFlight(InFlight&& other) noexcept
  : limiter_(std::move(other.limiter_))
{
}

InFlight& InFlight::operator=(InFlight&& other) noexcept
{
  if (this != &other) {
    if (limiter_)
      limiter_->in_flight_.fetch_sub(1);
    limiter_ = std::move(other.limiter_);
  }
  return *this;
}

std::optional<InFlight> ConcurrencyLimiter::try_acquire()
{
  auto cur = in_flight_.load();
  do {
    if (cur >= max_)
      return {};
  } while (!in_flight_.compare_exchange_weak(cur, cur + 1));
  return InFlight(shared_from_this());
}

Guard::Guard(CounterStore& counters, LocalDomains const* domains)
  : counters_(counters)
  , domains_(domains)
{
}

Admission Guard::check(std::vector<RateLimiter> const& limiters,
                       Expr::Resolver const&           env,
                       std::uint64_t                   now,
                       std::vector<InFlight>&          in_flight)
{
  for (auto const& limiter : limiters) {
    if (!limiter.expr.empty()
        && !Expr::to_bool(limiter.expr.eval(env, domains_)))
      continue;

    auto const key = new_key(limiter, env);

    if (limiter.concurrency) {
      std::shared_ptr<ConcurrencyLimiter> cl;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        auto& slot = concurrency_[key];
        if (!slot)
          slot = std::make_shared<ConcurrencyLimiter>(*limiter.concurrency);
        cl = slot;
      }
      auto slot = cl->try_acquire();
      if (!slot) {
        LOG(INFO) << "limiter " << limiter.id << ": concurrency limit of "
                  << *limiter.concurrency << " reached";
        return Deferred{now, ConcurrencyLimited{}};
      }
      in_flight.push_back(std::move(*slot));
    }

    if (limiter.rate) {
      if (auto const retry_at = counters_.rate_limit(key, *limiter.rate, now)) {
        LOG(INFO) << "limiter " << limiter.id << ": rate of "
                  << limiter.rate->requests << " per "
                  << limiter.rate->period.count() << "s exceeded, retry at "
                  << *retry_at;
        return Deferred{*retry_at, RateLimited{}};
      }
    }
  }
  return Admit{};
}

Admission Guard::check(RateLimiters const&    limiters,
                       Expr::Resolver const&  env,
                       std::uint64_t          now,
                       std::vector<InFlight>& in_flight)
{
  for (auto bucket : {&limiters.sender, &limiters.rcpt, &limiters.remote}) {
    auto result = check(*bucket, env, now, in_flight);
    if (!std::holds_alternative<Admit>(result))
      return result;
  }
  return Admit{};
}

bool Guard::has_quota(QueueQuotas const& quotas, Message& message)
{
  std::vector<QuotaKey> charged;

  auto rollback = [&] {
    for (auto const& qk : charged)
      counters_.add(qk.key, -static_cast<std::int64_t>(qk.amount));
  };

  // Returns false when the quota would be exceeded.
  auto charge = [&](QueueQuota const& quota, Expr::Resolver const& env,
                    std::uint64_t id) {
    if (!quota.expr.empty() && !Expr::to_bool(quota.expr.eval(env, domains_)))
      return true;

    auto const key = new_key(quota, env);

    if (quota.size) {
      auto const size_key = "s:" + key;
      if (!counters_.try_add(size_key, static_cast<std::int64_t>(message.size),
                             static_cast<std::int64_t>(*quota.size))) {
        LOG(INFO) << "quota " << quota.id << ": message of " << message.size
                  << " bytes exceeds the size limit of " << *quota.size;
        return false;
      }
      charged.push_back(
          QuotaKey{QuotaKey::kind::size, size_key, id, message.size});
    }
    if (quota.messages) {
      auto const count_key = "c:" + key;
      if (!counters_.try_add(count_key, 1,
                             static_cast<std::int64_t>(*quota.messages))) {
        LOG(INFO) << "quota " << quota.id << ": limit of " << *quota.messages
                  << " messages reached";
        return false;
      }
      charged.push_back(QuotaKey{QuotaKey::kind::count, count_key, id, 1});
    }
    return true;
  };

  QueueEnvelope const sender_env(message);
  for (auto const& quota : quotas.sender) {
    if (!charge(quota, sender_env, 0)) {
      rollback();
      return false;
    }
  }

  if (!quotas.rcpt_domain.empty()) {
    std::set<std::string_view> seen;
    for (std::size_t idx = 0; idx < message.recipients.size(); ++idx) {
      auto const& rcpt = message.recipients[idx];
      if (!seen.insert(domain_of(rcpt.address_lcase)).second)
        continue;
      QueueEnvelope const env(message, rcpt);
      for (auto const& quota : quotas.rcpt_domain) {
        if (!charge(quota, env, (idx + 1) << 32)) {
          rollback();
          return false;
        }
      }
    }
  }

  for (std::size_t idx = 0; idx < message.recipients.size(); ++idx) {
    QueueEnvelope const env(message, message.recipients[idx]);
    for (auto const& quota : quotas.rcpt) {
      if (!charge(quota, env, idx + 1)) {
        rollback();
        return false;
      }
    }
  }

  message.quota_keys.insert(message.quota_keys.end(),
                            std::make_move_iterator(charged.begin()),
                            std::make_move_iterator(charged.end()));
  return true;
}

void Guard::release_quota(Message& message)
{
  if (message.quota_keys.empty())
    return;

  auto const& rcpts = message.recipients;

  auto all_final = [&](std::string_view domain) {
    return std::all_of(rcpts.begin(), rcpts.end(), [&](Recipient const& r) {
      return (!domain.empty() && domain_of(r.address_lcase) != domain)
             || is_final(r.status);
    });
  };

  auto releasable = [&](QuotaKey const& qk) {
    if (qk.id == 0)
      return all_final({});
    auto const rcpt_idx = qk.id & 0xFFFFFFFF;
    if (rcpt_idx != 0) {
      return rcpt_idx <= rcpts.size() && is_final(rcpts[rcpt_idx - 1].status);
    }
    auto const dom_idx = qk.id >> 32;
    return dom_idx <= rcpts.size()
           && all_final(domain_of(rcpts[dom_idx - 1].address_lcase));
  };

  auto it = std::remove_if(
      message.quota_keys.begin(), message.quota_keys.end(),
      [&](QuotaKey const& qk) {
        if (!releasable(qk))
          return false;
        counters_.add(qk.key, -static_cast<std::int64_t>(qk.amount));
        return true;
      });
  message.quota_keys.erase(it, message.quota_keys.end());
}

void Guard::cleanup()
{
  std::lock_guard<std::mutex> lock(mtx_);
  for (auto it = concurrency_.begin(); it != concurrency_.end();) {
    if (it->second->is_active())
      ++it;
    else
      it = concurrency_.erase(it);
  }
}

} // namespace Queue
