#include "Pill.hpp"

std::mt19937_64& Pill::rng_()
{
  thread_local std::mt19937_64 rng{[] {
    std::random_device rd;
    std::seed_seq      seq{rd(), rd(), rd(), rd()};
    return std::mt19937_64{seq};
  }()};
  return rng;
}

Pill::Pill()
{
  std::uniform_int_distribution<decltype(s_)> uni_dist;
  s_ = uni_dist(rng_());

  // <http://philzimmermann.com/docs/human-oriented-base-32-encoding.txt>

  constexpr char b32_charset[]{"ybndrfg8ejkmcpqxot1uwisza345h769"};

  auto x{s_};
  for (auto resp{b32_ndigits_}; resp > 0; --resp) {
    b32_str_[resp - 1] = b32_charset[x % 32];
    x /= 32;
  }
  b32_str_[b32_ndigits_] = '\0';
}
