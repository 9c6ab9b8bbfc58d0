#ifndef PILL_DOT_HPP
#define PILL_DOT_HPP

#include <climits>
#include <cstddef>
#include <ostream>
#include <random>
#include <string_view>

// A pill is a unit of entropy: 64 random bits spelled in z-base-32.
// Used for MIME boundaries and Message-IDs.

class Pill {
public:
  Pill();

  bool operator==(Pill const& that) const { return this->s_ == that.s_; }
  bool operator!=(Pill const& that) const { return !(*this == that); }

  std::string_view as_string_view() const
  {
    return std::string_view{b32_str_, b32_ndigits_};
  }

private:
  unsigned long long s_;

  auto static constexpr b32_ndigits_ = ((sizeof(s_) * CHAR_BIT) + 4) / 5;
  char b32_str_[b32_ndigits_ + 1];

  friend std::ostream& operator<<(std::ostream& s, Pill const& p)
  {
    return s << p.as_string_view();
  }

  static std::mt19937_64& rng_();
};

#endif // PILL_DOT_HPP
