#ifndef NOW_DOT_HPP
#define NOW_DOT_HPP

#include <cstdint>
#include <ctime>
#include <ostream>

#include <sys/time.h>

#include <glog/logging.h>

// A point in time, in whole seconds since the epoch, together with its
// RFC 5322 date-time rendering in UTC.

class Now {
public:
  Now();
  explicit Now(std::uint64_t sec);

  std::uint64_t sec() const { return sec_; }
  const char*   string() const { return c_str_; }

  static std::uint64_t seconds();

private:
  void format_();

  std::uint64_t sec_;
  char          c_str_[32]; // RFC 5322 date-time section 3.3.

  friend std::ostream& operator<<(std::ostream& s, Now const& now)
  {
    return s << now.c_str_;
  }
};

inline std::uint64_t Now::seconds()
{
  timeval tv;
  PCHECK(gettimeofday(&tv, 0) == 0);
  return static_cast<std::uint64_t>(tv.tv_sec);
}

inline Now::Now()
  : sec_(seconds())
{
  format_();
}

inline Now::Now(std::uint64_t sec)
  : sec_(sec)
{
  format_();
}

inline void Now::format_()
{
  auto const t = static_cast<time_t>(sec_);
  tm         tm_buf;
  tm*        ptm = CHECK_NOTNULL(gmtime_r(&t, &tm_buf));
  CHECK_EQ(strftime(c_str_, sizeof c_str_, "%a, %d %b %Y %H:%M:%S +0000", ptm),
           sizeof(c_str_) - 1);
}

#endif // NOW_DOT_HPP
