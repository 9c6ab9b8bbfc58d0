#ifndef HASH_DOT_HPP
#define HASH_DOT_HPP

#include <cstdint>
#include <string>
#include <string_view>

#include <openssl/sha.h>

#include <glog/logging.h>

#include <cppcodec/base32_crockford.hpp>

// SHA-256 over a sequence of fields, rendered in Crockford's base32.
// Used for limiter and quota counter keys and for blob names.

class Hash {
public:
  Hash() { CHECK_EQ(SHA256_Init(&c), 1); }

  void update(std::string_view s)
  {
    CHECK_EQ(SHA256_Update(&c, s.data(), s.length()), 1);
  }

  // Fixed width, so adjacent numbers can't run together.
  void update(std::uint64_t n)
  {
    unsigned char b[sizeof(n)];
    for (auto i = 0u; i < sizeof(n); ++i)
      b[i] = static_cast<unsigned char>(n >> (8 * i));
    CHECK_EQ(SHA256_Update(&c, b, sizeof(b)), 1);
  }

  // Field separator for variable length data.
  void separator() { update(std::string_view("\0", 1)); }

  std::string final()
  {
    unsigned char md[SHA256_DIGEST_LENGTH];
    CHECK_EQ(SHA256_Final(md, &c), 1);
    return cppcodec::base32_crockford::encode(md, sizeof(md));
  }

private:
  SHA256_CTX c;
};

#endif // HASH_DOT_HPP
