#ifndef LOCALDOMAINS_DOT_HPP
#define LOCALDOMAINS_DOT_HPP

#include <initializer_list>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_set>

#include "CDB.hpp"
#include "fs.hpp"

// The set of domains this system accepts mail for, consulted by the
// is_local_domain() expression function. Lookups are case-insensitive.

class LocalDomains {
public:
  virtual ~LocalDomains() = default;

  virtual bool contains(std::string_view domain) const = 0;
};

class StaticDomains : public LocalDomains {
public:
  StaticDomains() = default;
  StaticDomains(std::initializer_list<std::string_view> domains);

  void add(std::string_view domain);

  bool contains(std::string_view domain) const override;

private:
  std::unordered_set<std::string> domains_;
};

class CDBDomains : public LocalDomains {
public:
  explicit CDBDomains(fs::path const& db);

  bool is_open() const { return db_.is_open(); }

  bool contains(std::string_view domain) const override;

private:
  mutable std::mutex mtx_;
  mutable CDB        db_;
};

// Uses <config_dir>/local_domains.cdb when it exists, else an empty set.
std::unique_ptr<LocalDomains> open_local_domains(fs::path const& config_dir);

#endif // LOCALDOMAINS_DOT_HPP
