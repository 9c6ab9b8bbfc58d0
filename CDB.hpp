#ifndef CDB_DOT_HPP
#define CDB_DOT_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

extern "C" {
#include <cdb.h>
}

#include "fs.hpp"

// Read only lookups in a constant database file. Not thread safe, a
// lookup moves the cursor held inside the cdb structure.

class CDB {
public:
  CDB(CDB const&) = delete;
  CDB& operator=(CDB const&) = delete;

  CDB() = default;
  explicit CDB(fs::path const& db) { open(db); }
  ~CDB();

  bool                       open(fs::path const& db);
  std::optional<std::string> find(std::string_view key);
  bool                       contains(std::string_view key);
  constexpr bool             is_open() const;

  // Write a database mapping each key to "1", replacing any file at path.
  static void build(fs::path const& db, std::vector<std::string> const& keys);

private:
  int fd_{-1};
  cdb cdb_{};
};

constexpr bool CDB::is_open() const { return fd_ != -1; }

#endif // CDB_DOT_HPP
