#include "CDB.hpp"

#include <cstring>
#include <limits>
#include <system_error>

#include <glog/logging.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

CDB::~CDB()
{
  if (is_open()) {
    cdb_free(&cdb_);
    close(fd_);
  }
}

bool CDB::open(fs::path const& db_path)
{
  auto const db_fn = db_path.string();

  fd_ = ::open(db_fn.c_str(), O_RDONLY);
  if (fd_ == -1) {
    PLOG(WARNING) << "unable to open " << db_fn;
    return false;
  }
  if (cdb_init(&cdb_, fd_) != 0) {
    PLOG(WARNING) << "not a constant database " << db_fn;
    close(fd_);
    fd_ = -1;
    return false;
  }
  return true;
}

std::optional<std::string> CDB::find(std::string_view key)
{
  if (!is_open())
    return {};

  CHECK_LT(key.length(), std::numeric_limits<unsigned int>::max());
  if (cdb_find(&cdb_, key.data(), static_cast<unsigned int>(key.length()))
      > 0) {
    auto const  vpos = cdb_datapos(&cdb_);
    auto const  vlen = cdb_datalen(&cdb_);
    std::string val;
    val.resize(vlen);
    if (cdb_read(&cdb_, val.data(), vlen, vpos) != 0) {
      PLOG(WARNING) << "cdb_read failed";
      return {};
    }
    return val;
  }

  return {};
}

bool CDB::contains(std::string_view key)
{
  if (!is_open())
    return false;

  CHECK_LT(key.length(), std::numeric_limits<unsigned int>::max());
  return cdb_find(&cdb_, key.data(), static_cast<unsigned int>(key.length()))
         > 0;
}

void CDB::build(fs::path const& db_path, std::vector<std::string> const& keys)
{
  auto tmp_path = db_path;
  tmp_path += ".tmp";
  auto const tmp_fn = tmp_path.string();

  auto const fd = ::open(tmp_fn.c_str(), O_RDWR | O_CREAT | O_TRUNC, 0644);
  if (fd == -1) {
    throw std::system_error(errno, std::generic_category(), tmp_fn);
  }

  cdb_make cdbm;
  cdb_make_start(&cdbm, fd);
  for (auto const& key : keys) {
    if (cdb_make_add(&cdbm, key.data(), static_cast<unsigned>(key.length()),
                     "1", 1)
        != 0) {
      auto const err = errno;
      close(fd);
      throw std::system_error(err, std::generic_category(), "cdb_make_add");
    }
  }
  if (cdb_make_finish(&cdbm) != 0) {
    auto const err = errno;
    close(fd);
    throw std::system_error(err, std::generic_category(), "cdb_make_finish");
  }
  close(fd);

  fs::rename(tmp_path, db_path);
}
