#include "LocalDomains.hpp"

#include <boost/algorithm/string/case_conv.hpp>

#include <glog/logging.h>

StaticDomains::StaticDomains(std::initializer_list<std::string_view> domains)
{
  for (auto dom : domains)
    add(dom);
}

void StaticDomains::add(std::string_view domain)
{
  domains_.emplace(boost::algorithm::to_lower_copy(std::string(domain)));
}

bool StaticDomains::contains(std::string_view domain) const
{
  return domains_.count(boost::algorithm::to_lower_copy(std::string(domain)))
         != 0;
}

CDBDomains::CDBDomains(fs::path const& db)
{
  if (!db_.open(db)) {
    LOG(WARNING) << "no local domains loaded from " << db;
  }
}

bool CDBDomains::contains(std::string_view domain) const
{
  auto const key = boost::algorithm::to_lower_copy(std::string(domain));

  std::lock_guard<std::mutex> lock(mtx_);
  return db_.contains(key);
}

std::unique_ptr<LocalDomains> open_local_domains(fs::path const& config_dir)
{
  auto const db_path = config_dir / "local_domains.cdb";

  error_code ec;
  if (fs::exists(db_path, ec)) {
    LOG(INFO) << "local domains from " << db_path;
    return std::make_unique<CDBDomains>(db_path);
  }
  LOG(INFO) << "no " << db_path << ", no domains are local";
  return std::make_unique<StaticDomains>();
}
