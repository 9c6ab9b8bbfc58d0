#include "LocalDomains.hpp"

#include <unistd.h>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  StaticDomains stat{"example.org", "Example.NET"};
  CHECK(stat.contains("example.org"));
  CHECK(stat.contains("EXAMPLE.org"));
  CHECK(stat.contains("example.net"));
  CHECK(!stat.contains("example.com"));
  CHECK(!stat.contains(""));

  auto const dir = fs::temp_directory_path()
                   / ("local-domains-test-" + std::to_string(getpid()));
  fs::create_directories(dir);

  // No database file, nothing is local.
  auto none = open_local_domains(dir);
  CHECK(!none->contains("example.org"));

  CDB no_db;
  CHECK(!no_db.open(dir / "unable-to-open-database.cdb"));
  CHECK(!no_db.contains("foo"));
  CHECK(!no_db.find("foo"));

  CDB::build(dir / "local_domains.cdb", {"example.org", "mail.example.org"});

  CDB db;
  CHECK(db.open(dir / "local_domains.cdb"));
  CHECK(db.contains("example.org"));
  CHECK_EQ(*db.find("mail.example.org"), "1");
  CHECK(!db.find("example.com"));

  auto local = open_local_domains(dir);
  CHECK(local->contains("example.org"));
  CHECK(local->contains("Mail.Example.Org"));
  CHECK(!local->contains("example.com"));

  fs::remove_all(dir);
}
