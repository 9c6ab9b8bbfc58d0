#include "osutil.hpp"

#include <gflags/gflags.h>

#include <glog/logging.h>

DECLARE_string(spool_dir);

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const config_path = osutil::get_config_dir();
  auto const exe_path    = osutil::get_exe_path();
  auto const home_dir    = osutil::get_home_dir();
  auto const hostname    = osutil::get_hostname();

  fs::path argv0 = argv[0];
  CHECK_EQ(argv0.filename(), exe_path.filename());
  CHECK_EQ(config_path, exe_path.parent_path());
  CHECK(!hostname.empty());

  FLAGS_spool_dir = "/var/spool/qtest";
  CHECK_EQ(osutil::get_spool_dir(), fs::path("/var/spool/qtest"));
}
