#include "osutil.hpp"

#include <pwd.h>
#include <sys/types.h>
#include <sys/utsname.h>
#include <unistd.h>

#include <gflags/gflags.h>

DEFINE_string(config_dir, "", "path to support/config files");
DEFINE_string(spool_dir, "", "path to the queue spool, blobs live below it");

#include <glog/logging.h>

namespace osutil {

fs::path get_config_dir()
{
  if (!FLAGS_config_dir.empty()) {
    return FLAGS_config_dir;
  }
  return get_exe_path().parent_path();
}

fs::path get_spool_dir()
{
  if (!FLAGS_spool_dir.empty()) {
    return FLAGS_spool_dir;
  }
  auto const spool_ev{getenv("SPOOL_DIR")};
  if (spool_ev) {
    return spool_ev;
  }
  return get_home_dir() / "spool";
}

fs::path get_exe_path()
{
  // Works on everything that has a procfs, read_symlink() has had
  // trouble with the st_size of zero /proc/self/exe reports.

  auto constexpr exe = "/proc/self/exe";

  auto constexpr max_link = 4 * 1024;
  char buf[max_link];

  auto const len{::readlink(exe, buf, max_link)};

  PCHECK(len != -1) << "readlink";
  if (len == max_link) {
    LOG(FATAL) << exe << " link too long";
  }
  buf[len] = '\0';
  return fs::path(buf);
}

fs::path get_home_dir()
{
  auto const homedir_ev{getenv("HOME")};
  if (homedir_ev) {
    return homedir_ev;
  }
  errno = 0; // See GETPWNAM(3)
  passwd* pw;
  PCHECK(pw = getpwuid(getuid()));
  return pw->pw_dir;
}

std::string get_hostname()
{
  utsname un;
  PCHECK(uname(&un) == 0);
  return std::string(un.nodename);
}

} // namespace osutil
