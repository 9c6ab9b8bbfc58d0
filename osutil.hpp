#ifndef OSUTIL_DOT_HPP_INCLUDED
#define OSUTIL_DOT_HPP_INCLUDED

#include <string>

#include "fs.hpp"

namespace osutil {
fs::path    get_config_dir();
fs::path    get_spool_dir();
fs::path    get_exe_path();
fs::path    get_home_dir();
std::string get_hostname();
} // namespace osutil

#endif // OSUTIL_DOT_HPP_INCLUDED
