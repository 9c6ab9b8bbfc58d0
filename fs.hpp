#ifndef FS_DOT_HPP
#define FS_DOT_HPP

// A short name for the filesystem library, used by the spool and the
// configuration loader.

#include <filesystem>
namespace fs = std::filesystem;
using std::error_code;

#endif // FS_DOT_HPP
