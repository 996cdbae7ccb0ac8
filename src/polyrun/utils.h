#ifndef POLYRUN_UTILS_H_
#define POLYRUN_UTILS_H_

#include <sys/time.h>
#include <string>
#include <filesystem>

#include <polyrun/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

constexpr fs::perms kPerm700 = fs::perms::owner_all;
constexpr fs::perms kPerm600 = fs::perms::owner_read | fs::perms::owner_write;

inline std::string PadInt(long x, size_t width) {
  std::string ret = std::to_string(x);
  if (ret.size() < width) ret = std::string(width - ret.size(), '0') + ret;
  return ret;
}

inline long ToUs(const struct timeval& v) {
  return (long)v.tv_sec * 1'000'000 + v.tv_usec;
}

bool MountTmpfs(const fs::path&, long size_kib);
bool Umount(const fs::path&);
bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
// create or truncate, then hand over to uid:gid
bool WriteFile(const fs::path&, const std::string& content, int uid, int gid,
               fs::perms = kPerm600);
bool Chown(const fs::path&, int uid, int gid);

#endif  // POLYRUN_UTILS_H_
