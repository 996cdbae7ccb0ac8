#ifndef INCLUDE_POLYRUN_PATHS_H_
#define INCLUDE_POLYRUN_PATHS_H_

#include <filesystem>

namespace fs = std::filesystem;

extern fs::path kBoxRoot;

namespace internal {

// does not meant to be publicly used; only for testing
extern fs::path kDataDir;

} // internal

fs::path SandboxHelperPath();
// held by a running instance
fs::path InstanceLockPath();

#endif  // INCLUDE_POLYRUN_PATHS_H_
