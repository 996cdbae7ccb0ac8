#include "paths.h"

#include <unistd.h>

#include "utils.h"

fs::path kBoxRoot = "/tmp/polyrun_box";

namespace internal {
fs::path kDataDir = fs::path(POLYRUN_DATA_DIR);
} // internal

const char kWorkdirRelative[] = "workdir";
fs::path Workdir(fs::path&& path) {
  path /= kWorkdirRelative;
  return path;
}

namespace {

inline fs::path BoxRoot(fs::path root, bool inside_box) {
  return inside_box ? fs::path("/") : root;
}

} // namespace

fs::path SandboxHelperPath() {
  return internal::kDataDir / "sandbox-exec";
}

// the pid keeps two broker instances sharing a box root apart
fs::path ExecutionBoxPath(long id) {
  return kBoxRoot / (std::to_string(getpid()) + "-" + PadInt(id, 6));
}
fs::path ExecutionSourcePath(long id, const LanguageProfile& profile, bool inside_box) {
  return Workdir(BoxRoot(ExecutionBoxPath(id), inside_box)) / profile.SourceFile();
}
fs::path ExecutionFeedPath(long id, const std::string& feed_file, bool inside_box) {
  return Workdir(BoxRoot(ExecutionBoxPath(id), inside_box)) / feed_file;
}

fs::path InstanceLockPath() {
  return internal::kDataDir / "lock";
}
