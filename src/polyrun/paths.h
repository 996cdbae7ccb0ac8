#ifndef POLYRUN_PATHS_H_
#define POLYRUN_PATHS_H_

#include <polyrun/paths.h>
#include <polyrun/language.h>

extern const char kWorkdirRelative[];
fs::path Workdir(fs::path&&);

// if inside_box = true, id is not used and the path is relative to the chroot
fs::path ExecutionBoxPath(long id);
fs::path ExecutionSourcePath(long id, const LanguageProfile& profile, bool inside_box = false);
fs::path ExecutionFeedPath(long id, const std::string& feed_file, bool inside_box = false);

#endif  // POLYRUN_PATHS_H_
