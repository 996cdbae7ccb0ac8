#include "utils.h"

#include <fcntl.h>
#include <unistd.h>
#include <sys/mount.h>
#include <atomic>
#include <algorithm>
#include <cstring>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

namespace {

std::atomic_long execution_id_seq = 0;

} // namespace

long GetUniqueExecutionId() {
  return ++execution_id_seq;
}

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;
#define X_RETURN_ARG3(cls, x, y, z, ...) case cls::x: return z;

#define X(...) X_RETURN_ARG1(Outcome, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* OutcomeName, Outcome, ENUM_OUTCOME_)
#undef X

#define X(...) X_RETURN_ARG2(Outcome, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* OutcomeToAbr, Outcome, ENUM_OUTCOME_)
#undef X

#define X(...) X_RETURN_ARG3(Outcome, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* OutcomeToDesc, Outcome, ENUM_OUTCOME_)
#undef X

#define X(...) X_RETURN_ARG1(TicketState, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* TicketStateName, TicketState, ENUM_TICKET_STATE_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG2
#undef X_RETURN_ARG3

static const char* kOutcomeNameTable[] = {
#define X(name, abr, desc) #name,
  ENUM_OUTCOME_
#undef X
};
static const char* kOutcomeAbrTable[] = {
#define X(name, abr, desc) abr,
  ENUM_OUTCOME_
#undef X
};

Outcome GetOutcome(const std::string& str) {
  for (size_t i = 0; i < sizeof(kOutcomeNameTable) / sizeof(kOutcomeNameTable[0]); i++) {
    if (str == kOutcomeNameTable[i] || str == kOutcomeAbrTable[i]) return (Outcome)i;
  }
  return Outcome::INTERNAL_ERROR;
}

std::string TruncationMarker(size_t limit) {
  return "\n[output truncated after " + std::to_string(limit) + " bytes]";
}

void OutputCapture::Append(const char* buf, size_t len) {
  total_ += len;
  if (data_.size() >= limit_) return;
  data_.append(buf, std::min(len, limit_ - data_.size()));
}

std::string OutputCapture::Str(size_t limit) const {
  limit = std::min(limit, limit_);
  if (total_ <= limit) return data_;
  return data_.substr(0, limit) + TruncationMarker(limit);
}

nlohmann::json ResultToJson(const ExecutionResult& res) {
  nlohmann::json ret = {
    {"outcome", OutcomeName(res.outcome)},
    {"verdict", OutcomeToAbr(res.outcome)},
    {"output", res.output},
    {"error", res.error},
    {"exit_code", nullptr},
    {"signal", nullptr},
    {"stage", res.stage},
    {"message", res.message},
    {"wall_time_ms", res.wall_time / 1000},
    {"cpu_time_ms", res.cpu_time / 1000},
    {"memory_kib", res.peak_memory},
  };
  if (res.exit_code) ret["exit_code"] = *res.exit_code;
  if (res.term_signal) ret["signal"] = *res.term_signal;
  return ret;
}

// throws nlohmann::json::exception on mistyped fields
Limits LimitsFromJson(const nlohmann::json& obj) {
  Limits ret;
  if (!obj.is_object()) return ret;
  ret.wall_time = obj.value("wall_time_ms", 0L) * 1000;
  ret.cpu_time = obj.value("cpu_time_ms", 0L) * 1000;
  ret.memory = obj.value("memory_mb", 0L) * 1024;
  if (obj.contains("memory_kib")) ret.memory = obj["memory_kib"].get<long>();
  ret.proc_num = obj.value("proc_num", 0);
  ret.fsize = obj.value("file_size_mb", 0L) * 1024;
  return ret;
}

bool MountTmpfs(const fs::path& path, long size_kib) {
  spdlog::debug("Mount tmpfs on {}, size {}", path.c_str(), size_kib);
  bool ret = 0 == mount("tmpfs", path.c_str(), "tmpfs", MS_NOSUID | MS_NODEV,
                        ("size=" + std::to_string(size_kib) + 'k').c_str());
  if (!ret) spdlog::warn("Failed mounting tmpfs on {}: {}", path.c_str(), strerror(errno));
  return ret;
}

bool Umount(const fs::path& path) {
  spdlog::debug("Umount {}", path.c_str());
  bool ret = 0 == umount2(path.c_str(), MNT_DETACH);
  if (!ret) spdlog::warn("Failed unmounting {}: {}", path.c_str(), strerror(errno));
  return ret;
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), ec.message());
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) {
    spdlog::warn("Failed deleting {}: {}", path.c_str(), ec.message());
    return false;
  }
  return true;
}

bool WriteFile(const fs::path& path, const std::string& content, int uid, int gid, fs::perms perms) {
  spdlog::debug("Write file {}, {} bytes", path.c_str(), content.size());
  int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC | O_NOFOLLOW,
                static_cast<mode_t>(perms));
  if (fd < 0) goto err;
  for (size_t pos = 0; pos < content.size();) {
    ssize_t ret = write(fd, content.data() + pos, content.size() - pos);
    if (ret < 0) {
      if (errno == EINTR) continue;
      int saved = errno;
      close(fd);
      errno = saved;
      goto err;
    }
    pos += ret;
  }
  if (fchown(fd, uid, gid) < 0) {
    int saved = errno;
    close(fd);
    errno = saved;
    goto err;
  }
  if (close(fd) < 0) goto err;
  return true;
err:
  spdlog::warn("Failed writing {}: {}", path.c_str(), strerror(errno));
  return false;
}

bool Chown(const fs::path& path, int uid, int gid) {
  if (lchown(path.c_str(), uid, gid) < 0) {
    spdlog::warn("Failed chown {} to {}:{}: {}", path.c_str(), uid, gid, strerror(errno));
    return false;
  }
  return true;
}
