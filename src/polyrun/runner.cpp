#include <polyrun/runner.h>

#include <poll.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <sys/eventfd.h>
#include <sys/sysinfo.h>
#include <chrono>
#include <climits>
#include <cstdint>
#include <cstring>
#include <algorithm>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "paths.h"
#include "utils.h"
#include "sandbox.h"
#include "sandbox_exec.h"

namespace {

using Clock = std::chrono::steady_clock;

constexpr long kWatchdogGrace = 1'000'000; // us, on top of the wall time limit of cjail
constexpr long kCpuTimeMargin = 50'000; // us
constexpr long kRssMargin = 1024; // KiB
constexpr auto kDrainTimeout = std::chrono::milliseconds(1000);
constexpr int kFileNum = 256;

const std::vector<std::string> kToolchainDirs = {
  "/usr", "/lib", "/lib64", "/lib32", "/bin", "/sbin", "/etc/alternatives", "/var/lib",
};

inline void CloseFd(int& fd) {
  if (fd >= 0) close(fd);
  fd = -1;
}

// box directory with a tmpfs work area; removed on destruction
class WorkArea {
  fs::path box_, workdir_;
  bool created_, mounted_;
 public:
  explicit WorkArea(long id) :
      box_(ExecutionBoxPath(id)), workdir_(Workdir(ExecutionBoxPath(id))),
      created_(false), mounted_(false) {}
  ~WorkArea() {
    if (mounted_) Umount(workdir_);
    if (created_) RemoveAll(box_);
  }
  WorkArea(const WorkArea&) = delete;
  WorkArea& operator=(const WorkArea&) = delete;

  bool Setup(int uid, int gid) {
    std::error_code ec;
    if (fs::exists(box_, ec) || ec) {
      spdlog::warn("Work area {} already exists", box_.c_str());
      return false;
    }
    constexpr fs::perms kPerm755 = fs::perms::owner_all |
        fs::perms::group_read | fs::perms::group_exec |
        fs::perms::others_read | fs::perms::others_exec;
    if (!CreateDirs(kBoxRoot)) return false;
    created_ = CreateDirs(box_, kPerm755);
    if (!created_ || !CreateDirs(workdir_)) return false;
    if (!(mounted_ = MountTmpfs(workdir_, kWorkAreaSize))) return false;
    fs::permissions(workdir_, kPerm700, ec);
    if (ec) {
      spdlog::warn("Failed setting permissions of {}: {}", workdir_.c_str(), ec.message());
      return false;
    }
    return Chown(workdir_, uid, gid);
  }
};

struct StageRun {
  bool spawned, has_result, watchdog, cancelled;
  struct cjail_result res;
  OutputCapture out, err;

  explicit StageRun(size_t out_limit) :
      spawned(false), has_result(false), watchdog(false), cancelled(false), res(),
      out(out_limit), err(kMaxOutput) {}

  long CpuTime() const {
    return has_result ? ToUs(res.rus.ru_utime) + ToUs(res.rus.ru_stime) : 0;
  }
  long PeakMemory() const { return has_result ? res.rus.ru_maxrss : 0; }
};

// Runs one jailed process, feeding input and draining its output until it is gone.
// Never blocks longer than watchdog_us (plus the drain timeout).
void ExecuteStage(const SandboxOptions& opt, const std::string* input, const CancelToken& cancel,
                  long watchdog_us, StageRun& run) {
  int in_pipe[2] = {-1, -1}, out_pipe[2] = {-1, -1}, err_pipe[2] = {-1, -1};
  if (pipe2(in_pipe, O_CLOEXEC) < 0 || pipe2(out_pipe, O_CLOEXEC) < 0 || pipe2(err_pipe, O_CLOEXEC) < 0) {
    spdlog::warn("Failed creating pipes: {}", strerror(errno));
    for (int* i : {in_pipe, out_pipe, err_pipe}) CloseFd(i[0]), CloseFd(i[1]);
    return;
  }
  // only our end; the program gets a blocking stdin
  if (fcntl(in_pipe[1], F_SETFL, O_NONBLOCK) < 0) {
    spdlog::warn("Failed setting stdin non-blocking: {}", strerror(errno));
    for (int* i : {in_pipe, out_pipe, err_pipe}) CloseFd(i[0]), CloseFd(i[1]);
    return;
  }
  SandboxProcess proc;
  bool spawned = SpawnSandbox(opt, in_pipe[0], out_pipe[1], err_pipe[1], proc);
  CloseFd(in_pipe[0]);
  CloseFd(out_pipe[1]);
  CloseFd(err_pipe[1]);
  int in_fd = in_pipe[1], out_fd = out_pipe[0], err_fd = err_pipe[0];
  if (!spawned) {
    CloseFd(in_fd);
    CloseFd(out_fd);
    CloseFd(err_fd);
    return;
  }
  run.spawned = true;
  int res_fd = proc.result_fd;

  if (!input || input->empty()) CloseFd(in_fd);
  size_t in_pos = 0, res_pos = 0;
  bool killed = false;
  auto Kill = [&]() {
    if (!killed) killpg(proc.pid, SIGKILL);
    killed = true;
  };
  const auto deadline = Clock::now() + std::chrono::microseconds(watchdog_us);
  auto drain_deadline = Clock::time_point::max();
  char buf[65536];

  while (out_fd >= 0 || err_fd >= 0 || res_fd >= 0) {
    auto now = Clock::now();
    if (now >= drain_deadline) {
      spdlog::debug("Helper pid={} did not close its output in time", proc.pid);
      break;
    }
    bool finished = killed || res_fd < 0;
    if (!finished && now >= deadline) {
      spdlog::info("Watchdog expired: pid={}", proc.pid);
      run.watchdog = true;
      Kill();
      drain_deadline = now + kDrainTimeout;
      continue;
    }
    auto until = finished ? drain_deadline : std::min(deadline, drain_deadline);
    long wait_ms = std::chrono::ceil<std::chrono::milliseconds>(until - now).count();
    int timeout = (int)std::min(wait_ms, (long)INT_MAX);

    struct pollfd fds[5];
    int nfds = 0, cancel_idx = -1;
    for (int fd : {out_fd, err_fd, res_fd}) {
      if (fd >= 0) fds[nfds++] = {fd, POLLIN, 0};
    }
    if (in_fd >= 0) fds[nfds++] = {in_fd, POLLOUT, 0};
    if (!run.cancelled && cancel.Fd() >= 0) {
      cancel_idx = nfds;
      fds[nfds++] = {cancel.Fd(), POLLIN, 0};
    }
    int ret = poll(fds, nfds, timeout);
    if (ret < 0) {
      if (errno == EINTR) continue;
      spdlog::warn("poll failed: {}", strerror(errno));
      Kill();
      break;
    }
    if (ret == 0) continue;
    now = Clock::now();
    for (int i = 0; i < nfds; i++) {
      if (!fds[i].revents) continue;
      int fd = fds[i].fd;
      if (i == cancel_idx) {
        spdlog::info("Cancelling helper pid={}", proc.pid);
        run.cancelled = true;
        Kill();
        drain_deadline = now + kDrainTimeout;
      } else if (fd == out_fd || fd == err_fd) {
        ssize_t len = read(fd, buf, sizeof(buf));
        if (len < 0 && (errno == EINTR || errno == EAGAIN)) continue;
        if (len <= 0) {
          CloseFd(fd == out_fd ? out_fd : err_fd);
        } else {
          (fd == out_fd ? run.out : run.err).Append(buf, len);
        }
      } else if (fd == res_fd) {
        ssize_t len = read(fd, reinterpret_cast<char*>(&run.res) + res_pos, sizeof(run.res) - res_pos);
        if (len < 0 && errno == EINTR) continue;
        if (len > 0) res_pos += len;
        if (len <= 0 || res_pos == sizeof(run.res)) {
          run.has_result = res_pos == sizeof(run.res);
          CloseFd(res_fd);
          // descendants are gone with the jail; the rest is what is left in the pipes
          if (drain_deadline == Clock::time_point::max()) drain_deadline = now + kDrainTimeout;
        }
      } else if (fd == in_fd) {
        if (fds[i].revents & (POLLERR | POLLHUP)) {
          CloseFd(in_fd);
          continue;
        }
        ssize_t len = write(fd, input->data() + in_pos, std::min(input->size() - in_pos, sizeof(buf)));
        if (len < 0) {
          if (errno == EINTR || errno == EAGAIN) continue;
          // EPIPE: the program stopped reading
          CloseFd(in_fd);
          continue;
        }
        in_pos += len;
        if (in_pos == input->size()) CloseFd(in_fd);
      }
    }
  }
  if (out_fd >= 0 || err_fd >= 0 || res_fd >= 0) Kill();
  CloseFd(in_fd);
  CloseFd(out_fd);
  CloseFd(err_fd);
  CloseFd(res_fd);
  int status = 0;
  while (waitpid(proc.pid, &status, 0) < 0 && errno == EINTR);
  if (!run.has_result && !killed) {
    spdlog::warn("Helper pid={} exited without a result: status={}", proc.pid, status);
  }
}

ExecutionResult StageFailure(Outcome outcome, const LanguageProfile& profile, const LanguageStage& stage,
                             const std::string& what) {
  ExecutionResult ret(outcome, fmt::format("{}: stage {}: {}", profile.id, stage.name, what));
  ret.stage = stage.name;
  return ret;
}

// SUCCESS means that the stage exited normally with status 0
ExecutionResult Classify(const StageRun& run, const Limits& lim, const LanguageProfile& profile,
                         const LanguageStage& stage) {
  if (!run.spawned) {
    return StageFailure(Outcome::INTERNAL_ERROR, profile, stage, "failed to start the sandbox");
  }
  if (run.cancelled) return StageFailure(Outcome::CANCELLED, profile, stage, "cancelled");
  if (run.watchdog) return StageFailure(Outcome::TIMEOUT, profile, stage, "wall time limit exceeded");
  if (!run.has_result) {
    return StageFailure(Outcome::INTERNAL_ERROR, profile, stage, "sandbox exited without a result");
  }
  auto& res = run.res;
  if (res.timekill == -1) {
    // timekill = -1 means the helper failed to set up the jail, errno in oomkill
    return StageFailure(Outcome::INTERNAL_ERROR, profile, stage,
                        fmt::format("sandbox setup failed: {}", strerror(res.oomkill)));
  }
  if (res.oomkill > 0) {
    return StageFailure(Outcome::RESOURCE_EXCEEDED, profile, stage, "memory limit exceeded");
  }
  if (res.timekill) {
    return StageFailure(Outcome::TIMEOUT, profile, stage, "time limit exceeded");
  }
  bool signaled = res.info.si_code == CLD_KILLED || res.info.si_code == CLD_DUMPED;
  bool memory_exceeded = lim.memory && res.rus.ru_maxrss > lim.memory;
  if (signaled && res.info.si_status == SIGXFSZ) {
    return StageFailure(Outcome::RESOURCE_EXCEEDED, profile, stage, "file size limit exceeded");
  }
  // memory exhaustion usually ends in SIGSEGV or SIGABRT, so check it before the signal
  if ((signaled || res.info.si_status != 0) && memory_exceeded) {
    return StageFailure(Outcome::RESOURCE_EXCEEDED, profile, stage, "memory limit exceeded");
  }
  if (lim.cpu_time && run.CpuTime() > lim.cpu_time) {
    return StageFailure(Outcome::TIMEOUT, profile, stage, "CPU time limit exceeded");
  }
  ExecutionResult ret(Outcome::SUCCESS);
  ret.stage = stage.name;
  if (signaled) {
    ret.outcome = Outcome::RUNTIME_ERROR;
    ret.term_signal = res.info.si_status;
    ret.exit_code = 128 + res.info.si_status;
    ret.message = fmt::format("killed by signal {} ({})", res.info.si_status, strsignal(res.info.si_status));
  } else if (res.info.si_status != 0) {
    ret.outcome = Outcome::RUNTIME_ERROR;
    ret.exit_code = res.info.si_status;
  } else {
    ret.exit_code = 0;
  }
  return ret;
}

SandboxOptions StageOptions(long id, const LanguageProfile& profile, const LanguageStage& stage,
                            const std::string& feed, const Limits& lim, int uid, int cpuid) {
  SandboxOptions opt;
  opt.boxdir = ExecutionBoxPath(id);
  std::string exe = ExpandTemplate(stage.executable, profile, feed);
  if (exe.find('/') == std::string::npos) opt.command = {"/usr/bin/env"};
  opt.command.push_back(exe);
  for (auto& arg : stage.args) opt.command.push_back(ExpandTemplate(arg, profile, feed));
  if (char* path = getenv("PATH")) opt.envs.push_back(std::string("PATH=") + path);
  opt.envs.insert(opt.envs.end(), {"HOME=/workdir", "TMPDIR=/workdir", "LANG=C.UTF-8"});
  for (auto& env : stage.envs) opt.envs.push_back(ExpandTemplate(env, profile, feed));
  opt.workdir = Workdir("/");
  if (cpuid != -1) opt.cpu_set.push_back(cpuid);
  opt.uid = opt.gid = uid;
  opt.wall_time = lim.wall_time;
  opt.cpu_time = lim.cpu_time ? lim.cpu_time + kCpuTimeMargin : 0;
  opt.rss = lim.memory ? lim.memory + kRssMargin : 0;
  opt.proc_num = lim.proc_num;
  opt.file_num = kFileNum;
  opt.fsize = lim.fsize;
  opt.share_net = false;
  opt.dirs = kToolchainDirs;
  opt.dirs.insert(opt.dirs.end(), profile.dirs.begin(), profile.dirs.end());
  opt.FilterDirs();
  return opt;
}

ExecutionResult RunStages(long id, const LanguageRegistry& registry, const LanguageProfile& profile,
                          const ExecutionRequest& req, const CancelToken& cancel, int uid, int cpuid) {
  long cpu_time = 0, peak_memory = 0;
  std::string feed;
  for (size_t i = 0; i < profile.stages.size(); i++) {
    const LanguageStage& stage = profile.stages[i];
    bool final_stage = i + 1 == profile.stages.size();
    if (cancel.IsCancelled()) return StageFailure(Outcome::CANCELLED, profile, stage, "cancelled");
    Limits lim = registry.StageLimits(stage, req.limits);
    SandboxOptions opt = StageOptions(id, profile, stage, feed, lim, uid, cpuid);
    // a fed file may be as large as the stage is allowed to write
    StageRun run(stage.feeds_next ? std::max(lim.fsize * 1024, kMaxOutput) : kMaxOutput);
    const std::string* input = final_stage && req.input ? &req.input.value() : nullptr;
    spdlog::debug("Stage started: id={} language={} stage={} command={}",
                  id, profile.id, stage.name, fmt::format("{}", opt.command));
    ExecuteStage(opt, input, cancel, lim.wall_time + kWatchdogGrace, run);
    cpu_time += run.CpuTime();
    peak_memory = std::max(peak_memory, run.PeakMemory());

    ExecutionResult ret = Classify(run, lim, profile, stage);
    ret.cpu_time = cpu_time;
    ret.peak_memory = peak_memory;
    spdlog::info("Stage finished: id={} language={} stage={} outcome={} code={} status={} time={} rss={}",
                 id, profile.id, stage.name, OutcomeToAbr(ret.outcome), run.res.info.si_code,
                 run.res.info.si_status, run.CpuTime(), run.PeakMemory());
    if (final_stage || ret.outcome != Outcome::SUCCESS) {
      // the capture of a feeding stage is larger than what a result may carry
      ret.output = run.out.Str(kMaxOutput);
      ret.error = run.err.Str();
    }
    if (final_stage) return ret;
    if (ret.outcome == Outcome::RUNTIME_ERROR) {
      // a failing toolchain stage is a diagnosis of the source, not of the program
      ret.outcome = Outcome::COMPILE_ERROR;
      ret.message = fmt::format("{}: stage {} failed", profile.id, stage.name);
      ret.exit_code.reset();
      ret.term_signal.reset();
      return ret;
    }
    if (ret.outcome != Outcome::SUCCESS) {
      ret.exit_code.reset();
      return ret;
    }
    if (stage.feeds_next) {
      if (run.out.Truncated()) {
        ret.outcome = Outcome::COMPILE_ERROR;
        ret.message = fmt::format("{}: stage {}: output too large", profile.id, stage.name);
        ret.exit_code.reset();
        ret.output = run.out.Str(kMaxOutput);
        ret.error = run.err.Str();
        return ret;
      }
      if (!WriteFile(ExecutionFeedPath(id, stage.feed_file), run.out.Data(), uid, uid)) {
        return StageFailure(Outcome::INTERNAL_ERROR, profile, stage, "failed to write the intermediate file");
      }
      feed = stage.feed_file;
    } else {
      feed.clear();
    }
  }
  __builtin_unreachable();
}

} // namespace

CancelToken::CancelToken() : fd_(eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK)), cancelled_(false) {
  if (fd_ < 0) spdlog::warn("eventfd failed: {}", strerror(errno));
}

CancelToken::~CancelToken() {
  if (fd_ >= 0) close(fd_);
}

void CancelToken::Cancel() {
  if (cancelled_.exchange(true)) return;
  uint64_t val = 1;
  if (fd_ >= 0) IGNORE_RETURN(write(fd_, &val, sizeof(val)));
}

SandboxRunner::SandboxRunner() {
  // writes to a pipe whose reader went away must fail with EPIPE instead
  signal(SIGPIPE, SIG_IGN);
  for (int i = 0; i < kUidPoolSize; i++) uid_pool_.push_back(i + kUidBase);
  for (int i = 0, N = get_nprocs(); i < N; i++) {
    if (CPU_ISSET(i, &kPinnedCpus)) cpuid_pool_.push_back(i);
  }
}

bool SandboxRunner::AcquireSlot(int& uid, int& cpuid) {
  std::lock_guard lck(pool_mtx_);
  if (uid_pool_.empty()) return false;
  uid = uid_pool_.back();
  uid_pool_.pop_back();
  cpuid = -1;
  if (cpuid_pool_.empty()) {
    if (CPU_COUNT(&kPinnedCpus)) {
      spdlog::warn("No available cpu; execution won\'t be pinned");
    }
  } else {
    cpuid = cpuid_pool_.back();
    cpuid_pool_.pop_back();
  }
  return true;
}

void SandboxRunner::ReleaseSlot(int uid, int cpuid) {
  std::lock_guard lck(pool_mtx_);
  uid_pool_.push_back(uid);
  if (cpuid != -1) cpuid_pool_.push_back(cpuid);
}

ExecutionResult SandboxRunner::Run(const LanguageRegistry& registry, const LanguageProfile& profile,
                                   const ExecutionRequest& req, const CancelToken& cancel) {
  auto start = Clock::now();
  long id = GetUniqueExecutionId();
  spdlog::info("Execution started: id={} language={} stages={}", id, profile.id, profile.stages.size());
  ExecutionResult ret;
  int uid = -1, cpuid = -1;
  if (profile.stages.empty()) {
    ret = ExecutionResult(Outcome::INTERNAL_ERROR, profile.id + ": no stages");
  } else if (cancel.IsCancelled()) {
    ret = ExecutionResult(Outcome::CANCELLED, "cancelled");
  } else if (auto missing = MissingToolchain(profile)) {
    ret = StageFailure(Outcome::INTERNAL_ERROR, profile, *missing,
                       fmt::format("toolchain {} is not installed", missing->executable));
  } else if (!AcquireSlot(uid, cpuid)) {
    ret = ExecutionResult(Outcome::INTERNAL_ERROR, profile.id + ": no free sandbox uid");
  } else {
    {
      WorkArea area(id);
      if (!area.Setup(uid, uid)) {
        ret = StageFailure(Outcome::INTERNAL_ERROR, profile, profile.stages[0], "failed to set up the work area");
      } else if (!WriteFile(ExecutionSourcePath(id, profile), req.source, uid, uid)) {
        ret = StageFailure(Outcome::INTERNAL_ERROR, profile, profile.stages[0], "failed to write the source");
      } else {
        try {
          ret = RunStages(id, registry, profile, req, cancel, uid, cpuid);
        } catch (const std::exception& err) {
          spdlog::error("Execution id={} aborted: {}", id, err.what());
          ret = ExecutionResult(Outcome::INTERNAL_ERROR, profile.id + ": " + err.what());
        }
      }
    }
    ReleaseSlot(uid, cpuid);
  }
  ret.wall_time = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start).count();
  if (ret.outcome == Outcome::INTERNAL_ERROR) spdlog::warn("Execution id={} failed: {}", id, ret.message);
  spdlog::info("Execution finished: id={} language={} outcome={} wall={} cpu={} rss={}",
               id, profile.id, OutcomeToAbr(ret.outcome), ret.wall_time, ret.cpu_time, ret.peak_memory);
  return ret;
}
