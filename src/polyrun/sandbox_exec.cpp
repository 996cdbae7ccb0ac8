#include "sandbox_exec.h"

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <polyrun/paths.h>

namespace {

bool WriteAll(int fd, const void* buf, size_t len) {
  const char* ptr = static_cast<const char*>(buf);
  while (len) {
    ssize_t ret = write(fd, ptr, len);
    if (ret < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    ptr += ret;
    len -= ret;
  }
  return true;
}

} // namespace

bool SpawnSandbox(SandboxOptions opt, int input_fd, int output_fd, int error_fd, SandboxProcess& proc) {
  opt.fd_input = kHelperInputFd;
  opt.fd_output = kHelperOutputFd;
  opt.fd_error = kHelperErrorFd;
  auto vec = opt.Serialize();
  long size = vec.size();
  auto cmd = SandboxHelperPath(); // no allocation after fork
  int ctlpipe[2], respipe[2];
  pid_t pid;
  if (pipe2(ctlpipe, O_CLOEXEC) < 0) goto err;
  if (pipe2(respipe, O_CLOEXEC) < 0) {
    int saved = errno;
    close(ctlpipe[0]);
    close(ctlpipe[1]);
    errno = saved;
    goto err;
  }
  pid = fork();
  if (pid < 0) {
    int saved = errno;
    close(ctlpipe[0]);
    close(ctlpipe[1]);
    close(respipe[0]);
    close(respipe[1]);
    errno = saved;
    goto err;
  }
  if (pid == 0) {
    setpgid(0, 0);
    signal(SIGPIPE, SIG_DFL);
    // move the sources above the target range first so that dup2 cannot clobber one of them
    const int src[] = {ctlpipe[0], respipe[1], input_fd, output_fd, error_fd};
    const int dst[] = {0, 1, kHelperInputFd, kHelperOutputFd, kHelperErrorFd};
    int tmp[5];
    for (int i = 0; i < 5; i++) {
      if ((tmp[i] = fcntl(src[i], F_DUPFD_CLOEXEC, 10)) < 0) _exit(127);
    }
    for (int i = 0; i < 5; i++) {
      if (dup2(tmp[i], dst[i]) < 0) _exit(127);
    }
    execl(cmd.c_str(), cmd.c_str(), nullptr);
    _exit(127);
  }
  setpgid(pid, pid); // mirror the child's setpgid in case we win the race
  close(ctlpipe[0]);
  close(respipe[1]);
  spdlog::debug("cjail_exec pid={} childpid={} boxdir={} command={}",
      getpid(), pid, opt.boxdir, fmt::format("{}", opt.command));
  if (!WriteAll(ctlpipe[1], &size, sizeof(size)) || !WriteAll(ctlpipe[1], vec.data(), vec.size())) {
    int saved = errno;
    close(ctlpipe[1]);
    close(respipe[0]);
    kill(-pid, SIGKILL);
    waitpid(pid, nullptr, 0);
    errno = saved;
    goto err;
  }
  close(ctlpipe[1]);
  proc.pid = pid;
  proc.result_fd = respipe[0];
  return true;
err:
  spdlog::warn("SpawnSandbox error: errno={} {}", errno, strerror(errno));
  return false;
}
