#ifndef POLYRUN_SANDBOX_EXEC_H_
#define POLYRUN_SANDBOX_EXEC_H_

#include <sys/types.h>

#include "sandbox.h"

// We separate this from sandbox.h because this function needs libpolyrun and other logging functions,
//   while we need to keep sandbox.h as small as possible

// The jail runs in the sandbox-exec helper so that cjail never runs inside the threaded broker.
// The helper is the leader of its own process group; killing the group tears down the jail,
//   whose pid namespace takes all descendants of the program with it.
// Inside the helper, the given stdin/stdout/stderr pipes are renumbered to
//   kHelperInputFd, kHelperOutputFd and kHelperErrorFd; opt.fd_* are overwritten accordingly.
constexpr int kHelperInputFd = 3, kHelperOutputFd = 4, kHelperErrorFd = 5;

struct SandboxProcess {
  pid_t pid;
  int result_fd; // yields one struct cjail_result, then EOF; owned by caller
};

// All fds must be O_CLOEXEC so that concurrent spawns do not inherit each other's pipes.
// Returns false (with errno set) if the helper could not be started.
bool SpawnSandbox(SandboxOptions opt, int input_fd, int output_fd, int error_fd, SandboxProcess& proc);

#endif  // POLYRUN_SANDBOX_EXEC_H_
