#ifndef INCLUDE_POLYRUN_RUNNER_H_
#define INCLUDE_POLYRUN_RUNNER_H_

#include <mutex>
#include <atomic>
#include <vector>

#include "execution.h"
#include "language.h"

// One-shot cancellation flag that can also be polled as a file descriptor
class CancelToken {
  int fd_; // eventfd
  std::atomic<bool> cancelled_;
 public:
  CancelToken();
  ~CancelToken();
  CancelToken(const CancelToken&) = delete;
  CancelToken& operator=(const CancelToken&) = delete;

  // safe to call from any thread, any number of times
  void Cancel();
  bool IsCancelled() const { return cancelled_.load(); }
  // readable after Cancel(); -1 if the eventfd could not be created
  int Fd() const { return fd_; }
};

class Runner {
 public:
  virtual ~Runner() = default;
  // must translate every failure into an ExecutionResult; request.limits are effective limits
  virtual ExecutionResult Run(const LanguageRegistry&, const LanguageProfile&,
                              const ExecutionRequest&, const CancelToken&) = 0;
};

class SandboxRunner : public Runner {
  std::mutex pool_mtx_;
  std::vector<int> uid_pool_, cpuid_pool_;

  bool AcquireSlot(int& uid, int& cpuid);
  void ReleaseSlot(int uid, int cpuid);
 public:
  static constexpr int kUidBase = 50000, kUidPoolSize = 100;

  SandboxRunner();
  ExecutionResult Run(const LanguageRegistry&, const LanguageProfile&,
                      const ExecutionRequest&, const CancelToken&) override;
};

#endif  // INCLUDE_POLYRUN_RUNNER_H_
