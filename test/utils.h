#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <mutex>
#include <chrono>
#include <vector>
#include <condition_variable>

#include <gtest/gtest.h>
#include <polyrun/runner.h>
#include <polyrun/scheduler.h>

// Runner that never spawns anything. The source selects the behavior:
//   "block"     waits until Release() or cancellation
//   "sleep:<n>" waits n milliseconds (cancellable)
//   "echo"      prints its stdin
//   otherwise   prints the source
class FakeRunner : public Runner {
  std::mutex mtx_;
  std::condition_variable cv_;
  bool released_;
  int running_, max_running_, cancelled_;
  std::vector<std::string> started_;
  std::vector<Limits> limits_;
 public:
  FakeRunner() : released_(false), running_(0), max_running_(0), cancelled_(0) {}

  ExecutionResult Run(const LanguageRegistry&, const LanguageProfile&,
                      const ExecutionRequest&, const CancelToken&) override;

  void Release();
  // false on timeout
  bool WaitStarted(size_t num, std::chrono::milliseconds timeout = std::chrono::seconds(5));
  bool WaitCancelled(int num, std::chrono::milliseconds timeout = std::chrono::seconds(5));
  int MaxRunning();
  std::vector<std::string> Started();
  std::vector<Limits> StartedLimits();
};

std::shared_ptr<const LanguageRegistry> BuiltinRegistry();

#endif // TEST_UTILS_H_
