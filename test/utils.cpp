#include "utils.h"

#include <thread>
#include <algorithm>

ExecutionResult FakeRunner::Run(const LanguageRegistry&, const LanguageProfile& profile,
                                const ExecutionRequest& req, const CancelToken& cancel) {
  std::unique_lock lck(mtx_);
  running_++;
  max_running_ = std::max(max_running_, running_);
  started_.push_back(req.source);
  limits_.push_back(req.limits);
  cv_.notify_all();

  auto deadline = std::chrono::steady_clock::time_point::max();
  bool wait = req.source == "block";
  if (req.source.compare(0, 6, "sleep:") == 0) {
    wait = true;
    deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(std::stol(req.source.substr(6)));
  }
  bool cancelled = false;
  while (wait) {
    if (cancel.IsCancelled()) {
      cancelled = true;
      break;
    }
    if (released_ || std::chrono::steady_clock::now() >= deadline) break;
    cv_.wait_for(lck, std::chrono::milliseconds(5));
  }

  ExecutionResult ret(Outcome::SUCCESS);
  ret.stage = profile.stages.back().name;
  if (cancelled) {
    cancelled_++;
    ret = ExecutionResult(Outcome::CANCELLED, "cancelled");
  } else {
    ret.exit_code = 0;
    ret.output = req.source == "echo" ? req.input.value_or("") : req.source;
  }
  running_--;
  cv_.notify_all();
  return ret;
}

void FakeRunner::Release() {
  std::lock_guard lck(mtx_);
  released_ = true;
  cv_.notify_all();
}

bool FakeRunner::WaitStarted(size_t num, std::chrono::milliseconds timeout) {
  std::unique_lock lck(mtx_);
  return cv_.wait_for(lck, timeout, [&]() { return started_.size() >= num; });
}

bool FakeRunner::WaitCancelled(int num, std::chrono::milliseconds timeout) {
  std::unique_lock lck(mtx_);
  return cv_.wait_for(lck, timeout, [&]() { return cancelled_ >= num; });
}

int FakeRunner::MaxRunning() {
  std::lock_guard lck(mtx_);
  return max_running_;
}

std::vector<std::string> FakeRunner::Started() {
  std::lock_guard lck(mtx_);
  return started_;
}

std::vector<Limits> FakeRunner::StartedLimits() {
  std::lock_guard lck(mtx_);
  return limits_;
}

std::shared_ptr<const LanguageRegistry> BuiltinRegistry() {
  static auto registry = std::make_shared<const LanguageRegistry>(LanguageRegistry::Builtin());
  return registry;
}
