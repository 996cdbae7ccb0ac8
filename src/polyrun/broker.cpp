#include <polyrun/broker.h>

#include <mutex>

#include <spdlog/spdlog.h>
#include <polyrun/runner.h>

namespace {

std::mutex broker_mtx;
std::shared_ptr<Scheduler> broker;

std::shared_ptr<Scheduler> CurrentBroker() {
  std::lock_guard lck(broker_mtx);
  return broker;
}

} // namespace

bool InitBroker(LanguageRegistry&& registry) {
  std::lock_guard lck(broker_mtx);
  if (broker) {
    spdlog::warn("Broker already initialized");
    return false;
  }
  broker = std::make_shared<Scheduler>(
      std::make_shared<const LanguageRegistry>(std::move(registry)),
      std::make_shared<SandboxRunner>(), kMaxParallel, kMaxPerCaller);
  return true;
}

Scheduler* GetBroker() {
  return CurrentBroker().get();
}

void ShutdownBroker() {
  std::shared_ptr<Scheduler> tmp;
  {
    std::lock_guard lck(broker_mtx);
    tmp.swap(broker);
  }
  if (tmp) tmp->Shutdown();
}

ExecutionResult Execute(const std::string& language, const std::string& source,
                        const std::optional<std::string>& input, const std::string& caller_id) {
  auto scheduler = CurrentBroker();
  if (!scheduler) return ExecutionResult(Outcome::INTERNAL_ERROR, "broker is not running");
  return scheduler->Execute(ExecutionRequest(language, source, input, caller_id));
}

PendingExecution SubmitExecution(ExecutionRequest&& req) {
  auto scheduler = CurrentBroker();
  if (!scheduler) return PendingExecution(ExecutionResult(Outcome::INTERNAL_ERROR, "broker is not running"));
  return scheduler->Submit(std::move(req));
}
