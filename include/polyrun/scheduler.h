#ifndef INCLUDE_POLYRUN_SCHEDULER_H_
#define INCLUDE_POLYRUN_SCHEDULER_H_

#include <deque>
#include <mutex>
#include <memory>
#include <thread>
#include <future>
#include <vector>
#include <unordered_map>
#include <condition_variable>

#include "runner.h"
#include "language.h"
#include "execution.h"

#define ENUM_TICKET_STATE_ \
  X(QUEUED) \
  X(RUNNING) \
  X(COMPLETED) \
  X(CANCELLED)
enum class TicketState {
#define X(name) name,
  ENUM_TICKET_STATE_
#undef X
};

class Scheduler;
struct Ticket;

// Caller-side handle of a submitted request.
// Dropping a handle whose result was not retrieved cancels the request.
// A handle must not outlive its scheduler unless its result is ready.
class PendingExecution {
  Scheduler* scheduler_;
  std::shared_ptr<Ticket> ticket_;
  std::shared_future<ExecutionResult> future_;
  bool retrieved_;

  friend class Scheduler;
  PendingExecution(Scheduler*, std::shared_ptr<Ticket>, std::shared_future<ExecutionResult>);
 public:
  // an immediately available result (NOT_FOUND, REJECTED)
  explicit PendingExecution(ExecutionResult&&);
  PendingExecution(PendingExecution&&) noexcept;
  PendingExecution& operator=(PendingExecution&&) noexcept;
  PendingExecution(const PendingExecution&) = delete;
  PendingExecution& operator=(const PendingExecution&) = delete;
  ~PendingExecution();

  // blocks until the result is delivered
  ExecutionResult Get();
  bool Ready() const;
  // false if the result was already produced
  bool Cancel();
  // true if the request got a ticket (it was neither NOT_FOUND nor REJECTED)
  bool Admitted() const { return ticket_ != nullptr; }
};

class Scheduler {
  struct CallerState {
    // admitted and not yet delivered, in submission order
    std::deque<std::shared_ptr<Ticket>> order;
  };

  std::shared_ptr<const LanguageRegistry> registry_;
  std::shared_ptr<Runner> runner_;
  const int max_parallel_, max_per_caller_;

  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::deque<std::shared_ptr<Ticket>> queue_;
  std::unordered_map<std::string, CallerState> callers_;
  std::vector<std::thread> workers_;
  int running_;
  bool shutdown_;

  void WorkerLoop(int worker_id);
  // must hold mtx_
  void Complete(const std::shared_ptr<Ticket>&, ExecutionResult&&);
  void Deliver(const std::string& caller_id);
  void Drop(std::shared_ptr<Ticket>, const std::string& message);
 public:
  Scheduler(std::shared_ptr<const LanguageRegistry> registry, std::shared_ptr<Runner> runner,
            int max_parallel, int max_per_caller);
  ~Scheduler();
  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;

  // never blocks on execution; NOT_FOUND and REJECTED are decided here
  // request.limits are replaced by the effective limits
  PendingExecution Submit(ExecutionRequest&&);
  ExecutionResult Execute(ExecutionRequest&& req) { return Submit(std::move(req)).Get(); }
  bool Cancel(const std::shared_ptr<Ticket>&);
  // cancel everything and join the workers; further submissions are rejected
  void Shutdown();

  size_t QueuedCount() const;
  int RunningCount() const;
  const LanguageRegistry& Registry() const { return *registry_; }
};

#endif  // INCLUDE_POLYRUN_SCHEDULER_H_
