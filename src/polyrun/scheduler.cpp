#include <polyrun/scheduler.h>

#include <atomic>
#include <algorithm>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <polyrun/utils.h>

struct Ticket {
  long id;
  ExecutionRequest request;
  const LanguageProfile* profile;
  TicketState state;
  CancelToken cancel;
  std::promise<ExecutionResult> promise;
  // finished but waiting for earlier tickets of the same caller
  std::optional<ExecutionResult> result;

  Ticket(long id, ExecutionRequest&& request, const LanguageProfile* profile) :
      id(id), request(std::move(request)), profile(profile), state(TicketState::QUEUED) {}
};

namespace {

std::atomic_long ticket_id_seq = 0;

} // namespace

/// PendingExecution

PendingExecution::PendingExecution(Scheduler* scheduler, std::shared_ptr<Ticket> ticket,
                                   std::shared_future<ExecutionResult> future) :
    scheduler_(scheduler), ticket_(std::move(ticket)), future_(std::move(future)), retrieved_(false) {}

PendingExecution::PendingExecution(ExecutionResult&& result) :
    scheduler_(nullptr), retrieved_(false) {
  std::promise<ExecutionResult> promise;
  promise.set_value(std::move(result));
  future_ = promise.get_future().share();
}

PendingExecution::PendingExecution(PendingExecution&& x) noexcept :
    scheduler_(x.scheduler_), ticket_(std::move(x.ticket_)), future_(std::move(x.future_)),
    retrieved_(x.retrieved_) {
  x.scheduler_ = nullptr;
}

PendingExecution& PendingExecution::operator=(PendingExecution&& x) noexcept {
  if (this == &x) return *this;
  if (!retrieved_) Cancel();
  scheduler_ = x.scheduler_;
  ticket_ = std::move(x.ticket_);
  future_ = std::move(x.future_);
  retrieved_ = x.retrieved_;
  x.scheduler_ = nullptr;
  return *this;
}

PendingExecution::~PendingExecution() {
  if (!retrieved_) Cancel();
}

ExecutionResult PendingExecution::Get() {
  if (!future_.valid()) return ExecutionResult(Outcome::INTERNAL_ERROR, "invalid execution handle");
  retrieved_ = true;
  return future_.get();
}

bool PendingExecution::Ready() const {
  return future_.valid() && future_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

bool PendingExecution::Cancel() {
  if (!scheduler_ || !ticket_ || Ready()) return false;
  return scheduler_->Cancel(ticket_);
}

/// Scheduler

Scheduler::Scheduler(std::shared_ptr<const LanguageRegistry> registry, std::shared_ptr<Runner> runner,
                     int max_parallel, int max_per_caller) :
    registry_(std::move(registry)), runner_(std::move(runner)),
    max_parallel_(std::max(1, max_parallel)), max_per_caller_(max_per_caller),
    running_(0), shutdown_(false) {
  for (int i = 0; i < max_parallel_; i++) {
    workers_.emplace_back(&Scheduler::WorkerLoop, this, i);
  }
  spdlog::info("Scheduler started: parallel={} per_caller={} languages={}",
               max_parallel_, max_per_caller_, registry_->Size());
}

Scheduler::~Scheduler() {
  Shutdown();
}

PendingExecution Scheduler::Submit(ExecutionRequest&& req) {
  const LanguageProfile* profile = registry_->Resolve(req.language);
  if (!profile) {
    spdlog::info("Unknown language {} from caller {}", req.language, req.caller_id);
    return PendingExecution(ExecutionResult(Outcome::NOT_FOUND, "unknown language: " + req.language));
  }
  if (!req.limits.Valid()) {
    return PendingExecution(ExecutionResult(Outcome::REJECTED, "invalid limits"));
  }
  req.limits = registry_->EffectiveLimits(*profile, req.limits);
  std::string caller_id = req.caller_id;
  auto ticket = std::make_shared<Ticket>(++ticket_id_seq, std::move(req), profile);
  std::shared_future<ExecutionResult> future = ticket->promise.get_future().share();
  {
    std::lock_guard lck(mtx_);
    if (shutdown_) {
      return PendingExecution(ExecutionResult(Outcome::REJECTED, "broker is shutting down"));
    }
    auto& order = callers_[caller_id].order;
    if (max_per_caller_ > 0 && order.size() >= (size_t)max_per_caller_) {
      spdlog::info("Rejected execution from caller {}: {} pending", caller_id, order.size());
      return PendingExecution(ExecutionResult(Outcome::REJECTED, fmt::format(
          "too many pending executions (at most {} per caller)", max_per_caller_)));
    }
    order.push_back(ticket);
    queue_.push_back(ticket);
    spdlog::info("Execution queued: ticket={} caller={} language={} queue={}",
                 ticket->id, caller_id, profile->id, queue_.size());
  }
  cv_.notify_one();
  return PendingExecution(this, std::move(ticket), std::move(future));
}

void Scheduler::WorkerLoop(int worker_id) {
  std::unique_lock lck(mtx_);
  while (true) {
    cv_.wait(lck, [this]() { return shutdown_ || !queue_.empty(); });
    if (queue_.empty()) break;
    std::shared_ptr<Ticket> ticket = queue_.front();
    queue_.pop_front();
    ticket->state = TicketState::RUNNING;
    running_++;
    lck.unlock();

    spdlog::debug("Worker {} dispatching ticket={}", worker_id, ticket->id);
    ExecutionResult res;
    try {
      res = runner_->Run(*registry_, *ticket->profile, ticket->request, ticket->cancel);
    } catch (const std::exception& err) {
      spdlog::error("Runner failed on ticket={}: {}", ticket->id, err.what());
      res = ExecutionResult(Outcome::INTERNAL_ERROR, ticket->profile->id + ": " + err.what());
    }

    lck.lock();
    running_--;
    Complete(ticket, std::move(res));
  }
  spdlog::debug("Worker {} stopped", worker_id);
}

void Scheduler::Complete(const std::shared_ptr<Ticket>& ticket, ExecutionResult&& res) {
  ticket->state = res.outcome == Outcome::CANCELLED ? TicketState::CANCELLED : TicketState::COMPLETED;
  spdlog::debug("Ticket {} {}: {}", ticket->id, TicketStateName(ticket->state), OutcomeName(res.outcome));
  ticket->result = std::move(res);
  Deliver(ticket->request.caller_id);
}

void Scheduler::Deliver(const std::string& caller_id) {
  auto it = callers_.find(caller_id);
  if (it == callers_.end()) return;
  auto& order = it->second.order;
  while (!order.empty() && order.front()->result) {
    std::shared_ptr<Ticket> ticket = order.front();
    order.pop_front();
    ticket->promise.set_value(std::move(*ticket->result));
    ticket->result.reset();
  }
  if (order.empty()) callers_.erase(it);
}

void Scheduler::Drop(std::shared_ptr<Ticket> ticket, const std::string& message) {
  queue_.erase(std::remove(queue_.begin(), queue_.end(), ticket), queue_.end());
  const std::string& caller_id = ticket->request.caller_id;
  if (auto it = callers_.find(caller_id); it != callers_.end()) {
    auto& order = it->second.order;
    order.erase(std::remove(order.begin(), order.end(), ticket), order.end());
  }
  ticket->state = TicketState::CANCELLED;
  ticket->promise.set_value(ExecutionResult(Outcome::CANCELLED, message));
  spdlog::info("Ticket {} cancelled before start", ticket->id);
  // later tickets of the caller may have been waiting for this one
  Deliver(caller_id);
}

bool Scheduler::Cancel(const std::shared_ptr<Ticket>& ticket) {
  std::lock_guard lck(mtx_);
  switch (ticket->state) {
    case TicketState::QUEUED:
      Drop(ticket, "cancelled before start");
      return true;
    case TicketState::RUNNING:
      spdlog::info("Cancelling running ticket {}", ticket->id);
      ticket->cancel.Cancel();
      return true;
    case TicketState::COMPLETED: [[fallthrough]];
    case TicketState::CANCELLED:
      return false;
  }
  __builtin_unreachable();
}

void Scheduler::Shutdown() {
  {
    std::lock_guard lck(mtx_);
    if (!shutdown_) spdlog::info("Scheduler shutting down: queued={} running={}", queue_.size(), running_);
    shutdown_ = true;
    while (!queue_.empty()) Drop(queue_.front(), "broker is shutting down");
    for (auto& caller : callers_) {
      for (auto& ticket : caller.second.order) {
        if (ticket->state == TicketState::RUNNING) ticket->cancel.Cancel();
      }
    }
  }
  cv_.notify_all();
  for (auto& worker : workers_) {
    if (worker.joinable()) worker.join();
  }
  workers_.clear();
}

size_t Scheduler::QueuedCount() const {
  std::lock_guard lck(mtx_);
  return queue_.size();
}

int Scheduler::RunningCount() const {
  std::lock_guard lck(mtx_);
  return running_;
}
