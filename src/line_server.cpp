#include "line_server.h"

#include <map>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <polyrun/utils.h>

namespace {

using nlohmann::json;

const char kDefaultCaller[] = "serve";
constexpr auto kReapInterval = std::chrono::milliseconds(10);

class LineServer {
  struct Pending {
    json id;
    PendingExecution handle;
  };

  Scheduler& scheduler_;
  std::ostream& out_;
  std::mutex out_mtx_, pending_mtx_;
  std::condition_variable cv_;
  std::map<std::string, Pending> pending_; // keyed by dumped id
  bool closing_;
  int errors_;
  // one thread collects every result, however many callers there are
  std::thread reaper_;

  void Write(const json& obj) {
    std::lock_guard lck(out_mtx_);
    out_ << obj.dump(-1, ' ', false, json::error_handler_t::replace) << '\n';
    out_.flush();
  }

  void WriteError(const json& id, const std::string& msg) {
    spdlog::info("Request {}: {}", id.dump(), msg);
    errors_++;
    Write(json{{"id", id}, {"error", msg}});
  }

  void WriteResult(const json& id, const ExecutionResult& res) {
    json obj = ResultToJson(res);
    obj["id"] = id;
    Write(obj);
  }

  void ReapLoop() {
    std::unique_lock lck(pending_mtx_);
    while (true) {
      for (auto it = pending_.begin(); it != pending_.end();) {
        if (!it->second.handle.Ready()) {
          ++it;
          continue;
        }
        WriteResult(it->second.id, it->second.handle.Get());
        it = pending_.erase(it);
      }
      if (closing_ && pending_.empty()) break;
      cv_.wait_for(lck, kReapInterval);
    }
  }

  void HandleCancel(const json& id) {
    std::lock_guard lck(pending_mtx_);
    auto it = pending_.find(id.dump());
    if (it == pending_.end()) return WriteError(id, "no pending request with this id");
    // the reply of the cancelled request carries the outcome
    it->second.handle.Cancel();
    cv_.notify_one();
  }

  void HandleRequest(const json& id, const json& req) {
    std::string key = id.dump();
    {
      std::lock_guard lck(pending_mtx_);
      if (pending_.count(key)) return WriteError(id, "duplicate id");
    }
    ExecutionRequest request;
    request.language = req.at("language").get<std::string>();
    request.source = req.at("source").get<std::string>();
    if (req.contains("stdin") && !req["stdin"].is_null()) request.input = req["stdin"].get<std::string>();
    request.caller_id = req.value("caller", std::string(kDefaultCaller));
    if (req.contains("limits")) {
      request.limits = LimitsFromJson(req["limits"]);
      request.limits.fsize = 0; // not a per-request knob
    }
    PendingExecution handle = scheduler_.Submit(std::move(request));
    if (!handle.Admitted()) return WriteResult(id, handle.Get());
    std::lock_guard lck(pending_mtx_);
    pending_.emplace(key, Pending{id, std::move(handle)});
  }

 public:
  LineServer(Scheduler& scheduler, std::ostream& out) :
      scheduler_(scheduler), out_(out), closing_(false), errors_(0),
      reaper_(&LineServer::ReapLoop, this) {}

  void HandleLine(const std::string& line) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) return;
    json req = json::parse(line, nullptr, false);
    if (req.is_discarded() || !req.is_object()) return WriteError(nullptr, "malformed request");
    json id = req.contains("id") ? req["id"] : json(nullptr);
    if (id.is_null()) return WriteError(nullptr, "missing id");
    try {
      if (req.value("cancel", false)) {
        HandleCancel(id);
      } else {
        HandleRequest(id, req);
      }
    } catch (const json::exception& err) {
      WriteError(id, std::string("malformed request: ") + err.what());
    }
  }

  int Finish() {
    {
      std::lock_guard lck(pending_mtx_);
      if (pending_.size()) spdlog::info("Input closed; cancelling {} pending requests", pending_.size());
      for (auto& i : pending_) i.second.handle.Cancel();
      closing_ = true;
    }
    cv_.notify_one();
    reaper_.join();
    return errors_;
  }
};

} // namespace

int ServeLoop(Scheduler& scheduler, std::istream& in, std::ostream& out) {
  LineServer server(scheduler, out);
  for (std::string line; std::getline(in, line);) server.HandleLine(line);
  return server.Finish();
}
