#ifndef INCLUDE_POLYRUN_EXECUTION_H_
#define INCLUDE_POLYRUN_EXECUTION_H_

#include <string>
#include <optional>

#include <sched.h>

// Process-wide configuration; set before InitBroker and never changed afterwards
extern int kMaxParallel; // global number of execution slots
extern int kMaxPerCaller; // queued + running per caller
extern cpu_set_t kPinnedCpus;
extern long kMaxOutput; // bytes kept per stream
extern long kWorkAreaSize; // KiB, tmpfs size of a work area

// All fields are optional; 0 means "not set" and falls through to the next layer
struct Limits {
  long wall_time; // us
  long cpu_time; // us
  long memory; // KiB (cgroup RSS)
  int proc_num; // processes & threads of the sandbox uid
  long fsize; // KiB

  Limits() : wall_time(0), cpu_time(0), memory(0), proc_num(0), fsize(0) {}
  Limits(long wall_time, long cpu_time, long memory, int proc_num = 0, long fsize = 0) :
      wall_time(wall_time), cpu_time(cpu_time), memory(memory), proc_num(proc_num), fsize(fsize) {}

  bool Valid() const {
    return wall_time >= 0 && cpu_time >= 0 && memory >= 0 && proc_num >= 0 && fsize >= 0;
  }
  // fill unset fields of *this from fallback
  Limits& Fill(const Limits& fallback);
  // lower every field to max where max is set
  Limits& Clamp(const Limits& max);
};

extern Limits kDefaultLimits; // used when a profile does not set a field
extern Limits kMaxLimits; // upper bound of any override

#define ENUM_OUTCOME_ \
  X(SUCCESS, "OK", "Success") \
  X(COMPILE_ERROR, "CE", "Compile Error") \
  X(RUNTIME_ERROR, "RE", "Runtime Error") \
  X(TIMEOUT, "TLE", "Timeout") \
  X(RESOURCE_EXCEEDED, "RLE", "Resource Limit Exceeded") \
  X(INTERNAL_ERROR, "IE", "Internal Error") \
  /* broker signals; no process was run to completion */ \
  X(NOT_FOUND, "NF", "Unknown Language") \
  X(REJECTED, "RJ", "Rejected") \
  X(CANCELLED, "CAN", "Cancelled")
enum class Outcome {
#define X(name, abr, desc) name,
  ENUM_OUTCOME_
#undef X
};

class ExecutionRequest {
 public:
  std::string language;
  std::string source;
  std::optional<std::string> input; // stdin of the final stage
  Limits limits; // overrides; replaced by the effective limits on admission
  // opaque; only used for per-caller admission and dropped with the request
  std::string caller_id;

  ExecutionRequest() {}
  ExecutionRequest(std::string language, std::string source,
                   std::optional<std::string> input, std::string caller_id) :
      language(std::move(language)),
      source(std::move(source)),
      input(std::move(input)),
      caller_id(std::move(caller_id)) {}
};

class ExecutionResult {
 public:
  Outcome outcome;
  std::string output, error; // stdout & stderr, truncated with a marker
  std::optional<int> exit_code; // absent unless a final stage exited on its own or by a signal
  std::optional<int> term_signal;
  std::string stage; // stage that decided the outcome
  std::string message; // explanation of broker signals & internal errors
  long wall_time; // us, whole execution
  long cpu_time; // us, sum of all stages
  long peak_memory; // KiB, best-effort maximum RSS

  ExecutionResult() :
      outcome(Outcome::INTERNAL_ERROR), wall_time(0), cpu_time(0), peak_memory(0) {}
  explicit ExecutionResult(Outcome outcome, std::string message = "") :
      outcome(outcome), message(std::move(message)),
      wall_time(0), cpu_time(0), peak_memory(0) {}
};

#endif  // INCLUDE_POLYRUN_EXECUTION_H_
