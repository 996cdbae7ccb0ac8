#ifndef INCLUDE_POLYRUN_UTILS_H_
#define INCLUDE_POLYRUN_UTILS_H_

#include <string>

#include <nlohmann/json_fwd.hpp>
#include "execution.h"
#include "scheduler.h"

long GetUniqueExecutionId();

const char* OutcomeName(Outcome);
const char* OutcomeToAbr(Outcome);
const char* OutcomeToDesc(Outcome);
// accepts names and abbreviations; INTERNAL_ERROR for unknown strings
Outcome GetOutcome(const std::string&);

// logging
const char* TicketStateName(TicketState);

std::string TruncationMarker(size_t limit);

// Keeps the first `limit` bytes of a stream and counts the rest
class OutputCapture {
  std::string data_;
  size_t limit_;
  size_t total_;
 public:
  explicit OutputCapture(size_t limit) : limit_(limit), total_(0) {}

  void Append(const char* buf, size_t len);
  bool Truncated() const { return total_ > limit_; }
  size_t TotalBytes() const { return total_; }
  const std::string& Data() const { return data_; }
  // data with the truncation marker appended if needed
  std::string Str() const { return Str(limit_); }
  // same, but cut to at most limit bytes
  std::string Str(size_t limit) const;
};

nlohmann::json ResultToJson(const ExecutionResult&);
// field names as in ResultToJson; limits in ms / MiB
Limits LimitsFromJson(const nlohmann::json&);

#endif  // INCLUDE_POLYRUN_UTILS_H_
