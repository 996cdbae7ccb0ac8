#ifndef INCLUDE_POLYRUN_BROKER_H_
#define INCLUDE_POLYRUN_BROKER_H_

#include <memory>
#include <optional>
#include <string>

#include "language.h"
#include "execution.h"
#include "scheduler.h"

// Call from main thread after the configuration is loaded;
// registry is frozen from here on. Returns false if already initialized.
bool InitBroker(LanguageRegistry&& registry);
// nullptr before InitBroker / after ShutdownBroker
Scheduler* GetBroker();
void ShutdownBroker();

// Called from any thread. Blocks only the calling thread.
ExecutionResult Execute(const std::string& language, const std::string& source,
                        const std::optional<std::string>& input, const std::string& caller_id);
PendingExecution SubmitExecution(ExecutionRequest&&);

#endif  // INCLUDE_POLYRUN_BROKER_H_
