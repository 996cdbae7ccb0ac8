#ifndef LINE_SERVER_H_
#define LINE_SERVER_H_

#include <istream>
#include <ostream>

#include <polyrun/scheduler.h>

// Line-delimited JSON front end of the broker.
//   request: {"id": ..., "language": "...", "source": "...", "stdin"?: "...", "caller"?: "...",
//             "limits"?: {"wall_time_ms", "cpu_time_ms", "memory_mb", "proc_num"}}
//   cancel:  {"id": ..., "cancel": true}
//   reply:   {"id": ..., <ResultToJson>} or {"id": ..., "error": "..."}
// Replies are written as soon as results are delivered, one per line.
// Returns at EOF after every pending request got its reply (those still pending are cancelled).
// The return value is the number of lines answered with an error.
int ServeLoop(Scheduler& scheduler, std::istream& in, std::ostream& out);

#endif  // LINE_SERVER_H_
