#ifndef POLYRUN_CPUSET_H_
#define POLYRUN_CPUSET_H_

#include <sched.h>

/*
 * Parses a comma-separated list of CPUs and ranges ("0,2-5,8-15:2").
 * Use "all" for all CPUs, "none" for none of the CPUs.
 * CPUs at or beyond ncpu are ignored.
 */
bool CpusetParse(const char* str, cpu_set_t* set, size_t ncpu);

#endif  // POLYRUN_CPUSET_H_
