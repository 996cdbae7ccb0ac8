#include <polyrun/execution.h>

#include <algorithm>

int kMaxParallel = 2;
int kMaxPerCaller = 2;
cpu_set_t kPinnedCpus = {};
long kMaxOutput = 16 * 1024; // 16 KiB
long kWorkAreaSize = 64 * 1024; // 64M

Limits kDefaultLimits(5'000'000, 5'000'000, 256 * 1024, 32, 16 * 1024);
Limits kMaxLimits(60'000'000, 60'000'000, 2 * 1024 * 1024, 256, 256 * 1024);

Limits& Limits::Fill(const Limits& fallback) {
  if (!wall_time) wall_time = fallback.wall_time;
  if (!cpu_time) cpu_time = fallback.cpu_time;
  if (!memory) memory = fallback.memory;
  if (!proc_num) proc_num = fallback.proc_num;
  if (!fsize) fsize = fallback.fsize;
  return *this;
}

Limits& Limits::Clamp(const Limits& max) {
  auto Lower = [](auto& val, auto mx) {
    if (mx > 0 && (val <= 0 || val > mx)) val = mx;
  };
  Lower(wall_time, max.wall_time);
  Lower(cpu_time, max.cpu_time);
  Lower(memory, max.memory);
  Lower(proc_num, max.proc_num);
  Lower(fsize, max.fsize);
  return *this;
}
