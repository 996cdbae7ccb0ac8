#include "cpuset.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace {

bool ParseNumber(const char*& p, unsigned long& val) {
  if (!isdigit((unsigned char)*p)) return false;
  char* end;
  errno = 0;
  val = strtoul(p, &end, 10);
  if (errno || end == p) return false;
  p = end;
  return true;
}

} // namespace

bool CpusetParse(const char* str, cpu_set_t* set, size_t ncpu) {
  CPU_ZERO(set);
  if (strcmp(str, "all") == 0) {
    for (size_t i = 0; i < ncpu && i < CPU_SETSIZE; i++) CPU_SET(i, set);
    return true;
  }
  if (strcmp(str, "none") == 0) return true;

  const char* p = str;
  while (true) {
    unsigned long a, b, stride = 1;
    if (!ParseNumber(p, a)) return false;
    b = a;
    if (*p == '-') {
      p++;
      if (!ParseNumber(p, b) || b < a) return false;
      if (*p == ':') {
        p++;
        if (!ParseNumber(p, stride) || stride == 0) return false;
      }
    }
    for (unsigned long i = a; i <= b && i < ncpu && i < CPU_SETSIZE; i += stride) CPU_SET(i, set);
    if (*p == '\0') return true;
    if (*p != ',') return false;
    p++;
  }
}
