#include "cpuset.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace {

// parse an unsigned decimal number at str; end is set to the first unparsed char
bool NextNumber(const char *str, const char **end, unsigned int *result) {
  if (str == nullptr || !isdigit((unsigned char)*str)) return false;
  char *p;
  errno = 0;
  unsigned long val = strtoul(str, &p, 10);
  if (errno || p == str) return false;
  *result = val;
  *end = p;
  return true;
}

} // namespace

bool CpusetParse(const char *str, cpu_set_t *set, size_t ncpu) {
  CPU_ZERO(set);
  if (strcmp(str, "all") == 0) {
    for (size_t i = 0; i < ncpu; i++) CPU_SET(i, set);
    return true;
  }
  if (strcmp(str, "none") == 0) return true;

  const char *p = str;
  while (true) {
    unsigned int a, b, s = 1; // range [a, b] with stride s
    if (!NextNumber(p, &p, &a)) return false;
    b = a;
    if (*p == '-') {
      if (!NextNumber(p + 1, &p, &b)) return false;
      if (*p == ':') {
        if (!NextNumber(p + 1, &p, &s) || s == 0) return false;
      }
    }
    if (a > b) return false;
    for (; a <= b && a < ncpu; a += s) CPU_SET(a, set);
    if (*p == '\0') return true;
    if (*p != ',') return false;
    p++;
  }
}
