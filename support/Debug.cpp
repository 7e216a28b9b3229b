#include "Debug.h"

#include <atomic>
#include <cstdlib>

namespace fixbench {

namespace {

std::atomic<int> &debugFlag() {
  static std::atomic<int> Enabled([]() {
    const char *Env = std::getenv("FIXBENCH_DEBUG");
    return (Env && *Env) ? 1 : 0;
  }());
  return Enabled;
}

} // namespace

bool isDebugLoggingEnabled() { return debugFlag().load() != 0; }

void setDebugLogging(bool Enabled) { debugFlag().store(Enabled ? 1 : 0); }

} // namespace fixbench
