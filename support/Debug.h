#ifndef FIXBENCH_SUPPORT_DEBUG_H
#define FIXBENCH_SUPPORT_DEBUG_H

namespace fixbench {

/// True when FIXBENCH_DEBUG is set to a non-empty value or verbose output was
/// requested on the command line.
bool isDebugLoggingEnabled();

void setDebugLogging(bool Enabled);

} // namespace fixbench

#endif // FIXBENCH_SUPPORT_DEBUG_H
