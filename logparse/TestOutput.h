#ifndef FIXBENCH_LOGPARSE_TESTOUTPUT_H
#define FIXBENCH_LOGPARSE_TESTOUTPUT_H

#include "llvm/ADT/StringRef.h"

#include <string>
#include <vector>

namespace fixbench {

struct TestCounts {
  unsigned Passed = 0;
  unsigned Failed = 0;
  unsigned Total = 0;
};

struct NamedTestResult {
  std::string Name;
  bool Passed = false;
};

/// Extracts pass/fail/total counts from test harness output. The first
/// recognized convention wins:
///   "Results: X/Y tests passed"
///   "X passed ... Y failed" (same line)
///   "Tests: X passed, Y failed, Z total"
///   lines starting with PASS / FAIL, optionally bracketed
///   "... OK" / "... FAIL" markers
///   "Assertion ... failed" lines, each counted as one failure
/// Unrecognized output yields all zeros.
TestCounts parseTestOutput(llvm::StringRef Text);

/// Individual results from "[PASS] name" / "[FAIL] name" lines.
std::vector<NamedTestResult> parseNamedTestResults(llvm::StringRef Text);

} // namespace fixbench

#endif // FIXBENCH_LOGPARSE_TESTOUTPUT_H
