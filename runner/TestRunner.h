#ifndef FIXBENCH_RUNNER_TESTRUNNER_H
#define FIXBENCH_RUNNER_TESTRUNNER_H

#include "logparse/SanitizerReport.h"
#include "logparse/TestOutput.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"

#include <string>
#include <vector>

namespace fixbench {

class BuildSandbox;

struct TestOutcome {
  unsigned Passed = 0;
  unsigned Failed = 0;
  unsigned Errors = 0;
  unsigned Skipped = 0;
  /// As reported by the harness, or 1 when only the exit status was usable.
  unsigned Total = 0;
  bool Success = false;
  bool TimedOut = false;
  std::string Output;
  double ElapsedSeconds = 0.0;
  llvm::Optional<std::string> CompilationError;
  llvm::Optional<SanitizerReport> Sanitizers;
  std::vector<NamedTestResult> Cases;

  bool hasSanitizerErrors() const {
    return Sanitizers && Sanitizers->hasErrors();
  }
};

/// Builds and runs a task's tests inside a sandbox.
///
/// A tests directory with a Makefile is copied into the sandbox and driven
/// with `make test`; otherwise its C sources are compiled directly against
/// the checked-out tree and the resulting binary is run.
class TestRunner {
public:
  explicit TestRunner(BuildSandbox &Sandbox, unsigned TimeoutSeconds = 120)
      : Sandbox(Sandbox), TimeoutSeconds(TimeoutSeconds) {}

  TestOutcome run(llvm::StringRef TestDir,
                  llvm::ArrayRef<std::string> ExtraSources = llvm::None);

private:
  BuildSandbox &Sandbox;
  unsigned TimeoutSeconds;

  TestOutcome runMakefileTests(llvm::StringRef TestDir);
  TestOutcome runDirectTests(llvm::StringRef TestDir,
                             llvm::ArrayRef<std::string> ExtraSources);
};

/// Test sources of a tests directory: test_*.c, or every *.c when there is
/// no such file. Names only, sorted.
std::vector<std::string> findTestSources(llvm::StringRef TestDir);

/// Whether Report contains a finding whose kind name contains Hint
/// (case-insensitive), e.g. "use-after-free" or "heap-buffer-overflow".
bool observedKind(const SanitizerReport &Report, llvm::StringRef Hint);

} // namespace fixbench

#endif // FIXBENCH_RUNNER_TESTRUNNER_H
