#include "TestRunner.h"

#include "logparse/CompilerDiagnostics.h"
#include "sandbox/BuildSandbox.h"
#include "support/Debug.h"
#include "support/FileUtils.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>
#include <chrono>

using namespace llvm;

namespace fixbench {

namespace {

using Clock = std::chrono::steady_clock;

double secondsSince(Clock::time_point Start) {
  std::chrono::duration<double> Elapsed = Clock::now() - Start;
  return Elapsed.count();
}

TestOutcome setupFailure(std::string Output, Clock::time_point Start) {
  TestOutcome Outcome;
  Outcome.Errors = 1;
  Outcome.Output = std::move(Output);
  Outcome.ElapsedSeconds = secondsSince(Start);
  return Outcome;
}

/// Steps shared by both branches once the tests have run: sanitizer report,
/// counts, exit status fallback and the overall verdict.
void scoreRun(TestOutcome &Outcome, bool ExitedCleanly) {
  Outcome.Sanitizers = parseSanitizerReport(Outcome.Output);
  TestCounts Counts = parseTestOutput(Outcome.Output);
  Outcome.Passed = Counts.Passed;
  Outcome.Failed = Counts.Failed;
  Outcome.Total = Counts.Total;
  Outcome.Cases = parseNamedTestResults(Outcome.Output);

  if (Outcome.Total == 0) {
    if (ExitedCleanly && !Outcome.hasSanitizerErrors())
      Outcome.Passed = 1;
    else
      Outcome.Failed = 1;
    Outcome.Total = 1;
  }
  Outcome.Success =
      ExitedCleanly && Outcome.Failed == 0 && !Outcome.hasSanitizerErrors();
}

} // namespace

std::vector<std::string> findTestSources(StringRef TestDir) {
  std::vector<std::string> Tests, AllSources;
  std::error_code EC;
  for (sys::fs::directory_iterator I(TestDir, EC), E; I != E && !EC;
       I.increment(EC)) {
    StringRef Name = sys::path::filename(I->path());
    if (!Name.endswith(".c") || !sys::fs::is_regular_file(I->path()))
      continue;
    AllSources.push_back(Name.str());
    if (Name.startswith("test_"))
      Tests.push_back(Name.str());
  }
  std::vector<std::string> &Result = Tests.empty() ? AllSources : Tests;
  std::sort(Result.begin(), Result.end());
  return std::move(Result);
}

bool observedKind(const SanitizerReport &Report, StringRef Hint) {
  if (Hint.empty())
    return false;
  for (SanitizerErrorKind Kind : Report.getErrorKinds())
    if (getSanitizerErrorKindName(Kind).contains_insensitive(Hint))
      return true;
  return Report.hasLeaks() &&
         getSanitizerErrorKindName(SanitizerErrorKind::MemoryLeak)
             .contains_insensitive(Hint);
}

TestOutcome TestRunner::run(StringRef TestDir, ArrayRef<std::string> ExtraSources) {
  if (!sys::fs::is_directory(TestDir))
    return setupFailure(("Test directory not found: " + TestDir).str(),
                        Clock::now());

  SmallString<256> Makefile(TestDir);
  sys::path::append(Makefile, "Makefile");
  if (sys::fs::exists(Makefile))
    return runMakefileTests(TestDir);
  return runDirectTests(TestDir, ExtraSources);
}

TestOutcome TestRunner::runMakefileTests(StringRef TestDir) {
  auto Start = Clock::now();
  if (!Sandbox.hasRepository() || Sandbox.getWorkDir().empty())
    return setupFailure("Sandbox not initialized", Start);

  SmallString<256> SandboxTests(Sandbox.getWorkDir());
  sys::path::append(SandboxTests, "tests");
  if (sys::fs::exists(SandboxTests))
    if (std::error_code EC =
            sys::fs::remove_directories(SandboxTests, /*IgnoreErrors=*/false))
      return setupFailure("cannot reset " + SandboxTests.str().str() + ": " +
                              EC.message(),
                          Start);
  if (std::error_code EC = copyDirectoryTree(TestDir, SandboxTests))
    return setupFailure("cannot copy tests into the sandbox: " + EC.message(),
                        Start);

  if (isDebugLoggingEnabled())
    errs() << "TestRunner: make test in " << SandboxTests << "\n";

  Command Cmd;
  Cmd.Program = Sandbox.getConfig().MakeProgram;
  Cmd.Args = {"-C", SandboxTests.str().str(), "test"};
  Cmd.Env = Sandbox.getTestEnvironment();
  // Compilation happens inside the same make invocation.
  Cmd.TimeoutSeconds = TimeoutSeconds + 60;
  ProcessResult Run = Sandbox.getRunner().run(Cmd);

  TestOutcome Outcome;
  Outcome.ElapsedSeconds = secondsSince(Start);
  Outcome.Output = Run.combinedOutput();
  if (Run.TimedOut) {
    Outcome.Errors = 1;
    Outcome.TimedOut = true;
    Outcome.Output = formatv("Test timeout after {0}s\n", TimeoutSeconds).str() +
                     Outcome.Output;
    return Outcome;
  }
  if (Run.ExecFailed) {
    Outcome.Errors = 1;
    Outcome.Output = "Test execution error: " + Run.ErrorMessage;
    return Outcome;
  }

  if (Optional<std::string> CompileError = findCompilationError(Outcome.Output)) {
    Outcome.Errors = 1;
    Outcome.CompilationError = std::move(CompileError);
    return Outcome;
  }

  scoreRun(Outcome, Run.ExitCode == 0);
  return Outcome;
}

TestOutcome TestRunner::runDirectTests(StringRef TestDir,
                                       ArrayRef<std::string> ExtraSources) {
  auto Start = Clock::now();
  std::vector<std::string> Sources = findTestSources(TestDir);
  if (Sources.empty())
    return setupFailure("No test source files found", Start);
  Sources.insert(Sources.end(), ExtraSources.begin(), ExtraSources.end());

  BuildResult Build = Sandbox.buildTest(TestDir, Sources, "test_runner");
  std::string BuildOutput = Build.combinedOutput();
  Optional<std::string> CompileError = findCompilationError(BuildOutput);
  if (!Build.Success || CompileError) {
    TestOutcome Outcome = setupFailure(BuildOutput, Start);
    Outcome.TimedOut = Build.TimedOut;
    if (CompileError)
      Outcome.CompilationError = std::move(CompileError);
    else if (!Build.TimedOut)
      Outcome.CompilationError = Build.Error;
    else
      Outcome.Output = Build.Error + "\n" + Outcome.Output;
    return Outcome;
  }

  SmallString<256> Executable(Build.BuildDir);
  sys::path::append(Executable, "test_runner");
  ExecutionResult Exec = Sandbox.runTest(Executable, None, TimeoutSeconds);

  TestOutcome Outcome;
  Outcome.ElapsedSeconds = secondsSince(Start);
  Outcome.Output = Exec.combinedOutput();
  if (Exec.TimedOut) {
    Outcome.TimedOut = true;
    Outcome.Output = Exec.Error + "\n" + Outcome.Output;
  } else if (!Exec.Error.empty()) {
    Outcome.Output = Exec.Error + "\n" + Outcome.Output;
  }
  scoreRun(Outcome, Exec.Success);
  return Outcome;
}

} // namespace fixbench
