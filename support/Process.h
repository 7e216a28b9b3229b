#ifndef FIXBENCH_SUPPORT_PROCESS_H
#define FIXBENCH_SUPPORT_PROCESS_H

#include <string>
#include <utility>
#include <vector>

namespace fixbench {

/// One external program invocation. Every command carries its own timeout.
struct Command {
  std::string Program;
  std::vector<std::string> Args;
  /// Variables added to (or replacing entries of) the parent environment.
  std::vector<std::pair<std::string, std::string>> Env;
  unsigned TimeoutSeconds = 0;
};

struct ProcessResult {
  int ExitCode = -1;
  std::string Stdout;
  std::string Stderr;
  bool TimedOut = false;
  bool ExecFailed = false;
  std::string ErrorMessage;
  double ElapsedSeconds = 0.0;

  bool succeeded() const { return !TimedOut && !ExecFailed && ExitCode == 0; }
  std::string combinedOutput() const { return Stdout + Stderr; }
};

/// Seam between the pipeline and the operating system. Tests substitute a
/// recording fake; production code uses SystemCommandRunner.
class CommandRunner {
public:
  virtual ~CommandRunner() = default;
  virtual ProcessResult run(const Command &Cmd) = 0;
};

/// Runs commands with llvm::sys::ExecuteAndWait. stdout and stderr are
/// redirected to temporary files so whatever was written before a timeout
/// kill is still returned.
class SystemCommandRunner : public CommandRunner {
public:
  ProcessResult run(const Command &Cmd) override;
};

CommandRunner &getSystemCommandRunner();

/// Shell-like rendering of a command for diagnostics.
std::string describeCommand(const Command &Cmd);

} // namespace fixbench

#endif // FIXBENCH_SUPPORT_PROCESS_H
