#ifndef FIXBENCH_SANDBOX_BUILDSANDBOX_H
#define FIXBENCH_SANDBOX_BUILDSANDBOX_H

#include "patch/PatchEngine.h"
#include "support/Process.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace fixbench {

class BuildCache;

struct SandboxConfig {
  /// Applies to every external process the sandbox starts.
  unsigned TimeoutSeconds = 300;
  bool EnableASan = true;
  bool EnableUBSan = false;
  std::string BuildType = "Debug";
  std::string CC = "clang";
  std::string CXX = "clang++";
  unsigned Jobs = 4;
  std::vector<std::pair<std::string, std::string>> CMakeOptions;
  std::string RepoURL = "https://github.com/bvschaik/julius.git";
  bool UseCache = true;
  /// Parent of per-session working directories; system temp dir if empty.
  std::string WorkRoot;
  /// Environment variable through which test Makefiles find the sources.
  std::string SourceEnvVar = "JULIUS_SRC";
  std::string GitProgram = "git";
  std::string CMakeProgram = "cmake";
  std::string MakeProgram = "make";
};

/// ASAN_OPTIONS for the configure/build phase and for test execution.
extern const char BuildASanOptions[];
extern const char RunASanOptions[];

enum class SandboxState {
  Uninitialized,
  Cloned,
  Patched,
  Built,
  TestBuilt,
  Executed,
  Cleaned
};

llvm::StringRef getSandboxStateName(SandboxState State);

struct CloneResult {
  bool Success = false;
  bool TimedOut = false;
  bool FromCache = false;
  std::string Stdout;
  std::string Stderr;
  std::string RepoDir;
  std::string Error;
};

struct BuildResult {
  bool Success = false;
  bool TimedOut = false;
  std::string Stdout;
  std::string Stderr;
  double ElapsedSeconds = 0.0;
  std::string BuildDir;
  std::string Error;

  std::string combinedOutput() const { return Stdout + Stderr; }
};

struct ExecutionResult {
  bool Success = false;
  bool TimedOut = false;
  int ExitCode = -1;
  std::string Stdout;
  std::string Stderr;
  double ElapsedSeconds = 0.0;
  std::string Error;

  std::string combinedOutput() const { return Stdout + Stderr; }
};

/// An isolated working tree for one evaluation: clone at a revision, patch,
/// build with sanitizers and run tests. Every process goes through the
/// injected CommandRunner with the configured timeout.
///
/// The working directory is removed by cleanup(), which is idempotent and
/// also runs on destruction.
class BuildSandbox {
public:
  BuildSandbox(SandboxConfig Config, CommandRunner &Runner,
               BuildCache *Cache = nullptr);
  ~BuildSandbox();

  BuildSandbox(const BuildSandbox &) = delete;
  BuildSandbox &operator=(const BuildSandbox &) = delete;

  /// Clones the configured repository. A cached tree for Commit is copied
  /// instead when available; otherwise the fresh checkout is published to
  /// the cache. An empty Commit clones the branch tip shallowly.
  CloneResult clone(llvm::StringRef Commit, llvm::StringRef Branch = "");

  /// Sets up a session from in-memory files instead of a clone. Label names
  /// the repository subdirectory.
  llvm::Error initializeFromFiles(const std::map<std::string, std::string> &Files,
                                  llvm::StringRef Label);

  PatchApplyResult applyBuggyPatch(llvm::StringRef PatchPath);
  PatchApplyResult applyModelFix(llvm::StringRef PatchText);

  /// Overwrites (or creates) files relative to the repository root.
  llvm::Error applyFileChanges(const std::map<std::string, std::string> &Files);

  /// CMake configure followed by make, sharing one timeout.
  BuildResult build(llvm::StringRef Target = "",
                    llvm::ArrayRef<std::string> ExtraArgs = llvm::None);

  /// Compiles TestSources (relative to TestDir) into a standalone binary
  /// against the repository's src/ include path.
  BuildResult buildTest(llvm::StringRef TestDir,
                        llvm::ArrayRef<std::string> TestSources,
                        llvm::StringRef OutputName = "test_runner");

  /// Runs a test binary with continue-on-error sanitizer options. A zero
  /// TimeoutSeconds uses the configured timeout.
  ExecutionResult runTest(llvm::StringRef Executable,
                          llvm::ArrayRef<std::string> Args = llvm::None,
                          unsigned TimeoutSeconds = 0);

  void cleanup();

  llvm::Optional<std::string> getFileContent(llvm::StringRef RelPath) const;

  /// Paths relative to the repository root of files ending in Extension,
  /// sorted.
  std::vector<std::string> listSourceFiles(llvm::StringRef Extension = ".c") const;

  /// Compile flags enabling the configured sanitizers, e.g.
  /// "-fsanitize=address -fno-omit-frame-pointer -g". Empty when none.
  std::string getSanitizerCompileFlags() const;
  std::string getSanitizerLinkFlags() const;

  /// Environment for test processes: sanitizer runtime options, plus the
  /// source directory variable and CFLAGS/LDFLAGS for Makefile driven tests.
  std::vector<std::pair<std::string, std::string>> getTestEnvironment() const;

  bool hasRepository() const { return !RepoDir.empty(); }
  SandboxState getState() const { return State; }
  const std::string &getWorkDir() const { return WorkDir; }
  const std::string &getRepoDir() const { return RepoDir; }
  const std::string &getBuildDir() const { return BuildDir; }
  const std::string &getCommit() const { return Commit; }
  const SandboxConfig &getConfig() const { return Config; }
  CommandRunner &getRunner() const { return Runner; }
  void setTimeout(unsigned Seconds) { Config.TimeoutSeconds = Seconds; }

private:
  SandboxConfig Config;
  CommandRunner &Runner;
  BuildCache *Cache;
  SandboxState State = SandboxState::Uninitialized;
  std::string WorkDir;
  std::string RepoDir;
  std::string BuildDir;
  std::string Commit;

  llvm::Error ensureWorkDir();
  PatchApplyResult applyPatchText(llvm::StringRef Text);
  ProcessResult runTool(std::string Program, std::vector<std::string> Args,
                        unsigned TimeoutSeconds,
                        std::vector<std::pair<std::string, std::string>> Env = {});
};

} // namespace fixbench

#endif // FIXBENCH_SANDBOX_BUILDSANDBOX_H
