#include "BuildSandbox.h"
#include "BuildCache.h"

#include "support/Debug.h"
#include "support/FileUtils.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>
#include <chrono>

using namespace llvm;

namespace fixbench {

const char BuildASanOptions[] =
    "detect_leaks=1:abort_on_error=1:print_stacktrace=1";
const char RunASanOptions[] =
    "detect_leaks=1:abort_on_error=0:print_stacktrace=1";

static const char NoRepositoryError[] =
    "Repository not cloned. Call clone() first.";

StringRef getSandboxStateName(SandboxState State) {
  switch (State) {
  case SandboxState::Uninitialized:
    return "uninitialized";
  case SandboxState::Cloned:
    return "cloned";
  case SandboxState::Patched:
    return "patched";
  case SandboxState::Built:
    return "built";
  case SandboxState::TestBuilt:
    return "test-built";
  case SandboxState::Executed:
    return "executed";
  case SandboxState::Cleaned:
    return "cleaned";
  }
  return "unknown";
}

static std::string joinPath(StringRef A, StringRef B) {
  SmallString<256> Path(A);
  sys::path::append(Path, B);
  return std::string(Path.str());
}

/// Joins RelPath under Root with dot components removed. Absolute paths and
/// paths climbing out of Root are rejected.
static Expected<std::string> resolveUnder(StringRef Root, StringRef RelPath) {
  SmallString<256> Rel(RelPath);
  sys::path::remove_dots(Rel, /*remove_dot_dot=*/true);
  if (Rel.empty() || sys::path::is_absolute(Rel) ||
      sys::path::has_root_name(Rel) || *sys::path::begin(Rel) == "..")
    return createStringError(std::errc::invalid_argument,
                             "path outside the repository: %s",
                             RelPath.str().c_str());
  return joinPath(Root, Rel);
}

static double secondsSince(std::chrono::steady_clock::time_point Start) {
  std::chrono::duration<double> Elapsed =
      std::chrono::steady_clock::now() - Start;
  return Elapsed.count();
}

BuildSandbox::BuildSandbox(SandboxConfig Config, CommandRunner &Runner,
                           BuildCache *Cache)
    : Config(std::move(Config)), Runner(Runner), Cache(Cache) {}

BuildSandbox::~BuildSandbox() { cleanup(); }

Error BuildSandbox::ensureWorkDir() {
  if (!WorkDir.empty())
    return Error::success();
  SmallString<256> Path;
  if (std::error_code EC = createUniqueWorkDir(Config.WorkRoot, "fixbench", Path))
    return createStringError(EC, "cannot create working directory: %s",
                             EC.message().c_str());
  WorkDir = std::string(Path.str());
  if (isDebugLoggingEnabled())
    errs() << "BuildSandbox: working directory " << WorkDir << "\n";
  return Error::success();
}

ProcessResult
BuildSandbox::runTool(std::string Program, std::vector<std::string> Args,
                      unsigned TimeoutSeconds,
                      std::vector<std::pair<std::string, std::string>> Env) {
  Command Cmd;
  Cmd.Program = std::move(Program);
  Cmd.Args = std::move(Args);
  Cmd.Env = std::move(Env);
  Cmd.TimeoutSeconds = TimeoutSeconds;
  return Runner.run(Cmd);
}

CloneResult BuildSandbox::clone(StringRef Rev, StringRef Branch) {
  CloneResult Result;
  if (Error E = ensureWorkDir()) {
    Result.Error = toString(std::move(E));
    return Result;
  }

  RepoDir = joinPath(WorkDir, "repo");
  if (sys::fs::exists(RepoDir))
    if (std::error_code EC = sys::fs::remove_directories(RepoDir, false)) {
      Result.Error = "cannot reset " + RepoDir + ": " + EC.message();
      RepoDir.clear();
      return Result;
    }

  bool Cacheable = Cache && Config.UseCache && !Rev.empty();
  if (Cacheable) {
    Expected<bool> Hit = Cache->restore(Rev, RepoDir);
    if (!Hit) {
      errs() << "BuildSandbox: warning: " << toString(Hit.takeError())
             << "; cloning instead\n";
      if (std::error_code EC = sys::fs::remove_directories(RepoDir, false)) {
        Result.Error = "cannot reset " + RepoDir + ": " + EC.message();
        RepoDir.clear();
        return Result;
      }
    } else if (*Hit) {
      Commit = Rev.str();
      State = SandboxState::Cloned;
      Result.Success = true;
      Result.FromCache = true;
      Result.Stdout = "Using cached repository";
      Result.RepoDir = RepoDir;
      return Result;
    }
  }

  std::vector<std::string> Args = {"clone"};
  if (Rev.empty()) {
    Args.push_back("--depth");
    Args.push_back("1");
  }
  if (!Branch.empty()) {
    Args.push_back("--branch");
    Args.push_back(Branch.str());
  }
  Args.push_back(Config.RepoURL);
  Args.push_back(RepoDir);

  if (isDebugLoggingEnabled())
    errs() << "BuildSandbox: cloning " << Config.RepoURL
           << (Rev.empty() ? std::string() : " at " + Rev.str()) << "\n";

  ProcessResult Clone =
      runTool(Config.GitProgram, std::move(Args), Config.TimeoutSeconds);
  Result.Stdout = Clone.Stdout;
  Result.Stderr = Clone.Stderr;
  if (!Clone.succeeded()) {
    Result.TimedOut = Clone.TimedOut;
    if (Clone.TimedOut)
      Result.Error = formatv("Clone timed out after {0}s",
                             Config.TimeoutSeconds).str();
    else
      Result.Error = "git clone failed: " +
                     (Clone.Stderr.empty() ? Clone.ErrorMessage : Clone.Stderr);
    RepoDir.clear();
    return Result;
  }

  if (!Rev.empty()) {
    ProcessResult Checkout =
        runTool(Config.GitProgram, {"-C", RepoDir, "checkout", Rev.str()},
                Config.TimeoutSeconds);
    Result.Stdout += Checkout.Stdout;
    Result.Stderr += Checkout.Stderr;
    if (!Checkout.succeeded()) {
      Result.TimedOut = Checkout.TimedOut;
      if (Checkout.TimedOut)
        Result.Error = formatv("Checkout timed out after {0}s",
                               Config.TimeoutSeconds).str();
      else
        Result.Error = "git checkout failed: " + (Checkout.Stderr.empty()
                                                      ? Checkout.ErrorMessage
                                                      : Checkout.Stderr);
      RepoDir.clear();
      return Result;
    }
    Commit = Rev.str();

    if (Cacheable) {
      Expected<bool> Stored = Cache->store(Rev, RepoDir);
      if (!Stored)
        errs() << "BuildSandbox: warning: " << toString(Stored.takeError())
               << "\n";
    }
  }

  State = SandboxState::Cloned;
  Result.Success = true;
  Result.RepoDir = RepoDir;
  return Result;
}

Error BuildSandbox::initializeFromFiles(
    const std::map<std::string, std::string> &Files, StringRef Label) {
  if (Error E = ensureWorkDir())
    return E;
  std::string Dir = joinPath(WorkDir, Label.empty() ? "repo" : Label);
  if (std::error_code EC = sys::fs::create_directories(Dir))
    return createStringError(EC, "cannot create %s: %s", Dir.c_str(),
                             EC.message().c_str());
  RepoDir = Dir;
  if (Error E = applyFileChanges(Files))
    return E;
  State = SandboxState::Cloned;
  return Error::success();
}

PatchApplyResult BuildSandbox::applyPatchText(StringRef Text) {
  if (!hasRepository()) {
    PatchApplyResult Result;
    Result.Error = NoRepositoryError;
    return Result;
  }
  PatchApplyOptions Options;
  Options.TimeoutSeconds = Config.TimeoutSeconds;
  Options.GitProgram = Config.GitProgram;
  PatchApplyResult Result = applyPatch(Text, RepoDir, Options, Runner);
  if (Result.Success)
    State = SandboxState::Patched;
  return Result;
}

PatchApplyResult BuildSandbox::applyBuggyPatch(StringRef PatchPath) {
  if (!hasRepository()) {
    PatchApplyResult Result;
    Result.Error = NoRepositoryError;
    return Result;
  }
  Expected<std::string> Text = readTextFile(PatchPath);
  if (!Text) {
    PatchApplyResult Result;
    Result.Error = toString(Text.takeError());
    return Result;
  }
  return applyPatchText(*Text);
}

PatchApplyResult BuildSandbox::applyModelFix(StringRef PatchText) {
  return applyPatchText(PatchText);
}

Error BuildSandbox::applyFileChanges(
    const std::map<std::string, std::string> &Files) {
  if (!hasRepository())
    return createStringError(std::errc::invalid_argument, NoRepositoryError);
  std::vector<std::pair<std::string, StringRef>> Targets;
  for (const auto &File : Files) {
    Expected<std::string> Target = resolveUnder(RepoDir, File.first);
    if (!Target)
      return Target.takeError();
    Targets.emplace_back(std::move(*Target), File.second);
  }
  for (const auto &Target : Targets)
    if (std::error_code EC = writeTextFile(Target.first, Target.second))
      return createStringError(EC, "cannot write %s: %s", Target.first.c_str(),
                               EC.message().c_str());
  if (!Files.empty())
    State = SandboxState::Patched;
  return Error::success();
}

std::string BuildSandbox::getSanitizerLinkFlags() const {
  SmallVector<StringRef, 2> Sanitizers;
  if (Config.EnableASan)
    Sanitizers.push_back("address");
  if (Config.EnableUBSan)
    Sanitizers.push_back("undefined");
  if (Sanitizers.empty())
    return std::string();
  return "-fsanitize=" + join(Sanitizers, ",");
}

std::string BuildSandbox::getSanitizerCompileFlags() const {
  std::string Flags = getSanitizerLinkFlags();
  if (!Flags.empty())
    Flags += " -fno-omit-frame-pointer -g";
  return Flags;
}

std::vector<std::pair<std::string, std::string>>
BuildSandbox::getTestEnvironment() const {
  std::vector<std::pair<std::string, std::string>> Env;
  if (hasRepository() && !Config.SourceEnvVar.empty())
    Env.emplace_back(Config.SourceEnvVar, joinPath(RepoDir, "src"));
  if (Config.EnableASan)
    Env.emplace_back("ASAN_OPTIONS", RunASanOptions);
  std::string Compile = getSanitizerCompileFlags();
  if (!Compile.empty()) {
    Env.emplace_back("CFLAGS", Compile);
    Env.emplace_back("LDFLAGS", getSanitizerLinkFlags());
  }
  return Env;
}

BuildResult BuildSandbox::build(StringRef Target, ArrayRef<std::string> ExtraArgs) {
  BuildResult Result;
  if (!hasRepository()) {
    Result.Error = NoRepositoryError;
    return Result;
  }
  auto Start = std::chrono::steady_clock::now();

  BuildDir = joinPath(WorkDir, "build");
  if (std::error_code EC = sys::fs::create_directories(BuildDir)) {
    Result.Error = "cannot create build directory: " + EC.message();
    return Result;
  }
  Result.BuildDir = BuildDir;

  std::vector<std::string> Configure = {
      "-S", RepoDir, "-B", BuildDir,
      "-DCMAKE_BUILD_TYPE=" + Config.BuildType,
      "-DCMAKE_C_COMPILER=" + Config.CC,
      "-DCMAKE_CXX_COMPILER=" + Config.CXX,
      // Older project files declare a minimum that current CMake rejects.
      "-DCMAKE_POLICY_VERSION_MINIMUM=3.5"};
  std::string Compile = getSanitizerCompileFlags();
  if (!Compile.empty()) {
    Configure.push_back("-DCMAKE_C_FLAGS=" + Compile);
    Configure.push_back("-DCMAKE_CXX_FLAGS=" + Compile);
    Configure.push_back("-DCMAKE_EXE_LINKER_FLAGS=" + getSanitizerLinkFlags());
  }
  for (const auto &Option : Config.CMakeOptions)
    Configure.push_back("-D" + Option.first + "=" + Option.second);
  Configure.insert(Configure.end(), ExtraArgs.begin(), ExtraArgs.end());

  std::vector<std::pair<std::string, std::string>> Env;
  if (Config.EnableASan)
    Env.emplace_back("ASAN_OPTIONS", BuildASanOptions);

  auto timedOut = [&]() {
    Result.TimedOut = true;
    Result.ElapsedSeconds = secondsSince(Start);
    Result.Error =
        formatv("Build timed out after {0}s", Config.TimeoutSeconds).str();
    return Result;
  };

  ProcessResult ConfigureRun =
      runTool(Config.CMakeProgram, Configure, Config.TimeoutSeconds, Env);
  Result.Stdout = ConfigureRun.Stdout;
  Result.Stderr = ConfigureRun.Stderr;
  if (ConfigureRun.TimedOut)
    return timedOut();
  if (!ConfigureRun.succeeded()) {
    Result.ElapsedSeconds = secondsSince(Start);
    Result.Error = "CMake configure failed: " +
                   (ConfigureRun.Stderr.empty() ? ConfigureRun.ErrorMessage
                                                : ConfigureRun.Stderr);
    return Result;
  }

  unsigned Spent = static_cast<unsigned>(secondsSince(Start));
  if (Config.TimeoutSeconds && Spent >= Config.TimeoutSeconds)
    return timedOut();
  unsigned Remaining = Config.TimeoutSeconds ? Config.TimeoutSeconds - Spent : 0;

  std::vector<std::string> Make = {"-C", BuildDir,
                                   "-j" + std::to_string(Config.Jobs)};
  if (!Target.empty())
    Make.push_back(Target.str());
  ProcessResult MakeRun = runTool(Config.MakeProgram, Make, Remaining, Env);
  Result.Stdout += MakeRun.Stdout;
  Result.Stderr += MakeRun.Stderr;
  if (MakeRun.TimedOut)
    return timedOut();

  Result.ElapsedSeconds = secondsSince(Start);
  if (!MakeRun.succeeded()) {
    Result.Error = "Build failed: " + (MakeRun.Stderr.empty()
                                           ? MakeRun.ErrorMessage
                                           : MakeRun.Stderr);
    return Result;
  }
  Result.Success = true;
  State = SandboxState::Built;
  return Result;
}

BuildResult BuildSandbox::buildTest(StringRef TestDir,
                                    ArrayRef<std::string> TestSources,
                                    StringRef OutputName) {
  BuildResult Result;
  if (!hasRepository()) {
    Result.Error = NoRepositoryError;
    return Result;
  }
  auto Start = std::chrono::steady_clock::now();

  std::string TestBuildDir = joinPath(WorkDir, "test_build");
  if (std::error_code EC = sys::fs::create_directories(TestBuildDir)) {
    Result.Error = "cannot create test build directory: " + EC.message();
    return Result;
  }

  std::vector<std::string> Args = {"-Wall", "-Wextra", "-I",
                                   joinPath(RepoDir, "src"), "-I", TestDir.str()};
  if (Config.EnableASan) {
    Args.push_back("-fsanitize=address");
    Args.push_back("-fno-omit-frame-pointer");
    Args.push_back("-g");
  }
  if (Config.EnableUBSan)
    Args.push_back("-fsanitize=undefined");
  for (const std::string &Source : TestSources)
    Args.push_back(joinPath(TestDir, Source));
  std::string Output = joinPath(TestBuildDir, OutputName);
  Args.push_back("-o");
  Args.push_back(Output);
  Args.push_back("-lm");

  std::vector<std::pair<std::string, std::string>> Env;
  if (Config.EnableASan)
    Env.emplace_back("ASAN_OPTIONS", BuildASanOptions);

  ProcessResult Compile =
      runTool(Config.CC, std::move(Args), Config.TimeoutSeconds, std::move(Env));
  Result.Stdout = Compile.Stdout;
  Result.Stderr = Compile.Stderr;
  Result.ElapsedSeconds = secondsSince(Start);
  Result.BuildDir = TestBuildDir;
  if (Compile.TimedOut) {
    Result.TimedOut = true;
    Result.Error =
        formatv("Test build timed out after {0}s", Config.TimeoutSeconds).str();
    return Result;
  }
  if (!Compile.succeeded()) {
    Result.Error = "Test compilation failed: " +
                   (Compile.Stderr.empty() ? Compile.ErrorMessage : Compile.Stderr);
    return Result;
  }
  Result.Success = true;
  State = SandboxState::TestBuilt;
  return Result;
}

ExecutionResult BuildSandbox::runTest(StringRef Executable,
                                      ArrayRef<std::string> Args,
                                      unsigned TimeoutSeconds) {
  ExecutionResult Result;
  if (!sys::fs::exists(Executable)) {
    Result.Error = ("Test executable not found: " + Executable).str();
    return Result;
  }
  unsigned Timeout = TimeoutSeconds ? TimeoutSeconds : Config.TimeoutSeconds;

  std::vector<std::pair<std::string, std::string>> Env;
  if (Config.EnableASan)
    Env.emplace_back("ASAN_OPTIONS", RunASanOptions);

  ProcessResult Run = runTool(Executable.str(), Args.vec(), Timeout, std::move(Env));
  State = SandboxState::Executed;
  Result.Stdout = Run.Stdout;
  Result.Stderr = Run.Stderr;
  Result.ExitCode = Run.ExitCode;
  Result.ElapsedSeconds = Run.ElapsedSeconds;
  Result.TimedOut = Run.TimedOut;
  Result.Success = Run.succeeded();
  if (Run.TimedOut)
    Result.Error = formatv("Test timed out after {0}s", Timeout).str();
  else if (Run.ExecFailed)
    Result.Error = Run.ErrorMessage;
  return Result;
}

void BuildSandbox::cleanup() {
  if (!WorkDir.empty()) {
    if (isDebugLoggingEnabled())
      errs() << "BuildSandbox: removing " << WorkDir << " ("
             << getSandboxStateName(State) << ")\n";
    if (std::error_code EC =
            sys::fs::remove_directories(WorkDir, /*IgnoreErrors=*/false))
      errs() << "BuildSandbox: warning: cannot remove " << WorkDir << ": "
             << EC.message() << "\n";
  }
  WorkDir.clear();
  RepoDir.clear();
  BuildDir.clear();
  State = SandboxState::Cleaned;
}

Optional<std::string> BuildSandbox::getFileContent(StringRef RelPath) const {
  if (!hasRepository())
    return None;
  Expected<std::string> Path = resolveUnder(RepoDir, RelPath);
  if (!Path) {
    consumeError(Path.takeError());
    return None;
  }
  Expected<std::string> Text = readTextFile(*Path);
  if (!Text) {
    consumeError(Text.takeError());
    return None;
  }
  return std::move(*Text);
}

std::vector<std::string> BuildSandbox::listSourceFiles(StringRef Extension) const {
  std::vector<std::string> Files;
  if (!hasRepository())
    return Files;
  std::error_code EC;
  for (sys::fs::recursive_directory_iterator I(RepoDir, EC), E; I != E && !EC;
       I.increment(EC)) {
    StringRef Path = I->path();
    if (!Path.endswith(Extension) || !sys::fs::is_regular_file(Path))
      continue;
    SmallString<256> Rel(Path);
    sys::path::replace_path_prefix(Rel, RepoDir, "");
    StringRef Relative = Rel.str();
    Relative = Relative.ltrim('/');
    if (Relative.startswith(".git/"))
      continue;
    Files.push_back(Relative.str());
  }
  std::sort(Files.begin(), Files.end());
  return Files;
}

} // namespace fixbench
