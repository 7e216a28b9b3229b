#include "Process.h"
#include "Debug.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/Optional.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/ErrorOr.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/FileUtilities.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Program.h"
#include "llvm/Support/raw_ostream.h"

#include <chrono>

extern char **environ;

using namespace llvm;

namespace fixbench {

namespace {

std::vector<std::string>
buildEnvironment(ArrayRef<std::pair<std::string, std::string>> Overrides) {
  StringMap<bool> Overridden;
  for (const auto &KV : Overrides)
    Overridden[KV.first] = true;

  std::vector<std::string> Env;
  for (char **Entry = environ; Entry && *Entry; ++Entry) {
    StringRef Var(*Entry);
    StringRef Name = Var.split('=').first;
    if (Overridden.count(Name))
      continue;
    Env.push_back(Var.str());
  }
  for (const auto &KV : Overrides)
    Env.push_back(KV.first + "=" + KV.second);
  return Env;
}

std::string readCapture(StringRef Path) {
  ErrorOr<std::unique_ptr<MemoryBuffer>> Buffer =
      MemoryBuffer::getFile(Path, /*IsText=*/true);
  if (!Buffer)
    return std::string();
  return (*Buffer)->getBuffer().str();
}

double secondsSince(std::chrono::steady_clock::time_point Start) {
  std::chrono::duration<double> Elapsed =
      std::chrono::steady_clock::now() - Start;
  return Elapsed.count();
}

} // namespace

ProcessResult SystemCommandRunner::run(const Command &Cmd) {
  ProcessResult Result;
  auto Start = std::chrono::steady_clock::now();

  std::string ProgramPath = Cmd.Program;
  if (StringRef(Cmd.Program).find('/') == StringRef::npos) {
    ErrorOr<std::string> Found = sys::findProgramByName(Cmd.Program);
    if (!Found) {
      Result.ExecFailed = true;
      Result.ErrorMessage = "unable to find program '" + Cmd.Program +
                            "': " + Found.getError().message();
      return Result;
    }
    ProgramPath = *Found;
  }

  SmallString<128> OutPath, ErrPath;
  if (std::error_code EC =
          sys::fs::createTemporaryFile("fixbench-stdout", "txt", OutPath)) {
    Result.ExecFailed = true;
    Result.ErrorMessage = "failed to create capture file: " + EC.message();
    return Result;
  }
  FileRemover OutRemover(OutPath);
  if (std::error_code EC =
          sys::fs::createTemporaryFile("fixbench-stderr", "txt", ErrPath)) {
    Result.ExecFailed = true;
    Result.ErrorMessage = "failed to create capture file: " + EC.message();
    return Result;
  }
  FileRemover ErrRemover(ErrPath);

  std::vector<StringRef> Argv;
  Argv.reserve(Cmd.Args.size() + 1);
  Argv.push_back(Cmd.Program);
  for (const std::string &Arg : Cmd.Args)
    Argv.push_back(Arg);

  std::vector<std::string> EnvStorage = buildEnvironment(Cmd.Env);
  std::vector<StringRef> EnvRefs(EnvStorage.begin(), EnvStorage.end());
  ArrayRef<StringRef> EnvArray(EnvRefs);

  Optional<StringRef> Redirects[] = {StringRef(""), StringRef(OutPath),
                                     StringRef(ErrPath)};

  if (isDebugLoggingEnabled())
    errs() << "Process: running " << describeCommand(Cmd) << " (timeout "
           << Cmd.TimeoutSeconds << "s)\n";

  std::string ErrMsg;
  bool ExecutionFailed = false;
  int RC = sys::ExecuteAndWait(ProgramPath, Argv, EnvArray, Redirects,
                               Cmd.TimeoutSeconds, /*MemoryLimit=*/0, &ErrMsg,
                               &ExecutionFailed);

  Result.ElapsedSeconds = secondsSince(Start);
  Result.ExitCode = RC;
  Result.Stdout = readCapture(OutPath);
  Result.Stderr = readCapture(ErrPath);
  Result.ExecFailed = ExecutionFailed;
  Result.ErrorMessage = ErrMsg;

  // ExecuteAndWait reports both a kill on timeout and a crash as -2.
  if (RC == -2 && Cmd.TimeoutSeconds != 0 &&
      (StringRef(ErrMsg).contains("timed out") ||
       Result.ElapsedSeconds >= static_cast<double>(Cmd.TimeoutSeconds))) {
    Result.TimedOut = true;
    Result.ErrorMessage = "timed out after " +
                          std::to_string(Cmd.TimeoutSeconds) + "s";
  }

  if (isDebugLoggingEnabled())
    errs() << "Process: " << Cmd.Program << " exited with " << RC
           << (Result.TimedOut ? " (timeout)" : "") << " after "
           << Result.ElapsedSeconds << "s\n";
  return Result;
}

CommandRunner &getSystemCommandRunner() {
  static SystemCommandRunner Runner;
  return Runner;
}

std::string describeCommand(const Command &Cmd) {
  std::string Out;
  raw_string_ostream OS(Out);
  OS << Cmd.Program;
  for (const std::string &Arg : Cmd.Args) {
    OS << ' ';
    if (Arg.empty() || StringRef(Arg).find_first_of(" \t\"'") != StringRef::npos)
      OS << '"' << Arg << '"';
    else
      OS << Arg;
  }
  return OS.str();
}

} // namespace fixbench
