#include "evaluator/Evaluator.h"
#include "evaluator/Generator.h"
#include "evaluator/ResultWriter.h"
#include "sandbox/BuildCache.h"
#include "sandbox/BuildSandbox.h"
#include "support/Debug.h"
#include "support/Process.h"

#include "llvm/Support/CommandLine.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/WithColor.h"
#include "llvm/Support/raw_ostream.h"

#include <memory>
#include <string>

using namespace llvm;
using namespace fixbench;

static cl::OptionCategory ClFixbenchCategory("fixbench options");

static cl::opt<std::string> ClTaskDir(cl::Positional, cl::Required,
                                      cl::desc("<task directory>"),
                                      cl::cat(ClFixbenchCategory));

static cl::opt<std::string> ClResponseFile(
    "response-file",
    cl::desc("Evaluate a stored model response instead of invoking a generator"),
    cl::value_desc("path"), cl::cat(ClFixbenchCategory));

static cl::opt<std::string> ClGenerator(
    "generator",
    cl::desc("Program invoked as '<program> <request.json>'; its stdout is the "
             "model response"),
    cl::value_desc("program"), cl::cat(ClFixbenchCategory));

static cl::opt<bool> ClValidateTask(
    "validate-task",
    cl::desc("Check that the task's tests fail on the buggy tree and pass on "
             "the fixed one"),
    cl::init(false), cl::cat(ClFixbenchCategory));

static cl::opt<std::string> ClOutput(
    "output", cl::desc("Write the result as JSON to this file"),
    cl::value_desc("path"), cl::cat(ClFixbenchCategory));

static cl::opt<std::string> ClCacheDir(
    "cache-dir",
    cl::desc("Directory of cached checkouts (default: $HOME/.cache/fixbench)"),
    cl::value_desc("dir"), cl::cat(ClFixbenchCategory));

static cl::opt<bool> ClNoCache("no-cache",
                               cl::desc("Always clone from the remote"),
                               cl::init(false), cl::cat(ClFixbenchCategory));

static cl::opt<std::string> ClWorkRoot(
    "work-root",
    cl::desc("Parent directory for sandboxes (default: system temp dir)"),
    cl::value_desc("dir"), cl::cat(ClFixbenchCategory));

static cl::opt<std::string> ClRepoURL(
    "repo-url", cl::desc("Repository cloned for non-synthetic tasks"),
    cl::value_desc("url"), cl::cat(ClFixbenchCategory));

static cl::opt<std::string> ClCC("cc", cl::desc("C compiler"), cl::init("clang"),
                                 cl::cat(ClFixbenchCategory));

static cl::opt<std::string> ClCXX("cxx", cl::desc("C++ compiler"),
                                  cl::init("clang++"),
                                  cl::cat(ClFixbenchCategory));

static cl::opt<unsigned> ClTimeout(
    "timeout",
    cl::desc("Timeout in seconds for each generator and sandbox process; "
             "task.json overrides it for the sandbox"),
    cl::init(300), cl::cat(ClFixbenchCategory));

static cl::opt<unsigned> ClJobs("jobs", cl::desc("Parallel build jobs"),
                                cl::init(4), cl::cat(ClFixbenchCategory));

static cl::opt<bool> ClUBSan("ubsan",
                             cl::desc("Also build with UndefinedBehaviorSanitizer"),
                             cl::init(false), cl::cat(ClFixbenchCategory));

static cl::opt<bool> ClVerbose("verbose", cl::desc("Print progress to stderr"),
                               cl::init(false), cl::cat(ClFixbenchCategory));

enum ExitStatus { ExitPass = 0, ExitFail = 1, ExitUsage = 2 };

static SandboxConfig getSandboxConfig() {
  SandboxConfig Config;
  Config.TimeoutSeconds = ClTimeout;
  Config.EnableUBSan = ClUBSan;
  Config.CC = ClCC;
  Config.CXX = ClCXX;
  Config.Jobs = ClJobs;
  Config.UseCache = !ClNoCache;
  Config.WorkRoot = ClWorkRoot;
  if (!ClRepoURL.empty())
    Config.RepoURL = ClRepoURL;
  return Config;
}

static int validateTask(Evaluator &E) {
  TaskValidation Validation = E.validate();
  if (!Validation.Error.empty())
    WithColor::error(errs(), "fixbench") << Validation.Error << "\n";
  outs() << "Task " << ClTaskDir << ": "
         << (Validation.Valid ? "valid" : "INVALID") << "\n";
  if (Validation.Fixed)
    outs() << "  fixed: " << Validation.Fixed->Passed << "/"
           << Validation.Fixed->Total << " passed\n";
  if (Validation.Buggy)
    outs() << "  buggy: " << Validation.Buggy->Passed << "/"
           << Validation.Buggy->Total << " passed\n";
  if (!ClOutput.empty())
    if (Error Err = writeValidationJSON(Validation, ClOutput)) {
      WithColor::error(errs(), "fixbench") << toString(std::move(Err)) << "\n";
      return ExitUsage;
    }
  return Validation.Valid ? ExitPass : ExitFail;
}

int main(int argc, char **argv) {
  InitLLVM X(argc, argv);
  cl::HideUnrelatedOptions(ClFixbenchCategory);
  cl::ParseCommandLineOptions(
      argc, argv,
      "fixbench - score a generated fix for a bug-fixing task\n\n"
      "  A task directory holds task.json, prompt.md, buggy.patch,\n"
      "  an optional solution/fix.patch and a tests/ directory.\n");

  if (ClVerbose)
    setDebugLogging(true);

  if (!sys::fs::is_directory(ClTaskDir)) {
    WithColor::error(errs(), "fixbench")
        << "task directory not found: " << ClTaskDir << "\n";
    return ExitUsage;
  }

  bool HasResponse = !ClResponseFile.empty();
  bool HasGenerator = !ClGenerator.empty();
  if (!ClValidateTask && HasResponse == HasGenerator) {
    WithColor::error(errs(), "fixbench")
        << "exactly one of --response-file or --generator is required\n";
    return ExitUsage;
  }

  CommandRunner &Runner = getSystemCommandRunner();
  std::unique_ptr<Generator> Gen;
  if (HasResponse)
    Gen = std::make_unique<ResponseFileGenerator>(ClResponseFile);
  else if (HasGenerator)
    Gen = std::make_unique<CommandGenerator>(ClGenerator, Runner, ClTimeout);
  else
    Gen = std::make_unique<ResponseFileGenerator>("");

  std::unique_ptr<BuildCache> Cache;
  if (!ClNoCache)
    Cache = std::make_unique<BuildCache>(
        ClCacheDir.empty() ? BuildCache::getDefaultRoot()
                            : std::string(ClCacheDir));

  Evaluator E(ClTaskDir, *Gen, getSandboxConfig(), Runner, Cache.get());
  if (ClValidateTask)
    return validateTask(E);

  EvaluationResult Result = E.run();
  outs() << formatEvaluationResult(Result);
  if (Result.Error)
    WithColor::error(errs(), "fixbench") << *Result.Error << "\n";
  if (Cache && isDebugLoggingEnabled())
    errs() << "fixbench: cache hits " << Cache->getHits() << ", misses "
           << Cache->getMisses() << ", stores " << Cache->getStores() << "\n";

  if (!ClOutput.empty()) {
    if (Error Err = writeResultJSON(Result, ClOutput)) {
      WithColor::error(errs(), "fixbench") << toString(std::move(Err)) << "\n";
      return ExitUsage;
    }
    if (isDebugLoggingEnabled())
      errs() << "fixbench: wrote " << ClOutput << "\n";
  }
  return Result.Success ? ExitPass : ExitFail;
}
