#include "Evaluator.h"

#include "patch/PatchEngine.h"
#include "patch/ResponseExtractor.h"
#include "sandbox/BuildCache.h"
#include "support/Debug.h"

#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>
#include <chrono>
#include <exception>

using namespace llvm;

namespace fixbench {

const char GeneratorSystemPrompt[] =
    "You are an expert C developer debugging issues in Julius, an open-source "
    "reimplementation of Caesar III.\n\n"
    "CRITICAL: Respond with the COMPLETE fixed file. Output the entire "
    "modified file in a code block with the filename:\n"
    "```c src/path/to/file.c\n"
    "<complete file contents with your fix applied>\n"
    "```\n\n"
    "Important:\n"
    "- Output the ENTIRE file, not just the changed parts\n"
    "- Include all original code with your fix integrated\n"
    "- Only change what's necessary to fix the bug\n"
    "- Preserve all existing formatting and structure";

namespace {

using Clock = std::chrono::steady_clock;

double secondsSince(Clock::time_point Start) {
  std::chrono::duration<double> Elapsed = Clock::now() - Start;
  return Elapsed.count();
}

void log(const Twine &Message) {
  if (isDebugLoggingEnabled())
    errs() << "Evaluator: " << Message << "\n";
}

/// Clears every sub-score so an early exit scores zero.
EvaluationResult &fail(EvaluationResult &Result, std::string Message,
                       Clock::time_point Start) {
  Result.Success = Result.Compiles = Result.NoSanitizerErrors =
      Result.TestsPass = Result.MatchesReference = false;
  Result.TotalScore = 0.0;
  Result.Error = std::move(Message);
  Result.ElapsedSeconds = secondsSince(Start);
  log("stopped: " + *Result.Error);
  return Result;
}

} // namespace

void applyScore(EvaluationResult &Result) {
  double Score = 0.0;
  if (Result.Compiles)
    Score += CompilesPoints;
  if (Result.NoSanitizerErrors)
    Score += NoSanitizerErrorsPoints;
  if (Result.TestsPass)
    Score += TestsPassPoints;
  if (Result.MatchesReference)
    Score += MatchesReferencePoints;
  Result.TotalScore = std::min(Score, Result.MaxScore);
  Result.Success = Result.Compiles && Result.NoSanitizerErrors && Result.TestsPass;
}

SandboxConfig Evaluator::configFor(const Task &T) const {
  SandboxConfig C = Config;
  C.TimeoutSeconds = T.Config.TimeoutSeconds;
  return C;
}

Error Evaluator::checkout(const Task &T, BuildSandbox &Sandbox) {
  if (T.Config.isSynthetic()) {
    // Only the regions covered by the patch are known; the rest of each
    // file is blank lines so that hunk positions still line up.
    PatchDocument Doc = parsePatch(T.BuggyPatch);
    PatchValidation Valid = validatePatch(Doc);
    if (!Valid.Ok)
      return createStringError(std::errc::invalid_argument,
                               "buggy.patch is not usable: %s",
                               Valid.Reason.c_str());
    log("reconstructing sources from buggy.patch");
    return Sandbox.initializeFromFiles(reconstructFiles(Doc, PatchSide::Old),
                                       "repo");
  }

  log("cloning at commit " + T.Config.Commit);
  CloneResult Clone = Sandbox.clone(T.Config.Commit);
  if (!Clone.Success)
    return createStringError(std::errc::io_error, "Failed to clone: %s",
                             Clone.Error.c_str());
  return Error::success();
}

Error Evaluator::applyBuggy(const Task &T, BuildSandbox &Sandbox) {
  log("applying buggy.patch");
  PatchApplyResult Applied = Sandbox.applyBuggyPatch(T.BuggyPatchPath);
  if (!Applied.Success)
    return createStringError(std::errc::invalid_argument,
                             "Failed to apply buggy patch: %s",
                             Applied.Error.c_str());
  return Error::success();
}

GenerationContext Evaluator::buildContext(const Task &T,
                                          const BuildSandbox &Sandbox) const {
  GenerationContext Context;
  Context.System = GeneratorSystemPrompt;
  for (const std::string &Path : T.Config.FilesToModify)
    if (Optional<std::string> Content = Sandbox.getFileContent(Path))
      Context.Files[Path] = std::move(*Content);
  return Context;
}

EvaluationResult Evaluator::run() {
  auto Start = Clock::now();
  EvaluationResult Result;
  Result.GeneratorName = Gen.getName();
  try {
    log("loading task from " + TaskDir);
    Expected<Task> T = loadTask(TaskDir);
    if (!T)
      return fail(Result, toString(T.takeError()), Start);
    Result.TaskId = T->Config.Id;
    Result.Category = T->Config.Category;
    Result.Tier = T->Config.Tier;
    Result.Commit = T->Config.Commit;
    if (T->Config.RequiresAssets)
      errs() << "Evaluator: warning: task " << T->Config.Id
             << " requires game assets\n";
    EvaluationResult Evaluated = evaluate(*T);
    Evaluated.GeneratorName = Result.GeneratorName;
    Evaluated.ElapsedSeconds = secondsSince(Start);
    return Evaluated;
  } catch (const std::exception &E) {
    return fail(Result, std::string("unexpected failure: ") + E.what(), Start);
  }
}

EvaluationResult Evaluator::evaluate(const Task &T) {
  auto Start = Clock::now();
  EvaluationResult Result;
  Result.TaskId = T.Config.Id;
  Result.Category = T.Config.Category;
  Result.Tier = T.Config.Tier;
  Result.Commit = T.Config.Commit;

  BuildSandbox Sandbox(configFor(T), Runner, Cache);
  if (Error E = checkout(T, Sandbox))
    return fail(Result, toString(std::move(E)), Start);
  if (Error E = applyBuggy(T, Sandbox))
    return fail(Result, toString(std::move(E)), Start);

  GenerationContext Context = buildContext(T, Sandbox);
  log("invoking " + Gen.getName());
  Expected<std::string> Response = Gen.generate(T.Prompt, Context);
  if (!Response)
    return fail(Result, "Generator failed: " + toString(Response.takeError()),
                Start);
  Result.ModelResponse = *Response;

  ExtractedFix Fix = extractFix(*Response);
  switch (Fix.FixKind) {
  case ExtractedFix::Kind::CompleteFiles: {
    std::string Combined;
    for (const auto &File : Fix.Files) {
      log("complete file for " + File.first);
      if (Optional<std::string> Original = Sandbox.getFileContent(File.first))
        Combined += createPatch(*Original, File.second, File.first);
    }
    Result.AppliedPatch = std::move(Combined);
    if (Error E = Sandbox.applyFileChanges(Fix.Files))
      return fail(Result, "Failed to write model files: " + toString(std::move(E)),
                  Start);
    break;
  }
  case ExtractedFix::Kind::Patch: {
    log("applying model patch");
    Result.AppliedPatch = Fix.PatchText;
    PatchApplyResult Applied = Sandbox.applyModelFix(Fix.PatchText);
    if (!Applied.Success)
      return fail(Result, "Failed to apply model patch: " + Applied.Error, Start);
    break;
  }
  case ExtractedFix::Kind::None:
    return fail(Result,
                "No fix found in model response (expected complete file or "
                "patch)",
                Start);
  }

  TestRunner Tests(Sandbox, T.Config.TimeoutSeconds);
  if (T.Config.isSynthetic()) {
    // No project build; the harness compile is the compile check.
    Result.Tests = Tests.run(T.TestDir);
    Result.Compiles = !Result.Tests->CompilationError && Result.Tests->Errors == 0;
  } else {
    log("building");
    BuildResult Build = Sandbox.build();
    Result.Compiles = Build.Success;
    if (!Build.Success)
      log("build failed: " + Build.Error);
    Result.Tests = Tests.run(T.TestDir);
  }

  Result.Sanitizers = Result.Tests->Sanitizers;
  Result.NoSanitizerErrors =
      Result.Sanitizers.hasValue() && !Result.Sanitizers->hasErrors();
  Result.TestsPass = Result.Tests->Success;
  if (T.Config.ExpectedSanitizerError && Result.Sanitizers)
    Result.ExpectedErrorObserved =
        observedKind(*Result.Sanitizers, *T.Config.ExpectedSanitizerError);

  if (T.ReferencePatch && !Result.AppliedPatch.empty()) {
    Result.PatchSimilarity = comparePatches(*T.ReferencePatch, Result.AppliedPatch);
    Result.MatchesReference = Result.PatchSimilarity >= SimilarityThreshold;
  }

  applyScore(Result);
  Result.ElapsedSeconds = secondsSince(Start);
  log(formatv("score {0}/{1}", Result.TotalScore, Result.MaxScore).str());
  return Result;
}

TaskValidation Evaluator::validate() {
  TaskValidation Validation;
  try {
    Expected<Task> T = loadTask(TaskDir);
    if (!T) {
      Validation.Error = toString(T.takeError());
      return Validation;
    }

    {
      BuildSandbox Sandbox(configFor(*T), Runner, Cache);
      if (Error E = checkout(*T, Sandbox)) {
        Validation.Error = toString(std::move(E));
        return Validation;
      }
      if (T->ReferencePatch) {
        if (Error E = applyBuggy(*T, Sandbox)) {
          Validation.Error = toString(std::move(E));
          return Validation;
        }
        PatchApplyResult Applied = Sandbox.applyModelFix(*T->ReferencePatch);
        if (!Applied.Success) {
          Validation.Error = "Failed to apply reference fix: " + Applied.Error;
          return Validation;
        }
      }
      Validation.Fixed = TestRunner(Sandbox, T->Config.TimeoutSeconds).run(T->TestDir);
    }

    {
      BuildSandbox Sandbox(configFor(*T), Runner, Cache);
      if (Error E = checkout(*T, Sandbox)) {
        Validation.Error = toString(std::move(E));
        return Validation;
      }
      if (Error E = applyBuggy(*T, Sandbox)) {
        Validation.Error = toString(std::move(E));
        return Validation;
      }
      Validation.Buggy = TestRunner(Sandbox, T->Config.TimeoutSeconds).run(T->TestDir);
    }
  } catch (const std::exception &E) {
    Validation.Error = std::string("unexpected failure: ") + E.what();
    return Validation;
  }

  Validation.Valid = Validation.Fixed->Success && !Validation.Buggy->Success;
  return Validation;
}

std::string formatEvaluationResult(const EvaluationResult &Result) {
  auto mark = [](bool B) { return B ? "x" : " "; };
  std::string Out;
  raw_string_ostream OS(Out);
  OS << "Task: " << Result.TaskId << "\n";
  OS << "Generator: " << Result.GeneratorName << "\n";
  OS << "Result: " << (Result.Success ? "PASSED" : "FAILED") << "\n\n";
  OS << formatv("Score Breakdown ({0}/{1}):\n", Result.TotalScore,
                Result.MaxScore);
  OS << formatv("  [{0}] Compiles: {1} point\n", mark(Result.Compiles),
                Result.Compiles ? 1 : 0);
  OS << formatv("  [{0}] No sanitizer errors: {1} point\n",
                mark(Result.NoSanitizerErrors), Result.NoSanitizerErrors ? 1 : 0);
  OS << formatv("  [{0}] Tests pass: {1} points\n", mark(Result.TestsPass),
                Result.TestsPass ? 2 : 0);
  OS << formatv("  [{0}] Matches fix: {1} bonus point\n",
                mark(Result.MatchesReference), Result.MatchesReference ? 1 : 0);

  if (Result.Tests) {
    const TestOutcome &Tests = *Result.Tests;
    OS << formatv("\nTests: {0}/{1} passed", Tests.Passed, Tests.Total);
    if (Tests.Failed)
      OS << formatv(", {0} failed", Tests.Failed);
    if (Tests.TimedOut)
      OS << " (timed out)";
    OS << "\n";
    if (Tests.CompilationError)
      OS << "Compilation error: " << *Tests.CompilationError << "\n";
  }
  if (Result.Sanitizers && (Result.Sanitizers->hasErrors() ||
                            Result.Sanitizers->hasLeaks()))
    OS << "\n" << formatSanitizerReport(*Result.Sanitizers);
  if (Result.ExpectedErrorObserved)
    OS << "Expected sanitizer error observed: "
       << (*Result.ExpectedErrorObserved ? "yes" : "no") << "\n";
  if (Result.PatchSimilarity > 0)
    OS << formatv("\nPatch similarity: {0:P1}\n", Result.PatchSimilarity);
  if (Result.Error)
    OS << "\nError: " << *Result.Error << "\n";
  OS << formatv("\nElapsed: {0:F1}s\n", Result.ElapsedSeconds);
  return OS.str();
}

} // namespace fixbench
