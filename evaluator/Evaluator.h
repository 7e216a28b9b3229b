#ifndef FIXBENCH_EVALUATOR_EVALUATOR_H
#define FIXBENCH_EVALUATOR_EVALUATOR_H

#include "Generator.h"
#include "Task.h"

#include "logparse/SanitizerReport.h"
#include "runner/TestRunner.h"
#include "sandbox/BuildSandbox.h"

#include "llvm/ADT/Optional.h"
#include "llvm/Support/Error.h"

#include <string>

namespace fixbench {

class BuildCache;

/// Points per sub-score.
constexpr double CompilesPoints = 1.0;
constexpr double NoSanitizerErrorsPoints = 1.0;
constexpr double TestsPassPoints = 2.0;
constexpr double MatchesReferencePoints = 1.0;
constexpr double MaxTotalScore = 5.0;
/// Reference similarity at or above which the bonus point is awarded.
constexpr double SimilarityThreshold = 0.70;

struct EvaluationResult {
  std::string TaskId = "unknown";
  std::string GeneratorName;
  std::string Category;
  std::string Tier;
  std::string Commit;

  bool Success = false;
  bool Compiles = false;
  bool NoSanitizerErrors = false;
  bool TestsPass = false;
  bool MatchesReference = false;
  double TotalScore = 0.0;
  double MaxScore = MaxTotalScore;

  llvm::Optional<TestOutcome> Tests;
  llvm::Optional<SanitizerReport> Sanitizers;
  double PatchSimilarity = 0.0;
  /// Set when the task names an expected sanitizer error kind.
  llvm::Optional<bool> ExpectedErrorObserved;
  std::string ModelResponse;
  std::string AppliedPatch;
  double ElapsedSeconds = 0.0;
  /// Set when the run stopped early; all sub-scores are then false.
  llvm::Optional<std::string> Error;

  double getScorePercentage() const {
    return MaxScore > 0 ? TotalScore / MaxScore * 100.0 : 0.0;
  }
};

/// Fills TotalScore and Success from the four sub-scores. The bonus point
/// never affects Success.
void applyScore(EvaluationResult &Result);

/// Outcome of checking that a task's tests discriminate: they must fail on
/// the buggy tree and pass on the fixed one.
struct TaskValidation {
  bool Valid = false;
  llvm::Optional<TestOutcome> Fixed;
  llvm::Optional<TestOutcome> Buggy;
  std::string Error;
};

/// Runs one task end to end: prepare the buggy tree, ask the generator for a
/// fix, apply it, build, test and score. Failures never escape run(); they
/// end up in EvaluationResult::Error.
class Evaluator {
public:
  Evaluator(std::string TaskDir, Generator &Gen, SandboxConfig Config,
            CommandRunner &Runner, BuildCache *Cache = nullptr)
      : TaskDir(std::move(TaskDir)), Gen(Gen), Config(std::move(Config)),
        Runner(Runner), Cache(Cache) {}

  EvaluationResult run();

  /// Does not consult the generator. Fixed means buggy plus the reference
  /// fix when one exists, the pinned tree otherwise.
  TaskValidation validate();

private:
  std::string TaskDir;
  Generator &Gen;
  SandboxConfig Config;
  CommandRunner &Runner;
  BuildCache *Cache;

  EvaluationResult evaluate(const Task &T);
  llvm::Error checkout(const Task &T, BuildSandbox &Sandbox);
  llvm::Error applyBuggy(const Task &T, BuildSandbox &Sandbox);
  GenerationContext buildContext(const Task &T,
                                 const BuildSandbox &Sandbox) const;
  SandboxConfig configFor(const Task &T) const;
};

/// System instruction given to the generator.
extern const char GeneratorSystemPrompt[];

std::string formatEvaluationResult(const EvaluationResult &Result);

} // namespace fixbench

#endif // FIXBENCH_EVALUATOR_EVALUATOR_H
