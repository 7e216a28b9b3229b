#include "evaluator/Evaluator.h"
#include "evaluator/ResultWriter.h"
#include "TestHelpers.h"

#include "gtest/gtest.h"

#include <nlohmann/json.hpp>

using namespace llvm;
using namespace fixbench;
using namespace fixbench::test;

namespace {

const char BuggyPatch[] = "diff --git a/src/game/undo.c b/src/game/undo.c\n"
                          "--- a/src/game/undo.c\n"
                          "+++ b/src/game/undo.c\n"
                          "@@ -1,5 +1,4 @@\n"
                          " void undo_clear(struct undo *u)\n"
                          " {\n"
                          "     free(u->data);\n"
                          "-    u->data = 0;\n"
                          " }\n";

const char FixPatch[] = "diff --git a/src/game/undo.c b/src/game/undo.c\n"
                        "--- a/src/game/undo.c\n"
                        "+++ b/src/game/undo.c\n"
                        "@@ -1,4 +1,5 @@\n"
                        " void undo_clear(struct undo *u)\n"
                        " {\n"
                        "     free(u->data);\n"
                        "+    u->data = 0;\n"
                        " }\n";

const char FixedSource[] = "void undo_clear(struct undo *u)\n"
                           "{\n"
                           "    free(u->data);\n"
                           "    u->data = 0;\n"
                           "}\n";

/// Returns a canned response and remembers what it was given.
class CannedGenerator : public Generator {
public:
  explicit CannedGenerator(std::string Response) : Response(std::move(Response)) {}

  std::string getName() const override { return "canned"; }

  Expected<std::string> generate(StringRef Prompt,
                                 const GenerationContext &Context) override {
    LastPrompt = Prompt.str();
    LastContext = Context;
    return Response;
  }

  std::string Response;
  std::string LastPrompt;
  GenerationContext LastContext;
};

/// git and cmake succeed, git clone creates the tree, the C compiler writes
/// its output file, and every test binary run answers with Exec.
class PipelineRunner : public FakeCommandRunner {
public:
  PipelineRunner() {
    Handler = [this](const Command &Cmd) { return answer(Cmd); };
  }

  ProcessResult Exec = exitedWith(0, "[PASS] undo_clear\nResults: 1/1 tests passed\n");
  ProcessResult Make = exitedWith(0);
  int FailGitApplyAt = -1;
  unsigned GitApplies = 0;
  unsigned TestRuns = 0;
  std::function<ProcessResult(unsigned)> ExecFor;

private:
  ProcessResult answer(const Command &Cmd) {
    if (Cmd.Program == "git") {
      if (!Cmd.Args.empty() && Cmd.Args[0] == "clone") {
        std::error_code EC = writeTextFile(Cmd.Args.back() + "/src/game/undo.c",
                                           FixedSource);
        return EC ? exitedWith(128, "", EC.message()) : exitedWith(0);
      }
      if (Cmd.Args.size() > 2 && Cmd.Args[2] == "apply" &&
          static_cast<int>(GitApplies++) == FailGitApplyAt)
        return exitedWith(1, "", "error: patch does not apply");
      return exitedWith(0);
    }
    if (Cmd.Program == "clang") {
      std::error_code EC = writeTextFile(argAfter(Cmd, "-o"), "binary");
      return EC ? exitedWith(1, "", EC.message()) : exitedWith(0);
    }
    if (Cmd.Program == "cmake")
      return exitedWith(0);
    if (Cmd.Program == "make")
      return Make;
    unsigned Run = TestRuns++;
    return ExecFor ? ExecFor(Run) : Exec;
  }
};

class EvaluatorTest : public ::testing::Test {
protected:
  ScopedTempDir Dir;
  PipelineRunner Runner;

  void SetUp() override { writeTask("synthetic"); }

  void writeTask(StringRef Commit) {
    Dir.write("task/task.json",
              (R"({"id": "undo-001", "category": "memory", "tier": 1,
                  "commit": ")" +
               Commit + R"(",
                  "files_to_modify": ["src/game/undo.c"],
                  "expected_asan_error": "use-after-free"})")
                  .str());
    Dir.write("task/prompt.md", "Undo crashes after clearing.\n");
    Dir.write("task/buggy.patch", BuggyPatch);
    Dir.write("task/solution/fix.patch", FixPatch);
    Dir.write("task/tests/test_undo.c", "int main(void) { return 0; }\n");
  }

  SandboxConfig config() const {
    SandboxConfig Config;
    Config.WorkRoot = Dir.path("work");
    Config.UseCache = false;
    return Config;
  }

  EvaluationResult evaluate(Generator &Gen) {
    return Evaluator(Dir.path("task"), Gen, config(), Runner).run();
  }
};

TEST(ScoreTest, SubScoresAddUp) {
  EvaluationResult R;
  R.Compiles = R.NoSanitizerErrors = R.TestsPass = R.MatchesReference = true;
  applyScore(R);
  EXPECT_DOUBLE_EQ(R.TotalScore, 5.0);
  EXPECT_TRUE(R.Success);
  EXPECT_DOUBLE_EQ(R.getScorePercentage(), 100.0);

  R.MatchesReference = false;
  applyScore(R);
  EXPECT_DOUBLE_EQ(R.TotalScore, 4.0);
  EXPECT_TRUE(R.Success);
}

TEST(ScoreTest, SuccessNeedsAllThreeCoreScores) {
  EvaluationResult R;
  R.Compiles = R.TestsPass = R.MatchesReference = true;
  applyScore(R);
  EXPECT_DOUBLE_EQ(R.TotalScore, 4.0);
  EXPECT_FALSE(R.Success);
}

TEST_F(EvaluatorTest, MissingTaskDirectoryScoresZero) {
  CannedGenerator Gen("");
  EvaluationResult R =
      Evaluator(Dir.path("absent"), Gen, config(), Runner).run();
  EXPECT_EQ(R.TaskId, "unknown");
  EXPECT_FALSE(R.Success);
  EXPECT_DOUBLE_EQ(R.TotalScore, 0.0);
  ASSERT_TRUE(R.Error.hasValue());
  EXPECT_NE(R.Error->find("task.json not found"), std::string::npos);
  EXPECT_TRUE(Runner.Commands.empty());
}

TEST_F(EvaluatorTest, SyntheticTaskWithMatchingPatch) {
  CannedGenerator Gen(std::string("The pointer is left dangling.\n```diff\n") +
                      FixPatch + "```\n");
  EvaluationResult R = evaluate(Gen);
  ASSERT_FALSE(R.Error.hasValue()) << *R.Error;

  EXPECT_EQ(R.TaskId, "undo-001");
  EXPECT_EQ(R.GeneratorName, "canned");
  EXPECT_EQ(R.Commit, "synthetic");
  EXPECT_TRUE(R.Compiles);
  EXPECT_TRUE(R.NoSanitizerErrors);
  EXPECT_TRUE(R.TestsPass);
  EXPECT_TRUE(R.MatchesReference);
  EXPECT_DOUBLE_EQ(R.PatchSimilarity, 1.0);
  EXPECT_DOUBLE_EQ(R.TotalScore, 5.0);
  EXPECT_TRUE(R.Success);
  ASSERT_TRUE(R.ExpectedErrorObserved.hasValue());
  EXPECT_FALSE(*R.ExpectedErrorObserved);
  ASSERT_TRUE(R.Tests.hasValue());
  EXPECT_EQ(R.Tests->Passed, 1u);

  EXPECT_EQ(Gen.LastPrompt, "Undo crashes after clearing.\n");
  EXPECT_EQ(Gen.LastContext.System, GeneratorSystemPrompt);
  EXPECT_EQ(Gen.LastContext.Files["src/game/undo.c"], FixedSource);

  // buggy.patch, model patch, test compile, test run
  ASSERT_EQ(Runner.Commands.size(), 4u);
  EXPECT_EQ(Runner.GitApplies, 2u);
  EXPECT_EQ(Runner.Commands[2].Program, "clang");

  std::string Report = formatEvaluationResult(R);
  EXPECT_NE(Report.find("Result: PASSED"), std::string::npos);
  EXPECT_NE(Report.find("[x] Compiles"), std::string::npos);
}

TEST_F(EvaluatorTest, CompleteFileResponse) {
  CannedGenerator Gen("```c src/game/undo.c\n"
                      "void undo_clear(struct undo *u)\n"
                      "{\n"
                      "    free(u->data);\n"
                      "    u->data = 0;\n"
                      "    u->size = 0;\n"
                      "}\n"
                      "```\n");
  EvaluationResult R = evaluate(Gen);
  ASSERT_FALSE(R.Error.hasValue()) << *R.Error;
  EXPECT_NE(R.AppliedPatch.find("+    u->size = 0;"), std::string::npos);
  EXPECT_EQ(Runner.GitApplies, 1u);
  EXPECT_TRUE(R.Success);
  EXPECT_GT(R.PatchSimilarity, 0.0);
  EXPECT_LT(R.PatchSimilarity, 1.0);
}

TEST_F(EvaluatorTest, CompleteFileOutsideRepositoryIsRejected) {
  CannedGenerator Gen("```c ../../../escaped.c\nint x;\n```\n");
  EvaluationResult R = evaluate(Gen);
  ASSERT_TRUE(R.Error.hasValue());
  EXPECT_NE(R.Error->find("Failed to write model files"), std::string::npos);
  EXPECT_NE(R.Error->find("path outside the repository"), std::string::npos);
  EXPECT_FALSE(R.Success);
  EXPECT_DOUBLE_EQ(R.TotalScore, 0.0);
  EXPECT_FALSE(sys::fs::exists(Dir.path("escaped.c")));
  EXPECT_FALSE(sys::fs::exists(Dir.path("work/escaped.c")));
}

TEST_F(EvaluatorTest, NoFixInResponse) {
  CannedGenerator Gen("I am not sure what is wrong here.");
  EvaluationResult R = evaluate(Gen);
  ASSERT_TRUE(R.Error.hasValue());
  EXPECT_EQ(*R.Error,
            "No fix found in model response (expected complete file or patch)");
  EXPECT_EQ(R.TaskId, "undo-001");
  EXPECT_DOUBLE_EQ(R.TotalScore, 0.0);
  EXPECT_FALSE(R.Compiles);
  EXPECT_EQ(R.ModelResponse, "I am not sure what is wrong here.");
}

TEST_F(EvaluatorTest, ModelPatchThatDoesNotApply) {
  Runner.FailGitApplyAt = 1;
  CannedGenerator Gen(std::string("```diff\n") + FixPatch + "```\n");
  EvaluationResult R = evaluate(Gen);
  ASSERT_TRUE(R.Error.hasValue());
  EXPECT_NE(R.Error->find("Failed to apply model patch"), std::string::npos);
  EXPECT_DOUBLE_EQ(R.TotalScore, 0.0);
  EXPECT_FALSE(R.Success);
}

TEST_F(EvaluatorTest, BuggyPatchThatDoesNotApply) {
  Runner.FailGitApplyAt = 0;
  CannedGenerator Gen(std::string("```diff\n") + FixPatch + "```\n");
  EvaluationResult R = evaluate(Gen);
  ASSERT_TRUE(R.Error.hasValue());
  EXPECT_NE(R.Error->find("Failed to apply buggy patch"), std::string::npos);
  EXPECT_TRUE(Gen.LastPrompt.empty());
}

TEST_F(EvaluatorTest, SanitizerFindingCostsPoints) {
  Runner.Exec = exitedWith(
      1, "",
      "==5==ERROR: AddressSanitizer: heap-use-after-free on address 0x6030000\n"
      "    #0 0x1 in undo_apply src/game/undo.c:9\n"
      "SUMMARY: AddressSanitizer: heap-use-after-free src/game/undo.c:9\n");
  CannedGenerator Gen(std::string("```diff\n") + FixPatch + "```\n");
  EvaluationResult R = evaluate(Gen);
  ASSERT_FALSE(R.Error.hasValue()) << *R.Error;
  EXPECT_TRUE(R.Compiles);
  EXPECT_FALSE(R.NoSanitizerErrors);
  EXPECT_FALSE(R.TestsPass);
  EXPECT_TRUE(R.MatchesReference);
  EXPECT_DOUBLE_EQ(R.TotalScore, 2.0);
  EXPECT_FALSE(R.Success);
  ASSERT_TRUE(R.ExpectedErrorObserved.hasValue());
  EXPECT_TRUE(*R.ExpectedErrorObserved);

  nlohmann::json J = toJSON(R);
  EXPECT_EQ(J["scores"]["total"].get<double>(), 2.0);
  EXPECT_FALSE(J["scores"]["no_sanitizer_errors"].get<bool>());
  ASSERT_EQ(J["sanitizer_report"]["errors"].size(), 1u);
  EXPECT_EQ(J["sanitizer_report"]["errors"][0]["type"].get<std::string>(),
            "heap-use-after-free");
  EXPECT_EQ(J["sanitizer_report"]["errors"][0]["location"].get<std::string>(),
            "src/game/undo.c:9");
  EXPECT_TRUE(J["expected_error_observed"].get<bool>());
}

TEST_F(EvaluatorTest, ClonedTaskBuildFailureStillRunsTests) {
  writeTask("abc123");
  Runner.Make = exitedWith(2, "", "src/game/undo.c:4: error: expected ';'\n");
  CannedGenerator Gen(std::string("```diff\n") + FixPatch + "```\n");
  EvaluationResult R = evaluate(Gen);
  ASSERT_FALSE(R.Error.hasValue()) << *R.Error;
  EXPECT_FALSE(R.Compiles);
  EXPECT_TRUE(R.TestsPass);
  EXPECT_TRUE(R.NoSanitizerErrors);
  EXPECT_DOUBLE_EQ(R.TotalScore, 4.0);
  EXPECT_FALSE(R.Success);

  ASSERT_FALSE(Runner.Commands.empty());
  EXPECT_EQ(Runner.Commands[0].Args[0], "clone");
  EXPECT_EQ(Gen.LastContext.Files["src/game/undo.c"], FixedSource);
}

TEST_F(EvaluatorTest, ValidateRequiresDiscriminatingTests) {
  Runner.ExecFor = [](unsigned Run) {
    if (Run == 0)
      return exitedWith(0, "Results: 1/1 tests passed\n");
    return exitedWith(1, "Results: 0/1 tests passed\n");
  };
  CannedGenerator Gen("");
  TaskValidation V = Evaluator(Dir.path("task"), Gen, config(), Runner).validate();
  EXPECT_TRUE(V.Error.empty()) << V.Error;
  ASSERT_TRUE(V.Fixed.hasValue());
  ASSERT_TRUE(V.Buggy.hasValue());
  EXPECT_TRUE(V.Fixed->Success);
  EXPECT_FALSE(V.Buggy->Success);
  EXPECT_TRUE(V.Valid);
  // Fixed tree: buggy.patch then fix.patch; buggy tree: buggy.patch.
  EXPECT_EQ(Runner.GitApplies, 3u);
  EXPECT_TRUE(Gen.LastPrompt.empty());

  nlohmann::json J = toJSON(V);
  EXPECT_TRUE(J["valid"].get<bool>());
  EXPECT_TRUE(J["error"].is_null());
}

TEST_F(EvaluatorTest, ValidateRejectsTestsThatAlwaysPass) {
  CannedGenerator Gen("");
  TaskValidation V = Evaluator(Dir.path("task"), Gen, config(), Runner).validate();
  EXPECT_TRUE(V.Error.empty()) << V.Error;
  EXPECT_FALSE(V.Valid);
}

TEST_F(EvaluatorTest, WritesResultFile) {
  CannedGenerator Gen(std::string("```diff\n") + FixPatch + "```\n");
  EvaluationResult R = evaluate(Gen);
  std::string Path = Dir.path("out/result.json");
  Error E = writeResultJSON(R, Path);
  ASSERT_FALSE(bool(E)) << toString(std::move(E));

  Expected<std::string> Text = readTextFile(Path);
  ASSERT_TRUE(bool(Text)) << toString(Text.takeError());
  nlohmann::json J = nlohmann::json::parse(*Text);
  EXPECT_EQ(J["task_id"].get<std::string>(), "undo-001");
  EXPECT_TRUE(J["success"].get<bool>());
  EXPECT_EQ(J["scores"]["max"].get<double>(), 5.0);
  EXPECT_EQ(J["metadata"]["tier"].get<std::string>(), "1");
  EXPECT_EQ(J["tests"]["passed"].get<unsigned>(), 1u);
  EXPECT_TRUE(J["error"].is_null());
}

TEST(ResultWriterTest, InvalidUtf8IsReplaced) {
  ScopedTempDir Dir;
  EvaluationResult R;
  R.TaskId = "undo-002";
  R.AppliedPatch = "--- a/src/a.c\n+++ b/src/a.c\n@@ -1 +1 @@\n-x\n+/* caf\xe9 */\n";
  R.Error = std::string("Build failed: src/a.c:1: error: stray '\xe9'");
  std::string Path = Dir.path("result.json");
  Error E = writeResultJSON(R, Path);
  ASSERT_FALSE(bool(E)) << toString(std::move(E));

  Expected<std::string> Text = readTextFile(Path);
  ASSERT_TRUE(bool(Text)) << toString(Text.takeError());
  nlohmann::json J = nlohmann::json::parse(*Text);
  EXPECT_EQ(J["task_id"].get<std::string>(), "undo-002");
  EXPECT_NE(J["applied_patch"].get<std::string>().find("+/* caf\xef\xbf\xbd */"),
            std::string::npos);
  EXPECT_NE(J["error"].get<std::string>().find("stray '\xef\xbf\xbd'"),
            std::string::npos);
}

} // namespace
