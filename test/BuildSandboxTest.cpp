#include "sandbox/BuildCache.h"
#include "sandbox/BuildSandbox.h"
#include "TestHelpers.h"

#include "llvm/Support/FileSystem.h"

#include "gtest/gtest.h"

#include <algorithm>

using namespace llvm;
using namespace fixbench;
using namespace fixbench::test;

namespace {

/// Pretends to be git: clone creates the destination with one source file.
ProcessResult fakeGit(const Command &Cmd) {
  if (!Cmd.Args.empty() && Cmd.Args[0] == "clone") {
    std::string Dest = Cmd.Args.back();
    std::error_code EC = writeTextFile(Dest + "/src/core/buffer.c", "int b;\n");
    if (EC)
      return exitedWith(128, "", EC.message());
  }
  return exitedWith(0);
}

SandboxConfig configIn(const ScopedTempDir &Dir) {
  SandboxConfig Config;
  Config.WorkRoot = Dir.path("work");
  Config.RepoURL = "https://example.invalid/julius.git";
  Config.TimeoutSeconds = 42;
  return Config;
}

TEST(BuildSandboxTest, CloneRunsGitWithTimeout) {
  ScopedTempDir Dir;
  FakeCommandRunner Runner(fakeGit);
  BuildSandbox Sandbox(configIn(Dir), Runner);

  CloneResult Clone = Sandbox.clone("abc123");
  ASSERT_TRUE(Clone.Success) << Clone.Error;
  EXPECT_FALSE(Clone.FromCache);
  EXPECT_EQ(Sandbox.getState(), SandboxState::Cloned);
  EXPECT_EQ(Sandbox.getCommit(), "abc123");

  ASSERT_EQ(Runner.Commands.size(), 2u);
  EXPECT_EQ(Runner.Commands[0].Args[0], "clone");
  EXPECT_EQ(Runner.Commands[0].TimeoutSeconds, 42u);
  EXPECT_EQ(Runner.Commands[1].Args[2], "checkout");
  EXPECT_EQ(Runner.Commands[1].Args[3], "abc123");

  Optional<std::string> Content = Sandbox.getFileContent("src/core/buffer.c");
  ASSERT_TRUE(Content.hasValue());
  EXPECT_EQ(*Content, "int b;\n");
  std::vector<std::string> Sources = Sandbox.listSourceFiles();
  ASSERT_EQ(Sources.size(), 1u);
  EXPECT_EQ(Sources[0], "src/core/buffer.c");
}

TEST(BuildSandboxTest, CloneFailureIsReported) {
  ScopedTempDir Dir;
  FakeCommandRunner Runner([](const Command &) {
    return exitedWith(128, "", "fatal: repository not found");
  });
  BuildSandbox Sandbox(configIn(Dir), Runner);
  CloneResult Clone = Sandbox.clone("abc123");
  EXPECT_FALSE(Clone.Success);
  EXPECT_NE(Clone.Error.find("repository not found"), std::string::npos);
  EXPECT_FALSE(Sandbox.hasRepository());
}

TEST(BuildSandboxTest, SecondCloneComesFromCache) {
  ScopedTempDir Dir;
  BuildCache Cache(Dir.path("cache"));
  FakeCommandRunner Runner(fakeGit);

  {
    BuildSandbox First(configIn(Dir), Runner, &Cache);
    ASSERT_TRUE(First.clone("abc123").Success);
  }
  EXPECT_EQ(Cache.getMisses(), 1u);
  EXPECT_EQ(Cache.getStores(), 1u);
  EXPECT_TRUE(Cache.contains("abc123"));

  size_t CallsBefore = Runner.Commands.size();
  BuildSandbox Second(configIn(Dir), Runner, &Cache);
  CloneResult Clone = Second.clone("abc123");
  ASSERT_TRUE(Clone.Success) << Clone.Error;
  EXPECT_TRUE(Clone.FromCache);
  EXPECT_EQ(Runner.Commands.size(), CallsBefore);
  EXPECT_EQ(Cache.getHits(), 1u);
  EXPECT_EQ(*Second.getFileContent("src/core/buffer.c"), "int b;\n");
}

TEST(BuildSandboxTest, CacheKeys) {
  EXPECT_EQ(BuildCache::keyFor("abc123").size(), 16u);
  EXPECT_EQ(BuildCache::keyFor("abc123"), BuildCache::keyFor("abc123"));
  EXPECT_NE(BuildCache::keyFor("abc123"), BuildCache::keyFor("abc124"));

  ScopedTempDir Dir;
  BuildCache Cache(Dir.path("cache"));
  EXPECT_EQ(Cache.getEntryPath("abc123"),
            Dir.path("cache/repo_" + BuildCache::keyFor("abc123")));
  Expected<bool> Miss = Cache.restore("abc123", Dir.path("dest"));
  ASSERT_TRUE(bool(Miss));
  EXPECT_FALSE(*Miss);

  Dir.write("tree/a.c", "int a;\n");
  Expected<bool> Stored = Cache.store("abc123", Dir.path("tree"));
  ASSERT_TRUE(bool(Stored));
  EXPECT_TRUE(*Stored);
  Expected<bool> Again = Cache.store("abc123", Dir.path("tree"));
  ASSERT_TRUE(bool(Again));
  EXPECT_FALSE(*Again);
}

TEST(BuildSandboxTest, CleanupIsIdempotent) {
  ScopedTempDir Dir;
  FakeCommandRunner Runner;
  BuildSandbox Sandbox(configIn(Dir), Runner);
  ASSERT_FALSE(errorToBool(Sandbox.initializeFromFiles({{"src/a.c", "int a;\n"}}, "repo")));
  std::string WorkDir = Sandbox.getWorkDir();
  ASSERT_TRUE(sys::fs::exists(WorkDir));

  Sandbox.cleanup();
  EXPECT_FALSE(sys::fs::exists(WorkDir));
  EXPECT_EQ(Sandbox.getState(), SandboxState::Cleaned);
  EXPECT_FALSE(Sandbox.hasRepository());
  Sandbox.cleanup();
  EXPECT_EQ(Sandbox.getState(), SandboxState::Cleaned);
  EXPECT_EQ(getSandboxStateName(Sandbox.getState()), "cleaned");
  EXPECT_TRUE(Runner.Commands.empty());
}

TEST(BuildSandboxTest, OperationsNeedRepository) {
  FakeCommandRunner Runner;
  BuildSandbox Sandbox(SandboxConfig(), Runner);
  EXPECT_FALSE(Sandbox.build().Success);
  EXPECT_FALSE(Sandbox.applyModelFix("--- a/x\n+++ b/x\n").Success);
  Error E = Sandbox.applyFileChanges({{"a.c", ""}});
  EXPECT_TRUE(bool(E));
  consumeError(std::move(E));
  EXPECT_FALSE(Sandbox.getFileContent("a.c").hasValue());
  EXPECT_TRUE(Runner.Commands.empty());
}

TEST(BuildSandboxTest, FileChangesStayInsideRepository) {
  ScopedTempDir Dir;
  FakeCommandRunner Runner;
  BuildSandbox Sandbox(configIn(Dir), Runner);
  ASSERT_FALSE(errorToBool(Sandbox.initializeFromFiles({{"src/a.c", "int a;\n"}}, "repo")));

  Error Escaping = Sandbox.applyFileChanges(
      {{"src/b.c", "int b;\n"}, {"../../../escaped.c", "int x;\n"}});
  ASSERT_TRUE(bool(Escaping));
  EXPECT_NE(toString(std::move(Escaping)).find("path outside the repository"),
            std::string::npos);
  EXPECT_FALSE(sys::fs::exists(Dir.path("escaped.c")));
  EXPECT_FALSE(sys::fs::exists(Dir.path("work/escaped.c")));
  EXPECT_FALSE(Sandbox.getFileContent("src/b.c").hasValue());

  Error Absolute = Sandbox.applyFileChanges({{Dir.path("abs.c"), "int y;\n"}});
  EXPECT_TRUE(bool(Absolute));
  consumeError(std::move(Absolute));
  EXPECT_FALSE(sys::fs::exists(Dir.path("abs.c")));
  EXPECT_FALSE(Sandbox.getFileContent("../../src/a.c").hasValue());

  ASSERT_FALSE(errorToBool(Sandbox.applyFileChanges({{"src/./c/../b.c", "int b;\n"}})));
  Optional<std::string> Written = Sandbox.getFileContent("src/b.c");
  ASSERT_TRUE(Written.hasValue());
  EXPECT_EQ(*Written, "int b;\n");
  EXPECT_EQ(Sandbox.getState(), SandboxState::Patched);
}

TEST(BuildSandboxTest, RunTestReportsTimeout) {
  ScopedTempDir Dir;
  Dir.write("bin/test_runner", "");
  FakeCommandRunner Runner([](const Command &) {
    ProcessResult Result = exitedWith(-2, "[PASS] first\n");
    Result.TimedOut = true;
    return Result;
  });
  BuildSandbox Sandbox(configIn(Dir), Runner);

  ExecutionResult Run = Sandbox.runTest(Dir.path("bin/test_runner"), None, 5);
  EXPECT_FALSE(Run.Success);
  EXPECT_TRUE(Run.TimedOut);
  EXPECT_EQ(Run.Error, "Test timed out after 5s");
  EXPECT_EQ(Run.Stdout, "[PASS] first\n");
  ASSERT_EQ(Runner.Commands.size(), 1u);
  EXPECT_EQ(Runner.Commands[0].TimeoutSeconds, 5u);
  EXPECT_EQ(Sandbox.getState(), SandboxState::Executed);
}

TEST(BuildSandboxTest, BuildConfiguresWithSanitizers) {
  ScopedTempDir Dir;
  FakeCommandRunner Runner;
  SandboxConfig Config = configIn(Dir);
  Config.EnableUBSan = true;
  Config.Jobs = 8;
  BuildSandbox Sandbox(Config, Runner);
  ASSERT_FALSE(errorToBool(Sandbox.initializeFromFiles({{"CMakeLists.txt", ""}}, "repo")));

  BuildResult Build = Sandbox.build();
  ASSERT_TRUE(Build.Success) << Build.Error;
  EXPECT_EQ(Sandbox.getState(), SandboxState::Built);
  ASSERT_EQ(Runner.Commands.size(), 2u);

  const Command &Configure = Runner.Commands[0];
  EXPECT_EQ(Configure.Program, "cmake");
  auto has = [](const Command &Cmd, StringRef Arg) {
    return std::find(Cmd.Args.begin(), Cmd.Args.end(), Arg.str()) !=
           Cmd.Args.end();
  };
  EXPECT_TRUE(has(Configure, "-DCMAKE_BUILD_TYPE=Debug"));
  EXPECT_TRUE(has(Configure, "-DCMAKE_C_FLAGS=-fsanitize=address,undefined "
                             "-fno-omit-frame-pointer -g"));
  EXPECT_TRUE(has(Configure, "-DCMAKE_POLICY_VERSION_MINIMUM=3.5"));

  const Command &Make = Runner.Commands[1];
  EXPECT_EQ(Make.Program, "make");
  EXPECT_TRUE(has(Make, "-j8"));
  EXPECT_LE(Make.TimeoutSeconds, 42u);
}

TEST(BuildSandboxTest, BuildFailureKeepsOutput) {
  ScopedTempDir Dir;
  FakeCommandRunner Runner([](const Command &Cmd) {
    if (Cmd.Program == "make")
      return exitedWith(2, "", "src/a.c:1:1: error: expected ';'\n");
    return exitedWith(0, "-- Configuring done\n");
  });
  BuildSandbox Sandbox(configIn(Dir), Runner);
  ASSERT_FALSE(errorToBool(Sandbox.initializeFromFiles({{"src/a.c", "int a"}}, "repo")));
  BuildResult Build = Sandbox.build();
  EXPECT_FALSE(Build.Success);
  EXPECT_NE(Build.Error.find("Build failed"), std::string::npos);
  EXPECT_NE(Build.combinedOutput().find("Configuring done"), std::string::npos);
  EXPECT_NE(Build.combinedOutput().find("expected ';'"), std::string::npos);
}

TEST(BuildSandboxTest, TestEnvironment) {
  ScopedTempDir Dir;
  FakeCommandRunner Runner;
  BuildSandbox Sandbox(configIn(Dir), Runner);
  ASSERT_FALSE(errorToBool(Sandbox.initializeFromFiles({}, "repo")));
  std::vector<std::pair<std::string, std::string>> Env =
      Sandbox.getTestEnvironment();
  auto lookup = [&](StringRef Name) {
    for (const auto &Var : Env)
      if (Var.first == Name)
        return Var.second;
    return std::string();
  };
  EXPECT_EQ(lookup("JULIUS_SRC"), Sandbox.getRepoDir() + "/src");
  EXPECT_EQ(lookup("ASAN_OPTIONS"), RunASanOptions);
  EXPECT_EQ(lookup("LDFLAGS"), "-fsanitize=address");
}

} // namespace
