#include "Task.h"

#include "support/FileUtils.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"

#include <nlohmann/json.hpp>

using namespace llvm;

namespace fixbench {

const char SyntheticCommit[] = "synthetic";

static std::string pathIn(StringRef Dir, StringRef A, StringRef B = "") {
  SmallString<256> Path(Dir);
  sys::path::append(Path, A, B);
  return std::string(Path.str());
}

static std::vector<std::string> stringList(const nlohmann::json &J,
                                           const char *Key) {
  std::vector<std::string> Out;
  if (!J.contains(Key) || !J[Key].is_array())
    return Out;
  for (auto &Item : J[Key])
    if (Item.is_string())
      Out.push_back(Item.get<std::string>());
  return Out;
}

Expected<TaskConfig> parseTaskConfig(StringRef JSONText) {
  nlohmann::json J;
  try {
    J = nlohmann::json::parse(JSONText.begin(), JSONText.end());
  } catch (const nlohmann::json::exception &E) {
    return createStringError(std::errc::invalid_argument,
                             "invalid task.json: %s", E.what());
  }
  if (!J.is_object())
    return createStringError(std::errc::invalid_argument,
                             "invalid task.json: expected an object");

  for (const char *Key : {"id", "category", "tier", "commit"})
    if (!J.contains(Key))
      return createStringError(std::errc::invalid_argument,
                               "task.json is missing '%s'", Key);

  TaskConfig Config;
  try {
    Config.Id = J["id"].get<std::string>();
    Config.Category = J["category"].get<std::string>();
    const nlohmann::json &Tier = J["tier"];
    Config.Tier = Tier.is_string() ? Tier.get<std::string>() : Tier.dump();
    Config.Commit = J["commit"].get<std::string>();
    Config.Name = J.value("name", Config.Id);
    Config.Description = J.value("description", "");
    Config.TimeoutSeconds = J.value("timeout", 300u);
    Config.RequiresAssets = J.value("requires_assets", false);
    if (J.contains("expected_asan_error") && J["expected_asan_error"].is_string())
      Config.ExpectedSanitizerError = J["expected_asan_error"].get<std::string>();
  } catch (const nlohmann::json::exception &E) {
    return createStringError(std::errc::invalid_argument,
                             "invalid task.json: %s", E.what());
  }
  Config.Tags = stringList(J, "tags");
  Config.FilesToModify = stringList(J, "files_to_modify");
  if (Config.TimeoutSeconds == 0)
    Config.TimeoutSeconds = 300;
  return Config;
}

Expected<Task> loadTask(StringRef Dir) {
  Task T;
  T.Dir = Dir.str();

  std::string ConfigPath = pathIn(Dir, "task.json");
  if (!sys::fs::exists(ConfigPath))
    return createStringError(std::errc::no_such_file_or_directory,
                             "task.json not found in %s", T.Dir.c_str());
  Expected<std::string> ConfigText = readTextFile(ConfigPath);
  if (!ConfigText)
    return ConfigText.takeError();
  Expected<TaskConfig> Config = parseTaskConfig(*ConfigText);
  if (!Config)
    return Config.takeError();
  T.Config = std::move(*Config);

  std::string PromptPath = pathIn(Dir, "prompt.md");
  if (!sys::fs::exists(PromptPath))
    return createStringError(std::errc::no_such_file_or_directory,
                             "prompt.md not found in %s", T.Dir.c_str());
  Expected<std::string> Prompt = readTextFile(PromptPath);
  if (!Prompt)
    return Prompt.takeError();
  T.Prompt = std::move(*Prompt);

  T.BuggyPatchPath = pathIn(Dir, "buggy.patch");
  if (!sys::fs::exists(T.BuggyPatchPath))
    return createStringError(std::errc::no_such_file_or_directory,
                             "buggy.patch not found in %s", T.Dir.c_str());
  Expected<std::string> Buggy = readTextFile(T.BuggyPatchPath);
  if (!Buggy)
    return Buggy.takeError();
  T.BuggyPatch = std::move(*Buggy);

  std::string ReferencePath = pathIn(Dir, "solution", "fix.patch");
  if (sys::fs::exists(ReferencePath)) {
    Expected<std::string> Reference = readTextFile(ReferencePath);
    if (!Reference)
      return Reference.takeError();
    T.ReferencePatch = std::move(*Reference);
  }

  T.TestDir = pathIn(Dir, "tests");
  return std::move(T);
}

} // namespace fixbench
