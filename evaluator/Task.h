#ifndef FIXBENCH_EVALUATOR_TASK_H
#define FIXBENCH_EVALUATOR_TASK_H

#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <string>
#include <vector>

namespace fixbench {

/// Commit value marking a task whose sources come from its patch alone.
extern const char SyntheticCommit[];

/// Contents of task.json.
struct TaskConfig {
  std::string Id;
  std::string Name;
  std::string Category;
  std::string Tier;
  std::string Description;
  std::string Commit;
  unsigned TimeoutSeconds = 300;
  std::vector<std::string> Tags;
  std::vector<std::string> FilesToModify;
  llvm::Optional<std::string> ExpectedSanitizerError;
  bool RequiresAssets = false;

  bool isSynthetic() const { return Commit == SyntheticCommit; }
};

/// A task directory:
///   task.json            metadata
///   prompt.md            problem statement given to the generator
///   buggy.patch          reverts the fix in the pinned tree
///   solution/fix.patch   reference fix (optional)
///   tests/               test sources, optionally with a Makefile
struct Task {
  std::string Dir;
  TaskConfig Config;
  std::string Prompt;
  std::string BuggyPatchPath;
  std::string BuggyPatch;
  llvm::Optional<std::string> ReferencePatch;
  std::string TestDir;
};

/// Parses task.json text. id, category, tier and commit are required; tier
/// may be a string or a number.
llvm::Expected<TaskConfig> parseTaskConfig(llvm::StringRef JSONText);

llvm::Expected<Task> loadTask(llvm::StringRef Dir);

} // namespace fixbench

#endif // FIXBENCH_EVALUATOR_TASK_H
