#ifndef FIXBENCH_PATCH_PATCHENGINE_H
#define FIXBENCH_PATCH_PATCHENGINE_H

#include "support/Process.h"

#include "llvm/ADT/StringRef.h"

#include <map>
#include <string>
#include <vector>

namespace fixbench {

enum class HunkLineKind { Context, Addition, Removal, NoNewlineMarker };

HunkLineKind classifyHunkLine(llvm::StringRef Line);

struct Hunk {
  unsigned OldStart = 0;
  unsigned OldCount = 0;
  unsigned NewStart = 0;
  unsigned NewCount = 0;
  /// Raw diff lines, each starting with ' ', '+', '-' or '\'.
  std::vector<std::string> Lines;
};

struct PatchedFile {
  std::string OldPath;
  std::string NewPath;
  bool IsNewFile = false;
  bool IsDeleted = false;
  bool IsBinary = false;
  std::vector<Hunk> Hunks;
};

struct PatchDocument {
  std::vector<PatchedFile> Files;
  std::string RawText;
};

/// Best-effort unified diff parser. Accepts git-style and bare traditional
/// diffs; never fails. Use validatePatch() to decide whether the result is
/// usable.
PatchDocument parsePatch(llvm::StringRef Text);

struct PatchValidation {
  bool Ok = false;
  std::string Reason;
};

PatchValidation validatePatch(const PatchDocument &Doc);

struct PatchApplyResult {
  bool Success = false;
  bool TimedOut = false;
  std::string Output;
  std::string Error;
  /// Filled only on success.
  std::vector<std::string> FilesTouched;
};

struct PatchApplyOptions {
  bool Reverse = false;
  unsigned StripComponents = 1;
  unsigned TimeoutSeconds = 60;
  std::string GitProgram = "git";
};

/// Applies Text to the tree at TargetDir with `git apply`. Mutates TargetDir
/// on success; failures are reported, never retried.
PatchApplyResult applyPatch(llvm::StringRef Text, llvm::StringRef TargetDir,
                            const PatchApplyOptions &Options,
                            CommandRunner &Runner);

PatchApplyResult applyPatch(llvm::StringRef Text, llvm::StringRef TargetDir,
                            bool Reverse = false, unsigned StripComponents = 1);

/// Unified diff between two full file contents, labelled a/<FileName> and
/// b/<FileName>. Both sides are given a trailing newline first.
std::string createPatch(llvm::StringRef OldText, llvm::StringRef NewText,
                        llvm::StringRef FileName);

/// Mean per-file similarity of A's files against B's, in [0, 1]. Files of A
/// missing from B score 0; either side without files yields 0.
double comparePatches(llvm::StringRef A, llvm::StringRef B);

enum class PatchSide { Old, New };

/// Rebuilds file text for one side of the patch from its hunks (context plus
/// removed lines for Old, context plus added lines for New). Each hunk is
/// placed at its start line and gaps are filled with empty lines, so only
/// regions covered by hunks carry real content.
std::map<std::string, std::string> reconstructFiles(const PatchDocument &Doc,
                                                    PatchSide Side);

} // namespace fixbench

#endif // FIXBENCH_PATCH_PATCHENGINE_H
