#ifndef FIXBENCH_PATCH_RESPONSEEXTRACTOR_H
#define FIXBENCH_PATCH_RESPONSEEXTRACTOR_H

#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"

#include <map>
#include <string>
#include <vector>

namespace fixbench {

/// A ``` fenced block of free text. Info is the rest of the opening fence
/// line, Body everything up to the closing fence.
struct FencedBlock {
  std::string Info;
  std::string Body;
};

/// Fenced blocks in order of appearance. An unterminated trailing fence is
/// ignored.
std::vector<FencedBlock> findFencedBlocks(llvm::StringRef Text);

/// First unified diff embedded in a model response, trimmed.
llvm::Optional<std::string> extractPatch(llvm::StringRef Response);

/// Whole-file rewrites: blocks whose info string names a .c/.h/.cpp path,
/// optionally after a language token (```c src/foo.c). Keys have a leading
/// "./" removed, bodies are trimmed and end in one newline. Empty when no
/// such block exists.
std::map<std::string, std::string> extractCompleteFiles(llvm::StringRef Response);

struct ExtractedFix {
  enum class Kind { None, CompleteFiles, Patch };

  Kind FixKind = Kind::None;
  std::map<std::string, std::string> Files;
  std::string PatchText;
};

/// Complete files win over patches.
ExtractedFix extractFix(llvm::StringRef Response);

} // namespace fixbench

#endif // FIXBENCH_PATCH_RESPONSEEXTRACTOR_H
