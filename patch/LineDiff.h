#ifndef FIXBENCH_PATCH_LINEDIFF_H
#define FIXBENCH_PATCH_LINEDIFF_H

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"

#include <string>
#include <vector>

namespace fixbench {

enum class EditKind { Equal, Insert, Delete };

struct EditOp {
  EditKind Kind;
  size_t OldIndex;
  size_t NewIndex;
};

/// Shortest edit script between two line sequences (Myers, O((N+M)D)).
std::vector<EditOp> computeLineDiff(llvm::ArrayRef<std::string> Old,
                                    llvm::ArrayRef<std::string> New);

/// 2 * matched / (|A| + |B|); 1.0 when both sequences are empty.
double similarityRatio(llvm::ArrayRef<std::string> A,
                       llvm::ArrayRef<std::string> B);

/// Renders a unified diff with Context lines around each change. Lines are
/// expected to carry their own trailing newline. Returns an empty string when
/// the inputs are identical.
std::string formatUnifiedDiff(llvm::ArrayRef<std::string> OldLines,
                              llvm::ArrayRef<std::string> NewLines,
                              llvm::StringRef FromFile, llvm::StringRef ToFile,
                              unsigned Context = 3);

/// Splits Text into lines, keeping each line's terminating newline.
std::vector<std::string> splitLinesKeepEnds(llvm::StringRef Text);

} // namespace fixbench

#endif // FIXBENCH_PATCH_LINEDIFF_H
