#ifndef FIXBENCH_SUPPORT_FILEUTILS_H
#define FIXBENCH_SUPPORT_FILEUTILS_H

#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <string>
#include <system_error>

namespace fixbench {

/// Reads a whole file as text.
llvm::Expected<std::string> readTextFile(llvm::StringRef Path);

/// Writes Content to Path, creating missing parent directories.
std::error_code writeTextFile(llvm::StringRef Path, llvm::StringRef Content);

/// Recursively copies the tree rooted at From into To, creating To when
/// missing. Regular files keep their permission bits; symlinks are recreated
/// verbatim.
std::error_code copyDirectoryTree(llvm::StringRef From, llvm::StringRef To);

/// Creates a fresh uniquely named directory under Root, or under the system
/// temporary directory when Root is empty.
std::error_code createUniqueWorkDir(llvm::StringRef Root, llvm::StringRef Prefix,
                                    llvm::SmallVectorImpl<char> &ResultPath);

} // namespace fixbench

#endif // FIXBENCH_SUPPORT_FILEUTILS_H
