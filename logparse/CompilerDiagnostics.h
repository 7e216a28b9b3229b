#ifndef FIXBENCH_LOGPARSE_COMPILERDIAGNOSTICS_H
#define FIXBENCH_LOGPARSE_COMPILERDIAGNOSTICS_H

#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"

#include <string>

namespace fixbench {

/// Scans compiler, linker and make output for a failure signature and returns
/// the matching text of the first one found. Signatures are tried in a fixed
/// order ("error:", "undefined reference to", "fatal error:", "cannot find
/// -l<lib>", "No rule to make target", "ld: ... not found"), each across the
/// whole text. Matching is case-sensitive so that sanitizer "ERROR:" headers
/// are not mistaken for compiler errors.
llvm::Optional<std::string> findCompilationError(llvm::StringRef Output);

} // namespace fixbench

#endif // FIXBENCH_LOGPARSE_COMPILERDIAGNOSTICS_H
