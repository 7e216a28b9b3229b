#include "CompilerDiagnostics.h"

#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/Regex.h"

using namespace llvm;

namespace fixbench {

Optional<std::string> findCompilationError(StringRef Output) {
  static const char *const Signatures[] = {
      "error:[[:space:]]+.+",
      "undefined reference to[[:space:]]+.+",
      "fatal error:[[:space:]]+.+",
      "cannot find[[:space:]]+-l[[:alnum:]_]+",
      "No rule to make target",
      "ld: .+ not found",
  };
  SmallVector<StringRef, 1> Matches;
  for (const char *Signature : Signatures) {
    Regex Pattern(Signature, Regex::Newline);
    if (Pattern.match(Output, &Matches))
      return Matches[0].rtrim("\r").str();
  }
  return None;
}

} // namespace fixbench
