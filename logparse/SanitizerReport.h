#ifndef FIXBENCH_LOGPARSE_SANITIZERREPORT_H
#define FIXBENCH_LOGPARSE_SANITIZERREPORT_H

#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <string>
#include <vector>

namespace fixbench {

enum class SanitizerErrorKind {
  HeapBufferOverflow,
  StackBufferOverflow,
  GlobalBufferOverflow,
  UseAfterFree,
  UseAfterReturn,
  UseAfterScope,
  DoubleFree,
  InvalidFree,
  AllocDeallocMismatch,
  MemoryLeak,
  StackOverflow,
  NullDereference,
  Unknown
};

/// Stable name as printed by AddressSanitizer ("heap-buffer-overflow",
/// "heap-use-after-free", ...).
llvm::StringRef getSanitizerErrorKindName(SanitizerErrorKind Kind);

/// Inverse of getSanitizerErrorKindName, case-insensitive. Also accepts the
/// short "use-after-free".
llvm::Optional<SanitizerErrorKind> parseSanitizerErrorKindName(llvm::StringRef Name);

/// Classifies the first line of a crash report.
SanitizerErrorKind classifySanitizerError(llvm::StringRef HeaderLine);

struct StackFrame {
  unsigned Index = 0;
  std::string Address;
  std::string Function;
  llvm::Optional<std::string> File;
  llvm::Optional<unsigned> Line;
  llvm::Optional<unsigned> Column;
  /// "module+offset" for frames without symbol information.
  llvm::Optional<std::string> Module;
};

struct StackTrace {
  /// Trace heading such as "freed by thread T0 here:"; empty for the
  /// access trace that directly follows the report header.
  std::string Description;
  std::vector<StackFrame> Frames;

  /// First frame with a source file outside the sanitizer runtime and system
  /// headers. Falls back to the first frame; null only for an empty trace.
  const StackFrame *getTopUserFrame() const;
};

struct SanitizerError {
  SanitizerErrorKind Kind = SanitizerErrorKind::Unknown;
  std::string Summary;
  std::string Description;
  llvm::Optional<std::string> Address;
  llvm::Optional<uint64_t> Size;
  std::vector<StackTrace> Traces;
  std::string RawText;

  /// "file[:line]" of the top user frame of the first trace.
  llvm::Optional<std::string> getLocation() const;
};

struct SanitizerReport {
  std::vector<SanitizerError> Errors;
  std::vector<SanitizerError> Leaks;
  std::string RawText;

  bool hasErrors() const { return !Errors.empty(); }
  bool hasLeaks() const { return !Leaks.empty(); }

  /// Distinct kinds among Errors, in order of first appearance.
  std::vector<SanitizerErrorKind> getErrorKinds() const;
};

/// Splits combined program output into AddressSanitizer crash reports and
/// LeakSanitizer leak reports. Output without any sanitizer marker yields an
/// empty report. Never fails.
SanitizerReport parseSanitizerReport(llvm::StringRef Text);

/// Cheap check for an "ERROR: AddressSanitizer:" or "ERROR: LeakSanitizer:"
/// header.
bool hasSanitizerError(llvm::StringRef Text);

/// Text following "SUMMARY: AddressSanitizer: " (or LeakSanitizer) on the
/// first summary line.
llvm::Optional<std::string> getSanitizerSummary(llvm::StringRef Text);

std::string formatSanitizerReport(const SanitizerReport &Report);

} // namespace fixbench

#endif // FIXBENCH_LOGPARSE_SANITIZERREPORT_H
