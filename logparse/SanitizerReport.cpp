#include "SanitizerReport.h"

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/Regex.h"
#include "llvm/Support/raw_ostream.h"

#include <cctype>

using namespace llvm;

namespace fixbench {

namespace {

struct KindPattern {
  const char *Needle;
  SanitizerErrorKind Kind;
};

// Checked in order; the specific overflow kinds must precede anything that
// could match a substring of them.
const KindPattern KindTable[] = {
    {"heap-buffer-overflow", SanitizerErrorKind::HeapBufferOverflow},
    {"stack-buffer-overflow", SanitizerErrorKind::StackBufferOverflow},
    {"global-buffer-overflow", SanitizerErrorKind::GlobalBufferOverflow},
    {"use-after-free", SanitizerErrorKind::UseAfterFree},
    {"stack-use-after-return", SanitizerErrorKind::UseAfterReturn},
    {"stack-use-after-scope", SanitizerErrorKind::UseAfterScope},
    {"double-free", SanitizerErrorKind::DoubleFree},
    {"invalid-free", SanitizerErrorKind::InvalidFree},
    {"attempting free", SanitizerErrorKind::InvalidFree},
    {"alloc-dealloc-mismatch", SanitizerErrorKind::AllocDeallocMismatch},
    {"stack-overflow", SanitizerErrorKind::StackOverflow},
};

const char *const RuntimePathFragments[] = {"asan_", "sanitizer_",
                                            "interceptors", "/usr/"};

bool parseUnsigned(StringRef S, unsigned &Value) {
  return !S.empty() && !S.getAsInteger(10, Value);
}

/// Splits "file:line[:col]" (anything after is ignored) or "(module+off)".
void parseFrameLocation(StringRef Location, StackFrame &Frame) {
  for (size_t I = 1; I + 1 < Location.size(); ++I) {
    if (Location[I] != ':' || !isdigit(static_cast<unsigned char>(Location[I + 1])))
      continue;
    Frame.File = Location.take_front(I).str();
    StringRef Rest = Location.drop_front(I + 1);
    StringRef LineText = Rest.take_while(
        [](char C) { return isdigit(static_cast<unsigned char>(C)); });
    unsigned Number;
    if (parseUnsigned(LineText, Number))
      Frame.Line = Number;
    Rest = Rest.drop_front(LineText.size());
    if (Rest.consume_front(":")) {
      StringRef ColumnText = Rest.take_while(
          [](char C) { return isdigit(static_cast<unsigned char>(C)); });
      if (parseUnsigned(ColumnText, Number))
        Frame.Column = Number;
    }
    return;
  }
  if (Location.contains('+')) {
    Location.consume_front("(");
    Location.consume_back(")");
    Frame.Module = Location.str();
  }
}

enum class ScanState { Idle, InCrashBlock, InLeakBlock, InStackTrace };

/// Line scanner that segments sanitizer output into crash and leak blocks
/// and collects the stack traces of each block.
class ReportScanner {
public:
  explicit ReportScanner(SanitizerReport &Report) : Report(Report) {}

  void scan(StringRef Text) {
    SmallVector<StringRef, 0> Lines;
    Text.split(Lines, '\n');
    for (StringRef Line : Lines)
      scanLine(Line.rtrim("\r"));
    closeBlock();
  }

private:
  SanitizerReport &Report;
  ScanState State = ScanState::Idle;
  bool BlockIsLeak = false;
  SanitizerError Current;
  std::vector<std::string> BlockLines;
  StackTrace Trace;
  bool HaveTrace = false;

  void scanLine(StringRef Line) {
    static const Regex Header(
        "=+[0-9]+=+ERROR: (AddressSanitizer|LeakSanitizer): (.*)$");
    SmallVector<StringRef, 3> Matches;
    if (Header.match(Line, &Matches)) {
      closeBlock();
      openBlock(Matches[1] == "LeakSanitizer", Matches[2]);
      return;
    }
    if (State == ScanState::Idle)
      return;

    size_t Summary = Line.find("SUMMARY:");
    if (Summary != StringRef::npos) {
      if (Summary != 0)
        blockLine(Line.take_front(Summary));
      closeBlock();
      return;
    }
    blockLine(Line);
  }

  void openBlock(bool IsLeak, StringRef FirstLine) {
    BlockIsLeak = IsLeak;
    State = IsLeak ? ScanState::InLeakBlock : ScanState::InCrashBlock;
    Current = SanitizerError();
    Current.Description = FirstLine.trim().str();
    BlockLines.clear();
    BlockLines.push_back(FirstLine.str());
  }

  void blockLine(StringRef Line) {
    BlockLines.push_back(Line.str());

    static const Regex TraceHeader(
        "^(freed|allocated|previously|READ|WRITE|caused by|(Direct|Indirect) leak)",
        Regex::IgnoreCase);
    static const Regex Frame(
        "^#([0-9]+)[[:space:]]+(0x[0-9a-f]+)[[:space:]]+(in[[:space:]]+)?"
        "([^[:space:]]+)([[:space:]]+(.+))?$",
        Regex::IgnoreCase);

    StringRef Trimmed = Line.trim();
    if (TraceHeader.match(Trimmed)) {
      closeTrace();
      Trace.Description = Trimmed.str();
      HaveTrace = true;
      State = ScanState::InStackTrace;
      return;
    }

    SmallVector<StringRef, 7> Matches;
    if (!Frame.match(Trimmed, &Matches))
      return;
    if (!HaveTrace) {
      HaveTrace = true;
      State = ScanState::InStackTrace;
    }
    StackFrame F;
    unsigned Index;
    if (parseUnsigned(Matches[1], Index))
      F.Index = Index;
    F.Address = Matches[2].str();
    StringRef Symbol = Matches[4];
    StringRef Location = Matches[6];
    if (Matches[3].empty() && Symbol.startswith("(") && Location.empty()) {
      // "#3 0x7f0 (/lib/x86_64-linux-gnu/libc.so.6+0x29d90)"
      parseFrameLocation(Symbol, F);
    } else {
      F.Function = Symbol.str();
      parseFrameLocation(Location.trim(), F);
    }
    Trace.Frames.push_back(std::move(F));
  }

  void closeTrace() {
    if (HaveTrace && !Trace.Frames.empty())
      Current.Traces.push_back(std::move(Trace));
    Trace = StackTrace();
    HaveTrace = false;
  }

  void closeBlock() {
    if (State == ScanState::Idle)
      return;
    closeTrace();
    Current.RawText = join(BlockLines, "\n");
    if (BlockIsLeak)
      finishLeak();
    else
      finishCrash();
    State = ScanState::Idle;
    BlockLines.clear();
  }

  void finishCrash() {
    static const Regex AddressPattern("on (address )?(0x[0-9a-f]+)",
                                      Regex::IgnoreCase);
    static const Regex SizePattern("of size ([0-9]+)");

    Current.Kind = classifySanitizerError(Current.Description);
    SmallVector<StringRef, 3> Matches;
    if (AddressPattern.match(Current.RawText, &Matches))
      Current.Address = Matches[2].str();
    uint64_t Size;
    if (SizePattern.match(Current.RawText, &Matches) &&
        !Matches[1].getAsInteger(10, Size))
      Current.Size = Size;

    if (Current.Address)
      Current.Summary = formatv("{0} at {1}",
                                getSanitizerErrorKindName(Current.Kind),
                                *Current.Address)
                            .str();
    else
      Current.Summary = Current.Description;
    Report.Errors.push_back(std::move(Current));
    Current = SanitizerError();
  }

  void finishLeak() {
    static const Regex Totals("([0-9]+) byte\\(s\\) .* in ([0-9]+) allocation");
    static const Regex LeakLine(
        "(Direct|Indirect) leak of ([0-9]+) byte\\(s\\) in ([0-9]+) object");

    Current.Kind = SanitizerErrorKind::MemoryLeak;
    uint64_t Bytes = 0, Allocations = 0;
    bool Found = false;
    SmallVector<StringRef, 4> Matches;
    for (const std::string &Line : BlockLines) {
      if (Totals.match(Line, &Matches) && !Matches[1].getAsInteger(10, Bytes) &&
          !Matches[2].getAsInteger(10, Allocations)) {
        Found = true;
        break;
      }
    }
    if (!Found) {
      // Per-object lines are summed when no totals line is present.
      for (const std::string &Line : BlockLines) {
        uint64_t B, N;
        if (LeakLine.match(Line, &Matches) && !Matches[2].getAsInteger(10, B) &&
            !Matches[3].getAsInteger(10, N)) {
          Bytes += B;
          Allocations += N;
          Found = true;
        }
      }
    }

    if (Found) {
      Current.Size = Bytes;
      Current.Summary = formatv("Memory leak: {0} bytes in {1} allocation(s)",
                                Bytes, Allocations)
                            .str();
    } else {
      Current.Summary = "Memory leak detected";
    }
    Report.Leaks.push_back(std::move(Current));
    Current = SanitizerError();
  }
};

} // namespace

StringRef getSanitizerErrorKindName(SanitizerErrorKind Kind) {
  switch (Kind) {
  case SanitizerErrorKind::HeapBufferOverflow:
    return "heap-buffer-overflow";
  case SanitizerErrorKind::StackBufferOverflow:
    return "stack-buffer-overflow";
  case SanitizerErrorKind::GlobalBufferOverflow:
    return "global-buffer-overflow";
  case SanitizerErrorKind::UseAfterFree:
    return "heap-use-after-free";
  case SanitizerErrorKind::UseAfterReturn:
    return "stack-use-after-return";
  case SanitizerErrorKind::UseAfterScope:
    return "stack-use-after-scope";
  case SanitizerErrorKind::DoubleFree:
    return "double-free";
  case SanitizerErrorKind::InvalidFree:
    return "invalid-free";
  case SanitizerErrorKind::AllocDeallocMismatch:
    return "alloc-dealloc-mismatch";
  case SanitizerErrorKind::MemoryLeak:
    return "memory-leak";
  case SanitizerErrorKind::StackOverflow:
    return "stack-overflow";
  case SanitizerErrorKind::NullDereference:
    return "null-dereference";
  case SanitizerErrorKind::Unknown:
    return "unknown";
  }
  return "unknown";
}

Optional<SanitizerErrorKind> parseSanitizerErrorKindName(StringRef Name) {
  Name = Name.trim();
  if (Name.equals_insensitive("use-after-free"))
    return SanitizerErrorKind::UseAfterFree;
  for (int I = 0; I <= static_cast<int>(SanitizerErrorKind::Unknown); ++I) {
    auto Kind = static_cast<SanitizerErrorKind>(I);
    if (Name.equals_insensitive(getSanitizerErrorKindName(Kind)))
      return Kind;
  }
  return None;
}

SanitizerErrorKind classifySanitizerError(StringRef HeaderLine) {
  for (const KindPattern &P : KindTable)
    if (HeaderLine.contains_insensitive(P.Needle))
      return P.Kind;
  if (HeaderLine.contains_insensitive("null") &&
      (HeaderLine.contains_insensitive("dereference") ||
       HeaderLine.contains_insensitive("access")))
    return SanitizerErrorKind::NullDereference;
  return SanitizerErrorKind::Unknown;
}

const StackFrame *StackTrace::getTopUserFrame() const {
  for (const StackFrame &F : Frames) {
    if (!F.File)
      continue;
    bool Runtime = any_of(RuntimePathFragments, [&](const char *Fragment) {
      return StringRef(*F.File).contains(Fragment);
    });
    if (!Runtime)
      return &F;
  }
  return Frames.empty() ? nullptr : &Frames.front();
}

Optional<std::string> SanitizerError::getLocation() const {
  if (Traces.empty())
    return None;
  const StackFrame *F = Traces.front().getTopUserFrame();
  if (!F || !F->File)
    return None;
  std::string Location = *F->File;
  if (F->Line)
    Location += ":" + std::to_string(*F->Line);
  return Location;
}

std::vector<SanitizerErrorKind> SanitizerReport::getErrorKinds() const {
  std::vector<SanitizerErrorKind> Kinds;
  for (const SanitizerError &E : Errors)
    if (!is_contained(Kinds, E.Kind))
      Kinds.push_back(E.Kind);
  return Kinds;
}

SanitizerReport parseSanitizerReport(StringRef Text) {
  SanitizerReport Report;
  Report.RawText = Text.str();
  if (!Text.contains("AddressSanitizer") && !Text.contains("LeakSanitizer"))
    return Report;

  ReportScanner(Report).scan(Text);

  if (Report.Leaks.empty() && Text.contains_insensitive("detected memory leaks")) {
    static const Regex LeakSummary("SUMMARY: AddressSanitizer: ([0-9]+) "
                                   "byte\\(s\\) leaked in ([0-9]+) allocation");
    SanitizerError Leak;
    Leak.Kind = SanitizerErrorKind::MemoryLeak;
    Leak.Description = "Memory leak detected";
    Leak.Summary = "Memory leak detected";
    SmallVector<StringRef, 3> Matches;
    uint64_t Bytes;
    if (LeakSummary.match(Text, &Matches) &&
        !Matches[1].getAsInteger(10, Bytes)) {
      Leak.Size = Bytes;
      Leak.Summary = formatv("Memory leak: {0} bytes in {1} allocation(s)",
                             Bytes, Matches[2])
                         .str();
    }
    Report.Leaks.push_back(std::move(Leak));
  }
  return Report;
}

bool hasSanitizerError(StringRef Text) {
  return Text.contains("ERROR: AddressSanitizer:") ||
         Text.contains("ERROR: LeakSanitizer:");
}

Optional<std::string> getSanitizerSummary(StringRef Text) {
  static const Regex Summary(
      "SUMMARY: (Address|Leak)Sanitizer: ([^\n]+)", Regex::Newline);
  SmallVector<StringRef, 3> Matches;
  if (!Summary.match(Text, &Matches))
    return None;
  return Matches[2].rtrim("\r").str();
}

std::string formatSanitizerReport(const SanitizerReport &Report) {
  std::string Out;
  raw_string_ostream OS(Out);

  if (Report.hasErrors()) {
    OS << "AddressSanitizer found " << Report.Errors.size() << " error(s):\n";
    unsigned N = 0;
    for (const SanitizerError &E : Report.Errors) {
      OS << "\n  " << ++N << ". " << getSanitizerErrorKindName(E.Kind) << "\n";
      OS << "     " << E.Summary << "\n";
      if (Optional<std::string> Location = E.getLocation())
        OS << "     at: " << *Location << "\n";
    }
  }

  if (Report.hasLeaks()) {
    if (Report.hasErrors())
      OS << "\n";
    OS << "LeakSanitizer found " << Report.Leaks.size() << " leak(s):\n";
    for (const SanitizerError &Leak : Report.Leaks)
      OS << "  - " << Leak.Summary << "\n";
  }

  if (!Report.hasErrors() && !Report.hasLeaks())
    OS << "No AddressSanitizer errors detected.\n";
  return OS.str();
}

} // namespace fixbench
