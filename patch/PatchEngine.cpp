#include "PatchEngine.h"
#include "LineDiff.h"

#include "support/Debug.h"
#include "support/FileUtils.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/FileUtilities.h"
#include "llvm/Support/Regex.h"
#include "llvm/Support/raw_ostream.h"

#include <cstring>

using namespace llvm;

namespace fixbench {

namespace {

StringRef stripPrefix(StringRef Path, StringRef Prefix) {
  Path.consume_front(Prefix);
  return Path;
}

/// Path part of a "--- " / "+++ " line: drops the marker, any tab-separated
/// timestamp and the a/ or b/ prefix.
std::string markerPath(StringRef Line, StringRef Prefix) {
  StringRef Path = Line.drop_front(4);
  Path = Path.split('\t').first.trim();
  return stripPrefix(Path, Prefix).str();
}

class PatchScanner {
public:
  explicit PatchScanner(StringRef Text) { Doc.RawText = Text.str(); }

  PatchDocument run() {
    SmallVector<StringRef, 0> Lines;
    StringRef(Doc.RawText).split(Lines, '\n');
    for (size_t I = 0; I < Lines.size(); ++I) {
      StringRef Line = Lines[I];
      Line.consume_back("\r");
      StringRef Next;
      if (I + 1 < Lines.size()) {
        Next = Lines[I + 1];
        Next.consume_back("\r");
      }
      if (scanLine(Line, Next))
        ++I;
    }
    flushFile();
    return std::move(Doc);
  }

private:
  PatchDocument Doc;
  bool HaveFile = false;
  PatchedFile File;
  bool HaveHunk = false;
  Hunk CurrentHunk;
  unsigned OldRemaining = 0;
  unsigned NewRemaining = 0;

  void flushHunk() {
    if (HaveHunk)
      File.Hunks.push_back(std::move(CurrentHunk));
    HaveHunk = false;
    CurrentHunk = Hunk();
    OldRemaining = NewRemaining = 0;
  }

  void flushFile() {
    flushHunk();
    if (HaveFile)
      Doc.Files.push_back(std::move(File));
    HaveFile = false;
    File = PatchedFile();
  }

  void startFile(std::string OldPath, std::string NewPath) {
    flushFile();
    HaveFile = true;
    File.OldPath = std::move(OldPath);
    File.NewPath = std::move(NewPath);
  }

  void appendBodyLine(StringRef Line) {
    switch (classifyHunkLine(Line)) {
    case HunkLineKind::Context:
      if (OldRemaining)
        --OldRemaining;
      if (NewRemaining)
        --NewRemaining;
      break;
    case HunkLineKind::Removal:
      if (OldRemaining)
        --OldRemaining;
      break;
    case HunkLineKind::Addition:
      if (NewRemaining)
        --NewRemaining;
      break;
    case HunkLineKind::NoNewlineMarker:
      break;
    }
    CurrentHunk.Lines.push_back(Line.str());
  }

  static bool isBodyLine(StringRef Line) {
    return !Line.empty() && (Line[0] == ' ' || Line[0] == '+' ||
                             Line[0] == '-' || Line[0] == '\\');
  }

  /// Returns true when Next was consumed as well.
  bool scanLine(StringRef Line, StringRef Next) {
    // Inside a hunk whose header counts are not exhausted every line is body,
    // including ones that look like "--- " headers.
    if (HaveHunk && (OldRemaining || NewRemaining)) {
      if (Line.empty()) {
        appendBodyLine(" ");
        return false;
      }
      if (isBodyLine(Line)) {
        appendBodyLine(Line);
        return false;
      }
    }

    if (Line.startswith("diff --git")) {
      static const Regex GitHeader("^diff --git a/(.+) b/(.+)$");
      SmallVector<StringRef, 3> Matches;
      if (GitHeader.match(Line, &Matches)) {
        startFile(Matches[1].str(), Matches[2].str());
      } else {
        SmallVector<StringRef, 4> Parts;
        Line.drop_front(strlen("diff --git")).trim().split(Parts, ' ', -1,
                                                            false);
        startFile(Parts.size() > 0 ? Parts[0].str() : std::string(),
                  Parts.size() > 1 ? Parts[1].str() : std::string());
      }
      return false;
    }

    if (Line.startswith("new file mode")) {
      if (HaveFile)
        File.IsNewFile = true;
      return false;
    }
    if (Line.startswith("deleted file mode")) {
      if (HaveFile)
        File.IsDeleted = true;
      return false;
    }
    if (Line.startswith("Binary files")) {
      if (HaveFile)
        File.IsBinary = true;
      return false;
    }

    if (Line.startswith("---")) {
      if (!Next.startswith("+++"))
        return false;
      std::string OldPath = markerPath(Line, "a/");
      std::string NewPath = markerPath(Next, "b/");
      // A git header already named the file; otherwise this is a bare
      // traditional diff and each ---/+++ pair opens a new file.
      if (!HaveFile || !File.Hunks.empty() || HaveHunk) {
        startFile(OldPath, NewPath);
      } else {
        flushHunk();
        if (File.OldPath.empty())
          File.OldPath = OldPath;
        if (File.NewPath.empty())
          File.NewPath = NewPath;
      }
      if (OldPath == "/dev/null")
        File.IsNewFile = true;
      if (NewPath == "/dev/null")
        File.IsDeleted = true;
      return true;
    }
    if (Line.startswith("+++"))
      return false;

    if (Line.startswith("@@")) {
      flushHunk();
      static const Regex HunkHeader(
          "^@@ -([0-9]+)(,([0-9]+))? \\+([0-9]+)(,([0-9]+))? @@");
      SmallVector<StringRef, 7> Matches;
      if (!HunkHeader.match(Line, &Matches))
        return false;
      if (!HaveFile) {
        // Hunks without any file header still get recorded; validation
        // rejects the pathless file.
        startFile(std::string(), std::string());
      }
      auto number = [](StringRef S, unsigned Default) {
        unsigned Value = Default;
        if (!S.empty() && S.getAsInteger(10, Value))
          Value = Default;
        return Value;
      };
      HaveHunk = true;
      CurrentHunk.OldStart = number(Matches[1], 0);
      CurrentHunk.OldCount = number(Matches[3], 1);
      CurrentHunk.NewStart = number(Matches[4], 0);
      CurrentHunk.NewCount = number(Matches[6], 1);
      OldRemaining = CurrentHunk.OldCount;
      NewRemaining = CurrentHunk.NewCount;
      return false;
    }

    // Hunk headers with wrong counts are common in generated patches; keep
    // taking body lines until something else shows up.
    if (HaveHunk && isBodyLine(Line)) {
      appendBodyLine(Line);
      return false;
    }
    if (HaveHunk && Line.empty() && isBodyLine(Next) && Next[0] != '\\') {
      appendBodyLine(" ");
      return false;
    }
    return false;
  }
};

std::vector<std::string> hunkLines(const PatchedFile &File) {
  std::vector<std::string> Lines;
  for (const Hunk &H : File.Hunks)
    Lines.insert(Lines.end(), H.Lines.begin(), H.Lines.end());
  return Lines;
}

} // namespace

HunkLineKind classifyHunkLine(StringRef Line) {
  if (Line.startswith("+"))
    return HunkLineKind::Addition;
  if (Line.startswith("-"))
    return HunkLineKind::Removal;
  if (Line.startswith("\\"))
    return HunkLineKind::NoNewlineMarker;
  return HunkLineKind::Context;
}

PatchDocument parsePatch(StringRef Text) { return PatchScanner(Text).run(); }

PatchValidation validatePatch(const PatchDocument &Doc) {
  PatchValidation Result;
  if (Doc.Files.empty()) {
    Result.Reason = "No files found in patch";
    return Result;
  }
  for (const PatchedFile &File : Doc.Files) {
    if (File.OldPath.empty() && File.NewPath.empty()) {
      Result.Reason = "Patch file missing path information";
      return Result;
    }
    if (!File.IsBinary && !File.IsNewFile && !File.IsDeleted &&
        File.Hunks.empty()) {
      Result.Reason = "Patch for " + File.NewPath + " has no hunks";
      return Result;
    }
  }
  Result.Ok = true;
  return Result;
}

PatchApplyResult applyPatch(StringRef Text, StringRef TargetDir,
                            const PatchApplyOptions &Options,
                            CommandRunner &Runner) {
  PatchApplyResult Result;

  SmallString<128> PatchPath;
  if (std::error_code EC =
          sys::fs::createTemporaryFile("fixbench", "patch", PatchPath)) {
    Result.Error = "failed to create patch file: " + EC.message();
    return Result;
  }
  FileRemover PatchRemover(PatchPath);

  // git apply rejects a patch whose last line is unterminated.
  std::string Content = Text.str();
  if (!Content.empty() && Content.back() != '\n')
    Content += '\n';
  if (std::error_code EC = writeTextFile(PatchPath, Content)) {
    Result.Error = "failed to write patch file: " + EC.message();
    return Result;
  }

  Command Cmd;
  Cmd.Program = Options.GitProgram;
  Cmd.Args = {"-C", TargetDir.str(), "apply",
              "-p" + std::to_string(Options.StripComponents)};
  if (Options.Reverse)
    Cmd.Args.push_back("-R");
  Cmd.Args.push_back(PatchPath.str().str());
  Cmd.TimeoutSeconds = Options.TimeoutSeconds;

  ProcessResult Proc = Runner.run(Cmd);
  Result.Output = Proc.Stdout;
  Result.TimedOut = Proc.TimedOut;
  if (!Proc.succeeded()) {
    Result.Error = Proc.Stderr;
    if (!Proc.ErrorMessage.empty())
      Result.Error += (Result.Error.empty() ? "" : "\n") + Proc.ErrorMessage;
    if (isDebugLoggingEnabled())
      errs() << "PatchEngine: git apply failed in " << TargetDir << ": "
             << Result.Error << "\n";
    return Result;
  }

  Result.Success = true;
  PatchDocument Doc = parsePatch(Text);
  for (const PatchedFile &File : Doc.Files)
    if (!File.IsDeleted)
      Result.FilesTouched.push_back(File.NewPath);
  for (const PatchedFile &File : Doc.Files)
    if (File.IsDeleted)
      Result.FilesTouched.push_back(File.OldPath);
  return Result;
}

PatchApplyResult applyPatch(StringRef Text, StringRef TargetDir, bool Reverse,
                            unsigned StripComponents) {
  PatchApplyOptions Options;
  Options.Reverse = Reverse;
  Options.StripComponents = StripComponents;
  return applyPatch(Text, TargetDir, Options, getSystemCommandRunner());
}

std::string createPatch(StringRef OldText, StringRef NewText,
                        StringRef FileName) {
  std::vector<std::string> OldLines = splitLinesKeepEnds(OldText);
  std::vector<std::string> NewLines = splitLinesKeepEnds(NewText);
  if (!OldLines.empty() && StringRef(OldLines.back()).back() != '\n')
    OldLines.back() += '\n';
  if (!NewLines.empty() && StringRef(NewLines.back()).back() != '\n')
    NewLines.back() += '\n';
  return formatUnifiedDiff(OldLines, NewLines, ("a/" + FileName).str(),
                           ("b/" + FileName).str());
}

double comparePatches(StringRef A, StringRef B) {
  PatchDocument Left = parsePatch(A);
  PatchDocument Right = parsePatch(B);
  if (Left.Files.empty() || Right.Files.empty())
    return 0.0;

  StringMap<const PatchedFile *> RightByPath;
  for (const PatchedFile &File : Right.Files)
    RightByPath.try_emplace(File.NewPath, &File);

  double Sum = 0.0;
  for (const PatchedFile &File : Left.Files) {
    auto It = RightByPath.find(File.NewPath);
    if (It == RightByPath.end())
      continue;
    Sum += similarityRatio(hunkLines(File), hunkLines(*It->second));
  }
  return Sum / static_cast<double>(Left.Files.size());
}

std::map<std::string, std::string> reconstructFiles(const PatchDocument &Doc,
                                                    PatchSide Side) {
  std::map<std::string, std::string> Files;
  for (const PatchedFile &File : Doc.Files) {
    if (File.IsBinary)
      continue;
    if (Side == PatchSide::Old && File.IsNewFile)
      continue;
    if (Side == PatchSide::New && File.IsDeleted)
      continue;
    const std::string &Path =
        Side == PatchSide::Old ? File.OldPath : File.NewPath;
    if (Path.empty() || Path == "/dev/null")
      continue;

    std::vector<std::string> Lines;
    for (const Hunk &H : File.Hunks) {
      unsigned Start = Side == PatchSide::Old ? H.OldStart : H.NewStart;
      while (Start > 0 && Lines.size() < Start - 1)
        Lines.emplace_back();
      for (const std::string &Raw : H.Lines) {
        HunkLineKind Kind = classifyHunkLine(Raw);
        bool Keep = Kind == HunkLineKind::Context ||
                    (Side == PatchSide::Old && Kind == HunkLineKind::Removal) ||
                    (Side == PatchSide::New && Kind == HunkLineKind::Addition);
        if (Keep)
          Lines.push_back(Raw.empty() ? std::string() : Raw.substr(1));
      }
    }

    std::string Text;
    for (const std::string &Line : Lines) {
      Text += Line;
      Text += '\n';
    }
    Files[Path] = std::move(Text);
  }
  return Files;
}

} // namespace fixbench
