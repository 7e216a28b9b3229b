#include "ResponseExtractor.h"

#include "llvm/ADT/SmallVector.h"

#include <tuple>

using namespace llvm;

namespace fixbench {

static const char Fence[] = "```";

std::vector<FencedBlock> findFencedBlocks(StringRef Text) {
  std::vector<FencedBlock> Blocks;
  size_t Pos = 0;
  while (true) {
    size_t Open = Text.find(Fence, Pos);
    if (Open == StringRef::npos)
      break;
    size_t InfoStart = Open + 3;
    size_t LineEnd = Text.find('\n', InfoStart);
    if (LineEnd == StringRef::npos)
      break;
    size_t Close = Text.find(Fence, LineEnd + 1);
    if (Close == StringRef::npos)
      break;
    FencedBlock Block;
    Block.Info = Text.slice(InfoStart, LineEnd).rtrim("\r").str();
    Block.Body = Text.slice(LineEnd + 1, Close).str();
    Blocks.push_back(std::move(Block));
    Pos = Close + 3;
  }
  return Blocks;
}

Optional<std::string> extractPatch(StringRef Response) {
  std::vector<FencedBlock> Blocks = findFencedBlocks(Response);

  for (const FencedBlock &Block : Blocks) {
    StringRef Info = StringRef(Block.Info).trim();
    if (Info.equals_insensitive("diff") || Info.equals_insensitive("patch"))
      return StringRef(Block.Body).trim().str();
  }
  for (const FencedBlock &Block : Blocks) {
    if (Block.Info.empty() && StringRef(Block.Body).startswith("diff --git"))
      return StringRef(Block.Body).trim().str();
  }
  for (const FencedBlock &Block : Blocks) {
    StringRef Body = Block.Body;
    if (Block.Info.empty() && Body.startswith("---") &&
        Body.find("+++") != StringRef::npos)
      return Body.trim().str();
  }

  size_t Start = Response.find("diff --git");
  if (Start == StringRef::npos)
    return None;
  size_t End = Response.find(Fence, Start);
  return Response.slice(Start, End).trim().str();
}

static bool hasSourceExtension(StringRef Path) {
  return Path.endswith_insensitive(".c") || Path.endswith_insensitive(".h") ||
         Path.endswith_insensitive(".cpp");
}

/// Path named by a fence info string, or empty.
static StringRef infoPath(StringRef Info) {
  Info = Info.trim();
  StringRef Lang, Rest;
  std::tie(Lang, Rest) = Info.split(' ');
  Rest = Rest.trim();
  StringRef Path = Info;
  if (!Rest.empty() && (Lang.equals_insensitive("c") ||
                        Lang.equals_insensitive("h") ||
                        Lang.equals_insensitive("cpp")))
    Path = Rest;
  if (Path.empty() || Path.contains('`') || !hasSourceExtension(Path))
    return StringRef();
  return Path;
}

std::map<std::string, std::string> extractCompleteFiles(StringRef Response) {
  std::map<std::string, std::string> Files;
  for (const FencedBlock &Block : findFencedBlocks(Response)) {
    StringRef Path = infoPath(Block.Info);
    if (Path.empty())
      continue;
    Path.consume_front("./");
    Files[Path.str()] = StringRef(Block.Body).trim().str() + "\n";
  }
  return Files;
}

ExtractedFix extractFix(StringRef Response) {
  ExtractedFix Fix;
  Fix.Files = extractCompleteFiles(Response);
  if (!Fix.Files.empty()) {
    Fix.FixKind = ExtractedFix::Kind::CompleteFiles;
    return Fix;
  }
  if (Optional<std::string> Patch = extractPatch(Response)) {
    Fix.FixKind = ExtractedFix::Kind::Patch;
    Fix.PatchText = std::move(*Patch);
  }
  return Fix;
}

} // namespace fixbench
