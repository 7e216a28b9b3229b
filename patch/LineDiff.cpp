#include "LineDiff.h"

#include "llvm/Support/raw_ostream.h"

#include <algorithm>

using namespace llvm;

namespace fixbench {

namespace {

/// V values saved before round D, covering diagonals [-D-1, D+1].
struct Round {
  int D;
  std::vector<int> V;
  int at(int K) const { return V[K + D + 1]; }
};

struct Opcode {
  EditKind Tag; // Equal, or Delete/Insert standing for a changed region.
  size_t I1, I2, J1, J2;
};

std::vector<Opcode> toOpcodes(ArrayRef<EditOp> Ops) {
  std::vector<Opcode> Codes;
  size_t I = 0, J = 0, N = 0;
  while (N < Ops.size()) {
    if (Ops[N].Kind == EditKind::Equal) {
      size_t I1 = I, J1 = J;
      while (N < Ops.size() && Ops[N].Kind == EditKind::Equal) {
        ++I;
        ++J;
        ++N;
      }
      Codes.push_back({EditKind::Equal, I1, I, J1, J});
      continue;
    }
    size_t I1 = I, J1 = J;
    while (N < Ops.size() && Ops[N].Kind != EditKind::Equal) {
      if (Ops[N].Kind == EditKind::Delete)
        ++I;
      else
        ++J;
      ++N;
    }
    Codes.push_back({EditKind::Delete, I1, I, J1, J});
  }
  return Codes;
}

std::vector<std::vector<Opcode>> groupOpcodes(std::vector<Opcode> Codes,
                                              size_t Context) {
  std::vector<std::vector<Opcode>> Groups;
  if (Codes.empty())
    return Groups;

  Opcode &First = Codes.front();
  if (First.Tag == EditKind::Equal) {
    First.I1 = std::max(First.I1, First.I2 > Context ? First.I2 - Context : 0);
    First.J1 = std::max(First.J1, First.J2 > Context ? First.J2 - Context : 0);
  }
  Opcode &Last = Codes.back();
  if (Last.Tag == EditKind::Equal) {
    Last.I2 = std::min(Last.I2, Last.I1 + Context);
    Last.J2 = std::min(Last.J2, Last.J1 + Context);
  }

  const size_t Window = Context * 2;
  std::vector<Opcode> Group;
  for (Opcode Code : Codes) {
    if (Code.Tag == EditKind::Equal && Code.I2 - Code.I1 > Window) {
      Group.push_back({EditKind::Equal, Code.I1,
                       std::min(Code.I2, Code.I1 + Context), Code.J1,
                       std::min(Code.J2, Code.J1 + Context)});
      Groups.push_back(std::move(Group));
      Group.clear();
      Code.I1 = std::max(Code.I1, Code.I2 - Context);
      Code.J1 = std::max(Code.J1, Code.J2 - Context);
    }
    Group.push_back(Code);
  }
  if (!Group.empty() &&
      !(Group.size() == 1 && Group.front().Tag == EditKind::Equal))
    Groups.push_back(std::move(Group));
  return Groups;
}

std::string formatRange(size_t Start, size_t Stop) {
  size_t Beginning = Start + 1;
  size_t Length = Stop - Start;
  if (Length == 1)
    return std::to_string(Beginning);
  if (Length == 0)
    --Beginning;
  return std::to_string(Beginning) + "," + std::to_string(Length);
}

} // namespace

std::vector<EditOp> computeLineDiff(ArrayRef<std::string> Old,
                                    ArrayRef<std::string> New) {
  const int N = static_cast<int>(Old.size());
  const int M = static_cast<int>(New.size());
  const int Max = N + M;
  const int Offset = Max + 1;
  std::vector<int> V(2 * Max + 3, 0);
  std::vector<Round> Trace;

  int Final = -1;
  for (int D = 0; D <= Max && Final < 0; ++D) {
    Trace.push_back(
        {D, std::vector<int>(V.begin() + Offset - D - 1,
                             V.begin() + Offset + D + 2)});
    for (int K = -D; K <= D; K += 2) {
      int X;
      if (K == -D || (K != D && V[Offset + K - 1] < V[Offset + K + 1]))
        X = V[Offset + K + 1];
      else
        X = V[Offset + K - 1] + 1;
      int Y = X - K;
      while (X < N && Y < M && Old[X] == New[Y]) {
        ++X;
        ++Y;
      }
      V[Offset + K] = X;
      if (X >= N && Y >= M) {
        Final = D;
        break;
      }
    }
  }

  std::vector<EditOp> Ops;
  int X = N, Y = M;
  for (int D = Final; D >= 0; --D) {
    const Round &R = Trace[D];
    int K = X - Y;
    int PrevK;
    if (K == -D || (K != D && R.at(K - 1) < R.at(K + 1)))
      PrevK = K + 1;
    else
      PrevK = K - 1;
    int PrevX = R.at(PrevK);
    int PrevY = PrevX - PrevK;
    while (X > PrevX && Y > PrevY) {
      --X;
      --Y;
      Ops.push_back({EditKind::Equal, static_cast<size_t>(X),
                     static_cast<size_t>(Y)});
    }
    if (D > 0) {
      if (X == PrevX)
        Ops.push_back({EditKind::Insert, static_cast<size_t>(PrevX),
                       static_cast<size_t>(PrevY)});
      else
        Ops.push_back({EditKind::Delete, static_cast<size_t>(PrevX),
                       static_cast<size_t>(PrevY)});
    }
    X = PrevX;
    Y = PrevY;
  }
  std::reverse(Ops.begin(), Ops.end());
  return Ops;
}

double similarityRatio(ArrayRef<std::string> A, ArrayRef<std::string> B) {
  size_t Total = A.size() + B.size();
  if (Total == 0)
    return 1.0;
  size_t Matched = 0;
  for (const EditOp &Op : computeLineDiff(A, B))
    if (Op.Kind == EditKind::Equal)
      ++Matched;
  return 2.0 * static_cast<double>(Matched) / static_cast<double>(Total);
}

std::string formatUnifiedDiff(ArrayRef<std::string> OldLines,
                              ArrayRef<std::string> NewLines,
                              StringRef FromFile, StringRef ToFile,
                              unsigned Context) {
  std::vector<std::vector<Opcode>> Groups =
      groupOpcodes(toOpcodes(computeLineDiff(OldLines, NewLines)), Context);
  if (Groups.empty())
    return std::string();

  std::string Out;
  raw_string_ostream OS(Out);
  OS << "--- " << FromFile << "\n";
  OS << "+++ " << ToFile << "\n";
  for (const auto &Group : Groups) {
    const Opcode &First = Group.front();
    const Opcode &Last = Group.back();
    OS << "@@ -" << formatRange(First.I1, Last.I2) << " +"
       << formatRange(First.J1, Last.J2) << " @@\n";
    for (const Opcode &Code : Group) {
      if (Code.Tag == EditKind::Equal) {
        for (size_t I = Code.I1; I < Code.I2; ++I)
          OS << ' ' << OldLines[I];
        continue;
      }
      for (size_t I = Code.I1; I < Code.I2; ++I)
        OS << '-' << OldLines[I];
      for (size_t J = Code.J1; J < Code.J2; ++J)
        OS << '+' << NewLines[J];
    }
  }
  return OS.str();
}

std::vector<std::string> splitLinesKeepEnds(StringRef Text) {
  std::vector<std::string> Lines;
  while (!Text.empty()) {
    size_t NL = Text.find('\n');
    if (NL == StringRef::npos) {
      Lines.push_back(Text.str());
      break;
    }
    Lines.push_back(Text.substr(0, NL + 1).str());
    Text = Text.substr(NL + 1);
  }
  return Lines;
}

} // namespace fixbench
