#include "TestOutput.h"

#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/Regex.h"

using namespace llvm;

namespace fixbench {

namespace {

SmallVector<StringRef, 0> splitLines(StringRef Text) {
  SmallVector<StringRef, 0> Lines;
  Text.split(Lines, '\n');
  for (StringRef &Line : Lines)
    Line = Line.rtrim("\r");
  return Lines;
}

unsigned toUnsigned(StringRef S) {
  unsigned Value = 0;
  if (S.getAsInteger(10, Value))
    return 0;
  return Value;
}

unsigned countOccurrences(const Regex &Pattern, StringRef Text) {
  unsigned Count = 0;
  SmallVector<StringRef, 1> Matches;
  while (Pattern.match(Text, &Matches)) {
    ++Count;
    size_t End = Matches[0].end() - Text.begin();
    Text = Text.drop_front(End ? End : 1);
  }
  return Count;
}

bool matchResultsLine(StringRef Line, TestCounts &Counts) {
  static const Regex Results(
      "Results:[[:space:]]*([0-9]+)/([0-9]+)[[:space:]]*tests?[[:space:]]*passed",
      Regex::IgnoreCase);
  SmallVector<StringRef, 3> M;
  if (!Results.match(Line, &M))
    return false;
  Counts.Passed = toUnsigned(M[1]);
  Counts.Total = toUnsigned(M[2]);
  Counts.Failed = Counts.Total > Counts.Passed ? Counts.Total - Counts.Passed : 0;
  return true;
}

bool matchPassedFailedLine(StringRef Line, TestCounts &Counts) {
  static const Regex PassedPart("([0-9]+)[[:space:]]+passed", Regex::IgnoreCase);
  static const Regex FailedPart("([0-9]+)[[:space:]]+failed", Regex::IgnoreCase);
  SmallVector<StringRef, 2> P, F;
  if (!PassedPart.match(Line, &P))
    return false;
  StringRef Rest = Line.drop_front(P[0].end() - Line.begin());
  if (!FailedPart.match(Rest, &F))
    return false;
  Counts.Passed = toUnsigned(P[1]);
  Counts.Failed = toUnsigned(F[1]);
  Counts.Total = Counts.Passed + Counts.Failed;
  return true;
}

bool matchTotalsLine(StringRef Line, TestCounts &Counts) {
  static const Regex Totals(
      "Tests?:[[:space:]]*([0-9]+)[[:space:]]+passed,[[:space:]]*([0-9]+)"
      "[[:space:]]+failed,[[:space:]]*([0-9]+)[[:space:]]+total",
      Regex::IgnoreCase);
  SmallVector<StringRef, 4> M;
  if (!Totals.match(Line, &M))
    return false;
  Counts.Passed = toUnsigned(M[1]);
  Counts.Failed = toUnsigned(M[2]);
  Counts.Total = toUnsigned(M[3]);
  return true;
}

} // namespace

TestCounts parseTestOutput(StringRef Text) {
  SmallVector<StringRef, 0> Lines = splitLines(Text);
  TestCounts Counts;

  for (StringRef Line : Lines)
    if (matchResultsLine(Line, Counts))
      return Counts;
  for (StringRef Line : Lines)
    if (matchPassedFailedLine(Line, Counts))
      return Counts;
  for (StringRef Line : Lines)
    if (matchTotalsLine(Line, Counts))
      return Counts;

  static const Regex PassLine("^[[:space:]]*\\[?PASS\\]?([[:space:]]|$)",
                              Regex::IgnoreCase);
  static const Regex FailLine("^[[:space:]]*\\[?FAIL\\]?([[:space:]]|$)",
                              Regex::IgnoreCase);
  unsigned Passes = 0, Fails = 0;
  for (StringRef Line : Lines) {
    if (PassLine.match(Line))
      ++Passes;
    else if (FailLine.match(Line))
      ++Fails;
  }
  if (Passes || Fails) {
    Counts.Passed = Passes;
    Counts.Failed = Fails;
    Counts.Total = Passes + Fails;
    return Counts;
  }

  static const Regex DotsOk("\\.\\.\\.[[:space:]]*OK", Regex::IgnoreCase);
  static const Regex DotsFail("\\.\\.\\.[[:space:]]*FAIL", Regex::IgnoreCase);
  unsigned Oks = 0;
  Fails = 0;
  for (StringRef Line : Lines) {
    Oks += countOccurrences(DotsOk, Line);
    Fails += countOccurrences(DotsFail, Line);
  }
  if (Oks || Fails) {
    Counts.Passed = Oks;
    Counts.Failed = Fails;
    Counts.Total = Oks + Fails;
    return Counts;
  }

  static const Regex AssertionFailed("Assertion .+ failed", Regex::IgnoreCase);
  unsigned Assertions = 0;
  for (StringRef Line : Lines)
    if (AssertionFailed.match(Line))
      ++Assertions;
  Counts.Failed = Assertions;
  Counts.Total = Assertions;
  return Counts;
}

std::vector<NamedTestResult> parseNamedTestResults(StringRef Text) {
  static const Regex Named(
      "^[[:space:]]*\\[(PASS|FAIL)\\][[:space:]:-]*([^[:space:]].*)$",
      Regex::IgnoreCase);
  std::vector<NamedTestResult> Results;
  SmallVector<StringRef, 3> M;
  for (StringRef Line : splitLines(Text)) {
    if (!Named.match(Line, &M))
      continue;
    NamedTestResult R;
    R.Name = M[2].rtrim().str();
    R.Passed = M[1].equals_insensitive("PASS");
    Results.push_back(std::move(R));
  }
  return Results;
}

} // namespace fixbench
