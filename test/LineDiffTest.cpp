#include "patch/LineDiff.h"

#include "gtest/gtest.h"

using namespace fixbench;

namespace {

std::vector<std::string> lines(std::initializer_list<const char *> L) {
  return std::vector<std::string>(L.begin(), L.end());
}

TEST(LineDiffTest, SplitKeepsLineEnds) {
  std::vector<std::string> L = splitLinesKeepEnds("a\nb\n\nc");
  ASSERT_EQ(L.size(), 4u);
  EXPECT_EQ(L[0], "a\n");
  EXPECT_EQ(L[2], "\n");
  EXPECT_EQ(L[3], "c");
  EXPECT_TRUE(splitLinesKeepEnds("").empty());
}

TEST(LineDiffTest, EditScriptIsMinimal) {
  std::vector<std::string> Old = lines({"a", "b", "c", "d"});
  std::vector<std::string> New = lines({"a", "c", "d", "e"});
  std::vector<EditOp> Ops = computeLineDiff(Old, New);
  unsigned Equal = 0, Inserted = 0, Deleted = 0;
  for (const EditOp &Op : Ops) {
    switch (Op.Kind) {
    case EditKind::Equal:
      EXPECT_EQ(Old[Op.OldIndex], New[Op.NewIndex]);
      ++Equal;
      break;
    case EditKind::Insert:
      ++Inserted;
      break;
    case EditKind::Delete:
      ++Deleted;
      break;
    }
  }
  EXPECT_EQ(Equal, 3u);
  EXPECT_EQ(Inserted, 1u);
  EXPECT_EQ(Deleted, 1u);
}

TEST(LineDiffTest, SimilarityRatio) {
  EXPECT_DOUBLE_EQ(similarityRatio({}, {}), 1.0);
  EXPECT_DOUBLE_EQ(similarityRatio(lines({"a"}), {}), 0.0);
  EXPECT_DOUBLE_EQ(similarityRatio(lines({"a", "b"}), lines({"a", "b"})), 1.0);
  EXPECT_DOUBLE_EQ(
      similarityRatio(lines({"a", "b", "c", "d"}), lines({"a", "b", "x", "d"})),
      0.75);
}

TEST(LineDiffTest, UnifiedDiffUsesContextWindow) {
  std::vector<std::string> Old, New;
  for (int I = 1; I <= 20; ++I) {
    Old.push_back("line " + std::to_string(I) + "\n");
    New.push_back(Old.back());
  }
  New[9] = "changed\n";
  std::string Diff = formatUnifiedDiff(Old, New, "a/f.c", "b/f.c");
  EXPECT_EQ(Diff, "--- a/f.c\n"
                  "+++ b/f.c\n"
                  "@@ -7,7 +7,7 @@\n"
                  " line 7\n"
                  " line 8\n"
                  " line 9\n"
                  "-line 10\n"
                  "+changed\n"
                  " line 11\n"
                  " line 12\n"
                  " line 13\n");
  EXPECT_EQ(formatUnifiedDiff(Old, Old, "a/f.c", "b/f.c"), "");
}

} // namespace
