// test_edit_set.cpp - Edit ordering, deduplication and overlap rejection

#include <gtest/gtest.h>

#include <vector>

#include "php_refactor/refactor/edit_set.hpp"

using namespace php_refactor;

namespace
{

EditOperation make_edit(const char * file, uint32_t start, uint32_t end, std::string text)
{
  EditOperation op;
  op.target_file = file;
  op.range.start_byte = start;
  op.range.end_byte = end;
  op.range.start_line = 1;
  op.range.start_column = start + 1;
  op.range.end_line = 1;
  op.range.end_column = end + 1;
  op.replacement_text = std::move(text);
  return op;
}

}  // namespace

TEST(RangesOverlap, HalfOpenSemantics)
{
  const auto r = [](uint32_t s, uint32_t e) {
    FullSourceRange out;
    out.start_byte = s;
    out.end_byte = e;
    return out;
  };

  EXPECT_TRUE(ranges_overlap(r(0, 5), r(4, 8)));
  EXPECT_FALSE(ranges_overlap(r(0, 5), r(5, 8)));
  EXPECT_TRUE(ranges_overlap(r(3, 3), r(3, 3)));
  EXPECT_FALSE(ranges_overlap(r(3, 3), r(3, 6)));
  EXPECT_TRUE(ranges_overlap(r(4, 4), r(3, 6)));
  EXPECT_FALSE(ranges_overlap(r(6, 6), r(3, 6)));
}

TEST(EditSet, KeepsOrderAndDropsDuplicates)
{
  EditSet set;
  EXPECT_TRUE(set.add(make_edit("/p/a.php", 10, 12, "x")));
  EXPECT_TRUE(set.add(make_edit("/p/a.php", 2, 4, "y")));
  EXPECT_TRUE(set.add(make_edit("/p/a.php", 10, 12, "x")));
  EXPECT_TRUE(set.add(make_edit("/p/b.php", 0, 1, "z")));

  EXPECT_EQ(set.size(), 3U);
  EXPECT_EQ(set.rejected_count(), 0U);

  const auto a = set.for_file("/p/a.php");
  ASSERT_EQ(a.size(), 2U);
  EXPECT_EQ(a[0].range.start_byte, 2U);
  EXPECT_EQ(a[1].range.start_byte, 10U);

  const auto files = set.files();
  ASSERT_EQ(files.size(), 2U);
  EXPECT_EQ(files[0], "/p/a.php");
  EXPECT_EQ(files[1], "/p/b.php");
}

TEST(EditSet, RejectsOverlapInSameFileOnly)
{
  EditSet set;
  EXPECT_TRUE(set.add(make_edit("/p/a.php", 5, 10, "first")));
  EXPECT_FALSE(set.add(make_edit("/p/a.php", 8, 12, "second")));
  EXPECT_TRUE(set.add(make_edit("/p/b.php", 8, 12, "other file")));

  EXPECT_EQ(set.rejected_count(), 1U);
  const auto a = set.for_file("/p/a.php");
  ASSERT_EQ(a.size(), 1U);
  EXPECT_EQ(a[0].replacement_text, "first");
}

TEST(EditSet, ConflictingTextAtSameRangeIsRejected)
{
  EditSet set;
  EXPECT_TRUE(set.add(make_edit("/p/a.php", 5, 10, "one")));
  EXPECT_FALSE(set.add(make_edit("/p/a.php", 5, 10, "two")));
  EXPECT_EQ(set.size(), 1U);
}

TEST(ApplyEdits, AppliesBackToFront)
{
  const std::string text = "use Old\\Thing;\n$x = new Thing();\n";
  std::vector<EditOperation> ops{
    make_edit("/p/a.php", 4, 13, "New\\Thing"),
    make_edit("/p/a.php", 15, 15, "// moved\n"),
  };
  EXPECT_EQ(apply_edits(text, ops), "use New\\Thing;\n// moved\n$x = new Thing();\n");
}

TEST(ApplyEdits, ClampsPastEnd)
{
  std::vector<EditOperation> ops{make_edit("/p/a.php", 100, 100, "!")};
  EXPECT_EQ(apply_edits("abc", ops), "abc!");
}

TEST(RefactorResult, Factories)
{
  const auto ok = RefactorResult::ok({make_edit("/p/a.php", 0, 0, "x")});
  EXPECT_TRUE(ok.success);
  EXPECT_EQ(ok.edits.size(), 1U);

  const auto fail = RefactorResult::fail("nope");
  EXPECT_FALSE(fail.success);
  EXPECT_EQ(fail.error, "nope");
  EXPECT_TRUE(fail.edits.empty());
}
