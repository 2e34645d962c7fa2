// test_source_manager.cpp - SourceFile line tables and the open-document overlay

#include <gtest/gtest.h>

#include <string>

#include "php_refactor/basic/diagnostic.hpp"
#include "php_refactor/basic/source_manager.hpp"
#include "php_refactor/test_support/temp_project.hpp"

using namespace php_refactor;

TEST(SourceFile, LineColumnIsOneBased)
{
  const SourceFile file("/tmp/a.php", "<?php\nclass A {}\n");

  const auto lc = file.get_line_column(6);
  EXPECT_EQ(lc.line, 2U);
  EXPECT_EQ(lc.column, 1U);

  EXPECT_EQ(file.get_offset(2, 7), 12U);
  EXPECT_EQ(file.line_count(), 3U);
  EXPECT_EQ(file.get_line(1), "class A {}");
}

TEST(SourceFile, CrlfLinesExcludeCarriageReturn)
{
  const SourceFile file("/tmp/a.php", "<?php\r\nuse A\\B;\r\n");
  EXPECT_EQ(file.get_line(0), "<?php");
  EXPECT_EQ(file.get_line(1), "use A\\B;");
}

TEST(SourceFile, FullRangeCarriesBytesAndPositions)
{
  const SourceFile file("/tmp/a.php", "<?php\nfunction handle() {}\n");
  const auto r = file.get_full_range(SourceRange(15, 21));

  EXPECT_EQ(r.start_byte, 15U);
  EXPECT_EQ(r.end_byte, 21U);
  EXPECT_EQ(r.start_line, 2U);
  EXPECT_EQ(r.start_column, 10U);
  EXPECT_EQ(r.end_line, 2U);
  EXPECT_EQ(r.end_column, 16U);
  EXPECT_EQ(file.get_slice(r.to_source_range()), "handle");
}

TEST(SourceRegistry, OverlayTakesPrecedenceOverDisk)
{
  test_support::TempProject project;
  const auto path = project.write("src/A.php", "<?php // disk\n");

  SourceRegistry docs;
  EXPECT_EQ(docs.read(path).value_or(""), "<?php // disk\n");

  docs.upsert(path, "<?php // editor\n");
  EXPECT_TRUE(docs.contains(path));
  EXPECT_EQ(docs.read(path).value_or(""), "<?php // editor\n");

  EXPECT_TRUE(docs.remove(path));
  EXPECT_EQ(docs.read(path).value_or(""), "<?php // disk\n");
}

TEST(SourceRegistry, MissingFileReadsAsNothing)
{
  const SourceRegistry docs;
  EXPECT_FALSE(docs.read("/nonexistent/phpref/none.php").has_value());
}

TEST(DiagnosticBag, BuilderCommitsOnDestruction)
{
  DiagnosticBag bag;
  {
    auto b = bag.report_error(SourceRange(1, 4), "Class 'X' is not imported. Add 'use' statement.");
    b.with_code("missing-import").with_source("php-refactor").with_fixit(SourceRange(0, 0), "use A\\X;\n", "Add import for A\\X");
    EXPECT_TRUE(bag.empty());
  }
  ASSERT_EQ(bag.size(), 1U);

  const Diagnostic & d = bag.all().front();
  EXPECT_EQ(d.code, "missing-import");
  EXPECT_EQ(d.source, "php-refactor");
  EXPECT_EQ(d.primary_range(), SourceRange(1, 4));
  ASSERT_EQ(d.fixits.size(), 1U);
  EXPECT_EQ(d.fixits.front().title, "Add import for A\\X");
  EXPECT_TRUE(bag.has_errors());
  EXPECT_EQ(bag.with_code("missing-import").size(), 1U);
  EXPECT_TRUE(bag.with_code("parse-error").empty());
}
