// test_file_enumerator.cpp - Workspace source discovery

#include <gtest/gtest.h>

#include <algorithm>

#include "php_refactor/project/file_enumerator.hpp"
#include "php_refactor/test_support/temp_project.hpp"

using namespace php_refactor;
using php_refactor::test_support::TempProject;

namespace
{

bool contains(const std::vector<fs::path> & files, const fs::path & p)
{
  return std::find(files.begin(), files.end(), p) != files.end();
}

}  // namespace

TEST(FileEnumerator, ReturnsSortedPhpFilesAndSkipsExcludedDirectories)
{
  TempProject project;
  const auto b = project.write("src/B.php", "<?php\n");
  const auto a = project.write("src/Sub/A.php", "<?php\n");
  project.write("src/readme.md", "# no\n");
  const auto vendored = project.write("vendor/lib/Lib.php", "<?php\n");
  project.write("node_modules/x/x.php", "<?php\n");

  const auto files = enumerate_source_files(project.root());
  EXPECT_TRUE(contains(files, b));
  EXPECT_TRUE(contains(files, a));
  EXPECT_FALSE(contains(files, vendored));
  EXPECT_EQ(files.size(), 2U);
  EXPECT_TRUE(std::is_sorted(files.begin(), files.end()));
}

TEST(FileEnumerator, VendorIncludedWhenNotExcluded)
{
  TempProject project;
  project.write("src/A.php", "<?php\n");
  const auto vendored = project.write("vendor/lib/Lib.php", "<?php\n");

  IndexerConfig config;
  config.exclude_vendor = false;
  const auto files = enumerate_source_files(project.root(), EnumerateOptions::from_config(config));
  EXPECT_TRUE(contains(files, vendored));
  EXPECT_EQ(files.size(), 2U);
}

TEST(FileEnumerator, MissingRootYieldsNothing)
{
  EXPECT_TRUE(enumerate_source_files("/nonexistent/phpref/root").empty());
}

TEST(FileEnumerator, ExcludedPathCheck)
{
  const EnumerateOptions options;
  EXPECT_TRUE(is_excluded_path("/p", "/p/vendor/a/A.php", options));
  EXPECT_TRUE(is_excluded_path("/p", "/p/src/storage/A.php", options));
  EXPECT_FALSE(is_excluded_path("/p", "/p/src/A.php", options));
}
