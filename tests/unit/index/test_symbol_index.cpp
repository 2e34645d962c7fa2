// test_symbol_index.cpp - Definition, method, inheritance and usage indexing

#include <gtest/gtest.h>

#include <algorithm>

#include "php_refactor/index/symbol_index.hpp"
#include "php_refactor/test_support/temp_project.hpp"

using namespace php_refactor;
using php_refactor::test_support::TempProject;

namespace
{

constexpr const char * k_logger_interface =
  "<?php\n"
  "namespace App\\Logging;\n"
  "\n"
  "interface LoggerInterface\n"
  "{\n"
  "    public function log(string $message): void;\n"
  "}\n";

constexpr const char * k_file_logger =
  "<?php\n"
  "namespace App\\Logging;\n"
  "\n"
  "class FileLogger implements LoggerInterface\n"
  "{\n"
  "    public function log(string $message): void {}\n"
  "    public function flush(): void {}\n"
  "}\n";

constexpr const char * k_database_logger =
  "<?php\n"
  "namespace App\\Logging;\n"
  "\n"
  "use App\\Support\\Connection;\n"
  "\n"
  "class DatabaseLogger extends BaseLogger implements \\App\\Logging\\LoggerInterface\n"
  "{\n"
  "    public function __construct(private Connection $db) {}\n"
  "    public function log(string $message): void {}\n"
  "}\n";

class SymbolIndexTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    files_ = {
      project_.write("src/Logging/LoggerInterface.php", k_logger_interface),
      project_.write("src/Logging/FileLogger.php", k_file_logger),
      project_.write("src/Logging/DatabaseLogger.php", k_database_logger),
    };
    ASSERT_EQ(index_.scan_workspace(files_), ScanResult::Completed);
  }

  TempProject project_;
  std::vector<fs::path> files_;
  SymbolIndex index_;
};

}  // namespace

TEST_F(SymbolIndexTest, DefinitionsCarryFqnKindAndRange)
{
  EXPECT_TRUE(index_.is_ready());

  const auto defs = index_.lookup_definitions("FileLogger");
  ASSERT_EQ(defs.size(), 1U);
  EXPECT_EQ(defs[0].fqn, "App\\Logging\\FileLogger");
  EXPECT_EQ(defs[0].kind, SymbolKind::Class);
  EXPECT_EQ(defs[0].name_range.start_line, 4U);
  EXPECT_EQ(defs[0].name_range.start_column, 7U);

  const auto iface = index_.lookup_definitions("LoggerInterface");
  ASSERT_EQ(iface.size(), 1U);
  EXPECT_EQ(iface[0].kind, SymbolKind::Interface);

  EXPECT_TRUE(index_.lookup_definitions("Missing").empty());
}

TEST_F(SymbolIndexTest, MethodsKeyedByClassAndFilteredByNamespace)
{
  const auto by_short = index_.lookup_method("FileLogger", "log");
  ASSERT_EQ(by_short.size(), 1U);
  EXPECT_EQ(by_short[0].parent_fqn, "App\\Logging\\FileLogger");
  EXPECT_EQ(by_short[0].fqn, "App\\Logging\\FileLogger::log");

  EXPECT_EQ(index_.lookup_method("App\\Logging\\FileLogger", "log").size(), 1U);
  EXPECT_TRUE(index_.lookup_method("Other\\FileLogger", "log").empty());

  const auto all_log = index_.methods_named("log");
  EXPECT_EQ(all_log.size(), 3U);
  EXPECT_EQ(index_.methods_named("flush").size(), 1U);
}

TEST_F(SymbolIndexTest, ImplementationsMatchByLastSegment)
{
  const auto impls = index_.implementations_of("App\\Logging\\LoggerInterface");
  EXPECT_EQ(impls, (std::vector<std::string>{"DatabaseLogger", "FileLogger"}));

  const auto edges = index_.inheritance_of("DatabaseLogger");
  ASSERT_EQ(edges.size(), 1U);
  ASSERT_TRUE(edges[0].extends_name.has_value());
  EXPECT_EQ(*edges[0].extends_name, "BaseLogger");
  EXPECT_EQ(edges[0].implements_names.count("App\\Logging\\LoggerInterface"), 1U);
}

TEST_F(SymbolIndexTest, UsageCandidatesIncludeImportsAndNames)
{
  const auto conn = index_.usage_candidates("Connection");
  ASSERT_EQ(conn.size(), 1U);
  EXPECT_EQ(conn[0].filename(), "DatabaseLogger.php");

  const auto iface = index_.usage_candidates("LoggerInterface");
  EXPECT_EQ(iface.size(), 3U);
}

TEST_F(SymbolIndexTest, RescanIsIdempotent)
{
  const IndexStats before = index_.stats();
  ASSERT_TRUE(index_.scan_file_from_disk(files_[1]));
  ASSERT_TRUE(index_.scan_file_from_disk(files_[1]));
  const IndexStats after = index_.stats();

  EXPECT_EQ(before.files, after.files);
  EXPECT_EQ(before.definitions, after.definitions);
  EXPECT_EQ(before.methods, after.methods);
  EXPECT_EQ(before.usage_symbols, after.usage_symbols);
  EXPECT_EQ(before.inheritance, after.inheritance);
  EXPECT_EQ(index_.lookup_definitions("FileLogger").size(), 1U);
  EXPECT_EQ(index_.lookup_method("FileLogger", "log").size(), 1U);
}

TEST_F(SymbolIndexTest, ParseFailureRemovesFileEntries)
{
  EXPECT_FALSE(index_.scan_text(files_[1], "<?php\nclass FileLogger {\n"));
  EXPECT_TRUE(index_.lookup_definitions("FileLogger").empty());
  EXPECT_TRUE(index_.lookup_method("FileLogger", "flush").empty());
  EXPECT_FALSE(index_.contains_file(files_[1]));
}

TEST_F(SymbolIndexTest, RenamedClassReplacesOldEntries)
{
  ASSERT_TRUE(index_.scan_text(
    files_[1],
    "<?php\nnamespace App\\Logging;\nclass StreamLogger implements LoggerInterface {\n"
    "    public function log(string $message): void {}\n}\n"));

  EXPECT_TRUE(index_.lookup_definitions("FileLogger").empty());
  EXPECT_EQ(index_.lookup_definitions("StreamLogger").size(), 1U);
  const auto impls = index_.implementations_of("LoggerInterface");
  EXPECT_EQ(impls, (std::vector<std::string>{"DatabaseLogger", "StreamLogger"}));
}

TEST_F(SymbolIndexTest, RemoveAndStaleFileDrop)
{
  index_.remove_file(files_[2]);
  EXPECT_TRUE(index_.lookup_definitions("DatabaseLogger").empty());
  EXPECT_TRUE(index_.usage_candidates("Connection").empty());

  // A later full scan without the interface file drops its entries.
  ASSERT_EQ(index_.scan_workspace({files_[1]}), ScanResult::Completed);
  EXPECT_TRUE(index_.lookup_definitions("LoggerInterface").empty());
  EXPECT_EQ(index_.stats().files, 1U);
}

TEST_F(SymbolIndexTest, CancelledScanLeavesIndexNotReady)
{
  SymbolIndex fresh;
  ScanCallbacks callbacks;
  callbacks.yield = [] { return false; };
  EXPECT_EQ(fresh.scan_workspace(files_, callbacks, std::chrono::milliseconds(-1)), ScanResult::Cancelled);
  EXPECT_FALSE(fresh.is_ready());
}

TEST_F(SymbolIndexTest, ProgressReportedAtEnd)
{
  SymbolIndex fresh;
  size_t last_done = 0;
  size_t last_total = 0;
  ScanCallbacks callbacks;
  callbacks.progress = [&](size_t done, size_t total) {
    last_done = done;
    last_total = total;
  };
  ASSERT_EQ(fresh.rebuild(files_, callbacks), ScanResult::Completed);
  EXPECT_EQ(last_done, 3U);
  EXPECT_EQ(last_total, 3U);
}

TEST_F(SymbolIndexTest, CancelledRescanClearsReadiness)
{
  ASSERT_TRUE(index_.is_ready());
  ScanCallbacks callbacks;
  callbacks.yield = [] { return false; };
  EXPECT_EQ(index_.scan_workspace(files_, callbacks, std::chrono::milliseconds(-1)), ScanResult::Cancelled);
  EXPECT_FALSE(index_.is_ready());

  ASSERT_EQ(index_.scan_workspace(files_), ScanResult::Completed);
  EXPECT_TRUE(index_.is_ready());
}
