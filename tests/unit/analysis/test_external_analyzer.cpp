// test_external_analyzer.cpp - PHPStan output parsing and subprocess handling

#include <gtest/gtest.h>

#include "php_refactor/analysis/external_analyzer.hpp"
#include "php_refactor/test_support/temp_project.hpp"

using namespace php_refactor;
using php_refactor::test_support::TempProject;

namespace
{

constexpr const char * k_phpstan_json = R"({
  "totals": { "errors": 0, "file_errors": 2 },
  "files": {
    "/app/src/Http/Controller.php": {
      "errors": 2,
      "messages": [
        { "message": "Undefined variable: $x", "line": 3, "ignorable": true },
        { "message": "Method has no return type.", "line": 7, "ignorable": true }
      ]
    },
    "/app/src/Other.php": {
      "errors": 1,
      "messages": [ { "message": "Other file", "line": 1 } ]
    }
  },
  "errors": []
})";

}  // namespace

TEST(PhpstanOutput, MatchesEntryByRelativePathSuffix)
{
  const auto result = parse_phpstan_output(
    k_phpstan_json, "/home/dev/project/src/Http/Controller.php", "src/Http/Controller.php");
  ASSERT_TRUE(result.success) << result.error;
  ASSERT_EQ(result.messages.size(), 2U);
  EXPECT_EQ(result.messages[0].line, 3U);
  EXPECT_EQ(result.messages[0].message, "Undefined variable: $x");
  EXPECT_EQ(result.messages[1].line, 7U);
}

TEST(PhpstanOutput, FallsBackToBasename)
{
  const auto result = parse_phpstan_output(k_phpstan_json, "/elsewhere/Other.php", "x/y/Other.php");
  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.messages.size(), 1U);
  EXPECT_EQ(result.messages[0].message, "Other file");
}

TEST(PhpstanOutput, EmptyAndUnmatched)
{
  const auto empty = parse_phpstan_output(R"({"totals":{},"files":[],"errors":[]})", "/a/B.php", "B.php");
  ASSERT_TRUE(empty.success);
  EXPECT_TRUE(empty.messages.empty());

  const auto unmatched = parse_phpstan_output(k_phpstan_json, "/a/Nothing.php", "Nothing.php");
  ASSERT_TRUE(unmatched.success);
  EXPECT_TRUE(unmatched.messages.empty());

  const auto broken = parse_phpstan_output("PHP Fatal error: out of memory", "/a/B.php", "B.php");
  EXPECT_FALSE(broken.success);
  EXPECT_NE(broken.error.find("invalid analyzer output"), std::string::npos);
}

TEST(PhpstanOutput, SoleEntryIsUsed)
{
  const auto result = parse_phpstan_output(
    R"({"files":{"/container/path/Renamed.php":{"messages":[{"message":"m","line":2}]}}})",
    "/a/B.php", "B.php");
  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.messages.size(), 1U);
}

TEST(AnalyzerDiagnostics, LineWideErrors)
{
  const SourceFile file("/tmp/a.php", "<?php\n$a = 1;\n  echo $x;\n");
  DiagnosticBag diags;
  append_analyzer_diagnostics({{3, "Undefined variable: $x"}, {0, "file level"}}, file, diags);

  ASSERT_EQ(diags.size(), 2U);
  const Diagnostic & first = diags.all()[0];
  EXPECT_EQ(first.severity, Severity::Error);
  EXPECT_EQ(first.source, k_analyzer_source);
  EXPECT_EQ(file.get_slice(first.primary_range()), "  echo $x;");
  EXPECT_EQ(file.get_slice(diags.all()[1].primary_range()), "<?php");
}

TEST(RunProcess, CapturesStdoutAndExitCode)
{
  TempProject project;
  const auto result = run_process(
    {"/bin/sh", "-c", "pwd; echo out; exit 3"}, project.root(), std::chrono::milliseconds(5000));
  EXPECT_FALSE(result.spawn_failed);
  EXPECT_FALSE(result.timed_out);
  EXPECT_EQ(result.exit_code, 3);
  EXPECT_NE(result.output.find("out\n"), std::string::npos);
  EXPECT_NE(result.output.find(project.root().filename().string()), std::string::npos);
}

TEST(RunProcess, MissingProgramExits127)
{
  const auto result = run_process(
    {"/nonexistent/phpref/phpstan"}, fs::temp_directory_path(), std::chrono::milliseconds(5000));
  EXPECT_EQ(result.exit_code, 127);
}

TEST(RunProcess, TimeoutKillsChild)
{
  const auto result =
    run_process({"/bin/sh", "-c", "sleep 5"}, fs::temp_directory_path(), std::chrono::milliseconds(100));
  EXPECT_TRUE(result.timed_out);
}

TEST(ExternalAnalyzer, DisabledByConfiguration)
{
  TempProject project;
  AnalyzerConfig config;
  config.enabled = false;
  ExternalAnalyzer analyzer(project.root(), config);
  EXPECT_FALSE(analyzer.is_active());
  EXPECT_TRUE(analyzer.command_for(project.path("src/A.php")).empty());
  EXPECT_FALSE(analyzer.analyze(project.path("src/A.php")).success);
}

TEST(ExternalAnalyzer, VendorBinaryRunsThroughInterpreter)
{
  TempProject project;
  project.write("vendor/bin/phpstan", "#!/bin/sh\n");
  AnalyzerConfig config;
  config.php = "./bin/php";
  config.level = "6";
  const ExternalAnalyzer analyzer(project.root(), config);
  ASSERT_TRUE(analyzer.is_active());

  const auto cmd = analyzer.command_for(project.path("src/Http/A.php"));
  ASSERT_EQ(cmd.size(), 7U);
  EXPECT_EQ(cmd[0], project.path("bin/php").string());
  EXPECT_EQ(cmd[1], "vendor/bin/phpstan");
  EXPECT_EQ(cmd[2], "analyse");
  EXPECT_EQ(cmd[3], "--error-format=json");
  EXPECT_EQ(cmd[4], "--no-progress");
  EXPECT_EQ(cmd[5], "--level=6");
  EXPECT_EQ(cmd[6], "src/Http/A.php");
}

TEST(ExternalAnalyzer, UnrunnableInterpreterDeactivates)
{
  TempProject project;
  project.write("src/A.php", "<?php\n");
  AnalyzerConfig config;
  config.executable = "vendor/bin/phpstan";
  config.php = "/nonexistent/phpref/php";
  config.timeout_ms = 5000;
  ExternalAnalyzer analyzer(project.root(), config);
  ASSERT_TRUE(analyzer.is_active());

  const auto result = analyzer.analyze(project.path("src/A.php"));
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("cannot execute"), std::string::npos);
  EXPECT_FALSE(analyzer.is_active());
}
