// test_diagnostic_printer.cpp - Plain-text rendering of diagnostics

#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "php_refactor/basic/diagnostic_printer.hpp"

using namespace php_refactor;

TEST(DiagnosticPrinter, RendersHeaderLocationAndSourceLine)
{
  const std::string src = "<?php\nnamespace App;\n\nfunction f(User $u) {}\n";
  const SourceFile file("/tmp/phpref_printer.php", src);
  const auto start = static_cast<uint32_t>(src.find("User"));

  DiagnosticBag diags;
  diags.report_error(SourceRange(start, start + 4), "Class 'User' is not imported. Add 'use' statement.", "not imported")
    .with_code("missing-import");

  std::ostringstream os;
  DiagnosticPrinter printer(os, false);
  printer.print_all(diags, file);

  const std::string out = os.str();
  EXPECT_NE(out.find("error[missing-import]: Class 'User' is not imported."), std::string::npos) << out;
  EXPECT_NE(out.find(":4:12"), std::string::npos) << out;
  EXPECT_NE(out.find("function f(User $u) {}"), std::string::npos) << out;
  EXPECT_NE(out.find("not imported"), std::string::npos) << out;
}

TEST(DiagnosticPrinter, AnalyzerSourceIsNoted)
{
  const SourceFile file("/tmp/phpref_printer.php", "<?php\n$x = 1;\n");

  DiagnosticBag diags;
  diags.report_error(SourceRange(6, 13), "Undefined variable").with_source("phpstan");

  std::ostringstream os;
  DiagnosticPrinter printer(os, false);
  printer.print_all(diags, file);

  EXPECT_NE(os.str().find("phpstan"), std::string::npos) << os.str();
}

TEST(DiagnosticPrinter, LabelIsUnderlinedUnderItsColumns)
{
  const std::string src = "<?php\nnew Mailer();\n";
  const SourceFile file("/tmp/phpref_printer.php", src);
  const auto start = static_cast<uint32_t>(src.find("Mailer"));

  DiagnosticBag diags;
  diags.report_error(SourceRange(start, start + 6), "Class 'Mailer' is not imported.", "here");
  ASSERT_EQ(diags.all().front().labels.size(), 1U);

  std::ostringstream os;
  DiagnosticPrinter printer(os, false);
  printer.print_all(diags, file);

  EXPECT_NE(os.str().find("      |     ^^^^^^ here"), std::string::npos) << os.str();
}
