// test_import_diagnostics.cpp - Missing-import detection and quick-fix offers

#include <gtest/gtest.h>

#include <algorithm>

#include "php_refactor/diagnostics/import_diagnostics.hpp"
#include "php_refactor/test_support/temp_project.hpp"

using namespace php_refactor;
using php_refactor::test_support::parse;

namespace
{

constexpr const char * k_controller =
  "<?php\n"
  "namespace App\\Http;\n"
  "\n"
  "use App\\Services\\Mailer;\n"
  "\n"
  "class Controller\n"
  "{\n"
  "    public function show(User $user, Request $r, Mailer $m, int $id, Missing $x): self\n"
  "    {\n"
  "        return new \\App\\Models\\User();\n"
  "    }\n"
  "}\n";

class ImportDiagnosticsTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    ASSERT_TRUE(index_.scan_text("/tmp/phpref_diag/Models/User.php", "<?php\nnamespace App\\Models;\nclass User {}\n"));
    ASSERT_TRUE(index_.scan_text("/tmp/phpref_diag/Legacy/User.php", "<?php\nnamespace Legacy;\nclass User {}\n"));
    ASSERT_TRUE(index_.scan_text("/tmp/phpref_diag/Http/Request.php", "<?php\nnamespace App\\Http;\nclass Request {}\n"));
  }

  SymbolIndex index_;
};

const Diagnostic * find_for(const DiagnosticBag & diags, std::string_view name)
{
  const std::string expected = missing_import_message(name);
  const auto it = std::find_if(diags.begin(), diags.end(), [&](const Diagnostic & d) {
    return d.message == expected;
  });
  return it == diags.end() ? nullptr : &*it;
}

}  // namespace

TEST(ClassNameFromMessage, RecognizedShapes)
{
  EXPECT_EQ(class_name_from_message(missing_import_message("User")).value_or(""), "User");
  EXPECT_EQ(
    class_name_from_message("Class App\\Models\\Order not found.").value_or(""), "App\\Models\\Order");
  EXPECT_EQ(class_name_from_message("Unknown class Invoice used").value_or(""), "Invoice");
  EXPECT_FALSE(class_name_from_message("Undefined variable $x").has_value());
}

TEST_F(ImportDiagnosticsTest, ReportsOnlyUnresolvableShortNames)
{
  auto unit = parse(k_controller, "/tmp/phpref_diag/Http/Controller.php");
  ASSERT_NE(unit.tree, nullptr);

  DiagnosticBag diags;
  EXPECT_EQ(check_missing_imports(*unit.tree, index_, diags), 2U);
  EXPECT_EQ(diags.size(), 2U);

  EXPECT_EQ(find_for(diags, "Request"), nullptr);
  EXPECT_EQ(find_for(diags, "Mailer"), nullptr);

  const Diagnostic * user = find_for(diags, "User");
  ASSERT_NE(user, nullptr);
  EXPECT_EQ(user->severity, Severity::Error);
  EXPECT_EQ(user->code, k_missing_import_code);
  EXPECT_EQ(user->source, k_diagnostic_source);
  EXPECT_EQ(unit.slice(user->primary_range()), "User");
  ASSERT_EQ(user->fixits.size(), 2U);
  std::vector<std::string> titles;
  for (const auto & fix : user->fixits) {
    titles.push_back(fix.title);
    EXPECT_NE(fix.replacement_text.find("use "), std::string::npos);
  }
  std::sort(titles.begin(), titles.end());
  EXPECT_EQ(titles, (std::vector<std::string>{"Add import for App\\Models\\User", "Add import for Legacy\\User"}));
  EXPECT_FALSE(user->help_message.has_value());

  const Diagnostic * missing = find_for(diags, "Missing");
  ASSERT_NE(missing, nullptr);
  EXPECT_TRUE(missing->fixits.empty());
  ASSERT_TRUE(missing->help_message.has_value());
  EXPECT_NE(missing->help_message->find("Missing"), std::string::npos);
}

TEST_F(ImportDiagnosticsTest, LocalAndGlobalNamespaceTypesAreVisible)
{
  auto unit = parse(
    "<?php\n"
    "class Local {}\n"
    "function f(Local $l, Exception $e): void {}\n",
    "/tmp/phpref_diag/script.php");
  ASSERT_NE(unit.tree, nullptr);

  index_.scan_text("/tmp/phpref_diag/Exception.php", "<?php\nclass Exception {}\n");

  DiagnosticBag diags;
  EXPECT_EQ(check_missing_imports(*unit.tree, index_, diags), 0U);
  EXPECT_TRUE(diags.empty());
}

TEST_F(ImportDiagnosticsTest, FixItInsertsSortedImport)
{
  auto unit = parse(k_controller, "/tmp/phpref_diag/Http/Controller.php");
  ASSERT_NE(unit.tree, nullptr);
  DiagnosticBag diags;
  check_missing_imports(*unit.tree, index_, diags);

  const Diagnostic * user = find_for(diags, "User");
  ASSERT_NE(user, nullptr);
  const auto fix = std::find_if(user->fixits.begin(), user->fixits.end(), [](const FixIt & f) {
    return f.title == "Add import for App\\Models\\User";
  });
  ASSERT_NE(fix, user->fixits.end());
  EXPECT_EQ(fix->replacement_text, "use App\\Models\\User;\nuse App\\Services\\Mailer;");
}
