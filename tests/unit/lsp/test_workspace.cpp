#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

#include "php_refactor/lsp.hpp"
#include "php_refactor/test_support/temp_project.hpp"

using json = nlohmann::json;
using php_refactor::test_support::TempProject;

static uint32_t find_byte_offset(const std::string & text, const std::string & needle)
{
  const auto pos = text.find(needle);
  EXPECT_NE(pos, std::string::npos) << "needle must exist: '" << needle << "'";
  if (pos == std::string::npos) return 0U;
  return static_cast<uint32_t>(pos);
}

static constexpr const char * k_controller =
  "<?php\n"
  "namespace App\\Http;\n"
  "\n"
  "use App\\Services\\UserService;\n"
  "\n"
  "class Controller\n"
  "{\n"
  "    public function __construct(private UserService $users) {}\n"
  "\n"
  "    public function show(int $id)\n"
  "    {\n"
  "        return $this->users->find($id);\n"
  "    }\n"
  "}\n";

class LspWorkspace : public ::testing::Test
{
protected:
  void SetUp() override
  {
    project_.write_composer("App\\", "src/");
    project_.write("src/Models/User.php", "<?php\nnamespace App\\Models;\n\nclass User {}\n");
    project_.write(
      "src/Services/UserService.php",
      "<?php\n"
      "namespace App\\Services;\n"
      "\n"
      "use App\\Models\\User;\n"
      "\n"
      "class UserService\n"
      "{\n"
      "    public function find(int $id): User { return new User(); }\n"
      "}\n");
    project_.write("src/Http/Controller.php", k_controller);
    project_.write(
      "src/Logging/LoggerInterface.php",
      "<?php\nnamespace App\\Logging;\n\ninterface LoggerInterface\n{\n    public function log(string $m): void;\n}\n");
    project_.write(
      "src/Logging/FileLogger.php",
      "<?php\nnamespace App\\Logging;\n\nclass FileLogger implements LoggerInterface\n{\n"
      "    public function log(string $m): void {}\n}\n");
  }

  [[nodiscard]] std::string uri(std::string_view rel) const
  {
    return "file://" + project_.path(rel).generic_string();
  }

  void load_and_index()
  {
    ASSERT_TRUE(ws_.load_project(project_.root().string()));
    const auto summary = json::parse(ws_.index_workspace_json());
    ASSERT_EQ(summary["result"], "completed");
  }

  TempProject project_;
  php_refactor::lsp::Workspace ws_;
};

TEST_F(LspWorkspace, IndexSummary)
{
  ASSERT_TRUE(ws_.load_project(project_.root().string()));
  EXPECT_FALSE(ws_.is_index_ready());

  const auto j = json::parse(ws_.index_workspace_json());
  EXPECT_EQ(j["result"], "completed");
  EXPECT_EQ(j["files"], 5);
  EXPECT_EQ(j["definitions"], 5);
  EXPECT_EQ(j["methods"], 5);
  EXPECT_TRUE(ws_.is_index_ready());
}

TEST_F(LspWorkspace, DiagnosticsUseUnsavedContent)
{
  load_and_index();
  const std::string edited = std::string(k_controller).insert(
    find_byte_offset(k_controller, "    public function show"),
    "    public function make() { return new User(); }\n\n");
  ws_.set_document(uri("src/Http/Controller.php"), edited);
  EXPECT_TRUE(ws_.has_document(uri("src/Http/Controller.php")));

  const auto j = json::parse(ws_.diagnostics_json(uri("src/Http/Controller.php")));
  ASSERT_EQ(j["items"].size(), 1U);
  const auto & item = j["items"][0];
  EXPECT_EQ(item["code"], "missing-import");
  EXPECT_EQ(item["severity"], "Error");
  EXPECT_EQ(item["source"], "php-refactor");
  ASSERT_EQ(item["fixes"].size(), 1U);
  EXPECT_EQ(item["fixes"][0]["title"], "Add import for App\\Models\\User");

  ws_.remove_document(uri("src/Http/Controller.php"));
  const auto clean = json::parse(ws_.diagnostics_json(uri("src/Http/Controller.php")));
  EXPECT_TRUE(clean["items"].empty());
}

TEST_F(LspWorkspace, DiagnosticsReportParseErrors)
{
  load_and_index();
  ws_.set_document(uri("src/Http/Controller.php"), "<?php\nclass Controller {\n");
  const auto j = json::parse(ws_.diagnostics_json(uri("src/Http/Controller.php")));
  ASSERT_FALSE(j["items"].empty());
  EXPECT_EQ(j["items"][0]["code"], "parse-error");
}

TEST_F(LspWorkspace, DefinitionOfClassAndMethod)
{
  load_and_index();
  const std::string service = project_.read("src/Services/UserService.php");

  const auto cls = json::parse(
    ws_.definition_json(uri("src/Services/UserService.php"), find_byte_offset(service, "User()") + 1));
  ASSERT_EQ(cls["locations"].size(), 1U);
  EXPECT_EQ(cls["locations"][0]["fqn"], "App\\Models\\User");
  EXPECT_EQ(cls["locations"][0]["uri"], uri("src/Models/User.php"));
  EXPECT_EQ(cls["locations"][0]["range"]["startLine"], 4);

  const auto method = json::parse(
    ws_.definition_json(uri("src/Http/Controller.php"), find_byte_offset(k_controller, "find(")));
  ASSERT_EQ(method["locations"].size(), 1U);
  EXPECT_EQ(method["locations"][0]["fqn"], "App\\Services\\UserService::find");
  EXPECT_EQ(method["locations"][0]["kind"], "method");

  const auto nothing = json::parse(ws_.definition_json(uri("src/Http/Controller.php"), 0));
  EXPECT_TRUE(nothing["locations"].empty());
}

TEST_F(LspWorkspace, ImplementationsOfInterface)
{
  load_and_index();
  const std::string iface = project_.read("src/Logging/LoggerInterface.php");
  const auto j = json::parse(ws_.implementation_json(
    uri("src/Logging/LoggerInterface.php"), find_byte_offset(iface, "LoggerInterface")));
  ASSERT_EQ(j["locations"].size(), 1U);
  EXPECT_EQ(j["locations"][0]["name"], "FileLogger");

  // Inside the interface body, away from any name: the enclosing type is used.
  const auto inside = json::parse(ws_.implementation_json(
    uri("src/Logging/LoggerInterface.php"), find_byte_offset(iface, "{")));
  EXPECT_EQ(inside["locations"].size(), 1U);
}

TEST_F(LspWorkspace, ReferencesOfMethodCountCallsAndDeclarations)
{
  load_and_index();
  const auto j = json::parse(
    ws_.references_json(uri("src/Http/Controller.php"), find_byte_offset(k_controller, "find(") + 2));
  ASSERT_EQ(j["locations"].size(), 2U);

  std::vector<std::string> uris;
  for (const auto & loc : j["locations"]) {
    uris.push_back(loc["uri"].get<std::string>());
  }
  std::sort(uris.begin(), uris.end());
  std::vector<std::string> expected{uri("src/Http/Controller.php"), uri("src/Services/UserService.php")};
  std::sort(expected.begin(), expected.end());
  EXPECT_EQ(uris, expected);
}

TEST_F(LspWorkspace, RenameMethodFromCall)
{
  load_and_index();
  const auto j = json::parse(ws_.rename_method_json(
    uri("src/Http/Controller.php"), find_byte_offset(k_controller, "find("), "findById"));
  ASSERT_TRUE(j["success"].get<bool>()) << j.dump();
  ASSERT_EQ(j["edits"].size(), 2U);
  for (const auto & edit : j["edits"]) {
    EXPECT_EQ(edit["newText"], "findById");
  }

  const auto refused = json::parse(ws_.rename_method_json(
    uri("src/Http/Controller.php"), find_byte_offset(k_controller, "find("), "9lives"));
  EXPECT_FALSE(refused["success"].get<bool>());
  EXPECT_TRUE(refused["edits"].empty());
  EXPECT_TRUE(refused.contains("error"));
}

TEST_F(LspWorkspace, CodeActionsForMissingImport)
{
  load_and_index();
  const std::string edited =
    "<?php\nnamespace App\\Http;\n\nclass Draft\n{\n    public function make() { return new User(); }\n}\n";
  ws_.set_document(uri("src/Http/Draft.php"), edited);

  const auto computed =
    json::parse(ws_.code_actions_json(uri("src/Http/Draft.php"), find_byte_offset(edited, "User()")));
  ASSERT_EQ(computed["actions"].size(), 2U);
  const auto & action = computed["actions"][0];
  EXPECT_EQ(action["title"], "Add import for App\\Models\\User");
  EXPECT_EQ(action["kind"], "quickfix");
  EXPECT_TRUE(action["isPreferred"].get<bool>());
  ASSERT_EQ(action["edits"].size(), 1U);
  EXPECT_EQ(action["edits"][0]["newText"], "\nuse App\\Models\\User;\n");

  // The cursor also sits inside `make()`.
  const auto & doc_action = computed["actions"][1];
  EXPECT_EQ(doc_action["title"], "Generate PHPDoc for method");
  EXPECT_EQ(doc_action["kind"], "refactor.rewrite");
  ASSERT_EQ(doc_action["edits"].size(), 1U);
  EXPECT_EQ(
    doc_action["edits"][0]["newText"],
    "    /**\n     * [Description]\n     *\n     * @return void\n     */\n");

  const auto from_host = json::parse(ws_.code_actions_json(
    uri("src/Http/Draft.php"), 0, {"Class Invoice not found."}));
  ASSERT_EQ(from_host["actions"].size(), 1U);
  EXPECT_EQ(from_host["actions"][0]["title"], "Add import for Invoice (not found in index)");
  EXPECT_TRUE(from_host["actions"][0]["edits"].empty());
}

TEST_F(LspWorkspace, MoveFileUpdatesImports)
{
  load_and_index();
  const auto j = json::parse(ws_.move_file_json(uri("src/Models/User.php"), uri("src/Domain/User.php")));
  ASSERT_TRUE(j["success"].get<bool>()) << j.dump();

  bool namespace_updated = false;
  bool import_updated = false;
  for (const auto & edit : j["edits"]) {
    namespace_updated |= edit["newText"] == "namespace App\\Domain;";
    import_updated |= edit["uri"] == uri("src/Services/UserService.php") && edit["newText"] == "App\\Domain\\User";
  }
  EXPECT_TRUE(namespace_updated);
  EXPECT_TRUE(import_updated);
}

TEST_F(LspWorkspace, AddImport)
{
  load_and_index();
  const auto j = json::parse(ws_.add_import_json(uri("src/Http/Controller.php"), {"App\\Models\\User"}));
  ASSERT_TRUE(j["success"].get<bool>());
  ASSERT_EQ(j["edits"].size(), 1U);
  EXPECT_EQ(j["edits"][0]["newText"], "use App\\Models\\User;\nuse App\\Services\\UserService;");
}

TEST_F(LspWorkspace, SaveDeleteAndMoveKeepIndexCurrent)
{
  load_and_index();
  const std::string order = "<?php\nnamespace App\\Models;\n\nclass Order {}\n";
  project_.write("src/Models/Order.php", order);
  const uint32_t at = find_byte_offset(order, "Order {");

  EXPECT_TRUE(json::parse(ws_.definition_json(uri("src/Models/Order.php"), at))["locations"].empty());
  ws_.did_save(uri("src/Models/Order.php"));
  EXPECT_EQ(json::parse(ws_.definition_json(uri("src/Models/Order.php"), at))["locations"].size(), 1U);

  project_.write("src/Sales/Order.php", order);
  ws_.did_move(uri("src/Models/Order.php"), uri("src/Sales/Order.php"));
  const auto moved = json::parse(ws_.definition_json(uri("src/Sales/Order.php"), at));
  ASSERT_EQ(moved["locations"].size(), 1U);
  EXPECT_EQ(moved["locations"][0]["uri"], uri("src/Sales/Order.php"));

  ws_.did_delete(uri("src/Sales/Order.php"));
  EXPECT_TRUE(json::parse(ws_.definition_json(uri("src/Sales/Order.php"), at))["locations"].empty());
}

TEST_F(LspWorkspace, InvalidConfigFallsBackToDefaults)
{
  project_.write("phpref.yaml", "indexer:\n  time_slice_ms: 0\n");
  std::string error;
  EXPECT_FALSE(ws_.load_project(project_.root().string(), &error));
  EXPECT_FALSE(error.empty());

  const auto j = json::parse(ws_.index_workspace_json());
  EXPECT_EQ(j["files"], 5);
}

TEST_F(LspWorkspace, AnalyzerDisabledByConfig)
{
  project_.write("phpref.yaml", "analyzer:\n  enabled: false\n");
  ASSERT_TRUE(ws_.load_project(project_.root().string()));
  const auto j = json::parse(ws_.analyze_json(uri("src/Models/User.php")));
  EXPECT_FALSE(j["active"].get<bool>());
  EXPECT_TRUE(j["items"].empty());
}
