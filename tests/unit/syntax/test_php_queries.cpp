// test_php_queries.cpp - Structural queries over parsed PHP files

#include <gtest/gtest.h>

#include <algorithm>
#include <string>

#include "php_refactor/syntax/php_queries.hpp"
#include "php_refactor/test_support/temp_project.hpp"

using namespace php_refactor;
using php_refactor::test_support::offset_of;
using php_refactor::test_support::parse;

TEST(NameHelpers, SplitAndJoin)
{
  EXPECT_EQ(short_name("App\\Models\\User"), "User");
  EXPECT_EQ(short_name("User"), "User");
  EXPECT_EQ(namespace_part("App\\Models\\User"), "App\\Models");
  EXPECT_EQ(namespace_part("\\App\\User"), "App");
  EXPECT_EQ(namespace_part("User"), "");
  EXPECT_EQ(join_fqn("App", "User"), "App\\User");
  EXPECT_EQ(join_fqn("", "User"), "User");
  EXPECT_EQ(normalize_name("\\App\\ User"), "App\\User");
}

TEST(NameHelpers, BuiltinsAndRelativeScopes)
{
  EXPECT_TRUE(is_builtin_type_name("string"));
  EXPECT_TRUE(is_builtin_type_name("MIXED"));
  EXPECT_FALSE(is_builtin_type_name("User"));
  EXPECT_TRUE(is_relative_scope_name("self"));
  EXPECT_TRUE(is_relative_scope_name("Static"));
  EXPECT_FALSE(is_relative_scope_name("this"));
}

TEST(ParsePhp, MalformedSourceFails)
{
  auto unit = parse("<?php\nclass {\n");
  EXPECT_EQ(unit.tree, nullptr);
  ASSERT_FALSE(unit.diags.empty());
  EXPECT_EQ(unit.diags.all().front().code, "parse-error");
}

TEST(PhpQueries, NamespaceAndTypeDeclarations)
{
  const std::string src =
    "<?php\n"
    "namespace App\\Services;\n"
    "\n"
    "interface Notifier {}\n"
    "final class UserService implements Notifier\n"
    "{\n"
    "    public function handle(): void {}\n"
    "}\n";
  auto unit = parse(src);
  ASSERT_NE(unit.tree, nullptr);

  const auto ns = find_namespace(*unit.tree);
  ASSERT_TRUE(ns.has_value());
  EXPECT_EQ(ns->name, "App\\Services");
  EXPECT_FALSE(ns->braced);
  EXPECT_EQ(unit.slice(ns->declaration_range), "namespace App\\Services;");
  EXPECT_EQ(unit.slice(ns->name_range), "App\\Services");

  const auto decls = find_type_declarations(*unit.tree);
  ASSERT_EQ(decls.size(), 2U);
  EXPECT_EQ(decls[0].name, "Notifier");
  EXPECT_EQ(decls[0].kind, SyntaxKind::InterfaceDeclaration);
  EXPECT_EQ(decls[1].fqn(), "App\\Services\\UserService");
  EXPECT_EQ(unit.slice(decls[1].name_range), "UserService");

  const auto enclosing = enclosing_type_at(*unit.tree, offset_of(src, "handle"));
  ASSERT_TRUE(enclosing.has_value());
  EXPECT_EQ(enclosing->name, "UserService");

  const Heritage h = collect_heritage(decls[1].node);
  EXPECT_FALSE(h.extends.has_value());
  ASSERT_EQ(h.implements.size(), 1U);
  EXPECT_EQ(h.implements.front().name, "Notifier");
}

TEST(PhpQueries, ImportTableAndResolution)
{
  const std::string src =
    "<?php\n"
    "namespace App\\Http;\n"
    "\n"
    "use App\\Models\\User;\n"
    "use App\\Services\\Mailer as Mail;\n"
    "use function strlen;\n";
  auto unit = parse(src);
  ASSERT_NE(unit.tree, nullptr);

  const ImportTable imports = collect_imports(*unit.tree);
  ASSERT_EQ(imports.items().size(), 2U);

  const UseItem * user = imports.find_alias("User");
  ASSERT_NE(user, nullptr);
  EXPECT_EQ(user->fqn, "App\\Models\\User");
  EXPECT_FALSE(user->explicit_alias);
  EXPECT_FALSE(user->in_group);
  EXPECT_EQ(unit.slice(user->declaration_range), "use App\\Models\\User;");

  const UseItem * mail = imports.find_alias("Mail");
  ASSERT_NE(mail, nullptr);
  EXPECT_EQ(mail->fqn, "App\\Services\\Mailer");
  EXPECT_TRUE(mail->explicit_alias);
  EXPECT_EQ(imports.find_fqn("\\App\\Services\\Mailer"), mail);

  EXPECT_EQ(resolve_class_name("User", imports, "App\\Http"), "App\\Models\\User");
  EXPECT_EQ(resolve_class_name("Mail", imports, "App\\Http"), "App\\Services\\Mailer");
  EXPECT_EQ(resolve_class_name("Request", imports, "App\\Http"), "App\\Http\\Request");
  EXPECT_EQ(resolve_class_name("\\Other\\Thing", imports, "App\\Http"), "Other\\Thing");
  EXPECT_EQ(resolve_class_name("User\\Profile", imports, "App\\Http"), "App\\Models\\User\\Profile");
}

TEST(PhpQueries, TypeReferencesSkipPrimitives)
{
  const std::string src =
    "<?php\n"
    "class Controller extends BaseController\n"
    "{\n"
    "    public function show(Request $request, int $id): Response\n"
    "    {\n"
    "        $user = new User();\n"
    "        return Response::make(\\Http\\View::render($user));\n"
    "    }\n"
    "}\n";
  auto unit = parse(src);
  ASSERT_NE(unit.tree, nullptr);

  const auto refs = collect_type_references(*unit.tree);
  auto has = [&](const std::string & name, TypeRefKind kind) {
    return std::any_of(refs.begin(), refs.end(), [&](const TypeReference & r) {
      return r.written == name && r.kind == kind;
    });
  };

  EXPECT_TRUE(has("BaseController", TypeRefKind::Extends));
  EXPECT_TRUE(has("Request", TypeRefKind::Param));
  EXPECT_TRUE(has("Response", TypeRefKind::Return));
  EXPECT_TRUE(has("User", TypeRefKind::New));
  EXPECT_TRUE(has("Response", TypeRefKind::Static));
  EXPECT_FALSE(std::any_of(refs.begin(), refs.end(), [](const TypeReference & r) {
    return r.written == "int";
  }));

  const auto qualified = std::find_if(refs.begin(), refs.end(), [](const TypeReference & r) {
    return r.written == "Http\\View";
  });
  ASSERT_NE(qualified, refs.end());
  EXPECT_TRUE(qualified->fully_qualified);
  EXPECT_TRUE(qualified->is_qualified());
}
