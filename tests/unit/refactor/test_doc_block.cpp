// test_doc_block.cpp - PHPDoc generation for classes and functions

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "php_refactor/refactor/doc_block.hpp"
#include "php_refactor/test_support/temp_project.hpp"

using namespace php_refactor;
using php_refactor::test_support::offset_of;
using php_refactor::test_support::parse;

namespace
{

std::string applied(const std::string & src, const DocBlockAction & action)
{
  const std::vector<EditOperation> ops{action.edit};
  return apply_edits(src, ops);
}

}  // namespace

TEST(ParseDocComment, SplitsDescriptionParamsAndTags)
{
  const DocComment doc = parse_doc_comment(
    "/**\n"
    " * Loads users.\n"
    " *\n"
    " * @param int ...$ids\n"
    " * @param $raw kept as is\n"
    " * @return string|null the value\n"
    " * @deprecated\n"
    " */");

  EXPECT_EQ(doc.description, (std::vector<std::string>{"Loads users."}));
  ASSERT_EQ(doc.params.size(), 2U);
  EXPECT_EQ(doc.params[0].type, "int");
  EXPECT_EQ(doc.params[0].name, "ids");
  EXPECT_EQ(doc.params[1].type, "");
  EXPECT_EQ(doc.params[1].description, "kept as is");
  ASSERT_NE(doc.param("raw"), nullptr);
  EXPECT_EQ(doc.param("missing"), nullptr);
  EXPECT_EQ(doc.return_tag.value_or(""), "string|null the value");
  EXPECT_EQ(doc.other_tags, (std::vector<std::string>{"@deprecated"}));
}

TEST(PlanDocBlockActions, GeneratesMethodBlockFromSignature)
{
  const std::string src =
    "<?php\n"
    "namespace App\\Services;\n"
    "\n"
    "class UserService\n"
    "{\n"
    "    public function find(int $id, $opts): ?User\n"
    "    {\n"
    "        return null;\n"
    "    }\n"
    "}\n";
  const auto unit = parse(src);
  ASSERT_NE(unit.tree, nullptr);

  const auto actions = plan_doc_block_actions(*unit.tree, offset_of(src, "return null"));
  ASSERT_EQ(actions.size(), 1U);
  EXPECT_EQ(actions[0].title, "Generate PHPDoc for method");
  EXPECT_TRUE(actions[0].edit.is_insertion());
  EXPECT_EQ(
    applied(src, actions[0]),
    "<?php\n"
    "namespace App\\Services;\n"
    "\n"
    "class UserService\n"
    "{\n"
    "    /**\n"
    "     * [Description]\n"
    "     *\n"
    "     * @param int $id\n"
    "     * @param mixed $opts\n"
    "     * @return ?User\n"
    "     */\n"
    "    public function find(int $id, $opts): ?User\n"
    "    {\n"
    "        return null;\n"
    "    }\n"
    "}\n");
}

TEST(PlanDocBlockActions, UpdateKeepsDescriptionsAndUnrelatedTags)
{
  const std::string src =
    "<?php\n"
    "class Mailer\n"
    "{\n"
    "    /**\n"
    "     * Sends one message.\n"
    "     *\n"
    "     * @param string $to the recipient\n"
    "     * @throws RuntimeException\n"
    "     */\n"
    "    public function send($to, int $retries = 3): bool\n"
    "    {\n"
    "        return true;\n"
    "    }\n"
    "}\n";
  const auto unit = parse(src);
  ASSERT_NE(unit.tree, nullptr);

  const auto actions = plan_doc_block_actions(*unit.tree, offset_of(src, "send("));
  ASSERT_EQ(actions.size(), 1U);
  EXPECT_EQ(actions[0].title, "Update PHPDoc for method");
  EXPECT_FALSE(actions[0].edit.is_insertion());
  EXPECT_EQ(
    applied(src, actions[0]),
    "<?php\n"
    "class Mailer\n"
    "{\n"
    "    /**\n"
    "     * Sends one message.\n"
    "     *\n"
    "     * @param string $to the recipient\n"
    "     * @param int $retries\n"
    "     * @return bool\n"
    "     * @throws RuntimeException\n"
    "     */\n"
    "    public function send($to, int $retries = 3): bool\n"
    "    {\n"
    "        return true;\n"
    "    }\n"
    "}\n");
}

TEST(PlanDocBlockActions, ClassBlockOnlyFromItsFirstLine)
{
  const std::string src =
    "<?php\n"
    "namespace App\\Models;\n"
    "\n"
    "class User extends Model\n"
    "{\n"
    "}\n";
  const auto unit = parse(src);
  ASSERT_NE(unit.tree, nullptr);

  const auto actions = plan_doc_block_actions(*unit.tree, offset_of(src, "User"));
  ASSERT_EQ(actions.size(), 1U);
  EXPECT_EQ(actions[0].title, "Generate PHPDoc for class");
  EXPECT_EQ(
    applied(src, actions[0]),
    "<?php\n"
    "namespace App\\Models;\n"
    "\n"
    "/**\n"
    " * Class User\n"
    " * @package App\\Models\n"
    " */\n"
    "class User extends Model\n"
    "{\n"
    "}\n");

  EXPECT_TRUE(plan_doc_block_actions(*unit.tree, offset_of(src, "{")).empty());
}

TEST(PlanDocBlockActions, PlainCommentAboveIsNotReplaced)
{
  const std::string src =
    "<?php\n"
    "// helper\n"
    "function slug(string $s): string { return $s; }\n";
  const auto unit = parse(src);
  ASSERT_NE(unit.tree, nullptr);

  const auto actions = plan_doc_block_actions(*unit.tree, offset_of(src, "slug"));
  ASSERT_EQ(actions.size(), 1U);
  EXPECT_EQ(actions[0].title, "Generate PHPDoc for function");
  EXPECT_EQ(
    applied(src, actions[0]),
    "<?php\n"
    "// helper\n"
    "/**\n"
    " * [Description]\n"
    " *\n"
    " * @param string $s\n"
    " * @return string\n"
    " */\n"
    "function slug(string $s): string { return $s; }\n");
}
