// test_scope_tracker.cpp - Receiver type inference at method call sites

#include <gtest/gtest.h>

#include <map>
#include <string>

#include "php_refactor/refactor/scope_tracker.hpp"
#include "php_refactor/test_support/temp_project.hpp"

using namespace php_refactor;
using php_refactor::test_support::parse;

namespace
{

/// Receiver FQN and acceptance of each `find(N)` call, keyed by N.
struct Observed
{
  std::string receiver;
  bool accepted = false;
};

std::map<std::string, Observed> observe(
  const test_support::TestParseUnit & unit, const RenameTarget & target)
{
  ScopeTracker tracker(*unit.tree, target);
  tracker.run();

  std::map<std::string, Observed> out;
  for (const CallSite & site : tracker.call_sites()) {
    // The argument text identifies the call: "find(3)" -> "3".
    const std::string_view call = unit.slice(site.call_range);
    const size_t open = call.rfind('(');
    const size_t close = call.rfind(')');
    out[std::string(call.substr(open + 1, close - open - 1))] = {site.receiver_type, site.accepted};
  }
  return out;
}

RenameTarget user_service_find()
{
  RenameTarget t;
  t.class_fqn = "App\\Services\\UserService";
  t.method = "find";
  return t;
}

}  // namespace

TEST(RenameTarget, AcceptsExactOrUnnamespacedShortName)
{
  RenameTarget t = user_service_find();
  EXPECT_TRUE(t.accepts("App\\Services\\UserService"));
  EXPECT_TRUE(t.accepts("app\\services\\userservice"));
  EXPECT_TRUE(t.accepts("UserService"));
  EXPECT_FALSE(t.accepts("Other\\UserService"));
  EXPECT_FALSE(t.accepts(""));

  t.implementor_fqns = {"App\\Services\\CachedUserService"};
  EXPECT_TRUE(t.accepts("App\\Services\\CachedUserService"));

  RenameTarget empty;
  empty.method = "find";
  EXPECT_FALSE(empty.accepts("App\\Services\\UserService"));
}

TEST(Scope, ParentLookupAndShadowing)
{
  Scope outer;
  outer.bind("$a", "App\\A");
  outer.bind("$b", "App\\B");
  Scope inner(&outer);
  inner.bind("$b", "");

  EXPECT_EQ(inner.lookup("$a"), "App\\A");
  EXPECT_EQ(inner.lookup("$b"), "");
  EXPECT_EQ(inner.lookup("$c"), "");
}

TEST(ScopeTracker, InfersReceiversFromParametersPropertiesAndNew)
{
  auto unit = parse(
    "<?php\n"
    "namespace App\\Http;\n"
    "\n"
    "use App\\Services\\UserService;\n"
    "\n"
    "class UserController\n"
    "{\n"
    "    private ?UserService $cache;\n"
    "\n"
    "    public function __construct(private UserService $users) {}\n"
    "\n"
    "    public function show(UserService $svc, $other)\n"
    "    {\n"
    "        $svc->find(1);\n"
    "        $this->users->find(2);\n"
    "        $x = new \\App\\Services\\UserService();\n"
    "        $x->find(3);\n"
    "        $other->find(4);\n"
    "        UserService::find(5);\n"
    "        $x = make();\n"
    "        $x->find(6);\n"
    "        $fn = function () use ($svc) { $svc->find(7); };\n"
    "        $this->make()->find(8);\n"
    "        $this->cache->find(9);\n"
    "    }\n"
    "\n"
    "    public function find($id) { return self::find(10); }\n"
    "}\n");
  ASSERT_NE(unit.tree, nullptr);

  const auto calls = observe(unit, user_service_find());
  ASSERT_EQ(calls.size(), 10U);

  for (const char * id : {"1", "2", "3", "5", "7", "9"}) {
    EXPECT_TRUE(calls.at(id).accepted) << "call " << id;
    EXPECT_EQ(calls.at(id).receiver, "App\\Services\\UserService") << "call " << id;
  }
  for (const char * id : {"4", "6", "8"}) {
    EXPECT_FALSE(calls.at(id).accepted) << "call " << id;
    EXPECT_EQ(calls.at(id).receiver, "") << "call " << id;
  }
  EXPECT_EQ(calls.at("10").receiver, "App\\Http\\UserController");
  EXPECT_FALSE(calls.at("10").accepted);
}

TEST(ScopeTracker, DefinitionsOnlyInAcceptedTypes)
{
  auto unit = parse(
    "<?php\n"
    "namespace App\\Services;\n"
    "\n"
    "class UserService\n"
    "{\n"
    "    public function find(int $id) { return $this->find($id - 1); }\n"
    "}\n"
    "\n"
    "class OrderService\n"
    "{\n"
    "    public function find(int $id) {}\n"
    "}\n");
  ASSERT_NE(unit.tree, nullptr);

  ScopeTracker tracker(*unit.tree, user_service_find());
  tracker.run();

  ASSERT_EQ(tracker.definitions().size(), 1U);
  EXPECT_EQ(unit.tree->file().get_line_column(tracker.definitions()[0].get_begin().offset()).line, 6U);
  ASSERT_EQ(tracker.call_sites().size(), 1U);
  EXPECT_TRUE(tracker.call_sites()[0].accepted);
  EXPECT_EQ(tracker.call_sites()[0].shape, CallShape::Member);
}

TEST(ScopeTracker, AnonymousClassIsolatesThis)
{
  auto unit = parse(
    "<?php\n"
    "namespace App\\Services;\n"
    "\n"
    "class UserService\n"
    "{\n"
    "    public function build()\n"
    "    {\n"
    "        return new class {\n"
    "            public function run() { $this->find(1); }\n"
    "        };\n"
    "    }\n"
    "\n"
    "    public function find($id) {}\n"
    "}\n");
  ASSERT_NE(unit.tree, nullptr);

  const auto calls = observe(unit, user_service_find());
  ASSERT_EQ(calls.size(), 1U);
  EXPECT_FALSE(calls.at("1").accepted);
}

TEST(ScopeTracker, FunctionsDoNotSeeOuterVariables)
{
  auto unit = parse(
    "<?php\n"
    "use App\\Services\\UserService;\n"
    "\n"
    "$svc = new UserService();\n"
    "$svc->find(1);\n"
    "\n"
    "function helper() { $svc->find(2); }\n"
    "\n"
    "$f = fn() => $svc->find(3);\n");
  ASSERT_NE(unit.tree, nullptr);

  const auto calls = observe(unit, user_service_find());
  ASSERT_EQ(calls.size(), 3U);
  EXPECT_TRUE(calls.at("1").accepted);
  EXPECT_FALSE(calls.at("2").accepted);
  EXPECT_TRUE(calls.at("3").accepted);
}

TEST(ScopeTracker, AssignmentRightSideSeesPreviousBinding)
{
  auto unit = parse(
    "<?php\n"
    "use App\\Services\\UserService;\n"
    "\n"
    "function load(UserService $svc)\n"
    "{\n"
    "    $svc = $svc->find(1);\n"
    "    $svc->find(2);\n"
    "    $copy = new UserService();\n"
    "    $copy = $copy->find(3) ?? $copy;\n"
    "}\n");
  ASSERT_NE(unit.tree, nullptr);

  const auto calls = observe(unit, user_service_find());
  ASSERT_EQ(calls.size(), 3U);
  EXPECT_TRUE(calls.at("1").accepted);
  // The call result carries no type, so the rebinding clears the variable.
  EXPECT_FALSE(calls.at("2").accepted);
  EXPECT_TRUE(calls.at("3").accepted);
}

TEST(ScopeTracker, ClosuresSeeOnlyCapturedVariables)
{
  auto unit = parse(
    "<?php\n"
    "use App\\Services\\UserService;\n"
    "\n"
    "$svc = new UserService();\n"
    "$other = new UserService();\n"
    "$a = function () use ($svc) { $svc->find(1); $other->find(2); };\n"
    "$b = function () use (&$other) { $other->find(3); };\n"
    "$c = function () { $svc->find(4); };\n");
  ASSERT_NE(unit.tree, nullptr);

  const auto calls = observe(unit, user_service_find());
  ASSERT_EQ(calls.size(), 4U);
  EXPECT_TRUE(calls.at("1").accepted);
  EXPECT_FALSE(calls.at("2").accepted);
  EXPECT_TRUE(calls.at("3").accepted);
  EXPECT_FALSE(calls.at("4").accepted);
}
