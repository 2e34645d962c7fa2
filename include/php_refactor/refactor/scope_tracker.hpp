// php_refactor/refactor/scope_tracker.hpp - Receiver type inference for method call sites
//
// A heuristic, single forward pass per function body. Ambiguous receivers
// are left unresolved so callers skip them: a missed rename is preferred
// over a wrong one.
//
#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "php_refactor/syntax/php_queries.hpp"
#include "php_refactor/syntax/syntax_walker.hpp"

namespace php_refactor
{

/// The class (or interface) whose method is being renamed.
struct RenameTarget
{
  std::string class_fqn;  ///< empty: resolve receivers only, accept nothing
  std::string method;
  bool is_interface = false;

  /// Interface targets: FQNs of every registered implementor
  std::vector<std::string> implementor_fqns;

  /// Exact FQN match, or a short-name match when either side is unnamespaced.
  [[nodiscard]] bool accepts(std::string_view type_fqn) const;
};

enum class CallShape : uint8_t {
  Member,  ///< $receiver->method()
  Static,  ///< Name::method()
};

struct CallSite
{
  CallShape shape = CallShape::Member;
  SourceRange name_range;     ///< the method identifier
  SourceRange call_range;     ///< the whole call expression
  std::string receiver_type;  ///< resolved FQN, empty when unknown
  bool accepted = false;
};

/// Variables bound to a type inside one function body.
class Scope
{
public:
  explicit Scope(const Scope * parent = nullptr) : parent_(parent) {}

  void bind(const std::string & variable, std::string type) { vars_[variable] = std::move(type); }

  /// Empty when unknown; a binding to "" shadows an outer one.
  [[nodiscard]] std::string lookup(const std::string & variable) const;

private:
  const Scope * parent_;
  std::unordered_map<std::string, std::string> vars_;
};

/**
 * Walks one parsed file and classifies every call of `target.method`.
 *
 * Also reports declarations of `target.method` inside accepted types, so a
 * single pass yields both the definitions and the call sites of a file.
 */
class ScopeTracker : public SyntaxWalker<ScopeTracker>
{
public:
  ScopeTracker(const SyntaxTree & tree, RenameTarget target);

  void run();

  [[nodiscard]] const std::vector<CallSite> & call_sites() const noexcept { return calls_; }

  /// Name ranges of `target.method` declarations in accepted types.
  [[nodiscard]] const std::vector<SourceRange> & definitions() const noexcept
  {
    return definitions_;
  }

  [[nodiscard]] const RenameTarget & target() const noexcept { return target_; }

  // Hooks ---------------------------------------------------------------------

  bool visit_namespace_definition(SyntaxNode node);
  bool visit_class_declaration(SyntaxNode node) { return enter_class(node); }
  bool visit_interface_declaration(SyntaxNode node) { return enter_class(node); }
  bool visit_trait_declaration(SyntaxNode node) { return enter_class(node); }
  bool visit_enum_declaration(SyntaxNode node) { return enter_class(node); }

  bool visit_method_declaration(SyntaxNode node);
  bool visit_function_definition(SyntaxNode node) { return enter_function(node, false); }
  bool visit_closure(SyntaxNode node);
  bool visit_arrow_function(SyntaxNode node) { return enter_function(node, true); }

  bool visit_assignment(SyntaxNode node);
  bool visit_new_expression(SyntaxNode node);
  bool visit_member_call(SyntaxNode node);
  bool visit_static_call(SyntaxNode node);

private:
  struct ClassContext
  {
    std::string fqn;  ///< empty for anonymous classes
    std::unordered_map<std::string, std::string> property_types;  ///< "name" -> FQN
  };

  bool enter_class(SyntaxNode node);
  bool enter_function(SyntaxNode node, bool inherits_scope);
  bool walk_function(SyntaxNode node, std::unique_ptr<Scope> scope);
  void bind_parameters(SyntaxNode parameters);
  void collect_property_types(SyntaxNode class_body, ClassContext & ctx) const;

  /// Static type of an expression, or "" when unknown.
  [[nodiscard]] std::string infer(SyntaxNode expr) const;
  [[nodiscard]] std::string resolve(std::string_view written) const;
  [[nodiscard]] std::string resolve_scope(SyntaxNode scope) const;

  [[nodiscard]] const ClassContext * current_class() const noexcept
  {
    return classes_.empty() ? nullptr : &classes_.back();
  }
  [[nodiscard]] bool is_target_method(SyntaxNode name) const;

  const SyntaxTree & tree_;
  RenameTarget target_;
  ImportTable imports_;
  std::string namespace_;

  std::vector<ClassContext> classes_;
  std::vector<std::unique_ptr<Scope>> scopes_;

  std::vector<CallSite> calls_;
  std::vector<SourceRange> definitions_;
};

}  // namespace php_refactor
