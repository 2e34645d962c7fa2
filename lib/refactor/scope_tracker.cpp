// php_refactor/refactor/scope_tracker.cpp - Receiver type inference for method call sites
#include "php_refactor/refactor/scope_tracker.hpp"

#include <algorithm>

namespace php_refactor
{

namespace
{

bool same_type(std::string_view a, std::string_view b)
{
  if (iequals(a, b)) {
    return true;
  }
  // An unnamespaced side could not be resolved; fall back to the short name.
  return (namespace_part(a).empty() || namespace_part(b).empty()) &&
         iequals(short_name(a), short_name(b));
}

std::string strip_sigil(std::string_view var)
{
  if (!var.empty() && var.front() == '$') {
    var.remove_prefix(1);
  }
  return std::string(var);
}

SyntaxNode parameter_variable(SyntaxNode param)
{
  SyntaxNode var = param.field("name");
  return var.is_null() ? param.first_child_of(SyntaxKind::Variable) : var;
}

}  // namespace

bool RenameTarget::accepts(std::string_view type_fqn) const
{
  if (class_fqn.empty() || type_fqn.empty()) {
    return false;
  }
  if (same_type(type_fqn, class_fqn)) {
    return true;
  }
  return std::any_of(implementor_fqns.begin(), implementor_fqns.end(), [&](const std::string & impl) {
    return same_type(type_fqn, impl);
  });
}

std::string Scope::lookup(const std::string & variable) const
{
  for (const Scope * s = this; s != nullptr; s = s->parent_) {
    const auto it = s->vars_.find(variable);
    if (it != s->vars_.end()) {
      return it->second;
    }
  }
  return {};
}

// ============================================================================
// ScopeTracker
// ============================================================================

ScopeTracker::ScopeTracker(const SyntaxTree & tree, RenameTarget target)
: tree_(tree), target_(std::move(target)), imports_(collect_imports(tree))
{
}

void ScopeTracker::run()
{
  calls_.clear();
  definitions_.clear();
  classes_.clear();
  namespace_.clear();

  // Top-level statements get their own scope.
  scopes_.clear();
  scopes_.push_back(std::make_unique<Scope>());
  walk(tree_.root());
  scopes_.clear();
}

bool ScopeTracker::visit_namespace_definition(SyntaxNode node)
{
  SyntaxNode name = node.field("name");
  if (name.is_null()) {
    name = node.first_child_of(SyntaxKind::NamespaceName);
  }
  const std::string ns = name.is_null() ? std::string() : normalize_name(name.text());

  const SyntaxNode body = node.field("body");
  if (body.is_null()) {
    namespace_ = ns;
    return false;
  }
  const std::string saved = namespace_;
  namespace_ = ns;
  walk(body);
  namespace_ = saved;
  return false;
}

bool ScopeTracker::enter_class(SyntaxNode node)
{
  const SyntaxNode name = node.field("name");
  ClassContext ctx;
  ctx.fqn = name.is_null() ? std::string() : join_fqn(namespace_, name.text());
  classes_.push_back(std::move(ctx));

  const SyntaxNode body = node.field("body");
  collect_property_types(body, classes_.back());
  walk(body);

  classes_.pop_back();
  return false;
}

bool ScopeTracker::visit_method_declaration(SyntaxNode node)
{
  const SyntaxNode name = node.field("name");
  const ClassContext * cls = current_class();
  if (is_target_method(name) && cls != nullptr && target_.accepts(cls->fqn)) {
    definitions_.push_back(name.range());
  }
  return enter_function(node, false);
}

bool ScopeTracker::enter_function(SyntaxNode node, bool inherits_scope)
{
  const Scope * parent = inherits_scope && !scopes_.empty() ? scopes_.back().get() : nullptr;
  return walk_function(node, std::make_unique<Scope>(parent));
}

bool ScopeTracker::visit_closure(SyntaxNode node)
{
  // Only variables listed in `use (...)` are visible inside the body.
  auto scope = std::make_unique<Scope>();
  for (const SyntaxNode & child : node.named_children()) {
    if (child.ts_kind() != "anonymous_function_use_clause") {
      continue;
    }
    for (const SyntaxNode & captured : child.named_children()) {
      const SyntaxNode var =
        captured.kind() == SyntaxKind::Variable ? captured : captured.first_child_of(SyntaxKind::Variable);
      if (var.is_null()) {
        continue;
      }
      const std::string name(var.text());
      scope->bind(name, scopes_.empty() ? std::string() : scopes_.back()->lookup(name));
    }
  }
  return walk_function(node, std::move(scope));
}

bool ScopeTracker::walk_function(SyntaxNode node, std::unique_ptr<Scope> scope)
{
  scopes_.push_back(std::move(scope));
  bind_parameters(node.field("parameters"));
  walk(node.field("body"));
  scopes_.pop_back();
  return false;
}

void ScopeTracker::bind_parameters(SyntaxNode parameters)
{
  if (parameters.is_null()) {
    return;
  }
  for (const SyntaxNode & param : parameters.named_children()) {
    if (param.kind() != SyntaxKind::SimpleParameter && param.kind() != SyntaxKind::PromotedParameter) {
      continue;
    }
    const SyntaxNode var = parameter_variable(param);
    if (var.is_null()) {
      continue;
    }
    const std::string hint = type_hint_name(param.field("type"));
    scopes_.back()->bind(std::string(var.text()), hint.empty() ? std::string() : resolve(hint));
  }
}

void ScopeTracker::collect_property_types(SyntaxNode class_body, ClassContext & ctx) const
{
  if (class_body.is_null()) {
    return;
  }
  for (const SyntaxNode & member : class_body.named_children()) {
    if (member.kind() == SyntaxKind::PropertyDeclaration) {
      const std::string hint = type_hint_name(member.field("type"));
      if (hint.empty()) {
        continue;
      }
      const std::string type = resolve(hint);
      for (const SyntaxNode & element : member.named_children()) {
        if (element.ts_kind() != "property_element") {
          continue;
        }
        SyntaxNode var = element.field("name");
        if (var.is_null()) {
          var = element.first_child_of(SyntaxKind::Variable);
        }
        if (!var.is_null()) {
          ctx.property_types[strip_sigil(var.text())] = type;
        }
      }
    } else if (member.kind() == SyntaxKind::MethodDeclaration && iequals(member.name_text(), "__construct")) {
      const SyntaxNode params = member.field("parameters");
      for (const SyntaxNode & param : params.named_children()) {
        if (param.kind() != SyntaxKind::PromotedParameter) {
          continue;
        }
        const SyntaxNode var = parameter_variable(param);
        const std::string hint = type_hint_name(param.field("type"));
        if (!var.is_null() && !hint.empty()) {
          ctx.property_types[strip_sigil(var.text())] = resolve(hint);
        }
      }
    }
  }
}

bool ScopeTracker::visit_assignment(SyntaxNode node)
{
  const SyntaxNode left = node.field("left");
  const SyntaxNode right = node.field("right");

  // Calls on the right still see the variable's previous binding.
  walk(right);
  if (left.kind() == SyntaxKind::Variable && !scopes_.empty()) {
    // Rebinding to an unknown type clears what the variable held before.
    scopes_.back()->bind(std::string(left.text()), infer(right));
  } else {
    walk(left);
  }
  return false;
}

bool ScopeTracker::visit_new_expression(SyntaxNode node)
{
  const auto children = node.named_children();
  const bool anonymous = std::any_of(children.begin(), children.end(), [](const SyntaxNode & c) {
    return c.ts_kind() == "anonymous_class" || c.kind() == SyntaxKind::DeclarationList;
  });
  if (!anonymous) {
    return true;
  }

  // `$this` inside an anonymous class is not the enclosing class.
  classes_.push_back(ClassContext{});
  walk_children(node);
  classes_.pop_back();
  return false;
}

bool ScopeTracker::visit_member_call(SyntaxNode node)
{
  const SyntaxNode name = node.field("name");
  if (is_target_method(name)) {
    CallSite site;
    site.shape = CallShape::Member;
    site.name_range = name.range();
    site.call_range = node.range();
    site.receiver_type = infer(node.field("object"));
    site.accepted = target_.accepts(site.receiver_type);
    calls_.push_back(std::move(site));
  }
  return true;
}

bool ScopeTracker::visit_static_call(SyntaxNode node)
{
  const SyntaxNode name = node.field("name");
  if (is_target_method(name)) {
    CallSite site;
    site.shape = CallShape::Static;
    site.name_range = name.range();
    site.call_range = node.range();
    site.receiver_type = resolve_scope(node.field("scope"));
    site.accepted = target_.accepts(site.receiver_type);
    calls_.push_back(std::move(site));
  }
  return true;
}

// ============================================================================
// Inference
// ============================================================================

std::string ScopeTracker::infer(SyntaxNode expr) const
{
  switch (expr.kind()) {
    case SyntaxKind::Parenthesized: {
      const auto children = expr.named_children();
      return children.empty() ? std::string() : infer(children.front());
    }
    case SyntaxKind::Assignment:
      return infer(expr.field("right"));
    case SyntaxKind::NewExpression: {
      const auto children = expr.named_children();
      if (children.empty()) {
        return {};
      }
      const SyntaxNode cls = children.front();
      if (
        cls.kind() == SyntaxKind::Name || cls.kind() == SyntaxKind::QualifiedName ||
        cls.kind() == SyntaxKind::RelativeScope) {
        return resolve(cls.text());
      }
      return {};
    }
    case SyntaxKind::Variable: {
      if (expr.text() == "$this") {
        const ClassContext * cls = current_class();
        return cls == nullptr ? std::string() : cls->fqn;
      }
      return scopes_.empty() ? std::string() : scopes_.back()->lookup(std::string(expr.text()));
    }
    case SyntaxKind::PropertyLookup: {
      const SyntaxNode object = expr.field("object");
      const SyntaxNode name = expr.field("name");
      const ClassContext * cls = current_class();
      if (
        cls == nullptr || object.kind() != SyntaxKind::Variable || object.text() != "$this" ||
        name.kind() != SyntaxKind::Name) {
        return {};
      }
      const auto it = cls->property_types.find(std::string(name.text()));
      return it == cls->property_types.end() ? std::string() : it->second;
    }
    default:
      // Calls and chains carry no return-type information.
      return {};
  }
}

std::string ScopeTracker::resolve(std::string_view written) const
{
  const std::string name = normalize_name(written);
  if (name.empty() || is_builtin_type_name(name)) {
    return {};
  }
  if (iequals(name, "self") || iequals(name, "static")) {
    const ClassContext * cls = current_class();
    return cls == nullptr ? std::string() : cls->fqn;
  }
  if (iequals(name, "parent")) {
    return {};
  }
  return resolve_class_name(written, imports_, namespace_);
}

std::string ScopeTracker::resolve_scope(SyntaxNode scope) const
{
  switch (scope.kind()) {
    case SyntaxKind::Name:
    case SyntaxKind::QualifiedName:
    case SyntaxKind::RelativeScope:
      return resolve(scope.text());
    case SyntaxKind::Variable:
    case SyntaxKind::Parenthesized:
      return infer(scope);
    default:
      return {};
  }
}

bool ScopeTracker::is_target_method(SyntaxNode name) const
{
  return !name.is_null() && name.kind() == SyntaxKind::Name && iequals(name.text(), target_.method);
}

}  // namespace php_refactor
