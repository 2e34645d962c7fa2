// php_refactor/syntax/syntax_walker.hpp - CRTP traversal over SyntaxNode trees
//
// Dispatches on SyntaxKind to `visit_<snake>` hooks. A hook returns true to
// let the walker descend into the node's child slots (see child_slots()),
// or false when it handled (or wants to prune) the subtree itself.
//
#pragma once

#include "php_refactor/syntax/syntax_tree.hpp"

namespace php_refactor
{

/**
 * CRTP-based syntax walker.
 *
 * Usage:
 * @code
 *   class CallCounter : public SyntaxWalker<CallCounter> {
 *   public:
 *     bool visit_member_call(SyntaxNode node) { ++count; return true; }
 *     int count = 0;
 *   };
 *
 *   CallCounter c;
 *   c.walk(tree->root());
 * @endcode
 *
 * @tparam Derived The derived walker class
 */
template <typename Derived>
class SyntaxWalker
{
public:
  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }

  void walk(SyntaxNode node)
  {
    if (node.is_null()) {
      return;
    }
    if (dispatch(node)) {
      walk_children(node);
    }
  }

  /// Descend into the child slots declared for the node's kind.
  void walk_children(SyntaxNode node)
  {
    const ChildSlots & slots = child_slots(node.kind());
    switch (slots.mode) {
      case ChildSlots::Mode::None:
        return;
      case ChildSlots::Mode::Fields:
        for (uint8_t i = 0; i < slots.field_count; ++i) {
          get_derived().walk(node.field(slots.fields[i]));
        }
        return;
      case ChildSlots::Mode::AllNamed:
        for (const SyntaxNode & child : node.named_children()) {
          get_derived().walk(child);
        }
        return;
    }
  }

  // ===========================================================================
  // Default hooks (descend)
  // ===========================================================================

#define PHP_SYNTAX_NODE(Kind, TsName, Snake) \
  bool visit_##Snake(SyntaxNode /*node*/) { return true; }
#include "php_refactor/syntax/syntax_nodes.def"

  bool visit_other(SyntaxNode /*node*/) { return true; }

private:
  bool dispatch(SyntaxNode node)
  {
    switch (node.kind()) {
#define PHP_SYNTAX_NODE(Kind, TsName, Snake) \
  case SyntaxKind::Kind:                     \
    return get_derived().visit_##Snake(node);
#include "php_refactor/syntax/syntax_nodes.def"
      case SyntaxKind::Other:
        return get_derived().visit_other(node);
    }
    return true;
  }
};

}  // namespace php_refactor
