// php_refactor/syntax/ts_ll.hpp - Low-level Tree-sitter wrapper (CST access)
#pragma once

#include <tree_sitter/api.h>

#include <cstdint>
#include <string_view>

#include "php_refactor/basic/source_manager.hpp"

// NOTE: The language entry point comes from the installed tree-sitter-php
// library (see CMakeLists.txt). The "php" grammar accepts text outside
// <?php tags as HTML.
extern "C" const TSLanguage * tree_sitter_php();

namespace php_refactor::ts_ll
{

//------------------------------------------------------------------------------
// Node - thin wrapper around TSNode
//------------------------------------------------------------------------------
class Node
{
public:
  Node() : node_{} {}
  explicit Node(TSNode n) : node_(n) {}

  [[nodiscard]] bool is_null() const noexcept { return ts_node_is_null(node_); }
  [[nodiscard]] bool is_named() const noexcept { return ts_node_is_named(node_); }
  [[nodiscard]] bool has_error() const noexcept { return ts_node_has_error(node_); }
  [[nodiscard]] bool is_error() const noexcept { return ts_node_is_error(node_); }
  [[nodiscard]] bool is_missing() const noexcept { return ts_node_is_missing(node_); }

  [[nodiscard]] std::string_view kind() const noexcept
  {
    const char * t = ts_node_type(node_);
    return t ? std::string_view(t) : std::string_view();
  }

  [[nodiscard]] uint32_t start_byte() const noexcept { return ts_node_start_byte(node_); }
  [[nodiscard]] uint32_t end_byte() const noexcept { return ts_node_end_byte(node_); }

  [[nodiscard]] SourceRange range() const noexcept { return {start_byte(), end_byte()}; }

  [[nodiscard]] std::string_view text(std::string_view source) const noexcept
  {
    const uint32_t s = start_byte();
    const uint32_t e = end_byte();
    if (is_null() || s > source.size() || e > source.size() || e < s) {
      return {};
    }
    return source.substr(s, e - s);
  }

  [[nodiscard]] uint32_t child_count() const noexcept { return ts_node_child_count(node_); }
  [[nodiscard]] uint32_t named_child_count() const noexcept
  {
    return ts_node_named_child_count(node_);
  }

  [[nodiscard]] Node child(uint32_t i) const noexcept { return Node(ts_node_child(node_, i)); }
  [[nodiscard]] Node named_child(uint32_t i) const noexcept
  {
    return Node(ts_node_named_child(node_, i));
  }

  [[nodiscard]] Node child_by_field(std::string_view field) const noexcept
  {
    return Node(
      ts_node_child_by_field_name(node_, field.data(), static_cast<uint32_t>(field.size())));
  }

  [[nodiscard]] Node parent() const noexcept { return Node(ts_node_parent(node_)); }

  [[nodiscard]] Node next_named_sibling() const noexcept
  {
    return Node(ts_node_next_named_sibling(node_));
  }

  /// Smallest named node spanning [start, end)
  [[nodiscard]] Node named_descendant_for_range(uint32_t start, uint32_t end) const noexcept
  {
    return Node(ts_node_named_descendant_for_byte_range(node_, start, end));
  }

  [[nodiscard]] bool operator==(const Node & other) const noexcept
  {
    return ts_node_eq(node_, other.node_);
  }
  [[nodiscard]] bool operator!=(const Node & other) const noexcept { return !(*this == other); }

  [[nodiscard]] TSNode raw() const noexcept { return node_; }

private:
  TSNode node_;
};

//------------------------------------------------------------------------------
// Cursor - wrapper around TSTreeCursor (named/un-named iteration)
//------------------------------------------------------------------------------
class Cursor
{
public:
  explicit Cursor(Node n) : cursor_(ts_tree_cursor_new(n.raw())) {}
  Cursor(const Cursor &) = delete;
  Cursor & operator=(const Cursor &) = delete;

  Cursor(Cursor && other) noexcept : cursor_(other.cursor_) { other.cursor_ = {}; }
  Cursor & operator=(Cursor && other) noexcept
  {
    if (this != &other) {
      ts_tree_cursor_delete(&cursor_);
      cursor_ = other.cursor_;
      other.cursor_ = {};
    }
    return *this;
  }

  ~Cursor() { ts_tree_cursor_delete(&cursor_); }

  [[nodiscard]] Node current_node() const noexcept
  {
    return Node(ts_tree_cursor_current_node(&cursor_));
  }

  /// Field name of the current node within its parent, empty when none
  [[nodiscard]] std::string_view current_field_name() const noexcept
  {
    const char * f = ts_tree_cursor_current_field_name(&cursor_);
    return f ? std::string_view(f) : std::string_view();
  }

  [[nodiscard]] bool goto_first_child() noexcept
  {
    return ts_tree_cursor_goto_first_child(&cursor_);
  }
  [[nodiscard]] bool goto_next_sibling() noexcept
  {
    return ts_tree_cursor_goto_next_sibling(&cursor_);
  }
  [[nodiscard]] bool goto_parent() noexcept { return ts_tree_cursor_goto_parent(&cursor_); }

private:
  TSTreeCursor cursor_;
};

//------------------------------------------------------------------------------
// Parser/Tree - RAII wrappers
//------------------------------------------------------------------------------
class Parser
{
public:
  /// Throws std::runtime_error when the PHP grammar cannot be loaded.
  Parser();
  Parser(const Parser &) = delete;
  Parser & operator=(const Parser &) = delete;
  ~Parser();

  [[nodiscard]] TSTree * parse_string(std::string_view source) const;

private:
  TSParser * parser_ = nullptr;
};

class Tree
{
public:
  explicit Tree(TSTree * t = nullptr) : tree_(t) {}
  Tree(const Tree &) = delete;
  Tree & operator=(const Tree &) = delete;

  Tree(Tree && other) noexcept : tree_(other.tree_) { other.tree_ = nullptr; }
  Tree & operator=(Tree && other) noexcept
  {
    if (this != &other) {
      reset();
      tree_ = other.tree_;
      other.tree_ = nullptr;
    }
    return *this;
  }

  ~Tree() { reset(); }

  void reset(TSTree * t = nullptr)
  {
    if (tree_) ts_tree_delete(tree_);
    tree_ = t;
  }

  [[nodiscard]] bool is_null() const noexcept { return tree_ == nullptr; }

  [[nodiscard]] Node root_node() const noexcept
  {
    return tree_ ? Node(ts_tree_root_node(tree_)) : Node();
  }

private:
  TSTree * tree_ = nullptr;
};

}  // namespace php_refactor::ts_ll
