// php_refactor/syntax/ts_ll.cpp - Low-level Tree-sitter wrapper implementation
#include "php_refactor/syntax/ts_ll.hpp"

#include <stdexcept>

namespace php_refactor::ts_ll
{

Parser::Parser()
{
  parser_ = ts_parser_new();
  if (parser_ == nullptr) {
    throw std::runtime_error("ts_parser_new() failed");
  }

  const TSLanguage * lang = tree_sitter_php();
  if (lang == nullptr || !ts_parser_set_language(parser_, lang)) {
    // Version mismatch between the runtime and the grammar library.
    ts_parser_delete(parser_);
    parser_ = nullptr;
    throw std::runtime_error("ts_parser_set_language() failed for tree-sitter-php");
  }
}

Parser::~Parser()
{
  if (parser_) ts_parser_delete(parser_);
  parser_ = nullptr;
}

TSTree * Parser::parse_string(std::string_view source) const
{
  // Tree-sitter consumes bytes; the grammar expects UTF-8.
  return ts_parser_parse_string(
    parser_, /*old_tree*/ nullptr, source.data(), static_cast<uint32_t>(source.size()));
}

}  // namespace php_refactor::ts_ll
