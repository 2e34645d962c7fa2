// php_refactor/diagnostics/import_diagnostics.hpp - Missing-import detection
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "php_refactor/basic/diagnostic.hpp"
#include "php_refactor/index/symbol_index.hpp"
#include "php_refactor/syntax/syntax_tree.hpp"

namespace php_refactor
{

inline constexpr const char * k_missing_import_code = "missing-import";
inline constexpr const char * k_diagnostic_source = "php-refactor";

/// "Class 'X' is not imported. Add 'use' statement."
[[nodiscard]] std::string missing_import_message(std::string_view class_name);

/**
 * Class name mentioned by a missing-class message, ours or another tool's
 * ("Class 'X' ...", "Class X not found", "unknown class X").
 */
[[nodiscard]] std::optional<std::string> class_name_from_message(std::string_view message);

/**
 * Report every type reference of `tree` that is neither built in, qualified,
 * imported, nor visible from the file's own namespace.
 *
 * Each diagnostic carries one fix-it per indexed definition of the name;
 * a name with no definition gets a help note instead.
 *
 * @return number of diagnostics added
 */
size_t check_missing_imports(const SyntaxTree & tree, const SymbolIndex & index, DiagnosticBag & diags);

}  // namespace php_refactor
