//===----------------------------------------------------------------------===//
//
// Part of the alproxy project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Symbol-name heuristics used by the definition and workspace-symbol handlers.
///
//===----------------------------------------------------------------------===//
#ifndef ALPROXY_LSP_SYMBOL_MATCHING_H
#define ALPROXY_LSP_SYMBOL_MATCHING_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/JSON.h"

#include <optional>
#include <string>

namespace alproxy::lsp
{

/// @brief Returns whether a definition result is `null` or an empty array.
[[nodiscard]] bool isEmptyDefinitionResult(const llvm::json::Value& result);

/// @brief Returns the text of a hover result's `contents`.
///
/// Accepts `MarkupContent`, a plain string, a `MarkedString` object, or an
/// array of the latter two (joined by newlines).
[[nodiscard]] std::string hoverContentText(const llvm::json::Value& hover);

/// @brief Extracts an AL symbol name from hover markup.
///
/// Patterns are tried in order: procedure, trigger, field, variable, then the
/// first identifier. Surrounding double quotes are removed.
///
/// @param[in] content Hover text.
/// @return Symbol name, or `std::nullopt` when nothing matched.
[[nodiscard]] std::optional<std::string> extractSymbolFromHoverText(llvm::StringRef content);

/// @brief Strips a trailing parameter list: `Foo(Bar: Integer)` becomes `Foo`.
[[nodiscard]] std::string cleanSymbolName(llvm::StringRef name);

/// @brief Searches a `textDocument/documentSymbol` result for a symbol.
///
/// Hierarchical `DocumentSymbol[]` entries are searched depth first (children
/// after their parent) and yield `{uri, range: selectionRange}`. Flat
/// `SymbolInformation[]` entries yield their own `location`. Names compare
/// case-insensitively, raw or with the parameter list stripped.
///
/// @param[in] symbols Document-symbol result.
/// @param[in] name Symbol name to find.
/// @param[in] documentUri URI used for hierarchical matches.
/// @return Location object, or `std::nullopt`.
[[nodiscard]] std::optional<llvm::json::Value> findSymbolLocation(const llvm::json::Value& symbols,
                                                                  llvm::StringRef          name,
                                                                  llvm::StringRef          documentUri);

/// @brief Returns whether a workspace-symbol query looks like a file path.
[[nodiscard]] bool looksLikeFilePath(llvm::StringRef query);

/// @brief Reduces a file-path query to a symbol name.
///
/// `src/Tab18.Customer.dal` becomes `Customer` and
/// `src/Table 6175301 CDO File.al` becomes `CDO File`.
[[nodiscard]] std::string extractSymbolFromQuery(llvm::StringRef query);

}  // namespace alproxy::lsp

#endif  // ALPROXY_LSP_SYMBOL_MATCHING_H
