//===----------------------------------------------------------------------===//
//
// Part of the alproxy project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// AL project discovery and server handshake payloads.
///
/// An AL project root is the nearest ancestor directory holding the `app.json`
/// manifest. The payload builders produce the exact shapes the AL language
/// server expects for its workspace configuration and initialization.
///
//===----------------------------------------------------------------------===//
#ifndef ALPROXY_LSP_PROJECT_H
#define ALPROXY_LSP_PROJECT_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/JSON.h"

#include <cstdint>
#include <optional>
#include <string>

namespace alproxy::lsp
{

/// @brief Default project manifest file name.
inline constexpr const char* DefaultManifestName = "app.json";

/// @brief Default number of directories searched for the manifest.
inline constexpr unsigned DefaultManifestSearchDepth = 5U;

/// @brief Searches `startDirectory` and its ancestors for the manifest.
/// @param[in] startDirectory First directory examined.
/// @param[in] manifestName Manifest file name.
/// @param[in] maxDepth Number of directories examined, including the start.
/// @return Manifest path, or `std::nullopt` when none is found.
[[nodiscard]] std::optional<std::string> findManifest(llvm::StringRef startDirectory,
                                                      llvm::StringRef manifestName = DefaultManifestName,
                                                      unsigned        maxDepth     = DefaultManifestSearchDepth);

/// @brief Returns the project root containing a file.
/// @param[in] filePath Path of a source file; the search starts at its directory.
/// @param[in] manifestName Manifest file name.
/// @param[in] maxDepth Number of directories examined.
/// @return Normalized project root, or `std::nullopt` when the file has no project.
[[nodiscard]] std::optional<std::string> findProjectRoot(llvm::StringRef filePath,
                                                         llvm::StringRef manifestName = DefaultManifestName,
                                                         unsigned        maxDepth     = DefaultManifestSearchDepth);

/// @brief Returns the language id the server expects for a file.
/// @return `json` for `.json` files, `al` otherwise.
[[nodiscard]] llvm::StringRef languageIdForPath(llvm::StringRef path);

/// @brief Builds the AL workspace settings object for a project root.
[[nodiscard]] llvm::json::Object makeWorkspaceSettings(llvm::StringRef projectRoot);

/// @brief Builds `workspace/didChangeConfiguration` params for a project root.
[[nodiscard]] llvm::json::Value makeDidChangeConfigurationParams(llvm::StringRef projectRoot);

/// @brief Builds `al/setActiveWorkspace` params for a project root.
[[nodiscard]] llvm::json::Value makeActiveWorkspaceParams(llvm::StringRef projectRoot);

/// @brief Builds `textDocument/didOpen` params (version 1).
[[nodiscard]] llvm::json::Value makeDidOpenParams(llvm::StringRef path, llvm::StringRef text);

/// @brief Builds the `initialize` params sent to the AL server.
/// @param[in] workspaceRoot Directory announced as root and sole workspace folder.
/// @param[in] processId Proxy process id.
[[nodiscard]] llvm::json::Value makeServerInitializeParams(llvm::StringRef workspaceRoot, std::int64_t processId);

/// @brief Extracts the workspace root from client `initialize` params.
///
/// Tries `rootUri`, then `rootPath`, then the first `workspaceFolders` entry.
///
/// @return Local path, or `std::nullopt` when the client sent none.
[[nodiscard]] std::optional<std::string> workspaceRootFromInitialize(const llvm::json::Value* params);

}  // namespace alproxy::lsp

#endif  // ALPROXY_LSP_PROJECT_H
