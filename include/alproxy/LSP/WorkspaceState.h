//===----------------------------------------------------------------------===//
//
// Part of the alproxy project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Server-side document and project handshake state.
///
/// Tracks which files have had `textDocument/didOpen` sent to the language
/// server and which project roots have completed the configuration handshake.
/// Both sets only grow for the lifetime of a session.
///
//===----------------------------------------------------------------------===//
#ifndef ALPROXY_LSP_WORKSPACE_STATE_H
#define ALPROXY_LSP_WORKSPACE_STATE_H

#include "llvm/ADT/STLFunctionalExtras.h"
#include "llvm/Support/Error.h"

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_set>

namespace alproxy::lsp
{

/// @brief Open-file and initialized-project sets keyed by normalized path.
class WorkspaceState final
{
public:
    /// @brief Runs `open` unless the file is already open, then marks it open.
    ///
    /// Concurrent callers for the same path wait for the in-flight `open`
    /// instead of sending a second `didOpen`. No lock is held while `open`
    /// runs. A caller that finds the previous attempt failed retries it.
    ///
    /// @param[in] path Normalized absolute path.
    /// @param[in] open Action that reads the file and notifies the server.
    /// @return Success, or the error from `open` (the file stays unmarked).
    [[nodiscard]] llvm::Error ensureFileOpen(const std::string& path, llvm::function_ref<llvm::Error()> open);

    /// @brief Records a file the client opened itself.
    void markFileOpen(std::string path);

    [[nodiscard]] bool        isFileOpen(const std::string& path) const;
    [[nodiscard]] std::size_t openFileCount() const;

    /// @brief Runs `initialize` once per project root.
    ///
    /// A caller arriving while another thread initializes the same root waits
    /// for that initialization to finish instead of repeating it.
    ///
    /// @param[in] root Normalized project root.
    /// @param[in] initialize Best-effort handshake; always marks the root afterwards.
    void ensureProjectInitialized(const std::string& root, llvm::function_ref<void()> initialize);

    [[nodiscard]] bool        isProjectInitialized(const std::string& root) const;
    [[nodiscard]] std::size_t initializedProjectCount() const;

private:
    mutable std::mutex              filesMutex_;
    std::condition_variable         filesCv_;
    std::unordered_set<std::string> openFiles_;
    std::unordered_set<std::string> openingFiles_;

    mutable std::mutex              projectsMutex_;
    std::condition_variable         projectsCv_;
    std::unordered_set<std::string> initializedProjects_;
    std::unordered_set<std::string> initializingProjects_;
};

}  // namespace alproxy::lsp

#endif  // ALPROXY_LSP_WORKSPACE_STATE_H
