//===----------------------------------------------------------------------===//
//
// Part of the alproxy project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements open-file and initialized-project tracking.
///
//===----------------------------------------------------------------------===//

#include "alproxy/LSP/WorkspaceState.h"

#include "llvm/ADT/ScopeExit.h"

#include <utility>

namespace alproxy::lsp
{

llvm::Error WorkspaceState::ensureFileOpen(const std::string& path, const llvm::function_ref<llvm::Error()> open)
{
    {
        std::unique_lock<std::mutex> lock(filesMutex_);
        filesCv_.wait(lock, [this, &path]() { return !openingFiles_.contains(path); });
        if (openFiles_.contains(path))
        {
            return llvm::Error::success();
        }
        openingFiles_.insert(path);
    }

    // The file is read and announced without holding the lock.
    llvm::Error error = open();
    {
        std::lock_guard<std::mutex> lock(filesMutex_);
        openingFiles_.erase(path);
        if (!error)
        {
            openFiles_.insert(path);
        }
    }
    filesCv_.notify_all();
    return error;
}

void WorkspaceState::markFileOpen(std::string path)
{
    std::lock_guard<std::mutex> lock(filesMutex_);
    openFiles_.insert(std::move(path));
}

bool WorkspaceState::isFileOpen(const std::string& path) const
{
    std::lock_guard<std::mutex> lock(filesMutex_);
    return openFiles_.contains(path);
}

std::size_t WorkspaceState::openFileCount() const
{
    std::lock_guard<std::mutex> lock(filesMutex_);
    return openFiles_.size();
}

void WorkspaceState::ensureProjectInitialized(const std::string& root, const llvm::function_ref<void()> initialize)
{
    {
        std::unique_lock<std::mutex> lock(projectsMutex_);
        projectsCv_.wait(lock, [this, &root]() { return !initializingProjects_.contains(root); });
        if (initializedProjects_.contains(root))
        {
            return;
        }
        initializingProjects_.insert(root);
    }

    auto finish = llvm::make_scope_exit([this, &root]() {
        {
            std::lock_guard<std::mutex> lock(projectsMutex_);
            initializingProjects_.erase(root);
            initializedProjects_.insert(root);
        }
        projectsCv_.notify_all();
    });
    initialize();
}

bool WorkspaceState::isProjectInitialized(const std::string& root) const
{
    std::lock_guard<std::mutex> lock(projectsMutex_);
    return initializedProjects_.contains(root);
}

std::size_t WorkspaceState::initializedProjectCount() const
{
    std::lock_guard<std::mutex> lock(projectsMutex_);
    return initializedProjects_.size();
}

}  // namespace alproxy::lsp
