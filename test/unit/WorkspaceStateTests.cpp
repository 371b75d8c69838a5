//===----------------------------------------------------------------------===//
//
// Part of the alproxy project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

#include "alproxy/LSP/WorkspaceState.h"
#include "alproxy/Support/Error.h"

bool runWorkspaceStateTests()
{
    {
        alproxy::lsp::WorkspaceState state;
        std::atomic<int>             opens{0};
        std::vector<std::thread>     threads;
        for (int i = 0; i < 8; ++i)
        {
            threads.emplace_back([&state, &opens]() {
                llvm::Error error = state.ensureFileOpen("/proj/src/Customer.Table.al", [&opens]() {
                    std::this_thread::sleep_for(std::chrono::milliseconds(5));
                    ++opens;
                    return llvm::Error::success();
                });
                llvm::consumeError(std::move(error));
            });
        }
        for (auto& thread : threads)
        {
            thread.join();
        }
        if (opens.load() != 1)
        {
            std::cerr << "expected exactly one didOpen for concurrent callers, got " << opens.load() << "\n";
            return false;
        }
        if (!state.isFileOpen("/proj/src/Customer.Table.al") || state.openFileCount() != 1U)
        {
            std::cerr << "expected file to be marked open\n";
            return false;
        }
    }

    {
        alproxy::lsp::WorkspaceState state;
        llvm::Error                  error = state.ensureFileOpen("/proj/missing.al", []() {
            return alproxy::makeProxyError(alproxy::ErrorKind::Io, "failed to read /proj/missing.al");
        });
        if (!error)
        {
            std::cerr << "expected open failure to propagate\n";
            return false;
        }
        llvm::consumeError(std::move(error));
        if (state.isFileOpen("/proj/missing.al"))
        {
            std::cerr << "failed open must not mark the file\n";
            return false;
        }

        state.markFileOpen("/proj/src/Vendor.Table.al");
        bool reopened = false;
        llvm::Error again = state.ensureFileOpen("/proj/src/Vendor.Table.al", [&reopened]() {
            reopened = true;
            return llvm::Error::success();
        });
        if (again || reopened)
        {
            llvm::consumeError(std::move(again));
            std::cerr << "client-opened files must not be reopened\n";
            return false;
        }
    }

    {
        // A slow open must not block bookkeeping for other documents.
        alproxy::lsp::WorkspaceState state;
        std::mutex                   gateMutex;
        std::condition_variable      gateCv;
        bool                         openStarted = false;
        bool                         releaseOpen = false;

        std::thread opener([&]() {
            llvm::Error error = state.ensureFileOpen("/proj/src/Slow.Codeunit.al", [&]() {
                std::unique_lock<std::mutex> lock(gateMutex);
                openStarted = true;
                gateCv.notify_all();
                gateCv.wait_for(lock, std::chrono::seconds(5), [&releaseOpen]() { return releaseOpen; });
                return llvm::Error::success();
            });
            llvm::consumeError(std::move(error));
        });
        {
            std::unique_lock<std::mutex> lock(gateMutex);
            gateCv.wait_for(lock, std::chrono::seconds(5), [&openStarted]() { return openStarted; });
        }

        std::atomic<bool> marked{false};
        std::thread       marker([&state, &marked]() {
            state.markFileOpen("/proj/src/Item.Table.al");
            marked = true;
        });
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (!marked.load() && std::chrono::steady_clock::now() < deadline)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        const bool markedWhileOpening = marked.load() && !state.isFileOpen("/proj/src/Slow.Codeunit.al");

        {
            std::lock_guard<std::mutex> lock(gateMutex);
            releaseOpen = true;
        }
        gateCv.notify_all();
        opener.join();
        marker.join();

        if (!markedWhileOpening)
        {
            std::cerr << "markFileOpen must not wait for an in-flight open of another file\n";
            return false;
        }
        if (!state.isFileOpen("/proj/src/Slow.Codeunit.al") || !state.isFileOpen("/proj/src/Item.Table.al"))
        {
            std::cerr << "expected both files to be marked open\n";
            return false;
        }
    }

    {
        alproxy::lsp::WorkspaceState state;
        std::atomic<int>             runs{0};
        std::atomic<int>             finishedBeforeReturn{0};
        std::vector<std::thread>     threads;
        for (int i = 0; i < 4; ++i)
        {
            threads.emplace_back([&state, &runs, &finishedBeforeReturn]() {
                state.ensureProjectInitialized("/proj", [&runs]() {
                    std::this_thread::sleep_for(std::chrono::milliseconds(30));
                    ++runs;
                });
                // Every caller returns only after the handshake completed.
                if (runs.load() == 1)
                {
                    ++finishedBeforeReturn;
                }
            });
        }
        for (auto& thread : threads)
        {
            thread.join();
        }
        if (runs.load() != 1 || finishedBeforeReturn.load() != 4)
        {
            std::cerr << "expected a single project initialization observed by every caller\n";
            return false;
        }
        if (!state.isProjectInitialized("/proj") || state.initializedProjectCount() != 1U)
        {
            std::cerr << "expected project root to be marked initialized\n";
            return false;
        }

        state.ensureProjectInitialized("/other", []() {});
        if (state.initializedProjectCount() != 2U)
        {
            std::cerr << "expected distinct roots to initialize independently\n";
            return false;
        }
    }

    return true;
}
