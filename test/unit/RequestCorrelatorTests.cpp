//===----------------------------------------------------------------------===//
//
// Part of the alproxy project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

#include "alproxy/LSP/RequestCorrelator.h"
#include "alproxy/Support/Error.h"
#include "alproxy/Support/Log.h"
#include "llvm/Support/raw_ostream.h"

namespace
{

/// Records requests written by the correlator.
class WrittenRequests final
{
public:
    bool push(const llvm::json::Value& message)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            messages_.push_back(message);
        }
        cv_.notify_all();
        return true;
    }

    std::optional<llvm::json::Object> waitFor(const std::size_t count)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, std::chrono::seconds(3), [this, count]() { return messages_.size() >= count; }))
        {
            return std::nullopt;
        }
        const auto* object = messages_[count - 1U].getAsObject();
        if (!object)
        {
            return std::nullopt;
        }
        return *object;
    }

private:
    std::mutex                     mutex_;
    std::condition_variable        cv_;
    std::vector<llvm::json::Value> messages_;
};

}  // namespace

bool runRequestCorrelatorTests()
{
    alproxy::Logger logger(llvm::nulls(), alproxy::TraceLevel::Verbose);

    {
        WrittenRequests                  written;
        alproxy::lsp::RequestCorrelator correlator(
            [&written](const llvm::json::Value& message) { return written.push(message); },
            std::chrono::seconds(3),
            logger);

        std::thread responder([&written, &correlator]() {
            // Answer the two requests in reverse order.
            const auto first  = written.waitFor(1U);
            const auto second = written.waitFor(2U);
            if (!first || !second)
            {
                return;
            }
            const auto secondId = second->getInteger("id");
            const auto firstId  = first->getInteger("id");
            if (!secondId || !firstId)
            {
                return;
            }
            (void) correlator.deliver(
                llvm::json::Object{{"jsonrpc", "2.0"}, {"id", *secondId}, {"result", llvm::json::Array{"second"}}});
            (void) correlator.deliver(
                llvm::json::Object{{"jsonrpc", "2.0"}, {"id", *firstId}, {"result", llvm::json::Array{"first"}}});
        });

        llvm::Expected<alproxy::lsp::ResponsePayload> secondResult(alproxy::lsp::ResponsePayload{});
        std::thread                                   secondSender([&correlator, &written, &secondResult]() {
            // Issue the second request only after the first one is on the wire.
            if (written.waitFor(1U))
            {
                secondResult = correlator.send("textDocument/hover", llvm::json::Object{});
            }
        });
        auto firstResult = correlator.send("al/gotodefinition", llvm::json::Object{});
        secondSender.join();
        responder.join();

        if (!firstResult || !secondResult)
        {
            if (!firstResult)
            {
                llvm::consumeError(firstResult.takeError());
            }
            if (!secondResult)
            {
                llvm::consumeError(secondResult.takeError());
            }
            std::cerr << "expected both correlated requests to resolve\n";
            return false;
        }
        const auto* firstArray  = firstResult->result.getAsArray();
        const auto* secondArray = secondResult->result.getAsArray();
        if (!firstArray || !secondArray || firstArray->size() != 1U || secondArray->size() != 1U ||
            (*firstArray)[0].getAsString() != llvm::StringRef("first") ||
            (*secondArray)[0].getAsString() != llvm::StringRef("second"))
        {
            std::cerr << "out-of-order responses were routed to the wrong waiter\n";
            return false;
        }
        if (correlator.outstanding() != 0U || correlator.lastIssuedId() != 2)
        {
            std::cerr << "expected an empty pending table after both responses\n";
            return false;
        }

        if (correlator.deliver(llvm::json::Object{{"jsonrpc", "2.0"}, {"id", 1}, {"result", nullptr}}))
        {
            std::cerr << "late response for a resolved id must be dropped\n";
            return false;
        }
        if (correlator.deliver(llvm::json::Object{{"jsonrpc", "2.0"}, {"id", "client-7"}, {"result", nullptr}}))
        {
            std::cerr << "responses with foreign ids must be dropped\n";
            return false;
        }
    }

    {
        WrittenRequests                  written;
        alproxy::lsp::RequestCorrelator correlator(
            [&written](const llvm::json::Value& message) { return written.push(message); },
            std::chrono::milliseconds(50),
            logger);
        auto result = correlator.send("al/hasProjectClosureLoadedRequest", nullptr);
        if (result)
        {
            std::cerr << "expected timeout without a response\n";
            return false;
        }
        const alproxy::ErrorSummary summary = alproxy::takeErrorSummary(result.takeError());
        if (summary.kind != alproxy::ErrorKind::Timeout ||
            summary.message.find("al/hasProjectClosureLoadedRequest") == std::string::npos)
        {
            std::cerr << "unexpected timeout error: " << summary.message << "\n";
            return false;
        }
        if (correlator.outstanding() != 0U)
        {
            std::cerr << "timed-out request must leave the pending table\n";
            return false;
        }
    }

    {
        WrittenRequests                  written;
        alproxy::lsp::RequestCorrelator correlator(
            [&written](const llvm::json::Value& message) { return written.push(message); },
            std::chrono::seconds(5),
            logger);
        std::thread closer([&written, &correlator]() {
            if (written.waitFor(1U))
            {
                correlator.failAll("language server connection closed");
            }
        });
        auto result = correlator.send("workspace/symbol", llvm::json::Object{{"query", "Customer"}});
        closer.join();
        if (result)
        {
            std::cerr << "expected transport failure after failAll\n";
            return false;
        }
        const alproxy::ErrorSummary summary = alproxy::takeErrorSummary(result.takeError());
        if (summary.kind != alproxy::ErrorKind::Transport)
        {
            std::cerr << "expected transport error kind after failAll\n";
            return false;
        }

        auto afterClose = correlator.send("workspace/symbol", llvm::json::Object{{"query", "Vendor"}});
        if (afterClose)
        {
            std::cerr << "sends after failAll must fail fast\n";
            return false;
        }
        llvm::consumeError(afterClose.takeError());
    }

    {
        alproxy::lsp::RequestCorrelator correlator([](const llvm::json::Value&) { return false; },
                                                   std::chrono::seconds(5),
                                                   logger);
        auto result = correlator.send("shutdown", nullptr);
        if (result)
        {
            std::cerr << "expected write failure to surface as an error\n";
            return false;
        }
        llvm::consumeError(result.takeError());
        if (correlator.outstanding() != 0U)
        {
            std::cerr << "failed write must not leave a pending entry\n";
            return false;
        }
    }

    return true;
}
