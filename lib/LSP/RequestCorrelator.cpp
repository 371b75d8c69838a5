//===----------------------------------------------------------------------===//
//
// Part of the alproxy project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements request/response correlation for server-bound requests.
///
//===----------------------------------------------------------------------===//

#include "alproxy/LSP/RequestCorrelator.h"

#include "alproxy/Support/Error.h"
#include "llvm/Support/FormatVariadic.h"

#include <utility>

namespace alproxy::lsp
{

RequestCorrelator::RequestCorrelator(WriteMessageFn write, const std::chrono::milliseconds timeout, Logger& logger)
    : write_(std::move(write))
    , logger_(logger)
    , timeout_(timeout)
{
}

llvm::Expected<ResponsePayload> RequestCorrelator::send(const llvm::StringRef method, llvm::json::Value params)
{
    auto                      pending = std::make_shared<PendingRequest>();
    std::int64_t              id      = 0;
    std::chrono::milliseconds timeout{0};
    pending->method = method.str();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closedReason_)
        {
            return makeProxyError(ErrorKind::Transport,
                                  "cannot send " + method + ": " + llvm::StringRef(*closedReason_));
        }
        id = ++nextId_;
        pending_.emplace(id, pending);
        timeout = timeout_;
    }

    logger_.verbose(llvm::formatv("-> server request {0} id={1}", method, id));
    if (!write_(makeRequest(id, method, std::move(params))))
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.erase(id);
        return makeProxyError(ErrorKind::Transport, "failed to write " + method + " request to language server");
    }

    std::unique_lock<std::mutex> lock(mutex_);
    const auto                   deadline = std::chrono::steady_clock::now() + timeout;
    const bool                   resolved = cv_.wait_until(lock, deadline, [&pending]() {
        return pending->response.has_value() || pending->failure.has_value();
    });
    if (!resolved)
    {
        pending_.erase(id);
        return makeProxyError(ErrorKind::Timeout, "timeout waiting for response to " + method);
    }
    if (pending->failure)
    {
        return makeProxyError(ErrorKind::Transport, "request " + method + " failed: " + *pending->failure);
    }
    return std::move(*pending->response);
}

bool RequestCorrelator::deliver(const llvm::json::Object& response)
{
    const auto* idValue = messageId(response);
    if (!idValue || !idValue->getAsInteger())
    {
        logger_.info("dropping server response with a foreign id");
        return false;
    }
    const std::int64_t id = *idValue->getAsInteger();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto                  it = pending_.find(id);
        if (it != pending_.end())
        {
            logger_.verbose(llvm::formatv("<- server response {0} id={1}", it->second->method, id));
            it->second->response = responsePayloadFromMessage(response);
            pending_.erase(it);
            cv_.notify_all();
            return true;
        }
    }

    logger_.info(llvm::formatv("dropping late or unknown server response id={0}", id));
    return false;
}

void RequestCorrelator::failAll(const llvm::StringRef reason)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!closedReason_)
    {
        closedReason_ = reason.str();
    }
    for (auto& [_, pending] : pending_)
    {
        pending->failure = reason.str();
    }
    pending_.clear();
    cv_.notify_all();
}

std::size_t RequestCorrelator::outstanding() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

std::int64_t RequestCorrelator::lastIssuedId() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return nextId_;
}

void RequestCorrelator::setTimeout(const std::chrono::milliseconds timeout)
{
    std::lock_guard<std::mutex> lock(mutex_);
    timeout_ = timeout;
}

}  // namespace alproxy::lsp
