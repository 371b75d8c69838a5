//===----------------------------------------------------------------------===//
//
// Part of the alproxy project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Correlation of proxy-issued server requests with their responses.
///
/// Every request the proxy sends to the language server gets a fresh id from a
/// strictly increasing counter and a single-use delivery slot. The server read
/// loop hands responses to `deliver`; the sending thread blocks in `send` until
/// its slot is filled, the timeout elapses, or the correlator is closed.
///
//===----------------------------------------------------------------------===//
#ifndef ALPROXY_LSP_REQUEST_CORRELATOR_H
#define ALPROXY_LSP_REQUEST_CORRELATOR_H

#include "alproxy/LSP/Message.h"
#include "alproxy/Support/Log.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace alproxy::lsp
{

/// @brief Writes one framed message to the server stream.
using WriteMessageFn = std::function<bool(const llvm::json::Value& message)>;

/// @brief Pending-request table keyed by proxy-issued integer ids.
class RequestCorrelator final
{
public:
    /// @brief Creates a correlator.
    /// @param[in] write Server-stream writer.
    /// @param[in] timeout Per-request response timeout.
    /// @param[in] logger Diagnostic log.
    RequestCorrelator(WriteMessageFn write, std::chrono::milliseconds timeout, Logger& logger);

    RequestCorrelator(const RequestCorrelator&)            = delete;
    RequestCorrelator& operator=(const RequestCorrelator&) = delete;

    /// @brief Sends a request and waits for its response.
    /// @param[in] method Request method.
    /// @param[in] params Request params; omitted when `null`.
    /// @return Server response payload (result or server error), or a
    /// `Transport`/`Timeout` error.
    [[nodiscard]] llvm::Expected<ResponsePayload> send(llvm::StringRef method, llvm::json::Value params);

    /// @brief Routes a server response to its waiter.
    /// @param[in] response Response message from the server.
    /// @return `true` when a waiter received the response; unknown and late
    /// ids are logged and dropped.
    bool deliver(const llvm::json::Object& response);

    /// @brief Fails every outstanding waiter and rejects later sends.
    /// @param[in] reason Message carried by the resulting transport errors.
    void failAll(llvm::StringRef reason);

    /// @brief Returns the number of requests awaiting a response.
    [[nodiscard]] std::size_t outstanding() const;

    /// @brief Returns the most recently issued id (`0` before the first send).
    [[nodiscard]] std::int64_t lastIssuedId() const;

    void setTimeout(std::chrono::milliseconds timeout);

private:
    struct PendingRequest final
    {
        std::string                    method;
        std::optional<ResponsePayload> response;
        std::optional<std::string>     failure;
    };

    WriteMessageFn                                                      write_;
    Logger&                                                             logger_;
    mutable std::mutex                                                  mutex_;
    std::condition_variable                                             cv_;
    std::unordered_map<std::int64_t, std::shared_ptr<PendingRequest>>   pending_;
    std::chrono::milliseconds                                           timeout_;
    std::int64_t                                                        nextId_{0};
    std::optional<std::string>                                          closedReason_;
};

}  // namespace alproxy::lsp

#endif  // ALPROXY_LSP_REQUEST_CORRELATOR_H
