//===----------------------------------------------------------------------===//
//
// Part of the alproxy project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Worker-pool scheduler for client requests with queued-request cancellation.
///
/// Client requests run here so a handler blocked on the language server never
/// stalls the client read loop. A request can be cancelled while it is still
/// queued; once a worker picks it up it runs to completion.
///
//===----------------------------------------------------------------------===//
#ifndef ALPROXY_LSP_REQUEST_SCHEDULER_H
#define ALPROXY_LSP_REQUEST_SCHEDULER_H

#include "alproxy/LSP/Message.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace alproxy::lsp
{

/// @brief Status outcome of a scheduled request task.
enum class RequestTaskStatus
{
    /// @brief Task ran and produced a payload.
    Completed,

    /// @brief Task was cancelled before it started.
    Cancelled,

    /// @brief Task threw; `errorMessage` carries the reason.
    Failed,
};

/// @brief Result envelope for scheduled request work.
struct RequestTaskResult final
{
    /// @brief Task outcome status.
    RequestTaskStatus status{RequestTaskStatus::Failed};

    /// @brief Response payload when completed.
    ResponsePayload payload;

    /// @brief Error message when failed.
    std::string errorMessage;
};

/// @brief Unit of scheduled request work.
using RequestTask = std::function<ResponsePayload()>;

/// @brief Completion callback invoked exactly once per accepted task.
using RequestCompletion = std::function<void(RequestTaskResult result, std::uint64_t latencyMicros)>;

/// @brief Fixed-size worker pool for client requests.
class RequestScheduler final
{
public:
    /// @brief Default number of worker threads.
    static constexpr std::size_t DefaultWorkerCount = 4U;

    /// @brief Starts the workers.
    /// @param[in] workerCount Number of worker threads (at least one is started).
    explicit RequestScheduler(std::size_t workerCount = DefaultWorkerCount);
    ~RequestScheduler();

    RequestScheduler(const RequestScheduler&)            = delete;
    RequestScheduler& operator=(const RequestScheduler&) = delete;

    /// @brief Enqueues request work for execution.
    /// @param[in] requestKey Stable request key (serialized client id).
    /// @param[in] method Request method name for tracing.
    /// @param[in] task Request task body.
    /// @param[in] completion Completion callback invoked once.
    /// @return `true` when queued; `false` after shutdown or for a duplicate key.
    [[nodiscard]] bool enqueue(std::string requestKey,
                               std::string method,
                               RequestTask task,
                               RequestCompletion completion);

    /// @brief Cancels a request that has not started yet.
    /// @param[in] requestKey Stable request key.
    /// @return `true` when a matching queued request was marked cancelled.
    [[nodiscard]] bool cancel(const std::string& requestKey);

    /// @brief Completes queued requests as cancelled and joins the workers.
    void shutdown();

    /// @brief Returns the number of worker threads.
    [[nodiscard]] std::size_t workerCount() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace alproxy::lsp

#endif  // ALPROXY_LSP_REQUEST_SCHEDULER_H
