//===----------------------------------------------------------------------===//
//
// Part of the alproxy project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Proxy session coordinating the client and language-server connections.
///
/// A session owns the two read loops, the pending-request table, the
/// workspace handshake state, and the client-request scheduler. Lifecycle
/// methods are handled inline on the client loop; every other client request
/// runs on the scheduler through the handler set.
///
//===----------------------------------------------------------------------===//
#ifndef ALPROXY_LSP_PROXY_SESSION_H
#define ALPROXY_LSP_PROXY_SESSION_H

#include "alproxy/LSP/Handlers.h"
#include "alproxy/LSP/JsonRpcIO.h"
#include "alproxy/LSP/Message.h"
#include "alproxy/LSP/ProxyConfig.h"
#include "alproxy/LSP/RequestCorrelator.h"
#include "alproxy/LSP/RequestScheduler.h"
#include "alproxy/LSP/Telemetry.h"
#include "alproxy/LSP/WorkspaceState.h"
#include "alproxy/Support/Log.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace alproxy::lsp
{

/// @brief Lifecycle state of a proxy session.
enum class SessionState
{
    Uninitialized,
    Initializing,
    Ready,
    ShuttingDown,
    Closed,
};

/// @brief Returns a stable state name for logs.
[[nodiscard]] llvm::StringRef sessionStateName(SessionState state);

/// @brief Proxy between one LSP client and one AL language server.
class ProxySession final : public HandlerContext
{
public:
    /// @brief Best-effort release of the language-server process.
    using ReleaseServerFn = std::function<void()>;

    /// @brief Ends a client read that is still blocked when the session stops.
    using ReleaseClientFn = std::function<void()>;

    /// @brief Creates a session over two connected transports.
    /// @param[in] client Transport to the LSP client.
    /// @param[in] server Transport to the language server.
    /// @param[in] config Session configuration.
    /// @param[in] logger Diagnostic log.
    /// @param[in] releaseServer Called once when the session ends.
    /// @param[in] releaseClient Called when the server side ended first so the
    ///            client loop stops reading; without it `run()` waits for the
    ///            client stream to close.
    /// @param[in] metricSink Optional telemetry sample sink.
    ProxySession(JsonRpcStreamTransport& client,
                 JsonRpcStreamTransport& server,
                 ProxyConfig             config,
                 Logger&                 logger,
                 ReleaseServerFn         releaseServer = {},
                 ReleaseClientFn         releaseClient = {},
                 RequestMetricSink       metricSink    = {});
    ~ProxySession() override;

    ProxySession(const ProxySession&)            = delete;
    ProxySession& operator=(const ProxySession&) = delete;

    /// @brief Runs both read loops until either stream ends or `exit` arrives.
    /// @return Process exit code (`0` after `shutdown`, otherwise `1`).
    [[nodiscard]] int run();

    /// @brief Handles one message read from the client.
    void handleClientMessage(const llvm::json::Value& message);

    /// @brief Handles one message read from the language server.
    void handleServerMessage(const llvm::json::Value& message);

    /// @brief Fails outstanding server requests, drains the scheduler, and
    /// releases the server. Idempotent.
    void stop();

    [[nodiscard]] SessionState state() const;

    /// @brief Returns whether an `exit` notification was observed.
    [[nodiscard]] bool shouldExit() const;

    /// @brief Returns the LSP-conformant process exit code.
    [[nodiscard]] int exitCode() const;

    /// @brief Returns the workspace root announced by the client.
    [[nodiscard]] std::optional<std::string> workspaceRoot() const;

    /// @brief Returns the AL project root detected at `initialize`.
    [[nodiscard]] std::optional<std::string> projectRoot() const;

    [[nodiscard]] const Telemetry& telemetry() const
    {
        return telemetry_;
    }

    [[nodiscard]] const WorkspaceState& workspace() const
    {
        return workspace_;
    }

    [[nodiscard]] const RequestCorrelator& correlator() const
    {
        return correlator_;
    }

    // HandlerContext
    [[nodiscard]] llvm::Error                     ensureFileOpened(llvm::StringRef path) override;
    [[nodiscard]] llvm::Error                     ensureProjectInitialized(llvm::StringRef path) override;
    [[nodiscard]] llvm::Error                     ensureWorkspaceProjectInitialized() override;
    [[nodiscard]] llvm::Expected<ResponsePayload> sendRequest(llvm::StringRef   method,
                                                              llvm::json::Value params) override;
    [[nodiscard]] llvm::Error sendNotification(llvm::StringRef method, llvm::json::Value params) override;
    void                      recordFallback(llvm::StringRef method) override;
    Logger&                   logger() override;

private:
    void clientLoop();
    void serverLoop();
    void markLoopFinished(bool clientLoop);

    void handleClientRequest(const llvm::json::Object& message, llvm::StringRef method, const llvm::json::Value& id);
    void handleClientNotification(const llvm::json::Object& message, llvm::StringRef method);
    void handleInitialize(const llvm::json::Value& id, const llvm::json::Value* params);
    void handleShutdown(const llvm::json::Value& id);
    void scheduleRequest(llvm::StringRef method, const llvm::json::Value& id, llvm::json::Value params);

    void initializeProject(const std::string& root);
    void waitForProjectLoad();
    [[nodiscard]] bool sleepUnlessStopping(std::chrono::milliseconds duration);

    void               writeClient(const llvm::json::Value& message);
    [[nodiscard]] bool writeServer(const llvm::json::Value& message);
    void               setState(SessionState state);

    JsonRpcStreamTransport& client_;
    JsonRpcStreamTransport& server_;
    ProxyConfig             config_;
    Logger&                 logger_;
    ReleaseServerFn         releaseServer_;
    ReleaseClientFn         releaseClient_;
    Telemetry               telemetry_;
    WorkspaceState          workspace_;
    RequestCorrelator       correlator_;

    mutable std::mutex         stateMutex_;
    std::condition_variable    stateCv_;
    SessionState               state_{SessionState::Uninitialized};
    std::optional<std::string> workspaceRoot_;
    std::optional<std::string> projectRoot_;
    bool                       shutdownRequested_{false};
    bool                       exitRequested_{false};
    bool                       stopped_{false};
    bool                       clientLoopDone_{false};
    bool                       serverLoopDone_{false};

    RequestScheduler scheduler_;
};

}  // namespace alproxy::lsp

#endif  // ALPROXY_LSP_PROXY_SESSION_H
