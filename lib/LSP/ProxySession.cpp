//===----------------------------------------------------------------------===//
//
// Part of the alproxy project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements proxy message dispatch, lifecycle handling, and state preparation.
///
//===----------------------------------------------------------------------===//

#include "alproxy/LSP/ProxySession.h"

#include "alproxy/LSP/Project.h"
#include "alproxy/Support/Error.h"
#include "alproxy/Support/Paths.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/Process.h"

#include <cstdint>
#include <thread>
#include <utility>

namespace alproxy::lsp
{
namespace
{

std::uint64_t elapsedMicros(const std::chrono::steady_clock::time_point start)
{
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start).count());
}

std::optional<std::string> didOpenUri(const llvm::json::Object& message)
{
    const auto* params = message.getObject("params");
    if (!params)
    {
        return std::nullopt;
    }
    const auto* textDocument = params->getObject("textDocument");
    if (!textDocument)
    {
        return std::nullopt;
    }
    if (const auto uri = textDocument->getString("uri"))
    {
        return uri->str();
    }
    return std::nullopt;
}

}  // namespace

llvm::StringRef sessionStateName(const SessionState state)
{
    switch (state)
    {
    case SessionState::Uninitialized:
        return "uninitialized";
    case SessionState::Initializing:
        return "initializing";
    case SessionState::Ready:
        return "ready";
    case SessionState::ShuttingDown:
        return "shutting-down";
    case SessionState::Closed:
        return "closed";
    }
    return "unknown";
}

ProxySession::ProxySession(JsonRpcStreamTransport& client,
                           JsonRpcStreamTransport& server,
                           ProxyConfig             config,
                           Logger&                 logger,
                           ReleaseServerFn         releaseServer,
                           ReleaseClientFn         releaseClient,
                           RequestMetricSink       metricSink)
    : client_(client)
    , server_(server)
    , config_(std::move(config))
    , logger_(logger)
    , releaseServer_(std::move(releaseServer))
    , releaseClient_(std::move(releaseClient))
    , correlator_([this](const llvm::json::Value& message) { return writeServer(message); },
                  config_.requestTimeout,
                  logger)
    , scheduler_(config_.workerCount)
{
    telemetry_.setSink(std::move(metricSink));
}

ProxySession::~ProxySession()
{
    stop();
}

int ProxySession::run()
{
    logger_.info(llvm::formatv("proxy session started ({0} workers, request timeout {1} ms)",
                               scheduler_.workerCount(),
                               config_.requestTimeout.count()));

    std::thread serverThread([this]() {
        serverLoop();
        markLoopFinished(false);
    });
    std::thread clientThread([this]() {
        clientLoop();
        markLoopFinished(true);
    });

    {
        std::unique_lock<std::mutex> lock(stateMutex_);
        stateCv_.wait(lock, [this]() { return clientLoopDone_ || serverLoopDone_; });
    }
    stop();

    // Releasing the server closes its output, which ends the server loop.
    serverThread.join();

    // After `exit` the client loop returns without another read. Otherwise the
    // server went away first and the client loop is parked in a read.
    bool clientFinished = false;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        clientFinished = clientLoopDone_ || exitRequested_;
    }
    if (!clientFinished)
    {
        if (releaseClient_)
        {
            releaseClient_();
        }
        else
        {
            logger_.info("waiting for the client stream to close");
        }
    }
    clientThread.join();
    return exitCode();
}

void ProxySession::stop()
{
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (stopped_)
        {
            return;
        }
        stopped_ = true;
        state_   = SessionState::Closed;
    }
    stateCv_.notify_all();

    correlator_.failAll("proxy session closed");
    scheduler_.shutdown();
    if (releaseServer_)
    {
        releaseServer_();
    }
    logger_.info("proxy session closed");
}

void ProxySession::clientLoop()
{
    while (!shouldExit())
    {
        llvm::json::Value message(nullptr);
        std::string       error;
        switch (client_.readMessage(message, error))
        {
        case ReadStatus::Message:
            handleClientMessage(message);
            break;
        case ReadStatus::EndOfStream:
            logger_.info("client stream closed");
            return;
        case ReadStatus::FramingError:
            logger_.error("client framing error: " + error);
            return;
        case ReadStatus::ParseError:
            logger_.error("client parse error: " + error);
            writeClient(makeErrorResponse(llvm::json::Value(nullptr), JsonRpcErrorParse, error));
            break;
        }
    }
}

void ProxySession::serverLoop()
{
    bool reading = true;
    while (reading)
    {
        llvm::json::Value message(nullptr);
        std::string       error;
        switch (server_.readMessage(message, error))
        {
        case ReadStatus::Message:
            handleServerMessage(message);
            break;
        case ReadStatus::EndOfStream:
            logger_.info("language server stream closed");
            reading = false;
            break;
        case ReadStatus::FramingError:
            logger_.error("language server framing error: " + error);
            reading = false;
            break;
        case ReadStatus::ParseError:
            logger_.error("language server parse error: " + error);
            reading = false;
            break;
        }
    }
    correlator_.failAll("language server connection closed");
}

void ProxySession::markLoopFinished(const bool clientLoop)
{
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (clientLoop)
        {
            clientLoopDone_ = true;
        }
        else
        {
            serverLoopDone_ = true;
        }
    }
    stateCv_.notify_all();
}

void ProxySession::handleClientMessage(const llvm::json::Value& message)
{
    const auto* object = message.getAsObject();
    if (!object)
    {
        logger_.error("dropping client message that is not a JSON object");
        return;
    }

    switch (classifyMessage(*object))
    {
    case MessageKind::Request:
        handleClientRequest(*object, *object->getString("method"), *messageId(*object));
        return;
    case MessageKind::Notification:
        handleClientNotification(*object, *object->getString("method"));
        return;
    case MessageKind::Response:
        logger_.verbose("-> forwarding client response to language server");
        if (!writeServer(message))
        {
            logger_.error("failed to forward client response to language server");
        }
        return;
    case MessageKind::Invalid:
        if (const auto* id = messageId(*object))
        {
            writeClient(makeErrorResponse(*id, JsonRpcErrorInvalidRequest, "request method must be a string"));
            return;
        }
        logger_.error("dropping client message without method or id");
        return;
    }
}

void ProxySession::handleClientRequest(const llvm::json::Object& message,
                                       const llvm::StringRef     method,
                                       const llvm::json::Value&  id)
{
    logger_.verbose(llvm::formatv("<- client request {0} id={1}", method, requestKeyFromId(id)));

    const SessionState current = state();
    if (current == SessionState::ShuttingDown || current == SessionState::Closed)
    {
        writeClient(makeErrorResponse(id, JsonRpcErrorInvalidRequest, ("request received after shutdown: " + method).str()));
        return;
    }

    const llvm::json::Value* params = message.get("params");
    if (method == "initialize")
    {
        if (current != SessionState::Uninitialized)
        {
            writeClient(makeErrorResponse(id, JsonRpcErrorInvalidRequest, "initialize already received"));
            return;
        }
        handleInitialize(id, params);
        return;
    }
    if (method == "shutdown")
    {
        handleShutdown(id);
        return;
    }

    scheduleRequest(method, id, params ? *params : llvm::json::Value(nullptr));
}

void ProxySession::handleClientNotification(const llvm::json::Object& message, const llvm::StringRef method)
{
    logger_.verbose("<- client notification " + method);

    if (method == "exit")
    {
        bool afterShutdown = false;
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            exitRequested_ = true;
            afterShutdown  = shutdownRequested_;
        }
        if (!writeServer(llvm::json::Object(message)))
        {
            logger_.error("failed to forward exit to language server");
        }
        logger_.info(afterShutdown ? "exit received after shutdown" : "exit received without shutdown");
        return;
    }

    const SessionState current = state();
    if (current == SessionState::ShuttingDown || current == SessionState::Closed)
    {
        logger_.verbose("dropping notification after shutdown: " + method);
        return;
    }

    if (method == "$/cancelRequest")
    {
        const auto* params = message.getObject("params");
        const auto* id     = params ? params->get("id") : nullptr;
        if (id && scheduler_.cancel(requestKeyFromId(*id)))
        {
            logger_.verbose("cancelled queued request " + requestKeyFromId(*id));
        }
        return;
    }

    if (method == "textDocument/didOpen")
    {
        if (const auto uri = didOpenUri(message))
        {
            workspace_.markFileOpen(normalizePath(fileUriToPath(*uri)));
        }
    }

    if (!writeServer(llvm::json::Object(message)))
    {
        logger_.error("failed to forward notification " + method + " to language server");
    }
}

void ProxySession::handleServerMessage(const llvm::json::Value& message)
{
    const auto* object = message.getAsObject();
    if (!object)
    {
        logger_.error("dropping language server message that is not a JSON object");
        return;
    }

    switch (classifyMessage(*object))
    {
    case MessageKind::Response:
        (void) correlator_.deliver(*object);
        return;
    case MessageKind::Request:
        logger_.verbose("<- server request " + *object->getString("method"));
        writeClient(message);
        return;
    case MessageKind::Notification:
        logger_.verbose("<- server notification " + *object->getString("method"));
        writeClient(message);
        return;
    case MessageKind::Invalid:
        logger_.error("dropping malformed language server message");
        return;
    }
}

void ProxySession::handleInitialize(const llvm::json::Value& id, const llvm::json::Value* params)
{
    const auto start = std::chrono::steady_clock::now();
    setState(SessionState::Initializing);

    std::optional<std::string> root = workspaceRootFromInitialize(params);
    std::optional<std::string> project;
    if (root)
    {
        root = normalizePath(*root);
        logger_.info("workspace root: " + *root);
        if (const auto manifest = findManifest(*root, config_.manifestName, config_.manifestSearchDepth))
        {
            project = llvm::sys::path::parent_path(*manifest).str();
            logger_.info("found AL project at " + *project);
        }
    }
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        workspaceRoot_ = root;
        projectRoot_   = project;
    }

    const std::string target = project ? *project : (root ? *root : normalizePath("."));
    auto              response =
        correlator_.send("initialize", makeServerInitializeParams(target, llvm::sys::Process::getProcessId()));
    if (!response)
    {
        const ErrorSummary summary = takeErrorSummary(response.takeError());
        logger_.error("initialize failed: " + summary.message);
        setState(SessionState::Uninitialized);
        writeClient(makeErrorResponse(id, JsonRpcErrorInternal, summary.message));
        telemetry_.record("initialize", elapsedMicros(start), RequestOutcome::Failed);
        return;
    }

    const bool rejected = response->isError();
    if (rejected)
    {
        logger_.error("language server rejected initialize");
        setState(SessionState::Uninitialized);
    }
    else
    {
        logger_.info("language server initialized for " + target);
        setState(SessionState::Ready);
    }
    writeClient(makeResponse(id, std::move(*response)));
    telemetry_.record("initialize",
                      elapsedMicros(start),
                      rejected ? RequestOutcome::Failed : RequestOutcome::Completed);
}

void ProxySession::handleShutdown(const llvm::json::Value& id)
{
    const auto start = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        shutdownRequested_ = true;
    }
    setState(SessionState::ShuttingDown);

    auto response = correlator_.send("shutdown", llvm::json::Value(nullptr));
    if (!response)
    {
        const ErrorSummary summary = takeErrorSummary(response.takeError());
        logger_.error("shutdown failed: " + summary.message);
        writeClient(makeErrorResponse(id, toJsonRpcCode(summary.kind), summary.message));
        telemetry_.record("shutdown", elapsedMicros(start), RequestOutcome::Failed);
        return;
    }
    writeClient(makeResponse(id, std::move(*response)));
    telemetry_.record("shutdown", elapsedMicros(start), RequestOutcome::Completed);
}

void ProxySession::scheduleRequest(const llvm::StringRef method, const llvm::json::Value& id, llvm::json::Value params)
{
    const HandlerKind kind = selectHandler(method);
    logger_.verbose(llvm::formatv("dispatching {0} to the {1} handler", method, handlerKindName(kind)));

    const bool queued = scheduler_.enqueue(
        requestKeyFromId(id),
        method.str(),
        [this, kind, requestMethod = method.str(), requestParams = std::move(params)]() {
            return runHandler(kind, requestMethod, requestParams, *this);
        },
        [this, requestId = cloneJsonId(id), requestMethod = method.str()](RequestTaskResult   result,
                                                                          const std::uint64_t latencyMicros) {
            switch (result.status)
            {
            case RequestTaskStatus::Completed: {
                const RequestOutcome outcome =
                    result.payload.isError() ? RequestOutcome::Failed : RequestOutcome::Completed;
                writeClient(makeResponse(requestId, std::move(result.payload)));
                telemetry_.record(requestMethod, latencyMicros, outcome);
                return;
            }
            case RequestTaskStatus::Cancelled:
                writeClient(makeErrorResponse(requestId, JsonRpcErrorRequestCancelled, "request cancelled"));
                telemetry_.record(requestMethod, latencyMicros, RequestOutcome::Cancelled);
                return;
            case RequestTaskStatus::Failed:
                logger_.error("handler for " + requestMethod + " failed: " + result.errorMessage);
                writeClient(makeErrorResponse(requestId,
                                              JsonRpcErrorInternal,
                                              result.errorMessage.empty() ? "request failed" : result.errorMessage));
                telemetry_.record(requestMethod, latencyMicros, RequestOutcome::Failed);
                return;
            }
        });

    if (!queued)
    {
        writeClient(makeErrorResponse(id, JsonRpcErrorInternal, "failed to queue request"));
    }
}

llvm::Error ProxySession::ensureFileOpened(const llvm::StringRef path)
{
    const std::string normalized = normalizePath(path);
    return workspace_.ensureFileOpen(normalized, [this, &normalized]() -> llvm::Error {
        auto buffer = llvm::MemoryBuffer::getFile(normalized, /*IsText=*/false, /*RequiresNullTerminator=*/false);
        if (!buffer)
        {
            return makeProxyError(ErrorKind::Io,
                                  "failed to read " + normalized + ": " + buffer.getError().message());
        }
        logger_.info("opening " + normalized);
        return sendNotification("textDocument/didOpen", makeDidOpenParams(normalized, (*buffer)->getBuffer()));
    });
}

llvm::Error ProxySession::ensureProjectInitialized(const llvm::StringRef path)
{
    const auto root = findProjectRoot(path, config_.manifestName, config_.manifestSearchDepth);
    if (!root)
    {
        logger_.verbose("no AL project found for " + path);
        return llvm::Error::success();
    }
    initializeProject(*root);
    return llvm::Error::success();
}

llvm::Error ProxySession::ensureWorkspaceProjectInitialized()
{
    const auto root = projectRoot();
    if (root)
    {
        initializeProject(*root);
    }
    return llvm::Error::success();
}

llvm::Expected<ResponsePayload> ProxySession::sendRequest(const llvm::StringRef method, llvm::json::Value params)
{
    return correlator_.send(method, std::move(params));
}

llvm::Error ProxySession::sendNotification(const llvm::StringRef method, llvm::json::Value params)
{
    logger_.verbose("-> server notification " + method);
    if (!writeServer(makeNotification(method, std::move(params))))
    {
        return makeProxyError(ErrorKind::Transport, "failed to write " + method + " notification to language server");
    }
    return llvm::Error::success();
}

void ProxySession::recordFallback(const llvm::StringRef method)
{
    telemetry_.recordFallback(method.str());
}

Logger& ProxySession::logger()
{
    return logger_;
}

void ProxySession::initializeProject(const std::string& root)
{
    workspace_.ensureProjectInitialized(root, [this, &root]() {
        logger_.info("initializing AL project " + root);

        if (auto error = sendNotification("workspace/didChangeConfiguration", makeDidChangeConfigurationParams(root)))
        {
            logger_.error("failed to send workspace configuration: " + llvm::toString(std::move(error)));
        }

        llvm::SmallString<256> manifest(root);
        llvm::sys::path::append(manifest, config_.manifestName);
        if (auto error = ensureFileOpened(manifest))
        {
            logger_.error("failed to open project manifest: " + llvm::toString(std::move(error)));
        }

        auto active = sendRequest("al/setActiveWorkspace", makeActiveWorkspaceParams(root));
        if (!active)
        {
            logger_.error("failed to set active workspace: " + llvm::toString(active.takeError()));
        }
        else if (active->isError())
        {
            logger_.error(llvm::formatv("al/setActiveWorkspace returned error {0}", active->errorCode()));
        }

        waitForProjectLoad();
        logger_.info("AL project initialized: " + root);
    });
}

void ProxySession::waitForProjectLoad()
{
    const ProjectLoadPolicy& policy = config_.projectLoad;
    for (unsigned attempt = 0; attempt < policy.maxAttempts; ++attempt)
    {
        auto loaded = sendRequest("al/hasProjectClosureLoadedRequest", llvm::json::Value(nullptr));
        if (!loaded)
        {
            logger_.error("project load check failed: " + llvm::toString(loaded.takeError()));
            return;
        }
        if (!loaded->isError())
        {
            if (const auto flag = loaded->result.getAsBoolean(); flag && *flag)
            {
                logger_.info("project closure loaded");
                return;
            }
        }
        if (attempt + 1U < policy.maxAttempts && !sleepUnlessStopping(policy.pollInterval))
        {
            return;
        }
    }
    logger_.info(llvm::formatv("project load not confirmed after {0} attempts, continuing", policy.maxAttempts));
}

bool ProxySession::sleepUnlessStopping(const std::chrono::milliseconds duration)
{
    std::unique_lock<std::mutex> lock(stateMutex_);
    return !stateCv_.wait_for(lock, duration, [this]() { return stopped_; });
}

void ProxySession::writeClient(const llvm::json::Value& message)
{
    if (!client_.writeMessage(message))
    {
        logger_.error("failed to write message to client");
    }
}

bool ProxySession::writeServer(const llvm::json::Value& message)
{
    return server_.writeMessage(message);
}

void ProxySession::setState(const SessionState state)
{
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (state_ != SessionState::Closed)
    {
        state_ = state;
    }
}

SessionState ProxySession::state() const
{
    std::lock_guard<std::mutex> lock(stateMutex_);
    return state_;
}

bool ProxySession::shouldExit() const
{
    std::lock_guard<std::mutex> lock(stateMutex_);
    return exitRequested_;
}

int ProxySession::exitCode() const
{
    std::lock_guard<std::mutex> lock(stateMutex_);
    return shutdownRequested_ ? 0 : 1;
}

std::optional<std::string> ProxySession::workspaceRoot() const
{
    std::lock_guard<std::mutex> lock(stateMutex_);
    return workspaceRoot_;
}

std::optional<std::string> ProxySession::projectRoot() const
{
    std::lock_guard<std::mutex> lock(stateMutex_);
    return projectRoot_;
}

}  // namespace alproxy::lsp
