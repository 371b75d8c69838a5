//===----------------------------------------------------------------------===//
//
// Part of the alproxy project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Per-method request translation for the AL language server.
///
/// Each handler validates client params, prepares server-side state (open the
/// file, initialize its project), issues correlated requests with fallbacks,
/// and produces the payload answered under the client's id. Handlers reach
/// the engine only through `HandlerContext`.
///
//===----------------------------------------------------------------------===//
#ifndef ALPROXY_LSP_HANDLERS_H
#define ALPROXY_LSP_HANDLERS_H

#include "alproxy/LSP/Message.h"
#include "alproxy/Support/Log.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

namespace alproxy::lsp
{

/// @brief Engine operations available to handlers.
class HandlerContext
{
public:
    virtual ~HandlerContext() = default;

    /// @brief Sends `textDocument/didOpen` for a local file unless already open.
    /// @param[in] path Local file path.
    /// @return Success, or an `Io`/`Transport` error.
    [[nodiscard]] virtual llvm::Error ensureFileOpened(llvm::StringRef path) = 0;

    /// @brief Runs the project handshake for the project containing a file.
    /// @param[in] path Local file path; files outside a project succeed immediately.
    [[nodiscard]] virtual llvm::Error ensureProjectInitialized(llvm::StringRef path) = 0;

    /// @brief Runs the project handshake for the project detected at `initialize`.
    [[nodiscard]] virtual llvm::Error ensureWorkspaceProjectInitialized() = 0;

    /// @brief Sends a correlated request to the language server.
    [[nodiscard]] virtual llvm::Expected<ResponsePayload> sendRequest(llvm::StringRef   method,
                                                                      llvm::json::Value params) = 0;

    /// @brief Sends a notification to the language server.
    [[nodiscard]] virtual llvm::Error sendNotification(llvm::StringRef method, llvm::json::Value params) = 0;

    /// @brief Records that a handler took its fallback path.
    virtual void recordFallback(llvm::StringRef method) = 0;

    virtual Logger& logger() = 0;
};

/// @brief Closed set of request handlers, in selection priority order.
enum class HandlerKind
{
    Definition,
    Hover,
    DocumentSymbol,
    WorkspaceSymbol,
    References,
    Unsupported,
    PassThrough,
};

/// @brief Returns the first handler whose method set contains `method`.
[[nodiscard]] HandlerKind selectHandler(llvm::StringRef method);

/// @brief Returns a stable handler name for logs.
[[nodiscard]] llvm::StringRef handlerKindName(HandlerKind kind);

/// @brief Runs a handler for one client request.
/// @param[in] kind Handler selected for `method`.
/// @param[in] method Client request method.
/// @param[in] params Client request params (`null` when absent).
/// @param[in] context Engine operations.
/// @return Payload answered under the client's id.
[[nodiscard]] ResponsePayload runHandler(HandlerKind              kind,
                                         llvm::StringRef          method,
                                         const llvm::json::Value& params,
                                         HandlerContext&          context);

/// @brief `textDocument/definition` via `al/gotodefinition`, with a
/// hover + documentSymbol fallback for empty results.
[[nodiscard]] ResponsePayload handleDefinition(const llvm::json::Value& params, HandlerContext& context);

/// @brief Forwards a document request after preparing server-side state.
[[nodiscard]] ResponsePayload handleDocumentRequest(llvm::StringRef          method,
                                                    const llvm::json::Value& params,
                                                    HandlerContext&          context);

/// @brief `workspace/symbol` with query validation and `al/symbolSearch` fallback.
[[nodiscard]] ResponsePayload handleWorkspaceSymbol(const llvm::json::Value& params, HandlerContext& context);

/// @brief Answers a method the AL server cannot serve.
[[nodiscard]] ResponsePayload handleUnsupported(llvm::StringRef method, HandlerContext& context);

/// @brief Forwards a request unchanged and relays its result or error.
[[nodiscard]] ResponsePayload handlePassThrough(llvm::StringRef          method,
                                                const llvm::json::Value& params,
                                                HandlerContext&          context);

}  // namespace alproxy::lsp

#endif  // ALPROXY_LSP_HANDLERS_H
