//===----------------------------------------------------------------------===//
//
// Part of the alproxy project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// JSON-RPC message model: classification, builders, and error codes.
///
/// Messages stay as `llvm::json::Object` values; `params`, `result`, and
/// `error` are left opaque until a handler inspects them.
///
//===----------------------------------------------------------------------===//
#ifndef ALPROXY_LSP_MESSAGE_H
#define ALPROXY_LSP_MESSAGE_H

#include "alproxy/Support/Error.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/JSON.h"

#include <cstdint>
#include <optional>
#include <string>

namespace alproxy::lsp
{

constexpr int JsonRpcErrorParse                = -32700;
constexpr int JsonRpcErrorInvalidRequest       = -32600;
constexpr int JsonRpcErrorMethodNotFound       = -32601;
constexpr int JsonRpcErrorInvalidParams        = -32602;
constexpr int JsonRpcErrorInternal             = -32603;
constexpr int JsonRpcErrorServerNotInitialized = -32002;
constexpr int JsonRpcErrorUnknown              = -32001;
constexpr int JsonRpcErrorRequestCancelled     = -32800;

/// @brief Shape of a JSON-RPC message.
enum class MessageKind
{
    /// @brief `method` and `id`.
    Request,

    /// @brief `method` without `id`.
    Notification,

    /// @brief `id` without `method`.
    Response,

    /// @brief Neither, or a non-string `method`.
    Invalid,
};

/// @brief Classifies a message object. A `null` id counts as absent.
[[nodiscard]] MessageKind classifyMessage(const llvm::json::Object& message);

/// @brief Returns the message id when present and not `null`.
[[nodiscard]] const llvm::json::Value* messageId(const llvm::json::Object& message);

/// @brief Returns a deep copy of a JSON-RPC id.
[[nodiscard]] llvm::json::Value cloneJsonId(const llvm::json::Value& id);

/// @brief Serializes an id into a stable map key.
/// @param[in] id Request id (string, integer, or other JSON value).
/// @return `s:`/`i:`/`j:` prefixed key.
[[nodiscard]] std::string requestKeyFromId(const llvm::json::Value& id);

/// @brief Builds a request; `params` is omitted when `null`.
[[nodiscard]] llvm::json::Value makeRequest(std::int64_t id, llvm::StringRef method, llvm::json::Value params);

/// @brief Builds a notification; `params` is omitted when `null`.
[[nodiscard]] llvm::json::Value makeNotification(llvm::StringRef method, llvm::json::Value params);

/// @brief Builds a success response.
[[nodiscard]] llvm::json::Value makeResultResponse(const llvm::json::Value& id, llvm::json::Value result);

/// @brief Builds an error response.
[[nodiscard]] llvm::json::Value makeErrorResponse(const llvm::json::Value& id, int code, llvm::StringRef message);

/// @brief Maps an error category onto the JSON-RPC code sent to the client.
[[nodiscard]] int toJsonRpcCode(ErrorKind kind);

/// @brief Response body produced by a handler or received from the server.
///
/// Exactly one of `result` and `error` is sent; `error` wins when set.
struct ResponsePayload final
{
    /// @brief Result value; `null` is a valid result.
    llvm::json::Value result{nullptr};

    /// @brief JSON-RPC error object, relayed verbatim when set.
    std::optional<llvm::json::Value> error;

    [[nodiscard]] static ResponsePayload success(llvm::json::Value result);
    [[nodiscard]] static ResponsePayload failure(int code, llvm::StringRef message);
    [[nodiscard]] static ResponsePayload relayed(llvm::json::Value error);

    [[nodiscard]] bool isError() const
    {
        return error.has_value();
    }

    /// @brief Returns the error code, or `0` for success payloads.
    [[nodiscard]] std::int64_t errorCode() const;
};

/// @brief Extracts `result`/`error` from a response message.
[[nodiscard]] ResponsePayload responsePayloadFromMessage(const llvm::json::Object& message);

/// @brief Builds the client-facing response for a payload.
[[nodiscard]] llvm::json::Value makeResponse(const llvm::json::Value& id, ResponsePayload payload);

}  // namespace alproxy::lsp

#endif  // ALPROXY_LSP_MESSAGE_H
