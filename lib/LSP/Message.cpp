//===----------------------------------------------------------------------===//
//
// Part of the alproxy project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements JSON-RPC message classification and builders.
///
//===----------------------------------------------------------------------===//

#include "alproxy/LSP/Message.h"

#include "llvm/Support/raw_ostream.h"

#include <utility>

namespace alproxy::lsp
{

MessageKind classifyMessage(const llvm::json::Object& message)
{
    const bool hasId = messageId(message) != nullptr;
    if (const auto* method = message.get("method"))
    {
        if (!method->getAsString())
        {
            return MessageKind::Invalid;
        }
        return hasId ? MessageKind::Request : MessageKind::Notification;
    }
    return hasId ? MessageKind::Response : MessageKind::Invalid;
}

const llvm::json::Value* messageId(const llvm::json::Object& message)
{
    const auto* id = message.get("id");
    if (!id || id->kind() == llvm::json::Value::Null)
    {
        return nullptr;
    }
    return id;
}

llvm::json::Value cloneJsonId(const llvm::json::Value& id)
{
    if (const auto text = id.getAsString())
    {
        return llvm::json::Value(text->str());
    }
    if (const auto integer = id.getAsInteger())
    {
        return llvm::json::Value(*integer);
    }
    if (const auto number = id.getAsNumber())
    {
        return llvm::json::Value(*number);
    }
    if (const auto boolean = id.getAsBoolean())
    {
        return llvm::json::Value(*boolean);
    }
    return llvm::json::Value(nullptr);
}

std::string requestKeyFromId(const llvm::json::Value& id)
{
    if (const auto text = id.getAsString())
    {
        return ("s:" + text->str());
    }
    if (const auto integer = id.getAsInteger())
    {
        return ("i:" + std::to_string(*integer));
    }

    std::string              serialized;
    llvm::raw_string_ostream stream(serialized);
    stream << id;
    stream.flush();
    return ("j:" + serialized);
}

llvm::json::Value makeRequest(const std::int64_t id, const llvm::StringRef method, llvm::json::Value params)
{
    llvm::json::Object request{
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method.str()},
    };
    if (params.kind() != llvm::json::Value::Null)
    {
        request["params"] = std::move(params);
    }
    return request;
}

llvm::json::Value makeNotification(const llvm::StringRef method, llvm::json::Value params)
{
    llvm::json::Object notification{
        {"jsonrpc", "2.0"},
        {"method", method.str()},
    };
    if (params.kind() != llvm::json::Value::Null)
    {
        notification["params"] = std::move(params);
    }
    return notification;
}

llvm::json::Value makeResultResponse(const llvm::json::Value& id, llvm::json::Value result)
{
    return llvm::json::Object{
        {"jsonrpc", "2.0"},
        {"id", cloneJsonId(id)},
        {"result", std::move(result)},
    };
}

llvm::json::Value makeErrorResponse(const llvm::json::Value& id, const int code, const llvm::StringRef message)
{
    return llvm::json::Object{
        {"jsonrpc", "2.0"},
        {"id", cloneJsonId(id)},
        {"error", llvm::json::Object{{"code", code}, {"message", message.str()}}},
    };
}

int toJsonRpcCode(const ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::Framing:
    case ErrorKind::Parse:
        return JsonRpcErrorParse;
    case ErrorKind::Validation:
        return JsonRpcErrorInvalidParams;
    case ErrorKind::Transport:
    case ErrorKind::Timeout:
    case ErrorKind::Io:
        return JsonRpcErrorInternal;
    }
    return JsonRpcErrorInternal;
}

ResponsePayload ResponsePayload::success(llvm::json::Value result)
{
    ResponsePayload payload;
    payload.result = std::move(result);
    return payload;
}

ResponsePayload ResponsePayload::failure(const int code, const llvm::StringRef message)
{
    ResponsePayload payload;
    payload.error = llvm::json::Object{{"code", code}, {"message", message.str()}};
    return payload;
}

ResponsePayload ResponsePayload::relayed(llvm::json::Value error)
{
    ResponsePayload payload;
    payload.error = std::move(error);
    return payload;
}

std::int64_t ResponsePayload::errorCode() const
{
    if (!error)
    {
        return 0;
    }
    if (const auto* object = error->getAsObject())
    {
        if (const auto code = object->getInteger("code"))
        {
            return *code;
        }
    }
    return JsonRpcErrorUnknown;
}

ResponsePayload responsePayloadFromMessage(const llvm::json::Object& message)
{
    if (const auto* error = message.get("error"))
    {
        if (error->kind() != llvm::json::Value::Null)
        {
            return ResponsePayload::relayed(*error);
        }
    }
    if (const auto* result = message.get("result"))
    {
        return ResponsePayload::success(*result);
    }
    return ResponsePayload::success(nullptr);
}

llvm::json::Value makeResponse(const llvm::json::Value& id, ResponsePayload payload)
{
    if (payload.error)
    {
        return llvm::json::Object{
            {"jsonrpc", "2.0"},
            {"id", cloneJsonId(id)},
            {"error", std::move(*payload.error)},
        };
    }
    return makeResultResponse(id, std::move(payload.result));
}

}  // namespace alproxy::lsp
