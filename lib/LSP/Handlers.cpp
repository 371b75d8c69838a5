//===----------------------------------------------------------------------===//
//
// Part of the alproxy project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements request translation for intercepted LSP methods.
///
//===----------------------------------------------------------------------===//

#include "alproxy/LSP/Handlers.h"

#include "alproxy/LSP/SymbolMatching.h"
#include "alproxy/Support/Error.h"
#include "alproxy/Support/Paths.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/FormatVariadic.h"

#include <optional>
#include <string>
#include <utility>

namespace alproxy::lsp
{
namespace
{

struct HandlerRoute final
{
    HandlerKind         kind;
    llvm::StringLiteral method;
};

constexpr HandlerRoute kHandlerRoutes[] = {
    {HandlerKind::Definition, "textDocument/definition"},
    {HandlerKind::Hover, "textDocument/hover"},
    {HandlerKind::DocumentSymbol, "textDocument/documentSymbol"},
    {HandlerKind::WorkspaceSymbol, "workspace/symbol"},
    {HandlerKind::References, "textDocument/references"},
    {HandlerKind::Unsupported, "textDocument/prepareCallHierarchy"},
    {HandlerKind::Unsupported, "callHierarchy/incomingCalls"},
    {HandlerKind::Unsupported, "callHierarchy/outgoingCalls"},
};

constexpr llvm::StringLiteral EmptyWorkspaceQueryMessage =
    "AL Language Server requires a non-empty query for workspace/symbol. "
    "Please provide a symbol name to search for.";

/// Validated `textDocument` + optional `position` params.
struct DocumentPosition final
{
    std::string              uri;
    std::string              path;
    const llvm::json::Value* position{nullptr};
};

ResponsePayload payloadFromError(llvm::Error error)
{
    const ErrorSummary summary = takeErrorSummary(std::move(error));
    return ResponsePayload::failure(toJsonRpcCode(summary.kind), summary.message);
}

ResponsePayload invalidParams(const llvm::StringRef method, llvm::Error error)
{
    const ErrorSummary summary = takeErrorSummary(std::move(error));
    return ResponsePayload::failure(JsonRpcErrorInvalidParams,
                                    llvm::formatv("Invalid parameters for {0}: {1}", method, summary.message).str());
}

llvm::Expected<DocumentPosition> parseDocumentParams(const llvm::json::Value& params, const bool requirePosition)
{
    const auto* object = params.getAsObject();
    if (!object)
    {
        return makeProxyError(ErrorKind::Validation, "params must be an object");
    }
    const auto* textDocument = object->getObject("textDocument");
    if (!textDocument)
    {
        return makeProxyError(ErrorKind::Validation, "missing textDocument");
    }
    const auto uri = textDocument->getString("uri");
    if (!uri || uri->empty())
    {
        return makeProxyError(ErrorKind::Validation, "missing textDocument.uri");
    }

    DocumentPosition parsed;
    parsed.uri  = uri->str();
    parsed.path = fileUriToPath(*uri);
    if (requirePosition)
    {
        const auto* position = object->get("position");
        if (!position || !position->getAsObject())
        {
            return makeProxyError(ErrorKind::Validation, "missing position");
        }
        parsed.position = position;
    }
    return parsed;
}

/// Opens the document and initializes its project.
llvm::Error prepareDocumentState(const DocumentPosition& document, HandlerContext& context)
{
    if (auto error = context.ensureFileOpened(document.path))
    {
        return error;
    }
    return context.ensureProjectInitialized(document.path);
}

llvm::json::Value textDocumentIdentifier(const llvm::StringRef uri)
{
    return llvm::json::Object{{"uri", uri.str()}};
}

/// Resolves an empty definition through hover text and document symbols.
std::optional<llvm::json::Value> definitionFallback(const DocumentPosition& document, HandlerContext& context)
{
    Logger& log = context.logger();

    auto hover = context.sendRequest("textDocument/hover",
                                     llvm::json::Object{
                                         {"textDocument", textDocumentIdentifier(document.uri)},
                                         {"position", *document.position},
                                     });
    if (!hover)
    {
        log.info("definition fallback: hover failed: " + llvm::toString(hover.takeError()));
        return std::nullopt;
    }
    if (hover->isError() || hover->result.kind() == llvm::json::Value::Null)
    {
        log.info("definition fallback: hover returned no content");
        return std::nullopt;
    }

    const auto symbolName = extractSymbolFromHoverText(hoverContentText(hover->result));
    if (!symbolName)
    {
        log.info("definition fallback: no symbol name in hover text");
        return std::nullopt;
    }
    log.info("definition fallback: extracted symbol '" + *symbolName + "' from hover");

    auto symbols = context.sendRequest("textDocument/documentSymbol",
                                       llvm::json::Object{{"textDocument", textDocumentIdentifier(document.uri)}});
    if (!symbols)
    {
        log.info("definition fallback: documentSymbol failed: " + llvm::toString(symbols.takeError()));
        return std::nullopt;
    }
    if (symbols->isError())
    {
        log.info("definition fallback: documentSymbol returned an error");
        return std::nullopt;
    }

    auto location = findSymbolLocation(symbols->result, *symbolName, document.uri);
    if (location)
    {
        log.info("definition fallback: found '" + *symbolName + "' via documentSymbol");
    }
    return location;
}

}  // namespace

HandlerKind selectHandler(const llvm::StringRef method)
{
    for (const HandlerRoute& route : kHandlerRoutes)
    {
        if (route.method == method)
        {
            return route.kind;
        }
    }
    return HandlerKind::PassThrough;
}

llvm::StringRef handlerKindName(const HandlerKind kind)
{
    switch (kind)
    {
    case HandlerKind::Definition:
        return "definition";
    case HandlerKind::Hover:
        return "hover";
    case HandlerKind::DocumentSymbol:
        return "documentSymbol";
    case HandlerKind::WorkspaceSymbol:
        return "workspaceSymbol";
    case HandlerKind::References:
        return "references";
    case HandlerKind::Unsupported:
        return "unsupported";
    case HandlerKind::PassThrough:
        return "passThrough";
    }
    return "unknown";
}

ResponsePayload runHandler(const HandlerKind        kind,
                           const llvm::StringRef    method,
                           const llvm::json::Value& params,
                           HandlerContext&          context)
{
    switch (kind)
    {
    case HandlerKind::Definition:
        return handleDefinition(params, context);
    case HandlerKind::Hover:
    case HandlerKind::DocumentSymbol:
    case HandlerKind::References:
        return handleDocumentRequest(method, params, context);
    case HandlerKind::WorkspaceSymbol:
        return handleWorkspaceSymbol(params, context);
    case HandlerKind::Unsupported:
        return handleUnsupported(method, context);
    case HandlerKind::PassThrough:
        return handlePassThrough(method, params, context);
    }
    return handlePassThrough(method, params, context);
}

ResponsePayload handleDefinition(const llvm::json::Value& params, HandlerContext& context)
{
    static constexpr llvm::StringLiteral Method = "textDocument/definition";

    auto document = parseDocumentParams(params, /*requirePosition=*/true);
    if (!document)
    {
        return invalidParams(Method, document.takeError());
    }
    if (auto error = prepareDocumentState(*document, context))
    {
        return payloadFromError(std::move(error));
    }

    auto response = context.sendRequest("al/gotodefinition",
                                        llvm::json::Object{
                                            {"textDocumentPositionParams",
                                             llvm::json::Object{
                                                 {"textDocument", textDocumentIdentifier(document->uri)},
                                                 {"position", *document->position},
                                             }},
                                        });
    if (!response)
    {
        return payloadFromError(response.takeError());
    }
    if (response->isError() || !isEmptyDefinitionResult(response->result))
    {
        return std::move(*response);
    }

    context.logger().info("definition result empty, trying hover + documentSymbol fallback");
    context.recordFallback(Method);
    if (auto location = definitionFallback(*document, context))
    {
        return ResponsePayload::success(std::move(*location));
    }
    return std::move(*response);
}

ResponsePayload handleDocumentRequest(const llvm::StringRef    method,
                                      const llvm::json::Value& params,
                                      HandlerContext&          context)
{
    const bool requirePosition = method != "textDocument/documentSymbol";
    auto       document        = parseDocumentParams(params, requirePosition);
    if (!document)
    {
        return invalidParams(method, document.takeError());
    }
    if (auto error = prepareDocumentState(*document, context))
    {
        return payloadFromError(std::move(error));
    }

    auto response = context.sendRequest(method, params);
    if (!response)
    {
        return payloadFromError(response.takeError());
    }
    return std::move(*response);
}

ResponsePayload handleWorkspaceSymbol(const llvm::json::Value& params, HandlerContext& context)
{
    Logger& log = context.logger();

    std::string query;
    if (const auto* object = params.getAsObject())
    {
        if (const auto text = object->getString("query"))
        {
            query = text->str();
        }
    }
    if (llvm::StringRef(query).trim().empty())
    {
        log.info("rejecting workspace/symbol with an empty query");
        return ResponsePayload::failure(JsonRpcErrorInvalidParams, EmptyWorkspaceQueryMessage);
    }

    if (looksLikeFilePath(query))
    {
        std::string extracted = extractSymbolFromQuery(query);
        log.info("workspace/symbol query '" + query + "' rewritten to '" + extracted + "'");
        query = std::move(extracted);
    }

    if (auto error = context.ensureWorkspaceProjectInitialized())
    {
        log.error("workspace project initialization failed: " + llvm::toString(std::move(error)));
    }

    auto response = context.sendRequest("workspace/symbol", llvm::json::Object{{"query", query}});
    if (!response)
    {
        return payloadFromError(response.takeError());
    }
    if (!response->isError())
    {
        if (const auto* results = response->result.getAsArray(); results && !results->empty())
        {
            return std::move(*response);
        }
    }

    log.info("workspace/symbol returned no results, falling back to al/symbolSearch for '" + query + "'");
    context.recordFallback("workspace/symbol");
    auto fallback = context.sendRequest("al/symbolSearch", llvm::json::Object{{"filter", query}});
    if (!fallback)
    {
        return payloadFromError(fallback.takeError());
    }
    return std::move(*fallback);
}

ResponsePayload handleUnsupported(const llvm::StringRef method, HandlerContext& context)
{
    context.logger().info("unsupported method: " + method);
    return ResponsePayload::failure(JsonRpcErrorMethodNotFound,
                                    ("Method not supported by AL Language Server: " + method).str());
}

ResponsePayload handlePassThrough(const llvm::StringRef    method,
                                  const llvm::json::Value& params,
                                  HandlerContext&          context)
{
    auto response = context.sendRequest(method, params);
    if (!response)
    {
        return payloadFromError(response.takeError());
    }
    return std::move(*response);
}

}  // namespace alproxy::lsp
