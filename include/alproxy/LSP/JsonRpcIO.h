//===----------------------------------------------------------------------===//
//
// Part of the alproxy project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Stream JSON-RPC framing utilities for Language Server Protocol transport.
///
/// Messages are encoded with `Content-Length` framing and decoded into LLVM
/// JSON values. The same transport class serves the client connection
/// (stdin/stdout) and the language-server connection (child pipes).
///
//===----------------------------------------------------------------------===//
#ifndef ALPROXY_LSP_JSON_RPC_IO_H
#define ALPROXY_LSP_JSON_RPC_IO_H

#include "llvm/Support/JSON.h"

#include <cstddef>
#include <iosfwd>
#include <mutex>
#include <string>

namespace alproxy::lsp
{

/// @brief Outcome of reading one framed message.
enum class ReadStatus
{
    /// @brief A complete, well-formed JSON payload was read.
    Message,

    /// @brief The stream closed cleanly before any header byte.
    EndOfStream,

    /// @brief Header block or payload length is malformed; the stream is unusable.
    FramingError,

    /// @brief The payload was consumed but is not well-formed JSON.
    ParseError,
};

/// @brief JSON-RPC stream transport with `Content-Length` framing.
class JsonRpcStreamTransport final
{
public:
    /// @brief Upper bound on an accepted payload length.
    static constexpr std::size_t MaxContentLength = 256U * 1024U * 1024U;

    /// @brief Creates a transport over input and output streams.
    /// @param[in] in Input stream.
    /// @param[in] out Output stream.
    JsonRpcStreamTransport(std::istream& in, std::ostream& out);

    /// @brief Reads one framed JSON-RPC message.
    /// @param[out] message Parsed JSON payload.
    /// @param[out] error Framing or parse error text when read fails.
    /// @return Read outcome.
    [[nodiscard]] ReadStatus readMessage(llvm::json::Value& message, std::string& error);

    /// @brief Writes one framed JSON-RPC message.
    /// @param[in] message JSON payload to write.
    /// @return `true` when write succeeds.
    [[nodiscard]] bool writeMessage(const llvm::json::Value& message);

private:
    std::istream& input_;
    std::ostream& output_;
    std::mutex    writeMutex_;
};

}  // namespace alproxy::lsp

#endif  // ALPROXY_LSP_JSON_RPC_IO_H
