//===----------------------------------------------------------------------===//
//
// Part of the alproxy project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements `Content-Length` framed JSON-RPC stream transport.
///
//===----------------------------------------------------------------------===//

#include "alproxy/LSP/JsonRpcIO.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include <istream>
#include <optional>
#include <ostream>
#include <string>

namespace alproxy::lsp
{
namespace
{

enum class HeaderParse
{
    NotContentLength,
    Valid,
    Invalid,
};

HeaderParse parseContentLengthHeader(const std::string& line, std::size_t& contentLength)
{
    const auto [name, rawValue] = llvm::StringRef(line).split(':');
    if (!name.trim().equals_insensitive("Content-Length"))
    {
        return HeaderParse::NotContentLength;
    }

    const llvm::StringRef header = rawValue.trim();
    if (header.empty())
    {
        return HeaderParse::Invalid;
    }
    std::size_t value = 0;
    for (const char ch : header)
    {
        if (ch < '0' || ch > '9')
        {
            return HeaderParse::Invalid;
        }
        value = value * 10U + static_cast<std::size_t>(ch - '0');
        if (value > JsonRpcStreamTransport::MaxContentLength)
        {
            return HeaderParse::Invalid;
        }
    }
    contentLength = value;
    return HeaderParse::Valid;
}

}  // namespace

JsonRpcStreamTransport::JsonRpcStreamTransport(std::istream& in, std::ostream& out)
    : input_(in)
    , output_(out)
{
}

ReadStatus JsonRpcStreamTransport::readMessage(llvm::json::Value& message, std::string& error)
{
    std::optional<std::size_t> contentLength;
    bool                       hasHeaders  = false;
    bool                       blankLine   = false;
    std::string                invalidLine;
    std::string                line;
    while (std::getline(input_, line))
    {
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        if (line.empty())
        {
            if (!hasHeaders)
            {
                // Tolerate stray separators between messages.
                continue;
            }
            blankLine = true;
            break;
        }

        hasHeaders = true;
        std::size_t parsedLength = 0;
        switch (parseContentLengthHeader(line, parsedLength))
        {
        case HeaderParse::Valid:
            contentLength = parsedLength;
            break;
        case HeaderParse::Invalid:
            invalidLine = line;
            break;
        case HeaderParse::NotContentLength:
            break;
        }
    }

    if (!hasHeaders)
    {
        return ReadStatus::EndOfStream;
    }
    if (!blankLine)
    {
        error = "unexpected end of stream inside header block";
        return ReadStatus::FramingError;
    }
    if (!invalidLine.empty())
    {
        error = "invalid Content-Length header: " + invalidLine;
        return ReadStatus::FramingError;
    }
    if (!contentLength.has_value())
    {
        error = "missing Content-Length header";
        return ReadStatus::FramingError;
    }

    std::string payload(*contentLength, '\0');
    input_.read(payload.data(), static_cast<std::streamsize>(*contentLength));
    if (input_.gcount() != static_cast<std::streamsize>(*contentLength))
    {
        error = "truncated JSON-RPC payload";
        return ReadStatus::FramingError;
    }

    llvm::Expected<llvm::json::Value> parsed = llvm::json::parse(payload);
    if (!parsed)
    {
        error = "invalid JSON payload: " + llvm::toString(parsed.takeError());
        return ReadStatus::ParseError;
    }

    message = std::move(*parsed);
    return ReadStatus::Message;
}

bool JsonRpcStreamTransport::writeMessage(const llvm::json::Value& message)
{
    std::string              payload;
    llvm::raw_string_ostream payloadStream(payload);
    payloadStream << message;
    payloadStream.flush();

    std::lock_guard<std::mutex> lock(writeMutex_);
    output_ << "Content-Length: " << payload.size() << "\r\n\r\n" << payload;
    output_.flush();
    return static_cast<bool>(output_);
}

}  // namespace alproxy::lsp
