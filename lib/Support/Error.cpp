//===----------------------------------------------------------------------===//
//
// Part of the alproxy project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the proxy error payload and error summaries.
///
//===----------------------------------------------------------------------===//

#include "alproxy/Support/Error.h"

#include "llvm/Support/raw_ostream.h"

#include <utility>

namespace alproxy
{

char ProxyError::ID = 0;

ProxyError::ProxyError(const ErrorKind kind, std::string text)
    : kind_(kind)
    , text_(std::move(text))
{
}

void ProxyError::log(llvm::raw_ostream& os) const
{
    os << errorKindName(kind_) << " error: " << text_;
}

std::error_code ProxyError::convertToErrorCode() const
{
    return llvm::inconvertibleErrorCode();
}

llvm::Error makeProxyError(const ErrorKind kind, const llvm::Twine& message)
{
    return llvm::make_error<ProxyError>(kind, message.str());
}

ErrorSummary takeErrorSummary(llvm::Error error)
{
    ErrorSummary summary;
    llvm::handleAllErrors(
        std::move(error),
        [&summary](const ProxyError& proxyError) {
            summary.kind    = proxyError.kind();
            summary.message = proxyError.text();
        },
        [&summary](const llvm::ErrorInfoBase& other) {
            summary.kind    = ErrorKind::Transport;
            summary.message = other.message();
        });
    return summary;
}

llvm::StringRef errorKindName(const ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::Framing:
        return "framing";
    case ErrorKind::Parse:
        return "parse";
    case ErrorKind::Validation:
        return "validation";
    case ErrorKind::Transport:
        return "transport";
    case ErrorKind::Timeout:
        return "timeout";
    case ErrorKind::Io:
        return "io";
    }
    return "unknown";
}

}  // namespace alproxy
