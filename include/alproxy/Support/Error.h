//===----------------------------------------------------------------------===//
//
// Part of the alproxy project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Error taxonomy shared by the proxy engine and its collaborators.
///
/// Failures travel as `llvm::Error` values carrying a `ProxyError` payload so
/// the dispatcher can map each failure category onto a JSON-RPC error code.
///
//===----------------------------------------------------------------------===//
#ifndef ALPROXY_SUPPORT_ERROR_H
#define ALPROXY_SUPPORT_ERROR_H

#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"

#include <string>
#include <system_error>

namespace alproxy
{

/// @brief Failure category of a proxy operation.
enum class ErrorKind
{
    /// @brief Malformed header block or length on a stream.
    Framing,

    /// @brief Payload was not well-formed JSON.
    Parse,

    /// @brief Missing or invalid required parameter.
    Validation,

    /// @brief Read/write failure on either stream, or a closed session.
    Transport,

    /// @brief No correlated response arrived within the request timeout.
    Timeout,

    /// @brief Local filesystem or process failure.
    Io,
};

/// @brief `llvm::ErrorInfo` payload for proxy failures.
class ProxyError final : public llvm::ErrorInfo<ProxyError>
{
public:
    static char ID;

    ProxyError(ErrorKind kind, std::string text);

    void log(llvm::raw_ostream& os) const override;

    [[nodiscard]] std::error_code convertToErrorCode() const override;

    [[nodiscard]] ErrorKind kind() const
    {
        return kind_;
    }

    [[nodiscard]] const std::string& text() const
    {
        return text_;
    }

private:
    ErrorKind   kind_;
    std::string text_;
};

/// @brief Flattened view of a consumed error.
struct ErrorSummary final
{
    /// @brief Failure category; foreign errors classify as `Transport`.
    ErrorKind kind{ErrorKind::Transport};

    /// @brief Human-readable message.
    std::string message;
};

/// @brief Creates a `ProxyError` wrapped in `llvm::Error`.
/// @param[in] kind Failure category.
/// @param[in] message Human-readable message.
/// @return Failure value.
[[nodiscard]] llvm::Error makeProxyError(ErrorKind kind, const llvm::Twine& message);

/// @brief Consumes an error and returns its category and message.
/// @param[in] error Failure value to consume. Must be a failure.
/// @return Flattened summary.
[[nodiscard]] ErrorSummary takeErrorSummary(llvm::Error error);

/// @brief Returns a stable lower-case name for an error category.
[[nodiscard]] llvm::StringRef errorKindName(ErrorKind kind);

}  // namespace alproxy

#endif  // ALPROXY_SUPPORT_ERROR_H
