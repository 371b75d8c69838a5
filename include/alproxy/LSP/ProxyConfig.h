//===----------------------------------------------------------------------===//
//
// Part of the alproxy project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Runtime configuration model for the AL language-server proxy.
///
/// Values come from built-in defaults, then `ALPROXY_*` environment variables,
/// then command-line flags, in increasing priority.
///
//===----------------------------------------------------------------------===//
#ifndef ALPROXY_LSP_PROXY_CONFIG_H
#define ALPROXY_LSP_PROXY_CONFIG_H

#include "alproxy/Support/Log.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace alproxy::lsp
{

/// @brief Retry policy for waiting on the server's project load.
struct ProjectLoadPolicy final
{
    /// @brief Delay between `al/hasProjectClosureLoadedRequest` polls.
    std::chrono::milliseconds pollInterval{500};

    /// @brief Maximum number of polls.
    unsigned maxAttempts{10};
};

/// @brief Immutable configuration for one proxy session.
struct ProxyConfig final
{
    /// @brief Language-server executable; empty selects discovery.
    std::string serverExecutable;

    /// @brief Extra arguments passed to the language server.
    std::vector<std::string> serverArguments;

    /// @brief Log destination; `-` selects stderr, empty selects the default file.
    std::string logFile;

    /// @brief Configured trace verbosity.
    TraceLevel traceLevel{TraceLevel::Basic};

    /// @brief Per-request timeout for correlated server requests.
    std::chrono::milliseconds requestTimeout{30000};

    /// @brief Project-load polling policy.
    ProjectLoadPolicy projectLoad;

    /// @brief Project manifest file name.
    std::string manifestName{"app.json"};

    /// @brief Number of directories examined when searching for the manifest,
    /// including the start directory.
    unsigned manifestSearchDepth{5};

    /// @brief Number of client-request worker threads.
    std::size_t workerCount{4};
};

/// @brief Parsed command line.
struct ProxyOptions final
{
    ProxyConfig config;
    bool        showHelp{false};
    bool        showVersion{false};
};

/// @brief Environment variable lookup hook.
using EnvironmentLookup = std::function<std::optional<std::string>(llvm::StringRef name)>;

/// @brief Reads variables from the process environment.
[[nodiscard]] std::optional<std::string> processEnvironment(llvm::StringRef name);

/// @brief Parses a trace level name (`off`, `basic`, `verbose`; `messages` is
/// accepted as `verbose`).
[[nodiscard]] std::optional<TraceLevel> parseTraceLevel(llvm::StringRef text);

/// @brief Parses proxy options.
/// @param[in] args Command-line arguments without the program name.
/// @param[in] environment Environment lookup used for defaults.
/// @return Parsed options, or a validation error naming the bad argument.
[[nodiscard]] llvm::Expected<ProxyOptions> parseProxyOptions(llvm::ArrayRef<std::string> args,
                                                             const EnvironmentLookup&    environment);

/// @brief Returns `<temp>/al-lsp-proxy.log`.
[[nodiscard]] std::string defaultLogFilePath();

/// @brief Prints the help text.
void printProxyUsage(llvm::raw_ostream& os);

}  // namespace alproxy::lsp

#endif  // ALPROXY_LSP_PROXY_CONFIG_H
