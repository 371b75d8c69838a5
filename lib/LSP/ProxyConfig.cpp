//===----------------------------------------------------------------------===//
//
// Part of the alproxy project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements proxy option parsing.
///
//===----------------------------------------------------------------------===//

#include "alproxy/LSP/ProxyConfig.h"

#include "alproxy/Support/Error.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/Process.h"

namespace alproxy::lsp
{
namespace
{

llvm::Error parseUnsigned(const llvm::StringRef flag, const llvm::StringRef text, unsigned& out)
{
    unsigned value = 0;
    if (text.getAsInteger(10, value))
    {
        return makeProxyError(ErrorKind::Validation, "invalid value for " + flag + ": '" + text + "'");
    }
    out = value;
    return llvm::Error::success();
}

llvm::Error parsePositive(const llvm::StringRef flag, const llvm::StringRef text, unsigned& out)
{
    if (auto error = parseUnsigned(flag, text, out))
    {
        return error;
    }
    if (out == 0U)
    {
        return makeProxyError(ErrorKind::Validation, flag + " must be greater than zero");
    }
    return llvm::Error::success();
}

llvm::Error applyTraceLevel(const llvm::StringRef source, const llvm::StringRef text, ProxyConfig& config)
{
    const auto level = parseTraceLevel(text);
    if (!level)
    {
        return makeProxyError(ErrorKind::Validation,
                              "invalid trace level for " + source + ": '" + text + "' (expected off|basic|verbose)");
    }
    config.traceLevel = *level;
    return llvm::Error::success();
}

}  // namespace

std::optional<std::string> processEnvironment(const llvm::StringRef name)
{
    if (auto value = llvm::sys::Process::GetEnv(name))
    {
        return *value;
    }
    return std::nullopt;
}

std::optional<TraceLevel> parseTraceLevel(const llvm::StringRef text)
{
    const std::string lowered = text.trim().lower();
    if (lowered == "off")
    {
        return TraceLevel::Off;
    }
    if (lowered == "basic")
    {
        return TraceLevel::Basic;
    }
    if (lowered == "verbose" || lowered == "messages")
    {
        return TraceLevel::Verbose;
    }
    return std::nullopt;
}

llvm::Expected<ProxyOptions> parseProxyOptions(const llvm::ArrayRef<std::string> args,
                                               const EnvironmentLookup&          environment)
{
    ProxyOptions options;
    ProxyConfig& config = options.config;

    if (environment)
    {
        if (const auto server = environment("ALPROXY_SERVER"))
        {
            config.serverExecutable = *server;
        }
        if (const auto logFile = environment("ALPROXY_LOG_FILE"))
        {
            config.logFile = *logFile;
        }
        if (const auto trace = environment("ALPROXY_TRACE"))
        {
            if (auto error = applyTraceLevel("ALPROXY_TRACE", *trace, config))
            {
                return std::move(error);
            }
        }
    }

    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const llvm::StringRef arg = args[i];

        // Accept both `--flag value` and `--flag=value`.
        llvm::StringRef            flag = arg;
        llvm::StringRef            body = arg;
        std::optional<std::string> inlineValue;
        if (body.consume_front("--") && body.contains('='))
        {
            const auto [name, value] = body.split('=');
            flag                     = arg.take_front(name.size() + 2U);
            inlineValue              = value.str();
        }
        auto requireValue = [&]() -> llvm::Expected<std::string> {
            if (inlineValue)
            {
                return *inlineValue;
            }
            if (i + 1 >= args.size())
            {
                return makeProxyError(ErrorKind::Validation, "missing value for " + flag);
            }
            return args[++i];
        };

        if (flag == "--help" || flag == "-h")
        {
            options.showHelp = true;
        }
        else if (flag == "--version" || flag == "-V")
        {
            options.showVersion = true;
        }
        else if (flag == "--server")
        {
            auto value = requireValue();
            if (!value)
            {
                return value.takeError();
            }
            config.serverExecutable = std::move(*value);
        }
        else if (flag == "--server-arg")
        {
            auto value = requireValue();
            if (!value)
            {
                return value.takeError();
            }
            config.serverArguments.push_back(std::move(*value));
        }
        else if (flag == "--log-file")
        {
            auto value = requireValue();
            if (!value)
            {
                return value.takeError();
            }
            config.logFile = std::move(*value);
        }
        else if (flag == "--trace")
        {
            auto value = requireValue();
            if (!value)
            {
                return value.takeError();
            }
            if (auto error = applyTraceLevel(flag, *value, config))
            {
                return std::move(error);
            }
        }
        else if (flag == "--request-timeout-ms")
        {
            auto value = requireValue();
            if (!value)
            {
                return value.takeError();
            }
            unsigned milliseconds = 0;
            if (auto error = parsePositive(flag, *value, milliseconds))
            {
                return std::move(error);
            }
            config.requestTimeout = std::chrono::milliseconds(milliseconds);
        }
        else if (flag == "--project-load-interval-ms")
        {
            auto value = requireValue();
            if (!value)
            {
                return value.takeError();
            }
            unsigned milliseconds = 0;
            if (auto error = parseUnsigned(flag, *value, milliseconds))
            {
                return std::move(error);
            }
            config.projectLoad.pollInterval = std::chrono::milliseconds(milliseconds);
        }
        else if (flag == "--project-load-attempts")
        {
            auto value = requireValue();
            if (!value)
            {
                return value.takeError();
            }
            if (auto error = parseUnsigned(flag, *value, config.projectLoad.maxAttempts))
            {
                return std::move(error);
            }
        }
        else if (flag == "--workers")
        {
            auto value = requireValue();
            if (!value)
            {
                return value.takeError();
            }
            unsigned workers = 0;
            if (auto error = parsePositive(flag, *value, workers))
            {
                return std::move(error);
            }
            config.workerCount = workers;
        }
        else
        {
            return makeProxyError(ErrorKind::Validation, "unknown argument: " + llvm::StringRef(args[i]));
        }
    }

    return options;
}

std::string defaultLogFilePath()
{
    llvm::SmallString<256> path;
    llvm::sys::path::system_temp_directory(/*ErasedOnReboot=*/true, path);
    llvm::sys::path::append(path, "al-lsp-proxy.log");
    return std::string(path.str());
}

void printProxyUsage(llvm::raw_ostream& os)
{
    os << "NAME\n"
       << "  alproxyd - protocol proxy in front of the AL language server\n\n"
       << "SYNOPSIS\n"
       << "  alproxyd [options]\n\n"
       << "DESCRIPTION\n"
       << "  alproxyd speaks LSP on stdin/stdout, launches the AL language server shipped with the\n"
       << "  VS Code AL extension, and repairs the server's non-standard request handling.\n\n"
       << "OPTIONS\n"
       << "  --server <path>\n"
       << "      Language-server executable. Default: newest ~/.vscode/extensions/ms-dynamics-smb.al-*.\n"
       << "      Environment: ALPROXY_SERVER.\n"
       << "  --server-arg <arg>\n"
       << "      Extra argument passed to the language server. Repeatable.\n"
       << "  --log-file <path|->\n"
       << "      Log destination ('-' for stderr). Default: " << defaultLogFilePath() << ".\n"
       << "      Environment: ALPROXY_LOG_FILE.\n"
       << "  --trace <off|basic|verbose>\n"
       << "      Log verbosity. Default: basic. Environment: ALPROXY_TRACE.\n"
       << "  --request-timeout-ms <n>\n"
       << "      Timeout for each request sent to the language server. Default: 30000.\n"
       << "  --project-load-interval-ms <n>\n"
       << "      Delay between project-load polls. Default: 500.\n"
       << "  --project-load-attempts <n>\n"
       << "      Maximum number of project-load polls. Default: 10.\n"
       << "  --workers <n>\n"
       << "      Client-request worker threads. Default: 4.\n"
       << "  --version, -V\n"
       << "      Print the version and exit.\n"
       << "  --help, -h\n"
       << "      Print this help text.\n";
}

}  // namespace alproxy::lsp
