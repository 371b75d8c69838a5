//===----------------------------------------------------------------------===//
//
// Part of the alproxy project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Entry point for the `alproxyd` AL language-server proxy.
///
/// The process speaks LSP on stdio, launches the AL language server as a child
/// process, and runs a proxy session between the two.
///
//===----------------------------------------------------------------------===//

#include "alproxy/LSP/JsonRpcIO.h"
#include "alproxy/LSP/ProxyConfig.h"
#include "alproxy/LSP/ProxySession.h"
#include "alproxy/Support/FdStream.h"
#include "alproxy/Support/Log.h"
#include "alproxy/Support/ServerLocator.h"
#include "alproxy/Support/ServerProcess.h"
#include "alproxy/Version.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"

#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace
{

std::unique_ptr<alproxy::Logger> openLogger(const alproxy::lsp::ProxyConfig& config)
{
    if (config.logFile == "-")
    {
        return std::make_unique<alproxy::Logger>(llvm::errs(), config.traceLevel);
    }

    const std::string path   = config.logFile.empty() ? alproxy::lsp::defaultLogFilePath() : config.logFile;
    auto              logger = alproxy::Logger::openFile(path, config.traceLevel);
    if (!logger)
    {
        llvm::errs() << "[alproxyd] " << llvm::toString(logger.takeError()) << "; logging to stderr\n";
        return std::make_unique<alproxy::Logger>(llvm::errs(), config.traceLevel);
    }
    return std::move(*logger);
}

}  // namespace

int main(int argc, char** argv)
{
    llvm::InitLLVM y(argc, argv);
    // A closed client or server pipe surfaces as a write error instead.
    ::signal(SIGPIPE, SIG_IGN);

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
    {
        args.emplace_back(argv[i]);
    }

    auto options = alproxy::lsp::parseProxyOptions(args, alproxy::lsp::processEnvironment);
    if (!options)
    {
        llvm::errs() << "alproxyd: " << llvm::toString(options.takeError()) << "\n";
        alproxy::lsp::printProxyUsage(llvm::errs());
        return 2;
    }
    if (options->showHelp)
    {
        alproxy::lsp::printProxyUsage(llvm::outs());
        return 0;
    }
    if (options->showVersion)
    {
        llvm::outs() << "alproxyd " << alproxy::kVersionString << "\n";
        return 0;
    }

    alproxy::lsp::ProxyConfig config = std::move(options->config);
    const auto                logger = openLogger(config);
    logger->info(llvm::Twine("alproxyd ") + alproxy::kVersionString + " starting");

    std::string executable = config.serverExecutable;
    if (executable.empty())
    {
        auto located = alproxy::locateServerExecutable();
        if (!located)
        {
            logger->error(llvm::toString(located.takeError()));
            return 1;
        }
        executable = std::move(*located);
    }

    // <extension>/bin/<platform>/<host>: the server runs from the extension directory.
    const std::string workingDirectory =
        llvm::sys::path::parent_path(llvm::sys::path::parent_path(llvm::sys::path::parent_path(executable))).str();
    logger->info("language server: " + executable);

    auto process = alproxy::ServerProcess::spawn(executable, config.serverArguments, workingDirectory);
    if (!process)
    {
        logger->error(llvm::toString(process.takeError()));
        return 1;
    }
    alproxy::ServerProcess& server = **process;
    logger->info(llvm::formatv("language server started with pid {0}", server.pid()));

    std::thread stderrDrain([&server, &logger]() {
        std::string line;
        while (std::getline(server.diagnostics(), line))
        {
            logger->info("[server stderr] " + line);
        }
    });

    // stdin is read through a descriptor stream so the session can end a read
    // still blocked when the language server exits first.
    alproxy::FdInputStream               clientInput(STDIN_FILENO, false);
    alproxy::lsp::JsonRpcStreamTransport clientTransport(clientInput, std::cout);
    alproxy::lsp::JsonRpcStreamTransport serverTransport(server.output(), server.input());

    int exitCode = 1;
    {
        alproxy::lsp::ProxySession session(
            clientTransport,
            serverTransport,
            config,
            *logger,
            [&server]() { server.terminate(); },
            [&clientInput]() { clientInput.interrupt(); },
            [&logger](const alproxy::lsp::RequestMetric& metric) {
                logger->verbose(llvm::formatv("[telemetry] method={0} latency_us={1} outcome={2}",
                                              metric.method,
                                              metric.latencyMicros,
                                              alproxy::lsp::requestOutcomeName(metric.outcome)));
            });
        exitCode = session.run();
    }

    // The child's stderr reaches EOF once it has been terminated.
    stderrDrain.join();
    logger->info(llvm::formatv("alproxyd exiting with code {0}", exitCode));
    return exitCode;
}
