//===----------------------------------------------------------------------===//
//
// Part of the alproxy project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Child process hosting the wrapped language server.
///
/// The child's stdin/stdout become the server-facing JSON-RPC streams and its
/// stderr is exposed for draining into the log. The child runs in its own
/// process group and, on Linux, receives SIGTERM when the proxy dies.
///
//===----------------------------------------------------------------------===//
#ifndef ALPROXY_SUPPORT_SERVER_PROCESS_H
#define ALPROXY_SUPPORT_SERVER_PROCESS_H

#include "alproxy/Support/FdStream.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <istream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>

namespace alproxy
{

/// @brief Running language-server child with piped standard streams.
class ServerProcess final
{
public:
    /// @brief Launches the server executable.
    /// @param[in] executable Absolute path of the server binary.
    /// @param[in] arguments Extra arguments (argv[1..]).
    /// @param[in] workingDirectory Directory the child starts in; empty keeps ours.
    /// @return Running process, or an I/O error when pipes, fork, or exec fail.
    [[nodiscard]] static llvm::Expected<std::unique_ptr<ServerProcess>> spawn(llvm::StringRef                executable,
                                                                              llvm::ArrayRef<std::string>    arguments,
                                                                              llvm::StringRef workingDirectory);

    ~ServerProcess();

    ServerProcess(const ServerProcess&)            = delete;
    ServerProcess& operator=(const ServerProcess&) = delete;

    /// @brief Stream connected to the child's stdout.
    std::istream& output()
    {
        return stdout_;
    }

    /// @brief Stream connected to the child's stdin.
    std::ostream& input()
    {
        return stdin_;
    }

    /// @brief Stream connected to the child's stderr.
    std::istream& diagnostics()
    {
        return stderr_;
    }

    [[nodiscard]] int pid() const
    {
        return pid_;
    }

    /// @brief Best-effort termination: SIGTERM to the process group, a short
    /// grace period, then SIGKILL. Safe to call more than once.
    void terminate();

private:
    ServerProcess(int pid, int stdinFd, int stdoutFd, int stderrFd);

    std::mutex     mutex_;
    int            pid_;
    bool           reaped_{false};
    FdOutputStream stdin_;
    FdInputStream  stdout_;
    FdInputStream  stderr_;
};

}  // namespace alproxy

#endif  // ALPROXY_SUPPORT_SERVER_PROCESS_H
