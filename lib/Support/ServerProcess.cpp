//===----------------------------------------------------------------------===//
//
// Part of the alproxy project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the language-server child process.
///
//===----------------------------------------------------------------------===//

#include "alproxy/Support/ServerProcess.h"

#include "alproxy/Support/Error.h"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

#ifdef __linux__
#include <sys/prctl.h>
#endif

namespace alproxy
{
namespace
{

constexpr auto TerminateGracePeriod = std::chrono::milliseconds(2000);
constexpr auto TerminatePollStep    = std::chrono::milliseconds(50);

/// Pipe pair whose unclaimed ends are closed on scope exit.
struct PipePair final
{
    int readFd{-1};
    int writeFd{-1};

    ~PipePair()
    {
        closeRead();
        closeWrite();
    }

    bool open()
    {
        int fds[2] = {-1, -1};
        if (::pipe(fds) != 0)
        {
            return false;
        }
        readFd  = fds[0];
        writeFd = fds[1];
        (void) ::fcntl(readFd, F_SETFD, FD_CLOEXEC);
        (void) ::fcntl(writeFd, F_SETFD, FD_CLOEXEC);
        return true;
    }

    void closeRead()
    {
        if (readFd >= 0)
        {
            ::close(readFd);
            readFd = -1;
        }
    }

    void closeWrite()
    {
        if (writeFd >= 0)
        {
            ::close(writeFd);
            writeFd = -1;
        }
    }

    int releaseRead()
    {
        const int fd = readFd;
        readFd       = -1;
        return fd;
    }

    int releaseWrite()
    {
        const int fd = writeFd;
        writeFd      = -1;
        return fd;
    }
};

/// Runs in the forked child; only async-signal-safe calls are allowed here.
[[noreturn]] void execChild(const char*                 executable,
                            const std::vector<char*>&   argv,
                            const char*                 workingDirectory,
                            const PipePair&             stdinPipe,
                            const PipePair&             stdoutPipe,
                            const PipePair&             stderrPipe,
                            const int                   statusFd)
{
    (void) ::setpgid(0, 0);
#ifdef __linux__
    (void) ::prctl(PR_SET_PDEATHSIG, SIGTERM);
#endif
    ::signal(SIGPIPE, SIG_DFL);

    if (::dup2(stdinPipe.readFd, STDIN_FILENO) < 0 || ::dup2(stdoutPipe.writeFd, STDOUT_FILENO) < 0 ||
        ::dup2(stderrPipe.writeFd, STDERR_FILENO) < 0)
    {
        const int error = errno;
        (void) ::write(statusFd, &error, sizeof(error));
        ::_exit(127);
    }
    if (workingDirectory != nullptr && ::chdir(workingDirectory) != 0)
    {
        const int error = errno;
        (void) ::write(statusFd, &error, sizeof(error));
        ::_exit(127);
    }

    ::execv(executable, argv.data());

    const int error = errno;
    (void) ::write(statusFd, &error, sizeof(error));
    ::_exit(127);
}

}  // namespace

ServerProcess::ServerProcess(const int pid, const int stdinFd, const int stdoutFd, const int stderrFd)
    : pid_(pid)
    , stdin_(stdinFd, true)
    , stdout_(stdoutFd, true)
    , stderr_(stderrFd, true)
{
}

ServerProcess::~ServerProcess()
{
    terminate();
    stdout_.close();
    stderr_.close();
}

llvm::Expected<std::unique_ptr<ServerProcess>> ServerProcess::spawn(const llvm::StringRef             executable,
                                                                    const llvm::ArrayRef<std::string> arguments,
                                                                    const llvm::StringRef             workingDirectory)
{
    PipePair stdinPipe;
    PipePair stdoutPipe;
    PipePair stderrPipe;
    PipePair statusPipe;
    if (!stdinPipe.open() || !stdoutPipe.open() || !stderrPipe.open() || !statusPipe.open())
    {
        return makeProxyError(ErrorKind::Io, llvm::Twine("failed to create server pipes: ") + std::strerror(errno));
    }

    // Everything the child touches is prepared before fork.
    const std::string        executablePath = executable.str();
    const std::string        directory      = workingDirectory.str();
    std::vector<std::string> argvStorage;
    argvStorage.reserve(arguments.size() + 1U);
    argvStorage.push_back(executablePath);
    argvStorage.insert(argvStorage.end(), arguments.begin(), arguments.end());
    std::vector<char*> argv;
    argv.reserve(argvStorage.size() + 1U);
    for (std::string& argument : argvStorage)
    {
        argv.push_back(argument.data());
    }
    argv.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0)
    {
        return makeProxyError(ErrorKind::Io, llvm::Twine("failed to fork server process: ") + std::strerror(errno));
    }
    if (pid == 0)
    {
        execChild(executablePath.c_str(),
                  argv,
                  directory.empty() ? nullptr : directory.c_str(),
                  stdinPipe,
                  stdoutPipe,
                  stderrPipe,
                  statusPipe.writeFd);
    }

    stdinPipe.closeRead();
    stdoutPipe.closeWrite();
    stderrPipe.closeWrite();
    statusPipe.closeWrite();

    // The status pipe closes on a successful exec and carries errno otherwise.
    int     childErrno = 0;
    ssize_t count      = 0;
    do
    {
        count = ::read(statusPipe.readFd, &childErrno, sizeof(childErrno));
    } while (count < 0 && errno == EINTR);
    if (count == static_cast<ssize_t>(sizeof(childErrno)))
    {
        int status = 0;
        (void) ::waitpid(pid, &status, 0);
        return makeProxyError(ErrorKind::Io,
                              "failed to launch language server " + executable + ": " + std::strerror(childErrno));
    }

    return std::unique_ptr<ServerProcess>(
        new ServerProcess(pid, stdinPipe.releaseWrite(), stdoutPipe.releaseRead(), stderrPipe.releaseRead()));
}

void ServerProcess::terminate()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (reaped_)
    {
        return;
    }
    stdin_.close();

    int status = 0;
    if (::waitpid(pid_, &status, WNOHANG) == pid_)
    {
        reaped_ = true;
        return;
    }

    (void) ::kill(-pid_, SIGTERM);
    (void) ::kill(pid_, SIGTERM);
    const auto deadline = std::chrono::steady_clock::now() + TerminateGracePeriod;
    while (std::chrono::steady_clock::now() < deadline)
    {
        const pid_t result = ::waitpid(pid_, &status, WNOHANG);
        if (result == pid_ || (result < 0 && errno == ECHILD))
        {
            reaped_ = true;
            return;
        }
        std::this_thread::sleep_for(TerminatePollStep);
    }

    (void) ::kill(-pid_, SIGKILL);
    (void) ::kill(pid_, SIGKILL);
    (void) ::waitpid(pid_, &status, 0);
    reaped_ = true;
}

}  // namespace alproxy
