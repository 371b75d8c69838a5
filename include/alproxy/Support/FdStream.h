//===----------------------------------------------------------------------===//
//
// Part of the alproxy project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// `std::iostream` adapters over POSIX file descriptors.
///
/// Pipes to the language-server child process are exposed through these so the
/// JSON-RPC transport can treat every connection as a pair of standard streams.
///
//===----------------------------------------------------------------------===//
#ifndef ALPROXY_SUPPORT_FD_STREAM_H
#define ALPROXY_SUPPORT_FD_STREAM_H

#include <array>
#include <atomic>
#include <istream>
#include <ostream>
#include <streambuf>

namespace alproxy
{

/// @brief Unidirectional stream buffer over a file descriptor.
class FdStreamBuffer final : public std::streambuf
{
public:
    /// @brief Wraps a descriptor.
    /// @param[in] fd Descriptor to read from or write to.
    /// @param[in] ownsFd Closes `fd` on destruction (or `close()`) when true.
    FdStreamBuffer(int fd, bool ownsFd);
    ~FdStreamBuffer() override;

    FdStreamBuffer(const FdStreamBuffer&)            = delete;
    FdStreamBuffer& operator=(const FdStreamBuffer&) = delete;

    /// @brief Flushes pending output and closes an owned descriptor.
    void close();

    /// @brief Creates the wake-up pipe that lets `interrupt()` end a blocking read.
    /// @return `false` when the pipe cannot be created.
    bool enableInterrupt();

    /// @brief Makes a pending or future read report end-of-file. Thread-safe.
    void interrupt();

    [[nodiscard]] int fd() const
    {
        return fd_;
    }

protected:
    int_type underflow() override;
    int_type overflow(int_type ch) override;
    int      sync() override;

private:
    bool flushOutput();

    static constexpr std::size_t BufferSize = 64U * 1024U;

    int                          fd_;
    bool                         ownsFd_;
    int                          wakeReadFd_{-1};
    int                          wakeWriteFd_{-1};
    std::atomic<bool>            interrupted_{false};
    std::array<char, BufferSize> input_{};
    std::array<char, BufferSize> output_{};
};

/// @brief Input stream reading from a file descriptor.
///
/// Reads can be ended from another thread with `interrupt()`, which is how a
/// session releases a reader parked on a peer that never closes.
class FdInputStream final : public std::istream
{
public:
    FdInputStream(int fd, bool ownsFd);

    /// @brief Closes an owned descriptor.
    void close()
    {
        buffer_.close();
    }

    /// @brief Ends a blocked or future read with end-of-file.
    void interrupt()
    {
        buffer_.interrupt();
    }

private:
    FdStreamBuffer buffer_;
};

/// @brief Output stream writing to a file descriptor.
class FdOutputStream final : public std::ostream
{
public:
    FdOutputStream(int fd, bool ownsFd);

    /// @brief Flushes and closes an owned descriptor.
    void close()
    {
        buffer_.close();
    }

private:
    FdStreamBuffer buffer_;
};

}  // namespace alproxy

#endif  // ALPROXY_SUPPORT_FD_STREAM_H
