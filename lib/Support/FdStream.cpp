//===----------------------------------------------------------------------===//
//
// Part of the alproxy project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements descriptor-backed stream buffers.
///
//===----------------------------------------------------------------------===//

#include "alproxy/Support/FdStream.h"

#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace alproxy
{

FdStreamBuffer::FdStreamBuffer(const int fd, const bool ownsFd)
    : fd_(fd)
    , ownsFd_(ownsFd)
{
    setg(input_.data(), input_.data(), input_.data());
    setp(output_.data(), output_.data() + output_.size());
}

FdStreamBuffer::~FdStreamBuffer()
{
    close();
    if (wakeReadFd_ >= 0)
    {
        ::close(wakeReadFd_);
    }
    if (wakeWriteFd_ >= 0)
    {
        ::close(wakeWriteFd_);
    }
}

bool FdStreamBuffer::enableInterrupt()
{
    if (wakeReadFd_ >= 0)
    {
        return true;
    }
    int fds[2] = {-1, -1};
    if (::pipe(fds) != 0)
    {
        return false;
    }
    (void) ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    (void) ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    wakeReadFd_  = fds[0];
    wakeWriteFd_ = fds[1];
    return true;
}

void FdStreamBuffer::interrupt()
{
    if (interrupted_.exchange(true))
    {
        return;
    }
    if (wakeWriteFd_ >= 0)
    {
        const char byte = 0;
        ssize_t    count = 0;
        do
        {
            count = ::write(wakeWriteFd_, &byte, 1U);
        } while (count < 0 && errno == EINTR);
    }
}

void FdStreamBuffer::close()
{
    if (fd_ < 0)
    {
        return;
    }
    (void) flushOutput();
    if (ownsFd_)
    {
        ::close(fd_);
    }
    fd_ = -1;
}

FdStreamBuffer::int_type FdStreamBuffer::underflow()
{
    if (gptr() < egptr())
    {
        return traits_type::to_int_type(*gptr());
    }
    if (fd_ < 0 || interrupted_.load())
    {
        return traits_type::eof();
    }

    if (wakeReadFd_ >= 0)
    {
        pollfd fds[2] = {{fd_, POLLIN, 0}, {wakeReadFd_, POLLIN, 0}};
        int    ready  = 0;
        do
        {
            ready = ::poll(fds, 2U, -1);
        } while (ready < 0 && errno == EINTR);
        if (ready < 0 || (fds[1].revents != 0) || interrupted_.load())
        {
            return traits_type::eof();
        }
    }

    ssize_t count = 0;
    do
    {
        count = ::read(fd_, input_.data(), input_.size());
    } while (count < 0 && errno == EINTR);

    if (count <= 0)
    {
        return traits_type::eof();
    }
    setg(input_.data(), input_.data(), input_.data() + count);
    return traits_type::to_int_type(*gptr());
}

FdStreamBuffer::int_type FdStreamBuffer::overflow(const int_type ch)
{
    if (!flushOutput())
    {
        return traits_type::eof();
    }
    if (traits_type::eq_int_type(ch, traits_type::eof()))
    {
        return traits_type::not_eof(ch);
    }
    *pptr() = traits_type::to_char_type(ch);
    pbump(1);
    return ch;
}

int FdStreamBuffer::sync()
{
    return flushOutput() ? 0 : -1;
}

bool FdStreamBuffer::flushOutput()
{
    const char* data      = pbase();
    std::size_t remaining = static_cast<std::size_t>(pptr() - pbase());
    setp(output_.data(), output_.data() + output_.size());
    if (remaining == 0U)
    {
        return true;
    }
    if (fd_ < 0)
    {
        return false;
    }

    while (remaining > 0U)
    {
        const ssize_t written = ::write(fd_, data, remaining);
        if (written < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return false;
        }
        data += written;
        remaining -= static_cast<std::size_t>(written);
    }
    return true;
}

FdInputStream::FdInputStream(const int fd, const bool ownsFd)
    : std::istream(nullptr)
    , buffer_(fd, ownsFd)
{
    // Without the wake-up pipe `interrupt()` still ends the next read.
    (void) buffer_.enableInterrupt();
    rdbuf(&buffer_);
}

FdOutputStream::FdOutputStream(const int fd, const bool ownsFd)
    : std::ostream(nullptr)
    , buffer_(fd, ownsFd)
{
    rdbuf(&buffer_);
}

}  // namespace alproxy
