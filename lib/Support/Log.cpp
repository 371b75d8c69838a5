//===----------------------------------------------------------------------===//
//
// Part of the alproxy project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the timestamped diagnostic log.
///
//===----------------------------------------------------------------------===//

#include "alproxy/Support/Log.h"

#include "alproxy/Support/Error.h"
#include "llvm/Support/Chrono.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/FormatVariadic.h"

#include <chrono>
#include <system_error>
#include <utility>

namespace alproxy
{

Logger::Logger(llvm::raw_ostream& stream, const TraceLevel level)
    : stream_(&stream)
    , level_(level)
{
}

Logger::Logger(std::unique_ptr<llvm::raw_ostream> stream, const TraceLevel level)
    : owned_(std::move(stream))
    , stream_(owned_.get())
    , level_(level)
{
}

llvm::Expected<std::unique_ptr<Logger>> Logger::openFile(const llvm::StringRef path, const TraceLevel level)
{
    std::error_code ec;
    auto            stream = std::make_unique<llvm::raw_fd_ostream>(path, ec, llvm::sys::fs::OF_Append);
    if (ec)
    {
        return makeProxyError(ErrorKind::Io, "failed to open log file " + path + ": " + ec.message());
    }
    return std::make_unique<Logger>(std::move(stream), level);
}

void Logger::setLevel(const TraceLevel level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

TraceLevel Logger::level() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::error(const llvm::Twine& message)
{
    write("error: " + message);
}

void Logger::info(const llvm::Twine& message)
{
    if (level() != TraceLevel::Off)
    {
        write(message);
    }
}

void Logger::verbose(const llvm::Twine& message)
{
    if (isVerbose())
    {
        write(message);
    }
}

void Logger::write(const llvm::Twine& message)
{
    const auto now = std::chrono::time_point_cast<std::chrono::nanoseconds>(std::chrono::system_clock::now());

    std::lock_guard<std::mutex> lock(mutex_);
    *stream_ << "[" << llvm::formatv("{0:%Y-%m-%d %H:%M:%S.%L}", llvm::sys::TimePoint<>(now)) << "] " << message
             << "\n";
    stream_->flush();
}

}  // namespace alproxy
