//===----------------------------------------------------------------------===//
//
// Part of the alproxy project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Timestamped, thread-safe diagnostic log.
///
/// stdout carries protocol traffic, so the log goes to a file or stderr.
///
//===----------------------------------------------------------------------===//
#ifndef ALPROXY_SUPPORT_LOG_H
#define ALPROXY_SUPPORT_LOG_H

#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include <memory>
#include <mutex>

namespace alproxy
{

/// @brief Trace verbosity level for proxy logs.
enum class TraceLevel
{
    /// @brief Only errors are written.
    Off,

    /// @brief Lifecycle, state preparation, and fallback events.
    Basic,

    /// @brief Per-message traffic in both directions.
    Verbose,
};

/// @brief Line-oriented logger shared by both read loops and handler workers.
class Logger final
{
public:
    /// @brief Creates a logger over a caller-owned stream.
    /// @param[in] stream Destination stream; must outlive the logger.
    /// @param[in] level Initial trace level.
    explicit Logger(llvm::raw_ostream& stream, TraceLevel level = TraceLevel::Basic);

    /// @brief Creates a logger that owns its destination stream.
    /// @param[in] stream Owned destination stream.
    /// @param[in] level Initial trace level.
    Logger(std::unique_ptr<llvm::raw_ostream> stream, TraceLevel level);

    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    /// @brief Opens (appending) a log file.
    /// @param[in] path Log file path.
    /// @param[in] level Initial trace level.
    /// @return Logger, or an I/O error when the file cannot be opened.
    [[nodiscard]] static llvm::Expected<std::unique_ptr<Logger>> openFile(llvm::StringRef path, TraceLevel level);

    void       setLevel(TraceLevel level);
    TraceLevel level() const;

    /// @brief Returns whether per-message traffic should be logged.
    [[nodiscard]] bool isVerbose() const
    {
        return level() == TraceLevel::Verbose;
    }

    void error(const llvm::Twine& message);
    void info(const llvm::Twine& message);
    void verbose(const llvm::Twine& message);

private:
    void write(const llvm::Twine& message);

    mutable std::mutex                 mutex_;
    std::unique_ptr<llvm::raw_ostream> owned_;
    llvm::raw_ostream*                 stream_;
    TraceLevel                         level_;
};

}  // namespace alproxy

#endif  // ALPROXY_SUPPORT_LOG_H
