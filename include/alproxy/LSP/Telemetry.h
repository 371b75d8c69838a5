//===----------------------------------------------------------------------===//
//
// Part of the alproxy project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Request telemetry aggregation and sink integration.
///
/// This module records client-request latency and outcome, counts handler
/// fallbacks per method, and forwards samples to an optional sink.
///
//===----------------------------------------------------------------------===//
#ifndef ALPROXY_LSP_TELEMETRY_H
#define ALPROXY_LSP_TELEMETRY_H

#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace alproxy::lsp
{

/// @brief Final state of a client request.
enum class RequestOutcome
{
    Completed,
    Failed,
    Cancelled,
};

/// @brief Returns a lower-case outcome name.
[[nodiscard]] llvm::StringRef requestOutcomeName(RequestOutcome outcome);

/// @brief Immutable telemetry sample for a completed request.
struct RequestMetric final
{
    /// @brief LSP method name.
    std::string method;

    /// @brief Request latency in microseconds.
    std::uint64_t latencyMicros{0};

    /// @brief How the request ended.
    RequestOutcome outcome{RequestOutcome::Completed};
};

/// @brief Sink callback invoked for each telemetry sample.
using RequestMetricSink = std::function<void(const RequestMetric&)>;

/// @brief Thread-safe request telemetry recorder.
class Telemetry final
{
public:
    /// @brief Sets the sink callback for newly recorded metrics.
    /// @param[in] sink Sink callback. Empty sink disables forwarding.
    void setSink(RequestMetricSink sink);

    /// @brief Records one request metric sample.
    /// @param[in] method LSP method name.
    /// @param[in] latencyMicros Elapsed time in microseconds.
    /// @param[in] outcome How the request ended.
    void record(std::string method, std::uint64_t latencyMicros, RequestOutcome outcome);

    /// @brief Counts one handler fallback (e.g. `al/symbolSearch`) for a method.
    void recordFallback(std::string method);

    /// @brief Returns total recorded request count for the method.
    /// @param[in] method LSP method name.
    /// @return Number of samples recorded for `method`.
    [[nodiscard]] std::uint64_t requestCount(std::string_view method) const;

    /// @brief Returns the number of fallbacks recorded for the method.
    [[nodiscard]] std::uint64_t fallbackCount(std::string_view method) const;

private:
    mutable std::mutex                             mutex_;
    RequestMetricSink                              sink_;
    std::unordered_map<std::string, std::uint64_t> requestCounts_;
    std::unordered_map<std::string, std::uint64_t> fallbackCounts_;
};

}  // namespace alproxy::lsp

#endif  // ALPROXY_LSP_TELEMETRY_H
