//===----------------------------------------------------------------------===//
//
// Part of the alproxy project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements request telemetry recording and sink forwarding.
///
//===----------------------------------------------------------------------===//

#include "alproxy/LSP/Telemetry.h"

#include <utility>

namespace alproxy::lsp
{

llvm::StringRef requestOutcomeName(const RequestOutcome outcome)
{
    switch (outcome)
    {
    case RequestOutcome::Completed:
        return "completed";
    case RequestOutcome::Failed:
        return "failed";
    case RequestOutcome::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

void Telemetry::setSink(RequestMetricSink sink)
{
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Telemetry::record(std::string method, const std::uint64_t latencyMicros, const RequestOutcome outcome)
{
    RequestMetricSink sink;
    RequestMetric     metric{method, latencyMicros, outcome};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++requestCounts_[std::move(method)];
        sink = sink_;
    }
    if (sink)
    {
        sink(metric);
    }
}

void Telemetry::recordFallback(std::string method)
{
    std::lock_guard<std::mutex> lock(mutex_);
    ++fallbackCounts_[std::move(method)];
}

std::uint64_t Telemetry::requestCount(const std::string_view method) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  it = requestCounts_.find(std::string(method));
    return it == requestCounts_.end() ? 0U : it->second;
}

std::uint64_t Telemetry::fallbackCount(const std::string_view method) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  it = fallbackCounts_.find(std::string(method));
    return it == fallbackCounts_.end() ? 0U : it->second;
}

}  // namespace alproxy::lsp
