//===----------------------------------------------------------------------===//
//
// Part of the alproxy project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the client-request worker pool.
///
//===----------------------------------------------------------------------===//

#include "alproxy/LSP/RequestScheduler.h"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace alproxy::lsp
{

class RequestScheduler::Impl final
{
public:
    explicit Impl(const std::size_t workerCount)
    {
        const std::size_t count = std::max<std::size_t>(1U, workerCount);
        workers_.reserve(count);
        for (std::size_t i = 0; i < count; ++i)
        {
            workers_.emplace_back([this]() { run(); });
        }
    }

    ~Impl()
    {
        shutdown();
    }

    bool enqueue(std::string requestKey, std::string method, RequestTask task, RequestCompletion completion)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_)
        {
            return false;
        }
        if (requestStates_.contains(requestKey))
        {
            return false;
        }

        auto state = std::make_shared<RequestState>();
        requestStates_.emplace(requestKey, state);
        queue_.push_back(WorkItem{std::move(requestKey),
                                  std::move(method),
                                  std::move(task),
                                  std::move(completion),
                                  std::move(state)});
        cv_.notify_one();
        return true;
    }

    bool cancel(const std::string& requestKey)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto                  it = requestStates_.find(requestKey);
        if (it == requestStates_.end() || it->second->started)
        {
            return false;
        }
        it->second->cancelled = true;
        return true;
    }

    void shutdown()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_)
            {
                return;
            }
            stopping_ = true;
            for (const auto& [_, state] : requestStates_)
            {
                if (!state->started)
                {
                    state->cancelled = true;
                }
            }
        }
        cv_.notify_all();
        for (auto& worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
    }

    std::size_t workerCount() const
    {
        return workers_.size();
    }

private:
    struct RequestState final
    {
        bool started{false};
        bool cancelled{false};
    };

    struct WorkItem final
    {
        std::string                   requestKey;
        std::string                   method;
        RequestTask                   task;
        RequestCompletion             completion;
        std::shared_ptr<RequestState> state;
    };

    void run()
    {
        while (true)
        {
            WorkItem item;
            bool     cancelled = false;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
                if (queue_.empty())
                {
                    return;
                }
                item = std::move(queue_.front());
                queue_.pop_front();
                cancelled           = item.state->cancelled;
                item.state->started = true;
            }

            RequestTaskResult result;
            const auto        start = std::chrono::steady_clock::now();
            if (cancelled)
            {
                result.status = RequestTaskStatus::Cancelled;
            }
            else
            {
                try
                {
                    result.payload = item.task();
                    result.status  = RequestTaskStatus::Completed;
                } catch (const std::exception& ex)
                {
                    result.status       = RequestTaskStatus::Failed;
                    result.errorMessage = ex.what();
                } catch (...)
                {
                    result.status       = RequestTaskStatus::Failed;
                    result.errorMessage = "unknown exception";
                }
            }
            const auto finish = std::chrono::steady_clock::now();

            {
                std::lock_guard<std::mutex> lock(mutex_);
                requestStates_.erase(item.requestKey);
            }

            if (item.completion)
            {
                const auto latencyMicros =
                    std::chrono::duration_cast<std::chrono::microseconds>(finish - start).count();
                item.completion(std::move(result), static_cast<std::uint64_t>(latencyMicros));
            }
        }
    }

    std::mutex                                                     mutex_;
    std::condition_variable                                        cv_;
    std::deque<WorkItem>                                           queue_;
    std::unordered_map<std::string, std::shared_ptr<RequestState>> requestStates_;
    bool                                                           stopping_{false};
    std::vector<std::thread>                                       workers_;
};

RequestScheduler::RequestScheduler(const std::size_t workerCount)
    : impl_(std::make_unique<Impl>(workerCount))
{
}

RequestScheduler::~RequestScheduler() = default;

bool RequestScheduler::enqueue(std::string       requestKey,
                               std::string       method,
                               RequestTask       task,
                               RequestCompletion completion)
{
    return impl_->enqueue(std::move(requestKey), std::move(method), std::move(task), std::move(completion));
}

bool RequestScheduler::cancel(const std::string& requestKey)
{
    return impl_->cancel(requestKey);
}

void RequestScheduler::shutdown()
{
    impl_->shutdown();
}

std::size_t RequestScheduler::workerCount() const
{
    return impl_->workerCount();
}

}  // namespace alproxy::lsp
