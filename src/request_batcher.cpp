#include "request_batcher.hpp"
#include "errors.hpp"
#include "logging.hpp"

#include <algorithm>
#include <exception>

namespace tollgate {

void to_json(nlohmann::json& j, const BatchStats& stats) {
    j = nlohmann::json{
        {"batches_executed", stats.batches_executed},
        {"items_batched", stats.items_batched},
        {"size_flushes", stats.size_flushes},
        {"timer_flushes", stats.timer_flushes},
        {"timeouts", stats.timeouts},
        {"failures", stats.failures},
        {"pending_groups", stats.pending_groups},
    };
}

RequestBatcher::RequestBatcher(const BatchConfig& config)
    : config_(config) {
    if (config_.enabled) {
        flusher_ = std::thread(&RequestBatcher::flusher_loop, this);
    }
}

RequestBatcher::~RequestBatcher() {
    stop();
}

nlohmann::json RequestBatcher::enqueue(const std::string& batch_key,
                                       nlohmann::json item,
                                       Executor execute) {
    if (!config_.enabled) {
        std::vector<nlohmann::json> single{std::move(item)};
        auto results = execute(single);
        if (results.size() != 1) {
            throw BatchError("executor returned " + std::to_string(results.size()) +
                             " results for 1 item");
        }
        return std::move(results.front());
    }

    std::future<nlohmann::json> result;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw BatchError("batcher is stopped");
        }

        auto it = groups_.find(batch_key);
        if (it == groups_.end()) {
            Group group;
            group.execute = std::move(execute);
            group.deadline = Clock::now() +
                             std::chrono::duration_cast<Clock::duration>(config_.batch_timeout);
            it = groups_.emplace(batch_key, std::move(group)).first;
            wake_.notify_one();
        }

        PendingItem pending;
        pending.payload = std::move(item);
        result = pending.promise.get_future();
        it->second.items.push_back(std::move(pending));

        // Full group: flush now, the timer no longer applies
        if (it->second.items.size() >= config_.max_batch_size) {
            Group full = std::move(it->second);
            groups_.erase(it);
            ++size_flushes_;
            launch_locked(batch_key, std::move(full));
        }
    }

    if (result.wait_for(config_.batch_max_wait) == std::future_status::timeout) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++timeouts_;
        }
        throw BatchTimeout("no result for batch '" + batch_key + "' within " +
                           std::to_string(config_.batch_max_wait.count()) + "s");
    }
    return result.get();
}

void RequestBatcher::launch_locked(const std::string& batch_key, Group group) {
    running_.erase(std::remove_if(running_.begin(), running_.end(),
                                  [](const std::future<void>& task) {
                                      return task.wait_for(std::chrono::seconds(0)) ==
                                             std::future_status::ready;
                                  }),
                   running_.end());

    running_.push_back(std::async(std::launch::async,
                                  [this, batch_key, g = std::move(group)]() mutable {
                                      execute_group(batch_key, std::move(g));
                                  }));
}

void RequestBatcher::execute_group(const std::string& batch_key, Group group) {
    if (group.items.empty()) {
        return;
    }

    std::vector<nlohmann::json> payloads;
    payloads.reserve(group.items.size());
    for (auto& item : group.items) {
        payloads.push_back(item.payload);
    }

    logging::debug("batch '", batch_key, "': executing ", payloads.size(), " items");

    std::vector<nlohmann::json> results;
    std::exception_ptr failure;
    try {
        results = group.execute(payloads);
        if (results.size() != payloads.size()) {
            throw BatchError("executor returned " + std::to_string(results.size()) +
                             " results for " + std::to_string(payloads.size()) + " items");
        }
    } catch (...) {
        failure = std::current_exception();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++batches_executed_;
        items_batched_ += payloads.size();
        if (failure) ++failures_;
    }

    if (failure) {
        for (auto& item : group.items) {
            item.promise.set_exception(failure);
        }
        return;
    }

    for (size_t i = 0; i < group.items.size(); ++i) {
        group.items[i].promise.set_value(std::move(results[i]));
    }
}

void RequestBatcher::flusher_loop() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (!stopping_) {
        if (groups_.empty()) {
            wake_.wait(lock);
            continue;
        }

        auto next_deadline = Clock::time_point::max();
        for (const auto& entry : groups_) {
            next_deadline = std::min(next_deadline, entry.second.deadline);
        }

        if (Clock::now() < next_deadline) {
            wake_.wait_until(lock, next_deadline);
            continue;
        }

        auto now = Clock::now();
        for (auto it = groups_.begin(); it != groups_.end();) {
            if (it->second.deadline <= now) {
                launch_locked(it->first, std::move(it->second));
                it = groups_.erase(it);
                ++timer_flushes_;
            } else {
                ++it;
            }
        }
    }
}

void RequestBatcher::stop() {
    std::map<std::string, Group> abandoned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
        abandoned.swap(groups_);
        wake_.notify_all();
    }

    if (flusher_.joinable()) {
        flusher_.join();
    }

    // No task can be launched once stopping_ is set and the flusher is gone
    std::vector<std::future<void>> running;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running.swap(running_);
    }
    for (auto& task : running) {
        task.wait();
    }

    for (auto& entry : abandoned) {
        for (auto& item : entry.second.items) {
            item.promise.set_exception(
                std::make_exception_ptr(BatchError("batcher stopped before '" + entry.first +
                                                   "' was flushed")));
        }
    }
}

BatchStats RequestBatcher::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    BatchStats s;
    s.batches_executed = batches_executed_;
    s.items_batched = items_batched_;
    s.size_flushes = size_flushes_;
    s.timer_flushes = timer_flushes_;
    s.timeouts = timeouts_;
    s.failures = failures_;
    s.pending_groups = groups_.size();
    return s;
}

void RequestBatcher::reset_stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    batches_executed_ = 0;
    items_batched_ = 0;
    size_flushes_ = 0;
    timer_flushes_ = 0;
    timeouts_ = 0;
    failures_ = 0;
}

} // namespace tollgate
