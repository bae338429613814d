#pragma once

#include "config.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

namespace tollgate {

struct BatchStats {
    uint64_t batches_executed = 0;
    uint64_t items_batched = 0;
    uint64_t size_flushes = 0;
    uint64_t timer_flushes = 0;
    uint64_t timeouts = 0;
    uint64_t failures = 0;
    size_t pending_groups = 0;
};

void to_json(nlohmann::json& j, const BatchStats& stats);

// Groups items sharing a batch key into one executor call. Result i of
// the call goes to the caller that enqueued item i.
class RequestBatcher {
public:
    // Must return exactly one result per item, in order
    using Executor = std::function<std::vector<nlohmann::json>(const std::vector<nlohmann::json>&)>;

    explicit RequestBatcher(const BatchConfig& config);
    ~RequestBatcher();

    RequestBatcher(const RequestBatcher&) = delete;
    RequestBatcher& operator=(const RequestBatcher&) = delete;

    // Blocks until this item's result arrives. Throws BatchTimeout after
    // batch_max_wait, BatchError on a broken executor contract, or whatever
    // the executor threw.
    nlohmann::json enqueue(const std::string& batch_key, nlohmann::json item, Executor execute);

    // Joins the flusher, waits for running batches and fails every
    // pending item with BatchError
    void stop();

    BatchStats stats() const;
    void reset_stats();

private:
    using Clock = std::chrono::steady_clock;

    struct PendingItem {
        nlohmann::json payload;
        std::promise<nlohmann::json> promise;
    };

    struct Group {
        std::vector<PendingItem> items;
        Executor execute;
        Clock::time_point deadline;
    };

    void flusher_loop();
    // Runs the group on its own task so a slow executor never holds up other keys
    void launch_locked(const std::string& batch_key, Group group);
    void execute_group(const std::string& batch_key, Group group);

    BatchConfig config_;
    std::map<std::string, Group> groups_;
    bool stopping_ = false;

    uint64_t batches_executed_ = 0;
    uint64_t items_batched_ = 0;
    uint64_t size_flushes_ = 0;
    uint64_t timer_flushes_ = 0;
    uint64_t timeouts_ = 0;
    uint64_t failures_ = 0;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::thread flusher_;
    std::vector<std::future<void>> running_;
};

} // namespace tollgate
