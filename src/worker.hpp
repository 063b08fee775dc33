// src/worker.hpp
// Default pipeline — batches events on a background thread and ships them
// to the collector as JSON frames.

#pragma once

#include "transport.hpp"
#include "pulse/config.hpp"
#include "pulse/error.hpp"
#include "pulse/event.hpp"
#include "pulse/pipeline.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <random>
#include <thread>
#include <variant>
#include <vector>

namespace pulse {

using Completion = std::shared_ptr<std::promise<void>>;

struct FlushRequest {
    Completion done;
};

struct CloseRequest {
    Completion done;
};

using WorkerMessage = std::variant<Event, FlushRequest, CloseRequest>;

class Worker : public Pipeline {
public:
    static constexpr size_t MAX_INBOX = 10000;
    static constexpr size_t MAX_RETRY_THREADS = 8;

    explicit Worker(PulseConfig config);
    ~Worker() override;

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    // Enqueue only. When the inbox is full the oldest message is dropped.
    // Once the worker has stopped, the event is dropped and reported as
    // Closed.
    void process(Event event) override;

    // Both block until the worker has handled the request or
    // close_timeout elapses. No-ops once the worker has stopped.
    void flush() override;
    void close() override;

    std::future<void> request_flush();
    std::future<void> request_close();

    const PulseConfig& config() const noexcept { return config_; }

private:
    // A retry thread and the flag it sets when it is done.
    struct RetrySlot {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    // What one pass over the inbox asked for.
    struct Pass {
        bool flush = false;
        bool close = false;
        std::vector<Completion> waiting;
    };

    void post(WorkerMessage msg);
    void await(std::future<void> done) const;

    void run();
    Pass take(std::deque<WorkerMessage>& inbox);
    void ship_pending();
    void deliver(const std::vector<uint8_t>& frame);
    void retry(std::vector<uint8_t> frame, std::shared_ptr<std::atomic<bool>> done);
    void reap_retries();
    std::chrono::milliseconds backoff(uint32_t attempt, std::mt19937& rng) const;
    void join_retries();
    void report(const PulseError& err) const;

    PulseConfig config_;
    TcpTransport transport_;

    std::mutex inbox_mutex_;
    std::condition_variable inbox_cv_;
    std::deque<WorkerMessage> inbox_;

    // Owned by the worker thread.
    std::vector<Event> pending_;
    std::vector<uint8_t> frame_;
    uint64_t next_batch_id_ = 1;

    std::atomic<bool> running_{true};
    std::thread thread_;

    std::mutex retry_mutex_;
    std::vector<RetrySlot> retries_;  // guarded by retry_mutex_
};

} // namespace pulse
