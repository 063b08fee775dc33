// src/worker.cpp
// Default pipeline implementation.

#include "worker.hpp"
#include "clock.hpp"
#include "encoding.hpp"

#include <algorithm>
#include <cmath>
#include <type_traits>

namespace pulse {

Worker::Worker(PulseConfig config)
    : config_(std::move(config)),
      transport_(config_.endpoint(), config_.network_timeout()) {
    pending_.reserve(config_.batch_size());
    frame_.reserve(64 * 1024);
    thread_ = std::thread(&Worker::run, this);
}

Worker::~Worker() {
    if (running_.load()) {
        (void)request_close();
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    join_retries();
}

// --- Producer side ---

void Worker::post(WorkerMessage msg) {
    bool wake;
    {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        wake = inbox_.empty();
        if (inbox_.size() >= MAX_INBOX) {
            inbox_.pop_front();
        }
        inbox_.push_back(std::move(msg));
    }
    if (wake) {
        inbox_cv_.notify_one();
    }
}

void Worker::process(Event event) {
    if (!running_.load()) {
        report(PulseError::closed());
        return;
    }
    post(std::move(event));
}

std::future<void> Worker::request_flush() {
    auto done = std::make_shared<std::promise<void>>();
    auto f = done->get_future();
    post(FlushRequest{std::move(done)});
    return f;
}

std::future<void> Worker::request_close() {
    auto done = std::make_shared<std::promise<void>>();
    auto f = done->get_future();
    post(CloseRequest{std::move(done)});
    return f;
}

void Worker::await(std::future<void> done) const {
    done.wait_for(config_.close_timeout());
}

void Worker::flush() {
    if (running_.load()) await(request_flush());
}

void Worker::close() {
    if (running_.load()) await(request_close());
}

// --- Worker thread ---

Worker::Pass Worker::take(std::deque<WorkerMessage>& inbox) {
    Pass pass;
    for (auto& msg : inbox) {
        std::visit([&](auto& m) {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same<T, Event>::value) {
                pending_.push_back(std::move(m));
                if (pending_.size() >= config_.batch_size()) ship_pending();
            } else {
                if constexpr (std::is_same<T, FlushRequest>::value) {
                    pass.flush = true;
                } else {
                    pass.close = true;
                }
                if (m.done) pass.waiting.push_back(std::move(m.done));
            }
        }, msg);
    }
    inbox.clear();
    return pass;
}

void Worker::run() {
    const auto interval = config_.flush_interval();
    auto deadline = std::chrono::steady_clock::now() + interval;

    while (running_.load()) {
        std::deque<WorkerMessage> inbox;
        {
            std::unique_lock<std::mutex> lock(inbox_mutex_);
            inbox_cv_.wait_until(lock, deadline, [this] { return !inbox_.empty(); });
            inbox.swap(inbox_);
        }

        Pass pass = take(inbox);

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            pass.flush = true;
            deadline = now + interval;
        }

        if (pass.flush || pass.close) {
            ship_pending();
            for (auto& done : pass.waiting) done->set_value();
        }

        if (pass.close) {
            transport_.close_connection();
            running_.store(false);
        }
    }
}

void Worker::ship_pending() {
    if (pending_.empty()) return;

    std::vector<Event> batch;
    batch.swap(pending_);
    pending_.reserve(config_.batch_size());

    encoding::BatchParams params;
    params.api_key = config_.api_key_bytes().data();
    params.batch_id = next_batch_id_++;
    params.sent_at = now_ms();
    params.events = batch.data();
    params.event_count = batch.size();

    frame_.clear();
    encoding::encode_batch_into(frame_, params);
    deliver(frame_);
}

void Worker::deliver(const std::vector<uint8_t>& frame) {
    if (transport_.send_frame(frame.data(), frame.size())) return;

    if (config_.max_retries() == 0) {
        report(PulseError::network("send to " + config_.endpoint() + " failed, retries disabled"));
        return;
    }

    std::lock_guard<std::mutex> lock(retry_mutex_);
    reap_retries();
    if (retries_.size() >= MAX_RETRY_THREADS) {
        report(PulseError::network("send failed, " + std::to_string(MAX_RETRY_THREADS) +
                                   " retries already in flight"));
        return;
    }
    auto done = std::make_shared<std::atomic<bool>>(false);
    RetrySlot slot;
    slot.done = done;
    slot.thread = std::thread(&Worker::retry, this, frame, std::move(done));
    retries_.push_back(std::move(slot));
}

// --- Retry ---

// 1s * 1.5^(attempt-1) plus up to 20% jitter, capped at 30s.
std::chrono::milliseconds Worker::backoff(uint32_t attempt, std::mt19937& rng) const {
    std::uniform_real_distribution<double> jitter(0.0, 0.2);
    double base = 1000.0 * std::pow(1.5, static_cast<double>(attempt - 1));
    double ms = std::min(base * (1.0 + jitter(rng)), 30000.0);
    return std::chrono::milliseconds(static_cast<int64_t>(ms));
}

void Worker::retry(std::vector<uint8_t> frame, std::shared_ptr<std::atomic<bool>> done) {
    TcpTransport transport(config_.endpoint(), config_.network_timeout());
    std::mt19937 rng(std::random_device{}());

    bool sent = false;
    for (uint32_t attempt = 1; attempt <= config_.max_retries() && !sent; attempt++) {
        std::this_thread::sleep_for(backoff(attempt, rng));
        sent = transport.send_frame(frame.data(), frame.size());
    }

    if (!sent) {
        report(PulseError::network("batch dropped after " +
            std::to_string(config_.max_retries()) + " retries"));
    }
    done->store(true);
}

// Join and drop retry threads that have finished. Caller holds retry_mutex_.
void Worker::reap_retries() {
    auto finished = std::partition(retries_.begin(), retries_.end(),
        [](const RetrySlot& slot) { return !slot.done->load(); });
    for (auto it = finished; it != retries_.end(); ++it) {
        if (it->thread.joinable()) it->thread.join();
    }
    retries_.erase(finished, retries_.end());
}

void Worker::join_retries() {
    std::lock_guard<std::mutex> lock(retry_mutex_);
    for (auto& slot : retries_) {
        if (slot.thread.joinable()) slot.thread.join();
    }
    retries_.clear();
}

void Worker::report(const PulseError& err) const {
    if (config_.on_error()) {
        config_.on_error()(err, false);
    }
}

} // namespace pulse
