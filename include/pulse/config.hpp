// include/pulse/config.hpp
// Flat configuration struct with builder pattern.

#pragma once

#include "enrichment.hpp"
#include "error.hpp"
#include "pipeline.hpp"
#include <array>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace pulse {

class PulseConfigBuilder;

// Configuration for the Pulse SDK.
class PulseConfig {
public:
    // Error sink. `fatal` is true when the failing call was abandoned
    // (nothing dispatched), false when the client recovered or dropped
    // a single event.
    using ErrorCallback = std::function<void(const PulseError& error, bool fatal)>;

    static PulseConfigBuilder builder(const std::string& api_key);

    // Presets.
    static PulseConfig production(const std::string& api_key);
    static PulseConfig development(const std::string& api_key);

    const std::array<uint8_t, 16>& api_key_bytes() const noexcept { return api_key_bytes_; }
    const std::string& endpoint() const noexcept { return endpoint_; }
    size_t batch_size() const noexcept { return batch_size_; }
    std::chrono::milliseconds flush_interval() const noexcept { return flush_interval_; }
    uint32_t max_retries() const noexcept { return max_retries_; }
    std::chrono::milliseconds close_timeout() const noexcept { return close_timeout_; }
    std::chrono::milliseconds network_timeout() const noexcept { return network_timeout_; }
    const std::string& anonymous_id() const noexcept { return anonymous_id_; }
    const Enrichments& enrichments() const noexcept { return enrichments_; }
    const std::shared_ptr<Pipeline>& pipeline() const noexcept { return pipeline_; }
    const ErrorCallback& on_error() const noexcept { return on_error_; }

private:
    friend class PulseConfigBuilder;

    std::array<uint8_t, 16> api_key_bytes_{};
    std::string endpoint_ = "ingest.pulse.dev:50000";
    size_t batch_size_ = 100;
    std::chrono::milliseconds flush_interval_{10000};
    uint32_t max_retries_ = 3;
    std::chrono::milliseconds close_timeout_{5000};
    std::chrono::milliseconds network_timeout_{30000};
    std::string anonymous_id_;   // empty: generate at client start
    Enrichments enrichments_;
    std::shared_ptr<Pipeline> pipeline_;  // null: default background worker
    ErrorCallback on_error_;
};

// Fluent builder for PulseConfig.
class PulseConfigBuilder {
public:
    explicit PulseConfigBuilder(const std::string& api_key);

    PulseConfigBuilder& endpoint(std::string endpoint);
    PulseConfigBuilder& batch_size(size_t size);
    PulseConfigBuilder& flush_interval(std::chrono::milliseconds interval);
    PulseConfigBuilder& max_retries(uint32_t retries);
    PulseConfigBuilder& close_timeout(std::chrono::milliseconds timeout);
    PulseConfigBuilder& network_timeout(std::chrono::milliseconds timeout);

    // Restore a previously persisted anonymous id instead of generating one.
    PulseConfigBuilder& anonymous_id(std::string id);

    // Add a pipeline-wide enrichment. Repeatable; runs in call order.
    PulseConfigBuilder& enrichment(Enrichment enrichment);

    // Replace the default background worker.
    PulseConfigBuilder& pipeline(std::shared_ptr<Pipeline> pipeline);

    PulseConfigBuilder& on_error(PulseConfig::ErrorCallback callback);

    // Build the config. Throws PulseError on invalid API key or batch size.
    PulseConfig build() const;

private:
    std::string api_key_;
    PulseConfig config_;
};

} // namespace pulse
