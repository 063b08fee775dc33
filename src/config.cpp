// src/config.cpp
// Configuration builder and presets.

#include "pulse/config.hpp"
#include "transport.hpp"
#include "validation.hpp"

namespace pulse {

// --- PulseConfig presets ---

PulseConfigBuilder PulseConfig::builder(const std::string& api_key) {
    return PulseConfigBuilder(api_key);
}

PulseConfig PulseConfig::production(const std::string& api_key) {
    return PulseConfig::builder(api_key).build();
}

PulseConfig PulseConfig::development(const std::string& api_key) {
    return PulseConfig::builder(api_key)
        .endpoint("localhost:50000")
        .batch_size(10)
        .flush_interval(std::chrono::milliseconds(2000))
        .build();
}

// --- PulseConfigBuilder ---

PulseConfigBuilder::PulseConfigBuilder(const std::string& api_key)
    : api_key_(api_key) {}

PulseConfigBuilder& PulseConfigBuilder::endpoint(std::string endpoint) {
    config_.endpoint_ = std::move(endpoint);
    return *this;
}

PulseConfigBuilder& PulseConfigBuilder::batch_size(size_t size) {
    config_.batch_size_ = size;
    return *this;
}

PulseConfigBuilder& PulseConfigBuilder::flush_interval(std::chrono::milliseconds interval) {
    config_.flush_interval_ = interval;
    return *this;
}

PulseConfigBuilder& PulseConfigBuilder::max_retries(uint32_t retries) {
    config_.max_retries_ = retries;
    return *this;
}

PulseConfigBuilder& PulseConfigBuilder::close_timeout(std::chrono::milliseconds timeout) {
    config_.close_timeout_ = timeout;
    return *this;
}

PulseConfigBuilder& PulseConfigBuilder::network_timeout(std::chrono::milliseconds timeout) {
    config_.network_timeout_ = timeout;
    return *this;
}

PulseConfigBuilder& PulseConfigBuilder::anonymous_id(std::string id) {
    config_.anonymous_id_ = std::move(id);
    return *this;
}

PulseConfigBuilder& PulseConfigBuilder::enrichment(Enrichment enrichment) {
    config_.enrichments_.push_back(std::move(enrichment));
    return *this;
}

PulseConfigBuilder& PulseConfigBuilder::pipeline(std::shared_ptr<Pipeline> pipeline) {
    config_.pipeline_ = std::move(pipeline);
    return *this;
}

PulseConfigBuilder& PulseConfigBuilder::on_error(PulseConfig::ErrorCallback callback) {
    config_.on_error_ = std::move(callback);
    return *this;
}

PulseConfig PulseConfigBuilder::build() const {
    if (config_.batch_size_ == 0) {
        throw PulseError::configuration("batchSize must be at least 1");
    }
    parse_endpoint(config_.endpoint_);

    PulseConfig result = config_;
    result.api_key_bytes_ = validation::validate_and_decode_api_key(api_key_);
    return result;
}

} // namespace pulse
