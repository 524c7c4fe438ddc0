#include <anchorband/runner/runner_config.hpp>

namespace anchorband::runner {

namespace {

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw utils::ConfigError(message);
    }
}

} // namespace

RunnerConfiguration RunnerConfiguration::from_config(const utils::Config& config) {
    RunnerConfiguration result;

    result.longs_file = config.get("longs_file", result.longs_file);
    result.shorts_file = config.get("shorts_file", result.shorts_file);
    result.output_file = config.get("output_file", result.output_file);
    result.cache_file = config.get("cache_file", result.cache_file);

    long interval = config.get<long>("fetch_interval_seconds", 2700);
    require(interval > 0, "fetch_interval_seconds must be positive");
    result.fetch_interval = std::chrono::seconds(interval);

    result.recent_days = config.get<int>("recent_days", 10);
    require(result.recent_days >= 0, "recent_days must not be negative");

    int min_count = config.get<int>("min_anchor_count", 2);
    require(min_count >= 1, "min_anchor_count must be at least 1");
    result.resolver.min_count = static_cast<size_t>(min_count);

    result.resolver.max_lookback_days = config.get<int>("max_lookback_days", 250);
    require(result.resolver.max_lookback_days > 0, "max_lookback_days must be positive");

    long throttle_ms = config.get<long>("calendar_throttle_ms", 1000);
    require(throttle_ms >= 0, "calendar_throttle_ms must not be negative");
    result.resolver.throttle = std::chrono::milliseconds(throttle_ms);

    result.resolver.fallback_history_limit = config.get<int>("fallback_history_limit", 8);
    require(result.resolver.fallback_history_limit > 0, "fallback_history_limit must be positive");

    result.classifier.bounce.atr_length = config.get<int>("atr_length", core::kDefaultAtrLength);
    require(result.classifier.bounce.atr_length > 0, "atr_length must be positive");

    result.classifier.bounce.atr_mult = config.get<double>("atr_mult", 0.05);
    require(result.classifier.bounce.atr_mult >= 0.0, "atr_mult must not be negative");

    result.gateway.endpoint = config.get("gateway_endpoint", result.gateway.endpoint);
    require(!result.gateway.endpoint.empty(), "gateway_endpoint must not be empty");

    long timeout = config.get<long>("request_timeout_seconds", 15);
    require(timeout > 0, "request_timeout_seconds must be positive");
    result.gateway.request_timeout = std::chrono::seconds(timeout);

    result.log_level = utils::Logger::parse_level(config.get("log_level", "info"));

    return result;
}

} // namespace anchorband::runner
