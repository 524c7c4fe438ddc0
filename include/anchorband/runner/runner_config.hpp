#pragma once
#include <anchorband/data/gateway_client.hpp>
#include <anchorband/earnings/anchor_resolver.hpp>
#include <anchorband/signal/signal_classifier.hpp>
#include <anchorband/utils/config.hpp>
#include <anchorband/utils/logger.hpp>
#include <chrono>
#include <string>

namespace anchorband {
namespace runner {

struct RunnerConfiguration {
    std::string longs_file = "longs.txt";
    std::string shorts_file = "shorts.txt";
    std::string output_file = "combined_avwap.txt";
    std::string cache_file = "earnings_cache.json";

    std::chrono::seconds fetch_interval{2700};
    int recent_days = 10;

    earnings::ResolverConfiguration resolver;
    signal::ClassifierConfiguration classifier;
    data::GatewayConfiguration gateway;

    utils::LogLevel log_level = utils::LogLevel::INFO;

    // Reads every key, falling back to the defaults above; throws ConfigError
    // for values outside their usable range
    static RunnerConfiguration from_config(const utils::Config& config);
};

} // namespace runner
} // namespace anchorband
