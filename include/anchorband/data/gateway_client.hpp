#pragma once
#include <nlohmann/json.hpp>
#include <zmq.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

namespace anchorband {
namespace data {

struct GatewayConfiguration {
    std::string endpoint = "tcp://127.0.0.1:5557";
    std::chrono::milliseconds request_timeout{15000};
    std::chrono::milliseconds idle_poll{10};
};

struct GatewayReply {
    bool ok = false;
    nlohmann::json rows = nlohmann::json::array();
    int error_code = 0;
    std::string error_message;
};

// Request/reply session with the market-data gateway over a DEALER socket.
//
// Every request carries a correlation id. A receiver thread reads replies and
// completes the promise registered under that id; the caller waits on the
// matching future with a timeout. Requests are single-flight: the gateway
// session does not multiplex, so request() holds a mutex for its whole
// round trip.
//
// Wire format (one JSON document per frame):
//   -> {"id": 7, "type": "daily_bars", "symbol": "ABC", "duration": "60 D", "bar_size": "1 day"}
//   <- {"id": 7, "rows": [...]}
//   <- {"id": 7, "error": {"code": 162, "message": "..."}}
class GatewayClient {
public:
    explicit GatewayClient(GatewayConfiguration config = GatewayConfiguration());
    ~GatewayClient();

    GatewayClient(const GatewayClient&) = delete;
    GatewayClient& operator=(const GatewayClient&) = delete;

    bool connect();
    void disconnect();
    bool is_connected() const { return running_; }

    // Rows of a successful reply; nullopt on timeout, transport or gateway error
    std::optional<nlohmann::json> request(const std::string& type, nlohmann::json params);

    // Broker status notices that arrive as errors but do not end a request
    static bool is_informational(int code);

    // "N Y" above a year of lookback, otherwise "N D" with a two-day minimum
    static std::string duration_for_days(int days);

    // Routes one raw reply to its waiting request; exposed for tests
    void dispatch(const std::string& payload);

    // Registers a waiter without sending; exposed for tests
    std::future<GatewayReply> expect_reply(uint64_t id);

private:
    void receive_loop();
    void complete(uint64_t id, GatewayReply reply);
    void forget(uint64_t id);

    GatewayConfiguration config_;
    zmq::context_t context_;
    std::unique_ptr<zmq::socket_t> socket_;

    std::mutex request_mutex_;
    std::mutex socket_mutex_;
    std::mutex pending_mutex_;
    std::unordered_map<uint64_t, std::promise<GatewayReply>> pending_;

    std::atomic<uint64_t> next_id_{1};
    std::atomic<bool> running_{false};
    std::thread receiver_;
};

} // namespace data
} // namespace anchorband
