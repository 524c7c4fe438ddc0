#include <anchorband/data/gateway_client.hpp>
#include <anchorband/utils/logger.hpp>
#include <algorithm>

namespace anchorband::data {

GatewayClient::GatewayClient(GatewayConfiguration config)
    : config_(std::move(config)), context_(1) {}

GatewayClient::~GatewayClient() {
    disconnect();
}

bool GatewayClient::connect() {
    if (running_) {
        utils::Logger::warn() << "Gateway client already connected" << utils::Logger::endl;
        return true;
    }

    try {
        socket_ = std::make_unique<zmq::socket_t>(context_, zmq::socket_type::dealer);
        socket_->set(zmq::sockopt::linger, 0);
        socket_->connect(config_.endpoint);
    } catch (const zmq::error_t& e) {
        utils::Logger::error() << "Failed to connect to gateway at " << config_.endpoint << ": " << e.what()
                               << utils::Logger::endl;
        socket_.reset();
        return false;
    }

    running_ = true;
    receiver_ = std::thread([this]() { receive_loop(); });

    utils::Logger::info() << "Connected to gateway at " << config_.endpoint << utils::Logger::endl;
    return true;
}

void GatewayClient::disconnect() {
    if (!running_) {
        return;
    }

    running_ = false;
    if (receiver_.joinable()) {
        receiver_.join();
    }

    {
        std::lock_guard<std::mutex> lock(socket_mutex_);
        if (socket_) {
            socket_->close();
            socket_.reset();
        }
    }

    // Wake anyone still waiting
    std::lock_guard<std::mutex> lock(pending_mutex_);
    for (auto& [id, promise] : pending_) {
        GatewayReply reply;
        reply.error_message = "gateway disconnected";
        promise.set_value(reply);
    }
    pending_.clear();

    utils::Logger::info() << "Disconnected from gateway" << utils::Logger::endl;
}

bool GatewayClient::is_informational(int code) {
    return code == 2104 || code == 2106 || code == 2158 || code == 2176;
}

std::string GatewayClient::duration_for_days(int days) {
    if (days > 365) {
        return std::to_string(std::max(1, days / 365)) + " Y";
    }
    return std::to_string(std::max(2, days)) + " D";
}

std::future<GatewayReply> GatewayClient::expect_reply(uint64_t id) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_[id].get_future();
}

void GatewayClient::complete(uint64_t id, GatewayReply reply) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        utils::Logger::debug() << "Dropping reply for unknown request " << id << utils::Logger::endl;
        return;
    }
    it->second.set_value(std::move(reply));
    pending_.erase(it);
}

void GatewayClient::forget(uint64_t id) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_.erase(id);
}

void GatewayClient::dispatch(const std::string& payload) {
    nlohmann::json message;
    try {
        message = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::exception& e) {
        utils::Logger::warn() << "Unparseable gateway message: " << e.what() << utils::Logger::endl;
        return;
    }

    if (!message.is_object()) {
        utils::Logger::warn() << "Gateway message is not an object" << utils::Logger::endl;
        return;
    }

    int64_t id = -1;
    auto id_it = message.find("id");
    if (id_it != message.end() && id_it->is_number_integer()) {
        id = id_it->get<int64_t>();
    }

    auto error_it = message.find("error");
    if (error_it != message.end() && error_it->is_object()) {
        // Fields of the wrong type read as code 0 / empty text and still fail the request
        int code = 0;
        std::string text;
        auto code_it = error_it->find("code");
        if (code_it != error_it->end() && code_it->is_number_integer()) {
            code = code_it->get<int>();
        }
        auto text_it = error_it->find("message");
        if (text_it != error_it->end() && text_it->is_string()) {
            text = text_it->get<std::string>();
        }
        if (is_informational(code)) {
            utils::Logger::debug() << "Gateway notice " << code << "[" << id << "]: " << text << utils::Logger::endl;
            return;
        }
        utils::Logger::error() << "Gateway error " << code << "[" << id << "]: " << text << utils::Logger::endl;
        if (id < 0) {
            return;
        }
        GatewayReply reply;
        reply.error_code = code;
        reply.error_message = text;
        complete(static_cast<uint64_t>(id), std::move(reply));
        return;
    }

    if (id < 0) {
        utils::Logger::debug() << "Ignoring gateway message without id" << utils::Logger::endl;
        return;
    }

    GatewayReply reply;
    reply.ok = true;
    auto rows_it = message.find("rows");
    if (rows_it != message.end() && rows_it->is_array()) {
        reply.rows = *rows_it;
    }
    complete(static_cast<uint64_t>(id), std::move(reply));
}

void GatewayClient::receive_loop() {
    while (running_) {
        zmq::message_t message;
        bool received = false;
        try {
            std::lock_guard<std::mutex> lock(socket_mutex_);
            if (socket_) {
                received = socket_->recv(message, zmq::recv_flags::dontwait).has_value();
            }
        } catch (const zmq::error_t& e) {
            utils::Logger::error() << "Gateway receive failed: " << e.what() << utils::Logger::endl;
        }

        if (!received) {
            std::this_thread::sleep_for(config_.idle_poll);
            continue;
        }

        try {
            dispatch(std::string(static_cast<const char*>(message.data()), message.size()));
        } catch (const nlohmann::json::exception& e) {
            utils::Logger::error() << "Dropping malformed gateway reply: " << e.what() << utils::Logger::endl;
        }
    }
}

std::optional<nlohmann::json> GatewayClient::request(const std::string& type, nlohmann::json params) {
    std::lock_guard<std::mutex> flight(request_mutex_);

    if (!running_) {
        utils::Logger::warn() << "Gateway not connected; dropping " << type << " request" << utils::Logger::endl;
        return std::nullopt;
    }

    uint64_t id = next_id_++;
    params["id"] = id;
    params["type"] = type;
    std::future<GatewayReply> reply = expect_reply(id);

    bool sent = false;
    try {
        std::string body = params.dump();
        std::lock_guard<std::mutex> lock(socket_mutex_);
        if (socket_) {
            sent = socket_->send(zmq::buffer(body), zmq::send_flags::dontwait).has_value();
        }
    } catch (const zmq::error_t& e) {
        utils::Logger::error() << "Gateway send failed: " << e.what() << utils::Logger::endl;
    }

    if (!sent) {
        utils::Logger::warn() << "Could not send " << type << " request " << id << utils::Logger::endl;
        forget(id);
        return std::nullopt;
    }

    if (reply.wait_for(config_.request_timeout) != std::future_status::ready) {
        utils::Logger::warn() << type << " request " << id << " timed out after "
                              << config_.request_timeout.count() << " ms" << utils::Logger::endl;
        forget(id);
        return std::nullopt;
    }

    GatewayReply result = reply.get();
    if (!result.ok) {
        return std::nullopt;
    }
    return result.rows;
}

} // namespace anchorband::data
