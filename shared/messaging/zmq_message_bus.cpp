#include "zmq_message_bus.hpp"

#include <zmq.h>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "common/result_helper.hpp"
#include "logging/logging.hpp"

namespace messaging {

namespace {
constexpr int kPollIntervalMs = 100;
}

std::string ZmqMessageBus::failureReply(const std::string& message) {
    nlohmann::ordered_json j;
    j["output"] = "❌ " + message + "\n";
    j["exit_code"] = 1;
    j["elapsed_seconds"] = 0.0;
    j["code"] = to_string(ResultCode::InternalError);
    return j.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

ZmqMessageBus::ZmqMessageBus(std::string pub_endpoint)
    : pub_endpoint_(std::move(pub_endpoint)) {
    context_ = zmq_ctx_new();
}

ZmqMessageBus::~ZmqMessageBus() {
    shutdown();
    if (context_) zmq_ctx_destroy(context_);
}

std::string ZmqMessageBus::lastError() {
    return zmq_strerror(zmq_errno());
}

// -------------------------
// PUBLISH
// -------------------------
Result<void> ZmqMessageBus::bindPubSocket() {
    if (pub_socket_) return OK();
    if (pub_endpoint_.empty()) return Error(ResultCode::InvalidArgument, "no publish endpoint configured");

    pub_socket_ = zmq_socket(context_, ZMQ_PUB);
    if (!pub_socket_) return Error(ResultCode::InternalError, "zmq_socket(PUB): " + lastError());

    int linger = 0;
    zmq_setsockopt(pub_socket_, ZMQ_LINGER, &linger, sizeof(linger));
    if (zmq_bind(pub_socket_, pub_endpoint_.c_str()) != 0) {
        auto err = lastError();
        zmq_close(pub_socket_);
        pub_socket_ = nullptr;
        return Error(ResultCode::InternalError, fmt::format("bind {}: {}", pub_endpoint_, err));
    }
    LOGI("publishing on {}", pub_endpoint_);
    return OK();
}

Result<void> ZmqMessageBus::publish(const std::string& topic, const std::string& payload) {
    if (!context_) return Error(ResultCode::InternalError, "zmq context unavailable");

    std::lock_guard<std::mutex> lock(pub_mutex_);
    auto r = bindPubSocket();
    RETURN_IF_ERR(r);

    if (zmq_send(pub_socket_, topic.data(), topic.size(), ZMQ_SNDMORE) < 0 ||
        zmq_send(pub_socket_, payload.data(), payload.size(), 0) < 0) {
        return Error(ResultCode::InternalError, "zmq_send: " + lastError());
    }
    return OK();
}

// -------------------------
// REQUEST
// -------------------------
Result<std::string> ZmqMessageBus::request(const std::string& endpoint, const std::string& payload,
                                           int timeout_ms) {
    if (!context_)
        return Result<std::string>::Error(ResultCode::InternalError, "zmq context unavailable");

    void* socket = zmq_socket(context_, ZMQ_REQ);
    if (!socket)
        return Result<std::string>::Error(ResultCode::InternalError, "zmq_socket(REQ): " + lastError());

    int linger = 0;
    zmq_setsockopt(socket, ZMQ_LINGER, &linger, sizeof(linger));
    zmq_setsockopt(socket, ZMQ_RCVTIMEO, &timeout_ms, sizeof(timeout_ms));

    if (zmq_connect(socket, endpoint.c_str()) != 0) {
        auto err = lastError();
        zmq_close(socket);
        return Result<std::string>::Error(ResultCode::InternalError, fmt::format("connect {}: {}", endpoint, err));
    }

    if (zmq_send(socket, payload.data(), payload.size(), 0) < 0) {
        auto err = lastError();
        zmq_close(socket);
        return Result<std::string>::Error(ResultCode::InternalError, "zmq_send: " + err);
    }

    auto r = receive(socket);
    zmq_close(socket);
    return r;
}

// -------------------------
// REPLY
// -------------------------
Result<void> ZmqMessageBus::reply(const std::string& endpoint, ReplyHandler handler) {
    if (!context_) return Error(ResultCode::InternalError, "zmq context unavailable");

    void* socket = zmq_socket(context_, ZMQ_REP);
    if (!socket) return Error(ResultCode::InternalError, "zmq_socket(REP): " + lastError());

    int linger = 0;
    zmq_setsockopt(socket, ZMQ_LINGER, &linger, sizeof(linger));
    if (zmq_bind(socket, endpoint.c_str()) != 0) {
        auto err = lastError();
        zmq_close(socket);
        return Error(ResultCode::InternalError, fmt::format("bind {}: {}", endpoint, err));
    }

    LOGI("serving requests on {}", endpoint);
    workers_.emplace_back(&ZmqMessageBus::serve, this, socket, std::move(handler));
    return OK();
}

void ZmqMessageBus::serve(void* socket, ReplyHandler handler) {
    zmq_pollitem_t items[] = {{socket, 0, ZMQ_POLLIN, 0}};

    while (running_.load()) {
        // timeout lets us check running_ periodically
        int rc = zmq_poll(items, 1, kPollIntervalMs);
        if (rc < 0) {
            if (!running_.load()) break;
            continue;
        }
        if (!(items[0].revents & ZMQ_POLLIN)) continue;

        auto req = receive(socket);
        if (!req) {
            LOGW("receive failed: {}", req.error().value_or("unknown"));
            continue;
        }

        // a REP socket must answer every request, even when the handler fails
        std::string response;
        try {
            response = handler(req.value());
        } catch (const std::exception& e) {
            LOGE("request handler threw: {}", e.what());
            response = failureReply(e.what());
        }
        if (zmq_send(socket, response.data(), response.size(), 0) < 0) {
            LOGW("reply failed: {}", lastError());
        }
    }
    zmq_close(socket);
}

Result<std::string> ZmqMessageBus::receive(void* socket) {
    zmq_msg_t msg;
    zmq_msg_init(&msg);
    if (zmq_msg_recv(&msg, socket, 0) < 0) {
        auto err = lastError();
        zmq_msg_close(&msg);
        return Result<std::string>::Error(ResultCode::Fail, err);
    }
    std::string data(static_cast<const char*>(zmq_msg_data(&msg)), zmq_msg_size(&msg));
    zmq_msg_close(&msg);
    return Result<std::string>::OK(std::move(data));
}

void ZmqMessageBus::shutdown() {
    if (!running_.exchange(false)) return;

    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();

    std::lock_guard<std::mutex> lock(pub_mutex_);
    if (pub_socket_) {
        zmq_close(pub_socket_);
        pub_socket_ = nullptr;
    }
}

} // namespace messaging
