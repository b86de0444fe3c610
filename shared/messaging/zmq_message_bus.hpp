#pragma once
#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "message_bus.hpp"

namespace messaging {

/**
 * libzmq transport.
 *  - publish(): two frames (topic, payload) on a PUB socket bound lazily to pub_endpoint
 *  - reply():   REP socket served by a polling thread until shutdown()
 *  - request(): one-shot REQ socket with a receive timeout
 */
class ZmqMessageBus : public MessageBus {
public:
    explicit ZmqMessageBus(std::string pub_endpoint = {});
    ~ZmqMessageBus() override;

    ZmqMessageBus(const ZmqMessageBus&) = delete;
    ZmqMessageBus& operator=(const ZmqMessageBus&) = delete;

    Result<void> publish(const std::string& topic, const std::string& payload) override;
    Result<std::string> request(const std::string& endpoint, const std::string& payload,
                                int timeout_ms) override;
    Result<void> reply(const std::string& endpoint, ReplyHandler handler) override;

    void shutdown() override;

    // Reply sent when a handler throws; same shape as an execution report.
    static std::string failureReply(const std::string& message);

private:
    void serve(void* socket, ReplyHandler handler);
    Result<void> bindPubSocket();

    static Result<std::string> receive(void* socket);
    static std::string lastError();

    void* context_ = nullptr;
    void* pub_socket_ = nullptr;
    std::string pub_endpoint_;
    std::mutex pub_mutex_;

    std::atomic<bool> running_{true};
    std::vector<std::thread> workers_;

    inline static constexpr const char* LOG_TAG = "ZmqMessageBus";
};

} // namespace messaging
