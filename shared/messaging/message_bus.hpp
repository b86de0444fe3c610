#pragma once
#include <functional>
#include <string>

#include "common/result.h"

namespace messaging {

// Request payload in, reply payload out.
using ReplyHandler = std::function<std::string(const std::string&)>;

class MessageBus {
public:
    virtual ~MessageBus() = default;

    // PUB
    virtual Result<void> publish(const std::string& topic, const std::string& payload) = 0;

    // REQ/REP
    virtual Result<std::string> request(const std::string& endpoint, const std::string& payload,
                                        int timeout_ms) = 0;
    virtual Result<void> reply(const std::string& endpoint, ReplyHandler handler) = 0;

    virtual void shutdown() = 0;
};

} // namespace messaging
