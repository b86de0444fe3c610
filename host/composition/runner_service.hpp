#pragma once
#include <string>

#include <nlohmann/json.hpp>

#include "command/command_dispatcher.hpp"
#include "common/result.h"

namespace composition {

/**
 * JSON request protocol served by the daemon.
 *
 *   {"action": "execute", "command": "...", "options": {...}, "user": "...", "confirmed": false}
 *   {"action": "catalog"}
 *
 * execute replies {"output", "exit_code", "elapsed_seconds", "code"};
 * catalog replies CommandDispatcher::catalog().
 */
class RunnerService {
public:
    explicit RunnerService(const command::CommandDispatcher& dispatcher) : dispatcher_(dispatcher) {}

    // never throws; malformed requests get an error reply
    std::string handle(const std::string& payload) const;

    static Result<command::ExecutionRequest> decodeRequest(const nlohmann::ordered_json& j);
    static nlohmann::ordered_json encodeReport(const command::ExecutionReport& report);

private:
    static std::string errorReply(ResultCode code, const std::string& message);

    const command::CommandDispatcher& dispatcher_;

    inline static constexpr const char* LOG_TAG = "RunnerService";
};

} // namespace composition
