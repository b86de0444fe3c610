#include "runner_service.hpp"

#include <exception>

#include <fmt/core.h>

#include "logging/logging.hpp"
#include "messaging/message_codec.hpp"

namespace composition {

using json = nlohmann::ordered_json;

Result<command::ExecutionRequest> RunnerService::decodeRequest(const json& j) {
    using R = Result<command::ExecutionRequest>;

    if (!j.is_object()) return R::Error(ResultCode::InvalidArgument, "request must be a JSON object");
    if (!j.contains("command") || !j["command"].is_string())
        return R::Error(ResultCode::InvalidArgument, "request needs a string 'command'");

    command::ExecutionRequest req;
    req.command = j["command"].get<std::string>();
    if (j.contains("options")) {
        if (!j["options"].is_object()) return R::Error(ResultCode::InvalidArgument, "'options' must be an object");
        req.options = message::fromJson(j["options"]);
    }
    if (j.contains("user") && j["user"].is_string()) req.user = j["user"].get<std::string>();
    if (j.contains("confirmed")) {
        if (!j["confirmed"].is_boolean()) return R::Error(ResultCode::InvalidArgument, "'confirmed' must be a boolean");
        req.confirmed = j["confirmed"].get<bool>();
    }
    return R::OK(std::move(req));
}

json RunnerService::encodeReport(const command::ExecutionReport& report) {
    json j;
    j["output"] = report.output;
    j["exit_code"] = report.exit_code;
    j["elapsed_seconds"] = report.elapsed_seconds;
    j["code"] = to_string(report.code);
    return j;
}

std::string RunnerService::errorReply(ResultCode code, const std::string& message) {
    command::ExecutionReport report;
    report.code = code;
    report.exit_code = 1;
    report.output = "❌ " + message + "\n";
    return encodeReport(report).dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string RunnerService::handle(const std::string& payload) const {
    json j = json::parse(payload, nullptr, false);
    if (j.is_discarded()) {
        LOGW("unparseable request ({} bytes)", payload.size());
        return errorReply(ResultCode::InvalidArgument, "request is not valid JSON");
    }

    std::string action = "execute";
    if (j.is_object() && j.contains("action")) {
        if (!j["action"].is_string()) return errorReply(ResultCode::InvalidArgument, "'action' must be a string");
        action = j["action"].get<std::string>();
    }
    if (action == "catalog") return dispatcher_.catalog().dump(-1, ' ', false, json::error_handler_t::replace);
    if (action != "execute")
        return errorReply(ResultCode::InvalidArgument, fmt::format("unknown action '{}'", action));

    auto req = decodeRequest(j);
    if (!req) return errorReply(req.code(), req.error().value_or("invalid request"));

    try {
        return encodeReport(dispatcher_.dispatch(req.value())).dump(-1, ' ', false, json::error_handler_t::replace);
    } catch (const std::exception& e) {
        LOGE("dispatch of '{}' failed: {}", req.value().command, e.what());
        return errorReply(ResultCode::InternalError, e.what());
    }
}

} // namespace composition
