// command_runner_ctl: sends one request to a running command_runner.
//
//   command_runner_ctl [-e endpoint] catalog
//   command_runner_ctl [-e endpoint] [-u user] [-y] run <command> [key=value ...]
//
// Values that look like numbers or true/false are sent typed; everything else as text.

#include <cstring>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "common/string_helper.hpp"
#include "messaging/zmq_message_bus.hpp"

using json = nlohmann::ordered_json;

namespace {

constexpr int kTimeoutMs = 30000;

json typedValue(const std::string& text) {
    auto lower = toLower(text);
    if (lower == "true") return true;
    if (lower == "false") return false;
    if (auto i = parseInteger(text)) return *i;
    // integers too wide for long long travel as text
    if (text.find_first_of(".eE") == std::string::npos) return text;
    if (auto n = parseNumber(text)) return *n;
    return text;
}

int usage() {
    fmt::print(stderr,
               "usage: command_runner_ctl [-e endpoint] catalog\n"
               "       command_runner_ctl [-e endpoint] [-u user] [-y] run <command> [key=value ...]\n");
    return 2;
}

} // namespace

int main(int argc, char** argv) {
    std::string endpoint = "tcp://127.0.0.1:5570";
    std::string user;
    bool confirmed = false;

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        if (!std::strcmp(argv[i], "-e") && i + 1 < argc) endpoint = argv[++i];
        else if (!std::strcmp(argv[i], "-u") && i + 1 < argc) user = argv[++i];
        else if (!std::strcmp(argv[i], "-y")) confirmed = true;
        else args.emplace_back(argv[i]);
    }
    if (args.empty()) return usage();

    json req;
    if (args[0] == "catalog") {
        req["action"] = "catalog";
    } else if (args[0] == "run" && args.size() >= 2) {
        req["action"] = "execute";
        req["command"] = args[1];
        req["options"] = json::object();
        for (size_t i = 2; i < args.size(); ++i) {
            auto eq = args[i].find('=');
            if (eq == std::string::npos || eq == 0) return usage();
            req["options"][args[i].substr(0, eq)] = typedValue(args[i].substr(eq + 1));
        }
        if (!user.empty()) req["user"] = user;
        req["confirmed"] = confirmed;
    } else {
        return usage();
    }

    messaging::ZmqMessageBus bus;
    auto reply = bus.request(endpoint, req.dump(), kTimeoutMs);
    if (!reply) {
        fmt::print(stderr, "command_runner_ctl: {}\n", reply.error().value_or("request failed"));
        return 1;
    }

    auto j = json::parse(reply.value(), nullptr, false);
    if (j.is_discarded()) {
        fmt::print(stderr, "command_runner_ctl: reply is not JSON\n");
        return 1;
    }
    if (args[0] == "catalog") {
        fmt::print("{}\n", j.dump(2));
        return 0;
    }

    fmt::print("{}", j.value("output", std::string()));
    return j.value("exit_code", 1);
}
