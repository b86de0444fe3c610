#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <string>
#include <thread>

#include <fmt/core.h>

#include "audit/audit_sink.hpp"
#include "audit/bus_audit_sink.hpp"
#include "command/command_dispatcher.hpp"
#include "command/command_registry.hpp"
#include "composition/runner_bootstrap.hpp"
#include "composition/runner_service.hpp"
#include "config/runner_config_loader.hpp"
#include "logging/logging.hpp"
#include "messaging/zmq_message_bus.hpp"
#include "query/entity_store.hpp"
#include "system_control/system_control.hpp"

static constexpr const char* TAG = "CommandRunner";

namespace {

std::atomic<bool> g_running{true};

void onSignal(int) {
    g_running.store(false);
}

} // namespace

int main(int argc, char** argv) {
    const std::string config_path = argc > 1 ? argv[1] : "config/command_runner.yaml";

    auto loaded = config::RunnerConfigLoader::loadFile(config_path);
    if (!loaded) {
        fmt::print(stderr, "command_runner: {}\n", loaded.error().value_or("invalid configuration"));
        return 1;
    }
    const auto& cfg = loaded.value();

    // YAML 기반 로깅 설정 적용
    if (!cfg.logging.empty()) {
        auto r = logging::init(logging::Type::SpdLog, cfg.logging);
        if (!r) fmt::print(stderr, "command_runner: logging disabled ({})\n", to_string(r));
    }
    LOG_INFO(TAG, "starting (config={}, environment={})", config_path, cfg.environment);

    auto store = std::make_shared<query::EntityStore>();
    if (!cfg.entities.empty()) {
        auto r = query::EntityFixtureLoader::loadFile(cfg.entities, *store);
        if (!r) {
            LOG_ERROR(TAG, "entity fixture: {}", to_string(r));
            return 1;
        }
    }

    command::CommandRegistry registry;
    composition::RunnerBootstrap::populate(registry, cfg, store);

    messaging::ZmqMessageBus bus(cfg.server.audit_endpoint);
    std::shared_ptr<audit::AuditSink> sink;
    if (cfg.server.audit_endpoint.empty()) sink = std::make_shared<audit::LogAuditSink>();
    else sink = std::make_shared<audit::BusAuditSink>(bus);

    command::CommandDispatcher dispatcher(registry, cfg, sink);
    composition::RunnerService service(dispatcher);

    auto served = bus.reply(cfg.server.endpoint, [&service](const std::string& payload) {
        return service.handle(payload);
    });
    if (!served) {
        LOG_ERROR(TAG, "cannot serve requests: {}", to_string(served));
        system_control::notify_status("FATAL: " + to_string(served));
        return 1;
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    system_control::notify_ready(fmt::format("{} command(s) on {}", registry.size(), cfg.server.endpoint));
    LOG_INFO(TAG, "ready: {} command(s), endpoint {}", registry.size(), cfg.server.endpoint);

    const auto watchdog = system_control::watchdog_interval();
    auto last_ping = std::chrono::steady_clock::now();
    while (g_running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (watchdog.count() > 0 && std::chrono::steady_clock::now() - last_ping >= watchdog / 2) {
            system_control::notify_watchdog();
            last_ping = std::chrono::steady_clock::now();
        }
    }

    system_control::notify_stopping();
    LOG_INFO(TAG, "stopping");
    bus.shutdown();
    return 0;
}
