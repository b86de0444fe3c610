#pragma once
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>

#include "command/command.hpp"
#include "query/entity_store.hpp"

namespace testing_support {

inline command::CommandDescriptor descriptor(const std::string& name,
                                             command::RiskLevel risk = command::RiskLevel::Low,
                                             const std::string& category = "Utility") {
    command::CommandDescriptor d;
    d.name = name;
    d.display_name = name;
    d.description = "test command " + name;
    d.category = category;
    d.risk = risk;
    return d;
}

// Counts executions and echoes the options it saw.
class StubCommand : public command::Command {
public:
    explicit StubCommand(command::CommandDescriptor d, int exit_code = 0)
        : Command(std::move(d)), exit_code_(exit_code) {}

    Result<void, command::ValidationError> validateOptions(const command::OptionValues& values) const override {
        if (throw_on_validate) throw std::out_of_range("stub validation failure");
        return Command::validateOptions(values);
    }

    command::CommandOutput execute(const command::OptionValues& values,
                                   const command::ExecutionContext& context) override {
        ++executions;
        last_values = values;
        last_context = context;
        if (throw_on_execute) throw std::runtime_error("stub failure");
        command::CommandOutput out;
        out.output = "ran " + name();
        out.exit_code = exit_code_;
        return out;
    }

    std::atomic<int> executions{0};
    bool throw_on_execute = false;
    bool throw_on_validate = false;
    command::OptionValues last_values;
    command::ExecutionContext last_context;

private:
    int exit_code_;
};

// 2024-04-01 00:00:00 UTC
inline std::chrono::system_clock::time_point fixedNow() {
    return std::chrono::system_clock::from_time_t(1711929600);
}

inline std::shared_ptr<query::EntityStore> sampleStore() {
    auto store = std::make_shared<query::EntityStore>();
    store->define("User", "Users", {"id", "name", "age", "status", "created_at"});
    (void)store->insert("User", {{"id", 1}, {"name", "Alice"}, {"age", 34}, {"status", "active"},
                                 {"created_at", "2024-01-15 09:12:00"}});
    (void)store->insert("User", {{"id", 2}, {"name", "Bob"}, {"age", 18}, {"status", "pending"},
                                 {"created_at", "2024-02-02 14:40:00"}});
    (void)store->insert("User", {{"id", 3}, {"name", "Carol"}, {"age", 52}, {"status", "active"},
                                 {"created_at", "2024-03-21 08:05:00"}});
    (void)store->insert("User", {{"id", 4}, {"name", "Dave"}, {"age", nullptr}, {"status", "banned"},
                                 {"created_at", "2023-12-31 23:59:59"}});

    store->define("sessions", "Sessions", {});
    (void)store->insert("sessions", {{"id", "a1"}, {"created_at", "2023-11-01 10:00:00"}});
    (void)store->insert("sessions", {{"id", "b2"}, {"created_at", "2024-03-20 22:31:00"}});
    (void)store->insert("sessions", {{"id", "c3"}, {"created_at", "2024-02-01 00:00:00"}});
    return store;
}

} // namespace testing_support
