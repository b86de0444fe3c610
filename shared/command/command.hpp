#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "common/result.h"
#include "command_def.hpp"

namespace command {

struct CommandOutput {
    std::string output;
    int exit_code = 0;
    double elapsed_seconds = 0.0;
};

struct ExecutionContext {
    std::string user;
    std::string environment;
    std::chrono::system_clock::time_point started_at = std::chrono::system_clock::now();
};

// One executable operation. The descriptor is fixed at construction.
class Command {
public:
    explicit Command(CommandDescriptor descriptor) : descriptor_(std::move(descriptor)) {}
    virtual ~Command() = default;

    Command(const Command&) = delete;
    Command& operator=(const Command&) = delete;

    const CommandDescriptor& descriptor() const noexcept { return descriptor_; }
    const std::string& name() const noexcept { return descriptor_.name; }

    bool requiresConfirmation() const;

    /**
     * Base option pass (required keys, then rules).
     * Overrides add domain checks and must call Command::validateOptions first.
     */
    virtual Result<void, ValidationError> validateOptions(const OptionValues& values) const;

    // values are already collected and validated by the caller
    virtual CommandOutput execute(const OptionValues& values, const ExecutionContext& context) = 0;

    // Catalog description consumed by the presentation layer.
    nlohmann::ordered_json toConfig() const;

private:
    const CommandDescriptor descriptor_;
};

using CommandHandle = std::shared_ptr<Command>;

} // namespace command
