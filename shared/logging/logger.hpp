#pragma once
#include <memory>
#include <string>

#include <yaml-cpp/yaml.h>

#include "common/result.h"
#include "logger_backend.hpp"

namespace logging {

class Logger {
public:
    static Logger& instance();

    Result<void> init(logging::Type logger, const std::string& filename);
    Result<void> apply();
    void log(const std::string& tag, Level level, const std::string& msg) { if(logger_) logger_->log(tag, level, msg); }

    bool isInitialized() const noexcept { return logger_ != nullptr; }

    Result<void> setLevel(const std::string& tag, Level level) {
        if(logger_) return logger_->setLevel(tag, level);
        return Error(ResultCode::InvalidArgument, "logger not initialized");
    }
    Result<void> enableTag(const std::string& tag) {
        if(logger_) return logger_->enableTag(tag);
        return Error(ResultCode::InvalidArgument, "logger not initialized");
    }
    Result<void> disableTag(const std::string& tag) {
        if(logger_) return logger_->disableTag(tag);
        return Error(ResultCode::InvalidArgument, "logger not initialized");
    }


private:
    Logger();
    ~Logger();

    // 복사/이동 금지
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    Result<void> configureSink(const std::string& tag, const YAML::Node& sink);
    Result<void> configureLevel(const std::string& tag, const YAML::Node& level);

    YAML::Node config_;
    std::shared_ptr<LoggerBackend> logger_;
};

} // namespace logging
