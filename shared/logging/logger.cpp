#include "logger.hpp"
#include "logger_spdlog.hpp"
#include "common/result_helper.hpp"

#include <iostream>

namespace logging {

Logger& Logger::instance() {
    static Logger instance;  // C++11 이후 thread-safe 보장
    return instance;
}

Logger::Logger() = default;

Logger::~Logger() {
    if(logger_) {
        auto r = logger_->shutdown();
        if (!r) std::cerr << "logger shutdown: " << to_string(r) << std::endl;
    }
}

Result<void> Logger::init(logging::Type logger_type, const std::string& filename) {
    try {
        config_ = YAML::LoadFile(filename);
    } catch (const YAML::Exception& e) {
        return Error(ResultCode::InvalidArgument,
                     std::string("logging config load error: ") + e.what());
    }

    switch (logger_type)
    {
    case logging::Type::SpdLog:
        logger_ = std::make_shared<SpdlogBackend>();
        break;
    default:
        return Error(ResultCode::InvalidArgument, "unknown logger type");
    }

    return logger_->init();
}

Result<void> Logger::configureLevel(const std::string& tag, const YAML::Node& node) {
    auto text = node.as<std::string>();
    auto level = parseLevel(text);
    if (!level) return Error(ResultCode::InvalidArgument, "unknown log level '" + text + "' for " + tag);
    return logger_->setLevel(tag, *level);
}

Result<void> Logger::apply() {
    if (!logger_) return Error(ResultCode::InvalidArgument, "logger not initialized");
    if (!config_["log"]) return OK();

    try {
        auto g_tag = std::string(GLOBAL_TAG);
        if (config_["log"][g_tag]) {
            auto node = config_["log"][g_tag];

            // Global level 설정
            if (node["level"]) {
                auto r = configureLevel(g_tag, node["level"]);
                RETURN_IF_ERR(r);
            }

            // Global sink 설정
            if (node["sinks"]) {
                for (auto sink : node["sinks"]) {
                    auto r = configureSink(g_tag, sink);
                    RETURN_IF_ERR(r);
                }
            }
        }

        for (auto it : config_["log"]) {
            std::string tag = it.first.as<std::string>();
            if (tag == GLOBAL_TAG) continue;
            auto node = it.second;

            if (node["sinks"]) {
                for (auto sink : node["sinks"]) {
                    auto r = configureSink(tag, sink);
                    RETURN_IF_ERR(r);
                }
            }
            auto r = logger_->registerLogger(tag);
            RETURN_IF_ERR(r);

            // 레벨 적용
            if (node["level"]) {
                r = configureLevel(tag, node["level"]);
                RETURN_IF_ERR(r);
            }
            if (node["enabled"] && !node["enabled"].as<bool>()) {
                r = logger_->disableTag(tag);
                RETURN_IF_ERR(r);
            }
        }
    } catch (const YAML::Exception& e) {
        return Error(ResultCode::InvalidArgument, std::string("logging config: ") + e.what());
    }
    return OK();
}

Result<void> Logger::configureSink(const std::string& tag, const YAML::Node& sink) {
    std::string type = sink["type"].as<std::string>();

    if (type == "console") {
        return logger_->setConsoleSink(tag);
    } else if (type == "file") {
        return logger_->setFileSink(tag, sink["filename"].as<std::string>());
    } else if (type == "rotating_file") {
        return logger_->setRotatingFileSink(tag,
            sink["filename"].as<std::string>(),
            sink["max_size"].as<size_t>(),
            sink["max_files"].as<size_t>());
    } else if (type == "syslog") {
        return logger_->setSyslogSink(tag,
            sink["ident"] ? sink["ident"].as<std::string>() : tag);
    }
    return Error(ResultCode::InvalidArgument, "unknown sink type: " + type);
}

} // namespace logging
