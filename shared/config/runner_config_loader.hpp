#pragma once
#include <string>

#include <yaml-cpp/yaml.h>

#include "common/result.h"
#include "runner_config.hpp"

namespace config {

class RunnerConfigLoader {
public:
    // Missing keys keep their defaults; relative paths are resolved
    // against the directory of the file.
    static Result<RunnerConfig> loadFile(const std::string& path);

    static Result<RunnerConfig> load(const YAML::Node& root, const std::string& base_dir = "");

    static RunnerConfig defaults() { return RunnerConfig{}; }

private:
    inline static constexpr const char* LOG_TAG = "RunnerConfigLoader";
};

} // namespace config
