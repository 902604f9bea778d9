#pragma once

#include "typehook/utils/logging.hpp"
#include "typehook/utils/result.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace typehook {
namespace core {

/**
 * @brief Settings for one type checking session.
 *
 * JSON form (every key optional):
 * @code
 * {
 *   "name": "module-a",
 *   "log_level": "debug",
 *   "trace_dispatch": true
 * }
 * @endcode
 */
struct SessionConfig {
    std::string name = "default";
    utils::LogLevel logLevel = utils::LogLevel::Warn;
    bool traceDispatch = false;

    /**
     * @brief Build a configuration from a JSON object, starting from the defaults.
     *
     * Unknown keys are ignored. A key with the wrong JSON type, or an unknown
     * log level name, produces an error.
     */
    static Result<SessionConfig> fromJson(const nlohmann::json& json);

    nlohmann::json toJson() const;
};

/**
 * @brief Read a SessionConfig from a JSON file.
 * @return The configuration, or an IoError / ParseError / InvalidArgument error.
 */
Result<SessionConfig> loadSessionConfig(const std::string& path);

} // namespace core
} // namespace typehook
