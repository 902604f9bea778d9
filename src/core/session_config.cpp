#include "typehook/core/session_config.h"
#include <fstream>

namespace typehook {
namespace core {

Result<SessionConfig> SessionConfig::fromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        return Error{ErrorCode::InvalidArgument, "Session configuration must be a JSON object"};
    }

    SessionConfig config;

    if (json.contains("name")) {
        if (!json["name"].is_string()) {
            return Error{ErrorCode::InvalidArgument, "\"name\" must be a string"};
        }
        config.name = json["name"].get<std::string>();
    }

    if (json.contains("log_level")) {
        if (!json["log_level"].is_string()) {
            return Error{ErrorCode::InvalidArgument, "\"log_level\" must be a string"};
        }
        const auto levelName = json["log_level"].get<std::string>();
        if (!utils::parseLogLevel(levelName, config.logLevel)) {
            return Error{ErrorCode::InvalidArgument, "Unknown log level: " + levelName};
        }
    }

    if (json.contains("trace_dispatch")) {
        if (!json["trace_dispatch"].is_boolean()) {
            return Error{ErrorCode::InvalidArgument, "\"trace_dispatch\" must be a boolean"};
        }
        config.traceDispatch = json["trace_dispatch"].get<bool>();
    }

    return config;
}

nlohmann::json SessionConfig::toJson() const {
    return {
        {"name", name},
        {"log_level", utils::logLevelName(logLevel)},
        {"trace_dispatch", traceDispatch}
    };
}

Result<SessionConfig> loadSessionConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::IoError, "Cannot open session configuration: " + path};
    }

    nlohmann::json json = nlohmann::json::parse(in, nullptr, false);
    if (json.is_discarded()) {
        return Error{ErrorCode::ParseError, "Malformed JSON in session configuration: " + path};
    }
    return SessionConfig::fromJson(json);
}

} // namespace core
} // namespace typehook
