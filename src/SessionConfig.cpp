#include "SessionConfig.hpp"
#include "BoardException.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <type_traits>

namespace {

BoardException BadValue(const char* key, const std::string& reason) {
    return BoardException(std::string("config key '") + key + "': " + reason,
                          StreamExitCodes::INVALID_ARGUMENTS_ERROR);
}

// nlohmann converts numbers with static_cast, so integer keys are range
// checked here instead of wrapping or truncating
template <typename T>
void CheckIntegerRange(const nlohmann::json& item, const char* key) {
    if (!item.is_number_integer()) {
        throw BadValue(key, "expected an integer, got " + item.dump());
    }
    if (item.is_number_unsigned()) {
        if (item.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
            throw BadValue(key, item.dump() + " is out of range");
        }
        return;
    }
    std::int64_t number = item.get<std::int64_t>();
    if (number < static_cast<std::int64_t>(std::numeric_limits<T>::min()) ||
        number > static_cast<std::int64_t>(std::numeric_limits<T>::max())) {
        throw BadValue(key, item.dump() + " is out of range");
    }
}

template <typename T>
void ReadKey(const nlohmann::json& json, const char* key, T& value) {
    auto it = json.find(key);
    if (it == json.end()) {
        return;
    }
    if constexpr (std::is_integral_v<T>) {
        CheckIntegerRange<T>(*it, key);
    }
    try {
        value = it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw BadValue(key, e.what());
    }
}

} // namespace

SessionConfig SessionConfigFromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw BoardException("config must be a JSON object", StreamExitCodes::INVALID_ARGUMENTS_ERROR);
    }
    SessionConfig config;
    ReadKey(json, "board_id", config.boardId);
    ReadKey(json, "port", config.port);
    ReadKey(json, "buffer_size", config.bufferSize);
    ReadKey(json, "stream_ms", config.streamMs);
    ReadKey(json, "bandpass_low", config.bandpassLow);
    ReadKey(json, "bandpass_high", config.bandpassHigh);
    ReadKey(json, "log_level", config.logLevel);
    ReadKey(json, "output_raw", config.outputRaw);
    ReadKey(json, "output_reloaded", config.outputReloaded);
    ReadKey(json, "output_processed", config.outputProcessed);
    return config;
}

SessionConfig LoadSessionConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw BoardException("unable to open config " + path, StreamExitCodes::INVALID_ARGUMENTS_ERROR);
    }
    nlohmann::json json;
    try {
        file >> json;
    } catch (const nlohmann::json::parse_error& e) {
        throw BoardException("unable to parse config " + path + ": " + e.what(),
                             StreamExitCodes::INVALID_ARGUMENTS_ERROR);
    }
    return SessionConfigFromJson(json);
}

nlohmann::json SessionConfigToJson(const SessionConfig& config) {
    return nlohmann::json{
        {"board_id", config.boardId},
        {"port", config.port},
        {"buffer_size", config.bufferSize},
        {"stream_ms", config.streamMs},
        {"bandpass_low", config.bandpassLow},
        {"bandpass_high", config.bandpassHigh},
        {"log_level", config.logLevel},
        {"output_raw", config.outputRaw},
        {"output_reloaded", config.outputReloaded},
        {"output_processed", config.outputProcessed}
    };
}
