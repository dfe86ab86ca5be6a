#include "VoiceConfig.hpp"
#include "debug_log.hpp"

#include <fstream>
#include <iterator>

namespace voicenote {

namespace {

template <typename T>
void ReadValue(const nlohmann::json& section, const char* key, T& target) {
    auto it = section.find(key);
    if (it == section.end() || it->is_null()) {
        return;
    }
    target = it->get<T>();
}

// JSON integers may be negative; get<unsigned int>() would wrap them
void ReadValue(const nlohmann::json& section, const char* key, unsigned int& target) {
    auto it = section.find(key);
    if (it == section.end() || it->is_null()) {
        return;
    }
    if (!it->is_number_unsigned()) {
        throw ConfigError(std::string("'") + key + "' must be a non-negative integer");
    }
    target = it->get<unsigned int>();
}

const nlohmann::json& Section(const nlohmann::json& root, const char* name) {
    static const nlohmann::json empty = nlohmann::json::object();
    auto it = root.find(name);
    if (it == root.end()) {
        return empty;
    }
    if (!it->is_object()) {
        throw ConfigError(std::string("section '") + name + "' must be an object");
    }
    return *it;
}

} // namespace

VoiceConfig VoiceConfig::FromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw ConfigError("configuration root must be an object");
    }

    VoiceConfig config;
    try {
        const auto& recorder = Section(json, "recorder");
        ReadValue(recorder, "max_duration_seconds", config.recorder.maxDurationSeconds);
        ReadValue(recorder, "tick_ms", config.recorder.tickMs);
        ReadValue(recorder, "sample_rate", config.recorder.sampleRate);
        ReadValue(recorder, "output_dir", config.recorder.outputDir);
        ReadValue(recorder, "denoise", config.recorder.denoise);

        const auto& player = Section(json, "player");
        ReadValue(player, "status_interval_ms", config.player.statusIntervalMs);

        const auto& storage = Section(json, "storage");
        ReadValue(storage, "gateway_url", config.storage.gatewayUrl);
        ReadValue(storage, "bucket", config.storage.bucket);
        ReadValue(storage, "timeout_ms", config.storage.timeoutMs);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid configuration value: ") + e.what());
    }

    if (config.recorder.maxDurationSeconds == 0) {
        throw ConfigError("recorder.max_duration_seconds must be positive");
    }
    if (config.recorder.tickMs == 0 || config.player.statusIntervalMs == 0) {
        throw ConfigError("tick intervals must be positive");
    }
    if (config.storage.bucket.empty()) {
        throw ConfigError("storage.bucket must not be empty");
    }

    return config;
}

VoiceConfig VoiceConfig::FromString(const std::string& text) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(std::string("could not parse configuration: ") + e.what());
    }
    return FromJson(json);
}

VoiceConfig VoiceConfig::Load(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("could not open configuration file: " + path);
    }

    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    DEBUG_LOG("Loaded configuration from " << path << DEBUG_LOG_ENDL);
    return FromString(text);
}

} // namespace voicenote
