#pragma once

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

namespace voicenote {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

struct RecorderConfig {
    unsigned int maxDurationSeconds = 120;
    unsigned int tickMs = 100;
    unsigned int sampleRate = 48000;
    std::string outputDir = "/tmp";
    bool denoise = false;
};

struct PlayerConfig {
    unsigned int statusIntervalMs = 100;
};

struct StorageConfig {
    std::string gatewayUrl = "ws://localhost:8000";
    std::string bucket = "voice-messages";
    unsigned int timeoutMs = 10000;
};

struct VoiceConfig {
    RecorderConfig recorder;
    PlayerConfig player;
    StorageConfig storage;

    // Missing keys keep their defaults. Throws ConfigError on malformed input.
    static VoiceConfig FromJson(const nlohmann::json& json);
    static VoiceConfig FromString(const std::string& text);
    static VoiceConfig Load(const std::string& path);
};

} // namespace voicenote
