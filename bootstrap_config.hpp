#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <filesystem>
#include "voice/voice_config.hpp"

// Centralized config + error table bootstrap for voxstream
namespace bootstrap_config {

    // Load voice_config.json and errors.json, return the typed config
    Voice::VoiceConfig initAll(const std::filesystem::path& configPath);

    // Generic loader → ensures defaults, patches missing keys, saves back
    bool loadConfig(const std::filesystem::path& path,
                    const nlohmann::json& defaults,
                    nlohmann::json& outConfig,
                    const std::string& name,
                    const std::string& errorCode = "");

    // Recursively fill missing / mistyped keys from defs
    bool mergeDefaults(nlohmann::json& cfg,
                       const nlohmann::json& defs,
                       int* patchedCount = nullptr);

    // json (already merged with defaults) → typed config
    Voice::VoiceConfig toVoiceConfig(const nlohmann::json& cfg);

    // Canonical defaults
    nlohmann::json defaultVoice();
    nlohmann::json defaultErrors();

    // Selectors the backend understands
    bool isKnownVoice(const std::string& voice);
    bool isKnownPersona(const std::string& persona);
}
