#include "bootstrap_config.hpp"
#include "error_manager.hpp"
#include "resources.hpp"
#include "logger.hpp"

#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

// ----------------- helpers -----------------
static bool sameKind(const nlohmann::json& a, const nlohmann::json& b) {
    // 10 parses as unsigned, the literal default is signed; both are numbers
    if (a.is_number() && b.is_number()) return true;
    return a.type() == b.type();
}

static void saveConfig(const fs::path& path, const nlohmann::json& cfg) {
    std::ofstream out(path);
    if (!out) {
        LOG_ERROR("Config", "Could not write " + path.string());
        return;
    }
    out << cfg.dump(2) << '\n';
}

template <typename T>
static T pick(const nlohmann::json& cfg, const char* section, const char* key, T fallback) {
    auto sec = cfg.find(section);
    if (sec == cfg.end() || !sec->is_object()) return fallback;
    auto it = sec->find(key);
    if (it == sec->end() || it->is_null()) return fallback;
    try {
        return it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Config", std::string(section) + "." + key + " has wrong type: " + e.what());
        return fallback;
    }
}

namespace bootstrap_config {

bool mergeDefaults(nlohmann::json& cfg,
                   const nlohmann::json& defs,
                   int* patchedCount) {
    bool patched = false;
    for (auto& [key, defVal] : defs.items()) {
        if (!cfg.contains(key) || cfg[key].is_null()) {
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        } else if (defVal.is_object() && cfg[key].is_object()) {
            if (mergeDefaults(cfg[key], defVal, patchedCount))
                patched = true;
        } else if (!sameKind(cfg[key], defVal)) {
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        }
    }
    return patched;
}

// ----------------- defaults -----------------
nlohmann::json defaultVoice() {
    return {
        {"server", {
            {"base_url", "http://127.0.0.1:3000"},
            {"stream_endpoint", "/api/proxy/voice/streaming"},
            {"fetch_timeout_ms", 5000},
            {"connect_timeout_ms", 10000}
        }},
        {"session", {
            {"project_id", ""},
            {"session_id", ""},
            {"voice", "alloy"},
            {"persona", "assistant"},
            {"min_clip_seconds", 0.4}
        }},
        {"playback", {
            {"inter_chunk_gap_ms", 50},
            {"retry_gap_ms", 100},
            {"tick_ms", 10},
            {"volume", 100.0}
        }},
        {"chunking", {
            {"max_chunk_size", 200},
            {"target_chunk_size", 150}
        }},
        {"logging", {
            {"file", "voxstream.log"},
            {"level", "debug"},
            {"console", false}
        }}
    };
}

nlohmann::json defaultErrors() {
    return {
        {"ERR_CONFIG_INVALID", {
            {"user", "[Config] Config file invalid → reset to defaults."},
            {"debug", "voice_config.json failed parsing or validation."}
        }},
        {"ERR_CLIP_TOO_SHORT", {
            {"user", "[Voice] That was too short to be speech."},
            {"debug", "Captured clip below minimum duration, request not sent."}
        }},
        {"ERR_NO_PROJECT", {
            {"user", "[Voice] No agent selected - cannot send audio."},
            {"debug", "session.project_id is empty."}
        }},
        {"ERR_TRANSPORT_HTTP", {
            {"user", "[Voice] The voice service returned an error."},
            {"debug", "Streaming request answered with a non-2xx status."}
        }},
        {"ERR_TRANSPORT_NETWORK", {
            {"user", "[Voice] Could not reach the voice service."},
            {"debug", "Streaming request failed at the network layer."}
        }},
        {"ERR_STREAM_INCOMPLETE", {
            {"user", "[Voice] The response ended unexpectedly."},
            {"debug", "Stream closed without a complete or error frame."}
        }},
        {"ERR_SERVER_ERROR", {
            {"user", "[Voice] The voice service reported an error."},
            {"debug", "Terminal error frame received."}
        }},
        {"ERR_CHUNK_DECODE", {
            {"user", "[Voice] Part of the reply could not be played."},
            {"debug", "Audio chunk failed to decode, skipped."}
        }},
        {"ERR_CHUNK_EXPIRED", {
            {"user", "[Voice] Part of the reply expired before playback."},
            {"debug", "audio_ref fetch returned 404 (artifact evicted), skipped without retry."}
        }},
        {"ERR_CHUNK_FETCH", {
            {"user", "[Voice] Part of the reply could not be downloaded."},
            {"debug", "audio_ref fetch failed or timed out, skipped without retry."}
        }},
        {"ERR_CHUNK_SYNTHESIS", {
            {"user", "[Voice] Part of the reply could not be synthesized."},
            {"debug", "Server reported a per-chunk TTS failure, skipped."}
        }},
        {"ERR_SESSION_CANCELLED", {
            {"user", "[Voice] Stopped."},
            {"debug", "Cycle invalidated by stopAudio or a newer submit."}
        }}
    };
}

bool isKnownVoice(const std::string& voice) {
    static const char* voices[] = { "alloy", "echo", "fable", "onyx", "nova", "shimmer" };
    for (auto* v : voices) {
        if (voice == v) return true;
    }
    return false;
}

bool isKnownPersona(const std::string& persona) {
    static const char* personas[] = { "assistant", "creative", "analytical", "casual", "professional" };
    for (auto* p : personas) {
        if (persona == p) return true;
    }
    return false;
}

// ----------------- typed view -----------------
Voice::VoiceConfig toVoiceConfig(const nlohmann::json& cfg) {
    Voice::VoiceConfig out;

    out.baseUrl          = pick<std::string>(cfg, "server", "base_url", out.baseUrl);
    out.streamEndpoint   = pick<std::string>(cfg, "server", "stream_endpoint", out.streamEndpoint);
    out.fetchTimeoutMs   = pick<int>(cfg, "server", "fetch_timeout_ms", out.fetchTimeoutMs);
    out.connectTimeoutMs = pick<int>(cfg, "server", "connect_timeout_ms", out.connectTimeoutMs);

    out.projectId      = pick<std::string>(cfg, "session", "project_id", out.projectId);
    out.sessionId      = pick<std::string>(cfg, "session", "session_id", out.sessionId);
    out.voice          = pick<std::string>(cfg, "session", "voice", out.voice);
    out.persona        = pick<std::string>(cfg, "session", "persona", out.persona);
    out.minClipSeconds = pick<double>(cfg, "session", "min_clip_seconds", out.minClipSeconds);

    out.interChunkGapMs = pick<int>(cfg, "playback", "inter_chunk_gap_ms", out.interChunkGapMs);
    out.retryGapMs      = pick<int>(cfg, "playback", "retry_gap_ms", out.retryGapMs);
    out.tickMs          = pick<int>(cfg, "playback", "tick_ms", out.tickMs);
    out.volume          = pick<float>(cfg, "playback", "volume", out.volume);

    out.maxChunkSize    = pick<std::size_t>(cfg, "chunking", "max_chunk_size", out.maxChunkSize);
    out.targetChunkSize = pick<std::size_t>(cfg, "chunking", "target_chunk_size", out.targetChunkSize);

    out.logFile    = pick<std::string>(cfg, "logging", "file", out.logFile);
    out.logLevel   = pick<std::string>(cfg, "logging", "level", out.logLevel);
    out.logConsole = pick<bool>(cfg, "logging", "console", out.logConsole);

    if (!isKnownVoice(out.voice)) {
        LOG_ERROR("Config", "Unknown voice '" + out.voice + "', using alloy");
        out.voice = "alloy";
    }
    if (!isKnownPersona(out.persona)) {
        LOG_ERROR("Config", "Unknown persona '" + out.persona + "', using assistant");
        out.persona = "assistant";
    }
    if (out.tickMs <= 0) {
        LOG_ERROR("Config", "playback.tick_ms must be positive, using 10");
        out.tickMs = 10;
    }
    if (parseLogLevel(out.logLevel, LogLevel::Off) == LogLevel::Off && out.logLevel != "off") {
        LOG_ERROR("Config", "Unknown logging.level '" + out.logLevel + "', using debug");
        out.logLevel = "debug";
    }
    if (out.interChunkGapMs < 0) out.interChunkGapMs = 0;
    if (out.retryGapMs < 0) out.retryGapMs = 0;
    if (out.maxChunkSize == 0) out.maxChunkSize = 200;
    if (out.targetChunkSize == 0) out.targetChunkSize = 150;

    return out;
}

// ----------------- loader -----------------
bool loadConfig(const fs::path& path,
                const nlohmann::json& defaults,
                nlohmann::json& outConfig,
                const std::string& name,
                const std::string& errorCode) {
    if (!fs::exists(path)) {
        outConfig = defaults;
        saveConfig(path, outConfig);

        LOG_PHASE(name + " created", true);
        return true;
    }

    try {
        std::ifstream f(path);
        f >> outConfig;
        if (!outConfig.is_object()) {
            throw std::runtime_error("top level is not an object");
        }

        int patchedCount = 0;
        if (mergeDefaults(outConfig, defaults, &patchedCount)) {
            saveConfig(path, outConfig);
            LOG_PHASE(name + " patched", true);
            LOG_DEBUG("Config", name + " patched (" + std::to_string(patchedCount) + " keys)");
        } else {
            LOG_PHASE(name + " load", true);
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Config", name + " invalid → reset to defaults (" + e.what() + ")");
        LOG_PHASE(name + " load", false);

        if (!errorCode.empty())
            ErrorManager::note(errorCode, path.string());

        outConfig = defaults;
        saveConfig(path, outConfig);
        return false;
    }
}

// ----------------- entry -----------------
Voice::VoiceConfig initAll(const fs::path& configPath) {
    // errors.json first so config problems are reported with the right text
    fs::path errPath = fs::path(getResourcePath()) / "errors.json";
    nlohmann::json errorsCfg;
    loadConfig(errPath, defaultErrors(), errorsCfg, "Errors config", "");
    ErrorManager::loadFromJson(errorsCfg);

    nlohmann::json voiceCfg;
    loadConfig(configPath, defaultVoice(), voiceCfg, "Voice config", "ERR_CONFIG_INVALID");

    return toVoiceConfig(voiceCfg);
}

} // namespace bootstrap_config
