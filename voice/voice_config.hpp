#pragma once
#include <string>
#include <cstddef>

namespace Voice {

    // Typed view of voice_config.json (see bootstrap_config::toVoiceConfig)
    struct VoiceConfig {
        // ---------------- server ----------------
        std::string baseUrl        = "http://127.0.0.1:3000";
        std::string streamEndpoint = "/api/proxy/voice/streaming";
        int fetchTimeoutMs         = 5000;   // per audio_ref fetch, never retried
        int connectTimeoutMs       = 10000;

        // ---------------- session ----------------
        std::string projectId;               // target agent
        std::string sessionId;               // opaque, passed through
        std::string voice          = "alloy";
        std::string persona        = "assistant";
        double minClipSeconds      = 0.4;

        // ---------------- playback ----------------
        int interChunkGapMs        = 50;
        int retryGapMs             = 100;
        int tickMs                 = 10;
        float volume               = 100.f;

        // ---------------- chunking ----------------
        std::size_t maxChunkSize    = 200;
        std::size_t targetChunkSize = 150;

        // ---------------- logging ----------------
        std::string logFile        = "voxstream.log";
        std::string logLevel       = "debug";   // trace | debug | error | off
        bool logConsole            = false;     // mirror to stderr
    };

} // namespace Voice
