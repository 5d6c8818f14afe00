#pragma once
#include <functional>
#include <string>
#include <string_view>
#include <vector>
#include "voice/voice_config.hpp"

namespace Voice {

    struct ConversationTurn {
        std::string role;      // "user" | "assistant"
        std::string content;
    };

    // One capture→response request
    struct StreamRequest {
        std::string audioWav;          // complete WAV file bytes
        std::string projectId;
        std::string sessionId;
        std::string voice;
        std::string persona;
        std::vector<ConversationTurn> history;

        // Polled while the request runs; true aborts it
        std::function<bool()> cancelled;
    };

    // How stream() ended
    struct TransportStatus {
        bool ok = false;              // 2xx and the body was read to the end
        bool cancelled = false;       // onData asked to stop
        int httpStatus = 0;
        std::string errorCode;        // ERR_TRANSPORT_HTTP / ERR_TRANSPORT_NETWORK
        std::string message;
    };

    struct FetchResult {
        enum class Status { Ok, NotFound, Failed };

        Status status = Status::Failed;
        std::string bytes;
        std::string message;
    };

    // ------------------------------------------------------------
    // VoiceTransport: the network side of a session
    // ------------------------------------------------------------
    // stream() blocks until the response body ends; body bytes are handed
    // to onData as they arrive, split arbitrarily. Returning false from
    // onData aborts the request.
    class VoiceTransport {
    public:
        using DataHandler = std::function<bool(std::string_view)>;

        virtual ~VoiceTransport() = default;

        virtual TransportStatus stream(const StreamRequest& request, const DataHandler& onData) = 0;

        // Follow-up fetch for an audio_ref frame. 404 → NotFound.
        virtual FetchResult fetchAudio(const std::string& audioId) = 0;

        // Absolute http(s) audio URL
        virtual FetchResult fetchUrl(const std::string& url) = 0;
    };

    // ------------------------------------------------------------
    // CprVoiceTransport
    // ------------------------------------------------------------
    class CprVoiceTransport : public VoiceTransport {
    public:
        explicit CprVoiceTransport(const VoiceConfig& config);

        TransportStatus stream(const StreamRequest& request, const DataHandler& onData) override;
        FetchResult fetchAudio(const std::string& audioId) override;
        FetchResult fetchUrl(const std::string& url) override;

        // base64(JSON history), sent in the "conversation" header
        static std::string encodeHistory(const std::vector<ConversationTurn>& history);

        // Non-2xx body → message: userMessage, then error, then the raw body
        static std::string errorMessageFromBody(const std::string& body, int status);

    private:
        std::string endpointUrl() const;

        std::string baseUrl_;
        std::string endpoint_;
        int fetchTimeoutMs_;
        int connectTimeoutMs_;
    };

} // namespace Voice
