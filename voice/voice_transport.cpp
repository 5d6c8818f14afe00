#include "voice_transport.hpp"
#include "encoding.hpp"
#include "logger.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <atomic>

namespace Voice {

    using json = nlohmann::json;

    // "HTTP/1.1 404 Not Found" → 404, anything else → 0
    static int statusFromHeaderLine(std::string_view line) {
        if (line.substr(0, 5) != "HTTP/") return 0;
        size_t sp = line.find(' ');
        if (sp == std::string_view::npos || sp + 4 > line.size()) return 0;

        int code = 0;
        for (size_t i = sp + 1; i < sp + 4; ++i) {
            char c = line[i];
            if (c < '0' || c > '9') return 0;
            code = code * 10 + (c - '0');
        }
        return code;
    }

    CprVoiceTransport::CprVoiceTransport(const VoiceConfig& config)
        : baseUrl_(config.baseUrl),
          endpoint_(config.streamEndpoint),
          fetchTimeoutMs_(config.fetchTimeoutMs),
          connectTimeoutMs_(config.connectTimeoutMs) {}

    std::string CprVoiceTransport::endpointUrl() const {
        std::string base = baseUrl_;
        while (!base.empty() && base.back() == '/') base.pop_back();
        if (!endpoint_.empty() && endpoint_.front() != '/') base.push_back('/');
        return base + endpoint_;
    }

    std::string CprVoiceTransport::encodeHistory(const std::vector<ConversationTurn>& history) {
        json arr = json::array();
        for (const auto& turn : history) {
            arr.push_back({{"role", turn.role}, {"content", turn.content}});
        }
        return encoding::base64Encode(arr.dump());
    }

    std::string CprVoiceTransport::errorMessageFromBody(const std::string& body, int status) {
        auto j = json::parse(body, nullptr, false);
        if (!j.is_discarded() && j.is_object()) {
            for (const char* key : {"userMessage", "error", "message"}) {
                auto it = j.find(key);
                if (it != j.end() && it->is_string() && !it->get<std::string>().empty()) {
                    return it->get<std::string>();
                }
            }
        }
        if (!body.empty()) return body;
        return "HTTP " + std::to_string(status);
    }

    // =========================================================
    // Streaming request
    // =========================================================
    TransportStatus CprVoiceTransport::stream(const StreamRequest& request, const DataHandler& onData) {
        TransportStatus result;
        const std::string url = endpointUrl();

        LOG_DEBUG("Transport", "POST " + url + " (audio=" + std::to_string(request.audioWav.size()) +
                               " bytes, history=" + std::to_string(request.history.size()) + ")");

        std::atomic<bool> cancelled{false};
        auto stopRequested = [&]() -> bool {
            if (!cancelled && request.cancelled && request.cancelled()) cancelled = true;
            return cancelled;
        };
        int status = 0;
        std::string errorBody;

        try {
            cpr::Multipart form{
                {"audio", cpr::Buffer{request.audioWav.begin(), request.audioWav.end(), "audio.wav"}, "audio/wav"},
                {"project_id", request.projectId},
                {"session_id", request.sessionId},
                {"voice", request.voice},
                {"persona", request.persona}
            };

            cpr::Header headers{{"Accept", "text/event-stream"}};
            if (!request.history.empty()) {
                headers["conversation"] = encodeHistory(request.history);
            }

            auto resp = cpr::Post(
                cpr::Url{url},
                headers,
                form,
                cpr::ConnectTimeout{connectTimeoutMs_},
                cpr::HeaderCallback{[&](std::string_view header, intptr_t) -> bool {
                    int code = statusFromHeaderLine(header);
                    if (code != 0) status = code;   // last one wins across redirects / 100-continue
                    return true;
                }},
                cpr::WriteCallback{[&](std::string_view data, intptr_t) -> bool {
                    if (stopRequested()) return false;
                    if (status >= 400) {
                        errorBody.append(data.data(), data.size());
                        return true;
                    }
                    if (!onData(data)) {
                        cancelled = true;
                        return false;
                    }
                    return true;
                }},
                cpr::ProgressCallback{[&](cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t,
                                          cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, intptr_t) -> bool {
                    return !stopRequested();
                }}
            );

            result.httpStatus = resp.status_code != 0 ? static_cast<int>(resp.status_code) : status;

            if (cancelled) {
                result.cancelled = true;
                result.message = "cancelled";
                LOG_DEBUG("Transport", "Stream cancelled by caller");
                return result;
            }

            if (resp.error.code != cpr::ErrorCode::OK && result.httpStatus == 0) {
                result.errorCode = "ERR_TRANSPORT_NETWORK";
                result.message = resp.error.message;
                LOG_ERROR("Transport", "Network failure: " + resp.error.message);
                return result;
            }

            if (result.httpStatus < 200 || result.httpStatus >= 300) {
                result.errorCode = "ERR_TRANSPORT_HTTP";
                result.message = errorMessageFromBody(errorBody, result.httpStatus);
                LOG_ERROR("Transport", "HTTP " + std::to_string(result.httpStatus) + ": " + result.message);
                return result;
            }

            if (resp.error.code != cpr::ErrorCode::OK) {
                // Connection dropped mid-body
                result.errorCode = "ERR_TRANSPORT_NETWORK";
                result.message = resp.error.message;
                LOG_ERROR("Transport", "Stream interrupted: " + resp.error.message);
                return result;
            }

            result.ok = true;
            LOG_DEBUG("Transport", "Stream closed by server (HTTP " + std::to_string(result.httpStatus) + ")");
        } catch (const std::exception& e) {
            result.errorCode = "ERR_TRANSPORT_NETWORK";
            result.message = e.what();
            LOG_ERROR("Transport", std::string("Exception in stream: ") + e.what());
        }
        return result;
    }

    // =========================================================
    // Chunk fetches
    // =========================================================
    static FetchResult toFetchResult(const cpr::Response& resp, const std::string& what) {
        FetchResult out;

        if (resp.status_code == 404) {
            out.status = FetchResult::Status::NotFound;
            out.message = "expired: " + what;
            return out;
        }
        if (resp.error.code != cpr::ErrorCode::OK) {
            out.message = resp.error.message;
            return out;
        }
        if (resp.status_code < 200 || resp.status_code >= 300) {
            out.message = "HTTP " + std::to_string(resp.status_code) + " for " + what;
            return out;
        }

        out.status = FetchResult::Status::Ok;
        out.bytes = resp.text;
        return out;
    }

    FetchResult CprVoiceTransport::fetchAudio(const std::string& audioId) {
        try {
            auto resp = cpr::Get(cpr::Url{endpointUrl()},
                                 cpr::Parameters{{"id", audioId}},
                                 cpr::Timeout{fetchTimeoutMs_});
            auto out = toFetchResult(resp, audioId);
            LOG_TRACE("Transport", "GET ?id=" + audioId + " -> " + std::to_string(resp.status_code) +
                                   " (" + std::to_string(out.bytes.size()) + " bytes)");
            return out;
        } catch (const std::exception& e) {
            FetchResult out;
            out.message = e.what();
            LOG_ERROR("Transport", std::string("Exception in fetchAudio: ") + e.what());
            return out;
        }
    }

    FetchResult CprVoiceTransport::fetchUrl(const std::string& url) {
        try {
            auto resp = cpr::Get(cpr::Url{url}, cpr::Timeout{fetchTimeoutMs_});
            return toFetchResult(resp, url);
        } catch (const std::exception& e) {
            FetchResult out;
            out.message = e.what();
            LOG_ERROR("Transport", std::string("Exception in fetchUrl: ") + e.what());
            return out;
        }
    }

} // namespace Voice
