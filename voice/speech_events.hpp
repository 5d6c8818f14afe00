#pragma once
#include <string>
#include "voice/channel.hpp"

namespace Voice {

    // 🔹 Everything the session tells the UI, as one tagged stream
    enum class SpeechEventType {
        UserSpeaking,   // VAD saw speech start (barge-in)
        Processing,     // clip accepted, request in flight
        AiSpeaking,     // first audio fragment of a run started playing
        Reset,          // back to idle (done, rejected, stopped or failed)
        Error,          // text = human-readable message
        Transcript,     // text = what the user said
        Response,       // text = full assistant reply
        ResponseChunk,  // text = streamed piece of the reply
        Complete        // text = full reply, transcript = user transcript
    };

    struct SpeechEvent {
        SpeechEventType type;
        std::string text;
        std::string transcript;
    };

    using EventChannel = Channel<SpeechEvent>;

    inline const char* toString(SpeechEventType type) {
        switch (type) {
            case SpeechEventType::UserSpeaking:  return "UserSpeaking";
            case SpeechEventType::Processing:    return "Processing";
            case SpeechEventType::AiSpeaking:    return "AiSpeaking";
            case SpeechEventType::Reset:         return "Reset";
            case SpeechEventType::Error:         return "Error";
            case SpeechEventType::Transcript:    return "Transcript";
            case SpeechEventType::Response:      return "Response";
            case SpeechEventType::ResponseChunk: return "ResponseChunk";
            case SpeechEventType::Complete:      return "Complete";
        }
        return "Unknown";
    }

} // namespace Voice
