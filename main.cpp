#include "bootstrap_config.hpp"
#include "error_manager.hpp"
#include "logger.hpp"
#include "resources.hpp"
#include "voice/audio_decoder.hpp"
#include "voice/audio_output.hpp"
#include "voice/speech_session.hpp"
#include "voice/text_chunker.hpp"
#include "voice/voice_transport.hpp"

#include <filesystem>
#include <future>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace fs = std::filesystem;

static std::mutex g_outMutex;

static void printLine(const std::string& line) {
    std::lock_guard<std::mutex> lock(g_outMutex);
    std::cout << line << std::endl;
}

static std::string trimmed(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

// 🔹 Mirror session events to the console
static void printEvents(Voice::EventChannel& events) {
    using Voice::SpeechEventType;
    while (auto ev = events.pop()) {
        switch (ev->type) {
            case SpeechEventType::UserSpeaking: printLine("[listening]"); break;
            case SpeechEventType::Processing:   printLine("[processing]"); break;
            case SpeechEventType::AiSpeaking:   printLine("[speaking]"); break;
            case SpeechEventType::Reset:        printLine("[idle]"); break;
            case SpeechEventType::Error:        printLine("[error] " + ev->text); break;
            case SpeechEventType::Transcript:   printLine("You: " + ev->text); break;
            case SpeechEventType::Response:     printLine("AI: " + Voice::stripMarkdownForVoice(ev->text)); break;
            case SpeechEventType::ResponseChunk:
            case SpeechEventType::Complete:
                break;
        }
    }
}

static void printHelp() {
    printLine("Commands:\n"
              "  say <clip.wav>   send a recorded clip\n"
              "  stop             stop playback\n"
              "  history          show the conversation\n"
              "  clear            forget the conversation\n"
              "  chunk <text>     show how text is split for synthesis\n"
              "  smart <text>     same, with the break-point cascade\n"
              "  stream <text>    feed text word by word, as tokens arrive\n"
              "  quit             exit");
}

// ============================================================
// Main entry point
// ============================================================
int main(int argc, char* argv[]) {
    initLogger("voxstream.log");
    LOG_PHASE("Startup begin", true);

    fs::path configPath = (argc > 1) ? fs::path(argv[1])
                                     : fs::path(getResourcePath()) / VOICE_CONFIG_FILE;
    Voice::VoiceConfig config = bootstrap_config::initAll(configPath);
    if (config.logFile != "voxstream.log") {
        initLogger(config.logFile);
    }
    setLogLevel(parseLogLevel(config.logLevel, LogLevel::Debug));
    setConsoleLogging(config.logConsole);
    LOG_PHASE("Bootstrap complete", true);

    if (config.projectId.empty()) {
        printLine(ErrorManager::getUserMessage("ERR_NO_PROJECT") + " (" + configPath.string() + ")");
    }

    auto events = std::make_shared<Voice::EventChannel>();
    Voice::SpeechSession session(
        config,
        std::make_shared<Voice::CprVoiceTransport>(config),
        std::make_shared<Voice::SfmlAudioDecoder>(),
        std::make_unique<Voice::SfmlAudioOutput>(config.volume),
        events);

    std::thread eventThread(printEvents, std::ref(*events));
    std::optional<std::future<CycleResult>> pending;

    auto reap = [&](bool wait) {
        if (!pending) return;
        if (!wait && pending->wait_for(std::chrono::seconds(0)) != std::future_status::ready) return;
        CycleResult result = pending->get();
        pending.reset();
        if (!result.success && result.errorCode != "ERR_SESSION_CANCELLED") {
            LOG_DEBUG("CLI", "Cycle ended with " + result.errorCode);
        }
    };

    LOG_PHASE("Startup complete, entering console loop", true);
    printHelp();

    std::string line;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(g_outMutex);
            std::cout << "> " << std::flush;
        }
        if (!std::getline(std::cin, line)) break;
        reap(false);

        line = trimmed(line);
        if (line.empty()) continue;

        size_t sp = line.find(' ');
        std::string cmd = line.substr(0, sp);
        std::string arg = (sp == std::string::npos) ? "" : trimmed(line.substr(sp + 1));

        if (cmd == "quit" || cmd == "exit") {
            break;
        } else if (cmd == "help") {
            printHelp();
        } else if (cmd == "say") {
            if (arg.empty()) {
                printLine("usage: say <clip.wav>");
                continue;
            }
            auto clip = Voice::loadClipFromFile(arg);
            if (!clip) {
                printLine("Could not load " + arg);
                continue;
            }
            session.onSpeechStart();
            reap(true);
            pending = session.submitAsync(std::move(*clip));
        } else if (cmd == "stop") {
            session.stopAudio();
        } else if (cmd == "history") {
            auto turns = session.conversation();
            if (turns.empty()) printLine("(no conversation yet)");
            for (const auto& turn : turns) {
                printLine(turn.role + ": " + turn.content);
            }
        } else if (cmd == "clear") {
            session.clearConversation();
            printLine("Conversation cleared.");
        } else if (cmd == "chunk") {
            int i = 0;
            for (const auto& piece : Voice::chunkText(arg, config.maxChunkSize)) {
                printLine("[" + std::to_string(i++) + "] " + piece);
            }
        } else if (cmd == "smart") {
            int i = 0;
            for (const auto& piece : Voice::smartChunk(arg, config.targetChunkSize)) {
                printLine("[" + std::to_string(i++) + "] " + piece);
            }
        } else if (cmd == "stream") {
            Voice::IncrementalChunker chunker(config.targetChunkSize);
            int i = 0;
            auto show = [&](const std::string& piece) {
                printLine("[" + std::to_string(i++) + "] " + piece);
            };
            size_t pos = 0;
            while (pos < arg.size()) {
                size_t next = arg.find(' ', pos);
                next = (next == std::string::npos) ? arg.size() : next + 1;
                for (const auto& piece : chunker.push(arg.substr(pos, next - pos))) show(piece);
                pos = next;
            }
            if (auto rest = chunker.finish()) show(*rest);
        } else {
            printLine("Unknown command: " + cmd);
        }
    }

    session.stopAudio();
    reap(true);
    events->close();
    eventThread.join();

    LOG_PHASE("Shutdown", true);
    shutdownLogger();
    return 0;
}
