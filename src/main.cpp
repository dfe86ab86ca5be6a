#include "Devices/RtAudioCaptureDevice.hpp"
#include "Devices/RtAudioPlaybackDevice.hpp"
#include "Player/Player.hpp"
#include "Recorder/Recorder.hpp"
#include "Transfer/StorageGatewayClient.hpp"
#include "Transfer/Transfer.hpp"
#include "common/VoiceConfig.hpp"
#include "common/VoiceErrors.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

using namespace voicenote;

class VoiceNoteApplication {
public:
    VoiceNoteApplication(VoiceConfig config, std::string sender_id)
        : _config(std::move(config)), _sender_id(std::move(sender_id)), _running(true) {
    }

    bool Run() {
        CaptureOptions captureOptions;
        captureOptions.sampleRate = _config.recorder.sampleRate;
        captureOptions.outputDir = _config.recorder.outputDir;
        captureOptions.denoise = _config.recorder.denoise;

        RecorderOptions recorderOptions;
        recorderOptions.maxDurationSeconds = _config.recorder.maxDurationSeconds;
        recorderOptions.tickInterval = std::chrono::milliseconds(_config.recorder.tickMs);

        try {
            _recorder = std::make_unique<Recorder>(std::make_shared<RtAudioCaptureDevice>(captureOptions),
                                                   MakeSteadyClock(), recorderOptions);
            _player = std::make_unique<Player>(std::make_shared<RtAudioPlaybackDevice>(
                std::chrono::milliseconds(_config.player.statusIntervalMs)));
        } catch (const std::exception& e) {
            std::cerr << "Failed to initialize audio: " << e.what() << std::endl;
            return false;
        }

        _gateway = std::make_shared<StorageGatewayClient>(_config.storage.gatewayUrl, _config.storage.bucket,
                                                          std::chrono::milliseconds(_config.storage.timeoutMs));
        if (!_gateway->Connect()) {
            std::cerr << "Storage gateway unavailable, upload and delete will fail" << std::endl;
        }
        _transfer = std::make_unique<Transfer>(_gateway);

        _recorder->SetDurationCallback([this](unsigned int elapsed, bool autoStopped) {
            if (autoStopped && !_auto_stop_announced.exchange(true)) {
                std::cout << "[RECORDER] Maximum duration reached (" << elapsed
                          << "s), type 'stop' to finish" << std::endl;
            }
        });
        _recorder->SetErrorCallback([](ErrorKind kind, const std::string& message) {
            std::cout << "[ERROR] " << ToString(kind) << ": " << message << std::endl;
        });
        _player->SetStateCallback([](Player::State state, const std::string& messageId) {
            std::cout << "[PLAYER] " << ToString(state) << " " << messageId << std::endl;
        });
        _player->SetErrorCallback([](ErrorKind kind, const std::string& message) {
            std::cout << "[ERROR] " << ToString(kind) << ": " << message << std::endl;
        });

        PrintHelp();

        std::string line;
        while (_running && std::getline(std::cin, line)) {
            if (!ProcessCommand(line)) {
                break;
            }
        }

        _player->Teardown();
        _recorder->Teardown();
        return true;
    }

private:
    bool ProcessCommand(const std::string& line) {
        std::istringstream in(line);
        std::string command;
        if (!(in >> command)) {
            return true;
        }

        if (command == "record") {
            _auto_stop_announced = false;
            if (_recorder->Start()) {
                std::cout << "[RECORDER] Recording..." << std::endl;
            }
        }
        else if (command == "stop") {
            _last_recording = _recorder->Stop();
            if (_last_recording) {
                std::cout << "[RECORDER] Saved " << _last_recording->location << " ("
                          << _last_recording->durationSeconds << "s"
                          << (_last_recording->autoStopped ? ", auto-stopped" : "") << ")" << std::endl;
            }
        }
        else if (command == "cancel") {
            _recorder->Cancel();
            std::cout << "[RECORDER] Cancelled" << std::endl;
        }
        else if (command == "upload") {
            std::string type, id;
            if (!(in >> type >> id)) {
                std::cout << "Usage: upload <preMatch|relationship> <context_id>" << std::endl;
            } else if (!_last_recording) {
                std::cout << "Nothing recorded yet" << std::endl;
            } else {
                Upload(type, id);
            }
        }
        else if (command == "delete") {
            std::string url;
            if (!(in >> url)) {
                std::cout << "Usage: delete <url>" << std::endl;
            } else {
                try {
                    _transfer->Remove(url);
                    std::cout << "[TRANSFER] Deleted" << std::endl;
                } catch (const VoiceError& e) {
                    std::cout << "[ERROR] " << ToString(e.Kind()) << ": " << e.what() << std::endl;
                }
            }
        }
        else if (command == "play" || command == "toggle") {
            std::string messageId, location;
            unsigned int duration = 0;
            if (!(in >> messageId >> location)) {
                std::cout << "Usage: " << command << " <message_id> <path> [duration]" << std::endl;
            } else {
                in >> duration;
                if (command == "play") {
                    _player->Play(messageId, location, duration);
                } else {
                    _player->Toggle(messageId, location, duration);
                }
            }
        }
        else if (command == "seek") {
            unsigned int position = 0;
            if (in >> position) {
                _player->Seek(position);
            } else {
                std::cout << "Usage: seek <seconds>" << std::endl;
            }
        }
        else if (command == "halt") {
            _player->Stop();
        }
        else if (command == "status") {
            PrintStatus();
        }
        else if (command == "quit" || command == "exit") {
            _running = false;
            return false;
        }
        else if (command == "help") {
            PrintHelp();
        }
        else {
            std::cout << "Unknown command: " << command << std::endl;
            PrintHelp();
        }
        return true;
    }

    void Upload(const std::string& type, const std::string& id) {
        try {
            ChatContext context = ChatContext::Parse(type, id);
            std::string url = _transfer->Upload(_last_recording->location, context, _sender_id,
                                                _last_recording->durationSeconds);
            std::cout << "[TRANSFER] Uploaded: " << url << std::endl;
        } catch (const VoiceError& e) {
            // The recording is kept, so the upload can simply be retried
            std::cout << "[ERROR] " << ToString(e.Kind()) << ": " << e.what() << std::endl;
        } catch (const std::invalid_argument& e) {
            std::cout << e.what() << std::endl;
        }
    }

    void PrintStatus() {
        std::cout << "Recorder: " << ToString(_recorder->GetState());
        if (_recorder->IsRecording()) {
            std::cout << " " << _recorder->GetElapsedSeconds() << "s";
        }
        std::cout << std::endl;

        auto playing = _player->GetCurrentlyPlayingId();
        std::cout << "Player: " << ToString(_player->GetState());
        if (playing) {
            std::cout << " " << *playing << " " << _player->GetPosition() << "/" << _player->GetDuration() << "s";
        }
        std::cout << std::endl;
    }

    void PrintHelp() {
        std::cout << "\n=== Voice Messages ===" << std::endl;
        std::cout << "Commands:" << std::endl;
        std::cout << "  record                        - Start recording" << std::endl;
        std::cout << "  stop                          - Stop recording and keep it" << std::endl;
        std::cout << "  cancel                        - Drop the current recording" << std::endl;
        std::cout << "  upload <type> <context_id>    - Upload the last recording" << std::endl;
        std::cout << "  delete <url>                  - Delete an uploaded message" << std::endl;
        std::cout << "  play <id> <path> [duration]   - Play a voice message" << std::endl;
        std::cout << "  toggle <id> <path> [duration] - Play or stop a voice message" << std::endl;
        std::cout << "  seek <seconds>                - Seek the playing message" << std::endl;
        std::cout << "  halt                          - Stop playback" << std::endl;
        std::cout << "  status                        - Show recorder and player state" << std::endl;
        std::cout << "  help                          - Show this help" << std::endl;
        std::cout << "  quit                          - Exit application" << std::endl;
        std::cout << "======================\n" << std::endl;
    }

    VoiceConfig _config;
    std::string _sender_id;
    std::unique_ptr<Recorder> _recorder;
    std::unique_ptr<Player> _player;
    std::shared_ptr<StorageGatewayClient> _gateway;
    std::unique_ptr<Transfer> _transfer;
    std::optional<RecordingResult> _last_recording;
    std::atomic<bool> _auto_stop_announced{false};
    std::atomic<bool> _running;
};

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cout << "Usage: " << argv[0] << " <config.json> <sender_id>" << std::endl;
        std::cout << "Example: " << argv[0] << " voicenote.json user456" << std::endl;
        return 1;
    }

    VoiceConfig config;
    try {
        config = VoiceConfig::Load(argv[1]);
    } catch (const ConfigError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    VoiceNoteApplication app(std::move(config), argv[2]);
    return app.Run() ? 0 : 1;
}
