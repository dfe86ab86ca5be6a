#include "Transfer.hpp"
#include "../common/PathUtils.hpp"
#include "../common/VoiceErrors.hpp"
#include "../common/debug_log.hpp"

#include <websocketpp/base64/base64.hpp>

#include <chrono>
#include <fstream>
#include <iterator>
#include <vector>

namespace voicenote {

namespace {

std::vector<uint8_t> ReadLocalFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw IOFailure("Could not open recording at " + path);
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw IOFailure("Could not read recording at " + path);
    }
    if (bytes.empty()) {
        throw IOFailure("Recording at " + path + " is empty");
    }
    return bytes;
}

int64_t SystemMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

Transfer::Transfer(std::shared_ptr<IStorageBackend> backend, MillisSource nowMillis)
    : _backend(std::move(backend))
    , _now_millis(nowMillis ? std::move(nowMillis) : MillisSource(&SystemMillis)) {
    if (!_backend) {
        throw std::invalid_argument("Transfer requires a storage backend");
    }
}

std::string Transfer::BuildObjectPath(const ChatContext& context, const std::string& senderId,
                                      int64_t millis, const std::string& extension) {
    std::string path = context.TypeName() + "/" + context.id + "/" + senderId + "-" + std::to_string(millis);
    if (!extension.empty()) {
        path += "." + extension;
    }
    return path;
}

std::string Transfer::ContentTypeFor(const std::string& extension) {
    if (extension == "wav") return "audio/wav";
    if (extension == "m4a") return "audio/m4a";
    if (extension == "mp3") return "audio/mpeg";
    if (extension == "ogg" || extension == "opus") return "audio/ogg";
    if (extension == "flac") return "audio/flac";
    return "application/octet-stream";
}

std::string Transfer::Upload(const std::string& location, const ChatContext& context,
                             const std::string& senderId, std::optional<unsigned int> durationSeconds) {
    if (senderId.empty()) {
        throw TransferFailure("Sender id is required to upload a voice message");
    }
    if (context.id.empty()) {
        throw TransferFailure("Chat context id is required to upload a voice message");
    }

    const std::string path = StripFileScheme(location);
    DEBUG_LOG("Transfer: starting upload of " << path << " for " << context.TypeName()
              << "/" << context.id << DEBUG_LOG_ENDL);

    std::vector<uint8_t> bytes = ReadLocalFile(path);
    const std::string extension = FileExtension(path);

    UploadRequest request;
    request.objectPath = BuildObjectPath(context, senderId, _now_millis(), extension);
    request.contentType = ContentTypeFor(extension);
    request.payload = websocketpp::base64_encode(bytes.data(), bytes.size());
    request.context = context;
    request.senderId = senderId;
    request.durationSeconds = durationSeconds;

    std::string url;
    try {
        url = _backend->Upload(request);
    } catch (const TransferFailure& e) {
        ERROR_LOG("Transfer: upload failed: " << e.what());
        throw;
    } catch (const std::exception& e) {
        ERROR_LOG("Transfer: upload failed: " << e.what());
        throw TransferFailure(std::string("Failed to upload voice message: ") + e.what());
    }

    if (url.empty()) {
        throw TransferFailure("Failed to get public URL for uploaded file");
    }

    DEBUG_LOG("Transfer: upload successful (" << request.objectPath << " -> " << url << ")" << DEBUG_LOG_ENDL);
    return url;
}

void Transfer::Remove(const std::string& remoteUrl) {
    if (remoteUrl.empty()) {
        throw TransferFailure("Voice message URL is empty");
    }

    try {
        _backend->Delete(remoteUrl);
    } catch (const TransferFailure& e) {
        ERROR_LOG("Transfer: delete failed: " << e.what());
        throw;
    } catch (const std::exception& e) {
        ERROR_LOG("Transfer: delete failed: " << e.what());
        throw TransferFailure(std::string("Failed to delete voice message: ") + e.what());
    }

    DEBUG_LOG("Transfer: deleted " << remoteUrl << DEBUG_LOG_ENDL);
}

} // namespace voicenote
