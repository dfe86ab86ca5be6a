#pragma once

#include "ChatContext.hpp"

#include <optional>
#include <string>

namespace voicenote {

struct UploadRequest {
    std::string objectPath;
    std::string contentType;
    std::string payload; // base64
    ChatContext context;
    std::string senderId;
    std::optional<unsigned int> durationSeconds;
};

// Remote object storage. Implementations throw on any failure.
class IStorageBackend {
public:
    virtual ~IStorageBackend() = default;

    // Returns the public URL of the stored object
    virtual std::string Upload(const UploadRequest& request) = 0;
    virtual void Delete(const std::string& url) = 0;
};

} // namespace voicenote
