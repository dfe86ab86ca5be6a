#pragma once

#include "ChatContext.hpp"
#include "IStorageBackend.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace voicenote {

// Moves recorded voice messages to remote storage and back out of it.
// Errors are never swallowed: IOFailure for the local file, TransferFailure
// for everything on the storage side. No retries.
class Transfer {
public:
    using MillisSource = std::function<int64_t()>;

    explicit Transfer(std::shared_ptr<IStorageBackend> backend, MillisSource nowMillis = nullptr);

    std::string Upload(const std::string& location, const ChatContext& context,
                       const std::string& senderId,
                       std::optional<unsigned int> durationSeconds = std::nullopt);

    void Remove(const std::string& remoteUrl);

    // <type>/<contextId>/<senderId>-<millis>.<extension>
    static std::string BuildObjectPath(const ChatContext& context, const std::string& senderId,
                                       int64_t millis, const std::string& extension);

    static std::string ContentTypeFor(const std::string& extension);

private:
    std::shared_ptr<IStorageBackend> _backend;
    MillisSource _now_millis;
};

} // namespace voicenote
