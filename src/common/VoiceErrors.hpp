#pragma once

#include <stdexcept>
#include <string>

namespace voicenote {

enum class ErrorKind {
    PermissionDenied,
    DeviceInitFailure,
    NoActiveSession,
    IOFailure,
    TransferFailure
};

const char* ToString(ErrorKind kind);

class VoiceError : public std::runtime_error {
public:
    VoiceError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), _kind(kind) {}

    ErrorKind Kind() const { return _kind; }

private:
    ErrorKind _kind;
};

// Thrown by capture/playback device implementations
class DeviceError : public VoiceError {
public:
    explicit DeviceError(const std::string& message)
        : VoiceError(ErrorKind::DeviceInitFailure, message) {}
};

// Local file could not be read or encoded
class IOFailure : public VoiceError {
public:
    explicit IOFailure(const std::string& message)
        : VoiceError(ErrorKind::IOFailure, message) {}
};

// Upload or delete against remote storage failed
class TransferFailure : public VoiceError {
public:
    explicit TransferFailure(const std::string& message)
        : VoiceError(ErrorKind::TransferFailure, message) {}
};

} // namespace voicenote
