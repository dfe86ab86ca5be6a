#include "VoiceErrors.hpp"

namespace voicenote {

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::PermissionDenied: return "PermissionDenied";
        case ErrorKind::DeviceInitFailure: return "DeviceInitFailure";
        case ErrorKind::NoActiveSession: return "NoActiveSession";
        case ErrorKind::IOFailure: return "IOFailure";
        case ErrorKind::TransferFailure: return "TransferFailure";
    }
    return "Unknown";
}

} // namespace voicenote
