#include "PathUtils.hpp"

#include <algorithm>
#include <cctype>

namespace voicenote {

std::string StripFileScheme(const std::string& location) {
    const std::string scheme = "file://";
    if (location.compare(0, scheme.size(), scheme) == 0) {
        return location.substr(scheme.size());
    }
    return location;
}

std::string FileExtension(const std::string& path) {
    const size_t slash = path.find_last_of('/');
    const size_t dot = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash) || dot + 1 == path.size()) {
        return "";
    }

    std::string extension = path.substr(dot + 1);
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return extension;
}

} // namespace voicenote
