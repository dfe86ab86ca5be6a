#pragma once

#include <string>

namespace voicenote {

// "file:///tmp/a.wav" -> "/tmp/a.wav"; other strings are returned as is
std::string StripFileScheme(const std::string& location);

// Lower-case extension without the dot, empty when there is none
std::string FileExtension(const std::string& path);

} // namespace voicenote
