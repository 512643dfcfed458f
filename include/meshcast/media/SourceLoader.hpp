#pragma once

#include "meshcast/exchange/VideoFileBroadcaster.hpp"

#include <string>
#include <string_view>

namespace meshcast::media {

// Guesses a MIME type from the file extension; unknown extensions map to video/mp4.
std::string guess_mime_type(std::string_view name);

// Reads a local path, file:// URL or http(s):// URL. Throws ResourceError.
exchange::SourceFile load_source(const std::string& uri);

}  // namespace meshcast::media
