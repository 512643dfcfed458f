#include "meshcast/media/SourceLoader.hpp"

#include "meshcast/Error.hpp"
#include "meshcast/logging/StructuredLogger.hpp"
#include "meshcast/protocol/VideoMessage.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <utility>

namespace meshcast::media {

namespace {

using logging::StructuredLogger;

void log_event(StructuredLogger::Level level,
               std::string_view event,
               StructuredLogger::FieldList fields = {}) {
    StructuredLogger::instance().log(level, event, std::move(fields));
}

struct MimeEntry {
    std::string_view extension;
    std::string_view mime_type;
};

constexpr std::array<MimeEntry, 9> kMimeTable{{
    {".mp4", "video/mp4"},
    {".m4v", "video/mp4"},
    {".webm", "video/webm"},
    {".mkv", "video/x-matroska"},
    {".mov", "video/quicktime"},
    {".ogv", "video/ogg"},
    {".ogg", "video/ogg"},
    {".ts", "video/mp2t"},
    {".avi", "video/x-msvideo"},
}};

bool starts_with(std::string_view value, std::string_view prefix) {
    return value.rfind(prefix, 0) == 0;
}

Bytes read_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw ResourceError("E_SOURCE_NOT_FOUND",
                            "Source file not found: " + path.string(),
                            "Check the path and permissions");
    }
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw ResourceError("E_SOURCE_READ", "Unable to open source file: " + path.string());
    }
    Bytes data((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    if (input.bad()) {
        throw ResourceError("E_SOURCE_READ", "Failed while reading source file: " + path.string());
    }
    return data;
}

size_t curl_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* buffer = static_cast<Bytes*>(userdata);
    buffer->insert(buffer->end(), ptr, ptr + size * nmemb);
    return size * nmemb;
}

Bytes download_http_curl(const std::string& url) {
    static const bool curl_ready = [] {
        return curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
    }();
    if (!curl_ready) {
        throw ResourceError("E_SOURCE_DOWNLOAD", "Unable to initialize libcurl");
    }
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw ResourceError("E_SOURCE_DOWNLOAD", "Unable to allocate curl handle");
    }
    Bytes output;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 120L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "meshcast/1.0");
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &output);
    const CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
        std::string reason = curl_easy_strerror(rc);
        curl_easy_cleanup(curl);
        throw ResourceError("E_SOURCE_DOWNLOAD", "Download failed: " + reason, "Check the URL and network access");
    }
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_easy_cleanup(curl);
    if (status >= 400) {
        throw ResourceError("E_SOURCE_DOWNLOAD", "HTTP status " + std::to_string(status));
    }
    return output;
}

std::string file_name_of(std::string_view uri) {
    const auto query = uri.find_first_of("?#");
    if (query != std::string_view::npos) {
        uri = uri.substr(0, query);
    }
    const auto slash = uri.find_last_of('/');
    if (slash != std::string_view::npos) {
        uri = uri.substr(slash + 1);
    }
    return uri.empty() ? std::string(protocol::kDefaultFileName) : std::string(uri);
}

}  // namespace

std::string guess_mime_type(std::string_view name) {
    const auto dot = name.find_last_of('.');
    if (dot == std::string_view::npos) {
        return std::string(protocol::kDefaultMimeType);
    }
    std::string extension(name.substr(dot));
    std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    for (const auto& entry : kMimeTable) {
        if (entry.extension == extension) {
            return std::string(entry.mime_type);
        }
    }
    return std::string(protocol::kDefaultMimeType);
}

exchange::SourceFile load_source(const std::string& uri) {
    if (uri.empty()) {
        throw ResourceError("E_SOURCE_NOT_FOUND", "No source given", "Pass a path or URL");
    }

    exchange::SourceFile source;
    if (starts_with(uri, "http://") || starts_with(uri, "https://")) {
        source.data = download_http_curl(uri);
        source.name = file_name_of(uri);
    } else {
        std::filesystem::path path = starts_with(uri, "file://") ? std::filesystem::path(uri.substr(7))
                                                                 : std::filesystem::path(uri);
        source.data = read_file(path);
        source.name = path.filename().string();
    }
    source.mime_type = guess_mime_type(source.name);

    if (source.data.empty()) {
        throw ResourceError("E_SOURCE_EMPTY", "Source is empty: " + uri, "Choose a non-empty video file");
    }
    log_event(StructuredLogger::Level::Info,
              "media.source.loaded",
              {{"name", source.name}, {"mime", source.mime_type}, {"bytes", std::to_string(source.data.size())}});
    return source;
}

}  // namespace meshcast::media
