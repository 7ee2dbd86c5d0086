//
// Created by Giuseppe Francione on 11/10/25.
//
#ifndef _WIN32
#include <magic.h>
#endif
#include "../../include/mime_detector.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <map>

std::string unmeta::MimeDetector::detect(const std::filesystem::path& path)
{
#ifndef _WIN32
    const magic_t magic = magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR);
    if (!magic) return {};
    if (magic_load(magic, nullptr) != 0)
    {
        Logger::log(LogLevel::Warning, std::string("magic_load failed: ") + magic_error(magic), "libmagic");
        magic_close(magic);
        return {};
    }
    const char* mime = magic_file(magic, path.string().c_str());
    std::string result = mime ? mime : "";
    if (!mime)
    {
        const char* err = magic_error(magic);
        Logger::log(LogLevel::Debug, "magic_file failed for " + path.string() + ": " + (err ? err : "unknown"),
                    "libmagic");
    }
    magic_close(magic);
    return result;
#else
    static const std::map<std::string, std::string> ext_to_mime = {
        {".png", "image/png"}, {".jpg", "image/jpeg"}, {".jpeg", "image/jpeg"}, {".jpe", "image/jpeg"}
    };
    auto ext = path.extension().string();
    std::ranges::transform(ext, ext.begin(), ::tolower);
    auto it = ext_to_mime.find(ext);
    return it != ext_to_mime.end() ? it->second : "application/octet-stream";
#endif
}
