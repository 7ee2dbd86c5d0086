//
// Created by Giuseppe Francione on 19/10/25.
//

#include "../../include/parser_registry.hpp"
#include "../../include/jpeg_parser.hpp"
#include "../../include/logger.hpp"
#include "../../include/mime_detector.hpp"
#include "../../include/png_parser.hpp"
#include <algorithm>
#include <cctype>

namespace unmeta {

ParserRegistry::ParserRegistry() {
    add<JpegParser>();
    add<PngParser>();
}

std::vector<const ParserEntry*> ParserRegistry::find_by_mime(const std::string_view mime) const {
    std::vector<const ParserEntry*> result;
    for (const auto& entry : entries_) {
        if (std::ranges::find(entry.mime_types, mime) != entry.mime_types.end()) {
            result.push_back(&entry);
        }
    }
    return result;
}

std::vector<const ParserEntry*> ParserRegistry::find_by_extension(const std::string_view ext) const {
    std::vector<const ParserEntry*> result;
    if (ext.empty() || ext[0] != '.') return result;

    auto iequals = [](const std::string_view s1, const std::string_view s2) {
        return std::equal(s1.begin(), s1.end(), s2.begin(), s2.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    };

    for (const auto& entry : entries_) {
        for (const auto supported_ext : entry.extensions) {
            if (iequals(supported_ext, ext)) {
                result.push_back(&entry);
                break;
            }
        }
    }
    return result;
}

std::unique_ptr<Parser> ParserRegistry::create_for(const std::filesystem::path& path) const {
    const auto mime = MimeDetector::detect(path);
    auto matches = find_by_mime(mime);
    if (matches.empty()) {
        Logger::log(LogLevel::Debug, "No parser for MIME type '" + mime + "' of " + path.string() +
                    ", trying the extension", "registry");
        matches = find_by_extension(path.extension().string());
    }

    if (matches.empty()) {
        Logger::log(LogLevel::Warning, "No parser for " + path.string(), "registry");
        return nullptr;
    }

    const ParserEntry* entry = matches.front();
    Logger::log(LogLevel::Debug, std::string(entry->name) + " selected for " + path.string(), "registry");
    return entry->create(path);
}

} // namespace unmeta
