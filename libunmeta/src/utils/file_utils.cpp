//
// Created by Giuseppe Francione on 17/11/25.
//

#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/random_utils.hpp"
#include <cerrno>
#include <stdexcept>

namespace unmeta {

    FILE* open_file(const std::filesystem::path& path, const char* mode) {
#ifdef _WIN32
        // On Windows, convert mode to wstring and use _wfopen, which accepts
        // wide-char paths (UTF-16), supporting Unicode and long paths.
        std::wstring wmode;
        for (const char* p = mode; *p; ++p) wmode += static_cast<wchar_t>(*p);

        std::error_code ec;
        auto abs_path = std::filesystem::absolute(path, ec);
        if (ec) {
            return _wfopen(path.wstring().c_str(), wmode.c_str());
        }

        // prepend the magic prefix to bypass MAX_PATH
        std::wstring long_path = L"\\\\?\\" + abs_path.wstring();
        return _wfopen(long_path.c_str(), wmode.c_str());
#else
        return std::fopen(path.string().c_str(), mode);
#endif
    }

    std::vector<unsigned char> read_file_bytes(const std::filesystem::path& path) {
        const unique_FILE in(open_file(path, "rb"));
        if (!in) {
            throw std::runtime_error("Cannot open " + path.string());
        }

        std::vector<unsigned char> data;
        unsigned char chunk[64 * 1024];
        size_t n;
        while ((n = std::fread(chunk, 1, sizeof(chunk), in.get())) > 0) {
            data.insert(data.end(), chunk, chunk + n);
        }
        if (std::ferror(in.get())) {
            throw std::runtime_error("Read error on " + path.string());
        }
        return data;
    }

    void write_file_bytes(const std::filesystem::path& path, const std::span<const unsigned char> data) {
        unique_FILE out(open_file(path, "wb"));
        if (!out) {
            throw std::runtime_error("Cannot open " + path.string() + " for writing");
        }
        if (!data.empty() && std::fwrite(data.data(), 1, data.size(), out.get()) != data.size()) {
            throw std::runtime_error("Short write on " + path.string());
        }
        // fclose may be the first to notice a full disk
        if (std::fclose(out.release()) != 0) {
            throw std::runtime_error("Cannot flush " + path.string());
        }
    }

    std::filesystem::path make_temp_file(const std::string& extension,
                                         const std::string& prefix,
                                         std::error_code& ec) {
        ec.clear();
        const auto base_tmp = std::filesystem::temp_directory_path(ec);
        if (ec) {
            Logger::log(LogLevel::Error, "No temp directory available (" + ec.message() + ")", "file_utils");
            return {};
        }

        for (int attempt = 0; attempt < 16; ++attempt) {
            auto candidate = base_tmp / ("unmeta-" + prefix + "-" + RandomUtils::random_suffix() + extension);
            // "x" fails if the file already exists
            if (FILE* f = open_file(candidate, "wbx")) {
                std::fclose(f);
                // owner only, it will hold a copy of a possibly private file
                std::filesystem::permissions(candidate,
                                             std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                             std::filesystem::perm_options::replace, ec);
                if (ec) {
                    std::error_code rm_ec;
                    std::filesystem::remove(candidate, rm_ec);
                    break;
                }
                Logger::log(LogLevel::Debug, "Created temp file: " + candidate.string(), "file_utils");
                return candidate;
            }
            if (errno != EEXIST) {
                ec = std::error_code(errno, std::generic_category());
                break;
            }
        }
        if (!ec) {
            ec = std::make_error_code(std::errc::file_exists);
        }
        Logger::log(LogLevel::Error, "Failed to create temp file in " + base_tmp.string() + " (" + ec.message() + ")",
                    "file_utils");
        return {};
    }

    std::filesystem::path make_staging_path_beside(const std::filesystem::path& target) {
        const auto dir = target.has_parent_path() ? target.parent_path() : std::filesystem::path(".");
        std::error_code ec;
        std::filesystem::path candidate;
        do {
            candidate = dir / ("." + target.filename().string() + ".unmeta-" + RandomUtils::random_suffix());
        } while (std::filesystem::exists(candidate, ec));
        return candidate;
    }

    bool remove_file_logged(const std::filesystem::path& file, std::error_code& ec, const std::string_view tag) {
        ec.clear();
        const bool removed = std::filesystem::remove(file, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Can't remove file: " + file.string() + " (" + ec.message() + ")", tag);
            return false;
        }
        if (removed) {
            Logger::log(LogLevel::Debug, "Removed file: " + file.string(), tag);
        }
        return true;
    }

} // namespace unmeta
