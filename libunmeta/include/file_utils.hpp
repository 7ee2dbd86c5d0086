//
// Created by Giuseppe Francione on 13/11/25.
//

#ifndef UNMETA_FILE_UTILS_HPP
#define UNMETA_FILE_UTILS_HPP

#include <cstdio>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace unmeta {

    /**
     * @brief RAII wrapper for FILE pointers to ensure they are closed.
     */
    struct FileCloser {
        void operator()(FILE *f) const { if (f) std::fclose(f); }
    };

    using unique_FILE = std::unique_ptr<FILE, FileCloser>;

    /**
     * @brief Opens a file using a filesystem path, handling Windows Unicode correctly.
     * @param path The path to the file.
     * @param mode The standard C fopen mode string (e.g., "rb", "wb").
     * @return FILE* pointer or nullptr if open failed.
     */
    FILE *open_file(const std::filesystem::path &path, const char *mode);

    /**
     * @brief Reads a whole file into memory.
     * @throws std::runtime_error if the file cannot be opened or read.
     */
    std::vector<unsigned char> read_file_bytes(const std::filesystem::path &path);

    /**
     * @brief Writes a buffer to a file, truncating it first.
     * @throws std::runtime_error if the file cannot be opened, written or flushed.
     */
    void write_file_bytes(const std::filesystem::path &path, std::span<const unsigned char> data);

    /**
     * @brief Creates a new, empty, uniquely named temporary file.
     *
     * The file lives in the system temp directory, is named
     * "unmeta-{prefix}-{random}{extension}" and is created exclusively, so
     * no other caller can be handed the same path. Only the owner can read
     * or write it.
     *
     * @param extension Extension to carry over (e.g. ".png"), may be empty.
     * @param prefix A short prefix (e.g. "inplace").
     * @param ec Set on failure; the returned path is then empty.
     */
    std::filesystem::path make_temp_file(const std::string &extension,
                                         const std::string &prefix,
                                         std::error_code &ec);

    /**
     * @brief Picks an unused hidden path in the same directory as target.
     *
     * Used to stage a copy before an atomic rename over target.
     */
    std::filesystem::path make_staging_path_beside(const std::filesystem::path &target);

    /**
     * @brief Removes a single file and logs the outcome.
     * @param file The file to be removed.
     * @param ec Set if the file exists but could not be removed.
     * @param tag The logger tag (e.g. "parser").
     * @return true if the file no longer exists.
     */
    bool remove_file_logged(const std::filesystem::path &file,
                            std::error_code &ec,
                            std::string_view tag = "file_utils");
} // namespace unmeta

#endif // UNMETA_FILE_UTILS_HPP
