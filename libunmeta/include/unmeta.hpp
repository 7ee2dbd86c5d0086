//
// Created by Giuseppe Francione on 09/12/25.
//

/**
 * @file unmeta.hpp
 * @brief Public API for the unmeta library.
 */

#ifndef UNMETA_HPP
#define UNMETA_HPP

#include "meta_value.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace unmeta {

class ParserRegistry;

/**
 * @brief Interface for receiving progress and status events during cleaning.
 */
struct UnmetaObserver {
    virtual ~UnmetaObserver() = default;

    virtual void onFileStart(const std::filesystem::path& path) {}

    virtual void onFileCleaned(const std::filesystem::path& path,
                               const std::filesystem::path& output) {}

    virtual void onFileSkipped(const std::filesystem::path& path,
                               const std::string& reason) {}

    virtual void onFileError(const std::filesystem::path& path,
                             const std::string& error) {}

    virtual void onLog(int level, const std::string& msg, const std::string& tag) {}
};

/**
 * @brief Outcome of cleaning one file.
 */
struct CleanResult {
    std::filesystem::path path;    ///< File as given by the caller
    std::filesystem::path output;  ///< Where the cleaned content ended up (empty on failure)
    bool cleaned = false;
    bool skipped = false;          ///< No parser handles this file type
    std::string error;
};

/**
 * @brief Main interface for the unmeta library.
 *
 * @details Wraps detection, parsing, cleaning and the in-place swap into a
 * simple, blocking API. Each file is handled independently: a failure is
 * recorded in its CleanResult and reported to the observer, and the batch
 * carries on.
 */
class Unmeta {
public:
    Unmeta();
    ~Unmeta();

    Unmeta(const Unmeta&) = delete;
    Unmeta& operator=(const Unmeta&) = delete;
    Unmeta(Unmeta&&) noexcept;
    Unmeta& operator=(Unmeta&&) noexcept;

    // --- Configuration ---

    /**
     * @brief Only strip the fields each parser recognizes, keep the rest intact.
     * Default: false (thorough cleaning).
     */
    Unmeta& lightweight(bool val);

    /**
     * @brief Replace the original files instead of writing "<stem>.cleaned<ext>".
     * Default: false.
     */
    Unmeta& inPlace(bool val);

    /**
     * @brief Move the cleaned files into this directory (ignored in place).
     * Default: empty (next to the original).
     */
    Unmeta& outputDirectory(const std::filesystem::path& dir);

    // --- Observability ---

    /**
     * @brief Sets the observer for progress events.
     * The caller retains ownership of the observer.
     */
    void setObserver(UnmetaObserver* observer);

    // --- Execution ---

    /**
     * @brief Reads the metadata of a file.
     * @throws InvalidInputError if no parser handles the file or the parser rejects it.
     * @throws CleaningError if the file is corrupt.
     */
    [[nodiscard]] MetaMap show(const std::filesystem::path& path) const;

    /**
     * @brief Cleans a list of files. Blocks until completion.
     */
    std::vector<CleanResult> clean(const std::vector<std::filesystem::path>& paths);

    CleanResult clean(const std::filesystem::path& path);

    [[nodiscard]] const ParserRegistry& registry() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace unmeta

#endif // UNMETA_HPP
