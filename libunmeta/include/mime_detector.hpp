//
// Created by Giuseppe Francione on 11/10/25.
//

#ifndef UNMETA_MIME_DETECTOR_HPP
#define UNMETA_MIME_DETECTOR_HPP

#include <filesystem>
#include <string>

namespace unmeta {

    /**
     * @brief Content-based file type detection.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of a file from its content.
         *
         * @param path The filesystem path to the file.
         * @return A MIME type such as "image/jpeg", or an empty string when
         *         the type cannot be determined.
         *
         * @note On Linux/macOS this uses libmagic with the system database.
         * @note On Windows this falls back to a map of file extensions.
         */
        static std::string detect(const std::filesystem::path& path);
    };

} // namespace unmeta
#endif // UNMETA_MIME_DETECTOR_HPP
