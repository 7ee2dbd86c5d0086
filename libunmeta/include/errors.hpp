//
// Created by Giuseppe Francione on 02/02/26.
//

/**
 * @file errors.hpp
 * @brief Exception types raised by parsers and the cleaning lifecycle.
 */

#ifndef UNMETA_ERRORS_HPP
#define UNMETA_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace unmeta {

    /**
     * @brief Raised at construction time when a filename cannot be used.
     *
     * Covers both paths that cannot be a file reference at all (empty,
     * directory-like) and files a concrete parser rejects (missing,
     * unreadable, wrong signature). The instance must not be used further.
     */
    class InvalidInputError : public std::invalid_argument {
    public:
        explicit InvalidInputError(const std::string& what) : std::invalid_argument(what) {}
    };

    /**
     * @brief Raised when a metadata read or a cleaning pass cannot complete.
     *
     * The source file is guaranteed untouched when this is thrown.
     */
    class CleaningError : public std::runtime_error {
    public:
        explicit CleaningError(const std::string& what) : std::runtime_error(what) {}
    };

    /**
     * @brief Raised when a lifecycle operation is called out of order.
     */
    class StateError : public std::logic_error {
    public:
        explicit StateError(const std::string& what) : std::logic_error(what) {}
    };

} // namespace unmeta

#endif // UNMETA_ERRORS_HPP
