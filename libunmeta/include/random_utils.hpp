//
// Created by Giuseppe Francione on 07/10/25.
//

#ifndef UNMETA_RANDOM_UTILS_HPP
#define UNMETA_RANDOM_UTILS_HPP

#include <string>

/**
 * @brief Thread-local random helpers used to name temporary files.
 */
namespace RandomUtils {

    /// @return A random 64-bit unsigned integer.
    unsigned long long next_u64();

    /// @return A 16-character lowercase hex string, suitable as a filename suffix.
    std::string random_suffix();

} // namespace RandomUtils

#endif // UNMETA_RANDOM_UTILS_HPP
