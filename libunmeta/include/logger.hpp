//
// Created by Giuseppe Francione on 20/10/25.
//

/**
 * @file logger.hpp
 * @brief Provides a static, thread-safe logging facade.
 *
 * Parsers, the registry and the facade all log through Logger. Nothing is
 * printed unless a sink has been installed.
 */

#ifndef UNMETA_LOGGER_HPP
#define UNMETA_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief Static logging facade for unmeta.
 *
 * Delegates every record to the registered ILogSink implementations.
 */
class Logger {
public:
    /**
     * @brief Add a new log sink. The Logger takes ownership of the sink.
     * @param sink Unique pointer to a sink implementation.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove a previously added sink, identified by address.
     * @return true if the sink was registered and is now destroyed.
     */
    static bool remove_sink(const ILogSink* sink);

    /// @brief Remove all configured sinks.
    static void clear_sinks();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Optional tag (default: "unmeta").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "unmeta");

    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
        }
        return "";
    }

    /**
     * @brief Converts a string to its LogLevel enum representation.
     * Case-sensitive. Returns LogLevel::Error if not matched.
     */
    static LogLevel string_to_level(const std::string& level) {
        if (level == "DEBUG")
            return LogLevel::Debug;
        if (level == "INFO")
            return LogLevel::Info;
        if (level == "WARNING" || level == "WARN")
            return LogLevel::Warning;
        return LogLevel::Error;
    }
private:
    ///< List of all registered sink implementations.
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    ///< Protects access to the sinks_ vector.
    static std::mutex mtx_;
};

#endif // UNMETA_LOGGER_HPP
