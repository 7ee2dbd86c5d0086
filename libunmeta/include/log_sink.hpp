//
// Created by Giuseppe Francione on 20/10/25.
//

#ifndef UNMETA_LOG_SINK_HPP
#define UNMETA_LOG_SINK_HPP

#include <string_view>

/**
 * @brief Severity levels for log messages.
 *
 * Sinks may use them to filter or format output.
 */
enum class LogLevel {
    Debug,   ///< Step-by-step detail of a cleaning pass
    Info,    ///< A file was read, cleaned or swapped
    Warning, ///< Something was left behind (e.g. a temporary file)
    Error    ///< A file could not be cleaned
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations of ILogSink decide where log records go (console, file,
 * the observer of an Unmeta instance). The Logger facade fans every record
 * out to all installed sinks.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Component that emitted the message (e.g. "png_parser").
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

#endif // UNMETA_LOG_SINK_HPP
