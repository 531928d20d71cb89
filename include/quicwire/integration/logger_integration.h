/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2024, kcenon
All rights reserved.

Redistribution and use in source and binary forms, with or without
modification, are permitted provided that the following conditions are met:

1. Redistributions of source code must retain the above copyright notice, this
   list of conditions and the following disclaimer.

2. Redistributions in binary form must reproduce the above copyright notice,
   this list of conditions and the following disclaimer in the documentation
   and/or other materials provided with the distribution.

3. Neither the name of the copyright holder nor the names of its
   contributors may be used to endorse or promote products derived from
   this software without specific prior written permission.

THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*****************************************************************************/

#pragma once

/**
 * @file logger_integration.h
 * @brief Logger integration interface for quicwire
 *
 * Standalone builds log through basic_logger. When built with
 * QUICWIRE_WITH_COMMON_SYSTEM the QUICWIRE_LOG_* macros delegate to
 * common_system's LOG_* macros and the manager forwards to the
 * GlobalLoggerRegistry.
 */

#include <memory>
#include <string>

#ifdef QUICWIRE_WITH_COMMON_SYSTEM
#include <kcenon/common/logging/log_macros.h>
#include <kcenon/common/interfaces/global_logger_registry.h>
#endif

namespace quicwire::integration {

/**
 * @enum log_level
 * @brief Log severity levels matching common_system
 */
enum class log_level : int {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

/**
 * @brief Convert a log level to its fixed-width display name
 */
const char* log_level_to_string(log_level level);

/**
 * @class logger_interface
 * @brief Abstract interface for logger integration
 */
class logger_interface {
public:
    virtual ~logger_interface() = default;

    /**
     * @brief Log a message with specified level
     * @param level Log severity level
     * @param message Message to log
     */
    virtual void log(log_level level, const std::string& message) = 0;

    /**
     * @brief Log a message with source location information
     * @param level Log severity level
     * @param message Message to log
     * @param file Source file name
     * @param line Line number
     * @param function Function name
     */
    virtual void log(log_level level, const std::string& message,
                    const std::string& file, int line,
                    const std::string& function) = 0;

    /**
     * @brief Check if a log level is enabled
     */
    virtual bool is_level_enabled(log_level level) const = 0;

    /**
     * @brief Flush any buffered log messages
     */
    virtual void flush() = 0;
};

#ifdef QUICWIRE_WITH_COMMON_SYSTEM

/**
 * @brief Convert quicwire log_level to common_system log_level
 */
inline kcenon::common::interfaces::log_level to_common_level(log_level level) {
    switch (level) {
        case log_level::trace: return kcenon::common::interfaces::log_level::trace;
        case log_level::debug: return kcenon::common::interfaces::log_level::debug;
        case log_level::info: return kcenon::common::interfaces::log_level::info;
        case log_level::warn: return kcenon::common::interfaces::log_level::warning;
        case log_level::error: return kcenon::common::interfaces::log_level::error;
        case log_level::fatal: return kcenon::common::interfaces::log_level::critical;
        default: return kcenon::common::interfaces::log_level::info;
    }
}

/**
 * @class common_system_logger_adapter
 * @brief Adapter that forwards logger_interface calls to a common_system ILogger
 */
class common_system_logger_adapter : public logger_interface {
public:
    /**
     * @param logger_name Name of the logger in GlobalLoggerRegistry (empty for default)
     */
    explicit common_system_logger_adapter(const std::string& logger_name = "");

    ~common_system_logger_adapter() override = default;

    void log(log_level level, const std::string& message) override;
    void log(log_level level, const std::string& message,
            const std::string& file, int line,
            const std::string& function) override;
    bool is_level_enabled(log_level level) const override;
    void flush() override;

private:
    std::string logger_name_;
    std::shared_ptr<kcenon::common::interfaces::ILogger> get_logger() const;
};

#endif // QUICWIRE_WITH_COMMON_SYSTEM

/**
 * @struct log_record
 * @brief One formatted line's worth of log data
 */
struct log_record {
    log_level level = log_level::info;
    std::string message;
    std::string file;   ///< Source file, empty when unknown
    int line = 0;
};

/**
 * @brief Format a record as "[LEVEL] [quicwire] message (file:line)"
 *
 * Only the file's base name is printed; the location suffix is omitted
 * when the record has no file.
 */
std::string format_log_record(const log_record& record);

/**
 * @class basic_logger
 * @brief Console logger used when no other logger is installed
 *
 * Prefixes format_log_record() output with a millisecond timestamp; error
 * and fatal go to stderr, everything else to stdout. The calling function
 * name is not printed.
 */
class basic_logger : public logger_interface {
public:
    /**
     * @brief Constructor with minimum log level
     * @param min_level Minimum level to log (default: info)
     */
    explicit basic_logger(log_level min_level = log_level::info);

    ~basic_logger() override;

    void log(log_level level, const std::string& message) override;
    void log(log_level level, const std::string& message,
            const std::string& file, int line,
            const std::string& function) override;
    bool is_level_enabled(log_level level) const override;
    void flush() override;

    void set_min_level(log_level level);

    log_level get_min_level() const;

private:
    class impl;
    std::unique_ptr<impl> pimpl_;
};

/**
 * @class logger_integration_manager
 * @brief Process-wide holder of the active logger
 */
class logger_integration_manager {
public:
    /**
     * @brief Get the singleton instance
     */
    static logger_integration_manager& instance();

    /**
     * @brief Set the logger implementation
     * @param logger Logger to use; nullptr restores the default logger
     */
    void set_logger(std::shared_ptr<logger_interface> logger);

    /**
     * @brief Get the current logger
     */
    std::shared_ptr<logger_interface> get_logger();

    void log(log_level level, const std::string& message);

    void log(log_level level, const std::string& message,
            const std::string& file, int line, const std::string& function);

private:
    logger_integration_manager();
    ~logger_integration_manager();

    class impl;
    std::unique_ptr<impl> pimpl_;
};

} // namespace quicwire::integration

// =============================================================================
// Convenience macros
// =============================================================================

#ifdef QUICWIRE_WITH_COMMON_SYSTEM

#define QUICWIRE_LOG_TRACE(msg) LOG_TRACE(msg)
#define QUICWIRE_LOG_DEBUG(msg) LOG_DEBUG(msg)
#define QUICWIRE_LOG_INFO(msg) LOG_INFO(msg)
#define QUICWIRE_LOG_WARN(msg) LOG_WARNING(msg)
#define QUICWIRE_LOG_ERROR(msg) LOG_ERROR(msg)
#define QUICWIRE_LOG_FATAL(msg) LOG_CRITICAL(msg)

#else

#define QUICWIRE_LOG_AT(level, msg) \
    ::quicwire::integration::logger_integration_manager::instance().log( \
        level, msg, __FILE__, __LINE__, __FUNCTION__)

#define QUICWIRE_LOG_TRACE(msg) QUICWIRE_LOG_AT(::quicwire::integration::log_level::trace, msg)
#define QUICWIRE_LOG_DEBUG(msg) QUICWIRE_LOG_AT(::quicwire::integration::log_level::debug, msg)
#define QUICWIRE_LOG_INFO(msg) QUICWIRE_LOG_AT(::quicwire::integration::log_level::info, msg)
#define QUICWIRE_LOG_WARN(msg) QUICWIRE_LOG_AT(::quicwire::integration::log_level::warn, msg)
#define QUICWIRE_LOG_ERROR(msg) QUICWIRE_LOG_AT(::quicwire::integration::log_level::error, msg)
#define QUICWIRE_LOG_FATAL(msg) QUICWIRE_LOG_AT(::quicwire::integration::log_level::fatal, msg)

#endif
