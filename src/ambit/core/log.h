// log.h created on 2026-09-12 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef AMBIT_CORE_LOG_H
#define AMBIT_CORE_LOG_H

#include <fmt/format.h>

#include <atomic>
#include <string_view>
#include <optional>

namespace ambit::core {


/// Process-wide logger used through the `log::` functions below.
/// Batch workers log concurrently, the handler must be thread-safe.
class Logger
{
public:
    enum class Level {
        Trace,
        Debug,
        Info,
        Warning,
        Error,
        None,  // disable logging
    };

    // The handler receives a formatted message (possibly multi-line)
    // and adds the timestamp itself.
    using Handler = void (*)(Level lvl, std::string_view msg);

    /// Writes `date time tid LEVEL message` lines to stderr
    static void default_handler(Level lvl, std::string_view msg);

    /// Create the default logger with its initial level.
    /// Without this, it's created at first use with level Trace.
    static void init(Level level) { default_instance().set_level(level); }

    static Logger& default_instance();

    explicit Logger(Level level) : m_level(level) {}

    void set_level(Level level) { m_level = level; }
    Level level() const { return m_level; }
    bool is_enabled(Level lvl) const { return lvl >= m_level; }

    void set_handler(Handler handler) { m_handler = handler; }

    /// Pass the message to the handler, unless its level is filtered out
    void log(Level lvl, std::string_view msg);

private:
    std::atomic<Level> m_level;
    std::atomic<Handler> m_handler {default_handler};
};


/// Level by the name used in config files: "trace", "debug", "info", "warning", "error", "none"
std::optional<Logger::Level> parse_log_level(std::string_view name);


namespace log {

/// Format and log the message. Arguments are not formatted when the level is filtered out.
template <typename... T>
void write(Logger::Level lvl, fmt::format_string<T...> fmt, T&&... args) {
    Logger& logger = Logger::default_instance();
    if (logger.is_enabled(lvl))
        logger.log(lvl, fmt::format(fmt, std::forward<T>(args)...));
}

template <typename... T>
void trace(fmt::format_string<T...> fmt, T&&... args) { write(Logger::Level::Trace, fmt, std::forward<T>(args)...); }

template <typename... T>
void debug(fmt::format_string<T...> fmt, T&&... args) { write(Logger::Level::Debug, fmt, std::forward<T>(args)...); }

template <typename... T>
void info(fmt::format_string<T...> fmt, T&&... args) { write(Logger::Level::Info, fmt, std::forward<T>(args)...); }

template <typename... T>
void warning(fmt::format_string<T...> fmt, T&&... args) { write(Logger::Level::Warning, fmt, std::forward<T>(args)...); }

template <typename... T>
void error(fmt::format_string<T...> fmt, T&&... args) { write(Logger::Level::Error, fmt, std::forward<T>(args)...); }

} // namespace log
} // namespace ambit::core


// Resolver scan steps, compiled in only with AMBIT_DEBUG_TRACE
#ifdef AMBIT_DEBUG_TRACE
#define TRACE(fmt, ...)  ambit::core::log::trace("{}:{} ({}) " fmt, __FILE__, __LINE__, __func__, ##__VA_ARGS__)
#else
#define TRACE(fmt, ...)  ((void)0)
#endif


#endif // AMBIT_CORE_LOG_H
