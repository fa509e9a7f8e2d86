#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace geofacet
{

enum class LogLevel : int
{
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5
};

// Process-wide logger. Sinks are invoked under the logger mutex, in the
// order they were added. A stderr console sink is installed on first use;
// call clear_sinks() to silence it.
class Logger
{
   public:
    struct LogEntry
    {
        std::chrono::system_clock::time_point timestamp;
        LogLevel                              level;
        std::string                           category;
        std::string                           message;
    };

    using LogSink = std::function<void(const LogEntry&)>;

    static Logger& instance();

    void     set_level(LogLevel level);
    LogLevel get_level() const;

    void add_sink(LogSink sink);
    void clear_sinks();

    void log(LogLevel level, std::string_view category, std::string_view message);

    template <typename... Args>
    void log_formatted(LogLevel level, std::string_view category, std::string_view format, Args&&... args);

    bool is_enabled(LogLevel level) const;

    static std::string level_to_string(LogLevel level);
    static std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);

   private:
    Logger();
    ~Logger()                        = default;
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex   mutex_;
    LogLevel             min_level_ = LogLevel::Warning;
    std::vector<LogSink> sinks_;

    template <typename T>
    static std::string arg_to_string(T&& v)
    {
        using D = std::decay_t<T>;
        if constexpr (std::is_same_v<D, std::string>)
            return v;
        else if constexpr (std::is_same_v<D, std::string_view>)
            return std::string(v);
        else if constexpr (std::is_same_v<D, const char*> || std::is_same_v<D, char*>)
        {
            const char* p = v;
            return p ? std::string(p) : std::string("(null)");
        }
        else if constexpr (std::is_same_v<D, bool>)
            return v ? "true" : "false";
        else
            return std::to_string(v);
    }

    // Replaces each "{}" in turn; surplus arguments are dropped.
    static std::string format_message(std::string_view format, auto&&... args)
    {
        std::string result(format);
        size_t      cursor = 0;
        auto        substitute = [&](auto&& arg)
        {
            auto pos = result.find("{}", cursor);
            if (pos == std::string::npos)
                return;
            auto text = arg_to_string(std::forward<decltype(arg)>(arg));
            result.replace(pos, 2, text);
            cursor = pos + text.size();
        };
        (substitute(std::forward<decltype(args)>(args)), ...);
        return result;
    }
};

template <typename... Args>
void Logger::log_formatted(LogLevel level, std::string_view category, std::string_view format, Args&&... args)
{
    if (!is_enabled(level))
        return;

    std::string formatted;
    try
    {
        formatted = format_message(format, std::forward<Args>(args)...);
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "logger", std::string("format error: ") + e.what());
        return;
    }
    log(level, category, formatted);
}

namespace sinks
{
Logger::LogSink console_sink();
Logger::LogSink file_sink(const std::string& filename);
Logger::LogSink null_sink();
// Appends every entry to *out. Intended for tests and for callers that want
// to inspect warnings after a geofacet() call.
Logger::LogSink memory_sink(std::shared_ptr<std::vector<Logger::LogEntry>> out);
}   // namespace sinks

#define GEOFACET_LOG_AT(lvl, category, ...)                                                      \
    do                                                                                           \
    {                                                                                            \
        if (::geofacet::Logger::instance().is_enabled(lvl))                                      \
        {                                                                                        \
            ::geofacet::Logger::instance().log_formatted(lvl, category, __VA_ARGS__);            \
        }                                                                                        \
    } while (0)

#define GEOFACET_LOG_TRACE(category, ...) GEOFACET_LOG_AT(::geofacet::LogLevel::Trace, category, __VA_ARGS__)
#define GEOFACET_LOG_DEBUG(category, ...) GEOFACET_LOG_AT(::geofacet::LogLevel::Debug, category, __VA_ARGS__)
#define GEOFACET_LOG_INFO(category, ...)  GEOFACET_LOG_AT(::geofacet::LogLevel::Info, category, __VA_ARGS__)
#define GEOFACET_LOG_WARN(category, ...)  GEOFACET_LOG_AT(::geofacet::LogLevel::Warning, category, __VA_ARGS__)
#define GEOFACET_LOG_ERROR(category, ...) GEOFACET_LOG_AT(::geofacet::LogLevel::Error, category, __VA_ARGS__)
#define GEOFACET_LOG_CRITICAL(category, ...) \
    GEOFACET_LOG_AT(::geofacet::LogLevel::Critical, category, __VA_ARGS__)

}   // namespace geofacet
