#ifndef VERILOOP_LOGGING_HPP
#define VERILOOP_LOGGING_HPP

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>

namespace veriloop::lib
{

    enum class LogLevel
    {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Off = 5
    };

    struct LogEvent
    {
        LogLevel level;
        std::string tag;
        std::string message;
    };

    const char *logLevelText(LogLevel level) noexcept;
    std::optional<LogLevel> parseLogLevel(std::string_view text);

    class Logger
    {
    public:
        using Sink = std::function<void(const LogEvent &)>;

        void setLevel(LogLevel level) noexcept
        {
            std::lock_guard<std::mutex> lock(mutex_);
            level_ = level;
        }
        void enable() noexcept
        {
            std::lock_guard<std::mutex> lock(mutex_);
            enabled_ = true;
        }
        void disable() noexcept
        {
            std::lock_guard<std::mutex> lock(mutex_);
            enabled_ = false;
        }
        void setSink(Sink sink)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sink_ = std::move(sink);
        }

        void allowTag(std::string_view tag)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            tags_.insert(std::string(tag));
        }

        void clearTags()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            tags_.clear();
        }

        bool enabled(LogLevel level, std::string_view tag) const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return acceptsLocked(level, tag);
        }

        void log(LogLevel level, std::string_view tag, std::string_view message)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!acceptsLocked(level, tag) || !sink_)
            {
                return;
            }
            LogEvent event{level, std::string(tag), std::string(message)};
            sink_(event);
        }

    private:
        bool acceptsLocked(LogLevel level, std::string_view tag) const
        {
            if (!enabled_ || level_ == LogLevel::Off || level == LogLevel::Off)
            {
                return false;
            }
            if (static_cast<int>(level) < static_cast<int>(level_))
            {
                return false;
            }
            if (!tags_.empty() && tags_.find(std::string(tag)) == tags_.end())
            {
                return false;
            }
            return true;
        }

        bool enabled_ = false;
        LogLevel level_ = LogLevel::Warn;
        std::unordered_set<std::string> tags_{};
        Sink sink_{};
        mutable std::mutex mutex_{};
    };

    // Null-tolerant helper for components holding an optional Logger*.
    inline void logTo(Logger *logger, LogLevel level, std::string_view tag, std::string_view message)
    {
        if (logger)
        {
            logger->log(level, tag, message);
        }
    }

} // namespace veriloop::lib

#endif // VERILOOP_LOGGING_HPP
