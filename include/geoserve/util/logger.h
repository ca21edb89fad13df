#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace geoserve
{
    enum class LogLevel
    {
        debug = 0,
        info = 1,
        warn = 2,
        error = 3
    };

    // Accepts "debug", "info", "warn"/"warning", "error" (case-insensitive).
    std::optional<LogLevel> ParseLogLevel(std::string_view name);

    class Logger
    {
    public:
        Logger() = default;

        void SetFile(std::string path);
        void SetLevel(LogLevel lvl);
        LogLevel level() const;

        void Debug(std::string_view event, std::string_view msg);
        void Info(std::string_view event, std::string_view msg);
        void Warn(std::string_view event, std::string_view msg);
        void Error(std::string_view event, std::string_view msg);

    private:
        void Log(LogLevel lvl, std::string_view event, std::string_view msg);
        static const char *ToStr(LogLevel lvl);

        mutable std::mutex mu_;
        std::string file_path_;
        LogLevel level_{LogLevel::info};
    };
} // namespace geoserve
