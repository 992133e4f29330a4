#pragma once

#include <cstdint>
#include <ctime>
#include <functional>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

#include <ads/typedefs.hpp>

/*
        A Log can be called from any thread and will write to the console and/or a log file
        Both are optional and choosen by the client at initialization
*/
class Log
{
  public:
    /*
            LogLevels dictate the severity of the log, messages below a sinks minimum level are dropped
    */
    enum class LogLevel
    {
        Debug,
        Information,
        Warning,
        Error,
    };

    Log(LogFlags log_flags, std::string_view log_name, LogLevel min_level = LogLevel::Debug);
    ~Log();

    Log(const Log&) = delete;
    Log(Log&&) = delete;
    Log& operator=(const Log&) = delete;
    Log& operator=(Log&&) = delete;

    /*
            Getter for all instances of a logger, returns nullptr for unknown names
    */
    static Log* GetInstance(std::string_view log_name);

    struct DetailInformation
    {
        std::time_t m_Time;
        std::string_view m_File;
        std::size_t m_Line;
        std::string_view m_Function;
    };

    /*
            Register a hook for external handling of messages
    */
    using LogHook = std::function<void(const DetailInformation&, LogLevel, std::string_view)>;
    uint32_t InstallHook(LogHook hook);
    void UninstallHook(uint32_t hook_id);

    void SetMinLevel(LogLevel level);
    LogLevel GetMinLevel() const;

    /*
            Wrapper for a log message, ensures that used strings are constant expressions
    */
    template<class... Args>
    struct LogMessageWrapper
    {
        consteval LogMessageWrapper(const char* message, std::source_location source_info = std::source_location::current())
            : m_Message{ message }
            , m_SourceInfo{ source_info }
        {
        }

        fmt::format_string<Args...> m_Message;
        std::source_location m_SourceInfo;
    };
    template<class... Args>
    using LogMessage = LogMessageWrapper<std::type_identity_t<Args>...>;

    void PrintRaw(const DetailInformation& detail_info, LogLevel level, std::string_view message);

    template<class... Args>
    static void DoLog(std::string_view log_name, LogLevel level, const LogMessage<Args...>& message, Args&&... args)
    {
        Log* log_sink{ Log::GetInstance(log_name) };
        if (log_sink == nullptr || level < log_sink->GetMinLevel())
        {
            return;
        }

        const DetailInformation detail_info{
            std::time(nullptr),
            message.m_SourceInfo.file_name(),
            message.m_SourceInfo.line(),
            message.m_SourceInfo.function_name(),
        };
        const std::string formatted{ fmt::format(message.m_Message, std::forward<Args>(args)...) };
        log_sink->PrintRaw(detail_info, level, formatted);
    }

    /*
            The name of the main log, globally available so one can query for the main log or create it themselves
    */
    static constexpr std::string_view c_MainLogName{ "Main-Log" };

  private:
    class LogImpl;
    std::unique_ptr<LogImpl> m_Impl;
};

template<class... Args>
void LogDebug(const Log::LogMessage<Args...>& message, Args&&... args)
{
    Log::DoLog(Log::c_MainLogName, Log::LogLevel::Debug, message, std::forward<Args>(args)...);
}
template<class... Args>
void LogInfo(const Log::LogMessage<Args...>& message, Args&&... args)
{
    Log::DoLog(Log::c_MainLogName, Log::LogLevel::Information, message, std::forward<Args>(args)...);
}
template<class... Args>
void LogWarning(const Log::LogMessage<Args...>& message, Args&&... args)
{
    Log::DoLog(Log::c_MainLogName, Log::LogLevel::Warning, message, std::forward<Args>(args)...);
}
template<class... Args>
void LogError(const Log::LogMessage<Args...>& message, Args&&... args)
{
    Log::DoLog(Log::c_MainLogName, Log::LogLevel::Error, message, std::forward<Args>(args)...);
}
