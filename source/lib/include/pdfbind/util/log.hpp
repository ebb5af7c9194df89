#pragma once

#include <cstdint>
#include <ctime>
#include <functional>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include <pdfbind/typedefs.hpp>
#include <pdfbind/util/type_traits.hpp>

/*
        A Log writes to the console and/or a log file, both are optional and choosen at construction
        Any number of hooks can be installed to receive every message, which is how a host embedding
        the library gets progress information without parsing stdout
*/
class Log
{
  public:
    Log(LogFlags log_flags, std::string_view log_name);
    ~Log();

    Log(const Log&) = delete;
    Log& operator=(const Log&) = delete;

    /*
            Getter for all instances of a logger
    */
    static Log* GetInstance(std::string_view log_name);

    /*
            LogLevels dictate the severity of the log
    */
    enum class LogLevel
    {
        Information,
        Debug,
        Warning,
        Error,
    };

    /*
            The Detail information that can be used to give a developer more information about a log
    */
    struct DetailInformation
    {
        std::time_t m_Time;
        std::string_view m_File;
        std::size_t m_Line;
        std::size_t m_Column;
        std::string_view m_Function;
        std::vector<std::string> m_StackTrace;
    };

    /*
            Register a hook for external handling of messages
    */
    using LogHook = std::function<void(const Log::DetailInformation&, Log::LogLevel, std::string_view)>;
    uint32_t InstallHook(LogHook hook);
    void UninstallHook(uint32_t hook_id);

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

        fmt::format_string<Args...> m_Message{};
        std::source_location m_SourceInfo{};
    };
    template<class... Args>
    using LogMessage = LogMessageWrapper<identity_t<Args>...>;

    bool GetStacktraceEnabled(LogLevel level) const;

    /*
            Formatted call stack of the caller, skipping the innermost skip frames
            Empty when the standard library was built without stacktrace support
    */
    static std::vector<std::string> CaptureStacktrace(std::size_t skip = 0);

    /*
            Raw Print function accepts a null-terminated string
            Templated print function uses fmtlib for formatting
    */
    void PrintRaw(const DetailInformation& detail_info, LogLevel level, const char* message);
    template<class... Args>
    void Print(const DetailInformation& detail_info, LogLevel level, fmt::format_string<Args...> message, Args&&... args)
    {
        const auto formatted{ fmt::format(message, std::forward<Args>(args)...) };
        PrintRaw(detail_info, level, formatted.c_str());
    }

    template<class... Args>
    static void DoLog(std::string_view log_name, LogLevel level, const LogMessage<Args...>& message, Args&&... args)
    {
        Log* log_sink = Log::GetInstance(log_name);
        if (log_sink)
        {
            std::vector<std::string> stack_trace;
            if (log_sink->GetStacktraceEnabled(level))
            {
                // Skips this function and the LogXXX wrapper
                stack_trace = CaptureStacktrace(2);
            }
            log_sink->Print(MakeDetailInformation(message.m_SourceInfo, std::move(stack_trace)),
                            level,
                            message.m_Message,
                            std::forward<Args>(args)...);
        }
    }

    /*
            Same as DoLog but with a stack trace that was captured elsewhere, e.g. where an exception was thrown
    */
    template<class... Args>
    static void DoLogWithStacktrace(std::string_view log_name,
                                    LogLevel level,
                                    std::vector<std::string> stack_trace,
                                    const LogMessage<Args...>& message,
                                    Args&&... args)
    {
        Log* log_sink = Log::GetInstance(log_name);
        if (log_sink)
        {
            if (!log_sink->GetStacktraceEnabled(level))
            {
                stack_trace.clear();
            }
            log_sink->Print(MakeDetailInformation(message.m_SourceInfo, std::move(stack_trace)),
                            level,
                            message.m_Message,
                            std::forward<Args>(args)...);
        }
    }

    /*
            The name of the main log, globally available so one can query for the main log or create it themselves
    */
    static constexpr std::string_view c_MainLogName{ "Main-Log" };

  private:
    static DetailInformation MakeDetailInformation(const std::source_location& source_info,
                                                   std::vector<std::string> stack_trace)
    {
        return DetailInformation{
            std::time(nullptr),
            source_info.file_name(),
            source_info.line(),
            source_info.column(),
            source_info.function_name(),
            std::move(stack_trace),
        };
    }

    class LogImpl;
    std::unique_ptr<LogImpl> m_Impl;
};

template<class... Args>
void LogInfo(const Log::LogMessage<Args...>& message, Args&&... args)
{
    Log::DoLog(Log::c_MainLogName, Log::LogLevel::Information, message, std::forward<Args>(args)...);
}
template<class... Args>
void LogDebug(const Log::LogMessage<Args...>& message, Args&&... args)
{
    Log::DoLog(Log::c_MainLogName, Log::LogLevel::Debug, message, std::forward<Args>(args)...);
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
template<class... Args>
void LogErrorWithStacktrace(std::vector<std::string> stack_trace, const Log::LogMessage<Args...>& message, Args&&... args)
{
    Log::DoLogWithStacktrace(Log::c_MainLogName,
                             Log::LogLevel::Error,
                             std::move(stack_trace),
                             message,
                             std::forward<Args>(args)...);
}
