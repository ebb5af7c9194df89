#include <pdfbind/util/log.hpp>

#include <pdfbind/util/log_impl.hpp>

#include <version>

#ifdef __cpp_lib_stacktrace
#include <stacktrace>
#endif

Log::Log(LogFlags log_flags, std::string_view log_name)
{
    m_Impl = std::make_unique<LogImpl>(log_flags, log_name);
    m_Impl->RegisterInstance(this);
}

Log::~Log() = default;

Log* Log::GetInstance(std::string_view log_name)
{
    return LogImpl::GetInstance(log_name);
}

uint32_t Log::InstallHook(LogHook hook)
{
    return m_Impl->InstallHook(std::move(hook));
}
void Log::UninstallHook(uint32_t hook_id)
{
    return m_Impl->UninstallHook(hook_id);
}

bool Log::GetStacktraceEnabled(LogLevel level) const
{
    return m_Impl->GetStacktraceEnabled(level);
}

std::vector<std::string> Log::CaptureStacktrace(std::size_t skip)
{
    std::vector<std::string> stack_trace;
#ifdef __cpp_lib_stacktrace
    for (const auto& stack_elem : std::stacktrace::current(skip + 1))
    {
        const std::string source_file{ stack_elem.source_file() };
        if (!source_file.empty())
        {
            stack_trace.push_back(fmt::format("  {:<64} @ {}:{}",
                                              stack_elem.description(),
                                              source_file,
                                              stack_elem.source_line()));
        }
        else
        {
            stack_trace.push_back(fmt::format("  {}", stack_elem.description()));
        }
    }

    if (!stack_trace.empty())
    {
        stack_trace[0][0] = '>';
    }
#else
    static_cast<void>(skip);
#endif
    return stack_trace;
}

void Log::PrintRaw(const DetailInformation& detail_info, LogLevel level, const char* message)
{
    m_Impl->Print(detail_info, level, message);
}
