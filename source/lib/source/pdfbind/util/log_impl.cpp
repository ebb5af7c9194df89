#include <pdfbind/util/log_impl.hpp>

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <map>
#include <sstream>
#include <stdexcept>

#include <QDebug>
#include <QString>

#include <fmt/chrono.h>
#include <fmt/ranges.h>

Log::LogImpl::LogImpl(LogFlags log_flags, std::string_view log_name)
    : m_LogName(log_name)
    , m_LogFlags(log_flags)
{
    if (bool(m_LogFlags & LogFlags::File))
        CreateLogFile();
}

Log::LogImpl::~LogImpl()
{
    UnregisterInstance();
}

Log* Log::LogImpl::GetInstance(std::string_view log_name)
{
    std::shared_lock<std::shared_mutex> read_lock(g_InstanceListMutex);

    auto it = g_Instances.find(std::string{ log_name });
    if (it != g_Instances.end())
        return it->second->m_ParentLog;
    return nullptr;
}

void Log::LogImpl::RegisterInstance(Log* parent_log)
{
    UnregisterInstance();

    m_ParentLog = parent_log;

    std::unique_lock<std::shared_mutex> write_lock(g_InstanceListMutex);
    if (g_Instances.find(m_LogName) != g_Instances.end())
        throw std::logic_error{ fmt::format("Log-Name Redefinition: {}", m_LogName) };
    g_Instances[m_LogName] = this;
}
void Log::LogImpl::UnregisterInstance()
{
    m_ParentLog = nullptr;

    std::unique_lock<std::shared_mutex> write_lock(g_InstanceListMutex);
    auto it = g_Instances.find(m_LogName);
    if (it != g_Instances.end() && it->second == this)
        g_Instances.erase(it);
}

uint32_t Log::LogImpl::InstallHook(Log::LogHook hook)
{
    std::lock_guard lock{ m_Mutex };
    const uint32_t hook_id{ m_NextHookId++ };
    m_LogHooks.push_back({ hook_id, std::move(hook) });
    return hook_id;
}

void Log::LogImpl::UninstallHook(uint32_t hook_id)
{
    std::lock_guard lock{ m_Mutex };
    std::erase_if(m_LogHooks,
                  [hook_id](const InstalledLogHook& hook)
                  { return hook.m_HookId == hook_id; });
}

bool Log::LogImpl::GetStacktraceEnabled(LogLevel level) const
{
    return level == LogLevel::Error && bool(m_LogFlags & LogFlags::DetailStacktrace);
}

void Log::LogImpl::Print(const Log::DetailInformation& detail_info, Log::LogLevel level, const char* message)
{
    Flush(detail_info, level, message);
}

void Log::LogImpl::Flush(const DetailInformation& detail_info, LogLevel level, const char* message)
{
    std::stringstream stream;

    if (message[0] == '\n')
    {
        stream << "\n";
        message++;
    }

    const char* prefix{ "[???]" };
    switch (level)
    {
    case LogLevel::Information:
        prefix = " [INFO]";
        break;
    case LogLevel::Debug:
        prefix = "[DEBUG]";
        break;
    case LogLevel::Warning:
        prefix = " [WARN]";
        break;
    case LogLevel::Error:
        prefix = "[ERROR]";
        break;
    }
    stream << prefix;

    // Detailed information, e.g. time, file, line...
    const LogFlags detail_bits{ m_LogFlags & LogFlags::DetailAll };
    if (bool(detail_bits))
    {
        std::vector<std::string> details;
        if (bool(detail_bits & LogFlags::DetailTime))
        {
            details.push_back(fmt::format("{:%H:%M:%S}", fmt::localtime(detail_info.m_Time)));
        }
        if (bool(detail_bits & LogFlags::DetailFile))
        {
            std::string_view file{ detail_info.m_File };
#ifdef PDFBIND_SOURCE_ROOT
            if (file.starts_with(PDFBIND_SOURCE_ROOT))
            {
                file = file.substr(std::strlen(PDFBIND_SOURCE_ROOT));
            }
#endif
            details.emplace_back(file);
        }
        if (bool(detail_bits & LogFlags::DetailLine))
        {
            if (IsColumnEnabled(detail_bits))
            {
                details.push_back(fmt::format("{}:{}", detail_info.m_Line, detail_info.m_Column));
            }
            else
            {
                details.push_back(fmt::format("{}", detail_info.m_Line));
            }
        }
        if (bool(detail_bits & LogFlags::DetailFunction))
        {
            details.emplace_back(detail_info.m_Function);
        }

        stream << "<" << fmt::format("{}", fmt::join(details, "; ")) << ">";
    }

    stream << ": ";

    stream << std::string_view(message) << "\n";

    if (GetStacktraceEnabled(level))
    {
        if (!detail_info.m_StackTrace.empty())
        {
            stream << "Stacktrace:\n";
            for (std::string_view stack_element : detail_info.m_StackTrace)
            {
                stream << stack_element << "\n";
            }
        }
        else
        {
            stream << "[[Stacktrace not available]]\n";
        }
    }

    const std::string full_message_str{ stream.str() };
    std::lock_guard lock{ m_Mutex };

    if (bool(m_LogFlags & LogFlags::Console))
        qDebug().noquote() << QString::fromStdString(full_message_str).trimmed();
    if (m_FileStream.is_open())
        m_FileStream << full_message_str << std::flush;

    for (const InstalledLogHook& hook : m_LogHooks)
    {
        hook.m_Hook(detail_info, level, message);
    }
}

bool Log::LogImpl::IsColumnEnabled(LogFlags detail_bits)
{
    return (detail_bits & LogFlags::DetailColumn) == LogFlags::DetailColumn;
}

void Log::LogImpl::CreateLogFile()
{
    namespace fs = std::filesystem;

    const std::string file_name{
        fmt::format("logs/{:%Y-%m-%d_%H-%M-%S}.log", fmt::localtime(std::time(nullptr))),
    };

    fs::path logs_directory{ fs::absolute("logs") };
    if (!fs::exists(logs_directory) || !fs::is_directory(logs_directory))
    {
        if (fs::exists(logs_directory))
        {
            fs::remove_all(logs_directory);
        }
        fs::create_directories(logs_directory);
    }

    std::multimap<fs::file_time_type, fs::path> files_sorted_by_modify_time;
    for (fs::directory_iterator dir_iter(logs_directory); dir_iter != fs::directory_iterator{}; ++dir_iter)
    {
        if (fs::is_regular_file(dir_iter->status()))
        {
            files_sorted_by_modify_time.insert({ fs::last_write_time(dir_iter->path()), dir_iter->path() });
        }
    }

    static constexpr std::size_t c_MaxNumLogFiles = 64;
    const std::size_t num_files = files_sorted_by_modify_time.size();
    if (num_files > c_MaxNumLogFiles)
    {
        const std::size_t files_to_delete = num_files - c_MaxNumLogFiles;
        auto it = files_sorted_by_modify_time.begin();
        for (std::size_t i = 0; i < files_to_delete; i++, ++it)
        {
            fs::remove(it->second);
        }
    }

    std::lock_guard lock{ m_Mutex };
    m_FileStream.open(file_name);
}
