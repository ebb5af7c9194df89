#include <pdfbind/cli_util.hpp>

#include <charconv>

#include <fmt/format.h>

#include <pdfbind/version.hpp>

LogFlags CliLogFlags(bool log_to_file)
{
    LogFlags log_flags{
        LogFlags::Console |
        LogFlags::DetailFile |
        LogFlags::DetailLine |
        LogFlags::DetailStacktrace
    };
    if (log_to_file)
    {
        log_flags |= LogFlags::File;
    }
    return log_flags;
}

CliLog::CliLog()
{
    m_Log.emplace(CliLogFlags(false), Log::c_MainLogName);
}

void CliLog::EnableFileLogging()
{
    // Only one log may be registered under the main name at any time
    m_Log.reset();
    m_Log.emplace(CliLogFlags(true), Log::c_MainLogName);
}

void PrintVersion(std::string_view tool_name)
{
    fmt::print("{} {} (built {})\n", tool_name, PdfBindVersion(), PdfBindBuildTime());
}

std::optional<Length> ParsePoints(std::string_view str)
{
    float points{};
    const auto* end{ str.data() + str.size() };
    const auto [ptr, ec]{ std::from_chars(str.data(), end, points) };
    if (ec != std::errc{} || ptr != end)
    {
        return std::nullopt;
    }
    return points * 1_pts;
}
