#pragma once

#include <optional>
#include <span>
#include <string_view>

#include <pdfbind/util/log.hpp>

#include <pdfbind/typedefs.hpp>
#include <pdfbind/util.hpp>

LogFlags CliLogFlags(bool log_to_file);

/*
        Creates the console log, reads config.ini and switches over to a
        file backed log if either the config or the command line asks for it
*/
class CliLog
{
  public:
    CliLog();

    void EnableFileLogging();

  private:
    std::optional<Log> m_Log;
};

void PrintVersion(std::string_view tool_name);

// Parses a plain number of points, e.g. "12" or "7.5"
std::optional<Length> ParsePoints(std::string_view str);
