#include <optional>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include <pdfbind/cli_util.hpp>

#include <pdfbind/util/log.hpp>

#include <pdfbind/config.hpp>
#include <pdfbind/pdf/impose.hpp>

struct CommandLineOptions
{
    bool m_HelpDisplayed{ false };
    bool m_Failed{ false };

    bool m_Deterministic{ false };
    bool m_LogToFile{ false };
    bool m_ScaleUp{ false };
    std::optional<Length> m_Margin{ std::nullopt };

    std::vector<std::string_view> m_Positionals{};
};

constexpr const char c_HelpStr[]{
    R"(
Usage:
    pdfbind-2up <input_pdf> [output_pdf] [format] [options]

Arguments:
    input_pdf           Path to the input PDF file.
    output_pdf          Path to the output PDF file, defaults to
                        <input_pdf>_2pp.pdf.
    format              Output sheet size, e.g. 'A4' or 'Letter', or any
                        size from the [PAGE_SIZES] of config.ini.

Options:
    --help              Display this information.
    --version           Display the version.
    --margin <points>   Margin around each half of the sheet, in points.
    --scale-up          Allow scaling pages up to fill their half.
    --deterministic     Omit the creation date from the output.
    --log-file          Additionally write the log to logs/.

Examples:
    pdfbind-2up document.pdf
    pdfbind-2up document.pdf output.pdf A4
)"
};

void PrintUsage()
{
    PrintVersion("pdfbind-2up");
    fmt::print("{}", c_HelpStr);
}

CommandLineOptions ParseCommandLine(int argc, char** raw_argv)
{
    using namespace std::string_view_literals;

    std::span argv{ raw_argv, static_cast<size_t>(argc) };

    CommandLineOptions cli;

    if (std::ranges::contains(argv, "--help"sv))
    {
        PrintUsage();
        cli.m_HelpDisplayed = true;
        return cli;
    }

    if (std::ranges::contains(argv, "--version"sv))
    {
        PrintVersion("pdfbind-2up");
        cli.m_HelpDisplayed = true;
        return cli;
    }

    for (size_t i = 1; i < argv.size(); i++)
    {
        const std::string_view arg{ argv[i] };
        if (arg == "--deterministic")
        {
            cli.m_Deterministic = true;
        }
        else if (arg == "--log-file")
        {
            cli.m_LogToFile = true;
        }
        else if (arg == "--scale-up")
        {
            cli.m_ScaleUp = true;
        }
        else if (arg == "--margin")
        {
            const auto margin{ i + 1 < argv.size() ? ParsePoints(argv[i + 1]) : std::nullopt };
            if (!margin.has_value())
            {
                LogError("--margin expects a number of points");
                cli.m_Failed = true;
                return cli;
            }

            cli.m_Margin = margin;
            ++i;
        }
        else if (arg.starts_with("--"))
        {
            LogError("Unknown command line option {}", arg);
            cli.m_Failed = true;
            return cli;
        }
        else
        {
            cli.m_Positionals.push_back(arg);
        }
    }

    return cli;
}

int main(int argc, char** argv)
{
    CliLog main_log{};
    g_Cfg = LoadConfig();

    const CommandLineOptions cli{ ParseCommandLine(argc, argv) };
    if (cli.m_Failed)
    {
        fmt::print("Use --help to list the available options.\n");
        return 1;
    }
    if (cli.m_HelpDisplayed)
    {
        return 0;
    }

    if (cli.m_Positionals.empty())
    {
        PrintUsage();
        return 0;
    }

    if (cli.m_LogToFile || g_Cfg.m_LogToFile)
    {
        main_log.EnableFileLogging();
    }
    if (cli.m_Deterministic)
    {
        g_Cfg.m_DeterministicPdfOutput = true;
    }
    if (cli.m_ScaleUp)
    {
        g_Cfg.m_ScaleUp = true;
    }
    if (cli.m_Margin.has_value())
    {
        g_Cfg.m_Margin = cli.m_Margin.value();
    }

    if (cli.m_Positionals.size() > 3)
    {
        LogWarning("Ignoring {} extra arguments", cli.m_Positionals.size() - 3);
    }

    const fs::path input_pdf{ cli.m_Positionals[0] };
    const std::optional<fs::path> output_pdf{
        cli.m_Positionals.size() > 1
            ? std::optional{ fs::path{ cli.m_Positionals[1] } }
            : std::nullopt,
    };
    const std::string page_format{
        cli.m_Positionals.size() > 2
            ? std::string{ cli.m_Positionals[2] }
            : g_Cfg.m_DefaultPageSize,
    };

    if (ImposeFile(input_pdf, output_pdf, page_format))
    {
        fmt::print("Conversion completed successfully!\n");
        return 0;
    }

    fmt::print("Conversion failed!\n");
    return 1;
}
