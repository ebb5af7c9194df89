#include <optional>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <pdfbind/cli_util.hpp>

#include <pdfbind/util/log.hpp>

#include <pdfbind/config.hpp>
#include <pdfbind/pdf/merge.hpp>

struct CommandLineOptions
{
    bool m_HelpDisplayed{ false };
    bool m_Failed{ false };

    bool m_Deterministic{ false };
    bool m_LogToFile{ false };
    bool m_NoBookmarks{ false };
    std::optional<PageRange> m_PageRange{ std::nullopt };

    std::vector<std::string_view> m_Positionals{};
};

constexpr const char c_HelpStr[]{
    R"(
Usage:
    pdfbind-merge <input1_pdf> <input2_pdf> [output_pdf] [options]
    pdfbind-merge <directory_path> [output_pdf] [options]

Arguments:
    input1_pdf          Path to the first input PDF file.
    input2_pdf          Path to the second input PDF file.
    directory_path      Path to a directory, all PDF files in it are
                        merged in file name order.
    output_pdf          Path to the output PDF file, defaults to
                        <first_input>_merged.pdf.

Options:
    --help              Display this information.
    --version           Display the version.
    --no-bookmarks      Do not carry bookmarks over into the output.
    --pages <start>:<end>
                        Only take pages [start, end) of every input,
                        counted from 0. Either side may be omitted.
    --deterministic     Omit the creation date from the output.
    --log-file          Additionally write the log to logs/.

Examples:
    pdfbind-merge document1.pdf document2.pdf
    pdfbind-merge document1.pdf document2.pdf merged.pdf
    pdfbind-merge /path/to/pdf/folder/
    pdfbind-merge /path/to/pdf/folder/ all_merged.pdf
)"
};

void PrintUsage()
{
    PrintVersion("pdfbind-merge");
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
        PrintVersion("pdfbind-merge");
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
        else if (arg == "--no-bookmarks")
        {
            cli.m_NoBookmarks = true;
        }
        else if (arg == "--pages")
        {
            const auto page_range{ i + 1 < argv.size() ? ParsePageRange(argv[i + 1]) : std::nullopt };
            if (!page_range.has_value())
            {
                LogError("--pages expects a range formatted as <start>:<end>");
                cli.m_Failed = true;
                return cli;
            }

            cli.m_PageRange = page_range;
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

    const auto& positionals{ cli.m_Positionals };
    if (positionals.empty())
    {
        PrintUsage();
        return 0;
    }
    if (positionals.size() > 3)
    {
        fmt::print("Error: Too many arguments.\n");
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
    const bool preserve_bookmarks{ g_Cfg.m_PreserveBookmarks && !cli.m_NoBookmarks };

    const auto to_path{
        [](std::string_view arg)
        { return fs::path{ arg }; }
    };

    std::error_code error;
    ConversionResult result;
    if (positionals.size() == 1)
    {
        LogInfo("Mode: Directory merge - {}", positionals[0]);
        result = MergeDirectory(positionals[0], std::nullopt, preserve_bookmarks, cli.m_PageRange);
    }
    else if (positionals.size() == 2 && fs::is_directory(to_path(positionals[0]), error))
    {
        LogInfo("Mode: Directory merge with output - {} -> {}", positionals[0], positionals[1]);
        result = MergeDirectory(positionals[0], to_path(positionals[1]), preserve_bookmarks, cli.m_PageRange);
    }
    else
    {
        const std::vector<fs::path> input_pdfs{
            positionals |
            std::views::take(2) |
            std::views::transform(to_path) |
            std::ranges::to<std::vector>()
        };
        const std::optional<fs::path> output_pdf{
            positionals.size() == 3
                ? std::optional{ to_path(positionals[2]) }
                : std::nullopt,
        };

        if (output_pdf.has_value())
        {
            LogInfo("Mode: Two file merge with output - {} -> {}",
                    fmt::join(positionals | std::views::take(2), ", "),
                    positionals[2]);
        }
        else
        {
            LogInfo("Mode: Two file merge - {}", fmt::join(positionals, ", "));
        }
        result = MergeFiles(input_pdfs, output_pdf, preserve_bookmarks, cli.m_PageRange);
    }

    if (result)
    {
        fmt::print("Merge completed successfully!\n");
        return 0;
    }

    fmt::print("Merge failed!\n");
    return 1;
}
