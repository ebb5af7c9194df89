#include <pdfbind/pdf/merge.hpp>

#include <ranges>
#include <system_error>

#include <fmt/format.h>

#include <pdfbind/pdf/conversion.hpp>

#include <pdfbind/util/log.hpp>

ConversionResult Merge(const std::vector<fs::path>& source_paths,
                       const fs::path& output_path,
                       bool preserve_bookmarks,
                       std::optional<PageRange> page_range,
                       PdfBackend& backend)
{
    return RunConversion(
        "Merging PDFs",
        [&]() -> ConversionResult
        {
            if (source_paths.empty())
            {
                return MakeConversionError(ConversionErrorKind::InvalidArgument,
                                           "No input PDF paths provided");
            }

            for (const auto& source_path : source_paths)
            {
                if (!fs::exists(source_path))
                {
                    return MakeConversionError(ConversionErrorKind::NotFound,
                                               fmt::format("Input file not found: {}", source_path.string()));
                }
            }

            LogInfo("Merging {} PDF files...", source_paths.size());

            auto document{ backend.Create() };
            uint32_t total_pages{ 0 };
            for (const auto& source_path : source_paths)
            {
                const auto file_name{ source_path.filename().string() };
                LogInfo("Processing: {}", file_name);

                auto source{ backend.Open(source_path) };
                const auto selection{ ClampPageRange(page_range, source->PageCount()) };
                const uint32_t first_page{ document->PageCount() };
                document->AppendPages(*source, selection);

                if (preserve_bookmarks && source->HasOutlines())
                {
                    try
                    {
                        const auto num_bookmarks{ document->CopyOutlines(*source, selection, first_page) };
                        LogDebug("Copied {} bookmarks from {}", num_bookmarks, file_name);
                    }
                    catch (const std::exception& e)
                    {
                        LogWarning("Could not preserve bookmarks from {}: {}", file_name, e.what());
                    }
                }

                LogInfo("  Added {} pages from {}", selection.m_Count, file_name);
                total_pages += selection.m_Count;
            }

            const auto written_path{ WriteAtomically(*document, output_path) };
            LogInfo("Saved: {}", written_path.string());
            LogInfo("Total pages in merged PDF: {}", total_pages);
            return written_path;
        });
}

ConversionResult MergeTwo(const fs::path& first_path,
                          const fs::path& second_path,
                          const fs::path& output_path,
                          bool preserve_bookmarks,
                          PdfBackend& backend)
{
    return Merge({ first_path, second_path }, output_path, preserve_bookmarks, std::nullopt, backend);
}

ConversionResult MergeFiles(const std::vector<fs::path>& source_paths,
                            std::optional<fs::path> output_path,
                            bool preserve_bookmarks,
                            std::optional<PageRange> page_range,
                            PdfBackend& backend)
{
    if (source_paths.size() < 2)
    {
        return LogFailure("Merging PDFs",
                          MakeConversionError(ConversionErrorKind::InvalidArgument,
                                              fmt::format("At least 2 PDF files are required for merging, got {}",
                                                          source_paths.size())));
    }

    const fs::path final_output_path{ output_path.value_or(DefaultMergedOutputPath(source_paths.front())) };
    LogInfo("Merging {} PDF files into {}:", source_paths.size(), final_output_path.string());
    for (const auto& [i, source_path] : source_paths | std::views::enumerate)
    {
        LogInfo("  {}. {}", i + 1, source_path.filename().string());
    }

    return Merge(source_paths, final_output_path, preserve_bookmarks, page_range, backend);
}

ConversionResult MergeDirectory(const fs::path& directory,
                                std::optional<fs::path> output_path,
                                bool preserve_bookmarks,
                                std::optional<PageRange> page_range,
                                PdfBackend& backend)
{
    std::error_code error;
    if (!fs::is_directory(directory, error))
    {
        return LogFailure("Merging PDFs",
                          MakeConversionError(ConversionErrorKind::InvalidArgument,
                                              fmt::format("{} is not a directory", directory.string())));
    }

    std::vector<fs::path> pdf_files;
    try
    {
        pdf_files = CollectPdfFiles(directory);
    }
    catch (const fs::filesystem_error& e)
    {
        return LogFailure("Merging PDFs", MakeConversionError(ConversionErrorKind::IoFailure, e.what()));
    }

    if (pdf_files.size() < 2)
    {
        return LogFailure("Merging PDFs",
                          MakeConversionError(ConversionErrorKind::InvalidArgument,
                                              fmt::format("Found {} PDF files in {}, at least 2 are required for merging",
                                                          pdf_files.size(),
                                                          directory.string())));
    }

    LogInfo("Found {} PDF files in {}", pdf_files.size(), directory.string());
    return MergeFiles(pdf_files, std::move(output_path), preserve_bookmarks, page_range, backend);
}
