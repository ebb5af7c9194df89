#pragma once

#include <optional>
#include <vector>

#include <pdfbind/error.hpp>
#include <pdfbind/util.hpp>

#include <pdfbind/pdf/backend.hpp>
#include <pdfbind/pdf/util.hpp>

/*
        Concatenates the pages of all source_paths in order into output_path
        page_range is applied to each source separately and clamped to its page count
        Bookmarks that cannot be carried over only produce a warning
*/
ConversionResult Merge(const std::vector<fs::path>& source_paths,
                       const fs::path& output_path,
                       bool preserve_bookmarks = true,
                       std::optional<PageRange> page_range = std::nullopt,
                       PdfBackend& backend = DefaultPdfBackend());

ConversionResult MergeTwo(const fs::path& first_path,
                          const fs::path& second_path,
                          const fs::path& output_path,
                          bool preserve_bookmarks = true,
                          PdfBackend& backend = DefaultPdfBackend());

// Requires at least two sources, writes to <first>_merged.pdf unless output_path is given
ConversionResult MergeFiles(const std::vector<fs::path>& source_paths,
                            std::optional<fs::path> output_path,
                            bool preserve_bookmarks = true,
                            std::optional<PageRange> page_range = std::nullopt,
                            PdfBackend& backend = DefaultPdfBackend());

// Merges all *.pdf files of a directory in file name order
ConversionResult MergeDirectory(const fs::path& directory,
                                std::optional<fs::path> output_path,
                                bool preserve_bookmarks = true,
                                std::optional<PageRange> page_range = std::nullopt,
                                PdfBackend& backend = DefaultPdfBackend());
