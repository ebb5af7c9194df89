#pragma once

#include <optional>
#include <string_view>

#include <pdfbind/error.hpp>
#include <pdfbind/util.hpp>

#include <pdfbind/pdf/backend.hpp>
#include <pdfbind/pdf/util.hpp>

/*
        Places every two consecutive pages of source_path side by side on one landscape sheet,
        the last sheet keeps its right half empty for an odd number of pages
        sheet_size is either the name of a page size, e.g. "A4" or "letter", or an explicit size
*/
ConversionResult Impose(const fs::path& source_path,
                        const fs::path& output_path,
                        const SheetSize& sheet_size,
                        Length margin = 12_pts,
                        bool scale_up = false,
                        PdfBackend& backend = DefaultPdfBackend());

// Like Impose, writing to <input>_2pp.pdf unless output_path is given, margin and scaling come from g_Cfg
ConversionResult ImposeFile(const fs::path& source_path,
                            std::optional<fs::path> output_path,
                            std::string_view page_size,
                            PdfBackend& backend = DefaultPdfBackend());
