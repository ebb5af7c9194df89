#include <pdfbind/pdf/impose.hpp>

#include <array>

#include <fmt/format.h>

#include <pdfbind/config.hpp>

#include <pdfbind/pdf/conversion.hpp>

#include <pdfbind/util/log.hpp>

ConversionResult Impose(const fs::path& source_path,
                        const fs::path& output_path,
                        const SheetSize& sheet_size,
                        Length margin,
                        bool scale_up,
                        PdfBackend& backend)
{
    return RunConversion(
        "Imposing PDF",
        [&]() -> ConversionResult
        {
            const auto resolved_size{ ResolveSheetSize(sheet_size) };
            if (!resolved_size.has_value())
            {
                return std::unexpected{ resolved_size.error() };
            }

            const auto layout{ ComputeSheetLayout(resolved_size.value(), margin) };
            if (!layout.has_value())
            {
                return std::unexpected{ layout.error() };
            }

            if (!fs::exists(source_path))
            {
                return MakeConversionError(ConversionErrorKind::NotFound,
                                           fmt::format("Input file not found: {}", source_path.string()));
            }

            auto source{ backend.Open(source_path) };
            const uint32_t page_count{ source->PageCount() };
            LogInfo("Input pages: {}", page_count);
            LogInfo("Output sheet size: {:.2f} x {:.2f} pts (landscape)",
                    ToPoints(layout->m_SheetSize.x),
                    ToPoints(layout->m_SheetSize.y));

            if (page_count == 0)
            {
                return MakeConversionError(ConversionErrorKind::InvalidArgument,
                                           fmt::format("{} has no pages", source_path.string()));
            }

            auto document{ backend.Create() };
            for (uint32_t i = 0; i < page_count; i += 2)
            {
                auto* sheet{ document->NextPage(layout->m_SheetSize) };

                static constexpr std::array c_Sides{ SheetSide::Left, SheetSide::Right };
                for (uint32_t j = 0; j < c_Sides.size(); j++)
                {
                    const uint32_t page_index{ i + j };
                    if (page_index >= page_count)
                    {
                        break;
                    }

                    const auto page{ source->GetPageGeometry(page_index) };
                    const auto placement{ ComputePagePlacement(layout.value(), page, c_Sides[j], scale_up) };
                    LogDebug("Page {}: {:.2f} x {:.2f} pts rotated by {}, scaled by {:.3f}",
                             page_index + 1,
                             ToPoints(page.m_Size.x),
                             ToPoints(page.m_Size.y),
                             RotationDegrees(page.m_Rotation),
                             placement.m_Scale);

                    sheet->PlacePage(*source, page_index, placement.m_Transform);
                }

                sheet->Finish();
            }

            const auto written_path{ WriteAtomically(*document, output_path) };
            LogInfo("Saved: {}", written_path.string());
            LogInfo("Sheets produced: {} (from {} pages)", ImposedSheetCount(page_count), page_count);
            return written_path;
        });
}

ConversionResult ImposeFile(const fs::path& source_path,
                            std::optional<fs::path> output_path,
                            std::string_view page_size,
                            PdfBackend& backend)
{
    const fs::path final_output_path{ output_path.value_or(DefaultImposedOutputPath(source_path)) };
    LogInfo("Converting {} to 2 pages per sheet on {}...", source_path.string(), page_size);
    return Impose(source_path,
                  final_output_path,
                  std::string{ page_size },
                  g_Cfg.m_Margin,
                  g_Cfg.m_ScaleUp,
                  backend);
}
