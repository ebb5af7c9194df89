#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <pdfbind/units.hpp>
#include <pdfbind/util.hpp>

struct Config
{
    std::string m_DefaultPageSize{ "A4" };
    Length m_Margin{ 12_pts };
    bool m_ScaleUp{ false };
    bool m_PreserveBookmarks{ true };
    bool m_DeterministicPdfOutput{ false };
    bool m_LogToFile{ false };

    inline static const std::map<std::string, Size> g_DefaultPageSizes{
        { "Letter", { 8.5_in, 11_in } },
        { "Legal", { 8.5_in, 14_in } },
        { "Ledger", { 11_in, 17_in } },
        { "A5", { 148_mm, 210_mm } },
        { "A4", { 210_mm, 297_mm } },
        { "A3", { 297_mm, 420_mm } },
    };
    std::map<std::string, Size> m_PageSizes{ g_DefaultPageSizes };

    // Case-insensitive, "a4" and "A4" name the same size
    std::optional<Size> FindPageSize(std::string_view name) const;
};

std::optional<Size> ParseSize(std::string str);
std::optional<Length> ParseLength(std::string str);

// Reads the given ini file if it exists, the file is never created
Config LoadConfig(const fs::path& config_path = "config.ini");

extern Config g_Cfg;
