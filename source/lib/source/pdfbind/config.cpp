#include <pdfbind/config.hpp>

#include <algorithm>
#include <ranges>
#include <string>
#include <vector>

#include <QFile>
#include <QSettings>

#include <pdfbind/qt_util.hpp>
#include <pdfbind/util/log.hpp>

Config g_Cfg{};

namespace
{
constexpr auto c_ToStringViews{ std::views::transform(
    [](auto str)
    { return std::string_view(str.data(), str.size()); }) };

std::optional<float> ToFloat(std::string_view str)
{
    try
    {
        size_t parsed{ 0 };
        const float val{ std::stof(std::string{ str }, &parsed) };
        if (parsed != str.size())
        {
            return std::nullopt;
        }
        return val;
    }
    catch (const std::exception&)
    {
        return std::nullopt;
    }
}

std::vector<std::string_view> SplitWords(std::string_view str)
{
    return str |
           std::views::split(' ') |
           c_ToStringViews |
           std::views::filter([](std::string_view part)
                              { return !part.empty(); }) |
           std::ranges::to<std::vector>();
}
} // namespace

std::optional<Size> Config::FindPageSize(std::string_view name) const
{
    const auto it{
        std::ranges::find_if(m_PageSizes,
                             [name](const auto& entry)
                             { return EqualsIgnoreCase(entry.first, name); }),
    };
    if (it == m_PageSizes.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Size> ParseSize(std::string str)
{
    std::ranges::replace(str, ',', '.');

    const auto parts{ SplitWords(str) };
    if (parts.size() != 4 || parts[1] != "x")
    {
        return std::nullopt;
    }

    const auto base_unit{ UnitFromName(parts.back()) };
    const auto width{ ToFloat(parts[0]) };
    const auto height{ ToFloat(parts[2]) };
    if (!base_unit.has_value() || !width.has_value() || !height.has_value())
    {
        return std::nullopt;
    }

    if (width.value() <= 0.0f || height.value() <= 0.0f)
    {
        return std::nullopt;
    }

    const auto unit_value{ UnitValue(base_unit.value()) };
    return Size{ width.value() * unit_value, height.value() * unit_value };
}

std::optional<Length> ParseLength(std::string str)
{
    std::ranges::replace(str, ',', '.');

    const auto parts{ SplitWords(str) };
    if (parts.size() != 2)
    {
        return std::nullopt;
    }

    const auto base_unit{ UnitFromName(parts.back()) };
    const auto length{ ToFloat(parts[0]) };
    if (!base_unit.has_value() || !length.has_value())
    {
        return std::nullopt;
    }

    return length.value() * UnitValue(base_unit.value());
}

Config LoadConfig(const fs::path& config_path)
{
    Config config{};
    if (!QFile::exists(ToQString(config_path)))
    {
        return config;
    }

    LogInfo("Reading configuration from {}...", config_path.string());

    QSettings settings(ToQString(config_path), QSettings::IniFormat);
    if (settings.status() != QSettings::Status::NoError)
    {
        LogWarning("Failed reading {}, continuing with default configuration...", config_path.string());
        return config;
    }

    {
        settings.beginGroup("DEFAULT");

        config.m_DefaultPageSize = settings.value("Page.Size", "A4").toString().toStdString();
        config.m_ScaleUp = settings.value("Scale.Up", false).toBool();
        config.m_PreserveBookmarks = settings.value("Preserve.Bookmarks", true).toBool();
        config.m_DeterministicPdfOutput = settings.value("Deterministic.Output", false).toBool();
        config.m_LogToFile = settings.value("Log.File", false).toBool();

        {
            auto margin{ settings.value("Margin") };
            if (margin.isValid())
            {
                const auto margin_str{ margin.toString().toStdString() };
                if (auto parsed_margin{ ParseLength(margin_str) })
                {
                    config.m_Margin = parsed_margin.value();
                }
                else
                {
                    LogWarning("Ignoring malformed margin \"{}\", expected e.g. \"12 points\"", margin_str);
                }
            }
        }

        settings.endGroup();
    }

    {
        settings.beginGroup("PAGE_SIZES");

        for (const auto& key : settings.allKeys())
        {
            const auto size_str{ settings.value(key).toString().toStdString() };
            if (auto size{ ParseSize(size_str) })
            {
                config.m_PageSizes[key.toStdString()] = size.value();
            }
            else
            {
                LogWarning("Ignoring malformed page size {} = \"{}\", expected e.g. \"210 x 297 mm\"",
                           key.toStdString(),
                           size_str);
            }
        }

        settings.endGroup();
    }

    if (!config.FindPageSize(config.m_DefaultPageSize).has_value())
    {
        LogWarning("Default page size {} is unknown, falling back to A4", config.m_DefaultPageSize);
        config.m_DefaultPageSize = "A4";
    }

    return config;
}
