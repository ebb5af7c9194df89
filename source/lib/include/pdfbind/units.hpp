#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <utility>

#include <magic_enum/magic_enum.hpp>

#include <pdfbind/util.hpp>

enum class Unit
{
    Millimeter,
    Centimeter,
    Inches,
    Points,
};

constexpr Length UnitValue(Unit unit)
{
    switch (unit)
    {
    case Unit::Millimeter:
        return 1_mm;
    case Unit::Centimeter:
        return 1_cm;
    case Unit::Inches:
        return 1_in;
    case Unit::Points:
        return 1_pts;
    }

    std::unreachable();
}

// Canonical name, used when printing sizes
constexpr std::string_view UnitName(Unit unit)
{
    switch (unit)
    {
    case Unit::Millimeter:
        return "mm";
    case Unit::Centimeter:
        return "cm";
    case Unit::Inches:
        return "inches";
    case Unit::Points:
        return "points";
    }

    std::unreachable();
}

struct UnitAlias
{
    std::string_view m_Name;
    Unit m_Unit;
};
inline constexpr std::array c_UnitAliases{
    UnitAlias{ "in", Unit::Inches },
    UnitAlias{ "inch", Unit::Inches },
    UnitAlias{ "pt", Unit::Points },
    UnitAlias{ "pts", Unit::Points },
};

constexpr std::optional<Unit> UnitFromName(std::string_view unit_name)
{
    for (const auto& unit : magic_enum::enum_values<Unit>())
    {
        if (UnitName(unit) == unit_name)
        {
            return unit;
        }
    }

    for (const auto& alias : c_UnitAliases)
    {
        if (alias.m_Name == unit_name)
        {
            return alias.m_Unit;
        }
    }
    return std::nullopt;
}
