#pragma once

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <dla/literals.h>
#include <dla/vector.h>

namespace fs = std::filesystem;

using Length = dla::length_unit;

using Size = dla::tvec2<Length>;
using Position = dla::tvec2<Length>;

// clang-format off
using namespace dla::literals;
using namespace dla::int_literals;

constexpr auto operator""_mm(long double v) { return Length{ float(v * 0.001L) }; }
constexpr auto operator""_mm(unsigned long long v) { return Length{ float(v * 0.001L) }; }

constexpr auto operator""_cm(long double v) { return Length{ float(v * 0.01L) }; }
constexpr auto operator""_cm(unsigned long long v) { return Length{ float(v * 0.01L) }; }

constexpr auto operator""_in(long double v) { return Length{ float(v * 0.0254L) }; }
constexpr auto operator""_in(unsigned long long v) { return Length{ float(v * 0.0254L) }; }

constexpr auto operator""_pts(long double v) { return Length{ float(v * 0.0254L / 72.0L) }; }
constexpr auto operator""_pts(unsigned long long v) { return Length{ float(v * 0.0254L / 72.0L) }; }

// clang-format on

inline double ToPoints(Length l)
{
    return static_cast<double>(l / 1_pts);
}
inline Length FromPoints(double points)
{
    return static_cast<float>(points) * 1_pts;
}

template<class FunT>
void ForEachFile(const fs::path& path, FunT&& fun)
{
    if (!std::filesystem::is_directory(path))
    {
        return;
    }

    for (auto& child : std::filesystem::directory_iterator(path))
    {
        if (!child.is_directory())
        {
            fun(child.path());
        }
    }
}

std::vector<fs::path> ListFiles(const fs::path& path);

std::string ToLower(std::string_view str);
bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs);
