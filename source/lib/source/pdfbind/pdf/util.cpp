#include <pdfbind/pdf/util.hpp>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <limits>
#include <numbers>
#include <ranges>
#include <utility>

#include <fmt/format.h>

#include <pdfbind/config.hpp>

namespace
{
// Exact values for right angles, cos(90) would otherwise leave a tiny residue in the matrix
std::pair<double, double> CosSin(double degrees)
{
    const double normalized{ std::fmod(std::fmod(degrees, 360.0) + 360.0, 360.0) };
    if (normalized == 0.0)
    {
        return { 1.0, 0.0 };
    }
    else if (normalized == 90.0)
    {
        return { 0.0, 1.0 };
    }
    else if (normalized == 180.0)
    {
        return { -1.0, 0.0 };
    }
    else if (normalized == 270.0)
    {
        return { 0.0, -1.0 };
    }

    const double radians{ normalized * std::numbers::pi / 180.0 };
    return { std::cos(radians), std::sin(radians) };
}

std::optional<int64_t> ParseIndex(std::string_view str)
{
    int64_t value{};
    const auto* end{ str.data() + str.size() };
    const auto [ptr, ec]{ std::from_chars(str.data(), end, value) };
    if (ec != std::errc{} || ptr != end)
    {
        return std::nullopt;
    }
    return value;
}
} // namespace

AffineTransform AffineTransform::Rotate(double degrees) const
{
    const auto [cos, sin]{ CosSin(degrees) };
    return Then(AffineTransform{ cos, sin, -sin, cos, 0.0, 0.0 });
}

AffineTransform AffineTransform::Scale(double sx, double sy) const
{
    return Then(AffineTransform{ sx, 0.0, 0.0, sy, 0.0, 0.0 });
}

AffineTransform AffineTransform::Translate(double tx, double ty) const
{
    return Then(AffineTransform{ 1.0, 0.0, 0.0, 1.0, tx, ty });
}

AffineTransform AffineTransform::Then(const AffineTransform& next) const
{
    return AffineTransform{
        m_A * next.m_A + m_B * next.m_C,
        m_A * next.m_B + m_B * next.m_D,
        m_C * next.m_A + m_D * next.m_C,
        m_C * next.m_B + m_D * next.m_D,
        m_E * next.m_A + m_F * next.m_C + next.m_E,
        m_E * next.m_B + m_F * next.m_D + next.m_F,
    };
}

dla::tvec2<double> AffineTransform::Apply(dla::tvec2<double> point) const
{
    return {
        m_A * point.x + m_C * point.y + m_E,
        m_B * point.x + m_D * point.y + m_F,
    };
}

bool AffineTransform::IsIdentity() const
{
    return m_A == 1.0 && m_B == 0.0 && m_C == 0.0 && m_D == 1.0 && m_E == 0.0 && m_F == 0.0;
}

int32_t RotationDegrees(PageRotation rotation)
{
    switch (rotation)
    {
    case PageRotation::None:
        return 0;
    case PageRotation::Degree90:
        return 90;
    case PageRotation::Degree180:
        return 180;
    case PageRotation::Degree270:
        return 270;
    }
    std::unreachable();
}

PageRotation NormalizeRotation(std::optional<int64_t> raw_rotation)
{
    if (!raw_rotation.has_value())
    {
        return PageRotation::None;
    }

    const int64_t rotation{ ((raw_rotation.value() % 360) + 360) % 360 };
    switch (rotation)
    {
    case 90:
        return PageRotation::Degree90;
    case 180:
        return PageRotation::Degree180;
    case 270:
        return PageRotation::Degree270;
    default:
        return PageRotation::None;
    }
}

Size ViewedSize(const PageGeometry& page)
{
    switch (page.m_Rotation)
    {
    case PageRotation::Degree90:
    case PageRotation::Degree270:
        return Size{ page.m_Size.y, page.m_Size.x };
    default:
        return page.m_Size;
    }
}

std::expected<Size, ConversionError> ResolveSheetSize(const SheetSize& sheet_size)
{
    if (const auto* size{ std::get_if<Size>(&sheet_size) })
    {
        return *size;
    }

    const auto& name{ std::get<std::string>(sheet_size) };
    if (const auto size{ g_Cfg.FindPageSize(name) })
    {
        return size.value();
    }
    return MakeConversionError(ConversionErrorKind::InvalidArgument,
                               fmt::format("Unknown page size \"{}\"", name));
}

std::expected<SheetLayout, ConversionError> ComputeSheetLayout(Size sheet_size, Length margin)
{
    if (sheet_size.x <= 0_pts || sheet_size.y <= 0_pts)
    {
        return MakeConversionError(ConversionErrorKind::InvalidArgument,
                                   fmt::format("Sheet size must be positive, got {:.2f} x {:.2f} pts",
                                               ToPoints(sheet_size.x),
                                               ToPoints(sheet_size.y)));
    }
    if (margin < 0_pts)
    {
        return MakeConversionError(ConversionErrorKind::InvalidArgument,
                                   fmt::format("Margin must not be negative, got {:.2f} pts", ToPoints(margin)));
    }

    const Size landscape{
        dla::math::max(sheet_size.x, sheet_size.y),
        dla::math::min(sheet_size.x, sheet_size.y),
    };
    const Size available{
        landscape.x / 2.0f - margin * 2.0f,
        landscape.y - margin * 2.0f,
    };
    if (available.x <= 0_pts || available.y <= 0_pts)
    {
        return MakeConversionError(ConversionErrorKind::InvalidArgument,
                                   fmt::format("Margin of {:.2f} pts leaves no room on a {:.2f} x {:.2f} pts sheet",
                                               ToPoints(margin),
                                               ToPoints(landscape.x),
                                               ToPoints(landscape.y)));
    }

    return SheetLayout{
        .m_SheetSize{ landscape },
        .m_AvailableSize{ available },
        .m_Margin{ margin },
    };
}

PagePlacement ComputePagePlacement(const SheetLayout& layout,
                                   const PageGeometry& page,
                                   SheetSide side,
                                   bool scale_up)
{
    if (page.m_Size.x <= 0_pts || page.m_Size.y <= 0_pts)
    {
        throw ConversionException{
            ConversionErrorKind::LibraryFailure,
            fmt::format("Page has an empty media box of {:.2f} x {:.2f} pts",
                        ToPoints(page.m_Size.x),
                        ToPoints(page.m_Size.y)),
        };
    }

    const Size viewed_size{ ViewedSize(page) };

    const float fit_scale{ dla::math::min(layout.m_AvailableSize.x / viewed_size.x,
                                          layout.m_AvailableSize.y / viewed_size.y) };
    const float scale{ scale_up ? fit_scale : dla::math::min(fit_scale, 1.0f) };

    const Length center_x{ side == SheetSide::Left ? layout.m_SheetSize.x * 0.25f
                                                   : layout.m_SheetSize.x * 0.75f };
    const Length center_y{ layout.m_SheetSize.y / 2.0f };
    const Position offset{
        center_x - viewed_size.x * scale / 2.0f,
        center_y - viewed_size.y * scale / 2.0f,
    };

    const double width{ ToPoints(page.m_Size.x) };
    const double height{ ToPoints(page.m_Size.y) };

    // Moves the media box to the origin, undoes /Rotate and moves the rotated page back into the first quadrant
    AffineTransform transform{
        AffineTransform{}
            .Translate(-ToPoints(page.m_Origin.x), -ToPoints(page.m_Origin.y))
            .Rotate(-RotationDegrees(page.m_Rotation)),
    };
    switch (page.m_Rotation)
    {
    case PageRotation::None:
        break;
    case PageRotation::Degree90:
        transform = transform.Translate(0.0, width);
        break;
    case PageRotation::Degree180:
        transform = transform.Translate(width, height);
        break;
    case PageRotation::Degree270:
        transform = transform.Translate(height, 0.0);
        break;
    }
    transform = transform
                    .Scale(scale, scale)
                    .Translate(ToPoints(offset.x), ToPoints(offset.y));

    return PagePlacement{
        .m_ViewedSize{ viewed_size },
        .m_Scale{ scale },
        .m_Offset{ offset },
        .m_Transform{ transform },
    };
}

PageSelection ClampPageRange(std::optional<PageRange> page_range, uint32_t page_count)
{
    if (!page_range.has_value())
    {
        return PageSelection{ 0, page_count };
    }

    const int64_t count{ page_count };
    const int64_t start{ std::max<int64_t>(0, std::min(page_range->m_Start, count - 1)) };
    const int64_t end{ std::max(start, std::min(page_range->m_End, count)) };
    return PageSelection{
        static_cast<uint32_t>(start),
        static_cast<uint32_t>(end - start),
    };
}

std::optional<PageRange> ParsePageRange(std::string_view str)
{
    const auto colon{ str.find(':') };
    if (colon == std::string_view::npos)
    {
        return std::nullopt;
    }

    const std::string_view start_str{ str.substr(0, colon) };
    const std::string_view end_str{ str.substr(colon + 1) };

    PageRange range{ 0, std::numeric_limits<int64_t>::max() };
    if (!start_str.empty())
    {
        const auto start{ ParseIndex(start_str) };
        if (!start.has_value())
        {
            return std::nullopt;
        }
        range.m_Start = start.value();
    }
    if (!end_str.empty())
    {
        const auto end{ ParseIndex(end_str) };
        if (!end.has_value())
        {
            return std::nullopt;
        }
        range.m_End = end.value();
    }
    return range;
}

std::vector<fs::path> SortPdfFiles(const fs::path& directory, std::vector<fs::path> file_names)
{
    std::erase_if(file_names,
                  [](const fs::path& file_name)
                  { return !ToLower(file_name.filename().string()).ends_with(".pdf"); });
    std::ranges::sort(file_names,
                      [](const fs::path& lhs, const fs::path& rhs)
                      { return lhs.filename().string() < rhs.filename().string(); });

    return file_names |
           std::views::transform([&](const fs::path& file_name)
                                 { return directory / file_name.filename(); }) |
           std::ranges::to<std::vector>();
}

std::vector<fs::path> CollectPdfFiles(const fs::path& directory)
{
    return SortPdfFiles(directory, ListFiles(directory));
}

fs::path DefaultImposedOutputPath(const fs::path& input_path)
{
    return input_path.parent_path() / fmt::format("{}_2pp.pdf", input_path.stem().string());
}

fs::path DefaultMergedOutputPath(const fs::path& first_input_path)
{
    return first_input_path.parent_path() / fmt::format("{}_merged.pdf", first_input_path.stem().string());
}

fs::path TemporaryOutputPath(const fs::path& output_path)
{
    return output_path.parent_path() / fmt::format(".{}.part", output_path.filename().string());
}
