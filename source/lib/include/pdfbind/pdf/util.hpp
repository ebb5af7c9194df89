#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <dla/vector.h>

#include <pdfbind/error.hpp>
#include <pdfbind/util.hpp>

/*
        A 2D affine transform as written by the PDF cm operator, [a b c d e f] in points
        Points are row vectors, so x' = a*x + c*y + e and y' = b*x + d*y + f
        Rotate, Scale and Translate return a transform that first applies *this and then the new operation
*/
struct AffineTransform
{
    double m_A{ 1.0 };
    double m_B{ 0.0 };
    double m_C{ 0.0 };
    double m_D{ 1.0 };
    double m_E{ 0.0 };
    double m_F{ 0.0 };

    // Counter-clockwise, in degrees
    AffineTransform Rotate(double degrees) const;
    AffineTransform Scale(double sx, double sy) const;
    AffineTransform Translate(double tx, double ty) const;
    AffineTransform Then(const AffineTransform& next) const;

    dla::tvec2<double> Apply(dla::tvec2<double> point) const;

    bool IsIdentity() const;
};

enum class PageRotation
{
    None,
    Degree90,
    Degree180,
    Degree270,
};

// Clockwise degrees as stored in /Rotate
int32_t RotationDegrees(PageRotation rotation);

// Anything that is not a multiple of 90 after taking it modulo 360 is treated as no rotation
PageRotation NormalizeRotation(std::optional<int64_t> raw_rotation);

struct PageGeometry
{
    Position m_Origin;
    Size m_Size;
    PageRotation m_Rotation{ PageRotation::None };
};

// Size of the page as it appears on screen, i.e. with /Rotate applied
Size ViewedSize(const PageGeometry& page);

using SheetSize = std::variant<std::string, Size>;

struct SheetLayout
{
    Size m_SheetSize;
    Size m_AvailableSize;
    Length m_Margin;
};

enum class SheetSide
{
    Left,
    Right,
};

struct PagePlacement
{
    Size m_ViewedSize;
    float m_Scale;
    Position m_Offset;
    AffineTransform m_Transform;
};

std::expected<Size, ConversionError> ResolveSheetSize(const SheetSize& sheet_size);

// Forces landscape and computes the area available to each half of the sheet
std::expected<SheetLayout, ConversionError> ComputeSheetLayout(Size sheet_size, Length margin);

PagePlacement ComputePagePlacement(const SheetLayout& layout,
                                   const PageGeometry& page,
                                   SheetSide side,
                                   bool scale_up);

constexpr uint32_t ImposedSheetCount(uint32_t page_count)
{
    return (page_count + 1) / 2;
}

// Zero-based and half-open
struct PageRange
{
    int64_t m_Start;
    int64_t m_End;
};

struct PageSelection
{
    uint32_t m_First;
    uint32_t m_Count;
};

PageSelection ClampPageRange(std::optional<PageRange> page_range, uint32_t page_count);

// Parses "<start>:<end>", either side may be omitted
std::optional<PageRange> ParsePageRange(std::string_view str);

// Filters a directory listing down to *.pdf files and orders them by file name
std::vector<fs::path> SortPdfFiles(const fs::path& directory, std::vector<fs::path> file_names);
std::vector<fs::path> CollectPdfFiles(const fs::path& directory);

fs::path DefaultImposedOutputPath(const fs::path& input_path);
fs::path DefaultMergedOutputPath(const fs::path& first_input_path);
fs::path TemporaryOutputPath(const fs::path& output_path);
