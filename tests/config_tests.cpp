#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <fstream>

#include <pdfbind/config.hpp>

#include "test_util.hpp"

using Catch::Matchers::WithinAbs;

TEST_CASE("Sizes are parsed with their unit", "[config_parse_size]")
{
    const auto a4{ ParseSize("210 x 297 mm") };
    REQUIRE(a4.has_value());
    REQUIRE_THAT(ToPoints(a4->x), WithinAbs(595.28, 0.01));
    REQUIRE_THAT(ToPoints(a4->y), WithinAbs(841.89, 0.01));

    const auto letter{ ParseSize("8,5 x 11 inches") };
    REQUIRE(letter.has_value());
    REQUIRE_THAT(ToPoints(letter->x), WithinAbs(612.0, 0.01));

    const auto points{ ParseSize("400 x 300 points") };
    REQUIRE(points.has_value());
    REQUIRE_THAT(ToPoints(points->x), WithinAbs(400.0, 0.01));

    REQUIRE(!ParseSize("210 x 297").has_value());
    REQUIRE(!ParseSize("210 by 297 mm").has_value());
    REQUIRE(!ParseSize("210 x 297 furlongs").has_value());
    REQUIRE(!ParseSize("0 x 297 mm").has_value());
    REQUIRE(!ParseSize("abc x 297 mm").has_value());
}

TEST_CASE("Lengths are parsed with their unit", "[config_parse_length]")
{
    const auto margin{ ParseLength("12 points") };
    REQUIRE(margin.has_value());
    REQUIRE_THAT(ToPoints(margin.value()), WithinAbs(12.0, 0.001));

    const auto cm{ ParseLength("1 cm") };
    REQUIRE(cm.has_value());
    REQUIRE_THAT(ToPoints(cm.value()), WithinAbs(28.3465, 0.001));

    const auto inch{ ParseLength("0,5 in") };
    REQUIRE(inch.has_value());
    REQUIRE_THAT(ToPoints(inch.value()), WithinAbs(36.0, 0.001));

    REQUIRE(!ParseLength("12").has_value());
    REQUIRE(!ParseLength("twelve points").has_value());
}

TEST_CASE("Page sizes are found case-insensitively", "[config_find_page_size]")
{
    const Config config{};
    REQUIRE(config.FindPageSize("A4").has_value());
    REQUIRE(config.FindPageSize("a4").has_value());
    REQUIRE(config.FindPageSize("LETTER").has_value());
    REQUIRE(!config.FindPageSize("Tabloid").has_value());
}

TEST_CASE("Missing config files keep the defaults", "[config_missing]")
{
    const auto dir{ MakeScratchDirectory("config_missing") };
    const auto config_path{ dir / "config.ini" };

    const auto config{ LoadConfig(config_path) };
    REQUIRE(config.m_DefaultPageSize == "A4");
    REQUIRE_THAT(ToPoints(config.m_Margin), WithinAbs(12.0, 0.001));
    REQUIRE(!config.m_ScaleUp);
    REQUIRE(config.m_PreserveBookmarks);
    REQUIRE(!config.m_DeterministicPdfOutput);
    REQUIRE(!fs::exists(config_path));
}

TEST_CASE("Config files override defaults and add page sizes", "[config_load]")
{
    const auto dir{ MakeScratchDirectory("config_load") };
    const auto config_path{ dir / "config.ini" };
    {
        std::ofstream config_file{ config_path };
        config_file << "[DEFAULT]\n"
                    << "Page.Size=Booklet\n"
                    << "Margin=5 mm\n"
                    << "Scale.Up=true\n"
                    << "Preserve.Bookmarks=false\n"
                    << "Deterministic.Output=true\n"
                    << "\n"
                    << "[PAGE_SIZES]\n"
                    << "Booklet=120 x 180 mm\n"
                    << "Broken=not a size\n";
    }

    const auto config{ LoadConfig(config_path) };
    REQUIRE(config.m_DefaultPageSize == "Booklet");
    REQUIRE_THAT(ToPoints(config.m_Margin), WithinAbs(14.17, 0.01));
    REQUIRE(config.m_ScaleUp);
    REQUIRE(!config.m_PreserveBookmarks);
    REQUIRE(config.m_DeterministicPdfOutput);

    const auto booklet{ config.FindPageSize("booklet") };
    REQUIRE(booklet.has_value());
    REQUIRE_THAT(ToPoints(booklet->x), WithinAbs(340.16, 0.01));
    REQUIRE(!config.FindPageSize("Broken").has_value());
    REQUIRE(config.FindPageSize("A4").has_value());
}

TEST_CASE("Unknown default page sizes fall back to A4", "[config_unknown_default]")
{
    const auto dir{ MakeScratchDirectory("config_unknown_default") };
    const auto config_path{ dir / "config.ini" };
    {
        std::ofstream config_file{ config_path };
        config_file << "[DEFAULT]\n"
                    << "Page.Size=Postcard\n"
                    << "Margin=huge\n";
    }

    const auto config{ LoadConfig(config_path) };
    REQUIRE(config.m_DefaultPageSize == "A4");
    REQUIRE_THAT(ToPoints(config.m_Margin), WithinAbs(12.0, 0.001));
}
