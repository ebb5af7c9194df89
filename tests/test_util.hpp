#pragma once

#include <string_view>

#include <pdfbind/util.hpp>

// Empty directory below the system temp directory, recreated on every call
inline fs::path MakeScratchDirectory(std::string_view name)
{
    const auto directory{ fs::temp_directory_path() / "pdfbind_tests" / name };
    fs::remove_all(directory);
    fs::create_directories(directory);
    return directory;
}
