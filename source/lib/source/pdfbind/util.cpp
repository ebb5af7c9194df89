#include <pdfbind/util.hpp>

#include <cctype>

std::vector<fs::path> ListFiles(const fs::path& path)
{
    std::vector<fs::path> files;
    ForEachFile(path,
                [&files](const fs::path& path)
                {
                    files.push_back(path.filename());
                });
    return files;
}

std::string ToLower(std::string_view str)
{
    std::string lower{ str };
    std::ranges::transform(lower,
                           lower.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
    return lower;
}

bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs)
{
    return lhs.size() == rhs.size() && ToLower(lhs) == ToLower(rhs);
}
