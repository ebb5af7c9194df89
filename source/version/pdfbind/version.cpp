#include <pdfbind/version.hpp>

#define STRINGIFY(x) #x
#define TOSTRING(x) STRINGIFY(x)

std::string_view PdfBindVersion()
{
#ifdef PDFBIND_VERSION
    return TOSTRING(PDFBIND_VERSION);
#else
    return "<unknown version>";
#endif
}

std::string_view PdfBindBuildTime()
{
#ifdef PDFBIND_NOW
    return TOSTRING(PDFBIND_NOW);
#else
    return "<unknown build time>";
#endif
}
