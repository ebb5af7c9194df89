#include <pdfbind/pdf/backend.hpp>

#include <pdfbind/pdf/podofo_backend.hpp>

PdfBackend& DefaultPdfBackend()
{
    static PoDoFoBackend backend{};
    return backend;
}
