#pragma once

#include <cstdint>
#include <memory>

#include <pdfbind/util.hpp>

#include <pdfbind/pdf/util.hpp>

/*
        A parsed input document, pages are only ever read from it
*/
class PdfSourceDocument
{
  public:
    virtual ~PdfSourceDocument() = default;

    virtual uint32_t PageCount() const = 0;

    virtual PageGeometry GetPageGeometry(uint32_t page_index) const = 0;

    virtual bool HasOutlines() = 0;
};

/*
        A page of an output document that source pages are drawn onto
*/
class PdfPage
{
  public:
    virtual ~PdfPage() = default;

    // Draws the full source page with the given transform, in points
    virtual void PlacePage(PdfSourceDocument& source, uint32_t page_index, const AffineTransform& transform) = 0;

    virtual void Finish() = 0;
};

class PdfDocument
{
  public:
    virtual ~PdfDocument() = default;

    virtual PdfPage* NextPage(Size page_size) = 0;

    // Copies the pages unchanged, keeping their content, resources and annotations
    virtual void AppendPages(PdfSourceDocument& source, PageSelection selection) = 0;

    // Clones the outline tree of source onto this document, entries pointing at pages in selection
    // are redirected to the pages appended starting at first_page, all other entries lose their target
    // Returns the number of cloned entries
    virtual uint32_t CopyOutlines(PdfSourceDocument& source, PageSelection selection, uint32_t first_page) = 0;

    virtual uint32_t PageCount() const = 0;

    virtual fs::path Write(fs::path path) = 0;
};

class PdfBackend
{
  public:
    virtual ~PdfBackend() = default;

    virtual std::unique_ptr<PdfSourceDocument> Open(const fs::path& path) = 0;
    virtual std::unique_ptr<PdfDocument> Create() = 0;
};

PdfBackend& DefaultPdfBackend();
