#pragma once

#include <map>
#include <memory>
#include <vector>

#include <podofo/main/PdfMemDocument.h>
#include <podofo/main/PdfPage.h>
#include <podofo/main/PdfPainter.h>
#include <podofo/main/PdfXObjectForm.h>

#include <pdfbind/pdf/backend.hpp>

class PoDoFoDocument;

class PoDoFoSourceDocument final : public PdfSourceDocument
{
  public:
    PoDoFoSourceDocument(const fs::path& path);
    virtual ~PoDoFoSourceDocument() override = default;

    virtual uint32_t PageCount() const override;

    virtual PageGeometry GetPageGeometry(uint32_t page_index) const override;

    virtual bool HasOutlines() override;

    PoDoFo::PdfMemDocument& GetDocument() const;

  private:
    fs::path m_Path;
    std::unique_ptr<PoDoFo::PdfMemDocument> m_Document;
};

class PoDoFoPage final : public PdfPage
{
    friend class PoDoFoDocument;

  public:
    virtual ~PoDoFoPage() override = default;

    virtual void PlacePage(PdfSourceDocument& source, uint32_t page_index, const AffineTransform& transform) override;

    virtual void Finish() override;

  private:
    PoDoFoPage(PoDoFo::PdfPage* page, PoDoFoDocument* document);

    PoDoFo::PdfPage* m_Page{ nullptr };
    PoDoFoDocument* m_Document{ nullptr };

    std::unique_ptr<PoDoFo::PdfPainter> m_Painter;
};

class PoDoFoDocument final : public PdfDocument
{
  public:
    PoDoFoDocument();
    virtual ~PoDoFoDocument() override = default;

    virtual PoDoFoPage* NextPage(Size page_size) override;

    virtual void AppendPages(PdfSourceDocument& source, PageSelection selection) override;

    virtual uint32_t CopyOutlines(PdfSourceDocument& source, PageSelection selection, uint32_t first_page) override;

    virtual uint32_t PageCount() const override;

    virtual fs::path Write(fs::path path) override;

    // Imports all pages of source as form xobjects on first use, returns the form for page_index
    const PoDoFo::PdfXObjectForm& GetPageForm(PoDoFoSourceDocument& source, uint32_t page_index);

  private:
    void ImportPageForms(PoDoFoSourceDocument& source);

    std::unique_ptr<PoDoFo::PdfMemDocument> m_Document;
    std::vector<std::unique_ptr<PoDoFoPage>> m_Pages;

    std::map<const PoDoFoSourceDocument*, std::vector<std::unique_ptr<PoDoFo::PdfXObjectForm>>> m_PageForms;
};

class PoDoFoBackend final : public PdfBackend
{
  public:
    virtual ~PoDoFoBackend() override = default;

    virtual std::unique_ptr<PdfSourceDocument> Open(const fs::path& path) override;
    virtual std::unique_ptr<PdfDocument> Create() override;
};
