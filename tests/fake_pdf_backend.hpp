#pragma once

#include <deque>
#include <fstream>
#include <ios>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <pdfbind/error.hpp>
#include <pdfbind/util.hpp>

#include <pdfbind/pdf/backend.hpp>

// In-memory stand-in for a PDF library, records what the engines ask of it
struct FakeSourceSpec
{
    std::vector<PageGeometry> m_Pages;
    bool m_HasOutlines{ false };
    bool m_FailOutlines{ false };
};

inline FakeSourceSpec UniformSource(uint32_t page_count, Size page_size, PageRotation rotation = PageRotation::None)
{
    FakeSourceSpec spec{};
    for (uint32_t i = 0; i < page_count; i++)
    {
        spec.m_Pages.push_back(PageGeometry{ .m_Origin{}, .m_Size{ page_size }, .m_Rotation{ rotation } });
    }
    return spec;
}

struct FakePlacedPage
{
    std::string m_Source;
    uint32_t m_PageIndex;
    AffineTransform m_Transform;
};

struct FakeOutputPage
{
    std::optional<Size> m_SheetSize;
    std::vector<FakePlacedPage> m_Placed;
    bool m_Finished{ false };

    std::string m_AppendedFrom;
    uint32_t m_AppendedIndex{ 0 };
};

struct FakeOutlineCopy
{
    std::string m_Source;
    PageSelection m_Selection;
    uint32_t m_FirstPage;
};

struct FakeWrittenDocument
{
    fs::path m_Path;
    std::deque<FakeOutputPage> m_Pages;
    std::vector<FakeOutlineCopy> m_Outlines;
};

class FakeSourceDocument final : public PdfSourceDocument
{
  public:
    FakeSourceDocument(std::string name, FakeSourceSpec spec)
        : m_Name{ std::move(name) }
        , m_Spec{ std::move(spec) }
    {
    }

    virtual uint32_t PageCount() const override
    {
        return static_cast<uint32_t>(m_Spec.m_Pages.size());
    }

    virtual PageGeometry GetPageGeometry(uint32_t page_index) const override
    {
        return m_Spec.m_Pages.at(page_index);
    }

    virtual bool HasOutlines() override
    {
        return m_Spec.m_HasOutlines;
    }

    std::string m_Name;
    FakeSourceSpec m_Spec;
};

class FakePage final : public PdfPage
{
  public:
    FakePage(FakeOutputPage& page)
        : m_Page{ page }
    {
    }

    virtual void PlacePage(PdfSourceDocument& source, uint32_t page_index, const AffineTransform& transform) override
    {
        auto& fake_source{ dynamic_cast<FakeSourceDocument&>(source) };
        m_Page.m_Placed.push_back(FakePlacedPage{ fake_source.m_Name, page_index, transform });
    }

    virtual void Finish() override
    {
        m_Page.m_Finished = true;
    }

  private:
    FakeOutputPage& m_Page;
};

class FakePdfBackend;

class FakeDocument final : public PdfDocument
{
  public:
    FakeDocument(FakePdfBackend& backend)
        : m_Backend{ backend }
    {
    }

    virtual PdfPage* NextPage(Size page_size) override
    {
        auto& page{ m_Written.m_Pages.emplace_back() };
        page.m_SheetSize = page_size;
        return m_PageWrappers.emplace_back(new FakePage{ page }).get();
    }

    virtual void AppendPages(PdfSourceDocument& source, PageSelection selection) override
    {
        auto& fake_source{ dynamic_cast<FakeSourceDocument&>(source) };
        for (uint32_t i = 0; i < selection.m_Count; i++)
        {
            auto& page{ m_Written.m_Pages.emplace_back() };
            page.m_AppendedFrom = fake_source.m_Name;
            page.m_AppendedIndex = selection.m_First + i;
        }
    }

    virtual uint32_t CopyOutlines(PdfSourceDocument& source, PageSelection selection, uint32_t first_page) override
    {
        auto& fake_source{ dynamic_cast<FakeSourceDocument&>(source) };
        if (fake_source.m_Spec.m_FailOutlines)
        {
            throw std::runtime_error{ "broken outline" };
        }

        m_Written.m_Outlines.push_back(FakeOutlineCopy{ fake_source.m_Name, selection, first_page });
        return 1;
    }

    virtual uint32_t PageCount() const override
    {
        return static_cast<uint32_t>(m_Written.m_Pages.size());
    }

    virtual fs::path Write(fs::path path) override;

  private:
    FakePdfBackend& m_Backend;
    FakeWrittenDocument m_Written;
    std::vector<std::unique_ptr<FakePage>> m_PageWrappers;
};

class FakePdfBackend final : public PdfBackend
{
  public:
    void AddSource(const fs::path& path, FakeSourceSpec spec)
    {
        {
            std::ofstream file{ path };
            file << "%PDF-fake";
        }
        m_Sources[path] = std::move(spec);
    }

    virtual std::unique_ptr<PdfSourceDocument> Open(const fs::path& path) override
    {
        const auto it{ m_Sources.find(path) };
        if (it == m_Sources.end())
        {
            throw ConversionException{ ConversionErrorKind::LibraryFailure, "not a PDF file" };
        }
        return std::make_unique<FakeSourceDocument>(path.filename().string(), it->second);
    }

    virtual std::unique_ptr<PdfDocument> Create() override
    {
        return std::make_unique<FakeDocument>(*this);
    }

    std::map<fs::path, FakeSourceSpec> m_Sources;
    bool m_FailWrite{ false };

    std::optional<FakeWrittenDocument> m_Written;
};

inline fs::path FakeDocument::Write(fs::path path)
{
    {
        std::ofstream file{ path };
        file << "%PDF-fake " << m_Written.m_Pages.size();
    }

    if (m_Backend.m_FailWrite)
    {
        throw std::ios_base::failure{ "disk full" };
    }

    m_Written.m_Path = path;
    m_Backend.m_Written = m_Written;
    return path;
}
