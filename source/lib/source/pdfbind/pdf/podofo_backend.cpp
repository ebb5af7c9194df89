#include <pdfbind/pdf/podofo_backend.hpp>

#include <cmath>
#include <set>
#include <utility>

#include <fmt/format.h>

#include <podofo/podofo.h>

#include <pdfbind/config.hpp>
#include <pdfbind/error.hpp>

#include <pdfbind/util/at_scope_exit.hpp>

#include <pdfbind/util/log.hpp>

namespace
{
ConversionErrorKind ErrorKind(const PoDoFo::PdfError& error)
{
    switch (error.GetCode())
    {
    case PoDoFo::PdfErrorCode::FileNotFound:
        return ConversionErrorKind::NotFound;
    case PoDoFo::PdfErrorCode::IOError:
        return ConversionErrorKind::IoFailure;
    default:
        return ConversionErrorKind::LibraryFailure;
    }
}

// Rethrow as a std::exception so the agnostic code can catch it
template<class FunT>
auto TranslatePdfErrors(std::string_view action, FunT&& fun)
{
    try
    {
        return fun();
    }
    catch (const PoDoFo::PdfError& e)
    {
        throw ConversionException{ ErrorKind(e), fmt::format("{}: {}", action, e.what()) };
    }
}

PoDoFoSourceDocument& AsPoDoFo(PdfSourceDocument& source)
{
    return dynamic_cast<PoDoFoSourceDocument&>(source);
}

std::optional<int64_t> ReadRawRotation(const PoDoFo::PdfPage& page)
{
    const auto* rotate{ page.GetDictionary().FindKeyParent("Rotate") };
    if (rotate == nullptr || !rotate->IsNumberOrReal())
    {
        return std::nullopt;
    }

    const double rotation{ rotate->GetReal() };
    if (!std::isfinite(rotation) || rotation != std::trunc(rotation))
    {
        return std::nullopt;
    }
    return static_cast<int64_t>(rotation);
}

auto Save(PoDoFo::PdfPainter& painter)
{
    painter.Save();
    return AtScopeExit{
        [&painter]()
        {
            painter.Restore();
        }
    };
}

PoDoFo::Matrix ToPoDoFoMatrix(const AffineTransform& transform)
{
    return PoDoFo::Matrix::FromCoefficients(
        transform.m_A,  // scale-x
        transform.m_B,  // rot-1
        transform.m_C,  // rot-2
        transform.m_D,  // scale-y
        transform.m_E,  // trans-x
        transform.m_F); // trans-y
}

using ObjectKey = std::pair<uint32_t, uint16_t>;
using PageMap = std::map<ObjectKey, PoDoFo::PdfPage*>;

ObjectKey GetObjectKey(const PoDoFo::PdfObject& object)
{
    const auto& reference{ object.GetIndirectReference() };
    return { reference.ObjectNumber(), reference.GenerationNumber() };
}

// Looks up a named destination, first in the catalog's /Dests dictionary and then in the /Dests name tree
const PoDoFo::PdfObject* FindNamedDestination(PoDoFo::PdfMemDocument& document, const PoDoFo::PdfObject& name)
{
    const std::string key{
        name.IsName()
            ? std::string{ name.GetName().GetString() }
            : std::string{ name.GetString().GetString() },
    };

    const PoDoFo::PdfObject* destination{ nullptr };
    if (const auto* dests{ document.GetCatalog().GetDictionary().FindKey("Dests") }; dests != nullptr && dests->IsDictionary())
    {
        destination = dests->GetDictionary().FindKey(key);
    }

    if (destination == nullptr)
    {
        if (auto* name_trees{ document.GetNames() })
        {
            destination = name_trees->GetValue("Dests", PoDoFo::PdfString{ key });
        }
    }

    // Named destinations may also be a dictionary holding the array under /D
    if (destination != nullptr && destination->IsDictionary())
    {
        destination = destination->GetDictionary().FindKey("D");
    }
    return destination;
}

// Finds the explicit destination of an outline item, either directly or through a GoTo action, resolving names
const PoDoFo::PdfArray* FindDestinationArray(PoDoFo::PdfMemDocument& document, const PoDoFo::PdfDictionary& item)
{
    const PoDoFo::PdfObject* destination{ item.FindKey("Dest") };
    if (destination == nullptr)
    {
        const auto* action{ item.FindKey("A") };
        if (action != nullptr && action->IsDictionary())
        {
            const auto* action_type{ action->GetDictionary().FindKey("S") };
            if (action_type != nullptr && action_type->IsName() && action_type->GetName() == "GoTo")
            {
                destination = action->GetDictionary().FindKey("D");
            }
        }
    }

    if (destination != nullptr && (destination->IsName() || destination->IsString()))
    {
        destination = FindNamedDestination(document, *destination);
    }

    if (destination == nullptr || !destination->IsArray() || destination->GetArray().GetSize() == 0)
    {
        return nullptr;
    }
    return &destination->GetArray();
}

class OutlineCloner
{
  public:
    OutlineCloner(PoDoFo::PdfMemDocument& source_document, PoDoFo::PdfMemDocument& document, PageMap page_map)
        : m_SourceDocument{ source_document }
        , m_Document{ document }
        , m_PageMap{ std::move(page_map) }
    {
    }

    void CloneSiblings(const PoDoFo::PdfObject* source_item, PoDoFo::PdfObject& target_parent, uint32_t depth)
    {
        static constexpr uint32_t c_MaxDepth{ 64 };
        if (depth > c_MaxDepth)
        {
            LogWarning("Outline is nested deeper than {} levels, dropping the remaining entries", c_MaxDepth);
            return;
        }

        for (; source_item != nullptr && source_item->IsDictionary();
             source_item = source_item->GetDictionary().FindKey("Next"))
        {
            const auto key{ GetObjectKey(*source_item) };
            if (key.first != 0 && !m_Visited.insert(key).second)
            {
                LogWarning("Outline contains a cycle, dropping the remaining entries");
                return;
            }

            const auto& source_dict{ source_item->GetDictionary() };
            auto& target_item{ m_Document.GetObjects().CreateDictionaryObject() };
            auto& target_dict{ target_item.GetDictionary() };

            if (const auto* title{ source_dict.FindKey("Title") }; title != nullptr && title->IsString())
            {
                target_dict.AddKey("Title", *title);
            }
            else
            {
                target_dict.AddKey("Title", PoDoFo::PdfString{ "" });
            }

            if (auto destination{ TranslateDestination(source_dict) })
            {
                target_dict.AddKey("Dest", destination.value());
            }

            AppendChild(target_parent, target_item);
            m_NumCloned++;

            if (const auto* first_child{ source_dict.FindKey("First") })
            {
                CloneSiblings(first_child, target_item, depth + 1);
            }
        }
    }

    uint32_t NumCloned() const
    {
        return m_NumCloned;
    }

  private:
    std::optional<PoDoFo::PdfArray> TranslateDestination(const PoDoFo::PdfDictionary& source_item) const
    {
        const auto* source_destination{ FindDestinationArray(m_SourceDocument, source_item) };
        if (source_destination == nullptr)
        {
            return std::nullopt;
        }

        const auto* source_page{ source_destination->FindAt(0) };
        if (source_page == nullptr)
        {
            return std::nullopt;
        }

        const auto it{ m_PageMap.find(GetObjectKey(*source_page)) };
        if (it == m_PageMap.end())
        {
            return std::nullopt;
        }

        PoDoFo::PdfArray destination;
        destination.Add(it->second->GetObject().GetIndirectReference());
        for (unsigned i = 1; i < source_destination->GetSize(); i++)
        {
            if (const auto* element{ source_destination->FindAt(i) })
            {
                destination.Add(*element);
            }
        }
        return destination;
    }

    static void AppendChild(PoDoFo::PdfObject& parent, PoDoFo::PdfObject& item)
    {
        auto& parent_dict{ parent.GetDictionary() };
        auto& item_dict{ item.GetDictionary() };

        item_dict.AddKey("Parent", parent.GetIndirectReference());
        if (auto* last{ parent_dict.FindKey("Last") })
        {
            last->GetDictionary().AddKey("Next", item.GetIndirectReference());
            item_dict.AddKey("Prev", last->GetIndirectReference());
        }
        else
        {
            parent_dict.AddKey("First", item.GetIndirectReference());
        }
        parent_dict.AddKey("Last", item.GetIndirectReference());

        // Children start out collapsed, the root counts its visible top-level entries
        const auto* count{ parent_dict.FindKey("Count") };
        const int64_t num_children{ count != nullptr && count->IsNumber() ? std::abs(count->GetNumber()) + 1 : 1 };
        const bool is_root{ !parent_dict.HasKey("Parent") };
        parent_dict.AddKey("Count", PoDoFo::PdfObject{ is_root ? num_children : -num_children });
    }

    PoDoFo::PdfMemDocument& m_SourceDocument;
    PoDoFo::PdfMemDocument& m_Document;
    PageMap m_PageMap;
    std::set<ObjectKey> m_Visited;
    uint32_t m_NumCloned{ 0 };
};
} // namespace

PoDoFoSourceDocument::PoDoFoSourceDocument(const fs::path& path)
    : m_Path{ path }
    , m_Document{ std::make_unique<PoDoFo::PdfMemDocument>() }
{
    TranslatePdfErrors(fmt::format("Failed reading {}", path.string()),
                       [&]()
                       { m_Document->Load(path.string()); });
}

uint32_t PoDoFoSourceDocument::PageCount() const
{
    return m_Document->GetPages().GetCount();
}

PageGeometry PoDoFoSourceDocument::GetPageGeometry(uint32_t page_index) const
{
    return TranslatePdfErrors(
        fmt::format("Failed reading page {} of {}", page_index + 1, m_Path.string()),
        [&]()
        {
            const auto& page{ m_Document->GetPages().GetPageAt(page_index) };
            const auto media_box{ page.GetMediaBox() };
            return PageGeometry{
                .m_Origin{ FromPoints(media_box.X), FromPoints(media_box.Y) },
                .m_Size{ FromPoints(media_box.Width), FromPoints(media_box.Height) },
                .m_Rotation{ NormalizeRotation(ReadRawRotation(page)) },
            };
        });
}

bool PoDoFoSourceDocument::HasOutlines()
{
    const auto* outlines{ m_Document->GetCatalog().GetDictionary().FindKey("Outlines") };
    return outlines != nullptr &&
           outlines->IsDictionary() &&
           outlines->GetDictionary().FindKey("First") != nullptr;
}

PoDoFo::PdfMemDocument& PoDoFoSourceDocument::GetDocument() const
{
    return *m_Document;
}

PoDoFoPage::PoDoFoPage(PoDoFo::PdfPage* page, PoDoFoDocument* document)
    : m_Page{ page }
    , m_Document{ document }
    , m_Painter{ std::make_unique<PoDoFo::PdfPainter>() }
{
    TranslatePdfErrors("Failed creating sheet",
                       [&]()
                       { m_Painter->SetCanvas(*m_Page, PoDoFo::PdfPainterFlags::NoSaveRestorePrior); });
}

void PoDoFoPage::PlacePage(PdfSourceDocument& source, uint32_t page_index, const AffineTransform& transform)
{
    auto& podofo_source{ AsPoDoFo(source) };
    const auto& form{ m_Document->GetPageForm(podofo_source, page_index) };

    TranslatePdfErrors("Failed placing page",
                       [&]()
                       {
                           auto save{ Save(*m_Painter) };
                           m_Painter->GraphicsState.SetCurrentMatrix(ToPoDoFoMatrix(transform));
                           m_Painter->DrawXObject(form, 0.0, 0.0);
                       });
}

void PoDoFoPage::Finish()
{
    TranslatePdfErrors("Failed writing sheet content",
                       [&]()
                       { m_Painter->FinishDrawing(); });
}

PoDoFoDocument::PoDoFoDocument()
    : m_Document{ std::make_unique<PoDoFo::PdfMemDocument>() }
{
}

PoDoFoPage* PoDoFoDocument::NextPage(Size page_size)
{
    auto* page{
        TranslatePdfErrors(
            "Failed creating page",
            [&]()
            {
                const unsigned new_page_idx{ m_Document->GetPages().GetCount() };
                return &m_Document->GetPages().CreatePageAt(
                    new_page_idx,
                    PoDoFo::Rect(
                        0.0,
                        0.0,
                        ToPoints(page_size.x),
                        ToPoints(page_size.y)));
            }),
    };

    m_Pages.push_back(std::unique_ptr<PoDoFoPage>{ new PoDoFoPage{ page, this } });
    return m_Pages.back().get();
}

void PoDoFoDocument::AppendPages(PdfSourceDocument& source, PageSelection selection)
{
    if (selection.m_Count == 0)
    {
        return;
    }

    // The ranged overload only copies pages, outlines are handled by CopyOutlines
    auto& podofo_source{ AsPoDoFo(source) };
    TranslatePdfErrors("Failed appending pages",
                       [&]()
                       { m_Document->GetPages().AppendDocumentPages(podofo_source.GetDocument(),
                                                                    selection.m_First,
                                                                    selection.m_Count); });
}

uint32_t PoDoFoDocument::CopyOutlines(PdfSourceDocument& source, PageSelection selection, uint32_t first_page)
{
    auto& podofo_source{ AsPoDoFo(source) };
    if (!podofo_source.HasOutlines())
    {
        return 0;
    }

    return TranslatePdfErrors(
        "Failed copying outlines",
        [&]()
        {
            auto& source_document{ podofo_source.GetDocument() };
            const auto* source_outlines{ source_document.GetCatalog().GetDictionary().FindKey("Outlines") };

            PageMap page_map;
            for (uint32_t i = 0; i < selection.m_Count; i++)
            {
                const auto& source_page{ source_document.GetPages().GetPageAt(selection.m_First + i) };
                auto& target_page{ m_Document->GetPages().GetPageAt(first_page + i) };
                page_map[GetObjectKey(source_page.GetObject())] = &target_page;
            }

            auto& catalog{ m_Document->GetCatalog().GetDictionary() };
            auto* target_outlines{ catalog.FindKey("Outlines") };
            if (target_outlines == nullptr)
            {
                auto& outlines{ m_Document->GetObjects().CreateDictionaryObject() };
                outlines.GetDictionary().AddKey("Type", PoDoFo::PdfName{ "Outlines" });
                catalog.AddKey("Outlines", outlines.GetIndirectReference());
                target_outlines = &outlines;
            }

            OutlineCloner cloner{ source_document, *m_Document, std::move(page_map) };
            cloner.CloneSiblings(source_outlines->GetDictionary().FindKey("First"), *target_outlines, 0);
            return cloner.NumCloned();
        });
}

uint32_t PoDoFoDocument::PageCount() const
{
    return m_Document->GetPages().GetCount();
}

fs::path PoDoFoDocument::Write(fs::path path)
{
    const auto pdf_path_string{ path.string() };
    LogInfo("Saving to {}...", pdf_path_string);

    TranslatePdfErrors(
        fmt::format("Failed writing {}", pdf_path_string),
        [&]()
        {
            if (g_Cfg.m_DeterministicPdfOutput)
            {
                auto& trailer{ m_Document->GetTrailer() };
                if (const auto* info{ trailer.GetDictionary().GetKey("Info") }; info != nullptr && info->IsReference())
                {
                    if (auto* obj{ m_Document->GetObjects().GetObject(info->GetReference()) })
                    {
                        obj->GetDictionary().RemoveKey("CreationDate");
                    }
                }

                m_Document->Save(pdf_path_string, PoDoFo::PdfSaveOptions::NoMetadataUpdate);
            }
            else
            {
                m_Document->Save(pdf_path_string);
            }
        });

    return path;
}

const PoDoFo::PdfXObjectForm& PoDoFoDocument::GetPageForm(PoDoFoSourceDocument& source, uint32_t page_index)
{
    if (!m_PageForms.contains(&source))
    {
        ImportPageForms(source);
    }

    const auto& forms{ m_PageForms.at(&source) };
    if (page_index >= forms.size())
    {
        throw ConversionException{
            ConversionErrorKind::LibraryFailure,
            fmt::format("Page {} is out of range, the document has {} pages", page_index + 1, forms.size()),
        };
    }
    return *forms[page_index];
}

void PoDoFoDocument::ImportPageForms(PoDoFoSourceDocument& source)
{
    TranslatePdfErrors(
        "Failed importing pages",
        [&]()
        {
            // Pages are imported through the page tree so that all their resources are copied, then each one
            // is turned into a form xobject and taken out of the page tree again
            auto& pages{ m_Document->GetPages() };
            const unsigned first_imported{ pages.GetCount() };
            const unsigned num_imported{ source.GetDocument().GetPages().GetCount() };
            pages.AppendDocumentPages(source.GetDocument(), 0, num_imported);

            auto& forms{ m_PageForms[&source] };
            forms.reserve(num_imported);
            for (unsigned i = 0; i < num_imported; i++)
            {
                const auto& page{ pages.GetPageAt(first_imported + i) };
                auto form{ m_Document->CreateXObjectForm(page.GetMediaBox()) };
                form->FillFromPage(page);

                // Rotation is part of the placement transform, the form stays in unrotated page space
                form->GetDictionary().RemoveKey("Matrix");
                forms.push_back(std::move(form));
            }

            for (unsigned i = num_imported; i > 0; i--)
            {
                pages.RemovePageAt(first_imported + i - 1);
            }
        });
}

std::unique_ptr<PdfSourceDocument> PoDoFoBackend::Open(const fs::path& path)
{
    return std::make_unique<PoDoFoSourceDocument>(path);
}

std::unique_ptr<PdfDocument> PoDoFoBackend::Create()
{
    return std::make_unique<PoDoFoDocument>();
}
