#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

#include <podofo/podofo.h>

#include <pdfbind/util.hpp>

struct TestPage
{
    double m_Width{ 595.276 };
    double m_Height{ 841.89 };
    int64_t m_Rotation{ 0 };
};

// How a bookmark refers to its page
enum class TestDestination
{
    Explicit,        // /Dest [page /Fit]
    NameTree,        // GoTo action with a string looked up in /Names /Dests
    DestsDictionary, // /Dest name looked up in the catalog's /Dests
};

struct TestBookmark
{
    std::string m_Title;
    uint32_t m_PageIndex;
    TestDestination m_Destination{ TestDestination::Explicit };
    std::vector<TestBookmark> m_Children{};
};

struct TestNamedDestinations
{
    std::map<std::string, PoDoFo::PdfArray> m_NameTree;
    std::map<std::string, PoDoFo::PdfArray> m_DestsDictionary;
};

inline PoDoFo::PdfArray TestPageDestination(PoDoFo::PdfMemDocument& document, uint32_t page_index)
{
    PoDoFo::PdfArray destination;
    destination.Add(document.GetPages().GetPageAt(page_index).GetObject().GetIndirectReference());
    destination.Add(PoDoFo::PdfName{ "Fit" });
    return destination;
}

// Children below the outline root are written collapsed
inline void AddTestBookmarks(PoDoFo::PdfMemDocument& document,
                             PoDoFo::PdfObject& parent,
                             const std::vector<TestBookmark>& bookmarks,
                             TestNamedDestinations& named_destinations,
                             bool is_root)
{
    auto& objects{ document.GetObjects() };

    PoDoFo::PdfObject* previous{ nullptr };
    for (const auto& bookmark : bookmarks)
    {
        auto& item{ objects.CreateDictionaryObject() };
        auto& item_dict{ item.GetDictionary() };
        item_dict.AddKey("Title", PoDoFo::PdfString{ bookmark.m_Title });
        item_dict.AddKey("Parent", parent.GetIndirectReference());

        const std::string destination_name{ "dest." + bookmark.m_Title };
        switch (bookmark.m_Destination)
        {
        case TestDestination::Explicit:
            item_dict.AddKey("Dest", TestPageDestination(document, bookmark.m_PageIndex));
            break;
        case TestDestination::NameTree:
        {
            PoDoFo::PdfDictionary action;
            action.AddKey("S", PoDoFo::PdfName{ "GoTo" });
            action.AddKey("D", PoDoFo::PdfString{ destination_name });
            item_dict.AddKey("A", action);
            named_destinations.m_NameTree.emplace(destination_name,
                                                  TestPageDestination(document, bookmark.m_PageIndex));
            break;
        }
        case TestDestination::DestsDictionary:
            item_dict.AddKey("Dest", PoDoFo::PdfName{ destination_name });
            named_destinations.m_DestsDictionary.emplace(destination_name,
                                                         TestPageDestination(document, bookmark.m_PageIndex));
            break;
        }

        if (previous == nullptr)
        {
            parent.GetDictionary().AddKey("First", item.GetIndirectReference());
        }
        else
        {
            previous->GetDictionary().AddKey("Next", item.GetIndirectReference());
            item_dict.AddKey("Prev", previous->GetIndirectReference());
        }

        if (!bookmark.m_Children.empty())
        {
            AddTestBookmarks(document, item, bookmark.m_Children, named_destinations, false);
        }
        previous = &item;
    }

    const auto num_bookmarks{ static_cast<int64_t>(bookmarks.size()) };
    parent.GetDictionary().AddKey("Last", previous->GetIndirectReference());
    parent.GetDictionary().AddKey("Count", PoDoFo::PdfObject{ is_root ? num_bookmarks : -num_bookmarks });
}

// Writes a PDF with one line drawn on every page and an optional outline
inline void WriteTestPdf(const fs::path& path,
                         const std::vector<TestPage>& pages,
                         const std::vector<TestBookmark>& bookmarks = {})
{
    PoDoFo::PdfMemDocument document;
    for (unsigned i = 0; i < pages.size(); i++)
    {
        const auto& test_page{ pages[i] };
        auto& page{
            document.GetPages().CreatePageAt(
                i,
                PoDoFo::Rect(0.0, 0.0, test_page.m_Width, test_page.m_Height)),
        };
        if (test_page.m_Rotation != 0)
        {
            page.GetDictionary().AddKey("Rotate", PoDoFo::PdfObject{ test_page.m_Rotation });
        }

        PoDoFo::PdfPainter painter;
        painter.SetCanvas(page);
        painter.DrawLine(10.0, 10.0, test_page.m_Width - 10.0, test_page.m_Height - 10.0);
        painter.FinishDrawing();
    }

    if (!bookmarks.empty())
    {
        auto& objects{ document.GetObjects() };
        auto& catalog{ document.GetCatalog().GetDictionary() };

        auto& outlines{ objects.CreateDictionaryObject() };
        outlines.GetDictionary().AddKey("Type", PoDoFo::PdfName{ "Outlines" });

        TestNamedDestinations named_destinations;
        AddTestBookmarks(document, outlines, bookmarks, named_destinations, true);
        catalog.AddKey("Outlines", outlines.GetIndirectReference());

        if (!named_destinations.m_NameTree.empty())
        {
            // A single leaf, std::map keeps the keys sorted as name trees require
            PoDoFo::PdfArray names;
            for (const auto& [name, destination] : named_destinations.m_NameTree)
            {
                names.Add(PoDoFo::PdfString{ name });
                names.Add(destination);
            }

            auto& dests_tree{ objects.CreateDictionaryObject() };
            dests_tree.GetDictionary().AddKey("Names", names);

            auto& name_dictionary{ objects.CreateDictionaryObject() };
            name_dictionary.GetDictionary().AddKey("Dests", dests_tree.GetIndirectReference());
            catalog.AddKey("Names", name_dictionary.GetIndirectReference());
        }

        if (!named_destinations.m_DestsDictionary.empty())
        {
            auto& dests{ objects.CreateDictionaryObject() };
            for (const auto& [name, destination] : named_destinations.m_DestsDictionary)
            {
                dests.GetDictionary().AddKey(PoDoFo::PdfName{ name }, destination);
            }
            catalog.AddKey("Dests", dests.GetIndirectReference());
        }
    }

    document.Save(path.string());
}

inline std::vector<TestPage> UniformTestPages(uint32_t count, TestPage page = {})
{
    return std::vector<TestPage>(count, page);
}

struct TestOutlineEntry
{
    std::string m_Title;
    int m_PageIndex;
    int m_Depth;
    int64_t m_Count;
};

inline int PageIndexOf(PoDoFo::PdfMemDocument& document, const PoDoFo::PdfObject& page)
{
    const auto page_reference{ page.GetIndirectReference() };
    for (unsigned i = 0; i < document.GetPages().GetCount(); i++)
    {
        if (document.GetPages().GetPageAt(i).GetObject().GetIndirectReference() == page_reference)
        {
            return static_cast<int>(i);
        }
    }
    return -1;
}

inline void ReadOutlineItems(PoDoFo::PdfMemDocument& document,
                             const PoDoFo::PdfObject* item,
                             int depth,
                             std::vector<TestOutlineEntry>& entries)
{
    for (; item != nullptr; item = item->GetDictionary().FindKey("Next"))
    {
        const auto& dict{ item->GetDictionary() };
        const auto* title{ dict.FindKey("Title") };
        const auto* count{ dict.FindKey("Count") };

        int page_index{ -1 };
        if (const auto* destination{ dict.FindKey("Dest") }; destination != nullptr && destination->IsArray())
        {
            if (const auto* target{ destination->GetArray().FindAt(0) })
            {
                page_index = PageIndexOf(document, *target);
            }
        }

        entries.push_back(TestOutlineEntry{
            .m_Title{ title != nullptr ? title->GetString().GetString() : std::string{} },
            .m_PageIndex{ page_index },
            .m_Depth{ depth },
            .m_Count{ count != nullptr ? count->GetNumber() : 0 },
        });

        ReadOutlineItems(document, dict.FindKey("First"), depth + 1, entries);
    }
}

// All outline items in document order, -1 as page index for items without an explicit target
inline std::vector<TestOutlineEntry> ReadOutline(PoDoFo::PdfMemDocument& document)
{
    std::vector<TestOutlineEntry> entries;
    if (const auto* outlines{ document.GetCatalog().GetDictionary().FindKey("Outlines") })
    {
        ReadOutlineItems(document, outlines->GetDictionary().FindKey("First"), 0, entries);
    }
    return entries;
}

inline int64_t ReadOutlineRootCount(PoDoFo::PdfMemDocument& document)
{
    const auto* outlines{ document.GetCatalog().GetDictionary().FindKey("Outlines") };
    const auto* count{ outlines != nullptr ? outlines->GetDictionary().FindKey("Count") : nullptr };
    return count != nullptr ? count->GetNumber() : 0;
}

// Title and target page index of every top-level outline item
inline std::vector<std::pair<std::string, int>> ReadTopLevelBookmarks(PoDoFo::PdfMemDocument& document)
{
    std::vector<std::pair<std::string, int>> bookmarks;
    for (const auto& entry : ReadOutline(document))
    {
        if (entry.m_Depth == 0)
        {
            bookmarks.push_back({ entry.m_Title, entry.m_PageIndex });
        }
    }
    return bookmarks;
}

inline std::string ReadContentStreams(const PoDoFo::PdfPage& page)
{
    std::string content;
    const auto* contents{ page.GetContents() };
    if (contents == nullptr)
    {
        return content;
    }

    const auto append{
        [&content](const PoDoFo::PdfObject* object)
        {
            if (object != nullptr && object->GetStream() != nullptr)
            {
                const auto data{ object->GetStream()->GetCopy() };
                content.append(data.data(), data.size());
            }
        }
    };

    const auto& object{ contents->GetObject() };
    if (object.IsArray())
    {
        for (unsigned i = 0; i < object.GetArray().GetSize(); i++)
        {
            append(object.GetArray().FindAt(i));
        }
    }
    else
    {
        append(&object);
    }
    return content;
}
