#include <catch2/catch_test_macros.hpp>
#include "format/docx_adapter.hpp"
#include "format/ooxml.hpp"
#include "format/xlsx_adapter.hpp"
#include "format/zip_archive.hpp"
#include "core/error.hpp"
#include "mocks/fake_ocr_extractor.hpp"

#include <tinyxml2.h>

#include <algorithm>
#include <format>
#include <tuple>
#include <utility>

using namespace docanon;
using docanon::testing::FakeOcrExtractor;

namespace {

constexpr const char* kRelNs = "http://schemas.openxmlformats.org/officeDocument/2006/relationships";
constexpr const char* kPkgRelNs = "http://schemas.openxmlformats.org/package/2006/relationships";

std::string make_package(const std::vector<std::pair<std::string, std::string>>& parts) {
    ZipWriter writer;
    for (const auto& [name, data] : parts) {
        writer.add(name, data);
    }
    return writer.finish();
}

std::string rels(const std::vector<std::tuple<std::string, std::string, std::string>>& entries) {
    std::string xml = std::format(R"(<?xml version="1.0" encoding="UTF-8"?><Relationships xmlns="{}">)", kPkgRelNs);
    for (const auto& [id, type, target] : entries) {
        xml += std::format(R"(<Relationship Id="{}" Type="{}/{}" Target="{}"/>)", id, kRelNs, type, target);
    }
    xml += "</Relationships>";
    return xml;
}

bool contains(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

std::vector<std::string> texts_of(const std::vector<StructuralUnit>& units) {
    std::vector<std::string> out;
    for (const auto& unit : units) out.push_back(unit.text);
    return out;
}

// ----------------------------------------------------------------------------
// DOCX fixture
// ----------------------------------------------------------------------------

std::string make_docx() {
    const std::string body = std::format(
        R"(<?xml version="1.0" encoding="UTF-8"?>)"
        R"(<w:document xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main")"
        R"( xmlns:r="{}" xmlns:a="http://schemas.openxmlformats.org/drawingml/2006/main"><w:body>)"
        R"(<w:p><w:r><w:t xml:space="preserve">My name is </w:t></w:r><w:r><w:t>John Doe</w:t></w:r></w:p>)"
        R"(<w:p/>)"
        R"(<w:tbl><w:tr><w:tc><w:p><w:r><w:t>cell text</w:t></w:r></w:p></w:tc></w:tr></w:tbl>)"
        R"(<w:p><w:hyperlink r:id="rId9"><w:r><w:t>a</w:t><w:tab/><w:t>b</w:t></w:r></w:hyperlink></w:p>)"
        R"(<w:p><w:r><w:drawing><a:graphic><a:blip r:embed="rId5"/></a:graphic></w:drawing></w:r></w:p>)"
        R"(<w:sectPr/></w:body></w:document>)",
        kRelNs);

    return make_package({
        {"_rels/.rels", rels({{"rId1", "officeDocument", "word/document.xml"}})},
        {"word/document.xml", body},
        {"word/_rels/document.xml.rels", rels({{"rId5", "image", "media/image1.png"}})},
        {"word/media/image1.png", "Contact test@example.com"},
    });
}

// ----------------------------------------------------------------------------
// XLSX fixture: one sheet with shared, inline and numeric cells plus a picture
// ----------------------------------------------------------------------------

constexpr const char* kMainNs = "http://schemas.openxmlformats.org/spreadsheetml/2006/main";

std::string make_xlsx() {
    const std::string content_types =
        R"(<?xml version="1.0" encoding="UTF-8"?>)"
        R"(<Types xmlns="http://schemas.openxmlformats.org/package/2006/content-types">)"
        R"(<Default Extension="png" ContentType="image/png"/>)"
        R"(<Override PartName="/xl/workbook.xml" ContentType="wb"/>)"
        R"(<Override PartName="/xl/worksheets/sheet1.xml" ContentType="ws"/>)"
        R"(<Override PartName="/xl/drawings/drawing1.xml" ContentType="dr"/>)"
        R"(</Types>)";

    const std::string workbook = std::format(
        R"(<workbook xmlns="{}" xmlns:r="{}"><sheets>)"
        R"(<sheet name="Sheet1" sheetId="1" r:id="rId1"/></sheets></workbook>)",
        kMainNs, kRelNs);

    const std::string shared = std::format(
        R"(<sst xmlns="{}" count="3" uniqueCount="3">)"
        R"(<si><t>Name</t></si>)"
        R"(<si><t>John Doe</t></si>)"
        R"(<si><r><t xml:space="preserve">rich </t></r><r><t>text</t></r></si>)"
        R"(</sst>)",
        kMainNs);

    const std::string sheet = std::format(
        R"(<worksheet xmlns="{}" xmlns:r="{}"><sheetData>)"
        R"(<row r="1"><c r="A1" t="s"><v>0</v></c><c r="B1"><v>42</v></c></row>)"
        R"(<row r="2"><c r="A2" t="s"><v>1</v></c><c r="C2" t="inlineStr"><is><t>test@example.com</t></is></c></row>)"
        R"(<row r="3"><c r="A3" t="s"><v>2</v></c></row>)"
        R"(</sheetData><drawing r:id="rId1"/></worksheet>)",
        kMainNs, kRelNs);

    const std::string drawing = std::format(
        R"(<xdr:wsDr xmlns:xdr="http://schemas.openxmlformats.org/drawingml/2006/spreadsheetDrawing")"
        R"( xmlns:a="http://schemas.openxmlformats.org/drawingml/2006/main" xmlns:r="{}">)"
        R"(<xdr:twoCellAnchor><xdr:pic><xdr:blipFill><a:blip r:embed="rId1"/></xdr:blipFill></xdr:pic>)"
        R"(</xdr:twoCellAnchor></xdr:wsDr>)",
        kRelNs);

    return make_package({
        {"[Content_Types].xml", content_types},
        {"_rels/.rels", rels({{"rId1", "officeDocument", "xl/workbook.xml"}})},
        {"xl/workbook.xml", workbook},
        {"xl/_rels/workbook.xml.rels", rels({{"rId1", "worksheet", "worksheets/sheet1.xml"},
                                             {"rId2", "sharedStrings", "sharedStrings.xml"}})},
        {"xl/sharedStrings.xml", shared},
        {"xl/worksheets/sheet1.xml", sheet},
        {"xl/worksheets/_rels/sheet1.xml.rels", rels({{"rId1", "drawing", "../drawings/drawing1.xml"}})},
        {"xl/drawings/drawing1.xml", drawing},
        {"xl/drawings/_rels/drawing1.xml.rels", rels({{"rId1", "image", "../media/image1.png"}})},
        {"xl/media/image1.png", "Call 555-123-4567"},
    });
}

} // anonymous namespace

// ============================================================================
// Package helpers
// ============================================================================

TEST_CASE("ooxml: part paths", "[ooxml]") {
    CHECK(ooxml::rels_path_for("xl/worksheets/sheet1.xml") == "xl/worksheets/_rels/sheet1.xml.rels");
    CHECK(ooxml::rels_path_for("root.xml") == "_rels/root.xml.rels");

    CHECK(ooxml::resolve_part_path("xl/drawings/drawing1.xml", "../media/image1.png") == "xl/media/image1.png");
    CHECK(ooxml::resolve_part_path("word/document.xml", "media/a.png") == "word/media/a.png");
    CHECK(ooxml::resolve_part_path("word/document.xml", "/word/media/a.png") == "word/media/a.png");
    CHECK(ooxml::resolve_part_path("", "xl/workbook.xml") == "xl/workbook.xml");
}

TEST_CASE("ooxml: relationships", "[ooxml]") {
    const std::string xml = std::format(
        R"(<Relationships xmlns="{}">)"
        R"(<Relationship Id="rId1" Type="{}/image" Target="media/a.png"/>)"
        R"(<Relationship Id="rId2" Type="{}/hyperlink" Target="https://example.com" TargetMode="External"/>)"
        R"(</Relationships>)",
        kPkgRelNs, kRelNs, kRelNs);

    const auto parsed = ooxml::parse_relationships(xml);
    REQUIRE(parsed.size() == 2);
    CHECK(ooxml::has_type(parsed.at("rId1"), "image"));
    CHECK_FALSE(ooxml::has_type(parsed.at("rId1"), "age"));
    CHECK_FALSE(parsed.at("rId1").external);
    CHECK(parsed.at("rId2").external);

    CHECK(ooxml::parse_relationships("").empty());
    CHECK(ooxml::parse_relationships("<not closed").empty());

    CHECK(ooxml::office_document_part(rels({{"rId1", "officeDocument", "/word/main.xml"}}), "fallback.xml")
          == "word/main.xml");
    CHECK(ooxml::office_document_part("", "fallback.xml") == "fallback.xml");
}

TEST_CASE("ooxml: element names and text", "[ooxml]") {
    tinyxml2::XMLDocument doc;
    REQUIRE(doc.Parse("<w:p><w:r><w:t>one </w:t></w:r><w:r><w:t>two</w:t></w:r></w:p>") == tinyxml2::XML_SUCCESS);
    CHECK(ooxml::local_name(doc.RootElement()) == "p");
    CHECK(ooxml::collect_text(doc.RootElement()) == "one two");
}

TEST_CASE("ZipReader: reads what ZipWriter wrote", "[ooxml][zip]") {
    const ZipReader zip(make_package({{"a.txt", "alpha"}, {"dir/b.txt", "beta"}}));
    CHECK(zip.entries() == std::vector<std::string>{"a.txt", "dir/b.txt"});
    CHECK(zip.contains("dir/b.txt"));
    CHECK(zip.read("a.txt") == "alpha");
    CHECK_FALSE(zip.read("missing").has_value());

    CHECK_THROWS_AS(ZipReader("not a zip archive"), DocumentError);
}

// ============================================================================
// DOCX
// ============================================================================

TEST_CASE("DocxAdapter: runs, tables and images in document order", "[ooxml][docx]") {
    FakeOcrExtractor ocr;
    DocxAdapter adapter(ocr);
    const auto units = adapter.extract(make_docx());

    CHECK(texts_of(units) == std::vector<std::string>{
        "My name is ", "John Doe", "cell text", "a\tb", "Contact test@example.com"});
    CHECK(units[1].position.kind == PositionKind::RUN);
    CHECK(units[1].position.row == 0);
    CHECK(units[1].position.column == 1);
    CHECK(units[2].position.row == 2);
    CHECK(units[4].position.kind == PositionKind::IMAGE_TEXT);
    CHECK(ocr.calls() == 1);
}

TEST_CASE("DocxAdapter: output is anonymized paragraphs as plain text", "[ooxml][docx]") {
    FakeOcrExtractor ocr;
    DocxAdapter adapter(ocr);
    (void)adapter.extract(make_docx());

    const auto out = adapter.reconstruct({
        {"John Doe", "[PERSON_aa]"},
        {"Contact test@example.com", "Contact [EMAIL_ADDRESS_bb]"},
    });
    CHECK(out == "My name is [PERSON_aa]\ncell text\na\tb\nContact [EMAIL_ADDRESS_bb]");
    CHECK(adapter.output_extension() == ".txt");
}

TEST_CASE("DocxAdapter: broken packages throw", "[ooxml][docx]") {
    NullOcrExtractor ocr;
    DocxAdapter adapter(ocr);
    CHECK_THROWS_AS(adapter.extract("plain text"), DocumentError);
    CHECK_THROWS_AS(adapter.extract(make_package({{"other.xml", "<x/>"}})), DocumentError);
    CHECK_THROWS_AS(adapter.reconstruct({}), DocumentError);
}

// ============================================================================
// XLSX
// ============================================================================

TEST_CASE("XlsxAdapter: string cells and image text are units", "[ooxml][xlsx]") {
    FakeOcrExtractor ocr;
    XlsxAdapter adapter(ocr);
    const auto units = adapter.extract(make_xlsx());

    CHECK(texts_of(units) == std::vector<std::string>{
        "Name", "John Doe", "test@example.com", "rich text", "Call 555-123-4567"});

    CHECK(units[2].position.kind == PositionKind::CELL);
    CHECK(units[2].position.row == 1);
    CHECK(units[2].position.column == 2);
    CHECK(units[4].position.kind == PositionKind::IMAGE_TEXT);
}

TEST_CASE("XlsxAdapter: reconstruct rewrites cells and replaces pictures with text rows",
          "[ooxml][xlsx]") {
    FakeOcrExtractor ocr;
    XlsxAdapter adapter(ocr);
    (void)adapter.extract(make_xlsx());

    const auto output = adapter.reconstruct({
        {"John Doe", "[PERSON_aa]"},
        {"test@example.com", "[EMAIL_ADDRESS_bb]"},
        {"Call 555-123-4567", "Call [PHONE_NUMBER_cc]"},
    });
    CHECK(adapter.output_extension() == ".xlsx");

    const ZipReader zip(output);
    CHECK_FALSE(zip.contains("xl/drawings/drawing1.xml"));
    CHECK_FALSE(zip.contains("xl/drawings/_rels/drawing1.xml.rels"));
    CHECK_FALSE(zip.contains("xl/media/image1.png"));
    CHECK(zip.contains("xl/workbook.xml"));

    const auto shared = zip.read("xl/sharedStrings.xml").value_or("");
    CHECK(shared.find("[PERSON_aa]") != std::string::npos);
    CHECK(shared.find("John Doe") == std::string::npos);
    CHECK(shared.find("Name") != std::string::npos);

    const auto sheet = zip.read("xl/worksheets/sheet1.xml").value_or("");
    CHECK(sheet.find("[EMAIL_ADDRESS_bb]") != std::string::npos);
    CHECK(sheet.find("<v>42</v>") != std::string::npos);
    CHECK(sheet.find("<drawing") == std::string::npos);
    CHECK(sheet.find(R"(<row r="4">)") != std::string::npos);

    CHECK(zip.read("xl/worksheets/_rels/sheet1.xml.rels").value_or("").find("drawing1") == std::string::npos);

    const auto types = zip.read("[Content_Types].xml").value_or("");
    CHECK(types.find("drawing1.xml") == std::string::npos);
    CHECK(types.find("sheet1.xml") != std::string::npos);

    // The output is itself a readable workbook
    FakeOcrExtractor reread_ocr;
    XlsxAdapter reread(reread_ocr);
    const auto texts = texts_of(reread.extract(output));
    CHECK(texts == std::vector<std::string>{
        "Name", "[PERSON_aa]", "[EMAIL_ADDRESS_bb]", "rich text",
        XlsxAdapter::kImageTextLabel, "Call [PHONE_NUMBER_cc]"});
    CHECK(reread_ocr.calls() == 0);
}

TEST_CASE("XlsxAdapter: blank OCR drops the picture without adding rows", "[ooxml][xlsx]") {
    NullOcrExtractor ocr;
    XlsxAdapter adapter(ocr);
    const auto units = adapter.extract(make_xlsx());
    CHECK(units.size() == 4);

    const ZipReader zip(adapter.reconstruct({}));
    CHECK_FALSE(zip.contains("xl/media/image1.png"));
    const auto sheet = zip.read("xl/worksheets/sheet1.xml").value_or("");
    CHECK(sheet.find(R"(<row r="4">)") == std::string::npos);
    CHECK(zip.read("xl/sharedStrings.xml").value_or("").find("John Doe") != std::string::npos);
}

TEST_CASE("XlsxAdapter: not a workbook", "[ooxml][xlsx]") {
    NullOcrExtractor ocr;
    XlsxAdapter adapter(ocr);
    CHECK_THROWS_AS(adapter.extract("plain text"), DocumentError);
    CHECK_THROWS_AS(adapter.extract(make_package({{"a.txt", "x"}})), DocumentError);
}
