#include <catch2/catch_test_macros.hpp>
#include "format/image_adapter.hpp"
#include "core/json.hpp"
#include "format/json_adapter.hpp"
#include "format/pdf_adapter.hpp"
#include "format/text_adapter.hpp"
#include "format/xml_adapter.hpp"
#include "core/error.hpp"
#include "mocks/fake_ocr_extractor.hpp"

#include <format>
#include <string>
#include <vector>

using namespace docanon;
using docanon::testing::FakeOcrExtractor;

// ============================================================================
// Text
// ============================================================================

TEST_CASE("TextAdapter: whole content is one unit", "[adapter][text]") {
    TextAdapter adapter;
    const std::string doc = "My name is John Doe.\nSecond line.";
    const auto units = adapter.extract(doc);

    REQUIRE(units.size() == 1);
    CHECK(units[0].text == doc);
    CHECK(units[0].position.kind == PositionKind::CHAR_RANGE);
    CHECK(units[0].position.end == doc.size());

    CHECK(adapter.reconstruct({{doc, "anonymized"}}) == "anonymized");
    CHECK(adapter.reconstruct({}) == doc);
    CHECK(adapter.output_extension() == ".txt");
}

// ============================================================================
// XML
// ============================================================================

TEST_CASE("XmlAdapter: non-blank text nodes in document order", "[adapter][xml]") {
    XmlAdapter adapter;
    const auto units = adapter.extract(
        "<root>\n  <name>John Doe</name>\n  <note>hi <b>x</b> tail</note>\n</root>");

    REQUIRE(units.size() == 4);
    CHECK(units[0].text == "John Doe");
    CHECK(units[0].position.kind == PositionKind::TREE_NODE);
    CHECK(units[0].position.path == "/root/name");
    CHECK(units[1].text == "hi ");
    CHECK(units[2].text == "x");
    CHECK(units[2].position.path == "/root/note/b");
    CHECK(units[3].text == " tail");
    CHECK(units[3].position.order == 3);
}

TEST_CASE("XmlAdapter: reconstruct replaces text and keeps structure", "[adapter][xml]") {
    XmlAdapter adapter;
    (void)adapter.extract(R"(<people><p id="1">John Doe</p><p id="2">Tom &amp; Jerry</p></people>)");

    const auto out = adapter.reconstruct({
        {"John Doe", "[PERSON_aa]"},
        {"Tom & Jerry", "[PERSON_bb] & co"},
    });

    CHECK(out.starts_with("<?xml"));
    CHECK(out.find(R"(<p id="1">[PERSON_aa]</p>)") != std::string::npos);
    CHECK(out.find(R"(<p id="2">[PERSON_bb] &amp; co</p>)") != std::string::npos);
    CHECK(out.find("John Doe") == std::string::npos);
}

TEST_CASE("XmlAdapter: malformed input throws", "[adapter][xml]") {
    XmlAdapter adapter;
    CHECK_THROWS_AS(adapter.extract("<root><open></root>"), DocumentError);
    CHECK_THROWS_AS(XmlAdapter{}.reconstruct({}), DocumentError);
}

// ============================================================================
// JSON
// ============================================================================

TEST_CASE("JsonAdapter: one unit per leaf string", "[adapter][json]") {
    JsonAdapter adapter;
    const auto units = adapter.extract(
        R"({"name":"John Doe","age":42,"tags":["a","John Doe"],"nested":{"k":"v","ok":true}})");

    REQUIRE(units.size() == 4);
    CHECK(units[0].text == "John Doe");
    CHECK(units[0].position.kind == PositionKind::JSON_PATH);
    CHECK(units[0].position.path == "$.name");
    CHECK(units[1].position.path == "$.tags[0]");
    CHECK(units[2].position.path == "$.tags[1]");
    CHECK(units[2].text == "John Doe");
    CHECK(units[3].position.path == "$.nested.k");
}

TEST_CASE("JsonAdapter: reconstruct leaves keys and non-strings alone", "[adapter][json]") {
    JsonAdapter adapter;
    (void)adapter.extract(R"({"John Doe":"John Doe","age":42,"list":["John Doe",null]})");

    const auto out = adapter.reconstruct({{"John Doe", "[PERSON_aa]"}});
    CHECK(out == R"({"John Doe":"[PERSON_aa]","age":42,"list":["[PERSON_aa]",null]})");

    auto parsed = json::parse(out);
    CHECK(parsed["John Doe"].get<std::string>() == "[PERSON_aa]");
    CHECK(parsed["list"][1].is_null());
}

TEST_CASE("JsonAdapter: numbers, member order and layout survive", "[adapter][json]") {
    const std::string doc =
        "{\n"
        "    \"zeta\": \"John Doe\",\n"
        "    \"id\": 9007199254740993,\n"
        "    \"price\": 1.50,\n"
        "    \"exp\": 1e2,\n"
        "    \"alpha\": [true, false, -0.0]\n"
        "}\n";

    JsonAdapter adapter;
    const auto units = adapter.extract(doc);
    REQUIRE(units.size() == 1);
    CHECK(units[0].position.path == "$.zeta");

    const auto out = adapter.reconstruct({{"John Doe", "[PERSON_aa]"}});
    CHECK(out ==
        "{\n"
        "    \"zeta\": \"[PERSON_aa]\",\n"
        "    \"id\": 9007199254740993,\n"
        "    \"price\": 1.50,\n"
        "    \"exp\": 1e2,\n"
        "    \"alpha\": [true, false, -0.0]\n"
        "}\n");
}

TEST_CASE("JsonAdapter: escaped strings are decoded and re-encoded", "[adapter][json]") {
    JsonAdapter adapter;
    const auto units = adapter.extract(R"({"q":"say \"hi\"\nJohn","k\u00e9y":["x"]})");
    REQUIRE(units.size() == 2);
    CHECK(units[0].text == "say \"hi\"\nJohn");
    CHECK(units[1].position.path == "$.k\xC3\xA9y[0]");

    const auto out = adapter.reconstruct({{"say \"hi\"\nJohn", "say \"[PERSON_aa]\""}});
    CHECK(out == R"({"q":"say \"[PERSON_aa]\"","k\u00e9y":["x"]})");
}

TEST_CASE("JsonAdapter: unmapped strings keep their original literal", "[adapter][json]") {
    JsonAdapter adapter;
    (void)adapter.extract(R"(["caf\u00e9", "plain"])");
    CHECK(adapter.reconstruct({}) == R"(["caf\u00e9", "plain"])");
}

TEST_CASE("JsonAdapter: invalid JSON throws", "[adapter][json]") {
    JsonAdapter adapter;
    CHECK_THROWS_AS(adapter.extract("{\"unterminated\": "), DocumentError);
}

// ============================================================================
// Image
// ============================================================================

TEST_CASE("ImageAdapter: OCR text is the only unit", "[adapter][image]") {
    FakeOcrExtractor ocr;
    ocr.set_result("PNGBYTES", "Contact test@example.com");
    ImageAdapter adapter(ocr);

    const auto units = adapter.extract("PNGBYTES");
    REQUIRE(units.size() == 1);
    CHECK(units[0].text == "Contact test@example.com");
    CHECK(units[0].position.kind == PositionKind::IMAGE_TEXT);
    CHECK(ocr.calls() == 1);

    CHECK(adapter.reconstruct({{"Contact test@example.com", "Contact [EMAIL_ADDRESS_aa]"}})
          == "Contact [EMAIL_ADDRESS_aa]");
    CHECK(adapter.output_extension() == ".txt");
}

TEST_CASE("ImageAdapter: disabled OCR yields empty output", "[adapter][image]") {
    NullOcrExtractor ocr;
    ImageAdapter adapter(ocr);
    const auto units = adapter.extract("whatever");
    REQUIRE(units.size() == 1);
    CHECK(units[0].text.empty());
    CHECK(adapter.reconstruct({}).empty());
}

// ============================================================================
// PDF (layout ordering, independent of the PDF parser)
// ============================================================================

namespace {

PdfItem text_item(size_t page, double x, double y, std::string text) {
    PdfItem item;
    item.kind = PdfItem::Kind::TEXT;
    item.page = page;
    item.x = x;
    item.y = y;
    item.text = std::move(text);
    return item;
}

// One page, Helvetica text drawn by `content`; xref offsets computed
std::string make_pdf(const std::string& content) {
    const std::vector<std::string> objects = {
        "<< /Type /Catalog /Pages 2 0 R >>",
        "<< /Type /Pages /Kids [3 0 R] /Count 1 >>",
        "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] /Contents 4 0 R "
        "/Resources << /Font << /F1 5 0 R >> >> >>",
        std::format("<< /Length {} >>\nstream\n{}\nendstream", content.size(), content),
        "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica >>",
    };

    std::string pdf = "%PDF-1.4\n";
    std::vector<size_t> offsets;
    for (size_t i = 0; i < objects.size(); ++i) {
        offsets.push_back(pdf.size());
        pdf += std::format("{} 0 obj\n{}\nendobj\n", i + 1, objects[i]);
    }
    const size_t xref = pdf.size();
    pdf += std::format("xref\n0 {}\n0000000000 65535 f \n", objects.size() + 1);
    for (const auto offset : offsets) {
        pdf += std::format("{:010} 00000 n \n", offset);
    }
    pdf += std::format("trailer\n<< /Size {} /Root 1 0 R >>\nstartxref\n{}\n%%EOF\n",
        objects.size() + 1, xref);
    return pdf;
}

PdfItem line_item(size_t page, double x, double y, double width, double height, std::string text) {
    auto item = text_item(page, x, y, std::move(text));
    item.width = width;
    item.height = height;
    return item;
}

PdfItem image_item(size_t page, double x, double y, const std::string& bytes) {
    PdfItem item;
    item.kind = PdfItem::Kind::IMAGE;
    item.page = page;
    item.x = x;
    item.y = y;
    item.image.assign(bytes.begin(), bytes.end());
    return item;
}

} // anonymous namespace

TEST_CASE("PdfAdapter: items are ordered by page, top, left", "[adapter][pdf]") {
    FakeOcrExtractor ocr;
    PdfAdapter adapter(ocr);

    const auto units = adapter.extract_items({
        text_item(1, 72, 100, "page two"),
        text_item(0, 300, 50, "right"),
        image_item(0, 72, 200, "Call 555-123-4567"),
        text_item(0, 72, 50, "left"),
    });

    REQUIRE(units.size() == 4);
    CHECK(units[0].text == "left");
    CHECK(units[1].text == "right");
    CHECK(units[2].text == "Call 555-123-4567");
    CHECK(units[3].text == "page two");
    CHECK(units[3].position.kind == PositionKind::LAYOUT);
    CHECK(units[3].position.page == 1);
    CHECK(units[3].position.order == 3);
    CHECK(ocr.calls() == 1);
}

TEST_CASE("PdfAdapter: output is the text stream without empty parts", "[adapter][pdf]") {
    FakeOcrExtractor ocr;
    ocr.set_result("blank-image", "");
    PdfAdapter adapter(ocr);

    (void)adapter.extract_items({
        text_item(0, 0, 10, "John Doe"),
        image_item(0, 0, 20, "blank-image"),
        text_item(0, 0, 30, "end"),
    });

    CHECK(adapter.reconstruct({{"John Doe", "[PERSON_aa]"}}) == "[PERSON_aa]\nend");
    CHECK(adapter.output_extension() == ".txt");
}

TEST_CASE("PdfAdapter: wrapped lines form one block", "[adapter][pdf]") {
    NullOcrExtractor ocr;
    PdfAdapter adapter(ocr);

    const auto units = adapter.extract_items({
        line_item(0, 72, 114, 150, 12, "Doe at the office."),
        line_item(0, 320, 100, 150, 12, "Sidebar note"),
        line_item(0, 72, 100, 200, 12, "Please contact John"),
        line_item(0, 72, 200, 200, 12, "Footer"),
        line_item(1, 72, 10, 200, 12, "Next page"),
    });

    REQUIRE(units.size() == 4);
    CHECK(units[0].text == "Please contact John Doe at the office.");
    CHECK(units[0].position.kind == PositionKind::LAYOUT);
    CHECK(units[0].position.x == 72.0);
    CHECK(units[0].position.y == 100.0);
    CHECK(units[1].text == "Sidebar note");
    CHECK(units[2].text == "Footer");
    CHECK(units[3].text == "Next page");
    CHECK(units[3].position.page == 1);

    CHECK(adapter.reconstruct({{"Please contact John Doe at the office.", "Please contact [PERSON_aa] at the office."}})
          == "Please contact [PERSON_aa] at the office.\nSidebar note\nFooter\nNext page");
}

TEST_CASE("PdfAdapter: block grouping keeps images separate", "[adapter][pdf]") {
    const auto grouped = PdfAdapter::group_blocks({
        line_item(0, 72, 100, 200, 12, "first"),
        image_item(0, 72, 113, "img"),
        line_item(0, 72, 114, 200, 12, "second"),
    });

    REQUIRE(grouped.size() == 2);
    CHECK(grouped[0].kind == PdfItem::Kind::TEXT);
    CHECK(grouped[0].text == "first second");
    CHECK(grouped[0].height == 26.0);
    CHECK(grouped[1].kind == PdfItem::Kind::IMAGE);
}

TEST_CASE("PdfAdapter: reads text from an in-memory document", "[adapter][pdf]") {
    FakeOcrExtractor ocr;
    PdfAdapter adapter(ocr);

    std::vector<StructuralUnit> units;
    REQUIRE_NOTHROW(units = adapter.extract(make_pdf("BT /F1 12 Tf 72 720 Td (John Doe) Tj ET")));
    REQUIRE(units.size() == 1);
    CHECK(units[0].text == "John Doe");
    CHECK(units[0].position.page == 0);
    CHECK(ocr.calls() == 0);

    CHECK(adapter.reconstruct({{"John Doe", "[PERSON_aa]"}}) == "[PERSON_aa]");
}

TEST_CASE("PdfAdapter: bytes that are not a PDF throw", "[adapter][pdf]") {
    NullOcrExtractor ocr;
    PdfAdapter adapter(ocr);
    CHECK_THROWS_AS(adapter.extract("definitely not a pdf"), DocumentError);
    CHECK_THROWS_AS(PdfAdapter(ocr).reconstruct({}), DocumentError);
}
