#include <catch2/catch_test_macros.hpp>
#include "format/csv_adapter.hpp"
#include "format/csv_codec.hpp"
#include "core/error.hpp"

using namespace docanon;

TEST_CASE("csv::parse: plain and quoted fields", "[csv]") {
    const auto rows = csv::parse("name,note\n\"Doe, John\",\"said \"\"hi\"\"\"\n");
    REQUIRE(rows.size() == 2);
    CHECK(rows[0] == csv::Row{"name", "note"});
    CHECK(rows[1] == csv::Row{"Doe, John", "said \"hi\""});
}

TEST_CASE("csv::parse: line endings, BOM and trailing newline", "[csv]") {
    SECTION("CRLF") {
        const auto rows = csv::parse("a,b\r\nc,d\r\n");
        REQUIRE(rows.size() == 2);
        CHECK(rows[1] == csv::Row{"c", "d"});
    }

    SECTION("no trailing newline") {
        const auto rows = csv::parse("a,b\nc,d");
        REQUIRE(rows.size() == 2);
        CHECK(rows[1] == csv::Row{"c", "d"});
    }

    SECTION("UTF-8 BOM is skipped") {
        const auto rows = csv::parse("\xEF\xBB\xBFid,name\n1,x\n");
        REQUIRE(rows.size() == 2);
        CHECK(rows[0][0] == "id");
    }

    SECTION("newline inside quotes stays in the field") {
        const auto rows = csv::parse("h\n\"line1\nline2\"\n");
        REQUIRE(rows.size() == 2);
        CHECK(rows[1][0] == "line1\nline2");
    }
}

TEST_CASE("csv::parse: ragged rows keep their width", "[csv]") {
    const auto rows = csv::parse("a,b,c\n1\n1,2,3,4\n");
    REQUIRE(rows.size() == 3);
    CHECK(rows[1].size() == 1);
    CHECK(rows[2].size() == 4);
}

TEST_CASE("csv::parse: empty fields", "[csv]") {
    const auto rows = csv::parse("a,,c\n,,\n");
    REQUIRE(rows.size() == 2);
    CHECK(rows[0] == csv::Row{"a", "", "c"});
    CHECK(rows[1] == csv::Row{"", "", ""});
}

TEST_CASE("csv::parse: unterminated quote throws", "[csv]") {
    CHECK_THROWS_AS(csv::parse("a,b\n\"open,x\n"), DocumentError);
}

TEST_CASE("csv::escape_field quotes only when needed", "[csv]") {
    CHECK(csv::escape_field("plain") == "plain");
    CHECK(csv::escape_field("a,b") == "\"a,b\"");
    CHECK(csv::escape_field("say \"x\"") == "\"say \"\"x\"\"\"");
    CHECK(csv::escape_field("two\nlines") == "\"two\nlines\"");
    CHECK(csv::escape_field("a;b", ';') == "\"a;b\"");
    CHECK(csv::escape_field("a,b", ';') == "a,b");
}

TEST_CASE("csv::write serializes rows", "[csv]") {
    CHECK(csv::write({{"a", "b,c"}, {"1"}}) == "a,\"b,c\"\n1\n");
}

TEST_CASE("CsvAdapter: header row is never a unit", "[csv][adapter]") {
    CsvAdapter adapter;
    const auto units = adapter.extract("name,email\nJohn Doe,test@example.com\nJane,\n");

    REQUIRE(units.size() == 4);
    CHECK(units[0].text == "John Doe");
    CHECK(units[0].position.kind == PositionKind::CELL);
    CHECK(units[0].position.row == 1);
    CHECK(units[0].position.column == 0);
    CHECK(units[1].text == "test@example.com");
    CHECK(units[3].text.empty());
}

TEST_CASE("CsvAdapter: reconstruct maps cells and keeps the header", "[csv][adapter]") {
    CsvAdapter adapter;
    (void)adapter.extract("name,note\nJohn Doe,\"hello, John Doe\"\nname,x\n");

    const TranslationMap mapping = {
        {"John Doe", "[PERSON_aa]"},
        {"hello, John Doe", "hello, [PERSON_aa]"},
        {"name", "[FIELD_bb]"},
    };
    const auto out = adapter.reconstruct(mapping);
    CHECK(out == "name,note\n[PERSON_aa],\"hello, [PERSON_aa]\"\n[FIELD_bb],x\n");
    CHECK(adapter.output_extension() == ".csv");
}

TEST_CASE("CsvAdapter: reconstruct before extract throws", "[csv][adapter]") {
    CsvAdapter adapter;
    CHECK_THROWS_AS(adapter.reconstruct({}), DocumentError);
}
