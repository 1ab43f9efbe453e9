#include <catch2/catch_test_macros.hpp>
#include "anon/slug_generator.hpp"
#include "core/error.hpp"
#include "mocks/test_fixtures.hpp"

using namespace docanon;
using docanon::testing::make_key;

// ============================================================================
// Hashing
// ============================================================================

TEST_CASE("SlugGenerator: full hash is HMAC-SHA256 hex", "[slug]") {
    // RFC 4231 test case 2
    const SlugGenerator slugs(make_key("Jefe"), std::nullopt);
    CHECK(slugs.full_hash("what do ya want for nothing?") ==
          "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST_CASE("SlugGenerator: same text, type and key give the same token", "[slug]") {
    const SlugGenerator slugs(make_key(), std::nullopt);
    std::vector<CollectedEntity> collected;
    RunCounters counters;

    const auto a = slugs.generate("John Doe", "PERSON", collected, counters);
    const auto b = slugs.generate("John Doe", "PERSON", collected, counters);
    CHECK(a == b);
    CHECK(a.starts_with("[PERSON_"));
    CHECK(a.ends_with("]"));
}

TEST_CASE("SlugGenerator: different keys give different hashes", "[slug]") {
    const SlugGenerator one(make_key("key-one-0123456789"), std::nullopt);
    const SlugGenerator two(make_key("key-two-0123456789"), std::nullopt);
    CHECK(one.full_hash("John Doe") != two.full_hash("John Doe"));
}

TEST_CASE("SlugGenerator: whitespace variants normalize to one identity", "[slug]") {
    CHECK(SlugGenerator::normalize("  John \t\n  Doe  ") == "John Doe");
    CHECK(SlugGenerator::normalize("John Doe") == "John Doe");
    CHECK(SlugGenerator::normalize("   ").empty());

    const SlugGenerator slugs(make_key(), std::nullopt);
    std::vector<CollectedEntity> collected;
    RunCounters counters;
    CHECK(slugs.generate("John  Doe", "PERSON", collected, counters) ==
          slugs.generate("John\nDoe", "PERSON", collected, counters));
    CHECK(collected[0].original_text == "John Doe");
}

// ============================================================================
// Display length
// ============================================================================

TEST_CASE("SlugGenerator: display hash length follows slug_length", "[slug]") {
    std::vector<CollectedEntity> collected;
    RunCounters counters;

    SECTION("default is the full 64 characters") {
        const SlugGenerator slugs(make_key(), std::nullopt);
        slugs.generate("test@example.com", "EMAIL_ADDRESS", collected, counters);
        CHECK(collected.back().display_hash.size() == 64);
        CHECK(collected.back().display_hash == collected.back().full_hash);
    }

    SECTION("8 characters, full hash unchanged") {
        const SlugGenerator slugs(make_key(), 8);
        const auto token = slugs.generate("test@example.com", "EMAIL_ADDRESS", collected, counters);
        const auto& rec = collected.back();
        CHECK(rec.display_hash.size() == 8);
        CHECK(rec.full_hash.size() == 64);
        CHECK(rec.full_hash.starts_with(rec.display_hash));
        CHECK(token == "[EMAIL_ADDRESS_" + rec.display_hash + "]");
    }

    SECTION("1 character is allowed") {
        const SlugGenerator slugs(make_key(), 1);
        slugs.generate("x", "PERSON", collected, counters);
        CHECK(collected.back().display_hash.size() == 1);
    }
}

TEST_CASE("SlugGenerator: rejects bad configuration", "[slug]") {
    CHECK_THROWS_AS(SlugGenerator(make_key(), 0), ConfigurationError);
    CHECK_THROWS_AS(SlugGenerator(make_key(), 65), ConfigurationError);
    CHECK_THROWS_AS(SlugGenerator(make_key(""), std::nullopt), ConfigurationError);
    CHECK_NOTHROW(SlugGenerator(make_key(), 64));
}

TEST_CASE("SlugGenerator: generate feeds collector and counters", "[slug]") {
    const SlugGenerator slugs(make_key(), 12);
    std::vector<CollectedEntity> collected;
    RunCounters counters;

    slugs.generate("John Doe", "PERSON", collected, counters);
    slugs.generate("Jane Roe", "PERSON", collected, counters);
    slugs.generate("test@example.com", "EMAIL_ADDRESS", collected, counters);

    REQUIRE(collected.size() == 3);
    CHECK(collected[0].entity_type == "PERSON");
    CHECK(collected[2].entity_type == "EMAIL_ADDRESS");
    CHECK(counters.total_entities_processed == 3);
    CHECK(counters.entity_counts.at("PERSON") == 2);
    CHECK(counters.entity_counts.at("EMAIL_ADDRESS") == 1);
}

TEST_CASE("SlugGenerator: token format", "[slug]") {
    CHECK(SlugGenerator::format_token("PERSON", "abc123") == "[PERSON_abc123]");
}
