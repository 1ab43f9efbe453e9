#include <catch2/catch_test_macros.hpp>
#include "anon/orchestrator.hpp"
#include "mocks/fake_entity_detector.hpp"
#include "mocks/test_fixtures.hpp"

#include <chrono>
#include <format>
#include <stdexcept>
#include <thread>

using namespace docanon;
using docanon::testing::FakeEntityDetector;
using docanon::testing::make_key;
using docanon::testing::make_memory_registry;
using docanon::testing::tokens_in;

namespace {

const std::string kSentence = "My name is John Doe and my email is test@example.com.";

FakeEntityDetector sentence_detector() {
    FakeEntityDetector detector;
    detector.add("John Doe", "PERSON", 0.85).add("test@example.com", "EMAIL_ADDRESS", 1.0);
    return detector;
}

} // anonymous namespace

// ============================================================================
// End-to-end scenarios
// ============================================================================

TEST_CASE("Orchestrator: person and email are replaced by tokens", "[orchestrator]") {
    auto detector = sentence_detector();
    auto registry = make_memory_registry();
    const auto key = make_key();
    Orchestrator orch(AnonymizationConfig{}, detector, key, registry.get());

    const auto out = orch.anonymize_text(kSentence);

    const auto tokens = tokens_in(out);
    REQUIRE(tokens.size() == 2);
    CHECK(tokens[0].first == "PERSON");
    CHECK(tokens[1].first == "EMAIL_ADDRESS");
    CHECK(out == std::format("My name is [PERSON_{}] and my email is [EMAIL_ADDRESS_{}].",
                             tokens[0].second, tokens[1].second));
    CHECK(out.find("John Doe") == std::string::npos);
    CHECK(out.find("test@example.com") == std::string::npos);
    CHECK(registry->count() == 2);

    CHECK(orch.counters().total_entities_processed == 2);
    CHECK(orch.counters().entity_counts.at("PERSON") == 1);
}

TEST_CASE("Orchestrator: re-running reuses tokens and only advances last_seen", "[orchestrator]") {
    auto detector = sentence_detector();
    auto registry = make_memory_registry();
    const auto key = make_key();

    Orchestrator first(AnonymizationConfig{}, detector, key, registry.get());
    const auto out1 = first.anonymize_text(kSentence);
    const auto tokens = tokens_in(out1);
    REQUIRE(tokens.size() == 2);
    const auto rec_before = registry->find_by_display_hash(tokens[0].second);
    REQUIRE(rec_before.has_value());

    std::this_thread::sleep_for(std::chrono::milliseconds(5));

    Orchestrator second(AnonymizationConfig{}, detector, key, registry.get());
    const auto out2 = second.anonymize_text(kSentence);
    CHECK(out2 == out1);
    CHECK(registry->count() == 2);

    const auto rec_after = registry->find_by_display_hash(tokens[0].second);
    REQUIRE(rec_after.has_value());
    CHECK(rec_after->first_seen == rec_before->first_seen);
    CHECK(rec_after->last_seen > rec_before->last_seen);
    CHECK(rec_after->original_text == "John Doe");
}

TEST_CASE("Orchestrator: slug_length 8 truncates display hash only", "[orchestrator]") {
    auto detector = sentence_detector();
    auto registry = make_memory_registry();
    const auto key = make_key();

    AnonymizationConfig cfg;
    cfg.slug_length = 8;
    Orchestrator orch(cfg, detector, key, registry.get());

    const auto tokens = tokens_in(orch.anonymize_text(kSentence));
    REQUIRE(tokens.size() == 2);
    for (const auto& [type, hash] : tokens) {
        CHECK(hash.size() == 8);
        const auto rec = registry->find_by_display_hash(hash);
        REQUIRE(rec.has_value());
        CHECK(rec->full_hash.size() == 64);
        CHECK(rec->full_hash.starts_with(hash));
    }
}

TEST_CASE("Orchestrator: preserved type is left verbatim", "[orchestrator]") {
    auto detector = sentence_detector();
    const auto key = make_key();

    AnonymizationConfig cfg;
    cfg.preserve_entity_types = {"PERSON"};
    Orchestrator orch(cfg, detector, key);

    const auto out = orch.anonymize_text(kSentence);
    CHECK(out.find("John Doe") != std::string::npos);
    CHECK(out.find("test@example.com") == std::string::npos);
    CHECK_FALSE(orch.active_entity_types().contains("PERSON"));
    CHECK(orch.active_entity_types().contains("EMAIL_ADDRESS"));
}

TEST_CASE("Orchestrator: allow-listed text is never replaced", "[orchestrator]") {
    FakeEntityDetector detector;
    detector.add("Acme", "ORGANIZATION").add("John Doe", "PERSON");
    const auto key = make_key();

    AnonymizationConfig cfg;
    cfg.allow_list = {"Acme"};
    Orchestrator orch(cfg, detector, key);

    const auto out = orch.anonymize_text("John Doe works at Acme.");
    CHECK(out.find("Acme") != std::string::npos);
    CHECK(out.find("John Doe") == std::string::npos);
    CHECK(orch.counters().total_entities_processed == 1);
}

// ============================================================================
// Detection plumbing
// ============================================================================

TEST_CASE("Orchestrator: spans below the threshold are not replaced", "[orchestrator]") {
    FakeEntityDetector detector;
    detector.add("maybe", "PERSON", 0.3).add("surely", "PERSON", 0.9);
    const auto key = make_key();
    Orchestrator orch(AnonymizationConfig{}, detector, key);

    const auto out = orch.anonymize_text("maybe surely");
    CHECK(out.starts_with("maybe [PERSON_"));
}

TEST_CASE("Orchestrator: blank text bypasses the detector", "[orchestrator]") {
    auto detector = sentence_detector();
    const auto key = make_key();
    Orchestrator orch(AnonymizationConfig{}, detector, key);

    CHECK(orch.anonymize_text("").empty());
    CHECK(orch.anonymize_text("  \n\t ") == "  \n\t ");
    CHECK(detector.analyze_calls() == 0);
}

TEST_CASE("Orchestrator: everything preserved means no detection", "[orchestrator]") {
    auto detector = sentence_detector();
    const auto key = make_key();

    AnonymizationConfig cfg;
    cfg.preserve_entity_types = {"PERSON", "EMAIL_ADDRESS"};
    Orchestrator orch(cfg, detector, key);

    CHECK(orch.anonymize_text(kSentence) == kSentence);
    CHECK(orch.anonymize_batch({kSentence, kSentence}) == std::vector<std::string>{kSentence, kSentence});
    CHECK(detector.analyze_calls() == 0);
}

TEST_CASE("Orchestrator: unknown preserve types are ignored", "[orchestrator]") {
    auto detector = sentence_detector();
    const auto key = make_key();

    AnonymizationConfig cfg;
    cfg.preserve_entity_types = {"NOT_A_TYPE"};
    Orchestrator orch(cfg, detector, key);

    CHECK(orch.active_entity_types().size() == 2);
    CHECK(tokens_in(orch.anonymize_text(kSentence)).size() == 2);
}

TEST_CASE("Orchestrator: out-of-range spans are dropped", "[orchestrator]") {
    FakeEntityDetector detector;
    detector.add_span("short", DetectedSpan(2, 50, "PERSON", 0.9));
    const auto key = make_key();
    Orchestrator orch(AnonymizationConfig{}, detector, key);

    CHECK(orch.anonymize_text("short") == "short");
}

// ============================================================================
// Batching
// ============================================================================

TEST_CASE("Orchestrator: batch keeps order and chunks by batch_size", "[orchestrator][batch]") {
    FakeEntityDetector detector;
    detector.add("John Doe", "PERSON");
    const auto key = make_key();
    Orchestrator orch(AnonymizationConfig{}, detector, key);

    const std::vector<std::string> texts = {
        "a John Doe", "", "b", "c John Doe", "   ", "d",
    };
    const auto out = orch.anonymize_batch(texts, 2);

    REQUIRE(out.size() == texts.size());
    CHECK(out[0].starts_with("a [PERSON_"));
    CHECK(out[1].empty());
    CHECK(out[2] == "b");
    CHECK(out[3].starts_with("c [PERSON_"));
    CHECK(out[4] == "   ");
    CHECK(out[5] == "d");
    CHECK(out[0].substr(2) == out[3].substr(2));

    // Four non-blank texts in chunks of two
    CHECK(detector.batch_sizes() == std::vector<size_t>{2, 2});
}

TEST_CASE("Orchestrator: batch with a repeated value writes one row", "[orchestrator][batch]") {
    FakeEntityDetector detector;
    detector.add("John Doe", "PERSON");
    auto registry = make_memory_registry();
    const auto key = make_key();
    Orchestrator orch(AnonymizationConfig{}, detector, key, registry.get());

    const auto out = orch.anonymize_batch({"John Doe", "hello John Doe", "John   Doe?"}, 32);
    CHECK(registry->count() == 1);
    CHECK(orch.counters().entity_counts.at("PERSON") == 2);
    CHECK(out[1] == "hello " + out[0]);
}

TEST_CASE("Orchestrator: batch_size 0 is rejected", "[orchestrator][batch]") {
    auto detector = sentence_detector();
    const auto key = make_key();
    Orchestrator orch(AnonymizationConfig{}, detector, key);
    CHECK_THROWS_AS(orch.anonymize_batch({kSentence}, 0), std::invalid_argument);
}

// ============================================================================
// Overlap policy
// ============================================================================

TEST_CASE("Orchestrator: overlap resolution", "[orchestrator][overlap]") {
    SECTION("leftmost span wins") {
        const auto kept = Orchestrator::resolve_overlaps({
            DetectedSpan(5, 15, "B", 0.99),
            DetectedSpan(0, 10, "A", 0.5),
        });
        REQUIRE(kept.size() == 1);
        CHECK(kept[0].entity_type == "A");
    }

    SECTION("equal start: higher score, then longer, then type name") {
        auto kept = Orchestrator::resolve_overlaps({
            DetectedSpan(0, 4, "LOW", 0.6),
            DetectedSpan(0, 4, "HIGH", 0.9),
        });
        REQUIRE(kept.size() == 1);
        CHECK(kept[0].entity_type == "HIGH");

        kept = Orchestrator::resolve_overlaps({
            DetectedSpan(0, 4, "SHORT", 0.8),
            DetectedSpan(0, 9, "LONG", 0.8),
        });
        REQUIRE(kept.size() == 1);
        CHECK(kept[0].entity_type == "LONG");

        kept = Orchestrator::resolve_overlaps({
            DetectedSpan(0, 4, "ZETA", 0.8),
            DetectedSpan(0, 4, "ALPHA", 0.8),
        });
        REQUIRE(kept.size() == 1);
        CHECK(kept[0].entity_type == "ALPHA");
    }

    SECTION("adjacent spans both survive") {
        const auto kept = Orchestrator::resolve_overlaps({
            DetectedSpan(4, 8, "B", 0.7),
            DetectedSpan(0, 4, "A", 0.7),
        });
        REQUIRE(kept.size() == 2);
        CHECK(kept[0].start == 0);
        CHECK(kept[1].start == 4);
    }

    SECTION("a span inside an accepted one is dropped") {
        const auto kept = Orchestrator::resolve_overlaps({
            DetectedSpan(0, 20, "URL", 0.7),
            DetectedSpan(8, 12, "HOSTNAME", 0.9),
            DetectedSpan(25, 30, "PERSON", 0.8),
        });
        REQUIRE(kept.size() == 2);
        CHECK(kept[0].entity_type == "URL");
        CHECK(kept[1].entity_type == "PERSON");
    }
}

TEST_CASE("Orchestrator: overlapping detections produce one token", "[orchestrator][overlap]") {
    FakeEntityDetector detector;
    detector.add("https://example.com/x", "URL", 0.7).add("example.com", "HOSTNAME", 0.9);
    const auto key = make_key();
    Orchestrator orch(AnonymizationConfig{}, detector, key);

    const auto out = orch.anonymize_text("see https://example.com/x now");
    const auto tokens = tokens_in(out);
    REQUIRE(tokens.size() == 1);
    CHECK(tokens[0].first == "URL");
    CHECK(out.find("example.com") == std::string::npos);
}
