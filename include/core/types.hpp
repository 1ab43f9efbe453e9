#pragma once

#include <string>
#include <vector>
#include <map>
#include <unordered_set>
#include <optional>
#include <cstdint>
#include <cstddef>

namespace docanon {

// ============================================================================
// Detection
// ============================================================================

/**
 * @brief Sensitive-text region reported by an entity detector
 *
 * Offsets are byte offsets into the UTF-8 text the detector was given,
 * half-open [start, end).
 */
struct DetectedSpan {
    size_t start = 0;
    size_t end = 0;
    std::string entity_type;
    double score = 0.0;

    DetectedSpan() = default;
    DetectedSpan(size_t s, size_t e, std::string type, double sc)
        : start(s), end(e), entity_type(std::move(type)), score(sc) {}

    [[nodiscard]] size_t length() const { return end - start; }
};

inline constexpr double kDefaultScoreThreshold = 0.6;
inline constexpr size_t kFullHashLength = 64;
inline constexpr size_t kDefaultBatchSize = 32;

// ============================================================================
// Anonymization
// ============================================================================

/**
 * @brief Per-run anonymization settings (immutable once an Orchestrator is built)
 */
struct AnonymizationConfig {
    std::string language = "en";
    std::unordered_set<std::string> allow_list;             // verbatim, case-sensitive
    std::unordered_set<std::string> preserve_entity_types;  // upper-case entity names
    std::optional<size_t> slug_length;                      // 1..64, nullopt = 64
    double score_threshold = kDefaultScoreThreshold;
};

/**
 * @brief One slug emission: (entity_type, normalized_text, display_hash, full_hash)
 */
struct CollectedEntity {
    std::string entity_type;
    std::string original_text;
    std::string display_hash;
    std::string full_hash;
};

/**
 * @brief Persisted registry row
 */
struct EntityRecord {
    std::string entity_type;
    std::string original_text;
    std::string display_hash;
    std::string full_hash;
    std::string first_seen;
    std::string last_seen;
};

/**
 * @brief Counters accumulated by one Orchestrator instance
 */
struct RunCounters {
    uint64_t total_entities_processed = 0;
    std::map<std::string, uint64_t> entity_counts;  // sorted for reporting
};

// ============================================================================
// Structural units
// ============================================================================

enum class PositionKind {
    CHAR_RANGE,   // flat text: [begin, end) into the content
    CELL,         // tabular/grid: sheet, row, column
    TREE_NODE,    // markup: pre-order index of the text node + its path
    JSON_PATH,    // nested key/value: path of the leaf string
    LAYOUT,       // paginated: page, top-left corner, reading order
    RUN,          // rich text: paragraph + run index
    IMAGE_TEXT    // OCR output of an embedded image
};

/**
 * @brief Where a unit came from, in the container's own coordinates
 *
 * Only the fields relevant to `kind` are meaningful.
 */
struct UnitPosition {
    PositionKind kind = PositionKind::CHAR_RANGE;
    size_t begin = 0;
    size_t end = 0;
    size_t sheet = 0;
    size_t row = 0;
    size_t column = 0;
    size_t page = 0;
    size_t order = 0;
    double x = 0.0;
    double y = 0.0;
    std::string path;

    static UnitPosition char_range(size_t b, size_t e) {
        UnitPosition p;
        p.kind = PositionKind::CHAR_RANGE;
        p.begin = b;
        p.end = e;
        return p;
    }

    static UnitPosition cell(size_t sheet_idx, size_t row_idx, size_t col_idx) {
        UnitPosition p;
        p.kind = PositionKind::CELL;
        p.sheet = sheet_idx;
        p.row = row_idx;
        p.column = col_idx;
        return p;
    }

    static UnitPosition tree_node(size_t index, std::string node_path) {
        UnitPosition p;
        p.kind = PositionKind::TREE_NODE;
        p.order = index;
        p.path = std::move(node_path);
        return p;
    }

    static UnitPosition json_path(std::string leaf_path) {
        UnitPosition p;
        p.kind = PositionKind::JSON_PATH;
        p.path = std::move(leaf_path);
        return p;
    }

    static UnitPosition layout(size_t page_idx, double left, double top, size_t reading_order) {
        UnitPosition p;
        p.kind = PositionKind::LAYOUT;
        p.page = page_idx;
        p.x = left;
        p.y = top;
        p.order = reading_order;
        return p;
    }

    static UnitPosition run(size_t paragraph, size_t run_idx) {
        UnitPosition p;
        p.kind = PositionKind::RUN;
        p.row = paragraph;
        p.column = run_idx;
        return p;
    }

    static UnitPosition image_text(size_t sheet_or_page, size_t image_idx) {
        UnitPosition p;
        p.kind = PositionKind::IMAGE_TEXT;
        p.sheet = sheet_or_page;
        p.order = image_idx;
        return p;
    }
};

/**
 * @brief One extractable text fragment plus where to put its replacement
 */
struct StructuralUnit {
    std::string text;
    UnitPosition position;

    StructuralUnit() = default;
    StructuralUnit(std::string t, UnitPosition pos)
        : text(std::move(t)), position(std::move(pos)) {}
};

} // namespace docanon
