#include "format/json_adapter.hpp"
#include "core/error.hpp"
#include "core/json.hpp"

#include <format>
#include <string_view>
#include <utility>

namespace docanon {

namespace {

/**
 * @brief Walks an already-validated document and records string leaf offsets
 */
class LeafScanner {
public:
    explicit LeafScanner(std::string_view doc) : doc_(doc) {}

    std::vector<JsonAdapter::StringLeaf> scan() {
        value("$");
        return std::move(leaves_);
    }

private:
    char peek() {
        skip_ws();
        if (pos_ >= doc_.size()) {
            throw DocumentError("json: unexpected end of document");
        }
        return doc_[pos_];
    }

    void expect(char c) {
        if (peek() != c) {
            throw DocumentError(std::format("json: expected '{}' at offset {}", c, pos_));
        }
        ++pos_;
    }

    void skip_ws() {
        while (pos_ < doc_.size() &&
               (doc_[pos_] == ' ' || doc_[pos_] == '\t' || doc_[pos_] == '\n' || doc_[pos_] == '\r')) {
            ++pos_;
        }
    }

    std::string_view string_literal() {
        const size_t begin = pos_;
        expect('"');
        while (pos_ < doc_.size() && doc_[pos_] != '"') {
            pos_ += doc_[pos_] == '\\' ? 2 : 1;
        }
        if (pos_ >= doc_.size()) {
            throw DocumentError("json: unterminated string");
        }
        ++pos_;
        return doc_.substr(begin, pos_ - begin);
    }

    void value(const std::string& path) {
        switch (peek()) {
            case '{': object(path); break;
            case '[': array(path); break;
            case '"': {
                const size_t begin = pos_;
                const auto literal = string_literal();
                leaves_.push_back({begin, pos_, path, json::decode_string(literal)});
                break;
            }
            default:
                // number, true, false, null
                while (pos_ < doc_.size() && doc_[pos_] != ',' && doc_[pos_] != '}' &&
                       doc_[pos_] != ']' && doc_[pos_] != ' ' && doc_[pos_] != '\t' &&
                       doc_[pos_] != '\n' && doc_[pos_] != '\r') {
                    ++pos_;
                }
        }
    }

    void object(const std::string& path) {
        expect('{');
        if (peek() == '}') { ++pos_; return; }
        while (true) {
            const auto key = json::decode_string(string_literal());
            expect(':');
            value(std::format("{}.{}", path, key));
            if (peek() == '}') { ++pos_; return; }
            expect(',');
        }
    }

    void array(const std::string& path) {
        expect('[');
        if (peek() == ']') { ++pos_; return; }
        for (size_t index = 0;; ++index) {
            value(std::format("{}[{}]", path, index));
            if (peek() == ']') { ++pos_; return; }
            expect(',');
        }
    }

    std::string_view doc_;
    size_t pos_ = 0;
    std::vector<JsonAdapter::StringLeaf> leaves_;
};

} // anonymous namespace

std::vector<StructuralUnit> JsonAdapter::extract(const std::string& document) {
    try {
        (void)json::parse(document);
        leaves_ = LeafScanner(document).scan();
    } catch (const json::parse_error& e) {
        throw DocumentError(std::format("json: {}", e.what()));
    }
    source_ = document;
    extracted_ = true;

    std::vector<StructuralUnit> units;
    units.reserve(leaves_.size());
    for (const auto& leaf : leaves_) {
        units.emplace_back(leaf.text, UnitPosition::json_path(leaf.path));
    }
    return units;
}

std::string JsonAdapter::reconstruct(const TranslationMap& mapping) {
    if (!extracted_) throw DocumentError("json: reconstruct() called before extract()");

    std::string out;
    out.reserve(source_.size());
    size_t copied = 0;
    for (const auto& leaf : leaves_) {
        const auto it = mapping.find(leaf.text);
        if (it == mapping.end()) continue;
        out.append(source_, copied, leaf.begin - copied);
        try {
            out += json::encode_string(it->second);
        } catch (const std::runtime_error& e) {
            throw DocumentError(std::format("json: {}", e.what()));
        }
        copied = leaf.end;
    }
    out.append(source_, copied, std::string::npos);
    return out;
}

} // namespace docanon
