#include "format/csv_adapter.hpp"
#include "core/error.hpp"

namespace docanon {

std::vector<StructuralUnit> CsvAdapter::extract(const std::string& document) {
    rows_ = csv::parse(document, delimiter_);
    extracted_ = true;

    std::vector<StructuralUnit> units;
    for (size_t r = 1; r < rows_.size(); ++r) {
        for (size_t c = 0; c < rows_[r].size(); ++c) {
            units.emplace_back(rows_[r][c], UnitPosition::cell(0, r, c));
        }
    }
    return units;
}

std::string CsvAdapter::reconstruct(const TranslationMap& mapping) {
    if (!extracted_) throw DocumentError("csv: reconstruct() called before extract()");

    auto out = rows_;
    for (size_t r = 1; r < out.size(); ++r) {
        for (auto& cell : out[r]) {
            cell = translate(mapping, cell);
        }
    }
    return csv::write(out, delimiter_);
}

} // namespace docanon
