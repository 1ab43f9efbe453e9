#pragma once

#include "format/csv_codec.hpp"
#include "format/iformat_adapter.hpp"

namespace docanon {

/**
 * @brief Delimited table: one unit per data cell
 *
 * The first record is the header and passes through unchanged. Output keeps
 * the row count, row widths and column order of the input.
 */
class CsvAdapter : public IFormatAdapter {
public:
    explicit CsvAdapter(char delimiter = ',') : delimiter_(delimiter) {}

    std::vector<StructuralUnit> extract(const std::string& document) override;
    std::string reconstruct(const TranslationMap& mapping) override;
    std::string_view output_extension() const override { return ".csv"; }

private:
    char delimiter_;
    std::vector<csv::Row> rows_;
    bool extracted_ = false;
};

} // namespace docanon
