#include "format/pdf_adapter.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <utility>

namespace docanon {

std::vector<StructuralUnit> PdfAdapter::extract(const std::string& document) {
    return extract_items(PdfReader::read(document));
}

std::vector<PdfItem> PdfAdapter::group_blocks(std::vector<PdfItem> items) {
    const auto reading_order = [](const PdfItem& a, const PdfItem& b) {
        if (a.page != b.page) return a.page < b.page;
        if (a.y != b.y) return a.y < b.y;
        return a.x < b.x;
    };
    std::stable_sort(items.begin(), items.end(), reading_order);

    std::vector<PdfItem> out;
    out.reserve(items.size());
    // Per block in `out`: bottom edge and height of its last line
    std::vector<std::pair<double, double>> last_line(items.size());

    for (auto& item : items) {
        if (item.kind == PdfItem::Kind::TEXT) {
            auto target = out.end();
            for (auto it = out.rbegin(); it != out.rend(); ++it) {
                if (it->page != item.page) break;
                if (it->kind != PdfItem::Kind::TEXT) continue;
                const auto& [bottom, height] = last_line[static_cast<size_t>(out.rend() - it - 1)];
                const double line_height = std::max(height, item.height);
                const double gap = item.y - bottom;
                const bool below = gap >= -line_height / 2.0 && gap <= line_height;
                const bool overlaps = item.x < it->x + it->width && item.x + item.width > it->x;
                if (below && overlaps) {
                    target = std::prev(it.base());
                    break;
                }
            }
            if (target != out.end()) {
                const double right = std::max(target->x + target->width, item.x + item.width);
                target->x = std::min(target->x, item.x);
                target->width = right - target->x;
                target->height = item.y + item.height - target->y;
                target->text += ' ';
                target->text += item.text;
                last_line[static_cast<size_t>(target - out.begin())] = {item.y + item.height, item.height};
                continue;
            }
        }
        last_line[out.size()] = {item.y + item.height, item.height};
        out.push_back(std::move(item));
    }

    std::stable_sort(out.begin(), out.end(), reading_order);
    return out;
}

std::vector<StructuralUnit> PdfAdapter::extract_items(std::vector<PdfItem> items) {
    const size_t lines = items.size();
    items = group_blocks(std::move(items));

    parts_.clear();
    std::vector<StructuralUnit> units;
    units.reserve(items.size());

    size_t images = 0;
    for (size_t i = 0; i < items.size(); ++i) {
        auto& item = items[i];
        std::string text = item.kind == PdfItem::Kind::IMAGE
            ? ocr_.extract(item.image)
            : std::move(item.text);
        if (item.kind == PdfItem::Kind::IMAGE) ++images;

        units.emplace_back(text, UnitPosition::layout(item.page, item.x, item.y, i));
        parts_.push_back(std::move(text));
    }

    extracted_ = true;
    utils::log::debug(std::format("pdf: {} items grouped into {} units ({} images)",
        lines, units.size(), images));
    return units;
}

std::string PdfAdapter::reconstruct(const TranslationMap& mapping) {
    if (!extracted_) throw DocumentError("pdf: reconstruct() called before extract()");

    std::string out;
    for (const auto& part : parts_) {
        const auto& text = translate(mapping, part);
        if (text.empty()) continue;
        if (!out.empty()) out += '\n';
        out += text;
    }
    return out;
}

} // namespace docanon
