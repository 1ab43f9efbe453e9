#include "format/pdf_reader.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <poppler-document.h>
#include <poppler-page.h>

#include <GfxState.h>
#include <GlobalParams.h>
#include <Object.h>
#include <OutputDev.h>
#include <PDFDoc.h>
#include <Stream.h>

#include <leptonica/allheaders.h>

#include <algorithm>
#include <cmath>
#include <format>
#include <memory>

namespace docanon {

namespace {

/**
 * @brief Encode an RGB buffer as PNG; empty on failure
 */
std::vector<uint8_t> encode_png(const std::vector<uint8_t>& rgb, int width, int height) {
    PIX* pix = pixCreate(width, height, 32);
    if (!pix) return {};

    for (int row = 0; row < height; ++row) {
        for (int col = 0; col < width; ++col) {
            const size_t off = (static_cast<size_t>(row) * width + col) * 3;
            pixSetRGBPixel(pix, col, row, rgb[off], rgb[off + 1], rgb[off + 2]);
        }
    }

    l_uint8* data = nullptr;
    size_t size = 0;
    std::vector<uint8_t> out;
    if (pixWriteMem(&data, &size, pix, IFF_PNG) == 0 && data) {
        out.assign(data, data + size);
    }
    if (data) lept_free(data);
    pixDestroy(&pix);
    return out;
}

/**
 * @brief Records every raster image drawn on a page, nothing else
 */
class ImageCaptureOutputDev : public OutputDev {
public:
    explicit ImageCaptureOutputDev(std::vector<PdfItem>& items) : items_(items) {}

    void set_page(size_t page) { page_ = page; }

    // Top-left origin, matching poppler-cpp text boxes
    bool upsideDown() override { return true; }
    bool useDrawChar() override { return false; }
    bool interpretType3Chars() override { return false; }
    bool needNonText() override { return true; }

    void drawImage(GfxState* state, Object* /*ref*/, Stream* str, int width, int height,
                   GfxImageColorMap* color_map, bool /*interpolate*/,
                   const int* /*mask_colors*/, bool /*inline_img*/) override {
        if (width <= 0 || height <= 0 || !color_map) return;

        const auto& ctm = state->getCTM();
        const double xs[] = {ctm[4], ctm[4] + ctm[0], ctm[4] + ctm[2], ctm[4] + ctm[0] + ctm[2]};
        const double ys[] = {ctm[5], ctm[5] + ctm[1], ctm[5] + ctm[3], ctm[5] + ctm[1] + ctm[3]};

        const int comps = color_map->getNumPixelComps();
        ImageStream image_stream(str, width, comps, color_map->getBits());
        image_stream.reset();

        std::vector<uint8_t> rgb(static_cast<size_t>(width) * height * 3, 0xFF);
        GfxRGB pixel;
        for (int row = 0; row < height; ++row) {
            unsigned char* line = image_stream.getLine();
            if (!line) break;
            for (int col = 0; col < width; ++col) {
                color_map->getRGB(&line[col * comps], &pixel);
                const size_t off = (static_cast<size_t>(row) * width + col) * 3;
                rgb[off] = colToByte(pixel.r);
                rgb[off + 1] = colToByte(pixel.g);
                rgb[off + 2] = colToByte(pixel.b);
            }
        }
        image_stream.close();

        PdfItem item;
        item.kind = PdfItem::Kind::IMAGE;
        item.page = page_;
        item.x = *std::min_element(std::begin(xs), std::end(xs));
        item.y = *std::min_element(std::begin(ys), std::end(ys));
        item.image = encode_png(rgb, width, height);
        if (item.image.empty()) {
            utils::log::warn(std::format("pdf: could not encode {}x{} image on page {}",
                width, height, page_ + 1));
            return;
        }
        items_.push_back(std::move(item));
    }

private:
    std::vector<PdfItem>& items_;
    size_t page_ = 0;
};

} // anonymous namespace

std::vector<PdfItem> PdfReader::read(const std::string& bytes) {
    std::vector<PdfItem> items;
    read_text(bytes, items);
    read_images(bytes, items);
    return items;
}

void PdfReader::read_text(const std::string& bytes, std::vector<PdfItem>& items) {
    std::unique_ptr<poppler::document> doc(poppler::document::load_from_raw_data(
        bytes.data(), static_cast<int>(bytes.size())));
    if (!doc) {
        throw DocumentError("pdf: not a readable PDF document");
    }
    if (doc->is_locked()) {
        throw DocumentError("pdf: document is encrypted");
    }

    const int pages = doc->pages();
    for (int index = 0; index < pages; ++index) {
        std::unique_ptr<poppler::page> page(doc->create_page(index));
        if (!page) continue;

        PdfItem line;
        bool open = false;
        bool space_pending = false;
        double right = 0.0;

        const auto flush = [&] {
            if (open) {
                line.width = right - line.x;
                line.text = utils::trim(line.text);
                if (!line.text.empty()) items.push_back(std::move(line));
            }
            line = PdfItem{};
            open = false;
        };

        // Boxes come in reading order with a top-left origin
        for (const auto& box : page->text_list()) {
            const auto utf8 = box.text().to_utf8();
            const std::string word(utf8.begin(), utf8.end());
            if (word.empty()) continue;

            const auto bbox = box.bbox();
            const bool same_line = open &&
                std::abs(bbox.y() - line.y) <= std::max(line.height, bbox.height()) / 2.0;
            if (!same_line) {
                flush();
                line.kind = PdfItem::Kind::TEXT;
                line.page = static_cast<size_t>(index);
                line.x = bbox.x();
                line.y = bbox.y();
                line.height = bbox.height();
                right = bbox.x() + bbox.width();
                open = true;
            } else if (space_pending) {
                line.text += ' ';
            }
            line.text += word;
            line.x = std::min(line.x, bbox.x());
            line.height = std::max(line.height, bbox.height());
            right = std::max(right, bbox.x() + bbox.width());
            space_pending = box.has_space_after();
        }
        flush();
    }
}

void PdfReader::read_images(const std::string& bytes, std::vector<PdfItem>& items) {
    const GlobalParamsIniter global_params(nullptr);

    // MemStream reads from the caller's buffer; ownership passes to PDFDoc
    auto stream = std::make_unique<MemStream>(bytes.data(), 0,
        static_cast<Goffset>(bytes.size()), Object(objNull));
    auto doc = std::make_unique<PDFDoc>(stream.release());
    if (!doc->isOk()) {
        throw DocumentError(std::format("pdf: cannot open document (error {})", doc->getErrorCode()));
    }

    ImageCaptureOutputDev capture(items);
    const int pages = doc->getNumPages();
    for (int page = 1; page <= pages; ++page) {
        capture.set_page(static_cast<size_t>(page - 1));
        doc->displayPage(&capture, page, 72.0, 72.0, 0, true, false, false);
    }
}

} // namespace docanon
