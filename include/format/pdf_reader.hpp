#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace docanon {

/**
 * @brief One positioned piece of page content
 *
 * Coordinates are in points with a top-left origin, so sorting by (y, x)
 * gives reading order.
 */
struct PdfItem {
    enum class Kind { TEXT, IMAGE };

    Kind kind = Kind::TEXT;
    size_t page = 0;
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;
    std::string text;            // TEXT: one line
    std::vector<uint8_t> image;  // IMAGE: PNG-encoded pixels
};

/**
 * @brief Pulls text lines and embedded raster images out of a PDF
 *
 * Text comes from poppler-cpp's word list, merged into lines. Images are
 * captured by rendering each page through a poppler OutputDev that only
 * records drawImage calls, and are re-encoded as PNG with Leptonica.
 */
class PdfReader {
public:
    /**
     * @throws DocumentError if the bytes are not a readable, unlocked PDF
     */
    [[nodiscard]] static std::vector<PdfItem> read(const std::string& bytes);

private:
    static void read_text(const std::string& bytes, std::vector<PdfItem>& items);
    static void read_images(const std::string& bytes, std::vector<PdfItem>& items);
};

} // namespace docanon
