#pragma once

#include "Errors.h"
#include "Result.h"

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace CarveSim {

/**
 * @brief Pre-rasterized text mask consumed by Grid::build().
 *
 * Pixels are row-major; `true` marks text (protected), `false` marks
 * background (carveable). No validation happens here: Grid::build() owns
 * the dimension and pixel-count checks.
 */
struct BinaryImage {
    int width = 0;
    int height = 0;
    std::vector<bool> pixels;

    // Grayscale values below this are treated as text ink.
    static constexpr int INK_THRESHOLD = 128;

    bool at(int x, int y) const { return pixels[static_cast<size_t>(y) * width + x]; }

    /**
     * @brief Build from ASCII-art rows. '#', 'X', 'x' and '1' are text;
     * anything else is background. Short rows are padded with background.
     */
    static BinaryImage fromRows(const std::vector<std::string>& rows);

    /**
     * @brief Threshold an 8-bit grayscale buffer (dark = text).
     */
    static BinaryImage fromGrayscale(int width, int height, const std::vector<uint8_t>& gray);

    size_t countSet() const;
};

/**
 * @brief Parse a Netpbm bitmap (P1/P4) or graymap (P2/P5) from a stream.
 */
Result<BinaryImage, BitmapError> parseNetpbm(std::istream& in);

/**
 * @brief Load a Netpbm file from disk.
 */
Result<BinaryImage, BitmapError> loadBinaryImage(const std::string& path);

} // namespace CarveSim
