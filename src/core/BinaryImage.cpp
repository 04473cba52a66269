#include "BinaryImage.h"
#include "LoggingChannels.h"

#include <algorithm>
#include <cctype>
#include <fstream>

namespace CarveSim {

BinaryImage BinaryImage::fromRows(const std::vector<std::string>& rows)
{
    BinaryImage image;
    image.height = static_cast<int>(rows.size());
    for (const auto& row : rows) {
        image.width = std::max(image.width, static_cast<int>(row.size()));
    }

    image.pixels.assign(static_cast<size_t>(image.width) * image.height, false);
    for (int y = 0; y < image.height; ++y) {
        const auto& row = rows[y];
        for (int x = 0; x < static_cast<int>(row.size()); ++x) {
            char c = row[x];
            image.pixels[static_cast<size_t>(y) * image.width + x] =
                (c == '#' || c == 'X' || c == 'x' || c == '1');
        }
    }
    return image;
}

BinaryImage BinaryImage::fromGrayscale(int width, int height, const std::vector<uint8_t>& gray)
{
    BinaryImage image;
    image.width = width;
    image.height = height;
    image.pixels.reserve(gray.size());
    for (uint8_t value : gray) {
        image.pixels.push_back(value < INK_THRESHOLD);
    }
    return image;
}

size_t BinaryImage::countSet() const
{
    return static_cast<size_t>(std::count(pixels.begin(), pixels.end(), true));
}

namespace {

// Skips whitespace and '#' comments between header tokens.
void skipHeaderSpace(std::istream& in)
{
    while (in) {
        int c = in.peek();
        if (c == '#') {
            std::string comment;
            std::getline(in, comment);
        }
        else if (std::isspace(c)) {
            in.get();
        }
        else {
            return;
        }
    }
}

bool readHeaderInt(std::istream& in, int& value)
{
    skipHeaderSpace(in);
    in >> value;
    return static_cast<bool>(in);
}

} // namespace

Result<BinaryImage, BitmapError> parseNetpbm(std::istream& in)
{
    char magic[2] = { 0, 0 };
    in.read(magic, 2);
    if (!in || magic[0] != 'P') {
        return Result<BinaryImage, BitmapError>::error(BitmapError{ "Not a Netpbm image" });
    }

    const char kind = magic[1];
    if (kind != '1' && kind != '2' && kind != '4' && kind != '5') {
        return Result<BinaryImage, BitmapError>::error(
            BitmapError{ std::string("Unsupported Netpbm format P") + kind });
    }

    int width = 0;
    int height = 0;
    int maxValue = 1;
    if (!readHeaderInt(in, width) || !readHeaderInt(in, height)) {
        return Result<BinaryImage, BitmapError>::error(BitmapError{ "Truncated Netpbm header" });
    }
    if (width <= 0 || height <= 0) {
        return Result<BinaryImage, BitmapError>::error(
            BitmapError{ "Invalid image dimensions " + std::to_string(width) + "x"
                         + std::to_string(height) });
    }
    if (kind == '2' || kind == '5') {
        if (!readHeaderInt(in, maxValue) || maxValue <= 0 || maxValue > 65535) {
            return Result<BinaryImage, BitmapError>::error(
                BitmapError{ "Invalid graymap max value" });
        }
    }

    const size_t pixelCount = static_cast<size_t>(width) * height;
    BinaryImage image;
    image.width = width;
    image.height = height;
    image.pixels.reserve(pixelCount);

    auto truncated = []() {
        return Result<BinaryImage, BitmapError>::error(BitmapError{ "Truncated pixel data" });
    };
    auto badSample = [maxValue](int value) {
        return Result<BinaryImage, BitmapError>::error(
            BitmapError{ "Gray sample " + std::to_string(value) + " outside [0, "
                         + std::to_string(maxValue) + "]" });
    };

    switch (kind) {
        case '1': {
            // Plain bitmap: one '0'/'1' per pixel, whitespace optional.
            while (image.pixels.size() < pixelCount) {
                skipHeaderSpace(in);
                int c = in.get();
                if (c == std::char_traits<char>::eof()) {
                    return truncated();
                }
                if (c != '0' && c != '1') {
                    return Result<BinaryImage, BitmapError>::error(
                        BitmapError{ "Unexpected character in P1 data" });
                }
                image.pixels.push_back(c == '1');
            }
            break;
        }
        case '4': {
            // Raw bitmap: rows packed MSB-first, padded to a whole byte.
            in.get();
            const int rowBytes = (width + 7) / 8;
            std::vector<char> row(rowBytes);
            for (int y = 0; y < height; ++y) {
                if (!in.read(row.data(), rowBytes)) {
                    return truncated();
                }
                for (int x = 0; x < width; ++x) {
                    uint8_t byte = static_cast<uint8_t>(row[x / 8]);
                    image.pixels.push_back((byte >> (7 - (x % 8))) & 1);
                }
            }
            break;
        }
        case '2': {
            for (size_t i = 0; i < pixelCount; ++i) {
                int value = 0;
                if (!readHeaderInt(in, value)) {
                    return truncated();
                }
                if (value < 0 || value > maxValue) {
                    return badSample(value);
                }
                int scaled = value * 255 / maxValue;
                image.pixels.push_back(scaled < BinaryImage::INK_THRESHOLD);
            }
            break;
        }
        case '5': {
            in.get();
            const int bytesPerSample = maxValue > 255 ? 2 : 1;
            for (size_t i = 0; i < pixelCount; ++i) {
                int value = 0;
                for (int b = 0; b < bytesPerSample; ++b) {
                    int c = in.get();
                    if (c == std::char_traits<char>::eof()) {
                        return truncated();
                    }
                    value = (value << 8) | (c & 0xFF);
                }
                if (value > maxValue) {
                    return badSample(value);
                }
                int scaled = value * 255 / maxValue;
                image.pixels.push_back(scaled < BinaryImage::INK_THRESHOLD);
            }
            break;
        }
    }

    return Result<BinaryImage, BitmapError>::okay(std::move(image));
}

Result<BinaryImage, BitmapError> loadBinaryImage(const std::string& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return Result<BinaryImage, BitmapError>::error(
            BitmapError{ "Cannot open image file: " + path });
    }

    auto result = parseNetpbm(file);
    if (result.isValue()) {
        const auto& image = result.value();
        LoggingChannels::grid()->info(
            "Loaded {}x{} bitmap from {} ({} text pixels)",
            image.width,
            image.height,
            path,
            image.countSet());
    }
    return result;
}

} // namespace CarveSim
