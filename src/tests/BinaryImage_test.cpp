#include "core/BinaryImage.h"

#include <gtest/gtest.h>
#include <sstream>
#include <string>

using namespace CarveSim;

namespace {

Result<BinaryImage, BitmapError> parse(const std::string& text)
{
    std::istringstream in(text);
    return parseNetpbm(in);
}

} // namespace

// Test ASCII-art rows, including ragged rows.
TEST(BinaryImageTest, FromRowsPadsShortRows)
{
    const BinaryImage image = BinaryImage::fromRows({ "#x", "1X..", "" });

    EXPECT_EQ(image.width, 4);
    EXPECT_EQ(image.height, 3);
    EXPECT_EQ(image.pixels.size(), 12u);
    EXPECT_TRUE(image.at(0, 0));
    EXPECT_TRUE(image.at(1, 0));
    EXPECT_FALSE(image.at(2, 0)); // Padded.
    EXPECT_TRUE(image.at(0, 1));
    EXPECT_TRUE(image.at(1, 1));
    EXPECT_FALSE(image.at(2, 1));
    EXPECT_FALSE(image.at(3, 2));
    EXPECT_EQ(image.countSet(), 4u);
}

TEST(BinaryImageTest, FromGrayscaleThresholdsDarkPixels)
{
    const BinaryImage image = BinaryImage::fromGrayscale(2, 2, { 0, 127, 128, 255 });

    EXPECT_TRUE(image.at(0, 0));
    EXPECT_TRUE(image.at(1, 0));
    EXPECT_FALSE(image.at(0, 1));
    EXPECT_FALSE(image.at(1, 1));
}

// Test plain PBM with comments and packed digits.
TEST(BinaryImageTest, ParsePlainBitmap)
{
    auto result = parse("P1\n# hello\n3 2\n0 1 0\n101\n");

    ASSERT_TRUE(result.isValue()) << result.errorValue().message;
    const BinaryImage image = result.value();
    EXPECT_EQ(image.width, 3);
    EXPECT_EQ(image.height, 2);
    EXPECT_FALSE(image.at(0, 0));
    EXPECT_TRUE(image.at(1, 0));
    EXPECT_TRUE(image.at(0, 1));
    EXPECT_FALSE(image.at(1, 1));
    EXPECT_TRUE(image.at(2, 1));
}

// Test raw PBM rows padded to whole bytes.
TEST(BinaryImageTest, ParseRawBitmap)
{
    std::string data = "P4\n10 2\n";
    data += static_cast<char>(0b10000000);
    data += static_cast<char>(0b01000000); // Bit 9 set.
    data += static_cast<char>(0b00000001);
    data += static_cast<char>(0b00000000);

    auto result = parse(data);

    ASSERT_TRUE(result.isValue()) << result.errorValue().message;
    const BinaryImage image = result.value();
    EXPECT_EQ(image.countSet(), 3u);
    EXPECT_TRUE(image.at(0, 0));
    EXPECT_TRUE(image.at(9, 0));
    EXPECT_TRUE(image.at(7, 1));
}

// Test plain PGM scaled against its max value.
TEST(BinaryImageTest, ParsePlainGraymap)
{
    auto result = parse("P2\n2 2\n15\n0 15\n8 7\n");

    ASSERT_TRUE(result.isValue()) << result.errorValue().message;
    const BinaryImage image = result.value();
    EXPECT_TRUE(image.at(0, 0));
    EXPECT_FALSE(image.at(1, 0));
    EXPECT_FALSE(image.at(0, 1)); // 8 * 255 / 15 = 136.
    EXPECT_TRUE(image.at(1, 1));  // 7 * 255 / 15 = 119.
}

// Test that gray samples outside [0, maxval] are rejected rather than scaled.
TEST(BinaryImageTest, ParseRejectsOutOfRangeSamples)
{
    auto tooBright = parse("P2\n2 1\n15\n3 16\n");
    ASSERT_TRUE(tooBright.isError());
    EXPECT_NE(tooBright.errorValue().message.find("16"), std::string::npos);

    EXPECT_TRUE(parse("P2\n1 1\n255\n-4\n").isError());
    EXPECT_TRUE(parse("P2\n1 1\n65535\n2000000000\n").isError());

    const std::string rawHeader = "P5\n2 1\n100\n";
    EXPECT_TRUE(parse(rawHeader + std::string{ '\x32', '\xC8' }).isError());
    EXPECT_TRUE(parse(rawHeader + std::string{ '\x32', '\x64' }).isValue());
}

TEST(BinaryImageTest, ParseRejectsBadInput)
{
    EXPECT_TRUE(parse("").isError());
    EXPECT_TRUE(parse("P3\n1 1\n255\n0 0 0\n").isError());
    EXPECT_TRUE(parse("P1\n0 4\n").isError());
    EXPECT_TRUE(parse("P1\n2 2\n0 1 1\n").isError());
    EXPECT_TRUE(parse("P1\n2 1\n0 7\n").isError());
    EXPECT_TRUE(parse("P2\n1 1\n0\n0\n").isError());

    auto missing = loadBinaryImage("/nonexistent/path/to/image.pbm");
    ASSERT_TRUE(missing.isError());
    EXPECT_NE(missing.errorValue().message.find("Cannot open"), std::string::npos);
}
