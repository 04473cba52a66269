#include "CellBitmap.h"

#include <bit>

namespace CarveSim {

namespace {
constexpr uint32_t BLOCK_SHIFT = 3; // 8x8 cells per word.
constexpr uint32_t BLOCK_MASK = 7;

uint32_t blocksFor(uint32_t cells)
{
    return (cells + BLOCK_MASK) >> BLOCK_SHIFT;
}
} // namespace

CellBitmap::CellBitmap(uint32_t width, uint32_t height)
    : width_(width),
      height_(height),
      blocksX_(blocksFor(width)),
      blocksY_(blocksFor(height)),
      words_(static_cast<size_t>(blocksX_) * blocksY_, 0)
{}

CellBitmap::BitRef CellBitmap::locate(uint32_t x, uint32_t y) const
{
    const size_t word = static_cast<size_t>(y >> BLOCK_SHIFT) * blocksX_ + (x >> BLOCK_SHIFT);
    const uint32_t bit = ((y & BLOCK_MASK) << BLOCK_SHIFT) | (x & BLOCK_MASK);
    return { word, uint64_t{ 1 } << bit };
}

void CellBitmap::set(uint32_t x, uint32_t y)
{
    const BitRef ref = locate(x, y);
    words_[ref.word] |= ref.mask;
}

void CellBitmap::clear(uint32_t x, uint32_t y)
{
    const BitRef ref = locate(x, y);
    words_[ref.word] &= ~ref.mask;
}

bool CellBitmap::isSet(uint32_t x, uint32_t y) const
{
    const BitRef ref = locate(x, y);
    return (words_[ref.word] & ref.mask) != 0;
}

bool CellBitmap::testAndSet(uint32_t x, uint32_t y)
{
    const BitRef ref = locate(x, y);
    const bool wasClear = (words_[ref.word] & ref.mask) == 0;
    words_[ref.word] |= ref.mask;
    return wasClear;
}

bool CellBitmap::isSetSafe(int x, int y) const
{
    if (x < 0 || y < 0 || static_cast<uint32_t>(x) >= width_
        || static_cast<uint32_t>(y) >= height_) {
        return false;
    }
    return isSet(static_cast<uint32_t>(x), static_cast<uint32_t>(y));
}

uint32_t CellBitmap::count() const
{
    uint32_t total = 0;
    for (const uint64_t word : words_) {
        total += static_cast<uint32_t>(std::popcount(word));
    }
    return total;
}

uint64_t CellBitmap::getBlock(uint32_t blockX, uint32_t blockY) const
{
    return words_[static_cast<size_t>(blockY) * blocksX_ + blockX];
}

} // namespace CarveSim
