#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace CarveSim {

/**
 * @brief One bit per grid cell. Used for the edge-reachability mask and for
 * de-duplicating island boundary cells.
 *
 * Bits are packed into 8x8 blocks, one uint64_t each, row-major inside the
 * block: bit = localY * 8 + localX. A flood fill touches neighbouring cells,
 * and those usually land in the same word.
 */
class CellBitmap {
public:
    CellBitmap(uint32_t width, uint32_t height);

    void set(uint32_t x, uint32_t y);
    void clear(uint32_t x, uint32_t y);
    bool isSet(uint32_t x, uint32_t y) const;

    // Set the bit and report whether it was previously clear.
    bool testAndSet(uint32_t x, uint32_t y);

    // Out-of-range coordinates read as clear.
    bool isSetSafe(int x, int y) const;

    uint32_t count() const;

    uint64_t getBlock(uint32_t blockX, uint32_t blockY) const;
    bool isBlockAllClear(uint32_t blockX, uint32_t blockY) const
    {
        return getBlock(blockX, blockY) == 0;
    }

    uint32_t getWidth() const { return width_; }
    uint32_t getHeight() const { return height_; }
    uint32_t getBlocksX() const { return blocksX_; }
    uint32_t getBlocksY() const { return blocksY_; }

private:
    struct BitRef {
        size_t word;
        uint64_t mask;
    };

    BitRef locate(uint32_t x, uint32_t y) const;

    uint32_t width_;
    uint32_t height_;
    uint32_t blocksX_;
    uint32_t blocksY_;
    std::vector<uint64_t> words_;
};

} // namespace CarveSim
