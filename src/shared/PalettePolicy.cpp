#include "shared/PalettePolicy.hpp"

#include <algorithm>
#include <bit>

namespace basalt {

uint8_t ceilLog2(size_t count) {
    if (count <= 1) {
        return 0;
    }
    return static_cast<uint8_t>(std::bit_width(count - 1));
}

size_t entryCount(DataKind kind) {
    return kind == DataKind::BlockStates ? ServerConfig::SECTION_VOLUME : ServerConfig::BIOME_VOLUME;
}

PaletteLayout FixedWidthPolicy::layoutFor(size_t paletteSize, DataKind kind) const {
    if (kind == DataKind::BlockStates) {
        return {blockBits, PaletteFormat::Indirect};
    }
    return {std::max<uint8_t>(1, ceilLog2(paletteSize)), PaletteFormat::Indirect};
}

PaletteFormat FixedWidthPolicy::formatFor(uint8_t bitsPerEntry, DataKind /*kind*/) const {
    return bitsPerEntry == 0 ? PaletteFormat::SingleValue : PaletteFormat::Indirect;
}

PaletteLayout VanillaPolicy::layoutFor(size_t paletteSize, DataKind kind) const {
    if (paletteSize <= 1) {
        return {0, PaletteFormat::SingleValue};
    }

    uint8_t bits = ceilLog2(paletteSize);
    if (kind == DataKind::BlockStates) {
        if (bits <= MAX_INDIRECT_BLOCK_BITS) {
            return {std::max(MIN_INDIRECT_BLOCK_BITS, bits), PaletteFormat::Indirect};
        }
        return {directBlockBits, PaletteFormat::Direct};
    }

    if (bits <= MAX_INDIRECT_BIOME_BITS) {
        return {bits, PaletteFormat::Indirect};
    }
    return {directBiomeBits, PaletteFormat::Direct};
}

PaletteFormat VanillaPolicy::formatFor(uint8_t bitsPerEntry, DataKind kind) const {
    if (bitsPerEntry == 0) {
        return PaletteFormat::SingleValue;
    }
    uint8_t maxIndirect = kind == DataKind::BlockStates ? MAX_INDIRECT_BLOCK_BITS : MAX_INDIRECT_BIOME_BITS;
    return bitsPerEntry <= maxIndirect ? PaletteFormat::Indirect : PaletteFormat::Direct;
}

std::unique_ptr<PalettePolicy> makePalettePolicy(ServerConfig::PaletteMode mode) {
    switch (mode) {
        case ServerConfig::PaletteMode::Fixed:
            return std::make_unique<FixedWidthPolicy>();
        case ServerConfig::PaletteMode::Vanilla:
            return std::make_unique<VanillaPolicy>();
    }
    return std::make_unique<FixedWidthPolicy>();
}

} // namespace basalt
