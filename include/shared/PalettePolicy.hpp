#pragma once

#include "core/ServerConfig.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>

namespace basalt {

enum class DataKind : uint8_t {
    BlockStates,    ///< 4096 entries per section
    Biomes,         ///< 64 entries per section
};

/**
 * @brief How a paletted container is laid out on the wire
 */
enum class PaletteFormat : uint8_t {
    SingleValue,    ///< bitsPerEntry 0: one VarInt id, empty data array
    Indirect,       ///< VarInt palette, data holds palette indices
    Direct,         ///< No palette, data holds global ids
};

struct PaletteLayout {
    uint8_t bitsPerEntry = 0;
    PaletteFormat format = PaletteFormat::Indirect;
};

/**
 * @brief Chooses bits-per-entry for a container
 *
 * Injected into the palette encoder and decoder so the packing code does not
 * depend on the width rule. The two methods must agree: formatFor() applied
 * to the width chosen by layoutFor() returns the same format.
 */
class PalettePolicy {
public:
    virtual ~PalettePolicy() = default;

    virtual PaletteLayout layoutFor(size_t paletteSize, DataKind kind) const = 0;

    /**
     * @brief Container format implied by a bits-per-entry byte read from the wire
     */
    virtual PaletteFormat formatFor(uint8_t bitsPerEntry, DataKind kind) const = 0;
};

/**
 * @brief Fixed block width with the palette always emitted
 *
 * Block states use blockBits regardless of palette size; biomes use
 * max(1, ceil(log2(size))). Vanilla clients treat a 15-bit block container
 * as direct and skip the palette; use VanillaPolicy when talking to them.
 */
class FixedWidthPolicy final : public PalettePolicy {
public:
    explicit FixedWidthPolicy(uint8_t blockBits = ServerConfig::FIXED_BLOCK_BITS)
        : blockBits(blockBits) {}

    PaletteLayout layoutFor(size_t paletteSize, DataKind kind) const override;
    PaletteFormat formatFor(uint8_t bitsPerEntry, DataKind kind) const override;

private:
    uint8_t blockBits;
};

/**
 * @brief Palette-size-driven widths with the protocol's thresholds
 *
 * | palette size    | block states                 | biomes                       |
 * |-----------------|------------------------------|------------------------------|
 * | 1               | single value (0 bits)        | single value (0 bits)        |
 * | 2..256 / 2..8   | indirect, max(4, log2) bits  | indirect, log2 bits          |
 * | larger          | direct, directBlockBits      | direct, directBiomeBits      |
 */
class VanillaPolicy final : public PalettePolicy {
public:
    VanillaPolicy(uint8_t directBlockBits = ServerConfig::DIRECT_BLOCK_BITS,
                  uint8_t directBiomeBits = ServerConfig::DIRECT_BIOME_BITS)
        : directBlockBits(directBlockBits), directBiomeBits(directBiomeBits) {}

    PaletteLayout layoutFor(size_t paletteSize, DataKind kind) const override;
    PaletteFormat formatFor(uint8_t bitsPerEntry, DataKind kind) const override;

    static constexpr uint8_t MIN_INDIRECT_BLOCK_BITS = 4;
    static constexpr uint8_t MAX_INDIRECT_BLOCK_BITS = 8;
    static constexpr uint8_t MAX_INDIRECT_BIOME_BITS = 3;

private:
    uint8_t directBlockBits;
    uint8_t directBiomeBits;
};

/**
 * @brief Policy selected by the runtime configuration
 */
std::unique_ptr<PalettePolicy> makePalettePolicy(ServerConfig::PaletteMode mode);

/**
 * @brief ceil(log2(count)), 0 for count <= 1
 */
uint8_t ceilLog2(size_t count);

/**
 * @brief Entries per section for a data kind
 */
size_t entryCount(DataKind kind);

} // namespace basalt
