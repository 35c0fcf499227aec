#pragma once

#include "core/ServerConfig.hpp"
#include <cmath>
#include <cstdint>
#include <functional>
#include <glm/glm.hpp>

namespace basalt {

/**
 * @brief Horizontal position of a chunk column
 *
 * Columns span the full world height, so only x and z identify them.
 */
struct ChunkPos {
    int32_t x;
    int32_t z;

    ChunkPos() : x(0), z(0) {}
    ChunkPos(int32_t x, int32_t z) : x(x), z(z) {}  // NOLINT(readability-identifier-length)

    /**
     * @brief Column containing a world position
     * @param worldPos Position in world space (y is ignored)
     */
    static ChunkPos fromWorldPos(const glm::dvec3& worldPos) {
        // Floor division so that -0.5 maps to column -1
        return ChunkPos(
            static_cast<int32_t>(std::floor(worldPos.x / ServerConfig::SECTION_WIDTH)),  // NOLINT(cppcoreguidelines-pro-type-union-access)
            static_cast<int32_t>(std::floor(worldPos.z / ServerConfig::SECTION_WIDTH))   // NOLINT(cppcoreguidelines-pro-type-union-access)
        );
    }

    /**
     * @brief World position of the column's (0, minY, 0) corner
     */
    glm::dvec3 toWorldPos() const {
        return glm::dvec3(static_cast<double>(x) * ServerConfig::SECTION_WIDTH,
                          static_cast<double>(ServerConfig::MIN_Y),
                          static_cast<double>(z) * ServerConfig::SECTION_WIDTH);
    }

    bool operator==(const ChunkPos& other) const {
        return x == other.x && z == other.z;
    }

    bool operator!=(const ChunkPos& other) const {
        return !(*this == other);
    }
};

} // namespace basalt

namespace std {
    template<>
    struct hash<basalt::ChunkPos> {
        size_t operator()(const basalt::ChunkPos& pos) const {
            size_t hash1 = std::hash<int32_t>{}(pos.x);
            size_t hash2 = std::hash<int32_t>{}(pos.z);
            return hash1 ^ (hash2 << 1);
        }
    };
}
