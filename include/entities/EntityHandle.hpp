/* Copyright (c) 2025 Stormfire Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_HANDLE_HPP
#define ENTITY_HANDLE_HPP

#include "utils/UniqueID.hpp"
#include <cstdint>
#include <format>
#include <functional>
#include <ostream>
#include <string>

/**
 * @brief Opaque, generation-checked reference to an enemy owned by the host.
 *
 * The effects core never holds enemies. It keys cooldown and hit-dedup
 * bookkeeping on handles issued by whoever owns the enemy pool, so a slot
 * that gets reused with a new generation is treated as a new target.
 *
 * Usage:
 *   EntityHandle enemy = EntityHandle::create();
 *   enemies.push_back({enemy, position, 40.0f});
 */
struct EntityHandle {
    using IDType = Stormfire::UniqueID::IDType;
    using Generation = uint32_t;

    static constexpr IDType INVALID_ID = Stormfire::UniqueID::INVALID_ID;
    static constexpr Generation INVALID_GENERATION = 0;

    IDType id{INVALID_ID};
    Generation generation{INVALID_GENERATION};

    constexpr EntityHandle() noexcept = default;
    constexpr EntityHandle(IDType entityId, Generation gen) noexcept
        : id(entityId), generation(gen) {}

    // Fresh handle with a process-unique id and first generation
    static EntityHandle create() {
        return EntityHandle(Stormfire::UniqueID::generate(), 1);
    }

    // Same id, next generation; used when a pooled slot is recycled
    [[nodiscard]] constexpr EntityHandle nextGeneration() const noexcept {
        return EntityHandle(id, generation + 1);
    }

    [[nodiscard]] constexpr bool isValid() const noexcept {
        return id != INVALID_ID && generation != INVALID_GENERATION;
    }

    [[nodiscard]] constexpr IDType getId() const noexcept { return id; }
    [[nodiscard]] constexpr Generation getGeneration() const noexcept {
        return generation;
    }

    [[nodiscard]] constexpr bool
    operator==(const EntityHandle& other) const noexcept {
        return id == other.id && generation == other.generation;
    }

    [[nodiscard]] constexpr bool
    operator!=(const EntityHandle& other) const noexcept {
        return !(*this == other);
    }

    // Ordering for flat_map / flat_set keys
    [[nodiscard]] constexpr bool
    operator<(const EntityHandle& other) const noexcept {
        if (id != other.id) return id < other.id;
        return generation < other.generation;
    }

    [[nodiscard]] std::size_t hash() const noexcept {
        std::size_t h = static_cast<std::size_t>(id);
        h ^= static_cast<std::size_t>(generation) << 48;
        return h;
    }

    [[nodiscard]] std::string toString() const {
        if (!isValid()) {
            return "EntityHandle::INVALID";
        }
        return std::format("EntityHandle({}:{})", id, generation);
    }
};

inline constexpr EntityHandle INVALID_ENTITY_HANDLE{};

inline std::ostream& operator<<(std::ostream& os, const EntityHandle& handle) {
    return os << handle.toString();
}

namespace std {
template <>
struct hash<EntityHandle> {
    std::size_t operator()(const EntityHandle& handle) const noexcept {
        return handle.hash();
    }
};
} // namespace std

#endif // ENTITY_HANDLE_HPP
