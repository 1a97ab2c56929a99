/* Copyright (c) 2025 Stormfire Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef UNIQUE_ID_HPP
#define UNIQUE_ID_HPP

#include <atomic>
#include <cstdint>

namespace Stormfire {
    /**
     * @brief Process-wide generator for unique 64-bit identifiers.
     *
     * Backs EntityHandle. The counter starts at 1 so
     * INVALID_ID is never handed out.
     */
    class UniqueID {
    public:
        using IDType = uint64_t;

        static IDType generate() {
            return m_nextID++;
        }

        static constexpr IDType INVALID_ID = 0;

    private:
        static inline std::atomic<IDType> m_nextID{1};
    };

} // namespace Stormfire

#endif // UNIQUE_ID_HPP
