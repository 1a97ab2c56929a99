/* Copyright (c) 2025 Stormfire Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DAMAGE_EVENT_HPP
#define DAMAGE_EVENT_HPP

#include "entities/EntityHandle.hpp"
#include <cstdint>
#include <ostream>
#include <vector>

namespace Stormfire {

enum class DamageCause : uint8_t {
  MissileBody = 0, // Direct contact with a flying missile
  Explosion = 1,   // Inside the growing explosion radius
  GroundFire = 2   // Periodic burn tick
};

inline const char *damageCauseToString(DamageCause cause) {
  switch (cause) {
  case DamageCause::MissileBody:
    return "MissileBody";
  case DamageCause::Explosion:
    return "Explosion";
  case DamageCause::GroundFire:
    return "GroundFire";
  }
  return "Unknown";
}

// For Boost.Test diagnostics
inline std::ostream &operator<<(std::ostream &os, DamageCause cause) {
  return os << damageCauseToString(cause);
}

/**
 * @brief Damage the combat layer should apply. Effect systems only report.
 */
struct DamageEvent {
  EntityHandle target{};
  float damage{0.0f};
  DamageCause cause{DamageCause::Explosion};
};

using DamageEvents = std::vector<DamageEvent>;

} // namespace Stormfire

#endif // DAMAGE_EVENT_HPP
