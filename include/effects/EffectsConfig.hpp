/* Copyright (c) 2025 Stormfire Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef EFFECTS_CONFIG_HPP
#define EFFECTS_CONFIG_HPP

namespace Stormfire {

class SettingsManager;

struct AtmosphereConfig {
  float worldWidth{3840.0f};
  float worldHeight{2160.0f};
  int rainCount{800};
  int snowCount{600};
  int petalCount{400};
  double footprintInterval{0.2}; // seconds between accepted footprints
  double footprintFade{5.0};     // seconds until a footprint is pruned
  int footprintMax{50};
};

struct MissileConfig {
  float damage{120.0f};
  float explosionRadius{150.0f};
  float speed{800.0f};
  float grenadeDamage{45.0f};
  float grenadeSpeed{600.0f};
  float maxFlightTime{5.0f};
  float explosionDuration{0.6f};
};

// Fire left behind by special-attack missiles
struct GroundFireConfig {
  float damagePerSecond{15.0f};
  float duration{5.0f};
  float radiusScale{0.8f}; // fraction of the explosion radius
};

/**
 * @brief Tunables for every effect system, defaulting to the shipped values.
 *
 * Built once by the host from SettingsManager; systems take it by value so
 * tests can construct one directly.
 */
struct EffectsConfig {
  AtmosphereConfig atmosphere{};
  MissileConfig missiles{};
  GroundFireConfig groundFire{};

  /// Reads the "atmosphere", "missiles" and "ground_fire" categories.
  /// Missing keys keep their defaults; out-of-range values are logged and
  /// replaced by the default.
  static EffectsConfig fromSettings(const SettingsManager &settings);
};

} // namespace Stormfire

#endif // EFFECTS_CONFIG_HPP
