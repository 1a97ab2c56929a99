/* Copyright (c) 2025 Stormfire Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "effects/EffectsConfig.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"
#include <cmath>
#include <format>

namespace Stormfire {

namespace {

template <typename T>
T readPositive(const SettingsManager &settings, const char *category,
               const char *key, T fallback) {
  T value = settings.get<T>(category, key, fallback);
  if (!(value > T{0}) || !std::isfinite(static_cast<double>(value))) {
    SETTINGS_WARNING(std::format("{}.{} must be positive, using {}", category,
                                 key, fallback));
    return fallback;
  }
  return value;
}

} // namespace

EffectsConfig EffectsConfig::fromSettings(const SettingsManager &settings) {
  EffectsConfig config;

  AtmosphereConfig &atmo = config.atmosphere;
  atmo.worldWidth =
      readPositive(settings, "atmosphere", "world_width", atmo.worldWidth);
  atmo.worldHeight =
      readPositive(settings, "atmosphere", "world_height", atmo.worldHeight);
  atmo.rainCount =
      readPositive(settings, "atmosphere", "rain_count", atmo.rainCount);
  atmo.snowCount =
      readPositive(settings, "atmosphere", "snow_count", atmo.snowCount);
  atmo.petalCount =
      readPositive(settings, "atmosphere", "petal_count", atmo.petalCount);
  atmo.footprintInterval = readPositive(
      settings, "atmosphere", "footprint_interval",
      static_cast<float>(atmo.footprintInterval));
  atmo.footprintFade = readPositive(settings, "atmosphere", "footprint_fade",
                                    static_cast<float>(atmo.footprintFade));
  atmo.footprintMax =
      readPositive(settings, "atmosphere", "footprint_max", atmo.footprintMax);

  MissileConfig &missiles = config.missiles;
  missiles.damage = readPositive(settings, "missiles", "damage", missiles.damage);
  missiles.explosionRadius = readPositive(settings, "missiles",
                                          "explosion_radius",
                                          missiles.explosionRadius);
  missiles.speed = readPositive(settings, "missiles", "speed", missiles.speed);
  missiles.grenadeDamage = readPositive(settings, "missiles", "grenade_damage",
                                        missiles.grenadeDamage);
  missiles.grenadeSpeed = readPositive(settings, "missiles", "grenade_speed",
                                       missiles.grenadeSpeed);
  missiles.maxFlightTime = readPositive(settings, "missiles",
                                        "max_flight_time",
                                        missiles.maxFlightTime);
  missiles.explosionDuration = readPositive(settings, "missiles",
                                            "explosion_duration",
                                            missiles.explosionDuration);

  GroundFireConfig &fire = config.groundFire;
  fire.damagePerSecond = readPositive(settings, "ground_fire",
                                      "damage_per_second",
                                      fire.damagePerSecond);
  fire.duration =
      readPositive(settings, "ground_fire", "duration", fire.duration);
  fire.radiusScale =
      readPositive(settings, "ground_fire", "radius_scale", fire.radiusScale);

  return config;
}

} // namespace Stormfire
