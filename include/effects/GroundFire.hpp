/* Copyright (c) 2025 Stormfire Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GROUND_FIRE_HPP
#define GROUND_FIRE_HPP

/**
 * @file GroundFire.hpp
 * @brief Stationary damage-over-time zone left by special-attack missiles
 *
 * Visuals are four procedurally animated layers (base flames, dancing
 * flames, sparks, smoke) whose counts scale with radius. Damage ticks are
 * paced per enemy handle against the host's wall clock, so frame rate does
 * not change how often an enemy burns.
 */

#include "effects/DamageEvent.hpp"
#include "entities/EnemyView.hpp"
#include "utils/Vector2D.hpp"
#include <boost/container/flat_map.hpp>
#include <span>
#include <vector>

namespace Stormfire {

class RenderSurface;

/**
 * @brief One animated fire particle.
 *
 * All layers share the struct; fields a layer does not animate stay zero.
 */
struct FireParticle {
  Vector2D base;     // anchor point in world space
  Vector2D position; // animated position in world space
  float size{0.0f};
  float intensity{1.0f};
  float flickerSpeed{0.0f};
  float colorVariant{1.0f};
  // dancing flames
  float danceRadius{0.0f};
  float danceSpeed{0.0f};
  // sparks
  float popInterval{0.0f};
  float lastPop{0.0f};
  // smoke
  float driftSpeed{0.0f};
  float driftDirection{0.0f};
};

class GroundFire {
public:
  static constexpr float DAMAGE_COOLDOWN = 0.5f;
  static constexpr float DEFAULT_DURATION = 5.0f;

  GroundFire(const Vector2D &center, float radius, float damagePerSecond,
             float duration = DEFAULT_DURATION);

  /**
   * @brief Advances age and layer animation
   * @return true once age reaches duration and the fire should be removed
   */
  bool update(float deltaTime);

  /**
   * @brief Emits a burn tick for every enemy touching the fire whose
   *        cooldown has elapsed
   * @param now host wall clock in seconds; must be non-decreasing
   *
   * An enemy touches when its center is within radius + size / 2. Each
   * tick deals damagePerSecond * DAMAGE_COOLDOWN. The first contact with
   * an enemy always ticks.
   */
  DamageEvents checkEnemyDamage(std::span<const EnemyView> enemies,
                                double now);

  void render(RenderSurface &surface, const Vector2D &cameraOffset) const;

  const Vector2D &getCenter() const { return m_center; }
  float getRadius() const { return m_radius; }
  float getDamagePerSecond() const { return m_damagePerSecond; }
  float getAge() const { return m_age; }
  float getDuration() const { return m_duration; }
  bool isExpired() const { return m_age >= m_duration; }

  // Opacity multiplier, 1 at spawn down to 0.6 at expiry
  float getFadeFactor() const;

  const std::vector<FireParticle> &getBaseFlames() const { return m_baseFlames; }
  const std::vector<FireParticle> &getDancingFlames() const {
    return m_dancingFlames;
  }
  const std::vector<FireParticle> &getSparks() const { return m_sparks; }
  const std::vector<FireParticle> &getSmoke() const { return m_smoke; }

private:
  void spawnLayers();
  void renderGlow(RenderSurface &surface, const Vector2D &center,
                  float fade) const;
  void renderDangerRing(RenderSurface &surface, const Vector2D &center,
                        float fade) const;

  Vector2D m_center;
  float m_radius;
  float m_damagePerSecond;
  float m_duration;
  float m_age{0.0f};

  std::vector<FireParticle> m_baseFlames;
  std::vector<FireParticle> m_dancingFlames;
  std::vector<FireParticle> m_sparks;
  std::vector<FireParticle> m_smoke;

  boost::container::flat_map<EntityHandle, double> m_lastDamageTimes;
};

} // namespace Stormfire

#endif // GROUND_FIRE_HPP
