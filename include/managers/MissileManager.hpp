/* Copyright (c) 2025 Stormfire Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MISSILE_MANAGER_HPP
#define MISSILE_MANAGER_HPP

/**
 * @file MissileManager.hpp
 * @brief Owns every live missile, grenade and ground fire
 *
 * Per frame the host calls update(), then render(), then the damage
 * queries, and applies the returned events itself. Special-attack missiles
 * are wired to spawnGroundFire() when fired.
 */

#include "effects/DamageEvent.hpp"
#include "effects/EffectsConfig.hpp"
#include "effects/GroundFire.hpp"
#include "effects/IWeaponAudio.hpp"
#include "effects/Missile.hpp"
#include "entities/EnemyView.hpp"
#include "utils/Vector2D.hpp"
#include <optional>
#include <span>
#include <vector>

namespace Stormfire {

class RenderSurface;

class MissileManager {
public:
  /**
   * @param audio optional, not owned; must outlive the manager
   */
  explicit MissileManager(const EffectsConfig &config = {},
                          IWeaponAudio *audio = nullptr);
  ~MissileManager();

  // Missiles hold callbacks bound to this instance
  MissileManager(const MissileManager &) = delete;
  MissileManager &operator=(const MissileManager &) = delete;
  MissileManager(MissileManager &&) = delete;
  MissileManager &operator=(MissileManager &&) = delete;

  /**
   * @brief Launches a standard rocket using the configured damage, radius
   * and speed
   * @return false if start or target is not finite
   */
  bool fireMissile(const Vector2D &start, const Vector2D &target);

  /**
   * @brief Launches a rocket with an explicit damage
   *
   * Radius and speed fall back to the configured values when omitted.
   * Only MissileKind::SpecialAttack leaves a ground fire.
   */
  bool fireMissile(const Vector2D &start, const Vector2D &target, float damage,
                   std::optional<float> explosionRadius = std::nullopt,
                   std::optional<float> speed = std::nullopt,
                   MissileKind kind = MissileKind::Standard);

  /// Launches a configured special-attack rocket that leaves a ground fire.
  bool fireSpecialMissile(const Vector2D &start, const Vector2D &target);

  /// Launches a grenade. Grenades have no trail and no flight sound.
  bool fireGrenade(const Vector2D &start, const Vector2D &target);
  bool fireGrenade(const Vector2D &start, const Vector2D &target, float damage,
                   float explosionRadius, float speed);

  /**
   * @brief Advances missiles, then ground fires, then drops finished ones
   *
   * Ground fires created by detonations during this call are added at the
   * end and first animate on the next update.
   */
  void update(float deltaTime, std::span<const EnemyView> enemies);

  /// Ground fires first so missiles and explosions draw over them
  void render(RenderSurface &surface, const Vector2D &cameraOffset) const;

  /// Body and explosion hits from every missile
  DamageEvents checkVisualDamage(std::span<const EnemyView> enemies);

  /// Burn ticks from every ground fire
  DamageEvents checkGroundFireDamage(std::span<const EnemyView> enemies,
                                     double now);

  /// Missiles currently exploding, for camera shake and similar host effects
  [[nodiscard]] std::vector<const Missile *> getExplodingMissiles() const;

  void spawnGroundFire(const Vector2D &center, float radius,
                       float damagePerSecond, float duration);

  /// Stops every flight sound and removes all missiles and ground fires
  void clear();

  size_t getMissileCount() const { return m_missiles.size(); }
  size_t getGroundFireCount() const {
    return m_groundFires.size() + m_pendingGroundFires.size();
  }
  const std::vector<Missile> &getMissiles() const { return m_missiles; }
  const std::vector<GroundFire> &getGroundFires() const { return m_groundFires; }
  const EffectsConfig &getConfig() const { return m_config; }

private:
  bool launch(MissileKind kind, const Vector2D &start, const Vector2D &target,
              float damage, float explosionRadius, float speed);
  void stopFlightSound(Missile &missile);

  EffectsConfig m_config;
  IWeaponAudio *m_audio;

  std::vector<Missile> m_missiles;
  std::vector<GroundFire> m_groundFires;
  std::vector<GroundFire> m_pendingGroundFires;
  bool m_updating{false};
};

} // namespace Stormfire

#endif // MISSILE_MANAGER_HPP
