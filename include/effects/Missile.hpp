/* Copyright (c) 2025 Stormfire Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MISSILE_HPP
#define MISSILE_HPP

/**
 * @file Missile.hpp
 * @brief Rocket and grenade projectile state machine
 *
 * A missile flies in a straight line toward its target, detonates on
 * arrival, on proximity to an enemy or after its maximum flight time, then
 * plays an explosion whose visual radius is also its damage radius.
 *
 * Lifecycle: Flying -> Exploding -> Finished. Transitions only move forward.
 */

#include "effects/DamageEvent.hpp"
#include "effects/IWeaponAudio.hpp"
#include "entities/EnemyView.hpp"
#include "utils/Vector2D.hpp"
#include <SDL3/SDL_rect.h>
#include <boost/container/flat_set.hpp>
#include <boost/container/small_vector.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>

namespace Stormfire {

class RenderSurface;

enum class MissileState : uint8_t { Flying, Exploding, Finished };

enum class MissileKind : uint8_t {
  Standard,
  SpecialAttack, // larger body, red trail, leaves ground fire
  Grenade        // no trail, no flight sound
};

const char *missileStateToString(MissileState state);

/// Invoked once on detonation of a special-attack missile.
/// Arguments: center, radius, damage per second, duration in seconds.
using GroundFireCallback =
    std::function<void(const Vector2D &, float, float, float)>;

/// Shape of the ground fire a special-attack missile leaves behind
struct GroundFireSpawn {
  float radiusScale{0.8f};
  float damagePerSecond{15.0f};
  float duration{5.0f};
};

struct ExplosionArea {
  Vector2D center;
  float radius{0.0f};
};

class Missile {
public:
  static constexpr float DEFAULT_DAMAGE = 120.0f;
  static constexpr float DEFAULT_EXPLOSION_RADIUS = 150.0f;
  static constexpr float DEFAULT_SPEED = 800.0f;
  static constexpr float DEFAULT_MAX_FLIGHT_TIME = 5.0f;
  static constexpr float DEFAULT_EXPLOSION_DURATION = 0.6f;

  static constexpr float ARRIVAL_DISTANCE = 10.0f;
  static constexpr float PROXIMITY_DISTANCE = 30.0f;
  // Explosion reaches full radius at this fraction of its duration
  static constexpr float GROWTH_FRACTION = 0.7f;
  static constexpr size_t MAX_TRAIL_CAPACITY = 10;

  Missile(MissileKind kind, const Vector2D &start, const Vector2D &target,
          float damage = DEFAULT_DAMAGE,
          float explosionRadius = DEFAULT_EXPLOSION_RADIUS,
          float speed = DEFAULT_SPEED);

  void setMaxFlightTime(float seconds) { m_maxFlightTime = seconds; }
  void setExplosionDuration(float seconds) { m_explosionDuration = seconds; }
  void setGroundFireCallback(GroundFireCallback callback,
                             GroundFireSpawn spawn = {});

  /// Hands the missile the flight loop it stops on detonation
  void setFlightSound(SoundHandle handle) { m_flightSound = handle; }
  SoundHandle getFlightSound() const { return m_flightSound; }
  /// Gives up ownership of the flight loop without stopping it
  SoundHandle releaseFlightSound();

  /**
   * @brief Advances one simulation step
   * @param audio may be nullptr
   * @return true iff the missile is Finished after the step
   */
  bool update(float deltaTime, std::span<const EnemyView> enemies,
              IWeaponAudio *audio);

  /**
   * @brief Reports enemies overlapped by the visible missile or explosion
   *
   * While flying, contact with the body deals a quarter of the damage.
   * While exploding, enemies within the current explosion radius take full
   * damage. Each enemy is credited at most once over the missile's life.
   */
  DamageEvents checkVisualDamage(std::span<const EnemyView> enemies);

  void render(RenderSurface &surface, const Vector2D &cameraOffset) const;

  MissileState getState() const { return m_state; }
  MissileKind getKind() const { return m_kind; }
  bool isGrenade() const { return m_kind == MissileKind::Grenade; }
  bool isSpecialAttack() const { return m_kind == MissileKind::SpecialAttack; }
  bool isExploding() const { return m_state == MissileState::Exploding; }
  bool isFinished() const { return m_state == MissileState::Finished; }

  const Vector2D &getPosition() const { return m_position; }
  const Vector2D &getTarget() const { return m_target; }
  const Vector2D &getVelocity() const { return m_velocity; }
  float getAngle() const { return m_angle; } // radians
  std::span<const Vector2D> getTrail() const {
    return {m_trail.data(), m_trail.size()};
  }
  size_t getMaxTrailLength() const { return m_maxTrailLength; }
  float getAge() const { return m_age; }
  float getDamage() const { return m_damage; }
  float getSpeed() const { return m_speed; }
  float getExplosionRadius() const { return m_explosionRadius; }
  float getExplosionAge() const { return m_explosionAge; }
  float getExplosionDuration() const { return m_explosionDuration; }
  float getLength() const { return m_length; }
  float getWidth() const { return m_width; }
  float getFlameIntensityBase() const { return m_flameIntensityBase; }
  float getFlameIntensityVariance() const { return m_flameIntensityVariance; }

  /// Explosion age over duration, clamped to [0, 1]
  [[nodiscard]] float getExplosionProgress() const;
  /// Radius that currently deals damage; 0 unless exploding
  [[nodiscard]] float getCurrentExplosionRadius() const;
  /// Center and full radius while exploding
  [[nodiscard]] std::optional<ExplosionArea> getExplosionDamageArea() const;
  /// Axis-aligned body bounds in world space
  [[nodiscard]] SDL_FRect getRect() const;

private:
  void updateFlight(float deltaTime, std::span<const EnemyView> enemies,
                    IWeaponAudio *audio);
  void detonate(IWeaponAudio *audio);

  void renderGrenade(RenderSurface &surface, const Vector2D &at) const;
  void renderTrail(RenderSurface &surface, const Vector2D &cameraOffset) const;
  void renderExhaust(RenderSurface &surface, const Vector2D &back,
                     const Vector2D &dir, const Vector2D &perp) const;
  void renderBody(RenderSurface &surface, const Vector2D &at) const;
  void renderExplosion(RenderSurface &surface, const Vector2D &at) const;
  void renderExplosionFlash(RenderSurface &surface, const Vector2D &at,
                            float progress) const;
  void renderExplosionExpansion(RenderSurface &surface, const Vector2D &at,
                                float progress) const;
  void renderExplosionPeak(RenderSurface &surface, const Vector2D &at,
                           float progress) const;
  void renderExplosionFade(RenderSurface &surface, const Vector2D &at,
                           float progress) const;

  MissileKind m_kind;
  MissileState m_state{MissileState::Flying};

  Vector2D m_position;
  Vector2D m_target;
  Vector2D m_velocity;
  float m_angle{0.0f};

  float m_damage;
  float m_explosionRadius;
  float m_speed;

  float m_length;
  float m_width;
  size_t m_maxTrailLength;
  float m_flameIntensityBase;
  float m_flameIntensityVariance;

  float m_age{0.0f};
  float m_maxFlightTime{DEFAULT_MAX_FLIGHT_TIME};
  float m_explosionAge{0.0f};
  float m_explosionDuration{DEFAULT_EXPLOSION_DURATION};

  boost::container::small_vector<Vector2D, MAX_TRAIL_CAPACITY> m_trail;
  boost::container::flat_set<EntityHandle> m_damagedEnemies;

  GroundFireCallback m_groundFireCallback;
  GroundFireSpawn m_groundFireSpawn;
  SoundHandle m_flightSound{INVALID_SOUND_HANDLE};
};

} // namespace Stormfire

#endif // MISSILE_HPP
