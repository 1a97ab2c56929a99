/* Copyright (c) 2025 Stormfire Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/MissileManager.hpp"
#include "core/Logger.hpp"
#include "render/RenderSurface.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <iterator>
#include <string>
#include <utility>

namespace Stormfire {

namespace {

bool isFinite(const Vector2D &v) {
  return std::isfinite(v.getX()) && std::isfinite(v.getY());
}

std::string describe(const Vector2D &v) {
  return std::format("({:.1f}, {:.1f})", v.getX(), v.getY());
}

const char *missileKindName(MissileKind kind) {
  switch (kind) {
  case MissileKind::Standard:
    return "missile";
  case MissileKind::SpecialAttack:
    return "special missile";
  case MissileKind::Grenade:
    return "grenade";
  }
  return "projectile";
}

} // namespace

MissileManager::MissileManager(const EffectsConfig &config, IWeaponAudio *audio)
    : m_config(config), m_audio(audio) {
  MISSILE_INFO(std::format("MissileManager ready (audio {})",
                           m_audio ? "enabled" : "disabled"));
}

MissileManager::~MissileManager() { clear(); }

bool MissileManager::fireMissile(const Vector2D &start,
                                 const Vector2D &target) {
  return fireMissile(start, target, m_config.missiles.damage);
}

bool MissileManager::fireMissile(const Vector2D &start, const Vector2D &target,
                                 float damage,
                                 std::optional<float> explosionRadius,
                                 std::optional<float> speed, MissileKind kind) {
  return launch(kind, start, target, damage,
                explosionRadius.value_or(m_config.missiles.explosionRadius),
                speed.value_or(m_config.missiles.speed));
}

bool MissileManager::fireSpecialMissile(const Vector2D &start,
                                        const Vector2D &target) {
  return fireMissile(start, target, m_config.missiles.damage, std::nullopt,
                     std::nullopt, MissileKind::SpecialAttack);
}

bool MissileManager::fireGrenade(const Vector2D &start,
                                 const Vector2D &target) {
  return fireGrenade(start, target, m_config.missiles.grenadeDamage,
                     m_config.missiles.explosionRadius,
                     m_config.missiles.grenadeSpeed);
}

bool MissileManager::fireGrenade(const Vector2D &start, const Vector2D &target,
                                 float damage, float explosionRadius,
                                 float speed) {
  return launch(MissileKind::Grenade, start, target, damage, explosionRadius,
                speed);
}

bool MissileManager::launch(MissileKind kind, const Vector2D &start,
                            const Vector2D &target, float damage,
                            float explosionRadius, float speed) {
  if (!isFinite(start) || !isFinite(target)) {
    MISSILE_WARN(std::format("Rejected {} with non-finite start {} or target {}",
                             missileKindName(kind), describe(start),
                             describe(target)));
    return false;
  }
  if (!std::isfinite(damage) || !std::isfinite(explosionRadius) ||
      !std::isfinite(speed) || explosionRadius < 0.0f || speed < 0.0f) {
    MISSILE_WARN(std::format(
        "Rejected {} with damage {} radius {} speed {}", missileKindName(kind),
        damage, explosionRadius, speed));
    return false;
  }

  Missile missile(kind, start, target, damage, explosionRadius, speed);
  missile.setMaxFlightTime(m_config.missiles.maxFlightTime);
  missile.setExplosionDuration(m_config.missiles.explosionDuration);

  if (kind == MissileKind::SpecialAttack) {
    GroundFireSpawn spawn{m_config.groundFire.radiusScale,
                          m_config.groundFire.damagePerSecond,
                          m_config.groundFire.duration};
    missile.setGroundFireCallback(
        [this](const Vector2D &center, float radius, float dps,
               float duration) {
          spawnGroundFire(center, radius, dps, duration);
        },
        spawn);
  }

  if (m_audio && kind != MissileKind::Grenade) {
    missile.setFlightSound(m_audio->startMissileFlight());
  }

  m_missiles.push_back(std::move(missile));
  MISSILE_DEBUG(std::format("Fired {} from {} to {}", missileKindName(kind),
                            describe(start), describe(target)));
  return true;
}

void MissileManager::stopFlightSound(Missile &missile) {
  SoundHandle handle = missile.releaseFlightSound();
  if (m_audio && handle != INVALID_SOUND_HANDLE) {
    m_audio->stopMissileFlight(handle);
  }
}

void MissileManager::update(float deltaTime,
                            std::span<const EnemyView> enemies) {
  if (!(deltaTime >= 0.0f) || !std::isfinite(deltaTime)) {
    MISSILE_WARN(std::format("Ignoring update with invalid dt {}", deltaTime));
    return;
  }

  m_updating = true;

  for (Missile &missile : m_missiles) {
    missile.update(deltaTime, enemies, m_audio);
  }
  auto firstFinished = std::stable_partition(
      m_missiles.begin(), m_missiles.end(),
      [](const Missile &missile) { return !missile.isFinished(); });
  for (auto it = firstFinished; it != m_missiles.end(); ++it) {
    stopFlightSound(*it);
  }
  m_missiles.erase(firstFinished, m_missiles.end());

  for (GroundFire &fire : m_groundFires) {
    fire.update(deltaTime);
  }
  std::erase_if(m_groundFires,
                [](const GroundFire &fire) { return fire.isExpired(); });

  m_updating = false;

  if (!m_pendingGroundFires.empty()) {
    m_groundFires.insert(m_groundFires.end(),
                         std::make_move_iterator(m_pendingGroundFires.begin()),
                         std::make_move_iterator(m_pendingGroundFires.end()));
    m_pendingGroundFires.clear();
  }
}

void MissileManager::render(RenderSurface &surface,
                            const Vector2D &cameraOffset) const {
  for (const GroundFire &fire : m_groundFires) {
    fire.render(surface, cameraOffset);
  }
  for (const Missile &missile : m_missiles) {
    missile.render(surface, cameraOffset);
  }
}

DamageEvents
MissileManager::checkVisualDamage(std::span<const EnemyView> enemies) {
  DamageEvents events;
  for (Missile &missile : m_missiles) {
    DamageEvents hits = missile.checkVisualDamage(enemies);
    events.insert(events.end(), hits.begin(), hits.end());
  }
  return events;
}

DamageEvents
MissileManager::checkGroundFireDamage(std::span<const EnemyView> enemies,
                                      double now) {
  DamageEvents events;
  for (GroundFire &fire : m_groundFires) {
    DamageEvents ticks = fire.checkEnemyDamage(enemies, now);
    events.insert(events.end(), ticks.begin(), ticks.end());
  }
  return events;
}

std::vector<const Missile *> MissileManager::getExplodingMissiles() const {
  std::vector<const Missile *> exploding;
  for (const Missile &missile : m_missiles) {
    if (missile.isExploding()) {
      exploding.push_back(&missile);
    }
  }
  return exploding;
}

void MissileManager::spawnGroundFire(const Vector2D &center, float radius,
                                     float damagePerSecond, float duration) {
  if (!isFinite(center) || !std::isfinite(radius) ||
      !std::isfinite(damagePerSecond) || !std::isfinite(duration)) {
    GROUNDFIRE_WARN(std::format("Rejected ground fire at {} r={} dps={} t={}",
                                describe(center), radius, damagePerSecond,
                                duration));
    return;
  }
  auto &target = m_updating ? m_pendingGroundFires : m_groundFires;
  target.emplace_back(center, radius, damagePerSecond, duration);
}

void MissileManager::clear() {
  for (Missile &missile : m_missiles) {
    stopFlightSound(missile);
  }
  m_missiles.clear();
  m_groundFires.clear();
  m_pendingGroundFires.clear();
}

} // namespace Stormfire
