/* Copyright (c) 2025 Stormfire Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "effects/GroundFire.hpp"
#include "core/Logger.hpp"
#include "render/RenderSurface.hpp"
#include "utils/Random.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <numbers>

namespace Stormfire {

namespace {

constexpr float TWO_PI = 2.0f * std::numbers::pi_v<float>;

Vector2D randomPointInRing(const Vector2D &center, float minDistance,
                           float maxDistance) {
  float angle = Random::range(0.0f, TWO_PI);
  float distance = Random::range(minDistance, maxDistance);
  return center + Vector2D::fromAngle(angle, distance);
}

} // namespace

GroundFire::GroundFire(const Vector2D &center, float radius,
                       float damagePerSecond, float duration)
    : m_center(center), m_radius(std::max(radius, 0.0f)),
      m_damagePerSecond(damagePerSecond), m_duration(duration) {
  spawnLayers();
  GROUNDFIRE_DEBUG(std::format(
      "Ground fire at ({:.0f}, {:.0f}) r={:.0f} dps={:.1f} for {:.1f}s",
      m_center.getX(), m_center.getY(), m_radius, m_damagePerSecond,
      m_duration));
}

void GroundFire::spawnLayers() {
  const int baseCount = static_cast<int>(m_radius / 4.0f);

  m_baseFlames.reserve(static_cast<size_t>(baseCount));
  for (int i = 0; i < baseCount; ++i) {
    FireParticle p;
    p.base = randomPointInRing(m_center, 0.0f, m_radius * 0.9f);
    p.position = p.base;
    p.size = Random::range(8.0f, 16.0f);
    p.intensity = Random::range(0.8f, 1.2f);
    p.flickerSpeed = Random::range(6.0f, 10.0f);
    p.colorVariant = Random::range(0.8f, 1.2f);
    m_baseFlames.push_back(p);
  }

  for (int i = 0; i < baseCount / 2; ++i) {
    FireParticle p;
    p.base = randomPointInRing(m_center, 0.0f, m_radius * 0.7f);
    p.position = p.base;
    p.size = Random::range(6.0f, 12.0f);
    p.intensity = Random::range(0.9f, 1.4f);
    p.flickerSpeed = Random::range(12.0f, 18.0f);
    p.danceRadius = Random::range(8.0f, 15.0f);
    p.danceSpeed = Random::range(2.0f, 4.0f);
    p.colorVariant = Random::range(0.9f, 1.1f);
    m_dancingFlames.push_back(p);
  }

  m_sparks.reserve(static_cast<size_t>(baseCount) * 2);
  for (int i = 0; i < baseCount * 2; ++i) {
    FireParticle p;
    p.base = randomPointInRing(m_center, 0.0f, m_radius * 0.8f);
    p.position = p.base;
    p.size = Random::range(2.0f, 5.0f);
    p.intensity = Random::range(1.0f, 1.5f);
    p.flickerSpeed = Random::range(15.0f, 25.0f);
    p.popInterval = Random::range(0.5f, 2.0f);
    p.colorVariant = Random::range(1.0f, 1.3f);
    m_sparks.push_back(p);
  }

  for (int i = 0; i < baseCount / 3; ++i) {
    FireParticle p;
    p.base = randomPointInRing(m_center, m_radius * 0.3f, m_radius * 1.1f);
    p.position = p.base;
    p.size = Random::range(10.0f, 20.0f);
    p.intensity = Random::range(0.3f, 0.7f);
    p.driftSpeed = Random::range(1.0f, 3.0f);
    p.driftDirection = Random::range(0.0f, TWO_PI);
    m_smoke.push_back(p);
  }
}

bool GroundFire::update(float deltaTime) {
  if (!(deltaTime >= 0.0f) || !std::isfinite(deltaTime)) {
    GROUNDFIRE_WARN(std::format("Ignoring update with invalid dt {}", deltaTime));
    return isExpired();
  }

  m_age += deltaTime;
  const float t = m_age;

  for (FireParticle &p : m_baseFlames) {
    float flicker = std::sin(t * p.flickerSpeed) * 2.0f;
    p.position = p.base + Vector2D(Random::range(-1.0f, 1.0f) + flicker,
                                   Random::range(-1.0f, 1.0f) + flicker * 0.5f);
  }

  for (FireParticle &p : m_dancingFlames) {
    float danceAngle = t * p.danceSpeed;
    float flicker = std::sin(t * p.flickerSpeed) * 3.0f;
    float dx = std::cos(danceAngle) * p.danceRadius;
    float dy = std::sin(danceAngle) * p.danceRadius * 0.5f;
    p.position =
        p.base + Vector2D(dx + Random::range(-2.0f, 2.0f) + flicker,
                          dy + Random::range(-1.0f, 1.0f) + flicker * 0.3f);
  }

  for (FireParticle &p : m_sparks) {
    if (t - p.lastPop > p.popInterval) {
      p.lastPop = t;
      p.popInterval = Random::range(0.5f, 2.0f);
      p.intensity = Random::range(1.5f, 2.0f);
    } else {
      p.intensity = std::max(0.8f, p.intensity - deltaTime * 2.0f);
    }
    float flicker = std::sin(t * p.flickerSpeed) * 4.0f;
    p.position = p.base + Vector2D(Random::range(-3.0f, 3.0f) + flicker,
                                   Random::range(-2.0f, 2.0f) + flicker * 0.4f);
  }

  for (FireParticle &p : m_smoke) {
    Vector2D drift = Vector2D::fromAngle(p.driftDirection, p.driftSpeed) *
                     deltaTime;
    p.position += drift + Vector2D(0.0f, -10.0f * deltaTime);
  }

  return isExpired();
}

DamageEvents GroundFire::checkEnemyDamage(std::span<const EnemyView> enemies,
                                          double now) {
  DamageEvents events;
  const float tickDamage = m_damagePerSecond * DAMAGE_COOLDOWN;

  for (const EnemyView &enemy : enemies) {
    float reach = m_radius + enemy.size * 0.5f;
    if (Vector2D::distanceSquared(enemy.position, m_center) > reach * reach) {
      continue;
    }

    auto it = m_lastDamageTimes.find(enemy.handle);
    if (it != m_lastDamageTimes.end() && now - it->second < DAMAGE_COOLDOWN) {
      continue;
    }
    m_lastDamageTimes[enemy.handle] = now;
    events.push_back(DamageEvent{enemy.handle, tickDamage,
                                 DamageCause::GroundFire});
  }
  return events;
}

float GroundFire::getFadeFactor() const {
  if (m_duration <= 0.0f) {
    return 0.6f;
  }
  return 1.0f - std::clamp(m_age / m_duration, 0.0f, 1.0f) * 0.4f;
}

void GroundFire::render(RenderSurface &surface,
                        const Vector2D &cameraOffset) const {
  const float fade = getFadeFactor();
  const Vector2D center = m_center - cameraOffset;

  renderGlow(surface, center, fade);

  for (const FireParticle &p : m_smoke) {
    float size = std::floor(p.size * p.intensity * fade);
    if (size <= 0.0f) {
      continue;
    }
    float gray = 80.0f + 40.0f * p.intensity;
    Vector2D at = p.position - cameraOffset;
    surface.fillCircle(at.getX(), at.getY(), size,
                       makeColor(gray, gray, gray, 120.0f * p.intensity * fade));
  }

  for (const FireParticle &p : m_baseFlames) {
    float size = std::floor(p.size * p.intensity * fade);
    if (size <= 0.0f) {
      continue;
    }
    float r = 255.0f * fade * p.colorVariant;
    float g = 120.0f * fade * p.colorVariant;
    Vector2D at = p.position - cameraOffset;
    surface.fillCircle(at.getX(), at.getY(), size, makeColor(r, g, 0.0f));
    if (size > 3.0f) {
      surface.fillCircle(at.getX(), at.getY(), size + 3.0f,
                         makeColor(r, g, 0.0f, 80.0f * fade * p.intensity));
    }
  }

  for (const FireParticle &p : m_dancingFlames) {
    float size = std::floor(p.size * p.intensity * fade);
    if (size <= 0.0f) {
      continue;
    }
    float r = 255.0f * fade;
    float g = 160.0f * fade * p.colorVariant;
    float b = 20.0f * fade * p.colorVariant;
    Vector2D at = p.position - cameraOffset;
    surface.fillCircle(at.getX(), at.getY(), size, makeColor(r, g, b));
    if (size > 2.0f) {
      surface.fillCircle(at.getX(), at.getY(), size + 2.0f,
                         makeColor(r, g, b, 100.0f * fade * p.intensity));
    }
  }

  for (const FireParticle &p : m_sparks) {
    float size = std::floor(p.size * p.intensity * fade);
    if (size <= 0.0f) {
      continue;
    }
    float boost = p.intensity * p.colorVariant;
    float r = 255.0f * fade * boost;
    float g = 200.0f * fade * boost;
    float b = 100.0f * fade * boost;
    Vector2D at = p.position - cameraOffset;
    surface.fillCircle(at.getX(), at.getY(), size, makeColor(r, g, b));
    if (size > 1.0f) {
      surface.fillCircle(at.getX(), at.getY(), size + 1.0f,
                         makeColor(r, g, b, 150.0f * fade * p.intensity));
    }
  }

  renderDangerRing(surface, center, fade);
}

void GroundFire::renderGlow(RenderSurface &surface, const Vector2D &center,
                            float fade) const {
  const float glowRadius = std::floor(m_radius * 1.2f);
  const float alpha = 40.0f * fade;
  surface.fillCircle(center.getX(), center.getY(), glowRadius,
                     makeColor(255.0f, 80.0f, 0.0f, alpha));
  surface.fillCircle(center.getX(), center.getY(), glowRadius * 0.8f,
                     makeColor(255.0f, 120.0f, 20.0f, alpha * 1.2f));
  surface.fillCircle(center.getX(), center.getY(), glowRadius * 0.6f,
                     makeColor(255.0f, 150.0f, 50.0f, alpha * 1.4f));
}

void GroundFire::renderDangerRing(RenderSurface &surface,
                                  const Vector2D &center, float fade) const {
  const float pulse = 0.8f + 0.2f * std::sin(m_age * 4.0f);
  const float alpha = 60.0f * fade * pulse;
  if (alpha > 10.0f) {
    surface.drawCircle(center.getX(), center.getY(), m_radius,
                       SDL_Color{255, 0, 0, 255}, 2.0f);
  }
}

} // namespace Stormfire
