/* Copyright (c) 2025 Stormfire Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "effects/Missile.hpp"
#include "core/Logger.hpp"
#include "render/RenderSurface.hpp"
#include "utils/Random.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <format>
#include <numbers>
#include <utility>

namespace Stormfire {

namespace {

constexpr float TWO_PI = 2.0f * std::numbers::pi_v<float>;

SDL_FPoint toPoint(const Vector2D &v) { return SDL_FPoint{v.getX(), v.getY()}; }

struct TrailLayer {
  float size;
  SDL_Color color;
};

constexpr std::array<TrailLayer, 4> STANDARD_TRAIL{{
    {12.0f, {255, 80, 0, 255}},
    {6.0f, {255, 180, 50, 255}},
    {3.0f, {255, 220, 100, 255}},
    {2.0f, {255, 255, 150, 255}},
}};

constexpr std::array<TrailLayer, 4> SPECIAL_TRAIL{{
    {16.0f, {255, 60, 0, 255}},
    {9.0f, {255, 140, 50, 255}},
    {4.0f, {255, 220, 120, 255}},
    {2.0f, {255, 255, 150, 255}},
}};

constexpr std::array<SDL_Color, 4> FLAME_COLORS{{
    {255, 100, 0, 255},
    {255, 150, 50, 255},
    {255, 200, 100, 255},
    {255, 255, 150, 255},
}};

} // namespace

const char *missileStateToString(MissileState state) {
  switch (state) {
  case MissileState::Flying:
    return "Flying";
  case MissileState::Exploding:
    return "Exploding";
  case MissileState::Finished:
    return "Finished";
  }
  return "Unknown";
}

Missile::Missile(MissileKind kind, const Vector2D &start,
                 const Vector2D &target, float damage, float explosionRadius,
                 float speed)
    : m_kind(kind), m_position(start), m_target(target), m_damage(damage),
      m_explosionRadius(explosionRadius), m_speed(speed) {
  Vector2D direction = target - start;
  m_velocity = direction.length() > 0.0f ? direction.normalized() * speed
                                         : Vector2D(0.0f, 0.0f);
  m_angle = m_velocity.angle();

  const bool special = kind == MissileKind::SpecialAttack;
  m_length = special ? 80.0f : 60.0f;
  m_width = special ? 24.0f : 18.0f;
  m_maxTrailLength = kind == MissileKind::Grenade ? 0 : (special ? 10 : 8);
  m_flameIntensityBase = special ? 1.2f : 1.0f;
  m_flameIntensityVariance = special ? 0.4f : 0.3f;
}

void Missile::setGroundFireCallback(GroundFireCallback callback,
                                    GroundFireSpawn spawn) {
  m_groundFireCallback = std::move(callback);
  m_groundFireSpawn = spawn;
}

SoundHandle Missile::releaseFlightSound() {
  SoundHandle handle = m_flightSound;
  m_flightSound = INVALID_SOUND_HANDLE;
  return handle;
}

bool Missile::update(float deltaTime, std::span<const EnemyView> enemies,
                     IWeaponAudio *audio) {
  if (!(deltaTime >= 0.0f) || !std::isfinite(deltaTime)) {
    MISSILE_WARN(std::format("Missile ignoring invalid dt {}", deltaTime));
    return isFinished();
  }

  m_age += deltaTime;

  switch (m_state) {
  case MissileState::Flying:
    updateFlight(deltaTime, enemies, audio);
    break;
  case MissileState::Exploding:
    m_explosionAge += deltaTime;
    if (m_explosionAge >= m_explosionDuration) {
      m_state = MissileState::Finished;
    }
    break;
  case MissileState::Finished:
    break;
  }
  return isFinished();
}

void Missile::updateFlight(float deltaTime, std::span<const EnemyView> enemies,
                           IWeaponAudio *audio) {
  Vector2D previous = m_position;
  m_position += m_velocity * deltaTime;

  if (m_maxTrailLength > 0) {
    m_trail.push_back(previous);
    while (m_trail.size() > m_maxTrailLength) {
      m_trail.erase(m_trail.begin());
    }
  }

  if (m_velocity.length() > 0.0f) {
    m_angle = m_velocity.angle();
  }

  if (Vector2D::distance(m_target, m_position) < ARRIVAL_DISTANCE ||
      m_age >= m_maxFlightTime) {
    detonate(audio);
    return;
  }

  for (const EnemyView &enemy : enemies) {
    if (Vector2D::distance(enemy.position, m_position) < PROXIMITY_DISTANCE) {
      detonate(audio);
      return;
    }
  }
}

void Missile::detonate(IWeaponAudio *audio) {
  m_state = MissileState::Exploding;
  m_explosionAge = 0.0f;

  if (audio) {
    if (m_flightSound != INVALID_SOUND_HANDLE) {
      audio->stopMissileFlight(m_flightSound);
    }
    audio->playExplosion();
  }
  m_flightSound = INVALID_SOUND_HANDLE;

  if (isSpecialAttack() && m_groundFireCallback) {
    m_groundFireCallback(m_position,
                         m_explosionRadius * m_groundFireSpawn.radiusScale,
                         m_groundFireSpawn.damagePerSecond,
                         m_groundFireSpawn.duration);
  }
}

DamageEvents Missile::checkVisualDamage(std::span<const EnemyView> enemies) {
  DamageEvents events;

  float reach = 0.0f;
  float damage = 0.0f;
  DamageCause cause = DamageCause::Explosion;
  if (m_state == MissileState::Flying) {
    reach = std::max(m_length, m_width) * 0.5f;
    damage = m_damage * 0.25f;
    cause = DamageCause::MissileBody;
  } else if (m_state == MissileState::Exploding) {
    reach = getCurrentExplosionRadius();
    damage = m_damage;
    cause = DamageCause::Explosion;
  } else {
    return events;
  }

  for (const EnemyView &enemy : enemies) {
    if (m_damagedEnemies.count(enemy.handle) != 0) {
      continue;
    }
    if (Vector2D::distance(enemy.position, m_position) <=
        reach + enemy.size * 0.5f) {
      m_damagedEnemies.insert(enemy.handle);
      events.push_back(DamageEvent{enemy.handle, damage, cause});
    }
  }
  return events;
}

float Missile::getExplosionProgress() const {
  if (m_explosionDuration <= 0.0f) {
    return 1.0f;
  }
  return std::clamp(m_explosionAge / m_explosionDuration, 0.0f, 1.0f);
}

float Missile::getCurrentExplosionRadius() const {
  if (m_state != MissileState::Exploding) {
    return 0.0f;
  }
  float progress = getExplosionProgress();
  if (progress < GROWTH_FRACTION) {
    return m_explosionRadius * (progress / GROWTH_FRACTION);
  }
  return m_explosionRadius;
}

std::optional<ExplosionArea> Missile::getExplosionDamageArea() const {
  if (m_state != MissileState::Exploding) {
    return std::nullopt;
  }
  return ExplosionArea{m_position, m_explosionRadius};
}

SDL_FRect Missile::getRect() const {
  return SDL_FRect{m_position.getX() - m_length * 0.5f,
                   m_position.getY() - m_width * 0.5f, m_length, m_width};
}

// ---------------------------------------------------------------------------
// Rendering
// ---------------------------------------------------------------------------

void Missile::render(RenderSurface &surface,
                     const Vector2D &cameraOffset) const {
  const Vector2D at = m_position - cameraOffset;
  if (m_state == MissileState::Flying) {
    if (isGrenade()) {
      renderGrenade(surface, at);
    } else {
      renderTrail(surface, cameraOffset);
      renderBody(surface, at);
    }
  } else if (m_state == MissileState::Exploding) {
    renderExplosion(surface, at);
  }
}

void Missile::renderGrenade(RenderSurface &surface, const Vector2D &at) const {
  constexpr float size = 12.0f;
  const float x = at.getX();
  const float y = at.getY();
  surface.fillCircle(x, y, size, SDL_Color{80, 90, 60, 255});
  surface.drawCircle(x, y, size, SDL_Color{60, 70, 45, 255}, 2.0f);
  // pin
  surface.fillCircle(x, y - std::floor(size * 0.6f), 3.0f,
                     SDL_Color{150, 150, 150, 255});
  const SDL_Color lines{50, 60, 35, 255};
  surface.drawLine(x - size * 0.7f, y, x + size * 0.7f, y, lines, 2.0f);
  surface.drawLine(x, y - size * 0.7f, x, y + size * 0.7f, lines, 2.0f);
}

void Missile::renderTrail(RenderSurface &surface,
                          const Vector2D &cameraOffset) const {
  if (m_trail.empty()) {
    return;
  }
  // Long trails draw every other point
  const size_t stride = m_trail.size() > 8 ? 2 : 1;
  const size_t drawn = (m_trail.size() + stride - 1) / stride;
  const auto &layers = isSpecialAttack() ? SPECIAL_TRAIL : STANDARD_TRAIL;
  const float glowPad = isSpecialAttack() ? 3.0f : 2.0f;
  const float glowAlpha = isSpecialAttack() ? 80.0f : 60.0f;

  size_t index = 0;
  for (size_t i = 0; i < m_trail.size(); i += stride, ++index) {
    const float fade =
        static_cast<float>(index + 1) / static_cast<float>(drawn);
    const Vector2D at = m_trail[i] - cameraOffset;

    // smoke under the fire
    surface.fillCircle(at.getX(), at.getY(), 14.0f * fade,
                       makeColor(90.0f, 90.0f, 90.0f, 60.0f * fade));

    for (const TrailLayer &layer : layers) {
      float size = std::max(1.0f, std::floor(layer.size * fade));
      surface.fillCircle(at.getX(), at.getY(), size,
                         scaleColor(layer.color, fade, 255.0f));
      if (size > 2.0f) {
        SDL_Color glow = layer.color;
        glow.a = static_cast<Uint8>(std::max(20.0f, std::floor(glowAlpha * fade)));
        surface.fillCircle(at.getX(), at.getY(), size + glowPad, glow);
      }
    }
  }
}

void Missile::renderExhaust(RenderSurface &surface, const Vector2D &back,
                            const Vector2D &dir, const Vector2D &perp) const {
  constexpr float flameLength = 50.0f;
  constexpr int segments = 6;
  const float t = m_age;
  const float v = m_flameIntensityVariance;

  const float flicker1 = std::sin(t * 12.0f) * v * 0.5f;
  const float flicker2 = std::sin(t * 15.6f) * v * 0.33f;
  const float flicker3 = std::sin(t * 8.4f) * v * 0.4f;
  const float intensity =
      std::clamp(m_flameIntensityBase + flicker1 + flicker2 + flicker3, 0.6f,
                 1.3f);
  const std::array<float, 4> layerFlicker{flicker1, flicker2, flicker3,
                                          flicker3};

  for (size_t layer = 0; layer < FLAME_COLORS.size(); ++layer) {
    const float layerIntensity = intensity * (1.0f + layerFlicker[layer] * 0.5f);
    const float scale = 1.0f - static_cast<float>(layer) * 0.2f;
    const float length = flameLength * scale * layerIntensity;
    const float maxWidth = 0.8f * scale * layerIntensity * (m_width / 4.0f);
    const SDL_Color color =
        scaleColor(FLAME_COLORS[layer], std::min(layerIntensity, 1.2f), 200.0f);

    std::array<Vector2D, segments> left;
    std::array<Vector2D, segments> right;
    for (int i = 0; i < segments; ++i) {
      float progress = static_cast<float>(i) / segments;
      Vector2D center = back - dir * (length * progress);
      float widthScale = progress < 0.7f
                             ? 0.15f + progress * 1.2f
                             : 1.35f * (1.0f - (progress - 0.7f) / 0.3f);
      float width = maxWidth * widthScale;
      float wave = (std::sin(t * 6.0f + progress * 3.0f) * 0.08f +
                    std::sin(t * 9.0f + progress * 5.0f) * 0.05f) *
                   width;
      left[static_cast<size_t>(i)] = center + perp * (width + wave);
      right[static_cast<size_t>(i)] = center - perp * (width - wave * 0.7f);
    }
    const float tipWobble = std::sin(t * 8.0f) * length * 0.05f;
    const Vector2D tip = back - dir * (length + tipWobble);

    for (size_t i = 0; i + 1 < left.size(); ++i) {
      const std::array<SDL_FPoint, 4> quad{toPoint(left[i]), toPoint(left[i + 1]),
                                           toPoint(right[i + 1]),
                                           toPoint(right[i])};
      surface.fillPolygon(quad, color);
    }
    const std::array<SDL_FPoint, 3> cap{toPoint(left.back()), toPoint(tip),
                                        toPoint(right.back())};
    surface.fillPolygon(cap, color);

    // embers along the flame
    const int emberCount = Random::rangeInt(2, 5);
    for (int i = 0; i < emberCount; ++i) {
      float progress = Random::range(0.1f, 0.9f);
      Vector2D ember = back - dir * (length * progress) +
                       perp * Random::range(-15.0f, 15.0f) * 0.3f;
      float size = std::floor(Random::range(1.0f, 4.0f) * (1.0f - progress * 0.5f));
      if (size >= 1.0f) {
        surface.fillCircle(
            ember.getX(), ember.getY(), size,
            makeColor(color.r + Random::range(-30.0f, 50.0f),
                      color.g + Random::range(-20.0f, 30.0f),
                      color.b + Random::range(-10.0f, 20.0f),
                      Random::range(120.0f, 200.0f)));
      }
    }
  }
}

void Missile::renderBody(RenderSurface &surface, const Vector2D &at) const {
  const bool special = isSpecialAttack();
  const float length = m_length * 1.3f;
  const float width = m_width * 1.2f;
  const Vector2D dir = Vector2D::fromAngle(m_angle);
  const Vector2D normal(-dir.getY(), dir.getX());
  const Vector2D perp = normal * (width * 0.5f);

  renderExhaust(surface, at - dir * (length * 0.5f), dir, normal);

  // four metallic segments, dark at the back
  constexpr int segments = 4;
  const float segmentLength = length / segments;
  for (int i = 0; i < segments; ++i) {
    float start = (static_cast<float>(i) - segments / 2.0f + 0.5f) * segmentLength;
    float end = start + segmentLength * 0.9f;
    float shade = 0.5f + 0.5f * (static_cast<float>(i) / (segments - 1));
    SDL_Color color =
        special ? makeColor(180.0f + 60.0f * shade, 120.0f + 30.0f * shade,
                            120.0f + 30.0f * shade)
                : makeColor(160.0f + 40.0f * shade, 160.0f + 40.0f * shade,
                            180.0f + 40.0f * shade);
    Vector2D front = at + dir * end;
    Vector2D back = at + dir * start;
    const std::array<SDL_FPoint, 4> segment{
        toPoint(front + perp), toPoint(front - perp), toPoint(back - perp),
        toPoint(back + perp)};
    surface.fillPolygon(segment, color);

    SDL_Color highlight = makeColor(color.r + 60.0f, color.g + 60.0f,
                                    color.b + 60.0f);
    const std::array<SDL_FPoint, 4> shine{
        toPoint(front + perp * 0.7f), toPoint(front + perp * 0.3f),
        toPoint(back + perp * 0.3f), toPoint(back + perp * 0.7f)};
    surface.fillPolygon(shine, highlight);
  }

  // warhead
  const Vector2D tip = at + dir * (length * 0.5f);
  const Vector2D tipBack = at + dir * (length * 0.5f - 12.0f);
  surface.fillCircle(tip.getX(), tip.getY(), std::floor(width),
                     special ? SDL_Color{255, 100, 100, 100}
                             : SDL_Color{255, 200, 100, 80});
  const std::array<SDL_FPoint, 3> warhead{toPoint(tip), toPoint(tipBack + perp),
                                          toPoint(tipBack - perp)};
  surface.fillPolygon(warhead, special ? SDL_Color{255, 180, 120, 255}
                                       : SDL_Color{255, 220, 120, 255});
  const std::array<SDL_FPoint, 3> warheadShine{
      toPoint(tip), toPoint(tipBack + perp * 0.6f), toPoint(tipBack - perp * 0.6f)};
  surface.fillPolygon(warheadShine, special ? SDL_Color{255, 255, 180, 255}
                                            : SDL_Color{255, 255, 200, 255});

  // stabilizer fins
  static constexpr std::array<float, 4> standardFins{0.8f, -0.8f, 2.1f, -2.1f};
  static constexpr std::array<float, 6> specialFins{
      0.8f, -0.8f, 2.1f, -2.1f, 0.0f, std::numbers::pi_v<float>};
  const std::span<const float> fins =
      special ? std::span<const float>(specialFins)
              : std::span<const float>(standardFins);
  const float finLength = width * 1.5f;
  const Vector2D finRoot = at - dir * (length * 0.5f - 8.0f);
  const SDL_Color finColor =
      special ? SDL_Color{200, 100, 100, 255} : SDL_Color{180, 120, 120, 255};
  const SDL_Color finShine =
      special ? SDL_Color{240, 120, 120, 255} : SDL_Color{220, 150, 150, 255};

  for (float finAngle : fins) {
    Vector2D reach = normal.rotated(finAngle) * finLength;
    const std::array<SDL_FPoint, 3> fin{
        toPoint(finRoot), toPoint(finRoot + reach),
        toPoint(finRoot - dir * 12.0f + reach * 0.7f)};
    surface.fillPolygon(fin, finColor);
    const std::array<SDL_FPoint, 3> shine{
        toPoint(finRoot), toPoint(finRoot + reach * 0.8f),
        toPoint(finRoot - dir * 8.0f + reach * 0.6f)};
    surface.fillPolygon(shine, finShine);
  }
}

void Missile::renderExplosion(RenderSurface &surface,
                              const Vector2D &at) const {
  const float progress = getExplosionProgress();
  if (progress < 0.1f) {
    renderExplosionFlash(surface, at, progress);
  } else if (progress < 0.4f) {
    renderExplosionExpansion(surface, at, progress);
  } else if (progress < GROWTH_FRACTION) {
    renderExplosionPeak(surface, at, progress);
  } else {
    renderExplosionFade(surface, at, progress);
  }
}

void Missile::renderExplosionFlash(RenderSurface &surface, const Vector2D &at,
                                   float progress) const {
  const float remaining = 1.0f - progress / 0.1f;
  const float flash = std::floor(m_explosionRadius * 0.5f);
  const float x = at.getX();
  const float y = at.getY();
  surface.fillCircle(x, y, flash * 2.0f,
                     makeColor(255.0f, 255.0f, 200.0f, 60.0f * remaining));
  surface.fillCircle(x, y, flash * 1.4f,
                     makeColor(255.0f, 255.0f, 150.0f, 120.0f * remaining));
  surface.fillCircle(x, y, flash,
                     makeColor(255.0f, 255.0f, 255.0f, 200.0f * remaining));
  surface.fillCircle(x, y, flash * 0.6f,
                     makeColor(255.0f, 255.0f, 100.0f, 255.0f * remaining));
}

void Missile::renderExplosionExpansion(RenderSurface &surface,
                                       const Vector2D &at,
                                       float progress) const {
  struct Layer {
    float radiusScale;
    SDL_Color color;
    float alpha;
  };
  const float expansion = (progress - 0.1f) / 0.3f;
  const float radius = std::floor(m_explosionRadius * expansion);
  const float x = at.getX();
  const float y = at.getY();

  const std::array<Layer, 6> layers{{
      {1.2f, {255, 80, 0, 255}, 140.0f * (1.0f - expansion * 0.3f)},
      {1.0f, {255, 120, 20, 255}, 180.0f * (1.0f - expansion * 0.2f)},
      {0.8f, {255, 150, 50, 255}, 200.0f * (1.0f - expansion * 0.1f)},
      {0.6f, {255, 200, 100, 255}, 220.0f},
      {0.4f, {255, 255, 150, 255}, 240.0f},
      {0.2f, {255, 255, 255, 255}, 255.0f},
  }};
  for (const Layer &layer : layers) {
    float r = std::floor(radius * layer.radiusScale);
    if (r > 0.0f) {
      surface.fillCircle(x, y, r, scaleColor(layer.color, 1.0f, layer.alpha));
    }
  }

  const int particles = static_cast<int>(20.0f * expansion);
  for (int i = 0; i < particles; ++i) {
    Vector2D p = at + Vector2D::fromAngle(Random::range(0.0f, TWO_PI),
                                          Random::range(radius * 0.8f,
                                                        radius * 1.3f));
    surface.fillCircle(p.getX(), p.getY(),
                       static_cast<float>(Random::rangeInt(2, 6)),
                       makeColor(255.0f, Random::range(150.0f, 255.0f),
                                 Random::range(0.0f, 100.0f),
                                 Random::range(120.0f, 200.0f)));
  }

  const float shockwave = std::floor(radius * 1.4f);
  if (shockwave > 5.0f) {
    surface.drawCircle(x, y, shockwave,
                       makeColor(255.0f, 200.0f, 150.0f,
                                 100.0f * (1.0f - expansion)),
                       4.0f);
  }
  if (expansion > 0.3f) {
    surface.drawCircle(x, y, std::floor(radius * 1.3f),
                       SDL_Color{255, 200, 100, 255},
                       std::max(2.0f, std::floor(5.0f * (1.0f - expansion))));
  }
}

void Missile::renderExplosionPeak(RenderSurface &surface, const Vector2D &at,
                                  float progress) const {
  struct Layer {
    float radiusScale;
    SDL_Color color;
    float alphaScale;
  };
  const float peak = (progress - 0.4f) / 0.3f;
  const float fade = 1.0f - peak * 0.5f;
  const float x = at.getX();
  const float y = at.getY();

  const std::array<Layer, 5> layers{{
      {1.0f, {255, 80, 0, 255}, 0.7f},
      {0.8f, {255, 120, 40, 255}, 0.8f},
      {0.6f, {255, 160, 80, 255}, 0.9f},
      {0.4f, {255, 200, 120, 255}, 1.0f},
      {0.2f, {255, 240, 160, 255}, 1.0f},
  }};
  for (const Layer &layer : layers) {
    float r = std::floor(m_explosionRadius * layer.radiusScale);
    if (r > 0.0f) {
      surface.fillCircle(x, y, r,
                         scaleColor(layer.color, 1.0f,
                                    255.0f * fade * layer.alphaScale));
    }
  }

  constexpr int debrisCount = 12;
  const float distance = m_explosionRadius * (0.8f + peak * 0.4f);
  for (int i = 0; i < debrisCount; ++i) {
    float angle = static_cast<float>(i) / debrisCount * TWO_PI;
    Vector2D p = at + Vector2D::fromAngle(angle, distance);
    surface.fillCircle(p.getX(), p.getY(),
                       static_cast<float>(Random::rangeInt(2, 6)),
                       makeColor(255.0f, Random::range(100.0f, 200.0f), 0.0f));
  }
}

void Missile::renderExplosionFade(RenderSurface &surface, const Vector2D &at,
                                  float progress) const {
  const float fade = std::min((progress - GROWTH_FRACTION) / 0.3f, 1.0f);
  const float smokeRadius = std::floor(m_explosionRadius * (1.1f + fade * 0.3f));
  const float smokeAlpha = 150.0f * (1.0f - fade);
  const float x = at.getX();
  const float y = at.getY();

  if (smokeAlpha > 0.0f) {
    surface.fillCircle(x, y, smokeRadius, makeColor(80, 80, 80, smokeAlpha));
    surface.fillCircle(x, y, smokeRadius * 0.8f,
                       makeColor(100, 100, 100, smokeAlpha));
    surface.fillCircle(x, y, smokeRadius * 0.6f,
                       makeColor(120, 120, 120, smokeAlpha));
  }

  if (fade < 0.7f) {
    constexpr int emberCount = 8;
    for (int i = 0; i < emberCount; ++i) {
      Vector2D p = at + Vector2D::fromAngle(
                            Random::range(0.0f, TWO_PI),
                            smokeRadius * Random::range(0.3f, 0.8f));
      surface.fillCircle(p.getX(), p.getY(),
                         static_cast<float>(Random::rangeInt(1, 3)),
                         makeColor(255.0f, Random::range(150.0f, 255.0f),
                                   Random::range(0.0f, 100.0f)));
    }
  }
}

} // namespace Stormfire
