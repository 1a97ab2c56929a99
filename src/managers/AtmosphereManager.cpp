/* Copyright (c) 2025 Stormfire Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/AtmosphereManager.hpp"
#include "core/Logger.hpp"
#include "render/RenderSurface.hpp"
#include "utils/Random.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <format>
#include <numbers>

namespace Stormfire {

namespace {

constexpr std::array<SDL_Color, 3> RAIN_COLORS{
    {{180, 200, 255, 255}, {160, 180, 255, 255}, {200, 220, 255, 255}}};
constexpr std::array<SDL_Color, 3> SNOW_COLORS{
    {{255, 255, 255, 255}, {240, 240, 255, 255}, {220, 220, 240, 255}}};
constexpr std::array<SDL_Color, 5> PETAL_COLORS{{{255, 182, 193, 255},
                                                 {255, 192, 203, 255},
                                                 {255, 174, 185, 255},
                                                 {255, 160, 180, 255},
                                                 {240, 170, 190, 255}}};

constexpr float FIRST_LIGHTNING_MIN = 3.0f;
constexpr float FIRST_LIGHTNING_MAX = 8.0f;
constexpr float NEXT_LIGHTNING_MIN = 4.0f;
constexpr float NEXT_LIGHTNING_MAX = 10.0f;

template <size_t N> SDL_Color pick(const std::array<SDL_Color, N> &palette) {
  return palette[static_cast<size_t>(Random::rangeInt(0, static_cast<int>(N) - 1))];
}

double sdlClockSeconds() {
  return static_cast<double>(SDL_GetTicksNS()) / 1'000'000'000.0;
}

} // namespace

const char *atmosphereTypeToString(AtmosphereType type) {
  switch (type) {
  case AtmosphereType::None:
    return "none";
  case AtmosphereType::Rain:
    return "rain";
  case AtmosphereType::Snow:
    return "snow";
  case AtmosphereType::Petals:
    return "petals";
  }
  return "none";
}

AtmosphereType atmosphereTypeFromString(std::string_view name) {
  if (name == "rain")
    return AtmosphereType::Rain;
  if (name == "snow")
    return AtmosphereType::Snow;
  if (name == "petals")
    return AtmosphereType::Petals;
  return AtmosphereType::None;
}

AtmosphereManager::AtmosphereManager(const AtmosphereConfig &config,
                                     Clock clock)
    : m_config(config),
      m_clock(clock ? std::move(clock) : Clock(sdlClockSeconds)) {}

void AtmosphereManager::setAtmosphere(AtmosphereType kind) {
  if (kind == m_type) {
    return;
  }

  ATMOSPHERE_INFO(std::format("Atmosphere {} -> {}",
                              atmosphereTypeToString(m_type),
                              atmosphereTypeToString(kind)));
  m_type = kind;
  m_particles.clear();
  m_lightning = LightningState{};
  m_lightning.nextInterval =
      Random::range(FIRST_LIGHTNING_MIN, FIRST_LIGHTNING_MAX);

  switch (kind) {
  case AtmosphereType::Rain:
    generateParticles(kind, m_config.rainCount);
    break;
  case AtmosphereType::Snow:
    generateParticles(kind, m_config.snowCount);
    break;
  case AtmosphereType::Petals:
    generateParticles(kind, m_config.petalCount);
    break;
  case AtmosphereType::None:
    break;
  }
}

void AtmosphereManager::setRandomAtmosphere() {
  setAtmosphere(static_cast<AtmosphereType>(Random::rangeInt(0, 3)));
}

void AtmosphereManager::generateParticles(AtmosphereType kind, int count) {
  m_particles.reserve(static_cast<size_t>(std::max(count, 0)));
  for (int i = 0; i < count; ++i) {
    m_particles.push_back(
        makeParticle(kind, Random::range(0.0f, m_config.worldWidth),
                     Random::range(0.0f, m_config.worldHeight)));
  }
  ATMOSPHERE_DEBUG(std::format("Generated {} {} particles over {}x{}",
                               m_particles.size(),
                               atmosphereTypeToString(kind),
                               m_config.worldWidth, m_config.worldHeight));
}

AtmosphereParticle AtmosphereManager::makeParticle(AtmosphereType kind,
                                                   float x, float y) const {
  AtmosphereParticle p;
  p.position = Vector2D(x, y);

  switch (kind) {
  case AtmosphereType::Rain:
    p.fallSpeed = Random::range(400.0f, 800.0f);
    p.drift = Random::range(-50.0f, 50.0f);
    p.width = static_cast<float>(Random::rangeInt(2, 4));
    p.height = static_cast<float>(Random::rangeInt(15, 25));
    p.color = pick(RAIN_COLORS);
    break;
  case AtmosphereType::Snow:
    p.fallSpeed = Random::range(60.0f, 120.0f);
    p.drift = Random::range(-80.0f, 80.0f);
    p.width = static_cast<float>(Random::rangeInt(3, 8));
    p.color = pick(SNOW_COLORS);
    break;
  case AtmosphereType::Petals:
    p.fallSpeed = Random::range(40.0f, 100.0f);
    p.drift = Random::range(-120.0f, 120.0f);
    p.width = static_cast<float>(Random::rangeInt(5, 11));
    p.color = pick(PETAL_COLORS);
    p.rotation = Random::range(0.0f, 2.0f * std::numbers::pi_v<float>);
    p.rotationSpeed = Random::range(-2.0f, 2.0f);
    break;
  case AtmosphereType::None:
    break;
  }
  return p;
}

void AtmosphereManager::update(float deltaTime) {
  if (!(deltaTime >= 0.0f) || !std::isfinite(deltaTime)) {
    ATMOSPHERE_WARN(std::format("Ignoring update with invalid dt {}", deltaTime));
    return;
  }

  pruneFootprints(m_clock());

  if (m_type == AtmosphereType::None) {
    return;
  }

  const float maxX = m_config.worldWidth + WRAP_MARGIN;
  const float maxY = m_config.worldHeight + WRAP_MARGIN;

  for (AtmosphereParticle &p : m_particles) {
    float x = p.position.getX() + p.drift * deltaTime;
    float y = p.position.getY() + p.fallSpeed * deltaTime;

    if (y > maxY) {
      y = -WRAP_MARGIN;
      x = Random::range(0.0f, m_config.worldWidth);
    }
    if (x < -WRAP_MARGIN) {
      x = maxX;
    } else if (x > maxX) {
      x = -WRAP_MARGIN;
    }
    p.position = Vector2D(x, y);
    p.rotation += p.rotationSpeed * deltaTime;
  }

  if (m_type == AtmosphereType::Rain) {
    updateLightning(deltaTime);
  }
}

void AtmosphereManager::updateLightning(float deltaTime) {
  LightningState &l = m_lightning;
  l.timer += deltaTime;

  if (!l.active && l.timer >= l.nextInterval) {
    l.active = true;
    l.remaining = Random::range(0.1f, 0.2f);
    l.nextInterval = Random::range(NEXT_LIGHTNING_MIN, NEXT_LIGHTNING_MAX);
    ATMOSPHERE_DEBUG("Lightning flash");
  }

  if (l.active) {
    l.remaining -= deltaTime;
    if (l.remaining <= 0.0f) {
      l.active = false;
      l.remaining = 0.0f;
      l.timer = 0.0f;
    }
  }
}

void AtmosphereManager::render(RenderSurface &surface,
                               const Vector2D &cameraOffset) const {
  if (m_type == AtmosphereType::None) {
    return;
  }

  const float maxX = static_cast<float>(surface.getWidth()) + CULL_MARGIN;
  const float maxY = static_cast<float>(surface.getHeight()) + CULL_MARGIN;

  for (const AtmosphereParticle &p : m_particles) {
    const float sx = p.position.getX() - cameraOffset.getX();
    const float sy = p.position.getY() - cameraOffset.getY();
    if (sx < -CULL_MARGIN || sx > maxX || sy < -CULL_MARGIN || sy > maxY) {
      continue;
    }

    switch (m_type) {
    case AtmosphereType::Rain:
      surface.fillRect(sx, sy, p.width, p.height, p.color);
      break;
    case AtmosphereType::Snow:
      surface.fillCircle(sx, sy, p.width * 0.5f + 1.0f, p.color);
      break;
    case AtmosphereType::Petals:
      renderPetal(surface, p, sx, sy);
      break;
    case AtmosphereType::None:
      break;
    }
  }
}

void AtmosphereManager::renderPetal(RenderSurface &surface,
                                    const AtmosphereParticle &petal, float sx,
                                    float sy) const {
  constexpr float step = 2.0f * std::numbers::pi_v<float> / 5.0f;
  const float length = std::max(3.0f, petal.width * 0.8f);
  const float breadth = std::max(2.0f, petal.width * 0.6f);
  const bool highlightTips = petal.width >= 7.0f;
  const SDL_Color tipColor = makeColor(petal.color.r + 25.0f,
                                       petal.color.g + 25.0f,
                                       petal.color.b + 25.0f);

  for (int i = 0; i < 5; ++i) {
    float angle = petal.rotation + step * static_cast<float>(i);
    Vector2D dir = Vector2D::fromAngle(angle);
    Vector2D center = Vector2D(sx, sy) + dir * (length * 0.6f);
    surface.fillEllipse(center.getX(), center.getY(), length * 0.5f,
                        breadth * 0.5f, angle, petal.color);
    if (highlightTips) {
      surface.fillCircle(sx + dir.getX() * length, sy + dir.getY() * length,
                         1.0f, tipColor);
    }
  }

  const float core = std::max(2.0f, std::floor(petal.width / 3.0f));
  surface.fillCircle(sx, sy, core, SDL_Color{200, 255, 200, 255});
  surface.fillCircle(sx, sy, std::max(1.0f, core * 0.5f),
                     SDL_Color{255, 255, 150, 255});
}

void AtmosphereManager::renderScreenOverlays(RenderSurface &surface) const {
  switch (m_type) {
  case AtmosphereType::Rain:
    if (m_lightning.active) {
      surface.fillOverlay(SDL_Color{255, 255, 255, 100});
    } else {
      surface.fillOverlay(SDL_Color{100, 150, 200, 25});
    }
    break;
  case AtmosphereType::Snow:
    surface.fillOverlay(SDL_Color{200, 220, 255, 20});
    break;
  case AtmosphereType::Petals:
    surface.fillOverlay(SDL_Color{255, 200, 220, 15});
    break;
  case AtmosphereType::None:
    break;
  }
}

bool AtmosphereManager::addFootprint(float x, float y) {
  const double now = m_clock();
  if (m_hasFootprint && now - m_lastFootprintTime < m_config.footprintInterval) {
    return false;
  }
  m_hasFootprint = true;
  m_lastFootprintTime = now;

  m_footprints.push_back(Footprint{Vector2D(x, y), now});
  const auto cap = static_cast<size_t>(std::max(m_config.footprintMax, 0));
  while (m_footprints.size() > cap) {
    m_footprints.pop_front();
  }
  return true;
}

void AtmosphereManager::pruneFootprints(double now) {
  while (!m_footprints.empty() &&
         now - m_footprints.front().createdAt > m_config.footprintFade) {
    m_footprints.pop_front();
  }
}

void AtmosphereManager::renderFootprints(RenderSurface &surface,
                                         const Vector2D &cameraOffset) const {
  const double now = m_clock();
  for (const Footprint &print : m_footprints) {
    double age = now - print.createdAt;
    if (age > m_config.footprintFade) {
      continue;
    }
    float alpha =
        255.0f * static_cast<float>(1.0 - age / m_config.footprintFade);
    Vector2D screen = print.position - cameraOffset;
    surface.fillCircle(screen.getX(), screen.getY(), FOOTPRINT_RADIUS,
                       makeColor(100.0f, 100.0f, 100.0f, alpha));
  }
}

} // namespace Stormfire
