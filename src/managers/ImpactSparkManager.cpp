/* Copyright (c) 2025 Stormfire Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/ImpactSparkManager.hpp"
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

using Palette = std::array<SDL_Color, 3>;

constexpr Palette WALL_PALETTE{{{255, 255, 255, 255},
                                {255, 255, 200, 255},
                                {255, 200, 100, 255}}};
constexpr Palette METAL_PALETTE{{{255, 255, 255, 255},
                                 {200, 200, 255, 255},
                                 {150, 150, 255, 255}}};
constexpr Palette DIRT_PALETTE{{{139, 69, 19, 255},
                                {160, 82, 45, 255},
                                {210, 180, 140, 255}}};

const Palette &paletteFor(SurfaceType surface) {
  switch (surface) {
  case SurfaceType::Metal:
    return METAL_PALETTE;
  case SurfaceType::Dirt:
    return DIRT_PALETTE;
  case SurfaceType::Wall:
  case SurfaceType::Default:
    break;
  }
  return WALL_PALETTE;
}

} // namespace

float ImpactSpark::getFade() const {
  if (lifetime <= 0.0f) {
    return 0.0f;
  }
  return std::clamp(1.0f - age / lifetime, 0.0f, 1.0f);
}

SDL_Color ImpactSpark::getColor() const {
  return scaleColor(baseColor, getFade(), 255.0f);
}

float ImpactSpark::getSize() const { return baseSize * getFade(); }

void ImpactSparkManager::addImpactSparks(float x, float y,
                                         std::optional<float> impactAngle,
                                         SurfaceType surface) {
  if (!std::isfinite(x) || !std::isfinite(y)) {
    SPARKS_WARN(std::format("Ignoring sparks at non-finite position ({}, {})",
                            x, y));
    return;
  }

  constexpr float pi = std::numbers::pi_v<float>;
  const Palette &palette = paletteFor(surface);
  const int count = Random::rangeInt(3, 5);

  for (int i = 0; i < count; ++i) {
    float direction = impactAngle
                          ? *impactAngle + pi + Random::range(-pi / 3, pi / 3)
                          : Random::range(0.0f, 2.0f * pi);
    float speed = Random::range(50.0f, 150.0f);

    ImpactSpark spark;
    spark.position = Vector2D(x + Random::range(-2.0f, 2.0f),
                              y + Random::range(-2.0f, 2.0f));
    spark.velocity = Vector2D::fromAngle(direction, speed);
    spark.baseColor = palette[static_cast<size_t>(
        Random::rangeInt(0, static_cast<int>(palette.size()) - 1))];
    spark.baseSize = Random::range(2.0f, 4.0f);
    spark.lifetime = Random::range(0.2f, 0.5f);
    m_sparks.push_back(spark);
  }
}

void ImpactSparkManager::update(float deltaTime) {
  if (!(deltaTime >= 0.0f) || !std::isfinite(deltaTime)) {
    SPARKS_WARN(std::format("Ignoring update with invalid dt {}", deltaTime));
    return;
  }

  for (ImpactSpark &spark : m_sparks) {
    // Move with the velocity from the previous tick, then apply forces
    spark.position += spark.velocity * deltaTime;
    spark.velocity.setY(spark.velocity.getY() + GRAVITY * deltaTime);
    spark.velocity *= DRAG;
    spark.age += deltaTime;
  }

  m_sparks.erase(std::remove_if(m_sparks.begin(), m_sparks.end(),
                                [](const ImpactSpark &spark) {
                                  return spark.isExpired();
                                }),
                 m_sparks.end());
}

void ImpactSparkManager::render(RenderSurface &surface,
                                const Vector2D &cameraOffset) const {
  const float maxX = static_cast<float>(surface.getWidth()) + CULL_MARGIN;
  const float maxY = static_cast<float>(surface.getHeight()) + CULL_MARGIN;

  for (const ImpactSpark &spark : m_sparks) {
    Vector2D screen = spark.position - cameraOffset;
    if (screen.getX() < -CULL_MARGIN || screen.getX() > maxX ||
        screen.getY() < -CULL_MARGIN || screen.getY() > maxY) {
      continue;
    }
    float size = spark.getSize();
    if (size <= 0.0f) {
      continue;
    }
    surface.fillCircle(screen.getX(), screen.getY(), std::max(1.0f, size),
                       spark.getColor());
  }
}

} // namespace Stormfire
