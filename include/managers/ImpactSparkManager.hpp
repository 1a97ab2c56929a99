/* Copyright (c) 2025 Stormfire Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef IMPACT_SPARK_MANAGER_HPP
#define IMPACT_SPARK_MANAGER_HPP

/**
 * @file ImpactSparkManager.hpp
 * @brief Short-lived ballistic sparks spawned where projectiles hit walls.
 *
 * Each spark falls under gravity, slows by a fixed per-tick drag and fades
 * color and size linearly to zero over a random 0.2-0.5s lifetime. Expired
 * sparks are compacted out after the update pass.
 */

#include "utils/Vector2D.hpp"
#include <SDL3/SDL.h>
#include <cstdint>
#include <optional>
#include <vector>

namespace Stormfire {

class RenderSurface;

enum class SurfaceType : uint8_t { Default = 0, Wall = 1, Metal = 2, Dirt = 3 };

struct ImpactSpark {
  Vector2D position;
  Vector2D velocity;
  SDL_Color baseColor{255, 255, 255, 255};
  float baseSize{3.0f};
  float age{0.0f};
  float lifetime{0.3f};

  // 1 at spawn, 0 at end of life
  float getFade() const;
  SDL_Color getColor() const;
  float getSize() const;
  bool isExpired() const { return age >= lifetime; }
};

class ImpactSparkManager {
public:
  static constexpr float GRAVITY = 300.0f;
  static constexpr float DRAG = 0.95f;
  static constexpr float CULL_MARGIN = 10.0f;

  ImpactSparkManager() = default;

  /**
   * @brief Spawns 3-5 sparks at (x, y)
   * @param impactAngle direction the projectile was travelling; sparks fly
   *        back along it with +/-60 degrees of spread. Without an angle they
   *        scatter in every direction.
   * @param surface selects the color palette
   */
  void addImpactSparks(float x, float y,
                       std::optional<float> impactAngle = std::nullopt,
                       SurfaceType surface = SurfaceType::Default);

  void update(float deltaTime);
  void render(RenderSurface &surface, const Vector2D &cameraOffset) const;

  void clear() { m_sparks.clear(); }
  size_t getSparkCount() const { return m_sparks.size(); }
  const std::vector<ImpactSpark> &getSparks() const { return m_sparks; }

private:
  std::vector<ImpactSpark> m_sparks;
};

} // namespace Stormfire

#endif // IMPACT_SPARK_MANAGER_HPP
