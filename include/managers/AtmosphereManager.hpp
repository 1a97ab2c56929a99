/* Copyright (c) 2025 Stormfire Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ATMOSPHERE_MANAGER_HPP
#define ATMOSPHERE_MANAGER_HPP

/**
 * @file AtmosphereManager.hpp
 * @brief World-space weather particles with lightning and player footprints
 *
 * Particles live at fixed world coordinates spread over the whole map and
 * fall continuously, re-entering at the top once they leave the bottom. The
 * field is regenerated only when the atmosphere kind changes, so switching
 * to the kind already active keeps every particle where it is.
 *
 * Rain additionally runs a lightning timer that drives a white full-screen
 * flash in renderScreenOverlays().
 */

#include "effects/EffectsConfig.hpp"
#include "utils/Vector2D.hpp"
#include <SDL3/SDL.h>
#include <cstdint>
#include <deque>
#include <functional>
#include <string_view>
#include <vector>

namespace Stormfire {

class RenderSurface;

enum class AtmosphereType : uint8_t { None = 0, Rain = 1, Snow = 2, Petals = 3 };

const char *atmosphereTypeToString(AtmosphereType type);

/// Parses "none", "rain", "snow" or "petals"; unknown names give None
AtmosphereType atmosphereTypeFromString(std::string_view name);

struct AtmosphereParticle {
  Vector2D position;
  float fallSpeed{0.0f}; // pixels per second, downward
  float drift{0.0f};     // pixels per second, horizontal
  float width{0.0f};     // rain streak width, otherwise diameter
  float height{0.0f};    // rain streak length, unused for other kinds
  SDL_Color color{255, 255, 255, 255};
  float rotation{0.0f};      // petals only
  float rotationSpeed{0.0f}; // petals only
};

struct LightningState {
  float timer{0.0f};
  float nextInterval{0.0f};
  float remaining{0.0f};
  bool active{false};
};

struct Footprint {
  Vector2D position;
  double createdAt{0.0};
};

class AtmosphereManager {
public:
  // Wall clock in seconds used for footprint pacing and fading
  using Clock = std::function<double()>;

  static constexpr float WRAP_MARGIN = 50.0f;
  static constexpr float CULL_MARGIN = 50.0f;
  static constexpr float FOOTPRINT_RADIUS = 3.0f;

  explicit AtmosphereManager(const AtmosphereConfig &config = {},
                             Clock clock = {});

  /**
   * @brief Switches weather kind
   *
   * No-op when kind is already active. Otherwise discards the field and
   * scatters a fresh one uniformly over the world, and restarts the
   * lightning timer.
   */
  void setAtmosphere(AtmosphereType kind);

  /// Picks one of the four kinds (None included) at random
  void setRandomAtmosphere();

  void update(float deltaTime);

  /// Particles in world space, shifted by cameraOffset and culled to screen
  void render(RenderSurface &surface, const Vector2D &cameraOffset) const;

  /// Full-screen tint for the current kind, or the lightning flash
  void renderScreenOverlays(RenderSurface &surface) const;

  /**
   * @brief Records a footprint at a world position
   * @return false when rate limited (less than the configured interval since
   *         the previous accepted footprint)
   */
  bool addFootprint(float x, float y);
  void renderFootprints(RenderSurface &surface,
                        const Vector2D &cameraOffset) const;

  AtmosphereType getAtmosphere() const { return m_type; }
  size_t getParticleCount() const { return m_particles.size(); }
  const std::vector<AtmosphereParticle> &getParticles() const {
    return m_particles;
  }
  bool isLightningActive() const { return m_lightning.active; }
  const LightningState &getLightningState() const { return m_lightning; }
  size_t getFootprintCount() const { return m_footprints.size(); }
  const std::deque<Footprint> &getFootprints() const { return m_footprints; }
  const AtmosphereConfig &getConfig() const { return m_config; }

private:
  void generateParticles(AtmosphereType kind, int count);
  AtmosphereParticle makeParticle(AtmosphereType kind, float x,
                                  float y) const;
  void updateLightning(float deltaTime);
  void pruneFootprints(double now);
  void renderPetal(RenderSurface &surface, const AtmosphereParticle &petal,
                   float sx, float sy) const;

  AtmosphereConfig m_config;
  Clock m_clock;
  AtmosphereType m_type{AtmosphereType::None};
  std::vector<AtmosphereParticle> m_particles;
  LightningState m_lightning;
  std::deque<Footprint> m_footprints;
  double m_lastFootprintTime{0.0};
  bool m_hasFootprint{false};
};

} // namespace Stormfire

#endif // ATMOSPHERE_MANAGER_HPP
