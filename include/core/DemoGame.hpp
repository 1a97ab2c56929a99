/* Copyright (c) 2025 Stormfire Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DEMO_GAME_HPP
#define DEMO_GAME_HPP

#include "effects/DamageEvent.hpp"
#include "effects/EffectsConfig.hpp"
#include "entities/EnemyView.hpp"
#include "managers/AtmosphereManager.hpp"
#include "managers/ImpactSparkManager.hpp"
#include "managers/MissileManager.hpp"
#include "managers/SoundManager.hpp"
#include "utils/Camera.hpp"
#include "utils/Vector2D.hpp"
#include <SDL3/SDL.h>
#include <memory>
#include <string>
#include <vector>

namespace Stormfire {

class RenderSurface;

/**
 * @brief Playable sandbox that drives every effect system.
 *
 * WASD moves the player, left click fires a missile at the cursor, right
 * click a special attack, G a grenade, keys 1-4 pick the weather and R
 * randomizes it. Target dummies wander the world and respawn when killed.
 * The dummies are host state; effect systems only read EnemyView snapshots
 * and report damage back.
 */
class DemoGame {
public:
  DemoGame() = default;
  ~DemoGame();

  DemoGame(const DemoGame &) = delete;
  DemoGame &operator=(const DemoGame &) = delete;

  /**
   * @brief Creates the window, renderer, audio and effect systems
   * @return false if SDL or the window could not be created
   */
  bool init(const std::string &title, int width, int height, bool vsync,
            const EffectsConfig &config, float masterVolume);

  void handleEvents();
  void update(float deltaTime, double now);
  void render();
  void clean();

  bool isRunning() const { return m_running; }
  bool isUsingVSync() const { return m_vsync; }

private:
  struct Dummy {
    EntityHandle handle;
    Vector2D position;
    Vector2D velocity;
    float size{40.0f};
    float health{100.0f};
  };

  void spawnDummy();
  void updatePlayer(float deltaTime);
  void updateDummies(float deltaTime);
  void applyDamage(const DamageEvents &events);
  void rebuildEnemyViews();
  Vector2D cursorWorldPosition() const;
  void renderWorld(RenderSurface &surface, const Vector2D &offset) const;

  SDL_Window *m_window{nullptr};
  SDL_Renderer *m_renderer{nullptr};
  int m_width{1280};
  int m_height{720};
  bool m_vsync{true};
  bool m_running{false};

  EffectsConfig m_config{};
  std::unique_ptr<SoundManager> m_sound;
  std::unique_ptr<AtmosphereManager> m_atmosphere;
  std::unique_ptr<ImpactSparkManager> m_sparks;
  std::unique_ptr<MissileManager> m_missiles;
  Camera m_camera{};

  Vector2D m_player{};
  Vector2D m_playerVelocity{};
  std::vector<Dummy> m_dummies;
  std::vector<EnemyView> m_enemyViews;
  float m_score{0.0f};
};

} // namespace Stormfire

#endif // DEMO_GAME_HPP
