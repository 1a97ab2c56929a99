/* Copyright (c) 2025 Stormfire Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/DemoGame.hpp"
#include "core/Logger.hpp"
#include "render/RenderSurface.hpp"
#include "utils/Random.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace Stormfire {

namespace {
constexpr float PLAYER_SPEED = 320.0f;
constexpr float PLAYER_RADIUS = 16.0f;
constexpr size_t DUMMY_COUNT = 12;
constexpr float DUMMY_HEALTH = 100.0f;
constexpr float EXPLOSION_SHAKE = 6.0f;
} // namespace

DemoGame::~DemoGame() { clean(); }

bool DemoGame::init(const std::string &title, int width, int height,
                    bool vsync, const EffectsConfig &config,
                    float masterVolume) {
  if (!SDL_Init(SDL_INIT_VIDEO)) {
    GAMELOOP_CRITICAL(std::format("SDL_Init failed: {}", SDL_GetError()));
    return false;
  }

  m_width = width;
  m_height = height;
  m_config = config;

  if (!SDL_CreateWindowAndRenderer(title.c_str(), width, height, 0, &m_window,
                                   &m_renderer)) {
    GAMELOOP_CRITICAL(std::format("Window creation failed: {}", SDL_GetError()));
    return false;
  }

  m_vsync = vsync && SDL_SetRenderVSync(m_renderer, 1);
  if (vsync && !m_vsync) {
    GAMELOOP_WARN(std::format("VSync unavailable, using software frame limiting: {}",
                              SDL_GetError()));
  }

  // Audio is optional; the effect systems run silent without it
  m_sound = std::make_unique<SoundManager>();
  IWeaponAudio *audio = nullptr;
  if (m_sound->init()) {
    m_sound->setSFXVolume(masterVolume);
    if (!m_sound->loadWeaponSounds("res/sfx")) {
      GAMELOOP_WARN("Weapon sounds missing from res/sfx");
    }
    audio = m_sound.get();
  } else {
    GAMELOOP_WARN("Audio unavailable, continuing without sound");
  }

  m_atmosphere = std::make_unique<AtmosphereManager>(m_config.atmosphere);
  m_sparks = std::make_unique<ImpactSparkManager>();
  m_missiles = std::make_unique<MissileManager>(m_config, audio);

  const float worldW = m_config.atmosphere.worldWidth;
  const float worldH = m_config.atmosphere.worldHeight;
  m_player = Vector2D(worldW * 0.5f, worldH * 0.5f);
  m_camera = Camera(m_player.getX(), m_player.getY(), static_cast<float>(width),
                    static_cast<float>(height));
  m_camera.setWorldBounds(0.0f, 0.0f, worldW, worldH);
  m_camera.setTargetPositionGetter([this]() { return m_player; });

  m_dummies.reserve(DUMMY_COUNT);
  for (size_t i = 0; i < DUMMY_COUNT; ++i) {
    spawnDummy();
  }

  m_atmosphere->setAtmosphere(AtmosphereType::Rain);
  m_running = true;
  GAMELOOP_INFO(std::format("{} ready at {}x{} ({})", title, width, height,
                            m_vsync ? "vsync" : "software limiting"));
  return true;
}

void DemoGame::spawnDummy() {
  Dummy dummy;
  dummy.handle = EntityHandle::create();
  do {
    dummy.position =
        Vector2D(Random::range(100.0f, m_config.atmosphere.worldWidth - 100.0f),
                 Random::range(100.0f, m_config.atmosphere.worldHeight - 100.0f));
  } while (Vector2D::distance(dummy.position, m_player) < 300.0f);
  dummy.velocity = Vector2D::fromAngle(Random::range(0.0f, 6.2831853f),
                                       Random::range(30.0f, 90.0f));
  dummy.size = Random::range(30.0f, 50.0f);
  dummy.health = DUMMY_HEALTH;
  m_dummies.push_back(dummy);
}

void DemoGame::handleEvents() {
  SDL_Event event;
  while (SDL_PollEvent(&event)) {
    switch (event.type) {
    case SDL_EVENT_QUIT:
      m_running = false;
      break;
    case SDL_EVENT_MOUSE_BUTTON_DOWN: {
      const bool special = event.button.button == SDL_BUTTON_RIGHT;
      if (event.button.button == SDL_BUTTON_LEFT || special) {
        const Vector2D target = cursorWorldPosition();
        const bool fired = special ? m_missiles->fireSpecialMissile(m_player, target)
                                   : m_missiles->fireMissile(m_player, target);
        if (!fired) {
          GAMELOOP_WARN("Missile launch rejected");
        }
      }
      break;
    }
    case SDL_EVENT_KEY_DOWN:
      switch (event.key.key) {
      case SDLK_ESCAPE:
        m_running = false;
        break;
      case SDLK_G:
        if (!m_missiles->fireGrenade(m_player, cursorWorldPosition())) {
          GAMELOOP_WARN("Grenade launch rejected");
        }
        break;
      case SDLK_1:
        m_atmosphere->setAtmosphere(AtmosphereType::None);
        break;
      case SDLK_2:
        m_atmosphere->setAtmosphere(AtmosphereType::Rain);
        break;
      case SDLK_3:
        m_atmosphere->setAtmosphere(AtmosphereType::Snow);
        break;
      case SDLK_4:
        m_atmosphere->setAtmosphere(AtmosphereType::Petals);
        break;
      case SDLK_R:
        m_atmosphere->setRandomAtmosphere();
        break;
      default:
        break;
      }
      break;
    default:
      break;
    }
  }
}

Vector2D DemoGame::cursorWorldPosition() const {
  float mx = 0.0f;
  float my = 0.0f;
  SDL_GetMouseState(&mx, &my);
  return m_camera.screenToWorld(Vector2D(mx, my));
}

void DemoGame::updatePlayer(float deltaTime) {
  const bool *keys = SDL_GetKeyboardState(nullptr);
  Vector2D direction(0.0f, 0.0f);
  if (keys[SDL_SCANCODE_W]) direction += Vector2D(0.0f, -1.0f);
  if (keys[SDL_SCANCODE_S]) direction += Vector2D(0.0f, 1.0f);
  if (keys[SDL_SCANCODE_A]) direction += Vector2D(-1.0f, 0.0f);
  if (keys[SDL_SCANCODE_D]) direction += Vector2D(1.0f, 0.0f);

  m_playerVelocity = direction.normalized() * PLAYER_SPEED;
  m_player += m_playerVelocity * deltaTime;
  m_player.setX(std::clamp(m_player.getX(), PLAYER_RADIUS,
                           m_config.atmosphere.worldWidth - PLAYER_RADIUS));
  m_player.setY(std::clamp(m_player.getY(), PLAYER_RADIUS,
                           m_config.atmosphere.worldHeight - PLAYER_RADIUS));

  if (m_playerVelocity.length() > 0.0f && m_atmosphere->getAtmosphere() == AtmosphereType::Snow) {
    m_atmosphere->addFootprint(m_player.getX(), m_player.getY() + PLAYER_RADIUS);
  }
}

void DemoGame::updateDummies(float deltaTime) {
  const float worldW = m_config.atmosphere.worldWidth;
  const float worldH = m_config.atmosphere.worldHeight;
  for (Dummy &dummy : m_dummies) {
    dummy.position += dummy.velocity * deltaTime;
    // Bounce off the world edge with a shower of wall sparks
    if (dummy.position.getX() < 0.0f || dummy.position.getX() > worldW) {
      dummy.velocity.setX(-dummy.velocity.getX());
      m_sparks->addImpactSparks(dummy.position.getX(), dummy.position.getY(),
                                dummy.velocity.angle(), SurfaceType::Wall);
    }
    if (dummy.position.getY() < 0.0f || dummy.position.getY() > worldH) {
      dummy.velocity.setY(-dummy.velocity.getY());
      m_sparks->addImpactSparks(dummy.position.getX(), dummy.position.getY(),
                                dummy.velocity.angle(), SurfaceType::Wall);
    }
    dummy.position.setX(std::clamp(dummy.position.getX(), 0.0f, worldW));
    dummy.position.setY(std::clamp(dummy.position.getY(), 0.0f, worldH));
  }
}

void DemoGame::rebuildEnemyViews() {
  m_enemyViews.clear();
  for (const Dummy &dummy : m_dummies) {
    m_enemyViews.push_back(EnemyView{dummy.handle, dummy.position, dummy.size});
  }
}

void DemoGame::applyDamage(const DamageEvents &events) {
  for (const DamageEvent &event : events) {
    auto it = std::find_if(m_dummies.begin(), m_dummies.end(),
                           [&](const Dummy &d) { return d.handle == event.target; });
    if (it == m_dummies.end()) {
      continue;
    }
    it->health -= event.damage;
    m_score += event.damage;
    SurfaceType surface = event.cause == DamageCause::MissileBody
                              ? SurfaceType::Metal
                              : SurfaceType::Dirt;
    m_sparks->addImpactSparks(it->position.getX(), it->position.getY(),
                              std::nullopt, surface);
  }

  const size_t before = m_dummies.size();
  std::erase_if(m_dummies, [](const Dummy &d) { return d.health <= 0.0f; });
  for (size_t i = m_dummies.size(); i < before; ++i) {
    spawnDummy();
  }
}

void DemoGame::update(float deltaTime, double now) {
  updatePlayer(deltaTime);
  updateDummies(deltaTime);
  rebuildEnemyViews();

  m_atmosphere->update(deltaTime);
  m_sparks->update(deltaTime);
  m_missiles->update(deltaTime, m_enemyViews);

  applyDamage(m_missiles->checkVisualDamage(m_enemyViews));
  rebuildEnemyViews();
  applyDamage(m_missiles->checkGroundFireDamage(m_enemyViews, now));

  if (!m_missiles->getExplodingMissiles().empty()) {
    m_camera.shake(0.2f, EXPLOSION_SHAKE);
  }
  m_camera.update(deltaTime);
}

void DemoGame::renderWorld(RenderSurface &surface,
                           const Vector2D &offset) const {
  // Ground grid
  const SDL_Color grid{40, 48, 40, 255};
  const float startX = std::floor(offset.getX() / 128.0f) * 128.0f;
  const float startY = std::floor(offset.getY() / 128.0f) * 128.0f;
  for (float x = startX; x < offset.getX() + m_width; x += 128.0f) {
    surface.drawLine(x - offset.getX(), 0.0f, x - offset.getX(),
                     static_cast<float>(m_height), grid);
  }
  for (float y = startY; y < offset.getY() + m_height; y += 128.0f) {
    surface.drawLine(0.0f, y - offset.getY(), static_cast<float>(m_width),
                     y - offset.getY(), grid);
  }

  for (const Dummy &dummy : m_dummies) {
    Vector2D at = dummy.position - offset;
    float health = std::clamp(dummy.health / DUMMY_HEALTH, 0.0f, 1.0f);
    surface.fillCircle(at.getX(), at.getY(), dummy.size * 0.5f,
                       makeColor(200.0f, 60.0f + 120.0f * health, 60.0f));
  }

  Vector2D player = m_player - offset;
  surface.fillCircle(player.getX(), player.getY(), PLAYER_RADIUS,
                     SDL_Color{80, 160, 255, 255});
}

void DemoGame::render() {
  SDL_SetRenderDrawColor(m_renderer, 24, 30, 24, 255);
  SDL_RenderClear(m_renderer);

  RenderSurface surface(m_renderer, m_width, m_height);
  const Vector2D offset = m_camera.getRenderOffset();

  m_atmosphere->renderFootprints(surface, offset);
  renderWorld(surface, offset);
  m_missiles->render(surface, offset);
  m_sparks->render(surface, offset);
  m_atmosphere->render(surface, offset);
  m_atmosphere->renderScreenOverlays(surface);

  SDL_SetRenderDrawColor(m_renderer, 255, 255, 255, 255);
  SDL_RenderDebugText(m_renderer, 8.0f, 8.0f,
                      std::format("score {:.0f}  missiles {}  fires {}  {}",
                                  m_score, m_missiles->getMissileCount(),
                                  m_missiles->getGroundFireCount(),
                                  atmosphereTypeToString(m_atmosphere->getAtmosphere()))
                          .c_str());

  SDL_RenderPresent(m_renderer);
}

void DemoGame::clean() {
  if (m_missiles) {
    m_missiles->clear();
  }
  m_missiles.reset();
  m_sparks.reset();
  m_atmosphere.reset();
  if (m_sound) {
    m_sound->clean();
    m_sound.reset();
  }
  if (m_renderer) {
    SDL_DestroyRenderer(m_renderer);
    m_renderer = nullptr;
  }
  if (m_window) {
    SDL_DestroyWindow(m_window);
    m_window = nullptr;
    SDL_Quit();
  }
  m_running = false;
}

} // namespace Stormfire
