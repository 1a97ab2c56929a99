/* Copyright (c) 2025 Stormfire Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/DemoGame.hpp"
#include "core/Logger.hpp"
#include "core/TimestepManager.hpp"
#include "effects/EffectsConfig.hpp"
#include "managers/SettingsManager.hpp"
#include <format>
#include <string>

const int WINDOW_WIDTH{1280};
const int WINDOW_HEIGHT{720};
const std::string GAME_NAME{"Stormfire"};

int main([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
  GAMELOOP_INFO(std::format("Initializing {}", GAME_NAME));

  auto& settings = Stormfire::SettingsManager::Instance();
  if (!settings.loadFromFile("res/settings.json")) {
    GAMELOOP_WARN("Failed to load settings.json - using defaults");
  } else {
    GAMELOOP_INFO("Settings loaded from res/settings.json");
  }

  const int windowWidth = settings.get<int>("display", "width", WINDOW_WIDTH);
  const int windowHeight = settings.get<int>("display", "height", WINDOW_HEIGHT);
  const bool vsync = settings.get<bool>("display", "vsync", true);
  const float volume = settings.get<float>("audio", "master_volume", 1.0f);
  const Stormfire::EffectsConfig config = Stormfire::EffectsConfig::fromSettings(settings);

  Stormfire::DemoGame game;
  if (!game.init(GAME_NAME, windowWidth, windowHeight, vsync, config, volume)) {
    GAMELOOP_CRITICAL(std::format("Init {} failed", GAME_NAME));
    game.clean();
    return -1;
  }

  Stormfire::TimestepManager ts(60.0f, 1.0f / 60.0f);
  ts.setSoftwareFrameLimiting(!game.isUsingVSync());

  GAMELOOP_INFO("Starting Main Loop");

  while (game.isRunning()) {
    ts.startFrame();
    game.handleEvents();

    while (ts.shouldUpdate()) {
      game.update(ts.getUpdateDeltaTime(), ts.getElapsedSeconds());
    }

    game.render();
    ts.endFrame();
  }

  GAMELOOP_INFO(std::format("{} shutting down", GAME_NAME));
  game.clean();
  return 0;
}
