/* Copyright (c) 2025 Stormfire Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SOUND_MANAGER_HPP
#define SOUND_MANAGER_HPP

#include "effects/IWeaponAudio.hpp"
#include <SDL3/SDL.h>
#include <SDL3_mixer/SDL_mixer.h>
#include <string>
#include <unordered_map>
#include <vector>

namespace Stormfire {

/**
 * @brief SDL3_mixer backed weapon audio.
 *
 * One-shots play on throwaway tracks that are reclaimed once they stop.
 * Missile flight loops play on tracks keyed by a SoundHandle so the missile
 * that started a loop can stop exactly that loop.
 */
class SoundManager : public IWeaponAudio {
public:
  static constexpr const char *FLIGHT_SOUND_ID = "missile_flight";
  static constexpr const char *EXPLOSION_SOUND_ID = "explosion";

  SoundManager() = default;
  ~SoundManager() override;

  SoundManager(const SoundManager &) = delete;
  SoundManager &operator=(const SoundManager &) = delete;

  /**
   * @brief Initializes the SDL audio subsystem, SDL3_mixer and the SFX group
   * @return true if initialization successful, false otherwise
   */
  bool init();

  /**
   * @brief Loads a sound effect from a file or all sound effects from a
   * directory
   * @param filePath Path to sound file or directory containing supported audio
   * files
   * @param soundID Identifier for the sound. Used as prefix when loading a
   * directory
   * @return true if at least one sound was loaded successfully
   */
  bool loadSFX(const std::string &filePath, const std::string &soundID);

  /**
   * @brief Loads missile_flight.wav and explosion.wav from a directory
   * @return true only if both loaded; missing sounds are skipped at play time
   */
  bool loadWeaponSounds(const std::string &directory);

  /**
   * @brief Plays a loaded sound effect
   * @param loops -1 loops forever, 0 plays once
   * @return the playing track, nullptr on failure
   */
  MIX_Track *playSFX(const std::string &soundID, int loops = 0,
                     float volume = 1.0f);

  // IWeaponAudio
  SoundHandle startMissileFlight() override;
  void stopMissileFlight(SoundHandle handle) override;
  void playExplosion() override;

  void setSFXVolume(float volume);
  float getSFXVolume() const { return m_sfxVolume; }

  bool isSFXLoaded(const std::string &soundID) const;
  bool isInitialized() const { return m_initialized; }
  size_t getActiveFlightCount() const { return m_flightTracks.size(); }

  /**
   * @brief Stops every track and shuts down SDL3_mixer
   */
  void clean();

private:
  MIX_Track *createAndConfigureTrack();
  void destroyTrack(MIX_Track *track);
  void cleanupStoppedTracks();
  std::vector<std::string> getSupportedExtensions() const;

  MIX_Mixer *m_mixer{nullptr};
  MIX_Group *m_sfxGroup{nullptr};

  std::unordered_map<std::string, MIX_Audio *> m_audioMap{};
  std::vector<MIX_Track *> m_oneShotTracks{};
  std::unordered_map<SoundHandle, MIX_Track *> m_flightTracks{};
  SoundHandle m_nextHandle{1};

  bool m_initialized{false};
  float m_sfxVolume{1.0f};
};

} // namespace Stormfire

#endif // SOUND_MANAGER_HPP
