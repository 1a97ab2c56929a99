/* Copyright (c) 2025 Stormfire Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/SoundManager.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <filesystem>
#include <format>

namespace Stormfire {

namespace {
constexpr const char *SFX_TAG = "sfx";
}

SoundManager::~SoundManager() { clean(); }

bool SoundManager::init() {
  if (m_initialized) {
    SOUND_WARN("Already initialized");
    return true;
  }

  if (!SDL_WasInit(SDL_INIT_AUDIO)) {
    if (!SDL_InitSubSystem(SDL_INIT_AUDIO)) {
      SOUND_ERROR(std::format("Failed to initialize SDL audio subsystem: {}",
                              SDL_GetError()));
      return false;
    }
  }

  if (!MIX_Init()) {
    SOUND_ERROR(std::format("Failed to initialize SDL3_mixer library: {}",
                            SDL_GetError()));
    return false;
  }

  m_mixer = MIX_CreateMixerDevice(SDL_AUDIO_DEVICE_DEFAULT_PLAYBACK, nullptr);
  if (!m_mixer) {
    SOUND_ERROR(std::format("Failed to create SDL3_mixer instance: {}",
                            SDL_GetError()));
    MIX_Quit();
    return false;
  }

  m_sfxGroup = MIX_CreateGroup(m_mixer);
  if (!m_sfxGroup) {
    SOUND_ERROR("Failed to create SFX group");
    MIX_DestroyMixer(m_mixer);
    MIX_Quit();
    m_mixer = nullptr;
    return false;
  }

  m_initialized = true;
  SOUND_INFO("Initialized SDL3_mixer");
  return true;
}

std::vector<std::string> SoundManager::getSupportedExtensions() const {
  return {".wav", ".mp3", ".ogg", ".flac", ".aiff", ".voc"};
}

bool SoundManager::loadSFX(const std::string &filePath,
                           const std::string &soundID) {
  if (!m_initialized) {
    SOUND_ERROR("Not initialized. Call init() first.");
    return false;
  }

  namespace fs = std::filesystem;

  auto store = [this](const std::string &id, MIX_Audio *audio) {
    auto it = m_audioMap.find(id);
    if (it != m_audioMap.end()) {
      MIX_DestroyAudio(it->second);
    }
    m_audioMap[id] = audio;
  };

  try {
    if (fs::is_directory(filePath)) {
      int fileCount = 0;
      const auto supportedExts = getSupportedExtensions();

      for (const auto &entry : fs::directory_iterator(filePath)) {
        if (!entry.is_regular_file())
          continue;

        const std::string extension = entry.path().extension().string();
        if (std::find(supportedExts.begin(), supportedExts.end(), extension) ==
            supportedExts.end()) {
          continue;
        }
        const std::string fullSoundID =
            std::format("{}_{}", soundID, entry.path().stem().string());

        MIX_Audio *audio =
            MIX_LoadAudio(m_mixer, entry.path().string().c_str(), true);
        if (!audio) {
          SOUND_WARN(std::format("Failed to load audio from {} - SDL Error: {}",
                                 entry.path().string(), SDL_GetError()));
          continue;
        }
        store(fullSoundID, audio);
        ++fileCount;
      }

      if (fileCount > 0) {
        SOUND_INFO(std::format("Loaded {} files from directory: {}", fileCount,
                               filePath));
      } else {
        SOUND_WARN(std::format("No supported audio files found in directory: {}",
                               filePath));
      }
      return fileCount > 0;
    }

    MIX_Audio *audio = MIX_LoadAudio(m_mixer, filePath.c_str(), true);
    if (!audio) {
      SOUND_ERROR(std::format("Failed to load audio: {} - SDL Error: {}",
                              filePath, SDL_GetError()));
      return false;
    }
    store(soundID, audio);
    SOUND_INFO(std::format("Loaded audio file: {}", soundID));
    return true;
  } catch (const fs::filesystem_error &e) {
    SOUND_ERROR(std::format("Filesystem error loading audio {}: {}", filePath,
                            e.what()));
    return false;
  }
}

bool SoundManager::loadWeaponSounds(const std::string &directory) {
  namespace fs = std::filesystem;
  const fs::path base(directory);
  bool flight = loadSFX((base / "missile_flight.wav").string(), FLIGHT_SOUND_ID);
  bool explosion = loadSFX((base / "explosion.wav").string(), EXPLOSION_SOUND_ID);
  return flight && explosion;
}

MIX_Track *SoundManager::createAndConfigureTrack() {
  MIX_Track *track = MIX_CreateTrack(m_mixer);
  if (!track) {
    return nullptr;
  }
  if (!MIX_SetTrackGroup(track, m_sfxGroup) || !MIX_TagTrack(track, SFX_TAG)) {
    MIX_DestroyTrack(track);
    return nullptr;
  }
  return track;
}

void SoundManager::destroyTrack(MIX_Track *track) {
  if (MIX_TrackPlaying(track)) {
    MIX_StopTrack(track, 0);
  }
  MIX_UntagTrack(track, SFX_TAG);
  MIX_DestroyTrack(track);
}

void SoundManager::cleanupStoppedTracks() {
  std::erase_if(m_oneShotTracks, [this](MIX_Track *track) {
    if (!MIX_TrackPlaying(track)) {
      destroyTrack(track);
      return true;
    }
    return false;
  });
}

MIX_Track *SoundManager::playSFX(const std::string &soundID, int loops,
                                 float volume) {
  if (!m_initialized) {
    SOUND_WARN("Not initialized. Call init() first.");
    return nullptr;
  }

  cleanupStoppedTracks();

  auto it = m_audioMap.find(soundID);
  if (it == m_audioMap.end()) {
    SOUND_WARN(std::format("Sound effect not found: {}", soundID));
    return nullptr;
  }

  MIX_Track *track = createAndConfigureTrack();
  if (!track) {
    SOUND_ERROR(std::format("Failed to create track for SFX: {}", soundID));
    return nullptr;
  }

  if (!MIX_SetTrackAudio(track, it->second)) {
    SOUND_ERROR(std::format("Failed to set track audio for SFX: {}", soundID));
    destroyTrack(track);
    return nullptr;
  }

  float finalVolume = std::clamp(volume * m_sfxVolume, 0.0f, 10.0f);
  if (!MIX_SetTrackGain(track, finalVolume)) {
    SOUND_WARN(std::format("Failed to set track volume for SFX: {}", soundID));
  }

  SDL_PropertiesID props = SDL_CreateProperties();
  if (loops != 0) {
    SDL_SetNumberProperty(props, MIX_PROP_PLAY_LOOPS_NUMBER, loops);
  }

  if (!MIX_PlayTrack(track, props)) {
    SOUND_ERROR(std::format("Failed to play SFX: {}", soundID));
    destroyTrack(track);
    SDL_DestroyProperties(props);
    return nullptr;
  }
  SDL_DestroyProperties(props);
  return track;
}

SoundHandle SoundManager::startMissileFlight() {
  MIX_Track *track = playSFX(FLIGHT_SOUND_ID, -1, 0.6f);
  if (!track) {
    return INVALID_SOUND_HANDLE;
  }
  SoundHandle handle = m_nextHandle++;
  m_flightTracks[handle] = track;
  return handle;
}

void SoundManager::stopMissileFlight(SoundHandle handle) {
  auto it = m_flightTracks.find(handle);
  if (it == m_flightTracks.end()) {
    return;
  }
  destroyTrack(it->second);
  m_flightTracks.erase(it);
}

void SoundManager::playExplosion() {
  MIX_Track *track = playSFX(EXPLOSION_SOUND_ID);
  if (track) {
    m_oneShotTracks.push_back(track);
  }
}

void SoundManager::setSFXVolume(float volume) {
  m_sfxVolume = std::clamp(volume, 0.0f, 10.0f);

  if (m_initialized) {
    cleanupStoppedTracks();
    for (MIX_Track *track : m_oneShotTracks) {
      MIX_SetTrackGain(track, m_sfxVolume);
    }
    for (const auto &[handle, track] : m_flightTracks) {
      MIX_SetTrackGain(track, m_sfxVolume * 0.6f);
    }
  }
}

bool SoundManager::isSFXLoaded(const std::string &soundID) const {
  return m_audioMap.find(soundID) != m_audioMap.end();
}

void SoundManager::clean() {
  if (!m_initialized)
    return;

  for (MIX_Track *track : m_oneShotTracks) {
    destroyTrack(track);
  }
  m_oneShotTracks.clear();
  for (const auto &[handle, track] : m_flightTracks) {
    destroyTrack(track);
  }
  m_flightTracks.clear();

  // Groups go before the audio they may still reference
  if (m_sfxGroup) {
    MIX_DestroyGroup(m_sfxGroup);
    m_sfxGroup = nullptr;
  }

  for (auto &[id, audio] : m_audioMap) {
    if (audio) {
      MIX_DestroyAudio(audio);
    }
  }
  m_audioMap.clear();

  if (m_mixer) {
    MIX_DestroyMixer(m_mixer);
    m_mixer = nullptr;
  }

  MIX_Quit();

  if (SDL_WasInit(SDL_INIT_AUDIO)) {
    SDL_QuitSubSystem(SDL_INIT_AUDIO);
  }

  m_initialized = false;
  SOUND_INFO("SoundManager cleaned up");
}

} // namespace Stormfire
