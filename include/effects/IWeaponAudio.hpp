/* Copyright (c) 2025 Stormfire Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef I_WEAPON_AUDIO_HPP
#define I_WEAPON_AUDIO_HPP

#include <cstdint>

namespace Stormfire {

using SoundHandle = uint64_t;
inline constexpr SoundHandle INVALID_SOUND_HANDLE = 0;

/**
 * @brief Audio cues raised by missiles.
 *
 * Passed around as a nullable pointer; nullptr means the game runs without
 * sound and every cue is skipped. Implemented by SoundManager.
 */
class IWeaponAudio {
public:
  virtual ~IWeaponAudio() = default;

  /// Starts the looping flight sound; INVALID_SOUND_HANDLE if unavailable
  virtual SoundHandle startMissileFlight() = 0;

  /// Stops a flight loop. Unknown or already stopped handles are ignored.
  virtual void stopMissileFlight(SoundHandle handle) = 0;

  virtual void playExplosion() = 0;
};

} // namespace Stormfire

#endif // I_WEAPON_AUDIO_HPP
