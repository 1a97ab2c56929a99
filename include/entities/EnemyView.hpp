/* Copyright (c) 2025 Stormfire Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENEMY_VIEW_HPP
#define ENEMY_VIEW_HPP

#include "entities/EntityHandle.hpp"
#include "utils/Vector2D.hpp"

/**
 * @brief Read-only snapshot of an enemy handed to effect systems each frame.
 *
 * size is the enemy's visual diameter; collision checks use size / 2.
 */
struct EnemyView {
    EntityHandle handle{};
    Vector2D position{};
    float size{0.0f};
};

#endif // ENEMY_VIEW_HPP
