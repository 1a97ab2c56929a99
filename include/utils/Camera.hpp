/* Copyright (c) 2025 Stormfire Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CAMERA_HPP
#define CAMERA_HPP

#include "utils/Vector2D.hpp"
#include <functional>
#include <random>

namespace Stormfire {

/**
 * @brief 2D camera that follows a target inside world bounds
 *
 * Effect systems never see the camera; the host passes getRenderOffset()
 * to every render call. Non-singleton: the demo owns one instance.
 */
class Camera {
public:
    enum class Mode {
        Free,   // Position only changes through setPosition()
        Follow  // Centers on the target every update
    };

    struct Bounds {
        float minX{0.0f};
        float minY{0.0f};
        float maxX{1000.0f};
        float maxY{1000.0f};

        bool isValid() const { return maxX > minX && maxY > minY; }
    };

    struct Viewport {
        float width{1920.0f};
        float height{1080.0f};

        bool isValid() const { return width > 0.0f && height > 0.0f; }
        float halfWidth() const { return width * 0.5f; }
        float halfHeight() const { return height * 0.5f; }
    };

    Camera() = default;

    /**
     * @param x Initial center X
     * @param y Initial center Y
     */
    Camera(float x, float y, float viewportWidth, float viewportHeight);

    /**
     * @brief Follows the target, clamps to world bounds and advances shake
     * @param deltaTime Seconds since last update
     */
    void update(float deltaTime);

    void setPosition(const Vector2D& position);
    const Vector2D& getPosition() const { return m_position; }

    void setViewport(float width, float height);
    const Viewport& getViewport() const { return m_viewport; }

    void setWorldBounds(float minX, float minY, float maxX, float maxY);
    const Bounds& getWorldBounds() const { return m_worldBounds; }

    void setMode(Mode mode) { m_mode = mode; }
    Mode getMode() const { return m_mode; }

    /**
     * @brief Sets the followed target by position getter and switches to Follow
     */
    void setTargetPositionGetter(std::function<Vector2D()> positionGetter);
    void clearTarget();
    bool hasTarget() const { return static_cast<bool>(m_positionGetter); }

    /**
     * @brief Top-left world position of the view, shake included
     *
     * Screen position of a world point is world - offset.
     */
    Vector2D getRenderOffset() const;

    Vector2D worldToScreen(const Vector2D& world) const { return world - getRenderOffset(); }
    Vector2D screenToWorld(const Vector2D& screen) const { return screen + getRenderOffset(); }

    /**
     * @brief Shakes the view; a stronger shake replaces a weaker one
     * @param duration Seconds
     * @param intensity Maximum offset in pixels, fading out over the duration
     */
    void shake(float duration, float intensity);
    bool isShaking() const { return m_shakeTimeRemaining > 0.0f; }

private:
    void clampToWorldBounds();
    Vector2D generateShakeOffset();

    Vector2D m_position{960.0f, 540.0f};
    Viewport m_viewport{};
    Bounds m_worldBounds{0.0f, 0.0f, 1920.0f, 1080.0f};
    Mode m_mode{Mode::Free};
    std::function<Vector2D()> m_positionGetter;

    float m_shakeTimeRemaining{0.0f};
    float m_shakeDuration{0.0f};
    float m_shakeIntensity{0.0f};
    Vector2D m_shakeOffset{0.0f, 0.0f};
    std::mt19937 m_shakeRng{std::random_device{}()};
    std::uniform_real_distribution<float> m_shakeDist{-1.0f, 1.0f};
};

} // namespace Stormfire

#endif // CAMERA_HPP
