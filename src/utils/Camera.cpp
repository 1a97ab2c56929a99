/* Copyright (c) 2025 Stormfire Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/Camera.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>
#include <utility>

namespace Stormfire {

Camera::Camera(float x, float y, float viewportWidth, float viewportHeight)
    : m_position(x, y), m_viewport{viewportWidth, viewportHeight} {
    if (!m_viewport.isValid()) {
        CAMERA_WARN("Invalid viewport dimensions provided, using defaults");
        m_viewport = Viewport{};
    }
    CAMERA_INFO(std::format("Camera created at position ({}, {})", x, y));
}

void Camera::update(float deltaTime) {
    if (m_shakeTimeRemaining > 0.0f) {
        m_shakeTimeRemaining -= deltaTime;
        if (m_shakeTimeRemaining <= 0.0f) {
            m_shakeTimeRemaining = 0.0f;
            m_shakeOffset = Vector2D{0.0f, 0.0f};
        } else {
            m_shakeOffset = generateShakeOffset();
        }
    }

    if (m_mode == Mode::Follow && m_positionGetter) {
        m_position = m_positionGetter();
    }

    clampToWorldBounds();
}

void Camera::setPosition(const Vector2D& position) {
    m_position = position;
    clampToWorldBounds();
}

void Camera::setViewport(float width, float height) {
    if (width > 0.0f && height > 0.0f) {
        m_viewport.width = width;
        m_viewport.height = height;
        CAMERA_DEBUG(std::format("Viewport updated to: {}x{}",
                                 static_cast<int>(width), static_cast<int>(height)));
    } else {
        CAMERA_WARN(std::format("Invalid viewport dimensions: {}x{}", width, height));
    }
}

void Camera::setWorldBounds(float minX, float minY, float maxX, float maxY) {
    Bounds bounds{minX, minY, maxX, maxY};
    if (!bounds.isValid()) {
        CAMERA_WARN(std::format("Invalid world bounds: ({}, {}) to ({}, {})",
                                minX, minY, maxX, maxY));
        return;
    }
    m_worldBounds = bounds;
    clampToWorldBounds();
}

void Camera::setTargetPositionGetter(std::function<Vector2D()> positionGetter) {
    m_positionGetter = std::move(positionGetter);
    if (m_positionGetter) {
        m_mode = Mode::Follow;
    }
}

void Camera::clearTarget() {
    m_positionGetter = nullptr;
    m_mode = Mode::Free;
}

Vector2D Camera::getRenderOffset() const {
    return Vector2D(m_position.getX() - m_viewport.halfWidth(),
                    m_position.getY() - m_viewport.halfHeight()) + m_shakeOffset;
}

void Camera::shake(float duration, float intensity) {
    if (duration <= 0.0f || intensity <= 0.0f) {
        return;
    }
    if (isShaking() && intensity < m_shakeIntensity) {
        return;
    }
    m_shakeTimeRemaining = duration;
    m_shakeDuration = duration;
    m_shakeIntensity = intensity;
    CAMERA_DEBUG(std::format("Camera shake started: duration={}s, intensity={}",
                             duration, intensity));
}

void Camera::clampToWorldBounds() {
    const float minX = m_worldBounds.minX + m_viewport.halfWidth();
    const float maxX = m_worldBounds.maxX - m_viewport.halfWidth();
    const float minY = m_worldBounds.minY + m_viewport.halfHeight();
    const float maxY = m_worldBounds.maxY - m_viewport.halfHeight();

    // A world smaller than the view is centered instead of clamped
    if (maxX > minX) {
        m_position.setX(std::clamp(m_position.getX(), minX, maxX));
    } else {
        m_position.setX((m_worldBounds.minX + m_worldBounds.maxX) * 0.5f);
    }

    if (maxY > minY) {
        m_position.setY(std::clamp(m_position.getY(), minY, maxY));
    } else {
        m_position.setY((m_worldBounds.minY + m_worldBounds.maxY) * 0.5f);
    }
}

Vector2D Camera::generateShakeOffset() {
    const float remaining = m_shakeDuration > 0.0f ? m_shakeTimeRemaining / m_shakeDuration : 0.0f;
    const float intensity = m_shakeIntensity * remaining;
    return Vector2D{m_shakeDist(m_shakeRng) * intensity,
                    m_shakeDist(m_shakeRng) * intensity};
}

} // namespace Stormfire
