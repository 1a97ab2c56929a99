/* Copyright (c) 2025 Stormfire Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RENDER_SURFACE_HPP
#define RENDER_SURFACE_HPP

#include <SDL3/SDL.h>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace Stormfire {

/**
 * @brief Builds an SDL_Color from floating point channels, clamped to 0..255.
 *
 * Effect code does its fade and intensity math in float and funnels the
 * result through here so nothing wraps around.
 */
SDL_Color makeColor(float r, float g, float b, float a = 255.0f);

/// Scales RGB by factor and replaces alpha, clamped.
SDL_Color scaleColor(SDL_Color base, float factor, float alpha);

/**
 * @brief Primitive drawing target over an SDL_Renderer.
 *
 * Non-owning. Shapes are tessellated into SDL_RenderGeometry calls with
 * alpha blending enabled. Coordinates are screen space; callers subtract
 * the camera offset themselves.
 *
 * Tests drive it with SDL_CreateSoftwareRenderer on an SDL_Surface, which
 * needs no window or video subsystem.
 */
class RenderSurface {
public:
  RenderSurface(SDL_Renderer *renderer, int width, int height);

  SDL_Renderer *getRenderer() const { return m_renderer; }
  int getWidth() const { return m_width; }
  int getHeight() const { return m_height; }

  void fillCircle(float cx, float cy, float radius, SDL_Color color);

  /// Ring of the given thickness whose outer edge sits at radius
  void drawCircle(float cx, float cy, float radius, SDL_Color color,
                  float thickness = 1.0f);

  /// Ellipse rotated by angle (radians) around its center
  void fillEllipse(float cx, float cy, float rx, float ry, float angle,
                   SDL_Color color);

  /// Convex polygon, triangulated as a fan from the first point
  void fillPolygon(std::span<const SDL_FPoint> points, SDL_Color color);

  void drawLine(float x1, float y1, float x2, float y2, SDL_Color color,
                float thickness = 1.0f);

  void fillRect(float x, float y, float w, float h, SDL_Color color);

  /// Alpha-blended rectangle covering the whole surface
  void fillOverlay(SDL_Color color);

  // Per-frame statistics; the host resets them after present
  size_t getPrimitiveCount() const { return m_primitiveCount; }
  size_t getFailedDrawCount() const { return m_failedDrawCount; }
  void resetStats() {
    m_primitiveCount = 0;
    m_failedDrawCount = 0;
  }

private:
  void submitGeometry();
  void pushVertex(float x, float y, const SDL_FColor &color);
  static int segmentsFor(float radius);

  SDL_Renderer *m_renderer;
  int m_width;
  int m_height;

  // Reused across calls to avoid per-shape allocation
  std::vector<SDL_Vertex> m_vertices;
  std::vector<int> m_indices;

  size_t m_primitiveCount{0};
  size_t m_failedDrawCount{0};
  bool m_loggedFailure{false};
};

} // namespace Stormfire

#endif // RENDER_SURFACE_HPP
