/* Copyright (c) 2025 Stormfire Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "render/RenderSurface.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <numbers>

namespace Stormfire {

namespace {

Uint8 clampChannel(float value) {
  if (!(value > 0.0f)) {
    return 0; // also catches NaN
  }
  return static_cast<Uint8>(std::min(value, 255.0f));
}

SDL_FColor toFColor(SDL_Color c) {
  return SDL_FColor{c.r / 255.0f, c.g / 255.0f, c.b / 255.0f, c.a / 255.0f};
}

} // namespace

SDL_Color makeColor(float r, float g, float b, float a) {
  return SDL_Color{clampChannel(r), clampChannel(g), clampChannel(b),
                   clampChannel(a)};
}

SDL_Color scaleColor(SDL_Color base, float factor, float alpha) {
  return makeColor(base.r * factor, base.g * factor, base.b * factor, alpha);
}

RenderSurface::RenderSurface(SDL_Renderer *renderer, int width, int height)
    : m_renderer(renderer), m_width(width), m_height(height) {
  m_vertices.reserve(256);
  m_indices.reserve(768);
  if (!SDL_SetRenderDrawBlendMode(m_renderer, SDL_BLENDMODE_BLEND)) {
    RENDER_ERROR(std::format("Failed to enable alpha blending: {}",
                             SDL_GetError()));
  }
}

int RenderSurface::segmentsFor(float radius) {
  return std::clamp(static_cast<int>(radius * 0.75f) + 8, 8, 64);
}

void RenderSurface::pushVertex(float x, float y, const SDL_FColor &color) {
  m_vertices.push_back(SDL_Vertex{SDL_FPoint{x, y}, color, SDL_FPoint{0, 0}});
}

void RenderSurface::submitGeometry() {
  ++m_primitiveCount;
  if (!m_vertices.empty()) {
    if (!SDL_RenderGeometry(m_renderer, nullptr, m_vertices.data(),
                            static_cast<int>(m_vertices.size()),
                            m_indices.empty() ? nullptr : m_indices.data(),
                            static_cast<int>(m_indices.size()))) {
      ++m_failedDrawCount;
      if (!m_loggedFailure) {
        RENDER_ERROR(std::format("SDL_RenderGeometry failed: {}",
                                 SDL_GetError()));
        m_loggedFailure = true;
      }
    }
  }
  m_vertices.clear();
  m_indices.clear();
}

void RenderSurface::fillCircle(float cx, float cy, float radius,
                               SDL_Color color) {
  fillEllipse(cx, cy, radius, radius, 0.0f, color);
}

void RenderSurface::fillEllipse(float cx, float cy, float rx, float ry,
                                float angle, SDL_Color color) {
  if (rx <= 0.0f || ry <= 0.0f || color.a == 0) {
    return;
  }
  const SDL_FColor fc = toFColor(color);
  const int segments = segmentsFor(std::max(rx, ry));
  const float c = std::cos(angle);
  const float s = std::sin(angle);

  pushVertex(cx, cy, fc);
  for (int i = 0; i < segments; ++i) {
    float t = 2.0f * std::numbers::pi_v<float> * static_cast<float>(i) /
              static_cast<float>(segments);
    float ex = std::cos(t) * rx;
    float ey = std::sin(t) * ry;
    pushVertex(cx + ex * c - ey * s, cy + ex * s + ey * c, fc);
  }
  for (int i = 0; i < segments; ++i) {
    m_indices.push_back(0);
    m_indices.push_back(1 + i);
    m_indices.push_back(1 + (i + 1) % segments);
  }
  submitGeometry();
}

void RenderSurface::drawCircle(float cx, float cy, float radius,
                               SDL_Color color, float thickness) {
  if (radius <= 0.0f || color.a == 0) {
    return;
  }
  const float inner = std::max(0.0f, radius - std::max(thickness, 1.0f));
  const SDL_FColor fc = toFColor(color);
  const int segments = segmentsFor(radius);

  for (int i = 0; i < segments; ++i) {
    float t = 2.0f * std::numbers::pi_v<float> * static_cast<float>(i) /
              static_cast<float>(segments);
    float ux = std::cos(t);
    float uy = std::sin(t);
    pushVertex(cx + ux * radius, cy + uy * radius, fc);
    pushVertex(cx + ux * inner, cy + uy * inner, fc);
  }
  for (int i = 0; i < segments; ++i) {
    int o0 = 2 * i;
    int i0 = o0 + 1;
    int o1 = 2 * ((i + 1) % segments);
    int i1 = o1 + 1;
    m_indices.insert(m_indices.end(), {o0, i0, o1, o1, i0, i1});
  }
  submitGeometry();
}

void RenderSurface::fillPolygon(std::span<const SDL_FPoint> points,
                                SDL_Color color) {
  if (points.size() < 3 || color.a == 0) {
    return;
  }
  const SDL_FColor fc = toFColor(color);
  for (const SDL_FPoint &p : points) {
    pushVertex(p.x, p.y, fc);
  }
  for (int i = 1; i + 1 < static_cast<int>(points.size()); ++i) {
    m_indices.insert(m_indices.end(), {0, i, i + 1});
  }
  submitGeometry();
}

void RenderSurface::drawLine(float x1, float y1, float x2, float y2,
                             SDL_Color color, float thickness) {
  if (color.a == 0) {
    return;
  }
  if (thickness <= 1.0f) {
    ++m_primitiveCount;
    bool ok = SDL_SetRenderDrawColor(m_renderer, color.r, color.g, color.b,
                                     color.a) &&
              SDL_RenderLine(m_renderer, x1, y1, x2, y2);
    if (!ok) {
      ++m_failedDrawCount;
    }
    return;
  }

  float dx = x2 - x1;
  float dy = y2 - y1;
  float len = std::sqrt(dx * dx + dy * dy);
  if (len <= 0.0f) {
    fillCircle(x1, y1, thickness * 0.5f, color);
    return;
  }
  float nx = -dy / len * thickness * 0.5f;
  float ny = dx / len * thickness * 0.5f;
  const SDL_FPoint quad[4] = {{x1 + nx, y1 + ny},
                              {x2 + nx, y2 + ny},
                              {x2 - nx, y2 - ny},
                              {x1 - nx, y1 - ny}};
  fillPolygon(quad, color);
}

void RenderSurface::fillRect(float x, float y, float w, float h,
                             SDL_Color color) {
  if (w <= 0.0f || h <= 0.0f || color.a == 0) {
    return;
  }
  ++m_primitiveCount;
  const SDL_FRect rect{x, y, w, h};
  bool ok = SDL_SetRenderDrawColor(m_renderer, color.r, color.g, color.b,
                                   color.a) &&
            SDL_RenderFillRect(m_renderer, &rect);
  if (!ok) {
    ++m_failedDrawCount;
  }
}

void RenderSurface::fillOverlay(SDL_Color color) {
  fillRect(0.0f, 0.0f, static_cast<float>(m_width),
           static_cast<float>(m_height), color);
}

} // namespace Stormfire
