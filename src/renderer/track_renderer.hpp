#pragma once

#include "../core/render_buffer.hpp"
#include "../core/view_transform.hpp"
#include "shader.hpp"
#include <array>
#include <cstdint>
#include <memory>

namespace track_overlay
{

// Draws the render buffer as GL_LINES into an offscreen target sized to the
// map canvas. The texture is then shown by the UI as an image.
//
// Per-segment thickness is uploaded as a vertex attribute but GL_LINES has a
// single global width, so every segment is drawn with line_width. Expanding
// each segment into a screen-space quad in the vertex stage would honour the
// attribute.
class track_renderer_t
{
public:
  track_renderer_t();
  ~track_renderer_t();

  track_renderer_t(const track_renderer_t &) = delete;
  track_renderer_t &operator=(const track_renderer_t &) = delete;

  // Only reads buffer and view. Re-uploads vertex data when the buffer
  // revision changed. Returns the color texture, 0 if the target is unusable.
  auto render(const render_buffer_t &buffer, const view_transform_t &view, const std::array<float, 3> &background, float line_width) -> unsigned int;

private:
  void init_gl();
  void resize_fbo(int width, int height);
  void upload(const render_buffer_t &buffer);

  std::unique_ptr<shader_t> m_shader;

  unsigned int m_fbo = 0;
  unsigned int m_color_texture = 0;
  int m_fbo_width = 0;
  int m_fbo_height = 0;
  bool m_fbo_complete = false;

  unsigned int m_vao = 0;
  unsigned int m_position_vbo = 0;
  unsigned int m_color_vbo = 0;
  unsigned int m_thickness_vbo = 0;
  unsigned int m_index_buffer = 0;

  std::uint64_t m_uploaded_revision = 0;
  bool m_has_upload = false;
  std::size_t m_index_count = 0;

  float m_line_width_range[2] = {1.0f, 1.0f};
};

} // namespace track_overlay
