#include "track_renderer.hpp"
#include <glad/glad.h>
#include <algorithm>
#include <iostream>

namespace track_overlay
{

static const char *VERTEX_SHADER = R"(
#version 330 core
layout(location = 0) in vec2 a_pos;
layout(location = 1) in vec3 a_color;
layout(location = 2) in float a_thickness;
uniform mat4 u_view_proj;
out vec3 v_color;
void main() {
    v_color = a_color;
    gl_Position = u_view_proj * vec4(a_pos, 0.0, 1.0);
}
)";

static const char *FRAGMENT_SHADER = R"(
#version 330 core
in vec3 v_color;
out vec4 frag_color;
void main() {
    frag_color = vec4(v_color, 1.0);
}
)";

track_renderer_t::track_renderer_t()
{
  init_gl();
}

track_renderer_t::~track_renderer_t()
{
  if (m_fbo)
    glDeleteFramebuffers(1, &m_fbo);
  if (m_color_texture)
    glDeleteTextures(1, &m_color_texture);
  if (m_vao)
    glDeleteVertexArrays(1, &m_vao);
  if (m_position_vbo)
    glDeleteBuffers(1, &m_position_vbo);
  if (m_color_vbo)
    glDeleteBuffers(1, &m_color_vbo);
  if (m_thickness_vbo)
    glDeleteBuffers(1, &m_thickness_vbo);
  if (m_index_buffer)
    glDeleteBuffers(1, &m_index_buffer);
}

void track_renderer_t::init_gl()
{
  m_shader = std::make_unique<shader_t>(VERTEX_SHADER, FRAGMENT_SHADER);
  if (!m_shader->is_valid())
    std::cerr << "Renderer: track shader unavailable, nothing will be drawn" << std::endl;

  glGenVertexArrays(1, &m_vao);
  glBindVertexArray(m_vao);

  glGenBuffers(1, &m_position_vbo);
  glBindBuffer(GL_ARRAY_BUFFER, m_position_vbo);
  glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, 2 * sizeof(float), (void *)0);
  glEnableVertexAttribArray(0);

  glGenBuffers(1, &m_color_vbo);
  glBindBuffer(GL_ARRAY_BUFFER, m_color_vbo);
  glVertexAttribPointer(1, 3, GL_FLOAT, GL_FALSE, 3 * sizeof(float), (void *)0);
  glEnableVertexAttribArray(1);

  glGenBuffers(1, &m_thickness_vbo);
  glBindBuffer(GL_ARRAY_BUFFER, m_thickness_vbo);
  glVertexAttribPointer(2, 1, GL_FLOAT, GL_FALSE, sizeof(float), (void *)0);
  glEnableVertexAttribArray(2);

  // Element buffer binding is part of the VAO state
  glGenBuffers(1, &m_index_buffer);
  glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, m_index_buffer);

  glBindVertexArray(0);
  glBindBuffer(GL_ARRAY_BUFFER, 0);

  glGetFloatv(GL_ALIASED_LINE_WIDTH_RANGE, m_line_width_range);
}

void track_renderer_t::resize_fbo(int width, int height)
{
  if (m_fbo_width == width && m_fbo_height == height && m_fbo != 0)
    return;

  m_fbo_width = width;
  m_fbo_height = height;

  if (m_fbo == 0)
    glGenFramebuffers(1, &m_fbo);
  glBindFramebuffer(GL_FRAMEBUFFER, m_fbo);

  if (m_color_texture == 0)
    glGenTextures(1, &m_color_texture);
  glBindTexture(GL_TEXTURE_2D, m_color_texture);
  glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA8, width, height, 0, GL_RGBA, GL_UNSIGNED_BYTE, nullptr);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
  glFramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_2D, m_color_texture, 0);

  m_fbo_complete = glCheckFramebufferStatus(GL_FRAMEBUFFER) == GL_FRAMEBUFFER_COMPLETE;
  if (!m_fbo_complete)
    std::cerr << "Renderer: framebuffer not complete (" << width << "x" << height << ")" << std::endl;

  glBindTexture(GL_TEXTURE_2D, 0);
  glBindFramebuffer(GL_FRAMEBUFFER, 0);
}

void track_renderer_t::upload(const render_buffer_t &buffer)
{
  glBindVertexArray(m_vao);

  glBindBuffer(GL_ARRAY_BUFFER, m_position_vbo);
  glBufferData(GL_ARRAY_BUFFER, buffer.positions.size() * sizeof(float), buffer.positions.data(), GL_STATIC_DRAW);

  glBindBuffer(GL_ARRAY_BUFFER, m_color_vbo);
  glBufferData(GL_ARRAY_BUFFER, buffer.colors.size() * sizeof(float), buffer.colors.data(), GL_STATIC_DRAW);

  glBindBuffer(GL_ARRAY_BUFFER, m_thickness_vbo);
  glBufferData(GL_ARRAY_BUFFER, buffer.thicknesses.size() * sizeof(float), buffer.thicknesses.data(), GL_STATIC_DRAW);

  glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, m_index_buffer);
  glBufferData(GL_ELEMENT_ARRAY_BUFFER, buffer.indices.size() * sizeof(std::uint32_t), buffer.indices.data(), GL_STATIC_DRAW);

  glBindVertexArray(0);
  glBindBuffer(GL_ARRAY_BUFFER, 0);

  m_index_count = buffer.indices.size();
  m_uploaded_revision = buffer.revision;
  m_has_upload = true;
}

auto track_renderer_t::render(const render_buffer_t &buffer, const view_transform_t &view, const std::array<float, 3> &background, float line_width) -> unsigned int
{
  const auto &state = view.get_state();
  int width = static_cast<int>(state.canvas_w);
  int height = static_cast<int>(state.canvas_h);
  if (width <= 0 || height <= 0)
    return 0;

  resize_fbo(width, height);
  if (!m_fbo_complete)
    return 0;

  if (!m_has_upload || m_uploaded_revision != buffer.revision)
    upload(buffer);

  glBindFramebuffer(GL_FRAMEBUFFER, m_fbo);
  glViewport(0, 0, width, height);
  glClearColor(background[0], background[1], background[2], 1.0f);
  glClear(GL_COLOR_BUFFER_BIT);

  if (m_index_count > 0 && m_shader->is_valid())
  {
    auto view_proj = view.clip_matrix();

    m_shader->bind();
    m_shader->set_mat4("u_view_proj", view_proj.data());

    glLineWidth(std::clamp(line_width, m_line_width_range[0], m_line_width_range[1]));

    glBindVertexArray(m_vao);
    glDrawElements(GL_LINES, static_cast<GLsizei>(m_index_count), GL_UNSIGNED_INT, (void *)0);
    glBindVertexArray(0);

    m_shader->unbind();
  }

  glBindFramebuffer(GL_FRAMEBUFFER, 0);
  return m_color_texture;
}

} // namespace track_overlay
