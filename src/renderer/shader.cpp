#include "shader.hpp"
#include <iostream>
#include <vector>

namespace track_overlay {

shader_t::shader_t(const std::string &vertex_src,
                   const std::string &fragment_src)
    : m_renderer_id(0) {
  unsigned int vs = compile_shader(GL_VERTEX_SHADER, vertex_src);
  unsigned int fs = compile_shader(GL_FRAGMENT_SHADER, fragment_src);

  if (vs == 0 || fs == 0) {
    if (vs)
      glDeleteShader(vs);
    if (fs)
      glDeleteShader(fs);
    return;
  }

  m_renderer_id = glCreateProgram();
  glAttachShader(m_renderer_id, vs);
  glAttachShader(m_renderer_id, fs);
  glLinkProgram(m_renderer_id);

  int result;
  glGetProgramiv(m_renderer_id, GL_LINK_STATUS, &result);
  if (result == GL_FALSE) {
    int length;
    glGetProgramiv(m_renderer_id, GL_INFO_LOG_LENGTH, &length);
    std::vector<char> message(length > 0 ? length : 1);
    glGetProgramInfoLog(m_renderer_id, length, &length, message.data());
    std::cerr << "Renderer: failed to link shader program!" << std::endl;
    std::cerr << message.data() << std::endl;
    glDeleteProgram(m_renderer_id);
    m_renderer_id = 0;
  }

  glDeleteShader(vs);
  glDeleteShader(fs);
}

shader_t::~shader_t() {
  if (m_renderer_id != 0)
    glDeleteProgram(m_renderer_id);
}

void shader_t::bind() const { glUseProgram(m_renderer_id); }

void shader_t::unbind() const { glUseProgram(0); }

void shader_t::set_mat4(const std::string &name, const float *column_major) {
  glUniformMatrix4fv(get_uniform_location(name), 1, GL_FALSE, column_major);
}

int shader_t::get_uniform_location(const std::string &name) {
  auto it = m_uniform_cache.find(name);
  if (it != m_uniform_cache.end())
    return it->second;

  int location = glGetUniformLocation(m_renderer_id, name.c_str());
  if (location == -1)
    std::cout << "Renderer: uniform '" << name << "' doesn't exist!"
              << std::endl;

  m_uniform_cache[name] = location;
  return location;
}

unsigned int shader_t::compile_shader(unsigned int type,
                                      const std::string &source) {
  unsigned int id = glCreateShader(type);
  const char *src = source.c_str();
  glShaderSource(id, 1, &src, nullptr);
  glCompileShader(id);

  int result;
  glGetShaderiv(id, GL_COMPILE_STATUS, &result);
  if (result == GL_FALSE) {
    int length;
    glGetShaderiv(id, GL_INFO_LOG_LENGTH, &length);
    std::vector<char> message(length > 0 ? length : 1);
    glGetShaderInfoLog(id, length, &length, message.data());
    std::cerr << "Renderer: failed to compile "
              << (type == GL_VERTEX_SHADER ? "vertex" : "fragment")
              << " shader!" << std::endl;
    std::cerr << message.data() << std::endl;
    glDeleteShader(id);
    return 0;
  }

  return id;
}

} // namespace track_overlay
