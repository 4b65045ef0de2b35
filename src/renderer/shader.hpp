#pragma once

#include <glad/glad.h>
#include <string>
#include <unordered_map>

namespace track_overlay {

class shader_t {
public:
  shader_t(const std::string &vertex_src, const std::string &fragment_src);
  ~shader_t();

  shader_t(const shader_t &) = delete;
  shader_t &operator=(const shader_t &) = delete;

  void bind() const;
  void unbind() const;

  void set_mat4(const std::string &name, const float *column_major);

  bool is_valid() const { return m_renderer_id != 0; }

private:
  unsigned int m_renderer_id;
  std::unordered_map<std::string, int> m_uniform_cache;

  int get_uniform_location(const std::string &name);
  unsigned int compile_shader(unsigned int type, const std::string &source);
};

} // namespace track_overlay
