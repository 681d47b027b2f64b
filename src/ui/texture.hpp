#pragma once

#include <cstddef>

namespace site_mapper
{

// RGBA OpenGL texture decoded from an encoded image (png/jpg). Must be
// created and destroyed on the thread owning the GL context.
class texture_t
{
public:
  texture_t() = default;
  ~texture_t();

  texture_t(const texture_t &) = delete;
  auto operator=(const texture_t &) -> texture_t & = delete;

  // Replaces any previous image
  auto load_from_memory(const unsigned char *data, size_t size) -> bool;

  auto is_valid() const -> bool
  {
    return m_renderer_id != 0;
  }
  auto get_id() const -> unsigned int // GLuint
  {
    return m_renderer_id;
  }
  auto get_width() const -> int
  {
    return m_width;
  }
  auto get_height() const -> int
  {
    return m_height;
  }

private:
  auto release() -> void;

  unsigned int m_renderer_id = 0;
  int m_width = 0;
  int m_height = 0;
};

} // namespace site_mapper
