#include "ui/texture.hpp"
#include <iostream>

#include "GLFW/glfw3.h" // For GL types

#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"

#ifndef GL_CLAMP_TO_EDGE
#define GL_CLAMP_TO_EDGE 0x812F
#endif

namespace site_mapper
{

texture_t::~texture_t()
{
  release();
}

auto texture_t::release() -> void
{
  if (m_renderer_id)
  {
    glDeleteTextures(1, &m_renderer_id);
    m_renderer_id = 0;
  }
  m_width = 0;
  m_height = 0;
}

auto texture_t::load_from_memory(const unsigned char *data, size_t size) -> bool
{
  if (!data || size == 0)
    return false;

  // Tiles are stored top row first, as ImGui expects
  stbi_set_flip_vertically_on_load(0);

  int width = 0;
  int height = 0;
  int channels = 0;
  unsigned char *pixels = stbi_load_from_memory(data, static_cast<int>(size), &width, &height, &channels, 4);
  if (!pixels)
  {
    std::cerr << "Texture: decode failed: " << stbi_failure_reason() << std::endl;
    return false;
  }

  release();
  m_width = width;
  m_height = height;

  glGenTextures(1, &m_renderer_id);
  glBindTexture(GL_TEXTURE_2D, m_renderer_id);

  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);

  glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA8, m_width, m_height, 0, GL_RGBA, GL_UNSIGNED_BYTE, pixels);

  stbi_image_free(pixels);
  return true;
}

} // namespace site_mapper
