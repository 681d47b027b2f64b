#pragma once

#include "core/basemaps.hpp"
#include "ui/texture.hpp"
#include <future>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace site_mapper
{

// Key for tile cache: "layer/z/x/y"
using tile_key_t = std::string;

class tile_service_t
{
public:
  tile_service_t() = default;
  ~tile_service_t() = default;

  tile_service_t(const tile_service_t &) = delete;
  auto operator=(const tile_service_t &) -> tile_service_t & = delete;

  // Request a tile. Returns the texture if loaded, nullptr while pending.
  // A miss checks the disk cache, then starts a download.
  auto get_tile(tile_layer_e layer, int z, int x, int y) -> std::shared_ptr<texture_t>;

  // Call once per frame to turn finished downloads into textures
  // (OpenGL texture creation must happen on main thread)
  auto update() -> void;

  // Drop decoded textures. Downloads in flight are still collected.
  auto clear() -> void;

  auto pending_count() const -> size_t
  {
    return m_pending.size();
  }
  auto cached_count() const -> size_t
  {
    return m_cache.size();
  }

private:
  struct pending_tile_t
  {
    tile_key_t key;
    std::future<std::string> data_future;
  };

  static auto make_key(tile_layer_e layer, int z, int x, int y) -> tile_key_t;
  static auto decode(const std::string &bytes) -> std::shared_ptr<texture_t>;

  std::map<tile_key_t, std::shared_ptr<texture_t>> m_cache;
  std::vector<pending_tile_t> m_pending;
  std::set<tile_key_t> m_loading_keys; // to avoid duplicate requests
  std::set<tile_key_t> m_failed_keys;  // not retried this session
};

} // namespace site_mapper
