#include "ui/tile_service.hpp"
#include <chrono>
#include <cpr/cpr.h>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <iterator>

namespace fs = std::filesystem;

namespace site_mapper
{

auto tile_service_t::make_key(tile_layer_e layer, int z, int x, int y) -> tile_key_t
{
  return std::format("{}/{}/{}/{}", basemaps::layer_name(layer), z, x, y);
}

auto tile_service_t::decode(const std::string &bytes) -> std::shared_ptr<texture_t>
{
  if (bytes.empty())
    return nullptr;

  auto texture = std::make_shared<texture_t>();
  if (!texture->load_from_memory(reinterpret_cast<const unsigned char *>(bytes.data()), bytes.size()))
    return nullptr;
  return texture;
}

auto tile_service_t::get_tile(tile_layer_e layer, int z, int x, int y) -> std::shared_ptr<texture_t>
{
  if (z > basemaps::max_zoom(layer))
    return nullptr;

  auto key = make_key(layer, z, x, y);

  auto it = m_cache.find(key);
  if (it != m_cache.end())
    return it->second;

  if (m_loading_keys.contains(key) || m_failed_keys.contains(key))
    return nullptr;

  // Disk cache first
  fs::path file_path = basemaps::cache_path(layer, z, x, y);
  std::error_code ec;
  if (fs::exists(file_path, ec))
  {
    std::ifstream f(file_path, std::ios::binary);
    std::string bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (auto texture = decode(bytes))
    {
      m_cache[key] = texture;
      return texture;
    }
    std::cerr << "Tiles: discarding unreadable cache file " << file_path.string() << std::endl;
    fs::remove(file_path, ec);
  }

  m_loading_keys.insert(key);

  std::string url = basemaps::tile_url(layer, z, x, y);
  std::string save_path = file_path.string();

  m_pending.push_back({key, std::async(std::launch::async,
                                       [url, save_path]()
                                       {
                                         cpr::Response r = cpr::Get(cpr::Url{url}, cpr::Header{{"User-Agent", "SiteMapper/0.1"}}, cpr::Timeout{15000});
                                         if (r.status_code != 200)
                                           return std::string();

                                         std::error_code write_ec;
                                         fs::path p(save_path);
                                         fs::create_directories(p.parent_path(), write_ec);
                                         if (write_ec)
                                         {
                                           std::cerr << "Tiles: cannot create " << p.parent_path().string() << ": " << write_ec.message() << std::endl;
                                           return r.text;
                                         }

                                         std::ofstream f(p, std::ios::binary);
                                         f.write(r.text.data(), static_cast<std::streamsize>(r.text.size()));
                                         if (!f)
                                           std::cerr << "Tiles: failed to write " << save_path << std::endl;
                                         return r.text;
                                       })});

  return nullptr;
}

auto tile_service_t::update() -> void
{
  auto it = m_pending.begin();
  while (it != m_pending.end())
  {
    if (it->data_future.wait_for(std::chrono::seconds(0)) != std::future_status::ready)
    {
      ++it;
      continue;
    }

    std::string data = it->data_future.get();
    m_loading_keys.erase(it->key);

    if (auto texture = decode(data))
      m_cache[it->key] = texture;
    else
      m_failed_keys.insert(it->key);

    it = m_pending.erase(it);
  }
}

auto tile_service_t::clear() -> void
{
  m_cache.clear();
  m_failed_keys.clear();
}

} // namespace site_mapper
