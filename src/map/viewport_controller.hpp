#pragma once

#include "core/map_types.hpp"
#include "map/style_revision_tracker.hpp"
#include "renderer/map_surface.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace site_mapper
{

// Owns the single live map surface: creation, basemap swaps, recentering and
// teardown. Everything else reaches the surface through surface(), which is
// null before initialize() and after teardown().
class viewport_controller_t
{
public:
  viewport_controller_t() = default;
  ~viewport_controller_t();

  viewport_controller_t(const viewport_controller_t &) = delete;
  auto operator=(const viewport_controller_t &) -> viewport_controller_t & = delete;

  // Creates the surface. Returns false (and does nothing) if one already exists.
  auto initialize(const surface_factory_t &factory, const viewport_t &viewport) -> bool;

  // Swap the basemap. No-op for the current basemap. Before the initial load
  // the request is remembered and applied once the surface is loaded.
  // Returns true when a swap was started.
  auto set_basemap(const std::string &basemap) -> bool;

  // Recenter without animation. No-op on an exact match with the last center
  // applied. Returns true when the camera moved.
  auto set_center(geo_position_t center) -> bool;

  // Release listeners and destroy the surface. Safe to call repeatedly.
  // Must not be called from inside a surface event handler.
  auto teardown() -> void;

  auto surface() const -> map_surface_t *
  {
    return m_surface.get();
  }
  auto is_loaded() const -> bool
  {
    return m_surface && m_surface->is_loaded();
  }
  // Loaded and not in the middle of a style swap
  auto is_ready() const -> bool
  {
    return m_surface && m_surface->is_style_loaded();
  }

  auto get_revision() const -> uint64_t
  {
    return m_tracker.get_revision();
  }
  auto get_tracker() -> style_revision_tracker_t &
  {
    return m_tracker;
  }
  auto get_basemap() const -> const std::string &
  {
    return m_basemap;
  }

  auto set_on_view_state(std::function<void(const view_state_t &)> callback) -> void
  {
    m_on_view_state = std::move(callback);
  }
  auto set_on_load(std::function<void()> callback) -> void
  {
    m_on_load = std::move(callback);
  }

  auto current_view_state() const -> std::optional<view_state_t>;

private:
  auto handle_load() -> void;
  auto apply_basemap() -> bool;
  auto apply_center() -> bool;
  auto emit_view_state() -> void;

  std::unique_ptr<map_surface_t> m_surface;
  style_revision_tracker_t m_tracker;

  std::string m_basemap;         // Applied to the surface
  std::string m_desired_basemap; // Last requested
  std::optional<geo_position_t> m_last_center;
  geo_position_t m_desired_center = DEFAULT_CENTER;

  std::vector<listener_id_t> m_listeners;
  listener_id_t m_style_load_listener = 0;

  std::function<void(const view_state_t &)> m_on_view_state;
  std::function<void()> m_on_load;
};

} // namespace site_mapper
