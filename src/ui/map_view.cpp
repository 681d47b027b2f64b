#include "ui/map_view.hpp"
#include "core/basemaps.hpp"
#include "core/geo_math.hpp"
#include "imgui.h"
#include <algorithm>
#include <cmath>
#include <format>
#include <string>
#include <vector>

namespace site_mapper
{

// --- Rendering Helpers ---
static void sanitize_points(std::vector<ImVec2> &points)
{
  if (points.empty())
    return;

  // Remove duplicate consecutive points
  std::vector<ImVec2> clean_points;
  for (const auto &p : points)
  {
    if (!clean_points.empty() && std::abs(p.x - clean_points.back().x) <= 0.01f && std::abs(p.y - clean_points.back().y) <= 0.01f)
      continue;
    clean_points.push_back(p);
  }

  // GeoJSON rings repeat the first point at the end
  if (clean_points.size() > 2)
  {
    float dx = clean_points.back().x - clean_points.front().x;
    float dy = clean_points.back().y - clean_points.front().y;
    if (std::abs(dx) < 0.01f && std::abs(dy) < 0.01f)
      clean_points.pop_back();
  }

  // Remove Collinear Points
  if (clean_points.size() > 2)
  {
    std::vector<ImVec2> final_points;
    for (size_t i = 0; i < clean_points.size(); ++i)
    {
      size_t prev = (i + clean_points.size() - 1) % clean_points.size();
      size_t next = (i + 1) % clean_points.size();
      ImVec2 p1 = clean_points[prev];
      ImVec2 p2 = clean_points[i];
      ImVec2 p3 = clean_points[next];

      float area = (p2.x - p1.x) * (p3.y - p1.y) - (p2.y - p1.y) * (p3.x - p1.x);
      if (std::abs(area) > 0.001f)
        final_points.push_back(p2);
    }
    clean_points = std::move(final_points);
  }
  points = std::move(clean_points);
}

static bool is_point_in_triangle(ImVec2 p, ImVec2 a, ImVec2 b, ImVec2 c)
{
  auto cross_product = [](ImVec2 a, ImVec2 b, ImVec2 c) { return (b.x - a.x) * (c.y - a.y) - (b.y - a.y) * (c.x - a.x); };
  bool s1 = cross_product(a, b, p) > 0.0f;
  bool s2 = cross_product(b, c, p) > 0.0f;
  bool s3 = cross_product(c, a, p) > 0.0f;
  return (s1 == s2) && (s2 == s3);
}

// Ear clipping; returns triangle indices into points
static std::vector<int> triangulate_polygon(const std::vector<ImVec2> &points)
{
  if (points.size() < 3)
    return {};

  double area_sum = 0;
  for (size_t i = 0; i < points.size(); i++)
  {
    size_t j = (i + 1) % points.size();
    area_sum += static_cast<double>(points[i].x) * points[j].y;
    area_sum -= static_cast<double>(points[j].x) * points[i].y;
  }
  bool is_ccw = area_sum > 0;

  std::vector<int> indices(points.size());
  for (int i = 0; i < static_cast<int>(indices.size()); ++i)
    indices[static_cast<size_t>(i)] = i;

  auto is_ear = [&](int u, int v, int w, int n_curr)
  {
    ImVec2 a = points[static_cast<size_t>(indices[static_cast<size_t>(u)])];
    ImVec2 b = points[static_cast<size_t>(indices[static_cast<size_t>(v)])];
    ImVec2 c = points[static_cast<size_t>(indices[static_cast<size_t>(w)])];

    float cp = (b.x - a.x) * (c.y - a.y) - (b.y - a.y) * (c.x - a.x);
    if (is_ccw ? cp <= 0.0001f : cp >= -0.0001f)
      return false;

    for (int p = 0; p < n_curr; p++)
    {
      if (p == u || p == v || p == w)
        continue;
      if (is_point_in_triangle(points[static_cast<size_t>(indices[static_cast<size_t>(p)])], a, b, c))
        return false;
    }
    return true;
  };

  std::vector<int> result;
  int n = static_cast<int>(indices.size());
  int count = 2 * n;
  for (int v = n - 1; n > 2;)
  {
    if (count-- <= 0)
      break; // Self-intersecting ring, draw what was clipped

    int u = v;
    if (u >= n)
      u = 0;
    v = u + 1;
    if (v >= n)
      v = 0;
    int w = v + 1;
    if (w >= n)
      w = 0;

    if (is_ear(u, v, w, n))
    {
      result.push_back(indices[static_cast<size_t>(u)]);
      result.push_back(indices[static_cast<size_t>(v)]);
      result.push_back(indices[static_cast<size_t>(w)]);
      indices.erase(indices.begin() + v);
      n--;
      count = 2 * n;
    }
  }
  return result;
}

// Dash lengths are given in line widths
static void add_dashed_polyline(ImDrawList *draw_list, const std::vector<ImVec2> &points, bool closed, ImU32 col, float width, const std::vector<float> &dash)
{
  if (points.size() < 2)
    return;

  if (dash.empty() || std::any_of(dash.begin(), dash.end(), [](float d) { return d <= 0.0f; }))
  {
    draw_list->AddPolyline(points.data(), static_cast<int>(points.size()), col, closed ? ImDrawFlags_Closed : ImDrawFlags_None, width);
    return;
  }

  const float scale = std::max(width, 1.0f);
  size_t pattern = 0;
  float remaining = dash[0] * scale;
  bool on = true;

  size_t segments = closed ? points.size() : points.size() - 1;
  for (size_t i = 0; i < segments; ++i)
  {
    ImVec2 a = points[i];
    ImVec2 b = points[(i + 1) % points.size()];
    float seg_len = std::hypot(b.x - a.x, b.y - a.y);
    if (seg_len <= 0.0f)
      continue;

    float t = 0.0f;
    while (t < seg_len)
    {
      float step = std::min(remaining, seg_len - t);
      if (on)
      {
        ImVec2 p0(a.x + (b.x - a.x) * (t / seg_len), a.y + (b.y - a.y) * (t / seg_len));
        ImVec2 p1(a.x + (b.x - a.x) * ((t + step) / seg_len), a.y + (b.y - a.y) * ((t + step) / seg_len));
        draw_list->AddLine(p0, p1, col, width);
      }
      t += step;
      remaining -= step;
      if (remaining <= 0.0f)
      {
        pattern = (pattern + 1) % dash.size();
        remaining = dash[pattern] * scale;
        on = !on;
      }
    }
  }
}

static auto to_imgui_color(const color_t &color, float alpha) -> ImU32
{
  return ImGui::ColorConvertFloat4ToU32(ImVec4(color[0], color[1], color[2], std::clamp(alpha, 0.0f, 1.0f)));
}

static auto is_selected(const feature_t &feature) -> bool
{
  auto it = feature.properties.find("selected");
  return it != feature.properties.end() && it->is_boolean() && it->get<bool>();
}

static auto feature_color(const paint_t &paint, const feature_t &feature) -> color_t
{
  if (!paint.color_property.empty())
  {
    if (auto color = parse_hex_color(geojson::property_string(feature.properties, paint.color_property)))
      return *color;
  }
  return paint.color;
}

static void render_popup_body(const popup_content_t &content)
{
  if (!content.title.empty())
    ImGui::TextColored(ImVec4(1.0f, 1.0f, 1.0f, 1.0f), "%s", content.title.c_str());

  for (const auto &line : content.address_lines)
    ImGui::TextDisabled("%s", line.c_str());

  if (!content.rows.empty())
  {
    ImGui::Separator();
    if (ImGui::BeginTable("##rows", 2, ImGuiTableFlags_SizingFixedFit))
    {
      for (const auto &row : content.rows)
      {
        ImGui::TableNextRow();
        ImGui::TableSetColumnIndex(0);
        ImGui::TextDisabled("%s", row.label.c_str());
        ImGui::TableSetColumnIndex(1);
        ImGui::TextUnformatted(row.value.c_str());
      }
      ImGui::EndTable();
    }
  }

  if (content.table && !content.table->columns.empty() && !content.table->rows.empty())
  {
    const auto &table = *content.table;
    ImGui::Separator();
    if (ImGui::BeginTable("##table", static_cast<int>(table.columns.size()), ImGuiTableFlags_Borders | ImGuiTableFlags_SizingFixedFit))
    {
      for (const auto &column : table.columns)
        ImGui::TableSetupColumn(column.c_str());
      ImGui::TableHeadersRow();

      for (const auto &row : table.rows)
      {
        ImGui::TableNextRow();
        for (size_t c = 0; c < row.size() && c < table.columns.size(); ++c)
        {
          ImGui::TableSetColumnIndex(static_cast<int>(c));
          ImGui::TextUnformatted(row[c].c_str());
        }
      }
      ImGui::EndTable();
    }
  }
}

// Returns false when the close button was pressed
static auto render_popup_window(const char *window_id, const ImVec2 &anchor, const popup_content_t &content) -> bool
{
  constexpr ImGuiWindowFlags flags = ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_AlwaysAutoResize |
                                     ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoFocusOnAppearing | ImGuiWindowFlags_NoNav |
                                     ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoDocking;

  bool keep_open = true;
  ImGui::SetNextWindowPos(anchor, ImGuiCond_Always, ImVec2(0.5f, 1.0f));
  ImGui::SetNextWindowBgAlpha(0.92f);
  if (ImGui::Begin(window_id, nullptr, flags))
  {
    if (ImGui::SmallButton("x"))
      keep_open = false;
    ImGui::SameLine();
    render_popup_body(content);
  }
  ImGui::End();
  return keep_open;
}

auto map_view_t::make_surface(const viewport_t &viewport) -> std::unique_ptr<map_surface_t>
{
  return std::make_unique<retained_surface_t>(viewport);
}

auto map_view_t::to_screen(const retained_surface_t &surface, geo_position_t position, const ImVec2 &canvas_p0) const -> ImVec2
{
  double x = 0.0;
  double y = 0.0;
  surface.geo_to_screen(position, x, y);
  return ImVec2(canvas_p0.x + static_cast<float>(x), canvas_p0.y + static_cast<float>(y));
}

auto map_view_t::project_ring(const retained_surface_t &surface, const ring_t &ring, const ImVec2 &canvas_p0) const -> std::vector<ImVec2>
{
  std::vector<ImVec2> points;
  points.reserve(ring.size());
  for (const auto &p : ring)
    points.push_back(to_screen(surface, p, canvas_p0));
  return points;
}

auto map_view_t::draw(map_canvas_t &canvas) -> void
{
  auto *surface = dynamic_cast<retained_surface_t *>(canvas.surface());

  ImVec2 canvas_p0 = ImGui::GetCursorScreenPos();
  ImVec2 canvas_sz_raw = ImGui::GetContentRegionAvail();
  ImVec2 canvas_sz(std::max(canvas_sz_raw.x, 50.0f), std::max(canvas_sz_raw.y, 50.0f));

  ImDrawList *draw_list = ImGui::GetWindowDrawList();
  draw_list->AddRectFilled(canvas_p0, ImVec2(canvas_p0.x + canvas_sz.x, canvas_p0.y + canvas_sz.y), IM_COL32(20, 20, 20, 255));

  ImGui::InvisibleButton("map_canvas", canvas_sz, ImGuiButtonFlags_MouseButtonLeft | ImGuiButtonFlags_MouseButtonRight);

  if (!surface)
  {
    draw_list->AddText(ImVec2(canvas_p0.x + 10.0f, canvas_p0.y + 10.0f), IM_COL32(200, 200, 200, 255), "Map not mounted");
    return;
  }

  surface->set_viewport_size(canvas_sz.x, canvas_sz.y);
  surface->update();
  m_tiles.update();

  handle_input(canvas, *surface, canvas_p0, canvas_sz);

  // Push input driven changes (draw feedback, selection) before painting
  canvas.refresh();

  draw_list->PushClipRect(canvas_p0, ImVec2(canvas_p0.x + canvas_sz.x, canvas_p0.y + canvas_sz.y), true);
  render_tiles(*surface, draw_list, canvas_p0, canvas_sz);
  render_layers(*surface, draw_list, canvas_p0);
  render_markers(*surface, draw_list, canvas_p0);
  render_scale_bar(*surface, draw_list, canvas_p0, canvas_sz);
  render_status(canvas, *surface, draw_list, canvas_p0);
  apply_cursor(*surface);
  if (m_hovering && !m_dragging && surface->cursor() == cursor_e::Crosshair)
  {
    ImVec2 m = ImGui::GetIO().MousePos;
    draw_list->AddLine(ImVec2(m.x - 10.0f, m.y), ImVec2(m.x + 10.0f, m.y), IM_COL32(255, 255, 255, 230), 1.5f);
    draw_list->AddLine(ImVec2(m.x, m.y - 10.0f), ImVec2(m.x, m.y + 10.0f), IM_COL32(255, 255, 255, 230), 1.5f);
  }
  draw_list->PopClipRect();

  render_popups(*surface, canvas_p0);
}

auto map_view_t::handle_input(map_canvas_t &canvas, retained_surface_t &surface, const ImVec2 &canvas_p0, const ImVec2 &canvas_sz) -> void
{
  ImGuiIO &io = ImGui::GetIO();
  const bool is_hovered = ImGui::IsItemHovered();
  const bool is_active = ImGui::IsItemActive();
  const ImVec2 local(io.MousePos.x - canvas_p0.x, io.MousePos.y - canvas_p0.y);

  // --- Hover ---
  if (is_hovered && !m_dragging)
  {
    auto geo = surface.screen_to_geo(local.x, local.y);
    m_mouse_geo = geo;
    if (!m_hovering || local.x != m_last_mouse.x || local.y != m_last_mouse.y)
      surface.pointer_move(geo);
    m_hovering = true;
    m_last_mouse = local;
  }
  else if (!is_hovered && m_hovering && !m_dragging)
  {
    surface.pointer_leave();
    m_hovering = false;
    m_mouse_geo.reset();
  }

  // --- Mouse Wheel Zoom, anchored at the cursor ---
  if (is_hovered && io.MouseWheel != 0.0f)
  {
    auto anchor = surface.screen_to_geo(local.x, local.y);
    double zoom = std::clamp(surface.zoom() + io.MouseWheel * 0.5, retained_surface_t::MIN_ZOOM, retained_surface_t::MAX_ZOOM);
    surface.zoom_to(zoom);

    double ax = 0.0;
    double ay = 0.0;
    surface.geo_to_screen(anchor, ax, ay);
    surface.pan_to(surface.screen_to_geo(canvas_sz.x * 0.5 + (ax - local.x), canvas_sz.y * 0.5 + (ay - local.y)));

    m_zoom_pending = true;
    m_last_zoom_time = ImGui::GetTime();
  }

  if (m_zoom_pending && !m_dragging && ImGui::GetTime() - m_last_zoom_time > 0.3)
  {
    surface.settle();
    m_zoom_pending = false;
  }

  // --- Panning ---
  if (is_active && ImGui::IsMouseDragging(ImGuiMouseButton_Left))
  {
    ImVec2 delta = io.MouseDelta;
    if (delta.x != 0.0f || delta.y != 0.0f)
      surface.pan_to(surface.screen_to_geo(canvas_sz.x * 0.5 - delta.x, canvas_sz.y * 0.5 - delta.y));
    m_dragging = true;
  }

  auto &draw = canvas.get_draw_session();

  // Double click finishes a line or polygon; the release that follows is not a click
  if (is_hovered && ImGui::IsMouseDoubleClicked(ImGuiMouseButton_Left) && draw.can_finish())
  {
    draw.finish();
    m_suppress_release = true;
  }

  if (ImGui::IsItemDeactivated())
  {
    if (m_dragging)
    {
      surface.settle();
      m_dragging = false;
    }
    else if (m_suppress_release)
    {
      m_suppress_release = false;
    }
    else if (is_hovered && ImGui::IsMouseReleased(ImGuiMouseButton_Left))
    {
      surface.click(surface.screen_to_geo(local.x, local.y));
    }
  }

  // Right click steps back one vertex while drawing
  if (is_hovered && ImGui::IsMouseClicked(ImGuiMouseButton_Right) && draw.is_active())
    draw.undo_vertex();
}

auto map_view_t::apply_cursor(const retained_surface_t &surface) -> void
{
  if (m_dragging)
  {
    ImGui::SetMouseCursor(ImGuiMouseCursor_ResizeAll);
    return;
  }
  if (!m_hovering)
    return;

  switch (surface.cursor())
  {
  case cursor_e::Pointer:
    ImGui::SetMouseCursor(ImGuiMouseCursor_Hand);
    break;
  case cursor_e::Crosshair:
    ImGui::SetMouseCursor(ImGuiMouseCursor_None); // Drawn by the view
    break;
  case cursor_e::Move:
    ImGui::SetMouseCursor(ImGuiMouseCursor_ResizeAll);
    break;
  case cursor_e::NotAllowed:
    ImGui::SetMouseCursor(ImGuiMouseCursor_NotAllowed);
    break;
  default:
    ImGui::SetMouseCursor(ImGuiMouseCursor_Arrow);
    break;
  }
}

auto map_view_t::render_tiles(const retained_surface_t &surface, ImDrawList *draw_list, const ImVec2 &canvas_p0, const ImVec2 &canvas_sz) -> void
{
  const auto *basemap = basemaps::find(surface.style_id());
  if (!basemap)
    basemap = basemaps::find(DEFAULT_BASEMAP);

  const double tile_size = retained_surface_t::TILE_SIZE;
  const double zoom = surface.zoom();
  const double world_size_pixels = std::pow(2.0, zoom) * tile_size;

  auto center = surface.center();
  double center_wx = 0.0;
  double center_wy = 0.0;
  geo::lat_lon_to_world(center.lat, center.lon, center_wx, center_wy);

  ImVec2 screen_center(canvas_p0.x + canvas_sz.x * 0.5f, canvas_p0.y + canvas_sz.y * 0.5f);

  double view_half_w = (canvas_sz.x * 0.5f) / world_size_pixels;
  double view_half_h = (canvas_sz.y * 0.5f) / world_size_pixels;

  bool base_layer = true;
  for (auto layer : basemap->layers)
  {
    int tile_zoom = std::min(static_cast<int>(std::floor(zoom)), basemaps::max_zoom(layer));
    double render_n = std::pow(2.0, tile_zoom);
    int max_tile = 1 << tile_zoom;

    int min_tx = static_cast<int>(std::floor((center_wx - view_half_w) * render_n));
    int max_tx = static_cast<int>(std::floor((center_wx + view_half_w) * render_n));
    int min_ty = static_cast<int>(std::floor((center_wy - view_half_h) * render_n));
    int max_ty = static_cast<int>(std::floor((center_wy + view_half_h) * render_n));

    if ((max_tx - min_tx + 1) * (max_ty - min_ty + 1) > 150)
      break;

    float tile_screen_size = static_cast<float>(tile_size * std::pow(2.0, zoom - tile_zoom));

    for (int x = min_tx; x <= max_tx; ++x)
    {
      for (int y = min_ty; y <= max_ty; ++y)
      {
        if (y < 0 || y >= max_tile)
          continue;
        int wrapped_x = ((x % max_tile) + max_tile) % max_tile;

        float draw_x = static_cast<float>((x / render_n - center_wx) * world_size_pixels + screen_center.x);
        float draw_y = static_cast<float>((y / render_n - center_wy) * world_size_pixels + screen_center.y);
        ImVec2 p_min(draw_x, draw_y);
        ImVec2 p_max(draw_x + tile_screen_size, draw_y + tile_screen_size);

        auto texture = m_tiles.get_tile(layer, tile_zoom, wrapped_x, y);
        if (texture && texture->is_valid())
        {
          draw_list->AddImage((ImTextureID)(intptr_t)texture->get_id(), p_min, p_max);
        }
        else if (base_layer)
        {
          // Progressive tile loading: show the closest loaded parent
          bool found_fallback = false;
          for (int fallback_zoom = tile_zoom - 1; fallback_zoom >= 0 && !found_fallback; --fallback_zoom)
          {
            int zoom_diff = tile_zoom - fallback_zoom;
            int parent_tx = wrapped_x >> zoom_diff;
            int parent_ty = y >> zoom_diff;

            auto parent_texture = m_tiles.get_tile(layer, fallback_zoom, parent_tx, parent_ty);
            if (!parent_texture || !parent_texture->is_valid())
              continue;

            float uv_scale = 1.0f / static_cast<float>(1 << zoom_diff);
            int sub_x = wrapped_x - (parent_tx << zoom_diff);
            int sub_y = y - (parent_ty << zoom_diff);
            ImVec2 uv_min(sub_x * uv_scale, sub_y * uv_scale);
            ImVec2 uv_max((sub_x + 1) * uv_scale, (sub_y + 1) * uv_scale);

            draw_list->AddImage((ImTextureID)(intptr_t)parent_texture->get_id(), p_min, p_max, uv_min, uv_max);
            found_fallback = true;
          }

          if (!found_fallback)
          {
            draw_list->AddRectFilled(p_min, p_max, IM_COL32(40, 40, 40, 255));
            draw_list->AddRect(p_min, p_max, IM_COL32(80, 80, 80, 100));
          }
        }

        if (m_show_tile_grid && base_layer)
        {
          draw_list->AddRect(p_min, p_max, IM_COL32(255, 255, 0, 80));
          auto label = std::format("{}/{}/{}", tile_zoom, wrapped_x, y);
          draw_list->AddText(ImVec2(p_min.x + 4.0f, p_min.y + 4.0f), IM_COL32(255, 255, 0, 200), label.c_str());
        }
      }
    }
    base_layer = false;
  }
}

auto map_view_t::render_layers(const retained_surface_t &surface, ImDrawList *draw_list, const ImVec2 &canvas_p0) -> void
{
  const double zoom = surface.zoom();

  for (const auto &layer_id : surface.layer_ids())
  {
    const auto *spec = surface.layer(layer_id);
    if (!spec || zoom < spec->min_zoom)
      continue;

    auto data = surface.source(spec->source);
    if (!data)
      continue;

    const auto &paint = spec->paint;
    for (const auto &feature : data->features)
    {
      if (!surface.draws_feature(*spec, feature))
        continue;

      const bool selected = is_selected(feature);
      const color_t color = feature_color(paint, feature);
      const auto &geometry = feature.geometry;

      switch (spec->kind)
      {
      case layer_kind_e::Fill:
      {
        if (!geometry.is_polygonal())
          break;

        float opacity = paint.opacity;
        if (paint.hover_opacity && !feature.id.empty() && surface.feature_state(spec->source, feature.id, "hover"))
          opacity = *paint.hover_opacity;
        if (paint.selected_opacity && selected)
          opacity = *paint.selected_opacity;

        ImU32 fill_col = to_imgui_color(color, opacity);
        for (const auto &polygon : geometry.parts)
        {
          if (polygon.empty())
            continue;

          // Holes are outlined only
          auto points = project_ring(surface, polygon.front(), canvas_p0);
          sanitize_points(points);
          auto triangles = triangulate_polygon(points);
          for (size_t i = 0; i + 2 < triangles.size(); i += 3)
          {
            draw_list->AddTriangleFilled(points[static_cast<size_t>(triangles[i])], points[static_cast<size_t>(triangles[i + 1])],
                                         points[static_cast<size_t>(triangles[i + 2])], fill_col);
          }

          if (paint.outline_color)
          {
            for (const auto &ring : polygon)
            {
              auto outline = project_ring(surface, ring, canvas_p0);
              draw_list->AddPolyline(outline.data(), static_cast<int>(outline.size()), to_imgui_color(*paint.outline_color, 1.0f), ImDrawFlags_Closed,
                                     std::max(paint.outline_width, 1.0f));
            }
          }
        }
        break;
      }
      case layer_kind_e::Line:
      {
        float width = (paint.selected_width && selected) ? *paint.selected_width : paint.width;
        ImU32 line_col = to_imgui_color(color, paint.opacity);
        const bool closed = geometry.is_polygonal();
        for (const auto &part : geometry.parts)
        {
          for (const auto &ring : part)
            add_dashed_polyline(draw_list, project_ring(surface, ring, canvas_p0), closed, line_col, width, paint.dash);
        }
        break;
      }
      case layer_kind_e::Circle:
      {
        if (!geometry.is_point_like())
          break;

        float radius = (paint.selected_width && selected) ? *paint.selected_width : paint.width;
        for (const auto &part : geometry.parts)
        {
          for (const auto &ring : part)
          {
            for (const auto &p : ring)
            {
              ImVec2 pos = to_screen(surface, p, canvas_p0);
              draw_list->AddCircleFilled(pos, radius, to_imgui_color(color, paint.opacity));
              if (paint.outline_color && paint.outline_width > 0.0f)
                draw_list->AddCircle(pos, radius, to_imgui_color(*paint.outline_color, 1.0f), 0, paint.outline_width);
            }
          }
        }
        break;
      }
      }
    }
  }
}

auto map_view_t::render_markers(retained_surface_t &surface, ImDrawList *draw_list, const ImVec2 &canvas_p0) -> void
{
  for (const auto &marker : surface.markers())
  {
    ImVec2 pos = to_screen(surface, marker.spec.position, canvas_p0);
    ImU32 col = to_imgui_color(marker.spec.color, 1.0f);

    if (marker.spec.style == marker_style_e::Subject)
    {
      draw_list->AddCircleFilled(pos, 11.0f, IM_COL32(255, 255, 255, 255));
      draw_list->AddCircleFilled(pos, 8.0f, col);
      draw_list->AddCircleFilled(pos, 3.0f, IM_COL32(255, 255, 255, 255));
    }
    else
    {
      // Pin with its tip on the position
      ImVec2 head(pos.x, pos.y - 18.0f);
      draw_list->AddTriangleFilled(ImVec2(pos.x - 6.0f, head.y + 3.0f), ImVec2(pos.x + 6.0f, head.y + 3.0f), pos, col);
      draw_list->AddCircleFilled(head, 8.0f, col);
      draw_list->AddCircle(head, 8.0f, IM_COL32(255, 255, 255, 220), 0, 1.5f);
      draw_list->AddCircleFilled(head, 3.0f, IM_COL32(255, 255, 255, 255));
    }
  }
}

auto map_view_t::render_popups(retained_surface_t &surface, const ImVec2 &canvas_p0) -> void
{
  for (const auto &marker : surface.markers())
  {
    if (!marker.popup_open)
      continue;

    ImVec2 pos = to_screen(surface, marker.spec.position, canvas_p0);
    auto window_id = std::format("##marker_popup_{}", marker.id);
    if (!render_popup_window(window_id.c_str(), ImVec2(pos.x, pos.y - 28.0f), marker.spec.popup))
      surface.toggle_marker_popup(marker.id);
  }

  if (auto popup = surface.popup())
  {
    ImVec2 pos = to_screen(surface, popup->anchor, canvas_p0);
    if (!render_popup_window("##map_popup", ImVec2(pos.x, pos.y - 6.0f), popup->content))
      surface.close_popup();
  }
}

auto map_view_t::render_scale_bar(const retained_surface_t &surface, ImDrawList *draw_list, const ImVec2 &canvas_p0, const ImVec2 &canvas_sz) -> void
{
  double feet_per_pixel = geo::meters_per_pixel(surface.center().lat, surface.zoom(), retained_surface_t::TILE_SIZE) * geo::FEET_PER_METER;
  if (!(feet_per_pixel > 0.0))
    return;

  // Approx 100px, rounded to 1/2/5 steps in feet or miles
  double target_feet = 100.0 * feet_per_pixel;
  const bool use_miles = target_feet >= 2640.0;
  double target = use_miles ? target_feet / 5280.0 : target_feet;

  double magnitude = std::pow(10.0, std::floor(std::log10(target)));
  double residual = target / magnitude;
  double rounded;
  if (residual > 5.0)
    rounded = 5.0 * magnitude;
  else if (residual > 2.0)
    rounded = 2.0 * magnitude;
  else
    rounded = magnitude;

  double rounded_feet = use_miles ? rounded * 5280.0 : rounded;
  float bar_width_px = static_cast<float>(rounded_feet / feet_per_pixel);

  ImVec2 bar_start(canvas_p0.x + canvas_sz.x - 20.0f - bar_width_px, canvas_p0.y + canvas_sz.y - 9.0f);
  ImVec2 bar_end(bar_start.x + bar_width_px, bar_start.y);

  draw_list->AddRectFilled(ImVec2(bar_start.x - 8, bar_start.y - 18), ImVec2(bar_end.x + 8, bar_start.y + 4), IM_COL32(30, 30, 30, 220), 4.0f);
  draw_list->AddLine(bar_start, bar_end, IM_COL32(255, 255, 255, 255), 2.0f);
  draw_list->AddLine(ImVec2(bar_start.x, bar_start.y - 6), bar_start, IM_COL32(255, 255, 255, 255), 2.0f);
  draw_list->AddLine(ImVec2(bar_end.x, bar_end.y - 6), bar_end, IM_COL32(255, 255, 255, 255), 2.0f);

  std::string label = use_miles ? std::format("{:g} mi", rounded) : std::format("{:.0f} ft", rounded);
  ImVec2 text_sz = ImGui::CalcTextSize(label.c_str());
  ImVec2 text_pos(bar_start.x + (bar_width_px - text_sz.x) * 0.5f, bar_start.y - text_sz.y - 2.0f);

  draw_list->AddText(ImVec2(text_pos.x + 1, text_pos.y + 1), IM_COL32(0, 0, 0, 255), label.c_str());
  draw_list->AddText(text_pos, IM_COL32(255, 255, 255, 255), label.c_str());
}

auto map_view_t::render_status(const map_canvas_t &canvas, const retained_surface_t &surface, ImDrawList *draw_list, const ImVec2 &canvas_p0) -> void
{
  std::string status = std::format("Zoom {:.1f}", surface.zoom());
  if (m_mouse_geo)
    status += std::format("  |  {:.6f}, {:.6f}", m_mouse_geo->lat, m_mouse_geo->lon);
  if (!surface.is_style_loaded())
    status += "  |  Loading basemap...";
  if (m_tiles.pending_count() > 0)
    status += std::format("  |  {} tiles loading", m_tiles.pending_count());

  const auto &props = canvas.get_props();
  const bool has_parcels = !is_empty(props.tax_parcels) || !is_empty(props.parcel_collection);
  if (has_parcels && surface.zoom() < props.parcel_min_zoom)
    status += std::format("  |  Zoom to {:.0f} to see parcels", props.parcel_min_zoom);

  ImVec2 text_sz = ImGui::CalcTextSize(status.c_str());
  ImVec2 pos(canvas_p0.x + 8.0f, canvas_p0.y + 8.0f);
  draw_list->AddRectFilled(ImVec2(pos.x - 4.0f, pos.y - 2.0f), ImVec2(pos.x + text_sz.x + 4.0f, pos.y + text_sz.y + 2.0f), IM_COL32(30, 30, 30, 200), 3.0f);
  draw_list->AddText(pos, IM_COL32(255, 255, 255, 255), status.c_str());
}

} // namespace site_mapper
