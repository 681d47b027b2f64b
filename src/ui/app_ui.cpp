#include "ui/app_ui.hpp"
#include "core/basemaps.hpp"
#include "core/popup_content.hpp"
#include "map/map_domains.hpp"
#include "imgui.h"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <format>
#include <iostream>

namespace site_mapper
{

namespace
{

auto load_data(const std::string &path, const char *what) -> feature_collection_ptr
{
  if (path.empty())
    return nullptr;

  feature_collection_t collection;
  if (!geojson::load_collection(path, collection))
  {
    std::cerr << "Workspace: could not load " << what << " from " << path << std::endl;
    return nullptr;
  }
  return make_collection(std::move(collection.features));
}

auto count_of(const feature_collection_ptr &collection) -> std::optional<size_t>
{
  if (!collection)
    return std::nullopt;
  return collection->size();
}

auto next_annotation_id(app_state_t &state) -> std::string
{
  for (;;)
  {
    auto id = std::format("feature-{}", state.next_annotation++);
    auto taken = std::any_of(state.props.features.begin(), state.props.features.end(), [&](const map_feature_t &f) { return f.id == id; });
    if (!taken)
      return id;
  }
}

auto default_label(const geometry_t &geometry) -> const char *
{
  if (geometry.is_point_like())
    return "Point";
  if (geometry.is_linear())
    return "Line";
  return "Area";
}

} // namespace

void AppUI::setup_style()
{
  ImGuiStyle &style = ImGui::GetStyle();
  ImVec4 *colors = style.Colors;

  // Dark theme with a green accent
  colors[ImGuiCol_Text] = ImVec4(0.92f, 0.92f, 0.92f, 1.00f);
  colors[ImGuiCol_TextDisabled] = ImVec4(0.55f, 0.55f, 0.55f, 1.00f);
  colors[ImGuiCol_WindowBg] = ImVec4(0.10f, 0.11f, 0.12f, 1.00f);
  colors[ImGuiCol_PopupBg] = ImVec4(0.12f, 0.13f, 0.14f, 0.96f);
  colors[ImGuiCol_Border] = ImVec4(0.25f, 0.26f, 0.27f, 0.50f);
  colors[ImGuiCol_FrameBg] = ImVec4(0.17f, 0.18f, 0.19f, 1.00f);
  colors[ImGuiCol_FrameBgHovered] = ImVec4(0.23f, 0.24f, 0.25f, 1.00f);
  colors[ImGuiCol_FrameBgActive] = ImVec4(0.29f, 0.30f, 0.31f, 1.00f);
  colors[ImGuiCol_TitleBg] = ImVec4(0.07f, 0.08f, 0.08f, 1.00f);
  colors[ImGuiCol_TitleBgActive] = ImVec4(0.07f, 0.08f, 0.08f, 1.00f);
  colors[ImGuiCol_MenuBarBg] = ImVec4(0.10f, 0.11f, 0.12f, 1.00f);
  colors[ImGuiCol_CheckMark] = ImVec4(0.13f, 0.77f, 0.37f, 1.00f);
  colors[ImGuiCol_SliderGrab] = ImVec4(0.13f, 0.66f, 0.33f, 1.00f);
  colors[ImGuiCol_SliderGrabActive] = ImVec4(0.13f, 0.77f, 0.37f, 1.00f);
  colors[ImGuiCol_Button] = ImVec4(0.19f, 0.20f, 0.21f, 1.00f);
  colors[ImGuiCol_ButtonHovered] = ImVec4(0.27f, 0.28f, 0.29f, 1.00f);
  colors[ImGuiCol_ButtonActive] = ImVec4(0.10f, 0.55f, 0.28f, 1.00f);
  colors[ImGuiCol_Header] = ImVec4(0.19f, 0.20f, 0.21f, 1.00f);
  colors[ImGuiCol_HeaderHovered] = ImVec4(0.25f, 0.26f, 0.27f, 1.00f);
  colors[ImGuiCol_HeaderActive] = ImVec4(0.13f, 0.66f, 0.33f, 1.00f);
  colors[ImGuiCol_Tab] = ImVec4(0.10f, 0.11f, 0.12f, 0.86f);
  colors[ImGuiCol_TabHovered] = ImVec4(0.13f, 0.66f, 0.33f, 0.80f);
  colors[ImGuiCol_TabActive] = ImVec4(0.19f, 0.20f, 0.21f, 1.00f);
  colors[ImGuiCol_ModalWindowDimBg] = ImVec4(0.05f, 0.05f, 0.05f, 0.45f);

  style.WindowRounding = 6.0f;
  style.FrameRounding = 4.0f;
  style.GrabRounding = 4.0f;
  style.PopupRounding = 6.0f;
  style.TabRounding = 4.0f;

  style.WindowPadding = ImVec2(10.0f, 10.0f);
  style.FramePadding = ImVec2(6.0f, 4.0f);
  style.ItemSpacing = ImVec2(8.0f, 6.0f);
}

map_callbacks_t AppUI::make_callbacks(app_state_t &state)
{
  map_callbacks_t callbacks;

  callbacks.on_viewport_change = [&state](const view_state_t &view) { state.view = view; };

  callbacks.on_map_click = [&state](geo_position_t position) { state.status = std::format("Map click at {:.6f}, {:.6f}", position.lat, position.lon); };

  callbacks.on_feature_click = [&state](const map_feature_t &feature)
  {
    auto &props = state.props;
    if (props.active_tool == active_tool_e::Delete)
    {
      std::erase_if(props.features, [&](const map_feature_t &f) { return f.id == feature.id; });
      if (props.selected_feature_id == feature.id)
        props.selected_feature_id.clear();
      props.layers.set_item_count(layer_ids::DRAWN_SHAPES, props.features.size());
      state.status = std::format("Deleted {}", feature.label.empty() ? feature.id : feature.label);
    }
    else
    {
      props.selected_feature_id = feature.id;
      state.status = std::format("Selected {}", feature.label.empty() ? feature.id : feature.label);
    }
    state.dirty = true;
  };

  callbacks.on_parcel_toggle = [&state](const feature_t &feature)
  {
    // The router resolves the parcel identifier into the feature id
    auto id = feature.id.empty() ? popups::tax_parcel_id(feature) : feature.id;
    if (id.empty())
      return;

    auto &selected = state.props.selected_tax_parcel_ids;
    auto it = std::find(selected.begin(), selected.end(), id);
    if (it != selected.end())
    {
      selected.erase(it);
      state.status = std::format("Parcel {} deselected", id);
    }
    else
    {
      selected.push_back(id);
      state.status = std::format("Parcel {} selected", id);
    }
    state.dirty = true;
  };

  callbacks.on_ring_click = [&state](double radius_miles, geo_position_t)
  {
    auto &props = state.props;
    props.selected_ring_radius = props.selected_ring_radius == radius_miles ? 0.0 : radius_miles;
    state.status = std::format("{:g} mile ring {}", radius_miles, props.selected_ring_radius > 0.0 ? "selected" : "cleared");
    state.dirty = true;
  };

  callbacks.on_draw_complete = [&state](const drawn_feature_t &drawn)
  {
    state.pending_drawn = drawn;
    state.status = draw_session_t::describe(drawn);
  };

  return callbacks;
}

bool AppUI::load_workspace(app_state_t &state)
{
  persistence::workspace_t ws;
  if (!persistence::load_workspace(state.workspace_file, ws))
    return false;
  state.workspace = ws;

  auto &props = state.props;
  props.viewport.center = ws.center();
  props.viewport.zoom = ws.project.zoom;
  props.viewport.basemap = basemaps::find(ws.project.basemap) ? ws.project.basemap : DEFAULT_BASEMAP;

  props.layers = layer_tree_t::make_default();
  persistence::apply_layers(ws, props.layers);

  props.parcel_subject_id = ws.parcels.subject_id;
  props.parcel_comp_ids = ws.parcels.comp_ids;
  props.parcel_id_fields = ws.parcels.id_fields;
  props.parcel_min_zoom = ws.parcels.min_zoom;

  props.ring_radii = ws.rings.radii_miles;
  props.selected_ring_radius = ws.rings.selected_miles;

  props.plan_parcels = load_data(ws.data.plan_parcels, "plan parcels");
  props.project_boundary = load_data(ws.data.project_boundary, "project boundary");
  props.tax_parcels = load_data(ws.data.tax_parcels, "tax parcels");
  props.sale_comps = load_data(ws.data.sale_comps, "sale comps");
  props.rent_comps = load_data(ws.data.rent_comps, "rent comps");
  props.parcel_collection = load_data(ws.data.reference_parcels, "reference parcels");

  props.layers.set_item_count(layer_ids::PLAN_PARCELS, count_of(props.plan_parcels));
  props.layers.set_item_count(layer_ids::TAX_PARCELS, count_of(props.tax_parcels));
  props.layers.set_item_count(layer_ids::SALE_COMPS, count_of(props.sale_comps));
  props.layers.set_item_count(layer_ids::RENT_COMPS, count_of(props.rent_comps));
  props.layers.set_item_count(layer_ids::PARCEL_OVERLAY, count_of(props.parcel_collection));

  props.features.clear();
  props.selected_feature_id.clear();
  props.selected_tax_parcel_ids.clear();
  if (!ws.data.annotations.empty() && !persistence::load_annotations(ws.data.annotations, props.features))
    std::cerr << "Workspace: could not load annotations from " << ws.data.annotations << std::endl;
  props.layers.set_item_count(layer_ids::DRAWN_SHAPES, props.features.size());

  state.status = std::format("Loaded {}", state.workspace_file);
  state.dirty = true;
  return true;
}

bool AppUI::save_workspace(app_state_t &state)
{
  auto &ws = state.workspace;
  const auto &props = state.props;

  ws.project.lat = props.viewport.center.lat;
  ws.project.lon = props.viewport.center.lon;
  ws.project.zoom = state.view ? state.view->zoom : props.viewport.zoom;
  ws.project.basemap = props.viewport.basemap;

  ws.parcels.subject_id = props.parcel_subject_id;
  ws.parcels.comp_ids = props.parcel_comp_ids;
  ws.parcels.id_fields = props.parcel_id_fields;
  ws.parcels.min_zoom = props.parcel_min_zoom;

  ws.rings.radii_miles = props.ring_radii;
  ws.rings.selected_miles = props.selected_ring_radius;

  persistence::capture_layers(props.layers, ws);

  bool ok = persistence::save_workspace(state.workspace_file, ws);

  state.status = ok ? std::format("Saved {}", state.workspace_file) : std::string("Save failed, see log");
  return ok;
}

void AppUI::render(map_canvas_t &canvas, map_view_t &view, app_state_t &state, std::function<void()> on_exit)
{
  ImGui::DockSpaceOverViewport(0, ImGui::GetMainViewport());

  render_main_menu(view, state, on_exit);
  handle_shortcuts(canvas, state);

  if (m_show_layers)
  {
    ImGui::SetNextWindowSize(ImVec2(320, 520), ImGuiCond_FirstUseEver);
    if (ImGui::Begin("Layers", &m_show_layers))
      render_layers(canvas, state);
    ImGui::End();
  }

  if (m_show_tools)
  {
    ImGui::SetNextWindowSize(ImVec2(320, 360), ImGuiCond_FirstUseEver);
    if (ImGui::Begin("Tools", &m_show_tools))
      render_tools(canvas, state);
    ImGui::End();
  }

  if (m_show_inspector)
  {
    ImGui::SetNextWindowSize(ImVec2(320, 360), ImGuiCond_FirstUseEver);
    if (ImGui::Begin("Inspector", &m_show_inspector))
      render_inspector(canvas, state);
    ImGui::End();
  }

  if (m_show_map_view)
  {
    ImGui::SetNextWindowSize(ImVec2(900, 650), ImGuiCond_FirstUseEver);
    // Edge-to-edge map
    ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(0, 0));
    if (ImGui::Begin("Map View", &m_show_map_view))
      view.draw(canvas);
    ImGui::End();
    ImGui::PopStyleVar();
  }

  render_save_annotation(state);
}

void AppUI::render_main_menu(map_view_t &view, app_state_t &state, std::function<void()> on_exit)
{
  if (!ImGui::BeginMainMenuBar())
    return;

  if (ImGui::BeginMenu("File"))
  {
    if (ImGui::MenuItem("Save Workspace", "Ctrl+S"))
      save_workspace(state);

    if (ImGui::MenuItem("Reload Workspace"))
    {
      if (!load_workspace(state))
        state.status = std::format("Could not load {}", state.workspace_file);
    }

    ImGui::Separator();

    if (ImGui::MenuItem("Clear Annotations", nullptr, false, !state.props.features.empty()))
    {
      state.props.features.clear();
      state.props.selected_feature_id.clear();
      state.props.layers.set_item_count(layer_ids::DRAWN_SHAPES, size_t{0});
      state.dirty = true;
    }

    ImGui::Separator();
    if (ImGui::MenuItem("Exit", "Alt+F4"))
    {
      if (on_exit)
        on_exit();
    }
    ImGui::EndMenu();
  }

  if (ImGui::BeginMenu("View"))
  {
    ImGui::MenuItem("Layers", nullptr, &m_show_layers);
    ImGui::MenuItem("Tools", nullptr, &m_show_tools);
    ImGui::MenuItem("Inspector", nullptr, &m_show_inspector);
    ImGui::MenuItem("Map View", nullptr, &m_show_map_view);
    ImGui::Separator();

    bool show_grid = view.get_show_tile_grid();
    if (ImGui::MenuItem("Tile Grid", nullptr, &show_grid))
      view.set_show_tile_grid(show_grid);

    if (ImGui::MenuItem("Clear Tile Cache"))
      view.get_tile_service().clear();
    ImGui::EndMenu();
  }

  if (!state.status.empty())
  {
    ImGui::Separator();
    ImGui::TextDisabled("%s", state.status.c_str());
  }

  ImGui::EndMainMenuBar();
}

void AppUI::render_layers(map_canvas_t &canvas, app_state_t &state)
{
  auto &props = state.props;

  // --- Basemap ---
  const auto *current = basemaps::find(props.viewport.basemap);
  if (ImGui::BeginCombo("Basemap", current ? current->label.c_str() : props.viewport.basemap.c_str()))
  {
    for (const auto &entry : basemaps::catalog())
    {
      bool is_selected = current && current->id == entry.id;
      if (ImGui::Selectable(entry.label.c_str(), is_selected))
      {
        props.viewport.basemap = entry.id;
        state.dirty = true;
      }
      if (is_selected)
        ImGui::SetItemDefaultFocus();
    }
    ImGui::EndCombo();
  }

  if (!canvas.get_controller().is_ready())
    ImGui::TextDisabled("Loading basemap...");

  ImGui::Separator();

  // --- Layer tree ---
  for (const auto &group : props.layers.get_groups())
  {
    ImGui::PushID(group.id.c_str());

    bool group_visible = group.visible;
    if (ImGui::Checkbox("##group", &group_visible))
    {
      props.layers.set_group_visible(group.id, group_visible);
      state.dirty = true;
    }
    ImGui::SameLine();

    ImGuiTreeNodeFlags flags = group.expanded ? ImGuiTreeNodeFlags_DefaultOpen : ImGuiTreeNodeFlags_None;
    if (ImGui::TreeNodeEx(group.label.c_str(), flags))
    {
      ImGui::BeginDisabled(!group.visible);
      for (const auto &item : group.items)
      {
        bool item_visible = item.visible;
        auto label = item.count ? std::format("{} ({})", item.label, *item.count) : item.label;
        if (ImGui::Checkbox(label.c_str(), &item_visible))
        {
          props.layers.set_item_visible(item.id, item_visible);
          state.dirty = true;
        }
      }
      ImGui::EndDisabled();
      ImGui::TreePop();
    }
    ImGui::PopID();
  }

  ImGui::Separator();

  // --- Parcels ---
  float min_zoom = static_cast<float>(props.parcel_min_zoom);
  if (ImGui::SliderFloat("Parcel min zoom", &min_zoom, 10.0f, 20.0f, "%.0f"))
  {
    props.parcel_min_zoom = std::round(min_zoom);
    state.dirty = true;
  }

  // --- Demographic rings ---
  ImGui::TextDisabled("Demographic rings");
  if (ImGui::RadioButton("None", props.selected_ring_radius <= 0.0))
  {
    props.selected_ring_radius = 0.0;
    state.dirty = true;
  }
  for (double radius : props.ring_radii)
  {
    ImGui::SameLine();
    auto label = std::format("{:g} mi", radius);
    if (ImGui::RadioButton(label.c_str(), props.selected_ring_radius == radius))
    {
      props.selected_ring_radius = radius;
      state.dirty = true;
    }
  }

  ImGui::Separator();

  // --- Project center ---
  double lat = props.viewport.center.lat;
  double lon = props.viewport.center.lon;
  bool lat_changed = ImGui::InputDouble("Latitude", &lat, 0.0, 0.0, "%.6f");
  bool lon_changed = ImGui::InputDouble("Longitude", &lon, 0.0, 0.0, "%.6f");
  if (lat_changed || lon_changed)
  {
    props.viewport.center = resolve_project_center(lat, lon);
    state.dirty = true;
  }

  if (ImGui::Button("Recenter on Project"))
  {
    props.viewport.center = state.workspace.center();
    // Same center as before still has to move the camera back
    if (auto *surface = canvas.surface())
      surface->jump_to(props.viewport.center);
    state.dirty = true;
  }
}

void AppUI::render_tools(map_canvas_t &canvas, app_state_t &state)
{
  auto &props = state.props;

  struct tool_entry_t
  {
    active_tool_e tool;
    const char *label;
  };
  static const tool_entry_t tools[] = {{active_tool_e::None, "Pan"},   {active_tool_e::Point, "Point"}, {active_tool_e::Line, "Line"},
                                       {active_tool_e::Polygon, "Area"}, {active_tool_e::Edit, "Edit"},   {active_tool_e::Delete, "Delete"}};

  for (size_t i = 0; i < std::size(tools); ++i)
  {
    if (i > 0 && i % 3 != 0)
      ImGui::SameLine();
    if (ImGui::RadioButton(tools[i].label, props.active_tool == tools[i].tool))
    {
      props.active_tool = tools[i].tool;
      state.dirty = true;
    }
  }

  auto &draw = canvas.get_draw_session();
  if (draw.is_active())
  {
    ImGui::Separator();
    ImGui::Text("Vertices: %zu", draw.get_vertices().size());

    if (auto measurement = draw.live_measurement())
    {
      auto text = draw_session_t::describe(*measurement);
      if (!text.empty())
        ImGui::TextColored(ImVec4(0.13f, 0.77f, 0.37f, 1.0f), "%s", text.c_str());
    }

    ImGui::BeginDisabled(!draw.can_finish());
    if (ImGui::Button("Finish"))
      draw.finish();
    ImGui::EndDisabled();
    ImGui::SameLine();
    ImGui::BeginDisabled(draw.get_vertices().empty());
    if (ImGui::Button("Undo"))
      draw.undo_vertex();
    ImGui::EndDisabled();
    ImGui::SameLine();
    if (ImGui::Button("Cancel"))
    {
      props.active_tool = active_tool_e::None;
      state.dirty = true;
    }
    ImGui::TextDisabled("Double click or Enter finishes, right click undoes");
  }
  else if (props.active_tool == active_tool_e::Delete)
  {
    ImGui::TextDisabled("Click an annotation to delete it");
  }

  ImGui::Separator();
  ImGui::TextDisabled("Annotations");

  if (ImGui::BeginListBox("##annotations", ImVec2(-FLT_MIN, 6 * ImGui::GetTextLineHeightWithSpacing())))
  {
    for (const auto &feature : props.features)
    {
      ImGui::PushID(feature.id.c_str());
      bool is_selected = props.selected_feature_id == feature.id;
      auto label = std::format("{} ({})", feature.label.empty() ? feature.id : feature.label, feature.category);
      if (ImGui::Selectable(label.c_str(), is_selected))
      {
        props.selected_feature_id = is_selected ? std::string() : feature.id;
        state.dirty = true;
      }
      ImGui::PopID();
    }
    ImGui::EndListBox();
  }

  auto it = std::find_if(props.features.begin(), props.features.end(), [&](const map_feature_t &f) { return f.id == props.selected_feature_id; });
  if (it == props.features.end())
    return;

  char label_buffer[128];
  snprintf(label_buffer, sizeof(label_buffer), "%s", it->label.c_str());
  if (ImGui::InputText("Label", label_buffer, sizeof(label_buffer)))
  {
    it->label = label_buffer;
    state.dirty = true;
  }

  char category_buffer[64];
  snprintf(category_buffer, sizeof(category_buffer), "%s", it->category.c_str());
  if (ImGui::InputText("Category", category_buffer, sizeof(category_buffer)))
  {
    it->category = category_buffer;
    state.dirty = true;
  }

  auto measured = draw_session_t::describe(draw_session_t::measure(it->geometry));
  if (!measured.empty())
    ImGui::Text("%s", measured.c_str());

  if (ImGui::Button("Delete Annotation"))
  {
    props.features.erase(it);
    props.selected_feature_id.clear();
    props.layers.set_item_count(layer_ids::DRAWN_SHAPES, props.features.size());
    state.dirty = true;
  }
}

void AppUI::render_inspector(map_canvas_t &canvas, app_state_t &state)
{
  const auto &props = state.props;

  if (state.view)
  {
    const auto &view = *state.view;
    ImGui::Text("Center: %.6f, %.6f", view.center.lat, view.center.lon);
    ImGui::Text("Zoom: %.2f", view.zoom);
    ImGui::Text("Bounds: %.5f, %.5f / %.5f, %.5f", view.bounds.south_west.lat, view.bounds.south_west.lon, view.bounds.north_east.lat,
                view.bounds.north_east.lon);
  }
  else
  {
    ImGui::TextDisabled("Map not settled yet");
  }

  ImGui::Separator();

  if (ImGui::CollapsingHeader("Selected Tax Parcels", ImGuiTreeNodeFlags_DefaultOpen))
  {
    if (props.selected_tax_parcel_ids.empty())
      ImGui::TextDisabled("Click a tax parcel to select it");
    for (const auto &id : props.selected_tax_parcel_ids)
      ImGui::BulletText("%s", id.c_str());

    if (!props.selected_tax_parcel_ids.empty() && ImGui::SmallButton("Clear Selection"))
    {
      state.props.selected_tax_parcel_ids.clear();
      state.dirty = true;
    }
  }

  if (ImGui::CollapsingHeader("Reference Parcels"))
  {
    const auto &buckets = canvas.get_parcel_buckets();
    ImGui::Text("Subject: %zu", buckets.subject.size());
    ImGui::Text("Comps: %zu", buckets.comp.size());
    ImGui::Text("Other: %zu", buckets.other.size());
    ImGui::TextDisabled("Subject APN: %s", props.parcel_subject_id.empty() ? "-" : props.parcel_subject_id.c_str());
  }

  if (ImGui::CollapsingHeader("Map Domains"))
  {
    const char *prefixes[] = {domain_ids::PLAN_PARCELS, domain_ids::PROJECT_BOUNDARY, domain_ids::TAX_PARCELS, domain_ids::REFERENCE_PARCELS,
                              domain_ids::SALE_COMPS,   domain_ids::RENT_COMPS,       domain_ids::ANNOTATIONS, domain_ids::RINGS,
                              domain_ids::DRAW_FEEDBACK};

    if (ImGui::BeginTable("##domains", 2, ImGuiTableFlags_RowBg | ImGuiTableFlags_SizingStretchProp))
    {
      for (const auto *prefix : prefixes)
      {
        auto result = canvas.last_result(prefix);
        ImGui::TableNextRow();
        ImGui::TableSetColumnIndex(0);
        ImGui::TextUnformatted(prefix);
        ImGui::TableSetColumnIndex(1);
        ImGui::TextUnformatted(result ? reconcile_result_name(*result) : "-");
      }
      ImGui::EndTable();
    }

    ImGui::Text("Style revision: %llu", static_cast<unsigned long long>(canvas.get_controller().get_revision()));
    ImGui::Text("Markers: %zu sale, %zu rent", canvas.get_markers().count(marker_domains::SALE_COMPS), canvas.get_markers().count(marker_domains::RENT_COMPS));

    if (const auto *surface = dynamic_cast<const retained_surface_t *>(canvas.surface()))
    {
      const auto &stats = surface->get_stats();
      ImGui::Text("Listeners: %zu", surface->listener_count());
      ImGui::Text("Sources: %zu live, %zu added, %zu removed", surface->source_ids().size(), stats.sources_added, stats.sources_removed);
      ImGui::Text("Layers: %zu live, %zu added, %zu removed", surface->layer_ids().size(), stats.layers_added, stats.layers_removed);
      ImGui::Text("Style loads: %zu", stats.style_loads);
    }
  }
}

void AppUI::render_save_annotation(app_state_t &state)
{
  if (state.pending_drawn && !ImGui::IsPopupOpen("Save Annotation"))
  {
    snprintf(m_label_buffer, sizeof(m_label_buffer), "%s %zu", default_label(state.pending_drawn->geometry), state.props.features.size() + 1);
    ImGui::OpenPopup("Save Annotation");
  }

  if (!ImGui::BeginPopupModal("Save Annotation", nullptr, ImGuiWindowFlags_AlwaysAutoResize))
    return;

  if (state.pending_drawn)
  {
    auto text = draw_session_t::describe(*state.pending_drawn);
    if (!text.empty())
      ImGui::Text("%s", text.c_str());
  }

  ImGui::InputText("Label", m_label_buffer, sizeof(m_label_buffer));
  ImGui::InputText("Category", m_category_buffer, sizeof(m_category_buffer));

  bool close = false;
  if (ImGui::Button("Save") && state.pending_drawn)
  {
    map_feature_t feature;
    feature.id = next_annotation_id(state);
    feature.geometry = state.pending_drawn->geometry;
    feature.label = m_label_buffer;
    feature.category = m_category_buffer;
    state.props.features.push_back(feature);
    state.props.selected_feature_id = feature.id;
    state.props.layers.set_item_count(layer_ids::DRAWN_SHAPES, state.props.features.size());
    state.status = std::format("{} saved", feature.label);
    close = true;
  }
  ImGui::SameLine();
  if (ImGui::Button("Discard"))
    close = true;

  if (close || !state.pending_drawn)
  {
    state.pending_drawn.reset();
    state.props.active_tool = active_tool_e::None;
    state.dirty = true;
    ImGui::CloseCurrentPopup();
  }
  ImGui::EndPopup();
}

void AppUI::handle_shortcuts(map_canvas_t &canvas, app_state_t &state)
{
  ImGuiIO &io = ImGui::GetIO();
  if (io.WantTextInput)
    return;

  if (io.KeyCtrl && ImGui::IsKeyPressed(ImGuiKey_S, false))
    save_workspace(state);

  auto &draw = canvas.get_draw_session();
  if (ImGui::IsKeyPressed(ImGuiKey_Escape, false) && state.props.active_tool != active_tool_e::None)
  {
    state.props.active_tool = active_tool_e::None;
    state.dirty = true;
  }
  if (ImGui::IsKeyPressed(ImGuiKey_Enter, false) && draw.can_finish())
    draw.finish();
  if (ImGui::IsKeyPressed(ImGuiKey_Backspace, true) && draw.is_active())
    draw.undo_vertex();
}

} // namespace site_mapper
