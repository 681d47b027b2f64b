#include "map/map_domains.hpp"
#include "core/popup_content.hpp"
#include <format>

namespace site_mapper
{
namespace domains
{

namespace
{

auto make_layer(std::string id, layer_kind_e kind, std::string source, paint_t paint, geometry_filter_e geometry = geometry_filter_e::Any,
                double min_zoom = 0.0) -> layer_spec_t
{
  layer_spec_t spec;
  spec.id = std::move(id);
  spec.kind = kind;
  spec.source = std::move(source);
  spec.paint = std::move(paint);
  spec.filter.geometry = geometry;
  spec.min_zoom = min_zoom;
  return spec;
}

auto fill_paint(color_t color, float opacity) -> paint_t
{
  paint_t paint;
  paint.color = color;
  paint.opacity = opacity;
  return paint;
}

auto line_paint(color_t color, float width, float opacity = 1.0f) -> paint_t
{
  paint_t paint;
  paint.color = color;
  paint.width = width;
  paint.opacity = opacity;
  return paint;
}

auto popup_binding(std::string layer_id, popup_content_t (*build)(const nlohmann::json &)) -> interaction_binding_t
{
  interaction_binding_t binding;
  binding.layer_id = std::move(layer_id);
  binding.action = interaction_e::Popup;
  binding.popup = [build](const rendered_feature_t &hit) { return build(hit.feature.properties); };
  return binding;
}

} // namespace

auto plan_parcels(const feature_collection_ptr &parcels) -> domain_plan_t
{
  domain_plan_t plan;
  plan.prefix = domain_ids::PLAN_PARCELS;

  const std::string src = "plan-parcels-src";
  plan.sources.push_back({src, parcels});
  plan.layers.push_back(make_layer("plan-parcels-fill", layer_kind_e::Fill, src, fill_paint(palette::PLAN_PARCELS, 0.15f)));
  plan.layers.push_back(make_layer("plan-parcels-line", layer_kind_e::Line, src, line_paint(palette::PLAN_PARCELS, 2.0f, 0.8f)));
  plan.bindings.push_back(popup_binding("plan-parcels-fill", &popups::plan_parcel));
  return plan;
}

auto project_boundary(const feature_collection_ptr &boundary, geo_position_t center) -> domain_plan_t
{
  domain_plan_t plan;
  plan.prefix = domain_ids::PROJECT_BOUNDARY;

  feature_t feature;
  if (!is_empty(boundary))
    feature = boundary->features.front();
  else
    feature.geometry = geometry_t::point(center);

  const std::string src = "project-boundary-src";
  plan.sources.push_back({src, make_collection({feature})});

  if (feature.geometry.is_polygonal())
  {
    plan.layers.push_back(make_layer("project-boundary-fill", layer_kind_e::Fill, src, fill_paint(palette::SITE_BOUNDARY, 0.05f)));

    auto outline = line_paint(palette::SITE_BOUNDARY, 3.0f, 0.9f);
    outline.dash = {4.0f, 3.0f};
    plan.layers.push_back(make_layer("project-boundary-line", layer_kind_e::Line, src, outline));
  }
  else
  {
    paint_t point;
    point.color = palette::SITE_BOUNDARY;
    point.width = 6.0f;
    point.outline_color = palette::SITE_BOUNDARY;
    point.outline_width = 2.0f;
    plan.layers.push_back(make_layer("project-boundary-point", layer_kind_e::Circle, src, point));
  }
  return plan;
}

auto tax_parcels(const feature_collection_ptr &parcels, const std::vector<std::string> &selected_ids, double min_zoom) -> domain_plan_t
{
  domain_plan_t plan;
  plan.prefix = domain_ids::TAX_PARCELS;

  const std::string src = "tax-parcels-src";
  plan.sources.push_back({src, parcels});

  auto fill = fill_paint(palette::TAX_PARCELS, 0.08f);
  fill.hover_opacity = 0.18f;
  plan.layers.push_back(make_layer("tax-parcels-fill", layer_kind_e::Fill, src, fill, geometry_filter_e::Any, min_zoom));
  plan.layers.push_back(make_layer("tax-parcels-line", layer_kind_e::Line, src, line_paint(palette::WHITE, 1.6f), geometry_filter_e::Any, min_zoom));

  std::vector<std::string> selected;
  for (const auto &id : selected_ids)
  {
    if (!id.empty())
      selected.push_back(id);
  }

  if (!selected.empty())
  {
    auto emphasis = [&](std::string id, layer_kind_e kind, paint_t paint)
    {
      auto spec = make_layer(std::move(id), kind, src, std::move(paint), geometry_filter_e::Any, min_zoom);
      spec.filter.property = "parcel_id";
      spec.filter.values = selected;
      plan.layers.push_back(std::move(spec));
    };
    emphasis("tax-parcels-selected-fill", layer_kind_e::Fill, fill_paint(palette::SITE_BOUNDARY, 0.3f));
    emphasis("tax-parcels-selected-highlight", layer_kind_e::Line, line_paint(palette::TAX_PARCELS, 3.2f));
    emphasis("tax-parcels-selected-line", layer_kind_e::Line, line_paint(palette::TAX_PARCELS, 2.0f));
  }

  interaction_binding_t binding;
  binding.layer_id = "tax-parcels-fill";
  binding.action = interaction_e::ParcelToggle;
  binding.hover_state = true;
  binding.popup = [](const rendered_feature_t &hit) { return popups::tax_parcel(hit.feature); };
  plan.bindings.push_back(std::move(binding));
  return plan;
}

auto reference_parcels(const parcel_buckets_t &buckets, double min_zoom, const std::vector<std::string> &id_fields) -> domain_plan_t
{
  domain_plan_t plan;
  plan.prefix = domain_ids::REFERENCE_PARCELS;

  struct bucket_style_t
  {
    const char *name;
    const std::vector<feature_t> *features;
    color_t fill;
    float fill_opacity;
    color_t stroke;
    float stroke_width;
  };

  // Neutral first so comp and subject emphasis paint above it
  const bucket_style_t styles[] = {
      {"all", &buckets.other, palette::NEUTRAL, 0.08f, palette::WHITE, 1.6f},
      {"comps", &buckets.comp, palette::COMP, 0.18f, palette::COMP, 2.2f},
      {"subject", &buckets.subject, palette::SUBJECT, 0.35f, palette::SUBJECT, 2.8f},
  };

  for (const auto &style : styles)
  {
    if (style.features->empty())
      continue;

    const std::string src = std::format("la-parcels-{}", style.name);
    plan.sources.push_back({src, make_collection(*style.features)});

    auto fill = fill_paint(style.fill, style.fill_opacity);
    fill.outline_color = style.stroke;
    plan.layers.push_back(make_layer(src + "-fill", layer_kind_e::Fill, src, fill, geometry_filter_e::Any, min_zoom));
    plan.layers.push_back(make_layer(src + "-line", layer_kind_e::Line, src, line_paint(style.stroke, style.stroke_width, 0.9f), geometry_filter_e::Any, min_zoom));

    interaction_binding_t binding;
    binding.layer_id = src + "-fill";
    binding.action = interaction_e::ParcelToggle;
    binding.popup = [](const rendered_feature_t &hit) { return popups::reference_parcel(hit.feature.properties); };
    binding.id_fields = id_fields.empty() ? DEFAULT_PARCEL_ID_FIELDS : id_fields;
    plan.bindings.push_back(std::move(binding));
  }
  return plan;
}

auto sale_comps(const feature_collection_ptr &comps) -> domain_plan_t
{
  domain_plan_t plan;
  plan.prefix = domain_ids::SALE_COMPS;

  const std::string src = "sale-comps-src";
  plan.sources.push_back({src, comps});

  auto fill = fill_paint(palette::SALE_COMPS, 0.25f);
  fill.color_property = "color";
  plan.layers.push_back(make_layer("sale-comps-fill", layer_kind_e::Fill, src, fill, geometry_filter_e::NotPoint));

  auto line = line_paint(palette::SALE_COMPS, 2.0f, 0.8f);
  line.color_property = "color";
  plan.layers.push_back(make_layer("sale-comps-line", layer_kind_e::Line, src, line, geometry_filter_e::NotPoint));

  plan.bindings.push_back(popup_binding("sale-comps-fill", &popups::sale_comp));
  return plan;
}

auto rent_comps(const feature_collection_ptr &comps) -> domain_plan_t
{
  domain_plan_t plan;
  plan.prefix = domain_ids::RENT_COMPS;
  plan.sources.push_back({"rent-comps-src", comps});
  return plan;
}

auto annotations(const std::vector<map_feature_t> &features, const std::string &selected_id) -> domain_plan_t
{
  domain_plan_t plan;
  plan.prefix = domain_ids::ANNOTATIONS;

  std::vector<feature_t> converted;
  converted.reserve(features.size());
  for (const auto &f : features)
  {
    feature_t feature;
    feature.id = f.id;
    feature.geometry = f.geometry;
    feature.properties = {{"id", f.id}, {"label", f.label}, {"category", f.category}, {"selected", !selected_id.empty() && f.id == selected_id}};
    converted.push_back(std::move(feature));
  }

  const std::string src = "user-features";
  plan.sources.push_back({src, make_collection(std::move(converted))});

  auto fill = fill_paint(palette::ANNOTATIONS, 0.2f);
  fill.selected_opacity = 0.4f;
  plan.layers.push_back(make_layer("user-features-fill", layer_kind_e::Fill, src, fill, geometry_filter_e::Polygon));

  auto line = line_paint(palette::ANNOTATIONS, 2.0f);
  line.selected_width = 3.0f;
  plan.layers.push_back(make_layer("user-features-line", layer_kind_e::Line, src, line, geometry_filter_e::LineOrPolygon));

  paint_t point;
  point.color = palette::ANNOTATIONS;
  point.width = 8.0f;
  point.selected_width = 10.0f;
  point.outline_color = palette::WHITE;
  point.outline_width = 2.0f;
  plan.layers.push_back(make_layer("user-features-point", layer_kind_e::Circle, src, point, geometry_filter_e::Point));

  for (const char *layer_id : {"user-features-fill", "user-features-point"})
  {
    interaction_binding_t binding;
    binding.layer_id = layer_id;
    binding.action = interaction_e::FeatureClick;
    plan.bindings.push_back(std::move(binding));
  }
  return plan;
}

auto demographic_rings(const std::vector<demographic_ring_t> &rings) -> domain_plan_t
{
  domain_plan_t plan;
  plan.prefix = domain_ids::RINGS;

  for (const auto &ring : rings)
  {
    const auto src = ring_source_id(ring.radius_miles);
    plan.sources.push_back({src, make_collection({ring.feature})});

    plan.layers.push_back(make_layer(src + "-fill", layer_kind_e::Fill, src, fill_paint(ring.color, ring.fill_opacity)));
    // White halo keeps the outline readable over aerial imagery
    plan.layers.push_back(make_layer(src + "-stroke-white", layer_kind_e::Line, src, line_paint(palette::WHITE, ring.halo_width)));
    plan.layers.push_back(make_layer(src + "-stroke", layer_kind_e::Line, src, line_paint(palette::BLACK, ring.line_width)));

    interaction_binding_t binding;
    binding.layer_id = src + "-fill";
    binding.action = interaction_e::RingClick;
    binding.ring_radius = ring.radius_miles;
    plan.bindings.push_back(std::move(binding));
  }

  plan.raise = {"user-features-fill", "user-features-line", "user-features-point", "sale-comps-fill",
                "sale-comps-line",    "draw-feedback-fill", "draw-feedback-line",  "draw-feedback-vertex"};
  return plan;
}

auto draw_feedback(const feature_collection_ptr &feedback) -> domain_plan_t
{
  domain_plan_t plan;
  plan.prefix = domain_ids::DRAW_FEEDBACK;

  const std::string src = "draw-feedback";
  plan.sources.push_back({src, feedback});
  plan.layers.push_back(make_layer("draw-feedback-fill", layer_kind_e::Fill, src, fill_paint(palette::DRAW_FEEDBACK, 0.3f), geometry_filter_e::Polygon));
  plan.layers.push_back(make_layer("draw-feedback-line", layer_kind_e::Line, src, line_paint(palette::DRAW_FEEDBACK, 3.0f), geometry_filter_e::LineOrPolygon));

  paint_t vertex;
  vertex.color = palette::WHITE;
  vertex.width = 6.0f;
  vertex.outline_color = palette::DRAW_FEEDBACK;
  vertex.outline_width = 2.0f;
  plan.layers.push_back(make_layer("draw-feedback-vertex", layer_kind_e::Circle, src, vertex, geometry_filter_e::Point));
  return plan;
}

} // namespace domains
} // namespace site_mapper
