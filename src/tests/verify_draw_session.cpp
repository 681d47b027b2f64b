#include "../map/draw_session.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

using namespace site_mapper;

void test_point_tool()
{
  std::cout << "Testing point tool..." << std::endl;
  draw_session_t draw;
  std::vector<std::string> completed;
  draw.set_on_complete([&](const drawn_feature_t &drawn) { completed.push_back(drawn.id); });

  assert(!draw.add_vertex({1.0, 1.0}));
  draw.begin(active_tool_e::Point);
  assert(draw.is_active());

  auto first = draw.add_vertex({-111.6, 33.28});
  assert(first && first->id == "draw-1");
  assert(first->geometry.is_point_like());
  assert(!first->length_ft && !first->area_sqft);
  assert(draw_session_t::describe(*first).empty());

  auto second = draw.add_vertex({-111.61, 33.29});
  assert(second && second->id == "draw-2");
  assert(completed.size() == 2 && completed[1] == "draw-2");
  assert(draw.get_tool() == active_tool_e::Point);
}

void test_line_tool()
{
  std::cout << "Testing line tool..." << std::endl;
  draw_session_t draw;
  draw.begin(active_tool_e::Line);

  assert(!draw.add_vertex({0.0, 0.0}));
  assert(!draw.can_finish());
  assert(!draw.finish());

  // Repeated clicks on the same spot are dropped
  draw.add_vertex({0.0, 0.0});
  assert(draw.get_vertices().size() == 1);

  auto before = draw.get_feedback();
  draw.add_vertex({0.01, 0.0});
  assert(draw.get_feedback() != before);
  assert(draw.can_finish());

  // One shape plus one point per vertex
  assert(draw.get_feedback()->size() == 3);
  assert(draw.get_feedback()->features[0].id == "draw-shape");
  assert(draw.get_feedback()->features[2].id == "draw-vertex-1");

  auto live = draw.live_measurement();
  assert(live && live->length_ft);

  auto drawn = draw.finish();
  assert(drawn);
  std::cout << "  " << draw_session_t::describe(*drawn) << std::endl;
  assert(*drawn->length_ft == 3648.0);
  assert(std::abs(*drawn->length_miles - 0.691) < 0.001);
  assert(draw_session_t::describe(*drawn) == "3,648 ft (0.69 mi)");

  // Still armed, vertices cleared
  assert(draw.get_tool() == active_tool_e::Line);
  assert(draw.get_vertices().empty());
  assert(draw.get_feedback()->empty());
}

void test_polygon_tool()
{
  std::cout << "Testing polygon tool..." << std::endl;
  draw_session_t draw;
  draw.begin(active_tool_e::Polygon);
  draw.add_vertex({0.0, 0.0});
  draw.add_vertex({0.001, 0.0});
  assert(!draw.can_finish());
  draw.add_vertex({0.001, 0.001});
  draw.add_vertex({0.0, 0.001});
  assert(draw.can_finish());

  assert(draw.undo_vertex());
  assert(draw.get_vertices().size() == 3);
  draw.add_vertex({0.0, 0.001});

  auto drawn = draw.finish();
  assert(drawn && drawn->id == "draw-1");
  assert(drawn->geometry.type == geometry_type_e::Polygon);

  // The ring is closed
  const auto &ring = drawn->geometry.parts.front().front();
  assert(ring.size() == 5 && ring.front() == ring.back());

  std::cout << "  " << draw_session_t::describe(*drawn) << std::endl;
  assert(std::abs(*drawn->area_sqft - 133087.0) < 600.0);
  assert(std::abs(*drawn->area_acres - *drawn->area_sqft / 43560.0) < 1e-9);
  assert(*drawn->perimeter_ft > 1400.0 && *drawn->perimeter_ft < 1470.0);
  assert(!drawn->length_ft);

  auto text = draw_session_t::describe(*drawn);
  assert(text.find(" acres (") != std::string::npos);
  assert(text.find(" sq ft)") != std::string::npos);
}

void test_describe()
{
  std::cout << "Testing measurement text..." << std::endl;
  drawn_feature_t area;
  area.area_sqft = 12345.0;
  area.area_acres = 12345.0 / 43560.0;
  assert(draw_session_t::describe(area) == "0.28 acres (12,345 sq ft)");

  drawn_feature_t line;
  line.length_ft = 1234567.0;
  line.length_miles = 1234567.0 / 5280.0;
  assert(draw_session_t::describe(line) == "1,234,567 ft (233.82 mi)");

  drawn_feature_t short_line;
  short_line.length_ft = 12.0;
  short_line.length_miles = 12.0 / 5280.0;
  assert(draw_session_t::describe(short_line) == "12 ft (0.00 mi)");
}

void test_cancel()
{
  std::cout << "Testing cancel and tool changes..." << std::endl;
  draw_session_t draw;
  draw.begin(active_tool_e::Polygon);
  draw.add_vertex({0.0, 0.0});
  draw.add_vertex({1.0, 0.0});

  // Same tool keeps the vertices
  draw.begin(active_tool_e::Polygon);
  assert(draw.get_vertices().size() == 2);

  draw.begin(active_tool_e::Line);
  assert(draw.get_vertices().empty());

  draw.add_vertex({0.0, 0.0});
  draw.add_vertex({std::numeric_limits<double>::quiet_NaN(), 0.0});
  assert(draw.get_vertices().size() == 1);

  draw.begin(active_tool_e::Edit);
  assert(!draw.is_active());
  assert(draw.get_vertices().empty());
  assert(draw.get_feedback()->empty());
  assert(!draw.undo_vertex());
}

int main()
{
  test_point_tool();
  test_line_tool();
  test_polygon_tool();
  test_describe();
  test_cancel();
  std::cout << "Draw Session Verification Passed" << std::endl;
  return 0;
}
