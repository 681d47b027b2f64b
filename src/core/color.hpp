#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>

namespace site_mapper
{

// Linear RGB in 0..1, same layout the UI color editors use
using color_t = std::array<float, 3>;

constexpr auto color_from_hex(uint32_t rgb) -> color_t
{
  return {static_cast<float>((rgb >> 16) & 0xFF) / 255.0f, static_cast<float>((rgb >> 8) & 0xFF) / 255.0f, static_cast<float>(rgb & 0xFF) / 255.0f};
}

// "#RRGGBB" or "RRGGBB"; nullopt for anything else
inline auto parse_hex_color(const std::string &text) -> std::optional<color_t>
{
  std::string hex = (!text.empty() && text.front() == '#') ? text.substr(1) : text;
  if (hex.size() != 6 || !std::all_of(hex.begin(), hex.end(), [](unsigned char c) { return std::isxdigit(c) != 0; }))
    return std::nullopt;
  return color_from_hex(static_cast<uint32_t>(std::stoul(hex, nullptr, 16)));
}

namespace palette
{
constexpr color_t PLAN_PARCELS = color_from_hex(0x22C55E);
constexpr color_t SITE_BOUNDARY = color_from_hex(0xF59E0B);
constexpr color_t TAX_PARCELS = color_from_hex(0x3B82F6);
constexpr color_t SALE_COMPS = color_from_hex(0xEF4444);
constexpr color_t RENT_COMPS = color_from_hex(0xF97316);
constexpr color_t ANNOTATIONS = color_from_hex(0x06B6D4);
constexpr color_t DRAW_FEEDBACK = color_from_hex(0x3B82F6);
constexpr color_t SUBJECT = color_from_hex(0x321FDB);
constexpr color_t COMP = color_from_hex(0x3399FF);
constexpr color_t NEUTRAL = color_from_hex(0xDEE2E6);
constexpr color_t WHITE = color_from_hex(0xFFFFFF);
constexpr color_t BLACK = color_from_hex(0x000000);
} // namespace palette

} // namespace site_mapper
