#include "view_state.hpp"

#include <cmath>

namespace footprint {

namespace {

// scaled values are clamped to what llround can represent exactly.
const double max_scaled = 9.0e15;

std::int64_t round_to(double value, int places) {
  const double scaled = value * std::pow(10.0, places);
  if (!(scaled > -max_scaled)) { return -std::int64_t(max_scaled); }
  if (!(scaled < max_scaled)) { return std::int64_t(max_scaled); }
  return std::int64_t(std::llround(scaled));
}

} // anonymous namespace

bool operator==(const viewport &a, const viewport &b) {
  return a.north == b.north && a.south == b.south &&
    a.east == b.east && a.west == b.west && a.zoom == b.zoom;
}

bool operator!=(const viewport &a, const viewport &b) {
  return !(a == b);
}

box_2d viewport_bbox(const viewport &v) {
  return box_2d(point_2d(v.west, v.south), point_2d(v.east, v.north));
}

void view_register::set_view(const viewport &v) {
  m_slot.set(v);
}

boost::optional<viewport> view_register::get_view() const {
  return m_slot.get();
}

bool operator==(const view_key &a, const view_key &b) {
  if (a.present != b.present) { return false; }
  if (!a.present) { return true; }
  return a.north == b.north && a.south == b.south &&
    a.east == b.east && a.west == b.west && a.zoom == b.zoom;
}

bool operator!=(const view_key &a, const view_key &b) {
  return !(a == b);
}

view_key make_view_key(const boost::optional<viewport> &v, const key_precision &precision) {
  view_key key;
  if (v) {
    key.present = true;
    key.north = round_to(v->north, precision.position);
    key.south = round_to(v->south, precision.position);
    key.east = round_to(v->east, precision.position);
    key.west = round_to(v->west, precision.position);
    key.zoom = round_to(v->zoom.get_value_or(0.0), precision.zoom);
  }
  return key;
}

} // namespace footprint
