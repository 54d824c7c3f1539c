#ifndef FOOTPRINT_VIEW_STATE_HPP
#define FOOTPRINT_VIEW_STATE_HPP

#include "geometry.hpp"
#include "spatial_store.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <boost/noncopyable.hpp>
#include <boost/optional.hpp>

namespace footprint {

/* The part of the map a client is currently looking at, in WGS84
 * degrees. The zoom is optional, since clients don't have to send it.
 */
struct viewport {
  viewport() : north(0), south(0), east(0), west(0), zoom() {}
  viewport(double n, double s, double e, double w, boost::optional<double> z)
    : north(n), south(s), east(e), west(w), zoom(z) {}

  double north, south, east, west;
  boost::optional<double> zoom;
};

bool operator==(const viewport &a, const viewport &b);
bool operator!=(const viewport &a, const viewport &b);

// lon/lat box covering the viewport, from (west, south) to (east, north).
box_2d viewport_bbox(const viewport &v);

/* A single value, shared between threads.
 *
 * Writes replace the whole value, so a reader always sees exactly one
 * of the values which were written, never a mix of two, and there's
 * no history. Readers get their own reference to the value, so don't
 * hold up writers.
 */
template <typename T>
class atomic_slot : public boost::noncopyable {
public:
  atomic_slot() : m_value() {}

  void set(const T &value) {
    std::shared_ptr<const T> ptr(new T(value));
    std::atomic_store(&m_value, ptr);
  }

  // returns none if nothing has been set yet.
  boost::optional<T> get() const {
    std::shared_ptr<const T> ptr = std::atomic_load(&m_value);
    if (ptr) {
      return *ptr;
    }
    return boost::none;
  }

private:
  std::shared_ptr<const T> m_value;
};

/* The most recently reported viewport, last write wins. */
class view_register : public boost::noncopyable {
public:
  void set_view(const viewport &v);
  boost::optional<viewport> get_view() const;

private:
  atomic_slot<viewport> m_slot;
};

/* Aggregate statistics, and the view they were calculated for. */
struct stats_snapshot {
  aggregate_stats stats;
  boost::optional<viewport> view;
};

typedef atomic_slot<stats_snapshot> stats_register;

/* Number of decimal places kept from each value of the view when
 * deciding whether it has changed. */
struct key_precision {
  key_precision() : position(4), zoom(1) {}
  key_precision(int p, int z) : position(p), zoom(z) {}

  int position, zoom;
};

/* Rounded form of a view, which compares equal for views which are
 * "the same" after rounding. There's a distinct key for no view at all.
 * A view without a zoom is keyed as zoom 0.
 */
struct view_key {
  view_key() : present(false), north(0), south(0), east(0), west(0), zoom(0) {}

  bool present;
  std::int64_t north, south, east, west, zoom;
};

bool operator==(const view_key &a, const view_key &b);
bool operator!=(const view_key &a, const view_key &b);

view_key make_view_key(const boost::optional<viewport> &v, const key_precision &precision);

} // namespace footprint

#endif /* FOOTPRINT_VIEW_STATE_HPP */
