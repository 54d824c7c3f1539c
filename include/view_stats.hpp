#ifndef FOOTPRINT_VIEW_STATS_HPP
#define FOOTPRINT_VIEW_STATS_HPP

#include "spatial_store.hpp"
#include "view_state.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>

#include <boost/noncopyable.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/thread.hpp>

namespace footprint {

/* Keeps the statistics for the latest view, only calling out to
 * recompute them when the view has changed by more than the rounding
 * in the key.
 */
class stats_tracker {
public:
  typedef std::function<aggregate_response (const box_2d &)> compute_function;

  stats_tracker(compute_function compute, const key_precision &precision);

  // returns the stats for the view. no view at all has zero stats. a
  // failed computation is logged and also gives zero stats, and isn't
  // retried until the view changes.
  stats_snapshot update(const boost::optional<viewport> &view);

  // number of times the compute function has been called.
  std::size_t computations() const;

private:
  compute_function m_compute;
  key_precision m_precision;
  view_key m_last_key;
  stats_snapshot m_last;
  std::size_t m_computations;
};

/* Background thread which periodically reads the view register and
 * publishes the statistics for it to the stats register.
 */
class stats_poller : public boost::noncopyable {
public:
  stats_poller(std::unique_ptr<spatial_store> store,
               const view_register &views,
               stats_register &stats,
               const key_precision &precision,
               std::chrono::milliseconds interval);

  // stops the thread, if it's running.
  ~stats_poller();

  // check the view and publish the stats once, on the calling thread.
  void poll_once();

  void start();
  void stop();

  const stats_tracker &tracker() const;

private:
  void run();

  std::unique_ptr<spatial_store> m_store;
  const view_register &m_views;
  stats_register &m_stats;
  stats_tracker m_tracker;
  std::chrono::milliseconds m_interval;

  boost::mutex m_mutex;
  boost::condition_variable m_cond;
  bool m_stopping;
  std::unique_ptr<boost::thread> m_thread;
};

} // namespace footprint

#endif /* FOOTPRINT_VIEW_STATS_HPP */
