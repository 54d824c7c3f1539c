#include "view_stats.hpp"
#include "logging/logger.hpp"
#include "store_io.hpp"

#include <boost/format.hpp>

namespace footprint {

stats_tracker::stats_tracker(compute_function compute, const key_precision &precision)
  : m_compute(compute),
    m_precision(precision),
    m_last_key(),
    m_last(),
    m_computations(0) {
}

stats_snapshot stats_tracker::update(const boost::optional<viewport> &view) {
  const view_key key = make_view_key(view, m_precision);
  if (key == m_last_key) {
    return m_last;
  }

  // the key is recorded first, so that a failure isn't retried on
  // every update with the same view.
  m_last_key = key;
  m_last = stats_snapshot();
  m_last.view = view;

  if (view) {
    ++m_computations;
    aggregate_response response = m_compute(viewport_bbox(*view));
    if (response.is_left()) {
      m_last.stats = response.left();

    } else {
      LOG_ERROR(boost::format("Unable to calculate view statistics: %1%") % response.right());
    }
  }

  return m_last;
}

std::size_t stats_tracker::computations() const {
  return m_computations;
}

stats_poller::stats_poller(std::unique_ptr<spatial_store> store,
                           const view_register &views,
                           stats_register &stats,
                           const key_precision &precision,
                           std::chrono::milliseconds interval)
  : m_store(std::move(store)),
    m_views(views),
    m_stats(stats),
    m_tracker(std::bind(&spatial_store::aggregate_in_bbox, m_store.get(), std::placeholders::_1),
              precision),
    m_interval(interval),
    m_stopping(false),
    m_thread() {
}

stats_poller::~stats_poller() {
  try {
    stop();

  } catch (const std::exception &e) {
    LOG_ERROR(boost::format("Failed to stop statistics poller: %1%") % e.what());
  }
}

void stats_poller::poll_once() {
  const boost::optional<viewport> view = m_views.get_view();
  const std::size_t before = m_tracker.computations();

  stats_snapshot snapshot = m_tracker.update(view);

  if (m_tracker.computations() != before) {
    LOG_DEBUG(boost::format("View changed: %1% buildings, %2% m2 total area")
              % snapshot.stats.count % snapshot.stats.area);
  }

  m_stats.set(snapshot);
}

void stats_poller::start() {
  if (m_thread) {
    throw std::runtime_error("Statistics poller is already running.");
  }

  {
    boost::mutex::scoped_lock lock(m_mutex);
    m_stopping = false;
  }
  m_thread.reset(new boost::thread(&stats_poller::run, this));
}

void stats_poller::stop() {
  if (!m_thread) {
    return;
  }

  {
    boost::mutex::scoped_lock lock(m_mutex);
    m_stopping = true;
  }
  m_cond.notify_all();

  m_thread->join();
  m_thread.reset();
}

const stats_tracker &stats_poller::tracker() const {
  return m_tracker;
}

void stats_poller::run() {
  boost::mutex::scoped_lock lock(m_mutex);

  while (!m_stopping) {
    lock.unlock();
    try {
      poll_once();

    } catch (const std::exception &e) {
      LOG_ERROR(boost::format("Statistics poll failed: %1%") % e.what());
    }
    lock.lock();

    const boost::chrono::milliseconds timeout(m_interval.count());
    m_cond.wait_for(lock, timeout, [this]() { return m_stopping; });
  }
}

} // namespace footprint
