#pragma once

#include "core/activity_source.hpp"
#include "core/track.hpp"
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace track_overlay
{

enum class loader_state_e
{
  IDLE,
  LISTING,
  FETCHING_STREAMS,
  READY, // Dataset waiting in take_dataset()
  FAILED
};

struct load_report_t
{
  std::uint64_t generation = 0;
  // UNAUTHENTICATED is also reported when only some streams were rejected
  fetch_status_e status = fetch_status_e::OK;
  std::string message;
  size_t activities_listed = 0;
  size_t streams_loaded = 0;
  size_t streams_failed = 0;
};

// Fetches one page of activities and all their streams on background tasks.
// update() is polled from the UI thread once per frame; the dataset is only
// handed out after every stream fetch has settled. Starting a new load while
// one is running abandons the old one: its results are never used.
class dataset_loader_t
{
public:
  dataset_loader_t(std::shared_ptr<activity_source_t> activities, std::shared_ptr<stream_source_t> streams, int max_concurrent_fetches = 4);
  ~dataset_loader_t();

  auto start(int page, int per_page) -> void;

  // Returns true on the call that completes a dataset
  auto update() -> bool;

  // Streams in activity-list order, failed activities excluded. Moves the
  // loader back to IDLE.
  auto take_dataset() -> std::vector<activity_stream_t>;

  auto get_state() const -> loader_state_e
  {
    return m_state;
  }
  auto is_busy() const -> bool
  {
    return m_state == loader_state_e::LISTING || m_state == loader_state_e::FETCHING_STREAMS;
  }
  auto get_report() const -> const load_report_t &
  {
    return m_report;
  }

  // {active fetches, queued fetches}
  auto get_loading_status() const -> std::pair<int, int>;

private:
  struct pending_stream_t
  {
    size_t slot;
    std::future<stream_result_t> data_future;
  };

  auto abandon_in_flight() -> void;
  auto drain_orphans() -> void;
  auto schedule_streams() -> void;
  auto finish() -> void;
  auto fail(fetch_status_e status, const std::string &message) -> void;

  std::shared_ptr<activity_source_t> m_activity_source;
  std::shared_ptr<stream_source_t> m_stream_source;
  int m_max_concurrent;

  loader_state_e m_state = loader_state_e::IDLE;
  load_report_t m_report;
  std::uint64_t m_generation = 0;

  std::future<activity_list_result_t> m_list_future;
  std::vector<activity_t> m_activities;
  std::vector<std::optional<std::vector<raw_point_t>>> m_slots; // One per activity
  std::vector<size_t> m_queue;
  std::vector<pending_stream_t> m_active;
  std::vector<activity_stream_t> m_dataset;

  // Abandoned tasks still running; kept until ready so the UI never blocks
  // in a future destructor
  std::vector<std::future<activity_list_result_t>> m_orphaned_lists;
  std::vector<std::future<stream_result_t>> m_orphaned_streams;
};

} // namespace track_overlay
