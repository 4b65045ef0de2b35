#include "core/dataset_loader.hpp"
#include <chrono>
#include <exception>
#include <iostream>

namespace track_overlay
{

template <typename T>
static auto is_ready(const std::future<T> &f) -> bool
{
  return f.valid() && f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

dataset_loader_t::dataset_loader_t(std::shared_ptr<activity_source_t> activities, std::shared_ptr<stream_source_t> streams, int max_concurrent_fetches)
    : m_activity_source(std::move(activities)), m_stream_source(std::move(streams)), m_max_concurrent(max_concurrent_fetches < 1 ? 1 : max_concurrent_fetches)
{
}

dataset_loader_t::~dataset_loader_t() = default;

auto dataset_loader_t::start(int page, int per_page) -> void
{
  if (is_busy())
    std::cout << "Dataset Loader: load #" << m_generation << " abandoned" << std::endl;
  abandon_in_flight();

  m_generation++;
  m_report = {};
  m_report.generation = m_generation;
  m_activities.clear();
  m_slots.clear();
  m_queue.clear();
  m_dataset.clear();

  if (!m_activity_source || !m_stream_source)
  {
    fail(fetch_status_e::UPSTREAM_ERROR, "No activity source configured");
    return;
  }

  auto source = m_activity_source;
  m_list_future = std::async(std::launch::async,
                             [source, page, per_page]() -> activity_list_result_t
                             {
                               try
                               {
                                 return source->list_activities(page, per_page);
                               }
                               catch (const std::exception &e)
                               {
                                 activity_list_result_t failed;
                                 failed.status = fetch_status_e::UPSTREAM_ERROR;
                                 failed.message = e.what();
                                 return failed;
                               }
                             });

  m_state = loader_state_e::LISTING;
  std::cout << "Dataset Loader: load #" << m_generation << " started (page " << page << ", " << per_page << " per page)" << std::endl;
}

auto dataset_loader_t::abandon_in_flight() -> void
{
  if (m_list_future.valid())
    m_orphaned_lists.push_back(std::move(m_list_future));

  for (auto &pending : m_active)
    m_orphaned_streams.push_back(std::move(pending.data_future));
  m_active.clear();
  m_queue.clear();
}

auto dataset_loader_t::drain_orphans() -> void
{
  std::erase_if(m_orphaned_lists, [](const auto &f) { return !f.valid() || is_ready(f); });
  std::erase_if(m_orphaned_streams, [](const auto &f) { return !f.valid() || is_ready(f); });
}

auto dataset_loader_t::update() -> bool
{
  drain_orphans();

  if (m_state == loader_state_e::LISTING)
  {
    if (!is_ready(m_list_future))
      return false;

    auto listing = m_list_future.get();
    if (listing.status != fetch_status_e::OK)
    {
      fail(listing.status, listing.message);
      return false;
    }

    m_activities = std::move(listing.activities);
    m_report.activities_listed = m_activities.size();
    m_slots.assign(m_activities.size(), std::nullopt);
    for (size_t i = 0; i < m_activities.size(); ++i)
      m_queue.push_back(i);

    std::cout << "Dataset Loader: " << m_activities.size() << " activities listed" << std::endl;
    m_state = loader_state_e::FETCHING_STREAMS;
  }

  if (m_state != loader_state_e::FETCHING_STREAMS)
    return false;

  // 1. Collect finished stream fetches
  auto it = m_active.begin();
  while (it != m_active.end())
  {
    if (!is_ready(it->data_future))
    {
      ++it;
      continue;
    }

    auto result = it->data_future.get();
    const auto &activity = m_activities[it->slot];

    if (result.status == fetch_status_e::OK)
    {
      m_slots[it->slot] = std::move(result.points);
      m_report.streams_loaded++;
    }
    else
    {
      // Kept for the UI; the load itself goes on without this activity
      if (result.status == fetch_status_e::UNAUTHENTICATED)
      {
        m_report.status = result.status;
        m_report.message = result.message;
      }
      std::cerr << "Dataset Loader: dropping activity " << activity.id << " (" << activity.name << "): " << to_string(result.status) << " " << result.message << std::endl;
      m_report.streams_failed++;
    }

    it = m_active.erase(it);
  }

  // 2. Start queued fetches
  schedule_streams();

  if (m_active.empty() && m_queue.empty())
  {
    finish();
    return true;
  }
  return false;
}

auto dataset_loader_t::schedule_streams() -> void
{
  while (static_cast<int>(m_active.size()) < m_max_concurrent && !m_queue.empty())
  {
    size_t slot = m_queue.front();
    m_queue.erase(m_queue.begin());

    auto source = m_stream_source;
    std::string activity_id = m_activities[slot].id;

    m_active.push_back({slot, std::async(std::launch::async,
                                         [source, activity_id]() -> stream_result_t
                                         {
                                           try
                                           {
                                             return source->get_stream(activity_id);
                                           }
                                           catch (const std::exception &e)
                                           {
                                             stream_result_t failed;
                                             failed.status = fetch_status_e::UPSTREAM_ERROR;
                                             failed.message = e.what();
                                             return failed;
                                           }
                                         })});
  }
}

auto dataset_loader_t::finish() -> void
{
  m_dataset.clear();
  for (size_t i = 0; i < m_activities.size(); ++i)
  {
    if (!m_slots[i])
      continue;
    m_dataset.push_back({m_activities[i], std::move(*m_slots[i])});
  }
  m_slots.clear();

  m_state = loader_state_e::READY;
  std::cout << "Dataset Loader: load #" << m_generation << " complete, " << m_report.streams_loaded << " streams, " << m_report.streams_failed << " dropped" << std::endl;
}

auto dataset_loader_t::fail(fetch_status_e status, const std::string &message) -> void
{
  abandon_in_flight();
  m_report.status = status;
  m_report.message = message;
  m_state = loader_state_e::FAILED;
  std::cerr << "Dataset Loader: load #" << m_generation << " failed: " << to_string(status) << " " << message << std::endl;
}

auto dataset_loader_t::take_dataset() -> std::vector<activity_stream_t>
{
  if (m_state != loader_state_e::READY)
    return {};

  m_state = loader_state_e::IDLE;
  return std::move(m_dataset);
}

auto dataset_loader_t::get_loading_status() const -> std::pair<int, int>
{
  return {static_cast<int>(m_active.size()), static_cast<int>(m_queue.size())};
}

} // namespace track_overlay
